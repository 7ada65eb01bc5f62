#pragma once

#include "event_dispatcher.hpp"
#include "log.hpp"
#include "scheduler.hpp"
#include "world.hpp"

#include <cstdio>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace realmsim
{
    struct EffectConfig
    {
        Duration defaultBuffDuration = std::chrono::seconds(30);
        Duration defaultDebuffDuration = std::chrono::seconds(15);
        Duration defaultTickInterval = std::chrono::seconds(3);
    };

    struct EffectSpec
    {
        std::string name;
        EffectType type = EffectType::Buff;

        // Zero means "until removed".
        Duration duration{};
        std::vector<std::pair<Stat, int>> statModifiers;

        // Health change per tick (negative = damage); only periodic when both are non-zero.
        int healthDelta = 0;
        Duration interval{};
    };

    inline const char *effect_type_name(EffectType t) noexcept
    {
        switch (t)
        {
        case EffectType::Buff:
            return "buff";
        case EffectType::Debuff:
            return "debuff";
        case EffectType::DamageOverTime:
            return "dot";
        case EffectType::HealOverTime:
            return "hot";
        }
        return "unknown";
    }

    // Timed stat modifiers and periodic health changes.
    //
    // Every effect owns at most two scheduler entries: a recurring tick and a one-shot
    // expiration. Both callbacks capture only ids and re-resolve the entity and the
    // effect when they run, so an entity that died, left or lost the effect in the
    // meantime turns the callback into a no-op.
    class EffectSystem
    {
    public:
        EffectSystem(World &world, Scheduler &scheduler, EventDispatcher &events, const IClock &clock, EffectConfig cfg = {})
            : m_world(world), m_scheduler(scheduler), m_events(events), m_clock(clock), m_cfg(std::move(cfg))
        {
        }

        EffectSystem(const EffectSystem &) = delete;
        EffectSystem &operator=(const EffectSystem &) = delete;

        const EffectConfig &config() const noexcept { return m_cfg; }

        // Returns NoEffect if the entity does not exist.
        EffectId apply(EntityId target, const EffectSpec &spec)
        {
            if (spec.duration < Duration::zero() || spec.interval < Duration::zero())
            {
                throw std::runtime_error("EffectSystem::apply: negative duration or interval");
            }
            Entity *e = m_world.find(target);
            if (!e)
            {
                return NoEffect;
            }

            Effect fx;
            fx.id = m_nextEffectId++;
            fx.name = spec.name;
            fx.type = spec.type;
            fx.statModifiers = spec.statModifiers;
            fx.duration = spec.duration;
            fx.appliedAt = m_clock.now();
            fx.interval = spec.interval;
            fx.healthDelta = spec.healthDelta;

            const EffectId id = fx.id;

            // The tick is scheduled before the expiration so that a tick landing on the
            // expiration instant still runs first.
            if (fx.healthDelta != 0 && fx.interval > Duration::zero())
            {
                // The series stops itself once the entity or the effect is gone.
                auto series = std::make_shared<TimerId>(NoTimer);
                *series = m_scheduler.schedule(
                    fx.interval, [this, target, id, series]
                    {
                        if (!on_tick_(target, id))
                        {
                            m_scheduler.cancel(*series);
                        } },
                    true, fx.interval);
                fx.periodicEvent = *series;
            }
            if (fx.duration > Duration::zero())
            {
                fx.expirationEvent = m_scheduler.schedule(fx.duration, [this, target, id]
                                                          { on_expire_(target, id); });
            }

            Logger::instance().logf(LogLevel::Debug, m_clock.now(), target, "effect %llu '%s' (%s) applied for %.1fs",
                                    static_cast<unsigned long long>(id), fx.name.c_str(), effect_type_name(fx.type),
                                    to_seconds(fx.duration));

            m_world.write(target).effects.emplace(id, std::move(fx));
            ++m_applied;
            return id;
        }

        // Cancels both timers. Returns false if the entity or the effect is gone.
        bool remove(EntityId target, EffectId id)
        {
            Entity *e = m_world.find(target);
            if (!e)
            {
                return false;
            }
            auto it = e->effects.find(id);
            if (it == e->effects.end())
            {
                return false;
            }
            m_scheduler.cancel(it->second.periodicEvent);
            m_scheduler.cancel(it->second.expirationEvent);
            e->effects.erase(it);
            m_world.mark_dirty(target);
            return true;
        }

        // Drops every effect without notification (death, removal).
        void clear(EntityId target)
        {
            Entity *e = m_world.find(target);
            if (!e || e->effects.empty())
            {
                return;
            }
            for (auto &[id, fx] : e->effects)
            {
                (void)id;
                m_scheduler.cancel(fx.periodicEvent);
                m_scheduler.cancel(fx.expirationEvent);
            }
            e->effects.clear();
            m_world.mark_dirty(target);
        }

        // Only the expiration timer is cancelled; the modifiers stay until remove().
        bool make_permanent(EntityId target, EffectId id)
        {
            Entity *e = m_world.find(target);
            if (!e)
            {
                return false;
            }
            auto it = e->effects.find(id);
            if (it == e->effects.end())
            {
                return false;
            }
            m_scheduler.cancel(it->second.expirationEvent);
            it->second.expirationEvent = NoTimer;
            it->second.duration = Duration::zero();
            m_world.mark_dirty(target);
            return true;
        }

        EffectId bless(EntityId target, int bonus = 5)
        {
            return bless(target, bonus, m_cfg.defaultBuffDuration);
        }

        EffectId bless(EntityId target, int bonus, Duration duration)
        {
            EffectSpec spec;
            spec.name = "Blessed";
            spec.type = EffectType::Buff;
            spec.duration = duration;
            spec.statModifiers.emplace_back(Stat::ArmorClass, bonus);

            const EffectId id = apply(target, spec);
            if (id == NoEffect)
            {
                return id;
            }
            const Entity &e = m_world.entity(target);
            if (e.kind == EntityKind::Player)
            {
                m_events.publish(stat_update(target, {{"armor_class", e.effective(Stat::ArmorClass)}}));
                char buf[160];
                std::snprintf(buf, sizeof(buf), "Divine light surrounds you! You feel blessed. (+%d Armor Class for %.0f seconds)",
                              bonus, to_seconds(duration));
                m_events.publish(message_to(target, buf));
            }
            return id;
        }

        EffectId poison(EntityId target, int damagePerTick = 5)
        {
            return poison(target, damagePerTick, m_cfg.defaultTickInterval, m_cfg.defaultDebuffDuration);
        }

        EffectId poison(EntityId target, int damagePerTick, Duration tickInterval, Duration duration)
        {
            EffectSpec spec;
            spec.name = "Poisoned";
            spec.type = EffectType::DamageOverTime;
            spec.duration = duration;
            spec.healthDelta = -damagePerTick;
            spec.interval = tickInterval;

            const EffectId id = apply(target, spec);
            if (id != NoEffect && m_world.entity(target).kind == EntityKind::Player)
            {
                char buf[160];
                std::snprintf(buf, sizeof(buf), "Vile toxins course through your body! You are poisoned. (%d damage every %.1f seconds for %.1f seconds)",
                              damagePerTick, to_seconds(tickInterval), to_seconds(duration));
                m_events.publish(message_to(target, buf));
            }
            return id;
        }

        std::string summary(EntityId target) const
        {
            const Entity *e = m_world.find(target);
            if (!e || e->effects.empty())
            {
                return "You have no active effects.";
            }

            const TimePoint now = m_clock.now();
            std::string out = "=== Active Effects ===\n";
            char buf[160];
            for (const auto &[id, fx] : e->effects)
            {
                (void)id;
                std::snprintf(buf, sizeof(buf), "\n%s (%s)\n", fx.name.c_str(), effect_type_name(fx.type));
                out += buf;
                if (fx.duration > Duration::zero())
                {
                    const Duration left = std::max(Duration::zero(), fx.duration - (now - fx.appliedAt));
                    std::snprintf(buf, sizeof(buf), "  Duration: %.1fs remaining\n", to_seconds(left));
                }
                else
                {
                    std::snprintf(buf, sizeof(buf), "  Duration: permanent\n");
                }
                out += buf;
                if (!fx.statModifiers.empty())
                {
                    out += "  Modifiers:";
                    for (const auto &[stat, delta] : fx.statModifiers)
                    {
                        std::snprintf(buf, sizeof(buf), " %s %+d", stat_name(stat), delta);
                        out += buf;
                    }
                    out += "\n";
                }
                if (fx.healthDelta != 0)
                {
                    std::snprintf(buf, sizeof(buf), "  Periodic: %+d HP every %.1fs\n", fx.healthDelta, to_seconds(fx.interval));
                    out += buf;
                }
            }
            return out;
        }

        std::uint64_t applied_total() const noexcept { return m_applied; }
        std::uint64_t ticks_total() const noexcept { return m_ticks; }
        std::uint64_t expired_total() const noexcept { return m_expired; }

    private:
        // Returns false when the tick refers to an effect that no longer exists.
        bool on_tick_(EntityId target, EffectId id)
        {
            Entity *e = m_world.find(target);
            if (!e)
            {
                return false;
            }
            auto it = e->effects.find(id);
            if (it == e->effects.end())
            {
                return false;
            }
            if (!e->alive())
            {
                return true;
            }
            const Effect &fx = it->second;

            const int before = e->health;
            if (fx.healthDelta < 0)
            {
                // Periodic damage wears down but never kills.
                e->health = std::max(std::min(1, before), before + fx.healthDelta);
            }
            else
            {
                e->health = std::min(e->maxHealth, before + fx.healthDelta);
            }
            m_world.mark_dirty(target);
            ++m_ticks;

            const int change = e->health - before;
            Logger::instance().logf(LogLevel::Trace, m_clock.now(), target, "effect %llu tick %+d (health %d)",
                                    static_cast<unsigned long long>(id), change, e->health);

            if (e->kind != EntityKind::Player)
            {
                return true;
            }
            char buf[128];
            if (fx.healthDelta < 0)
            {
                std::snprintf(buf, sizeof(buf), "The poison burns through your veins! You take %d poison damage.", -change);
            }
            else
            {
                std::snprintf(buf, sizeof(buf), "Healing energy flows through you! You heal for %d health.", change);
            }
            m_events.publish(message_to(target, buf));
            m_events.publish(stat_update(target, {{"health", e->health}, {"max_health", e->maxHealth}}));
            return true;
        }

        void on_expire_(EntityId target, EffectId id)
        {
            Entity *e = m_world.find(target);
            if (!e)
            {
                return;
            }
            auto it = e->effects.find(id);
            if (it == e->effects.end())
            {
                return;
            }
            Effect fx = std::move(it->second);
            e->effects.erase(it);
            m_scheduler.cancel(fx.periodicEvent);
            m_world.mark_dirty(target);
            ++m_expired;

            Logger::instance().logf(LogLevel::Debug, m_clock.now(), target, "effect %llu '%s' expired",
                                    static_cast<unsigned long long>(id), fx.name.c_str());

            if (e->kind != EntityKind::Player)
            {
                return;
            }
            std::string text;
            switch (fx.type)
            {
            case EffectType::DamageOverTime:
                text = "The poison has run its course.";
                break;
            case EffectType::HealOverTime:
                text = "The healing effect fades.";
                break;
            case EffectType::Buff:
                text = "The " + fx.name + " fades away.";
                break;
            case EffectType::Debuff:
                text = fx.name + " wears off.";
                break;
            }
            m_events.publish(message_to(target, std::move(text)));

            if (!fx.statModifiers.empty())
            {
                std::vector<EventField> fields;
                for (const auto &[stat, delta] : fx.statModifiers)
                {
                    (void)delta;
                    fields.push_back({stat_name(stat), e->effective(stat)});
                }
                m_events.publish(stat_update(target, std::move(fields)));
            }
        }

        World &m_world;
        Scheduler &m_scheduler;
        EventDispatcher &m_events;
        const IClock &m_clock;
        EffectConfig m_cfg;

        EffectId m_nextEffectId = 1;
        std::uint64_t m_applied = 0;
        std::uint64_t m_ticks = 0;
        std::uint64_t m_expired = 0;
    };
}
