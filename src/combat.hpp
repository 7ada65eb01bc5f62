#pragma once

#include "effects.hpp"
#include "event_dispatcher.hpp"
#include "log.hpp"
#include "random.hpp"
#include "scheduler.hpp"
#include "world.hpp"

#include <cstdio>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace realmsim
{
    struct CombatConfig
    {
        double critChance = 0.10;
        double critMultiplier = 1.5;

        // Fixed pause between a resolved swing and the next windup.
        Duration recoveryDelay = std::chrono::milliseconds(500);

        // A surviving target that is not fighting turns on its attacker.
        bool autoRetaliate = true;

        std::uint64_t seed = 1;
    };

    struct SwingRoll
    {
        int roll = 0;
        int damage = 0;
        bool critical = false;
    };

    // Pure damage roll for one swing. `swingSerial` is the attacker's per-entity swing
    // counter, so the same seed and the same fight always produce the same numbers.
    inline SwingRoll roll_swing(const CombatConfig &cfg,
                                EntityId attacker,
                                std::uint64_t swingSerial,
                                const WeaponSnapshot &weapon,
                                int strength,
                                int targetArmor) noexcept
    {
        SwingRoll r;
        r.roll = rng_int_range(cfg.seed, attacker, RngStream::Damage, swingSerial, weapon.damageMin, weapon.damageMax);

        int damage = std::max(1, r.roll + floor_div(strength - 10, 2));
        damage = std::max(1, damage - floor_div(targetArmor, 5));

        r.critical = rng_unit_double(cfg.seed, attacker, RngStream::Critical, swingSerial) < cfg.critChance;
        if (r.critical)
        {
            damage = static_cast<int>(damage * cfg.critMultiplier);
        }
        r.damage = damage;
        return r;
    }

    // Real-time auto-attack: IDLE -> WINDUP -> SWING -> RECOVERY -> WINDUP ...
    //
    // Each combatant has at most one pending scheduler entry (CombatState::pendingEvent).
    // Callbacks capture only the attacker id; the target is re-resolved and re-validated
    // at the start of every transition, so a target that died, left or was removed is
    // never hit. Every path back to IDLE cancels the pending entry before clearing.
    class CombatSystem
    {
    public:
        CombatSystem(World &world,
                     Scheduler &scheduler,
                     EventDispatcher &events,
                     EffectSystem &effects,
                     const IClock &clock,
                     CombatConfig cfg = {})
            : m_world(world), m_scheduler(scheduler), m_events(events), m_effects(effects), m_clock(clock), m_cfg(std::move(cfg))
        {
        }

        CombatSystem(const CombatSystem &) = delete;
        CombatSystem &operator=(const CombatSystem &) = delete;

        const CombatConfig &config() const noexcept { return m_cfg; }

        // "attack <name>": resolves the target by keyword in the attacker's room.
        bool engage(EntityId attacker, std::string_view targetName)
        {
            Entity *a = m_world.find(attacker);
            if (!a)
            {
                reject_(attacker, "You have no form.");
                return false;
            }
            if (!check_can_attack_(*a))
            {
                return false;
            }
            targetName = trim(targetName);
            if (targetName.empty())
            {
                reject_(attacker, "Attack whom?");
                return false;
            }
            Entity *t = m_world.find_in_room(a->room, targetName, attacker);
            if (!t)
            {
                reject_(attacker, "'" + std::string(targetName) + "' not found.");
                return false;
            }
            return engage_checked_(*a, *t);
        }

        // Engage a known entity (retaliation, scripted NPC aggression).
        bool engage_entity(EntityId attacker, EntityId target)
        {
            Entity *a = m_world.find(attacker);
            if (!a)
            {
                return false;
            }
            if (!check_can_attack_(*a))
            {
                return false;
            }
            Entity *t = m_world.find(target);
            if (!t || t->room != a->room)
            {
                reject_(attacker, "Your target cannot be found.");
                return false;
            }
            return engage_checked_(*a, *t);
        }

        // "stop"
        void disengage(EntityId who)
        {
            Entity *e = m_world.find(who);
            if (!e)
            {
                reject_(who, "You have no form.");
                return;
            }
            if (!e->combat.in_combat())
            {
                reject_(who, "You're not in combat.");
                return;
            }
            const Entity *t = m_world.find(e->combat.target);
            reset(who);
            if (t)
            {
                m_events.publish(message_to(who, "You stop attacking " + t->name + "."));
            }
            else
            {
                m_events.publish(message_to(who, "You disengage from combat."));
            }
        }

        // "flee": d20 + DEX modifier against a DC that drops as health drops.
        void flee(EntityId who)
        {
            Entity *e = m_world.find(who);
            if (!e)
            {
                reject_(who, "You have no form.");
                return;
            }
            if (!e->combat.in_combat())
            {
                reject_(who, "You're not in combat.");
                return;
            }

            const double healthFraction = (e->maxHealth > 0) ? static_cast<double>(e->health) / e->maxHealth : 1.0;
            const int dc = std::max(5, 15 - static_cast<int>(10.0 * (1.0 - healthFraction)));
            const std::uint64_t attempt = ++m_fleeAttempts;
            const int roll = rng_int_range(m_cfg.seed, who, RngStream::Flee, attempt, 1, 20);
            const int dexMod = floor_div(e->effective(Stat::Dexterity) - 10, 2);
            const int total = roll + dexMod;

            char detail[96];
            std::snprintf(detail, sizeof(detail), "(Roll: %d + %d DEX = %d vs DC %d)", roll, dexMod, total, dc);

            if (total < dc)
            {
                m_events.publish(message_to(who, std::string("You fail to escape! ") + detail));
                return;
            }

            const Room *from = m_world.find_room(e->room);
            if (!from || from->exits.empty())
            {
                m_events.publish(message_to(who, "There's nowhere to flee!"));
                return;
            }

            const int pick = rng_int_range(m_cfg.seed, who, RngStream::FleeExit, attempt, 0, static_cast<int>(from->exits.size()) - 1);
            auto exit = from->exits.begin();
            std::advance(exit, pick);
            const std::string direction = exit->first;
            const RoomId fromId = from->id;
            const RoomId toId = exit->second;

            if (!m_world.find_room(toId))
            {
                m_events.publish(message_to(who, "You try to flee but the exit leads nowhere!"));
                return;
            }

            reset(who);
            m_world.move(who, toId);
            Logger::instance().logf(LogLevel::Debug, m_clock.now(), who, "fled %s to room %llu", direction.c_str(),
                                    static_cast<unsigned long long>(toId));

            m_events.publish(message_to_room(fromId, e->name + " flees " + direction + "!", {who}));
            m_events.publish(message_to(who, "You flee " + direction + "! " + detail));
            m_events.publish(message_to_room(toId, e->name + " arrives in a panic.", {who}));
        }

        // Cancel the pending transition and return to IDLE. No notification.
        void reset(EntityId who)
        {
            Entity *e = m_world.find(who);
            if (!e)
            {
                return;
            }
            m_scheduler.cancel(e->combat.pendingEvent);
            e->combat = CombatState{};
            e->combat.entity = who;
        }

        // Called before an entity leaves the world graph.
        void on_entity_removed(EntityId who)
        {
            release_targeting_(who, "Your target is no longer here.");
            reset(who);
        }

        // A participant going offline ends every fight it is part of, on both sides.
        void on_disconnect(EntityId who)
        {
            release_targeting_(who, "Your target is no longer here.");
            reset(who);
        }

        // "respawn" for a dead player.
        void respawn_player(EntityId who)
        {
            Entity *e = m_world.find(who);
            if (!e)
            {
                reject_(who, "You have no form.");
                return;
            }
            if (e->alive())
            {
                reject_(who, "You are not dead.");
                return;
            }

            reset(who);
            Entity &w = m_world.write(who);
            w.health = w.maxHealth;
            const RoomId home = (m_world.find_room(w.spawnRoom) != nullptr) ? w.spawnRoom : w.room;
            if (home != NoRoom && home != w.room)
            {
                m_world.move(who, home);
            }

            const Room *r = m_world.find_room(w.room);
            m_events.publish(message_to(who, "You return to life" + (r ? " in " + r->name : std::string()) + "."));
            m_events.publish(stat_update(who, {{"health", w.health}, {"max_health", w.maxHealth}}));
            m_events.publish(message_to_room(w.room, w.name + " appears in a flash of light.", {who}));
        }

        std::string status_text(EntityId who) const
        {
            const Entity *e = m_world.find(who);
            if (!e)
            {
                return "You have no form.";
            }
            const CombatState &c = e->combat;
            if (!c.in_combat())
            {
                return "You are not in combat.";
            }

            std::string out = "Combat Status\n";
            char buf[160];

            const Entity *t = m_world.find(c.target);
            if (t)
            {
                const double pct = (t->maxHealth > 0) ? 100.0 * t->health / t->maxHealth : 0.0;
                std::snprintf(buf, sizeof(buf), "Target: %s (%.0f%% health)\n", t->name.c_str(), pct);
            }
            else
            {
                std::snprintf(buf, sizeof(buf), "Target: none\n");
            }
            out += buf;

            const Duration elapsed = m_clock.now() - c.phaseStartedAt;
            const Duration remaining = std::max(Duration::zero(), c.phaseDuration - elapsed);
            const double progress = (c.phaseDuration > Duration::zero())
                                        ? std::min(100.0, 100.0 * to_seconds(elapsed) / to_seconds(c.phaseDuration))
                                        : 100.0;
            std::snprintf(buf, sizeof(buf), "Phase: %s (%.0f%% - %.1fs remaining)\n", combat_phase_name(c.phase), progress,
                          to_seconds(remaining));
            out += buf;

            std::snprintf(buf, sizeof(buf), "Weapon: %s, %d-%d %s damage, %.1fs speed", c.weapon.name.c_str(), c.weapon.damageMin,
                          c.weapon.damageMax, c.weapon.damageType.c_str(), to_seconds(c.weapon.swingInterval));
            out += buf;
            return out;
        }

        std::uint64_t swings_total() const noexcept { return m_swings; }
        std::uint64_t deaths_total() const noexcept { return m_deaths; }

    private:
        void reject_(EntityId who, std::string text) { m_events.publish(message_to(who, std::move(text))); }

        bool check_can_attack_(const Entity &a)
        {
            if (!a.alive())
            {
                reject_(a.id, "You can't attack while dead.");
                return false;
            }
            if (a.room == NoRoom)
            {
                reject_(a.id, "You are nowhere.");
                return false;
            }
            if (a.combat.in_combat())
            {
                const Entity *current = m_world.find(a.combat.target);
                reject_(a.id, "You're already attacking " + (current ? current->name : std::string("something")) +
                                  "! Use 'stop' to disengage first.");
                return false;
            }
            return true;
        }

        bool engage_checked_(Entity &a, Entity &t)
        {
            if (t.id == a.id)
            {
                reject_(a.id, "You can't attack yourself!");
                return false;
            }
            if (!t.alive())
            {
                reject_(a.id, t.name + " is already dead.");
                return false;
            }

            begin_windup_(a, t, false);

            m_events.publish(message_to(a.id, "You begin attacking " + t.name + " with your " + a.combat.weapon.name + "... (" +
                                                  format_seconds(a.combat.phaseDuration) + "s)"));
            m_events.publish(message_to(t.id, a.name + " attacks you!"));
            m_events.publish(message_to_room(a.room, a.name + " attacks " + t.name + "!", {a.id, t.id}));
            return true;
        }

        // Snapshot the weapon and schedule the swing. A windup following a recovery is
        // shortened by the recovery delay so consecutive swings stay one interval apart.
        void begin_windup_(Entity &a, const Entity &t, bool afterRecovery)
        {
            CombatState &c = a.combat;
            m_scheduler.cancel(c.pendingEvent);

            c.entity = a.id;
            c.target = t.id;
            c.weapon = m_world.weapon_for(a);
            c.phase = CombatPhase::Windup;
            c.phaseStartedAt = m_clock.now();
            c.phaseDuration = afterRecovery ? std::max(Duration::zero(), c.weapon.swingInterval - m_cfg.recoveryDelay)
                                            : c.weapon.swingInterval;

            const EntityId attacker = a.id;
            c.pendingEvent = m_scheduler.schedule(c.phaseDuration, [this, attacker]
                                                  { on_swing_due_(attacker); });

            Logger::instance().logf(LogLevel::Trace, m_clock.now(), attacker, "windup -> %llu (%s, %.2fs)",
                                    static_cast<unsigned long long>(t.id), c.weapon.name.c_str(), to_seconds(c.phaseDuration));
        }

        void end_combat_(Entity &a, const char *why)
        {
            reset(a.id);
            if (why)
            {
                m_events.publish(message_to(a.id, why));
            }
        }

        void on_swing_due_(EntityId attacker)
        {
            Entity *a = m_world.find(attacker);
            if (!a || a->combat.phase != CombatPhase::Windup)
            {
                return;
            }
            a->combat.pendingEvent = NoTimer;

            if (!a->alive())
            {
                end_combat_(*a, nullptr);
                return;
            }
            Entity *t = m_world.find(a->combat.target);
            if (!t || t->room != a->room || a->room == NoRoom)
            {
                end_combat_(*a, "Your target is no longer here.");
                return;
            }
            if (!t->alive())
            {
                end_combat_(*a, (t->name + " is already dead!").c_str());
                return;
            }

            a->combat.phase = CombatPhase::Swing;
            a->combat.phaseStartedAt = m_clock.now();
            a->combat.phaseDuration = Duration::zero();
            resolve_swing_(*a, *t);
        }

        void resolve_swing_(Entity &a, Entity &t)
        {
            const std::uint64_t serial = ++a.swingSerial;
            const SwingRoll r = roll_swing(m_cfg, a.id, serial, a.combat.weapon, a.effective(Stat::Strength),
                                           t.effective(Stat::ArmorClass));

            Entity &target = m_world.write(t.id);
            target.health = std::max(0, target.health - r.damage);
            m_world.mark_dirty(a.id);
            ++a.combat.swings;
            ++m_swings;

            Logger::instance().logf(LogLevel::Debug, m_clock.now(), a.id, "swing #%llu at %llu: roll=%d damage=%d%s health=%d",
                                    static_cast<unsigned long long>(serial), static_cast<unsigned long long>(t.id), r.roll,
                                    r.damage, r.critical ? " crit" : "", target.health);

            const std::string crit = r.critical ? " **CRITICAL!**" : "";
            std::vector<EventField> fields = {{"damage", r.damage},
                                              {"critical", r.critical ? 1 : 0},
                                              {"target", static_cast<std::int64_t>(t.id)},
                                              {"target_health", target.health}};

            OutboundEvent hit = message_to(a.id, "You hit " + t.name + " for " + std::to_string(r.damage) + " damage!" + crit,
                                           EventKind::Combat);
            hit.fields = fields;
            m_events.publish(std::move(hit));

            OutboundEvent hurt = message_to(t.id, a.name + " hits you for " + std::to_string(r.damage) + " damage!" + crit,
                                            EventKind::Combat);
            hurt.fields = std::move(fields);
            m_events.publish(std::move(hurt));
            m_events.publish(stat_update(t.id, {{"health", target.health}, {"max_health", target.maxHealth}}));
            m_events.publish(message_to_room(a.room, a.name + " hits " + t.name + "!" + crit, {a.id, t.id}));

            if (!target.alive())
            {
                handle_death_(t.id, a.id);
                return;
            }

            const bool offline = target.kind == EntityKind::Player && !target.connected;
            if (m_cfg.autoRetaliate && !offline && !target.combat.in_combat())
            {
                engage_entity(t.id, a.id);
            }

            CombatState &c = a.combat;
            c.phase = CombatPhase::Recovery;
            c.phaseStartedAt = m_clock.now();
            c.phaseDuration = m_cfg.recoveryDelay;
            const EntityId attacker = a.id;
            c.pendingEvent = m_scheduler.schedule(m_cfg.recoveryDelay, [this, attacker]
                                                  { on_recovery_due_(attacker); });
        }

        void on_recovery_due_(EntityId attacker)
        {
            Entity *a = m_world.find(attacker);
            if (!a || a->combat.phase != CombatPhase::Recovery)
            {
                return;
            }
            a->combat.pendingEvent = NoTimer;

            if (!a->alive())
            {
                end_combat_(*a, nullptr);
                return;
            }
            const Entity *t = m_world.find(a->combat.target);
            if (!t || !t->alive() || t->room != a->room)
            {
                end_combat_(*a, "Combat ended.");
                return;
            }
            begin_windup_(*a, *t, true);
        }

        // Everyone fighting `victim` goes back to IDLE, pending swings cancelled.
        void release_targeting_(EntityId victim, const char *why)
        {
            for (EntityId id : m_world.entity_ids())
            {
                if (id == victim)
                {
                    continue;
                }
                Entity *e = m_world.find(id);
                if (e && e->combat.in_combat() && e->combat.target == victim)
                {
                    end_combat_(*e, why);
                }
            }
        }

        void handle_death_(EntityId victimId, EntityId killerId)
        {
            ++m_deaths;
            Entity &victim = m_world.write(victimId);
            const Entity *killer = m_world.find(killerId);
            const std::string killerName = killer ? killer->name : std::string("something");
            const RoomId room = victim.room;

            Logger::instance().logf(LogLevel::Info, m_clock.now(), victimId, "%s slain by %s",
                                    victim.name.c_str(), killerName.c_str());

            release_targeting_(victimId, nullptr);
            reset(victimId);
            m_effects.clear(victimId);

            m_events.publish(message_to_room(room, victim.name + " has been slain by " + killerName + "!"));

            if (victim.kind == EntityKind::Player)
            {
                m_events.publish(message_to(victimId, "You have been slain! (Use 'respawn' to return)"));
                m_events.publish(stat_update(victimId, {{"health", 0}, {"max_health", victim.maxHealth}}));
                return;
            }

            if (killer && killer->kind == EntityKind::Player && victim.experienceReward > 0)
            {
                Entity &k = m_world.write(killerId);
                k.experience += victim.experienceReward;
                m_events.publish(message_to(killerId, "You gain " + std::to_string(victim.experienceReward) + " experience!"));
                m_events.publish(stat_update(killerId, {{"experience", k.experience}}));
            }

            m_world.take_out(victimId);
            if (victim.respawnDelay > Duration::zero())
            {
                m_scheduler.schedule(victim.respawnDelay, [this, victimId]
                                     { respawn_npc_(victimId); });
            }
        }

        void respawn_npc_(EntityId id)
        {
            Entity *e = m_world.find(id);
            if (!e || e->alive() || !m_world.find_room(e->spawnRoom))
            {
                return;
            }
            reset(id);
            e->health = e->maxHealth;
            m_world.move(id, e->spawnRoom);

            Logger::instance().logf(LogLevel::Debug, m_clock.now(), id, "%s respawned in room %llu", e->name.c_str(),
                                    static_cast<unsigned long long>(e->spawnRoom));
            m_events.publish(message_to_room(e->spawnRoom, e->name + " appears."));
        }

        World &m_world;
        Scheduler &m_scheduler;
        EventDispatcher &m_events;
        EffectSystem &m_effects;
        const IClock &m_clock;
        CombatConfig m_cfg;

        std::uint64_t m_fleeAttempts = 0;
        std::uint64_t m_swings = 0;
        std::uint64_t m_deaths = 0;
    };
}
