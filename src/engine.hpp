#pragma once

#include "clock.hpp"
#include "combat.hpp"
#include "command_queue.hpp"
#include "command_registry.hpp"
#include "commands.hpp"
#include "effects.hpp"
#include "event_dispatcher.hpp"
#include "log.hpp"
#include "scheduler.hpp"
#include "world.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace realmsim
{
    struct EngineConfig
    {
        // Upper bound on one idle wait, even when no timer is due sooner.
        Duration maxPollInterval = std::chrono::milliseconds(250);

        // Process-wide log level to install. Unset leaves the Logger as the host set it
        // (the Logger itself starts disabled).
        std::optional<LogLevel> logLevel;

        CombatConfig combat{};
        EffectConfig effects{};

        // Passive regeneration for idle, living entities. Zero interval disables it.
        Duration regenInterval = Duration::zero();
        int regenAmount = 1;

        bool registerBuiltinCommands = true;

        // Optional persistence hooks. `markDirty` is called for every entity mutation;
        // `saveOnShutdown` receives the sorted set of entities dirtied during the run.
        std::function<void(EntityId)> markDirty;
        std::function<void(const std::vector<EntityId> &)> saveOnShutdown;

        // Enable extra runtime invariant checks after every unit of work (throws on violation).
#if defined(REALMSIM_ENABLE_INVARIANT_CHECKS_DEFAULT)
        bool enableInvariantChecks = (REALMSIM_ENABLE_INVARIANT_CHECKS_DEFAULT != 0);
#else
        bool enableInvariantChecks = false;
#endif
    };

    // The single logical worker.
    //
    // Owns the world graph and every subsystem that mutates it. Each iteration runs
    // exactly one unit of work (one command, or else one due timer) to completion and
    // then flushes the outbound events it produced. Transport threads only call
    // enqueue_command/connect/disconnect/drain/request_shutdown; everything else is for
    // code running on the loop (handlers, timer callbacks) or for a caller that drives
    // the loop itself through run_one().
    class Engine
    {
    public:
        struct Stats
        {
            std::uint64_t unitsOfWork = 0;
            std::uint64_t commandsProcessed = 0;
            std::uint64_t timersFired = 0;
            std::uint64_t handlerFaults = 0;
            std::uint64_t unknownCommands = 0;

            std::size_t timersPending = 0;
            std::size_t commandsQueued = 0;
            std::size_t dirtyEntities = 0;
        };

        explicit Engine(EngineConfig cfg = {}, std::shared_ptr<IClock> clock = std::make_shared<SteadyClock>())
            : m_cfg(std::move(cfg)),
              m_clock(require_clock_(std::move(clock))),
              m_scheduler(*m_clock),
              m_queue(*m_clock),
              m_effects(m_world, m_scheduler, m_events, *m_clock, m_cfg.effects),
              m_combat(m_world, m_scheduler, m_events, m_effects, *m_clock, m_cfg.combat)
        {
            if (m_cfg.maxPollInterval <= Duration::zero())
            {
                throw std::runtime_error("Engine: maxPollInterval must be positive");
            }
            if (m_cfg.regenInterval < Duration::zero())
            {
                throw std::runtime_error("Engine: regenInterval must not be negative");
            }

            if (m_cfg.logLevel)
            {
                Logger::instance().set_level(*m_cfg.logLevel);
            }

            m_world.set_dirty_sink([this](EntityId id)
                                   { mark_dirty(id); });
            m_events.set_room_resolver([this](RoomId room)
                                       { return m_world.players_in(room); });

            if (m_cfg.registerBuiltinCommands)
            {
                register_builtin_commands(m_registry, GameSystems{m_world, m_events, m_combat, m_effects});
            }

            if (m_cfg.regenInterval > Duration::zero())
            {
                m_scheduler.schedule(
                    m_cfg.regenInterval, [this]
                    { regen_tick_(); },
                    true, m_cfg.regenInterval);
            }
        }

        Engine(const Engine &) = delete;
        Engine &operator=(const Engine &) = delete;

        ~Engine() { stop(); }

        // Runs the loop on a dedicated thread until stop().
        void start()
        {
            if (m_thread.joinable())
            {
                throw std::runtime_error("Engine::start: already running");
            }
            m_shutdown.store(false);
            m_thread = std::thread([this]
                                   {
                try
                {
                    run();
                }
                catch (const std::exception &ex)
                {
                    m_loopFailed.store(true);
                    Logger::instance().logf(LogLevel::Error, m_clock->now(), NoEntity, "engine loop terminated: %s", ex.what());
                } });
        }

        void stop()
        {
            request_shutdown();
            if (m_thread.joinable())
            {
                m_thread.join();
            }
        }

        bool loop_failed() const noexcept { return m_loopFailed.load(); }

        // Blocks until request_shutdown(). Finishes the unit in flight, then runs the
        // shutdown drain pass.
        void run()
        {
            Logger::instance().logf(LogLevel::Info, m_clock->now(), NoEntity, "engine loop started (%zu verbs)", m_registry.size());
            while (!m_shutdown.load())
            {
                if (!run_one())
                {
                    wait_for_work_();
                }
            }
            drain_on_shutdown_();
        }

        // Processes at most one unit of work at the clock's current time. A queued command
        // always wins over a due timer. Returns true if a unit ran.
        bool run_one()
        {
            if (std::optional<Command> cmd = m_queue.try_pop())
            {
                begin_unit_();
                process_command_(*cmd);
                end_unit_();
                return true;
            }

            if (Scheduler::Entry entry = m_scheduler.pop_ready(m_clock->now()))
            {
                begin_unit_();
                run_timer_(*entry);
                m_scheduler.rearm(entry);
                end_unit_();
                return true;
            }
            return false;
        }

        // Runs units until nothing is ready at the current time. Returns the count.
        std::size_t run_pending()
        {
            std::size_t n = 0;
            while (run_one())
            {
                ++n;
            }
            return n;
        }

        void request_shutdown()
        {
            m_shutdown.store(true);
            m_queue.wake();
        }

        bool shutdown_requested() const noexcept { return m_shutdown.load(); }

        // Thread-safe, non-blocking. Returns the arrival sequence.
        std::uint64_t enqueue_command(ParticipantId source, std::string text)
        {
            return m_queue.push(source, std::move(text), CommandKind::Input);
        }

        // Thread-safe. The mailbox exists from this call on; the entity is marked connected
        // when the Connect command reaches the loop.
        std::uint64_t connect(ParticipantId who)
        {
            m_events.register_participant(who);
            return m_queue.push(who, std::string(), CommandKind::Connect);
        }

        // Thread-safe. Combat is cancelled and the mailbox dropped on the loop, in order
        // with everything the participant sent before.
        std::uint64_t disconnect(ParticipantId who)
        {
            return m_queue.push(who, std::string(), CommandKind::Disconnect);
        }

        // Thread-safe.
        std::vector<OutboundEvent> drain(ParticipantId who) { return m_events.drain(who); }

        void register_command(std::string verb, CommandRegistry::Handler handler, std::vector<std::string> aliases = {})
        {
            m_registry.register_handler(std::move(verb), std::move(handler), std::move(aliases));
        }

        // Loop-only accessors.
        World &world() noexcept { return m_world; }
        const World &world() const noexcept { return m_world; }
        Scheduler &scheduler() noexcept { return m_scheduler; }
        EventDispatcher &events() noexcept { return m_events; }
        CombatSystem &combat() noexcept { return m_combat; }
        EffectSystem &effects() noexcept { return m_effects; }
        const CommandRegistry &commands() const noexcept { return m_registry; }
        const IClock &clock() const noexcept { return *m_clock; }
        const EngineConfig &config() const noexcept { return m_cfg; }

        void mark_dirty(EntityId id)
        {
            m_dirty.insert(id);
            if (m_cfg.markDirty)
            {
                m_cfg.markDirty(id);
            }
        }

        const std::set<EntityId> &dirty() const noexcept { return m_dirty; }

        // Admin removal: every fight involving the entity ends, its timers are cancelled,
        // and it leaves its room and the world graph. Returns false for unknown ids.
        bool remove_entity(EntityId id)
        {
            const Entity *e = m_world.find(id);
            if (!e)
            {
                return false;
            }
            const RoomId room = e->room;
            const std::string name = e->name;

            m_combat.on_entity_removed(id);
            m_effects.clear(id);
            m_world.remove(id);
            mark_dirty(id);

            if (room != NoRoom)
            {
                m_events.publish(message_to_room(room, name + " vanishes."));
            }
            Logger::instance().logf(LogLevel::Info, m_clock->now(), id, "entity '%s' removed", name.c_str());
            return true;
        }

        Stats stats() const
        {
            Stats out = m_stats;
            out.timersPending = m_scheduler.size();
            out.commandsQueued = m_queue.size();
            out.dirtyEntities = m_dirty.size();
            return out;
        }

    private:
        static std::shared_ptr<IClock> require_clock_(std::shared_ptr<IClock> clock)
        {
            if (!clock)
            {
                throw std::runtime_error("Engine: null clock");
            }
            return clock;
        }

        void begin_unit_()
        {
            ++m_stats.unitsOfWork;
            m_events.begin_unit(m_stats.unitsOfWork);
        }

        void end_unit_()
        {
            m_events.flush();
            if (m_cfg.enableInvariantChecks)
            {
                validate_invariants_();
            }
        }

        void process_command_(const Command &cmd)
        {
            ++m_stats.commandsProcessed;
            Logger::instance().logf(LogLevel::Trace, m_clock->now(), cmd.source, "command #%llu '%s'",
                                    static_cast<unsigned long long>(cmd.sequence), cmd.text.c_str());
            try
            {
                switch (cmd.kind)
                {
                case CommandKind::Connect:
                    on_connect_(cmd.source);
                    break;
                case CommandKind::Disconnect:
                    on_disconnect_(cmd.source);
                    break;
                case CommandKind::Input:
                    if (trim(cmd.text).empty())
                    {
                        break;
                    }
                    if (!m_registry.dispatch(cmd))
                    {
                        ++m_stats.unknownCommands;
                        const auto [verb, args] = CommandRegistry::split_verb(cmd.text);
                        (void)args;
                        m_events.publish(message_to(cmd.source, "Unknown command: " + verb));
                    }
                    break;
                }
            }
            catch (const std::exception &ex)
            {
                ++m_stats.handlerFaults;
                Logger::instance().logf(LogLevel::Error, m_clock->now(), cmd.source, "command #%llu '%s' failed: %s",
                                        static_cast<unsigned long long>(cmd.sequence), cmd.text.c_str(), ex.what());
            }
        }

        void run_timer_(const TimedCallback &entry)
        {
            ++m_stats.timersFired;
            try
            {
                entry.action();
            }
            catch (const std::exception &ex)
            {
                ++m_stats.handlerFaults;
                Logger::instance().logf(LogLevel::Error, m_clock->now(), NoEntity, "timer %llu (firing %llu) failed: %s",
                                        static_cast<unsigned long long>(entry.id),
                                        static_cast<unsigned long long>(entry.firings), ex.what());
            }
        }

        void on_connect_(ParticipantId who)
        {
            m_events.register_participant(who);
            Entity *e = m_world.find(who);
            if (!e)
            {
                m_events.publish(message_to(who, "You have no form."));
                return;
            }
            m_world.write(who).connected = true;
            Logger::instance().logf(LogLevel::Info, m_clock->now(), who, "%s connected", e->name.c_str());

            m_events.publish(message_to_room(e->room, e->name + " has entered the world.", {who}));
            m_events.publish(message_to(who, commands::describe_room(m_world, *e)));
            m_events.publish(stat_update(who, {{"health", e->health}, {"max_health", e->maxHealth}}));
        }

        void on_disconnect_(ParticipantId who)
        {
            if (Entity *e = m_world.find(who))
            {
                m_world.write(who).connected = false;
                m_combat.on_disconnect(who);
                m_events.publish(message_to_room(e->room, e->name + " has left the world.", {who}));
                Logger::instance().logf(LogLevel::Info, m_clock->now(), who, "%s disconnected", e->name.c_str());
            }
            m_events.unregister_participant(who);
        }

        void wait_for_work_()
        {
            Duration wait = m_cfg.maxPollInterval;
            if (std::optional<Duration> next = m_scheduler.time_until_next(m_clock->now()))
            {
                wait = std::min(wait, *next);
            }
            if (wait > Duration::zero())
            {
                m_queue.wait_for(wait);
            }
        }

        void drain_on_shutdown_()
        {
            const std::size_t dropped = m_queue.size();
            Logger::instance().logf(LogLevel::Info, m_clock->now(), NoEntity,
                                    "engine shutting down (%zu dirty entities, %zu queued commands dropped)", m_dirty.size(), dropped);
            if (m_cfg.saveOnShutdown)
            {
                const std::vector<EntityId> ids(m_dirty.begin(), m_dirty.end());
                try
                {
                    m_cfg.saveOnShutdown(ids);
                    m_dirty.clear();
                }
                catch (const std::exception &ex)
                {
                    Logger::instance().logf(LogLevel::Error, m_clock->now(), NoEntity, "save on shutdown failed: %s", ex.what());
                }
            }
            m_events.flush();
        }

        void regen_tick_()
        {
            for (EntityId id : m_world.entity_ids())
            {
                const Entity &e = m_world.entity(id);
                if (!e.alive() || e.room == NoRoom || e.combat.in_combat() || e.health >= e.maxHealth)
                {
                    continue;
                }
                Entity &w = m_world.write(id);
                w.health = std::min(w.maxHealth, w.health + m_cfg.regenAmount);
                if (w.kind == EntityKind::Player && w.connected)
                {
                    m_events.publish(stat_update(id, {{"health", w.health}, {"max_health", w.maxHealth}}));
                }
            }
        }

        void validate_invariants_()
        {
            for (EntityId id : m_world.entity_ids())
            {
                const Entity &e = m_world.entity(id);
                const CombatState &c = e.combat;
                switch (c.phase)
                {
                case CombatPhase::Idle:
                    if (c.pendingEvent != NoTimer || c.target != NoEntity)
                    {
                        throw std::runtime_error("Invariant violated: idle entity " + std::to_string(id) + " holds a timer or target");
                    }
                    break;
                case CombatPhase::Swing:
                    throw std::runtime_error("Invariant violated: entity " + std::to_string(id) + " left in SWING after a unit of work");
                case CombatPhase::Windup:
                case CombatPhase::Recovery:
                    if (!m_scheduler.is_pending(c.pendingEvent))
                    {
                        throw std::runtime_error("Invariant violated: entity " + std::to_string(id) + " in " +
                                                 combat_phase_name(c.phase) + " without a pending transition");
                    }
                    break;
                }

                if (e.room != NoRoom)
                {
                    const Room &r = m_world.room(e.room);
                    if (std::find(r.occupants.begin(), r.occupants.end(), id) == r.occupants.end())
                    {
                        throw std::runtime_error("Invariant violated: entity " + std::to_string(id) + " missing from its room");
                    }
                }
            }
        }

        EngineConfig m_cfg;
        std::shared_ptr<IClock> m_clock;

        World m_world;
        Scheduler m_scheduler;
        CommandQueue m_queue;
        EventDispatcher m_events;
        CommandRegistry m_registry;
        EffectSystem m_effects;
        CombatSystem m_combat;

        std::set<EntityId> m_dirty;
        Stats m_stats;

        std::atomic<bool> m_shutdown{false};
        std::atomic<bool> m_loopFailed{false};
        std::thread m_thread;
    };
}
