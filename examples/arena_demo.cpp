#include "engine.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

// Real-time arena: the engine loop runs on its own thread against the wall clock while
// two scripted "connections" feed it commands from transport threads and a printer
// thread drains their mailboxes.
//
//   arena_demo [--duration S] [--seed N] [--log-level LEVEL]
//
// REALMSIM_LOG_LEVEL is read when --log-level is absent.

namespace
{
    using namespace std::chrono_literals;

    constexpr realmsim::RoomId Gate = 1;
    constexpr realmsim::RoomId Pit = 2;
    constexpr realmsim::RoomId Shrine = 3;

    constexpr realmsim::EntityId Kara = 1;
    constexpr realmsim::EntityId Brom = 2;
    constexpr realmsim::EntityId Ghoul = 100;
    constexpr realmsim::EntityId Rat = 101;

    constexpr realmsim::ItemId Spear = 10;
    constexpr realmsim::ItemId Dagger = 11;

    struct Params
    {
        std::uint32_t durationSeconds = 20;
        std::uint64_t seed = 1;
        realmsim::LogLevel logLevel = realmsim::LogLevel::Warn;
    };

    [[noreturn]] void usage_and_exit()
    {
        std::cerr
            << "Real-time arena demo\n"
            << "  --duration S      seconds of wall time to run (default 20)\n"
            << "  --seed N          combat RNG seed (default 1)\n"
            << "  --log-level L     error|warn|info|debug|trace|off (default warn,\n"
            << "                    or REALMSIM_LOG_LEVEL)\n";
        std::exit(2);
    }

    // Whole-string unsigned parse; rejects trailing text.
    template <class T>
    bool parse_number(std::string_view s, T &out)
    {
        T v{};
        const auto r = std::from_chars(s.data(), s.data() + s.size(), v);
        if (r.ec != std::errc() || r.ptr != s.data() + s.size())
        {
            return false;
        }
        out = v;
        return true;
    }

    Params parse_args(int argc, char **argv)
    {
        Params p;
        if (const char *env = std::getenv("REALMSIM_LOG_LEVEL"))
        {
            if (!realmsim::parse_log_level(env, p.logLevel))
            {
                std::cerr << "ignoring REALMSIM_LOG_LEVEL='" << env << "'\n";
            }
        }

        for (int i = 1; i < argc; ++i)
        {
            std::string_view a(argv[i]);
            auto need = [&]() -> std::string_view
            {
                if (i + 1 >= argc)
                {
                    usage_and_exit();
                }
                return std::string_view(argv[++i]);
            };

            if (a == "--duration")
            {
                if (!parse_number(need(), p.durationSeconds) || p.durationSeconds == 0)
                    usage_and_exit();
            }
            else if (a == "--seed")
            {
                if (!parse_number(need(), p.seed))
                    usage_and_exit();
            }
            else if (a == "--log-level")
            {
                if (!realmsim::parse_log_level(need(), p.logLevel))
                    usage_and_exit();
            }
            else
            {
                usage_and_exit();
            }
        }
        return p;
    }

    void build_world(realmsim::World &w)
    {
        using realmsim::Room;
        w.add_room(Room{Gate, "The Gate", "Iron bars and a bored crowd.", {}, {}});
        w.add_room(Room{Pit, "The Pit", "A sunken ring of packed sand.", {}, {}});
        w.add_room(Room{Shrine, "The Shrine", "Candles gutter before a cracked idol.", {}, {}});
        w.link(Gate, "down", Pit);
        w.link(Pit, "up", Gate);
        w.link(Gate, "east", Shrine);
        w.link(Shrine, "west", Gate);

        realmsim::WeaponTemplate spear;
        spear.id = Spear;
        spear.name = "ash spear";
        spear.keywords = {"spear"};
        spear.damageMin = 4;
        spear.damageMax = 9;
        spear.swingInterval = 2500ms;
        spear.damageType = "piercing";
        w.add_weapon(spear);

        realmsim::WeaponTemplate dagger;
        dagger.id = Dagger;
        dagger.name = "bone dagger";
        dagger.keywords = {"dagger"};
        dagger.damageMin = 2;
        dagger.damageMax = 5;
        dagger.swingInterval = 1s;
        w.add_weapon(dagger);

        realmsim::Entity kara;
        kara.id = Kara;
        kara.kind = realmsim::EntityKind::Player;
        kara.name = "Kara";
        kara.room = Gate;
        kara.spawnRoom = Gate;
        kara.strength = 14;
        kara.inventory = {Spear};
        w.spawn(kara);

        realmsim::Entity brom;
        brom.id = Brom;
        brom.kind = realmsim::EntityKind::Player;
        brom.name = "Brom";
        brom.room = Gate;
        brom.spawnRoom = Gate;
        brom.dexterity = 16;
        brom.inventory = {Dagger};
        w.spawn(brom);

        realmsim::Entity ghoul;
        ghoul.id = Ghoul;
        ghoul.name = "pit ghoul";
        ghoul.keywords = {"ghoul"};
        ghoul.room = Pit;
        ghoul.spawnRoom = Pit;
        ghoul.maxHealth = ghoul.health = 60;
        ghoul.armorClass = 5;
        ghoul.baseDamageMin = 2;
        ghoul.baseDamageMax = 6;
        ghoul.baseSwingInterval = 3s;
        ghoul.experienceReward = 40;
        ghoul.respawnDelay = 10s;
        w.spawn(ghoul);

        realmsim::Entity rat;
        rat.id = Rat;
        rat.name = "sewer rat";
        rat.keywords = {"rat"};
        rat.room = Pit;
        rat.spawnRoom = Pit;
        rat.maxHealth = rat.health = 12;
        rat.armorClass = 0;
        rat.experienceReward = 5;
        rat.respawnDelay = 5s;
        w.spawn(rat);
    }

    struct Step
    {
        std::chrono::milliseconds after;
        std::string text;
    };

    // One scripted connection: connects, then plays its lines with pauses.
    void play(realmsim::Engine &engine, realmsim::ParticipantId who, const std::vector<Step> &script,
              const std::atomic<bool> &stopping)
    {
        engine.connect(who);
        for (const Step &s : script)
        {
            const auto until = std::chrono::steady_clock::now() + s.after;
            while (std::chrono::steady_clock::now() < until)
            {
                if (stopping.load())
                {
                    return;
                }
                std::this_thread::sleep_for(20ms);
            }
            engine.enqueue_command(who, s.text);
        }
    }
}

int main(int argc, char **argv)
{
    const Params p = parse_args(argc, argv);

    realmsim::EngineConfig cfg;
    cfg.logLevel = p.logLevel;
    cfg.combat.seed = p.seed;
    cfg.regenInterval = 5s;
    cfg.regenAmount = 2;
    cfg.saveOnShutdown = [](const std::vector<realmsim::EntityId> &ids)
    {
        std::printf("[save] %zu dirty entities:", ids.size());
        for (realmsim::EntityId id : ids)
        {
            std::printf(" %llu", static_cast<unsigned long long>(id));
        }
        std::printf("\n");
    };

    realmsim::Engine engine(cfg);
    build_world(engine.world());

    // Demo-only verbs running through the same registry as the built-ins.
    engine.register_command("pray", [&engine](const realmsim::Command &cmd, std::string_view)
                            {
        const realmsim::Entity *e = engine.world().find(cmd.source);
        if (!e || e->room != Shrine)
        {
            engine.events().publish(realmsim::message_to(cmd.source, "There is nothing here to pray to."));
            return;
        }
        engine.effects().bless(cmd.source, 3, 8s); });
    engine.register_command("throw", [&engine](const realmsim::Command &cmd, std::string_view args)
                            {
        const realmsim::Entity *e = engine.world().find(cmd.source);
        if (!e)
        {
            return;
        }
        const realmsim::Entity *target = engine.world().find_in_room(e->room, args, cmd.source);
        if (!target || target->id == cmd.source)
        {
            engine.events().publish(realmsim::message_to(cmd.source, "Throw at whom?"));
            return;
        }
        engine.events().publish(realmsim::message_to(cmd.source, "You fling a venom dart at " + target->name + "."));
        engine.effects().poison(target->id, 2, 1s, 6s); });

    const std::vector<Step> karaScript{
        {300ms, "look"},
        {500ms, "wield spear"},
        {500ms, "east"},
        {400ms, "pray"},
        {400ms, "effects"},
        {400ms, "west"},
        {400ms, "down"},
        {300ms, "attack ghoul"},
        {3000ms, "combat"},
        {6000ms, "say that was close"},
        {1000ms, "up"},
    };
    const std::vector<Step> bromScript{
        {600ms, "wield dagger"},
        {500ms, "down"},
        {500ms, "throw rat"},
        {300ms, "kill rat"},
        {4000ms, "attack ghoul"},
        {2500ms, "flee"},
        {1500ms, "status"},
        {2000ms, "dance"},
    };

    engine.start();

    std::atomic<bool> stopping{false};
    std::mutex outMu;
    std::thread printer([&]
                        {
        while (!stopping.load())
        {
            for (realmsim::ParticipantId who : {Kara, Brom})
            {
                for (const auto &ev : engine.drain(who))
                {
                    if (ev.text.empty())
                    {
                        continue;
                    }
                    std::lock_guard<std::mutex> lk(outMu);
                    std::printf("[%s] %s\n", (who == Kara) ? "Kara" : "Brom", ev.text.c_str());
                }
            }
            std::this_thread::sleep_for(50ms);
        } });

    std::thread karaConn([&]
                         { play(engine, Kara, karaScript, stopping); });
    std::thread bromConn([&]
                         { play(engine, Brom, bromScript, stopping); });

    std::this_thread::sleep_for(std::chrono::seconds(p.durationSeconds));

    stopping.store(true);
    karaConn.join();
    bromConn.join();
    engine.disconnect(Kara);
    engine.disconnect(Brom);

    // Let the loop process the disconnects before stopping it.
    std::this_thread::sleep_for(200ms);
    engine.stop();
    printer.join();

    if (engine.loop_failed())
    {
        std::fprintf(stderr, "engine loop failed\n");
        return 1;
    }

    // The loop thread has been joined; stats are safe to read.
    const realmsim::Engine::Stats s = engine.stats();
    std::printf("units=%llu commands=%llu timers=%llu faults=%llu unknown=%llu pending=%zu\n",
                static_cast<unsigned long long>(s.unitsOfWork),
                static_cast<unsigned long long>(s.commandsProcessed),
                static_cast<unsigned long long>(s.timersFired),
                static_cast<unsigned long long>(s.handlerFaults),
                static_cast<unsigned long long>(s.unknownCommands),
                s.timersPending);
    return 0;
}
