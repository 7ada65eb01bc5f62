#pragma once

// Shared helpers for the engine tests: a small two-room world and a way to drive a
// ManualClock-backed engine through time deterministically.

#include "engine.hpp"

#include <cassert>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace realmsim::testing
{
    constexpr RoomId ArenaRoom = 1;
    constexpr RoomId HallRoom = 2;

    inline TimePoint at(double seconds)
    {
        return TimePoint{} + from_seconds(seconds);
    }

    // Moves the clock forward to `until`, stopping at every timer that comes due on the
    // way and running everything ready at that instant. Returns the units of work run.
    inline std::size_t advance_to(Engine &engine, ManualClock &clock, TimePoint until)
    {
        std::size_t n = engine.run_pending();
        while (true)
        {
            const std::optional<TimePoint> next = engine.scheduler().next_due();
            if (!next || *next > until)
            {
                break;
            }
            if (*next > clock.now())
            {
                clock.set(*next);
            }
            n += engine.run_pending();
        }
        if (until > clock.now())
        {
            clock.set(until);
        }
        n += engine.run_pending();
        return n;
    }

    inline std::size_t advance_to(Engine &engine, ManualClock &clock, double seconds)
    {
        return advance_to(engine, clock, at(seconds));
    }

    struct Arena
    {
        std::shared_ptr<ManualClock> clock;
        std::unique_ptr<Engine> engine;

        Engine &operator*() { return *engine; }
        Engine *operator->() { return engine.get(); }

        std::size_t advance_to(double seconds) { return testing::advance_to(*engine, *clock, seconds); }
    };

    // Arena <-> Hall, connected north/south.
    inline Arena make_arena(EngineConfig cfg = {})
    {
        Arena a;
        a.clock = std::make_shared<ManualClock>();
        a.engine = std::make_unique<Engine>(std::move(cfg), a.clock);

        World &w = a.engine->world();
        w.add_room(Room{ArenaRoom, "The Arena", "Sand, blood and a ring of empty stands.", {}, {}});
        w.add_room(Room{HallRoom, "The Hall", "A draughty stone hall.", {}, {}});
        w.link(ArenaRoom, "north", HallRoom);
        w.link(HallRoom, "south", ArenaRoom);
        return a;
    }

    inline Entity make_player(EntityId id, std::string name, RoomId room = ArenaRoom)
    {
        Entity e;
        e.id = id;
        e.kind = EntityKind::Player;
        e.keywords = {to_lower(name)};
        e.name = std::move(name);
        e.room = room;
        e.maxHealth = 100;
        e.health = 100;
        e.armorClass = 0;
        e.strength = 10;
        return e;
    }

    inline Entity make_npc(EntityId id, std::string name, int health, RoomId room = ArenaRoom)
    {
        Entity e;
        e.id = id;
        e.kind = EntityKind::Npc;
        e.keywords = {to_lower(name)};
        e.name = std::move(name);
        e.room = room;
        e.maxHealth = health;
        e.health = health;
        e.armorClass = 0;
        e.strength = 10;
        return e;
    }

    // Spawns and connects a player, then empties every mailbox so tests start from a
    // quiet world.
    inline void join(Arena &a, Entity player)
    {
        const EntityId id = player.id;
        a.engine->world().spawn(std::move(player));
        a.engine->connect(id);
        a.engine->run_pending();
        for (EntityId other : a.engine->world().entity_ids())
        {
            (void)a.engine->drain(other);
        }
    }

    inline std::vector<std::string> texts(const std::vector<OutboundEvent> &events)
    {
        std::vector<std::string> out;
        for (const auto &ev : events)
        {
            if (!ev.text.empty())
            {
                out.push_back(ev.text);
            }
        }
        return out;
    }

    inline std::size_t count_containing(const std::vector<OutboundEvent> &events, std::string_view needle)
    {
        std::size_t n = 0;
        for (const auto &ev : events)
        {
            if (ev.text.find(needle) != std::string::npos)
            {
                ++n;
            }
        }
        return n;
    }

    template <class Fn>
    void expect_throw(Fn &&fn)
    {
        bool threw = false;
        try
        {
            fn();
        }
        catch (const std::exception &)
        {
            threw = true;
        }
        assert(threw);
    }
}
