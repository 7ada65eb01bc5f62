/*
Purpose: Every path back to IDLE cancels the pending combat timer.

What this tests: disengage, disconnect (including the opponent that retaliated),
admin removal, the target leaving the room and a successful flee all return the
combatant to IDLE with its pending transition cancelled. Invalid engage attempts are rejected to the sender without mutation.
Retaliation, player death and the respawn command are covered along the way.
*/

#include "harness.hpp"

#include <cassert>
#include <chrono>
#include <string>

using namespace std::chrono_literals;
using namespace realmsim;
using namespace realmsim::testing;

namespace
{
    Arena make_quiet_arena(bool retaliate = false)
    {
        EngineConfig cfg;
        cfg.combat.autoRetaliate = retaliate;
        return make_arena(cfg);
    }

    void assert_idle(const Entity &e)
    {
        assert(e.combat.phase == CombatPhase::Idle);
        assert(e.combat.pendingEvent == NoTimer);
        assert(e.combat.target == NoEntity);
    }
}

int main()
{
    // Rejections are single-participant and mutate nothing.
    {
        Arena a = make_quiet_arena();
        join(a, make_player(1, "Alice"));
        join(a, make_player(2, "Bob"));
        Entity corpse = make_npc(3, "Rat", 5);
        corpse.health = 0;
        a->world().spawn(std::move(corpse));

        a->enqueue_command(1, "attack");
        a->enqueue_command(1, "attack dragon");
        a->enqueue_command(1, "attack alice");
        a->enqueue_command(1, "attack rat");
        a->enqueue_command(1, "stop");
        a->enqueue_command(1, "flee");
        a->enqueue_command(99, "attack bob");
        a->run_pending();

        const auto t = texts(a->drain(1));
        assert((t == std::vector<std::string>{"Attack whom?", "'dragon' not found.", "You can't attack yourself!",
                                              "Rat is already dead.", "You're not in combat.", "You're not in combat."}));
        assert(a->drain(2).empty());
        assert_idle(a->world().entity(1));
        assert(a->scheduler().size() == 0);
        assert(a->stats().handlerFaults == 0);

        // Already fighting.
        a->enqueue_command(1, "attack bob");
        a->enqueue_command(1, "attack bob");
        a->run_pending();
        assert(texts(a->drain(1)).back() == "You're already attacking Bob! Use 'stop' to disengage first.");
    }

    // stop: cancels the pending swing.
    {
        Arena a = make_quiet_arena();
        join(a, make_player(1, "Alice"));
        a->world().spawn(make_npc(2, "Rat", 50));

        a->enqueue_command(1, "attack rat");
        a->run_pending();
        const TimerId swing = a->world().entity(1).combat.pendingEvent;
        assert(a->scheduler().is_pending(swing));

        a.advance_to(1.0);
        a->enqueue_command(1, "stop");
        a->run_pending();
        assert_idle(a->world().entity(1));
        assert(!a->scheduler().is_pending(swing));
        assert(texts(a->drain(1)).back() == "You stop attacking Rat.");

        a.advance_to(10.0);
        assert(a->combat().swings_total() == 0);
        assert(a->world().entity(2).health == 50);
    }

    // Disconnect mid-combat: idle, no more swings, mailbox gone.
    {
        Arena a = make_quiet_arena();
        join(a, make_player(1, "Alice"));
        a->world().spawn(make_npc(2, "Rat", 50));

        a->enqueue_command(1, "attack rat");
        a.advance_to(2.2);
        assert(a->combat().swings_total() == 1);
        assert(a->world().entity(1).combat.phase == CombatPhase::Recovery);

        a->disconnect(1);
        a->run_pending();
        assert_idle(a->world().entity(1));
        assert(!a->world().entity(1).connected);
        assert(!a->events().is_registered(1));

        a.advance_to(20.0);
        assert(a->combat().swings_total() == 1);
    }

    // Disconnect with default retaliation: the NPC that turned on the player stands
    // down too, and later hits on the offline player draw no counter-attack.
    {
        Arena a = make_arena();
        join(a, make_player(1, "Alice"));
        a->world().spawn(make_npc(2, "Rat", 500));

        a->enqueue_command(1, "attack rat");
        a.advance_to(2.2);
        assert(a->combat().swings_total() == 1);
        assert(a->world().entity(2).combat.target == 1);
        const TimerId ratSwing = a->world().entity(2).combat.pendingEvent;
        assert(a->scheduler().is_pending(ratSwing));

        a->disconnect(1);
        a->run_pending();
        assert_idle(a->world().entity(1));
        assert_idle(a->world().entity(2));
        assert(!a->scheduler().is_pending(ratSwing));

        a.advance_to(10.0);
        assert(a->combat().swings_total() == 1);
        assert(a->world().entity(1).health == 100);
        assert_idle(a->world().entity(1));

        // Scripted aggression against the offline player: no retaliation.
        assert(a->combat().engage_entity(2, 1));
        a.advance_to(12.2);
        assert(a->combat().swings_total() == 2);
        assert(a->world().entity(1).health < 100);
        assert_idle(a->world().entity(1));
    }

    // Admin removal of the target: attacker idles at once; removal of the attacker
    // cancels its own timer.
    {
        Arena a = make_quiet_arena();
        join(a, make_player(1, "Alice"));
        join(a, make_player(3, "Bob"));
        a->world().spawn(make_npc(2, "Rat", 50));

        a->enqueue_command(1, "attack rat");
        a->enqueue_command(3, "attack rat");
        a->run_pending();
        const TimerId bobsSwing = a->world().entity(3).combat.pendingEvent;

        assert(a->remove_entity(2));
        assert(!a->remove_entity(2));
        assert(!a->world().contains(2));
        assert_idle(a->world().entity(1));
        assert_idle(a->world().entity(3));
        assert(!a->scheduler().is_pending(bobsSwing));

        a->enqueue_command(1, "attack bob");
        a->run_pending();
        const TimerId alicesSwing = a->world().entity(1).combat.pendingEvent;
        assert(a->remove_entity(1));
        assert(!a->scheduler().is_pending(alicesSwing));

        a.advance_to(30.0);
        assert(a->combat().swings_total() == 0);
        assert(a->world().entity(3).health == 100);
        assert(count_containing(a->drain(3), "Your target is no longer here.") == 1);
    }

    // The target walks away during the windup: the swing finds nobody.
    {
        Arena a = make_quiet_arena();
        join(a, make_player(1, "Alice"));
        join(a, make_player(2, "Bob"));

        a->enqueue_command(1, "attack bob");
        a->enqueue_command(2, "north");
        a->run_pending();
        assert(a->world().entity(2).room == HallRoom);

        a.advance_to(2.0);
        assert(a->combat().swings_total() == 0);
        assert_idle(a->world().entity(1));
        assert(texts(a->drain(1)).back() == "Your target is no longer here.");
    }

    // Retaliation: an idle target engages its attacker after the first hit.
    {
        Arena a = make_quiet_arena(/*retaliate=*/true);
        join(a, make_player(1, "Alice"));
        a->world().spawn(make_npc(2, "Wolf", 500));

        a->enqueue_command(1, "attack wolf");
        a.advance_to(2.0);
        const Entity &wolf = a->world().entity(2);
        assert(wolf.combat.phase == CombatPhase::Windup);
        assert(wolf.combat.target == 1);

        a.advance_to(4.0);
        assert(a->world().entity(1).health < 100);
        assert(count_containing(a->drain(1), "Wolf hits you for") == 1);
    }

    // Flee: success moves through an exit and idles; failure keeps fighting.
    {
        EngineConfig cfg;
        cfg.combat.autoRetaliate = false;
        Arena a = make_arena(cfg);
        Entity alice = make_player(1, "Alice");
        alice.dexterity = 40; // +15: always escapes
        join(a, std::move(alice));
        Entity clumsy = make_player(3, "Clod");
        clumsy.dexterity = -30; // -20: never escapes
        join(a, std::move(clumsy));
        a->world().spawn(make_npc(2, "Troll", 500));

        a->enqueue_command(1, "attack troll");
        a->enqueue_command(3, "attack troll");
        a->run_pending();
        const TimerId swing = a->world().entity(1).combat.pendingEvent;

        a->enqueue_command(1, "flee");
        a->enqueue_command(3, "flee");
        a->run_pending();

        assert(a->world().entity(1).room == HallRoom);
        assert_idle(a->world().entity(1));
        assert(!a->scheduler().is_pending(swing));
        assert(texts(a->drain(1)).back().rfind("You flee north!", 0) == 0);

        assert(a->world().entity(3).room == ArenaRoom);
        assert(a->world().entity(3).combat.phase == CombatPhase::Windup);
        const auto clod = texts(a->drain(3));
        bool failed = false;
        for (const auto &line : clod)
        {
            failed = failed || line.rfind("You fail to escape!", 0) == 0;
        }
        assert(failed);

        // Moving while fighting is refused.
        a->enqueue_command(3, "north");
        a->run_pending();
        assert(texts(a->drain(3)).back() == "You're fighting! Use 'flee' to escape.");
        assert(a->world().entity(3).room == ArenaRoom);
    }

    // Player death and respawn.
    {
        EngineConfig cfg;
        cfg.combat.autoRetaliate = false;
        Arena a = make_arena(cfg);
        Entity alice = make_player(1, "Alice");
        alice.health = 1;
        join(a, std::move(alice));
        a->world().spawn(make_npc(2, "Ogre", 500));

        a->combat().engage_entity(2, 1);
        a.advance_to(2.0);
        const Entity &me = a->world().entity(1);
        assert(!me.alive());
        assert_idle(a->world().entity(2));
        assert(me.room == ArenaRoom);
        assert(count_containing(a->drain(1), "You have been slain!") == 1);

        a->enqueue_command(1, "attack ogre");
        a->enqueue_command(1, "north");
        a->run_pending();
        const auto dead = texts(a->drain(1));
        assert(dead[0] == "You can't attack while dead.");
        assert(dead[1] == "You can't move while dead.");

        a->world().write(1).spawnRoom = HallRoom;
        a->enqueue_command(1, "respawn");
        a->run_pending();
        assert(me.alive());
        assert(me.health == me.maxHealth);
        assert(me.room == HallRoom);
        assert(texts(a->drain(1))[0] == "You return to life in The Hall.");

        a->enqueue_command(1, "respawn");
        a->run_pending();
        assert(texts(a->drain(1)).back() == "You are not dead.");
    }

    return 0;
}
