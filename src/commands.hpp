#pragma once

#include "combat.hpp"
#include "command_registry.hpp"
#include "effects.hpp"
#include "event_dispatcher.hpp"
#include "world.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace realmsim
{
    // Everything a command handler may touch. All members outlive the registry.
    struct GameSystems
    {
        World &world;
        EventDispatcher &events;
        CombatSystem &combat;
        EffectSystem &effects;
    };

    namespace commands
    {
        inline std::string describe_room(const World &world, const Entity &viewer)
        {
            const Room *r = world.find_room(viewer.room);
            if (!r)
            {
                return "You are nowhere.";
            }

            std::string out = r->name + "\n" + r->description;

            out += "\nExits: ";
            if (r->exits.empty())
            {
                out += "none";
            }
            else
            {
                bool first = true;
                for (const auto &[dir, to] : r->exits)
                {
                    (void)to;
                    out += (first ? "" : ", ") + dir;
                    first = false;
                }
            }

            for (EntityId id : r->occupants)
            {
                if (id == viewer.id)
                {
                    continue;
                }
                const Entity *e = world.find(id);
                if (!e)
                {
                    continue;
                }
                out += "\n" + e->name;
                if (!e->alive())
                {
                    out += " (dead)";
                }
                else if (e->combat.in_combat())
                {
                    const Entity *t = world.find(e->combat.target);
                    out += " is here, fighting " + (t ? t->name : std::string("something")) + ".";
                    continue;
                }
                out += " is here.";
            }
            return out;
        }

        inline std::string canonical_direction(std::string_view verb)
        {
            const std::string v = to_lower(verb);
            if (v == "n")
                return "north";
            if (v == "s")
                return "south";
            if (v == "e")
                return "east";
            if (v == "w")
                return "west";
            if (v == "u")
                return "up";
            if (v == "d")
                return "down";
            return v;
        }

        inline void move(GameSystems sys, EntityId who, const std::string &direction)
        {
            Entity *e = sys.world.find(who);
            if (!e)
            {
                sys.events.publish(message_to(who, "You have no form."));
                return;
            }
            if (!e->alive())
            {
                sys.events.publish(message_to(who, "You can't move while dead."));
                return;
            }
            if (e->combat.in_combat())
            {
                sys.events.publish(message_to(who, "You're fighting! Use 'flee' to escape."));
                return;
            }
            const Room *r = sys.world.find_room(e->room);
            auto exit = r ? r->exits.find(direction) : std::map<std::string, RoomId>::const_iterator{};
            if (!r || exit == r->exits.end() || !sys.world.find_room(exit->second))
            {
                sys.events.publish(message_to(who, "You can't go that way."));
                return;
            }

            const RoomId from = e->room;
            const RoomId to = exit->second;
            sys.world.move(who, to);

            sys.events.publish(message_to_room(from, e->name + " leaves " + direction + ".", {who}));
            sys.events.publish(message_to_room(to, e->name + " arrives.", {who}));
            sys.events.publish(message_to(who, describe_room(sys.world, *e)));
        }
    }

    // Installs the built-in verbs. Connection lifecycle (connect/disconnect) is handled by
    // the engine itself and never goes through the registry.
    inline void register_builtin_commands(CommandRegistry &registry, GameSystems sys)
    {
        registry.register_handler(
            "look", [sys](const Command &cmd, std::string_view)
            {
                const Entity *e = sys.world.find(cmd.source);
                sys.events.publish(message_to(cmd.source, e ? commands::describe_room(sys.world, *e) : "You have no form."));
            },
            {"l"});

        registry.register_handler(
            "say", [sys](const Command &cmd, std::string_view args)
            {
                const Entity *e = sys.world.find(cmd.source);
                if (!e)
                {
                    sys.events.publish(message_to(cmd.source, "You have no form."));
                    return;
                }
                if (args.empty())
                {
                    sys.events.publish(message_to(cmd.source, "Say what?"));
                    return;
                }
                const std::string text(args);
                sys.events.publish(message_to(cmd.source, "You say: " + text));
                sys.events.publish(message_to_room(e->room, e->name + " says: " + text, {cmd.source}));
            });

        for (const char *dir : {"north", "south", "east", "west", "up", "down"})
        {
            const std::string direction(dir);
            registry.register_handler(
                direction, [sys, direction](const Command &cmd, std::string_view)
                { commands::move(sys, cmd.source, direction); },
                {std::string(1, direction.front())});
        }

        registry.register_handler(
            "attack", [sys](const Command &cmd, std::string_view args)
            { sys.combat.engage(cmd.source, args); },
            {"kill", "k"});

        registry.register_handler("stop", [sys](const Command &cmd, std::string_view)
                                  { sys.combat.disengage(cmd.source); });

        registry.register_handler("flee", [sys](const Command &cmd, std::string_view)
                                  { sys.combat.flee(cmd.source); });

        // Swapping weapons never touches an in-flight swing; the next windup picks it up.
        registry.register_handler(
            "wield", [sys](const Command &cmd, std::string_view args)
            {
                Entity *e = sys.world.find(cmd.source);
                if (!e)
                {
                    sys.events.publish(message_to(cmd.source, "You have no form."));
                    return;
                }
                if (args.empty())
                {
                    sys.events.publish(message_to(cmd.source, "Wield what?"));
                    return;
                }
                const WeaponTemplate *w = sys.world.find_carried_weapon(*e, args);
                if (!w)
                {
                    sys.events.publish(message_to(cmd.source, "You don't have '" + std::string(args) + "'."));
                    return;
                }
                if (e->equippedWeapon == w->id)
                {
                    sys.events.publish(message_to(cmd.source, "You are already wielding the " + w->name + "."));
                    return;
                }
                sys.world.write(cmd.source).equippedWeapon = w->id;
                sys.events.publish(message_to(cmd.source, "You wield the " + w->name + "."));
                sys.events.publish(message_to_room(e->room, e->name + " wields a " + w->name + ".", {cmd.source}));
            });

        registry.register_handler("unwield", [sys](const Command &cmd, std::string_view)
                                  {
                Entity *e = sys.world.find(cmd.source);
                if (!e)
                {
                    sys.events.publish(message_to(cmd.source, "You have no form."));
                    return;
                }
                const WeaponTemplate *w = sys.world.find_weapon(e->equippedWeapon);
                if (!w)
                {
                    sys.events.publish(message_to(cmd.source, "You aren't wielding anything."));
                    return;
                }
                sys.world.write(cmd.source).equippedWeapon = NoItem;
                sys.events.publish(message_to(cmd.source, "You stop wielding the " + w->name + ".")); });

        registry.register_handler(
            "combat", [sys](const Command &cmd, std::string_view)
            { sys.events.publish(message_to(cmd.source, sys.combat.status_text(cmd.source))); },
            {"status"});

        registry.register_handler("effects", [sys](const Command &cmd, std::string_view)
                                  { sys.events.publish(message_to(cmd.source, sys.effects.summary(cmd.source))); });

        registry.register_handler("respawn", [sys](const Command &cmd, std::string_view)
                                  { sys.combat.respawn_player(cmd.source); });
    }
}
