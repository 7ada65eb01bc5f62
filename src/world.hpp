#pragma once

#include "common.hpp"

#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace realmsim
{
    enum class EntityKind : std::uint8_t
    {
        Player = 1,
        Npc = 2,
    };

    enum class Stat : std::uint8_t
    {
        ArmorClass = 1,
        Strength = 2,
        Dexterity = 3,
        Intelligence = 4,
        Vitality = 5,
    };

    inline const char *stat_name(Stat s) noexcept
    {
        switch (s)
        {
        case Stat::ArmorClass:
            return "armor_class";
        case Stat::Strength:
            return "strength";
        case Stat::Dexterity:
            return "dexterity";
        case Stat::Intelligence:
            return "intelligence";
        case Stat::Vitality:
            return "vitality";
        }
        return "unknown";
    }

    struct WeaponTemplate
    {
        ItemId id = NoItem;
        std::string name;
        std::vector<std::string> keywords;
        int damageMin = 1;
        int damageMax = 4;
        Duration swingInterval = std::chrono::seconds(2);
        std::string damageType = "physical";
    };

    // Weapon stats frozen at WINDUP entry. Equipment changes are only observed the next
    // time a windup starts.
    struct WeaponSnapshot
    {
        ItemId weapon = NoItem;
        std::string name = "fists";
        int damageMin = 1;
        int damageMax = 4;
        Duration swingInterval = std::chrono::seconds(2);
        std::string damageType = "physical";
    };

    enum class CombatPhase : std::uint8_t
    {
        Idle = 0,
        Windup = 1,
        Swing = 2,
        Recovery = 3,
    };

    inline const char *combat_phase_name(CombatPhase p) noexcept
    {
        switch (p)
        {
        case CombatPhase::Idle:
            return "idle";
        case CombatPhase::Windup:
            return "windup";
        case CombatPhase::Swing:
            return "swing";
        case CombatPhase::Recovery:
            return "recovery";
        }
        return "unknown";
    }

    struct CombatState
    {
        EntityId entity = NoEntity;
        EntityId target = NoEntity;
        CombatPhase phase = CombatPhase::Idle;
        TimePoint phaseStartedAt{};
        Duration phaseDuration{};

        // Scheduler handle of the next phase transition. Never more than one.
        TimerId pendingEvent = NoTimer;
        WeaponSnapshot weapon{};

        // Swings resolved in the current fight.
        std::uint64_t swings = 0;

        bool in_combat() const noexcept { return phase != CombatPhase::Idle; }
    };

    enum class EffectType : std::uint8_t
    {
        Buff = 1,
        Debuff = 2,
        DamageOverTime = 3,
        HealOverTime = 4,
    };

    struct Effect
    {
        EffectId id = NoEffect;
        std::string name;
        EffectType type = EffectType::Buff;
        std::vector<std::pair<Stat, int>> statModifiers;

        // Zero duration means "until removed".
        Duration duration{};
        TimePoint appliedAt{};

        // Periodic health change (negative = damage). Zero interval means not periodic.
        Duration interval{};
        int healthDelta = 0;

        TimerId expirationEvent = NoTimer;
        TimerId periodicEvent = NoTimer;
    };

    struct Entity
    {
        EntityId id = NoEntity;
        EntityKind kind = EntityKind::Npc;
        std::string name;
        std::vector<std::string> keywords;

        RoomId room = NoRoom;
        RoomId spawnRoom = NoRoom;

        int level = 1;
        int maxHealth = 100;
        int health = 100;
        int armorClass = 10;
        int strength = 10;
        int dexterity = 10;
        int intelligence = 10;
        int vitality = 10;

        // Natural (unarmed) attack.
        int baseDamageMin = 1;
        int baseDamageMax = 4;
        Duration baseSwingInterval = std::chrono::seconds(2);

        std::vector<ItemId> inventory;
        ItemId equippedWeapon = NoItem;

        std::map<EffectId, Effect> effects;
        CombatState combat{};

        // Monotonic across fights; keys the damage RNG.
        std::uint64_t swingSerial = 0;

        bool connected = false;
        int experience = 0;

        // NPC content.
        int experienceReward = 0;
        Duration respawnDelay{};

        bool alive() const noexcept { return health > 0; }

        int base_stat(Stat s) const noexcept
        {
            switch (s)
            {
            case Stat::ArmorClass:
                return armorClass;
            case Stat::Strength:
                return strength;
            case Stat::Dexterity:
                return dexterity;
            case Stat::Intelligence:
                return intelligence;
            case Stat::Vitality:
                return vitality;
            }
            return 0;
        }

        // Base value plus the modifiers of every active effect.
        int effective(Stat s) const noexcept
        {
            int total = base_stat(s);
            for (const auto &[id, effect] : effects)
            {
                (void)id;
                for (const auto &[stat, delta] : effect.statModifiers)
                {
                    if (stat == s)
                    {
                        total += delta;
                    }
                }
            }
            return total;
        }

        bool matches(std::string_view keyword) const
        {
            const std::string k = to_lower(trim(keyword));
            if (k.empty())
            {
                return false;
            }
            const std::string n = to_lower(name);
            if (n == k || n.find(k) != std::string::npos)
            {
                return true;
            }
            for (const auto &kw : keywords)
            {
                if (to_lower(kw) == k)
                {
                    return true;
                }
            }
            return false;
        }
    };

    struct Room
    {
        RoomId id = NoRoom;
        std::string name;
        std::string description;
        std::map<std::string, RoomId> exits;

        // Arrival order.
        std::vector<EntityId> occupants;
    };

    // The world graph: flat stores indexed by id. Entities refer to rooms, rooms to
    // entities and entities to weapon templates only by id, so nothing here owns
    // anything across stores. Owned and mutated by the engine loop.
    class World
    {
    public:
        using DirtySink = std::function<void(EntityId)>;

        void set_dirty_sink(DirtySink sink) { m_dirtySink = std::move(sink); }

        Room &add_room(Room room)
        {
            if (room.id == NoRoom)
            {
                throw std::runtime_error("World::add_room: room id 0 is reserved");
            }
            room.occupants.clear();
            auto [it, inserted] = m_rooms.emplace(room.id, std::move(room));
            if (!inserted)
            {
                throw std::runtime_error("World::add_room: duplicate RoomId");
            }
            return it->second;
        }

        void link(RoomId from, const std::string &direction, RoomId to)
        {
            (void)room_(to);
            room_(from).exits[to_lower(direction)] = to;
        }

        void add_weapon(WeaponTemplate weapon)
        {
            if (weapon.id == NoItem)
            {
                throw std::runtime_error("World::add_weapon: item id 0 is reserved");
            }
            if (weapon.damageMin > weapon.damageMax || weapon.damageMin < 0 || weapon.swingInterval <= Duration::zero())
            {
                throw std::runtime_error("World::add_weapon: invalid stats for '" + weapon.name + "'");
            }
            auto [it, inserted] = m_weapons.emplace(weapon.id, std::move(weapon));
            (void)it;
            if (!inserted)
            {
                throw std::runtime_error("World::add_weapon: duplicate ItemId");
            }
        }

        Entity &spawn(Entity e)
        {
            if (e.id == NoEntity)
            {
                throw std::runtime_error("World::spawn: entity id 0 is reserved");
            }
            Room &r = room_(e.room);
            if (e.spawnRoom == NoRoom)
            {
                e.spawnRoom = e.room;
            }
            e.combat = CombatState{};
            e.combat.entity = e.id;
            auto [it, inserted] = m_entities.emplace(e.id, std::move(e));
            if (!inserted)
            {
                throw std::runtime_error("World::spawn: duplicate EntityId");
            }
            r.occupants.push_back(it->first);
            return it->second;
        }

        void remove(EntityId id)
        {
            Entity &e = record_(id);
            leave_room_(e);
            m_entities.erase(id);
        }

        // Takes the entity out of its room without deleting it (dead NPCs awaiting respawn).
        void take_out(EntityId id)
        {
            Entity &e = record_(id);
            leave_room_(e);
            e.room = NoRoom;
            mark_dirty(id);
        }

        void move(EntityId id, RoomId to)
        {
            Entity &e = record_(id);
            Room &dst = room_(to);
            leave_room_(e);
            e.room = to;
            dst.occupants.push_back(id);
            mark_dirty(id);
        }

        bool contains(EntityId id) const { return m_entities.find(id) != m_entities.end(); }

        Entity *find(EntityId id)
        {
            auto it = m_entities.find(id);
            return (it == m_entities.end()) ? nullptr : &it->second;
        }

        const Entity *find(EntityId id) const
        {
            auto it = m_entities.find(id);
            return (it == m_entities.end()) ? nullptr : &it->second;
        }

        const Entity &entity(EntityId id) const { return record_(id); }

        // Write access: reports the entity to the persistence hook.
        Entity &write(EntityId id)
        {
            Entity &e = record_(id);
            mark_dirty(id);
            return e;
        }

        void mark_dirty(EntityId id)
        {
            if (m_dirtySink)
            {
                m_dirtySink(id);
            }
        }

        Room *find_room(RoomId id)
        {
            auto it = m_rooms.find(id);
            return (it == m_rooms.end()) ? nullptr : &it->second;
        }

        const Room *find_room(RoomId id) const
        {
            auto it = m_rooms.find(id);
            return (it == m_rooms.end()) ? nullptr : &it->second;
        }

        const Room &room(RoomId id) const { return room_(id); }

        const WeaponTemplate *find_weapon(ItemId id) const
        {
            auto it = m_weapons.find(id);
            return (it == m_weapons.end()) ? nullptr : &it->second;
        }

        // First living entity in `room` (other than `self`) matching `keyword`, in arrival order.
        Entity *find_in_room(RoomId room, std::string_view keyword, EntityId self = NoEntity)
        {
            const Room *r = find_room(room);
            if (!r)
            {
                return nullptr;
            }
            Entity *fallback = nullptr;
            for (EntityId id : r->occupants)
            {
                Entity *e = find(id);
                if (!e || !e->matches(keyword))
                {
                    continue;
                }
                if (id == self)
                {
                    fallback = e;
                    continue;
                }
                if (e->alive())
                {
                    return e;
                }
                if (!fallback)
                {
                    fallback = e;
                }
            }
            return fallback;
        }

        // Weapon in the entity's inventory matching `keyword`.
        const WeaponTemplate *find_carried_weapon(const Entity &e, std::string_view keyword) const
        {
            const std::string k = to_lower(trim(keyword));
            for (ItemId item : e.inventory)
            {
                const WeaponTemplate *w = find_weapon(item);
                if (!w)
                {
                    continue;
                }
                const std::string n = to_lower(w->name);
                if (n == k || n.find(k) != std::string::npos)
                {
                    return w;
                }
                for (const auto &kw : w->keywords)
                {
                    if (to_lower(kw) == k)
                    {
                        return w;
                    }
                }
            }
            return nullptr;
        }

        WeaponSnapshot weapon_for(const Entity &e) const
        {
            WeaponSnapshot s;
            if (const WeaponTemplate *w = find_weapon(e.equippedWeapon))
            {
                s.weapon = w->id;
                s.name = w->name;
                s.damageMin = w->damageMin;
                s.damageMax = w->damageMax;
                s.swingInterval = w->swingInterval;
                s.damageType = w->damageType;
                return s;
            }
            s.damageMin = e.baseDamageMin;
            s.damageMax = e.baseDamageMax;
            s.swingInterval = e.baseSwingInterval;
            return s;
        }

        // Connected players in a room, in arrival order.
        std::vector<ParticipantId> players_in(RoomId room) const
        {
            std::vector<ParticipantId> out;
            const Room *r = find_room(room);
            if (!r)
            {
                return out;
            }
            for (EntityId id : r->occupants)
            {
                const Entity *e = find(id);
                if (e && e->kind == EntityKind::Player && e->connected)
                {
                    out.push_back(id);
                }
            }
            return out;
        }

        // Sorted, so whole-world sweeps visit entities in a stable order.
        std::vector<EntityId> entity_ids() const
        {
            std::vector<EntityId> out;
            out.reserve(m_entities.size());
            for (const auto &[id, e] : m_entities)
            {
                (void)e;
                out.push_back(id);
            }
            std::sort(out.begin(), out.end());
            return out;
        }

        std::size_t entity_count() const noexcept { return m_entities.size(); }
        std::size_t room_count() const noexcept { return m_rooms.size(); }

    private:
        void leave_room_(Entity &e)
        {
            if (Room *r = find_room(e.room))
            {
                r->occupants.erase(std::remove(r->occupants.begin(), r->occupants.end(), e.id), r->occupants.end());
            }
        }

        const Entity &record_(EntityId id) const
        {
            auto it = m_entities.find(id);
            if (it == m_entities.end())
            {
                throw std::runtime_error("World: unknown EntityId=" + std::to_string(static_cast<std::uint64_t>(id)));
            }
            return it->second;
        }

        Entity &record_(EntityId id)
        {
            auto it = m_entities.find(id);
            if (it == m_entities.end())
            {
                throw std::runtime_error("World: unknown EntityId=" + std::to_string(static_cast<std::uint64_t>(id)));
            }
            return it->second;
        }

        const Room &room_(RoomId id) const
        {
            auto it = m_rooms.find(id);
            if (it == m_rooms.end())
            {
                throw std::runtime_error("World: unknown RoomId=" + std::to_string(static_cast<std::uint64_t>(id)));
            }
            return it->second;
        }

        Room &room_(RoomId id)
        {
            auto it = m_rooms.find(id);
            if (it == m_rooms.end())
            {
                throw std::runtime_error("World: unknown RoomId=" + std::to_string(static_cast<std::uint64_t>(id)));
            }
            return it->second;
        }

        std::unordered_map<EntityId, Entity> m_entities;
        std::unordered_map<RoomId, Room> m_rooms;
        std::unordered_map<ItemId, WeaponTemplate> m_weapons;
        DirtySink m_dirtySink;
    };
}
