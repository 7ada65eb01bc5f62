#pragma once

#include "common.hpp"

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace realmsim
{
    enum class EventScope : std::uint8_t
    {
        Participant = 1,
        Room = 2,
        Broadcast = 3,
    };

    enum class EventKind : std::uint8_t
    {
        Message = 1,
        StatUpdate = 2,
        Combat = 3,
    };

    struct EventField
    {
        std::string name;
        std::int64_t value = 0;
    };

    struct OutboundEvent
    {
        EventScope scope = EventScope::Participant;

        // Participant scope: explicit recipients. On delivery this holds the one
        // participant the copy was delivered to, whatever the scope.
        std::vector<ParticipantId> targets;
        RoomId room = NoRoom;
        std::vector<ParticipantId> exclude;

        EventKind kind = EventKind::Message;
        std::string text;
        std::vector<EventField> fields;

        // Unit of work that produced the event (filled in by the dispatcher).
        std::uint64_t unit = 0;

        std::optional<std::int64_t> field(std::string_view name) const
        {
            for (const auto &f : fields)
            {
                if (f.name == name)
                {
                    return f.value;
                }
            }
            return std::nullopt;
        }
    };

    inline OutboundEvent message_to(ParticipantId who, std::string text, EventKind kind = EventKind::Message)
    {
        OutboundEvent ev;
        ev.scope = EventScope::Participant;
        ev.targets.push_back(who);
        ev.kind = kind;
        ev.text = std::move(text);
        return ev;
    }

    inline OutboundEvent message_to_room(RoomId room, std::string text, std::vector<ParticipantId> exclude = {},
                                         EventKind kind = EventKind::Message)
    {
        OutboundEvent ev;
        ev.scope = EventScope::Room;
        ev.room = room;
        ev.exclude = std::move(exclude);
        ev.kind = kind;
        ev.text = std::move(text);
        return ev;
    }

    inline OutboundEvent broadcast(std::string text, std::vector<ParticipantId> exclude = {})
    {
        OutboundEvent ev;
        ev.scope = EventScope::Broadcast;
        ev.exclude = std::move(exclude);
        ev.text = std::move(text);
        return ev;
    }

    inline OutboundEvent stat_update(ParticipantId who, std::vector<EventField> fields)
    {
        OutboundEvent ev = message_to(who, std::string(), EventKind::StatUpdate);
        ev.fields = std::move(fields);
        return ev;
    }

    // Fan-out of outbound notifications into per-participant delivery queues.
    //
    // publish() and flush() run on the engine loop only. Recipients are resolved at
    // publish time and staged in a batch; flush() hands the batch to the mailboxes once
    // the unit of work is complete. drain() and (un)registration are thread-safe and are
    // what transport threads call.
    class EventDispatcher
    {
    public:
        using RoomResolver = std::function<std::vector<ParticipantId>(RoomId)>;

        void set_room_resolver(RoomResolver resolver) { m_roomResolver = std::move(resolver); }

        void register_participant(ParticipantId who)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_mailboxes.try_emplace(who, std::make_shared<Mailbox>());
        }

        void unregister_participant(ParticipantId who)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_mailboxes.erase(who);
        }

        bool is_registered(ParticipantId who) const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_mailboxes.find(who) != m_mailboxes.end();
        }

        void begin_unit(std::uint64_t unit) noexcept { m_unit = unit; }

        void publish(OutboundEvent ev)
        {
            ev.unit = m_unit;
            for (ParticipantId who : recipients_(ev))
            {
                OutboundEvent copy = ev;
                copy.targets.assign(1, who);
                m_batch.emplace_back(who, std::move(copy));
            }
            ++m_published;
        }

        std::size_t staged() const noexcept { return m_batch.size(); }

        // Moves the staged batch into mailboxes, preserving publish order per recipient.
        // Recipients without a mailbox (not connected) are skipped. Returns the number of
        // deliveries made.
        std::size_t flush()
        {
            std::size_t delivered = 0;
            for (auto &[who, ev] : m_batch)
            {
                std::shared_ptr<Mailbox> box = mailbox_(who);
                if (!box)
                {
                    continue;
                }
                std::lock_guard<std::mutex> lk(box->mu);
                box->queue.push_back(std::move(ev));
                ++delivered;
            }
            m_batch.clear();
            m_delivered += delivered;
            return delivered;
        }

        std::vector<OutboundEvent> drain(ParticipantId who)
        {
            std::vector<OutboundEvent> out;
            std::shared_ptr<Mailbox> box = mailbox_(who);
            if (!box)
            {
                return out;
            }
            std::lock_guard<std::mutex> lk(box->mu);
            out.reserve(box->queue.size());
            for (auto &ev : box->queue)
            {
                out.push_back(std::move(ev));
            }
            box->queue.clear();
            return out;
        }

        std::uint64_t published_total() const noexcept { return m_published; }
        std::uint64_t delivered_total() const noexcept { return m_delivered; }

    private:
        struct Mailbox
        {
            std::mutex mu;
            std::deque<OutboundEvent> queue;
        };

        std::shared_ptr<Mailbox> mailbox_(ParticipantId who) const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            auto it = m_mailboxes.find(who);
            return (it == m_mailboxes.end()) ? nullptr : it->second;
        }

        std::vector<ParticipantId> recipients_(const OutboundEvent &ev) const
        {
            std::vector<ParticipantId> out;
            switch (ev.scope)
            {
            case EventScope::Participant:
                out = ev.targets;
                break;
            case EventScope::Room:
                if (!m_roomResolver)
                {
                    throw std::runtime_error("EventDispatcher: room event published without a room resolver");
                }
                out = m_roomResolver(ev.room);
                break;
            case EventScope::Broadcast:
            {
                std::lock_guard<std::mutex> lk(m_mu);
                out.reserve(m_mailboxes.size());
                for (const auto &[who, box] : m_mailboxes)
                {
                    (void)box;
                    out.push_back(who);
                }
                // Mailbox map order is unspecified; keep broadcast delivery deterministic.
                std::sort(out.begin(), out.end());
                break;
            }
            }

            if (!ev.exclude.empty())
            {
                out.erase(std::remove_if(out.begin(), out.end(), [&](ParticipantId who)
                                         { return std::find(ev.exclude.begin(), ev.exclude.end(), who) != ev.exclude.end(); }),
                          out.end());
            }
            return out;
        }

        mutable std::mutex m_mu;
        std::unordered_map<ParticipantId, std::shared_ptr<Mailbox>> m_mailboxes;
        RoomResolver m_roomResolver;

        std::vector<std::pair<ParticipantId, OutboundEvent>> m_batch;
        std::uint64_t m_unit = 0;
        std::uint64_t m_published = 0;
        std::uint64_t m_delivered = 0;
    };
}
