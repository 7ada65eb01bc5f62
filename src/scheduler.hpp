#pragma once

#include "clock.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <queue>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace realmsim
{
    using TimerAction = std::function<void()>;

    struct TimedCallback
    {
        TimerId id = NoTimer;
        TimePoint executeAt{};

        // Tie-break for equal executeAt (FIFO). A recurring successor keeps the
        // sequence of the schedule() call that started the series.
        std::uint64_t sequence = 0;

        TimerAction action;
        bool recurring = false;
        Duration interval{};
        bool cancelled = false;

        // Number of times this entry (or its series) has been popped for execution.
        std::uint64_t firings = 0;
    };

    // Min-heap of timed callbacks ordered by (executeAt, sequence).
    //
    // Cancellation is lazy: cancel() flags the entry and forgets its id; the entry is
    // discarded when it reaches the top of the heap. Only the engine loop may touch a
    // Scheduler, so nothing here is synchronized.
    class Scheduler
    {
    public:
        using Entry = std::shared_ptr<TimedCallback>;

        explicit Scheduler(const IClock &clock) : m_clock(clock) {}

        Scheduler(const Scheduler &) = delete;
        Scheduler &operator=(const Scheduler &) = delete;

        TimerId schedule(Duration delay, TimerAction action, bool recurring = false, Duration interval = Duration::zero())
        {
            if (delay < Duration::zero())
            {
                throw std::runtime_error("Scheduler::schedule: negative delay");
            }
            return schedule_at(m_clock.now() + delay, std::move(action), recurring, interval);
        }

        TimerId schedule_at(TimePoint when, TimerAction action, bool recurring = false, Duration interval = Duration::zero())
        {
            if (!action)
            {
                throw std::runtime_error("Scheduler::schedule: null action");
            }
            if (recurring && interval <= Duration::zero())
            {
                throw std::runtime_error("Scheduler::schedule: recurring callback needs a positive interval");
            }

            auto entry = std::make_shared<TimedCallback>();
            entry->id = m_nextId++;
            entry->executeAt = when;
            entry->sequence = m_nextSequence++;
            entry->action = std::move(action);
            entry->recurring = recurring;
            entry->interval = recurring ? interval : Duration::zero();

            m_index.emplace(entry->id, entry);
            m_heap.push(entry);
            return entry->id;
        }

        // Idempotent. Unknown, fired and already-cancelled ids are ignored.
        void cancel(TimerId id)
        {
            auto it = m_index.find(id);
            if (it == m_index.end())
            {
                return;
            }
            it->second->cancelled = true;
            m_index.erase(it);
            ++m_cancelledTotal;
        }

        bool is_pending(TimerId id) const { return m_index.find(id) != m_index.end(); }

        // Returns the earliest non-cancelled entry with executeAt <= now, or nullptr if the
        // earliest live entry is still in the future. Ownership passes to the caller; a
        // recurring entry must be handed back through rearm() once it has run.
        Entry pop_ready(TimePoint now)
        {
            discard_cancelled_head_();
            if (m_heap.empty() || now < m_heap.top()->executeAt)
            {
                return nullptr;
            }

            Entry e = m_heap.top();
            m_heap.pop();
            if (!e->recurring)
            {
                m_index.erase(e->id);
            }
            ++e->firings;
            ++m_firedTotal;
            return e;
        }

        // Re-enqueue the successor of a recurring entry after its action ran. The next
        // target is the previous target plus the interval, never "now plus interval",
        // so slow handlers do not make a periodic series drift.
        void rearm(const Entry &e)
        {
            if (!e || !e->recurring || e->cancelled)
            {
                return;
            }
            e->executeAt += e->interval;
            m_heap.push(e);
        }

        std::optional<Duration> time_until_next(TimePoint now)
        {
            discard_cancelled_head_();
            if (m_heap.empty())
            {
                return std::nullopt;
            }
            const TimePoint next = m_heap.top()->executeAt;
            return (next <= now) ? Duration::zero() : (next - now);
        }

        std::optional<TimePoint> next_due()
        {
            discard_cancelled_head_();
            if (m_heap.empty())
            {
                return std::nullopt;
            }
            return m_heap.top()->executeAt;
        }

        // Live (non-cancelled) timers, including a recurring series currently executing.
        std::size_t size() const noexcept { return m_index.size(); }

        // Heap entries including cancelled tombstones not yet popped.
        std::size_t heap_size() const noexcept { return m_heap.size(); }

        std::uint64_t fired_total() const noexcept { return m_firedTotal; }
        std::uint64_t cancelled_total() const noexcept { return m_cancelledTotal; }

    private:
        struct Later
        {
            bool operator()(const Entry &a, const Entry &b) const noexcept
            {
                // priority_queue is max-heap, so invert
                if (b->executeAt < a->executeAt)
                {
                    return true;
                }
                if (a->executeAt < b->executeAt)
                {
                    return false;
                }
                return b->sequence < a->sequence;
            }
        };

        void discard_cancelled_head_()
        {
            while (!m_heap.empty() && m_heap.top()->cancelled)
            {
                m_heap.pop();
            }
        }

        const IClock &m_clock;
        std::priority_queue<Entry, std::vector<Entry>, Later> m_heap;
        std::unordered_map<TimerId, Entry> m_index;
        TimerId m_nextId = 1;
        std::uint64_t m_nextSequence = 1;
        std::uint64_t m_firedTotal = 0;
        std::uint64_t m_cancelledTotal = 0;
    };
}
