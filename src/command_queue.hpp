#pragma once

#include "clock.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace realmsim
{
    enum class CommandKind : std::uint8_t
    {
        Input = 1,
        Connect = 2,
        Disconnect = 3,
    };

    struct Command
    {
        ParticipantId source = NoEntity;
        CommandKind kind = CommandKind::Input;
        std::string text;

        // Assigned at enqueue time; strictly increasing across all producers.
        std::uint64_t sequence = 0;
        TimePoint arrivedAt{};
    };

    // Multi-producer / single-consumer FIFO of inbound commands. Producers are transport
    // threads; the only consumer is the engine loop, which also sleeps on it while idle.
    class CommandQueue
    {
    public:
        explicit CommandQueue(const IClock &clock) : m_clock(clock) {}

        CommandQueue(const CommandQueue &) = delete;
        CommandQueue &operator=(const CommandQueue &) = delete;

        // Non-blocking. Returns the sequence number assigned to the command.
        std::uint64_t push(ParticipantId source, std::string text, CommandKind kind = CommandKind::Input)
        {
            std::uint64_t seq = 0;
            {
                std::lock_guard<std::mutex> lk(m_mu);
                seq = ++m_lastSequence;
                Command cmd;
                cmd.source = source;
                cmd.kind = kind;
                cmd.text = std::move(text);
                cmd.sequence = seq;
                cmd.arrivedAt = m_clock.now();
                m_queue.push_back(std::move(cmd));
            }
            m_cv.notify_one();
            return seq;
        }

        std::optional<Command> try_pop()
        {
            std::lock_guard<std::mutex> lk(m_mu);
            if (m_queue.empty())
            {
                return std::nullopt;
            }
            Command out = std::move(m_queue.front());
            m_queue.pop_front();
            return out;
        }

        bool empty() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_queue.empty();
        }

        std::size_t size() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_queue.size();
        }

        // Blocks until a command is queued, wake() is called, or `timeout` elapses.
        // Returns true if the queue is non-empty on return.
        bool wait_for(Duration timeout)
        {
            std::unique_lock<std::mutex> lk(m_mu);
            m_cv.wait_for(lk, timeout, [&]
                          { return !m_queue.empty() || m_woken; });
            m_woken = false;
            return !m_queue.empty();
        }

        void wake()
        {
            {
                std::lock_guard<std::mutex> lk(m_mu);
                m_woken = true;
            }
            m_cv.notify_all();
        }

    private:
        const IClock &m_clock;
        mutable std::mutex m_mu;
        std::condition_variable m_cv;
        std::deque<Command> m_queue;
        std::uint64_t m_lastSequence = 0;
        bool m_woken = false;
    };
}
