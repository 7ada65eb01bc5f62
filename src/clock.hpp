#pragma once

#include "common.hpp"

#include <mutex>
#include <stdexcept>

namespace realmsim
{
    class IClock
    {
    public:
        virtual ~IClock() = default;
        virtual TimePoint now() const = 0;
    };

    class SteadyClock final : public IClock
    {
    public:
        TimePoint now() const override { return Clock::now(); }
    };

    // Clock that only moves when told to. Used to drive the engine deterministically
    // from tests and offline tools. Thread-safe so transport threads may stamp commands.
    class ManualClock final : public IClock
    {
    public:
        explicit ManualClock(TimePoint start = TimePoint{}) : m_now(start) {}

        TimePoint now() const override
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_now;
        }

        void set(TimePoint t)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            if (t < m_now)
            {
                throw std::runtime_error("ManualClock::set: time must not go backwards");
            }
            m_now = t;
        }

        void advance(Duration d)
        {
            if (d < Duration::zero())
            {
                throw std::runtime_error("ManualClock::advance: negative duration");
            }
            std::lock_guard<std::mutex> lk(m_mu);
            m_now += d;
        }

    private:
        mutable std::mutex m_mu;
        TimePoint m_now;
    };
}
