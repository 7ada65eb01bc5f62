/*
Purpose: Basic Scheduler contract.

What this tests: a 5 s one-shot fires exactly once and not before its target time,
simultaneous timers fire in insertion order, invalid input is rejected synchronously,
and cancel() is idempotent for unknown, fired and already-cancelled ids.
*/

#include "scheduler.hpp"

#include <cassert>
#include <chrono>
#include <string>
#include <vector>

namespace
{
    using namespace std::chrono_literals;

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

    // Pops and runs everything due at the clock's current time.
    int drain_ready(realmsim::Scheduler &s, const realmsim::ManualClock &clock)
    {
        int n = 0;
        while (auto e = s.pop_ready(clock.now()))
        {
            e->action();
            s.rearm(e);
            ++n;
        }
        return n;
    }
}

int main()
{
    using realmsim::ManualClock;
    using realmsim::Scheduler;
    using realmsim::TimePoint;

    // One-shot 5 s callback: not at 4.9 s, once at 5.0 s, never again.
    {
        ManualClock clock;
        Scheduler s(clock);
        int fired = 0;
        TimePoint firedAt{};

        const auto id = s.schedule(5s, [&]
                                   { ++fired; firedAt = clock.now(); });
        assert(id != realmsim::NoTimer);
        assert(s.is_pending(id));
        assert(s.time_until_next(clock.now()) == std::optional<realmsim::Duration>(5s));

        clock.advance(4900ms);
        assert(drain_ready(s, clock) == 0);
        assert(fired == 0);
        assert(*s.time_until_next(clock.now()) == 100ms);

        clock.advance(100ms);
        assert(drain_ready(s, clock) == 1);
        assert(fired == 1);
        assert(firedAt == TimePoint{} + 5s);
        assert(!s.is_pending(id));

        clock.advance(100ms);
        assert(drain_ready(s, clock) == 0);
        assert(fired == 1);
        assert(s.size() == 0);
        assert(!s.time_until_next(clock.now()).has_value());
    }

    // Equal timestamps fire in insertion order; earlier timestamps win regardless of order.
    {
        ManualClock clock;
        Scheduler s(clock);
        std::vector<std::string> order;

        s.schedule(2s, [&]
                   { order.push_back("b1"); });
        s.schedule(1s, [&]
                   { order.push_back("a"); });
        s.schedule(2s, [&]
                   { order.push_back("b2"); });
        s.schedule_at(TimePoint{} + 2s, [&]
                      { order.push_back("b3"); });

        clock.advance(3s);
        assert(drain_ready(s, clock) == 4);
        assert((order == std::vector<std::string>{"a", "b1", "b2", "b3"}));
    }

    // Invalid input is rejected without side effects.
    {
        ManualClock clock;
        Scheduler s(clock);
        expect_throw([&]
                     { s.schedule(-1ms, [] {}); });
        expect_throw([&]
                     { s.schedule(1s, realmsim::TimerAction{}); });
        expect_throw([&]
                     { s.schedule(1s, [] {}, /*recurring=*/true, /*interval=*/0s); });
        assert(s.size() == 0);
        assert(s.heap_size() == 0);

        // Zero delay is valid and due immediately.
        int fired = 0;
        s.schedule(0s, [&]
                   { ++fired; });
        assert(drain_ready(s, clock) == 1);
        assert(fired == 1);
    }

    // cancel() is idempotent.
    {
        ManualClock clock;
        Scheduler s(clock);
        int fired = 0;
        const auto a = s.schedule(1s, [&]
                                  { ++fired; });
        const auto b = s.schedule(1s, [&]
                                  { fired += 10; });

        s.cancel(a);
        s.cancel(a);
        s.cancel(424242);
        assert(s.cancelled_total() == 1);
        assert(s.size() == 1);
        assert(s.heap_size() == 2);

        clock.advance(1s);
        assert(drain_ready(s, clock) == 1);
        assert(fired == 10);

        // Fired ids are no longer cancellable.
        s.cancel(b);
        assert(s.cancelled_total() == 1);
        assert(s.heap_size() == 0);
    }

    // Ids are never reused.
    {
        ManualClock clock;
        Scheduler s(clock);
        const auto a = s.schedule(0s, [] {});
        s.cancel(a);
        const auto b = s.schedule(0s, [] {});
        assert(b != a);
        assert(b > a);
    }

    return 0;
}
