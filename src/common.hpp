#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <cstdio>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace realmsim
{
    using EntityId = std::uint64_t;
    using RoomId = std::uint64_t;
    using ItemId = std::uint64_t;
    using EffectId = std::uint64_t;
    using TimerId = std::uint64_t;

    // Participants are the player entities a transport connection speaks for.
    using ParticipantId = EntityId;

    inline constexpr EntityId NoEntity = 0;
    inline constexpr RoomId NoRoom = 0;
    inline constexpr ItemId NoItem = 0;
    inline constexpr EffectId NoEffect = 0;
    inline constexpr TimerId NoTimer = 0;

    // All engine time is monotonic. Wall-clock time never enters the core.
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = Clock::duration;

    inline Duration from_seconds(double s)
    {
        return std::chrono::duration_cast<Duration>(std::chrono::duration<double>(s));
    }

    inline double to_seconds(Duration d) noexcept
    {
        return std::chrono::duration<double>(d).count();
    }

    inline double to_seconds(TimePoint t) noexcept
    {
        return to_seconds(t.time_since_epoch());
    }

    inline std::string format_seconds(Duration d)
    {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.1f", to_seconds(d));
        return std::string(buf);
    }

    inline std::string to_lower(std::string_view s)
    {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    inline std::string_view trim(std::string_view s) noexcept
    {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        {
            s.remove_prefix(1);
        }
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        {
            s.remove_suffix(1);
        }
        return s;
    }

    // Floor division (rounds toward negative infinity) for stat modifiers.
    inline constexpr int floor_div(int a, int b) noexcept
    {
        const int q = a / b;
        return ((a % b != 0) && ((a < 0) != (b < 0))) ? q - 1 : q;
    }
}
