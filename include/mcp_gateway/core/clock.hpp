#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace mcp_gateway {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// ---------------------------------------------------------------------------
// IClock — time source for TTLs, reuse windows and recovery cooldowns.
//
// Components take an IClock& so tests can advance time explicitly.
// ---------------------------------------------------------------------------
class IClock {
public:
    virtual ~IClock() = default;
    [[nodiscard]] virtual TimePoint Now() const = 0;
};

class SystemClock : public IClock {
public:
    [[nodiscard]] TimePoint Now() const override { return Clock::now(); }
};

// Shared process-wide system clock.
IClock& DefaultClock();

// Format as ISO-8601 UTC with millisecond precision: 2026-01-01T00:00:00.000Z
std::string FormatIso8601(TimePoint tp);

// Parse "YYYY-MM-DDTHH:MM:SS" with optional fractional seconds and optional
// trailing 'Z'. Values without a zone designator are read as UTC.
std::optional<TimePoint> ParseIso8601(std::string_view text);

} // namespace mcp_gateway
