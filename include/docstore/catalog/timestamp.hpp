#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace docstore::catalog {

using Clock = std::chrono::system_clock;
using Timestamp = std::chrono::time_point<Clock, std::chrono::milliseconds>;
using ClockFn = std::function<Timestamp()>;

[[nodiscard]] Timestamp now_timestamp();

// YYYY-MM-DDTHH:MM:SS.mmmZ
[[nodiscard]] std::string format_timestamp_iso(Timestamp timestamp);

// Accepts YYYY-MM-DD with an optional THH:MM[:SS[.fraction]] part and an
// optional Z or +HH:MM / -HH:MM suffix. A space may replace the T.
[[nodiscard]] std::optional<Timestamp> parse_timestamp_iso(std::string_view text);

[[nodiscard]] Timestamp timestamp_from_epoch_ms(std::int64_t epoch_ms) noexcept;

}  // namespace docstore::catalog
