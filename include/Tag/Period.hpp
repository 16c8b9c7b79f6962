#pragma once

#include "Manifest.hpp"

#include <chrono>
#include <cstdint>
#include <rs/result.hpp>
#include <string>

namespace orcka {

// Largest `number` a `{ unit, number }` period accepts.
inline constexpr std::int64_t MAX_PERIOD_NUMBER = 1'000'000;

// Maps `now` (UTC) to the bucket of the configured period:
//
//   hourly / { unit = "hours" }     YYYYMMDD_HH
//   { unit = "minutes" }            YYYYMMDD_HHMM
//   { unit = "seconds" }            YYYYMMDD_HHMMSS
//   { unit = "days" }               YYYYMMDD
//   weekly / { unit = "weeks" }     YYYYMMDD of the bucket's Monday
//   monthly / { unit = "months" }   YYYYMM
//   yearly                          YYYY
//   { unit = "none" }               (empty)
//
// `number` widens a bucket to that many units, counted from the Unix epoch
// (for months, from year 0).  Widths past the current epoch count collapse
// to the epoch bucket.
rs::Result<std::string>
periodBucket(const Period& period,
             std::chrono::system_clock::time_point now) noexcept;

// `weekly`, `days:3`, `none:`.
std::string describePeriod(const Period& period);

// Bucket widths of an hour or less.
bool isShortPeriod(const Period& period) noexcept;

} // namespace orcka
