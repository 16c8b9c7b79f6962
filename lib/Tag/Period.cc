#include "Tag/Period.hpp"

#include "Algos.hpp"
#include "Manifest.hpp"

#include <chrono>
#include <cstdint>
#include <fmt/core.h>
#include <rs/result.hpp>
#include <string>
#include <variant>

namespace orcka {

namespace chrono = std::chrono;

static std::int64_t floorTo(const std::int64_t value, const std::int64_t step) {
  const std::int64_t rem = value % step;
  return value - (rem < 0 ? rem + step : rem);
}

static std::string formatDay(const chrono::sys_days day) {
  const chrono::year_month_day ymd{ day };
  return fmt::format("{:04}{:02}{:02}", static_cast<int>(ymd.year()),
                     static_cast<unsigned>(ymd.month()),
                     static_cast<unsigned>(ymd.day()));
}

static std::string formatTime(const chrono::sys_seconds time,
                              const bool minutes, const bool seconds) {
  const chrono::sys_days day = chrono::floor<chrono::days>(time);
  const chrono::hh_mm_ss hms{ time - day };
  std::string out =
      fmt::format("{}_{:02}", formatDay(day), hms.hours().count());
  if (minutes) {
    out += fmt::format("{:02}", hms.minutes().count());
  }
  if (seconds) {
    out += fmt::format("{:02}", hms.seconds().count());
  }
  return out;
}

template <typename Duration>
static chrono::sys_seconds floorToUnits(const chrono::system_clock::time_point now,
                                        const std::int64_t number) {
  const auto units = chrono::floor<Duration>(now).time_since_epoch().count();
  return chrono::sys_seconds{ chrono::duration_cast<chrono::seconds>(
      Duration{ floorTo(units, number) }) };
}

static std::string weekBucket(const chrono::system_clock::time_point now,
                              const std::int64_t number) {
  // 1969-12-29 is the Monday before the Unix epoch.
  const chrono::sys_days base{ chrono::year{ 1969 } / chrono::December / 29 };
  const chrono::sys_days day = chrono::floor<chrono::days>(now);
  const chrono::sys_days monday =
      day - (chrono::weekday{ day } - chrono::Monday);
  const std::int64_t weeks = (monday - base).count() / 7;
  return formatDay(base + chrono::days{ floorTo(weeks, number) * 7 });
}

static std::string monthBucket(const chrono::system_clock::time_point now,
                               const std::int64_t number) {
  const chrono::year_month_day ymd{ chrono::floor<chrono::days>(now) };
  const std::int64_t index = static_cast<std::int64_t>(
                                 static_cast<int>(ymd.year()))
                                 * 12
                             + static_cast<unsigned>(ymd.month()) - 1;
  const std::int64_t floored = floorTo(index, number);
  return fmt::format("{:04}{:02}", floored / 12, (floored % 12) + 1);
}

static rs::Result<std::string>
unitBucket(const std::string& unit, const std::int64_t number,
           const chrono::system_clock::time_point now) {
  if (unit == "none") {
    return rs::Ok(std::string());
  } else if (unit == "seconds") {
    return rs::Ok(formatTime(floorToUnits<chrono::seconds>(now, number),
                             /*minutes=*/true, /*seconds=*/true));
  } else if (unit == "minutes") {
    return rs::Ok(formatTime(floorToUnits<chrono::minutes>(now, number),
                             /*minutes=*/true, /*seconds=*/false));
  } else if (unit == "hours") {
    return rs::Ok(formatTime(floorToUnits<chrono::hours>(now, number),
                             /*minutes=*/false, /*seconds=*/false));
  } else if (unit == "days") {
    const auto days = chrono::floor<chrono::days>(now).time_since_epoch();
    return rs::Ok(formatDay(
        chrono::sys_days{ chrono::days{ floorTo(days.count(), number) } }));
  } else if (unit == "weeks") {
    return rs::Ok(weekBucket(now, number));
  } else if (unit == "months") {
    return rs::Ok(monthBucket(now, number));
  }
  rs_bail("unknown period unit `{}`", unit);
}

rs::Result<std::string>
periodBucket(const Period& period,
             const chrono::system_clock::time_point now) noexcept {
  return std::visit(
      Overloaded{
          [&](const std::string& preset) -> rs::Result<std::string> {
            if (preset == "hourly") {
              return unitBucket("hours", 1, now);
            } else if (preset == "weekly") {
              return unitBucket("weeks", 1, now);
            } else if (preset == "monthly") {
              return unitBucket("months", 1, now);
            } else if (preset == "yearly") {
              const chrono::year_month_day ymd{ chrono::floor<chrono::days>(
                  now) };
              return rs::Ok(
                  fmt::format("{:04}", static_cast<int>(ymd.year())));
            }
            rs_bail("unknown period `{}`", preset);
          },
          [&](const PeriodSpec& spec) -> rs::Result<std::string> {
            const std::int64_t number =
                spec.number.has_value() && *spec.number > 0 ? *spec.number
                                                            : 1;
            return unitBucket(spec.unit, number, now);
          },
      },
      period);
}

std::string describePeriod(const Period& period) {
  return std::visit(Overloaded{
                        [](const std::string& preset) { return preset; },
                        [](const PeriodSpec& spec) {
                          if (spec.number.has_value()) {
                            return fmt::format("{}:{}", spec.unit,
                                               *spec.number);
                          }
                          return fmt::format("{}:", spec.unit);
                        },
                    },
                    period);
}

bool isShortPeriod(const Period& period) noexcept {
  return std::visit(Overloaded{
                        [](const std::string& preset) {
                          return preset == "hourly";
                        },
                        [](const PeriodSpec& spec) {
                          if (spec.unit == "minutes" || spec.unit == "seconds") {
                            return true;
                          }
                          return spec.unit == "hours"
                                 && spec.number.value_or(1) <= 1;
                        },
                    },
                    period);
}

} // namespace orcka

#ifdef ORCKA_TEST

#  include <limits>
#  include <rs/tests.hpp>

// NOLINTBEGIN
using namespace orcka;
using namespace std::chrono;
// NOLINTEND

// Wednesday 2024-03-13 14:37:52 UTC
static const system_clock::time_point NOW =
    sys_days{ year{ 2024 } / March / 13 } + hours{ 14 } + minutes{ 37 }
    + seconds{ 52 };

static std::string bucket(const std::string& unit,
                          const std::optional<std::int64_t> number) {
  return periodBucket(Period(PeriodSpec{ .unit = unit, .number = number }),
                      NOW)
      .unwrap();
}

static void testHugeNumber() {
  const std::int64_t huge = std::numeric_limits<std::int64_t>::max();
  tests::assertEq(bucket("seconds", huge), "19700101_000000");
  tests::assertEq(bucket("minutes", huge), "19700101_0000");
  tests::assertEq(bucket("hours", huge), "19700101_00");
  tests::assertEq(bucket("days", huge), "19700101");
  tests::assertEq(bucket("weeks", huge), "19691229");
  tests::assertEq(bucket("months", huge), "000001");

  tests::pass();
}

static void testPresets() {
  tests::assertEq(periodBucket(Period("hourly"), NOW).unwrap(), "20240313_14");
  tests::assertEq(periodBucket(Period("weekly"), NOW).unwrap(), "20240311");
  tests::assertEq(periodBucket(Period("monthly"), NOW).unwrap(), "202403");
  tests::assertEq(periodBucket(Period("yearly"), NOW).unwrap(), "2024");
  tests::assertEq(periodBucket(Period("daily"), NOW).unwrap_err()->what(),
                  "unknown period `daily`");

  tests::pass();
}

static void testUnits() {
  tests::assertEq(bucket("none", std::nullopt), "");
  tests::assertEq(bucket("seconds", 1), "20240313_143752");
  tests::assertEq(bucket("minutes", 1), "20240313_1437");
  tests::assertEq(bucket("minutes", 15), "20240313_1430");
  tests::assertEq(bucket("hours", 6), "20240313_12");
  tests::assertEq(bucket("days", 1), "20240313");
  tests::assertEq(bucket("weeks", std::nullopt), "20240311");
  tests::assertEq(bucket("months", 1), "202403");
  tests::assertEq(bucket("months", 6), "202401");
  tests::assertEq(bucket("months", 0), "202403");
  tests::assertEq(
      periodBucket(Period(PeriodSpec{ .unit = "fortnights", .number = 1 }),
                   NOW)
          .unwrap_err()
          ->what(),
      "unknown period unit `fortnights`");

  tests::pass();
}

static void testBucketsAreStableWithinPeriod() {
  const system_clock::time_point later = NOW + hours{ 30 };
  tests::assertEq(periodBucket(Period("weekly"), later).unwrap(),
                  periodBucket(Period("weekly"), NOW).unwrap());
  tests::assertNe(periodBucket(Period(PeriodSpec{ .unit = "days",
                                                  .number = 1 }),
                               later)
                      .unwrap(),
                  bucket("days", 1));

  tests::pass();
}

static void testDescribePeriod() {
  tests::assertEq(describePeriod(Period("weekly")), "weekly");
  tests::assertEq(describePeriod(Period(PeriodSpec{ .unit = "days",
                                                    .number = 3 })),
                  "days:3");
  tests::assertEq(describePeriod(Period(PeriodSpec{ .unit = "none",
                                                    .number = std::nullopt })),
                  "none:");

  tests::pass();
}

static void testIsShortPeriod() {
  tests::assertTrue(isShortPeriod(Period("hourly")));
  tests::assertFalse(isShortPeriod(Period("weekly")));
  tests::assertTrue(
      isShortPeriod(Period(PeriodSpec{ .unit = "minutes", .number = 30 })));
  tests::assertTrue(
      isShortPeriod(Period(PeriodSpec{ .unit = "hours", .number = 1 })));
  tests::assertFalse(
      isShortPeriod(Period(PeriodSpec{ .unit = "hours", .number = 2 })));

  tests::pass();
}

int main() {
  testPresets();
  testUnits();
  testHugeNumber();
  testBucketsAreStableWithinPeriod();
  testDescribePeriod();
  testIsShortPeriod();
}

#endif
