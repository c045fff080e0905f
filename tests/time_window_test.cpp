// =============================================================================
// time_window_test.cpp
// =============================================================================
// Unit tests for the TimeWindow family.
//
// Validates:
//   - StaticInterval membership and roll-forward (ahead, inside, passed)
//   - PeriodicWindow daily/weekly spans, including wrap-around
//   - ComplementWindow roll-forward and double complement identity
//   - union_of / intersection_of flattening, identities and roll-forward
//   - Constructor validation
//   - Saturation of edges that would pass the end of the clock
//
// All instants are built with utc_ms(); 2024-01-01 is a Monday.
// =============================================================================

#include "cadence/window/periodic_window.hpp"
#include "cadence/window/static_interval.hpp"
#include "cadence/window/time_window.hpp"
#include "cadence/window/window_algebra.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>

namespace {

using namespace std::chrono_literals;
using cadence::Interval;
using cadence::Timestamp;

Timestamp at(int year, unsigned month, unsigned day, unsigned hour = 0,
             unsigned minute = 0) {
  return cadence::ms_to_timestamp(
      cadence::utc_ms(year, month, day, hour, minute));
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. The default StaticInterval is the unbounded window.
// Why: It is the "cannot be determined" answer for every non-temporal
//      condition; it must contain everything and never end.
// -----------------------------------------------------------------------------
TEST(StaticIntervalTest, DefaultIsUnbounded) {
  cadence::StaticInterval always;
  const Timestamp t = at(2024, 1, 1, 12);

  EXPECT_TRUE(always.isUnbounded());
  EXPECT_TRUE(always.contains(t));
  EXPECT_TRUE(always.contains(at(1950, 6, 1)));
  EXPECT_EQ(always.rollForward(t), (Interval{t, cadence::kPositiveInfinity}));
  EXPECT_EQ(always.describe(), "always");
}

// -----------------------------------------------------------------------------
// 2. A fixed interval rolls forward to itself, then to [t, end), then never.
// -----------------------------------------------------------------------------
TEST(StaticIntervalTest, RollForwardAheadInsideAndPassed) {
  const Timestamp start = at(2024, 1, 1, 8);
  const Timestamp end = at(2024, 1, 1, 17);
  cadence::StaticInterval window(start, end);

  EXPECT_EQ(window.rollForward(at(2024, 1, 1, 6)), (Interval{start, end}));
  EXPECT_EQ(window.rollForward(at(2024, 1, 1, 9)),
            (Interval{at(2024, 1, 1, 9), end}));
  EXPECT_TRUE(window.rollForward(end).isNever());

  EXPECT_TRUE(window.contains(start));
  EXPECT_FALSE(window.contains(end)) << "right edge is exclusive";
}

TEST(StaticIntervalTest, RejectsReversedBounds) {
  EXPECT_THROW(cadence::StaticInterval(at(2024, 1, 2), at(2024, 1, 1)),
               std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 3. Daily window membership follows the time of day, half-open.
// -----------------------------------------------------------------------------
TEST(PeriodicWindowTest, DailyMembership) {
  auto office = cadence::PeriodicWindow::daily(8h, 17h);

  EXPECT_FALSE(office->contains(at(2024, 1, 1, 7, 59)));
  EXPECT_TRUE(office->contains(at(2024, 1, 1, 8, 0)));
  EXPECT_TRUE(office->contains(at(2024, 3, 15, 16, 59)));
  EXPECT_FALSE(office->contains(at(2024, 1, 1, 17, 0)));
  EXPECT_EQ(office->describe(), "daily 08:00-17:00");
}

// -----------------------------------------------------------------------------
// 4. Daily roll-forward: before, during and after the span.
// Why: The distance to the rolled-forward left edge is the sleep estimate.
//      Rolling into the wrong day would oversleep by 24 hours.
// -----------------------------------------------------------------------------
TEST(PeriodicWindowTest, DailyRollForward) {
  auto office = cadence::PeriodicWindow::daily(8h, 17h);

  EXPECT_EQ(office->rollForward(at(2024, 1, 1, 7)),
            (Interval{at(2024, 1, 1, 8), at(2024, 1, 1, 17)}));
  EXPECT_EQ(office->rollForward(at(2024, 1, 1, 9, 30)),
            (Interval{at(2024, 1, 1, 9, 30), at(2024, 1, 1, 17)}));
  EXPECT_EQ(office->rollForward(at(2024, 1, 1, 18)),
            (Interval{at(2024, 1, 2, 8), at(2024, 1, 2, 17)}));
  EXPECT_EQ(office->rollForward(at(2023, 12, 31, 17)),
            (Interval{at(2024, 1, 1, 8), at(2024, 1, 1, 17)}))
      << "must cross the year boundary";
}

// -----------------------------------------------------------------------------
// 5. A span with start > end wraps across midnight.
// -----------------------------------------------------------------------------
TEST(PeriodicWindowTest, DailyWrapsAcrossMidnight) {
  auto night = cadence::PeriodicWindow::daily(22h, 6h);

  EXPECT_TRUE(night->contains(at(2024, 1, 1, 23)));
  EXPECT_TRUE(night->contains(at(2024, 1, 2, 5, 59)));
  EXPECT_FALSE(night->contains(at(2024, 1, 2, 12)));

  EXPECT_EQ(night->rollForward(at(2024, 1, 1, 23)),
            (Interval{at(2024, 1, 1, 23), at(2024, 1, 2, 6)}));
  EXPECT_EQ(night->rollForward(at(2024, 1, 2, 3)),
            (Interval{at(2024, 1, 2, 3), at(2024, 1, 2, 6)}));
  EXPECT_EQ(night->rollForward(at(2024, 1, 2, 12)),
            (Interval{at(2024, 1, 2, 22), at(2024, 1, 3, 6)}));
}

TEST(PeriodicWindowTest, EqualOffsetsCoverWholePeriod) {
  auto all_day = cadence::PeriodicWindow::daily(0h, 0h);
  const Timestamp t = at(2024, 1, 1, 13);

  EXPECT_TRUE(all_day->contains(t));
  EXPECT_TRUE(all_day->isUnbounded());
  EXPECT_EQ(all_day->rollForward(t), (Interval{t, cadence::kPositiveInfinity}));
}

// -----------------------------------------------------------------------------
// 6. Weekly windows are anchored at Monday 00:00 UTC.
// -----------------------------------------------------------------------------
TEST(PeriodicWindowTest, WeeklyAnchoredOnMonday) {
  // Monday and Tuesday.
  auto early_week = cadence::PeriodicWindow::weekly(0h, 48h);

  EXPECT_TRUE(early_week->contains(at(2024, 1, 1, 0)));   // Mon
  EXPECT_TRUE(early_week->contains(at(2024, 1, 2, 23)));  // Tue
  EXPECT_FALSE(early_week->contains(at(2024, 1, 3, 0)));  // Wed
  EXPECT_FALSE(early_week->contains(at(2024, 1, 7, 12))); // Sun

  EXPECT_EQ(early_week->rollForward(at(2024, 1, 3, 10)),
            (Interval{at(2024, 1, 8), at(2024, 1, 10)}));
  EXPECT_EQ(early_week->describe(), "weekly Mon 00:00-Wed 00:00");
}

TEST(PeriodicWindowTest, RejectsOffsetsOutsidePeriod) {
  EXPECT_THROW(cadence::PeriodicWindow::daily(8h, 24h), std::invalid_argument);
  EXPECT_THROW(cadence::PeriodicWindow::daily(-1h, 8h), std::invalid_argument);
  EXPECT_THROW(cadence::PeriodicWindow(0h, 0h, 0h), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 7. Complement rolls forward to the gap after the current occurrence.
// -----------------------------------------------------------------------------
TEST(ComplementWindowTest, RollForwardSkipsCurrentOccurrence) {
  auto office = cadence::PeriodicWindow::daily(8h, 17h);
  auto off_hours = office->complement();

  EXPECT_TRUE(off_hours->contains(at(2024, 1, 1, 18)));
  EXPECT_FALSE(off_hours->contains(at(2024, 1, 1, 9)));

  EXPECT_EQ(off_hours->rollForward(at(2024, 1, 1, 9)),
            (Interval{at(2024, 1, 1, 17), at(2024, 1, 2, 8)}));
  EXPECT_EQ(off_hours->rollForward(at(2024, 1, 1, 20)),
            (Interval{at(2024, 1, 1, 20), at(2024, 1, 2, 8)}));
}

// -----------------------------------------------------------------------------
// 8. Complementing twice hands back the original object.
// -----------------------------------------------------------------------------
TEST(ComplementWindowTest, DoubleComplementIsIdentity) {
  cadence::WindowPtr office = cadence::PeriodicWindow::daily(8h, 17h);

  EXPECT_EQ(office->complement()->complement().get(), office.get());
}

TEST(ComplementWindowTest, ComplementOfUnboundedNeverOccurs) {
  auto nothing = cadence::unbounded_window()->complement();

  EXPECT_FALSE(nothing->contains(at(2024, 1, 1)));
  EXPECT_TRUE(nothing->rollForward(at(2024, 1, 1)).isNever());
}

// -----------------------------------------------------------------------------
// 9. Union: earliest occurrence wins and touching members merge.
// -----------------------------------------------------------------------------
TEST(WindowAlgebraTest, UnionPicksEarliestAndMergesAdjacent) {
  auto morning = cadence::PeriodicWindow::daily(8h, 12h);
  auto afternoon = cadence::PeriodicWindow::daily(12h, 17h);
  auto evening = cadence::PeriodicWindow::daily(19h, 21h);

  auto day = cadence::union_of({evening, afternoon, morning});

  EXPECT_TRUE(day->contains(at(2024, 1, 1, 13)));
  EXPECT_FALSE(day->contains(at(2024, 1, 1, 18)));

  EXPECT_EQ(day->rollForward(at(2024, 1, 1, 9)),
            (Interval{at(2024, 1, 1, 9), at(2024, 1, 1, 17)}));
  EXPECT_EQ(day->rollForward(at(2024, 1, 1, 17, 30)),
            (Interval{at(2024, 1, 1, 19), at(2024, 1, 1, 21)}));
}

TEST(WindowAlgebraTest, UnionFlattensAndIsAbsorbedByUnbounded) {
  auto a = cadence::PeriodicWindow::daily(1h, 2h);
  auto b = cadence::PeriodicWindow::daily(3h, 4h);
  auto c = cadence::PeriodicWindow::daily(5h, 6h);

  auto nested = cadence::union_of({cadence::union_of({a, b}), c});
  const auto* any = dynamic_cast<const cadence::AnyWindow*>(nested.get());
  ASSERT_NE(any, nullptr);
  EXPECT_EQ(any->windows().size(), 3u);

  EXPECT_TRUE(
      cadence::union_of({a, cadence::unbounded_window()})->isUnbounded());
  EXPECT_THROW(cadence::union_of({}), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 10. Intersection: unbounded is the identity, singletons collapse.
// -----------------------------------------------------------------------------
TEST(WindowAlgebraTest, IntersectionIdentity) {
  cadence::WindowPtr office = cadence::PeriodicWindow::daily(8h, 17h);

  EXPECT_EQ(cadence::intersection_of({office, cadence::unbounded_window()}),
            office);
  EXPECT_TRUE(cadence::intersection_of({})->isUnbounded());
}

// -----------------------------------------------------------------------------
// 11. Intersection roll-forward hops between members until they overlap.
// Why: "office hours on the weekend" starting from a Monday must land on
//      Saturday 08:00, not on Monday 08:00 or Saturday 00:00.
// -----------------------------------------------------------------------------
TEST(WindowAlgebraTest, IntersectionRollForwardFindsOverlap) {
  auto office = cadence::PeriodicWindow::daily(8h, 17h);
  auto weekend = cadence::PeriodicWindow::weekly(5 * 24h, 0h);

  auto weekend_office = cadence::intersection_of({office, weekend});

  EXPECT_FALSE(weekend_office->contains(at(2024, 1, 1, 10)));
  EXPECT_TRUE(weekend_office->contains(at(2024, 1, 6, 10)));
  EXPECT_EQ(weekend_office->rollForward(at(2024, 1, 1, 10)),
            (Interval{at(2024, 1, 6, 8), at(2024, 1, 6, 17)}));
}

TEST(WindowAlgebraTest, DisjointStaticIntersectionNeverOccurs) {
  auto first = cadence::StaticInterval::create(at(2024, 1, 1), at(2024, 1, 2));
  auto second = cadence::StaticInterval::create(at(2024, 1, 3), at(2024, 1, 4));

  auto none = cadence::intersection_of({first, second});

  EXPECT_TRUE(none->rollForward(at(2023, 12, 1)).isNever());
}

// -----------------------------------------------------------------------------
// 12. Edges past the end of the clock saturate at kPositiveInfinity.
// Why: The next start or end of a span can lie beyond Timestamp::max();
//      rolling forward there must not wrap around to the distant past.
//      Timestamp::max() falls at about 07:12 UTC of its day.
// -----------------------------------------------------------------------------
TEST(PeriodicWindowTest, RollForwardSaturatesNearEndOfTime) {
  auto office = cadence::PeriodicWindow::daily(8h, 17h);
  EXPECT_TRUE(office->rollForward(cadence::kPositiveInfinity - 1h).isNever());

  auto long_day = cadence::PeriodicWindow::daily(6h, 17h);
  const Timestamp late = cadence::kPositiveInfinity - 30min;
  ASSERT_TRUE(long_day->contains(late));
  EXPECT_EQ(long_day->rollForward(late),
            (Interval{late, cadence::kPositiveInfinity}));

  // The occurrence never ends, so its complement never starts.
  EXPECT_TRUE(long_day->complement()->rollForward(late).isNever());
}

// -----------------------------------------------------------------------------
// 13. Members that together cover the whole day form one open-ended span.
// -----------------------------------------------------------------------------
TEST(WindowAlgebraTest, UnionCoveringWholeDayIsOpenEnded) {
  auto first_half = cadence::PeriodicWindow::daily(0h, 12h);
  auto second_half = cadence::PeriodicWindow::daily(12h, 0h);

  auto whole_day = cadence::union_of({first_half, second_half});
  const Timestamp t = at(2024, 1, 1, 7);

  EXPECT_EQ(whole_day->rollForward(t),
            (Interval{t, cadence::kPositiveInfinity}));
  EXPECT_TRUE(whole_day->complement()->rollForward(t).isNever());
}
