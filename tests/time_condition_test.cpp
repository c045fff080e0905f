// =============================================================================
// time_condition_test.cpp
// =============================================================================
// Unit tests for TimeCondition and the temporal behaviour of composites.
//
// Validates:
//   - evaluate() follows window membership on the injected clock
//   - Estimates: zero inside a window, distance to the next start outside
//   - Any takes the minimum estimate, All the maximum
//   - cycle(): union for Any, intersection for All, complement for Not
//   - cycle() and evaluate() agree over a two-day sweep
//
// Clock:
//   SimulationTimeProvider pinned at Monday 2024-01-01 07:00 UTC.
// =============================================================================

#include "cadence/condition/composite.hpp"
#include "cadence/condition/constant_conditions.hpp"
#include "cadence/condition/time_condition.hpp"
#include "cadence/time/simulation_time_provider.hpp"
#include "cadence/window/periodic_window.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace std::chrono_literals;

class TimeConditionTest : public ::testing::Test {
 protected:
  cadence::SimulationTimeProvider clock{cadence::utc_ms(2024, 1, 1, 7)};

  // One hour and three hours ahead of the pinned clock.
  std::shared_ptr<const cadence::TimeCondition> in_one_hour =
      cadence::TimeCondition::daily(8h, 9h);
  std::shared_ptr<const cadence::TimeCondition> in_three_hours =
      cadence::TimeCondition::daily(10h, 11h);

  std::shared_ptr<const cadence::TimeCondition> office =
      cadence::TimeCondition::daily(8h, 17h);

  static cadence::Timestamp at(int year, unsigned month, unsigned day,
                               unsigned hour, unsigned minute = 0) {
    return cadence::ms_to_timestamp(
        cadence::utc_ms(year, month, day, hour, minute));
  }

  void pin(cadence::Timestamp t) {
    clock.advance_time(cadence::timestamp_to_ms(t));
  }

  cadence::Timestamp now() const { return cadence::now_of(clock); }

  static cadence::Duration estimate(const cadence::ConditionPtr& condition,
                                    cadence::Timestamp t) {
    const auto* estimator = cadence::change_estimator(*condition);
    EXPECT_NE(estimator, nullptr) << condition->describe();
    return estimator ? estimator->estimateTimeToNextPossibleChange(t)
                     : cadence::Duration::zero();
  }
};

// -----------------------------------------------------------------------------
// 1. evaluate() reads the injected clock.
// -----------------------------------------------------------------------------
TEST_F(TimeConditionTest, EvaluateFollowsClock) {
  EXPECT_FALSE(office->evaluate(clock));

  clock.advance_by(1h);
  EXPECT_TRUE(office->evaluate(clock));

  pin(at(2024, 1, 1, 17));
  EXPECT_FALSE(office->evaluate(clock));
}

TEST_F(TimeConditionTest, EachClockIsIndependent) {
  cadence::SimulationTimeProvider night{cadence::utc_ms(2024, 1, 1, 23)};

  clock.advance_by(2h);
  EXPECT_TRUE(office->evaluate(clock));
  EXPECT_FALSE(office->evaluate(night));
}

// -----------------------------------------------------------------------------
// 2. Estimate is the distance to the next window start, zero when inside.
// -----------------------------------------------------------------------------
TEST_F(TimeConditionTest, EstimateUntilNextStart) {
  EXPECT_EQ(estimate(in_one_hour, now()), 1h);
  EXPECT_EQ(estimate(in_three_hours, now()), 3h);
  EXPECT_EQ(estimate(office, at(2024, 1, 1, 12)), 0ms);
  EXPECT_EQ(estimate(office, at(2024, 1, 1, 17, 30)), 14h + 30min);
}

// -----------------------------------------------------------------------------
// 3. All waits for the slowest branch, Any for the fastest.
// Why: A conjunction cannot turn true before both windows have opened;
//      a disjunction may turn true as soon as either opens.
// -----------------------------------------------------------------------------
TEST_F(TimeConditionTest, AllTakesMaximumAnyTakesMinimum) {
  auto conjunction = cadence::and_(in_one_hour, in_three_hours);
  auto disjunction = cadence::or_(in_one_hour, in_three_hours);

  EXPECT_EQ(estimate(conjunction, now()), 3h);
  EXPECT_EQ(estimate(disjunction, now()), 1h);
}

TEST_F(TimeConditionTest, AnyWithNonEstimatingChildRechecksImmediately) {
  auto mixed = cadence::or_(in_three_hours, cadence::always_false());
  EXPECT_EQ(estimate(mixed, now()), 0ms);
}

// -----------------------------------------------------------------------------
// 4. Not over a temporal child estimates until the child's window closes.
// -----------------------------------------------------------------------------
TEST_F(TimeConditionTest, NotEstimatesUntilWindowCloses) {
  auto outside_office = cadence::not_(office);

  EXPECT_TRUE(outside_office->isTemporal());
  EXPECT_EQ(estimate(outside_office, at(2024, 1, 1, 9)), 8h);
  EXPECT_EQ(estimate(outside_office, at(2024, 1, 1, 18)), 0ms);
}

// -----------------------------------------------------------------------------
// 5. Any over temporal children: union cycle; any other child: unbounded.
// -----------------------------------------------------------------------------
TEST_F(TimeConditionTest, AnyCycleIsUnionOfWindows) {
  auto disjunction = cadence::or_(in_one_hour, in_three_hours);
  auto cycle = disjunction->cycle();

  EXPECT_TRUE(cycle->contains(at(2024, 1, 1, 8, 30)));
  EXPECT_FALSE(cycle->contains(at(2024, 1, 1, 9, 30)));
  EXPECT_TRUE(cycle->contains(at(2024, 1, 1, 10, 30)));
  EXPECT_EQ(cycle->rollForward(now()),
            (cadence::Interval{at(2024, 1, 1, 8), at(2024, 1, 1, 9)}));

  EXPECT_TRUE(cadence::or_(in_one_hour, cadence::always_true())
                  ->cycle()
                  ->isUnbounded());
}

// -----------------------------------------------------------------------------
// 6. Not forwards isTemporal, so a negated window keeps Any determinable.
// -----------------------------------------------------------------------------
TEST_F(TimeConditionTest, AnyWithNegatedWindowHasDeterminableCycle) {
  auto either = cadence::or_(cadence::not_(office), in_one_hour);
  auto cycle = either->cycle();

  EXPECT_FALSE(cycle->isUnbounded());
  EXPECT_TRUE(cycle->contains(at(2024, 1, 1, 8, 30)));
  EXPECT_FALSE(cycle->contains(at(2024, 1, 1, 12)));
  EXPECT_TRUE(cycle->contains(at(2024, 1, 1, 20)));
}

// -----------------------------------------------------------------------------
// 7. All: intersection, with non-temporal children acting as the identity.
// -----------------------------------------------------------------------------
TEST_F(TimeConditionTest, AllCycleIsIntersection) {
  auto mondays = cadence::TimeCondition::weekly(0h, 24h);
  auto monday_office = cadence::and_(office, mondays);
  auto cycle = monday_office->cycle();

  EXPECT_TRUE(cycle->contains(at(2024, 1, 1, 9)));
  EXPECT_FALSE(cycle->contains(at(2024, 1, 2, 9)));
  EXPECT_EQ(cycle->rollForward(at(2024, 1, 1, 18)),
            (cadence::Interval{at(2024, 1, 8, 8), at(2024, 1, 8, 17)}));

  auto with_constant = cadence::and_(office, cadence::always_true());
  EXPECT_EQ(with_constant->cycle(), office->window());
}

// -----------------------------------------------------------------------------
// 8. cycle().contains(t) agrees with evaluate() at every sampled instant.
// Why: The scheduler sleeps on the cycle and fires on evaluate(); a
//      disagreement means either a missed run or a spurious wakeup.
// -----------------------------------------------------------------------------
TEST_F(TimeConditionTest, CycleAgreesWithEvaluate) {
  auto weekend = cadence::TimeCondition::weekly(5 * 24h, 0h);
  auto night = cadence::TimeCondition::daily(22h, 6h);

  const std::vector<cadence::ConditionPtr> conditions{
      office,
      night,
      cadence::or_(in_one_hour, in_three_hours),
      cadence::and_(office, cadence::not_(in_one_hour)),
      cadence::or_(cadence::not_(office), in_one_hour),
      cadence::and_(night, weekend),
  };

  for (const auto& condition : conditions) {
    const auto cycle = condition->cycle();
    // Friday 00:00 to Sunday 00:00 in 30-minute steps.
    for (int step = 0; step < 2 * 48; ++step) {
      pin(at(2024, 1, 5, 0) + step * 30min);
      EXPECT_EQ(cycle->contains(now()), condition->evaluate(clock))
          << condition->describe() << " at "
          << cadence::format_timestamp(now());
    }
  }
}

// -----------------------------------------------------------------------------
// 9. Named constructors.
// -----------------------------------------------------------------------------
TEST_F(TimeConditionTest, FromWindowSharesTheWindow) {
  cadence::WindowPtr window = cadence::PeriodicWindow::daily(6h, 7h);
  auto condition = cadence::TimeCondition::fromWindow(window);

  EXPECT_EQ(condition->window(), window);
  EXPECT_EQ(condition->cycle(), window);
  EXPECT_EQ(condition->describe(), "<is daily 06:00-07:00>");
}

TEST_F(TimeConditionTest, BetweenIsOneOff) {
  auto launch = cadence::TimeCondition::between(at(2024, 1, 1, 9),
                                                at(2024, 1, 1, 10));

  EXPECT_EQ(estimate(launch, now()), 2h);
  pin(at(2024, 1, 1, 9, 15));
  EXPECT_TRUE(launch->evaluate(clock));
  pin(at(2024, 1, 2, 9, 15));
  EXPECT_FALSE(launch->evaluate(clock));
  EXPECT_TRUE(launch->cycle()->rollForward(now()).isNever());
}

TEST_F(TimeConditionTest, RejectsNullWindow) {
  EXPECT_THROW(cadence::TimeCondition::fromWindow(nullptr),
               std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 10. Negating two half-day spans that cover the whole day.
// Why: The complement has no occurrence at all. The estimate must be the
//      longest possible wait, not a wrapped-around negative distance.
// -----------------------------------------------------------------------------
TEST_F(TimeConditionTest, NegatedWholeDayUnionNeverTurnsTrue) {
  auto whole_day = cadence::or_(cadence::TimeCondition::daily(0h, 12h),
                                cadence::TimeCondition::daily(12h, 0h));
  auto never = cadence::not_(whole_day);

  EXPECT_TRUE(whole_day->evaluate(clock));
  EXPECT_FALSE(never->evaluate(clock));
  EXPECT_TRUE(never->cycle()->rollForward(now()).isNever());
  EXPECT_EQ(estimate(never, now()),
            cadence::distance(now(), cadence::kPositiveInfinity));
  EXPECT_GT(estimate(never, now()), cadence::Duration::zero());
}
