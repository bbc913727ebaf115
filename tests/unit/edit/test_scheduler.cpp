#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "mathedit/edit/scheduler.hpp"

using mathedit::ManualScheduler;
using mathedit::Millis;

TEST(ManualScheduler, FiresInDueOrder)
{
  ManualScheduler s;
  std::vector<std::string> fired;
  s.schedule(Millis{30}, [&] { fired.push_back("late"); });
  s.schedule(Millis{10}, [&] { fired.push_back("early"); });
  s.schedule(Millis{10}, [&] { fired.push_back("early2"); });

  s.advance(Millis{9});
  EXPECT_TRUE(fired.empty());
  EXPECT_EQ(s.pending_count(), 3U);

  s.advance(Millis{1});
  EXPECT_EQ(fired, (std::vector<std::string>{"early", "early2"}));

  s.advance_to(Millis{100});
  EXPECT_EQ(fired.back(), "late");
  EXPECT_EQ(s.now(), Millis{100});
  EXPECT_EQ(s.pending_count(), 0U);
}

TEST(ManualScheduler, ClockReadsDueTimeInsideCallback)
{
  ManualScheduler s;
  Millis seen{-1};
  s.schedule(Millis{25}, [&] { seen = s.now(); });
  s.advance_to(Millis{60});
  EXPECT_EQ(seen, Millis{25});
}

TEST(ManualScheduler, CancelledTimerNeverFires)
{
  ManualScheduler s;
  int count = 0;
  const auto id = s.schedule(Millis{5}, [&] { ++count; });
  EXPECT_TRUE(s.cancel(id));
  EXPECT_FALSE(s.cancel(id));
  EXPECT_FALSE(s.cancel(mathedit::k_no_timer));
  s.advance(Millis{10});
  EXPECT_EQ(count, 0);
}

TEST(ManualScheduler, CallbackCanScheduleWithinInterval)
{
  ManualScheduler s;
  std::vector<int> fired;
  s.schedule(Millis{10}, [&] {
    fired.push_back(10);
    s.schedule(Millis{5}, [&] { fired.push_back(15); });
    s.schedule(Millis{50}, [&] { fired.push_back(60); });
  });
  s.advance_to(Millis{20});
  EXPECT_EQ(fired, (std::vector<int>{10, 15}));
  EXPECT_EQ(s.pending_count(), 1U);
}
