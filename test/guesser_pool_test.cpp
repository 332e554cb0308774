/**
 * Tests for GuesserPool checkout and return.
 *
 * Run with ThreadSanitizer to detect data races:
 *   cmake -B build -DENABLE_TSAN=ON && cmake --build build
 *   ./build/guesser_pool_test
 */

#include "typeguesser/error.h"
#include "typeguesser/guesser_pool.h"

#include <atomic>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

using namespace typeguesser;

TEST(GuesserPoolTest, AcquireGivesFreshGuesser) {
  GuesserPool pool(4);
  PooledGuesser guesser = pool.acquire();
  ASSERT_TRUE(guesser);
  EXPECT_EQ(guesser->regime(), InputRegime::UNSET);
  EXPECT_EQ(guesser->guess(), DatabaseTypeRequest());
}

TEST(GuesserPoolTest, ReturnedGuesserIsReused) {
  GuesserPool pool(4);
  Guesser* first = nullptr;
  {
    PooledGuesser guesser = pool.acquire();
    first = guesser.get();
  }
  EXPECT_EQ(pool.available(), 1u);

  PooledGuesser again = pool.acquire();
  EXPECT_EQ(again.get(), first);
  EXPECT_EQ(pool.available(), 0u);
}

TEST(GuesserPoolTest, ReuseAfterIntegersAcceptsBooleans) {
  GuesserPool pool(4);
  {
    PooledGuesser guesser = pool.acquire();
    guesser->adjust_to_compensate_for_value(int32_t{1});
    guesser->adjust_to_compensate_for_value(int32_t{22});
    EXPECT_EQ(guesser->guess().type(), TypeTag::INTEGER);
  }

  PooledGuesser guesser = pool.acquire();
  guesser->reset();
  guesser->adjust_to_compensate_for_value("false");
  DatabaseTypeRequest request = guesser->guess();
  EXPECT_EQ(request.type(), TypeTag::BOOLEAN);
  EXPECT_EQ(request.size().integer_digits, 0u);
  EXPECT_EQ(guesser->value_count(), 1u);
}

TEST(GuesserPoolTest, ReturnRestoresDefaultSettings) {
  GuesserPool pool(4);
  {
    PooledGuesser guesser = pool.acquire();
    guesser->settings().char_can_be_boolean = true;
    guesser->settings().culture = CultureConfig::european();
  }
  PooledGuesser guesser = pool.acquire();
  EXPECT_FALSE(guesser->settings().char_can_be_boolean);
  EXPECT_EQ(guesser->settings().culture.decimal_mark, '.');
}

TEST(GuesserPoolTest, PoolDefaultsApplyToNewGuessers) {
  GuessSettings defaults;
  defaults.culture = CultureConfig::european();
  GuesserPool pool(defaults, 2);

  PooledGuesser guesser = pool.acquire();
  guesser->adjust_to_compensate_for_value("3,5");
  EXPECT_EQ(guesser->guess().type(), TypeTag::DECIMAL);
}

TEST(GuesserPoolTest, MisuseRaisesSameErrorAsFreshGuesser) {
  GuesserPool pool(4);
  PooledGuesser guesser = pool.acquire();
  guesser->adjust_to_compensate_for_value("text");
  try {
    guesser->adjust_to_compensate_for_value(Decimal{1, 0});
    FAIL() << "Expected MixedTypingException";
  } catch (const MixedTypingException& e) {
    EXPECT_EQ(e.kind(), MixedTypingKind::DECIMAL_AFTER_STRING);
  }
}

TEST(GuesserPoolTest, ExplicitRelease) {
  GuesserPool pool(4);
  PooledGuesser guesser = pool.acquire();
  guesser.release();
  EXPECT_FALSE(guesser);
  EXPECT_EQ(pool.available(), 1u);
  guesser.release(); // no-op
  EXPECT_EQ(pool.available(), 1u);
}

TEST(GuesserPoolTest, MoveTransfersOwnership) {
  GuesserPool pool(4);
  PooledGuesser a = pool.acquire();
  PooledGuesser b = std::move(a);
  EXPECT_FALSE(a);
  EXPECT_TRUE(b);
  EXPECT_EQ(pool.available(), 0u);

  PooledGuesser c = pool.acquire();
  c = std::move(b); // the guesser c held goes back to the pool
  EXPECT_EQ(pool.available(), 1u);
}

TEST(GuesserPoolTest, RetainsAtMostMaxGuessers) {
  GuesserPool pool(2);
  {
    std::vector<PooledGuesser> held;
    for (int i = 0; i < 5; ++i)
      held.push_back(pool.acquire());
  }
  EXPECT_EQ(pool.available(), 2u);
  EXPECT_EQ(pool.max_retained(), 2u);
}

TEST(GuesserPoolTest, DefaultCapacity) {
  EXPECT_GE(GuesserPool::default_max_retained(), 2u);
  GuesserPool pool;
  EXPECT_EQ(pool.max_retained(), GuesserPool::default_max_retained());
}

TEST(GuesserPoolTest, ConcurrentCheckout) {
  GuesserPool pool(4);
  const int num_threads = 8;
  const int rounds = 200;
  std::atomic<int> failures{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < num_threads; ++t) {
    threads.emplace_back([&pool, &failures, t] {
      for (int r = 0; r < rounds; ++r) {
        PooledGuesser guesser = pool.acquire();
        if (guesser->value_count() != 0 || guesser->regime() != InputRegime::UNSET) {
          failures++;
          continue;
        }
        if ((t + r) % 2 == 0) {
          guesser->adjust_to_compensate_for_value(int64_t{r});
          if (guesser->guess().type() != TypeTag::INTEGER)
            failures++;
        } else {
          guesser->adjust_to_compensate_for_value(std::to_string(r) + ".5");
          if (guesser->guess().type() != TypeTag::DECIMAL)
            failures++;
        }
      }
    });
  }
  for (auto& thread : threads)
    thread.join();

  EXPECT_EQ(failures.load(), 0);
  EXPECT_LE(pool.available(), 4u);
}
