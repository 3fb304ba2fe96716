#include "network/stream/fetch_handle.hpp"

#include <thread>

#include <gtest/gtest.h>

#include "network/stream/stream_error.hpp"
#include "testutil/outcome.hpp"

using namespace csync::network::stream;
using std::chrono_literals::operator""ms;

/**
 * @given an unresolved handle
 * @when resolved twice
 * @then only the first result counts
 */
TEST(FetchHandleTest, ResolvesOnce) {
  FetchHandle handle;
  EXPECT_FALSE(handle.IsResolved());

  EXPECT_TRUE(handle.Resolve(outcome::success()));
  EXPECT_FALSE(handle.Abort());

  EXPECT_TRUE(handle.IsResolved());
  EXPECT_OUTCOME_TRUE_1(handle.Wait());
}

/**
 * @given an aborted handle
 * @when waiting on it
 * @then FETCH_ABORTED is returned
 */
TEST(FetchHandleTest, Abort) {
  FetchHandle handle;
  EXPECT_TRUE(handle.Abort());
  EXPECT_OUTCOME_ERROR(res, handle.Wait(), StreamError::FETCH_ABORTED);
}

/**
 * @given an unresolved handle
 * @when waiting with a timeout
 * @then none is returned
 */
TEST(FetchHandleTest, WaitForTimesOut) {
  FetchHandle handle;
  EXPECT_FALSE(handle.WaitFor(20ms));
}

/**
 * @given a waiter on another thread
 * @when the handle resolves
 * @then the waiter wakes up with the result
 */
TEST(FetchHandleTest, WaitWakesUp) {
  FetchHandle handle;
  boost::optional<outcome::result<void>> seen;
  std::thread waiter([&] { seen = handle.WaitFor(2000ms); });

  handle.Resolve(outcome::success());
  waiter.join();

  ASSERT_TRUE(seen);
  EXPECT_TRUE(seen.value());
}

/**
 * @given callbacks registered before and after resolution
 * @when the handle resolves
 * @then each runs once with the result
 */
TEST(FetchHandleTest, Callbacks) {
  FetchHandle handle;
  int before = 0;
  int after = 0;
  handle.OnResolved([&](const outcome::result<void> &res) {
    EXPECT_FALSE(res);
    ++before;
  });

  handle.Abort();
  EXPECT_EQ(before, 1);

  handle.OnResolved([&](const outcome::result<void> &res) {
    EXPECT_FALSE(res);
    ++after;
  });
  EXPECT_EQ(after, 1);
  EXPECT_EQ(before, 1);
}
