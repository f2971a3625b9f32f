#include "fl/detail/async_op_counter.hpp"

#include <gtest/gtest.h>
#include <thread>

/**
 * @test Verify that fl::detail::async_op_counter counts and blocks as expected.
 */
TEST(async_op_counter, basic) {
  fl::detail::async_op_counter counter;

  EXPECT_TRUE(counter.async_op_start("elector/poll_timer"));
  EXPECT_TRUE(counter.async_op_start("session/on_timeout/write"));
  EXPECT_EQ(counter.pending(), 2);
  counter.async_op_done("elector/poll_timer");
  counter.async_op_done("session/on_timeout/write");
  EXPECT_EQ(counter.pending(), 0);

  EXPECT_FALSE(counter.in_shutdown());
  EXPECT_TRUE(counter.async_op_start("elector/poll_timer"));
  EXPECT_TRUE(counter.async_op_start("elector/poll_timer"));
  EXPECT_EQ(counter.pending(), 2);

  counter.shutdown();
  EXPECT_TRUE(counter.in_shutdown());
  EXPECT_FALSE(counter.async_op_start("elector/poll_timer"));
  EXPECT_EQ(counter.pending(), 2);

  std::thread t([&counter]() {
    counter.async_op_done("elector/poll_timer");
    counter.async_op_done("elector/poll_timer");
  });

  counter.block_until_all_done();
  EXPECT_EQ(counter.pending(), 0);
  EXPECT_FALSE(counter.async_op_start("elector/poll_timer"));
  t.join();
}

/**
 * @test Verify that block_until_all_done() returns immediately when nothing is pending.
 */
TEST(async_op_counter, block_when_idle) {
  fl::detail::async_op_counter counter;
  counter.block_until_all_done();
  EXPECT_TRUE(counter.in_shutdown());
}

/**
 * @test Verify that an unbalanced async_op_done() is reported.
 */
TEST(async_op_counter, unbalanced_done) {
  fl::detail::async_op_counter counter;
  EXPECT_TRUE(counter.async_op_start("session/on_write/read"));
  EXPECT_THROW(counter.async_op_done("session/on_timeout/write"), std::logic_error);
  EXPECT_EQ(counter.pending(), 1);
  counter.async_op_done("session/on_write/read");
}
