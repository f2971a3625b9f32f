#include "fl/leader_elector.hpp"

#include <gtest/gtest.h>

#include <future>

/**
 * @test Verify that fl::leader_elector rejects stop() from its own loop thread, where the callbacks run.
 *
 * The elector is never started, so the channel does not need a server behind it.
 */
TEST(leader_elector, stop_from_callback_thread) {
  using namespace std::chrono_literals;
  auto queue = std::make_shared<fl::active_completion_queue>("store");
  auto channel = grpc::CreateChannel("localhost:1", grpc::InsecureChannelCredentials());
  fl::leader_elector elector(queue, channel, fl::lock_identifier{42, "test-42"});
  EXPECT_FALSE(elector.loop_queue().in_loop_thread());
  EXPECT_EQ(elector.loop_queue().name(), "elector[test-42(42)]");

  std::promise<bool> rejected;
  elector.loop_queue().cq().make_relative_timer(
      1ms, "test/stop_in_loop", [&rejected, &elector](auto const&, bool) {
        try {
          elector.stop();
          rejected.set_value(false);
        } catch (std::runtime_error const&) {
          rejected.set_value(true);
        }
      });
  auto f = rejected.get_future();
  ASSERT_EQ(f.wait_for(5s), std::future_status::ready);
  EXPECT_TRUE(f.get());

  // ... the rejected call did not change anything, stop() from the application thread works ...
  EXPECT_FALSE(elector.is_leader());
  EXPECT_NO_THROW(elector.stop());
  EXPECT_NO_THROW(elector.stop());
}
