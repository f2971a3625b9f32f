#include "fl/log.hpp"

#include <gmock/gmock.h>

#include <thread>

namespace {
using captured_logs = std::vector<std::pair<fl::severity, std::string>>;

std::shared_ptr<fl::log_sink> capture_to(captured_logs& logs) {
  return fl::make_log_sink([&logs](fl::severity sev, std::string&& msg) { logs.emplace_back(sev, std::move(msg)); });
}
} // anonymous namespace

/**
 * @test Verify the format of a message: severity, text, location and thread.
 */
TEST(log, format) {
  fl::log lg;
  // ... with no sinks nothing is formatted ...
  EXPECT_FALSE(lg.enabled(fl::severity::fatal));
  ASSERT_NO_THROW(FL_LOG_I(error, lg) << "lock " << 4 << 2);
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  using namespace ::testing;
  ASSERT_NO_THROW(FL_LOG_I(error, lg) << "release failed for id=" << 42);
  ASSERT_EQ(logs.size(), 1UL);
  EXPECT_EQ(logs[0].first, fl::severity::error);
  EXPECT_THAT(logs[0].second, StartsWith("[error] release failed for id=42 @ log_ut.cpp:"));
  std::ostringstream tid;
  tid << "[thread " << std::this_thread::get_id() << "]";
  EXPECT_THAT(logs[0].second, EndsWith(tid.str()));
}

/**
 * @test Verify that messages below the run-time minimum severity are dropped without evaluating the expression.
 */
TEST(log, run_time_disable) {
  fl::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  int cnt = 0;
  auto f = [&cnt]() {
    ++cnt;
    return 42;
  };
  lg.min_severity(fl::severity::warning);
  EXPECT_EQ(lg.min_severity(), fl::severity::warning);
  EXPECT_FALSE(lg.enabled(fl::severity::info));
  ASSERT_NO_THROW(FL_LOG_I(info, lg) << "became leader " << f());
  EXPECT_EQ(logs.size(), 0UL);
  EXPECT_EQ(cnt, 0);
  ASSERT_NO_THROW(FL_LOG_I(warning, lg) << "poll failed " << f());
  ASSERT_EQ(logs.size(), 1UL);
  EXPECT_EQ(cnt, 1);
  EXPECT_THAT(logs[0].second, ::testing::StartsWith("[warning] poll failed 42"));
}

/**
 * @test Verify that levels below FL_MIN_SEVERITY are disabled at compile-time.
 */
TEST(log, compile_time_disable) {
  static_assert(fl::detail::compile_time_disabled(fl::severity::debug), "debug must be disabled by default");
  static_assert(not fl::detail::compile_time_disabled(fl::severity::info), "info must be enabled by default");
  fl::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  int cnt = 0;
  auto f = [&cnt]() {
    ++cnt;
    return 42;
  };
  // ... enabled at run-time, but disabled at compile-time ...
  lg.min_severity(fl::severity::trace);
  ASSERT_NO_THROW(FL_LOG_I(debug, lg) << "timer fired " << f() << std::hex << 42);
  EXPECT_EQ(logs.size(), 0UL);
  EXPECT_EQ(cnt, 0);
}

/**
 * @test Verify that the FL_LOG() macro and the process-wide core work as expected.
 */
TEST(log, instance) {
  fl::log& lg = fl::log::instance();
  EXPECT_EQ(&lg, &fl::log::instance());
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  ASSERT_NO_THROW(FL_LOG(info) << "session opened " << 42);
  ASSERT_EQ(logs.size(), 1UL);
  EXPECT_EQ(logs[0].first, fl::severity::info);
  EXPECT_THAT(logs[0].second, ::testing::StartsWith("[info] session opened 42"));
  lg.clear_sinks();
}

/**
 * @test Verify that each sink receives its own copy of the message.
 */
TEST(log, multiple_sinks) {
  fl::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));
  lg.add_sink(fl::make_log_sink([&logs](fl::severity sev, std::string&& msg) {
    logs.emplace_back(sev, "(2) " + msg);
  }));

  using namespace ::testing;
  ASSERT_NO_THROW(FL_LOG_I(error, lg) << "revoke failed " << 42);
  ASSERT_EQ(logs.size(), 2UL);
  EXPECT_THAT(logs[0].second, StartsWith("[error] revoke failed 42"));
  EXPECT_THAT(logs[1].second, StartsWith("(2) [error] revoke failed 42"));
}
