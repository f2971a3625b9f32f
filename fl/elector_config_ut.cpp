#include "fl/elector_config.hpp"

#include <gtest/gtest.h>

#include <sstream>

/**
 * @test Verify the defaults of fl::elector_config.
 */
TEST(elector_config, defaults) {
  using namespace std::chrono_literals;
  fl::elector_config config;
  EXPECT_EQ(config.poll_interval, 5s);
  EXPECT_EQ(config.operation_timeout, 5s);
  EXPECT_EQ(config.session_ttl, 10s);
  EXPECT_EQ(config.key_prefix, "fluxlock/advisory");
  EXPECT_NE(config.holder.find(':'), std::string::npos);
  EXPECT_NO_THROW(fl::validate(config));

  std::ostringstream os;
  os << config;
  EXPECT_NE(os.str().find("poll_interval=5000ms"), std::string::npos);
}

/**
 * @test Verify that fl::validate rejects bad configurations.
 */
TEST(elector_config, validate) {
  using namespace std::chrono_literals;
  auto expect_invalid = [](auto mutate) {
    fl::elector_config config;
    mutate(config);
    EXPECT_THROW(fl::validate(config), std::invalid_argument);
  };
  expect_invalid([](fl::elector_config& c) { c.poll_interval = 0ms; });
  expect_invalid([](fl::elector_config& c) { c.operation_timeout = -1ms; });
  expect_invalid([](fl::elector_config& c) { c.session_ttl = 0ms; });
  expect_invalid([](fl::elector_config& c) { c.session_ttl = 999ms; });
  expect_invalid([](fl::elector_config& c) { c.key_prefix = ""; });

  fl::elector_config config;
  config.poll_interval = 10ms;
  config.session_ttl = 1s;
  EXPECT_NO_THROW(fl::validate(config));
}

/**
 * @test Verify fl::decide_scheduler_mode.
 */
TEST(scaling_config, scheduler_mode) {
  using m = fl::scheduler_mode;
  fl::scaling_config config;
  EXPECT_EQ(fl::decide_scheduler_mode(config), m::always);

  config.enable_leader_election = true;
  EXPECT_EQ(fl::decide_scheduler_mode(config), m::when_elected);

  config.worker_only = true;
  EXPECT_EQ(fl::decide_scheduler_mode(config), m::never);

  config.worker_only = false;
  config.disable_scheduler = true;
  EXPECT_EQ(fl::decide_scheduler_mode(config), m::never);

  std::ostringstream os;
  os << m::always << " " << m::never << " " << m::when_elected << " " << m(7);
  EXPECT_EQ(os.str(), "always never when_elected scheduler_mode(7)");
}
