#include "fl/log_sink.hpp"

#include <gtest/gtest.h>

#include <sstream>

/**
 * @test Verify that fl::make_log_sink forwards to the functor.
 */
TEST(log_sink, function) {
  std::string value;
  fl::severity sev = fl::severity::trace;
  auto ls = fl::make_log_sink([&value, &sev](fl::severity s, std::string&& m) {
    value = std::move(m);
    sev = s;
  });

  ls->log(fl::severity::warning, std::string("poll failed"));
  EXPECT_EQ(sev, fl::severity::warning);
  EXPECT_EQ(value, "poll failed");
}

/**
 * @test Verify that fl::make_stream_sink writes one line per message.
 */
TEST(log_sink, stream) {
  std::ostringstream os;
  auto ls = fl::make_stream_sink(os);
  ls->log(fl::severity::info, std::string("[info] acquired"));
  ls->log(fl::severity::error, std::string("[error] release failed"));
  EXPECT_EQ(os.str(), "[info] acquired\n[error] release failed\n");
}
