#include "fl/log_severity.hpp"

#include <gtest/gtest.h>

#include <sstream>

/**
 * @test Verify the order and the names of the severity levels.
 */
TEST(log_severity, names) {
  ASSERT_LT(fl::severity::LOWEST, fl::severity::HIGHEST);
  ASSERT_LE(fl::severity::LOWEST, fl::severity::LOWEST_ENABLED);

  using s = fl::severity;
  std::ostringstream os;
  os << s::trace << " " << s::info << " " << s::warning << " " << s::fatal << " " << s(42);
  EXPECT_EQ(os.str(), "trace info warning fatal severity(42)");
}

/**
 * @test Verify that fl::parse_severity() accepts the printed names and rejects anything else.
 */
TEST(log_severity, parse) {
  for (int i = int(fl::severity::LOWEST); i <= int(fl::severity::HIGHEST); ++i) {
    std::ostringstream os;
    os << fl::severity(i);
    EXPECT_EQ(fl::parse_severity(os.str()), fl::severity(i));
  }
  EXPECT_THROW(fl::parse_severity("INFO"), std::invalid_argument);
  EXPECT_THROW(fl::parse_severity(""), std::invalid_argument);
}
