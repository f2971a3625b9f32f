#include "fl/detail/elector_state_machine.hpp"

#include <gtest/gtest.h>

#include <sstream>

/**
 * @test Verify the valid and invalid transitions of fl::detail::elector_state_machine.
 */
TEST(elector_state_machine, basic) {
  using s = fl::detail::elector_state;
  fl::detail::elector_state_machine machine;

  ASSERT_EQ(machine.current(), s::idle);
  EXPECT_FALSE(machine.change_state("test", s::leader));
  EXPECT_FALSE(machine.change_state("test", s::stopped));
  EXPECT_TRUE(machine.change_state("test", s::polling));
  EXPECT_FALSE(machine.change_state("test", s::polling));
  EXPECT_FALSE(machine.change_state("test", s::idle));

  EXPECT_TRUE(machine.change_state("test", s::leader));
  EXPECT_FALSE(machine.change_state("test", s::leader));
  EXPECT_TRUE(machine.change_state("test", s::polling));
  EXPECT_TRUE(machine.change_state("test", s::leader));
  EXPECT_FALSE(machine.change_state("test", s::stopped));

  EXPECT_TRUE(machine.change_state("test", s::stopping));
  EXPECT_FALSE(machine.change_state("test", s::stopping));
  EXPECT_FALSE(machine.change_state("test", s::polling));
  EXPECT_FALSE(machine.change_state("test", s::leader));
  EXPECT_TRUE(machine.change_state("test", s::stopped));

  EXPECT_FALSE(machine.change_state("test", s::idle));
  EXPECT_FALSE(machine.change_state("test", s::polling));
  EXPECT_FALSE(machine.change_state("test", s::stopping));
  EXPECT_EQ(machine.current(), s::stopped);
}

/**
 * @test Verify that an elector can be stopped without being started.
 */
TEST(elector_state_machine, stop_before_start) {
  using s = fl::detail::elector_state;
  fl::detail::elector_state_machine machine;
  EXPECT_TRUE(machine.change_state("test", s::stopping));
  EXPECT_TRUE(machine.change_state("test", s::stopped));
  EXPECT_FALSE(machine.change_state("test", s::polling));
}

/**
 * @test Verify that the iostream operator for fl::detail::elector_state works as expected.
 */
TEST(elector_state, streaming) {
  using s = fl::detail::elector_state;
  std::ostringstream os;
  os << s::idle << " " << s::polling << " " << s::leader << " " << s::stopping << " " << s::stopped << " "
     << s(9);
  EXPECT_EQ(os.str(), "idle polling leader stopping stopped elector_state(9)");
}
