#include "fl/lock_identifier.hpp"

#include <gtest/gtest.h>

#include <set>
#include <sstream>
#include <unordered_set>

/**
 * @test Verify that lookups are stable and the catalog has no collisions.
 */
TEST(lock_registry, unique_and_stable) {
  auto all = fl::lock_registry::all();
  ASSERT_EQ(all.size(), 3UL);

  std::set<std::int64_t> ids;
  std::set<std::string> names;
  for (auto const& id : all) {
    ids.insert(id.id);
    names.insert(id.name);
    EXPECT_EQ(fl::lock_registry::lookup(id.name), id);
    EXPECT_EQ(id.id >> 32, fl::lock_registry::namespace_prefix);
  }
  EXPECT_EQ(ids.size(), all.size());
  EXPECT_EQ(names.size(), all.size());

  auto jobs = fl::lock_registry::lookup(fl::lock_purpose::jobs_scheduler);
  EXPECT_EQ(jobs, fl::lock_registry::lookup(fl::lock_purpose::jobs_scheduler));
  EXPECT_EQ(jobs.id, 0x464C555800000001LL);
  EXPECT_EQ(jobs.name, "jobs_scheduler");
  EXPECT_NE(jobs, fl::lock_registry::lookup(fl::lock_purpose::functions_scheduler));
  EXPECT_NE(jobs, fl::lock_registry::lookup(fl::lock_purpose::rpc_scheduler));
}

/**
 * @test Verify that unknown purpose names are rejected.
 */
TEST(lock_registry, unknown_name) {
  EXPECT_THROW(fl::lock_registry::lookup(std::string("email_scheduler")), std::invalid_argument);
  EXPECT_THROW(fl::lock_registry::lookup(std::string("")), std::invalid_argument);
  EXPECT_THROW(fl::lock_registry::lookup(fl::lock_purpose(17)), std::invalid_argument);

  std::ostringstream os;
  os << fl::lock_purpose(17);
  EXPECT_EQ(os.str(), "lock_purpose(17)");
}

/**
 * @test Verify the streaming, comparison and hashing of fl::lock_identifier.
 */
TEST(lock_identifier, basic) {
  fl::lock_identifier a{42, "test"};
  fl::lock_identifier b{43, "test"};
  std::ostringstream os;
  os << a << " " << fl::lock_purpose::rpc_scheduler;
  EXPECT_EQ(os.str(), "test(42) rpc_scheduler");

  EXPECT_TRUE(a < b);
  EXPECT_FALSE(b < a);
  EXPECT_NE(a, b);

  std::unordered_set<fl::lock_identifier> set{a, b, a};
  EXPECT_EQ(set.size(), 2UL);
}
