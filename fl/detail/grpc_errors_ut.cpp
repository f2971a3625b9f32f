#include "fl/detail/grpc_errors.hpp"
#include <etcd/etcdserver/etcdserverpb/rpc.pb.h>

#include <gtest/gtest.h>

#include <sstream>

/**
 * @test Verify that check_grpc_status does not throw on success.
 */
TEST(grpc_errors, check_grpc_status_ok) {
  ASSERT_NO_THROW(fl::detail::check_grpc_status(grpc::Status::OK, "advisory_lock/try_acquire"));
}

/**
 * @test Verify the exception raised for a failed status.
 */
TEST(grpc_errors, check_grpc_status_error) {
  grpc::Status status(grpc::DEADLINE_EXCEEDED, "too slow");
  try {
    fl::detail::check_grpc_status(status, "advisory_lock/release");
    FAIL() << "expected an exception";
  } catch (fl::detail::grpc_error const& ex) {
    EXPECT_EQ(std::string(ex.what()), "advisory_lock/release failed: too slow [DEADLINE_EXCEEDED]");
    EXPECT_EQ(ex.code(), grpc::DEADLINE_EXCEEDED);
  }
  EXPECT_THROW(
      fl::detail::check_grpc_status(grpc::Status(grpc::UNAVAILABLE, "refused"), "session/revoke/lease_revoke"),
      std::runtime_error);
}

/**
 * @test Verify the names of the status codes.
 */
TEST(grpc_errors, status_code_name) {
  using fl::detail::status_code_name;
  EXPECT_STREQ(status_code_name(grpc::OK), "OK");
  EXPECT_STREQ(status_code_name(grpc::UNAVAILABLE), "UNAVAILABLE");
  EXPECT_STREQ(status_code_name(grpc::UNAUTHENTICATED), "UNAUTHENTICATED");
  EXPECT_STREQ(status_code_name(grpc::StatusCode(1000)), "UNKNOWN_CODE");
}

/**
 * @test Verify that print_to_stream prints the message on a single line.
 */
TEST(grpc_errors, print_to_stream) {
  etcdserverpb::PutRequest req;
  req.set_key("fluxlock/advisory/000000000000002a");
  req.set_lease(7);

  std::ostringstream os;
  os << fl::detail::print_to_stream(req);
  EXPECT_EQ(os.str(), "key: \"fluxlock/advisory/000000000000002a\" lease: 7");
}
