#ifndef fl_detail_mocked_grpc_interceptor_hpp
#define fl_detail_mocked_grpc_interceptor_hpp

#include <fl/detail/async_ops.hpp>

#include <gmock/gmock.h>
#include <grpc++/grpc++.h>

#include <memory>

namespace fl {
namespace detail {

/**
 * A gRPC interceptor that forwards every operation to a gmock object instead of gRPC++.
 *
 * Tests set expectations on @c shared_mock, typically matching the operation by name, and complete the operation by
 * filling its response (or status) and invoking op->callback(*op, ok), either immediately or later.  Nothing is ever
 * posted to the grpc::CompletionQueue, and the stubs are never dereferenced, tests use null stubs.
 */
struct mocked_grpc_interceptor {
  /// The mocked operations, each receives the operation as its base class.
  struct mocked {
    MOCK_CONST_METHOD1(make_deadline_timer, void(std::shared_ptr<base_async_op> op));
    MOCK_CONST_METHOD1(cancel_deadline_timer, void(std::shared_ptr<base_async_op> op));
    MOCK_CONST_METHOD1(async_rpc, void(std::shared_ptr<base_async_op> op));
    MOCK_CONST_METHOD1(async_create_rdwr_stream, void(std::shared_ptr<base_async_op> op));
    MOCK_CONST_METHOD1(async_write, void(std::shared_ptr<base_async_op> op));
    MOCK_CONST_METHOD1(async_read, void(std::shared_ptr<base_async_op> op));
    MOCK_CONST_METHOD1(async_finish, void(std::shared_ptr<base_async_op> op));
    MOCK_CONST_METHOD0(try_cancel, void());
  };

  mocked_grpc_interceptor()
      : shared_mock(std::make_shared<mocked>()) {
  }

  void make_deadline_timer(std::shared_ptr<deadline_timer> const& timer, grpc::CompletionQueue*, void*) {
    shared_mock->make_deadline_timer(timer);
  }
  void cancel_deadline_timer(std::shared_ptr<deadline_timer> const& timer) {
    shared_mock->cancel_deadline_timer(timer);
  }

  template <typename C, typename M, typename W, typename R>
  void async_rpc(C*, M C::*, std::shared_ptr<unary_rpc_op<W, R>> const& op, grpc::CompletionQueue*, void*) {
    shared_mock->async_rpc(op);
  }

  template <typename C, typename M, typename W, typename R>
  void async_create_rdwr_stream(
      C*, M C::*, std::shared_ptr<create_rdwr_stream_op<W, R>> const& op, grpc::CompletionQueue*, void*) {
    shared_mock->async_create_rdwr_stream(op);
  }

  template <typename W, typename R>
  void async_write(async_rdwr_stream<W, R>&, std::shared_ptr<write_op<W>> const& op, void*) {
    shared_mock->async_write(op);
  }
  template <typename W, typename R>
  void async_read(async_rdwr_stream<W, R>&, std::shared_ptr<read_op<R>> const& op, void*) {
    shared_mock->async_read(op);
  }
  template <typename W, typename R>
  void async_finish(async_rdwr_stream<W, R>&, std::shared_ptr<finish_op> const& op, void*) {
    shared_mock->async_finish(op);
  }

  template <typename W, typename R>
  void try_cancel(async_rdwr_stream<W, R>&) {
    shared_mock->try_cancel();
  }

  /// Shared, so the tests can set expectations after the interceptor is copied into the queue.
  std::shared_ptr<mocked> shared_mock;
};

} // namespace detail
} // namespace fl

#endif // fl_detail_mocked_grpc_interceptor_hpp
