#ifndef fl_detail_default_grpc_interceptor_hpp
#define fl_detail_default_grpc_interceptor_hpp

#include <fl/detail/async_ops.hpp>

#include <grpc++/grpc++.h>

#include <memory>

namespace fl {
namespace detail {

/**
 * The production gRPC interceptor: post each operation to the real grpc::CompletionQueue.
 *
 * fl::completion_queue<> routes every interaction with gRPC++ through its interceptor, the unit tests replace this
 * one with fl::detail::mocked_grpc_interceptor and play the part of the etcd server.
 */
struct default_grpc_interceptor {
  void make_deadline_timer(std::shared_ptr<deadline_timer> const& timer, grpc::CompletionQueue* cq, void* tag) {
    timer->alarm_.reset(new grpc::Alarm(cq, timer->deadline, tag));
  }

  /// The queue still delivers the timer, with ok == false, unless it already fired.
  void cancel_deadline_timer(std::shared_ptr<deadline_timer> const& timer) {
    timer->cancel();
  }

  /// Start a unary RPC, its completion (with any error in op->status) is delivered through @a tag.
  template <typename C, typename M, typename W, typename R>
  void async_rpc(
      C* stub, M C::*call, std::shared_ptr<unary_rpc_op<W, R>> const& op, grpc::CompletionQueue* cq, void* tag) {
    op->rpc = (stub->*call)(&op->context, op->request, cq);
    op->rpc->Finish(&op->response, &op->status, tag);
  }

  template <typename C, typename M, typename W, typename R>
  void async_create_rdwr_stream(
      C* stub, M C::*call, std::shared_ptr<create_rdwr_stream_op<W, R>> const& op, grpc::CompletionQueue* cq,
      void* tag) {
    op->stream->client = (stub->*call)(&op->stream->context, cq, tag);
  }

  template <typename W, typename R>
  void async_write(async_rdwr_stream<W, R>& stream, std::shared_ptr<write_op<W>> const& op, void* tag) {
    stream.client->Write(op->request, tag);
  }

  template <typename W, typename R>
  void async_read(async_rdwr_stream<W, R>& stream, std::shared_ptr<read_op<R>> const& op, void* tag) {
    stream.client->Read(&op->response, tag);
  }

  template <typename W, typename R>
  void async_finish(async_rdwr_stream<W, R>& stream, std::shared_ptr<finish_op> const& op, void* tag) {
    stream.client->Finish(&op->status, tag);
  }

  /// Abort the stream, its pending Write() and Read() complete with ok == false.
  template <typename W, typename R>
  void try_cancel(async_rdwr_stream<W, R>& stream) {
    stream.context.TryCancel();
  }
};

} // namespace detail
} // namespace fl

#endif // fl_detail_default_grpc_interceptor_hpp
