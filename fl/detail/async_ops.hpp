#ifndef fl_detail_async_ops_hpp
#define fl_detail_async_ops_hpp
/**
 * @file
 *
 * Define the operations posted to a fl::completion_queue<>.
 *
 * Each operation owns everything gRPC writes to while it is pending: the context, the request and response buffers,
 * the status.  The queue keeps the operation alive until its tag is delivered, then calls its callback once with the
 * result, and drops it.  A callback that needs the results later must copy them.
 */

#include <grpc++/alarm.h>
#include <grpc++/grpc++.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>

namespace fl {
namespace detail {

/// The common part of all the operations.
struct base_async_op {
  virtual ~base_async_op() {
  }

  /// Called once, from the queue thread, with ok == false if the operation was cancelled or failed.
  std::function<void(base_async_op&, bool)> callback;

  /// For logging, the mocked tests also use it to tell operations apart, e.g. "elector/poll_timer".
  std::string name;
};

/**
 * A one-shot timer.
 *
 * The elector polls on a chain of these, the session renews its lease on another.
 */
struct deadline_timer : public base_async_op {
  /**
   * Cancel the timer.
   *
   * A cancelled timer is still delivered, with ok == false, from the queue thread.
   */
  void cancel() {
    if (alarm_) {
      alarm_->Cancel();
    }
  }

  std::chrono::system_clock::time_point deadline;

private:
  friend struct default_grpc_interceptor;
  std::unique_ptr<grpc::Alarm> alarm_;
};

/// Extract the request and response types from the signature of a PrepareAsyncFoo() member function.
template <typename M>
struct unary_rpc_traits {
  using matches = std::false_type;
};

template <typename W, typename R>
struct unary_rpc_traits<std::unique_ptr<grpc::ClientAsyncResponseReader<R>>(
    grpc::ClientContext*, W const&, grpc::CompletionQueue*)> {
  using matches = std::true_type;
  using request_type = W;
  using response_type = R;
};

/**
 * A unary RPC, e.g. a KV Txn or a LeaseGrant.
 *
 * The callback gets ok == true even if the RPC failed, @c status has the result of the call.
 */
template <typename W, typename R>
struct unary_rpc_op : public base_async_op {
  grpc::ClientContext context;
  W request;
  R response;
  grpc::Status status;
  std::unique_ptr<grpc::ClientAsyncResponseReader<R>> rpc;
};

/// Write one message to a bi-directional stream.
template <typename W>
struct write_op : public base_async_op {
  W request;
};

/// Read one message from a bi-directional stream.
template <typename R>
struct read_op : public base_async_op {
  R response;
};

/// A bi-directional stream, only the lease KeepAlive stream is used.
template <typename W, typename R>
struct async_rdwr_stream {
  grpc::ClientContext context;
  std::unique_ptr<grpc::ClientAsyncReaderWriter<W, R>> client;

  using write_op = ::fl::detail::write_op<W>;
  using read_op = ::fl::detail::read_op<R>;
};

/// Extract the message types from the signature of an AsyncFoo() member function that starts a stream.
template <typename M>
struct rdwr_stream_traits {
  using matches = std::false_type;
};

template <typename W, typename R>
struct rdwr_stream_traits<std::unique_ptr<grpc::ClientAsyncReaderWriter<W, R>>(
    grpc::ClientContext*, grpc::CompletionQueue*, void*)> {
  using matches = std::true_type;
  using write_type = W;
  using read_type = R;
  using stream_type = async_rdwr_stream<W, R>;
};

/// Start a bi-directional stream, the callback receives the stream in @c stream.
template <typename W, typename R>
struct create_rdwr_stream_op : public base_async_op {
  create_rdwr_stream_op()
      : stream(std::make_shared<async_rdwr_stream<W, R>>()) {
  }
  std::shared_ptr<async_rdwr_stream<W, R>> stream;
};

/// Close a stream and receive its final status.
struct finish_op : public base_async_op {
  grpc::Status status;
};

} // namespace detail
} // namespace fl

#endif // fl_detail_async_ops_hpp
