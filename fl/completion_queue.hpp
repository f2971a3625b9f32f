#ifndef fl_completion_queue_hpp
#define fl_completion_queue_hpp

#include <fl/detail/async_ops.hpp>
#include <fl/detail/base_completion_queue.hpp>
#include <fl/detail/default_grpc_interceptor.hpp>
#include <fl/detail/grpc_errors.hpp>

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace fl {

/// A struct to indicate the APIs should return futures instead of invoking a callback.
struct use_future {};

/**
 * Wrap a gRPC completion queue.
 *
 * The grpc::CompletionQueue is not much of an abstraction.  This wrapper makes it easier to write asynchronous
 * operations that call functors (lambdas, std::function<>, etc) when the operation completes, or that return a
 * std::shared_future<> for callers that prefer to block.
 *
 * @tparam grpc_interceptor_t mediate all calls to the gRPC library.  The default inlines all the calls, the main
 * reason to change it is to mock the gRPC++ APIs in tests.
 */
template <typename grpc_interceptor_t = detail::default_grpc_interceptor>
class completion_queue : public detail::base_completion_queue {
public:
  //@{
  /// @name type traits
  using grpc_interceptor_type = grpc_interceptor_t;
  //@}

  explicit completion_queue(grpc_interceptor_type interceptor = grpc_interceptor_type())
      : detail::base_completion_queue()
      , interceptor_(std::move(interceptor)) {
  }

  grpc_interceptor_type& interceptor() {
    return interceptor_;
  }

  /**
   * Call the functor when the deadline timer expires.
   *
   * The functor receives (detail::deadline_timer const&, bool ok), @a ok is false if the timer was cancelled.
   */
  template <typename Functor>
  std::shared_ptr<detail::deadline_timer>
  make_deadline_timer(std::chrono::system_clock::time_point deadline, std::string name, Functor&& f) {
    auto op = create_op<detail::deadline_timer>(std::move(name), std::forward<Functor>(f));
    void* tag = register_op("make_deadline_timer()", op);
    op->deadline = deadline;
    interceptor_.make_deadline_timer(op, cq(), tag);
    return op;
  }

  /// Call the functor N units of time from now.
  template <typename duration_type, typename Functor>
  std::shared_ptr<detail::deadline_timer> make_relative_timer(duration_type duration, std::string name, Functor&& f) {
    auto deadline = std::chrono::system_clock::now() + duration;
    return make_deadline_timer(deadline, std::move(name), std::forward<Functor>(f));
  }

  /**
   * Cancel a timer created by this queue.
   *
   * The timer functor is still called, with ok == false, unless the timer had already fired.
   */
  void cancel_timer(std::shared_ptr<detail::deadline_timer> timer) {
    interceptor_.cancel_deadline_timer(std::move(timer));
  }

  /**
   * Start an asynchronous unary RPC call and invoke a functor with the results.
   *
   * For a stub member function such as etcdserverpb::KV::Stub::AsyncTxn the functor receives:
   *
   * @code
   * detail::unary_rpc_op<etcdserverpb::TxnRequest, etcdserverpb::TxnResponse> const& op, bool ok
   * @endcode
   *
   * The request and response types are deduced from the member function signature.  The RPC fails with
   * DEADLINE_EXCEEDED if it does not complete before @a deadline, the status is reported in op.status.
   */
  template <typename C, typename M, typename W, typename Functor>
  void async_rpc(
      C* async_client, M C::*call, W&& request, std::chrono::system_clock::time_point deadline, std::string name,
      Functor&& f) {
    using requirements = detail::unary_rpc_traits<M>;
    static_assert(
        requirements::matches::value, "The member function signature does not match: "
                                      "std::unique_ptr<grpc::ClientResponseReader<R>>("
                                      "grpc::ClientContext*,W const&,grpc::CompletionQueue*)");
    using request_type = typename requirements::request_type;
    using response_type = typename requirements::response_type;
    static_assert(
        std::is_same<typename std::decay<W>::type, request_type>::value,
        "Mismatch request parameter type vs. operation signature");

    using op_type = detail::unary_rpc_op<request_type, response_type>;
    auto op = create_op<op_type>(std::move(name), std::forward<Functor>(f));
    void* tag = register_op("async_rpc()", op);
    op->request.Swap(&request);
    op->context.set_deadline(deadline);
    interceptor_.async_rpc(async_client, call, op, cq(), tag);
  }

  /**
   * Start an asynchronous unary RPC call and return a future to wait until it completes.
   *
   * The future holds the response when the RPC succeeds.  It holds a std::runtime_error if the operation is cancelled
   * or if the RPC returns a non-OK status, including when the deadline expires.
   */
  template <typename C, typename M, typename W>
  std::shared_future<typename detail::unary_rpc_traits<M>::response_type> async_rpc(
      C* async_client, M C::*call, W&& request, std::chrono::system_clock::time_point deadline, std::string name,
      use_future) {
    using response_type = typename detail::unary_rpc_traits<M>::response_type;
    auto promise = std::make_shared<std::promise<response_type>>();
    this->async_rpc(
        async_client, call, std::forward<W>(request), deadline, std::move(name), [promise](auto const& op, bool ok) {
          if (not ok) {
            promise->set_exception(std::make_exception_ptr(std::runtime_error(op.name + " cancelled")));
            return;
          }
          try {
            detail::check_grpc_status(op.status, op.name);
          } catch (std::runtime_error const&) {
            promise->set_exception(std::current_exception());
            return;
          }
          // ... protobufs are copied, op is a const& ...
          promise->set_value(op.response);
        });
    return promise->get_future().share();
  }

  /**
   * Create a new asynchronous read-write stream and call the functor when it is constructed and ready.
   *
   * The functor receives std::shared_ptr<detail::async_rdwr_stream<Request, Response>> and the @a ok flag.
   */
  template <typename C, typename M, typename Functor>
  void async_create_rdwr_stream(C* async_client, M C::*call, std::string name, Functor&& f) {
    using requirements = detail::rdwr_stream_traits<M>;
    static_assert(
        requirements::matches::value, "The member function signature does not match: "
                                      "std::unique_ptr<grpc::ClientAsyncReaderWriter<W, R>>("
                                      "grpc::ClientContext*,grpc::CompletionQueue*,void*)");
    using write_type = typename requirements::write_type;
    using read_type = typename requirements::read_type;

    using op_type = detail::create_rdwr_stream_op<write_type, read_type>;
    auto op = std::make_shared<op_type>();
    op->callback = [functor = std::forward<Functor>(f)](detail::base_async_op & bop, bool ok) {
      auto& op = dynamic_cast<op_type&>(bop);
      functor(op.stream, ok);
    };
    op->name = std::move(name);
    void* tag = register_op("async_create_rdwr_stream()", op);
    interceptor_.async_create_rdwr_stream(async_client, call, op, cq(), tag);
  }

  /// Start the creation of a new asynchronous read-write stream and return a future to wait until it is ready.
  template <typename C, typename M>
  std::shared_future<std::shared_ptr<typename detail::rdwr_stream_traits<M>::stream_type>>
  async_create_rdwr_stream(C* async_client, M C::*call, std::string name, use_future) {
    using ret_type = std::shared_ptr<typename detail::rdwr_stream_traits<M>::stream_type>;
    auto promise = std::make_shared<std::promise<ret_type>>();
    this->async_create_rdwr_stream(async_client, call, std::move(name), [promise](auto stream, bool ok) {
      if (not ok) {
        promise->set_exception(std::make_exception_ptr(std::runtime_error("async create_rdwr_stream cancelled")));
        return;
      }
      promise->set_value(std::move(stream));
    });
    return promise->get_future().share();
  }

  /// Make an asynchronous call to Write() and call the functor when it is completed.
  template <typename W, typename R, typename Functor>
  void async_write(detail::async_rdwr_stream<W, R>& stream, W&& request, std::string name, Functor&& f) {
    auto op = create_op<detail::write_op<W>>(std::move(name), std::forward<Functor>(f));
    void* tag = register_op("async_write()", op);
    op->request.Swap(&request);
    interceptor_.async_write(stream, op, tag);
  }

  /// Make an asynchronous call to Read() and call the functor when it is completed.
  template <typename W, typename R, typename Functor>
  void async_read(detail::async_rdwr_stream<W, R>& stream, std::string name, Functor&& f) {
    auto op = create_op<detail::read_op<R>>(std::move(name), std::forward<Functor>(f));
    void* tag = register_op("async_read()", op);
    interceptor_.async_read(stream, op, tag);
  }

  /// Make an asynchronous call to Finish() and return a future with the final status of the stream.
  template <typename W, typename R>
  std::shared_future<grpc::Status> async_finish(detail::async_rdwr_stream<W, R>& stream, std::string name, use_future) {
    auto promise = std::make_shared<std::promise<grpc::Status>>();
    auto op = create_op<detail::finish_op>(std::move(name), [promise](auto const& op, bool ok) {
      if (not ok) {
        promise->set_exception(std::make_exception_ptr(std::runtime_error("async finish cancelled")));
        return;
      }
      promise->set_value(op.status);
    });
    void* tag = register_op("async_finish()", op);
    interceptor_.async_finish(stream, op, tag);
    return promise->get_future().share();
  }

  /// Cancel all pending operations on a stream, they complete with ok == false.
  template <typename W, typename R>
  void try_cancel_on(detail::async_rdwr_stream<W, R>& stream) {
    interceptor_.try_cancel(stream);
  }

private:
  /// The interceptor to catch all interactions with the underlying grpc::CompletionQueue.
  grpc_interceptor_type interceptor_;
};

} // namespace fl

#endif // fl_completion_queue_hpp
