#ifndef fl_detail_base_completion_queue_hpp
#define fl_detail_base_completion_queue_hpp

#include <fl/detail/async_ops.hpp>

#include <grpc++/grpc++.h>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace fl {
namespace detail {
/// A helper class for testing.
struct base_completion_queue_test_only;

/**
 * The non-template part of fl::completion_queue<>.
 *
 * Owns the grpc::CompletionQueue, runs its event loop, and keeps every posted operation alive until gRPC reports it
 * back through its tag.  The tag is the address of the operation.
 */
class base_completion_queue {
public:
  /// How often the loop wakes up to check for shutdown().
  static std::chrono::milliseconds constexpr loop_timeout{50};

  base_completion_queue();
  virtual ~base_completion_queue();

  /// Run the event loop in the calling thread until shutdown().
  void run();

  /**
   * Stop the event loop.
   *
   * Operations still pending are not delivered, their owners must cancel them and wait before calling this.
   */
  void shutdown();

  /// The number of operations posted but not yet delivered.
  std::size_t pending_count() const;

  /// The names of the operations posted but not yet delivered, for troubleshooting.
  std::vector<std::string> pending_names() const;

protected:
  friend struct ::fl::detail::base_completion_queue_test_only;
  grpc::CompletionQueue* cq() {
    return &queue_;
  }

  /// Create an operation whose callback receives the concrete @a op_type.
  template <typename op_type, typename Functor>
  std::shared_ptr<op_type> create_op(std::string name, Functor&& f) const {
    auto op = std::make_shared<op_type>();
    op->name = std::move(name);
    op->callback = [functor = std::move(f)](base_async_op & bop, bool ok) {
      functor(dynamic_cast<op_type const&>(bop), ok);
    };
    return op;
  }

  /**
   * Keep @a op alive until its completion is delivered.
   *
   * @return the tag to pass to gRPC.
   * @throws std::runtime_error if the operation is already pending.
   */
  void* register_op(char const* where, std::shared_ptr<base_async_op> op);

  /// Remove the operation for @a tag from the pending set, null if the tag is unknown.
  std::shared_ptr<base_async_op> unregister_op(void* tag);

private:
  /// Deliver one event from the queue to its operation.
  void dispatch(void* tag, bool ok);

private:
  mutable std::mutex mu_;
  std::map<void*, std::shared_ptr<base_async_op>> pending_ops_;

  grpc::CompletionQueue queue_;
  std::atomic<bool> shutdown_;
};
} // namespace detail
} // namespace fl

#endif // fl_detail_base_completion_queue_hpp
