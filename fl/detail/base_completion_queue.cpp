#include "fl/detail/base_completion_queue.hpp"
#include <fl/log.hpp>

#include <sstream>
#include <stdexcept>

namespace fl {
namespace detail {

std::chrono::milliseconds constexpr base_completion_queue::loop_timeout;

base_completion_queue::base_completion_queue()
    : mu_()
    , pending_ops_()
    , queue_()
    , shutdown_(false) {
}

base_completion_queue::~base_completion_queue() {
  auto names = pending_names();
  if (names.empty()) {
    return;
  }
  // ... the callbacks may refer to destroyed objects, they are dropped without a call ...
  std::ostringstream os;
  for (auto const& n : names) {
    os << " " << n;
  }
  FL_LOG(error) << "completion queue destroyed with " << names.size() << " pending operations:" << os.str();
}

void base_completion_queue::run() {
  while (not shutdown_.load()) {
    void* tag = nullptr;
    bool ok = false;
    auto status = queue_.AsyncNext(&tag, &ok, std::chrono::system_clock::now() + loop_timeout);
    if (status == grpc::CompletionQueue::SHUTDOWN) {
      FL_LOG(trace) << "completion queue drained, exit loop";
      return;
    }
    if (status == grpc::CompletionQueue::GOT_EVENT) {
      dispatch(tag, ok);
    }
  }
}

void base_completion_queue::shutdown() {
  FL_LOG(trace) << "completion queue shutdown with " << pending_count() << " pending operations";
  shutdown_.store(true);
  queue_.Shutdown();
}

std::size_t base_completion_queue::pending_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return pending_ops_.size();
}

std::vector<std::string> base_completion_queue::pending_names() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<std::string> names;
  names.reserve(pending_ops_.size());
  for (auto const& kv : pending_ops_) {
    names.push_back(kv.second->name);
  }
  return names;
}

void* base_completion_queue::register_op(char const* where, std::shared_ptr<base_async_op> op) {
  void* tag = op.get();
  FL_LOG(trace) << where << " posting " << op->name;
  std::lock_guard<std::mutex> lock(mu_);
  auto r = pending_ops_.emplace(tag, op);
  if (not r.second) {
    std::ostringstream os;
    os << where << " operation " << op->name << " is already pending";
    throw std::runtime_error(os.str());
  }
  return tag;
}

std::shared_ptr<base_async_op> base_completion_queue::unregister_op(void* tag) {
  std::lock_guard<std::mutex> lock(mu_);
  auto i = pending_ops_.find(tag);
  if (i == pending_ops_.end()) {
    return std::shared_ptr<base_async_op>();
  }
  auto op = std::move(i->second);
  pending_ops_.erase(i);
  return op;
}

void base_completion_queue::dispatch(void* tag, bool ok) {
  if (tag == nullptr) {
    FL_LOG(warning) << "completion queue reported a null tag, ignored";
    return;
  }
  // ... the lock is released before the callback runs, callbacks post new operations ...
  auto op = unregister_op(tag);
  if (not op) {
    FL_LOG(error) << "completion queue reported an unknown tag " << tag << ", ignored";
    return;
  }
  op->callback(*op, ok);
}

} // namespace detail
} // namespace fl
