#include "fl/detail/async_op_counter.hpp"
#include <fl/log.hpp>

#include <sstream>
#include <stdexcept>

namespace fl {
namespace detail {

bool async_op_counter::async_op_start(char const* name) {
  std::lock_guard<std::mutex> lock(mu_);
  if (shutdown_) {
    FL_LOG(trace) << "async_op_start(" << name << ") rejected, shutting down";
    return false;
  }
  ++pending_[name];
  FL_LOG(trace) << "async_op_start(" << name << ")";
  return true;
}

void async_op_counter::async_op_done(char const* name) {
  std::unique_lock<std::mutex> lock(mu_);
  auto i = pending_.find(name);
  if (i == pending_.end()) {
    std::ostringstream os;
    os << "async_op_done(" << name << ") without a matching async_op_start()";
    throw std::logic_error(os.str());
  }
  if (--i->second == 0) {
    pending_.erase(i);
  }
  FL_LOG(trace) << "async_op_done(" << name << ")";
  if (pending_.empty()) {
    lock.unlock();
    cv_.notify_all();
  }
}

void async_op_counter::shutdown() {
  std::lock_guard<std::mutex> lock(mu_);
  shutdown_ = true;
}

int async_op_counter::pending() const {
  std::lock_guard<std::mutex> lock(mu_);
  int count = 0;
  for (auto const& kv : pending_) {
    count += kv.second;
  }
  return count;
}

void async_op_counter::block_until_all_done() {
  std::unique_lock<std::mutex> lock(mu_);
  shutdown_ = true;
  for (auto const& kv : pending_) {
    FL_LOG(trace) << "waiting for " << kv.second << " x " << kv.first;
  }
  cv_.wait(lock, [this]() { return pending_.empty(); });
}

} // namespace detail
} // namespace fl
