#include "fl/active_completion_queue.hpp"
#include <fl/log.hpp>

namespace fl {

active_completion_queue::active_completion_queue(std::string name)
    : name_(std::move(name))
    , queue_(std::make_shared<completion_queue<>>())
    , thread_() {
  // ... the thread holds its own reference, the loop may outlive a failed constructor ...
  thread_ = std::thread([q = queue_]() { q->run(); });
  FL_LOG(trace) << name_ << " loop thread started";
}

active_completion_queue::~active_completion_queue() {
  queue_->shutdown();
  if (thread_.joinable()) {
    thread_.join();
  }
  FL_LOG(trace) << name_ << " loop thread joined";
}

} // namespace fl
