#include "fl/leader_elector.hpp"
#include <fl/detail/leader_elector_impl.hpp>
#include <fl/detail/session_impl.hpp>

#include <sstream>
#include <stdexcept>

namespace {
std::string loop_name(fl::lock_identifier const& lock) {
  std::ostringstream os;
  os << "elector[" << lock << "]";
  return os.str();
}
} // anonymous namespace

namespace fl {
leader_elector::leader_elector(
    std::shared_ptr<active_completion_queue> queue, std::shared_ptr<grpc::Channel> etcd_channel,
    lock_identifier lock, elector_config config)
    : queue_(std::move(queue))
    , channel_(std::move(etcd_channel))
    , loop_(loop_name(lock))
    , impl_() {
  auto const ttl = config.session_ttl;
  auto const timeout = config.operation_timeout;
  auto make_session = [q = queue_, c = channel_, ttl, timeout]() {
    return std::unique_ptr<session>(new detail::session_impl<completion_queue<>>(
        q->cq(), etcdserverpb::Lease::NewStub(c), ttl, timeout));
  };
  impl_.reset(new detail::leader_elector_impl<completion_queue<>>(
      loop_.cq(), queue_->cq(), etcdserverpb::KV::NewStub(channel_), std::move(make_session), std::move(lock),
      std::move(config)));
}

leader_elector::~leader_elector() noexcept(false) {
}

void leader_elector::start(callback_type on_become_leader, callback_type on_lose_leadership) {
  impl_->start(std::move(on_become_leader), std::move(on_lose_leadership));
}

void leader_elector::stop() {
  // ... stop() waits for the running poll, which would be waiting for the caller ...
  if (loop_.in_loop_thread()) {
    std::ostringstream os;
    os << "stop() called from a transition callback for " << impl_->lock();
    throw std::runtime_error(os.str());
  }
  impl_->stop();
}
} // namespace fl
