#include "fl/detail/elector_state_machine.hpp"
#include <fl/log.hpp>

namespace fl {
namespace detail {

std::ostream& operator<<(std::ostream& os, elector_state x) {
  switch (x) {
  case elector_state::idle:
    return os << "idle";
  case elector_state::polling:
    return os << "polling";
  case elector_state::leader:
    return os << "leader";
  case elector_state::stopping:
    return os << "stopping";
  case elector_state::stopped:
    return os << "stopped";
  }
  return os << "elector_state(" << int(x) << ")";
}

elector_state_machine::elector_state_machine()
    : mu_()
    , state_(elector_state::idle) {
}

elector_state elector_state_machine::current() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

bool elector_state_machine::change_state(char const* where, elector_state nstate) {
  std::lock_guard<std::mutex> lock(mu_);
  if (not check_change_state(nstate)) {
    FL_LOG(trace) << where << " rejected transition " << state_ << " -> " << nstate;
    return false;
  }
  FL_LOG(trace) << where << " transition " << state_ << " -> " << nstate;
  state_ = nstate;
  return true;
}

bool elector_state_machine::check_change_state(elector_state nstate) const {
  using s = elector_state;
  switch (state_) {
  case s::stopped:
    break;
  case s::stopping:
    return nstate == s::stopped;
  case s::leader:
    return nstate == s::polling or nstate == s::stopping;
  case s::polling:
    return nstate == s::leader or nstate == s::stopping;
  case s::idle:
    return nstate == s::polling or nstate == s::stopping;
  }
  return false;
}

} // namespace detail
} // namespace fl
