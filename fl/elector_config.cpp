#include "fl/elector_config.hpp"

#include <sstream>
#include <stdexcept>

#include <limits.h>
#include <unistd.h>

namespace fl {

std::string elector_config::default_holder() {
  char hostname[HOST_NAME_MAX + 1] = {0};
  if (gethostname(hostname, sizeof(hostname) - 1) != 0) {
    hostname[0] = '\0';
  }
  std::ostringstream os;
  os << (hostname[0] == '\0' ? "unknown" : hostname) << ":" << getpid();
  return os.str();
}

void validate(elector_config const& config) {
  auto check_positive = [](std::chrono::milliseconds d, char const* name) {
    if (d.count() <= 0) {
      std::ostringstream os;
      os << "elector_config." << name << " must be positive, got " << d.count() << "ms";
      throw std::invalid_argument(os.str());
    }
  };
  check_positive(config.poll_interval, "poll_interval");
  check_positive(config.operation_timeout, "operation_timeout");
  check_positive(config.session_ttl, "session_ttl");
  if (config.session_ttl < std::chrono::seconds(1)) {
    std::ostringstream os;
    os << "elector_config.session_ttl must be at least 1s, got " << config.session_ttl.count() << "ms";
    throw std::invalid_argument(os.str());
  }
  if (config.key_prefix.empty()) {
    throw std::invalid_argument("elector_config.key_prefix must not be empty");
  }
}

std::ostream& operator<<(std::ostream& os, elector_config const& x) {
  return os << "{poll_interval=" << x.poll_interval.count() << "ms, operation_timeout=" << x.operation_timeout.count()
            << "ms, session_ttl=" << x.session_ttl.count() << "ms, key_prefix=" << x.key_prefix
            << ", holder=" << x.holder << "}";
}

std::ostream& operator<<(std::ostream& os, scheduler_mode x) {
  switch (x) {
  case scheduler_mode::always:
    return os << "always";
  case scheduler_mode::never:
    return os << "never";
  case scheduler_mode::when_elected:
    return os << "when_elected";
  }
  return os << "scheduler_mode(" << int(x) << ")";
}

scheduler_mode decide_scheduler_mode(scaling_config const& config) {
  if (config.disable_scheduler or config.worker_only) {
    return scheduler_mode::never;
  }
  if (config.enable_leader_election) {
    return scheduler_mode::when_elected;
  }
  return scheduler_mode::always;
}

} // namespace fl
