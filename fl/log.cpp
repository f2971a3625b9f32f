#include "fl/log.hpp"

#include <cstring>
#include <thread>

namespace fl {

log& log::instance() {
  static log core;
  return core;
}

void log::add_sink(std::shared_ptr<log_sink> sink) {
  std::lock_guard<std::mutex> guard(mu_);
  sinks_.push_back(std::move(sink));
}

void log::clear_sinks() {
  std::lock_guard<std::mutex> guard(mu_);
  sinks_.clear();
}

bool log::enabled(severity sev) const {
  std::lock_guard<std::mutex> guard(mu_);
  return not sinks_.empty() and sev >= min_severity_;
}

void log::write(severity sev, std::string&& msg) {
  std::vector<std::shared_ptr<log_sink>> sinks;
  {
    std::lock_guard<std::mutex> guard(mu_);
    if (sev < min_severity_) {
      return;
    }
    sinks = sinks_;
  }
  if (sinks.empty()) {
    return;
  }
  for (std::size_t i = 0; i + 1 < sinks.size(); ++i) {
    sinks[i]->log(sev, std::string(msg));
  }
  sinks.back()->log(sev, std::move(msg));
}

namespace detail {
log_line<false>::log_line(severity sev, char const* file, int lineno, log& core)
    : core_(core)
    , sev_(sev)
    , file_(file)
    , lineno_(lineno)
    , open_(core.enabled(sev))
    , os_() {
  if (open_) {
    os_ << "[" << sev_ << "] ";
  }
}

void log_line<false>::flush() {
  open_ = false;
  char const* base = std::strrchr(file_, '/');
  os_ << " @ " << (base == nullptr ? file_ : base + 1) << ":" << lineno_ << " [thread " << std::this_thread::get_id()
      << "]";
  core_.write(sev_, os_.str());
}
} // namespace detail

} // namespace fl
