#include "fl/log_sink.hpp"

#include <iostream>
#include <mutex>

namespace {
class function_sink : public fl::log_sink {
public:
  explicit function_sink(fl::log_function f)
      : f_(std::move(f)) {
  }

  void log(fl::severity sev, std::string&& message) override {
    f_(sev, std::move(message));
  }

private:
  fl::log_function f_;
};

class stream_sink : public fl::log_sink {
public:
  explicit stream_sink(std::ostream& os)
      : mu_()
      , os_(os) {
  }

  void log(fl::severity sev, std::string&& message) override {
    std::lock_guard<std::mutex> lock(mu_);
    os_ << message << "\n";
    if (sev >= fl::severity::warning) {
      os_.flush();
    }
  }

private:
  std::mutex mu_;
  std::ostream& os_;
};
} // anonymous namespace

namespace fl {

std::shared_ptr<log_sink> make_log_sink(log_function f) {
  return std::make_shared<function_sink>(std::move(f));
}

std::shared_ptr<log_sink> make_stream_sink(std::ostream& os) {
  return std::make_shared<stream_sink>(os);
}

} // namespace fl
