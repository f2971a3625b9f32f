#include <fl/active_completion_queue.hpp>
#include <fl/elector_config.hpp>
#include <fl/leader_elector.hpp>
#include <fl/lock_identifier.hpp>
#include <fl/log.hpp>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>
#include <vector>

namespace {
volatile std::sig_atomic_t interrupt = 0;
extern "C" void signal_handler(int sig) {
  interrupt = 1;
}

/// Return the value of an environment variable, or @a default_value if it is not set.
std::string env_or(char const* name, std::string const& default_value) {
  char const* value = std::getenv(name);
  return value == nullptr ? default_value : std::string(value);
}

bool env_flag(char const* name) {
  auto value = env_or(name, "");
  return value == "1" or value == "true" or value == "yes";
}

void usage(char const* argv0) {
  std::cerr << "Usage: " << argv0
            << " [--endpoint=<etcd-address>] [--enable-leader-election] [--disable-scheduler] [--worker-only]"
            << " [--poll-interval-ms=<n>] [--holder=<text>] [--log-level=<severity>]\n"
            << "  the FLUXLOCK_ETCD_ENDPOINT, FLUXLOCK_ENABLE_LEADER_ELECTION, FLUXLOCK_DISABLE_SCHEDULER,"
            << " FLUXLOCK_WORKER_ONLY, FLUXLOCK_POLL_INTERVAL_MS and FLUXLOCK_LOG_LEVEL environment variables set the"
            << " defaults"
            << std::endl;
}

/// Run the singleton duty for one purpose, this demo only logs.
class scheduler {
public:
  explicit scheduler(fl::lock_identifier lock)
      : lock_(std::move(lock)) {
  }
  void resume() {
    FL_LOG(info) << "scheduler " << lock_ << " running";
  }
  void pause() {
    FL_LOG(info) << "scheduler " << lock_ << " paused";
  }

private:
  fl::lock_identifier lock_;
};
} // anonymous namespace

int main(int argc, char* argv[]) try {
  using namespace std::chrono_literals;

  std::string etcd_address = env_or("FLUXLOCK_ETCD_ENDPOINT", "localhost:2379");
  fl::scaling_config scaling;
  scaling.enable_leader_election = env_flag("FLUXLOCK_ENABLE_LEADER_ELECTION");
  scaling.disable_scheduler = env_flag("FLUXLOCK_DISABLE_SCHEDULER");
  scaling.worker_only = env_flag("FLUXLOCK_WORKER_ONLY");
  fl::elector_config config;
  config.poll_interval = std::chrono::milliseconds(std::stol(env_or("FLUXLOCK_POLL_INTERVAL_MS", "5000")));
  auto log_level = fl::parse_severity(env_or("FLUXLOCK_LOG_LEVEL", "info"));

  // ... the command line wins over the environment ...
  for (int i = 1; i != argc; ++i) {
    std::string arg = argv[i];
    auto value = [&arg]() { return arg.substr(arg.find('=') + 1); };
    if (arg.rfind("--endpoint=", 0) == 0) {
      etcd_address = value();
    } else if (arg == "--enable-leader-election") {
      scaling.enable_leader_election = true;
    } else if (arg == "--disable-scheduler") {
      scaling.disable_scheduler = true;
    } else if (arg == "--worker-only") {
      scaling.worker_only = true;
    } else if (arg.rfind("--poll-interval-ms=", 0) == 0) {
      config.poll_interval = std::chrono::milliseconds(std::stol(value()));
    } else if (arg.rfind("--log-level=", 0) == 0) {
      log_level = fl::parse_severity(value());
    } else if (arg.rfind("--holder=", 0) == 0) {
      config.holder = value();
    } else {
      usage(argv[0]);
      return 1;
    }
  }
  fl::validate(config);

  fl::log::instance().add_sink(fl::make_stream_sink(std::clog));
  fl::log::instance().min_severity(log_level);

  auto mode = fl::decide_scheduler_mode(scaling);
  FL_LOG(info) << "scheduler mode is " << mode;

  std::vector<std::unique_ptr<scheduler>> schedulers;
  for (auto const& lock : fl::lock_registry::all()) {
    schedulers.emplace_back(new scheduler(lock));
  }

  auto queue = std::make_shared<fl::active_completion_queue>();
  std::vector<std::unique_ptr<fl::leader_elector>> electors;
  if (mode == fl::scheduler_mode::always) {
    for (auto& s : schedulers) {
      s->resume();
    }
  } else if (mode == fl::scheduler_mode::when_elected) {
    auto etcd_channel = grpc::CreateChannel(etcd_address, grpc::InsecureChannelCredentials());
    auto locks = fl::lock_registry::all();
    for (std::size_t i = 0; i != locks.size(); ++i) {
      auto* s = schedulers[i].get();
      electors.emplace_back(new fl::leader_elector(queue, etcd_channel, locks[i], config));
      electors.back()->start([s]() { s->resume(); }, [s]() { s->pause(); });
    }
  }

  std::signal(SIGINT, &signal_handler);
  std::signal(SIGTERM, &signal_handler);

  // ... wait until the user interrupts the program ...
  while (interrupt == 0) {
    std::this_thread::sleep_for(20ms);
  }

  FL_LOG(info) << "shutting down";
  for (auto& e : electors) {
    e->stop();
  }
  for (auto& s : schedulers) {
    s->pause();
  }
  return 0;
} catch (std::exception const& ex) {
  std::cerr << "std::exception raised: " << ex.what() << std::endl;
  return 1;
}
