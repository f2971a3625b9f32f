#include <fl/active_completion_queue.hpp>
#include <fl/leader_elector.hpp>
#include <fl/log.hpp>

#include <cctype>
#include <cstdlib>
#include <iostream>

/**
 * Check, once, if this process can take an advisory lock.
 *
 * Exits with 0 if the lock was acquired (it is released before exiting), 2 if somebody else holds it, and 1 on error.
 */
int main(int argc, char* argv[]) try {
  if (argc != 2 and argc != 3) {
    std::cerr << "Usage: " << argv[0] << " <purpose-name|lock-id> [etcd-address]" << std::endl;
    return 1;
  }
  std::string purpose = argv[1];
  char const* etcd_address = argc == 2 ? "localhost:2379" : argv[2];

  fl::log::instance().add_sink(fl::make_stream_sink(std::clog));

  // ... accept a catalog name or a raw numeric id ...
  fl::lock_identifier lock;
  if (not purpose.empty() and std::isdigit(static_cast<unsigned char>(purpose[0]))) {
    lock = fl::lock_identifier{std::stoll(purpose, nullptr, 0), "adhoc-" + purpose};
  } else {
    lock = fl::lock_registry::lookup(purpose);
  }

  auto etcd_channel = grpc::CreateChannel(etcd_address, grpc::InsecureChannelCredentials());
  auto queue = std::make_shared<fl::active_completion_queue>();
  fl::leader_elector elector(queue, etcd_channel, lock);
  bool acquired = elector.try_acquire_once();
  std::cout << lock << (acquired ? " acquired" : " held by another process") << std::endl;
  elector.stop();
  return acquired ? 0 : 2;
} catch (std::exception const& ex) {
  std::cerr << "std::exception raised: " << ex.what() << std::endl;
  return 1;
}
