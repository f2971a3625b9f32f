#include "fl/lock_identifier.hpp"

#include <sstream>
#include <stdexcept>

namespace fl {

namespace {
lock_purpose const catalog[] = {
    lock_purpose::jobs_scheduler, lock_purpose::functions_scheduler, lock_purpose::rpc_scheduler,
};

/// The catalog name of @a x, nullptr if @a x is not a known purpose.
char const* purpose_name(lock_purpose x) {
  switch (x) {
  case lock_purpose::jobs_scheduler:
    return "jobs_scheduler";
  case lock_purpose::functions_scheduler:
    return "functions_scheduler";
  case lock_purpose::rpc_scheduler:
    return "rpc_scheduler";
  }
  return nullptr;
}
} // anonymous namespace

std::int64_t constexpr lock_registry::namespace_prefix;

std::ostream& operator<<(std::ostream& os, lock_identifier const& x) {
  return os << x.name << "(" << x.id << ")";
}

std::ostream& operator<<(std::ostream& os, lock_purpose x) {
  auto name = purpose_name(x);
  if (name == nullptr) {
    return os << "lock_purpose(" << int(x) << ")";
  }
  return os << name;
}

lock_identifier lock_registry::lookup(lock_purpose purpose) {
  auto name = purpose_name(purpose);
  if (name == nullptr) {
    std::ostringstream os;
    os << "unknown " << purpose;
    throw std::invalid_argument(os.str());
  }
  // ... the low word starts at 1, zero is easy to confuse with an uninitialized id ...
  return lock_identifier{(namespace_prefix << 32) + int(purpose) + 1, name};
}

lock_identifier lock_registry::lookup(std::string const& name) {
  for (auto purpose : catalog) {
    if (name == purpose_name(purpose)) {
      return lookup(purpose);
    }
  }
  std::ostringstream os;
  os << "unknown lock purpose <" << name << ">, expected one of:";
  for (auto purpose : catalog) {
    os << " " << purpose;
  }
  throw std::invalid_argument(os.str());
}

std::vector<lock_identifier> lock_registry::all() {
  std::vector<lock_identifier> result;
  for (auto purpose : catalog) {
    result.push_back(lookup(purpose));
  }
  return result;
}

} // namespace fl
