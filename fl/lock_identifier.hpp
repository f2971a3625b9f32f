#ifndef fl_lock_identifier_hpp
#define fl_lock_identifier_hpp

#include <cstdint>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

namespace fl {

/**
 * Identify one advisory lock in the shared lock namespace.
 *
 * The @c id is the key into the backing store, the @c name is only used for logging.  Reusing an id for two unrelated
 * purposes is a configuration error, use fl::lock_registry for the purposes known to the application.
 */
struct lock_identifier {
  std::int64_t id;
  std::string name;
};

inline bool operator==(lock_identifier const& lhs, lock_identifier const& rhs) {
  return lhs.id == rhs.id and lhs.name == rhs.name;
}
inline bool operator!=(lock_identifier const& lhs, lock_identifier const& rhs) {
  return not(lhs == rhs);
}
inline bool operator<(lock_identifier const& lhs, lock_identifier const& rhs) {
  return lhs.id < rhs.id or (lhs.id == rhs.id and lhs.name < rhs.name);
}

/// Streaming operator, prints "name(id)".
std::ostream& operator<<(std::ostream& os, lock_identifier const& x);

/// The singleton duties of the host service that are protected by a leader election.
enum class lock_purpose {
  jobs_scheduler,
  functions_scheduler,
  rpc_scheduler,
};

/// The streaming operator for @c lock_purpose, prints the purpose name.
std::ostream& operator<<(std::ostream& os, lock_purpose x);

/**
 * The fixed catalog of advisory lock identifiers.
 *
 * All identifiers share the 0x464C5558 ("FLUX") high word, so they never collide with ad-hoc ids picked by other
 * applications that share the lock namespace.  The low word is the position of the purpose in the catalog, never
 * renumber an existing entry.
 */
class lock_registry {
public:
  /// The high 32 bits of every identifier in the catalog.
  static std::int64_t constexpr namespace_prefix = 0x464C5558;

  /**
   * Return the identifier for a purpose.
   *
   * @throws std::invalid_argument if @a purpose is not one of the enumerators.
   */
  static lock_identifier lookup(lock_purpose purpose);

  /**
   * Return the identifier for a purpose given its name, e.g. "jobs_scheduler".
   *
   * @throws std::invalid_argument if @a purpose_name is not in the catalog.
   */
  static lock_identifier lookup(std::string const& purpose_name);

  /// All the identifiers in the catalog.
  static std::vector<lock_identifier> all();
};

} // namespace fl

namespace std {
template <>
struct hash<fl::lock_identifier> {
  std::size_t operator()(fl::lock_identifier const& x) const {
    return std::hash<std::int64_t>()(x.id);
  }
};
} // namespace std

#endif // fl_lock_identifier_hpp
