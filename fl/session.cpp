#include "fl/session.hpp"

namespace fl {
session::~session() noexcept(false) {
}
} // namespace fl
