#include "fl/elector.hpp"

namespace fl {
elector::~elector() noexcept(false) {
}
} // namespace fl
