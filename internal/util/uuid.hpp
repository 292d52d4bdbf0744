#pragma once

#include <string>

namespace roster::util {

// Random RFC4122 v4 id in canonical text form. Used for claim and
// failed-attempt ids.
std::string NewId();

} // namespace roster::util
