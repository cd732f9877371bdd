#pragma once

#include <string>

namespace sportsledger::util {

// Fresh record id: a random RFC 4122 version 4 UUID in lowercase
// 8-4-4-4-12 form. Ids carry no meaning and are never hashed.
std::string NewId();

} // namespace sportsledger::util
