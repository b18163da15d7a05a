#pragma once

#include <cstddef>
#include <string>

namespace agentwire::ids {

// RFC 4122 version 4 identifier, lower-case hex with dashes
std::string uuid_v4();

// Random [0-9a-z] string, used for turn ids in logs
std::string short_id(size_t length = 8);

}  // namespace agentwire::ids
