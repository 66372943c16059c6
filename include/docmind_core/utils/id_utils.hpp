#pragma once

#include <string>

namespace docmind_core {

// Random RFC 4122 version 4 UUID in canonical 8-4-4-4-12 form
std::string generate_uuid_v4();

}  // namespace docmind_core
