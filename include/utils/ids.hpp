#pragma once

#include <string>

namespace desk {

// Random version-4 UUID in canonical 8-4-4-4-12 form
std::string generate_uuid();

} // namespace desk
