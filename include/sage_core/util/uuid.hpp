#pragma once

#include <string>

namespace sage_core {

// Random (version 4) UUID in canonical lowercase form, e.g.
// "3f2504e0-4f89-41d3-9a0c-0305e82c3301"
std::string generate_uuid_v4();

}  // namespace sage_core
