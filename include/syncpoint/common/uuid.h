#pragma once

#include <string>

namespace syncpoint {

/// Random (version 4) UUID in the canonical 8-4-4-4-12 hex form.
std::string GenerateUuid();

}  // namespace syncpoint
