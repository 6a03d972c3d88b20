#pragma once

#include <string>

namespace stroll {

    // Random (version 4) UUID in canonical 8-4-4-4-12 hex form.
    std::string GenerateUuid();

}
