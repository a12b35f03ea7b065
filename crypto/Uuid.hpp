#pragma once

#include <string>

namespace geotrack {

class Uuid {
public:
    /// Random (version 4) UUID in canonical 8-4-4-4-12 lowercase form.
    static std::string generateV4();

    static bool isCanonical(const std::string& value);
};

} // namespace geotrack
