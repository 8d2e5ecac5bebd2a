#pragma once
#include <istream>
#include <string>
#include "VRPInstance.h"

class InstanceParser {
public:
    // Throws std::runtime_error on a missing file or any malformed line.
    static VRPInstance parse(const std::string& filename);
    static VRPInstance parse(std::istream& in, const std::string& source_name);
};
