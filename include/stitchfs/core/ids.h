#pragma once

#include <string>

namespace stitchfs::core {

/// @brief Generate a unique request ID for correlation.
std::string GenerateRequestId();
/// @brief Generate a unique name for temporary files (chunk replacement, atomic publish).
std::string GenerateTempName(const std::string& prefix);

}  // namespace stitchfs::core
