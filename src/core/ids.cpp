#include "stitchfs/core/ids.h"

#include <Poco/UUIDGenerator.h>

namespace stitchfs::core {

std::string GenerateRequestId() {
    return Poco::UUIDGenerator().createOne().toString();
}

std::string GenerateTempName(const std::string& prefix) {
    return prefix + Poco::UUIDGenerator().createRandom().toString();
}

}  // namespace stitchfs::core
