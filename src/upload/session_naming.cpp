#include "stitchfs/upload/session_naming.h"

#include <cctype>
#include <limits>

namespace stitchfs::upload {

bool IsValidSessionId(const std::string& session_id) {
    if (session_id.empty() || session_id.size() > kMaxSessionIdLength) {
        return false;
    }
    for (char c : session_id) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_')) {
            return false;
        }
    }
    return true;
}

core::Result<std::uint64_t> ParseChunkIndex(const std::string& text) {
    if (text.empty()) {
        return core::MakeError(core::ErrorCode::kInvalidChunkIndex, "chunk index is required");
    }
    constexpr auto kMax = std::numeric_limits<std::uint64_t>::max();
    std::uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return core::MakeError(core::ErrorCode::kInvalidChunkIndex,
                                   "chunk index must be a non-negative integer");
        }
        const auto digit = static_cast<std::uint64_t>(c - '0');
        if (value > (kMax - digit) / 10) {
            return core::MakeError(core::ErrorCode::kInvalidChunkIndex,
                                   "chunk index out of range");
        }
        value = value * 10 + digit;
    }
    return value;
}

std::string SanitizeDestinationName(const std::string& name) {
    // Trailing separators do not start a new segment: "out.bin/" names "out.bin".
    const auto end = name.find_last_not_of("/\\");
    if (end == std::string::npos) {
        return "";
    }
    const auto trimmed = name.substr(0, end + 1);
    const auto pos = trimmed.find_last_of("/\\");
    if (pos == std::string::npos) {
        return trimmed;
    }
    return trimmed.substr(pos + 1);
}

bool IsPublishableName(const std::string& name) {
    if (name.empty() || name.size() > 255) {
        return false;
    }
    if (name == "." || name == "..") {
        return false;
    }
    return name.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
}

PathNamer::PathNamer(std::string public_prefix) : public_prefix_(std::move(public_prefix)) {
    while (!public_prefix_.empty() && public_prefix_.back() == '/') {
        public_prefix_.pop_back();
    }
}

std::string PathNamer::SessionDir(const std::string& session_id) const { return session_id; }

std::string PathNamer::ChunkPath(const std::string& session_id,
                                 std::uint64_t chunk_index) const {
    return session_id + "/chunk_" + std::to_string(chunk_index);
}

std::string PathNamer::PublicPath(const std::string& name) const {
    return public_prefix_ + "/" + name;
}

}  // namespace stitchfs::upload
