#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "stitchfs/core/result.h"

namespace stitchfs::upload {

constexpr std::size_t kMaxSessionIdLength = 255;

/// @brief True when `session_id` has 1 to kMaxSessionIdLength characters, all in [A-Za-z0-9_-].
bool IsValidSessionId(const std::string& session_id);

/// @brief Parses a decimal chunk index; anything but plain ASCII digits is kInvalidChunkIndex.
core::Result<std::uint64_t> ParseChunkIndex(const std::string& text);

/// @brief Keeps only the final path segment of a caller-supplied file name.
///
/// Both '/' and '\' count as separators and trailing separators are ignored, so "dir/"
/// yields "dir". The result may be empty, "." or ".."; use
/// IsPublishableName() to reject those.
std::string SanitizeDestinationName(const std::string& name);
bool IsPublishableName(const std::string& name);

/// @brief Deterministic mapping from session/chunk keys to staging paths and from
/// destination names to public reference paths.
class PathNamer {
public:
    explicit PathNamer(std::string public_prefix = "/uploads");

    std::string SessionDir(const std::string& session_id) const;
    std::string ChunkPath(const std::string& session_id, std::uint64_t chunk_index) const;
    std::string PublicPath(const std::string& name) const;

private:
    std::string public_prefix_;
};

}  // namespace stitchfs::upload
