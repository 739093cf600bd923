#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace stitchfs::http {

/// @brief Inclusive byte range within a file.
struct ByteRange {
    std::uint64_t first{0};
    std::uint64_t last{0};

    std::uint64_t length() const { return last - first + 1; }
};

/// @brief Parses a single `Range: bytes=...` value against a file of `size` bytes.
///
/// Accepts "a-b", "a-" and the suffix form "-n". An end past the file is clamped.
/// Returns nullopt for multi-range, other units, or an unsatisfiable range.
std::optional<ByteRange> ParseByteRange(const std::string& header, std::uint64_t size);

/// @brief True when `name` could have been published by the assembler.
///
/// Hidden names are refused so in-flight `.assembling-*` files are never served.
bool IsDownloadableName(const std::string& name);

/// @brief Route template for downloads, e.g. "/uploads/{name}".
std::string DownloadPattern(const std::string& public_prefix);

}  // namespace stitchfs::http
