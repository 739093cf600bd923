#include "stitchfs/http/download.h"

#include <charconv>

#include "stitchfs/upload/session_naming.h"

namespace stitchfs::http {

namespace {

bool ParseOffset(const std::string& text, std::uint64_t* out) {
    if (text.empty()) {
        return false;
    }
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, *out);
    return ec == std::errc() && ptr == end;
}

}  // namespace

std::optional<ByteRange> ParseByteRange(const std::string& header, std::uint64_t size) {
    constexpr const char kUnit[] = "bytes=";
    if (header.rfind(kUnit, 0) != 0 || size == 0) {
        return std::nullopt;
    }
    const auto ranges = header.substr(sizeof(kUnit) - 1);
    const auto dash = ranges.find('-');
    if (dash == std::string::npos || ranges.find(',') != std::string::npos) {
        return std::nullopt;
    }
    const auto first_text = ranges.substr(0, dash);
    const auto last_text = ranges.substr(dash + 1);

    ByteRange range;
    if (first_text.empty()) {
        // Suffix form: the final n bytes.
        std::uint64_t suffix = 0;
        if (!ParseOffset(last_text, &suffix) || suffix == 0) {
            return std::nullopt;
        }
        range.first = suffix >= size ? 0 : size - suffix;
        range.last = size - 1;
        return range;
    }

    if (!ParseOffset(first_text, &range.first) || range.first >= size) {
        return std::nullopt;
    }
    if (last_text.empty()) {
        range.last = size - 1;
    } else if (!ParseOffset(last_text, &range.last)) {
        return std::nullopt;
    }
    if (range.last >= size) {
        range.last = size - 1;
    }
    if (range.first > range.last) {
        return std::nullopt;
    }
    return range;
}

bool IsDownloadableName(const std::string& name) {
    return upload::IsPublishableName(name) && name.front() != '.' &&
           upload::SanitizeDestinationName(name) == name;
}

std::string DownloadPattern(const std::string& public_prefix) {
    std::string prefix = public_prefix;
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }
    return prefix + "/{name}";
}

}  // namespace stitchfs::http
