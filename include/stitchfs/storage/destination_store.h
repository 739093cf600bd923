#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "stitchfs/core/result.h"

namespace stitchfs::storage {

/// @brief Sequential write handle for one assembled file.
///
/// Destroying a writer without CloseAndFlush() releases the handle; whatever was appended
/// so far stays behind unless the store publishes atomically.
class DestinationWriter {
public:
    virtual ~DestinationWriter() = default;

    virtual core::Result<void> Append(const std::string& bytes) = 0;
    /// Flushes to durable storage and closes. No further Append is allowed.
    virtual core::Result<void> CloseAndFlush() = 0;
    virtual std::uint64_t bytes_written() const = 0;
};

/// @brief Durable location for assembled files.
class DestinationStore {
public:
    virtual ~DestinationStore() = default;

    /// Opens `name` for sequential writing, truncating any existing file of that name.
    /// `name` must already be a single sanitized path segment.
    virtual core::Result<std::unique_ptr<DestinationWriter>> OpenAppendStream(
        const std::string& name) = 0;
    /// True when a writer that is not closed leaves nothing under the public name.
    virtual bool publishes_atomically() const { return false; }
};

}  // namespace stitchfs::storage
