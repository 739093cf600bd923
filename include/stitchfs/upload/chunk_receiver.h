#pragma once

#include <memory>
#include <string>

#include "stitchfs/core/result.h"
#include "stitchfs/storage/staging_store.h"
#include "stitchfs/upload/session_naming.h"

namespace stitchfs::upload {

/// @brief Validates and persists one chunk of one upload session.
///
/// All validation happens before the staging store is touched. Re-sending a chunk
/// replaces the previous bytes for that index.
class ChunkReceiver {
public:
    ChunkReceiver(std::shared_ptr<storage::StagingStore> staging, PathNamer namer);

    /// @param chunk_index decimal text as received from the transport.
    core::Result<void> Receive(const std::string& session_id, const std::string& chunk_index,
                               const std::string& payload);

private:
    std::shared_ptr<storage::StagingStore> staging_;
    PathNamer namer_;
};

}  // namespace stitchfs::upload
