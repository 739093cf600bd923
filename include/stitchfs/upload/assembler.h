#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "stitchfs/core/result.h"
#include "stitchfs/storage/destination_store.h"
#include "stitchfs/storage/staging_store.h"
#include "stitchfs/upload/session_lock.h"
#include "stitchfs/upload/session_naming.h"

namespace stitchfs::upload {

/// @brief Caller's request to assemble a session into one file.
struct FinalizeRequest {
    std::string session_id;
    std::string destination_name;
    /// Caller's claim; every index below it must be staged.
    std::int64_t total_chunks{0};
};

/// @brief Outcome of a successful finalize.
struct AssembledFile {
    /// Public reference path, e.g. "/uploads/out.bin".
    std::string path;
    std::uint64_t size_bytes{0};
    std::string sha256;
};

/// @brief Streams a session's chunks in index order into the destination store and
/// reclaims the session's staging directory.
///
/// Once the session is found, its staging directory is removed whatever the outcome. A
/// failed assembly does not roll back bytes already written to the destination unless the
/// destination store publishes atomically. Finalize must be called at most once per session;
/// with a lock table, concurrent calls for one session are serialized and the later call
/// reports kSessionNotFound.
class Assembler {
public:
    /// @param locks optional; nullptr disables per-session serialization.
    Assembler(std::shared_ptr<storage::StagingStore> staging,
              std::shared_ptr<storage::DestinationStore> destination, PathNamer namer,
              int max_chunks, std::shared_ptr<SessionLockTable> locks);

    core::Result<AssembledFile> Finalize(const FinalizeRequest& request);

    int max_chunks() const { return max_chunks_; }

private:
    core::Result<AssembledFile> StreamChunks(const std::string& session_id,
                                             const std::string& name,
                                             std::int64_t total_chunks);
    void CleanupSession(const std::string& session_id);

    std::shared_ptr<storage::StagingStore> staging_;
    std::shared_ptr<storage::DestinationStore> destination_;
    PathNamer namer_;
    int max_chunks_{1000};
    std::shared_ptr<SessionLockTable> locks_;
};

}  // namespace stitchfs::upload
