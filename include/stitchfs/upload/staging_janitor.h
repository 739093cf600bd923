#pragma once

#include <cstdint>
#include <memory>

#include "stitchfs/storage/staging_store.h"
#include "stitchfs/upload/session_lock.h"
#include "stitchfs/upload/session_naming.h"

namespace stitchfs::upload {

/// @brief Reaps staging directories of sessions that were never finalized.
class StagingJanitor {
public:
    StagingJanitor(std::shared_ptr<storage::StagingStore> staging,
                   std::shared_ptr<SessionLockTable> locks, std::int64_t max_session_age_seconds,
                   int max_sessions_per_sweep);

    /// @brief Removes sessions idle longer than the configured age.
    /// @return number of sessions removed in this sweep.
    int Sweep();

private:
    std::shared_ptr<storage::StagingStore> staging_;
    std::shared_ptr<SessionLockTable> locks_;
    PathNamer namer_;
    std::int64_t max_session_age_seconds_{86400};
    int max_sessions_per_sweep_{200};
};

}  // namespace stitchfs::upload
