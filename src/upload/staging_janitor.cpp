#include "stitchfs/upload/staging_janitor.h"

#include <optional>
#include <string>

#include "stitchfs/core/logger.h"
#include "stitchfs/observability/metrics.h"

namespace stitchfs::upload {

StagingJanitor::StagingJanitor(std::shared_ptr<storage::StagingStore> staging,
                               std::shared_ptr<SessionLockTable> locks,
                               std::int64_t max_session_age_seconds, int max_sessions_per_sweep)
    : staging_(std::move(staging)),
      locks_(std::move(locks)),
      max_session_age_seconds_(max_session_age_seconds),
      max_sessions_per_sweep_(max_sessions_per_sweep) {}

int StagingJanitor::Sweep() {
    auto sessions = staging_->ListSessions();
    if (!sessions.ok()) {
        core::LogError("Janitor sweep failed to list sessions: " + sessions.error().message);
        return 0;
    }

    int reaped = 0;
    for (const auto& session : sessions.value()) {
        if (reaped >= max_sessions_per_sweep_) {
            break;
        }
        if (session.age_seconds <= max_session_age_seconds_) {
            continue;
        }
        // Skip foreign entries that could never have been created by the receiver.
        if (!IsValidSessionId(session.session_id)) {
            continue;
        }

        std::optional<SessionLockTable::Guard> guard;
        if (locks_) {
            guard.emplace(locks_->Acquire(session.session_id));
        }
        // A finalize may have consumed the session while we waited for the lock.
        if (!staging_->Exists(namer_.SessionDir(session.session_id))) {
            continue;
        }
        auto removed = staging_->RemoveDirRecursive(namer_.SessionDir(session.session_id));
        if (!removed.ok()) {
            observability::RecordCleanupWarning();
            core::LogWarning("Janitor could not remove session " + session.session_id + ": " +
                             removed.error().message);
            continue;
        }
        ++reaped;
        core::LogInfo("Janitor reaped abandoned session " + session.session_id + " (idle " +
                      std::to_string(session.age_seconds) + "s)");
    }

    if (reaped > 0) {
        observability::RecordSessionsReaped(static_cast<std::uint64_t>(reaped));
    }
    return reaped;
}

}  // namespace stitchfs::upload
