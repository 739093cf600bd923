#include "stitchfs/upload/chunk_receiver.h"

#include "stitchfs/core/logger.h"
#include "stitchfs/observability/metrics.h"

namespace stitchfs::upload {

ChunkReceiver::ChunkReceiver(std::shared_ptr<storage::StagingStore> staging, PathNamer namer)
    : staging_(std::move(staging)), namer_(std::move(namer)) {}

core::Result<void> ChunkReceiver::Receive(const std::string& session_id,
                                          const std::string& chunk_index,
                                          const std::string& payload) {
    if (!IsValidSessionId(session_id)) {
        return core::MakeError(core::ErrorCode::kInvalidSessionId, "invalid upload id");
    }
    auto index = ParseChunkIndex(chunk_index);
    if (!index.ok()) {
        return index.error();
    }
    if (payload.empty()) {
        return core::MakeError(core::ErrorCode::kMissingPayload, "chunk payload is required");
    }

    auto dir = staging_->EnsureDir(namer_.SessionDir(session_id));
    if (!dir.ok()) {
        core::LogError("Chunk staging failed for session " + session_id + ": " +
                       dir.error().message);
        return core::Error{core::ErrorCode::kStorageWriteFailed, "failed to store chunk",
                           dir.error().code};
    }
    auto written = staging_->WriteFile(namer_.ChunkPath(session_id, index.value()), payload);
    if (!written.ok()) {
        core::LogError("Chunk write failed for session " + session_id + " chunk " +
                       std::to_string(index.value()) + ": " + written.error().message);
        return core::Error{core::ErrorCode::kStorageWriteFailed, "failed to store chunk",
                           written.error().code};
    }

    observability::RecordChunkReceived(static_cast<std::uint64_t>(payload.size()));
    core::LogDebug("Stored chunk " + std::to_string(index.value()) + " for session " +
                   session_id + " (" + std::to_string(payload.size()) + " bytes)");
    return core::Ok();
}

}  // namespace stitchfs::upload
