#include "stitchfs/upload/assembler.h"

#include <memory>
#include <optional>

#include <openssl/evp.h>
#include <Poco/DigestEngine.h>

#include "stitchfs/core/logger.h"
#include "stitchfs/observability/metrics.h"

namespace stitchfs::upload {

Assembler::Assembler(std::shared_ptr<storage::StagingStore> staging,
                     std::shared_ptr<storage::DestinationStore> destination, PathNamer namer,
                     int max_chunks, std::shared_ptr<SessionLockTable> locks)
    : staging_(std::move(staging)),
      destination_(std::move(destination)),
      namer_(std::move(namer)),
      max_chunks_(max_chunks),
      locks_(std::move(locks)) {}

core::Result<AssembledFile> Assembler::Finalize(const FinalizeRequest& request) {
    if (request.total_chunks < 1 || request.total_chunks > max_chunks_) {
        return core::MakeError(core::ErrorCode::kInvalidChunkCount,
                               "totalChunks must be between 1 and " +
                                   std::to_string(max_chunks_));
    }
    if (!IsValidSessionId(request.session_id)) {
        return core::MakeError(core::ErrorCode::kInvalidSessionId, "invalid upload id");
    }
    const auto name = SanitizeDestinationName(request.destination_name);
    if (!IsPublishableName(name)) {
        return core::MakeError(core::ErrorCode::kInvalidDestinationName, "invalid file name");
    }

    std::optional<SessionLockTable::Guard> guard;
    if (locks_) {
        guard.emplace(locks_->Acquire(request.session_id));
    }

    if (!staging_->Exists(namer_.SessionDir(request.session_id))) {
        return core::MakeError(core::ErrorCode::kSessionNotFound, "upload session not found");
    }

    auto assembled = StreamChunks(request.session_id, name, request.total_chunks);
    CleanupSession(request.session_id);

    if (!assembled.ok()) {
        core::LogError("Assembly failed for session " + request.session_id + " into " + name +
                       ": " + assembled.error().message);
        observability::RecordFinalize(false);
        return core::Error{core::ErrorCode::kAssemblyFailed,
                           destination_->publishes_atomically()
                               ? "assembly failed; no file was published"
                               : "assembly failed; the destination file may be incomplete",
                           assembled.error().code};
    }

    observability::RecordFinalize(true);
    core::LogInfo("Assembled session " + request.session_id + " into " + name + " (" +
                  std::to_string(request.total_chunks) + " chunks, " +
                  std::to_string(assembled.value().size_bytes) + " bytes)");
    return assembled;
}

core::Result<AssembledFile> Assembler::StreamChunks(const std::string& session_id,
                                                    const std::string& name,
                                                    std::int64_t total_chunks) {
    auto opened = destination_->OpenAppendStream(name);
    if (!opened.ok()) {
        return opened.error();
    }
    auto& writer = opened.value();

    using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
    DigestContext sha256(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!sha256 || EVP_DigestInit_ex(sha256.get(), EVP_sha256(), nullptr) != 1) {
        return core::MakeError(core::ErrorCode::kInternal, "failed to initialize sha256");
    }
    for (std::int64_t i = 0; i < total_chunks; ++i) {
        const auto index = static_cast<std::uint64_t>(i);
        auto chunk = staging_->ReadFile(namer_.ChunkPath(session_id, index));
        if (!chunk.ok()) {
            if (chunk.code() == core::ErrorCode::kNotFound) {
                return core::MakeError(core::ErrorCode::kMissingChunk,
                                       "missing chunk " + std::to_string(index));
            }
            return chunk.error();
        }
        auto appended = writer->Append(chunk.value());
        if (!appended.ok()) {
            return appended.error();
        }
        if (EVP_DigestUpdate(sha256.get(), chunk.value().data(), chunk.value().size()) != 1) {
            return core::MakeError(core::ErrorCode::kInternal, "failed to update sha256");
        }
    }

    auto closed = writer->CloseAndFlush();
    if (!closed.ok()) {
        return closed.error();
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(sha256.get(), digest, &digest_len) != 1) {
        return core::MakeError(core::ErrorCode::kInternal, "failed to finalize sha256");
    }

    AssembledFile file;
    file.path = namer_.PublicPath(name);
    file.size_bytes = writer->bytes_written();
    file.sha256 = Poco::DigestEngine::digestToHex(
        Poco::DigestEngine::Digest(digest, digest + digest_len));
    return file;
}

void Assembler::CleanupSession(const std::string& session_id) {
    auto removed = staging_->RemoveDirRecursive(namer_.SessionDir(session_id));
    if (!removed.ok()) {
        observability::RecordCleanupWarning();
        core::LogWarning("Orphaned staging data for session " + session_id + ": " +
                         removed.error().message);
    }
}

}  // namespace stitchfs::upload
