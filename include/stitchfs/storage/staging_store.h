#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "stitchfs/core/result.h"

namespace stitchfs::storage {

/// @brief A session directory as seen by the janitor.
struct StagedSession {
    std::string session_id;
    /// Seconds since the session directory was last modified.
    std::int64_t age_seconds{0};
};

/// @brief Keyed namespace holding per-session chunk files.
///
/// Paths are relative to the store's root ("{session}" or "{session}/chunk_{n}"); callers
/// build them with upload::PathNamer and never see the physical location.
class StagingStore {
public:
    virtual ~StagingStore() = default;

    /// Idempotent directory creation.
    virtual core::Result<void> EnsureDir(const std::string& path) = 0;
    /// Full-file replace; a concurrent reader sees either the old or the new bytes.
    virtual core::Result<void> WriteFile(const std::string& path, const std::string& bytes) = 0;
    /// Returns kNotFound when the file is absent.
    virtual core::Result<std::string> ReadFile(const std::string& path) const = 0;
    virtual bool Exists(const std::string& path) const = 0;
    /// Succeeds when the directory is already gone.
    virtual core::Result<void> RemoveDirRecursive(const std::string& path) = 0;
    virtual core::Result<std::vector<StagedSession>> ListSessions() const = 0;
};

}  // namespace stitchfs::storage
