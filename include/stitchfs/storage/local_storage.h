#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "stitchfs/core/result.h"
#include "stitchfs/storage/destination_store.h"
#include "stitchfs/storage/staging_store.h"

namespace stitchfs::storage {

/// @brief Staging store rooted at a local directory; chunk writes are atomic replaces.
class LocalStagingStore : public StagingStore {
public:
    explicit LocalStagingStore(std::string root);

    core::Result<void> EnsureDir(const std::string& path) override;
    core::Result<void> WriteFile(const std::string& path, const std::string& bytes) override;
    core::Result<std::string> ReadFile(const std::string& path) const override;
    bool Exists(const std::string& path) const override;
    core::Result<void> RemoveDirRecursive(const std::string& path) override;
    core::Result<std::vector<StagedSession>> ListSessions() const override;

    const std::string& root() const { return root_; }

private:
    std::filesystem::path Resolve(const std::string& path) const;

    std::string root_;
};

/// @brief Destination store writing assembled files into a local directory.
///
/// With `atomic_publish` the file is written under a hidden temporary name in the same
/// directory and renamed onto its public name by CloseAndFlush().
class LocalDestinationStore : public DestinationStore {
public:
    LocalDestinationStore(std::string root, bool atomic_publish);

    core::Result<std::unique_ptr<DestinationWriter>> OpenAppendStream(
        const std::string& name) override;

    /// Physical path of a published file, or kNotFound.
    core::Result<std::string> ResolveForRead(const std::string& name) const;

    const std::string& root() const { return root_; }
    bool publishes_atomically() const override { return atomic_publish_; }

private:
    std::string root_;
    bool atomic_publish_{false};
};

}  // namespace stitchfs::storage
