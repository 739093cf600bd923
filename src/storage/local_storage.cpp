#include "stitchfs/storage/local_storage.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>

#include <fcntl.h>
#include <unistd.h>

#include "stitchfs/core/ids.h"

namespace stitchfs::storage {

namespace {

core::Error IoError(const std::string& what) {
    return core::MakeError(core::ErrorCode::kIoError, what);
}

// Writes the whole buffer, retrying short writes and EINTR.
bool WriteAll(int fd, const char* data, std::size_t size) {
    std::size_t offset = 0;
    while (offset < size) {
        const ssize_t written = ::write(fd, data + offset, size - offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        offset += static_cast<std::size_t>(written);
    }
    return true;
}

class LocalDestinationWriter : public DestinationWriter {
public:
    LocalDestinationWriter(int fd, std::filesystem::path write_path,
                           std::filesystem::path final_path)
        : fd_(fd), write_path_(std::move(write_path)), final_path_(std::move(final_path)) {}

    ~LocalDestinationWriter() override {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        if (!published_ && write_path_ != final_path_) {
            std::error_code ec;
            std::filesystem::remove(write_path_, ec);
        }
    }

    LocalDestinationWriter(const LocalDestinationWriter&) = delete;
    LocalDestinationWriter& operator=(const LocalDestinationWriter&) = delete;

    core::Result<void> Append(const std::string& bytes) override {
        if (fd_ < 0) {
            return IoError("destination stream is closed");
        }
        if (!WriteAll(fd_, bytes.data(), bytes.size())) {
            return IoError("failed to write destination file: " +
                           std::string(std::strerror(errno)));
        }
        bytes_written_ += static_cast<std::uint64_t>(bytes.size());
        return core::Ok();
    }

    core::Result<void> CloseAndFlush() override {
        if (fd_ < 0) {
            return IoError("destination stream is closed");
        }
        const int fd = fd_;
        fd_ = -1;
        if (::fsync(fd) != 0) {
            const std::string reason = std::strerror(errno);
            ::close(fd);
            return IoError("failed to flush destination file: " + reason);
        }
        if (::close(fd) != 0) {
            return IoError("failed to close destination file: " +
                           std::string(std::strerror(errno)));
        }
        if (write_path_ != final_path_) {
            std::error_code ec;
            std::filesystem::rename(write_path_, final_path_, ec);
            if (ec) {
                return IoError("failed to publish destination file: " + ec.message());
            }
        }
        published_ = true;
        return core::Ok();
    }

    std::uint64_t bytes_written() const override { return bytes_written_; }

private:
    int fd_{-1};
    std::filesystem::path write_path_;
    std::filesystem::path final_path_;
    std::uint64_t bytes_written_{0};
    bool published_{false};
};

}  // namespace

LocalStagingStore::LocalStagingStore(std::string root) : root_(std::move(root)) {
    std::filesystem::create_directories(root_);
}

std::filesystem::path LocalStagingStore::Resolve(const std::string& path) const {
    return std::filesystem::path(root_) / path;
}

core::Result<void> LocalStagingStore::EnsureDir(const std::string& path) {
    std::error_code ec;
    std::filesystem::create_directories(Resolve(path), ec);
    if (ec) {
        return IoError("failed to create staging directory: " + ec.message());
    }
    return core::Ok();
}

core::Result<void> LocalStagingStore::WriteFile(const std::string& path,
                                                const std::string& bytes) {
    const auto final_path = Resolve(path);
    // Write next to the target, then rename over it so readers never see a torn chunk.
    const auto temp_path = final_path.parent_path() / core::GenerateTempName(".partial-");

    const int fd = ::open(temp_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
    if (fd < 0) {
        return IoError("failed to open temp chunk file: " + std::string(std::strerror(errno)));
    }
    if (!WriteAll(fd, bytes.data(), bytes.size())) {
        const std::string reason = std::strerror(errno);
        ::close(fd);
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
        return IoError("failed to write temp chunk file: " + reason);
    }
    const bool synced = ::fsync(fd) == 0;
    const bool closed = ::close(fd) == 0;
    if (!synced || !closed) {
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
        return IoError("failed to flush temp chunk file");
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, final_path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return IoError("failed to move chunk into place: " + ec.message());
    }
    return core::Ok();
}

core::Result<std::string> LocalStagingStore::ReadFile(const std::string& path) const {
    const auto file_path = Resolve(path);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file_path, ec)) {
        return core::MakeError(core::ErrorCode::kNotFound, "staged file not found");
    }
    const auto size = std::filesystem::file_size(file_path, ec);
    if (ec) {
        return IoError("failed to stat staged file: " + ec.message());
    }

    std::ifstream in(file_path, std::ios::binary);
    if (!in.is_open()) {
        return IoError("failed to open staged file");
    }
    std::string bytes(static_cast<std::size_t>(size), '\0');
    in.read(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (static_cast<std::uintmax_t>(in.gcount()) != size) {
        return IoError("short read on staged file");
    }
    return bytes;
}

bool LocalStagingStore::Exists(const std::string& path) const {
    std::error_code ec;
    return std::filesystem::exists(Resolve(path), ec);
}

core::Result<void> LocalStagingStore::RemoveDirRecursive(const std::string& path) {
    std::error_code ec;
    std::filesystem::remove_all(Resolve(path), ec);
    if (ec) {
        return IoError("failed to remove staging directory: " + ec.message());
    }
    return core::Ok();
}

core::Result<std::vector<StagedSession>> LocalStagingStore::ListSessions() const {
    std::error_code ec;
    std::filesystem::directory_iterator it(root_, ec);
    if (ec) {
        return IoError("failed to list staging root: " + ec.message());
    }

    const auto now = std::filesystem::file_time_type::clock::now();
    std::vector<StagedSession> sessions;
    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_directory(entry_ec)) {
            continue;
        }
        const auto modified = entry.last_write_time(entry_ec);
        if (entry_ec) {
            // Removed between listing and stat.
            continue;
        }
        StagedSession session;
        session.session_id = entry.path().filename().string();
        session.age_seconds =
            std::chrono::duration_cast<std::chrono::seconds>(now - modified).count();
        sessions.push_back(std::move(session));
    }
    return sessions;
}

LocalDestinationStore::LocalDestinationStore(std::string root, bool atomic_publish)
    : root_(std::move(root)), atomic_publish_(atomic_publish) {
    std::filesystem::create_directories(root_);
}

core::Result<std::unique_ptr<DestinationWriter>> LocalDestinationStore::OpenAppendStream(
    const std::string& name) {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        return IoError("failed to create destination root: " + ec.message());
    }

    const auto final_path = std::filesystem::path(root_) / name;
    const auto write_path =
        atomic_publish_ ? std::filesystem::path(root_) / core::GenerateTempName(".assembling-")
                        : final_path;

    const int fd = ::open(write_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
    if (fd < 0) {
        return IoError("failed to open destination file: " + std::string(std::strerror(errno)));
    }
    std::unique_ptr<DestinationWriter> writer(
        new LocalDestinationWriter(fd, write_path, final_path));
    return core::Result<std::unique_ptr<DestinationWriter>>(std::move(writer));
}

core::Result<std::string> LocalDestinationStore::ResolveForRead(const std::string& name) const {
    const auto path = std::filesystem::path(root_) / name;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return core::MakeError(core::ErrorCode::kNotFound, "file not found");
    }
    return path.string();
}

}  // namespace stitchfs::storage
