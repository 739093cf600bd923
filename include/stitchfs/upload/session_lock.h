#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace stitchfs::upload {

/// @brief In-process mutual exclusion keyed by session id.
///
/// Entries exist only while at least one guard for the id is alive, so the table does not
/// grow with the number of sessions ever seen.
class SessionLockTable {
public:
    class Guard {
    public:
        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&&) = delete;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        ~Guard();

    private:
        friend class SessionLockTable;
        Guard(SessionLockTable* table, std::string session_id, std::shared_ptr<std::mutex> mutex);

        SessionLockTable* table_{nullptr};
        std::string session_id_;
        std::shared_ptr<std::mutex> mutex_;
    };

    /// Blocks until the session's lock is free.
    Guard Acquire(const std::string& session_id);
    /// Number of ids with a live guard or waiter.
    std::size_t active_count() const;

private:
    void Release(const std::string& session_id, const std::shared_ptr<std::mutex>& mutex);

    mutable std::mutex table_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
};

}  // namespace stitchfs::upload
