#include "stitchfs/upload/session_lock.h"

namespace stitchfs::upload {

SessionLockTable::Guard::Guard(SessionLockTable* table, std::string session_id,
                               std::shared_ptr<std::mutex> mutex)
    : table_(table), session_id_(std::move(session_id)), mutex_(std::move(mutex)) {}

SessionLockTable::Guard::Guard(Guard&& other) noexcept
    : table_(other.table_),
      session_id_(std::move(other.session_id_)),
      mutex_(std::move(other.mutex_)) {
    other.table_ = nullptr;
}

SessionLockTable::Guard::~Guard() {
    if (table_ && mutex_) {
        table_->Release(session_id_, mutex_);
    }
}

SessionLockTable::Guard SessionLockTable::Acquire(const std::string& session_id) {
    std::shared_ptr<std::mutex> mutex;
    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        auto& slot = locks_[session_id];
        if (!slot) {
            slot = std::make_shared<std::mutex>();
        }
        mutex = slot;
    }
    // Waiters hold a reference, which keeps the entry alive until they are done.
    mutex->lock();
    return Guard(this, session_id, std::move(mutex));
}

std::size_t SessionLockTable::active_count() const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    return locks_.size();
}

void SessionLockTable::Release(const std::string& session_id,
                               const std::shared_ptr<std::mutex>& mutex) {
    mutex->unlock();
    std::lock_guard<std::mutex> lock(table_mutex_);
    auto it = locks_.find(session_id);
    // One reference in the table, one in the releasing guard.
    if (it != locks_.end() && it->second == mutex && mutex.use_count() == 2) {
        locks_.erase(it);
    }
}

}  // namespace stitchfs::upload
