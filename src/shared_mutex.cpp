#include "mcpgate/shared_mutex.hpp"

namespace mcpgate {

void SharedMutex::lock() {
    std::unique_lock<std::mutex> lock(mutex_);
    ++waiting_writers_;
    writers_cv_.wait(lock, [this] {
        return !writer_active_ && active_readers_ == 0;
    });
    --waiting_writers_;
    writer_active_ = true;
}

bool SharedMutex::try_lock() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (writer_active_ || active_readers_ > 0) return false;
    writer_active_ = true;
    return true;
}

void SharedMutex::unlock() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        writer_active_ = false;
    }
    // Wake everyone: a waiting writer takes priority through the reader predicate.
    writers_cv_.notify_one();
    readers_cv_.notify_all();
}

void SharedMutex::lock_shared() {
    std::unique_lock<std::mutex> lock(mutex_);
    readers_cv_.wait(lock, [this] {
        return !writer_active_ && waiting_writers_ == 0;
    });
    ++active_readers_;
}

bool SharedMutex::try_lock_shared() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (writer_active_ || waiting_writers_ > 0) return false;
    ++active_readers_;
    return true;
}

void SharedMutex::unlock_shared() {
    bool last = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last = --active_readers_ == 0;
    }
    if (last) writers_cv_.notify_one();
}

} // namespace mcpgate
