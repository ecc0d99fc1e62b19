#pragma once
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace mcpgate {

/// Readers-writer lock that prefers writers: once a writer is waiting, new
/// readers queue behind it. Meets the SharedMutex requirements, so it works
/// with std::shared_lock and std::unique_lock.
class SharedMutex {
public:
    SharedMutex() = default;
    SharedMutex(const SharedMutex&) = delete;
    SharedMutex& operator=(const SharedMutex&) = delete;

    void lock();
    bool try_lock();
    void unlock();

    void lock_shared();
    bool try_lock_shared();
    void unlock_shared();

private:
    std::mutex mutex_;
    std::condition_variable readers_cv_;
    std::condition_variable writers_cv_;
    size_t active_readers_{0};
    size_t waiting_writers_{0};
    bool writer_active_{false};
};

} // namespace mcpgate
