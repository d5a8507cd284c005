#ifndef SHUFFLENET_MUTEX_H
#define SHUFFLENET_MUTEX_H

#include <mutex>
#include <shared_mutex>

// Clang thread safety annotations; no-ops with other compilers.
#if defined(__clang__) && (!defined(SWIG))
#define THREAD_ANNOTATION_ATTRIBUTE__(x) __attribute__((x))
#else
#define THREAD_ANNOTATION_ATTRIBUTE__(x)  // no-op
#endif

#define CAPABILITY(x) THREAD_ANNOTATION_ATTRIBUTE__(capability(x))

#define SCOPED_CAPABILITY THREAD_ANNOTATION_ATTRIBUTE__(scoped_lockable)

#define GUARDED_BY(x) THREAD_ANNOTATION_ATTRIBUTE__(guarded_by(x))

#define ACQUIRE(...) \
    THREAD_ANNOTATION_ATTRIBUTE__(acquire_capability(__VA_ARGS__))

#define ACQUIRE_SHARED(...) \
    THREAD_ANNOTATION_ATTRIBUTE__(acquire_shared_capability(__VA_ARGS__))

#define RELEASE(...) \
    THREAD_ANNOTATION_ATTRIBUTE__(release_capability(__VA_ARGS__))

#define RELEASE_SHARED(...) \
    THREAD_ANNOTATION_ATTRIBUTE__(release_shared_capability(__VA_ARGS__))

#define EXCLUDES(...) THREAD_ANNOTATION_ATTRIBUTE__(locks_excluded(__VA_ARGS__))

namespace shufflenet {

class CAPABILITY("mutex") Mutex {
   private:
    std::mutex mutex_;

   public:
    void lock() ACQUIRE() { mutex_.lock(); }

    void unlock() RELEASE() { mutex_.unlock(); }
};

class CAPABILITY("shared_mutex") SharedMutex {
   private:
    std::shared_mutex mutex_;

   public:
    void lock() ACQUIRE() { mutex_.lock(); }

    void lock_shared() ACQUIRE_SHARED() { mutex_.lock_shared(); }

    void unlock() RELEASE() { mutex_.unlock(); }

    void unlock_shared() RELEASE_SHARED() { mutex_.unlock_shared(); }
};

// Holds a Mutex for the lifetime of the scope.
class SCOPED_CAPABILITY MutexLocker {
   private:
    Mutex* mut;

   public:
    explicit MutexLocker(Mutex* mu) ACQUIRE(mu) : mut(mu) { mu->lock(); }

    ~MutexLocker() RELEASE() { mut->unlock(); }

    MutexLocker(const MutexLocker&) = delete;
    MutexLocker& operator=(const MutexLocker&) = delete;
};

// Tag type for selecting the shared constructor.
struct shared_lock_t {
} inline constexpr shared_lock = {};

// Holds a SharedMutex, exclusively or shared, for the lifetime of the scope.
class SCOPED_CAPABILITY SharedMutexLocker {
   private:
    SharedMutex* mut;
    bool is_exclusive;

   public:
    explicit SharedMutexLocker(SharedMutex* mu) ACQUIRE(mu)
        : mut(mu), is_exclusive(true) {
        mut->lock();
    }

    SharedMutexLocker(SharedMutex* mu, const shared_lock_t&) ACQUIRE_SHARED(mu)
        : mut(mu), is_exclusive(false) {
        mut->lock_shared();
    }

    ~SharedMutexLocker() RELEASE() {
        if (is_exclusive) {
            mut->unlock();
        } else {
            mut->unlock_shared();
        }
    }

    SharedMutexLocker(const SharedMutexLocker&) = delete;
    SharedMutexLocker& operator=(const SharedMutexLocker&) = delete;
};

}  // namespace shufflenet

#endif  // SHUFFLENET_MUTEX_H
