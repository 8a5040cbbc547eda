#ifndef LOCK_HPP
#define LOCK_HPP

// Mutual exclusion for state read by several tasks. The firmware passes a
// FreeRtosLock; host tests pass their own.
class Lock {
public:
    virtual ~Lock() {}
    virtual void lock() = 0;
    virtual void unlock() = 0;
};

class LockGuard {
public:
    explicit LockGuard(Lock& lock_in) : held(lock_in) { held.lock(); }
    ~LockGuard() { held.unlock(); }

    LockGuard(const LockGuard&) = delete;
    LockGuard& operator=(const LockGuard&) = delete;

private:
    Lock& held;
};

#endif // LOCK_HPP
