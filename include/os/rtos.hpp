#pragma once
#include <cstddef> // Required for size_t
#include <cstdint>

namespace Rtos {

// Timeouts are expressed in milliseconds.
static constexpr uint32_t NO_WAIT     = 0;
static constexpr uint32_t MAX_TIMEOUT = 0xFFFFFFFFu;

void SleepMs(int ms);

// Monotonic time in microseconds
uint64_t NowUs();

//== Task abstraction ==//
class Task {
public:
    Task();
    ~Task();

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    bool Create(const char* name, void (*fn)(void*), void* arg);
    void Join();

private:
    struct TaskHandle;
    TaskHandle* handle_;
};

//== Mutex abstraction ==//
class Mutex {
public:
    Mutex();
    ~Mutex();

    Mutex(const Mutex&) = delete;
    Mutex& operator=(const Mutex&) = delete;

    void lock();
    void unlock();

private:
    struct MutexHandle;
    MutexHandle* handle_;
};

// Scoped lock: unlocks on every exit path.
class LockGuard {
public:
    explicit LockGuard(Mutex& m) : m_(m) { m_.lock(); }
    ~LockGuard() { m_.unlock(); }

    LockGuard(const LockGuard&) = delete;
    LockGuard& operator=(const LockGuard&) = delete;

private:
    Mutex& m_;
};

//== Counting Semaphore abstraction ==//
class CountingSemaphore {
public:
    /**
     * @param maxCount      Maximum count (e.g. queue capacity)
     * @param initialCount  Starting count
     */
    CountingSemaphore(size_t maxCount, size_t initialCount);
    ~CountingSemaphore();

    CountingSemaphore(const CountingSemaphore&) = delete;
    CountingSemaphore& operator=(const CountingSemaphore&) = delete;

    // Block up to timeout_ms for count>0, then --count.
    // MAX_TIMEOUT waits forever, NO_WAIT never blocks.
    bool take(uint32_t timeout_ms = MAX_TIMEOUT);
    bool try_take() { return take(NO_WAIT); }
    void give();      // ++count, wake one waiter if present

private:
    struct CountingSemHandle;
    CountingSemHandle* handle_;
};

//== Queue abstraction ==//
// Fixed-size statically allocated circular queue, synchronised with the
// OSAL Mutex and two CountingSemaphores (free slots / filled slots).
//
// overwrite=false : send() blocks (up to the timeout) while the queue is full.
// overwrite=true  : send() never blocks; when full, the oldest item is
//                   discarded ("freshest wins"). wasLastSendOverwritten()
//                   reports whether the last send displaced an item.
template <typename T, size_t Capacity>
class Queue {
    static_assert(Capacity > 0, "Queue capacity must be non-zero");

public:
    explicit Queue(bool overwrite = false) : m_overwrite(overwrite) {}

    Queue(const Queue&) = delete;
    Queue& operator=(const Queue&) = delete;

    bool send(const T& item, uint32_t timeout_ms = MAX_TIMEOUT) {
        bool overwritten = false;

        if (!m_space.take(m_overwrite ? NO_WAIT : timeout_ms)) {
            if (!m_overwrite) return false;

            // Full: reclaim the oldest slot. If a receiver raced us to it,
            // a slot has been freed instead.
            if (m_data.try_take()) {
                LockGuard lk(m_lock);
                m_tail = (m_tail + 1) % Capacity;
                overwritten = true;
            } else if (!m_space.take(MAX_TIMEOUT)) {
                return false;
            }
        }

        {
            LockGuard lk(m_lock);
            m_buffer[m_head] = item;
            m_head = (m_head + 1) % Capacity;
            m_last_overwritten = overwritten;
        }
        m_data.give();
        return true;
    }

    bool try_send(const T& item) { return send(item, NO_WAIT); }

    bool receive(T& item, uint32_t timeout_ms = MAX_TIMEOUT) {
        if (!m_data.take(timeout_ms)) return false;
        {
            LockGuard lk(m_lock);
            item = m_buffer[m_tail];
            m_tail = (m_tail + 1) % Capacity;
        }
        m_space.give();
        return true;
    }

    bool try_receive(T& item) { return receive(item, NO_WAIT); }

    bool wasLastSendOverwritten() {
        LockGuard lk(m_lock);
        return m_last_overwritten;
    }

    static constexpr size_t capacity() { return Capacity; }

private:
    T m_buffer[Capacity]{};
    size_t m_head = 0;
    size_t m_tail = 0;
    bool m_overwrite;
    bool m_last_overwritten = false;

    Mutex m_lock;
    CountingSemaphore m_space{Capacity, Capacity};  // Initially all free
    CountingSemaphore m_data{Capacity, 0};          // Initially empty
};

} // namespace Rtos
