#include "os/rtos.hpp"
#include <pthread.h>
#include <semaphore.h>
#include <time.h>
#include <errno.h>
#include <iostream>   // for std::cerr

namespace Rtos {

void SleepMs(int ms) {
    if (ms <= 0) return;
    timespec req{};
    req.tv_sec  = ms / 1000;
    req.tv_nsec = static_cast<long>(ms % 1000) * 1000000L;
    while (::nanosleep(&req, &req) == -1 && errno == EINTR) {
    }
}

uint64_t NowUs() {
    timespec ts{};
    ::clock_gettime(CLOCK_MONOTONIC, &ts);
    return uint64_t(ts.tv_sec) * 1000000ull + uint64_t(ts.tv_nsec) / 1000ull;
}

// =======================
// Task Implementation
// =======================

namespace {

struct ThreadArgs {
    void (*fn)(void*);
    void* arg;
};

void* threadEntryPoint(void* ptr) {
    ThreadArgs* args = static_cast<ThreadArgs*>(ptr);
    args->fn(args->arg);
    delete args;
    return nullptr;
}

// Absolute CLOCK_REALTIME deadline for sem_timedwait
timespec deadlineAfterMs(uint32_t ms) {
    timespec ts{};
    ::clock_gettime(CLOCK_REALTIME, &ts);
    ts.tv_sec  += ms / 1000;
    ts.tv_nsec += static_cast<long>(ms % 1000) * 1000000L;
    if (ts.tv_nsec >= 1000000000L) {
        ts.tv_sec  += 1;
        ts.tv_nsec -= 1000000000L;
    }
    return ts;
}

} // anonymous namespace

struct Task::TaskHandle {
    pthread_t thread;
    bool created = false;
    bool joined = false;
};

Task::Task() : handle_(new TaskHandle{}) {}

Task::~Task() {
    if (handle_->created && !handle_->joined) {
        pthread_detach(handle_->thread);
    }
    delete handle_;
}

bool Task::Create(const char* name, void (*fn)(void*), void* arg) {
    if (handle_->created && !handle_->joined) {
        std::cerr << "[RTOS] Task " << (name ? name : "?") << " already running\n";
        return false;
    }

    auto* args = new ThreadArgs{fn, arg};
    if (pthread_create(&handle_->thread, nullptr, threadEntryPoint, args) != 0) {
        std::cerr << "[RTOS] Failed to create task " << (name ? name : "?") << "\n";
        delete args;
        return false;
    }
    handle_->created = true;
    handle_->joined = false;
    return true;
}

void Task::Join() {
    if (handle_->created && !handle_->joined) {
        pthread_join(handle_->thread, nullptr);
        handle_->joined = true;
    }
}

// =======================
// Mutex Implementation
// =======================

struct Mutex::MutexHandle {
    pthread_mutex_t native;
};

Mutex::Mutex() : handle_(new MutexHandle) {
    if (pthread_mutex_init(&handle_->native, nullptr) != 0) {
        std::cerr << "[RTOS] Mutex init failed\n";
    }
}

Mutex::~Mutex() {
    pthread_mutex_destroy(&handle_->native);
    delete handle_;
}

void Mutex::lock() {
    pthread_mutex_lock(&handle_->native);
}

void Mutex::unlock() {
    pthread_mutex_unlock(&handle_->native);
}

// =======================
// Counting Semaphore Implementation
// =======================

struct CountingSemaphore::CountingSemHandle {
    sem_t sem;
    unsigned maxCount;
};

CountingSemaphore::CountingSemaphore(size_t maxCount, size_t initialCount)
: handle_(new CountingSemHandle) {
    handle_->maxCount = static_cast<unsigned>(maxCount);

    if (initialCount > maxCount) {
        std::cerr << "[RTOS] CountingSemaphore initial count > max count\n";
        initialCount = maxCount;
    }

    if (sem_init(&handle_->sem, 0, static_cast<unsigned>(initialCount)) != 0) {
        std::cerr << "[RTOS] sem_init failed\n";
    }
}

CountingSemaphore::~CountingSemaphore() {
    sem_destroy(&handle_->sem);
    delete handle_;
}

bool CountingSemaphore::take(uint32_t timeout_ms) {
    if (timeout_ms == NO_WAIT) {
        return sem_trywait(&handle_->sem) == 0;
    }

    if (timeout_ms == MAX_TIMEOUT) {
        while (sem_wait(&handle_->sem) != 0) {
            if (errno != EINTR) {
                std::cerr << "[RTOS] sem_wait failed\n";
                return false;
            }
        }
        return true;
    }

    const timespec deadline = deadlineAfterMs(timeout_ms);
    while (sem_timedwait(&handle_->sem, &deadline) != 0) {
        if (errno == EINTR) continue;
        if (errno != ETIMEDOUT) {
            std::cerr << "[RTOS] sem_timedwait failed\n";
        }
        return false;
    }
    return true;
}

void CountingSemaphore::give() {
    int val = 0;
    sem_getvalue(&handle_->sem, &val);

    if (static_cast<unsigned>(val) < handle_->maxCount) {
        sem_post(&handle_->sem);
    } else {
        std::cerr << "[RTOS] CountingSemaphore give() called when full\n";
    }
}

} // namespace Rtos
