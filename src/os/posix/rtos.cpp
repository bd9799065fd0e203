#include "os/rtos.hpp"
#include <pthread.h>
#include <unistd.h>   // for usleep
#include <iostream>   // for std::cerr
#include <semaphore.h>
#include <cerrno>
#include <ctime>

namespace Rtos {

// Sleep utility
void SleepMs(int ms) {
    usleep(ms * 1000);  // Convert ms to microseconds
}

uint64_t NowUs() {
    timespec ts{};
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return uint64_t(ts.tv_sec) * 1000000ull + uint64_t(ts.tv_nsec) / 1000ull;
}

uint64_t WallClockUs() {
    timespec ts{};
    clock_gettime(CLOCK_REALTIME, &ts);
    return uint64_t(ts.tv_sec) * 1000000ull + uint64_t(ts.tv_nsec) / 1000ull;
}

// =======================
// Task Implementation
// =======================

// Wrapper to convert function pointer to pthread-style
struct ThreadArgs {
    void (*fn)(void*);
    void* arg;
};

// Static thread entry point
static void* threadEntryPoint(void* ptr) {
    ThreadArgs* args = static_cast<ThreadArgs*>(ptr);
    args->fn(args->arg);
    delete args;
    return nullptr;
}

// Platform-specific handle
struct Task::TaskHandle {
    pthread_t thread;
    bool created = false;
    bool joined = false;
};

Task::Task() {
    handle_ = new TaskHandle{};
}

Task::~Task() {
    if (handle_ && !handle_->joined && handle_->created) {
        pthread_detach(handle_->thread);  // detach if not joined
    }
    delete handle_;
}

bool Task::Create(const char* name, void (*fn)(void*), void* arg) {

    auto* args = new ThreadArgs{fn, arg};

    if (pthread_create(&handle_->thread, nullptr, threadEntryPoint, args) == 0) {
        handle_->created = true;
        return true;
    }

    std::cerr << "[RTOS] Failed to create task " << (name ? name : "?") << "\n";
    delete args;
    return false;
}

void Task::Join() {
    if (handle_ && handle_->created && !handle_->joined) {
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

Mutex::Mutex() {
    handle_ = new MutexHandle;
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

CountingSemaphore::CountingSemaphore(size_t maxCount, size_t initialCount) {
    handle_ = new CountingSemHandle;
    handle_->maxCount = static_cast<unsigned>(maxCount);

    if (initialCount > maxCount) {
        std::cerr << "[CountingSemaphore] Error: Initial count > max count\n";
        initialCount = maxCount;  // clamp
    }

    if (sem_init(&handle_->sem, 0, static_cast<unsigned>(initialCount)) != 0) {
        std::cerr << "[CountingSemaphore] sem_init failed\n";
    }
}

CountingSemaphore::~CountingSemaphore() {
    sem_destroy(&handle_->sem);
    delete handle_;
}

bool CountingSemaphore::take(uint32_t timeout_ms) {
    if (timeout_ms == MAX_TIMEOUT) {
        while (sem_wait(&handle_->sem) != 0) {
            if (errno != EINTR) {
                std::cerr << "[CountingSemaphore] sem_wait failed\n";
                return false;
            }
        }
        return true;
    }

    // sem_timedwait takes an absolute CLOCK_REALTIME deadline
    timespec deadline{};
    clock_gettime(CLOCK_REALTIME, &deadline);
    deadline.tv_sec  += timeout_ms / 1000;
    deadline.tv_nsec += long(timeout_ms % 1000) * 1000000L;
    if (deadline.tv_nsec >= 1000000000L) {
        deadline.tv_sec  += 1;
        deadline.tv_nsec -= 1000000000L;
    }

    while (sem_timedwait(&handle_->sem, &deadline) != 0) {
        if (errno == EINTR) continue;
        if (errno != ETIMEDOUT) {
            std::cerr << "[CountingSemaphore] sem_timedwait failed\n";
        }
        return false;
    }
    return true;
}

bool CountingSemaphore::try_take() {
    return (sem_trywait(&handle_->sem) == 0);
}

void CountingSemaphore::give() {
    int val;
    sem_getvalue(&handle_->sem, &val);

    if (static_cast<unsigned>(val) < handle_->maxCount) {
        sem_post(&handle_->sem);
    } else {
        std::cerr << "[CountingSemaphore] give() called when full\n";
    }
}
}  // namespace Rtos
