#pragma once
#include <cstddef> // Required for size_t
#include <cstdint>

namespace Rtos {

// Blocking timeout meaning "wait forever"
static constexpr uint32_t MAX_TIMEOUT = 0xFFFFFFFFu;

void SleepMs(int ms);

// Monotonic clock in microseconds (durations, cadence)
uint64_t NowUs();

// Wall clock in microseconds since the Unix epoch (record timestamps)
uint64_t WallClockUs();

//== Task abstraction ==//
// This class provides a simple task wrapper
class Task {
public:
    Task();
    ~Task();

    bool Create(const char* name, void (*fn)(void*), void* arg);
    void Join();

private:
    struct TaskHandle;
    TaskHandle* handle_;
};

//== Mutex abstraction ==//
// Satisfies BasicLockable, so std::lock_guard<Rtos::Mutex> works.
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

//== Counting Semaphore abstraction ==//
class CountingSemaphore {
public:
    /**
     * @param maxCount    Maximum count (e.g. queue capacity)
     * @param initialCount  Starting count
     */
    CountingSemaphore(size_t maxCount, size_t initialCount);
    ~CountingSemaphore();

    CountingSemaphore(const CountingSemaphore&) = delete;
    CountingSemaphore& operator=(const CountingSemaphore&) = delete;

    // block until count>0 or timeout, then --count
    bool take(uint32_t timeout_ms = MAX_TIMEOUT);
    bool try_take();  // non-blocking: if count>0 then --count, else false
    void give();      // ++count, wake one waiter if present

private:
    struct CountingSemHandle;
    CountingSemHandle* handle_;
};

//== Queue abstraction ==//
// Fixed-size statically allocated queue
//
// Circular buffer synchronised with the OSAL Mutex and two counting
// semaphores (free slots / filled slots). POSIX has no native queue, so it is
// built by hand here; an RTOS port can specialise it onto native queue APIs.
//
// T must be default constructible and copy assignable.
template <typename T, size_t Capacity>
class Queue {
public:
    Queue() : head(0), tail(0) {}

    // Blocks until space is available or timeout expires.
    bool send(const T& item, uint32_t timeout_ms = MAX_TIMEOUT) {
        if (!spaceAvailable.take(timeout_ms)) return false;
        push(item);
        return true;
    }

    bool try_send(const T& item) {
        if (!spaceAvailable.try_take()) return false;
        push(item);
        return true;
    }

    // Blocks until data is available or timeout expires.
    bool receive(T& item, uint32_t timeout_ms = MAX_TIMEOUT) {
        if (!dataAvailable.take(timeout_ms)) return false;
        pop(item);
        return true;
    }

    bool try_receive(T& item) {
        if (!dataAvailable.try_take()) return false;
        pop(item);
        return true;
    }

private:
    void push(const T& item) {
        lock.lock();
        buffer[head] = item;
        head = (head + 1) % Capacity;
        lock.unlock();
        dataAvailable.give();   // Signal data is available
    }

    void pop(T& item) {
        lock.lock();
        item = buffer[tail];
        buffer[tail] = T{};     // release anything the slot owns
        tail = (tail + 1) % Capacity;
        lock.unlock();
        spaceAvailable.give();  // Signal space is available
    }

    T buffer[Capacity];
    size_t head, tail;

    Mutex lock;
    CountingSemaphore spaceAvailable{Capacity, Capacity};  // Initially full space
    CountingSemaphore dataAvailable{Capacity, 0};          // Initially no data
};
} // namespace Rtos
