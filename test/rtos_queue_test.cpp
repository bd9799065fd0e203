#include "os/rtos.hpp"
#include <iostream>
#include <string>
#include <vector>

// Same shape as the reader -> ingest hand-off: small queue, slow consumer
struct Item {
    int seq = 0;
    std::vector<std::string> lines;
};

Rtos::Queue<Item, 3> queue;
static int g_failures = 0;
static std::vector<int> received;

void Producer(void*) {
    std::cout << "[Producer] Thread started\n";
    for (int i = 1; i <= 10; ++i) {
        Item it;
        it.seq = i;
        it.lines.assign(static_cast<size_t>(i), "tid:1,range:(1)");
        queue.send(it);  // blocks while the queue is full
        std::cout << "[Producer] Sent: " << i << std::endl;
    }
}

void Consumer(void*) {
    Rtos::SleepMs(200);
    std::cout << "[Consumer] Thread started\n";
    for (int i = 1; i <= 10; ++i) {
        Item it;
        if (!queue.receive(it, 2000)) {
            std::cerr << "[Consumer] receive timed out at " << i << "\n";
            ++g_failures;
            return;
        }
        if (it.lines.size() != static_cast<size_t>(it.seq)) ++g_failures;
        received.push_back(it.seq);
        std::cout << "[Consumer] Received: " << it.seq << std::endl;
        Rtos::SleepMs(20);
    }
}

int main() {
    Rtos::Task producerTask;
    Rtos::Task consumerTask;

    if (!producerTask.Create("Producer", Producer, nullptr) ||
        !consumerTask.Create("Consumer", Consumer, nullptr)) {
        std::cerr << "[Main] task creation failed\n";
        return 1;
    }

    std::cout << "[Main] Waiting for threads...\n";
    producerTask.Join();
    consumerTask.Join();

    for (size_t i = 0; i < received.size(); ++i) {
        if (received[i] != static_cast<int>(i) + 1) ++g_failures;
    }
    if (received.size() != 10) ++g_failures;

    // Empty queue: bounded receive gives up, try_* never block
    Item it;
    const uint64_t t0 = Rtos::NowUs();
    if (queue.receive(it, 100)) ++g_failures;
    if (Rtos::NowUs() - t0 < 80000) ++g_failures;
    if (queue.try_receive(it)) ++g_failures;

    for (int i = 0; i < 3; ++i) {
        Item f; f.seq = i;
        if (!queue.try_send(f)) ++g_failures;
    }
    Item extra;
    if (queue.try_send(extra)) ++g_failures;        // full
    if (queue.send(extra, 50)) ++g_failures;        // full, times out

    if (g_failures) {
        std::cerr << "[Main] Test FAILED (" << g_failures << ")\n";
        return 1;
    }
    std::cout << "[Main] Test complete.\n";
    return 0;
}
