#pragma once
#include <atomic>
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

#include "os/rtos.hpp"

#include "apps/core/IngestOrchestrator.hpp"
#include "msg/BatchSummary.hpp"

namespace core {

// One batch handed from the reader task to the ingest task
struct LineBatch {
    std::vector<std::string> lines;
    bool end_of_stream = false;
};

static constexpr std::size_t BATCH_QUEUE_DEPTH = 4;
using BatchQueue = Rtos::Queue<LineBatch, BATCH_QUEUE_DEPTH>;

// Poll period of the ingest task while waiting for a batch
static constexpr uint32_t INGEST_POLL_MS = 200;

// ---------------------------------------------------------------------------
//  Reader task
// ---------------------------------------------------------------------------
// Cuts the input into batches at blank lines or after batch_max_lines, sends them
// on 'out', then sends an end-of-stream batch. If a send fails the remaining
// input is abandoned, no end-of-stream follows and 'failed' is set.
// NOTE: the context must outlive the task.
struct ReaderTaskCtx {
    std::istream* in = nullptr;
    BatchQueue* out = nullptr;
    uint32_t batch_max_lines = 256;
    uint32_t send_timeout_ms = Rtos::MAX_TIMEOUT;

    std::atomic<bool> failed{false};
    std::atomic<uint32_t> batches_sent{0};
};

void ReaderTaskEntry(void* arg);

// ---------------------------------------------------------------------------
//  Ingest task
// ---------------------------------------------------------------------------
// Runs every batch through the orchestrator until end-of-stream, or until
// 'stop' is set and the queue has been drained. 'done' is set on exit.
struct IngestTaskCtx {
    IngestOrchestrator* orchestrator = nullptr;
    BatchQueue* in = nullptr;
    bool print_summaries = true;

    std::atomic<bool> stop{false};
    std::atomic<bool> done{false};
    std::atomic<uint32_t> batches{0};
    std::atomic<uint32_t> faults{0};
};

void IngestTaskEntry(void* arg);

// One console line per batch
void printSummary(uint32_t batch_no, IngestOrchestrator::Status st, const msg::BatchSummary& s);

} // namespace core
