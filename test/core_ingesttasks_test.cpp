// test/core_ingesttasks_test.cpp
//
// Reader / ingest task pair: batch cutting, end-of-stream, and shutdown when
// the hand-off breaks or the reader never starts.

#include <iostream>
#include <sstream>
#include <string>

#include "os/rtos.hpp"
#include "apps/core/IngestTasks.hpp"
#include "apps/uwb/MotionCache.hpp"
#include "platform/memory/InMemoryRecordStore.hpp"

static int g_failures = 0;

static void check(bool cond, const std::string& what) {
    if (cond) {
        std::cout << "[TEST] PASS " << what << "\n";
    } else {
        std::cerr << "[TEST] FAIL " << what << "\n";
        ++g_failures;
    }
}

static void testReaderCutsBatches() {
    std::istringstream in(
        "tid:1,range:(1)\n"
        "tid:2,range:(2)\r\n"
        "tid:3,range:(3)\n"
        "\n"
        "  \n"
        "tid:4,range:(4)\n");

    core::BatchQueue queue;
    core::ReaderTaskCtx ctx{};
    ctx.in = &in;
    ctx.out = &queue;
    ctx.batch_max_lines = 2;

    // Queue depth covers all batches: run inline
    core::ReaderTaskEntry(&ctx);
    check(!ctx.failed.load() && ctx.batches_sent.load() == 3, "three batches sent");

    core::LineBatch b{};
    check(queue.try_receive(b) && b.lines.size() == 2 && b.lines[1] == "tid:2,range:(2)",
          "batch cut at batch_max_lines, CR stripped");
    check(queue.try_receive(b) && b.lines.size() == 1 && b.lines[0] == "tid:3,range:(3)",
          "batch cut at blank line");
    check(queue.try_receive(b) && b.lines.size() == 1 && !b.end_of_stream, "trailing batch flushed");
    check(queue.try_receive(b) && b.end_of_stream && b.lines.empty(), "end-of-stream last");
    check(!queue.try_receive(b), "nothing after end-of-stream");
}

static void testReaderReportsBrokenHandOff() {
    // More batches than the queue holds and nobody consuming
    std::string text;
    for (std::size_t i = 0; i < core::BATCH_QUEUE_DEPTH + 2; ++i) text += "tid:1,range:(1)\n\n";
    std::istringstream in(text);

    core::BatchQueue queue;
    core::ReaderTaskCtx ctx{};
    ctx.in = &in;
    ctx.out = &queue;
    ctx.send_timeout_ms = 50;

    core::ReaderTaskEntry(&ctx);
    check(ctx.failed.load(), "failed send is reported");
    check(ctx.batches_sent.load() == core::BATCH_QUEUE_DEPTH, "only queued batches counted");

    core::LineBatch b{};
    bool saw_eos = false;
    while (queue.try_receive(b)) saw_eos = saw_eos || b.end_of_stream;
    check(!saw_eos, "no end-of-stream after a failed hand-off");
}

static void testIngestStopsWithoutReader() {
    platform::InMemoryRecordStore store;
    uwb::MotionCache cache;
    core::IngestOrchestrator orch(core::IngestConfig{}, store, cache);

    core::BatchQueue queue;
    core::IngestTaskCtx ctx{};
    ctx.orchestrator = &orch;
    ctx.in = &queue;
    ctx.print_summaries = false;

    // One batch queued, then the producer goes away without end-of-stream
    core::LineBatch b{};
    b.lines.push_back("tid:4,range:(100,110,103),cmd:2");
    check(queue.try_send(b), "batch queued");

    Rtos::Task task;
    check(task.Create("Ingest", core::IngestTaskEntry, &ctx), "ingest task created");
    ctx.stop.store(true);
    task.Join();

    check(ctx.done.load(), "ingest task left on stop");
    check(ctx.batches.load() == 1 && store.rawRows().size() == 1, "queued batch drained before leaving");
}

static void testPipelineEndToEnd() {
    platform::InMemoryRecordStore store;
    uwb::MotionCache cache;
    core::IngestOrchestrator orch(core::IngestConfig{}, store, cache);

    std::istringstream in(
        "tid:4,range:(100,110,103),cmd:1,user:alice\n"
        "tid:5,range:(100,110,103),cmd:2\n"
        "\n"
        "tid:4,range:(100,110,103),cmd:3,user:alice\n");

    core::BatchQueue queue;
    core::ReaderTaskCtx reader{};
    reader.in = &in;
    reader.out = &queue;

    core::IngestTaskCtx ingest{};
    ingest.orchestrator = &orch;
    ingest.in = &queue;
    ingest.print_summaries = false;

    Rtos::Task readerTask;
    Rtos::Task ingestTask;
    const bool created = ingestTask.Create("Ingest", core::IngestTaskEntry, &ingest) &&
                         readerTask.Create("Reader", core::ReaderTaskEntry, &reader);
    if (!created) ingest.stop.store(true);
    readerTask.Join();
    ingestTask.Join();

    check(created, "tasks created");
    check(ingest.done.load() && !reader.failed.load(), "stream drained");
    check(ingest.batches.load() == 2 && ingest.faults.load() == 0, "two batches, no faults");
    check(store.rawRows().size() == 3, "all eligible rows stored");

    const auto sessions = store.sessions();
    check(sessions.size() == 1 && sessions[0].has_ended, "session opened and closed across batches");
}

int main() {
    std::cout << "=== INGEST TASKS TEST ===\n";

    testReaderCutsBatches();
    testReaderReportsBrokenHandOff();
    testIngestStopsWithoutReader();
    testPipelineEndToEnd();

    if (g_failures) {
        std::cerr << "[TEST] " << g_failures << " check(s) failed\n";
        return 1;
    }
    std::cout << "[TEST] all checks passed\n";
    return 0;
}
