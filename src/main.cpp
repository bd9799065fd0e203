#include <fstream>
#include <iostream>
#include <string>

#include "os/rtos.hpp"
#include "apps/core/IngestConfig.hpp"
#include "apps/core/IngestOrchestrator.hpp"
#include "apps/core/IngestTasks.hpp"
#include "apps/uwb/MotionCache.hpp"
#include "platform/memory/InMemoryRecordStore.hpp"
#include "platform/linux/UdpForwarder.hpp"

struct Args {
    std::string config_path;
    std::string input = "-";
    std::string mode;             // overrides config when set
};

static void print_usage(const char* exe) {
    std::cerr
        << "Usage:\n"
        << "  " << exe << " [--config FILE] [--mode raw|process] [--input FILE|-]\n"
        << "\nBatches are separated by blank lines on the input.\n";
}

static bool parse_args(int argc, char** argv, Args& out) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];

        auto need_value = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << name << "\n";
                return nullptr;
            }
            return argv[++i];
        };

        if (a == "--config") {
            const char* v = need_value("--config");
            if (!v) return false;
            out.config_path = v;
        } else if (a == "--mode") {
            const char* v = need_value("--mode");
            if (!v) return false;
            out.mode = v;
        } else if (a == "--input") {
            const char* v = need_value("--input");
            if (!v) return false;
            out.input = v;
        } else {
            std::cerr << "Unknown argument: " << a << "\n";
            return false;
        }
    }
    return true;
}

int main(int argc, char** argv) {
    Args args;
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 2;
    }

    // ---- CONFIGURATION ----
    core::IngestConfig cfg{};
    if (!args.config_path.empty() && !core::loadConfig(args.config_path, cfg)) {
        return 2;
    }
    if (!args.mode.empty() && !core::parseMode(args.mode, cfg.MODE)) {
        std::cerr << "[MAIN] unknown mode '" << args.mode << "'\n";
        print_usage(argv[0]);
        return 2;
    }
    cfg = core::sanitise(cfg);

    std::ifstream file;
    std::istream* in = &std::cin;
    if (args.input != "-") {
        file.open(args.input);
        if (!file) {
            std::cerr << "[MAIN] could not open input " << args.input << "\n";
            return 2;
        }
        in = &file;
    }

    // ---- COLLABORATORS ----
    platform::InMemoryRecordStore store;
    uwb::MotionCache motion;

    platform::UdpForwarder forwarder(cfg.FORWARD);
    platform::IForwarder* fwd = nullptr;
    if (cfg.FORWARD_ENABLED) {
        if (forwarder.Start()) fwd = &forwarder;
        else std::cerr << "[MAIN] forwarding disabled: forwarder failed to start\n";
    }

    core::IngestOrchestrator orchestrator(cfg, store, motion, fwd);

    // ---- QUEUES / TASKS ----
    // Task contexts must outlive the tasks (main-scope)
    core::BatchQueue batchQueue;

    core::ReaderTaskCtx reader_ctx{};
    reader_ctx.in = in;
    reader_ctx.batch_max_lines = cfg.BATCH_MAX_LINES;
    reader_ctx.out = &batchQueue;

    core::IngestTaskCtx ingest_ctx{};
    ingest_ctx.orchestrator = &orchestrator;
    ingest_ctx.in = &batchQueue;

    std::cout << "[MAIN] mode=" << core::modeName(cfg.MODE)
              << " offset=" << cfg.CALIBRATION.OFFSET << "\n";

    Rtos::Task readerTask;
    Rtos::Task ingestTask;
    if (!ingestTask.Create("Ingest", core::IngestTaskEntry, &ingest_ctx)) {
        std::cerr << "[MAIN] ingest task creation failed\n";
        return 1;
    }
    if (!readerTask.Create("Reader", core::ReaderTaskEntry, &reader_ctx)) {
        std::cerr << "[MAIN] reader task creation failed\n";
        ingest_ctx.stop.store(true);   // ingest task must not outlive batchQueue
        ingestTask.Join();
        return 1;
    }

    // Heartbeat until the stream is drained
    const uint64_t start_us = Rtos::NowUs();
    uint64_t last_beat_us = start_us;
    while (!ingest_ctx.done.load()) {
        Rtos::SleepMs(50);
        // No end-of-stream will come: let the ingest task drain and leave
        if (reader_ctx.failed.load()) ingest_ctx.stop.store(true);
        const uint64_t now = Rtos::NowUs();
        if (now - last_beat_us >= 1000000ull) {
            std::cout << "[MAIN] HEARTBEAT batches=" << ingest_ctx.batches.load()
                      << " tags=" << motion.size() << "\n";
            last_beat_us = now;
        }
    }

    readerTask.Join();
    ingestTask.Join();

    std::cout << "[MAIN] done batches=" << ingest_ctx.batches.load()
              << " raw_rows=" << store.rawRows().size()
              << " processed_rows=" << store.processedRows().size()
              << " sessions=" << store.sessions().size() << "\n";

    if (reader_ctx.failed.load()) return 1;
    return ingest_ctx.faults.load() == 0 ? 0 : 1;
}
