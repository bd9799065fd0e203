// IngestTasks.cpp
#include "apps/core/IngestTasks.hpp"

#include <iostream>

namespace core {

void printSummary(uint32_t batch_no, IngestOrchestrator::Status st, const msg::BatchSummary& s) {
    std::cout << "[INGEST] batch=" << batch_no
              << " status=" << IngestOrchestrator::StatusStr(st)
              << " received=" << s.received_lines
              << " saved=" << s.saved
              << " invalid=" << s.skipped_invalid
              << " calibration=" << s.skipped_calibration
              << " cmd0=" << s.skipped_command_zero
              << " unsolvable=" << s.skipped_unsolvable
              << " sessions_open=" << s.sessions_opened_or_updated
              << " sessions_closed=" << s.sessions_closed
              << " forwarded=" << int(s.forwarded_ok)
              << " offset=" << s.calibration_offset << "\n";
}

// === Reader Task Loop ===
void ReaderTaskEntry(void* arg) {
    auto* ctx = static_cast<ReaderTaskCtx*>(arg);
    if (!ctx) return;
    if (!ctx->in || !ctx->out) {
        ctx->failed.store(true);
        return;
    }

    LineBatch batch{};
    std::string line;

    auto flush = [&]() -> bool {
        if (batch.lines.empty()) return true;
        if (!ctx->out->send(batch, ctx->send_timeout_ms)) return false;
        ctx->batches_sent++;
        batch = LineBatch{};
        return true;
    };

    bool ok = true;
    while (ok && std::getline(*ctx->in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        if (line.find_first_not_of(" \t") == std::string::npos) {
            ok = flush();
            continue;
        }
        batch.lines.push_back(line);
        if (batch.lines.size() >= ctx->batch_max_lines) ok = flush();
    }
    if (ok) ok = flush();

    LineBatch eos{};
    eos.end_of_stream = true;
    if (!ok || !ctx->out->send(eos, ctx->send_timeout_ms)) {
        std::cerr << "[READER] batch hand-off failed after " << ctx->batches_sent.load()
                  << " batches, input abandoned\n";
        ctx->failed.store(true);
    }
}

// === Ingest Task Loop ===
void IngestTaskEntry(void* arg) {
    auto* ctx = static_cast<IngestTaskCtx*>(arg);
    if (!ctx) return;
    if (!ctx->orchestrator || !ctx->in) {
        ctx->done.store(true);
        return;
    }

    while (true) {
        LineBatch batch{};
        if (!ctx->in->receive(batch, INGEST_POLL_MS)) {
            if (ctx->stop.load()) break;
            continue;
        }
        if (batch.end_of_stream) break;

        msg::BatchSummary s{};
        const auto st = ctx->orchestrator->ingest(batch.lines, Rtos::WallClockUs(), s);
        const uint32_t n = ++ctx->batches;
        if (st != IngestOrchestrator::Status::OK) ctx->faults++;

        if (ctx->print_summaries) printSummary(n, st, s);
    }
    ctx->done.store(true);
}

} // namespace core
