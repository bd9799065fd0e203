#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "os/rtos.hpp"

#include "apps/core/IngestConfig.hpp"
#include "apps/core/ReportSessionMachine.hpp"
#include "apps/uwb/TelemetryParser.hpp"
#include "apps/uwb/CalibrationNormalizer.hpp"
#include "apps/uwb/PositionSolver.hpp"
#include "apps/uwb/MotionCache.hpp"

#include "platform/IRecordStore.hpp"
#include "platform/IForwarder.hpp"

#include "msg/BatchSummary.hpp"

namespace core {

// ---------------------------------------------------------------------------
//  IngestOrchestrator
// ---------------------------------------------------------------------------
// Runs one batch of telemetry lines, in order:
//   parse -> normalize -> session update -> eligibility -> store (raw) | solve + motion (process)
// Rows of a batch are committed all-or-nothing. Row-level problems are only
// counted; the return status is non-OK only for batch-level faults.
//
// Store, motion cache and forwarder are borrowed and must outlive the orchestrator.
// Batches are serialised internally, so one orchestrator may be shared by tasks.
class IngestOrchestrator {
public:
    enum class Status : uint8_t {
        OK = 0,
        EMPTY_BATCH,       // no non-blank line: rejected, nothing written
        STORAGE_FAILED,    // begin/append/commit failed: nothing written
    };

    static const char* StatusStr(Status s);

    IngestOrchestrator(const IngestConfig& cfg,
                       platform::IRecordStore& store,
                       uwb::MotionCache& cache,
                       platform::IForwarder* forwarder = nullptr);

    const IngestConfig& getConfig() const { return m_cfg; }

    // Run with the configured MODE.
    Status ingest(const std::vector<std::string>& lines, uint64_t now_us, msg::BatchSummary& out);

    // Raw path: store calibrated readings, then forward the committed rows.
    Status ingestRaw(const std::vector<std::string>& lines, uint64_t now_us, msg::BatchSummary& out);

    // Processing path: solve each eligible reading and store position + motion delta.
    Status processLines(const std::vector<std::string>& lines, uint64_t now_us, msg::BatchSummary& out);

    // Split a multi-line payload into lines ("\n" or "\r\n"), dropping blank ones.
    static std::vector<std::string> splitLines(const std::string& payload);

private:
    Status runBatch(IngestMode mode, const std::vector<std::string>& lines,
                    uint64_t now_us, msg::BatchSummary& out);

    // Storage fault path: roll back and clear everything that claimed to be written.
    Status abortBatch(const char* what, msg::BatchSummary& out);

    IngestConfig m_cfg{};

    uwb::TelemetryParser m_parser;
    uwb::CalibrationNormalizer m_normalizer;
    uwb::PositionSolver m_solver;

    platform::IRecordStore& m_store;
    uwb::MotionCache& m_cache;
    platform::IForwarder* m_forwarder = nullptr;   // optional

    ReportSessionMachine m_sessions;

    Rtos::Mutex m_batch_lock;
};

} // namespace core
