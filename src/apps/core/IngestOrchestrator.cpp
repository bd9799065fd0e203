// IngestOrchestrator.cpp
#include "apps/core/IngestOrchestrator.hpp"

#include <cctype>
#include <iostream>
#include <memory>
#include <mutex>

namespace {

bool isBlank(const std::string& s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // namespace

namespace core {

const char* IngestOrchestrator::StatusStr(Status s) {
    switch (s) {
        case Status::OK: return "OK";
        case Status::EMPTY_BATCH: return "EMPTY_BATCH";
        case Status::STORAGE_FAILED: return "STORAGE_FAILED";
        default: return "UNKNOWN";
    }
}

IngestOrchestrator::IngestOrchestrator(const IngestConfig& cfg,
                                       platform::IRecordStore& store,
                                       uwb::MotionCache& cache,
                                       platform::IForwarder* forwarder)
: m_cfg(sanitise(cfg))
, m_normalizer(m_cfg.CALIBRATION)
, m_solver(m_cfg.SOLVER)
, m_store(store)
, m_cache(cache)
, m_forwarder(forwarder)
, m_sessions(store) {
}

std::vector<std::string> IngestOrchestrator::splitLines(const std::string& payload) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start <= payload.size()) {
        std::size_t nl = payload.find('\n', start);
        if (nl == std::string::npos) nl = payload.size();

        std::string line = payload.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!isBlank(line)) lines.push_back(line);

        start = nl + 1;
    }
    return lines;
}

IngestOrchestrator::Status IngestOrchestrator::ingest(const std::vector<std::string>& lines,
                                                      uint64_t now_us, msg::BatchSummary& out) {
    return runBatch(m_cfg.MODE, lines, now_us, out);
}

IngestOrchestrator::Status IngestOrchestrator::ingestRaw(const std::vector<std::string>& lines,
                                                         uint64_t now_us, msg::BatchSummary& out) {
    return runBatch(IngestMode::RAW_INGEST, lines, now_us, out);
}

IngestOrchestrator::Status IngestOrchestrator::processLines(const std::vector<std::string>& lines,
                                                            uint64_t now_us, msg::BatchSummary& out) {
    return runBatch(IngestMode::PROCESS, lines, now_us, out);
}

IngestOrchestrator::Status IngestOrchestrator::abortBatch(const char* what, msg::BatchSummary& out) {
    m_store.rollback();
    out.saved = 0;
    out.sessions_opened_or_updated = 0;
    out.sessions_closed = 0;
    out.forwarded_ok = 0;
    std::cerr << "[INGEST] storage fault (" << what << "), batch rolled back\n";
    return Status::STORAGE_FAILED;
}

IngestOrchestrator::Status IngestOrchestrator::runBatch(IngestMode mode,
                                                        const std::vector<std::string>& lines,
                                                        uint64_t now_us,
                                                        msg::BatchSummary& out) {
    std::lock_guard<Rtos::Mutex> guard(m_batch_lock);

    out = msg::BatchSummary{};
    out.calibration_offset = m_normalizer.getConfig().OFFSET;

    for (const std::string& line : lines) {
        if (!isBlank(line)) ++out.received_lines;
    }
    if (out.received_lines == 0) {
        std::cerr << "[INGEST] empty batch rejected\n";
        return Status::EMPTY_BATCH;
    }

    if (!m_store.begin()) {
        out.saved = 0;
        std::cerr << "[INGEST] storage fault (begin)\n";
        return Status::STORAGE_FAILED;
    }

    // Motion fixes become visible only with the rows that carry them
    std::unique_ptr<uwb::MotionCache::Batch> motion;
    if (mode == IngestMode::PROCESS) motion.reset(new uwb::MotionCache::Batch(m_cache));

    std::vector<msg::StoredReading> staged_raw;
    uint32_t staged = 0;
    uint32_t line_no = 0;

    for (const std::string& line : lines) {
        if (isBlank(line)) continue;
        ++line_no;

        // ---- Parse ----
        msg::RawReading raw{};
        if (!m_parser.parse(line, now_us, raw)) {
            ++out.skipped_invalid;
            if (m_cfg.VERBOSE) std::cout << "[INGEST] #" << line_no << " invalid line\n";
            continue;
        }

        // ---- Normalize ----
        const msg::CalibratedReading cal = m_normalizer.normalize(raw);

        // ---- Session (independent of storage eligibility) ----
        SessionEffect effect = SessionEffect::NONE;
        if (!m_sessions.update(cal.reading, now_us, effect)) {
            return abortBatch("session", out);
        }
        if (effect == SessionEffect::OPENED || effect == SessionEffect::UPDATED) {
            ++out.sessions_opened_or_updated;
        } else if (effect == SessionEffect::CLOSED) {
            ++out.sessions_closed;
        }
        if (m_cfg.VERBOSE && effect != SessionEffect::NONE) {
            std::cout << "[SESSION] user=" << raw.session_user << " "
                      << ReportSessionMachine::getEffectName(effect) << "\n";
        }

        // ---- Eligibility ----
        if (cal.calibration_tag) {
            ++out.skipped_calibration;
            if (m_cfg.VERBOSE) std::cout << "[INGEST] #" << line_no << " tag=" << raw.tag_id << " calibration tag\n";
            continue;
        }
        if (raw.command == static_cast<int32_t>(SessionCommand::DISCARD)) {
            ++out.skipped_command_zero;
            if (m_cfg.VERBOSE) std::cout << "[INGEST] #" << line_no << " tag=" << raw.tag_id << " cmd 0\n";
            continue;
        }

        // ---- Raw path ----
        if (mode == IngestMode::RAW_INGEST) {
            uint64_t id = 0;
            if (!m_store.appendRaw(cal, id)) {
                return abortBatch("appendRaw", out);
            }
            staged_raw.push_back(msg::StoredReading{id, cal});
            ++staged;
            continue;
        }

        // ---- Processing path ----
        msg::ResolvedPosition pos{};
        uwb::PositionSolver::Status why = uwb::PositionSolver::Status::OK;
        if (!m_solver.solveReading(cal, pos, &why)) {
            ++out.skipped_unsolvable;
            if (m_cfg.VERBOSE) {
                std::cout << "[SOLVER] #" << line_no << " tag=" << raw.tag_id
                          << " unsolvable: " << uwb::PositionSolver::StatusStr(why) << "\n";
            }
            continue;
        }

        const uwb::MotionDelta delta = motion->update(pos.tag_id, pos.x, pos.y, pos.resolved_at_us);

        msg::ProcessedRecord rec{};
        rec.tag_id = pos.tag_id;
        rec.x = pos.x;
        rec.y = pos.y;
        rec.has_motion = delta.has_prior ? 1 : 0;
        rec.distance_travelled = delta.distance;
        rec.elapsed_s = delta.elapsed_s;
        rec.recorded_at_us = pos.resolved_at_us;

        if (!m_store.appendProcessed(rec)) {
            return abortBatch("appendProcessed", out);
        }
        ++staged;

        if (m_cfg.VERBOSE) {
            std::cout << "[SOLVER] #" << line_no << " tag=" << rec.tag_id
                      << " x=" << rec.x << " y=" << rec.y << "\n";
        }
    }

    if (!m_store.commit()) {
        return abortBatch("commit", out);
    }
    out.saved = staged;
    if (motion) motion->commit();

    // ---- Forward committed raw rows (never affects what was stored) ----
    if (mode == IngestMode::RAW_INGEST && !staged_raw.empty() && m_forwarder) {
        out.forwarded_ok = m_forwarder->forward(staged_raw) ? 1 : 0;
        if (!out.forwarded_ok) {
            std::cerr << "[FWD] forwarding of " << staged_raw.size() << " rows failed\n";
        }
    }

    return Status::OK;
}

} // namespace core
