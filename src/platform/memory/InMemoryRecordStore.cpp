#include "platform/memory/InMemoryRecordStore.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace platform {

namespace {

std::string spanToText(uint8_t has, double v) {
    if (!has) return std::string();
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.17g", v);
    return buf;
}

bool spanFromText(const std::string& text, double& v) {
    if (text.empty()) return false;
    char* end = nullptr;
    v = std::strtod(text.c_str(), &end);
    return end != text.c_str() && *end == '\0';
}

} // namespace

SessionRow InMemoryRecordStore::toRow(const msg::ReportSession& s) {
    SessionRow row;
    row.session = s;
    row.session.has_span_x = 0;
    row.session.has_span_y = 0;
    row.session.span_x = 0.0;
    row.session.span_y = 0.0;
    row.kx = spanToText(s.has_span_x, s.span_x);
    row.ky = spanToText(s.has_span_y, s.span_y);
    return row;
}

msg::ReportSession InMemoryRecordStore::fromRow(const SessionRow& row) {
    msg::ReportSession s = row.session;
    double v = 0.0;
    if (spanFromText(row.kx, v)) { s.has_span_x = 1; s.span_x = v; }
    if (spanFromText(row.ky, v)) { s.has_span_y = 1; s.span_y = v; }
    return s;
}

bool InMemoryRecordStore::begin() {
    std::lock_guard<Rtos::Mutex> guard(m_lock);
    if (m_in_txn) {
        std::cerr << "[STORE] begin() while a transaction is open\n";
        return false;
    }
    m_work = m_committed;
    m_in_txn = true;
    return true;
}

bool InMemoryRecordStore::commit() {
    std::lock_guard<Rtos::Mutex> guard(m_lock);
    if (!m_in_txn) return false;

    if (m_fail_next_commit) {
        m_fail_next_commit = false;
        m_work = Tables{};
        m_in_txn = false;
        std::cerr << "[STORE] commit failed (injected), transaction rolled back\n";
        return false;
    }

    m_committed = std::move(m_work);
    m_work = Tables{};
    m_in_txn = false;
    return true;
}

void InMemoryRecordStore::rollback() {
    std::lock_guard<Rtos::Mutex> guard(m_lock);
    m_work = Tables{};
    m_in_txn = false;
}

bool InMemoryRecordStore::appendRaw(const msg::CalibratedReading& reading, uint64_t& id) {
    std::lock_guard<Rtos::Mutex> guard(m_lock);
    Tables& t = active();
    id = t.next_raw_id++;
    t.raw.push_back(msg::StoredReading{id, reading});
    return true;
}

bool InMemoryRecordStore::appendProcessed(msg::ProcessedRecord& record) {
    std::lock_guard<Rtos::Mutex> guard(m_lock);
    Tables& t = active();
    record.id = t.next_processed_id++;
    t.processed.push_back(record);
    return true;
}

bool InMemoryRecordStore::findOpenSession(const std::string& user, msg::ReportSession& out,
                                          bool& found) {
    std::lock_guard<Rtos::Mutex> guard(m_lock);
    const Tables& t = active();
    found = false;

    // Most recent first
    for (auto it = t.sessions.rbegin(); it != t.sessions.rend(); ++it) {
        if (it->session.user == user && it->session.isOpen()) {
            out = fromRow(*it);
            found = true;
            break;
        }
    }
    return true;
}

bool InMemoryRecordStore::insertSession(msg::ReportSession& session) {
    std::lock_guard<Rtos::Mutex> guard(m_lock);
    Tables& t = active();
    session.session_id = t.next_session_id++;
    t.sessions.push_back(toRow(session));
    return true;
}

bool InMemoryRecordStore::updateSession(const msg::ReportSession& session) {
    std::lock_guard<Rtos::Mutex> guard(m_lock);
    Tables& t = active();
    for (SessionRow& row : t.sessions) {
        if (row.session.session_id == session.session_id) {
            row = toRow(session);
            return true;
        }
    }
    return false;
}

std::vector<msg::StoredReading> InMemoryRecordStore::rawRows() const {
    std::lock_guard<Rtos::Mutex> guard(m_lock);
    return m_committed.raw;
}

std::vector<msg::ProcessedRecord> InMemoryRecordStore::processedRows() const {
    std::lock_guard<Rtos::Mutex> guard(m_lock);
    return m_committed.processed;
}

std::vector<msg::ReportSession> InMemoryRecordStore::sessions() const {
    std::lock_guard<Rtos::Mutex> guard(m_lock);
    std::vector<msg::ReportSession> out;
    out.reserve(m_committed.sessions.size());
    for (const SessionRow& row : m_committed.sessions) out.push_back(fromRow(row));
    return out;
}

} // namespace platform
