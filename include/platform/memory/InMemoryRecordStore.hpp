#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "os/rtos.hpp"
#include "platform/IRecordStore.hpp"

namespace platform {

// Session table row as the report schema keeps it: kx/ky are text columns.
// Spans are doubles everywhere else; conversion happens only here.
struct SessionRow {
    msg::ReportSession session;   // span_x/span_y unused in storage
    std::string kx;               // empty = NULL
    std::string ky;
};

// ---------------------------------------------------------------------------
//  InMemoryRecordStore
// ---------------------------------------------------------------------------
// Process-local IRecordStore with snapshot transactions: begin() copies the
// committed tables, writes go to the copy, commit() swaps it in.
class InMemoryRecordStore : public IRecordStore {
public:
    InMemoryRecordStore() = default;

    bool begin() override;
    bool commit() override;
    void rollback() override;

    bool appendRaw(const msg::CalibratedReading& reading, uint64_t& id) override;
    bool appendProcessed(msg::ProcessedRecord& record) override;

    bool findOpenSession(const std::string& user, msg::ReportSession& out, bool& found) override;
    bool insertSession(msg::ReportSession& session) override;
    bool updateSession(const msg::ReportSession& session) override;

    // Committed state (copies)
    std::vector<msg::StoredReading> rawRows() const;
    std::vector<msg::ProcessedRecord> processedRows() const;
    std::vector<msg::ReportSession> sessions() const;

    // Fault injection: the next commit() fails and rolls back.
    void failNextCommit() { m_fail_next_commit = true; }

    bool inTransaction() const { return m_in_txn; }

private:
    struct Tables {
        std::vector<msg::StoredReading> raw;
        std::vector<msg::ProcessedRecord> processed;
        std::vector<SessionRow> sessions;
        uint64_t next_raw_id = 1;
        uint64_t next_processed_id = 1;
        uint64_t next_session_id = 1;
    };

    Tables& active() { return m_in_txn ? m_work : m_committed; }

    static SessionRow toRow(const msg::ReportSession& s);
    static msg::ReportSession fromRow(const SessionRow& row);

    mutable Rtos::Mutex m_lock;
    Tables m_committed;
    Tables m_work;
    bool m_in_txn = false;
    bool m_fail_next_commit = false;
};

} // namespace platform
