#pragma once
#include <cstdint>
#include <string>

#include "msg/RangeReading.hpp"
#include "msg/PositionRecord.hpp"
#include "msg/ReportSession.hpp"

namespace platform {

// Storage collaborator. Any engine will do as long as begin()..commit() is atomic:
// after rollback() (or a failed commit()) none of the writes since begin() are visible.
// Outside begin()/commit() every write applies immediately.
class IRecordStore {
public:
    virtual bool begin() = 0;
    virtual bool commit() = 0;
    virtual void rollback() = 0;

    virtual bool appendRaw(const msg::CalibratedReading& reading, uint64_t& id) = 0;
    virtual bool appendProcessed(msg::ProcessedRecord& record) = 0;   // fills record.id

    // Most recent session of 'user' that has no end time.
    // Returns false only on a storage fault; 'found' tells whether 'out' was filled.
    virtual bool findOpenSession(const std::string& user, msg::ReportSession& out, bool& found) = 0;
    virtual bool insertSession(msg::ReportSession& session) = 0;      // fills session_id
    virtual bool updateSession(const msg::ReportSession& session) = 0;

    virtual ~IRecordStore() = default;
};

} // namespace platform
