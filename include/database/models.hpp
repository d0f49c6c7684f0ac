#pragma once

#include <sqlite_orm/sqlite_orm.h>
#include <string>
#include <cstdint>
#include <chrono>

namespace extender {
namespace db {

// Journaled status event
struct StatusEventRecord {
    int64_t id;
    int64_t sequence;
    int64_t timestamp_ms;   // Unix timestamp in milliseconds
    std::string type;       // e.g. "ConnectionStateChanged"
    std::string reason;     // reason code, "None" when not applicable
    std::string details;    // JSON document with the full new value

    StatusEventRecord() : id(0), sequence(0), timestamp_ms(0) {}

    StatusEventRecord(int64_t id, int64_t sequence, int64_t timestamp_ms,
                      const std::string& type, const std::string& reason,
                      const std::string& details)
        : id(id), sequence(sequence), timestamp_ms(timestamp_ms),
          type(type), reason(reason), details(details) {}
};

// Define the storage schema using sqlite_orm
inline auto initStorage(const std::string& path) {
    using namespace sqlite_orm;

    return make_storage(
        path,
        make_index("idx_status_events_sequence", &StatusEventRecord::sequence),
        make_table(
            "status_events",
            make_column("id", &StatusEventRecord::id, primary_key().autoincrement()),
            make_column("sequence", &StatusEventRecord::sequence, unique()),
            make_column("timestamp_ms", &StatusEventRecord::timestamp_ms),
            make_column("type", &StatusEventRecord::type),
            make_column("reason", &StatusEventRecord::reason, default_value("None")),
            make_column("details", &StatusEventRecord::details, default_value("{}"))
        )
    );
}

// Define storage type for convenience
using Storage = decltype(initStorage(""));

inline int64_t getCurrentTimestampMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

} // namespace db
} // namespace extender
