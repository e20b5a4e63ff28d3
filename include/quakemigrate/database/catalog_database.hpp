#pragma once

/**
 * Event catalog database
 *
 * SQLite storage of triggered candidates, located events, their picks and
 * station magnitudes.
 */

#include "quakemigrate/core/types.hpp"
#include "quakemigrate/core/event.hpp"
#include "quakemigrate/trigger/trigger.hpp"
#include <mutex>
#include <string>
#include <vector>

// Forward declare sqlite3 types
struct sqlite3;
struct sqlite3_stmt;

namespace quakemigrate {

/**
 * CatalogEvent - Summary row of the event table
 */
struct CatalogEvent {
    std::string uid;
    double origin_time;     // epoch seconds
    double x, y, z;
    double coa_value;
    int valid_picks;
    double ml;              // NaN without a magnitude
    uint32_t quality_flags;

    CatalogEvent() : origin_time(0), x(0), y(0), z(0), coa_value(0),
                     valid_picks(0), ml(0), quality_flags(0) {}
};

/**
 * CatalogDatabase - SQLite event catalog
 */
class CatalogDatabase {
public:
    CatalogDatabase();
    ~CatalogDatabase();

    // Prevent copying
    CatalogDatabase(const CatalogDatabase&) = delete;
    CatalogDatabase& operator=(const CatalogDatabase&) = delete;

    // Connection management; open creates the schema if needed
    bool open(const std::string& filename);
    bool isOpen() const { return db_ != nullptr; }
    void close();

    // Storage; an event or trigger already present under the same uid is
    // replaced together with its picks and station magnitudes
    bool storeTriggers(const std::vector<Trigger>& triggers);
    bool storeEvent(const Event& event);

    // Queries
    std::vector<CatalogEvent> queryEvents(TimePoint start, TimePoint end) const;
    int64_t countTriggers() const;
    int64_t countEvents() const;
    int64_t countPicks() const;
    int64_t countStationMagnitudes() const;

    // Last error message
    std::string lastError() const { return last_error_; }

private:
    sqlite3* db_;
    std::string last_error_;
    mutable std::mutex mutex_;

    // Prepared statements
    sqlite3_stmt* stmt_insert_trigger_;
    sqlite3_stmt* stmt_insert_event_;
    sqlite3_stmt* stmt_insert_pick_;
    sqlite3_stmt* stmt_insert_stamag_;

    // Internal helpers (caller holds the mutex)
    bool createSchema();
    bool prepareStatements();
    void finalizeStatements();
    bool insertTrigger(const Trigger& trigger);
    bool insertPick(const std::string& uid, const Pick& pick);
    bool insertStationMagnitude(const std::string& uid, const StationMagnitude& sm);
    bool deleteChildren(const std::string& uid);
    int64_t count(const char* table) const;
    double currentLddate() const;
    bool executeSQL(const char* sql);
    void setError(const std::string& context);
};

} // namespace quakemigrate
