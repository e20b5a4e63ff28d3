/**
 * Event Catalog Database Implementation
 *
 * SQLite storage for triggers, located events, picks and station magnitudes.
 */

#include "quakemigrate/database/catalog_database.hpp"
#include <sqlite3.h>
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>

namespace quakemigrate {

namespace {

const char* CREATE_TRIGGER_SQL = R"(
CREATE TABLE IF NOT EXISTS triggered (
    uid         TEXT PRIMARY KEY,
    event_num   INTEGER NOT NULL,
    peak_time   REAL NOT NULL,
    coa_value   REAL NOT NULL,
    coa_norm    REAL NOT NULL,
    x           REAL NOT NULL,
    y           REAL NOT NULL,
    z           REAL NOT NULL,
    min_time    REAL NOT NULL,
    max_time    REAL NOT NULL,
    threshold   REAL NOT NULL,
    lddate      REAL NOT NULL
);
CREATE INDEX IF NOT EXISTS trigger_time_idx ON triggered(peak_time);
)";

const char* CREATE_EVENT_SQL = R"(
CREATE TABLE IF NOT EXISTS event (
    uid             TEXT PRIMARY KEY,
    trigger_num     INTEGER NOT NULL,
    trigger_time    REAL NOT NULL,
    origin_time     REAL NOT NULL,
    refined_time    REAL NOT NULL,
    coa_value       REAL NOT NULL,
    coa_norm        REAL NOT NULL,
    contributors    INTEGER NOT NULL,
    x               REAL NOT NULL,
    y               REAL NOT NULL,
    z               REAL NOT NULL,
    err_x           REAL NOT NULL,
    err_y           REAL NOT NULL,
    err_z           REAL NOT NULL,
    gau_x           REAL,
    gau_y           REAL,
    gau_z           REAL,
    cov_x           REAL,
    cov_y           REAL,
    cov_z           REAL,
    lat             REAL,
    lon             REAL,
    depth           REAL,
    quality         INTEGER NOT NULL,
    ml              REAL,
    ml_err          REAL,
    ml_nsta         INTEGER,
    lddate          REAL NOT NULL
);
CREATE INDEX IF NOT EXISTS event_time_idx ON event(origin_time);
)";

const char* CREATE_PICK_SQL = R"(
CREATE TABLE IF NOT EXISTS pick (
    uid             TEXT NOT NULL REFERENCES event(uid) ON DELETE CASCADE,
    station         TEXT NOT NULL,
    phase           TEXT NOT NULL,
    modelled_time   REAL NOT NULL,
    pick_time       REAL NOT NULL,
    uncertainty     REAL NOT NULL,
    snr             REAL NOT NULL,
    amplitude       REAL NOT NULL,
    sigma           REAL NOT NULL,
    valid           INTEGER NOT NULL,
    status          TEXT NOT NULL,
    PRIMARY KEY (uid, station, phase)
);
)";

const char* CREATE_STAMAG_SQL = R"(
CREATE TABLE IF NOT EXISTS stamag (
    uid         TEXT NOT NULL REFERENCES event(uid) ON DELETE CASCADE,
    stream      TEXT NOT NULL,
    epi_dist    REAL NOT NULL,
    hyp_dist    REAL NOT NULL,
    amplitude   REAL NOT NULL,
    period      REAL NOT NULL,
    noise       REAL NOT NULL,
    magnitude   REAL NOT NULL,
    correction  REAL NOT NULL,
    used        INTEGER NOT NULL,
    PRIMARY KEY (uid, stream)
);
)";

double toEpoch(TimePoint t) {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        t.time_since_epoch()).count() / 1e6;
}

void bindEstimate(sqlite3_stmt* stmt, int first, const LocationEstimate& est) {
    for (int axis = 0; axis < 3; axis++) {
        if (est.valid) {
            sqlite3_bind_double(stmt, first + axis, est.position[axis]);
        } else {
            sqlite3_bind_null(stmt, first + axis);
        }
    }
}

} // namespace

CatalogDatabase::CatalogDatabase()
    : db_(nullptr)
    , stmt_insert_trigger_(nullptr)
    , stmt_insert_event_(nullptr)
    , stmt_insert_pick_(nullptr)
    , stmt_insert_stamag_(nullptr)
{
}

CatalogDatabase::~CatalogDatabase() {
    close();
}

bool CatalogDatabase::open(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (db_) {
        close();
    }

    int rc = sqlite3_open(filename.c_str(), &db_);
    if (rc != SQLITE_OK) {
        setError("Failed to open database " + filename);
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    executeSQL("PRAGMA foreign_keys = ON;");

    // Performance settings
    executeSQL("PRAGMA journal_mode = WAL;");
    executeSQL("PRAGMA synchronous = NORMAL;");

    if (!createSchema() || !prepareStatements()) {
        close();
        return false;
    }

    return true;
}

void CatalogDatabase::close() {
    if (db_) {
        finalizeStatements();
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool CatalogDatabase::createSchema() {
    if (!executeSQL(CREATE_TRIGGER_SQL)) return false;
    if (!executeSQL(CREATE_EVENT_SQL)) return false;
    if (!executeSQL(CREATE_PICK_SQL)) return false;
    if (!executeSQL(CREATE_STAMAG_SQL)) return false;
    return true;
}

bool CatalogDatabase::prepareStatements() {
    const char* trigger_sql =
        "INSERT OR REPLACE INTO triggered (uid, event_num, peak_time, coa_value, coa_norm, "
        "x, y, z, min_time, max_time, threshold, lddate) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";
    if (sqlite3_prepare_v2(db_, trigger_sql, -1, &stmt_insert_trigger_, nullptr) != SQLITE_OK) {
        setError("Failed to prepare trigger insert");
        return false;
    }

    const char* event_sql =
        "INSERT OR REPLACE INTO event (uid, trigger_num, trigger_time, origin_time, "
        "refined_time, coa_value, coa_norm, contributors, x, y, z, err_x, err_y, err_z, "
        "gau_x, gau_y, gau_z, cov_x, cov_y, cov_z, lat, lon, depth, quality, "
        "ml, ml_err, ml_nsta, lddate) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, "
        "?, ?, ?, ?)";
    if (sqlite3_prepare_v2(db_, event_sql, -1, &stmt_insert_event_, nullptr) != SQLITE_OK) {
        setError("Failed to prepare event insert");
        return false;
    }

    const char* pick_sql =
        "INSERT INTO pick (uid, station, phase, modelled_time, pick_time, uncertainty, "
        "snr, amplitude, sigma, valid, status) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";
    if (sqlite3_prepare_v2(db_, pick_sql, -1, &stmt_insert_pick_, nullptr) != SQLITE_OK) {
        setError("Failed to prepare pick insert");
        return false;
    }

    const char* stamag_sql =
        "INSERT INTO stamag (uid, stream, epi_dist, hyp_dist, amplitude, period, noise, "
        "magnitude, correction, used) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";
    if (sqlite3_prepare_v2(db_, stamag_sql, -1, &stmt_insert_stamag_, nullptr) != SQLITE_OK) {
        setError("Failed to prepare stamag insert");
        return false;
    }

    return true;
}

void CatalogDatabase::finalizeStatements() {
    sqlite3_stmt** stmts[] = {
        &stmt_insert_trigger_, &stmt_insert_event_,
        &stmt_insert_pick_, &stmt_insert_stamag_
    };
    for (auto stmt : stmts) {
        if (*stmt) {
            sqlite3_finalize(*stmt);
            *stmt = nullptr;
        }
    }
}

bool CatalogDatabase::storeTriggers(const std::vector<Trigger>& triggers) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return false;

    if (!executeSQL("BEGIN TRANSACTION")) return false;
    for (const auto& trigger : triggers) {
        if (!insertTrigger(trigger)) {
            executeSQL("ROLLBACK");
            return false;
        }
    }
    return executeSQL("COMMIT");
}

bool CatalogDatabase::insertTrigger(const Trigger& trigger) {
    sqlite3_reset(stmt_insert_trigger_);
    sqlite3_bind_text(stmt_insert_trigger_, 1, trigger.uid.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt_insert_trigger_, 2, trigger.event_num);
    sqlite3_bind_double(stmt_insert_trigger_, 3, toEpoch(trigger.peak_time));
    sqlite3_bind_double(stmt_insert_trigger_, 4, trigger.peak_value);
    sqlite3_bind_double(stmt_insert_trigger_, 5, trigger.peak_normalised);
    sqlite3_bind_double(stmt_insert_trigger_, 6, trigger.position.x);
    sqlite3_bind_double(stmt_insert_trigger_, 7, trigger.position.y);
    sqlite3_bind_double(stmt_insert_trigger_, 8, trigger.position.z);
    sqlite3_bind_double(stmt_insert_trigger_, 9, toEpoch(trigger.start_time));
    sqlite3_bind_double(stmt_insert_trigger_, 10, toEpoch(trigger.end_time));
    sqlite3_bind_double(stmt_insert_trigger_, 11, trigger.threshold);
    sqlite3_bind_double(stmt_insert_trigger_, 12, currentLddate());

    if (sqlite3_step(stmt_insert_trigger_) != SQLITE_DONE) {
        setError("Failed to insert trigger " + trigger.uid);
        return false;
    }
    return true;
}

bool CatalogDatabase::storeEvent(const Event& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return false;

    if (!executeSQL("BEGIN TRANSACTION")) return false;

    if (!deleteChildren(event.uid)) {
        executeSQL("ROLLBACK");
        return false;
    }

    sqlite3_stmt* stmt = stmt_insert_event_;
    sqlite3_reset(stmt);
    sqlite3_bind_text(stmt, 1, event.uid.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 2, event.trigger_num);
    sqlite3_bind_double(stmt, 3, toEpoch(event.trigger_time));
    sqlite3_bind_double(stmt, 4, toEpoch(event.origin_time));
    sqlite3_bind_double(stmt, 5, toEpoch(event.refined_origin_time));
    sqlite3_bind_double(stmt, 6, event.coa_value);
    sqlite3_bind_double(stmt, 7, event.coa_normalised);
    sqlite3_bind_int(stmt, 8, event.contributors);
    sqlite3_bind_double(stmt, 9, event.spline.position.x);
    sqlite3_bind_double(stmt, 10, event.spline.position.y);
    sqlite3_bind_double(stmt, 11, event.spline.position.z);
    sqlite3_bind_double(stmt, 12, event.spline.uncertainty.x);
    sqlite3_bind_double(stmt, 13, event.spline.uncertainty.y);
    sqlite3_bind_double(stmt, 14, event.spline.uncertainty.z);
    bindEstimate(stmt, 15, event.gaussian);
    bindEstimate(stmt, 18, event.covariance);
    if (event.has_geographic) {
        sqlite3_bind_double(stmt, 21, event.geographic.latitude);
        sqlite3_bind_double(stmt, 22, event.geographic.longitude);
        sqlite3_bind_double(stmt, 23, event.geographic.depth);
    } else {
        sqlite3_bind_null(stmt, 21);
        sqlite3_bind_null(stmt, 22);
        sqlite3_bind_null(stmt, 23);
    }
    sqlite3_bind_int64(stmt, 24, event.quality_flags);
    if (event.magnitude && event.magnitude->valid()) {
        sqlite3_bind_double(stmt, 25, event.magnitude->value);
        sqlite3_bind_double(stmt, 26, event.magnitude->uncertainty);
        sqlite3_bind_int(stmt, 27, event.magnitude->station_count);
    } else {
        sqlite3_bind_null(stmt, 25);
        sqlite3_bind_null(stmt, 26);
        sqlite3_bind_null(stmt, 27);
    }
    sqlite3_bind_double(stmt, 28, currentLddate());

    if (sqlite3_step(stmt) != SQLITE_DONE) {
        setError("Failed to insert event " + event.uid);
        executeSQL("ROLLBACK");
        return false;
    }

    for (const auto& pick : event.picks) {
        if (!insertPick(event.uid, pick)) {
            executeSQL("ROLLBACK");
            return false;
        }
    }

    if (event.magnitude) {
        for (const auto& sm : event.magnitude->station_magnitudes) {
            if (!insertStationMagnitude(event.uid, sm)) {
                executeSQL("ROLLBACK");
                return false;
            }
        }
    }

    return executeSQL("COMMIT");
}

bool CatalogDatabase::insertPick(const std::string& uid, const Pick& pick) {
    std::string phase = phaseTypeToString(pick.phase);
    std::string status = pickStatusToString(pick.status);

    sqlite3_reset(stmt_insert_pick_);
    sqlite3_bind_text(stmt_insert_pick_, 1, uid.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_pick_, 2, pick.station.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_pick_, 3, phase.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt_insert_pick_, 4, toEpoch(pick.modelled_time));
    sqlite3_bind_double(stmt_insert_pick_, 5, toEpoch(pick.time));
    sqlite3_bind_double(stmt_insert_pick_, 6, pick.uncertainty);
    sqlite3_bind_double(stmt_insert_pick_, 7, pick.snr);
    sqlite3_bind_double(stmt_insert_pick_, 8, pick.amplitude);
    sqlite3_bind_double(stmt_insert_pick_, 9, pick.sigma);
    sqlite3_bind_int(stmt_insert_pick_, 10, pick.valid ? 1 : 0);
    sqlite3_bind_text(stmt_insert_pick_, 11, status.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt_insert_pick_) != SQLITE_DONE) {
        setError("Failed to insert pick " + pick.station + " " + phase);
        return false;
    }
    return true;
}

bool CatalogDatabase::insertStationMagnitude(const std::string& uid,
                                             const StationMagnitude& sm) {
    std::string stream = sm.stream_id.toString();

    sqlite3_reset(stmt_insert_stamag_);
    sqlite3_bind_text(stmt_insert_stamag_, 1, uid.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_stamag_, 2, stream.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt_insert_stamag_, 3, sm.epicentral_distance);
    sqlite3_bind_double(stmt_insert_stamag_, 4, sm.hypocentral_distance);
    sqlite3_bind_double(stmt_insert_stamag_, 5, sm.amplitude);
    sqlite3_bind_double(stmt_insert_stamag_, 6, sm.period);
    sqlite3_bind_double(stmt_insert_stamag_, 7, sm.noise_amplitude);
    sqlite3_bind_double(stmt_insert_stamag_, 8, sm.magnitude);
    sqlite3_bind_double(stmt_insert_stamag_, 9, sm.correction);
    sqlite3_bind_int(stmt_insert_stamag_, 10, sm.used ? 1 : 0);

    if (sqlite3_step(stmt_insert_stamag_) != SQLITE_DONE) {
        setError("Failed to insert stamag " + stream);
        return false;
    }
    return true;
}

bool CatalogDatabase::deleteChildren(const std::string& uid) {
    const char* tables[] = {"pick", "stamag"};
    for (const char* table : tables) {
        std::string sql = std::string("DELETE FROM ") + table + " WHERE uid = ?";
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            setError("Failed to prepare delete from " + std::string(table));
            return false;
        }
        sqlite3_bind_text(stmt, 1, uid.c_str(), -1, SQLITE_TRANSIENT);
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            setError("Failed to delete from " + std::string(table));
            return false;
        }
    }
    return true;
}

std::vector<CatalogEvent> CatalogDatabase::queryEvents(TimePoint start, TimePoint end) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CatalogEvent> events;
    if (!db_) return events;

    const char* sql =
        "SELECT e.uid, e.origin_time, e.x, e.y, e.z, e.coa_value, e.ml, e.quality, "
        "(SELECT COUNT(*) FROM pick p WHERE p.uid = e.uid AND p.valid = 1) "
        "FROM event e WHERE e.origin_time >= ? AND e.origin_time < ? "
        "ORDER BY e.origin_time";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "CatalogDatabase error: Failed to prepare event query: "
                  << sqlite3_errmsg(db_) << std::endl;
        return events;
    }
    sqlite3_bind_double(stmt, 1, toEpoch(start));
    sqlite3_bind_double(stmt, 2, toEpoch(end));

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        CatalogEvent row;
        const unsigned char* uid = sqlite3_column_text(stmt, 0);
        if (uid) row.uid = reinterpret_cast<const char*>(uid);
        row.origin_time = sqlite3_column_double(stmt, 1);
        row.x = sqlite3_column_double(stmt, 2);
        row.y = sqlite3_column_double(stmt, 3);
        row.z = sqlite3_column_double(stmt, 4);
        row.coa_value = sqlite3_column_double(stmt, 5);
        row.ml = sqlite3_column_type(stmt, 6) == SQLITE_NULL
               ? std::numeric_limits<double>::quiet_NaN()
               : sqlite3_column_double(stmt, 6);
        row.quality_flags = static_cast<uint32_t>(sqlite3_column_int64(stmt, 7));
        row.valid_picks = sqlite3_column_int(stmt, 8);
        events.push_back(row);
    }
    sqlite3_finalize(stmt);
    return events;
}

int64_t CatalogDatabase::count(const char* table) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return 0;

    std::string sql = std::string("SELECT COUNT(*) FROM ") + table;
    sqlite3_stmt* stmt = nullptr;
    int64_t n = 0;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            n = sqlite3_column_int64(stmt, 0);
        }
        sqlite3_finalize(stmt);
    }
    return n;
}

int64_t CatalogDatabase::countTriggers() const { return count("triggered"); }
int64_t CatalogDatabase::countEvents() const { return count("event"); }
int64_t CatalogDatabase::countPicks() const { return count("pick"); }
int64_t CatalogDatabase::countStationMagnitudes() const { return count("stamag"); }

double CatalogDatabase::currentLddate() const {
    return toEpoch(std::chrono::system_clock::now());
}

bool CatalogDatabase::executeSQL(const char* sql) {
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        last_error_ = errmsg ? errmsg : "Unknown error";
        std::cerr << "CatalogDatabase error: " << last_error_ << std::endl;
        sqlite3_free(errmsg);
        return false;
    }
    return true;
}

void CatalogDatabase::setError(const std::string& context) {
    last_error_ = context + ": " + (db_ ? sqlite3_errmsg(db_) : "no connection");
    std::cerr << "CatalogDatabase error: " << last_error_ << std::endl;
}

} // namespace quakemigrate
