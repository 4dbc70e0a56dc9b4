#include "FlightStore.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <utility>

namespace {

const char* kBaseSchema = R"sql(
CREATE TABLE IF NOT EXISTS aircraft (
    address TEXT PRIMARY KEY,
    callsign TEXT,
    first_seen REAL,
    last_seen REAL
);
CREATE TABLE IF NOT EXISTS flight_session (
    id TEXT PRIMARY KEY,
    aircraft_address TEXT,
    start_time REAL,
    end_time REAL,
    FOREIGN KEY (aircraft_address) REFERENCES aircraft(address)
);
CREATE INDEX IF NOT EXISTS idx_flight_session_aircraft
    ON flight_session(aircraft_address);
CREATE TABLE IF NOT EXISTS path (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    session_id TEXT,
    address TEXT,
    ts REAL,
    ts_iso TEXT,
    lat REAL,
    lon REAL,
    alt REAL,
    FOREIGN KEY (session_id) REFERENCES flight_session(id),
    FOREIGN KEY (address) REFERENCES aircraft(address)
);
CREATE INDEX IF NOT EXISTS idx_path_address_ts ON path(address, ts);
)sql";

class Statement {
   public:
    Statement(sqlite3* db, const char* sql) : db(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw StorageError(std::string("prepare failed: ") +
                               sqlite3_errmsg(db));
        }
    }
    ~Statement() { sqlite3_finalize(stmt); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, double value) {
        check(sqlite3_bind_double(stmt, index, value));
    }
    void bind(int index, const std::string& value) {
        check(sqlite3_bind_text(stmt, index, value.c_str(),
                                static_cast<int>(value.size()),
                                SQLITE_TRANSIENT));
    }
    void bind(int index, const std::optional<double>& value) {
        value ? bind(index, *value) : bind_null(index);
    }
    void bind(int index, const std::optional<int>& value) {
        value ? check(sqlite3_bind_int(stmt, index, *value)) : bind_null(index);
    }
    void bind(int index, const std::optional<std::string>& value) {
        value ? bind(index, *value) : bind_null(index);
    }
    void bind_null(int index) { check(sqlite3_bind_null(stmt, index)); }

    // True while rows remain.
    bool step() {
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc != SQLITE_DONE) {
            throw StorageError(std::string("step failed: ") +
                               sqlite3_errmsg(db));
        }
        return false;
    }

    bool is_null(int column) const {
        return sqlite3_column_type(stmt, column) == SQLITE_NULL;
    }
    double column_double(int column) const {
        return sqlite3_column_double(stmt, column);
    }
    std::string column_text(int column) const {
        const unsigned char* text = sqlite3_column_text(stmt, column);
        return text ? reinterpret_cast<const char*>(text) : "";
    }

   private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw StorageError(std::string("bind failed: ") +
                               sqlite3_errmsg(db));
        }
    }

    sqlite3* db;
    sqlite3_stmt* stmt = nullptr;
};

void ensure_parent_directory(const std::string& path) {
    if (path == ":memory:" || path.rfind("file:", 0) == 0) {
        return;
    }
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        std::cerr << "Failed to ensure directory for " << path << ": "
                  << ec.message() << std::endl;
    }
}

}  // namespace

FlightStore::FlightStore(const std::string& path,
                         double session_inactivity_seconds)
    : inactivity_seconds(session_inactivity_seconds) {
    ensure_parent_directory(path);

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_URI;
    if (sqlite3_open_v2(path.c_str(), &db, flags, nullptr) != SQLITE_OK) {
        std::string message =
            db ? sqlite3_errmsg(db) : "out of memory opening database";
        sqlite3_close(db);
        db = nullptr;
        throw StorageError("cannot open " + path + ": " + message);
    }

    try {
        exec("PRAGMA journal_mode=WAL;");
        ensure_schema();
    } catch (const StorageError&) {
        sqlite3_close(db);
        db = nullptr;
        throw;
    }
}

FlightStore::~FlightStore() {
    if (db != nullptr) {
        sqlite3_close(db);
    }
}

const std::vector<ColumnMigration>& FlightStore::migrations() {
    // Ordered; append only.
    static const std::vector<ColumnMigration> list = {
        {"path", "velocity", "REAL"},
        {"path", "track", "REAL"},
        {"path", "vertical_rate", "REAL"},
        {"path", "type", "TEXT"},
        {"aircraft", "assembly_time_ms", "REAL"},
        {"aircraft", "stale_cpr_count", "INTEGER"},
    };
    return list;
}

void FlightStore::exec(const std::string& sql) {
    char* error = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : sqlite3_errmsg(db);
        sqlite3_free(error);
        throw StorageError(message);
    }
}

void FlightStore::ensure_schema() {
    exec(kBaseSchema);
    apply_migrations();
}

void FlightStore::apply_migrations() {
    for (const auto& migration : migrations()) {
        auto existing = columns(migration.table);
        if (std::find(existing.begin(), existing.end(), migration.column) !=
            existing.end()) {
            continue;
        }
        try {
            exec(std::string("ALTER TABLE ") + migration.table +
                 " ADD COLUMN " + migration.column + " " + migration.type);
            std::cout << "Added column " << migration.table << "."
                      << migration.column << std::endl;
        } catch (const StorageError& e) {
            std::cerr << "Failed to add " << migration.column << " column to "
                      << migration.table << ": " << e.what() << std::endl;
        }
    }
}

std::vector<std::string> FlightStore::columns(const std::string& table) const {
    std::string sql = "PRAGMA table_info(" + table + ")";
    Statement stmt(db, sql.c_str());
    std::vector<std::string> names;
    while (stmt.step()) {
        names.push_back(stmt.column_text(1));
    }
    return names;
}

void FlightStore::apply(const PersistenceTask& task, double now) {
    if (auto upsert = std::get_if<UpsertAircraft>(&task)) {
        upsert_aircraft(*upsert);
    } else if (auto start = std::get_if<StartSession>(&task)) {
        start_session(*start, now);
    } else if (auto end = std::get_if<EndSession>(&task)) {
        end_session(*end);
    } else if (auto path = std::get_if<InsertPath>(&task)) {
        insert_path(*path);
    }
}

void FlightStore::upsert_aircraft(const UpsertAircraft& task) {
    Statement stmt(db,
                   "INSERT INTO aircraft (address, callsign, first_seen, "
                   "last_seen, assembly_time_ms, stale_cpr_count) "
                   "VALUES (?1, ?2, ?3, ?4, ?5, ?6) "
                   "ON CONFLICT(address) DO UPDATE SET "
                   "callsign = COALESCE(excluded.callsign, aircraft.callsign), "
                   "last_seen = excluded.last_seen, "
                   "assembly_time_ms = COALESCE(excluded.assembly_time_ms, "
                   "aircraft.assembly_time_ms), "
                   "stale_cpr_count = COALESCE(excluded.stale_cpr_count, "
                   "aircraft.stale_cpr_count)");
    stmt.bind(1, task.address);
    stmt.bind(2, task.callsign);
    stmt.bind(3, task.first_seen);
    stmt.bind(4, task.last_update);
    stmt.bind(5, task.assembly_time_ms);
    stmt.bind(6, task.stale_cpr_count);
    stmt.step();
}

void FlightStore::start_session(const StartSession& task, double now) {
    if (session_aliases.count(task.session_id) > 0) {
        return;
    }
    {
        Statement known(db, "SELECT 1 FROM flight_session WHERE id = ?1");
        known.bind(1, task.session_id);
        if (known.step()) {
            return;
        }
    }

    close_inactive_sessions(std::max(now, task.start_time), task.address);

    Statement open_session(db,
                           "SELECT id FROM flight_session "
                           "WHERE aircraft_address = ?1 AND end_time IS NULL "
                           "LIMIT 1");
    open_session.bind(1, task.address);
    if (open_session.step()) {
        std::string running = open_session.column_text(0);
        session_aliases[task.session_id] = running;
        std::cout << "Continuing open session " << running << " for "
                  << task.address << std::endl;
        return;
    }

    Statement insert(db,
                     "INSERT OR IGNORE INTO flight_session "
                     "(id, aircraft_address, start_time) VALUES (?1, ?2, ?3)");
    insert.bind(1, task.session_id);
    insert.bind(2, task.address);
    insert.bind(3, task.start_time);
    insert.step();
}

void FlightStore::end_session(const EndSession& task) {
    std::string target = resolve(task.session_id);
    Statement stmt(db, "UPDATE flight_session SET end_time = ?2 WHERE id = ?1");
    stmt.bind(1, target);
    stmt.bind(2, task.end_time);
    stmt.step();
    forget_aliases(target);
}

void FlightStore::insert_path(const InsertPath& task) {
    Statement stmt(db,
                   "INSERT INTO path (session_id, address, ts, ts_iso, lat, "
                   "lon, alt, velocity, track, vertical_rate, type) "
                   "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11)");
    stmt.bind(1, resolve(task.session_id));
    stmt.bind(2, task.address);
    stmt.bind(3, task.ts);
    stmt.bind(4, task.ts_iso);
    stmt.bind(5, task.lat);
    stmt.bind(6, task.lon);
    stmt.bind(7, task.alt);
    stmt.bind(8, task.speed);
    stmt.bind(9, task.track);
    stmt.bind(10, task.vertical_rate);
    stmt.bind(11, task.velocity_type);
    stmt.step();
}

std::size_t FlightStore::close_inactive_sessions(double now) {
    return close_inactive_sessions(now, std::nullopt);
}

std::size_t FlightStore::close_inactive_sessions(
    double now, const std::optional<std::string>& address) {
    std::string sql =
        "SELECT s.id, s.aircraft_address, s.start_time, "
        "(SELECT MAX(p.ts) FROM path p WHERE p.address = s.aircraft_address) "
        "FROM flight_session s WHERE s.end_time IS NULL";
    if (address) {
        sql += " AND s.aircraft_address = ?1";
    }

    std::vector<std::pair<std::string, std::string>> expired;
    {
        Statement select(db, sql.c_str());
        if (address) {
            select.bind(1, *address);
        }
        while (select.step()) {
            double last_activity = select.column_double(2);
            if (!select.is_null(3)) {
                last_activity = std::max(last_activity, select.column_double(3));
            }
            if (now - last_activity > inactivity_seconds) {
                expired.emplace_back(select.column_text(0),
                                     select.column_text(1));
            }
        }
    }

    for (const auto& session : expired) {
        Statement update(db,
                         "UPDATE flight_session SET end_time = ?2 WHERE id = ?1");
        update.bind(1, session.first);
        update.bind(2, now);
        update.step();
        forget_aliases(session.first);
        std::cout << "Closed inactive session " << session.first << " for "
                  << session.second << std::endl;
    }
    return expired.size();
}

const std::string& FlightStore::resolve(const std::string& session_id) const {
    auto it = session_aliases.find(session_id);
    return it == session_aliases.end() ? session_id : it->second;
}

void FlightStore::forget_aliases(const std::string& closed_session) {
    for (auto it = session_aliases.begin(); it != session_aliases.end();) {
        if (it->second == closed_session) {
            it = session_aliases.erase(it);
        } else {
            ++it;
        }
    }
}
