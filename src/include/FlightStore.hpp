#ifndef FLIGHTSTORE_HPP
#define FLIGHTSTORE_HPP

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "PersistenceTask.hpp"

struct sqlite3;

class StorageError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

// One additive schema change. Applied only when the column is missing.
struct ColumnMigration {
    const char* table;
    const char* column;
    const char* type;
};

// SQLite access for the aircraft, flight_session and path relations. Not
// thread safe; owned and driven by the persistence worker thread.
class FlightStore {
   public:
    FlightStore(const std::string& path, double session_inactivity_seconds);
    ~FlightStore();

    FlightStore(const FlightStore&) = delete;
    FlightStore& operator=(const FlightStore&) = delete;

    void apply(const PersistenceTask& task, double now);

    void upsert_aircraft(const UpsertAircraft& task);
    void start_session(const StartSession& task, double now);
    void end_session(const EndSession& task);
    void insert_path(const InsertPath& task);

    // Sets end_time = now on every open session whose aircraft has had no
    // path activity for longer than the inactivity threshold.
    std::size_t close_inactive_sessions(double now);

    std::vector<std::string> columns(const std::string& table) const;
    std::size_t alias_count() const { return session_aliases.size(); }

    static const std::vector<ColumnMigration>& migrations();

   private:
    void exec(const std::string& sql);
    void ensure_schema();
    void apply_migrations();
    std::size_t close_inactive_sessions(double now,
                                        const std::optional<std::string>& address);
    const std::string& resolve(const std::string& session_id) const;
    void forget_aliases(const std::string& closed_session);

    sqlite3* db = nullptr;
    double inactivity_seconds;
    // Session ids started while the aircraft already had an open session,
    // mapped to that session. Dropped once the target session closes.
    std::unordered_map<std::string, std::string> session_aliases;
};

#endif  // FLIGHTSTORE_HPP
