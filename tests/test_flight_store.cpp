#include <gtest/gtest.h>

#include <algorithm>

#include "FlightStore.hpp"
#include "TempDatabase.hpp"

namespace {

bool has_column(const std::vector<std::string>& columns, const char* name) {
    return std::find(columns.begin(), columns.end(), name) != columns.end();
}

InsertPath point(const std::string& session, double ts) {
    InsertPath task;
    task.session_id = session;
    task.address = "ABC123";
    task.ts = ts;
    task.ts_iso = "1970-01-01T00:00:00.000000+00:00";
    task.lat = 52.0;
    task.lon = 4.0;
    task.alt = 36000.0;
    return task;
}

}  // namespace

TEST(FlightStore, CreatesFullSchema) {
    TempDatabase temp;
    FlightStore store(temp.path(), 300.0);

    auto path_columns = store.columns("path");
    for (const char* name : {"session_id", "address", "ts", "ts_iso", "lat",
                             "lon", "alt", "velocity", "track",
                             "vertical_rate", "type"}) {
        EXPECT_TRUE(has_column(path_columns, name)) << name;
    }
    auto aircraft_columns = store.columns("aircraft");
    EXPECT_TRUE(has_column(aircraft_columns, "assembly_time_ms"));
    EXPECT_TRUE(has_column(aircraft_columns, "stale_cpr_count"));

    auto mode = temp.query("PRAGMA journal_mode");
    ASSERT_EQ(mode.size(), 1u);
    EXPECT_EQ(mode[0][0], "wal");
}

TEST(FlightStore, MigratesOlderDatabase) {
    TempDatabase temp;
    temp.execute(
        "CREATE TABLE aircraft (address TEXT PRIMARY KEY, callsign TEXT, "
        "first_seen REAL, last_seen REAL);"
        "CREATE TABLE flight_session (id TEXT PRIMARY KEY, "
        "aircraft_address TEXT, start_time REAL, end_time REAL);"
        "CREATE TABLE path (id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "session_id TEXT, address TEXT, ts REAL, ts_iso TEXT, lat REAL, "
        "lon REAL, alt REAL);"
        "INSERT INTO path (session_id, address, ts, ts_iso, lat, lon, alt) "
        "VALUES ('S', 'ABC123', 1.0, 'x', 52.0, 4.0, 1000.0);");

    {
        FlightStore store(temp.path(), 300.0);
        EXPECT_TRUE(has_column(store.columns("path"), "vertical_rate"));
        EXPECT_TRUE(has_column(store.columns("aircraft"), "stale_cpr_count"));
    }

    auto rows = temp.query("SELECT address, alt, velocity FROM path");
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0][0], "ABC123");
    EXPECT_EQ(rows[0][2], "NULL");

    // Reopening an up to date database is a no-op.
    EXPECT_NO_THROW(FlightStore reopened(temp.path(), 300.0));
}

TEST(FlightStore, UpsertKeepsKnownFields) {
    TempDatabase temp;
    FlightStore store(temp.path(), 300.0);

    store.upsert_aircraft(
        UpsertAircraft{"ABC123", std::string("KLM1023"), 10.0, 20.0, 1500.0, 2});
    store.upsert_aircraft(
        UpsertAircraft{"ABC123", std::nullopt, 5.0, 30.0, std::nullopt, 3});

    auto rows = temp.query(
        "SELECT callsign, first_seen, last_seen, assembly_time_ms, "
        "stale_cpr_count FROM aircraft");
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0][0], "KLM1023");
    EXPECT_DOUBLE_EQ(std::stod(rows[0][1]), 10.0);
    EXPECT_DOUBLE_EQ(std::stod(rows[0][2]), 30.0);
    EXPECT_DOUBLE_EQ(std::stod(rows[0][3]), 1500.0);
    EXPECT_EQ(rows[0][4], "3");
}

TEST(FlightStore, SweepClosesOnlyInactiveSessions) {
    TempDatabase temp;
    FlightStore store(temp.path(), 300.0);

    store.start_session(StartSession{"S", "ABC123", 0.0}, 0.0);
    store.insert_path(point("S", 100.0));
    store.insert_path(point("S", 200.0));

    EXPECT_EQ(store.close_inactive_sessions(400.0), 0u);
    EXPECT_EQ(temp.query("SELECT end_time FROM flight_session")[0][0], "NULL");

    EXPECT_EQ(store.close_inactive_sessions(501.0), 1u);
    auto rows = temp.query("SELECT end_time FROM flight_session");
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_DOUBLE_EQ(std::stod(rows[0][0]), 501.0);

    EXPECT_EQ(store.close_inactive_sessions(900.0), 0u);
}

TEST(FlightStore, SessionWithoutPathsUsesStartTime) {
    TempDatabase temp;
    FlightStore store(temp.path(), 300.0);

    store.start_session(StartSession{"S", "ABC123", 1000.0}, 1000.0);
    EXPECT_EQ(store.close_inactive_sessions(1200.0), 0u);
    EXPECT_EQ(store.close_inactive_sessions(1301.0), 1u);
}

TEST(FlightStore, StartWhileOpenContinuesExistingSession) {
    TempDatabase temp;
    FlightStore store(temp.path(), 300.0);

    store.start_session(StartSession{"S1", "ABC123", 0.0}, 0.0);
    store.insert_path(point("S1", 10.0));

    store.start_session(StartSession{"S2", "ABC123", 100.0}, 100.0);
    store.insert_path(point("S2", 100.0));

    auto sessions = temp.query("SELECT id FROM flight_session");
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions[0][0], "S1");
    auto paths = temp.query("SELECT DISTINCT session_id FROM path");
    ASSERT_EQ(paths.size(), 1u);
    EXPECT_EQ(paths[0][0], "S1");

    store.start_session(StartSession{"S3", "ABC123", 1000.0}, 1000.0);
    auto rows = temp.query(
        "SELECT id, end_time FROM flight_session ORDER BY start_time");
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0][0], "S1");
    EXPECT_DOUBLE_EQ(std::stod(rows[0][1]), 1000.0);
    EXPECT_EQ(rows[1][0], "S3");
    EXPECT_EQ(rows[1][1], "NULL");
}

TEST(FlightStore, DuplicateStartIsIgnored) {
    TempDatabase temp;
    FlightStore store(temp.path(), 300.0);

    store.start_session(StartSession{"S", "ABC123", 0.0}, 0.0);
    store.start_session(StartSession{"S", "ABC123", 50.0}, 50.0);

    auto rows = temp.query("SELECT start_time FROM flight_session");
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_DOUBLE_EQ(std::stod(rows[0][0]), 0.0);
}

TEST(FlightStore, ExplicitEndSetsEndTime) {
    TempDatabase temp;
    FlightStore store(temp.path(), 300.0);

    store.start_session(StartSession{"S", "ABC123", 0.0}, 0.0);
    store.apply(EndSession{"S", 42.0}, 50.0);

    EXPECT_DOUBLE_EQ(
        std::stod(temp.query("SELECT end_time FROM flight_session")[0][0]),
        42.0);
}

TEST(FlightStore, SweepDropsAliasesOfClosedSessions) {
    TempDatabase temp;
    FlightStore store(temp.path(), 300.0);

    store.start_session(StartSession{"S1", "ABC123", 0.0}, 0.0);
    store.insert_path(point("S1", 10.0));
    store.start_session(StartSession{"S2", "ABC123", 100.0}, 100.0);
    store.start_session(StartSession{"S3", "ABC123", 110.0}, 110.0);
    EXPECT_EQ(store.alias_count(), 2u);

    EXPECT_EQ(store.close_inactive_sessions(1000.0), 1u);
    EXPECT_EQ(store.alias_count(), 0u);
}

TEST(FlightStore, EndThroughAliasDropsIt) {
    TempDatabase temp;
    FlightStore store(temp.path(), 300.0);

    store.start_session(StartSession{"S1", "ABC123", 0.0}, 0.0);
    store.start_session(StartSession{"S2", "ABC123", 50.0}, 50.0);
    store.start_session(StartSession{"T1", "DEF456", 50.0}, 50.0);
    store.start_session(StartSession{"T2", "DEF456", 60.0}, 60.0);
    ASSERT_EQ(store.alias_count(), 2u);

    store.end_session(EndSession{"S2", 70.0});
    EXPECT_EQ(store.alias_count(), 1u);
    auto rows = temp.query("SELECT end_time FROM flight_session WHERE id = 'S1'");
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_DOUBLE_EQ(std::stod(rows[0][0]), 70.0);
}

TEST(FlightStore, UnopenableDatabaseThrows) {
    EXPECT_THROW(FlightStore("/proc/adsb_relay/none.db", 300.0), StorageError);
}
