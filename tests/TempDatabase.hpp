#ifndef TEMPDATABASE_HPP
#define TEMPDATABASE_HPP

#include <sqlite3.h>

#include <atomic>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

// Scratch database file under the temp directory, removed with its WAL files
// on destruction. query() reads through a separate connection.
class TempDatabase {
   public:
    TempDatabase() {
        static std::atomic<int> counter{0};
        directory = std::filesystem::temp_directory_path() /
                    ("adsb_relay_test_" + std::to_string(::getpid()) + "_" +
                     std::to_string(counter++));
        std::filesystem::create_directories(directory);
        file = (directory / "flights.db").string();
    }
    ~TempDatabase() {
        std::error_code ec;
        std::filesystem::remove_all(directory, ec);
    }

    const std::string& path() const { return file; }

    using Rows = std::vector<std::vector<std::string>>;

    Rows query(const std::string& sql) const {
        sqlite3* db = nullptr;
        if (sqlite3_open(file.c_str(), &db) != SQLITE_OK) {
            sqlite3_close(db);
            throw std::runtime_error("cannot open " + file);
        }
        Rows rows;
        char* error = nullptr;
        int rc = sqlite3_exec(db, sql.c_str(), collect, &rows, &error);
        std::string message = error ? error : "";
        sqlite3_free(error);
        sqlite3_close(db);
        if (rc != SQLITE_OK) {
            throw std::runtime_error(message);
        }
        return rows;
    }

    void execute(const std::string& sql) const { query(sql); }

   private:
    static int collect(void* out, int count, char** values, char**) {
        auto rows = static_cast<Rows*>(out);
        std::vector<std::string> row;
        for (int i = 0; i < count; ++i) {
            row.push_back(values[i] ? values[i] : "NULL");
        }
        rows->push_back(row);
        return 0;
    }

    std::filesystem::path directory;
    std::string file;
};

#endif  // TEMPDATABASE_HPP
