#ifndef PERSISTENCETASK_HPP
#define PERSISTENCETASK_HPP

#include <optional>
#include <string>
#include <variant>

struct UpsertAircraft {
    std::string address;
    std::optional<std::string> callsign;
    double first_seen = 0.0;
    double last_update = 0.0;
    std::optional<double> assembly_time_ms;
    std::optional<int> stale_cpr_count;
};

struct StartSession {
    std::string session_id;
    std::string address;
    double start_time = 0.0;
};

struct EndSession {
    std::string session_id;
    double end_time = 0.0;
};

struct InsertPath {
    std::string session_id;
    std::string address;
    double ts = 0.0;
    std::string ts_iso;
    double lat = 0.0;
    double lon = 0.0;
    std::optional<double> alt;
    std::optional<double> speed;
    std::optional<double> track;
    std::optional<double> vertical_rate;
    std::optional<std::string> velocity_type;
};

using PersistenceTask =
    std::variant<UpsertAircraft, StartSession, EndSession, InsertPath>;

// Anything that accepts persistence tasks. enqueue() must not block.
class TaskQueue {
   public:
    virtual ~TaskQueue() = default;
    virtual void enqueue(PersistenceTask task) = 0;
};

#endif  // PERSISTENCETASK_HPP
