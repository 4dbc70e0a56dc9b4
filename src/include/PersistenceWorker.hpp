#ifndef PERSISTENCEWORKER_HPP
#define PERSISTENCEWORKER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "FlightStore.hpp"
#include "PersistenceTask.hpp"

struct WorkerOptions {
    std::string db_path = "adsb_data.db";
    std::chrono::milliseconds poll_interval{500};
    std::chrono::milliseconds sweep_interval{60000};
    double session_inactivity_seconds = 300.0;
};

// Sole writer to the flight database. Tasks are applied in FIFO order on a
// dedicated thread; the inactivity sweep runs on the same thread.
class PersistenceWorker : public TaskQueue {
   public:
    using Clock = std::function<double()>;

    explicit PersistenceWorker(const WorkerOptions& options);
    PersistenceWorker(const WorkerOptions& options, Clock clock);
    ~PersistenceWorker() override;

    PersistenceWorker(const PersistenceWorker&) = delete;
    PersistenceWorker& operator=(const PersistenceWorker&) = delete;

    // Opens storage (throws StorageError) and starts the consumer thread.
    void start();
    // Drains what is queued, then closes storage.
    void stop();

    void enqueue(PersistenceTask task) override;

    std::size_t processed() const { return tasks_processed.load(); }
    std::size_t failed() const { return tasks_failed.load(); }
    std::size_t sessions_closed() const { return sessions_swept.load(); }

   private:
    void run();
    void handle(const PersistenceTask& task);
    void sweep();

    WorkerOptions options;
    Clock clock;
    std::unique_ptr<FlightStore> store;
    std::thread thread;

    std::mutex mutex;
    std::condition_variable wakeup;
    std::deque<PersistenceTask> queue;
    bool stopping = false;

    std::atomic<std::size_t> tasks_processed{0};
    std::atomic<std::size_t> tasks_failed{0};
    std::atomic<std::size_t> sessions_swept{0};
};

#endif  // PERSISTENCEWORKER_HPP
