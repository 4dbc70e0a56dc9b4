#include "PersistenceWorker.hpp"

#include <iostream>
#include <optional>
#include <utility>

#include "TimeUtils.hpp"

PersistenceWorker::PersistenceWorker(const WorkerOptions& options)
    : PersistenceWorker(options, now_seconds) {}

PersistenceWorker::PersistenceWorker(const WorkerOptions& options, Clock clock)
    : options(options), clock(std::move(clock)) {}

PersistenceWorker::~PersistenceWorker() { stop(); }

void PersistenceWorker::start() {
    if (thread.joinable()) {
        return;
    }
    store = std::make_unique<FlightStore>(options.db_path,
                                          options.session_inactivity_seconds);
    {
        std::lock_guard<std::mutex> lock(mutex);
        stopping = false;
    }
    thread = std::thread(&PersistenceWorker::run, this);
    std::cout << "Persistence worker writing to " << options.db_path
              << std::endl;
}

void PersistenceWorker::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stopping = true;
    }
    wakeup.notify_all();
    if (thread.joinable()) {
        thread.join();
        std::cout << "Persistence worker stopped (" << tasks_processed
                  << " tasks applied, " << tasks_failed << " failed)"
                  << std::endl;
    }
    store.reset();
}

void PersistenceWorker::enqueue(PersistenceTask task) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        queue.push_back(std::move(task));
    }
    wakeup.notify_one();
}

void PersistenceWorker::run() {
    sweep();
    auto next_sweep = std::chrono::steady_clock::now() + options.sweep_interval;

    while (true) {
        std::optional<PersistenceTask> task;
        {
            std::unique_lock<std::mutex> lock(mutex);
            wakeup.wait_for(lock, options.poll_interval,
                            [this] { return stopping || !queue.empty(); });
            if (stopping) {
                break;
            }
            if (!queue.empty()) {
                task = std::move(queue.front());
                queue.pop_front();
            }
        }

        if (task) {
            handle(*task);
        }
        if (std::chrono::steady_clock::now() >= next_sweep) {
            sweep();
            next_sweep = std::chrono::steady_clock::now() + options.sweep_interval;
        }
    }

    // Drain once on stop.
    std::deque<PersistenceTask> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex);
        remaining.swap(queue);
    }
    for (const auto& task : remaining) {
        handle(task);
    }
}

void PersistenceWorker::handle(const PersistenceTask& task) {
    try {
        store->apply(task, clock());
        ++tasks_processed;
    } catch (const std::exception& e) {
        ++tasks_failed;
        std::cerr << "DB task failed: " << e.what() << std::endl;
    }
}

void PersistenceWorker::sweep() {
    try {
        sessions_swept += store->close_inactive_sessions(clock());
    } catch (const StorageError& e) {
        std::cerr << "Session sweep failed: " << e.what() << std::endl;
    }
}
