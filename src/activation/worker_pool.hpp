#pragma once

#include "core/result.hpp"
#include "core/session.hpp"
#include "core/types.hpp"
#include <QProcessEnvironment>
#include <QString>
#include <QStringList>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

class QProcess;

namespace jitstreamer::activation {

/**
 * WorkerJob - One activation attempt, run as an external process.
 */
struct WorkerJob {
    Uuid session_id;
    QString program;
    QStringList arguments;
    QProcessEnvironment environment = QProcessEnvironment::systemEnvironment();
    std::chrono::milliseconds timeout{60000};

    /**
     * Called once with the outcome, on the worker thread (or on the thread
     * calling shutdown() for jobs that never started).
     */
    std::function<void(const Outcome&)> on_complete;
};

struct JobHandle {
    uint64_t id = 0;
    std::shared_future<Outcome> outcome;
};

enum class JobState { Queued, Running, Finished };

struct JobStatus {
    JobState state = JobState::Queued;
    size_t queue_position = 0;  // 1-based while queued, 0 otherwise
    std::optional<Outcome> outcome;
};

/**
 * WorkerPool - Runs jobs on a fixed number of worker threads.
 *
 * At most `capacity` processes run at once; further jobs wait in FIFO
 * order. Each job gets its own process and the pool enforces its deadline
 * (terminate, wait `kill_grace`, kill), so a job always ends in bounded
 * time even when the process ignores SIGTERM or never prints anything.
 */
class WorkerPool {
public:
    struct Options {
        size_t capacity = 10;
        std::chrono::milliseconds kill_grace{2000};
        std::chrono::milliseconds start_timeout{5000};
        std::chrono::milliseconds poll_interval{50};
        size_t finished_history = 1024;
    };

    explicit WorkerPool(Options options);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * Queue a job. Fails with Cancelled after shutdown().
     */
    [[nodiscard]] Res<JobHandle> submit(WorkerJob job);

    /**
     * Wait for the job's outcome (no timeout; the job deadline bounds it).
     */
    [[nodiscard]] Outcome await(const JobHandle& handle) const;
    [[nodiscard]] std::optional<Outcome> await(const JobHandle& handle,
                                               std::chrono::milliseconds timeout) const;

    [[nodiscard]] Res<JobStatus> status(uint64_t job_id) const;

    [[nodiscard]] size_t capacity() const { return options_.capacity; }
    [[nodiscard]] size_t running() const { return running_.load(); }
    [[nodiscard]] size_t peak_running() const { return peak_running_.load(); }
    [[nodiscard]] size_t queued() const;
    [[nodiscard]] bool is_shut_down() const { return stopping_.load(); }

    /**
     * Cancel queued jobs, stop running ones, and join the workers.
     * Every pending job is reported Cancelled. Idempotent.
     */
    void shutdown();

private:
    struct Entry {
        uint64_t id = 0;
        WorkerJob job;
        JobState state = JobState::Queued;
        std::optional<Outcome> outcome;
        std::promise<Outcome> promise;
        std::shared_future<Outcome> future;
    };

    /**
     * Holds one unit of the running count for as long as it lives.
     */
    class RunningSlot {
    public:
        explicit RunningSlot(WorkerPool& pool);
        ~RunningSlot();
        RunningSlot(const RunningSlot&) = delete;
        RunningSlot& operator=(const RunningSlot&) = delete;

    private:
        WorkerPool& pool_;
    };

    Options options_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::shared_ptr<Entry>> queue_;
    std::unordered_map<uint64_t, std::shared_ptr<Entry>> jobs_;
    std::deque<uint64_t> finished_order_;
    uint64_t next_id_ = 1;

    std::atomic<bool> stopping_{false};
    std::atomic<size_t> running_{0};
    std::atomic<size_t> peak_running_{0};
    std::vector<std::thread> workers_;
    std::once_flag shutdown_once_;

    void worker_loop(size_t index);
    [[nodiscard]] Outcome run_process(const WorkerJob& job);
    void stop_process(QProcess& process);
    void finish(const std::shared_ptr<Entry>& entry, Outcome outcome);
};

[[nodiscard]] constexpr std::string_view to_string(JobState state) noexcept {
    switch (state) {
        case JobState::Queued: return "queued";
        case JobState::Running: return "running";
        case JobState::Finished: return "finished";
    }
    return "unknown";
}

} // namespace jitstreamer::activation
