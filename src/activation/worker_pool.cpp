#include "activation/worker_pool.hpp"

#include <QLoggingCategory>
#include <QProcess>
#include <exception>

Q_LOGGING_CATEGORY(jitstreamerWorkersLog, "jitstreamer.workers")

namespace jitstreamer::activation {

namespace {

// Trimmed stderr, else stdout, else nothing.
std::string captured_output(QProcess& process) {
    const auto err = QString::fromUtf8(process.readAllStandardError()).trimmed();
    if (!err.isEmpty()) return err.toStdString();
    return QString::fromUtf8(process.readAllStandardOutput()).trimmed().toStdString();
}

std::string failure_detail(QProcess& process) {
    auto output = captured_output(process);
    if (!output.empty()) return output;
    return "exit code " + std::to_string(process.exitCode());
}

std::string crash_detail(QProcess& process) {
    auto output = captured_output(process);
    if (output.empty()) return "Worker crashed";
    return "Worker crashed: " + output;
}

} // namespace

WorkerPool::RunningSlot::RunningSlot(WorkerPool& pool) : pool_(pool) {
    const auto now = pool_.running_.fetch_add(1) + 1;
    auto peak = pool_.peak_running_.load();
    while (now > peak && !pool_.peak_running_.compare_exchange_weak(peak, now)) {
    }
}

WorkerPool::RunningSlot::~RunningSlot() {
    pool_.running_.fetch_sub(1);
}

WorkerPool::WorkerPool(Options options) : options_(options) {
    if (options_.capacity == 0) {
        options_.capacity = 1;
    }
    workers_.reserve(options_.capacity);
    for (size_t i = 0; i < options_.capacity; ++i) {
        workers_.emplace_back([this, i] { worker_loop(i); });
    }
    qCInfo(jitstreamerWorkersLog) << "Worker pool started with" << options_.capacity << "runners";
}

WorkerPool::~WorkerPool() {
    shutdown();
}

Res<JobHandle> WorkerPool::submit(WorkerJob job) {
    auto entry = std::make_shared<Entry>();
    entry->job = std::move(job);
    entry->future = entry->promise.get_future().share();

    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return fail<JobHandle>(ErrorCode::Cancelled, "Worker pool is shut down");
        }
        entry->id = next_id_++;
        queue_.push_back(entry);
        jobs_.emplace(entry->id, entry);
    }
    cv_.notify_one();

    qCDebug(jitstreamerWorkersLog) << "Queued job" << entry->id << "for session"
                                   << entry->job.session_id.to_string().c_str();
    return Res<JobHandle>::ok(JobHandle{.id = entry->id, .outcome = entry->future});
}

Outcome WorkerPool::await(const JobHandle& handle) const {
    return handle.outcome.get();
}

std::optional<Outcome> WorkerPool::await(const JobHandle& handle,
                                         std::chrono::milliseconds timeout) const {
    if (handle.outcome.wait_for(timeout) != std::future_status::ready) {
        return std::nullopt;
    }
    return handle.outcome.get();
}

Res<JobStatus> WorkerPool::status(uint64_t job_id) const {
    std::lock_guard lock(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
        return fail<JobStatus>(ErrorCode::NotFound, "Unknown job " + std::to_string(job_id));
    }

    const auto& entry = it->second;
    JobStatus status{.state = entry->state, .queue_position = 0, .outcome = entry->outcome};
    if (entry->state == JobState::Queued) {
        for (size_t i = 0; i < queue_.size(); ++i) {
            if (queue_[i]->id == job_id) {
                status.queue_position = i + 1;
                break;
            }
        }
    }
    return Res<JobStatus>::ok(std::move(status));
}

size_t WorkerPool::queued() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

void WorkerPool::worker_loop(size_t index) {
    while (true) {
        std::shared_ptr<Entry> entry;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_) {
                return;
            }
            entry = queue_.front();
            queue_.pop_front();
            entry->state = JobState::Running;
        }

        qCDebug(jitstreamerWorkersLog) << "Runner" << index << "took job" << entry->id;
        Outcome outcome;
        {
            RunningSlot slot(*this);
            outcome = run_process(entry->job);
        }
        finish(entry, std::move(outcome));
    }
}

void WorkerPool::stop_process(QProcess& process) {
    const int grace_ms = static_cast<int>(options_.kill_grace.count());
    process.terminate();
    if (!process.waitForFinished(grace_ms)) {
        qCWarning(jitstreamerWorkersLog) << "Worker" << process.processId()
                                         << "ignored termination, killing";
        process.kill();
        process.waitForFinished(grace_ms);
    }
}

Outcome WorkerPool::run_process(const WorkerJob& job) {
    QProcess process;
    process.setProgram(job.program);
    process.setArguments(job.arguments);
    process.setProcessEnvironment(job.environment);
    process.start();

    if (!process.waitForStarted(static_cast<int>(options_.start_timeout.count()))) {
        return Outcome::failed("Cannot start " + job.program.toStdString() + ": " +
                               process.errorString().toStdString());
    }

    const auto deadline = std::chrono::steady_clock::now() + job.timeout;
    const int poll_ms = static_cast<int>(options_.poll_interval.count());
    while (!process.waitForFinished(poll_ms)) {
        if (process.state() == QProcess::NotRunning) {
            break;
        }
        if (stopping_) {
            stop_process(process);
            return Outcome::cancelled("Worker pool shut down");
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            qCWarning(jitstreamerWorkersLog) << "Job for session" << job.session_id.to_string().c_str()
                                             << "exceeded" << job.timeout.count() << "ms";
            stop_process(process);
            return Outcome::timed_out("No result after " + std::to_string(job.timeout.count()) + " ms");
        }
    }

    if (process.exitStatus() == QProcess::CrashExit) {
        return Outcome::failed(crash_detail(process));
    }
    if (process.exitCode() != 0) {
        return Outcome::failed(failure_detail(process));
    }
    return Outcome::succeeded();
}

void WorkerPool::finish(const std::shared_ptr<Entry>& entry, Outcome outcome) {
    {
        std::lock_guard lock(mutex_);
        entry->state = JobState::Finished;
        entry->outcome = outcome;
        finished_order_.push_back(entry->id);
        while (finished_order_.size() > options_.finished_history) {
            jobs_.erase(finished_order_.front());
            finished_order_.pop_front();
        }
    }
    entry->promise.set_value(outcome);

    if (entry->job.on_complete) {
        try {
            entry->job.on_complete(outcome);
        } catch (const std::exception& e) {
            qCWarning(jitstreamerWorkersLog) << "Completion callback for job" << entry->id
                                             << "threw:" << e.what();
        } catch (...) {
            qCWarning(jitstreamerWorkersLog) << "Completion callback for job" << entry->id
                                             << "threw a non-standard exception";
        }
    }
}

void WorkerPool::shutdown() {
    std::call_once(shutdown_once_, [this] {
        std::deque<std::shared_ptr<Entry>> cancelled;
        {
            std::lock_guard lock(mutex_);
            stopping_ = true;
            cancelled.swap(queue_);
        }
        cv_.notify_all();

        for (const auto& entry : cancelled) {
            finish(entry, Outcome::cancelled("Worker pool shut down before the job started"));
        }
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        qCInfo(jitstreamerWorkersLog) << "Worker pool stopped;" << cancelled.size()
                                      << "queued jobs cancelled";
    });
}

} // namespace jitstreamer::activation
