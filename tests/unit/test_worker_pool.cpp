#include <catch2/catch_test_macros.hpp>
#include "activation/worker_pool.hpp"
#include "test_support.hpp"
#include <QFile>
#include <QTemporaryDir>
#include <atomic>
#include <stdexcept>

using namespace jitstreamer;
using namespace jitstreamer::activation;
using namespace std::chrono_literals;

namespace {

WorkerPool::Options fast_options(size_t capacity) {
    WorkerPool::Options options;
    options.capacity = capacity;
    options.kill_grace = 300ms;
    options.poll_interval = 10ms;
    return options;
}

WorkerJob shell_job(const QString& script, std::chrono::milliseconds timeout = 10s) {
    WorkerJob job;
    job.session_id = Uuid::generate();
    job.program = testing::shell();
    job.arguments = {QStringLiteral("-c"), script};
    job.timeout = timeout;
    return job;
}

} // namespace

TEST_CASE("Worker outcomes", "[workers]") {
    WorkerPool pool(fast_options(2));

    SECTION("Exit code zero succeeds") {
        auto handle = pool.submit(shell_job(QStringLiteral("exit 0"))).unwrap();
        REQUIRE(pool.await(handle) == Outcome::succeeded());
    }

    SECTION("Non-zero exit fails with the process's stderr") {
        auto handle = pool.submit(shell_job(QStringLiteral("echo 'device is locked' >&2; exit 3"))).unwrap();
        auto outcome = pool.await(handle);
        REQUIRE(outcome.kind == Outcome::Kind::Failed);
        REQUIRE(outcome.detail == "device is locked");
    }

    SECTION("Falls back to stdout, then the exit code") {
        auto out = pool.submit(shell_job(QStringLiteral("echo 'no developer image'; exit 1"))).unwrap();
        REQUIRE(pool.await(out).detail == "no developer image");

        auto silent = pool.submit(shell_job(QStringLiteral("exit 7"))).unwrap();
        REQUIRE(pool.await(silent).detail == "exit code 7");
    }

    SECTION("A crash keeps what the worker printed") {
        auto handle = pool.submit(shell_job(QStringLiteral("echo 'tunnel lost' >&2; kill -SEGV $$"))).unwrap();
        auto outcome = pool.await(handle);
        REQUIRE(outcome.kind == Outcome::Kind::Failed);
        REQUIRE(outcome.detail == "Worker crashed: tunnel lost");

        auto quiet = pool.submit(shell_job(QStringLiteral("kill -SEGV $$"))).unwrap();
        REQUIRE(pool.await(quiet).detail == "Worker crashed");
    }

    SECTION("Missing program fails to start") {
        auto job = shell_job({});
        job.program = QStringLiteral("/nonexistent/jitstreamer-worker");
        auto outcome = pool.await(pool.submit(std::move(job)).unwrap());
        REQUIRE(outcome.kind == Outcome::Kind::Failed);
        REQUIRE(outcome.detail.rfind("Cannot start", 0) == 0);
    }

    SECTION("Environment reaches the worker") {
        auto job = shell_job(QStringLiteral("test \"$JITSTREAMER_UDID\" = udid-env"));
        job.environment.insert(QStringLiteral("JITSTREAMER_UDID"), QStringLiteral("udid-env"));
        REQUIRE(pool.await(pool.submit(std::move(job)).unwrap()).ok());
    }
}

TEST_CASE("Worker deadline is enforced", "[workers][timeout]") {
    WorkerPool pool(fast_options(1));

    SECTION("Well-behaved process is terminated") {
        const auto started = std::chrono::steady_clock::now();
        auto handle = pool.submit(shell_job(QStringLiteral("exec sleep 30"), 200ms)).unwrap();
        auto outcome = pool.await(handle);

        REQUIRE(outcome.kind == Outcome::Kind::TimedOut);
        REQUIRE(outcome.detail == "No result after 200 ms");
        REQUIRE(std::chrono::steady_clock::now() - started < 5s);
    }

    SECTION("Process ignoring SIGTERM is killed after the grace period") {
        const auto started = std::chrono::steady_clock::now();
        auto handle = pool.submit(shell_job(QStringLiteral("trap '' TERM; exec sleep 30"), 200ms)).unwrap();

        REQUIRE(pool.await(handle).kind == Outcome::Kind::TimedOut);
        REQUIRE(std::chrono::steady_clock::now() - started < 5s);
        REQUIRE(pool.running() == 0);
    }

    SECTION("A callback throwing a non-standard type is survived") {
        auto job = shell_job(QStringLiteral("exit 0"));
        job.on_complete = [](const Outcome&) { throw 42; };
        REQUIRE(pool.await(pool.submit(std::move(job)).unwrap()).ok());

        auto next = pool.submit(shell_job(QStringLiteral("exit 0"))).unwrap();
        REQUIRE(pool.await(next, 10s).has_value());
        REQUIRE(pool.running() == 0);
    }
}

TEST_CASE("Concurrency is bounded by capacity", "[workers][capacity]") {
    WorkerPool pool(fast_options(2));
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto log = dir.filePath(QStringLiteral("order"));

    std::vector<JobHandle> handles;
    for (int i = 0; i < 6; ++i) {
        handles.push_back(pool.submit(shell_job(
            QStringLiteral("echo %1 >> '%2'; sleep 0.5").arg(i).arg(log))).unwrap());
    }

    REQUIRE(testing::wait_until([&] { return pool.running() == 2; }));
    REQUIRE(pool.queued() == 4);

    auto last = pool.status(handles.back().id).unwrap();
    REQUIRE(last.state == JobState::Queued);
    REQUIRE(last.queue_position == 4);

    for (const auto& handle : handles) {
        REQUIRE(pool.await(handle).ok());
    }
    REQUIRE(pool.peak_running() == 2);
    REQUIRE(pool.running() == 0);

    auto finished = pool.status(handles.front().id).unwrap();
    REQUIRE(finished.state == JobState::Finished);
    REQUIRE(finished.outcome == Outcome::succeeded());
    REQUIRE(pool.status(9999).unwrap_err().is(ErrorCode::NotFound));

    QFile order(log);
    REQUIRE(order.open(QIODevice::ReadOnly));
    const auto lines = QString::fromUtf8(order.readAll()).split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    REQUIRE(lines.size() == 6);
    // Two runners take jobs in FIFO order, so the first pair starts before the last pair.
    REQUIRE(lines.indexOf(QStringLiteral("0")) < lines.indexOf(QStringLiteral("4")));
    REQUIRE(lines.indexOf(QStringLiteral("1")) < lines.indexOf(QStringLiteral("5")));
}

TEST_CASE("Completion callbacks", "[workers]") {
    WorkerPool pool(fast_options(1));

    SECTION("Callback receives the outcome") {
        std::atomic<int> calls{0};
        auto job = shell_job(QStringLiteral("exit 1"));
        job.on_complete = [&](const Outcome& outcome) {
            if (outcome.kind == Outcome::Kind::Failed) ++calls;
        };
        auto handle = pool.submit(std::move(job)).unwrap();
        REQUIRE_FALSE(pool.await(handle).ok());
        REQUIRE(testing::wait_until([&] { return calls.load() == 1; }));
    }

    SECTION("A throwing callback does not take the runner down") {
        auto job = shell_job(QStringLiteral("exit 0"));
        job.on_complete = [](const Outcome&) { throw std::runtime_error("callback failed"); };
        REQUIRE(pool.await(pool.submit(std::move(job)).unwrap()).ok());

        auto next = pool.submit(shell_job(QStringLiteral("exit 0"))).unwrap();
        REQUIRE(pool.await(next, 10s).has_value());
        REQUIRE(pool.running() == 0);
    }
}

TEST_CASE("Shutdown cancels pending work", "[workers][shutdown]") {
    WorkerPool pool(fast_options(1));

    std::atomic<int> cancelled_callbacks{0};
    auto running = shell_job(QStringLiteral("exec sleep 30"), 60s);
    auto queued = shell_job(QStringLiteral("exit 0"));
    queued.on_complete = [&](const Outcome& outcome) {
        if (outcome.kind == Outcome::Kind::Cancelled) ++cancelled_callbacks;
    };

    auto running_handle = pool.submit(std::move(running)).unwrap();
    auto queued_handle = pool.submit(std::move(queued)).unwrap();
    REQUIRE(testing::wait_until([&] { return pool.running() == 1; }));

    const auto started = std::chrono::steady_clock::now();
    pool.shutdown();
    REQUIRE(std::chrono::steady_clock::now() - started < 5s);

    REQUIRE(pool.await(running_handle).kind == Outcome::Kind::Cancelled);
    REQUIRE(pool.await(queued_handle).kind == Outcome::Kind::Cancelled);
    REQUIRE(cancelled_callbacks == 1);
    REQUIRE(pool.is_shut_down());

    auto late = pool.submit(shell_job(QStringLiteral("exit 0")));
    REQUIRE(late.unwrap_err().is(ErrorCode::Cancelled));

    pool.shutdown();
}
