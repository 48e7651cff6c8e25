#include "Scanner.hpp"
#include <exception>
#include <memory>
#include <spdlog/spdlog.h>

Scanner::Scanner(HostRegistry& registry, ProbeFn probe, std::size_t threads,
                 std::chrono::milliseconds interval, ClockFn clock)
    : registry_(registry), probe_(std::move(probe)), clock_(std::move(clock)), interval_(interval),
      pool_(threads), running_(false), stopping_(false), cycles_(0), next_offset_(0), triggered_(false) {}

Scanner::~Scanner() {
    stop();
}

bool Scanner::start() {
    if (stopping_.load()) return false;
    if (running_.exchange(true)) {
        spdlog::warn("scanner already running");
        return false;
    }
    worker_ = std::thread(&Scanner::run_loop, this);
    return true;
}

void Scanner::stop() {
    stopping_.store(true);
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        running_.store(false);
    }
    wake_cv_.notify_all();
    if (worker_.joinable()) worker_.join();
    pool_.stop();
}

void Scanner::trigger() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        triggered_ = true;
    }
    wake_cv_.notify_all();
}

CycleReport Scanner::run_cycle() {
    std::lock_guard<std::mutex> cycle_lock(cycle_mutex_);

    struct Progress {
        std::mutex mtx;
        std::condition_variable done;
        std::size_t outstanding = 0;
        CycleReport report;
    };
    auto progress = std::make_shared<Progress>();

    const auto ids = registry_.ids();
    const auto deadline = HostClock::now() + interval_;
    const std::size_t offset = ids.empty() ? 0 : next_offset_ % ids.size();
    progress->outstanding = ids.size();

    for (std::size_t i = 0; i < ids.size(); ++i) {
        const std::string& id = ids[(offset + i) % ids.size()];
        auto task = [this, progress, id, deadline]() {
            const bool skip = stopping_.load() || HostClock::now() > deadline;
            bool reachable = false;
            bool failed = false;
            std::optional<HostState> committed;
            if (!skip) {
                try {
                    reachable = probe_(id);
                } catch (const std::exception& ex) {
                    spdlog::warn("cannot probe host {}: {}", id, ex.what());
                }
                try {
                    committed = registry_.apply_probe(id, reachable, clock_());
                } catch (const std::exception& ex) {
                    failed = true;
                    spdlog::error("cannot record probe of host {}: {}", id, ex.what());
                }
                if (committed) spdlog::info("host {} is {}", id, name_for(*committed));
            }

            std::lock_guard<std::mutex> lock(progress->mtx);
            if (skip) {
                ++progress->report.skipped;
            } else if (failed) {
                ++progress->report.failed;
            } else {
                ++progress->report.probed;
                if (reachable) ++progress->report.reachable;
                if (committed) ++progress->report.committed;
            }
            if (--progress->outstanding == 0) progress->done.notify_all();
        };

        if (!pool_.submit(std::move(task))) {
            std::lock_guard<std::mutex> lock(progress->mtx);
            ++progress->report.skipped;
            --progress->outstanding;
        }
    }

    CycleReport report;
    {
        std::unique_lock<std::mutex> lock(progress->mtx);
        progress->done.wait(lock, [&progress]() { return progress->outstanding == 0; });
        report = progress->report;
    }

    if (!stopping_.load()) {
        // tasks are dequeued in submission order, so the skipped ones sit (nearly)
        // at the tail; the next cycle starts with them
        if (!ids.empty()) next_offset_ = (offset + ids.size() - report.skipped) % ids.size();
        registry_.mark_scan_complete(clock_());
        ++cycles_;
    }
    if (report.skipped > 0 && !stopping_.load()) {
        spdlog::warn("scan cycle skipped {} of {} hosts, retrying next cycle", report.skipped, ids.size());
    }
    spdlog::debug("scan cycle: {} probed, {} reachable, {} skipped, {} failed, {} transitions",
                  report.probed, report.reachable, report.skipped, report.failed, report.committed);
    return report;
}

void Scanner::run_loop() {
    while (running_.load()) {
        run_cycle();

        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_cv_.wait_for(lock, interval_, [this]() { return !running_.load() || triggered_; });
        triggered_ = false;
    }
}
