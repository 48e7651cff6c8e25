#ifndef SCANNER_HPP
#define SCANNER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include "HostRegistry.hpp"
#include "WorkerPool.hpp"

struct CycleReport {
    std::size_t probed = 0;
    std::size_t reachable = 0;
    // not probed this cycle (pool refused the task or the cycle ran out of time)
    std::size_t skipped = 0;
    std::size_t committed = 0;
    // probed, but the result could not be recorded; retried next cycle
    std::size_t failed = 0;
};

// Probes every registered host once per cycle on a fixed-size pool and feeds
// the results through the registry. Cycles never overlap.
class Scanner {
public:
    using ProbeFn = std::function<bool(const std::string& address)>;
    using ClockFn = std::function<HostClock::time_point()>;

    Scanner(HostRegistry& registry, ProbeFn probe, std::size_t threads,
            std::chrono::milliseconds interval, ClockFn clock = &HostClock::now);
    ~Scanner();

    // Runs cycles in a background thread, one every interval.
    bool start();
    // Abandons queued probes, waits for in-flight ones, joins all threads.
    void stop();
    // Starts the next background cycle now instead of at the end of the interval.
    void trigger();

    // One complete cycle, blocking until every task has returned.
    CycleReport run_cycle();

    std::size_t thread_count() const { return pool_.size(); }
    uint64_t cycles_completed() const { return cycles_.load(); }

private:
    HostRegistry& registry_;
    ProbeFn probe_;
    ClockFn clock_;
    std::chrono::milliseconds interval_;
    WorkerPool pool_;

    std::atomic<bool> running_;
    std::atomic<bool> stopping_;
    std::atomic<uint64_t> cycles_;
    std::thread worker_;

    std::mutex cycle_mutex_;
    // position in the host list the next cycle submits first, so hosts
    // skipped for lack of time go to the front of the queue
    std::size_t next_offset_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    bool triggered_;

    void run_loop();
};

#endif // SCANNER_HPP
