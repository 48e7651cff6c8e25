#ifndef WORKER_POOL_HPP
#define WORKER_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

// Fixed number of threads draining a shared task queue. At most size()
// tasks run at any instant.
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threads);
    ~WorkerPool();

    // Returns false once the pool has been stopped.
    bool submit(std::function<void()> task);

    // Refuses new tasks, lets the workers drain what is queued, joins them.
    void stop();

    std::size_t size() const { return thread_count_; }

private:
    std::size_t thread_count_;
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queue_mtx_;
    std::condition_variable cv_;
    bool stopping_;

    void worker();
};

#endif // WORKER_POOL_HPP
