#pragma once

#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace quakemigrate {

/**
 * WorkerPool - Fixed set of threads running one task per worker, with a
 * barrier at the end of each run
 *
 * The calling thread acts as worker 0, so a pool of size 1 starts no
 * threads. An exception thrown by any worker is rethrown from run() once
 * every worker has finished.
 */
class WorkerPool {
public:
    explicit WorkerPool(size_t size);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    size_t size() const { return size_; }

    // Runs task(worker) for every worker in [0, size()) and waits
    void run(const std::function<void(size_t)>& task);

private:
    size_t size_;
    std::vector<std::thread> threads_;
    std::mutex mutex_;
    std::condition_variable start_cv_;
    std::condition_variable done_cv_;
    const std::function<void(size_t)>* task_;
    uint64_t generation_;
    size_t pending_;
    bool stopping_;
    std::exception_ptr error_;

    void workerLoop(size_t index);
    void execute(size_t index);
};

} // namespace quakemigrate
