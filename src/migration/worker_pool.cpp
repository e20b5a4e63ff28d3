#include "quakemigrate/migration/worker_pool.hpp"
#include <algorithm>

namespace quakemigrate {

WorkerPool::WorkerPool(size_t size)
    : size_(std::max<size_t>(size, 1))
    , task_(nullptr)
    , generation_(0)
    , pending_(0)
    , stopping_(false)
{
    for (size_t i = 1; i < size_; i++) {
        threads_.emplace_back(&WorkerPool::workerLoop, this, i);
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    start_cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

void WorkerPool::execute(size_t index) {
    try {
        (*task_)(index);
    } catch (...) {
        // Rethrown from run() on the calling thread
        std::lock_guard<std::mutex> lock(mutex_);
        if (!error_) error_ = std::current_exception();
    }
}

void WorkerPool::run(const std::function<void(size_t)>& task) {
    if (threads_.empty()) {
        task(0);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        task_ = &task;
        pending_ = threads_.size();
        error_ = nullptr;
        generation_++;
    }
    start_cv_.notify_all();

    execute(0);

    std::exception_ptr error;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        done_cv_.wait(lock, [this] { return pending_ == 0; });
        task_ = nullptr;
        error = error_;
        error_ = nullptr;
    }
    if (error) std::rethrow_exception(error);
}

void WorkerPool::workerLoop(size_t index) {
    uint64_t seen = 0;
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            start_cv_.wait(lock, [&] { return stopping_ || generation_ != seen; });
            if (stopping_) return;
            seen = generation_;
        }

        execute(index);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_--;
        }
        done_cv_.notify_one();
    }
}

} // namespace quakemigrate
