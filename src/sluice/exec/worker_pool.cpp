/**
 * @file worker_pool.cpp
 */
#include "sluice/exec/worker_pool.hpp"

#include <exception>
#include <system_error>

#include <spdlog/spdlog.h>

namespace sluice::exec {

sluice_detail::expected<std::unique_ptr<WorkerPool>, PoolError> WorkerPool::create(PoolConfig cfg) {
    if (cfg.threads == 0)        return sluice_detail::unexpected(PoolError::ThreadsZero);
    if (cfg.queue_capacity == 0) return sluice_detail::unexpected(PoolError::CapacityZero);

    std::unique_ptr<WorkerPool> pool(new WorkerPool(cfg));
    try {
        pool->workers_.reserve(cfg.threads);
        for (std::size_t i = 0; i < cfg.threads; ++i) pool->workers_.emplace_back([p = pool.get()] { p->run(); });
    } catch (const std::system_error& e) {
        SPDLOG_ERROR("worker pool: thread spawn failed: {}", e.what());
        pool->shutdown(ShutdownMode::Discard);
        return sluice_detail::unexpected(PoolError::SpawnFailed);
    }
    SPDLOG_DEBUG("worker pool started threads={} capacity={}", cfg.threads, cfg.queue_capacity);
    return pool;
}

WorkerPool::~WorkerPool() {
    shutdown(cfg_.on_destroy);
}

SubmitErr WorkerPool::submit(Task task) {
    {
        std::lock_guard lk(mu_);
        if (stopping_) { ++stats_.rejected; return SubmitErr::Stopped; }
        if (queue_.size() >= cfg_.queue_capacity) { ++stats_.rejected; return SubmitErr::Full; }
        queue_.push_back(std::move(task));
        ++stats_.submitted;
    }
    work_cv_.notify_one();
    return SubmitErr::Ok;
}

void WorkerPool::run() {
    for (;;) {
        Task task;
        {
            std::unique_lock lk(mu_);
            work_cv_.wait(lk, [&] { return stopping_ || !queue_.empty(); });
            if (queue_.empty() || (stopping_ && !draining_)) return;
            task = std::move(queue_.front());
            queue_.pop_front();
            ++active_;
        }

        bool ok = true;
        try {
            task();
        } catch (const std::exception& e) {
            ok = false;
            SPDLOG_ERROR("worker pool: task failed: {}", e.what());
        }
        task = nullptr; // release captures before the pool reports idle

        {
            std::lock_guard lk(mu_);
            --active_;
            ++(ok ? stats_.completed : stats_.failed);
            if (queue_.empty() && active_ == 0) idle_cv_.notify_all();
        }
    }
}

std::size_t WorkerPool::shutdown(ShutdownMode mode) {
    std::size_t dropped = 0;
    {
        std::lock_guard lk(mu_);
        if (stopping_) return 0;
        stopping_ = true;
        draining_ = (mode == ShutdownMode::Drain);
        if (!draining_) {
            dropped = queue_.size();
            stats_.discarded += dropped;
            queue_.clear();
        }
    }
    work_cv_.notify_all();
    for (auto& t : workers_) {
        if (!t.joinable()) continue;
        // a task shutting down its own pool cannot join itself
        if (t.get_id() == std::this_thread::get_id()) t.detach();
        else t.join();
    }
    {
        std::lock_guard lk(mu_);
        workers_.clear();
    }
    idle_cv_.notify_all();
    if (dropped > 0) SPDLOG_INFO("worker pool discarded {} queued task(s) at shutdown", dropped);
    return dropped;
}

void WorkerPool::wait_idle() {
    std::unique_lock lk(mu_);
    idle_cv_.wait(lk, [&] { return (queue_.empty() && active_ == 0) || (stopping_ && workers_.empty()); });
}

std::size_t WorkerPool::pending() const {
    std::lock_guard lk(mu_);
    return queue_.size();
}

bool WorkerPool::stopped() const {
    std::lock_guard lk(mu_);
    return stopping_;
}

WorkerPool::Stats WorkerPool::stats() const {
    std::lock_guard lk(mu_);
    return stats_;
}

std::string_view to_string(PoolError e) noexcept {
    switch (e) {
        case PoolError::ThreadsZero:  return "threads_zero";
        case PoolError::CapacityZero: return "capacity_zero";
        case PoolError::SpawnFailed:  return "spawn_failed";
    }
    return "unknown";
}

} // namespace sluice::exec
