#pragma once
/**
 * @file worker_pool.hpp
 * @brief Bounded worker pool for detached background work (cache refresh, sweeps).
 *
 * Design goals:
 *  - Bounded queue: submit() never blocks, it reports Full instead.
 *  - Explicit shutdown: Drain runs everything queued, Discard drops it. Nothing leaks.
 *  - Construction via factory; configuration errors are values, not exceptions.
 */

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>
#include <vector>

#include "sluice/compat/expected.hpp"
#include "sluice/config/constants.hpp"

namespace sluice::exec {

/// Factory errors (setup time only).
enum class PoolError : uint8_t {
    ThreadsZero = 1, ///< At least one worker is required
    CapacityZero,    ///< Queue capacity must not be zero
    SpawnFailed      ///< The OS refused to start a thread
};

/// Result of submit().
enum class SubmitErr : uint8_t { Ok, Full, Stopped };

/// What happens to queued tasks at shutdown.
enum class ShutdownMode : uint8_t { Drain, Discard };

/** @struct PoolConfig
 *  @brief Pool sizing and destructor policy.
 */
struct PoolConfig {
    std::size_t  threads{sluice::config::constants::WORKER_THREADS};
    std::size_t  queue_capacity{sluice::config::constants::WORKER_QUEUE_CAPACITY};
    ShutdownMode on_destroy{ShutdownMode::Drain};
};

class WorkerPool final {
public:
    using Task = std::function<void()>;

    /// Spawn the workers. Fails without leaving threads behind.
    static sluice_detail::expected<std::unique_ptr<WorkerPool>, PoolError> create(PoolConfig cfg);

    /// Shuts down with the configured on_destroy mode.
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Enqueue a task. Never blocks.
    [[nodiscard]] SubmitErr submit(Task task);

    /**
     * @brief Stop accepting work and join the workers.
     * @return Number of queued tasks dropped (always 0 for Drain).
     * @details Idempotent; later calls return 0.
     */
    std::size_t shutdown(ShutdownMode mode);

    /// Block until the queue is empty and no task is running.
    void wait_idle();

    [[nodiscard]] std::size_t pending() const;
    [[nodiscard]] bool stopped() const;

    struct Stats {
        uint64_t submitted{0}, completed{0}, rejected{0}, discarded{0}, failed{0};
    };
    [[nodiscard]] Stats stats() const;

private:
    explicit WorkerPool(PoolConfig cfg) noexcept : cfg_(cfg) {}
    void run();

    PoolConfig               cfg_;
    mutable std::mutex       mu_;
    std::condition_variable  work_cv_;
    std::condition_variable  idle_cv_;
    std::deque<Task>         queue_;
    std::vector<std::thread> workers_;
    std::size_t              active_{0};
    bool                     stopping_{false};
    bool                     draining_{true};
    Stats                    stats_{};
};

std::string_view to_string(PoolError e) noexcept;

} // namespace sluice::exec
