#pragma once
/**
 * @file single_flight.hpp
 * @brief In-flight de-duplication: concurrent callers for one key share a single execution.
 * @details The first caller runs the work; callers arriving while it runs block on a
 *          shared_future and receive a copy of the same value. The key is released as soon as
 *          the value is published, so later callers start a new flight; callers that must not
 *          repeat finished work re-check their own result store inside the flight.
 */

#include <chrono>
#include <cstddef>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "sluice/core/string_key.hpp"

namespace sluice::exec {

template <class T>
class SingleFlight {
public:
    struct Outcome {
        T    value;
        bool shared{false}; ///< true when this caller joined someone else's flight
    };

    /// Run @p fn for @p key unless a flight is already running; exceptions reach every waiter.
    template <class Fn>
    Outcome run(std::string_view key, Fn&& fn) {
        return *run(key, std::forward<Fn>(fn), [] { return false; }, std::chrono::milliseconds{0});
    }

    /**
     * @brief As run(), but a joiner gives up once @p expired() returns true.
     * @details A joiner re-checks @p expired every @p poll while the flight runs (poll 0 = wait
     *          unbounded). The leader always runs @p fn to completion.
     * @return std::nullopt for a joiner that gave up; the flight keeps running for the others.
     */
    template <class Fn, class Expired>
    std::optional<Outcome> run(std::string_view key, Fn&& fn, Expired&& expired, std::chrono::milliseconds poll) {
        std::promise<T> promise;
        {
            std::unique_lock lk(mu_);
            if (auto it = flights_.find(key); it != flights_.end()) {
                auto fut = it->second;
                lk.unlock();
                if (poll.count() > 0) {
                    while (fut.wait_for(poll) != std::future_status::ready) {
                        if (expired()) return std::nullopt;
                    }
                }
                return Outcome{fut.get(), true};
            }
            flights_.emplace(std::string(key), promise.get_future().share());
        }

        try {
            T value = std::forward<Fn>(fn)();
            promise.set_value(value);
            finish(key);
            return Outcome{std::move(value), false};
        } catch (...) {
            promise.set_exception(std::current_exception());
            finish(key);
            throw;
        }
    }

    [[nodiscard]] std::size_t in_flight() const {
        std::lock_guard lk(mu_);
        return flights_.size();
    }

private:
    void finish(std::string_view key) {
        std::lock_guard lk(mu_);
        if (auto it = flights_.find(key); it != flights_.end()) flights_.erase(it);
    }

    mutable std::mutex mu_;
    std::unordered_map<std::string, std::shared_future<T>, core::StringKeyHash, core::StringKeyEq> flights_;
};

} // namespace sluice::exec
