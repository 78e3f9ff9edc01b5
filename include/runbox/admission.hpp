#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <list>
#include <map>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>

namespace runbox {

    // Bounded concurrency gate for in-process executions. When a slot frees
    // up it goes to the waiter whose owner has the fewest running jobs per
    // unit of weight; equal shares are served in arrival order.
    class admission_pool {
      public:
        class ticket {
          public:
            ticket(ticket&& other) noexcept : pool_{other.pool_}, owner_{std::move(other.owner_)} {
                other.pool_ = nullptr;
            }
            ticket& operator=(ticket&& other) noexcept;
            ticket(const ticket&) = delete;
            ticket& operator=(const ticket&) = delete;
            ~ticket();

            const std::string& owner() const noexcept { return owner_; }

          private:
            friend class admission_pool;
            ticket(admission_pool* pool, std::string owner) : pool_{pool}, owner_{std::move(owner)} {}

            admission_pool* pool_;
            std::string owner_;
        };

        explicit admission_pool(size_t capacity);

        // Blocks until admitted; nullopt on deadline expiry or stop request.
        std::optional<ticket> acquire(
                const std::string& owner,
                uint32_t weight,
                std::chrono::steady_clock::time_point deadline,
                std::stop_token stop = {});

        size_t capacity() const noexcept { return capacity_; }
        size_t active() const;
        size_t active_for(const std::string& owner) const;
        size_t waiting() const;

      private:
        struct waiter {
            uint64_t seq{};
            std::string owner{};
            uint32_t weight{1U};
        };

        void release(const std::string& owner);
        // caller holds mutex_
        const waiter* next_in_line() const;

        mutable std::mutex mutex_{};
        std::condition_variable_any cv_{};
        size_t capacity_;
        size_t active_{};
        std::map<std::string, size_t> active_by_owner_{};
        std::list<waiter> waiters_{};
        uint64_t next_seq_{};
    };

}  // namespace runbox
