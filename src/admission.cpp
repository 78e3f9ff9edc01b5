#include "runbox/admission.hpp"

#include <algorithm>
#include <stdexcept>

namespace runbox {

    admission_pool::ticket& admission_pool::ticket::operator=(ticket&& other) noexcept {
        if (this != &other) {
            if (pool_ != nullptr) {
                pool_->release(owner_);
            }
            pool_ = other.pool_;
            owner_ = std::move(other.owner_);
            other.pool_ = nullptr;
        }
        return *this;
    }

    admission_pool::ticket::~ticket() {
        if (pool_ != nullptr) {
            pool_->release(owner_);
        }
    }

    admission_pool::admission_pool(size_t capacity) : capacity_{capacity} {
        if (capacity_ == 0U) {
            throw std::invalid_argument{"admission pool capacity must be positive"};
        }
    }

    const admission_pool::waiter* admission_pool::next_in_line() const {
        const waiter* best = nullptr;
        size_t best_running = 0U;
        for (const auto& w : waiters_) {
            auto it = active_by_owner_.find(w.owner);
            auto running = it == active_by_owner_.end() ? 0U : it->second;
            if (best == nullptr) {
                best = &w;
                best_running = running;
                continue;
            }
            // (running + 1) / weight, compared without division
            auto lhs = static_cast<uint64_t>(running + 1U) * best->weight;
            auto rhs = static_cast<uint64_t>(best_running + 1U) * w.weight;
            if (lhs < rhs || (lhs == rhs && w.seq < best->seq)) {
                best = &w;
                best_running = running;
            }
        }
        return best;
    }

    std::optional<admission_pool::ticket> admission_pool::acquire(
            const std::string& owner,
            uint32_t weight,
            std::chrono::steady_clock::time_point deadline,
            std::stop_token stop) {
        std::unique_lock lock{mutex_};
        auto seq = next_seq_++;
        auto self = waiters_.insert(waiters_.end(), waiter{seq, owner, std::max(weight, 1U)});

        auto admitted = cv_.wait_until(lock, stop, deadline, [&] {
            return active_ < capacity_ && next_in_line() == &*self;
        });

        waiters_.erase(self);
        if (!admitted) {
            // another waiter may now be first in line
            cv_.notify_all();
            return std::nullopt;
        }

        ++active_;
        ++active_by_owner_[owner];
        cv_.notify_all();
        return ticket{this, owner};
    }

    void admission_pool::release(const std::string& owner) {
        {
            std::lock_guard lock{mutex_};
            --active_;
            if (auto it = active_by_owner_.find(owner); it != active_by_owner_.end()) {
                if (--it->second == 0U) {
                    active_by_owner_.erase(it);
                }
            }
        }
        cv_.notify_all();
    }

    size_t admission_pool::active() const {
        std::lock_guard lock{mutex_};
        return active_;
    }

    size_t admission_pool::active_for(const std::string& owner) const {
        std::lock_guard lock{mutex_};
        auto it = active_by_owner_.find(owner);
        return it == active_by_owner_.end() ? 0U : it->second;
    }

    size_t admission_pool::waiting() const {
        std::lock_guard lock{mutex_};
        return waiters_.size();
    }

}  // namespace runbox
