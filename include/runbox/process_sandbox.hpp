#pragma once

#include "backend.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace runbox {

    struct sandbox_settings {
        std::filesystem::path node_path{};
        std::filesystem::path python_path{};
        std::filesystem::path work_root{};
        size_t memory_mb{512U};
        size_t workers{4U};
        network_mode network{network_mode::isolated};

        static sandbox_settings from_config(const service_config& cfg);
    };

    // Handle to one queued or running sandbox job.
    class sandbox_job {
        // only process_sandbox can name this
        struct private_tag {
            explicit private_tag() = default;
        };

      public:
        sandbox_job(private_tag, uint64_t id, packaged_code code, run_options opts);

        uint64_t id() const noexcept { return id_; }

        std::shared_future<raw_outcome> outcome() const { return outcome_; }

        // Best effort and non-blocking: drops a queued job, kills the process
        // group of a running one.
        void cancel();

        bool cancel_requested() const noexcept { return cancel_requested_.load(); }

      private:
        friend class process_sandbox;

        uint64_t id_;
        packaged_code code_;
        run_options opts_;
        std::promise<raw_outcome> promise_{};
        std::shared_future<raw_outcome> outcome_{};
        std::atomic<bool> cancel_requested_{false};
        std::atomic<int> pid_{0};
    };

    // Out-of-process ephemeral sandbox: every job runs node or python3 in a
    // fresh working directory, its own session and (when permitted) network
    // namespace, under rlimits and with a scrubbed environment. Jobs are
    // consumed by a fixed pool of worker threads.
    class process_sandbox final : public execution_backend {
      public:
        explicit process_sandbox(sandbox_settings settings);
        ~process_sandbox() override;

        process_sandbox(const process_sandbox&) = delete;
        process_sandbox& operator=(const process_sandbox&) = delete;

        std::shared_ptr<sandbox_job> submit(const packaged_code& code, const run_options& opts);

        // submit() then wait up to the job timeout; expiry and stop requests
        // cancel the job without waiting for it to wind down.
        raw_outcome run(const packaged_code& code, const run_options& opts) override;

        bool supports(language lang) const;

        size_t queued() const;

      private:
        void worker_loop(std::stop_token stop);
        raw_outcome execute(sandbox_job& job);

        sandbox_settings settings_;
        mutable std::mutex mutex_{};
        std::condition_variable_any cv_{};
        std::deque<std::shared_ptr<sandbox_job>> queue_{};
        std::vector<std::shared_ptr<sandbox_job>> running_{};
        std::atomic<uint64_t> next_id_{1U};
        std::vector<std::jthread> workers_{};
    };

}  // namespace runbox
