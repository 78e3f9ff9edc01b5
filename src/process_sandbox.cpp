#include "runbox/process_sandbox.hpp"

#include "runbox/format.hpp"

#include "internal/platform.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#if RUNBOX_PLATFORM_LINUX
#include <sched.h>
#include <sys/prctl.h>
#endif

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fstream>
#include <system_error>

using namespace runbox::literals;
namespace fs = std::filesystem;

namespace runbox {

    namespace detail {

        static constexpr auto poll_slice = std::chrono::milliseconds{50};
        static constexpr auto await_grace = std::chrono::milliseconds{1000};
        static constexpr rlim_t open_file_limit = 256U;

        struct child_spec {
            std::vector<std::string> args{};
            std::vector<std::string> env{};
            std::string workdir{};
            size_t memory_mb{};
            rlim_t cpu_seconds{};
            bool isolate_network{true};
            bool limit_address_space{true};
        };

        struct capture_buffer {
            std::string text{};
            size_t limit{};
            bool truncated{false};

            void append(const char* data, size_t n) {
                if (text.size() >= limit) {
                    truncated = truncated || n > 0U;
                    return;
                }
                auto room = limit - text.size();
                if (n > room) {
                    truncated = true;
                    n = room;
                }
                text.append(data, n);
            }
        };

        static std::vector<char*> to_argv(std::vector<std::string>& values) {
            std::vector<char*> out{};
            out.reserve(values.size() + 1U);
            for (auto& v : values) {
                out.push_back(v.data());
            }
            out.push_back(nullptr);
            return out;
        }

        static void set_limit(int resource, rlim_t value) {
            rlimit lim{};
            lim.rlim_cur = value;
            lim.rlim_max = value;
            (void)::setrlimit(resource, &lim);
        }

        // Runs in the forked child: async-signal-safe calls only.
        [[noreturn]] static void exec_child(
                const child_spec& spec, char* const* argv, char* const* envp, int out_fd, int err_fd) {
            ::setsid();
#if RUNBOX_PLATFORM_LINUX
            ::prctl(PR_SET_PDEATHSIG, SIGKILL);
            if (spec.isolate_network) {
                // unprivileged first, then with CAP_SYS_ADMIN; running without is accepted
                if (::unshare(CLONE_NEWUSER | CLONE_NEWNET) != 0) {
                    (void)::unshare(CLONE_NEWNET);
                }
            }
#endif
            if (spec.limit_address_space) {
                set_limit(RLIMIT_AS, static_cast<rlim_t>(spec.memory_mb) * 1024U * 1024U);
            }
            set_limit(RLIMIT_CPU, spec.cpu_seconds);
            set_limit(RLIMIT_NOFILE, open_file_limit);
            set_limit(RLIMIT_CORE, 0U);

            if (::chdir(spec.workdir.c_str()) != 0) {
                _exit(126);
            }

            auto devnull = ::open("/dev/null", O_RDONLY);
            if (devnull >= 0) {
                ::dup2(devnull, STDIN_FILENO);
                ::close(devnull);
            }
            ::dup2(out_fd, STDOUT_FILENO);
            ::dup2(err_fd, STDERR_FILENO);

            ::execve(argv[0], argv, envp);
            static constexpr char msg[] = "runbox: failed to exec interpreter\n";
            (void)::write(STDERR_FILENO, msg, sizeof(msg) - 1U);
            _exit(127);
        }

        static void kill_group(int pid) {
            if (pid <= 0) {
                return;
            }
            ::kill(-pid, SIGKILL);
            ::kill(pid, SIGKILL);
        }

        static std::string make_workdir(const fs::path& root) {
            std::error_code ec{};
            fs::create_directories(root, ec);
            if (ec) {
                throw std::runtime_error{"failed to create sandbox root {}: {}"_format(root.string(), ec.message())};
            }
            auto pattern = (root / "job-XXXXXX").string();
            if (::mkdtemp(pattern.data()) == nullptr) {
                throw std::runtime_error{"mkdtemp failed in {}: {}"_format(root.string(), std::strerror(errno))};
            }
            return pattern;
        }

        static void write_text_file(const fs::path& path, std::string_view text) {
            std::ofstream out{path, std::ios::binary};
            if (!out) {
                throw std::runtime_error("failed to open file for write: {}"_format(path.string()));
            }
            out << text;
            if (!out) {
                throw std::runtime_error("failed to write file: {}"_format(path.string()));
            }
        }

        static void remove_workdir(const std::string& dir) {
            std::error_code ec{};
            fs::remove_all(dir, ec);
            if (ec) {
                log_warn("failed to remove sandbox workdir ", dir, ": ", ec.message());
            }
        }

        static std::string trim_copy(std::string_view text) {
            return std::string{utils::trim_ascii(text)};
        }

    }  // namespace detail

    sandbox_settings sandbox_settings::from_config(const service_config& cfg) {
        sandbox_settings s{};
        s.node_path = cfg.node_path;
        s.python_path = cfg.python_path;
        s.work_root = cfg.work_root;
        s.memory_mb = cfg.sandbox_memory_mb;
        s.workers = cfg.sandbox_workers;
        s.network = cfg.sandbox_network;
        return s;
    }

    sandbox_job::sandbox_job(private_tag, uint64_t id, packaged_code code, run_options opts)
        : id_{id}, code_{std::move(code)}, opts_{std::move(opts)} {
        outcome_ = promise_.get_future().share();
    }

    void sandbox_job::cancel() {
        cancel_requested_.store(true);
        detail::kill_group(pid_.load());
    }

    process_sandbox::process_sandbox(sandbox_settings settings) : settings_{std::move(settings)} {
        auto count = std::max<size_t>(settings_.workers, 1U);
        workers_.reserve(count);
        for (size_t i = 0U; i < count; ++i) {
            workers_.emplace_back([this](std::stop_token stop) { worker_loop(stop); });
        }
    }

    process_sandbox::~process_sandbox() {
        std::deque<std::shared_ptr<sandbox_job>> abandoned{};
        {
            std::lock_guard lock{mutex_};
            abandoned.swap(queue_);
            for (auto& job : running_) {
                job->cancel();
            }
        }
        for (auto& job : abandoned) {
            raw_outcome out{};
            out.cancelled = true;
            job->promise_.set_value(std::move(out));
        }
        for (auto& w : workers_) {
            w.request_stop();
        }
        cv_.notify_all();
        workers_.clear();
    }

    bool process_sandbox::supports(language lang) const {
        return lang == language::python ? !settings_.python_path.empty() : !settings_.node_path.empty();
    }

    size_t process_sandbox::queued() const {
        std::lock_guard lock{mutex_};
        return queue_.size();
    }

    std::shared_ptr<sandbox_job> process_sandbox::submit(const packaged_code& code, const run_options& opts) {
        auto id = next_id_.fetch_add(1U);
        auto job = std::make_shared<sandbox_job>(sandbox_job::private_tag{}, id, code, opts);
        {
            std::lock_guard lock{mutex_};
            queue_.push_back(job);
        }
        cv_.notify_one();
        log_info("sandbox job ", id, " queued (", code.script_name, ")");
        return job;
    }

    raw_outcome process_sandbox::run(const packaged_code& code, const run_options& opts) {
        auto start = std::chrono::steady_clock::now();
        auto job = submit(code, opts);
        auto outcome = job->outcome();
        auto deadline = start + opts.timeout + detail::await_grace;

        while (true) {
            auto now = std::chrono::steady_clock::now();
            if (opts.stop.stop_requested()) {
                job->cancel();
                raw_outcome out{};
                out.cancelled = true;
                out.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - start).count();
                return out;
            }
            if (now >= deadline) {
                job->cancel();
                log_warn("sandbox job ", job->id(), " did not complete before its deadline");
                raw_outcome out{};
                out.timed_out = true;
                out.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - start).count();
                return out;
            }
            auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, detail::poll_slice);
            if (outcome.wait_for(slice) == std::future_status::ready) {
                return outcome.get();
            }
        }
    }

    void process_sandbox::worker_loop(std::stop_token stop) {
        while (!stop.stop_requested()) {
            std::shared_ptr<sandbox_job> job{};
            {
                std::unique_lock lock{mutex_};
                if (!cv_.wait(lock, stop, [this] { return !queue_.empty(); })) {
                    return;
                }
                job = std::move(queue_.front());
                queue_.pop_front();
                running_.push_back(job);
            }

            raw_outcome out{};
            try {
                out = execute(*job);
            } catch (const std::exception& e) {
                log_error("sandbox job ", job->id(), " failed to start: ", e.what());
                out = raw_outcome{};
                out.unavailable = true;
                out.error_name = "Error";
                out.error_message = e.what();
            }

            {
                std::lock_guard lock{mutex_};
                std::erase(running_, job);
            }
            job->promise_.set_value(std::move(out));
        }
    }

    raw_outcome process_sandbox::execute(sandbox_job& job) {
        raw_outcome out{};
        auto start = std::chrono::steady_clock::now();
        auto elapsed = [&start] {
            return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start)
                    .count();
        };

        if (job.cancel_requested()) {
            out.cancelled = true;
            return out;
        }

        const auto& code = job.code_;
        const auto& interpreter = code.lang == language::python ? settings_.python_path : settings_.node_path;
        if (interpreter.empty()) {
            out.unavailable = true;
            out.error_name = "Error";
            out.error_message = "No {} interpreter is configured for the sandbox"_format(
                    code.lang == language::python ? internal::platform::tool::python : internal::platform::tool::node);
            return out;
        }

        auto workdir = detail::make_workdir(settings_.work_root);
        auto script = fs::path{workdir} / code.script_name;
        try {
            detail::write_text_file(script, code.source);
        } catch (const std::runtime_error&) {
            detail::remove_workdir(workdir);
            throw;
        }

        auto timeout_seconds = std::chrono::duration_cast<std::chrono::seconds>(job.opts_.timeout).count();

        detail::child_spec spec{};
        spec.workdir = workdir;
        spec.memory_mb = settings_.memory_mb;
        spec.cpu_seconds = static_cast<rlim_t>(timeout_seconds + 1);
        spec.isolate_network = settings_.network == network_mode::isolated && internal::platform::supports_netns;
        spec.args.push_back(interpreter.string());
        if (code.lang == language::python) {
            spec.args.push_back("-I");
            spec.args.push_back("-u");
        }
        else {
            // V8 reserves far more address space than it uses; cap the heap instead
            spec.limit_address_space = false;
            spec.args.push_back("--max-old-space-size={}"_format(settings_.memory_mb));
        }
        spec.args.push_back(script.string());
        spec.env = {
                "PATH=/usr/local/bin:/usr/bin:/bin",
                "HOME={}"_format(workdir),
                "TMPDIR={}"_format(workdir),
                "LANG=C.UTF-8",
                "PYTHONDONTWRITEBYTECODE=1",
                "PYTHONUNBUFFERED=1",
                "NODE_DISABLE_COLORS=1"};

        auto argv = detail::to_argv(spec.args);
        auto envp = detail::to_argv(spec.env);

        int stdout_pipe[2]{};
        int stderr_pipe[2]{};
        if (::pipe2(stdout_pipe, O_CLOEXEC) != 0) {
            detail::remove_workdir(workdir);
            throw std::runtime_error{"pipe() failed: {}"_format(std::strerror(errno))};
        }
        if (::pipe2(stderr_pipe, O_CLOEXEC) != 0) {
            ::close(stdout_pipe[0]);
            ::close(stdout_pipe[1]);
            detail::remove_workdir(workdir);
            throw std::runtime_error{"pipe() failed: {}"_format(std::strerror(errno))};
        }

        auto pid = ::fork();
        if (pid < 0) {
            ::close(stdout_pipe[0]);
            ::close(stdout_pipe[1]);
            ::close(stderr_pipe[0]);
            ::close(stderr_pipe[1]);
            detail::remove_workdir(workdir);
            throw std::runtime_error{"fork() failed: {}"_format(std::strerror(errno))};
        }

        if (pid == 0) {
            detail::exec_child(spec, argv.data(), envp.data(), stdout_pipe[1], stderr_pipe[1]);
        }

        // parent
        job.pid_.store(pid);
        ::close(stdout_pipe[1]);
        ::close(stderr_pipe[1]);
        if (job.cancel_requested()) {
            detail::kill_group(pid);
        }

        harness_stream out_stream{job.opts_.max_stdout_bytes};
        detail::capture_buffer err_buf{};
        err_buf.limit = job.opts_.max_stdout_bytes;

        bool timed_out = false;
        bool cancelled = false;
        int fds_open = 2;

        pollfd fds[2]{};
        fds[0] = {.fd = stdout_pipe[0], .events = POLLIN, .revents = 0};
        fds[1] = {.fd = stderr_pipe[0], .events = POLLIN, .revents = 0};

        auto deadline = start + job.opts_.timeout;

        while (fds_open > 0) {
            if (job.cancel_requested()) {
                cancelled = true;
                break;
            }
            auto remaining =
                    std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                timed_out = true;
                break;
            }

            auto wait = std::min(remaining, detail::poll_slice);
            int ret = ::poll(fds, 2, static_cast<int>(wait.count()));
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                break;
            }
            if (ret == 0) {
                continue;
            }

            char chunk[4096]{};
            for (int i = 0; i < 2; ++i) {
                if (fds[i].fd < 0) {
                    continue;
                }
                if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
                    auto n = ::read(fds[i].fd, chunk, sizeof(chunk));
                    if (n > 0) {
                        if (i == 0) {
                            out_stream.append(std::string_view{chunk, static_cast<size_t>(n)});
                        }
                        else {
                            err_buf.append(chunk, static_cast<size_t>(n));
                        }
                    }
                    else if (n == 0 || errno != EINTR) {
                        ::close(fds[i].fd);
                        fds[i].fd = -1;
                        --fds_open;
                    }
                }
            }
        }

        if (timed_out || cancelled) {
            detail::kill_group(pid);
        }

        for (auto& f : fds) {
            if (f.fd >= 0) {
                ::close(f.fd);
            }
        }

        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        job.pid_.store(0);
        detail::remove_workdir(workdir);

        // CPU rlimit expiry
        if (WIFSIGNALED(status) && (WTERMSIG(status) == SIGXCPU)) {
            timed_out = true;
        }

        auto harness = out_stream.finish();
        out.stdout_text = std::move(harness.stdout_text);
        out.stdout_truncated = harness.stdout_truncated;
        out.elapsed_ms = elapsed();

        if (cancelled) {
            out.cancelled = true;
            return out;
        }
        if (timed_out) {
            out.timed_out = true;
            return out;
        }

        auto exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
        if (exit_code == 0 && harness.result_truncated) {
            out.error_name = "RangeError";
            out.error_message = "Execution result exceeded the limit of {} bytes"_format(max_result_bytes);
            out.error_text = "{}: {}"_format(out.error_name, out.error_message);
            return out;
        }
        if (exit_code == 0) {
            out.ok = true;
            out.result = harness.result ? std::move(*harness.result) : make_null();
            return out;
        }

        out.error_text = detail::trim_copy(err_buf.text);
        if (out.error_text.empty()) {
            out.error_text = detail::trim_copy(out.stdout_text);
        }
        if (out.error_text.empty()) {
            out.error_text = "Process exited with status {}"_format(exit_code);
        }
        if (exit_code == 127 && err_buf.text.starts_with("runbox: failed to exec"sv)) {
            out.unavailable = true;
            out.error_message = out.error_text;
        }
        log_info("sandbox job ", job.id(), " exited with status ", exit_code);
        return out;
    }

}  // namespace runbox
