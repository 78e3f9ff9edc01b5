#include "runbox/isolate.hpp"

#include "runbox/format.hpp"

#include <libplatform/libplatform.h>
#include <v8.h>

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

using namespace runbox::literals;

namespace runbox {

    namespace detail {

        enum class stop_reason : uint8_t { none, timeout, cancelled, out_of_memory };

        struct console_capture {
            std::string text{};
            size_t limit{};
            bool truncated{false};

            void append_line(std::string_view line) {
                if (truncated) {
                    return;
                }
                if (text.size() + line.size() + 1U > limit) {
                    auto room = limit > text.size() ? limit - text.size() : 0U;
                    text.append(line.substr(0U, room));
                    truncated = true;
                    return;
                }
                text.append(line);
                text.push_back('\n');
            }
        };

        // Shared between the executing thread, the watchdog and V8 callbacks.
        struct run_state {
            v8::Isolate* isolate{nullptr};
            std::mutex mutex{};
            std::condition_variable_any cv{};
            bool done{false};
            bool cancel_requested{false};
            std::atomic<stop_reason> reason{stop_reason::none};

            void terminate(stop_reason why) {
                auto expected = stop_reason::none;
                if (reason.compare_exchange_strong(expected, why)) {
                    isolate->TerminateExecution();
                }
            }
        };

        static std::string to_std_string(v8::Isolate* isolate, v8::Local<v8::Value> v) {
            v8::String::Utf8Value utf8{isolate, v};
            if (*utf8 == nullptr) {
                return {};
            }
            return std::string{*utf8, static_cast<size_t>(utf8.length())};
        }

        static v8::MaybeLocal<v8::String> new_string(v8::Isolate* isolate, std::string_view text) {
            return v8::String::NewFromUtf8(isolate, text.data(), v8::NewStringType::kNormal, static_cast<int>(text.size()));
        }

        static std::optional<std::string> string_property(
                v8::Isolate* isolate, v8::Local<v8::Context> context, v8::Local<v8::Object> obj, std::string_view key) {
            v8::Local<v8::String> name{};
            v8::Local<v8::Value> prop{};
            if (!new_string(isolate, key).ToLocal(&name) || !obj->Get(context, name).ToLocal(&prop) ||
                prop->IsUndefined() || prop->IsNull()) {
                return std::nullopt;
            }
            return to_std_string(isolate, prop);
        }

        static std::string display_string(
                v8::Isolate* isolate, v8::Local<v8::Context> context, v8::Local<v8::Value> v) {
            if (v->IsString()) {
                return to_std_string(isolate, v);
            }
            if (v->IsNativeError()) {
                if (auto stack = string_property(isolate, context, v.As<v8::Object>(), "stack"sv)) {
                    return *stack;
                }
                return to_std_string(isolate, v);
            }
            if (v->IsObject() && !v->IsFunction()) {
                v8::TryCatch try_catch{isolate};
                v8::Local<v8::String> json{};
                if (v8::JSON::Stringify(context, v).ToLocal(&json)) {
                    return to_std_string(isolate, json);
                }
            }
            return to_std_string(isolate, v);
        }

        static void console_write(const v8::FunctionCallbackInfo<v8::Value>& info) {
            auto* capture = static_cast<console_capture*>(info.Data().As<v8::External>()->Value());
            auto* isolate = info.GetIsolate();
            auto context = isolate->GetCurrentContext();
            std::string line{};
            for (int i = 0; i < info.Length(); ++i) {
                if (i > 0) {
                    line.push_back(' ');
                }
                line += display_string(isolate, context, info[i]);
            }
            capture->append_line(line);
        }

        static bool install_console(v8::Isolate* isolate, v8::Local<v8::Context> context, console_capture& capture) {
            auto console = v8::Object::New(isolate);
            auto data = v8::External::New(isolate, &capture);
            for (auto method : {"log"sv, "info"sv, "warn"sv, "error"sv, "debug"sv, "trace"sv}) {
                v8::Local<v8::Function> fn{};
                v8::Local<v8::String> name{};
                if (!v8::Function::New(context, console_write, data).ToLocal(&fn) ||
                    !new_string(isolate, method).ToLocal(&name) || !console->Set(context, name, fn).FromMaybe(false)) {
                    return false;
                }
            }
            v8::Local<v8::String> console_name{};
            return new_string(isolate, "console"sv).ToLocal(&console_name) &&
                   context->Global()->Set(context, console_name, console).FromMaybe(false);
        }

        static bool install_json_global(
                v8::Isolate* isolate, v8::Local<v8::Context> context, std::string_view name, const std::string& json) {
            v8::Local<v8::String> key{};
            v8::Local<v8::String> text{};
            v8::Local<v8::Value> parsed{};
            if (!new_string(isolate, name).ToLocal(&key) || !new_string(isolate, json).ToLocal(&text) ||
                !v8::JSON::Parse(context, text).ToLocal(&parsed)) {
                return false;
            }
            return context->Global()->Set(context, key, parsed).FromMaybe(false);
        }

        static bool install_globals(v8::Isolate* isolate, v8::Local<v8::Context> context, const packaged_code& code) {
            value_object env{};
            for (const auto& [k, v] : code.env_vars) {
                env.emplace(k, make_string(v));
            }
            if (!install_json_global(isolate, context, "params"sv, to_json(make_object(code.params))) ||
                !install_json_global(isolate, context, "environmentVariables"sv, to_json(make_object(std::move(env))))) {
                return false;
            }
            for (const auto& b : code.bindings) {
                if (!install_json_global(isolate, context, b.name, to_json(b.bound))) {
                    return false;
                }
            }
            return true;
        }

        static void fill_exception(
                raw_outcome& out, v8::Isolate* isolate, v8::Local<v8::Context> context, v8::Local<v8::Value> exception) {
            if (exception.IsEmpty()) {
                out.error_name = "Error";
                out.error_message = "Unknown error";
                return;
            }
            if (exception->IsObject()) {
                auto obj = exception.As<v8::Object>();
                out.error_name = string_property(isolate, context, obj, "name"sv).value_or("Error");
                out.error_message = string_property(isolate, context, obj, "message"sv).value_or("");
                out.stack = string_property(isolate, context, obj, "stack"sv).value_or("");
                if (out.error_message.empty() && !exception->IsNativeError()) {
                    out.error_message = display_string(isolate, context, exception);
                }
            }
            else {
                // `throw "text"` and other primitives
                out.error_name = "Error";
                out.error_message = to_std_string(isolate, exception);
            }
            if (out.error_message.empty()) {
                out.error_message = "Unknown error";
            }
        }

        static size_t near_heap_limit(void* data, size_t current_heap_limit, size_t /*initial_heap_limit*/) {
            auto* state = static_cast<run_state*>(data);
            state->terminate(stop_reason::out_of_memory);
            // headroom to unwind after termination
            return current_heap_limit * 2U;
        }

        struct isolate_deleter {
            void operator()(v8::Isolate* isolate) const { isolate->Dispose(); }
        };

        static void execute(
                raw_outcome& out,
                v8::Isolate* isolate,
                run_state& state,
                console_capture& capture,
                const packaged_code& code) {
            v8::Isolate::Scope isolate_scope{isolate};
            v8::HandleScope handle_scope{isolate};
            auto context = v8::Context::New(isolate);
            v8::Context::Scope context_scope{context};
            v8::TryCatch try_catch{isolate};

            if (!install_console(isolate, context, capture) || !install_globals(isolate, context, code)) {
                out.unavailable = true;
                out.error_name = "Error";
                out.error_message = "Failed to initialize the execution context";
                return;
            }

            v8::Local<v8::String> source{};
            v8::Local<v8::String> resource{};
            if (!new_string(isolate, code.source).ToLocal(&source) ||
                !new_string(isolate, code.script_name).ToLocal(&resource)) {
                out.error_name = "RangeError";
                out.error_message = "Code is too large";
                return;
            }

            v8::ScriptOrigin origin{isolate, resource};
            v8::Local<v8::Script> script{};
            if (!v8::Script::Compile(context, source, &origin).ToLocal(&script)) {
                out.is_compile_error = true;
                fill_exception(out, isolate, context, try_catch.Exception());
                auto message = try_catch.Message();
                if (!message.IsEmpty()) {
                    if (auto line = message->GetLineNumber(context).FromMaybe(0); line > 0) {
                        out.raw_line = static_cast<size_t>(line);
                        out.raw_column = static_cast<size_t>(message->GetStartColumn() + 1);
                        v8::Local<v8::String> source_line{};
                        std::string text{};
                        if (message->GetSourceLine(context).ToLocal(&source_line)) {
                            text = to_std_string(isolate, source_line);
                        }
                        out.stack = "{}:{}\n{}\n\n{}: {}"_format(
                                code.script_name, line, text, out.error_name, out.error_message);
                    }
                }
                return;
            }

            v8::Local<v8::Value> completion{};
            if (!script->Run(context).ToLocal(&completion)) {
                if (try_catch.HasTerminated() || state.reason.load() != stop_reason::none) {
                    return;
                }
                fill_exception(out, isolate, context, try_catch.Exception());
                return;
            }

            if (!completion->IsPromise()) {
                out.ok = true;
                out.result = make_null();
                return;
            }

            auto promise = completion.As<v8::Promise>();
            isolate->PerformMicrotaskCheckpoint();
            if (try_catch.HasTerminated() || state.reason.load() != stop_reason::none) {
                return;
            }

            switch (promise->State()) {
                case v8::Promise::kPending:
                    out.error_name = "Error";
                    out.error_message = "Execution did not settle: the returned promise never resolved";
                    return;
                case v8::Promise::kRejected:
                    fill_exception(out, isolate, context, promise->Result());
                    return;
                case v8::Promise::kFulfilled:
                    break;
            }

            auto result = promise->Result();
            out.ok = true;
            out.result = make_null();
            if (result->IsUndefined()) {
                return;
            }
            v8::Local<v8::String> json{};
            if (!v8::JSON::Stringify(context, result).ToLocal(&json)) {
                if (try_catch.HasTerminated()) {
                    out.ok = false;
                    return;
                }
                out.ok = false;
                fill_exception(out, isolate, context, try_catch.Exception());
                return;
            }
            if (auto parsed = parse_json(to_std_string(isolate, json))) {
                out.result = std::move(*parsed);
            }
        }

    }  // namespace detail

    void initialize_v8() {
        static std::once_flag once{};
        static std::unique_ptr<v8::Platform> platform{};
        std::call_once(once, [] {
            platform = v8::platform::NewDefaultPlatform();
            v8::V8::InitializePlatform(platform.get());
            v8::V8::Initialize();
        });
    }

    isolate_backend::isolate_backend(size_t capacity, size_t heap_limit_mb)
        : pool_{capacity}, heap_limit_mb_{heap_limit_mb} {}

    raw_outcome isolate_backend::run(const packaged_code& code, const run_options& opts) {
        raw_outcome out{};
        auto start = std::chrono::steady_clock::now();
        auto deadline = start + opts.timeout;
        auto finish = [&]() -> raw_outcome {
            out.elapsed_ms =
                    std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start)
                            .count();
            return std::move(out);
        };

        auto ticket = pool_.acquire(opts.owner, opts.weight, deadline, opts.stop);
        if (!ticket) {
            out.cancelled = opts.stop.stop_requested();
            out.timed_out = !out.cancelled;
            return finish();
        }

        initialize_v8();

        std::unique_ptr<v8::ArrayBuffer::Allocator> allocator{v8::ArrayBuffer::Allocator::NewDefaultAllocator()};
        v8::Isolate::CreateParams params{};
        params.array_buffer_allocator = allocator.get();
        params.constraints.ConfigureDefaultsFromHeapSize(0U, heap_limit_mb_ * 1024U * 1024U);

        std::unique_ptr<v8::Isolate, detail::isolate_deleter> isolate{v8::Isolate::New(params)};
        if (!isolate) {
            out.unavailable = true;
            out.error_name = "Error";
            out.error_message = "Failed to create an isolate";
            return finish();
        }

        detail::run_state state{};
        state.isolate = isolate.get();
        isolate->AddNearHeapLimitCallback(detail::near_heap_limit, &state);

        detail::console_capture capture{};
        capture.limit = opts.max_stdout_bytes;

        auto request_cancel = [&state] {
            {
                std::lock_guard lock{state.mutex};
                state.cancel_requested = true;
            }
            state.cv.notify_all();
        };
        std::stop_callback on_cancel{opts.stop, request_cancel};

        std::thread watchdog{[&state, deadline] {
            std::unique_lock lock{state.mutex};
            state.cv.wait_until(lock, deadline, [&state] { return state.done || state.cancel_requested; });
            if (state.done) {
                return;
            }
            state.terminate(state.cancel_requested ? detail::stop_reason::cancelled : detail::stop_reason::timeout);
        }};

        detail::execute(out, isolate.get(), state, capture, code);

        {
            std::lock_guard lock{state.mutex};
            state.done = true;
        }
        state.cv.notify_all();
        watchdog.join();

        switch (state.reason.load()) {
            case detail::stop_reason::none:
                break;
            case detail::stop_reason::timeout:
                out.ok = false;
                out.timed_out = true;
                break;
            case detail::stop_reason::cancelled:
                out.ok = false;
                out.cancelled = true;
                break;
            case detail::stop_reason::out_of_memory:
                out.ok = false;
                out.error_name = "RangeError";
                out.error_message = "Execution exceeded the memory limit of {} MB"_format(heap_limit_mb_);
                break;
        }

        out.stdout_text = std::move(capture.text);
        out.stdout_truncated = capture.truncated;
        return finish();
    }

}  // namespace runbox
