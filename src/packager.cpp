#include "runbox/packager.hpp"

#include "runbox/errors.hpp"
#include "runbox/format.hpp"

#include "internal/js_scanner.hpp"

#include <sstream>

using namespace runbox::literals;

namespace runbox {

    namespace detail {

        // Counts every newline it writes, so line offsets are known by construction.
        class source_writer {
          public:
            void line(std::string_view text) {
                out_ << text << '\n';
                lines_ += utils::count_newlines(text) + 1U;
            }

            size_t lines() const noexcept { return lines_; }

            std::string str() const { return out_.str(); }

          private:
            std::ostringstream out_{};
            size_t lines_{};
        };

        static std::string env_object_json(const std::map<std::string, std::string, std::less<>>& env) {
            value_object obj{};
            for (const auto& [k, v] : env) {
                obj.emplace(k, make_string(v));
            }
            return to_json(make_object(std::move(obj)));
        }

        static std::string deserialize_call(language lang, const std::string& json) {
            return lang == language::python ? "json.loads({})"_format(quote_json_string(json))
                                            : "JSON.parse({})"_format(quote_json_string(json));
        }

        static size_t write_body(source_writer& out, std::string_view body, std::string_view indent) {
            auto lines = utils::split_lines(body);
            for (auto l : lines) {
                if (l.empty()) {
                    out.line(""sv);
                }
                else {
                    out.line("{}{}"_format(indent, l));
                }
            }
            return lines.size();
        }

        static std::vector<std::string> custom_tool_parameters(const value_object& params) {
            const auto& grammar = internal::js::js_grammar::instance();
            std::vector<std::string> names{};
            for (const auto& [key, _] : params) {
                if (!grammar.is_binding_identifier(key)) {
                    log_warn("custom tool parameter '", key, "' is not a valid identifier; not declared");
                    continue;
                }
                names.push_back(key);
            }
            return names;
        }

        static packaged_code package_isolate(const resolved_code& resolved, const execution_request& req) {
            packaged_code out{};
            out.lang = language::javascript;
            out.backend = backend_kind::isolate;
            out.format = module_format::script;
            out.script_name = std::string{isolate_script_name};
            out.body_indent = "";

            source_writer src{};
            src.line("(async () => {"sv);
            src.line("  try {"sv);
            out.wrapper_line_count = src.lines();

            if (req.is_custom_tool) {
                for (const auto& name : custom_tool_parameters(req.params)) {
                    src.line("    const {0} = params.{0};"_format(name));
                    ++out.param_line_count;
                }
            }

            out.prologue_line_count = src.lines();
            out.body_line_count = write_body(src, resolved.code, out.body_indent);

            src.line("  } catch (error) {"sv);
            src.line("    throw error;"sv);
            src.line("  }"sv);
            src.line("})()"sv);

            out.source = src.str();
            out.user_code = resolved.code;
            out.params = req.params;
            out.env_vars = req.env_vars;
            out.bindings = resolved.bindings;
            return out;
        }

        static packaged_code package_node(
                const resolved_code& resolved, const dependency_report& deps, const execution_request& req) {
            packaged_code out{};
            out.lang = language::javascript;
            out.backend = backend_kind::sandbox;
            out.format = deps.extraction.has_static_imports() ? module_format::esm : module_format::commonjs;
            out.script_name = out.format == module_format::esm ? "main.mjs" : "main.cjs";
            out.body_indent = "";

            source_writer src{};
            if (deps.extraction.has_static_imports()) {
                src.line(deps.extraction.imports);
                if (deps.uses_require) {
                    src.line("import { createRequire as __runbox_create_require } from 'node:module';"sv);
                    src.line("const require = __runbox_create_require(import.meta.url);"sv);
                }
            }

            src.line("const params = {};"_format(deserialize_call(language::javascript, to_json(make_object(req.params)))));
            src.line("const environmentVariables = {};"_format(
                    deserialize_call(language::javascript, env_object_json(req.env_vars))));
            for (const auto& b : resolved.bindings) {
                src.line("const {} = {};"_format(b.name, format_literal(b.bound, language::javascript)));
            }

            auto wrapper_start = src.lines();
            src.line(";(async () => {"sv);
            src.line("  try {"sv);
            src.line("    const __runbox_result = await (async () => {"sv);
            out.wrapper_line_count = src.lines() - wrapper_start;

            out.prologue_line_count = src.lines();
            const auto& body = deps.extraction.has_static_imports() ? deps.extraction.remaining_code : resolved.code;
            out.body_line_count = write_body(src, body, out.body_indent);

            src.line("    })();"sv);
            src.line("    console.log('\\n{}' + JSON.stringify(__runbox_result));"_format(result_sentinel));
            src.line("  } catch (error) {"sv);
            src.line("    console.log(String((error && (error.stack || error.message)) || error));"sv);
            src.line("    throw error;"sv);
            src.line("  }"sv);
            src.line("})();"sv);

            out.source = src.str();
            out.user_code = resolved.code;
            return out;
        }

        static packaged_code package_python(const resolved_code& resolved, const execution_request& req) {
            packaged_code out{};
            out.lang = language::python;
            out.backend = backend_kind::sandbox;
            out.format = module_format::python;
            out.script_name = "main.py";
            out.body_indent = "    ";

            source_writer src{};
            src.line("import json"sv);
            src.line("params = {}"_format(deserialize_call(language::python, to_json(make_object(req.params)))));
            src.line("environmentVariables = {}"_format(
                    deserialize_call(language::python, env_object_json(req.env_vars))));
            for (const auto& b : resolved.bindings) {
                src.line("{} = {}"_format(b.name, format_literal(b.bound, language::python)));
            }

            auto wrapper_start = src.lines();
            src.line("def __runbox_main__():"sv);
            out.wrapper_line_count = src.lines() - wrapper_start;

            out.prologue_line_count = src.lines();
            out.body_line_count = write_body(src, resolved.code, out.body_indent);

            src.line("    pass"sv);
            src.line("try:"sv);
            src.line("    __runbox_result__ = __runbox_main__()"sv);
            src.line("except BaseException:"sv);
            src.line("    import traceback"sv);
            src.line("    print(traceback.format_exc(), end='', flush=True)"sv);
            src.line("    raise"sv);
            src.line("print('\\n{}' + json.dumps(__runbox_result__, default=str))"_format(result_sentinel));

            out.source = src.str();
            out.user_code = resolved.code;
            return out;
        }

    }  // namespace detail

    backend_kind select_backend(language lang, bool has_imports, bool is_custom_tool, bool sandbox_enabled) {
        if (lang == language::python) {
            if (!sandbox_enabled) {
                throw execution_error{
                        error_kind::configuration,
                        "Python execution requires the process sandbox to be enabled. Please contact your "
                        "administrator to enable it, or use JavaScript instead."};
            }
            return backend_kind::sandbox;
        }
        if (has_imports && !sandbox_enabled) {
            throw execution_error{
                    error_kind::configuration,
                    "JavaScript code with import statements requires the process sandbox to be enabled. Please "
                    "remove the import statements, or contact your administrator to enable it."};
        }
        if (is_custom_tool || !has_imports) {
            return backend_kind::isolate;
        }
        return backend_kind::sandbox;
    }

    packaged_code package_code(
            const resolved_code& resolved,
            const dependency_report& deps,
            const execution_request& req,
            backend_kind backend) {
        if (req.lang == language::python) {
            return detail::package_python(resolved, req);
        }
        if (backend == backend_kind::isolate) {
            return detail::package_isolate(resolved, req);
        }
        return detail::package_node(resolved, deps, req);
    }

    std::string unpackage(const packaged_code& packaged) {
        auto lines = utils::split_lines(packaged.source);
        std::vector<std::string> body{};
        body.reserve(packaged.body_line_count);
        for (size_t i = packaged.prologue_line_count;
             i < packaged.prologue_line_count + packaged.body_line_count && i < lines.size();
             ++i) {
            auto l = lines[i];
            if (l.starts_with(packaged.body_indent)) {
                l.remove_prefix(packaged.body_indent.size());
            }
            body.emplace_back(l);
        }
        return utils::join_with_separator(body, "\n"sv);
    }

    harness_stream::harness_stream(size_t stdout_limit, size_t result_limit)
        : stdout_limit_{stdout_limit}, result_limit_{result_limit} {}

    void harness_stream::emit_stdout(std::string_view text) {
        if (text.empty()) {
            return;
        }
        auto& out = out_.stdout_text;
        if (out.size() >= stdout_limit_) {
            out_.stdout_truncated = true;
            return;
        }
        auto room = stdout_limit_ - out.size();
        if (text.size() > room) {
            out_.stdout_truncated = true;
            text = text.substr(0U, room);
        }
        out.append(text);
    }

    // A completed result line followed by another one was user output.
    void harness_stream::release_held_result() {
        if (!has_result_) {
            return;
        }
        has_result_ = false;
        emit_stdout(result_marker);
        emit_stdout(result_);
        emit_stdout("\n"sv);
        result_.clear();
        out_.result_truncated = false;
    }

    void harness_stream::append(std::string_view chunk) {
        pending_.append(chunk);

        while (!pending_.empty()) {
            if (collecting_result_) {
                auto eol = pending_.find('\n');
                auto piece = std::string_view{pending_}.substr(0U, eol);
                if (result_.size() + piece.size() > result_limit_) {
                    out_.result_truncated = true;
                }
                else {
                    result_.append(piece);
                }
                if (eol == std::string::npos) {
                    pending_.clear();
                    break;
                }
                pending_.erase(0U, eol + 1U);
                collecting_result_ = false;
                has_result_ = true;
                continue;
            }

            auto pos = pending_.find(result_marker);
            if (pos != std::string::npos) {
                release_held_result();
                emit_stdout(std::string_view{pending_}.substr(0U, pos));
                pending_.erase(0U, pos + result_marker.size());
                collecting_result_ = true;
                continue;
            }

            // keep a possible partial marker for the next chunk
            auto keep = std::min(pending_.size(), result_marker.size() - 1U);
            emit_stdout(std::string_view{pending_}.substr(0U, pending_.size() - keep));
            pending_.erase(0U, pending_.size() - keep);
            break;
        }
    }

    harness_output harness_stream::finish() {
        if (collecting_result_) {
            // output ended inside the result line
            collecting_result_ = false;
            has_result_ = true;
        }
        else {
            emit_stdout(pending_);
        }
        pending_.clear();

        if (has_result_ && !out_.result_truncated) {
            if (auto parsed = parse_json(utils::trim_ascii(result_))) {
                out_.result = std::move(*parsed);
            }
            else {
                // JSON.stringify(undefined) prints "undefined"
                out_.result = make_null();
            }
        }
        return std::move(out_);
    }

    harness_output split_harness_output(std::string_view stdout_text) {
        harness_stream stream{};
        stream.append(stdout_text);
        return stream.finish();
    }

}  // namespace runbox
