#include "runbox/provenance.hpp"

#include "runbox/format.hpp"

using namespace runbox::literals;

namespace runbox {

    namespace detail {

        struct line_ref {
            size_t line{};
            std::optional<size_t> column{};
        };

        static std::optional<size_t> parse_digits(std::string_view text, size_t& pos) {
            auto begin = pos;
            while (pos < text.size() && utils::is_ascii_digit(text[pos])) {
                ++pos;
            }
            if (pos == begin) {
                return std::nullopt;
            }
            return utils::parse_arithmetic<size_t>(text.substr(begin, pos - begin));
        }

        // Every `<script>:<line>[:<col>]` reference in `text`, in order.
        static std::vector<line_ref> script_references(std::string_view text, std::string_view script) {
            std::vector<line_ref> refs{};
            size_t cursor = 0U;
            while ((cursor = text.find(script, cursor)) != std::string_view::npos) {
                auto pos = cursor + script.size();
                cursor = pos;
                if (pos >= text.size() || text[pos] != ':') {
                    continue;
                }
                ++pos;
                auto line = parse_digits(text, pos);
                if (!line) {
                    continue;
                }
                line_ref ref{*line, std::nullopt};
                if (pos < text.size() && text[pos] == ':') {
                    ++pos;
                    ref.column = parse_digits(text, pos);
                }
                refs.push_back(ref);
            }
            return refs;
        }

        // `File "<...>/main.py", line N` and `Cell In[k], line N` references, in order.
        static std::vector<line_ref> python_references(std::string_view text, std::string_view script) {
            std::vector<line_ref> refs{};
            for (auto line : utils::split_lines(text)) {
                auto trimmed = utils::trim_ascii(line);
                size_t marker = std::string_view::npos;
                if (trimmed.starts_with("File \""sv)) {
                    auto quote = trimmed.find('"', 6U);
                    if (quote == std::string_view::npos || !trimmed.substr(6U, quote - 6U).ends_with(script)) {
                        continue;
                    }
                    marker = trimmed.find(", line "sv, quote);
                }
                else if (trimmed.starts_with("Cell In["sv)) {
                    marker = trimmed.find(", line "sv);
                }
                if (marker == std::string_view::npos) {
                    continue;
                }
                auto pos = marker + 7U;
                if (auto n = parse_digits(trimmed, pos)) {
                    refs.push_back(line_ref{*n, std::nullopt});
                }
            }
            return refs;
        }

        // `> 12 |` code-frame pointer lines.
        static std::optional<line_ref> arrow_reference(std::string_view text) {
            for (auto line : utils::split_lines(text)) {
                if (!line.starts_with('>')) {
                    continue;
                }
                auto rest = utils::trim_ascii(line.substr(1U));
                size_t pos = 0U;
                auto n = parse_digits(rest, pos);
                if (!n) {
                    continue;
                }
                auto tail = utils::trim_ascii(rest.substr(pos));
                if (tail.starts_with('|')) {
                    return line_ref{*n, std::nullopt};
                }
            }
            return std::nullopt;
        }

        static bool is_error_name(std::string_view name) {
            if (name.empty() || !utils::is_identifier_start(name.front())) {
                return false;
            }
            for (auto c : name) {
                if (!utils::is_identifier_char(c) && c != '.') {
                    return false;
                }
            }
            return true;
        }

        // "Name: message" -> {Name, message}
        static std::optional<std::pair<std::string, std::string>> split_error_line(std::string_view line) {
            line = utils::trim_ascii(line);
            auto colon = line.find(':');
            if (colon == std::string_view::npos) {
                if (is_error_name(line) && (line.ends_with("Error"sv) || line.ends_with("Exception"sv) ||
                                            line == "KeyboardInterrupt"sv)) {
                    return std::pair{std::string{line}, std::string{}};
                }
                return std::nullopt;
            }
            auto name = line.substr(0U, colon);
            if (!is_error_name(name)) {
                return std::nullopt;
            }
            return std::pair{std::string{name}, std::string{utils::trim_ascii(line.substr(colon + 1U))}};
        }

        static std::string erase_all(std::string text, std::string_view open, std::string_view needle_end) {
            // removes `\s*<open>...<needle_end>` groups, e.g. " (detected at line 4)"
            size_t cursor = 0U;
            while ((cursor = text.find(open, cursor)) != std::string::npos) {
                auto close = text.find(needle_end, cursor + open.size());
                if (close == std::string::npos) {
                    break;
                }
                auto begin = cursor;
                while (begin > 0U && utils::is_ascii_space(text[begin - 1U])) {
                    --begin;
                }
                text.erase(begin, close + needle_end.size() - begin);
                cursor = begin;
            }
            return text;
        }

        static std::string strip_python_location_suffixes(std::string message) {
            message = erase_all(std::move(message), "(detected at line "sv, ")"sv);
            // "(main.py, line 4)"
            size_t cursor = 0U;
            while ((cursor = message.find(".py, line "sv, cursor)) != std::string::npos) {
                auto open = message.rfind('(', cursor);
                auto close = message.find(')', cursor);
                if (open == std::string::npos || close == std::string::npos) {
                    break;
                }
                auto begin = open;
                while (begin > 0U && utils::is_ascii_space(message[begin - 1U])) {
                    --begin;
                }
                message.erase(begin, close + 1U - begin);
                cursor = begin;
            }
            return std::string{utils::trim_ascii(message)};
        }

        // "... on line 9" inside a message refers to the generated program.
        static std::string rewrite_line_mentions(std::string message, const packaged_code& code) {
            static constexpr auto marker = "on line "sv;
            size_t cursor = 0U;
            while ((cursor = message.find(marker, cursor)) != std::string::npos) {
                auto pos = cursor + marker.size();
                auto begin = pos;
                auto n = parse_digits(message, pos);
                cursor = pos;
                if (!n || *n < code.body_start_line() || *n > code.body_end_line()) {
                    continue;
                }
                auto adjusted = std::to_string(*n - code.prologue_line_count);
                message.replace(begin, pos - begin, adjusted);
                cursor = begin + adjusted.size();
            }
            return message;
        }

        // Strips a trailing " (12:34)" position.
        static std::string strip_position_suffix(std::string_view message) {
            message = utils::trim_ascii(message);
            if (!message.ends_with(')')) {
                return std::string{message};
            }
            auto open = message.rfind('(');
            if (open == std::string_view::npos) {
                return std::string{message};
            }
            auto inner = message.substr(open + 1U, message.size() - open - 2U);
            auto colon = inner.find(':');
            if (colon == std::string_view::npos || !utils::parse_arithmetic<size_t>(inner.substr(0U, colon)) ||
                !utils::parse_arithmetic<size_t>(inner.substr(colon + 1U))) {
                return std::string{message};
            }
            return std::string{utils::trim_ascii(message.substr(0U, open))};
        }

        static std::optional<error_location> resolve_location(
                const packaged_code& code, const std::vector<line_ref>& refs, bool syntax) {
            for (const auto& ref : refs) {
                if (syntax && ref.line > code.body_end_line()) {
                    return clamp_to_last_line(code, ref.line);
                }
                if (auto loc = locate(code, ref.line, ref.column)) {
                    return loc;
                }
            }
            return std::nullopt;
        }

        static std::string with_hint(std::string_view name, std::string message) {
            if (!is_syntax_error_name(name)) {
                return message;
            }
            if (auto hint = syntax_hint(message); hint && message.find(*hint) == std::string::npos) {
                message += ' ';
                message += *hint;
            }
            return message;
        }

    }  // namespace detail

    std::string error_label(std::string_view name) {
        if (name == "SyntaxError"sv) {
            return "Syntax Error";
        }
        if (name == "TypeError"sv) {
            return "Type Error";
        }
        if (name == "ReferenceError"sv) {
            return "Reference Error";
        }
        return std::string{name};
    }

    std::optional<std::string_view> syntax_hint(std::string_view message) {
        if (message.find("Unexpected end of input"sv) != std::string_view::npos ||
            message.find("was never closed"sv) != std::string_view::npos ||
            message.find("unexpected EOF"sv) != std::string_view::npos) {
            return "(Check for missing closing brackets or braces)"sv;
        }
        if (message.find("Invalid or unexpected token"sv) != std::string_view::npos ||
            message.find("Unexpected token"sv) != std::string_view::npos ||
            message.find("unterminated string literal"sv) != std::string_view::npos) {
            return "(Check for missing quotes, brackets, or semicolons)"sv;
        }
        return std::nullopt;
    }

    bool is_syntax_error_name(std::string_view name) {
        return name == "SyntaxError"sv || name == "IndentationError"sv || name == "TabError"sv;
    }

    std::string compose_message(
            std::string_view name, std::string_view message, const std::optional<error_location>& location) {
        std::string out{message};
        if (location) {
            if (!location->source_line_text.empty()) {
                out = "Line {}: `{}` - {}"_format(location->adjusted_line, location->source_line_text, message);
            }
            else {
                out = "Line {} - {}"_format(location->adjusted_line, message);
            }
        }

        if (!name.empty() && name != "Error"sv) {
            auto label = error_label(name);
            if (utils::to_lower_ascii(out).find(utils::to_lower_ascii(label)) == std::string::npos) {
                out = "{}: {}"_format(label, out);
            }
        }
        return out;
    }

    std::string clean_stack(std::string_view stack, std::string_view script_name) {
        std::vector<std::string> kept{};
        for (auto line : utils::split_lines(stack)) {
            bool from_script = line.find(script_name) != std::string_view::npos;
            if (!from_script &&
                (line.find("vm.js"sv) != std::string_view::npos || line.find("internal/"sv) != std::string_view::npos)) {
                continue;
            }
            auto trimmed = utils::trim_ascii(line);
            if (trimmed.starts_with("at "sv)) {
                kept.push_back("    {}"_format(trimmed));
            }
            else {
                kept.emplace_back(line);
            }
        }
        while (!kept.empty() && utils::trim_ascii(kept.back()).empty()) {
            kept.pop_back();
        }
        return utils::join_with_separator(kept, "\n"sv);
    }

    std::string strip_script_paths(std::string_view text, std::string_view script_name) {
        std::string out{};
        out.reserve(text.size());
        size_t cursor = 0U;
        size_t found = 0U;
        while ((found = text.find(script_name, cursor)) != std::string_view::npos) {
            auto begin = found;
            while (begin > cursor) {
                auto c = text[begin - 1U];
                if (utils::is_ascii_space(c) || c == '(' || c == '"' || c == '\'') {
                    break;
                }
                --begin;
            }
            out.append(text.substr(cursor, begin - cursor));
            out.append(script_name);
            cursor = found + script_name.size();
        }
        out.append(text.substr(cursor));
        return out;
    }

    std::optional<error_location> locate(
            const packaged_code& code, size_t raw_line, std::optional<size_t> raw_column) {
        if (raw_line < code.body_start_line() || raw_line > code.body_end_line()) {
            return std::nullopt;
        }
        error_location loc{};
        loc.raw_line = raw_line;
        loc.raw_column = raw_column;
        loc.adjusted_line = raw_line - code.prologue_line_count;
        if (raw_column) {
            auto indent = code.body_indent.size();
            loc.adjusted_column = *raw_column > indent ? *raw_column - indent : 1U;
        }
        auto lines = utils::split_lines(code.user_code);
        if (loc.adjusted_line <= lines.size()) {
            loc.source_line_text = std::string{utils::trim_ascii(lines[loc.adjusted_line - 1U])};
        }
        return loc;
    }

    error_location clamp_to_last_line(const packaged_code& code, size_t raw_line) {
        auto lines = utils::split_lines(code.user_code);
        size_t last = lines.size();
        while (last > 1U && utils::trim_ascii(lines[last - 1U]).empty()) {
            --last;
        }
        error_location loc{};
        loc.raw_line = raw_line;
        loc.adjusted_line = last;
        loc.adjusted_column = lines[last - 1U].size();
        loc.source_line_text = std::string{utils::trim_ascii(lines[last - 1U])};
        return loc;
    }

    mapped_error map_isolate_error(const raw_outcome& raw, const packaged_code& code) {
        mapped_error m{};
        m.name = raw.error_name.empty() ? std::string{"Error"} : raw.error_name;
        // SyntaxErrors thrown while running (JSON.parse, new Function) are runtime failures
        bool syntax = raw.is_compile_error;
        m.kind = syntax ? error_kind::compile : error_kind::runtime;
        m.message = detail::with_hint(m.name, raw.error_message.empty() ? std::string{"Unknown error"} : raw.error_message);

        std::vector<detail::line_ref> refs{};
        if (raw.raw_line) {
            refs.push_back(detail::line_ref{*raw.raw_line, raw.raw_column});
        }
        for (auto ref : detail::script_references(raw.stack, code.script_name)) {
            refs.push_back(ref);
        }
        m.location = detail::resolve_location(code, refs, syntax);
        m.stack = clean_stack(raw.stack, code.script_name);
        m.display = compose_message(m.name, m.message, m.location);
        return m;
    }

    mapped_error map_sandbox_error(const raw_outcome& raw, const packaged_code& code) {
        mapped_error m{};
        auto text = raw.error_text.empty() ? raw.error_message : raw.error_text;
        std::vector<detail::line_ref> refs{};

        if (code.lang == language::python) {
            // the last "Name: message" line of the traceback
            auto lines = utils::split_lines(text);
            for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
                if (utils::trim_ascii(*it).empty()) {
                    continue;
                }
                if (auto parsed = detail::split_error_line(*it)) {
                    m.name = parsed->first;
                    m.message = parsed->second;
                }
                else {
                    m.message = std::string{utils::trim_ascii(*it)};
                }
                break;
            }
            m.message = detail::rewrite_line_mentions(detail::strip_python_location_suffixes(m.message), code);

            // innermost user frame wins
            auto all = detail::python_references(text, code.script_name);
            for (auto it = all.rbegin(); it != all.rend(); ++it) {
                refs.push_back(*it);
            }
        }
        else {
            auto lines = utils::split_lines(text);
            auto first_line = lines.empty() ? std::string_view{} : utils::trim_ascii(lines.front());

            // "SyntaxError: /path/file.js: Unexpected token. (5:10)"
            bool matched_header = false;
            if (auto parsed = detail::split_error_line(first_line); parsed && parsed->first.ends_with("Error")) {
                auto rest = std::string_view{parsed->second};
                auto path_colon = rest.find(": "sv);
                if (rest.ends_with(')') && path_colon != std::string_view::npos) {
                    auto open = rest.rfind('(');
                    if (open == std::string_view::npos || open < path_colon + 2U) {
                        open = std::string_view::npos;
                    }
                    auto inner = open == std::string_view::npos ? std::string_view{}
                                                                : rest.substr(open + 1U, rest.size() - open - 2U);
                    auto colon = inner.find(':');
                    auto l = colon == std::string_view::npos ? std::nullopt
                                                             : utils::parse_arithmetic<size_t>(inner.substr(0U, colon));
                    auto c = colon == std::string_view::npos ? std::nullopt
                                                             : utils::parse_arithmetic<size_t>(inner.substr(colon + 1U));
                    if (l && c) {
                        m.name = parsed->first;
                        auto msg = utils::trim_ascii(rest.substr(path_colon + 2U, open - path_colon - 2U));
                        if (msg.ends_with('.')) {
                            msg.remove_suffix(1U);
                        }
                        m.message = std::string{msg};
                        refs.push_back(detail::line_ref{*l, c});
                        matched_header = true;
                    }
                }
            }

            if (!matched_header) {
                for (auto line : lines) {
                    if (auto parsed = detail::split_error_line(line);
                        parsed && (parsed->first.ends_with("Error") || parsed->first.ends_with("Exception"))) {
                        m.name = parsed->first;
                        m.message = detail::strip_position_suffix(parsed->second);
                        break;
                    }
                }
                if (m.message.empty()) {
                    // thrown non-Error values: the harness printed String(error)
                    auto out_lines = utils::split_lines(utils::trim_ascii(raw.stdout_text));
                    auto fallback = out_lines.empty() ? std::string_view{} : utils::trim_ascii(out_lines.back());
                    m.message = std::string{fallback.empty() ? first_line : fallback};
                }
                refs = detail::script_references(text, code.script_name);
                if (auto arrow = detail::arrow_reference(text)) {
                    refs.push_back(*arrow);
                }
            }
        }

        if (m.message.empty()) {
            m.message = text.empty() ? std::string{"Unknown error"} : std::string{utils::trim_ascii(text)};
        }
        bool syntax = is_syntax_error_name(m.name);
        m.kind = syntax ? error_kind::compile : error_kind::runtime;
        m.message = detail::with_hint(m.name, m.message);
        m.location = detail::resolve_location(code, refs, syntax);
        m.stack = strip_script_paths(text, code.script_name);
        m.display = compose_message(m.name, m.message, m.location);
        m.replacement_stdout = m.name.empty() || m.name == "Error"sv ? m.message : "{}: {}"_format(m.name, m.message);
        return m;
    }

    mapped_error map_error(const raw_outcome& raw, const packaged_code& code, std::chrono::milliseconds timeout) {
        mapped_error m{};
        if (raw.timed_out) {
            m.kind = error_kind::timeout;
            m.name = std::string{to_string(error_kind::timeout)};
            m.message = "Execution timed out after {}ms"_format(timeout.count());
            m.display = m.message;
            return m;
        }
        if (raw.cancelled) {
            m.kind = error_kind::runtime;
            m.message = "Execution was cancelled";
            m.display = m.message;
            return m;
        }
        if (raw.unavailable) {
            m.kind = error_kind::backend_unavailable;
            m.name = std::string{to_string(error_kind::backend_unavailable)};
            m.message = raw.error_message.empty() ? raw.error_text : raw.error_message;
            if (m.message.empty()) {
                m.message = "Execution backend is unavailable";
            }
            m.display = m.message;
            return m;
        }
        if (code.backend == backend_kind::isolate) {
            return map_isolate_error(raw, code);
        }
        return map_sandbox_error(raw, code);
    }

}  // namespace runbox
