#include "runbox/imports.hpp"

#include "runbox/format.hpp"
#include "runbox/utils.hpp"

#include "internal/js_scanner.hpp"

#include <optional>
#include <vector>

using namespace runbox::literals;
using namespace std::string_view_literals;

namespace runbox {

    namespace detail {

        using internal::js::scan_error;
        using internal::js::token;
        using internal::js::token_kind;

        struct import_segment {
            size_t start{};
            size_t end{};
        };

        static bool is_module_specifier(const std::vector<token>& tokens, size_t i) {
            return i < tokens.size() && tokens[i].kind == token_kind::string;
        }

        // Index of the closer matching the opener at `open`.
        static size_t find_closer(const std::vector<token>& tokens, size_t open, char closer) {
            for (size_t i = open + 1U; i < tokens.size(); ++i) {
                if (tokens[i].depth == tokens[open].depth && tokens[i].is_punct(closer)) {
                    return i;
                }
            }
            throw scan_error{"unbalanced brackets in import declaration", tokens[open].offset};
        }

        // Last token index of the declaration starting at `first` (the `import` keyword).
        static size_t declaration_end(const std::vector<token>& tokens, size_t first) {
            auto depth = tokens[first].depth;
            std::optional<size_t> specifier{};

            if (is_module_specifier(tokens, first + 1U)) {
                specifier = first + 1U;
            }
            else {
                for (size_t k = first + 1U; k < tokens.size(); ++k) {
                    const auto& t = tokens[k];
                    if (t.depth != depth) {
                        continue;
                    }
                    if (t.is_punct(';')) {
                        break;
                    }
                    if (t.is_word("from"sv) && is_module_specifier(tokens, k + 1U)) {
                        specifier = k + 1U;
                        break;
                    }
                    if (t.is_punct('=') && !(k + 1U < tokens.size() && tokens[k + 1U].is_punct('='))) {
                        // import name = require('module')
                        if (k + 4U < tokens.size() && tokens[k + 1U].is_word("require"sv) &&
                            tokens[k + 2U].is_punct('(') && is_module_specifier(tokens, k + 3U) &&
                            tokens[k + 4U].is_punct(')')) {
                            auto last = k + 4U;
                            if (last + 1U < tokens.size() && tokens[last + 1U].is_punct(';')) {
                                ++last;
                            }
                            return last;
                        }
                        break;
                    }
                }
            }

            if (!specifier) {
                throw scan_error{"malformed import declaration", tokens[first].offset};
            }

            auto last = *specifier;
            // import attributes: with { type: 'json' } / assert { ... }
            if (last + 2U < tokens.size() &&
                (tokens[last + 1U].is_word("with"sv) || tokens[last + 1U].is_word("assert"sv)) &&
                tokens[last + 2U].is_punct('{')) {
                last = find_closer(tokens, last + 2U, '}');
            }
            if (last + 1U < tokens.size() && tokens[last + 1U].is_punct(';')) {
                ++last;
            }
            return last;
        }

        static bool starts_declaration(const std::vector<token>& tokens, size_t i) {
            const auto& t = tokens[i];
            if (t.depth != 0U || !t.is_word("import"sv)) {
                return false;
            }
            if (i > 0U && tokens[i - 1U].is_punct('.')) {
                return false;
            }
            // import(...) and import.meta are expressions
            if (i + 1U < tokens.size() && (tokens[i + 1U].is_punct('(') || tokens[i + 1U].is_punct('.'))) {
                return false;
            }
            return true;
        }

        static std::vector<import_segment> find_import_segments(std::string_view code) {
            auto tokens = internal::js::tokenize(code);
            std::vector<import_segment> segments{};
            for (size_t i = 0U; i < tokens.size(); ++i) {
                if (!starts_declaration(tokens, i)) {
                    continue;
                }
                auto last = declaration_end(tokens, i);
                segments.push_back(import_segment{tokens[i].offset, tokens[last].end()});
                i = last;
            }
            return segments;
        }

        static bool raw_require_search(std::string_view code) {
            size_t cursor = 0U;
            while ((cursor = code.find("require"sv, cursor)) != std::string_view::npos) {
                auto pos = cursor + 7U;
                cursor = pos;
                while (pos < code.size() && utils::is_ascii_space(code[pos])) {
                    ++pos;
                }
                if (pos >= code.size() || code[pos] != '(') {
                    continue;
                }
                ++pos;
                while (pos < code.size() && utils::is_ascii_space(code[pos])) {
                    ++pos;
                }
                if (pos < code.size() && (code[pos] == '\'' || code[pos] == '"' || code[pos] == '`')) {
                    return true;
                }
            }
            return false;
        }

    }  // namespace detail

    import_extraction extract_imports(std::string_view code) {
        import_extraction out{};
        out.remaining_code = std::string{code};

        std::vector<detail::import_segment> segments{};
        try {
            segments = detail::find_import_segments(code);
        } catch (const internal::js::scan_error& e) {
            log_warn("failed to extract JavaScript imports at offset ", e.offset(), ": ", e.what());
            out.parse_failed = true;
            return out;
        }

        if (segments.empty()) {
            return out;
        }

        std::vector<std::string> texts{};
        std::string remaining{};
        remaining.reserve(code.size());
        size_t cursor = 0U;
        for (const auto& seg : segments) {
            remaining.append(code.substr(cursor, seg.start - cursor));
            auto removed = code.substr(seg.start, seg.end - seg.start);
            remaining.append(utils::count_newlines(removed), '\n');
            texts.emplace_back(utils::trim_ascii(removed));
            cursor = seg.end;
        }
        remaining.append(code.substr(cursor));

        out.imports = utils::join_with_separator(texts, "\n"sv);
        out.remaining_code = std::move(remaining);
        out.import_line_count = utils::count_newlines(out.imports) + 1U;
        return out;
    }

    bool has_require_calls(std::string_view code) {
        std::vector<internal::js::token> tokens{};
        try {
            tokens = internal::js::tokenize(code);
        } catch (const internal::js::scan_error&) {
            return detail::raw_require_search(code);
        }
        for (size_t i = 0U; i + 2U < tokens.size(); ++i) {
            if (!tokens[i].is_word("require"sv) || !tokens[i + 1U].is_punct('(')) {
                continue;
            }
            if (i > 0U && tokens[i - 1U].is_punct('.')) {
                continue;
            }
            auto kind = tokens[i + 2U].kind;
            if (kind == internal::js::token_kind::string || kind == internal::js::token_kind::template_chunk) {
                return true;
            }
        }
        return false;
    }

    dependency_report analyze_dependencies(std::string_view code) {
        dependency_report report{};
        report.extraction = extract_imports(code);
        report.uses_require = has_require_calls(code);
        return report;
    }

}  // namespace runbox
