#include "js_scanner.hpp"

#include "runbox/format.hpp"

using namespace runbox::literals;

namespace runbox::internal::js {

    namespace detail {
        static constexpr bool is_ident_start(char c) {
            return utils::is_identifier_start(c) || static_cast<unsigned char>(c) >= 0x80U || c == '\\';
        }

        static constexpr bool is_ident_part(char c) {
            return is_ident_start(c) || utils::is_ascii_digit(c);
        }

        static constexpr char matching_opener(char closer) {
            switch (closer) {
                case ')':
                    return '(';
                case ']':
                    return '[';
                default:
                    return '{';
            }
        }
    }  // namespace detail

    const js_grammar& js_grammar::instance() {
        static const js_grammar grammar{};
        return grammar;
    }

    js_grammar::js_grammar() {
        for (auto word :
             {"return"sv,
              "typeof"sv,
              "instanceof"sv,
              "in"sv,
              "of"sv,
              "new"sv,
              "delete"sv,
              "void"sv,
              "throw"sv,
              "case"sv,
              "do"sv,
              "else"sv,
              "yield"sv,
              "await"sv}) {
            expression_keywords_.insert(word);
        }
        for (auto word :
             {"break"sv,    "case"sv,   "catch"sv,   "class"sv,      "const"sv,  "continue"sv, "debugger"sv,
              "default"sv,  "delete"sv, "do"sv,      "else"sv,       "enum"sv,   "export"sv,   "extends"sv,
              "false"sv,    "finally"sv, "for"sv,    "function"sv,   "if"sv,     "import"sv,   "in"sv,
              "instanceof"sv, "new"sv,  "null"sv,    "return"sv,     "super"sv,  "switch"sv,   "this"sv,
              "throw"sv,    "true"sv,   "try"sv,     "typeof"sv,     "var"sv,    "void"sv,     "while"sv,
              "with"sv,     "yield"sv,  "let"sv,     "static"sv,     "implements"sv, "interface"sv,
              "package"sv,  "private"sv, "protected"sv, "public"sv,  "await"sv,  "arguments"sv, "eval"sv}) {
            reserved_words_.insert(word);
        }
    }

    bool js_grammar::is_binding_identifier(std::string_view word) const {
        if (word.empty() || !utils::is_identifier_start(word.front())) {
            return false;
        }
        if (!std::ranges::all_of(word, [](char c) { return utils::is_identifier_char(c); })) {
            return false;
        }
        return !is_reserved(word);
    }

    std::vector<token> scanner::scan() {
        tokens_.clear();
        brackets_.clear();
        pos_ = 0U;

        while (true) {
            skip_trivia();
            if (pos_ >= src_.size()) {
                break;
            }
            auto c = peek();
            if (c == '"' || c == '\'') {
                scan_string(c);
            }
            else if (c == '`') {
                scan_template_chunk(pos_);
            }
            else if (c == '}' && !brackets_.empty() && brackets_.back() == '$') {
                // end of a ${...} substitution; resume the template
                brackets_.pop_back();
                scan_template_chunk(pos_);
            }
            else if (detail::is_ident_start(c)) {
                scan_identifier();
            }
            else if (utils::is_ascii_digit(c) || (c == '.' && utils::is_ascii_digit(peek(1U)))) {
                scan_number();
            }
            else if (c == '/' && regex_allowed()) {
                scan_regex();
            }
            else {
                scan_punctuator();
            }
        }

        if (!brackets_.empty()) {
            throw scan_error{"unexpected end of input: unclosed '{}'"_format(brackets_.back()), src_.size()};
        }
        return std::move(tokens_);
    }

    void scanner::skip_trivia() {
        while (pos_ < src_.size()) {
            auto c = peek();
            if (utils::is_ascii_space(c)) {
                ++pos_;
                continue;
            }
            if (c == '/' && peek(1U) == '/') {
                auto eol = src_.find('\n', pos_);
                pos_ = eol == std::string_view::npos ? src_.size() : eol;
                continue;
            }
            if (c == '/' && peek(1U) == '*') {
                auto close = src_.find("*/"sv, pos_ + 2U);
                if (close == std::string_view::npos) {
                    throw scan_error{"unterminated block comment", pos_};
                }
                pos_ = close + 2U;
                continue;
            }
            // hashbang on the first line
            if (pos_ == 0U && c == '#' && peek(1U) == '!') {
                auto eol = src_.find('\n');
                pos_ = eol == std::string_view::npos ? src_.size() : eol;
                continue;
            }
            break;
        }
    }

    void scanner::scan_string(char quote) {
        auto start = pos_++;
        while (pos_ < src_.size()) {
            auto c = src_[pos_];
            if (c == '\\') {
                pos_ += 2U;
                continue;
            }
            if (c == '\n') {
                break;
            }
            ++pos_;
            if (c == quote) {
                emit(token_kind::string, start, pos_);
                return;
            }
        }
        throw scan_error{"unterminated string literal", start};
    }

    void scanner::scan_template_chunk(size_t start) {
        ++pos_;  // opening '`' or the '}' closing a substitution
        while (pos_ < src_.size()) {
            auto c = src_[pos_];
            if (c == '\\') {
                pos_ += 2U;
                continue;
            }
            if (c == '`') {
                ++pos_;
                emit(token_kind::template_chunk, start, pos_);
                return;
            }
            if (c == '$' && peek(1U) == '{') {
                pos_ += 2U;
                emit(token_kind::template_chunk, start, pos_);
                brackets_.push_back('$');
                return;
            }
            ++pos_;
        }
        throw scan_error{"unterminated template literal", start};
    }

    void scanner::scan_regex() {
        auto start = pos_++;
        bool in_class = false;
        while (pos_ < src_.size()) {
            auto c = src_[pos_];
            if (c == '\n') {
                break;
            }
            if (c == '\\') {
                pos_ += 2U;
                continue;
            }
            ++pos_;
            if (c == '[') {
                in_class = true;
            }
            else if (c == ']') {
                in_class = false;
            }
            else if (c == '/' && !in_class) {
                while (pos_ < src_.size() && detail::is_ident_part(src_[pos_])) {
                    ++pos_;
                }
                emit(token_kind::regex, start, pos_);
                return;
            }
        }
        throw scan_error{"unterminated regular expression literal", start};
    }

    void scanner::scan_number() {
        auto start = pos_;
        while (pos_ < src_.size()) {
            auto c = src_[pos_];
            if (detail::is_ident_part(c) || c == '.') {
                ++pos_;
                continue;
            }
            auto prev = utils::char_tolower(src_[pos_ - 1U]);
            if ((c == '+' || c == '-') && prev == 'e' && !(src_.substr(start, 2U) == "0x"sv || src_.substr(start, 2U) == "0X"sv)) {
                ++pos_;
                continue;
            }
            break;
        }
        emit(token_kind::number, start, pos_);
    }

    void scanner::scan_identifier() {
        auto start = pos_;
        while (pos_ < src_.size() && detail::is_ident_part(src_[pos_])) {
            pos_ += src_[pos_] == '\\' ? 2U : 1U;
        }
        pos_ = std::min(pos_, src_.size());
        emit(token_kind::identifier, start, pos_);
    }

    void scanner::scan_punctuator() {
        auto c = peek();
        auto start = pos_++;
        switch (c) {
            case '(':
            case '[':
            case '{':
                emit(token_kind::punctuator, start, pos_);
                brackets_.push_back(c);
                return;
            case ')':
            case ']':
            case '}': {
                if (brackets_.empty() || brackets_.back() != detail::matching_opener(c)) {
                    throw scan_error{"unexpected '{}'"_format(c), start};
                }
                brackets_.pop_back();
                emit(token_kind::punctuator, start, pos_);
                return;
            }
            default:
                emit(token_kind::punctuator, start, pos_);
                return;
        }
    }

    bool scanner::regex_allowed() const {
        if (tokens_.empty()) {
            return true;
        }
        const auto& last = tokens_.back();
        switch (last.kind) {
            case token_kind::identifier:
                return js_grammar::instance().precedes_expression(last.text);
            case token_kind::number:
            case token_kind::string:
            case token_kind::regex:
                return false;
            case token_kind::template_chunk:
                // a chunk ending in "${" opens an expression
                return last.text.ends_with("${"sv);
            case token_kind::punctuator:
                return !(last.is_punct(')') || last.is_punct(']') || last.is_punct('}'));
        }
        return true;
    }

    void scanner::emit(token_kind kind, size_t start, size_t end) {
        tokens_.push_back(token{kind, start, end - start, brackets_.size(), src_.substr(start, end - start)});
    }

}  // namespace runbox::internal::js
