#pragma once

#include "runbox/utils.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace runbox::internal::js {

    using namespace std::string_view_literals;

    enum class token_kind : uint8_t { identifier, number, string, template_chunk, regex, punctuator };

    struct token {
        token_kind kind{};
        size_t offset{};
        size_t length{};
        // bracket nesting outside the token; an opener and its closer share a depth
        size_t depth{};
        std::string_view text{};

        bool is_punct(char c) const noexcept { return kind == token_kind::punctuator && text.size() == 1U && text[0] == c; }
        bool is_word(std::string_view word) const noexcept { return kind == token_kind::identifier && text == word; }
        size_t end() const noexcept { return offset + length; }
    };

    class scan_error : public std::runtime_error {
      public:
        scan_error(const std::string& message, size_t offset)
            : std::runtime_error{message}, offset_{offset} {}

        size_t offset() const noexcept { return offset_; }

      private:
        size_t offset_;
    };

    // Process-wide keyword tables, built once on first use.
    class js_grammar {
      public:
        static const js_grammar& instance();

        // Keywords after which a '/' starts a regular expression literal.
        bool precedes_expression(std::string_view word) const { return expression_keywords_.contains(word); }

        bool is_reserved(std::string_view word) const { return reserved_words_.contains(word); }

        // Plain identifier that is not a reserved word.
        bool is_binding_identifier(std::string_view word) const;

      private:
        js_grammar();

        std::unordered_set<std::string_view> expression_keywords_{};
        std::unordered_set<std::string_view> reserved_words_{};
    };

    // Lexes JavaScript source into significant tokens; comments and whitespace
    // are dropped. Throws scan_error on unterminated literals/comments and on
    // unbalanced brackets.
    class scanner {
      public:
        explicit scanner(std::string_view source) : src_{source} {}

        std::vector<token> scan();

      private:
        void skip_trivia();
        void scan_string(char quote);
        void scan_template_chunk(size_t start);
        void scan_regex();
        void scan_number();
        void scan_identifier();
        void scan_punctuator();
        bool regex_allowed() const;
        void emit(token_kind kind, size_t start, size_t end);

        char peek(size_t ahead = 0U) const noexcept {
            return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
        }

        std::string_view src_;
        size_t pos_{};
        std::vector<char> brackets_{};
        std::vector<token> tokens_{};
    };

    inline std::vector<token> tokenize(std::string_view source) {
        return scanner{source}.scan();
    }

}  // namespace runbox::internal::js
