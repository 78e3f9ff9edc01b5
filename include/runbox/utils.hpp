#pragma once

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <optional>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace runbox {

    constexpr std::string_view sloc_fname(const std::source_location& loc) {
        std::string_view sv{loc.file_name()};
        if (auto p = sv.rfind('/'); p != sv.npos)
            sv.remove_prefix(p + 1);
        return sv;
    }

    inline void prepend_location(std::ostream& os, const std::source_location& loc) {
        os << '[' << sloc_fname(loc) << ':' << loc.line() << "] ";
    }

// Debug logger; no-op on release builds
#ifndef NDEBUG
    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(
                Args&&... args, const std::source_location& loc = std::source_location::current()) {
            prepend_location(std::cerr, loc);
            (std::cerr << ... << std::forward<Args>(args)) << std::endl;
        }
    };
#else
    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(Args&&...) {}
    };
#endif

    // deduction guide
    template <typename... Args>
    debug_log(Args&&...) -> debug_log<Args...>;

    enum class log_level : uint8_t { error, warn, info };

    namespace detail {
        inline log_level& active_log_level() {
            static log_level level{log_level::warn};
            return level;
        }

        inline std::mutex& log_mutex() {
            static std::mutex m{};
            return m;
        }

        template <typename... Args>
        void emit_log(log_level level, std::string_view tag, const std::source_location& loc, Args&&... args) {
            if (level > active_log_level()) {
                return;
            }
            std::lock_guard lock{log_mutex()};
            prepend_location(std::cerr, loc);
            std::cerr << tag;
            (std::cerr << ... << std::forward<Args>(args)) << '\n';
        }
    }  // namespace detail

    inline void set_log_level(log_level level) {
        detail::active_log_level() = level;
    }

    inline log_level current_log_level() {
        return detail::active_log_level();
    }

    // Leveled loggers; always compiled, filtered by set_log_level()
    template <typename... Args>
    struct log_info {
        explicit log_info(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            detail::emit_log(log_level::info, "info: ", loc, std::forward<Args>(args)...);
        }
    };

    template <typename... Args>
    struct log_warn {
        explicit log_warn(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            detail::emit_log(log_level::warn, "warn: ", loc, std::forward<Args>(args)...);
        }
    };

    template <typename... Args>
    struct log_error {
        explicit log_error(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            detail::emit_log(log_level::error, "error: ", loc, std::forward<Args>(args)...);
        }
    };

    template <typename... Args>
    log_info(Args&&...) -> log_info<Args...>;
    template <typename... Args>
    log_warn(Args&&...) -> log_warn<Args...>;
    template <typename... Args>
    log_error(Args&&...) -> log_error<Args...>;

    namespace utils {
        constexpr char char_tolower(char c) {
            if (c >= 'A' && c <= 'Z') {
                return c + ('a' - 'A');
            }
            return c;
        }

        constexpr bool str_case_eq(std::string_view lhs, std::string_view rhs) {
            return std::ranges::equal(
                    lhs | std::views::transform(char_tolower), rhs | std::views::transform(char_tolower));
        }

        constexpr bool is_ascii_space(char c) noexcept {
            return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
        }

        constexpr bool is_ascii_digit(char c) noexcept {
            return c >= '0' && c <= '9';
        }

        constexpr bool is_identifier_start(char c) noexcept {
            auto lower = static_cast<char>(c | 0x20);
            return (lower >= 'a' && lower <= 'z') || c == '_' || c == '$';
        }

        constexpr bool is_identifier_char(char c) noexcept {
            return is_identifier_start(c) || is_ascii_digit(c);
        }

        constexpr std::string_view trim_ascii(std::string_view value) {
            while (!value.empty() && is_ascii_space(value.front())) {
                value.remove_prefix(1U);
            }
            while (!value.empty() && is_ascii_space(value.back())) {
                value.remove_suffix(1U);
            }
            return value;
        }

        inline std::string to_lower_ascii(std::string_view value) {
            std::string out{};
            out.reserve(value.size());
            for (auto c : value) {
                out.push_back(char_tolower(c));
            }
            return out;
        }

        namespace detail {
            template <typename T>
            concept arithmetic_type = std::integral<T> || std::floating_point<T>;
        }

        template <detail::arithmetic_type T>
        constexpr std::optional<T> parse_arithmetic(std::string_view input, [[maybe_unused]] int base = 10) {
            T value{};
            std::from_chars_result result;

            if constexpr (std::integral<T>) {
                result = std::from_chars(input.data(), input.data() + input.size(), value, base);
            }
            else {
                result = std::from_chars(input.data(), input.data() + input.size(), value);
            }

            if (result.ec != std::errc{} || result.ptr != input.data() + input.size()) {
                return std::nullopt;
            }

            return {value};
        }

        inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
            if (values.empty()) {
                return {};
            }
            return values | std::views::join_with(separator) | std::ranges::to<std::string>();
        }

        // Splits on '\n' keeping a trailing empty segment, so joining the
        // result with '\n' reproduces the input exactly.
        inline std::vector<std::string_view> split_lines(std::string_view text) {
            std::vector<std::string_view> lines{};
            size_t cursor = 0U;
            while (true) {
                auto line_end = text.find('\n', cursor);
                if (line_end == std::string_view::npos) {
                    lines.push_back(text.substr(cursor));
                    break;
                }
                lines.push_back(text.substr(cursor, line_end - cursor));
                cursor = line_end + 1U;
            }
            return lines;
        }

        inline size_t count_newlines(std::string_view text) {
            return static_cast<size_t>(std::ranges::count(text, '\n'));
        }

    }  // namespace utils

}  // namespace runbox
