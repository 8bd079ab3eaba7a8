#pragma once

#include <algorithm>
#include <charconv>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <vector>

namespace annomics {

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

        constexpr std::string_view trim_view(std::string_view value) {
            auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos) {
                return {};
            }
            auto last = value.find_last_not_of(" \t\r\n");
            return value.substr(first, (last - first) + 1U);
        }

        template <std::integral T>
        constexpr std::optional<T> parse_integer(std::string_view input, int base = 10) {
            T value{};
            auto result = std::from_chars(input.data(), input.data() + input.size(), value, base);
            if (result.ec != std::errc{} || result.ptr != input.data() + input.size()) {
                return std::nullopt;
            }
            return {value};
        }

        // Splits on `separator`, trims each piece and drops the empty ones.
        inline std::vector<std::string> split_trimmed(std::string_view text, char separator) {
            std::vector<std::string> out{};
            for (auto piece : text | std::views::split(separator)) {
                auto trimmed = trim_view(std::string_view{piece.begin(), piece.end()});
                if (!trimmed.empty()) {
                    out.emplace_back(trimmed);
                }
            }
            return out;
        }

        inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
            if (values.empty()) {
                return {};
            }
            return values | std::views::join_with(separator) | std::ranges::to<std::string>();
        }

    }  // namespace utils

}  // namespace annomics
