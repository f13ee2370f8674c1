/**
 * @file text.cpp
 * @brief Whitespace helpers shared by the extractors
 */

#include "compactscan/common.hpp"

#include <algorithm>
#include <cctype>

namespace compactscan::common {

namespace {

[[nodiscard]] bool is_space(char c) noexcept
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

std::string trim(std::string_view input)
{
    std::size_t start = 0;
    while (start < input.size() && is_space(input[start])) {
        ++start;
    }
    std::size_t end = input.size();
    while (end > start && is_space(input[end - 1])) {
        --end;
    }
    return std::string(input.substr(start, end - start));
}

std::string collapse_whitespace(std::string_view input)
{
    std::string result;
    result.reserve(input.size());
    bool pending_space = false;
    for (char c : input) {
        if (is_space(c)) {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result.push_back(' ');
            pending_space = false;
        }
        result.push_back(c);
    }
    return result;
}

bool is_blank(std::string_view input) noexcept
{
    return std::ranges::all_of(input, [](char c) noexcept { return is_space(c); });
}

}  // namespace compactscan::common
