#pragma once

/**
 * @file print.hpp
 * @brief std::print / std::println for standard libraries that lack <print>
 */

#if __has_include(<print>)
    #include <print>
#else
    #include <cstdio>
    #include <format>
    #include <string>
    #include <utility>

namespace std {

template <typename... Args>
void print(FILE* stream, std::format_string<Args...> fmt, Args&&... args)
{
    const std::string text = std::format(fmt, std::forward<Args>(args)...);
    std::fwrite(text.data(), 1, text.size(), stream);
}

template <typename... Args>
void print(std::format_string<Args...> fmt, Args&&... args)
{
    std::print(stdout, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void println(FILE* stream, std::format_string<Args...> fmt, Args&&... args)
{
    std::string text = std::format(fmt, std::forward<Args>(args)...);
    text.push_back('\n');
    std::fwrite(text.data(), 1, text.size(), stream);
}

template <typename... Args>
void println(std::format_string<Args...> fmt, Args&&... args)
{
    std::println(stdout, fmt, std::forward<Args>(args)...);
}

}  // namespace std
#endif
