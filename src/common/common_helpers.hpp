//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef GPUSHARE_COMMON_HELPERS_HPP_INCLUDED
#define GPUSHARE_COMMON_HELPERS_HPP_INCLUDED

#include <spdlog/spdlog.h>

#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace gpushare
{
namespace common
{

/// @brief Wraps the given action into a try/catch block, and performs it without throwing the given exception type.
///
/// @return `true` if the action was performed successfully, `false` if an exception was thrown.
///         Always `true` if exceptions are disabled.
///
template <typename Exception = std::exception, typename Action>
bool performWithoutThrowing(Action&& action) noexcept
{
#if defined(__cpp_exceptions)
    try
    {
#endif
        std::forward<Action>(action)();
        return true;

#if defined(__cpp_exceptions)
    } catch (const Exception& ex)
    {
        spdlog::critical("Unexpected C++ exception is caught: {}", ex.what());
        return false;
    }
#endif
}

/// Joins two path components with exactly one separator between them.
///
/// An empty `root` leaves `path` untouched; `"/"` as `root` yields an absolute `path`.
///
inline std::string joinPath(const std::string& root, const std::string& path)
{
    if (root.empty())
    {
        return path;
    }

    const auto root_end = root.find_last_not_of('/');
    const auto head     = (root_end == std::string::npos) ? std::string{} : root.substr(0, root_end + 1);

    const auto path_begin = path.find_first_not_of('/');
    if (path_begin == std::string::npos)
    {
        return head.empty() ? "/" : head;
    }
    return head + '/' + path.substr(path_begin);
}

/// Splits a string by the given delimiter; empty items are preserved.
///
inline std::vector<std::string> splitString(const std::string& str, const char delimiter)
{
    std::vector<std::string> items;
    std::string::size_type   begin = 0;
    while (true)
    {
        const auto end = str.find(delimiter, begin);
        items.push_back(str.substr(begin, end - begin));
        if (end == std::string::npos)
        {
            break;
        }
        begin = end + 1;
    }
    return items;
}

}  // namespace common
}  // namespace gpushare

#endif  // GPUSHARE_COMMON_HELPERS_HPP_INCLUDED
