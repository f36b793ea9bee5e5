//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef GPUSHARE_PLATFORM_POSIX_UTILS_HPP_INCLUDED
#define GPUSHARE_PLATFORM_POSIX_UTILS_HPP_INCLUDED

#include <cerrno>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

namespace gpushare
{
namespace platform
{

/// Wraps a POSIX syscall and retries it if it was interrupted by a signal.
///
/// @return Zero on success, otherwise the `errno` of the failed call.
///
template <typename Call>
int posixSyscallError(const Call& call)
{
    while (call() < 0)
    {
        const int error_num = errno;
        if (error_num != EINTR)
        {
            return error_num;
        }
    }
    return 0;
}

/// Removes a file, treating its absence as success.
///
/// @return Zero on success (or if there was nothing to remove), otherwise `errno` of the failed `unlink`.
///
inline int removeFileIfExists(const std::string& file_path)
{
    const int err = posixSyscallError([&file_path] {
        //
        return ::unlink(file_path.c_str());
    });
    return (err == ENOENT) ? 0 : err;
}

/// Checks whether something (file, device node, socket, etc.) exists at the given path.
///
inline bool pathExists(const std::string& path)
{
    struct stat path_stat
    {};
    return 0 == posixSyscallError([&path, &path_stat] {
               //
               return ::stat(path.c_str(), &path_stat);
           });
}

}  // namespace platform
}  // namespace gpushare

#endif  // GPUSHARE_PLATFORM_POSIX_UTILS_HPP_INCLUDED
