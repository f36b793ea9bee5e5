//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "kubelet_watcher.hpp"

#include "gpushare/platform/posix_utils.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <array>
#include <cerrno>
#include <chrono>
#include <climits>
#include <cstddef>
#include <cstring>
#include <memory>
#include <poll.h>
#include <string>
#include <sys/inotify.h>
#include <unistd.h>
#include <utility>

namespace gpushare
{
namespace daemon
{
namespace engine
{

KubeletWatcher::MakeResult::Var KubeletWatcher::make(const std::string& kubelet_socket_path)
{
    const auto slash_pos   = kubelet_socket_path.rfind('/');
    const auto socket_dir  = (slash_pos == std::string::npos) ? std::string{"."}
                                                              : kubelet_socket_path.substr(0, slash_pos + 1);
    auto       socket_name = (slash_pos == std::string::npos) ? kubelet_socket_path
                                                              : kubelet_socket_path.substr(slash_pos + 1);

    const int inotify_fd = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd == -1)
    {
        return std::string{"Failed to init inotify: "} + std::strerror(errno);
    }

    if (::inotify_add_watch(inotify_fd, socket_dir.c_str(), IN_CREATE) == -1)
    {
        const int err = errno;
        ::close(inotify_fd);
        return "Failed to watch directory '" + socket_dir + "': " + std::strerror(err);
    }

    return std::make_unique<KubeletWatcher>(inotify_fd, std::move(socket_name));
}

KubeletWatcher::KubeletWatcher(const int inotify_fd, std::string socket_name)
    : inotify_fd_{inotify_fd}
    , socket_name_{std::move(socket_name)}
{
}

KubeletWatcher::~KubeletWatcher()
{
    if (inotify_fd_ != -1)
    {
        ::close(inotify_fd_);
        inotify_fd_ = -1;
    }
}

bool KubeletWatcher::pollCreated(const std::chrono::milliseconds timeout)
{
    pollfd poll_fd{inotify_fd_, POLLIN, 0};

    int        ready = 0;
    const auto err   = platform::posixSyscallError([this, &poll_fd, &ready, timeout] {
        //
        ready = ::poll(&poll_fd, 1, static_cast<int>(timeout.count()));
        return ready;
    });
    if (err != 0)
    {
        logger_->warn("Failed to poll inotify events (err={}).", err);
        return false;
    }
    if ((ready == 0) || ((poll_fd.revents & POLLIN) == 0))
    {
        return false;
    }
    return drainEvents();
}

bool KubeletWatcher::drainEvents()
{
    constexpr std::size_t buf_size = 16 * (sizeof(inotify_event) + NAME_MAX + 1);

    alignas(inotify_event) std::array<char, buf_size> buffer{};

    bool is_created = false;
    while (true)
    {
        const auto length = ::read(inotify_fd_, buffer.data(), buffer.size());
        if (length <= 0)
        {
            if ((length < 0) && (errno != EAGAIN) && (errno != EINTR))
            {
                logger_->warn("Failed to read inotify events: {}.", std::strerror(errno));
            }
            break;
        }

        std::size_t offset = 0;
        while (offset < static_cast<std::size_t>(length))
        {
            const auto* const event = reinterpret_cast<const inotify_event*>(buffer.data() + offset);  // NOLINT
            if (((event->mask & IN_CREATE) != 0) && (event->len > 0) && (socket_name_ == event->name))
            {
                logger_->info("Kubelet socket '{}' has been created.", socket_name_);
                is_created = true;
            }
            offset += sizeof(inotify_event) + event->len;
        }
    }
    return is_created;
}

}  // namespace engine
}  // namespace daemon
}  // namespace gpushare
