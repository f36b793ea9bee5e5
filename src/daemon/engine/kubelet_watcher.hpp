//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef GPUSHARE_DAEMON_ENGINE_KUBELET_WATCHER_HPP_INCLUDED
#define GPUSHARE_DAEMON_ENGINE_KUBELET_WATCHER_HPP_INCLUDED

#include "logging.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace gpushare
{
namespace daemon
{
namespace engine
{

/// Watches (via inotify) the kubelet socket directory for the socket being created.
///
/// The kubelet re-creates its socket on restart, and forgets all registered plugins then.
///
class KubeletWatcher final
{
public:
    using Ptr = std::unique_ptr<KubeletWatcher>;

    struct MakeResult
    {
        using Failure = std::string;
        using Success = Ptr;
        using Var     = cetl::variant<Success, Failure>;
    };
    CETL_NODISCARD static MakeResult::Var make(const std::string& kubelet_socket_path);

    KubeletWatcher(const int inotify_fd, std::string socket_name);

    KubeletWatcher(const KubeletWatcher&)                = delete;
    KubeletWatcher(KubeletWatcher&&) noexcept            = delete;
    KubeletWatcher& operator=(const KubeletWatcher&)     = delete;
    KubeletWatcher& operator=(KubeletWatcher&&) noexcept = delete;

    ~KubeletWatcher();

    /// Waits up to the timeout for inotify events, and consumes all of them.
    ///
    /// @return `true` if the kubelet socket has been created since the previous call.
    ///
    CETL_NODISCARD bool pollCreated(const std::chrono::milliseconds timeout);

private:
    bool drainEvents();

    int               inotify_fd_;
    const std::string socket_name_;
    common::LoggerPtr logger_{common::getLogger("engine")};

};  // KubeletWatcher

}  // namespace engine
}  // namespace daemon
}  // namespace gpushare

#endif  // GPUSHARE_DAEMON_ENGINE_KUBELET_WATCHER_HPP_INCLUDED
