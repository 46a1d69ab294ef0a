#include "remote_sync.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

Result<void> RemoteFilesystemSync::ensure_remote_dir(TransportHandle& handle,
                                                     const std::string& local_relative_path,
                                                     const std::string& remote_root) {
    auto segments = parent_segments(local_relative_path);
    if (segments.empty()) {
        return Result<void>::Ok();
    }

    for (const auto& seg : segments) {
        if (seg == "..") {
            return Result<void>::Err(ErrorKind::RemoteFilesystem,
                "Path escapes the remote root: " + local_relative_path);
        }
    }

    FileChannel* channel = handle.file_channel();
    if (!channel) {
        return Result<void>::Err(ErrorKind::RemoteFilesystem,
            "No file transfer channel open on " + handle.address());
    }

    std::string prefix;
    for (const auto& seg : segments) {
        prefix = join_remote_path(prefix, seg);
        std::string remote_dir = join_remote_path(remote_root, prefix);

        auto present = channel->exists(remote_dir);
        if (present.is_err()) {
            return Result<void>::Err(ErrorKind::RemoteFilesystem, present.error);
        }
        if (present.value) continue;

        auto made = channel->mkdir(remote_dir);
        if (made.is_err()) {
            return Result<void>::Err(ErrorKind::RemoteFilesystem, made.error);
        }
        brickdev_log(fmt::format("sync: created {} on {}", remote_dir, handle.address()));
    }

    return Result<void>::Ok();
}
