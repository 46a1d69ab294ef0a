#pragma once

#include <string>
#include <core/types.hpp>
#include <ssh/transport.hpp>

// Mirrors a local relative path's directory chain under a remote root.
//
// Each prefix of the parent directory is checked with exists() and created
// only if missing, shortest first, so repeating the call with the same path
// makes no further remote changes. A failure part-way keeps the directories
// already created; retrying completes the chain.
class RemoteFilesystemSync {
public:
    // "demo/sub/hello.py" under "/home/robot" ensures /home/robot/demo and
    // /home/robot/demo/sub. A bare file name is a no-op.
    static Result<void> ensure_remote_dir(TransportHandle& handle,
                                          const std::string& local_relative_path,
                                          const std::string& remote_root);
};
