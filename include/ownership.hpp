#pragma once
#include <cstddef>
#include <string>
#include <sys/types.h>

namespace pgentry {
namespace launch {

// chown -R without following symbolic links. Returns the number of
// entries changed. Throws LaunchError if the path does not exist and
// std::system_error when a chown fails.
std::size_t chown_tree(const std::string& path, uid_t uid, gid_t gid);

} // namespace launch
} // namespace pgentry
