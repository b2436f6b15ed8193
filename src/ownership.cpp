#include "ownership.hpp"
#include "shared/errors.hpp"
#include <cerrno>
#include <filesystem>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace pgentry {
namespace launch {

namespace {

void change_owner(const fs::path& p, uid_t uid, gid_t gid) {
    if (lchown(p.c_str(), uid, gid) != 0) {
        throw std::system_error(errno, std::generic_category(), "chown " + p.string());
    }
}

} // namespace

std::size_t chown_tree(const std::string& path, uid_t uid, gid_t gid) {
    std::error_code ec;
    auto status = fs::symlink_status(path, ec);
    if (ec || !fs::exists(status)) {
        throw LaunchError("cannot change ownership of " + path + ": no such file or directory");
    }

    change_owner(path, uid, gid);
    std::size_t changed = 1;

    if (!fs::is_directory(status)) {
        return changed;
    }

    // Default options: symlinked directories are not descended into
    for (fs::recursive_directory_iterator it(path), end; it != end; ++it) {
        change_owner(it->path(), uid, gid);
        ++changed;
    }
    return changed;
}

} // namespace launch
} // namespace pgentry
