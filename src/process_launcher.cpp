#include "process_launcher.hpp"
#include "shared/errors.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <grp.h>
#include <pwd.h>
#include <sys/wait.h>
#include <unistd.h>

namespace pgentry {
namespace launch {

namespace {

bool is_number(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

unsigned long parse_id(const std::string& s) {
    try {
        return std::stoul(s);
    } catch (const std::out_of_range&) {
        throw LaunchError("id out of range: " + s);
    }
}

std::system_error sys_error(const std::string& what) {
    return std::system_error(errno, std::generic_category(), what);
}

} // namespace

Account resolve_account(const std::string& user, const std::string& group) {
    if (user.empty()) {
        throw LaunchError("application user is not configured");
    }

    Account account;
    struct passwd* pw = is_number(user)
        ? getpwuid(static_cast<uid_t>(parse_id(user)))
        : getpwnam(user.c_str());

    if (pw) {
        account.user = pw->pw_name;
        account.uid = pw->pw_uid;
        account.gid = pw->pw_gid;
        account.home = pw->pw_dir ? pw->pw_dir : "/";
    } else if (is_number(user)) {
        account.user = user;
        account.uid = static_cast<uid_t>(parse_id(user));
        account.gid = static_cast<gid_t>(account.uid);
        account.in_passwd = false;
    } else {
        throw LaunchError("unknown user '" + user + "'");
    }

    if (is_number(group)) {
        account.gid = static_cast<gid_t>(parse_id(group));
    } else if (!group.empty()) {
        struct group* gr = getgrnam(group.c_str());
        if (!gr) {
            throw LaunchError("unknown group '" + group + "'");
        }
        account.gid = gr->gr_gid;
    }

    return account;
}

void drop_privileges(const Account& account) {
    if (geteuid() == 0) {
        if (account.in_passwd) {
            if (initgroups(account.user.c_str(), account.gid) != 0) {
                throw sys_error("initgroups(" + account.user + ")");
            }
        } else if (setgroups(1, &account.gid) != 0) {
            throw sys_error("setgroups");
        }
        if (setgid(account.gid) != 0) {
            throw sys_error("setgid(" + std::to_string(account.gid) + ")");
        }
        if (setuid(account.uid) != 0) {
            throw sys_error("setuid(" + std::to_string(account.uid) + ")");
        }
    } else if (geteuid() != account.uid || getegid() != account.gid) {
        throw LaunchError("not running as root, cannot switch to user '" + account.user + "'");
    }

    if (setenv("HOME", account.home.c_str(), 1) != 0) {
        throw sys_error("setenv(HOME)");
    }
}

void exec_command(const std::vector<std::string>& argv, const Account& account) {
    if (argv.empty()) {
        throw LaunchError("no command to execute");
    }

    drop_privileges(account);

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    execvp(args[0], args.data());
    throw sys_error("exec " + argv[0]);
}

int run_command(const std::vector<std::string>& argv, const Account& account) {
    if (argv.empty()) {
        throw LaunchError("no command to run");
    }

    // Keep buffered log lines from being written twice
    std::cout.flush();
    std::cerr.flush();
    std::fflush(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        throw sys_error("fork");
    }

    if (pid == 0) {
        try {
            exec_command(argv, account);
        } catch (const std::exception& e) {
            std::cerr << argv[0] << ": " << e.what() << std::endl;
        }
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            throw sys_error("waitpid");
        }
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 1;
}

std::string join_command(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) out += ' ';
        out += arg;
    }
    return out;
}

} // namespace launch
} // namespace pgentry
