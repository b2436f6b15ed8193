#pragma once
#include <string>
#include <vector>
#include <sys/types.h>

namespace pgentry {
namespace launch {

// The unprivileged identity the application runs as
struct Account {
    std::string user;
    uid_t uid = 0;
    gid_t gid = 0;
    std::string home = "/";
    bool in_passwd = true;    // false for a bare numeric uid
};

// User by name or numeric uid; group by name, numeric gid, or empty for
// the user's primary group. Throws LaunchError for unknown names.
Account resolve_account(const std::string& user, const std::string& group);

// Switch the calling process to the account. As root this sets the
// supplementary groups, gid and uid; otherwise the process must already
// run as the account. Also sets HOME.
void drop_privileges(const Account& account);

// Drop privileges and execvp() the command. Returns only by throwing.
void exec_command(const std::vector<std::string>& argv, const Account& account);

// Run the command as the account in a child process and wait for it.
// Returns its exit status, 127 when it could not be started and
// 128 + N when it was killed by signal N.
int run_command(const std::vector<std::string>& argv, const Account& account);

std::string join_command(const std::vector<std::string>& argv);

} // namespace launch
} // namespace pgentry
