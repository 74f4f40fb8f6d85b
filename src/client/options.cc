#include "options.h"

#include <cstdlib>
#include <cstring>
#include <gflags/gflags.h>
#include <string>

DEFINE_string(server_url, "http://127.0.0.1:8000", "Seafile server address");
DEFINE_string(username, "test@seafiletest.com", "Seafile account (email)");
DEFINE_string(password, "testtest", "Seafile account password");
DEFINE_string(repo_id, "",
              "ID of the repository to mount (first repository if empty)");
DEFINE_string(mountpoint, "/mnt/seafile",
              "Mount point used when none is given after --");
DEFINE_string(cache_dir, "/tmp", "Directory for open file staging buffers");
DEFINE_int32(cache_ttl, 10, "Seconds a directory listing stays cached");
DEFINE_int32(max_idle_files, 64,
             "Clean buffers kept after their last release");
DEFINE_int32(timeout_ms, 10000, "Timeout of a single HTTP call");
DEFINE_bool(debug, false, "Run libfuse in debug mode (implies foreground)");

namespace {

// Environment variables only apply to flags not given on the command line.
std::string flag_or_env(const char *flag, const std::string &value,
                        const char *env) {
    if (!gflags::GetCommandLineFlagInfoOrDie(flag).is_default) {
        return value;
    }
    const char *from_env = std::getenv(env);
    if (from_env != nullptr && from_env[0] != '\0') {
        return from_env;
    }
    return value;
}

} // namespace

Options parse_options(int *argc, char ***argv) {
    gflags::SetUsageMessage(
        "Mount a Seafile repository.\n"
        "usage: seafs --server_url=URL --username=EMAIL --password=PASS "
        "[--repo_id=ID] -- MOUNTPOINT [fuse options]");
    gflags::ParseCommandLineFlags(argc, argv, /*remove_flags=*/true);

    Options options;
    options.server_url = flag_or_env("server_url", FLAGS_server_url,
                                     "SEAFILE_TEST_SERVER_ADDRESS");
    options.username =
        flag_or_env("username", FLAGS_username, "SEAFILE_TEST_USERNAME");
    options.password =
        flag_or_env("password", FLAGS_password, "SEAFILE_TEST_PASSWORD");
    options.mountpoint = flag_or_env("mountpoint", FLAGS_mountpoint,
                                     "SEAFILE_TEST_MOUNT_POINT");
    options.repo_id = FLAGS_repo_id;
    options.cache_dir = FLAGS_cache_dir;
    options.cache_ttl = FLAGS_cache_ttl > 0 ? FLAGS_cache_ttl : 0;
    options.max_idle_files =
        FLAGS_max_idle_files > 0 ? static_cast<size_t>(FLAGS_max_idle_files)
                                 : 0;
    options.timeout_ms = FLAGS_timeout_ms;
    options.debug_mode = FLAGS_debug;

    // What gflags left behind belongs to libfuse. The first positional that
    // is not the value of -o is the mount point.
    bool have_mountpoint = false;
    options.fuse_args.push_back((*argv)[0]);
    for (int i = 1; i < *argc; i++) {
        const char *arg = (*argv)[i];
        if (!strcmp(arg, "--")) {
            continue;
        }
        if (!strcmp(arg, "-o") && i + 1 < *argc) {
            options.fuse_args.push_back(arg);
            options.fuse_args.push_back((*argv)[++i]);
            continue;
        }
        if (arg[0] != '-' && !have_mountpoint) {
            options.mountpoint = arg;
            have_mountpoint = true;
        }
        options.fuse_args.push_back(arg);
    }
    if (!have_mountpoint) {
        options.fuse_args.push_back(options.mountpoint);
    }
    if (options.debug_mode) {
        options.fuse_args.push_back("-d");
    }

    return options;
}
