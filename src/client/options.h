#ifndef OPTIONS_H
#define OPTIONS_H

#include <cstddef>
#include <ctime>
#include <string>
#include <vector>

// Immutable mount configuration, built once in main().
struct Options {
    std::string server_url;
    std::string username;
    std::string password;
    std::string repo_id; // empty selects the first repository
    std::string mountpoint;
    std::string cache_dir; // staging area for open file buffers
    time_t cache_ttl;
    size_t max_idle_files;
    int timeout_ms;
    bool debug_mode;

    // argv handed to fuse_main, argv[0] and the mount point included.
    std::vector<std::string> fuse_args;

    Options()
        : server_url("http://127.0.0.1:8000"),
          username("test@seafiletest.com"), password("testtest"),
          repo_id(), mountpoint("/mnt/seafile"), cache_dir("/tmp"),
          cache_ttl(10), max_idle_files(64), timeout_ms(10000),
          debug_mode(false), fuse_args() {}
};

// Parses gflags, applies SEAFILE_TEST_* environment overrides for flags left
// at their defaults and collects the remaining arguments for libfuse.
Options parse_options(int *argc, char ***argv);

#endif // OPTIONS_H
