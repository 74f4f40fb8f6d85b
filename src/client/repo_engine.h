#ifndef REPO_ENGINE_H
#define REPO_ENGINE_H

#include "attr_cache.h"
#include "open_file_table.h"
#include "options.h"
#include "repository.h"
#include "status.h"

#include <memory>
#include <string>
#include <sys/stat.h>
#include <sys/types.h>
#include <utility>
#include <vector>

// Translates filesystem operations on the mount into attribute cache lookups,
// open-file table operations and repository calls.
class RepoEngine {
  public:
    RepoEngine(const Options &options, std::shared_ptr<IRepository> repo,
               Clock clock = wall_clock);
    ~RepoEngine() = default;

    Status getattr(const std::string &path, struct stat *stbuf);
    std::pair<Status, std::vector<std::string>>
    readdir(const std::string &path);

    Status open(const std::string &path);
    Status create(const std::string &path);
    std::pair<Status, size_t> read(const std::string &path, char *buf,
                                   size_t size, off_t offset);
    std::pair<Status, size_t> write(const std::string &path, const char *buf,
                                    size_t size, off_t offset);
    // Without an open handle the new size is uploaded right away.
    Status truncate(const std::string &path, off_t length, bool has_handle);
    Status flush(const std::string &path);
    Status fsync(const std::string &path);
    Status release(const std::string &path);

    Status rename(const std::string &from, const std::string &to);
    Status unlink(const std::string &path);
    Status mkdir(const std::string &path);
    Status rmdir(const std::string &path);
    Status utimens(const std::string &path);

    AttrCache &attr_cache() { return cache_; }
    OpenFileTable &open_files() { return files_; }

  private:
    void fill_stat(const DirectoryEntry &entry, struct stat *stbuf);
    void note_uploaded(const std::string &path);

    std::shared_ptr<IRepository> repo_;
    AttrCache cache_;
    OpenFileTable files_;
    Clock clock_;
    uid_t uid_;
    gid_t gid_;
};

#endif // REPO_ENGINE_H
