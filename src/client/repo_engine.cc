#include "repo_engine.h"
#include "util.h"

#include <butil/logging.h>
#include <cstring>
#include <unistd.h>

// Remote failures on the write path reach the kernel as plain I/O errors.
static Status to_io_error(const std::string &op, const std::string &path,
                          const Status &s) {
    return Status::IOError(op + " " + path + ": " + s.message());
}

RepoEngine::RepoEngine(const Options &options,
                       std::shared_ptr<IRepository> repo, Clock clock)
    : repo_(repo), cache_(repo, options.cache_ttl, clock),
      files_(repo, options.cache_dir, options.max_idle_files),
      clock_(clock), uid_(::getuid()), gid_(::getgid()) {}

Status RepoEngine::getattr(const std::string &path, struct stat *stbuf) {
    const std::string key = normalize_path(path);
    memset(stbuf, 0, sizeof(struct stat));

    if (key == "/") {
        stbuf->st_mode = S_IFDIR | 0755;
        stbuf->st_nlink = 2;
        stbuf->st_atime = stbuf->st_mtime = stbuf->st_ctime = clock_();
        stbuf->st_uid = uid_;
        stbuf->st_gid = gid_;
        return Status::OK();
    }

    auto [s, entry] = cache_.lookup(key);
    auto file = files_.find(key);
    if (!s.ok()) {
        if (!file) {
            return s;
        }
        // Created locally, not yet visible in any listing.
        const time_t now = clock_();
        entry = DirectoryEntry{filename(key), EntryKind::kFile, 0, now, now};
    }
    if (file && entry.kind == EntryKind::kFile) {
        entry.size = file->size();
    }

    fill_stat(entry, stbuf);
    return Status::OK();
}

std::pair<Status, std::vector<std::string>>
RepoEngine::readdir(const std::string &path) {
    // A failed listing is already logged and shows up as an empty directory.
    AttrCache::Listing listing = cache_.list(path);

    std::vector<std::string> names{".", ".."};
    for (const auto &kv : listing.entries) {
        names.push_back(kv.first);
    }
    return {Status::OK(), names};
}

Status RepoEngine::open(const std::string &path) {
    auto [s, file] = files_.open(path, /*download=*/true);
    return s;
}

Status RepoEngine::create(const std::string &path) {
    const std::string key = normalize_path(path);
    auto [dir_name, name] = split_path_from_target(key);
    if (name.empty()) {
        return Status::Conflict("cannot create the mount root");
    }

    cache_.list(dir_name);
    cache_.patch(dir_name, name, EntryKind::kFile, 0);

    auto [s, file] = files_.open(key, /*download=*/false);
    if (!s.ok()) {
        return to_io_error("create", key, s);
    }
    // An empty, dirty buffer: the flush below makes the file exist remotely.
    s = file->truncate(0);
    if (s.ok()) {
        s = files_.flush(key);
    }
    if (!s.ok()) {
        // A failed create gets no release; the dirty buffer waits for the
        // next open of the path.
        files_.drop_handle(key);
        return to_io_error("create", key, s);
    }
    return Status::OK();
}

std::pair<Status, size_t> RepoEngine::read(const std::string &path, char *buf,
                                           size_t size, off_t offset) {
    return files_.read(path, buf, size, offset);
}

std::pair<Status, size_t> RepoEngine::write(const std::string &path,
                                            const char *buf, size_t size,
                                            off_t offset) {
    return files_.write(path, buf, size, offset);
}

Status RepoEngine::truncate(const std::string &path, off_t length,
                            bool has_handle) {
    const std::string key = normalize_path(path);
    if (has_handle) {
        return files_.truncate(key, length);
    }

    auto [s, file] = files_.open(key, /*download=*/true);
    if (!s.ok()) {
        return s;
    }
    Status ts = file->truncate(length);
    uint64_t size = file->size();

    bool uploaded = false;
    s = files_.release(key, &uploaded);
    if (!ts.ok()) {
        return ts;
    }
    if (!s.ok()) {
        return to_io_error("truncate", key, s);
    }
    if (uploaded) {
        auto [dir_name, name] = split_path_from_target(key);
        cache_.patch(dir_name, name, EntryKind::kFile, size);
    }
    return Status::OK();
}

Status RepoEngine::flush(const std::string &path) {
    const std::string key = normalize_path(path);
    bool uploaded = false;
    Status s = files_.flush(key, &uploaded);
    if (!s.ok()) {
        // Logged by the table; the dirty buffer waits for the next attempt.
        return Status::OK();
    }
    if (uploaded) {
        note_uploaded(key);
    }
    return Status::OK();
}

Status RepoEngine::fsync(const std::string &path) { return flush(path); }

Status RepoEngine::release(const std::string &path) {
    const std::string key = normalize_path(path);
    auto file = files_.find(key);
    if (!file) {
        return Status::OK();
    }

    bool uploaded = false;
    Status s = files_.release(key, &uploaded);
    if (!s.ok()) {
        return to_io_error("release", key, s);
    }
    if (uploaded) {
        auto [dir_name, name] = split_path_from_target(key);
        cache_.patch(dir_name, name, EntryKind::kFile, file->size());
    }
    return Status::OK();
}

Status RepoEngine::rename(const std::string &from, const std::string &to) {
    const std::string src = normalize_path(from);
    const std::string dst = normalize_path(to);
    if (src == "/" || dst == "/") {
        return Status::Conflict("cannot rename the mount root");
    }
    if (src == dst) {
        return Status::OK();
    }

    auto [src_dir, src_name] = split_path_from_target(src);
    auto [dst_dir, dst_name] = split_path_from_target(dst);

    auto [ls, entry] = cache_.lookup(src);
    const bool is_dir = ls.ok() && entry.kind == EntryKind::kDirectory;
    uint64_t size = ls.ok() ? entry.size : 0;

    files_.rename(src, dst);

    if (src_dir == dst_dir) {
        Status s = repo_->rename(src, dst_name, is_dir);
        if (!s.ok()) {
            files_.rename(dst, src);
            return to_io_error("rename", src, s);
        }
    } else {
        Status s = repo_->move(src, dst_dir);
        if (!s.ok()) {
            files_.rename(dst, src);
            return to_io_error("move", src, s);
        }
        if (src_name != dst_name) {
            // Two steps, not atomic: after a failed rename the object sits
            // in the new directory under its old name.
            const std::string moved = join_paths(dst_dir, src_name);
            s = repo_->rename(moved, dst_name, is_dir);
            if (!s.ok()) {
                LOG(WARNING) << "rename " << src << " -> " << dst
                             << " stopped at " << moved << ": "
                             << s.ToString();
                files_.rename(dst, moved);
                cache_.invalidate(src_dir);
                cache_.invalidate(dst_dir);
                return to_io_error("rename", moved, s);
            }
        }
    }

    if (auto file = files_.find(dst)) {
        size = file->size();
    }
    cache_.drop(src_dir, src_name);
    cache_.patch(dst_dir, dst_name,
                 is_dir ? EntryKind::kDirectory : EntryKind::kFile, size);
    if (is_dir) {
        cache_.invalidate(src);
    }
    return Status::OK();
}

Status RepoEngine::unlink(const std::string &path) {
    const std::string key = normalize_path(path);
    if (key == "/") {
        return Status::Conflict("cannot unlink the mount root");
    }

    Status s = repo_->remove_file(key);
    if (!s.ok()) {
        return to_io_error("unlink", key, s);
    }

    files_.discard(key);
    auto [dir_name, name] = split_path_from_target(key);
    cache_.drop(dir_name, name);
    return Status::OK();
}

Status RepoEngine::mkdir(const std::string &path) {
    const std::string key = normalize_path(path);
    if (key == "/") {
        return Status::Conflict("the mount root already exists");
    }

    Status s = repo_->create_dir(key);
    if (!s.ok()) {
        return to_io_error("mkdir", key, s);
    }

    auto [dir_name, name] = split_path_from_target(key);
    cache_.patch(dir_name, name, EntryKind::kDirectory, 0);
    return Status::OK();
}

Status RepoEngine::rmdir(const std::string &path) {
    const std::string key = normalize_path(path);
    if (key == "/") {
        return Status::Conflict("cannot remove the mount root");
    }

    Status s = repo_->remove_dir(key);
    if (!s.ok()) {
        return to_io_error("rmdir", key, s);
    }

    auto [dir_name, name] = split_path_from_target(key);
    cache_.drop(dir_name, name);
    cache_.invalidate(key);
    return Status::OK();
}

Status RepoEngine::utimens(const std::string &path) {
    // Remote timestamps are set by the server; only existence is checked.
    struct stat st;
    return getattr(path, &st);
}

void RepoEngine::fill_stat(const DirectoryEntry &entry, struct stat *stbuf) {
    if (entry.kind == EntryKind::kDirectory) {
        stbuf->st_mode = S_IFDIR | 0755;
        stbuf->st_nlink = 2;
    } else {
        stbuf->st_mode = S_IFREG | 0644;
        stbuf->st_nlink = 1;
        stbuf->st_size = static_cast<off_t>(entry.size);
    }
    stbuf->st_ctime = entry.created_at;
    stbuf->st_atime = entry.created_at;
    stbuf->st_mtime = entry.modified_at;
    stbuf->st_uid = uid_;
    stbuf->st_gid = gid_;
}

void RepoEngine::note_uploaded(const std::string &path) {
    auto file = files_.find(path);
    if (!file) {
        return;
    }
    auto [dir_name, name] = split_path_from_target(path);
    cache_.patch(dir_name, name, EntryKind::kFile, file->size());
}
