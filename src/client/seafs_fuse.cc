#include "seafs_fuse.h"
#include "repo_engine.h"
#include "status.h"

#include <butil/logging.h>
#include <cerrno>
#include <fcntl.h>
#include <sys/types.h>

static RepoEngine *engine() {
    return static_cast<RepoEngine *>(fuse_get_context()->private_data);
}

int status_to_errno(const Status &s) {
    switch (s.code()) {
    case Status::kOk:
        return 0;
    case Status::kNotFound:
        return -ENOENT;
    case Status::kInvalidArgument:
        return -EINVAL;
    case Status::kConflict:
        return -EFAULT;
    case Status::kIOError:
    case Status::kCorruption:
    default:
        return -EIO;
    }
}

// Lookups of missing names are routine and not worth a log line.
static int reply(const char *op, const char *path, const Status &s) {
    if (!s.ok() && !s.is_not_found()) {
        LOG(ERROR) << op << " " << path << ": " << s.ToString();
    }
    return status_to_errno(s);
}

int seafs_getattr(const char *path, struct stat *stbuf,
                  struct fuse_file_info * /*fi*/) {
    return reply("getattr", path, engine()->getattr(path, stbuf));
}

int seafs_readdir(const char *path, void *buf, fuse_fill_dir_t filler,
                  off_t /*offset*/, struct fuse_file_info * /*fi*/,
                  enum fuse_readdir_flags /*flags*/) {
    auto [s, names] = engine()->readdir(path);
    if (!s.ok()) {
        return reply("readdir", path, s);
    }
    for (const auto &name : names) {
        if (filler(buf, name.c_str(), NULL, 0, (enum fuse_fill_dir_flags)0)) {
            break;
        }
    }
    return 0;
}

int seafs_mkdir(const char *path, mode_t /*mode*/) {
    return reply("mkdir", path, engine()->mkdir(path));
}

int seafs_unlink(const char *path) {
    return reply("unlink", path, engine()->unlink(path));
}

int seafs_rmdir(const char *path) {
    return reply("rmdir", path, engine()->rmdir(path));
}

int seafs_rename(const char *from, const char *to, unsigned int flags) {
    // RENAME_EXCHANGE and RENAME_NOREPLACE have no remote counterpart.
    if (flags) {
        return -EINVAL;
    }
    return reply("rename", from, engine()->rename(from, to));
}

int seafs_truncate(const char *path, off_t size, struct fuse_file_info *fi) {
    return reply("truncate", path,
                 engine()->truncate(path, size, /*has_handle=*/fi != NULL));
}

int seafs_open(const char *path, struct fuse_file_info * /*fi*/) {
    return reply("open", path, engine()->open(path));
}

int seafs_read(const char *path, char *buf, size_t size, off_t offset,
               struct fuse_file_info * /*fi*/) {
    auto [s, n] = engine()->read(path, buf, size, offset);
    if (!s.ok()) {
        return reply("read", path, s);
    }
    return static_cast<int>(n);
}

int seafs_write(const char *path, const char *buf, size_t size, off_t offset,
                struct fuse_file_info * /*fi*/) {
    auto [s, n] = engine()->write(path, buf, size, offset);
    if (!s.ok()) {
        return reply("write", path, s);
    }
    return static_cast<int>(n);
}

int seafs_flush(const char *path, struct fuse_file_info * /*fi*/) {
    return reply("flush", path, engine()->flush(path));
}

int seafs_release(const char *path, struct fuse_file_info *fi) {
    Status s = engine()->release(path);
    fi->fh = 0;
    return reply("release", path, s);
}

int seafs_fsync(const char *path, int /*isdatasync*/,
                struct fuse_file_info * /*fi*/) {
    return reply("fsync", path, engine()->fsync(path));
}

int seafs_create(const char *path, mode_t /*mode*/,
                 struct fuse_file_info * /*fi*/) {
    return reply("create", path, engine()->create(path));
}

int seafs_utimens(const char *path, const struct timespec /*tv*/[2],
                  struct fuse_file_info * /*fi*/) {
    return reply("utimens", path, engine()->utimens(path));
}
