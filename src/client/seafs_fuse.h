#ifndef SEAFS_FUSE_H
#define SEAFS_FUSE_H

#include "status.h"

#include <fuse.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

// Negative errno for the kernel. Remote failures arrive here as IOError.
int status_to_errno(const Status &s);

int seafs_getattr(const char *path, struct stat *stbuf,
                  struct fuse_file_info *fi);
int seafs_readdir(const char *path, void *buf, fuse_fill_dir_t filler,
                  off_t offset, struct fuse_file_info *fi,
                  enum fuse_readdir_flags flags);
int seafs_mkdir(const char *path, mode_t mode);
int seafs_unlink(const char *path);
int seafs_rmdir(const char *path);
int seafs_rename(const char *from, const char *to, unsigned int flags);
int seafs_truncate(const char *path, off_t size, struct fuse_file_info *fi);
int seafs_open(const char *path, struct fuse_file_info *fi);
int seafs_read(const char *path, char *buf, size_t size, off_t offset,
               struct fuse_file_info *fi);
int seafs_write(const char *path, const char *buf, size_t size, off_t offset,
                struct fuse_file_info *fi);
int seafs_flush(const char *path, struct fuse_file_info *fi);
int seafs_release(const char *path, struct fuse_file_info *fi);
int seafs_fsync(const char *path, int isdatasync, struct fuse_file_info *fi);
int seafs_create(const char *path, mode_t mode, struct fuse_file_info *fi);
int seafs_utimens(const char *path, const struct timespec tv[2],
                  struct fuse_file_info *fi);

// Extended attributes, chmod, chown and statfs stay NULL: libfuse answers
// ENOSYS for them.
static const struct fuse_operations seafs_oper = {.getattr = seafs_getattr,
                                                  .readlink = NULL,
                                                  .mknod = NULL,
                                                  .mkdir = seafs_mkdir,
                                                  .unlink = seafs_unlink,
                                                  .rmdir = seafs_rmdir,
                                                  .symlink = NULL,
                                                  .rename = seafs_rename,
                                                  .link = NULL,
                                                  .chmod = NULL,
                                                  .chown = NULL,
                                                  .truncate = seafs_truncate,
                                                  .open = seafs_open,
                                                  .read = seafs_read,
                                                  .write = seafs_write,
                                                  .statfs = NULL,
                                                  .flush = seafs_flush,
                                                  .release = seafs_release,
                                                  .fsync = seafs_fsync,
                                                  .setxattr = NULL,
                                                  .getxattr = NULL,
                                                  .listxattr = NULL,
                                                  .removexattr = NULL,
                                                  .opendir = NULL,
                                                  .readdir = seafs_readdir,
                                                  .releasedir = NULL,
                                                  .fsyncdir = NULL,
                                                  .init = NULL,
                                                  .destroy = NULL,
                                                  .access = NULL,
                                                  .create = seafs_create,
                                                  .lock = NULL,
                                                  .utimens = seafs_utimens,
                                                  .bmap = NULL,
                                                  .ioctl = NULL,
                                                  .poll = NULL,
                                                  .write_buf = NULL,
                                                  .read_buf = NULL,
                                                  .flock = NULL,
                                                  .fallocate = NULL,
                                                  .copy_file_range = NULL,
                                                  .lseek = NULL};
#endif // SEAFS_FUSE_H
