#ifndef OPEN_FILE_TABLE_H
#define OPEN_FILE_TABLE_H

#include "eviction_policy.h"
#include "repository.h"
#include "status.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <unordered_map>
#include <utility>

// Local staging buffer of one remote file: an unlinked temporary file plus a
// dirty flag.
class OpenFile {
  public:
    explicit OpenFile(int fd)
        : fd_(fd), dirty_(false), version_(0), handles_(0) {}
    ~OpenFile();

    OpenFile(const OpenFile &) = delete;
    OpenFile &operator=(const OpenFile &) = delete;

    // Creates a buffer under staging_dir seeded with content.
    static std::pair<Status, std::shared_ptr<OpenFile>>
    make(const std::string &staging_dir, const std::string &content);

    // Short reads past the end of the buffer are not errors.
    Status read(char *dst, size_t size, off_t offset, size_t *n);
    Status write(const char *src, size_t size, off_t offset);
    Status truncate(off_t length);

    // Reads the whole buffer from its start. version identifies the state
    // that was read so that a later mark_clean does not hide newer writes.
    Status contents(std::string *out, uint64_t *version);
    void mark_clean(uint64_t version);

    bool dirty() const;
    uint64_t size() const;

  private:
    friend class OpenFileTable;

    mutable std::mutex mu_;
    int fd_;
    bool dirty_;
    uint64_t version_; // bumped by every mutation

    int handles_; // open handles; guarded by the table's lock
};

/**
 * Maps paths to their OpenFile. At most one buffer exists per path; rename
 * relocates it. Dirty buffers are reconciled with the repository by
 * uploading their whole content.
 *
 * Buffers whose last handle was released clean stay cached; at most
 * max_idle of them are kept, least recently released evicted first.
 */
class OpenFileTable {
  public:
    OpenFileTable(std::shared_ptr<IRepository> repo, std::string staging_dir,
                  size_t max_idle);
    ~OpenFileTable() = default;

    // Returns the existing buffer or creates one, downloaded or empty.
    std::pair<Status, std::shared_ptr<OpenFile>>
    acquire(const std::string &path, bool download);

    // acquire() plus one open handle on the buffer.
    std::pair<Status, std::shared_ptr<OpenFile>> open(const std::string &path,
                                                      bool download);

    std::shared_ptr<OpenFile> find(const std::string &path) const;

    std::pair<Status, size_t> read(const std::string &path, char *buf,
                                   size_t size, off_t offset);
    std::pair<Status, size_t> write(const std::string &path, const char *buf,
                                    size_t size, off_t offset);
    Status truncate(const std::string &path, off_t length);

    // Write-back if dirty. The buffer stays in the table either way.
    Status flush(const std::string &path, bool *uploaded = nullptr);

    // Write-back if dirty, then drop the buffer whatever the outcome.
    Status close(const std::string &path, bool *uploaded = nullptr);

    // Gives up one handle. A dirty buffer is closed once its last handle is
    // gone (flushed while others remain); a clean one becomes idle.
    Status release(const std::string &path, bool *uploaded = nullptr);

    // Gives up one handle without writing back. A dirty buffer stays for a
    // later flush or release.
    void drop_handle(const std::string &path);

    // Relocates the buffer at old_path and, for a directory, those below it.
    // Unreferenced clean buffers at new_path are dropped.
    void rename(const std::string &old_path, const std::string &new_path);

    // Drops the buffer without uploading it.
    void discard(const std::string &path);

    size_t size() const;
    size_t idle_count() const;

  private:
    Status write_back(const std::string &path,
                      const std::shared_ptr<OpenFile> &file, bool *uploaded);
    void park_idle_locked(const std::string &path);

    mutable std::mutex mu_;
    std::unordered_map<std::string, std::shared_ptr<OpenFile>> files_;
    std::unique_ptr<IEvictionPolicy> idle_;

    std::shared_ptr<IRepository> repo_;
    std::string staging_dir_;
    size_t max_idle_;
};

#endif // OPEN_FILE_TABLE_H
