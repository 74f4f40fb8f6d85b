#include "open_file_table.h"
#include "cache_policies/lru_policy.h"
#include "util.h"

#include <butil/logging.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

OpenFile::~OpenFile() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

std::pair<Status, std::shared_ptr<OpenFile>>
OpenFile::make(const std::string &staging_dir, const std::string &content) {
    std::string tmpl = join_paths(staging_dir, "seafs-XXXXXX");
    std::vector<char> name(tmpl.begin(), tmpl.end());
    name.push_back('\0');

    int fd = ::mkstemp(name.data());
    if (fd == -1) {
        return {Status::IOError("mkstemp in " + staging_dir + ": " +
                                std::string(strerror(errno))),
                nullptr};
    }
    // The buffer only lives as long as the descriptor.
    ::unlink(name.data());

    auto file = std::make_shared<OpenFile>(fd);
    if (!content.empty()) {
        Status s = file->write(content.data(), content.size(), 0);
        if (!s.ok()) {
            return {s, nullptr};
        }
    }
    file->dirty_ = false;
    return {Status::OK(), file};
}

Status OpenFile::read(char *dst, size_t size, off_t offset, size_t *n) {
    std::lock_guard<std::mutex> lk(mu_);
    size_t done = 0;
    while (done < size) {
        ssize_t r = ::pread(fd_, dst + done, size - done, offset + done);
        if (r < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Status::IOError("pread: " + std::string(strerror(errno)));
        }
        if (r == 0) {
            break;
        }
        done += static_cast<size_t>(r);
    }
    *n = done;
    return Status::OK();
}

Status OpenFile::write(const char *src, size_t size, off_t offset) {
    std::lock_guard<std::mutex> lk(mu_);
    size_t done = 0;
    while (done < size) {
        ssize_t w = ::pwrite(fd_, src + done, size - done, offset + done);
        if (w < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Status::IOError("pwrite: " + std::string(strerror(errno)));
        }
        done += static_cast<size_t>(w);
    }
    dirty_ = true;
    version_++;
    return Status::OK();
}

Status OpenFile::truncate(off_t length) {
    std::lock_guard<std::mutex> lk(mu_);
    if (::ftruncate(fd_, length) == -1) {
        return Status::IOError("ftruncate: " + std::string(strerror(errno)));
    }
    dirty_ = true;
    version_++;
    return Status::OK();
}

Status OpenFile::contents(std::string *out, uint64_t *version) {
    std::lock_guard<std::mutex> lk(mu_);
    struct stat st;
    if (::fstat(fd_, &st) == -1) {
        return Status::IOError("fstat: " + std::string(strerror(errno)));
    }

    out->resize(st.st_size);
    size_t done = 0;
    while (done < out->size()) {
        ssize_t r = ::pread(fd_, &(*out)[done], out->size() - done, done);
        if (r < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Status::IOError("pread: " + std::string(strerror(errno)));
        }
        if (r == 0) {
            break;
        }
        done += static_cast<size_t>(r);
    }
    out->resize(done);
    *version = version_;
    return Status::OK();
}

void OpenFile::mark_clean(uint64_t version) {
    std::lock_guard<std::mutex> lk(mu_);
    if (version_ == version) {
        dirty_ = false;
    }
}

bool OpenFile::dirty() const {
    std::lock_guard<std::mutex> lk(mu_);
    return dirty_;
}

uint64_t OpenFile::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    struct stat st;
    if (::fstat(fd_, &st) == -1) {
        return 0;
    }
    return static_cast<uint64_t>(st.st_size);
}

OpenFileTable::OpenFileTable(std::shared_ptr<IRepository> repo,
                             std::string staging_dir, size_t max_idle)
    : files_(), idle_(std::make_unique<LRUEvictionPolicy>()),
      repo_(std::move(repo)), staging_dir_(std::move(staging_dir)),
      max_idle_(max_idle) {}

std::pair<Status, std::shared_ptr<OpenFile>>
OpenFileTable::acquire(const std::string &path, bool download) {
    const std::string key = normalize_path(path);
    if (auto existing = find(key)) {
        return {Status::OK(), existing};
    }

    std::string content;
    if (download) {
        auto [s, data] = repo_->get_content(key);
        if (s.ok()) {
            content = std::move(data);
        } else {
            // Opening never fails on a fetch error; the buffer starts empty.
            LOG(WARNING) << "download " << key
                         << " failed, starting empty: " << s.ToString();
        }
    }

    auto [s, file] = OpenFile::make(staging_dir_, content);
    if (!s.ok()) {
        LOG(ERROR) << "cannot stage " << key << ": " << s.ToString();
        return {s, nullptr};
    }

    std::lock_guard<std::mutex> lk(mu_);
    auto it = files_.find(key);
    if (it != files_.end()) {
        // Lost a race with another acquire; theirs wins.
        return {Status::OK(), it->second};
    }
    files_[key] = file;
    return {Status::OK(), file};
}

std::pair<Status, std::shared_ptr<OpenFile>>
OpenFileTable::open(const std::string &path, bool download) {
    const std::string key = normalize_path(path);
    auto [s, file] = acquire(key, download);
    if (!s.ok()) {
        return {s, nullptr};
    }

    std::lock_guard<std::mutex> lk(mu_);
    auto it = files_.find(key);
    if (it == files_.end()) {
        // Closed between acquire and now; register it again.
        files_[key] = file;
    } else {
        file = it->second;
    }
    file->handles_++;
    idle_->remove(key);
    return {Status::OK(), file};
}

std::shared_ptr<OpenFile> OpenFileTable::find(const std::string &path) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = files_.find(normalize_path(path));
    if (it == files_.end()) {
        return nullptr;
    }
    return it->second;
}

std::pair<Status, size_t> OpenFileTable::read(const std::string &path,
                                              char *buf, size_t size,
                                              off_t offset) {
    auto [s, file] = acquire(path, /*download=*/true);
    if (!s.ok()) {
        return {s, 0};
    }
    size_t n = 0;
    s = file->read(buf, size, offset, &n);
    return {s, n};
}

std::pair<Status, size_t> OpenFileTable::write(const std::string &path,
                                               const char *buf, size_t size,
                                               off_t offset) {
    auto [s, file] = acquire(path, /*download=*/true);
    if (!s.ok()) {
        return {s, 0};
    }
    s = file->write(buf, size, offset);
    if (!s.ok()) {
        return {s, 0};
    }
    return {Status::OK(), size};
}

Status OpenFileTable::truncate(const std::string &path, off_t length) {
    auto [s, file] = acquire(path, /*download=*/true);
    if (!s.ok()) {
        return s;
    }
    return file->truncate(length);
}

Status OpenFileTable::flush(const std::string &path, bool *uploaded) {
    if (uploaded) {
        *uploaded = false;
    }
    auto file = find(path);
    if (!file) {
        return Status::OK();
    }
    return write_back(normalize_path(path), file, uploaded);
}

Status OpenFileTable::close(const std::string &path, bool *uploaded) {
    if (uploaded) {
        *uploaded = false;
    }
    const std::string key = normalize_path(path);
    auto file = find(key);
    if (!file) {
        return Status::OK();
    }

    Status s = write_back(key, file, uploaded);

    std::lock_guard<std::mutex> lk(mu_);
    auto it = files_.find(key);
    // An open that raced with the write-back keeps the buffer alive.
    if (it != files_.end() && it->second == file && file->handles_ == 0) {
        files_.erase(it);
        idle_->remove(key);
    }
    return s;
}

Status OpenFileTable::release(const std::string &path, bool *uploaded) {
    if (uploaded) {
        *uploaded = false;
    }
    const std::string key = normalize_path(path);
    std::shared_ptr<OpenFile> file;
    int remaining = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = files_.find(key);
        if (it == files_.end()) {
            return Status::OK();
        }
        file = it->second;
        if (file->handles_ > 0) {
            file->handles_--;
        }
        remaining = file->handles_;
    }

    if (file->dirty()) {
        if (remaining > 0) {
            return write_back(key, file, uploaded);
        }
        return close(key, uploaded);
    }

    if (remaining == 0) {
        std::lock_guard<std::mutex> lk(mu_);
        park_idle_locked(key);
    }
    return Status::OK();
}

// True for dir itself and everything below it.
static bool is_under(const std::string &path, const std::string &dir) {
    return path == dir ||
           (path.size() > dir.size() && path.compare(0, dir.size(), dir) == 0 &&
            path[dir.size()] == '/');
}

void OpenFileTable::drop_handle(const std::string &path) {
    const std::string key = normalize_path(path);
    std::lock_guard<std::mutex> lk(mu_);
    auto it = files_.find(key);
    if (it == files_.end()) {
        return;
    }
    OpenFile &file = *it->second;
    if (file.handles_ > 0) {
        file.handles_--;
    }
    if (file.handles_ == 0 && !file.dirty()) {
        park_idle_locked(key);
    }
}

void OpenFileTable::rename(const std::string &old_path,
                           const std::string &new_path) {
    const std::string from = normalize_path(old_path);
    const std::string to = normalize_path(new_path);
    if (from == to) {
        return;
    }

    std::lock_guard<std::mutex> lk(mu_);

    // The target's previous content is gone remotely. Unreferenced clean
    // copies of it must not be served again.
    for (auto it = files_.begin(); it != files_.end();) {
        if (is_under(it->first, to) && it->second->handles_ == 0 &&
            !it->second->dirty()) {
            idle_->remove(it->first);
            it = files_.erase(it);
        } else {
            ++it;
        }
    }

    // A directory takes the buffers of everything below it along.
    struct Moved {
        std::string key;
        std::shared_ptr<OpenFile> file;
        bool idle;
    };
    std::vector<Moved> moved;
    for (auto it = files_.begin(); it != files_.end();) {
        if (is_under(it->first, from)) {
            const bool idle = idle_->contains(it->first);
            idle_->remove(it->first);
            moved.push_back({to + it->first.substr(from.size()),
                             std::move(it->second), idle});
            it = files_.erase(it);
        } else {
            ++it;
        }
    }

    for (auto &m : moved) {
        // Whatever buffer the target still had is replaced, as the file is.
        idle_->remove(m.key);
        files_[m.key] = std::move(m.file);
        if (m.idle) {
            idle_->insert(m.key);
        }
    }
}

void OpenFileTable::discard(const std::string &path) {
    const std::string key = normalize_path(path);
    std::lock_guard<std::mutex> lk(mu_);
    files_.erase(key);
    idle_->remove(key);
}

size_t OpenFileTable::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return files_.size();
}

size_t OpenFileTable::idle_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return idle_->size();
}

Status OpenFileTable::write_back(const std::string &path,
                                 const std::shared_ptr<OpenFile> &file,
                                 bool *uploaded) {
    if (!file->dirty()) {
        return Status::OK();
    }

    std::string content;
    uint64_t version = 0;
    Status s = file->contents(&content, &version);
    if (!s.ok()) {
        LOG(WARNING) << "write-back of " << path << " failed: " << s.ToString();
        return s;
    }

    auto [dir_name, name] = split_path_from_target(path);
    s = repo_->upload(dir_name, name, content);
    if (!s.ok()) {
        // Still dirty, the next flush or close uploads everything again.
        LOG(WARNING) << "write-back of " << path << " failed: " << s.ToString();
        return s;
    }

    file->mark_clean(version);
    if (uploaded) {
        *uploaded = true;
    }
    VLOG(1) << "uploaded " << path << " (" << content.size() << " bytes)";
    return Status::OK();
}

void OpenFileTable::park_idle_locked(const std::string &path) {
    idle_->insert(path);

    std::string victim;
    while (idle_->size() > max_idle_ && idle_->evict(&victim)) {
        auto it = files_.find(victim);
        if (it == files_.end()) {
            continue;
        }
        // Only clean, unreferenced buffers can go without losing data.
        if (it->second->handles_ == 0 && !it->second->dirty()) {
            files_.erase(it);
        }
    }
}
