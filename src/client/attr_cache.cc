#include "attr_cache.h"
#include "util.h"

#include <butil/logging.h>
#include <mutex>

time_t wall_clock() { return ::time(nullptr); }

AttrCache::Listing AttrCache::list(const std::string &path) {
    const std::string key = normalize_path(path);
    const time_t now = clock_();
    uint64_t generation = 0;
    {
        std::shared_lock lk(mu_);
        auto it = snapshots_.find(key);
        if (it != snapshots_.end() && now < it->second.expires_at) {
            return {Status::OK(), kCacheHit, it->second.entries};
        }
        auto git = generations_.find(key);
        if (git != generations_.end()) {
            generation = git->second;
        }
    }

    // The remote call runs without the lock; concurrent refreshes of the same
    // directory are harmless since the last one replaces the snapshot.
    auto [s, dirents] = repo_->list_dir(key, /*force_refresh=*/true);
    if (!s.ok()) {
        LOG(WARNING) << "list " << key << " failed, serving empty listing: "
                     << s.ToString();
        return {s, kFallback, EntryMap()};
    }

    Snapshot snapshot;
    for (const auto &d : dirents) {
        DirectoryEntry entry;
        entry.name = d.name();
        entry.kind = d.type() == "dir" ? EntryKind::kDirectory
                                       : EntryKind::kFile;
        entry.size = entry.kind == EntryKind::kFile && d.size() > 0
                         ? static_cast<uint64_t>(d.size())
                         : 0;
        entry.modified_at = d.has_mtime() ? static_cast<time_t>(d.mtime()) : now;
        // The API reports no creation time.
        entry.created_at = entry.modified_at;
        snapshot.entries[entry.name] = entry;
    }
    snapshot.expires_at = now + ttl_;

    std::unique_lock lk(mu_);
    auto git = generations_.find(key);
    if (git != generations_.end() && git->second != generation) {
        // A local mutation landed while fetching; the result may predate it.
        return {Status::OK(), kRefreshed, std::move(snapshot.entries)};
    }
    auto &slot = snapshots_[key];
    slot = std::move(snapshot);
    return {Status::OK(), kRefreshed, slot.entries};
}

std::pair<Status, DirectoryEntry> AttrCache::lookup(const std::string &path) {
    auto [dir_name, name] = split_path_from_target(normalize_path(path));
    if (name.empty()) {
        return {Status::InvalidArgument("root has no parent listing"),
                DirectoryEntry()};
    }

    Listing listing = list(dir_name);
    auto it = listing.entries.find(name);
    if (it == listing.entries.end()) {
        return {Status::NotFound(path), DirectoryEntry()};
    }
    return {Status::OK(), it->second};
}

void AttrCache::patch(const std::string &path, const std::string &name,
                      EntryKind kind, uint64_t size) {
    const std::string key = normalize_path(path);
    const time_t now = clock_();

    std::unique_lock lk(mu_);
    bump_locked(key);
    auto it = snapshots_.find(key);
    if (it == snapshots_.end()) {
        return;
    }

    DirectoryEntry &entry = it->second.entries[name];
    entry.name = name;
    entry.kind = kind;
    entry.size = kind == EntryKind::kFile ? size : 0;
    entry.created_at = now;
    entry.modified_at = now;
}

void AttrCache::drop(const std::string &path, const std::string &name) {
    const std::string key = normalize_path(path);

    std::unique_lock lk(mu_);
    bump_locked(key);
    auto it = snapshots_.find(key);
    if (it == snapshots_.end()) {
        return;
    }
    it->second.entries.erase(name);
}

void AttrCache::invalidate(const std::string &path) {
    const std::string key = normalize_path(path);

    std::unique_lock lk(mu_);
    bump_locked(key);
    snapshots_.erase(key);
}

bool AttrCache::has_snapshot(const std::string &path) const {
    std::shared_lock lk(mu_);
    return snapshots_.count(normalize_path(path)) > 0;
}

void AttrCache::bump_locked(const std::string &key) { generations_[key]++; }
