#pragma once

#include "repository.h"
#include "status.h"

#include <cstdint>
#include <ctime>
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

using Clock = std::function<time_t()>;

time_t wall_clock();

enum class EntryKind { kFile, kDirectory };

struct DirectoryEntry {
    std::string name;
    EntryKind kind;
    uint64_t size; // 0 for directories
    time_t created_at;
    time_t modified_at;
};

using EntryMap = std::map<std::string, DirectoryEntry>;

/**
 * Per-directory snapshots of the remote listing with a time-to-live.
 *
 * A snapshot is replaced wholesale on refresh. Local mutations patch single
 * entries of snapshots that already exist so that the next lookup reflects
 * them before the TTL runs out. A fetch that overlapped a mutation of the
 * same directory is returned to its caller but never installed.
 */
class AttrCache {
  public:
    enum Origin {
        kCacheHit,  // served from a live snapshot
        kRefreshed, // fetched from the repository
        kFallback,  // fetch failed, empty result; status holds the error
    };

    struct Listing {
        Status status;
        Origin origin;
        EntryMap entries;
    };

    AttrCache(std::shared_ptr<IRepository> repo, time_t ttl,
              Clock clock = wall_clock)
        : repo_(std::move(repo)), ttl_(ttl), clock_(std::move(clock)) {}

    Listing list(const std::string &path);

    // Looks up the entry for a full path in its parent's listing.
    std::pair<Status, DirectoryEntry> lookup(const std::string &path);

    void patch(const std::string &path, const std::string &name,
               EntryKind kind, uint64_t size);
    void drop(const std::string &path, const std::string &name);
    void invalidate(const std::string &path);

    bool has_snapshot(const std::string &path) const;

  private:
    struct Snapshot {
        EntryMap entries;
        time_t expires_at;
    };

    // Caller holds mu_ exclusively.
    void bump_locked(const std::string &key);

    mutable std::shared_mutex mu_;
    std::unordered_map<std::string, Snapshot> snapshots_;
    // Per directory, bumped by every patch, drop and invalidate.
    std::unordered_map<std::string, uint64_t> generations_;

    std::shared_ptr<IRepository> repo_;
    time_t ttl_;
    Clock clock_;
};
