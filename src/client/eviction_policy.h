#pragma once
#include <string>

// Orders idle open-file buffers by path for eviction.
class IEvictionPolicy {
public:
    virtual ~IEvictionPolicy() = default;
    virtual void insert(const std::string &path) = 0;
    virtual void remove(const std::string &path) = 0;
    virtual void update(const std::string &path) = 0;
    virtual bool evict(std::string *victim) = 0;
    virtual bool contains(const std::string &path) const = 0;
    virtual size_t size() const = 0;
};
