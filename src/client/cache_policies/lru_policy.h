#pragma once
#include "../eviction_policy.h"
#include <list>
#include <string>
#include <unordered_map>

/**
 * LEAST RECENTLY USED eviction policy
 * Evicts the buffer released the longest time ago
 */
class LRUEvictionPolicy : public IEvictionPolicy {
    public:
        void insert(const std::string &key) override { // O(1)
            if (key_ptrs_.count(key)) {
                update(key);
                return;
            }
            usage_.push_front(key);
            key_ptrs_[key] = usage_.begin();
        }

        void remove(const std::string &key) override { // O(1)
            auto it = key_ptrs_.find(key);
            if (it == key_ptrs_.end()) return;
            usage_.erase(it->second);
            key_ptrs_.erase(it);
        }

        void update(const std::string &key) override { // O(1)
            auto it = key_ptrs_.find(key);
            if (it == key_ptrs_.end()) return;
            usage_.erase(it->second);
            usage_.push_front(key);
            it->second = usage_.begin();
        }

        bool evict(std::string *victim) override { // O(1)
            if (usage_.empty()) return false;
            *victim = usage_.back();
            usage_.pop_back();
            key_ptrs_.erase(*victim);
            return true;
        }

        bool contains(const std::string &key) const override {
            return key_ptrs_.count(key) > 0;
        }

        size_t size() const override { return usage_.size(); }

    private:
        std::list<std::string> usage_;
        std::unordered_map<std::string, std::list<std::string>::iterator> key_ptrs_;
};
