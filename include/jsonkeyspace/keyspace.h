#pragma once

#include "common_types.h"
#include <string>
#include <unordered_map>
#include <vector>

namespace jsonkeyspace {

// Store keys to the JSON document each one owns.
// Not synchronised: the caller serialises commands that touch the same key.
class Keyspace {
public:
    Keyspace() = default;

    Keyspace(const Keyspace&) = delete;
    Keyspace& operator=(const Keyspace&) = delete;

    // nullptr when the key does not exist
    const json* find(const std::string& key) const;
    json* find_mutable(const std::string& key);

    bool contains(const std::string& key) const;
    void insert_or_assign(const std::string& key, json document);
    // Returns true if the key existed
    bool erase(const std::string& key);

    size_t size() const { return documents_.size(); }
    bool empty() const { return documents_.empty(); }
    std::vector<std::string> keys() const;

private:
    std::unordered_map<std::string, json> documents_;
};

} // namespace jsonkeyspace
