#include "jsonkeyspace/keyspace.h"
#include <algorithm>
#include <utility>

namespace jsonkeyspace {

const json* Keyspace::find(const std::string& key) const {
    auto it = documents_.find(key);
    return it == documents_.end() ? nullptr : &it->second;
}

json* Keyspace::find_mutable(const std::string& key) {
    auto it = documents_.find(key);
    return it == documents_.end() ? nullptr : &it->second;
}

bool Keyspace::contains(const std::string& key) const {
    return documents_.count(key) != 0;
}

void Keyspace::insert_or_assign(const std::string& key, json document) {
    documents_.insert_or_assign(key, std::move(document));
}

bool Keyspace::erase(const std::string& key) {
    return documents_.erase(key) != 0;
}

std::vector<std::string> Keyspace::keys() const {
    std::vector<std::string> result;
    result.reserve(documents_.size());
    for (const auto& entry : documents_) {
        result.push_back(entry.first);
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace jsonkeyspace
