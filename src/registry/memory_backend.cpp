#include "registry/memory_backend.hpp"

#include <algorithm>

namespace masterlist::registry {

MemoryBackend::MemoryBackend(const Clock &clock) : clock(clock) {}

bool MemoryBackend::expired(const ExpiringHash &entry, TimePoint now) const {
    return now >= entry.expiresAt;
}

void MemoryBackend::writeHash(const std::string &key, const Fields &fields, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex);
    ExpiringHash &entry = hashes[key];
    entry.fields = fields;
    entry.expiresAt = clock.now() + ttl;
}

std::optional<RegistryBackend::Fields> MemoryBackend::readHash(const std::string &key) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = hashes.find(key);
    if (it == hashes.end()) {
        return std::nullopt;
    }
    if (expired(it->second, clock.now())) {
        hashes.erase(it);
        return std::nullopt;
    }
    return it->second.fields;
}

std::vector<std::string> MemoryBackend::scanKeys(const std::string &prefix) {
    std::lock_guard<std::mutex> lock(mutex);
    const TimePoint now = clock.now();
    std::vector<std::string> keys;
    for (auto it = hashes.begin(); it != hashes.end();) {
        if (expired(it->second, now)) {
            it = hashes.erase(it);
            continue;
        }
        if (it->first.rfind(prefix, 0) == 0) {
            keys.push_back(it->first);
        }
        ++it;
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

std::set<std::string> MemoryBackend::readSet(const std::string &key) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = sets.find(key);
    if (it == sets.end()) {
        return {};
    }
    return it->second;
}

void MemoryBackend::replaceSet(const std::string &key, const std::set<std::string> &members) {
    std::lock_guard<std::mutex> lock(mutex);
    if (members.empty()) {
        sets.erase(key);
        return;
    }
    sets[key] = members;
}

void MemoryBackend::writeField(const std::string &key, const std::string &field, const std::string &value) {
    std::lock_guard<std::mutex> lock(mutex);
    persistentHashes[key][field] = value;
}

std::optional<std::string> MemoryBackend::readField(const std::string &key, const std::string &field) {
    std::lock_guard<std::mutex> lock(mutex);
    auto hash = persistentHashes.find(key);
    if (hash == persistentHashes.end()) {
        return std::nullopt;
    }
    auto it = hash->second.find(field);
    if (it == hash->second.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryBackend::deleteField(const std::string &key, const std::string &field) {
    std::lock_guard<std::mutex> lock(mutex);
    auto hash = persistentHashes.find(key);
    if (hash == persistentHashes.end()) {
        return;
    }
    hash->second.erase(field);
    if (hash->second.empty()) {
        persistentHashes.erase(hash);
    }
}

} // namespace masterlist::registry
