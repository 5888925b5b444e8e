#pragma once

#include "common/clock.hpp"
#include "registry/registry_backend.hpp"

#include <mutex>
#include <unordered_map>

namespace masterlist::registry {

// In-process backend for single-instance deployments and tests. Expiry is passive:
// an entry past its deadline is invisible and dropped on the next access.
class MemoryBackend final : public RegistryBackend {
public:
    explicit MemoryBackend(const Clock &clock);

    const char *name() const override { return "memory"; }

    void writeHash(const std::string &key, const Fields &fields, std::chrono::seconds ttl) override;
    std::optional<Fields> readHash(const std::string &key) override;
    std::vector<std::string> scanKeys(const std::string &prefix) override;

    std::set<std::string> readSet(const std::string &key) override;
    void replaceSet(const std::string &key, const std::set<std::string> &members) override;

    void writeField(const std::string &key, const std::string &field, const std::string &value) override;
    std::optional<std::string> readField(const std::string &key, const std::string &field) override;
    void deleteField(const std::string &key, const std::string &field) override;

private:
    struct ExpiringHash {
        Fields fields;
        TimePoint expiresAt{};
    };

    bool expired(const ExpiringHash &entry, TimePoint now) const;

    const Clock &clock;
    std::mutex mutex;
    std::unordered_map<std::string, ExpiringHash> hashes;
    std::unordered_map<std::string, Fields> persistentHashes;
    std::unordered_map<std::string, std::set<std::string>> sets;
};

} // namespace masterlist::registry
