#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace masterlist::registry {

// Raised when the backing store cannot be reached or rejects a command.
class RegistryUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Key/value primitives the registry is built on. Every call is atomic on its own.
// Implementations throw RegistryUnavailable on failure.
class RegistryBackend {
public:
    using Fields = std::map<std::string, std::string>;

    virtual ~RegistryBackend() = default;

    virtual const char *name() const = 0;

    // Replaces the whole hash and (re)arms its expiry.
    virtual void writeHash(const std::string &key, const Fields &fields, std::chrono::seconds ttl) = 0;
    // nullopt when the key is absent or expired.
    virtual std::optional<Fields> readHash(const std::string &key) = 0;
    // Live keys starting with prefix.
    virtual std::vector<std::string> scanKeys(const std::string &prefix) = 0;

    virtual std::set<std::string> readSet(const std::string &key) = 0;
    virtual void replaceSet(const std::string &key, const std::set<std::string> &members) = 0;

    // Single fields of a persistent hash.
    virtual void writeField(const std::string &key, const std::string &field, const std::string &value) = 0;
    virtual std::optional<std::string> readField(const std::string &key, const std::string &field) = 0;
    virtual void deleteField(const std::string &key, const std::string &field) = 0;
};

} // namespace masterlist::registry
