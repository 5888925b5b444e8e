#pragma once

#include "registry/listing.hpp"
#include "registry/registry_store.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace masterlist::registry {

// Session identifier carried in every challenge and echoed by the game server.
constexpr uint64_t kDefaultChallengeUid = 1000000001337ULL;

constexpr const char *kVerificationTimedOutMessage = "Server verification timed out. Please check your ports.";
constexpr const char *kInternalErrorMessage = "An internal server error occurred.";

struct RegistrationSettings {
    std::chrono::milliseconds verificationTimeout{800};
    std::chrono::seconds serverTtl{30};
    uint64_t challengeUid = kDefaultChallengeUid;
};

enum class RegistrationError {
    None,
    VerificationTimedOut,
    StoreUnavailable,
    Internal
};

const char *ToString(RegistrationError error);

struct RegistrationResult {
    RegistrationError error = RegistrationError::None;
    std::string message;
    std::optional<std::string> token;
    std::string ip;
    int port = 0;

    bool ok() const { return error == RegistrationError::None; }
};

// Proves a validated listing's endpoint answers the challenge, then publishes it.
// Safe to call from several threads; each call owns its own verification socket.
class RegistrationHandler {
public:
    RegistrationHandler(RegistryStore &store, RegistrationSettings settings);

    RegistrationResult registerServer(Listing listing);

    const RegistrationSettings &settings() const { return config; }

private:
    RegistryStore &store;
    RegistrationSettings config;
};

} // namespace masterlist::registry
