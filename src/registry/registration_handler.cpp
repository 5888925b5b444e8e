#include "registry/registration_handler.hpp"

#include "crypto/packet_cipher.hpp"
#include "crypto/random_token.hpp"
#include "net/verification_client.hpp"

#include "spdlog/spdlog.h"

namespace masterlist::registry {

namespace {

RegistrationResult failure(RegistrationError error, const char *message) {
    RegistrationResult result;
    result.error = error;
    result.message = message;
    return result;
}

} // namespace

const char *ToString(RegistrationError error) {
    switch (error) {
        case RegistrationError::None:
            return "none";
        case RegistrationError::VerificationTimedOut:
            return "verification timed out";
        case RegistrationError::StoreUnavailable:
            return "store unavailable";
        case RegistrationError::Internal:
            return "internal";
    }
    return "unknown";
}

RegistrationHandler::RegistrationHandler(RegistryStore &store, RegistrationSettings settings)
    : store(store), config(settings) {}

RegistrationResult RegistrationHandler::registerServer(Listing listing) {
    const net::Endpoint endpoint = listing.endpoint();
    const std::string address = net::AddressKey(endpoint);

    const auto key = crypto::DecodeKey(listing.key);
    if (!key) {
        spdlog::error("RegistrationHandler: Listing for {} carries an unusable key", address);
        return failure(RegistrationError::Internal, kInternalErrorMessage);
    }

    net::VerifyOutcome outcome = net::VerifyOutcome::Failed;
    {
        net::VerificationClient client;
        if (client.connect(endpoint, *key, config.challengeUid)) {
            outcome = client.awaitChallenge(config.verificationTimeout);
        }
        client.close();
    }

    if (outcome == net::VerifyOutcome::TimedOut) {
        spdlog::info("RegistrationHandler: {} did not answer the challenge", address);
        return failure(RegistrationError::VerificationTimedOut, kVerificationTimedOutMessage);
    }
    if (outcome == net::VerifyOutcome::Failed) {
        spdlog::error("RegistrationHandler: Could not run verification against {}", address);
        return failure(RegistrationError::Internal, kInternalErrorMessage);
    }

    try {
        listing.token.reset();
        if (listing.hidden) {
            const auto previous = store.getByEndpoint(listing.ip, listing.port);
            if (previous && previous->token) {
                listing.token = previous->token;
            } else {
                listing.token = crypto::GenerateUuidV4();
            }
        }
        store.put(listing, config.serverTtl);
    } catch (const RegistryUnavailable &ex) {
        spdlog::error("RegistrationHandler: Failed to store {}: {}", address, ex.what());
        return failure(RegistrationError::StoreUnavailable, kInternalErrorMessage);
    } catch (const std::runtime_error &ex) {
        spdlog::error("RegistrationHandler: Failed to register {}: {}", address, ex.what());
        return failure(RegistrationError::Internal, kInternalErrorMessage);
    }

    spdlog::info("RegistrationHandler: Registered '{}' at {}{}", listing.name, address,
                 listing.hidden ? " (hidden)" : "");

    RegistrationResult result;
    result.token = listing.token;
    result.ip = listing.ip;
    result.port = listing.port;
    return result;
}

} // namespace masterlist::registry
