#pragma once

#include "common/clock.hpp"
#include "common/scheduler.hpp"
#include "crypto/packet_cipher.hpp"
#include "net/challenge_protocol.hpp"
#include "net/endpoint.hpp"
#include "net/verification_client.hpp"
#include "presence/presence_sink.hpp"
#include "presence/presence_tracker.hpp"
#include "registry/listing.hpp"
#include "registry/listing_validation.hpp"
#include "registry/memory_backend.hpp"
#include "registry/registration_handler.hpp"
#include "registry/registry_store.hpp"
#include "registry/version_catalog.hpp"
#include "server/server_api.hpp"
