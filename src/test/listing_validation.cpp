#include <gtest/gtest.h>

#include "registry/listing_validation.hpp"

using namespace masterlist;
using namespace masterlist::registry;

namespace {

constexpr const char *kKey = "AQIDBAUGBwgJCgsMDQ4PEA==";

VersionCatalog catalog() {
    VersionInfo current;
    current.name = "1.0.0";
    current.supported = true;
    current.checksumsEnabled = true;
    current.checksums = {111, 222};

    VersionInfo legacy;
    legacy.name = "0.9.0";
    legacy.supported = false;
    return VersionCatalog({current, legacy});
}

json::Value validBody() {
    return json::Value{
        {"name", "Friday Night"},
        {"description", "casual games"},
        {"map", "mp_rr_box"},
        {"version", "1.0.0"},
        {"numPlayers", 4},
        {"maxPlayers", 16},
        {"checksum", 111},
        {"port", 37015},
        {"playlist", "survival_dev"},
        {"key", kKey}
    };
}

RequestOrigin origin() {
    return RequestOrigin{"203.0.113.7", "DE"};
}

std::string errorFor(const json::Value &body) {
    return ValidateRegistration(body, origin(), catalog()).error;
}

} // namespace

TEST(ListingValidation, AcceptsValidBody) {
    const ValidationResult result = ValidateRegistration(validBody(), origin(), catalog());
    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.listing.ip, "203.0.113.7");
    EXPECT_EQ(result.listing.port, 37015);
    EXPECT_EQ(result.listing.playerCount, 4);
    EXPECT_EQ(result.listing.region, "DE");
    EXPECT_FALSE(result.listing.hasPassword);
    EXPECT_FALSE(result.listing.hidden);
    EXPECT_FALSE(result.listing.token.has_value());
}

TEST(ListingValidation, RequiredFields) {
    for (const char *field : {"name", "map", "version", "playlist", "key"}) {
        json::Value body = validBody();
        body.erase(field);
        EXPECT_EQ(errorFor(body), "Missing required fields.") << field;
    }
    json::Value empty = validBody();
    empty["name"] = "";
    EXPECT_EQ(errorFor(empty), "Missing required fields.");
}

TEST(ListingValidation, NameRules) {
    json::Value body = validBody();
    body["name"] = std::string(257, 'a');
    EXPECT_EQ(errorFor(body), "Name must be between 1 and 256 characters.");

    // 256 two-byte characters are still 256 characters.
    std::string wide;
    for (int i = 0; i < 256; ++i) {
        wide += "\xC3\xA9";
    }
    body["name"] = wide;
    EXPECT_TRUE(ValidateRegistration(body, origin(), catalog()).ok);

    for (const char *name : {"join https://example", "www.spam-site", "discord.gg/abc", "at 10.0.0.1:37015",
                             "[fe80::1] lan", "visit example.com now", "example.org/path"}) {
        body["name"] = name;
        EXPECT_EQ(errorFor(body), "Server name cannot contain URLs or invite links.") << name;
    }

    body["name"] = "Version 1.2 Fun Server";
    EXPECT_TRUE(ValidateRegistration(body, origin(), catalog()).ok);
}

TEST(ListingValidation, FieldRanges) {
    json::Value body = validBody();
    body["description"] = std::string(257, 'd');
    EXPECT_EQ(errorFor(body), "Description must be below 256 characters.");

    body = validBody();
    body["map"] = std::string(33, 'm');
    EXPECT_EQ(errorFor(body), "Map must be between 1 and 32 characters.");

    for (int maxPlayers : {0, 129}) {
        body = validBody();
        body["maxPlayers"] = maxPlayers;
        EXPECT_EQ(errorFor(body), "Max players must be between 1 and 128 players.");
    }
    body = validBody();
    body["maxPlayers"] = "128";
    EXPECT_TRUE(ValidateRegistration(body, origin(), catalog()).ok);

    for (long long port : {-1LL, 65536LL}) {
        body = validBody();
        body["port"] = port;
        EXPECT_EQ(errorFor(body), "Port must be in the range 0-65535");
    }

    body = validBody();
    body["playlist"] = "survival-dev";
    EXPECT_EQ(errorFor(body), "Playlist must be composed of latin letters, numbers, and underscores.");

    body = validBody();
    body["key"] = "c2hvcnQ=";
    EXPECT_EQ(errorFor(body), "Invalid encryption key.");
}

TEST(ListingValidation, RequiresClientIp) {
    const ValidationResult result = ValidateRegistration(validBody(), RequestOrigin{"", "XX"}, catalog());
    EXPECT_EQ(result.error, "Couldn't retrieve an IP address.");
}

TEST(ListingValidation, PasswordAndMods) {
    json::Value body = validBody();
    body["password"] = "hunter2";
    body["enabledMods"] = R"([{"id": "m1", "name": "Mod"}, {"id": "m2", "name": "Other"}])";
    const ValidationResult result = ValidateRegistration(body, origin(), catalog());
    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_TRUE(result.listing.hasPassword);
    EXPECT_EQ(result.listing.password, "hunter2");
    EXPECT_EQ(result.listing.enabledMods.size(), 2u);
    EXPECT_EQ(result.listing.requiredMods, (std::vector<std::string>{"m1", "m2"}));
}

TEST(ListingValidation, VersionAndChecksum) {
    json::Value body = validBody();
    body["version"] = "0.9.0";
    EXPECT_EQ(errorFor(body), "Please update to the latest version of the SDK to host a public server.");

    // Hidden servers may run unsupported versions.
    body["hidden"] = true;
    EXPECT_TRUE(ValidateRegistration(body, origin(), catalog()).ok);

    body = validBody();
    body["checksum"] = 333;
    EXPECT_EQ(errorFor(body),
              "Your remote functions checksum does not match the server checksum.\nChecksum: 333\nVersion: 1.0.0");
}

TEST(ListingValidation, IntegerFieldsRejectOutOfRangeNumbers) {
    const json::Value body = json::Parse(R"({
        "huge": 1e30,
        "tiny": -1e300,
        "edge": 9223372036854775808.0,
        "unsigned": 18446744073709551615,
        "max": 9223372036854775807,
        "whole": 42.0,
        "fraction": 4.5,
        "text": "99999999999999999999"
    })");
    EXPECT_FALSE(ReadIntegerField(body, "huge").has_value());
    EXPECT_FALSE(ReadIntegerField(body, "tiny").has_value());
    EXPECT_FALSE(ReadIntegerField(body, "edge").has_value());
    EXPECT_FALSE(ReadIntegerField(body, "unsigned").has_value());
    EXPECT_EQ(ReadIntegerField(body, "max").value_or(0), 9223372036854775807LL);
    EXPECT_EQ(ReadIntegerField(body, "whole").value_or(0), 42);
    EXPECT_FALSE(ReadIntegerField(body, "fraction").has_value());
    EXPECT_FALSE(ReadIntegerField(body, "text").has_value());
}

TEST(ListingValidation, HugeNumbersInRegistration) {
    json::Value body = validBody();
    body["port"] = json::Parse("1e30");
    EXPECT_EQ(errorFor(body), "Port must be in the range 0-65535");

    body = validBody();
    body["maxPlayers"] = json::Parse("-1e300");
    EXPECT_EQ(errorFor(body), "Max players must be between 1 and 128 players.");

    // An unrepresentable checksum never wraps into a negative value.
    body = validBody();
    body["checksum"] = json::Parse("18446744073709551615");
    EXPECT_EQ(errorFor(body),
              "Your remote functions checksum does not match the server checksum.\nChecksum: 0\nVersion: 1.0.0");
}
