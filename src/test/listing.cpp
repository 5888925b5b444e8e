#include <gtest/gtest.h>

#include "registry/listing.hpp"

using namespace masterlist;
using namespace masterlist::registry;

namespace {

Listing sampleListing() {
    Listing listing;
    listing.ip = "203.0.113.7";
    listing.port = 37015;
    listing.name = "Friday Night";
    listing.description = "casual";
    listing.map = "mp_rr_box";
    listing.playlist = "survival_dev";
    listing.playerCount = 3;
    listing.maxPlayers = 16;
    listing.version = "1.0.0";
    listing.checksum = -123456789012LL;
    listing.region = "DE";
    listing.key = "AQIDBAUGBwgJCgsMDQ4PEA==";
    listing.requiredMods = {"core"};
    listing.enabledMods = {ModInfo{"core", "Core", "team", "1.2", "ts-1", "base"}};
    return listing;
}

} // namespace

TEST(Listing, StorageFieldsAreStrings) {
    Listing listing = sampleListing();
    listing.hasPassword = true;
    listing.password = "hunter2";
    listing.token = "tok";

    const StorageFields fields = ToStorageFields(listing);
    EXPECT_EQ(fields.at("port"), "37015");
    EXPECT_EQ(fields.at("hidden"), "false");
    EXPECT_EQ(fields.at("hasPassword"), "true");
    EXPECT_EQ(fields.at("password"), "hunter2");
    EXPECT_EQ(fields.at("playerCount"), "3");
    EXPECT_EQ(fields.at("numPlayers"), "3");
    EXPECT_EQ(fields.at("checksum"), "-123456789012");
    EXPECT_EQ(fields.at("requiredMods"), R"(["core"])");
    EXPECT_EQ(fields.at("token"), "tok");

    const auto mods = json::Parse(fields.at("enabledMods"));
    ASSERT_EQ(mods.size(), 1u);
    EXPECT_EQ(mods[0]["thunderstore_id"], "ts-1");
}

TEST(Listing, PasswordOnlyStoredWhenProtected) {
    const StorageFields fields = ToStorageFields(sampleListing());
    EXPECT_EQ(fields.count("password"), 0u);
    EXPECT_EQ(fields.count("token"), 0u);
}

TEST(Listing, StorageRoundTrip) {
    Listing listing = sampleListing();
    listing.hidden = true;
    listing.hasPassword = true;
    listing.password = "pw";
    listing.token = "abc";

    const Listing restored = FromStorageFields(ToStorageFields(listing));
    EXPECT_EQ(restored.ip, listing.ip);
    EXPECT_EQ(restored.port, listing.port);
    EXPECT_EQ(restored.name, listing.name);
    EXPECT_EQ(restored.checksum, listing.checksum);
    EXPECT_TRUE(restored.hidden);
    EXPECT_TRUE(restored.hasPassword);
    EXPECT_EQ(restored.password, "pw");
    ASSERT_TRUE(restored.token.has_value());
    EXPECT_EQ(*restored.token, "abc");
    EXPECT_EQ(restored.requiredMods, listing.requiredMods);
    EXPECT_EQ(restored.enabledMods, listing.enabledMods);
}

TEST(Listing, LenientParsingOfStoredFields) {
    StorageFields fields;
    fields["ip"] = "198.51.100.1";
    fields["name"] = "old entry";
    fields["playerCount"] = "many";
    fields["hasPassword"] = "true";
    fields["enabledMods"] = R"([{"id": "a", "name": "A"}])";

    const Listing listing = FromStorageFields(fields);
    EXPECT_EQ(listing.port, kDefaultListingPort);
    EXPECT_EQ(listing.playerCount, 0);
    EXPECT_EQ(listing.region, "XX");
    // hasPassword follows the stored password, not the stored flag.
    EXPECT_FALSE(listing.hasPassword);
    EXPECT_EQ(listing.requiredMods, (std::vector<std::string>{"a"}));
}

TEST(Listing, JsonForms) {
    Listing listing = sampleListing();
    listing.hasPassword = true;
    listing.password = "secret";

    const json::Value real = ToJson(listing, true);
    EXPECT_EQ(real["port"], 37015);
    EXPECT_EQ(real["hidden"], false);
    EXPECT_EQ(real["hasPassword"], true);
    EXPECT_EQ(real["numPlayers"], 3);
    EXPECT_EQ(real["checksum"], -123456789012LL);
    EXPECT_TRUE(real["requiredMods"].is_array());
    EXPECT_EQ(real["password"], "");

    const json::Value strings = ToJson(listing, false);
    EXPECT_EQ(strings["port"], "37015");
    EXPECT_EQ(strings["hidden"], "false");
    EXPECT_EQ(strings["hasPassword"], "true");
    EXPECT_EQ(strings["numPlayers"], "3");
    EXPECT_EQ(strings["requiredMods"], R"(["core"])");
    EXPECT_EQ(strings["password"], "");
}

TEST(Listing, NormalizeMods) {
    const auto required = NormalizeRequiredMods(json::Parse(R"([" a ", "", 5, "b", "a"])"));
    EXPECT_EQ(required, (std::vector<std::string>{"a", "b"}));

    const auto fromString = NormalizeRequiredMods(json::Value(R"(["x"])"));
    EXPECT_EQ(fromString, (std::vector<std::string>{"x"}));
    EXPECT_TRUE(NormalizeRequiredMods(json::Value("not json")).empty());
    EXPECT_TRUE(NormalizeRequiredMods(json::Value(42)).empty());

    const auto enabled = NormalizeEnabledMods(json::Parse(R"([
        {"id": " m1 ", "name": " Mod One ", "thunderstore_id": "t1"},
        {"id": "m2"},
        {"id": "m1", "name": "Duplicate"},
        "m3"
    ])"));
    ASSERT_EQ(enabled.size(), 1u);
    EXPECT_EQ(enabled[0].id, "m1");
    EXPECT_EQ(enabled[0].name, "Mod One");
    EXPECT_EQ(enabled[0].thunderstoreId, "t1");
    EXPECT_EQ(enabled[0].author, "");
}
