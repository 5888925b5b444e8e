#include <gtest/gtest.h>

#include "registry/memory_backend.hpp"
#include "registry/registry_store.hpp"
#include "test/test_registry.hpp"

using namespace masterlist;
using namespace masterlist::registry;
using namespace std::chrono_literals;
using masterlist::test::MakeListing;

TEST(RegistryStore, PutAndLookupByEndpoint) {
    ManualClock clock;
    MemoryBackend backend(clock);
    RegistryStore store(backend);

    store.put(MakeListing("1.2.3.4", 37015, "Alpha", 3), 30s);
    const auto found = store.getByEndpoint("1.2.3.4", 37015);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->name, "Alpha");
    EXPECT_EQ(found->playerCount, 3);
    EXPECT_FALSE(store.getByEndpoint("1.2.3.4", 37016).has_value());

    EXPECT_EQ(store.allKeys(), (std::set<std::string>{"servers:1.2.3.4:37015"}));
    EXPECT_THROW(store.put(MakeListing("", 1, "No ip"), 30s), std::invalid_argument);
}

TEST(RegistryStore, PutIsUpsertAndRestartsTtl) {
    ManualClock clock;
    MemoryBackend backend(clock);
    RegistryStore store(backend);

    store.put(MakeListing("1.2.3.4", 1, "Old"), 30s);
    clock.advance(25s);
    store.put(MakeListing("1.2.3.4", 1, "New"), 30s);
    clock.advance(25s);

    const auto all = store.listings();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].name, "New");

    clock.advance(5s);
    EXPECT_TRUE(store.listings().empty());
    EXPECT_TRUE(store.allKeys().empty());
}

TEST(RegistryStore, GetAllUsesRequestedTypes) {
    ManualClock clock;
    MemoryBackend backend(clock);
    RegistryStore store(backend);
    store.put(MakeListing("1.2.3.4", 1, "A", 2), 30s);

    const auto real = store.getAll(true);
    ASSERT_EQ(real.size(), 1u);
    EXPECT_EQ(real[0]["playerCount"], 2);

    const auto strings = store.getAll(false);
    ASSERT_EQ(strings.size(), 1u);
    EXPECT_EQ(strings[0]["playerCount"], "2");
}

TEST(RegistryStore, TokenLookup) {
    ManualClock clock;
    MemoryBackend backend(clock);
    RegistryStore store(backend);

    Listing hidden = MakeListing("5.6.7.8", 2, "Secret");
    hidden.hidden = true;
    hidden.token = "token-1";
    store.put(hidden, 30s);
    store.put(MakeListing("1.2.3.4", 1, "Public"), 30s);

    const auto found = store.getByToken("token-1");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->name, "Secret");
    EXPECT_FALSE(store.getByToken("token-2").has_value());
    EXPECT_FALSE(store.getByToken("").has_value());
}

TEST(RegistryStore, IgnoresForeignKeysUnderPrefix) {
    ManualClock clock;
    MemoryBackend backend(clock);
    RegistryStore store(backend);

    backend.writeHash("servers:garbage", {{"name", "x"}}, 30s);
    store.put(MakeListing("1.2.3.4", 1, "A"), 30s);

    EXPECT_EQ(store.allKeys().size(), 1u);
    EXPECT_EQ(store.listings().size(), 1u);
}

TEST(RegistryStore, KnownKeysAndMeta) {
    ManualClock clock;
    MemoryBackend backend(clock);
    RegistryStore store(backend);

    store.replaceKnownKeys({"servers:1.2.3.4:1"});
    EXPECT_EQ(store.knownKeys(), (std::set<std::string>{"servers:1.2.3.4:1"}));

    Listing listing = MakeListing("1.2.3.4", 1, "Alpha");
    listing.requiredMods = {"core"};
    listing.enabledMods = {ModInfo{"core", "Core", "", "", "", ""}};
    const net::Endpoint endpoint{"1.2.3.4", 1};
    store.upsertMeta(endpoint, MetaFromListing(listing));

    EXPECT_TRUE(backend.readField(kServerMetaHashKey, "1.2.3.4:1").has_value());
    const auto meta = store.getMeta(endpoint);
    ASSERT_TRUE(meta.has_value());
    EXPECT_EQ(meta->name, "Alpha");
    EXPECT_EQ(meta->map, "mp_lobby");
    EXPECT_EQ(meta->requiredMods, (std::vector<std::string>{"core"}));
    ASSERT_EQ(meta->enabledMods.size(), 1u);
    EXPECT_EQ(meta->enabledMods[0].name, "Core");

    store.removeMeta(endpoint);
    EXPECT_FALSE(store.getMeta(endpoint).has_value());

    backend.writeField(kServerMetaHashKey, "9.9.9.9:9", "not json");
    EXPECT_FALSE(store.getMeta(net::Endpoint{"9.9.9.9", 9}).has_value());
}

TEST(RegistryStore, UnavailableBackend) {
    test::FailingBackend backend;
    RegistryStore store(backend);

    EXPECT_TRUE(store.listings().empty());
    EXPECT_TRUE(store.getAll(true).empty());
    EXPECT_THROW(store.fetchListings(), RegistryUnavailable);
    EXPECT_THROW(store.allKeys(), RegistryUnavailable);
    EXPECT_THROW(store.getByToken("t"), RegistryUnavailable);
    EXPECT_THROW(store.put(MakeListing("1.2.3.4", 1, "A"), 30s), RegistryUnavailable);
}
