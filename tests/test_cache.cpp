// Copyright 2026 The ttsync Authors
// SPDX-License-Identifier: Apache-2.0
#include <doctest.h>
#include <ttsync.h>

#include "memory_sink.h"

using namespace ttsync;
using ttsync_test::MemorySink;

namespace {

SyncConfig config_for(std::vector<std::string> key) {
    SyncConfig c;
    c.natural_key = std::move(key);
    c.as_of = parse_date("2024-03-01");
    return c;
}

Row item(const char* code, std::int64_t qty) {
    return Row{{"code", std::string(code)}, {"qty", qty}};
}

} // namespace

TEST_CASE("cache: empty target") {
    MemorySink sink;
    auto cache = VersionCache::build(sink, config_for({"code"}));
    CHECK(cache.empty());
    CHECK(sink.scan_calls == 1);
}

TEST_CASE("cache: holds digest and id of current versions only") {
    MemorySink sink;
    auto old_id = sink.seed(item("A", 1), parse_date("2023-01-01"), parse_date("2023-06-01"));
    auto cur_a = sink.seed(item("A", 2), parse_date("2023-06-01"));
    auto cur_b = sink.seed(item("B", 5), parse_date("2023-01-01"));

    auto config = config_for({"code"});
    auto cache = VersionCache::build(sink, config);
    REQUIRE(cache.size() == 2);

    const auto* a = cache.find(encode_key(item("A", 0), config.natural_key));
    REQUIRE(a != nullptr);
    CHECK(a->id == cur_a);
    CHECK(a->id != old_id);
    CHECK(a->digest == hash_row(item("A", 2), config.system_columns));

    const auto* b = cache.find(encode_key(item("B", 0), config.natural_key));
    REQUIRE(b != nullptr);
    CHECK(b->id == cur_b);

    CHECK(cache.find(encode_key(item("C", 0), config.natural_key)) == nullptr);
}

TEST_CASE("cache: honours a custom open valid_to") {
    MemorySink sink;
    auto open = parse_date("9999-12-31");
    sink.seed(item("A", 1), parse_date("2023-01-01"), open);
    sink.seed(item("B", 1), parse_date("2023-01-01"));  // default sentinel

    auto config = config_for({"code"});
    config.sentinel_valid_to = open;
    auto cache = VersionCache::build(sink, config);
    CHECK(cache.size() == 1);
    CHECK(cache.find(encode_key(item("A", 0), config.natural_key)) != nullptr);
}

TEST_CASE("cache: two current versions of one key is fatal") {
    MemorySink sink;
    sink.seed(item("A", 1), parse_date("2023-01-01"));
    sink.seed(item("A", 2), parse_date("2023-02-01"));

    try {
        VersionCache::build(sink, config_for({"code"}));
        FAIL("expected DuplicateCurrentKey");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::DuplicateCurrentKey);
        // Both versions are named by digest.
        SystemColumns sys;
        std::string msg = e.what();
        CHECK(msg.find(to_hex(hash_row(item("A", 1), sys))) != std::string::npos);
        CHECK(msg.find(to_hex(hash_row(item("A", 2), sys))) != std::string::npos);
    }
}

TEST_CASE("cache: composite natural key") {
    MemorySink sink;
    sink.seed(Row{{"plant", std::string("P1")}, {"code", std::string("A")}},
              parse_date("2023-01-01"));
    sink.seed(Row{{"plant", std::string("P2")}, {"code", std::string("A")}},
              parse_date("2023-01-01"));

    auto cache = VersionCache::build(sink, config_for({"plant", "code"}));
    CHECK(cache.size() == 2);
}

TEST_CASE("cache: stored row missing a key column is fatal") {
    MemorySink sink;
    sink.seed(Row{{"qty", std::int64_t{1}}}, parse_date("2023-01-01"));

    CHECK_THROWS_AS(VersionCache::build(sink, config_for({"code"})), Error);
}

TEST_CASE("cache: manual insert rejects duplicates") {
    VersionCache cache;
    cache.insert("k", CacheEntry{Digest{}, 1});
    CHECK_THROWS_AS(cache.insert("k", CacheEntry{Digest{}, 2}), Error);
    CHECK(cache.size() == 1);
    CHECK(cache.find("k")->id == 1);
}
