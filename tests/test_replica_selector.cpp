#include <catch2/catch_test_macros.hpp>
#include "db/replica_selector.hpp"

#include <set>
#include <stdexcept>

using namespace paydb;

TEST_CASE("ReplicaSelector: empty candidate list means no override", "[replica]") {
    ReplicaSelector random;
    CHECK_FALSE(random.select({}).has_value());

    ReplicaSelector pinned(ReplicaSelectionMode::PINNED, 4);
    CHECK_FALSE(pinned.select({}).has_value());
}

TEST_CASE("ReplicaSelector: random choice stays within the candidates", "[replica]") {
    const std::vector<std::string> candidates = {"host=r1", "host=r2", "host=r3"};
    ReplicaSelector selector;

    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        const auto chosen = selector.select(candidates);
        REQUIRE(chosen.has_value());
        seen.insert(*chosen);
    }
    CHECK(seen.size() > 1);
    for (const auto& s : seen) {
        CHECK((s == "host=r1" || s == "host=r2" || s == "host=r3"));
    }
}

TEST_CASE("ReplicaSelector: single candidate is always chosen", "[replica]") {
    ReplicaSelector selector;
    CHECK(selector.select({"host=only"}) == std::optional<std::string>("host=only"));
}

TEST_CASE("ReplicaSelector: pinned index", "[replica]") {
    const std::vector<std::string> candidates = {"host=r1", "host=r2"};

    CHECK(ReplicaSelector(ReplicaSelectionMode::PINNED, 1).select(candidates) ==
          std::optional<std::string>("host=r2"));
    CHECK_THROWS_AS(ReplicaSelector(ReplicaSelectionMode::PINNED, 2).select(candidates),
                    std::out_of_range);
}

TEST_CASE("ReplicaSelector: built from config", "[replica]") {
    ReplicaSelectionConfig config;
    config.mode = ReplicaSelectionMode::PINNED;
    config.pinned_index = 0;
    config.available_maindb_replicas = {"host=a", "host=b"};

    const auto selector = ReplicaSelector::from_config(config);
    CHECK(selector.mode() == ReplicaSelectionMode::PINNED);
    CHECK(selector.select(config.available_maindb_replicas) == std::optional<std::string>("host=a"));
    CHECK(std::string(replica_selection_mode_to_string(selector.mode())) == "pinned");
}
