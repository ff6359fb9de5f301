// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "network/network_manager.hpp"
#include "network/peer_config.hpp"
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>

using namespace peerlink::network;
using json = nlohmann::json;

namespace {

// Temporary file removed on scope exit
class TempFile {
public:
    explicit TempFile(const std::string& contents) {
        path_ = (std::filesystem::temp_directory_path() /
                 ("peerlink_config_" + std::to_string(reinterpret_cast<uintptr_t>(this)) +
                  ".json"))
                    .string();
        std::ofstream out(path_);
        out << contents;
    }
    ~TempFile() { std::remove(path_.c_str()); }
    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace

TEST_CASE("PeerConfig defaults", "[config]") {
    PeerConfig config;
    CHECK(config.max_stream_count == 8);
    CHECK(config.message_queue_size == 1024);
    CHECK(config.dedup_capacity == 100000);
    CHECK(config.dedup_false_positive_rate == 0.001);
    CHECK(config.min_write_timeout == std::chrono::milliseconds(1000));
    CHECK(config.write_bytes_per_second == 5120);
    CHECK(config.validate().empty());
}

TEST_CASE("PeerConfig validation", "[config]") {
    PeerConfig config;

    SECTION("Zero stream cap") {
        config.max_stream_count = 0;
        CHECK_FALSE(config.validate().empty());
    }
    SECTION("Zero queue") {
        config.message_queue_size = 0;
        CHECK_FALSE(config.validate().empty());
    }
    SECTION("False-positive rate out of range") {
        config.dedup_false_positive_rate = 1.5;
        CHECK_FALSE(config.validate().empty());
    }
    SECTION("Zero throughput floor") {
        config.write_bytes_per_second = 0;
        CHECK_FALSE(config.validate().empty());
    }
}

TEST_CASE("PeerConfig labels", "[config]") {
    PeerConfig config;
    config.peer_labels["QmNodeOne"] = "node01";

    CHECK(config.label_for("QmNodeOne") == "node01");
    CHECK(config.label_for("QmUnknown") == "QmUnknown");
}

TEST_CASE("PeerConfig JSON", "[config]") {
    SECTION("Missing keys keep defaults") {
        json j = json::parse(R"({"max_stream_count": 4, "min_write_timeout_ms": 250})");
        PeerConfig config = j.get<PeerConfig>();
        CHECK(config.max_stream_count == 4);
        CHECK(config.min_write_timeout == std::chrono::milliseconds(250));
        CHECK(config.message_queue_size == 1024);
        CHECK(config.peer_labels.empty());
    }

    SECTION("Labels survive a round trip") {
        PeerConfig config;
        config.peer_labels["QmNodeOne"] = "node01";
        config.dedup_capacity = 42;

        json j = config;
        PeerConfig back = j.get<PeerConfig>();
        CHECK(back.dedup_capacity == 42);
        CHECK(back.label_for("QmNodeOne") == "node01");
    }
}

TEST_CASE("LoadPeerConfig", "[config]") {
    SECTION("Valid file") {
        TempFile file(R"({"message_queue_size": 16, "peer_labels": {"a": "node-a"}})");
        auto config = LoadPeerConfig(file.path());
        REQUIRE(config.has_value());
        CHECK(config->message_queue_size == 16);
        CHECK(config->label_for("a") == "node-a");
    }

    SECTION("Malformed JSON") {
        TempFile file("{ not json");
        CHECK_FALSE(LoadPeerConfig(file.path()).has_value());
    }

    SECTION("Invalid values") {
        TempFile file(R"({"dedup_capacity": 0})");
        CHECK_FALSE(LoadPeerConfig(file.path()).has_value());
    }

    SECTION("Missing file") {
        CHECK_FALSE(LoadPeerConfig("/nonexistent/peerlink.json").has_value());
    }
}

TEST_CASE("NetworkManager config JSON", "[config]") {
    TempFile file(R"({
        "chain_id": 7,
        "node_id": "node-a",
        "listen_enabled": true,
        "io_threads": 3,
        "connect_timeout_ms": 500,
        "peer": {"max_stream_count": 2}
    })");

    auto config = LoadNetworkConfig(file.path());
    REQUIRE(config.has_value());
    CHECK(config->chain_id == 7u);
    CHECK(config->node_id == "node-a");
    CHECK(config->listen_enabled);
    CHECK(config->io_threads == 3);
    CHECK(config->connect_timeout == std::chrono::milliseconds(500));
    CHECK(config->peer.max_stream_count == 2);
    CHECK(config->peer.message_queue_size == 1024);

    SECTION("node_id is required") {
        TempFile missing_id(R"({"chain_id": 7})");
        CHECK_FALSE(LoadNetworkConfig(missing_id.path()).has_value());
    }
}
