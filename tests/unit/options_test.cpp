#include <gtest/gtest.h>
#include <fstream>
#include "../../include/quorumkv/config/options.hpp"
#include "../utils/test_utils.hpp"

using namespace quorumkv::config;
using quorumkv::test::TempDir;

namespace {

    NodeOptions parse(std::vector<std::string> args) {
        args.insert(args.begin(), "quorumkv_node");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(&arg[0]);
        }
        return NodeOptions::from_args(static_cast<int>(argv.size()), argv.data());
    }

}

TEST(OptionsTest, PositionalPeersGetSequentialIds) {
    NodeOptions options = parse({ "2", "127.0.0.1:5001,127.0.0.1:5002,127.0.0.1:5003" });

    EXPECT_EQ(options.id, 2u);
    ASSERT_EQ(options.peers.size(), 3u);
    EXPECT_EQ(options.peers.at(3), "127.0.0.1:5003");
    EXPECT_EQ(options.effective_listen_address(), "127.0.0.1:5002");
    EXPECT_EQ(options.effective_storage_path(), "data_2");
    EXPECT_EQ(options.tick_interval_ms, 100u);
    EXPECT_EQ(options.snapshot_threshold, 1000u);
}

TEST(OptionsTest, ExplicitIdsAndDataDir) {
    NodeOptions options = parse({ "10", "10=hostA:6000,20=hostB:6000", "--data-dir", "/tmp/x" });

    EXPECT_EQ(options.peers.at(10), "hostA:6000");
    EXPECT_EQ(options.peers.at(20), "hostB:6000");
    EXPECT_EQ(options.effective_storage_path(), "/tmp/x");
}

TEST(OptionsTest, RejectsBadArguments) {
    EXPECT_THROW(parse({}), std::invalid_argument);
    EXPECT_THROW(parse({ "1" }), std::invalid_argument);
    EXPECT_THROW(parse({ "0", "a:1" }), std::invalid_argument);
    EXPECT_THROW(parse({ "abc", "a:1" }), std::invalid_argument);
    EXPECT_THROW(parse({ "4", "a:1,b:2,c:3" }), std::invalid_argument);
    EXPECT_THROW(parse({ "1", "a:1,,c:3" }), std::invalid_argument);
    EXPECT_THROW(parse({ "1", "1=a:1,1=b:2" }), std::invalid_argument);
    EXPECT_THROW(parse({ "1", "nohost" }), std::invalid_argument);
    EXPECT_THROW(parse({ "1", "a:1", "extra" }), std::invalid_argument);
    EXPECT_THROW(parse({ "1", "a:1", "--bogus" }), std::invalid_argument);
    EXPECT_THROW(parse({ "1", "a:1", "--data-dir" }), std::invalid_argument);
}

TEST(OptionsTest, ParseAddress) {
    std::string host;
    uint16_t port = 0;
    parse_address("localhost:8080", host, port);
    EXPECT_EQ(host, "localhost");
    EXPECT_EQ(port, 8080);

    EXPECT_THROW(parse_address("localhost", host, port), std::invalid_argument);
    EXPECT_THROW(parse_address(":80", host, port), std::invalid_argument);
    EXPECT_THROW(parse_address("h:", host, port), std::invalid_argument);
    EXPECT_THROW(parse_address("h:0", host, port), std::invalid_argument);
    EXPECT_THROW(parse_address("h:70000", host, port), std::invalid_argument);
    EXPECT_THROW(parse_address("h:8o", host, port), std::invalid_argument);
}

TEST(OptionsTest, ConfigFileIsOverriddenByArguments) {
    TempDir dir;
    std::string path = dir.sub("node.json");
    {
        std::ofstream out(path);
        out << R"({
            "id": 1,
            "peers": { "1": "127.0.0.1:7001", "2": "127.0.0.1:7002" },
            "tick_interval_ms": 50,
            "snapshot_threshold": 200,
            "storage_path": "from_file",
            "unknown_key": true
        })";
    }

    NodeOptions options = parse({ "--config", path });
    EXPECT_EQ(options.id, 1u);
    EXPECT_EQ(options.peers.size(), 2u);
    EXPECT_EQ(options.tick_interval_ms, 50u);
    EXPECT_EQ(options.snapshot_threshold, 200u);
    EXPECT_EQ(options.effective_storage_path(), "from_file");

    options = parse({ "2", "127.0.0.1:7001,127.0.0.1:7002", "--config", path, "--data-dir", "cli_dir" });
    EXPECT_EQ(options.id, 2u);
    EXPECT_EQ(options.tick_interval_ms, 50u);
    EXPECT_EQ(options.effective_storage_path(), "cli_dir");
}

TEST(OptionsTest, BadConfigFile) {
    TempDir dir;
    EXPECT_THROW(parse({ "--config", dir.sub("missing.json") }), std::invalid_argument);

    std::string path = dir.sub("broken.json");
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(parse({ "--config", path }), std::invalid_argument);
}

TEST(OptionsTest, FromJsonAcceptsPeerString) {
    NodeOptions options;
    options.from_json(nlohmann::json::parse(R"({ "id": 3, "peers": "a:1,b:2,c:3" })"));
    options.validate();
    EXPECT_EQ(options.effective_listen_address(), "c:3");

    EXPECT_THROW(options.from_json(nlohmann::json::parse(R"({ "peers": 5 })")), std::invalid_argument);
    EXPECT_THROW(options.from_json(nlohmann::json::parse(R"({ "peers": { "x": "a:1" } })")), std::invalid_argument);
    EXPECT_THROW(options.from_json(nlohmann::json::parse(R"({ "election_tick": "ten" })")), std::invalid_argument);
    EXPECT_THROW(options.from_json(nlohmann::json::parse("[1, 2]")), std::invalid_argument);
}

TEST(OptionsTest, ValidateChecksRanges) {
    NodeOptions options;
    options.id = 1;
    options.peers = { { 1, "127.0.0.1:7001" } };
    options.validate();

    NodeOptions bad = options;
    bad.heartbeat_tick = bad.election_tick;
    EXPECT_THROW(bad.validate(), std::invalid_argument);

    bad = options;
    bad.tick_interval_ms = 0;
    EXPECT_THROW(bad.validate(), std::invalid_argument);

    bad = options;
    bad.listen_address = "0.0.0.0";
    EXPECT_THROW(bad.validate(), std::invalid_argument);

    bad = options;
    bad.max_frame_bytes = 10;
    EXPECT_THROW(bad.validate(), std::invalid_argument);
}

TEST(OptionsTest, ToJsonRoundTripsThroughFromJson) {
    NodeOptions options;
    options.id = 2;
    options.peers = { { 1, "h1:1" }, { 2, "h2:2" } };
    options.election_tick = 20;
    options.listen_address = "0.0.0.0:2";

    nlohmann::json j = options.to_json();
    EXPECT_EQ(j["peers"]["2"], "h2:2");
    EXPECT_EQ(j["storage_path"], "data_2");

    NodeOptions copy;
    copy.from_json(j);
    EXPECT_EQ(copy.id, 2u);
    EXPECT_EQ(copy.peers, options.peers);
    EXPECT_EQ(copy.election_tick, 20u);
    EXPECT_EQ(copy.effective_listen_address(), "0.0.0.0:2");
}

TEST(OptionsTest, ClientAddressFollowsListenHost) {
    NodeOptions options;
    options.id = 3;
    options.peers = { { 3, "10.0.0.7:7003" } };
    options.validate();
    EXPECT_EQ(options.effective_client_address(), "10.0.0.7:50053");

    options.client_port_base = 6000;
    EXPECT_EQ(options.effective_client_address(), "10.0.0.7:6003");

    options.client_address = "127.0.0.1:9000";
    EXPECT_EQ(options.effective_client_address(), "127.0.0.1:9000");

    NodeOptions bad = options;
    bad.client_address = "nowhere";
    EXPECT_THROW(bad.validate(), std::invalid_argument);

    bad = options;
    bad.client_address.clear();
    bad.client_port_base = 65535;
    EXPECT_THROW(bad.validate(), std::invalid_argument);

    NodeOptions copy;
    copy.from_json(nlohmann::json::parse(R"({"client_port_base": 7000})"));
    EXPECT_EQ(copy.client_port_base, 7000u);
}
