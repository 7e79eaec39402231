#include <gtest/gtest.h>
#include "../../src/network/client_server.hpp"
#include "../../src/network/kv_client.hpp"
#include "../../src/network/socket_io.hpp"
#include "../../src/network/tcp_transport.hpp"
#include "../../src/storage/record_log.hpp"
#include "../utils/test_utils.hpp"
#include <unistd.h>

using namespace quorumkv;
using quorumkv::test::TempDir;
using quorumkv::test::freePort;
using quorumkv::test::loopback;
using quorumkv::test::makeOptions;
using quorumkv::test::waitFor;

// Single node cluster with its client endpoint on loopback
class ClientServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::map<uint64_t, std::string> peers = { { 1, loopback(freePort()) } };
        options = makeOptions(1, peers, dir.sub("node_1"));
        options.client_address = loopback(freePort());
        options.validate();

        store = kv::open_kv_store(options.effective_storage_path());
        transport = std::make_shared<network::TcpTransport>(1, options.effective_listen_address(), options);
        node = raft::create_raft_node(options, transport, store);
        service = std::make_shared<kv::KvService>(node, store,
            std::chrono::milliseconds(options.proposal_timeout_ms));
        server = std::make_unique<network::ClientServer>(1, options.effective_client_address(), service, options);

        transport->start();
        node->start();
        server->start();
        ASSERT_TRUE(waitFor([&] { return node->is_leader(); }));
    }

    void TearDown() override {
        server->stop();
        transport->stop();
        node->stop();
    }

    TempDir dir;
    config::NodeOptions options;
    std::shared_ptr<kv::IKvStore> store;
    std::shared_ptr<network::TcpTransport> transport;
    std::shared_ptr<raft::IRaftNode> node;
    std::shared_ptr<kv::KvService> service;
    std::unique_ptr<network::ClientServer> server;
};

TEST_F(ClientServerTest, SetGetDeleteOverSocket) {
    network::KvClient client(options.effective_client_address());

    network::ClientResponse response = client.set("alpha", "one two");
    ASSERT_TRUE(response.success) << response.error;

    response = client.get("alpha");
    EXPECT_TRUE(response.success);
    EXPECT_TRUE(response.found);
    EXPECT_EQ(response.value, "one two");

    // Writes through the endpoint land in the replicated store
    EXPECT_EQ(service->get("alpha").value, "one two");

    response = client.remove("alpha");
    EXPECT_TRUE(response.success) << response.error;
    response = client.get("alpha");
    EXPECT_TRUE(response.success);
    EXPECT_FALSE(response.found);
}

TEST_F(ClientServerTest, RejectsBadRequestsAndKeepsServing) {
    network::KvClient client(options.effective_client_address());

    network::ClientResponse response = network::decode_response(client.round_trip(std::string(1, '\xff')));
    EXPECT_FALSE(response.success);
    EXPECT_NE(response.error.find("malformed request"), std::string::npos);

    response = client.request(network::ClientRequest{ "increment", "k", "" });
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.error, "unknown op 'increment'");

    response = client.set("", "v");
    EXPECT_FALSE(response.success);

    // Same connection still works
    ASSERT_TRUE(client.set("k", "v").success);
    EXPECT_EQ(client.get("k").value, "v");
}

TEST_F(ClientServerTest, OversizedFrameClosesConnection) {
    std::string error;
    int fd = network::connect_with_timeout(options.effective_client_address(), 1000, error);
    ASSERT_GE(fd, 0) << error;
    network::set_io_timeout(fd, SO_RCVTIMEO, 2000);

    const char header[4] = { '\x7f', '\xff', '\xff', '\xff' };
    ASSERT_TRUE(network::send_all(fd, header, sizeof(header)));
    char byte;
    EXPECT_EQ(network::recv_exact(fd, &byte, 1), 0);
    close(fd);

    network::KvClient client(options.effective_client_address());
    EXPECT_TRUE(client.set("after", "1").success);
}

TEST_F(ClientServerTest, StoppedServerIsUnreachable) {
    network::KvClient client(options.effective_client_address(), 500);
    ASSERT_TRUE(client.set("k", "v").success);

    server->stop();
    EXPECT_THROW(client.get("k"), std::runtime_error);
}
