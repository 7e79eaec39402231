#include <iostream>
#include <memory>
#include <chrono>
#include <vector>
#include <sstream>
#include <iomanip>

#include "../include/quorumkv.hpp"
#include "network/tcp_transport.hpp"
#include "network/client_server.hpp"

using namespace quorumkv;
using namespace std::chrono;

class NodeCLI {
private:
    config::NodeOptions options_;
    std::shared_ptr<kv::IKvStore> store_;
    std::shared_ptr<network::TcpTransport> transport_;
    std::shared_ptr<raft::IRaftNode> node_;
    std::shared_ptr<kv::KvService> service_;
    std::unique_ptr<network::ClientServer> client_server_;
    bool running_ = true;

public:
    explicit NodeCLI(const config::NodeOptions& options)
        : options_(options)
    {
        store_ = kv::open_kv_store(options_.effective_storage_path(), options_.wal_compaction_threshold);
        transport_ = std::make_shared<network::TcpTransport>(options_.id,
            options_.effective_listen_address(), options_);
        node_ = raft::create_raft_node(options_, transport_, store_);
        service_ = std::make_shared<kv::KvService>(node_, store_,
            milliseconds(options_.proposal_timeout_ms));
        client_server_ = std::make_unique<network::ClientServer>(options_.id,
            options_.effective_client_address(), service_, options_);
    }

    void start_node() {
        std::cout << "\nStarting node " << options_.id << " on " << options_.effective_listen_address()
            << " (data: " << options_.effective_storage_path() << ")" << std::endl;

        transport_->start();
        node_->start();
        client_server_->start();

        std::cout << "Node started!" << std::endl;
    }

    void stop_node() {
        std::cout << "\nStopping node..." << std::endl;
        client_server_->stop();
        transport_->stop();
        node_->stop();
        std::cout << "Node stopped!" << std::endl;
    }

    void print_status() {
        node_->print_status();
        std::cout << "Peers: ";
        for (uint64_t id : transport_->peers().ids()) {
            std::string address;
            if (transport_->peers().lookup(id, address)) {
                std::cout << id << "=" << address << " ";
            }
        }
        std::cout << std::endl;
    }

    void print_kv_store() {
        std::cout << "\n KV STORE CONTENTS:" << std::endl;
        std::cout << "-----------------------" << std::endl;
        store_->print_all();
    }

    void send_command(const std::string& cmd_line) {
        std::istringstream iss(cmd_line);
        std::string cmd, key, value;
        iss >> cmd >> key;

        if (key.empty()) {
            std::cout << "Usage: " << cmd << " <key>" << (cmd == "get" || cmd == "del" ? "" : " <value>") << std::endl;
            return;
        }

        if (cmd == "get") {
            try {
                kv::GetResponse response = service_->get(key);
                if (response.found) {
                    std::cout << key << " = " << response.value << std::endl;
                }
                else {
                    std::cout << "Key not found: " << key << std::endl;
                }
            }
            catch (const storage::StorageError& e) {
                std::cout << "GET failed: " << e.what() << std::endl;
            }
        }
        else if (cmd == "put" || cmd == "set") {
            iss >> value;
            if (value.empty()) {
                std::cout << "Usage: set <key> <value>" << std::endl;
                return;
            }
            kv::SetResponse response = service_->set(key, value);
            if (response.success) {
                std::cout << "SET " << key << " = " << value << std::endl;
            }
            else {
                std::cout << "SET failed: " << response.error << std::endl;
            }
        }
        else if (cmd == "del" || cmd == "delete") {
            kv::SetResponse response = service_->remove(key);
            if (response.success) {
                std::cout << "Key deleted: " << key << std::endl;
            }
            else {
                std::cout << "DELETE failed: " << response.error << std::endl;
            }
        }
    }

    void change_membership(const std::string& cmd_line) {
        std::istringstream iss(cmd_line);
        std::string cmd, id_text, address;
        iss >> cmd >> id_text >> address;

        uint64_t id = 0;
        try {
            id = std::stoull(id_text);
        }
        catch (const std::exception&) {
            id = 0;
        }
        if (id == 0 || (cmd == "add" && address.empty())) {
            std::cout << "Usage: add <id> <host:port> | remove <id>" << std::endl;
            return;
        }

        raft::ProposeStatus status;
        milliseconds timeout(options_.proposal_timeout_ms);
        if (cmd == "add") {
            try {
                std::string host;
                uint16_t port = 0;
                config::parse_address(address, host, port);
            }
            catch (const std::invalid_argument& e) {
                std::cout << e.what() << std::endl;
                return;
            }
            status = node_->add_node(id, address, timeout);
        }
        else {
            status = node_->remove_node(id, timeout);
        }

        std::cout << (cmd == "add" ? "ADD " : "REMOVE ") << id << ": "
            << raft::propose_status_to_string(status) << std::endl;
    }

    void run() {
        std::cout << " QUORUMKV NODE - CLI" << std::endl;

        start_node();

        while (running_) {
            std::cout << "\n Commands: status | kv | set <k> <v> | get <k> | del <k> | add <id> <addr> | remove <id> | help | exit" << std::endl;
            std::cout << "> ";

            std::string input;
            if (!std::getline(std::cin, input)) break;

            if (input.empty()) continue;

            std::istringstream iss(input);
            std::string cmd;
            iss >> cmd;

            if (cmd == "exit" || cmd == "quit") {
                running_ = false;
            }
            else if (cmd == "status") {
                print_status();
            }
            else if (cmd == "kv") {
                print_kv_store();
            }
            else if (cmd == "help") {
                print_help();
            }
            else if (cmd == "set" || cmd == "put" || cmd == "get" || cmd == "del" || cmd == "delete") {
                send_command(input);
            }
            else if (cmd == "add" || cmd == "remove") {
                change_membership(input);
            }
            else {
                std::cout << "Unknown command. Type 'help' for commands." << std::endl;
            }

            if (node_->get_lifecycle() == raft::Lifecycle::STOPPED) {
                std::cerr << "Node stopped after a storage failure" << std::endl;
                running_ = false;
            }
        }

        stop_node();
    }

    void print_help() {
        std::cout << "\nAVAILABLE COMMANDS:" << std::endl;
        std::cout << "------------------------" << std::endl;
        std::cout << std::left;
        std::cout << std::setw(20) << "status" << "- Show node status" << std::endl;
        std::cout << std::setw(20) << "kv" << "- Show local KV store contents" << std::endl;
        std::cout << std::setw(20) << "set k v" << "- Set key (waits for commit)" << std::endl;
        std::cout << std::setw(20) << "get k" << "- Get value from the local store" << std::endl;
        std::cout << std::setw(20) << "del k" << "- Delete key" << std::endl;
        std::cout << std::setw(20) << "add id host:port" << "- Add a node to the cluster" << std::endl;
        std::cout << std::setw(20) << "remove id" << "- Remove a node from the cluster" << std::endl;
        std::cout << std::setw(20) << "help" << "- Show this help" << std::endl;
        std::cout << std::setw(20) << "exit" << "- Exit program" << std::endl;
    }
};

int main(int argc, char* argv[]) {
    config::NodeOptions options;
    try {
        options = config::NodeOptions::from_args(argc, argv);
    }
    catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << config::usage(argc > 0 ? argv[0] : "quorumkv_node") << std::endl;
        return 2;
    }

    try {
        NodeCLI cli(options);
        cli.run();
    }
    catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
