#include <catch2/catch_test_macros.hpp>

#include "platform/linux/unix_socket_client.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>
#include <vector>

using json = nlohmann::json;

namespace {

std::string tmp_socket_path() {
    return "/tmp/subflow_test_ipc_" + std::to_string(getpid()) + ".sock";
}

// Polls the non-blocking server until at least `want` lines have arrived.
std::vector<json> read_at_least(UnixSocketServer& server, int fd, size_t want) {
    std::vector<json> cmds;
    for (int i = 0; i < 200 && cmds.size() < want; ++i) {
        if (!server.read_commands(fd, cmds)) break;
        if (cmds.size() < want) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return cmds;
}

// Plain connected socket for writing bytes the JSON client would never send.
int raw_connect(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return -1;
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

} // namespace

TEST_CASE("IPC protocol", "[ipc]") {
    auto sock_path = tmp_socket_path();

    SECTION("ServerStartStop") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        REQUIRE(server.server_fd() >= 0);
        REQUIRE(std::filesystem::exists(sock_path));
        server.stop();
        REQUIRE_FALSE(std::filesystem::exists(sock_path));
    }

    SECTION("ClientConnects") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("ConnectWithoutServerFails") {
        UnixSocketClient client;
        REQUIRE_FALSE(client.connect(sock_path));
    }

    SECTION("RoundTrip") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(client.send({{"cmd", "status"}, {"task_id", "t1"}}));

        auto cmds = read_at_least(server, client_fd, 1);
        REQUIRE(cmds.size() == 1);
        REQUIRE(cmds[0]["cmd"] == "status");
        REQUIRE(cmds[0]["task_id"] == "t1");

        REQUIRE(server.send_response(client_fd, {{"status", "ok"}, {"progress", 35}}));

        json resp;
        REQUIRE(client.recv(resp, 1000));
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["progress"] == 35);

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("IllFormedUtf8IsReplacedOnTheWire") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(server.send_response(client_fd, {{"status", "ok"}, {"text", "caf\xe9"}}));

        json resp;
        REQUIRE(client.recv(resp, 1000));
        REQUIRE(resp["text"] == "caf\xEF\xBF\xBD");

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("PipelinedCommands") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        for (int i = 0; i < 5; ++i) {
            REQUIRE(client.send({{"cmd", "history"}, {"seq", i}}));
        }

        auto cmds = read_at_least(server, client_fd, 5);
        REQUIRE(cmds.size() == 5);
        for (int i = 0; i < 5; ++i) {
            REQUIRE(cmds[i]["seq"] == i);
        }

        // Replies queued back to back are read one line at a time.
        for (int i = 0; i < 5; ++i) {
            REQUIRE(server.send_response(client_fd, {{"seq", i}}));
        }
        for (int i = 0; i < 5; ++i) {
            json resp;
            REQUIRE(client.recv(resp, 1000));
            REQUIRE(resp["seq"] == i);
        }

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("MalformedLineIsDiscarded") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = raw_connect(sock_path);
        REQUIRE(raw >= 0);
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        std::string bytes = "not json\n\n{\"cmd\":\"methods\"}\n";
        REQUIRE(::send(raw, bytes.data(), bytes.size(), MSG_NOSIGNAL) ==
                static_cast<ssize_t>(bytes.size()));

        auto cmds = read_at_least(server, client_fd, 2);
        REQUIRE(cmds.size() == 2);
        REQUIRE(cmds[0].is_discarded());
        REQUIRE(cmds[1]["cmd"] == "methods");

        ::close(raw);
        server.close_client(client_fd);
        server.stop();
    }

    SECTION("PartialLineWaitsForNewline") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = raw_connect(sock_path);
        REQUIRE(raw >= 0);
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        std::string head = "{\"cmd\":";
        REQUIRE(::send(raw, head.data(), head.size(), MSG_NOSIGNAL) > 0);
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

        std::vector<json> cmds;
        REQUIRE(server.read_commands(client_fd, cmds));
        REQUIRE(cmds.empty());

        std::string tail = "\"cancel\"}\n";
        REQUIRE(::send(raw, tail.data(), tail.size(), MSG_NOSIGNAL) > 0);
        cmds = read_at_least(server, client_fd, 1);
        REQUIRE(cmds.size() == 1);
        REQUIRE(cmds[0]["cmd"] == "cancel");

        ::close(raw);
        server.close_client(client_fd);
        server.stop();
    }

    SECTION("ClientDisconnect") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        client.close();

        // Server should detect disconnect (read returns false)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        std::vector<json> cmds;
        REQUIRE_FALSE(server.read_commands(client_fd, cmds));

        server.close_client(client_fd);
        server.stop();
    }

    SECTION("RecvTimesOut") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        REQUIRE(server.accept_client() >= 0);

        json resp;
        REQUIRE_FALSE(client.recv(resp, 20));

        client.close();
        server.stop();
    }
}
