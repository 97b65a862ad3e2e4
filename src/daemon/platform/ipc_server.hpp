#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

class IpcServer {
public:
    virtual ~IpcServer() = default;
    virtual bool start(const std::string& endpoint) = 0;
    virtual void stop() = 0;
    virtual int server_fd() const = 0;
    virtual int accept_client() = 0;

    // Appends every complete request line received so far. A line that is
    // not valid JSON is appended as a discarded value. Returns false once
    // the peer has gone away.
    virtual bool read_commands(int client_fd, std::vector<nlohmann::json>& cmds) = 0;

    virtual bool send_response(int client_fd, const nlohmann::json& response) = 0;
    virtual void close_client(int client_fd) = 0;
};
