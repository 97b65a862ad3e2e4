#include "base64.hpp"
#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  methods                           List transcription methods");
    std::println(stderr, "  submit FILE [options] [--follow]  Transcribe one audio file");
    std::println(stderr, "  batch FILE... [options]           Transcribe several files");
    std::println(stderr, "  watch TASK                        Follow a task's progress");
    std::println(stderr, "  status [TASK]                     Show a task, or all active tasks");
    std::println(stderr, "  fetch TASK FORMAT [-o PATH]       Download srt|vtt|lrc|txt|bundle");
    std::println(stderr, "  cancel TASK                       Cancel a running task");
    std::println(stderr, "  history [--limit N]               Show finished tasks");
    std::println(stderr, "Options:");
    std::println(stderr, "  --method NAME  --formats srt,vtt  --language CODE  --model NAME");
    std::println(stderr, "  --api-url URL  --api-key KEY  --min-speech MS  --min-silence MS");
}

static void print_event(const json& ev) {
    auto type = ev.value("type", "");
    if (type == "progress") {
        std::println("[{:>3}%] {:<12} {}", ev.value("progress", 0), ev.value("step", ""),
                     ev.value("message", ""));
    } else if (type == "log") {
        std::println("       {:<12} {}", ev.value("level", "info"), ev.value("message", ""));
    } else if (type == "error") {
        std::println(stderr, "Error: {}", ev.value("message", "unknown error"));
    } else if (type == "completion") {
        const auto& result = ev.contains("result") ? ev["result"] : json::object();
        std::println("Done: {}", result.value("message", "completed"));
        if (result.contains("outputs")) {
            for (auto& [fmt, path] : result["outputs"].items()) {
                std::println("  {}: {}", fmt, path.get<std::string>());
            }
        }
        if (result.contains("files")) {
            std::println("  {} of {} files succeeded", result.value("successful_files", 0),
                         result.value("total_files", 0));
        }
    }
}

// Returns the process exit code.
static int follow(UnixSocketClient& client, const std::string& id) {
    if (!client.send({{"cmd", "subscribe"}, {"task_id", id}})) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    json response;
    if (!client.recv(response)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }
    if (response.value("status", "") == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }
    if (response.value("finished", false)) {
        const auto& snap = response.contains("task") ? response["task"] : response["batch"];
        std::println("{}", snap.dump(2));
        return snap.value("status", "") == "failed" ? 1 : 0;
    }

    json ev;
    while (client.recv(ev, -1)) {
        print_event(ev);
        auto type = ev.value("type", "");
        if (type == "completion") return 0;
        if (type == "error") return 1;
    }
    std::println(stderr, "Connection to daemon lost");
    return 1;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::vector<std::string> positional;
    json config = json::object();
    std::string output_path;
    int limit = 10;
    bool follow_progress = false;

    // Parse optional args
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string { return i + 1 < argc ? argv[++i] : ""; };

        if (arg == "--method") {
            config["method"] = next();
        } else if (arg == "--formats") {
            // Comma lists are split by the daemon.
            config["output_formats"] = next();
        } else if (arg == "--language") {
            config["language"] = next();
        } else if (arg == "--model") {
            config["model"] = next();
        } else if (arg == "--api-url") {
            config["api_url"] = next();
        } else if (arg == "--api-key") {
            config["api_key"] = next();
        } else if (arg == "--min-speech") {
            config["min_speech_duration_ms"] = std::atoll(next().c_str());
        } else if (arg == "--min-silence") {
            config["min_silence_duration_ms"] = std::atoll(next().c_str());
        } else if (arg == "--limit") {
            limit = std::atoi(next().c_str());
        } else if (arg == "-o" || arg == "--output") {
            output_path = next();
        } else if (arg == "--follow" || arg == "-F") {
            follow_progress = true;
        } else {
            positional.push_back(arg);
        }
    }

    // The daemon resolves paths against its own working directory.
    auto absolute = [](const std::string& p) {
        std::error_code ec;
        auto abs = std::filesystem::absolute(p, ec);
        return ec ? p : abs.string();
    };

    // Build command JSON
    json cmd;
    if (command == "methods") {
        cmd = {{"cmd", "methods"}};
    } else if (command == "submit" && positional.size() == 1) {
        cmd = {{"cmd", "submit"}, {"file", absolute(positional[0])}, {"config", config}};
    } else if (command == "batch" && !positional.empty()) {
        json files = json::array();
        for (const auto& p : positional) files.push_back(absolute(p));
        cmd = {{"cmd", "submit_batch"}, {"files", files}, {"config", config}};
    } else if (command == "watch" && positional.size() == 1) {
        cmd = {{"cmd", "subscribe"}, {"task_id", positional[0]}};
    } else if (command == "status") {
        cmd = {{"cmd", "status"}};
        if (!positional.empty()) cmd["task_id"] = positional[0];
    } else if (command == "fetch" && positional.size() == 2) {
        cmd = {{"cmd", "fetch"}, {"task_id", positional[0]}, {"format", positional[1]}};
    } else if (command == "cancel" && positional.size() == 1) {
        cmd = {{"cmd", "cancel"}, {"task_id", positional[0]}};
    } else if (command == "history") {
        cmd = {{"cmd", "history"}, {"limit", limit}};
    } else {
        std::println(stderr, "Unknown command or wrong arguments: {}", command);
        usage(argv[0]);
        return 1;
    }

    // Connect and send
    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is subflowd running?");
        return 1;
    }

    if (command == "watch") {
        return follow(client, positional[0]);
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    json response;
    if (!client.recv(response)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    // Display response
    auto status = response.value("status", "");
    if (status == "error") {
        std::println(stderr, "Error ({}): {}", response.value("kind", "error"),
                     response.value("message", "unknown error"));
        return 1;
    }

    if (command == "methods") {
        for (auto& m : response["methods"]) {
            std::println("{}{:<16} {}", m.value("default", false) ? "* " : "  ",
                         m.value("name", ""), m.value("description", ""));
        }
    } else if (command == "submit") {
        auto id = response.value("task_id", "");
        std::println("{}", id);
        if (follow_progress) return follow(client, id);
    } else if (command == "batch") {
        auto id = response.value("batch_id", "");
        std::println("batch {}", id);
        for (auto& t : response["task_ids"]) {
            std::println("  {}", t.get<std::string>());
        }
        if (follow_progress) return follow(client, id);
    } else if (command == "fetch") {
        std::string content;
        if (response.contains("content_base64")) {
            if (!base64::decode(response["content_base64"].get<std::string>(), content)) {
                std::println(stderr, "Malformed bundle payload");
                return 1;
            }
        } else {
            content = response.value("content", "");
        }

        if (output_path.empty()) {
            std::cout << content;
        } else {
            std::ofstream f(output_path, std::ios::binary | std::ios::trunc);
            if (!f.write(content.data(), static_cast<std::streamsize>(content.size()))) {
                std::println(stderr, "Cannot write {}", output_path);
                return 1;
            }
            std::println("Wrote {}", output_path);
        }
    } else if (command == "history") {
        for (auto& entry : response["entries"]) {
            std::println("[{}] {} {} {}", entry.value("timestamp", ""), entry.value("task_id", ""),
                         entry.value("status", ""), entry.value("source", ""));
            if (entry.contains("message") && entry["message"].is_string()) {
                std::println("  {}", entry["message"].get<std::string>());
            }
        }
    } else if (command == "cancel") {
        std::println("{}", response.value("message", "OK"));
    } else {
        std::println("{}", response.dump(2));
    }

    return 0;
}
