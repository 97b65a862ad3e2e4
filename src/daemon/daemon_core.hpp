#pragma once

#include "asr/plugin_registry.hpp"
#include "config.hpp"
#include "pipeline/batch_coordinator.hpp"
#include "pipeline/task_orchestrator.hpp"
#include "pipeline/task_store.hpp"
#include "platform/ipc_server.hpp"
#include "progress/progress_channels.hpp"
#include "storage/task_archive.hpp"
#include "storage/workspace.hpp"

#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

class DaemonCore {
public:
    using NotifyCallback = std::function<void()>;

    DaemonCore(Config config, bool verbose, IpcServer& ipc, NotifyCallback notify);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // data_root overrides the XDG data directory (archive, uploads, outputs).
    bool init(const std::string& data_root = {});

    nlohmann::json handle_command(int client_fd, const nlohmann::json& cmd);

    // Called on the event loop thread after notify: forwards queued
    // progress events to subscribed clients and reaps finished workers.
    void on_worker_event();

    void remove_client(int fd);

    void shutdown();

    const TaskStore& store() const { return store_; }
    const ProgressChannels& channels() const { return channels_; }

private:
    nlohmann::json handle_methods(const nlohmann::json& cmd);
    nlohmann::json handle_submit(const nlohmann::json& cmd);
    nlohmann::json handle_submit_batch(const nlohmann::json& cmd);
    nlohmann::json handle_subscribe(int client_fd, const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_batch(const nlohmann::json& cmd);
    nlohmann::json handle_fetch(const nlohmann::json& cmd);
    nlohmann::json handle_cancel(const nlohmann::json& cmd);
    nlohmann::json handle_history(const nlohmann::json& cmd);

    void on_snapshot(const Task& task);
    // Archives a finished task and drops its in-memory snapshot.
    void retire(const Task& task);
    void spawn(std::function<void(std::stop_token)> fn);
    bool cancel_task(const std::string& task_id);
    void flush_subscriptions();

    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    IpcServer& ipc_;
    NotifyCallback notify_;

    std::unique_ptr<PluginRegistry> registry_;
    ProgressChannels channels_;
    TaskStore store_;
    TaskArchive archive_;
    std::unique_ptr<TaskOrchestrator> orchestrator_;
    std::unique_ptr<BatchCoordinator> batches_;

    std::mutex cancel_mu_;
    std::unordered_map<std::string, std::stop_source> cancel_sources_;

    struct ClientSubscription {
        int fd;
        std::shared_ptr<Subscription> sub;
    };
    std::vector<ClientSubscription> subscriptions_;

    struct Worker {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::list<Worker> workers_;
};
