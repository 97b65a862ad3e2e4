#include "daemon_core.hpp"

#include "base64.hpp"
#include "platform/platform_paths.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <print>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

json error_response(const Error& err) {
    return {{"status", "error"}, {"kind", to_string(err.kind)}, {"message", err.message}};
}

json error_response(ErrorKind kind, const std::string& message) {
    return error_response(Error{kind, message});
}

std::string string_arg(const json& cmd, const char* key) {
    if (!cmd.contains(key) || !cmd[key].is_string()) return {};
    return cmd[key].get<std::string>();
}

json archived_to_json(const ArchivedTask& t) {
    json j = {
        {"task_id", t.task_id},
        {"timestamp", t.timestamp},
        {"source", t.source},
        {"method", t.method},
        {"status", t.status},
        {"message", t.message},
        {"stats", to_json(t.stats)},
        {"outputs", t.outputs},
    };
    if (!t.error.empty()) j["error"] = t.error;
    if (!t.bundle.empty()) j["bundle"] = t.bundle;
    return j;
}

} // namespace

DaemonCore::DaemonCore(Config config, bool verbose, IpcServer& ipc, NotifyCallback notify)
    : config_(std::move(config)), verbose_(verbose), ipc_(ipc),
      notify_(std::move(notify)),
      channels_(config_.progress.subscriber_backlog) {}

DaemonCore::~DaemonCore() {
    shutdown();
}

bool DaemonCore::init(const std::string& data_root) {
    registry_ = make_plugin_registry(config_);

    std::string data = data_root;
    if (data.empty()) data = platform::data_dir();
    if (data.empty()) data = "/tmp/subflow";

    fs::path upload_dir = config_.storage.upload_dir.empty()
        ? fs::path(data) / "uploads" : fs::path(config_.storage.upload_dir);
    fs::path output_dir = config_.storage.output_dir.empty()
        ? fs::path(data) / "outputs" : fs::path(config_.storage.output_dir);

    std::error_code ec;
    fs::create_directories(upload_dir, ec);
    if (ec) {
        std::println(stderr, "Cannot create upload dir {}: {}", upload_dir.string(), ec.message());
        return false;
    }
    fs::create_directories(output_dir, ec);
    if (ec) {
        std::println(stderr, "Cannot create output dir {}: {}", output_dir.string(), ec.message());
        return false;
    }

    if (!archive_.open(data + "/history.db")) {
        std::println(stderr, "Warning: task archive failed to open, history disabled");
    }

    OrchestratorOptions opts{
        .vad = {
            .min_speech_duration_ms = config_.vad.min_speech_duration_ms,
            .min_silence_duration_ms = config_.vad.min_silence_duration_ms,
            .max_speech_duration_ms = config_.vad.max_speech_duration_ms,
            .frame_ms = config_.vad.frame_ms,
            .energy_threshold = config_.vad.energy_threshold,
        },
        .max_concurrent_segments = config_.dispatch.max_concurrent_segments,
        .keep_segments = config_.storage.keep_segments,
        .bundle = config_.storage.bundle,
    };

    // Bad VAD values in the config file would make every submission fail.
    if (auto ok = validate(opts.vad); !ok) {
        std::println(stderr, "config: {}", ok.error().message);
        return false;
    }

    orchestrator_ = std::make_unique<TaskOrchestrator>(
        *registry_, channels_, Workspace(upload_dir, output_dir), opts, verbose_);
    batches_ = std::make_unique<BatchCoordinator>(
        *orchestrator_, channels_,
        BatchOptions{.max_files = config_.batch.max_files,
                     .max_parallel_files = config_.batch.max_parallel_files});

    log(std::format("Default method {}, outputs under {}", registry_->default_name(), output_dir.string()));
    return true;
}

json DaemonCore::handle_command(int client_fd, const json& cmd) {
    if (!cmd.is_object()) {
        return error_response(ErrorKind::Configuration, "malformed request");
    }
    if (cmd.contains("cmd") && !cmd["cmd"].is_string()) {
        return error_response(ErrorKind::Configuration, "'cmd' must be a string");
    }
    std::string cmd_str = string_arg(cmd, "cmd");

    // A handler that trips over an unexpected field type answers this client only.
    try {
        if (cmd_str == "methods") return handle_methods(cmd);
        if (cmd_str == "submit") return handle_submit(cmd);
        if (cmd_str == "submit_batch") return handle_submit_batch(cmd);
        if (cmd_str == "subscribe") return handle_subscribe(client_fd, cmd);
        if (cmd_str == "status") return handle_status(cmd);
        if (cmd_str == "batch") return handle_batch(cmd);
        if (cmd_str == "fetch") return handle_fetch(cmd);
        if (cmd_str == "cancel") return handle_cancel(cmd);
        if (cmd_str == "history") return handle_history(cmd);
    } catch (const json::exception& e) {
        log(std::format("{}: bad request: {}", cmd_str, e.what()));
        return error_response(ErrorKind::Configuration, std::format("bad request: {}", e.what()));
    }
    return {{"status", "error"}, {"message", "unknown command"}};
}

json DaemonCore::handle_methods(const json& /*cmd*/) {
    json methods = json::array();
    for (const auto& info : registry_->list()) {
        methods.push_back({
            {"name", info.name},
            {"description", info.description},
            {"required_fields", info.required_fields},
            {"default", info.is_default},
        });
    }
    return {{"status", "ok"}, {"methods", methods}, {"default", registry_->default_name()}};
}

json DaemonCore::handle_submit(const json& cmd) {
    auto file = string_arg(cmd, "file");
    if (file.empty()) {
        return error_response(ErrorKind::Configuration, "missing 'file'");
    }

    auto request = TaskRequest::from_json(cmd.contains("config") ? cmd["config"] : json());
    if (!request) return error_response(request.error());
    request->source = file;

    auto validated = orchestrator_->validate(*request);
    if (!validated) return error_response(validated.error());

    auto task_id = make_task_id();
    auto staged = orchestrator_->workspace().stage_upload(task_id, file);
    if (!staged) return error_response(staged.error());
    validated->source = staged->string();

    store_.put(Task{.id = task_id, .source = file, .method = validated->method, .created_at = utc_timestamp()});

    std::stop_source stop;
    {
        std::lock_guard lock(cancel_mu_);
        cancel_sources_[task_id] = stop;
    }

    log(std::format("Task {} submitted: {} via {}", task_id, file, validated->method));

    spawn([this, task_id, stop, req = std::move(*validated)](std::stop_token shutdown) mutable {
        std::stop_callback forward(shutdown, [stop]() mutable { stop.request_stop(); });

        Task result = orchestrator_->run(task_id, req, stop.get_token(),
                                         [this](const Task& t) { on_snapshot(t); });
        retire(result);
        orchestrator_->workspace().remove_upload(task_id);

        std::lock_guard lock(cancel_mu_);
        cancel_sources_.erase(task_id);
    });

    return {{"status", "ok"}, {"task_id", task_id}};
}

json DaemonCore::handle_submit_batch(const json& cmd) {
    if (!cmd.contains("files") || !cmd["files"].is_array()) {
        return error_response(ErrorKind::Configuration, "missing 'files' list");
    }
    std::vector<std::string> files;
    for (const auto& f : cmd["files"]) {
        if (!f.is_string()) return error_response(ErrorKind::Configuration, "'files' must hold strings");
        files.push_back(f.get<std::string>());
    }

    auto request = TaskRequest::from_json(cmd.contains("config") ? cmd["config"] : json());
    if (!request) return error_response(request.error());

    auto plan = batches_->prepare(files, *request);
    if (!plan) return error_response(plan.error());

    json task_ids = json::array();
    {
        std::lock_guard lock(cancel_mu_);
        for (const auto& item : plan->items) {
            cancel_sources_[item.task_id] = item.stop;
            task_ids.push_back(item.task_id);
            store_.put(Task{.id = item.task_id, .source = item.file, .method = item.request.method,
                            .created_at = utc_timestamp()});
        }
    }
    store_.put_batch(plan->batch_id, {
        {"batch_id", plan->batch_id},
        {"status", "running"},
        {"task_ids", task_ids},
    });

    log(std::format("Batch {} submitted: {} files", plan->batch_id, plan->items.size()));

    auto batch_id = plan->batch_id;
    spawn([this, plan = std::move(*plan)](std::stop_token shutdown) {
        auto report = batches_->run(plan, shutdown, [this](const Task& t) {
            on_snapshot(t);
            if (t.is_terminal()) retire(t);
        });

        auto j = report.to_json();
        j["status"] = "completed";
        store_.put_batch(plan.batch_id, std::move(j));

        std::lock_guard lock(cancel_mu_);
        for (const auto& item : plan.items) cancel_sources_.erase(item.task_id);
    });

    return {{"status", "ok"}, {"batch_id", batch_id}, {"task_ids", task_ids}};
}

json DaemonCore::handle_subscribe(int client_fd, const json& cmd) {
    auto id = string_arg(cmd, "task_id");
    if (id.empty()) {
        return error_response(ErrorKind::Configuration, "missing 'task_id'");
    }

    // Subscribe before looking at the snapshot: the orchestrator stores the
    // terminal snapshot before publishing, so anything not yet terminal here
    // will still reach this subscription.
    auto sub = channels_.subscribe(id, notify_);

    if (auto task = store_.get(id)) {
        if (task->is_terminal()) {
            channels_.unsubscribe(sub);
            return {{"status", "ok"}, {"finished", true}, {"task", task->to_json()}};
        }
    } else if (auto batch = store_.get_batch(id)) {
        if (batch->value("status", "") == "completed") {
            channels_.unsubscribe(sub);
            return {{"status", "ok"}, {"finished", true}, {"batch", *batch}};
        }
    } else {
        channels_.unsubscribe(sub);
        if (auto archived = archive_.find(id)) {
            return {{"status", "ok"}, {"finished", true}, {"task", archived_to_json(*archived)}};
        }
        return error_response(ErrorKind::NotFound, "unknown task: " + id);
    }

    subscriptions_.push_back({client_fd, std::move(sub)});
    return {{"status", "subscribed"}, {"task_id", id}};
}

json DaemonCore::handle_status(const json& cmd) {
    auto id = string_arg(cmd, "task_id");
    if (id.empty()) {
        json tasks = json::array();
        for (const auto& t : store_.all()) {
            if (!t.is_terminal()) tasks.push_back(t.to_json());
        }
        return {{"status", "ok"}, {"active", tasks}};
    }

    if (auto task = store_.get(id)) {
        return {{"status", "ok"}, {"task", task->to_json()}};
    }
    if (auto archived = archive_.find(id)) {
        return {{"status", "ok"}, {"task", archived_to_json(*archived)}};
    }
    return error_response(ErrorKind::NotFound, "unknown task: " + id);
}

json DaemonCore::handle_batch(const json& cmd) {
    auto id = string_arg(cmd, "batch_id");
    auto batch = store_.get_batch(id);
    if (!batch) return error_response(ErrorKind::NotFound, "unknown batch: " + id);
    return {{"status", "ok"}, {"batch", *batch}};
}

json DaemonCore::handle_fetch(const json& cmd) {
    auto id = string_arg(cmd, "task_id");
    auto format = string_arg(cmd, "format");
    if (format.empty()) format = "srt";

    std::map<std::string, std::string> outputs;
    std::string bundle;
    if (auto task = store_.get(id)) {
        if (task->status != TaskStatus::Completed) {
            return error_response(ErrorKind::Task, std::format("task {} is {}", id, to_string(task->status)));
        }
        outputs = task->outputs;
        bundle = task->bundle;
    } else if (auto archived = archive_.find(id)) {
        if (archived->status != "completed") {
            return error_response(ErrorKind::Task, std::format("task {} is {}", id, archived->status));
        }
        outputs = archived->outputs;
        bundle = archived->bundle;
    } else {
        return error_response(ErrorKind::NotFound, "unknown task: " + id);
    }

    std::string path;
    if (format == "bundle") {
        path = bundle;
    } else if (auto it = outputs.find(format); it != outputs.end()) {
        path = it->second;
    }
    if (path.empty()) {
        return error_response(ErrorKind::NotFound, std::format("task {} has no {} output", id, format));
    }

    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return error_response(ErrorKind::NotFound, "output file missing: " + path);
    }
    std::stringstream ss;
    ss << f.rdbuf();

    json resp = {{"status", "ok"}, {"task_id", id}, {"format", format}, {"path", path}};
    if (format == "bundle") {
        resp["content_base64"] = base64::encode(ss.str());
    } else {
        resp["content"] = ss.str();
    }
    return resp;
}

json DaemonCore::handle_cancel(const json& cmd) {
    auto id = string_arg(cmd, "task_id");
    if (cancel_task(id)) {
        log("Cancelling task " + id);
        return {{"status", "ok"}, {"message", "cancelling"}};
    }
    if (auto task = store_.get(id)) {
        return error_response(ErrorKind::Task, std::format("task {} already {}", id, to_string(task->status)));
    }
    if (auto archived = archive_.find(id)) {
        return error_response(ErrorKind::Task, std::format("task {} already {}", id, archived->status));
    }
    return error_response(ErrorKind::NotFound, "unknown task: " + id);
}

json DaemonCore::handle_history(const json& cmd) {
    int limit = 10;
    if (cmd.contains("limit") && cmd["limit"].is_number_integer()) limit = cmd["limit"].get<int>();
    limit = std::clamp(limit, 1, 1000);

    json entries = json::array();
    for (const auto& t : archive_.recent(limit)) {
        entries.push_back(archived_to_json(t));
    }
    return {{"status", "ok"}, {"entries", entries}};
}

void DaemonCore::on_snapshot(const Task& task) {
    store_.put(task);
}

void DaemonCore::retire(const Task& task) {
    // Status, fetch and subscribe read the archive once the snapshot is gone.
    if (archive_.insert(task)) {
        store_.erase(task.id);
    } else {
        log(std::format("Task {} kept in memory: archive insert failed", task.id));
    }
}

void DaemonCore::spawn(std::function<void(std::stop_token)> fn) {
    auto done = std::make_shared<std::atomic<bool>>(false);
    workers_.push_back({
        .thread = std::jthread([fn = std::move(fn), done, this](std::stop_token st) {
            fn(st);
            done->store(true, std::memory_order_release);
            notify_();
        }),
        .done = done,
    });
}

bool DaemonCore::cancel_task(const std::string& task_id) {
    std::lock_guard lock(cancel_mu_);
    auto it = cancel_sources_.find(task_id);
    if (it == cancel_sources_.end()) return false;
    it->second.request_stop();
    return true;
}

void DaemonCore::flush_subscriptions() {
    std::vector<std::string> to_cancel;

    std::erase_if(subscriptions_, [&](ClientSubscription& cs) {
        uint64_t dropped_before = cs.sub->dropped();
        for (const auto& ev : cs.sub->drain()) {
            if (!ipc_.send_response(cs.fd, ev.to_json())) {
                log(std::format("Subscriber on fd {} for {} went away", cs.fd, cs.sub->task_id()));
                channels_.unsubscribe(cs.sub);
                if (config_.daemon.cancel_on_disconnect) to_cancel.push_back(cs.sub->task_id());
                return true;
            }
        }
        if (cs.sub->dropped() != dropped_before) {
            log(std::format("Subscriber on fd {} fell behind, {} events dropped so far",
                            cs.fd, cs.sub->dropped()));
        }
        return cs.sub->closed();
    });

    for (const auto& id : to_cancel) cancel_task(id);
}

void DaemonCore::on_worker_event() {
    flush_subscriptions();

    std::erase_if(workers_, [](const Worker& w) {
        return w.done->load(std::memory_order_acquire);
    });
}

void DaemonCore::remove_client(int fd) {
    std::vector<std::string> to_cancel;
    std::erase_if(subscriptions_, [&](const ClientSubscription& cs) {
        if (cs.fd != fd) return false;
        channels_.unsubscribe(cs.sub);
        if (config_.daemon.cancel_on_disconnect) to_cancel.push_back(cs.sub->task_id());
        return true;
    });
    for (const auto& id : to_cancel) {
        if (cancel_task(id)) log("Client disconnected, cancelling task " + id);
    }
}

void DaemonCore::shutdown() {
    {
        std::lock_guard lock(cancel_mu_);
        if (!cancel_sources_.empty()) {
            log(std::format("Cancelling {} running tasks...", cancel_sources_.size()));
        }
        for (auto& [id, src] : cancel_sources_) src.request_stop();
    }

    // jthread destructors request stop and join.
    workers_.clear();
    flush_subscriptions();
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[subflow] {}", msg);
    }
}
