#include "asr/plugin_registry.hpp"

#include "asr/qwen_asr_plugin.hpp"
#include "asr/whisper_http_plugin.hpp"

#include <algorithm>
#include <print>

PluginRegistry::PluginRegistry(std::vector<Registration> plugins, std::string default_name)
    : plugins_(std::move(plugins)), default_name_(std::move(default_name)) {
    if (!find(default_name_) && !plugins_.empty()) {
        std::println(stderr, "asr: unknown default method '{}', falling back to '{}'",
                     default_name_, plugins_.front().plugin->name());
        default_name_ = plugins_.front().plugin->name();
    }
}

std::vector<PluginInfo> PluginRegistry::list() const {
    std::vector<PluginInfo> out;
    out.reserve(plugins_.size());
    for (const auto& r : plugins_) {
        out.push_back({
            .name = r.plugin->name(),
            .description = r.plugin->description(),
            .required_fields = r.required_fields,
            .is_default = r.plugin->name() == default_name_,
        });
    }
    return out;
}

const PluginRegistry::Registration* PluginRegistry::find(const std::string& name) const {
    auto it = std::ranges::find_if(plugins_, [&name](const Registration& r) {
        return r.plugin->name() == name;
    });
    return it != plugins_.end() ? &*it : nullptr;
}

std::expected<const AsrPlugin*, Error> PluginRegistry::resolve(const std::string& name) const {
    const auto* r = find(name);
    if (!r) {
        return make_error(ErrorKind::NotFound, "unknown transcription method: " + name);
    }
    return r->plugin.get();
}

std::expected<PluginBinding, Error>
PluginRegistry::resolve_configured(const std::string& name, const PluginOverrides& overrides) const {
    const auto* r = find(name.empty() ? default_name_ : name);
    if (!r) {
        // Unknown method in a submission is a configuration problem, not a lookup miss.
        return make_error(ErrorKind::Configuration, "unknown transcription method: " + name);
    }

    PluginOptions opts = r->defaults;
    if (!overrides.endpoint.empty()) opts.endpoint = overrides.endpoint;
    if (!overrides.api_key.empty()) opts.api_key = overrides.api_key;
    if (!overrides.model.empty()) opts.model = overrides.model;
    if (!overrides.language.empty()) opts.language = overrides.language;

    auto valid = r->plugin->validate(opts);
    if (!valid) {
        return std::unexpected(valid.error());
    }
    return PluginBinding{.plugin = r->plugin.get(), .options = std::move(opts)};
}

std::unique_ptr<PluginRegistry> make_plugin_registry(const Config& config) {
    const auto& asr = config.asr;
    std::vector<PluginRegistry::Registration> plugins;

    plugins.push_back({
        .plugin = std::make_unique<WhisperHttpPlugin>(asr.faster_whisper.api_format),
        .defaults = {
            .endpoint = asr.faster_whisper.url,
            .api_key = asr.faster_whisper.api_key,
            .model = asr.faster_whisper.model,
            .language = asr.language,
            .prompt = asr.faster_whisper.prompt,
            .timeout_s = asr.timeout_s,
        },
        .required_fields = {"api_url"},
    });

    plugins.push_back({
        .plugin = std::make_unique<QwenAsrPlugin>(),
        .defaults = {
            .endpoint = QwenAsrPlugin::ENDPOINT,
            .api_key = asr.qwen.api_key,
            .model = asr.qwen.model,
            .language = asr.qwen.language,
            .timeout_s = asr.timeout_s,
        },
        .required_fields = {"api_key", "model"},
    });

    return std::make_unique<PluginRegistry>(std::move(plugins), asr.default_method);
}
