#pragma once

#include "asr/plugin.hpp"
#include "config.hpp"
#include "errors.hpp"

#include <expected>
#include <memory>
#include <string>
#include <vector>

// Fields a submission may set for one task. Empty means "use the default".
struct PluginOverrides {
    std::string endpoint;
    std::string api_key;
    std::string model;
    std::string language;
};

struct PluginInfo {
    std::string name;
    std::string description;
    std::vector<std::string> required_fields;
    bool is_default = false;
};

// A plugin together with the fully merged, validated options for one task.
struct PluginBinding {
    const AsrPlugin* plugin = nullptr;
    PluginOptions options;
};

// Name -> plugin table, fixed after construction and safe to share
// across task threads without locking.
class PluginRegistry {
public:
    struct Registration {
        std::unique_ptr<AsrPlugin> plugin;
        PluginOptions defaults;
        std::vector<std::string> required_fields;
    };

    PluginRegistry(std::vector<Registration> plugins, std::string default_name);

    PluginRegistry(const PluginRegistry&) = delete;
    PluginRegistry& operator=(const PluginRegistry&) = delete;

    std::vector<PluginInfo> list() const;
    const std::string& default_name() const { return default_name_; }

    std::expected<const AsrPlugin*, Error> resolve(const std::string& name) const;

    // An empty name selects the default plugin.
    std::expected<PluginBinding, Error> resolve_configured(const std::string& name,
                                                           const PluginOverrides& overrides) const;

private:
    const Registration* find(const std::string& name) const;

    std::vector<Registration> plugins_;
    std::string default_name_;
};

std::unique_ptr<PluginRegistry> make_plugin_registry(const Config& config);
