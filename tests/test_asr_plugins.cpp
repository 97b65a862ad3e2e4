#include <catch2/catch_test_macros.hpp>

#include "asr/plugin_registry.hpp"
#include "asr/qwen_asr_plugin.hpp"
#include "asr/whisper_http_plugin.hpp"
#include "base64.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

bool has_field(const std::vector<FormField>& fields, const std::string& name, const std::string& value) {
    return std::ranges::any_of(fields, [&](const FormField& f) { return f.name == name && f.data == value; });
}

bool has_field(const std::vector<FormField>& fields, const std::string& name) {
    return std::ranges::any_of(fields, [&](const FormField& f) { return f.name == name; });
}

} // namespace

TEST_CASE("WhisperHttpPlugin", "[asr]") {
    WhisperHttpPlugin plugin("openai");

    SECTION("ParsesTextField") {
        auto r = WhisperHttpPlugin::parse_response(R"({"text": "  hello world \n"})");
        REQUIRE(r.has_value());
        REQUIRE(*r == "hello world");
    }

    SECTION("ParsesSegmentList") {
        auto r = WhisperHttpPlugin::parse_response(R"({"segments": [{"text": " one"}, {"text": "two "}]})");
        REQUIRE(r.has_value());
        REQUIRE(*r == "one two");
    }

    SECTION("ParsesPlainText") {
        auto r = WhisperHttpPlugin::parse_response("first line\n\nsecond line\n");
        REQUIRE(r.has_value());
        REQUIRE(*r == "first line second line");
    }

    SECTION("PlainTextIsMadeValidUtf8") {
        auto r = WhisperHttpPlugin::parse_response("caf\xe9\n");
        REQUIRE(r.has_value());
        REQUIRE(*r == "caf\xEF\xBF\xBD");
    }

    SECTION("BlankBodyIsEmptyText") {
        auto r = WhisperHttpPlugin::parse_response("  \n ");
        REQUIRE(r.has_value());
        REQUIRE(r->empty());
    }

    SECTION("ServerErrorIsFailure") {
        auto r = WhisperHttpPlugin::parse_response(R"({"error": {"message": "model not loaded"}})");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error() == "server error: model not loaded");

        auto bad = WhisperHttpPlugin::parse_response("{not json");
        REQUIRE_FALSE(bad.has_value());
    }

    SECTION("OpenAiForm") {
        PluginOptions opts{.model = "large-v2", .language = "zh", .prompt = "names: Ada"};
        auto fields = plugin.build_form({1, 2, 3}, opts);
        REQUIRE(fields.front().name == "file");
        REQUIRE(fields.front().filename == "audio.wav");
        REQUIRE(fields.front().data.size() == 3);
        REQUIRE(has_field(fields, "model", "large-v2"));
        REQUIRE(has_field(fields, "language", "zh"));
        REQUIRE(has_field(fields, "prompt", "names: Ada"));
        REQUIRE(has_field(fields, "response_format", "json"));
    }

    SECTION("AutoLanguageIsOmitted") {
        PluginOptions opts{.model = "large-v2"};
        auto fields = plugin.build_form({}, opts);
        REQUIRE_FALSE(has_field(fields, "language"));
        REQUIRE_FALSE(has_field(fields, "prompt"));
    }

    SECTION("Validation") {
        REQUIRE(plugin.validate({.endpoint = "http://localhost:8000/v1/audio/transcriptions"}).has_value());

        auto missing = plugin.validate({});
        REQUIRE_FALSE(missing.has_value());
        REQUIRE(missing.error().kind == ErrorKind::Configuration);

        REQUIRE_FALSE(plugin.validate({.endpoint = "ftp://example.org"}).has_value());
        REQUIRE_FALSE(plugin.validate({.endpoint = "http://x", .timeout_s = 0}).has_value());
        REQUIRE_FALSE(WhisperHttpPlugin("grpc").validate({.endpoint = "http://x"}).has_value());
    }

    SECTION("EmptyClipFailsWithoutNetwork") {
        AudioClip clip{.sample_rate = 16000};
        auto r = plugin.transcribe(clip, {.endpoint = "http://127.0.0.1:9"});
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error() == "empty audio");
    }
}

TEST_CASE("QwenAsrPlugin", "[asr]") {
    QwenAsrPlugin plugin;

    SECTION("RequestShape") {
        std::vector<uint8_t> wav_data = {'R', 'I', 'F', 'F'};
        PluginOptions opts{.api_key = "k", .model = "qwen3-asr-flash", .language = "auto", .prompt = "ctx"};
        auto req = QwenAsrPlugin::build_request(wav_data, opts);

        REQUIRE(req["model"] == "qwen3-asr-flash");
        const auto& messages = req["input"]["messages"];
        REQUIRE(messages.size() == 2);
        REQUIRE(messages[0]["role"] == "system");
        REQUIRE(messages[0]["content"][0]["text"] == "ctx");
        REQUIRE(messages[1]["role"] == "user");
        REQUIRE(messages[1]["content"][0]["audio"] == "data:audio/wav;base64," + base64::encode(wav_data));
        REQUIRE(req["parameters"]["result_format"] == "message");
        REQUIRE(req["parameters"]["asr_options"]["enable_lid"] == true);
        REQUIRE_FALSE(req["parameters"]["asr_options"].contains("language"));
    }

    SECTION("ExplicitLanguage") {
        PluginOptions opts{.api_key = "k", .model = "qwen3-asr-flash", .language = "en"};
        auto req = QwenAsrPlugin::build_request({}, opts);
        REQUIRE(req["parameters"]["asr_options"]["language"] == "en");
        REQUIRE(req["parameters"]["asr_options"]["enable_lid"] == false);
    }

    SECTION("ParsesChoices") {
        json body = {
            {"output", {{"choices", json::array({
                {{"message", {{"role", "assistant"}, {"content", json::array({{{"text", "你好"}}, {{"text", "世界"}}})}}}},
            })}}},
        };
        auto r = QwenAsrPlugin::parse_response(body.dump());
        REQUIRE(r.has_value());
        REQUIRE(*r == "你好 世界");
    }

    SECTION("NoChoicesIsEmptyText") {
        auto r = QwenAsrPlugin::parse_response(R"({"output": {"choices": []}})");
        REQUIRE(r.has_value());
        REQUIRE(r->empty());
    }

    SECTION("ErrorCodeIsFailure") {
        auto r = QwenAsrPlugin::parse_response(R"({"code": "InvalidApiKey", "message": "bad key"})");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error() == "server error: InvalidApiKey - bad key");

        REQUIRE_FALSE(QwenAsrPlugin::parse_response(R"({"unexpected": true})").has_value());
    }

    SECTION("Validation") {
        REQUIRE(plugin.validate({.api_key = "k", .model = "qwen3-asr-flash"}).has_value());

        auto no_key = plugin.validate({.model = "qwen3-asr-flash"});
        REQUIRE_FALSE(no_key.has_value());
        REQUIRE(no_key.error().kind == ErrorKind::Configuration);
        REQUIRE(no_key.error().message == "qwen-asr: api_key is required");

        auto bad_model = plugin.validate({.api_key = "k", .model = "whisper"});
        REQUIRE_FALSE(bad_model.has_value());
        REQUIRE(bad_model.error().message.find("qwen3-asr-flash") != std::string::npos);
    }
}

TEST_CASE("PluginRegistry", "[asr]") {

    SECTION("BuiltInMethods") {
        Config cfg;
        auto registry = make_plugin_registry(cfg);
        auto methods = registry->list();
        REQUIRE(methods.size() == 2);
        REQUIRE(methods[0].name == "faster-whisper");
        REQUIRE(methods[0].is_default);
        REQUIRE(methods[0].required_fields == std::vector<std::string>{"api_url"});
        REQUIRE(methods[1].name == "qwen-asr");
        REQUIRE_FALSE(methods[1].is_default);
        REQUIRE(methods[1].required_fields == std::vector<std::string>{"api_key", "model"});
    }

    SECTION("ResolveByName") {
        auto registry = make_plugin_registry(Config{});
        auto plugin = registry->resolve("qwen-asr");
        REQUIRE(plugin.has_value());
        REQUIRE((*plugin)->name() == "qwen-asr");

        auto missing = registry->resolve("nope");
        REQUIRE_FALSE(missing.has_value());
        REQUIRE(missing.error().kind == ErrorKind::NotFound);
    }

    SECTION("EmptyNameSelectsDefault") {
        auto registry = make_plugin_registry(Config{});
        auto binding = registry->resolve_configured("", {});
        REQUIRE(binding.has_value());
        REQUIRE(binding->plugin->name() == "faster-whisper");
        REQUIRE(binding->options.endpoint == Config{}.asr.faster_whisper.url);
    }

    SECTION("OverridesAreMerged") {
        auto registry = make_plugin_registry(Config{});
        auto binding = registry->resolve_configured("faster-whisper",
                                                    {.endpoint = "http://gpu-box:9000/v1/audio/transcriptions",
                                                     .language = "ja"});
        REQUIRE(binding.has_value());
        REQUIRE(binding->options.endpoint == "http://gpu-box:9000/v1/audio/transcriptions");
        REQUIRE(binding->options.language == "ja");
        REQUIRE(binding->options.model == Config{}.asr.faster_whisper.model);
    }

    SECTION("QwenWithoutKeyIsConfigurationError") {
        auto registry = make_plugin_registry(Config{});
        auto binding = registry->resolve_configured("qwen-asr", {});
        REQUIRE_FALSE(binding.has_value());
        REQUIRE(binding.error().kind == ErrorKind::Configuration);

        auto with_key = registry->resolve_configured("qwen-asr", {.api_key = "sk-test"});
        REQUIRE(with_key.has_value());
        REQUIRE(with_key->options.endpoint == QwenAsrPlugin::ENDPOINT);
    }

    SECTION("UnknownMethodIsConfigurationError") {
        auto registry = make_plugin_registry(Config{});
        auto binding = registry->resolve_configured("whisperx", {});
        REQUIRE_FALSE(binding.has_value());
        REQUIRE(binding.error().kind == ErrorKind::Configuration);
        REQUIRE(binding.error().message == "unknown transcription method: whisperx");
    }

    SECTION("UnknownDefaultFallsBack") {
        Config cfg;
        cfg.asr.default_method = "does-not-exist";
        auto registry = make_plugin_registry(cfg);
        REQUIRE(registry->default_name() == "faster-whisper");
    }

    SECTION("CustomPlugins") {
        std::vector<PluginRegistry::Registration> plugins;
        plugins.push_back({.plugin = std::make_unique<test::MockPlugin>(test::numbered),
                           .defaults = {.model = "tiny"}});
        PluginRegistry registry(std::move(plugins), "mock");

        REQUIRE(registry.resolve_configured("", {}).has_value());
        auto rejected = registry.resolve_configured("mock", {.model = "invalid"});
        REQUIRE_FALSE(rejected.has_value());
        REQUIRE(rejected.error().kind == ErrorKind::Configuration);
    }
}
