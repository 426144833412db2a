#include "config.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace sbr {

namespace {

WideInt read_integer(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        return static_cast<WideInt>(value.get<uint64_t>());
    }
    if (value.is_number_integer()) {
        return static_cast<WideInt>(value.get<int64_t>());
    }
    throw std::invalid_argument("expected an integer, got " + value.dump());
}

void apply_json(const nlohmann::json& j, Config& config) {
    if (j.contains("logging")) {
        auto& log = j["logging"];
        if (log.contains("level")) config.logging.level = log["level"].get<std::string>();
        if (log.contains("pattern")) config.logging.pattern = log["pattern"].get<std::string>();
    }

    if (j.contains("codec")) {
        auto& codec = j["codec"];
        if (codec.contains("case_sensitive")) config.codec.case_sensitive = codec["case_sensitive"].get<bool>();
        if (codec.contains("style")) config.codec.style = codec["style"].get<std::string>();
    }

    if (j.contains("enums")) {
        for (const auto& decl_json : j["enums"]) {
            EnumDeclaration decl;
            decl.type_id = decl_json.at("type_id").get<std::string>();
            if (decl_json.contains("width")) decl.width = decl_json["width"].get<uint32_t>();
            if (decl_json.contains("signed")) decl.is_signed = decl_json["signed"].get<bool>();
            for (const auto& member_json : decl_json.at("members")) {
                decl.members.push_back(MemberDeclaration{
                    member_json.at("name").get<std::string>(), read_integer(member_json.at("value"))});
            }
            config.enums.push_back(std::move(decl));
        }
    }

    if (j.contains("samples")) {
        for (const auto& sample_json : j["samples"]) {
            SampleQuery sample;
            sample.type_id = sample_json.at("type_id").get<std::string>();
            if (sample_json.contains("values")) {
                for (const auto& value : sample_json["values"]) {
                    sample.values.push_back(read_integer(value));
                }
            }
            if (sample_json.contains("texts")) {
                for (const auto& text : sample_json["texts"]) {
                    sample.texts.push_back(text.get<std::string>());
                }
            }
            config.samples.push_back(std::move(sample));
        }
    }
}

} // namespace

Config Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::warn("Config file {} not found, using defaults", path);
        return default_config(); // Return default if file doesn't exist
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str());
}

Config Config::load_from_string(std::string_view text) {
    Config config = default_config();

    try {
        nlohmann::json j = nlohmann::json::parse(text);
        apply_json(j, config);
    } catch (const std::exception& e) {
        spdlog::error("Invalid configuration, using defaults: {}", e.what());
        return default_config();
    }

    return config;
}

Config Config::default_config() {
    return Config{};
}

} // namespace sbr
