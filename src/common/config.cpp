#include "common/config.h"

#include <cstdlib>
#include <functional>
#include <utility>
#include <vector>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

#include "common/error.h"

namespace promptguard {

namespace {

std::optional<std::string> GetEnv(std::string_view prefix, const char* suffix) {
    std::string key(prefix);
    key += suffix;
    const char* value = std::getenv(key.c_str());
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

nlohmann::json NodeToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Map: {
            nlohmann::json object = nlohmann::json::object();
            for (const auto& kv : node) {
                object[kv.first.as<std::string>()] = NodeToJson(kv.second);
            }
            return object;
        }
        case YAML::NodeType::Sequence: {
            nlohmann::json array = nlohmann::json::array();
            for (const auto& item : node) {
                array.push_back(NodeToJson(item));
            }
            return array;
        }
        case YAML::NodeType::Scalar: {
            const std::string& text = node.Scalar();
            int64_t as_int = 0;
            if (absl::SimpleAtoi(text, &as_int)) {
                return as_int;
            }
            double as_double = 0.0;
            if (absl::SimpleAtod(text, &as_double)) {
                return as_double;
            }
            if (text == "true" || text == "false") {
                return text == "true";
            }
            return text;
        }
        default:
            return nullptr;
    }
}

}  // namespace

absl::StatusOr<Config> Config::LoadFromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return ConfigFileNotFound(absl::StrCat("no such file: ", path.string()));
    }

    try {
        Config config;
        config.root_ = YAML::LoadFile(path.string());
        return config;
    } catch (const YAML::Exception& e) {
        return ConfigParseError(absl::StrCat(path.string(), ": ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromString(std::string_view yaml_content) {
    try {
        Config config;
        config.root_ = YAML::Load(std::string(yaml_content));
        return config;
    } catch (const YAML::Exception& e) {
        return ConfigParseError(e.what());
    }
}

absl::StatusOr<Config> Config::LoadFromEnvironment(std::string_view prefix) {
    Config config;

    if (auto val = GetEnv(prefix, "MAX_LENGTH")) {
        int64_t max_length = 0;
        if (!absl::SimpleAtoi(*val, &max_length)) {
            return ConfigurationError(
                absl::StrCat(std::string(prefix), "MAX_LENGTH is not an integer: ", *val));
        }
        config.Set("validator.max_length", max_length);
    }

    if (auto val = GetEnv(prefix, "STRICT_MODE")) {
        bool strict = false;
        if (!absl::SimpleAtob(*val, &strict)) {
            return ConfigurationError(
                absl::StrCat(std::string(prefix), "STRICT_MODE is not a boolean: ", *val));
        }
        config.Set("validator.strict_mode", strict);
    }

    if (auto val = GetEnv(prefix, "LOG_LEVEL")) {
        config.Set("logging.level", *val);
    }

    return config;
}

absl::StatusOr<Config> Config::LoadLayered(
    const std::optional<std::filesystem::path>& path,
    std::string_view env_prefix) {
    Config config;

    if (path.has_value()) {
        Config file_config;
        PROMPTGUARD_ASSIGN_OR_RETURN(file_config, LoadFromFile(*path));
        config.Merge(file_config);
    }

    // Environment has the highest priority
    auto env_config = LoadFromEnvironment(env_prefix);
    if (!env_config.ok()) {
        return Annotate(env_config.status(), "environment");
    }
    config.Merge(*env_config);

    return config;
}

void Config::Merge(const Config& other) {
    std::function<void(YAML::Node, const YAML::Node&)> merge_nodes;
    merge_nodes = [&merge_nodes](YAML::Node base, const YAML::Node& overlay) {
        if (!overlay.IsMap()) {
            return;
        }
        for (const auto& kv : overlay) {
            const std::string key = kv.first.as<std::string>();
            const YAML::Node existing = std::as_const(base)[key];
            if (existing && existing.IsMap() && kv.second.IsMap()) {
                merge_nodes(base[key], kv.second);
            } else {
                base[key] = YAML::Clone(kv.second);
            }
        }
    };

    if (!root_.IsMap() && other.root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }
    merge_nodes(root_, other.root_);
}

std::optional<YAML::Node> Config::GetNestedNode(std::string_view key) const {
    std::vector<std::string> parts = absl::StrSplit(std::string(key), '.');

    // reset() rebinds the handle; plain assignment would write into root_
    YAML::Node current;
    current.reset(root_);

    for (const auto& part : parts) {
        if (!current.IsMap()) {
            return std::nullopt;
        }
        const YAML::Node child = std::as_const(current)[part];
        if (!child) {
            return std::nullopt;
        }
        current.reset(child);
    }

    if (current.IsNull()) {
        return std::nullopt;
    }

    return current;
}

std::string Config::GetString(std::string_view key, std::string_view default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        return node->as<std::string>();
    }
    return std::string(default_value);
}

int64_t Config::GetInt(std::string_view key, int64_t default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<int64_t>();
        } catch (const YAML::Exception&) {
            return default_value;
        }
    }
    return default_value;
}

double Config::GetDouble(std::string_view key, double default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<double>();
        } catch (const YAML::Exception&) {
            return default_value;
        }
    }
    return default_value;
}

bool Config::GetBool(std::string_view key, bool default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<bool>();
        } catch (const YAML::Exception&) {
            return default_value;
        }
    }
    return default_value;
}

bool Config::HasKey(std::string_view key) const {
    return GetNestedNode(key).has_value();
}

void Config::Set(std::string_view key, ConfigValue value) {
    std::vector<std::string> parts = absl::StrSplit(std::string(key), '.');

    if (!root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }

    YAML::Node current;
    current.reset(root_);
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        if (!std::as_const(current)[parts[i]].IsMap()) {
            current[parts[i]] = YAML::Node(YAML::NodeType::Map);
        }
        YAML::Node next = current[parts[i]];
        current.reset(next);
    }

    std::visit([&](const auto& val) { current[parts.back()] = val; }, value);
}

nlohmann::json Config::ToJson() const {
    return NodeToJson(root_);
}

}  // namespace promptguard
