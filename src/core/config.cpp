#include "config.hpp"
#include "constants.hpp"
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

// Accepts either "prereqs: setup:run" or "prereqs: [a:run, b:run]".
static std::vector<std::string> parse_string_list(const YAML::Node& node) {
    std::vector<std::string> out;
    if (!node) return out;
    if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
    } else if (node.IsSequence()) {
        for (const auto& item : node) {
            out.push_back(item.as<std::string>());
        }
    }
    return out;
}

static bool valid_namespace_name(const std::string& name) {
    return !name.empty() && name.find_first_of(" \t\r\n") == std::string::npos;
}

bool project_config_exists(const fs::path& dir) {
    return fs::exists(get_project_config_path(dir));
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / PROJECT_CONFIG_FILE;
}

const NamespaceConfig* Config::find_namespace(const std::string& name) const {
    for (const auto& ns : namespaces_) {
        if (ns.name == name) return &ns;
    }
    return nullptr;
}

Result<Config> Config::parse(const std::string& yaml, const std::string& origin) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("Failed to parse {}: {}", origin, e.what()));
    }

    if (!root.IsMap()) {
        return Result<Config>::Err(fmt::format("{}: expected a mapping at top level", origin));
    }

    Config config;
    try {
        config.marker_ = root["marker"].as<std::string>(DEFAULT_RUNTIME_MARKER);
        config.log_file_ = root["log_file"].as<std::string>("");

        const YAML::Node namespaces = root["namespaces"];
        if (!namespaces || !namespaces.IsMap()) {
            return Result<Config>::Err(fmt::format("{}: 'namespaces' must be a mapping", origin));
        }

        for (const auto& kv : namespaces) {
            NamespaceConfig ns;
            ns.name = kv.first.as<std::string>();
            if (!valid_namespace_name(ns.name)) {
                return Result<Config>::Err(fmt::format(
                    "{}: invalid namespace name '{}'", origin, ns.name));
            }

            const YAML::Node& node = kv.second;
            if (!node.IsMap() || !node["command"] || !node["command"].IsScalar()) {
                return Result<Config>::Err(fmt::format(
                    "{}: namespace '{}' needs a 'command'", origin, ns.name));
            }
            ns.command = node["command"].as<std::string>();
            ns.description = node["description"].as<std::string>("");
            ns.directory = node["directory"].as<std::string>("");
            ns.prereqs = parse_string_list(node["prereqs"]);

            config.namespaces_.push_back(std::move(ns));
        }
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("Failed to read {}: {}", origin, e.what()));
    }

    if (config.namespaces_.empty()) {
        return Result<Config>::Err(fmt::format("{}: no namespaces defined", origin));
    }
    return Result<Config>::Ok(std::move(config));
}

Result<Config> Config::load_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Cannot open " + path.string());
    }
    std::stringstream buf;
    buf << in.rdbuf();

    auto result = parse(buf.str(), path.string());
    if (result.is_ok()) {
        result.value.path_ = path;
    }
    return result;
}

Result<Config> Config::load_project(const fs::path& dir) {
    fs::path path = get_project_config_path(dir);
    if (!fs::exists(path)) {
        return Result<Config>::Err(fmt::format("No {} found in {}", PROJECT_CONFIG_FILE, dir.string()));
    }
    return load_file(path);
}
