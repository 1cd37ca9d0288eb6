#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load ./lifeline.yaml (or <dir>/lifeline.yaml)
    static Result<Config> load_project(const fs::path& dir = fs::current_path());

    // Load an explicit config file
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text; `origin` is only used in error messages
    static Result<Config> parse(const std::string& yaml, const std::string& origin = "<string>");

    // Accessors
    const std::vector<NamespaceConfig>& namespaces() const { return namespaces_; }
    const std::string& marker() const { return marker_; }
    const std::string& log_file() const { return log_file_; }
    const fs::path& path() const { return path_; }

    const NamespaceConfig* find_namespace(const std::string& name) const;

public:
    Config() = default;

private:
    std::vector<NamespaceConfig> namespaces_;
    std::string marker_;
    std::string log_file_;
    fs::path path_;
};

bool project_config_exists(const fs::path& dir = fs::current_path());
fs::path get_project_config_path(const fs::path& dir = fs::current_path());
