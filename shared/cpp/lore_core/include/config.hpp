#pragma once
#include "entity.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

struct Paths {
    std::filesystem::path root_dir;
    std::filesystem::path state_dir;    // <root>/.codelore
    std::filesystem::path sidecar_dir;  // <root>/.codelore/lore
    std::filesystem::path config_file;
    std::filesystem::path hash_db;
};

Paths make_paths(const std::filesystem::path& root);
// Walks upwards from start to the first directory holding .codelore/.
std::filesystem::path find_project_root(const std::filesystem::path& start);

struct ModelConfig {
    std::optional<std::string> default_model;
    std::map<std::string, std::string> by_scope; // scope name -> model
};

struct Config {
    std::vector<std::string> languages{"python"};
    std::string provider{"mock"};
    std::map<std::string, ModelConfig> model_settings;
    bool fail_on_stale{false};
    bool auto_update{false};
    int history_cap{10};
    int max_parallelism{8};
    std::string ollama_url{"http://localhost:11434"};
    long timeout_ms{240000};
    int max_source_chars{8192};
    bool placeholder_on_failure{true};
    std::vector<std::string> ignore_dirs{".git", ".codelore", "build", "out", "bin", "obj",
                                         "node_modules", "venv", ".venv", "dist", "target",
                                         "__pycache__"};

    // Environment only; never written to config.json.
    std::string openai_api_key;
    std::string anthropic_api_key;
};

// Scope-specific model, else the provider default, else none.
std::optional<std::string> model_for_scope(const Config& cfg,
                                           const std::string& provider,
                                           std::optional<Scope> scope);

nlohmann::json config_to_json(const Config& cfg);
Config config_from_json(const nlohmann::json& j);

// Missing file gives defaults; a malformed one gives defaults and a warning.
Config load_config(const std::filesystem::path& file);
void save_config(const Config& cfg, const std::filesystem::path& file);
void apply_env_overrides(Config& cfg);

// Whole-string integer of at least min; std::invalid_argument naming key otherwise.
long parse_long(const std::string& key, const std::string& v, long min);

// Keys are the scalar field names, "languages", "ignore_dirs" and
// "model.<provider>.<scope|default>".
std::optional<std::string> config_get(const Config& cfg, const std::string& key);
void config_set(Config& cfg, const std::string& key, const std::string& value);
