#include "../include/config.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

Paths make_paths(const std::filesystem::path& root) {
    Paths p;
    p.root_dir = root;
    p.state_dir = root / ".codelore";
    p.sidecar_dir = p.state_dir / "lore";
    p.config_file = p.state_dir / "config.json";
    p.hash_db = p.state_dir / "hash-index.db";
    return p;
}

std::filesystem::path find_project_root(const std::filesystem::path& start) {
    auto path = std::filesystem::absolute(start).lexically_normal();
    if (std::filesystem::is_regular_file(path)) path = path.parent_path();
    while (true) {
        if (std::filesystem::is_directory(path / ".codelore")) return path;
        if (path == path.parent_path() || path.empty()) break;
        path = path.parent_path();
    }
    throw std::runtime_error("no .codelore directory found from " + start.string() +
                             " (run 'codelore init' first)");
}

std::optional<std::string> model_for_scope(const Config& cfg,
                                           const std::string& provider,
                                           std::optional<Scope> scope) {
    auto it = cfg.model_settings.find(provider);
    if (it == cfg.model_settings.end()) return std::nullopt;
    const ModelConfig& m = it->second;
    if (scope) {
        auto s = m.by_scope.find(scope_name(*scope));
        if (s != m.by_scope.end() && !s->second.empty()) return s->second;
    }
    return m.default_model;
}

json config_to_json(const Config& cfg) {
    json models = json::object();
    for (const auto& kv : cfg.model_settings) {
        json m = json::object();
        if (kv.second.default_model) m["default"] = *kv.second.default_model;
        for (const auto& s : kv.second.by_scope) m[s.first] = s.second;
        models[kv.first] = m;
    }
    return json{
        {"languages", cfg.languages},
        {"provider", cfg.provider},
        {"model_settings", models},
        {"fail_on_stale", cfg.fail_on_stale},
        {"auto_update", cfg.auto_update},
        {"history_cap", cfg.history_cap},
        {"max_parallelism", cfg.max_parallelism},
        {"ollama_url", cfg.ollama_url},
        {"timeout_ms", cfg.timeout_ms},
        {"max_source_chars", cfg.max_source_chars},
        {"placeholder_on_failure", cfg.placeholder_on_failure},
        {"ignore_dirs", cfg.ignore_dirs}
    };
}

Config config_from_json(const json& j) {
    Config cfg;
    if (!j.is_object()) throw std::invalid_argument("config must be a JSON object");
    cfg.languages = j.value("languages", cfg.languages);
    cfg.provider = j.value("provider", cfg.provider);
    cfg.fail_on_stale = j.value("fail_on_stale", cfg.fail_on_stale);
    cfg.auto_update = j.value("auto_update", cfg.auto_update);
    cfg.history_cap = std::max(1, j.value("history_cap", cfg.history_cap));
    cfg.max_parallelism = std::max(1, j.value("max_parallelism", cfg.max_parallelism));
    cfg.ollama_url = j.value("ollama_url", cfg.ollama_url);
    cfg.timeout_ms = j.value("timeout_ms", cfg.timeout_ms);
    cfg.max_source_chars = j.value("max_source_chars", cfg.max_source_chars);
    cfg.placeholder_on_failure = j.value("placeholder_on_failure", cfg.placeholder_on_failure);
    cfg.ignore_dirs = j.value("ignore_dirs", cfg.ignore_dirs);
    if (j.contains("model_settings") && j["model_settings"].is_object()) {
        for (auto it = j["model_settings"].begin(); it != j["model_settings"].end(); ++it) {
            if (!it.value().is_object()) continue;
            ModelConfig m;
            for (auto s = it.value().begin(); s != it.value().end(); ++s) {
                if (!s.value().is_string()) continue;
                if (s.key() == "default") m.default_model = s.value().get<std::string>();
                else if (parse_scope(s.key())) m.by_scope[s.key()] = s.value().get<std::string>();
            }
            cfg.model_settings[it.key()] = m;
        }
    }
    return cfg;
}

Config load_config(const std::filesystem::path& file) {
    if (!std::filesystem::exists(file)) return Config{};
    try {
        return config_from_json(json::parse(read_text_file(file)));
    } catch (const std::exception& e) {
        std::cerr << "[config] ignoring malformed " << file.string() << ": " << e.what() << std::endl;
        return Config{};
    }
}

void save_config(const Config& cfg, const std::filesystem::path& file) {
    write_text_file_atomic(file, config_to_json(cfg).dump(2) + "\n");
}

void apply_env_overrides(Config& cfg) {
    cfg.provider = getenv_or("CODELORE_PROVIDER", cfg.provider);
    std::string model = getenv_or("CODELORE_MODEL", "");
    if (!model.empty()) cfg.model_settings[cfg.provider].default_model = model;
    cfg.ollama_url = getenv_or("OLLAMA_URL", cfg.ollama_url);
    cfg.openai_api_key = getenv_or("OPENAI_API_KEY", cfg.openai_api_key);
    cfg.anthropic_api_key = getenv_or("ANTHROPIC_API_KEY", cfg.anthropic_api_key);
}

namespace {

std::vector<std::string> split_list(const std::string& v) {
    std::vector<std::string> out;
    std::stringstream ss(v);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

bool parse_bool(const std::string& key, const std::string& v) {
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    throw std::invalid_argument(key + ": expected a boolean, got '" + v + "'");
}

// "model.<provider>.<scope>" -> {provider, scope}
std::pair<std::string, std::string> split_model_key(const std::string& key) {
    auto dot = key.find('.', 6);
    if (dot == std::string::npos || dot == 6 || dot + 1 >= key.size()) {
        throw std::invalid_argument("expected model.<provider>.<scope>, got '" + key + "'");
    }
    std::string scope = key.substr(dot + 1);
    if (scope != "default" && !parse_scope(scope)) {
        throw std::invalid_argument("unknown scope '" + scope + "'");
    }
    return {key.substr(6, dot - 6), scope};
}

} // namespace

long parse_long(const std::string& key, const std::string& v, long min) {
    long n = 0;
    try {
        size_t used = 0;
        n = std::stol(v, &used);
        if (used != v.size()) throw std::invalid_argument(v);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(key + ": expected an integer, got '" + v + "'");
    }
    if (n < min) throw std::invalid_argument(key + ": must be at least " + std::to_string(min));
    return n;
}

std::optional<std::string> config_get(const Config& cfg, const std::string& key) {
    if (starts_with(key, "model.")) {
        auto ps = split_model_key(key);
        auto it = cfg.model_settings.find(ps.first);
        if (it == cfg.model_settings.end()) return std::nullopt;
        if (ps.second == "default") return it->second.default_model;
        auto s = it->second.by_scope.find(ps.second);
        if (s == it->second.by_scope.end()) return std::nullopt;
        return s->second;
    }
    if (key == "languages") return join_lines(cfg.languages, ",");
    if (key == "ignore_dirs") return join_lines(cfg.ignore_dirs, ",");
    json j = config_to_json(cfg);
    if (key == "model_settings" || !j.contains(key)) return std::nullopt;
    const json& v = j[key];
    return v.is_string() ? v.get<std::string>() : v.dump();
}

void config_set(Config& cfg, const std::string& key, const std::string& value) {
    if (starts_with(key, "model.")) {
        auto ps = split_model_key(key);
        ModelConfig& m = cfg.model_settings[ps.first];
        if (ps.second == "default") m.default_model = value;
        else m.by_scope[ps.second] = value;
    } else if (key == "languages") {
        cfg.languages = split_list(value);
    } else if (key == "ignore_dirs") {
        cfg.ignore_dirs = split_list(value);
    } else if (key == "provider") {
        cfg.provider = value;
    } else if (key == "fail_on_stale") {
        cfg.fail_on_stale = parse_bool(key, value);
    } else if (key == "auto_update") {
        cfg.auto_update = parse_bool(key, value);
    } else if (key == "placeholder_on_failure") {
        cfg.placeholder_on_failure = parse_bool(key, value);
    } else if (key == "history_cap") {
        cfg.history_cap = (int)parse_long(key, value, 1);
    } else if (key == "max_parallelism") {
        cfg.max_parallelism = (int)parse_long(key, value, 1);
    } else if (key == "timeout_ms") {
        cfg.timeout_ms = parse_long(key, value, 1);
    } else if (key == "max_source_chars") {
        cfg.max_source_chars = (int)parse_long(key, value, 1);
    } else if (key == "ollama_url") {
        cfg.ollama_url = value;
    } else {
        throw std::invalid_argument("unknown config key '" + key + "'");
    }
}
