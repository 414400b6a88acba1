#include "../include/generator.hpp"
#include "../include/http.hpp"
#include "../../../shared/cpp/lore_core/include/util.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <mutex>

using json = nlohmann::json;

namespace {

const char* kFunctionPrompt =
    "You are a code documentation expert. Generate a clear, concise description of the following function.\n\n"
    "Function name: {name}\n"
    "Language: {language}\n\n"
    "Provide a 1-2 sentence description of what this function does, its inputs, and its output.";

const char* kClassPrompt =
    "You are a code documentation expert. Generate a clear, concise description of the following class.\n\n"
    "Class name: {name}\n"
    "Language: {language}\n\n"
    "Provide a 1-2 sentence description of this class's purpose and key functionality.";

const char* kModulePrompt =
    "You are a code documentation expert. Generate a clear, concise description of the following module.\n\n"
    "Module name: {name}\n"
    "Language: {language}\n\n"
    "Provide a 2-3 sentence overview of this module's purpose and main exports.";

std::string fill(std::string tmpl, const ParsedEntity& e) {
    auto sub = [&tmpl](const std::string& key, const std::string& value) {
        auto pos = tmpl.find(key);
        if (pos != std::string::npos) tmpl.replace(pos, key.size(), value);
    };
    sub("{name}", e.name);
    sub("{language}", e.language);
    return tmpl;
}

void check_status(const HttpResponse& r, const std::string& provider) {
    if (r.status < 200 || r.status >= 300) {
        throw GenerationError(provider + " request failed: status " + std::to_string(r.status) +
                              ": " + r.body.substr(0, 200));
    }
}

json parse_object(const std::string& body, const std::string& provider) {
    auto data = json::parse(body, nullptr, false);
    if (data.is_discarded()) throw GenerationError(provider + " returned invalid JSON");
    if (!data.is_object()) throw GenerationError(provider + " returned " + data.type_name() + ", expected an object");
    return data;
}

// Runs an extractor over a reply, turning JSON access errors into GenerationError.
template <typename F>
std::string extract(const std::string& provider, const std::string& body, F&& f) {
    try {
        return f(parse_object(body, provider));
    } catch (const json::exception& e) {
        throw GenerationError(provider + " response has unexpected shape: " + e.what());
    }
}

HttpResponse post(const std::string& provider, const std::string& url, const json& body,
                  long timeout_ms, const std::vector<std::string>& headers = {}) {
    try {
        return http_post_json(url, body.dump(), timeout_ms, headers);
    } catch (const std::runtime_error& e) {
        throw GenerationError(provider + ": " + e.what());
    }
}

struct Registry {
    std::mutex mtx;
    std::map<std::string, GeneratorFactory> factories;

    Registry() {
        factories["mock"] = [](const Config&) { return std::unique_ptr<DescriptionGenerator>(new MockGenerator()); };
        factories["ollama"] = [](const Config& c) { return std::unique_ptr<DescriptionGenerator>(new OllamaGenerator(c)); };
        factories["openai"] = [](const Config& c) { return std::unique_ptr<DescriptionGenerator>(new OpenAIGenerator(c)); };
        factories["anthropic"] = [](const Config& c) { return std::unique_ptr<DescriptionGenerator>(new AnthropicGenerator(c)); };
    }
};

Registry& registry() {
    static Registry r;
    return r;
}

} // namespace

std::vector<std::string> DescriptionGenerator::generate_batch(const std::vector<ParsedEntity>& entities,
                                                              const std::optional<std::string>& context) {
    std::vector<std::string> out;
    out.reserve(entities.size());
    for (const auto& e : entities) out.push_back(generate(e, context));
    return out;
}

std::string build_prompt(const ParsedEntity& e, const std::optional<std::string>& context) {
    std::string base;
    switch (e.scope) {
        case Scope::Function: base = fill(kFunctionPrompt, e); break;
        case Scope::Class: base = fill(kClassPrompt, e); break;
        case Scope::Module: base = fill(kModulePrompt, e); break;
        default:
            base = std::string("Generate a concise 1-2 sentence description for this ") +
                   scope_name(e.scope) + " named " + e.name + " in " + e.language + ".";
            break;
    }
    if (context && !context->empty()) base += "\n\nContext: " + *context;
    return base;
}

std::string truncate_source(const std::string& source, std::size_t max_chars) {
    if (source.size() <= max_chars) return source;
    return source.substr(0, max_chars) + "\n... (truncated)";
}

std::string placeholder_description(const ParsedEntity& e) {
    return std::string("Description unavailable for ") + scope_name(e.scope) + " " + e.name + ".";
}

std::string MockGenerator::generate(const ParsedEntity& e, const std::optional<std::string>&) {
    switch (e.scope) {
        case Scope::Function: return "Function " + e.name + " in " + e.language + ".";
        case Scope::Class: return "Class " + e.name + " in " + e.language + ".";
        case Scope::Module: return "Module " + e.name + " written in " + e.language + ".";
        case Scope::Package: return "Package " + e.name + " containing related modules.";
        case Scope::Project: return "Project at " + e.location.path + ".";
    }
    return std::string(scope_name(e.scope)) + " " + e.name + ".";
}

ChatGenerator::ChatGenerator(const Config& cfg, std::string provider, std::string default_model)
    : cfg_(cfg), provider_(std::move(provider)), default_model_(std::move(default_model)) {}

std::string ChatGenerator::model_for(Scope scope) const {
    return model_for_scope(cfg_, provider_, scope).value_or(default_model_);
}

std::string ChatGenerator::generate(const ParsedEntity& e, const std::optional<std::string>& context) {
    std::string user = build_prompt(e, context) + "\n\nSource code:\n```\n" +
                       truncate_source(e.source, (std::size_t)cfg_.max_source_chars) + "\n```";
    std::string text = trim(request(model_for(e.scope), user));
    if (text.empty()) throw GenerationError(provider_ + " returned an empty description for " + e.name);
    return text;
}

OllamaGenerator::OllamaGenerator(const Config& cfg) : ChatGenerator(cfg, "ollama", "llama3.2") {}

std::string OllamaGenerator::request(const std::string& model, const std::string& user_message) {
    json body = {
        {"model", model},
        {"stream", false},
        {"messages", json::array({json{{"role", "user"}, {"content", user_message}}})}
    };
    auto r = post(provider_, cfg_.ollama_url + "/api/chat", body, cfg_.timeout_ms);
    check_status(r, provider_);
    return ollama_reply_text(r.body);
}

OpenAIGenerator::OpenAIGenerator(const Config& cfg) : ChatGenerator(cfg, "openai", "gpt-4o") {
    if (cfg_.openai_api_key.empty()) throw std::invalid_argument("OPENAI_API_KEY is not set");
}

std::string OpenAIGenerator::request(const std::string& model, const std::string& user_message) {
    json body = {
        {"model", model},
        {"max_tokens", 1024},
        {"messages", json::array({json{{"role", "user"}, {"content", user_message}}})}
    };
    auto r = post(provider_, "https://api.openai.com/v1/chat/completions", body, cfg_.timeout_ms,
                  {"Authorization: Bearer " + cfg_.openai_api_key});
    check_status(r, provider_);
    return openai_reply_text(r.body);
}

AnthropicGenerator::AnthropicGenerator(const Config& cfg)
    : ChatGenerator(cfg, "anthropic", "claude-sonnet-4-5-20250929") {
    if (cfg_.anthropic_api_key.empty()) throw std::invalid_argument("ANTHROPIC_API_KEY is not set");
}

std::string AnthropicGenerator::request(const std::string& model, const std::string& user_message) {
    json body = {
        {"model", model},
        {"max_tokens", 1024},
        {"messages", json::array({json{{"role", "user"}, {"content", user_message}}})}
    };
    auto r = post(provider_, "https://api.anthropic.com/v1/messages", body, cfg_.timeout_ms,
                  {"x-api-key: " + cfg_.anthropic_api_key, "anthropic-version: 2023-06-01"});
    check_status(r, provider_);
    return anthropic_reply_text(r.body);
}

std::string ollama_reply_text(const std::string& body) {
    return extract("ollama", body, [](const json& data) {
        auto it = data.find("message");
        if (it == data.end() || !it->is_object() || !it->contains("content") || !(*it)["content"].is_string()) {
            throw GenerationError("ollama response has no message content");
        }
        return (*it)["content"].get<std::string>();
    });
}

std::string openai_reply_text(const std::string& body) {
    return extract("openai", body, [](const json& data) {
        auto it = data.find("choices");
        if (it == data.end() || !it->is_array() || it->empty() || !(*it)[0].is_object()) {
            throw GenerationError("openai response has no choices");
        }
        const json& choice = (*it)[0];
        auto msg = choice.find("message");
        if (msg == choice.end() || !msg->is_object() || !msg->contains("content") ||
            !(*msg)["content"].is_string()) {
            throw GenerationError("openai response has no message content");
        }
        return (*msg)["content"].get<std::string>();
    });
}

std::string anthropic_reply_text(const std::string& body) {
    return extract("anthropic", body, [](const json& data) {
        auto it = data.find("content");
        if (it != data.end() && it->is_array()) {
            for (const auto& part : *it) {
                if (!part.is_object()) continue;
                auto type = part.find("type");
                auto text = part.find("text");
                if (type != part.end() && *type == "text" && text != part.end() && text->is_string()) {
                    return text->get<std::string>();
                }
            }
        }
        throw GenerationError("anthropic response has no text content");
    });
}

void register_generator(const std::string& provider, GeneratorFactory factory) {
    auto& r = registry();
    std::lock_guard<std::mutex> lock(r.mtx);
    r.factories[provider] = std::move(factory);
}

std::vector<std::string> generator_names() {
    auto& r = registry();
    std::lock_guard<std::mutex> lock(r.mtx);
    std::vector<std::string> out;
    for (const auto& kv : r.factories) out.push_back(kv.first);
    return out;
}

std::unique_ptr<DescriptionGenerator> make_generator(const Config& cfg, const std::string& provider) {
    GeneratorFactory f;
    {
        auto& r = registry();
        std::lock_guard<std::mutex> lock(r.mtx);
        auto it = r.factories.find(provider);
        if (it == r.factories.end()) throw std::invalid_argument("unknown provider '" + provider + "'");
        f = it->second;
    }
    return f(cfg);
}
