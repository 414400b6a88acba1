#pragma once
#include "../../../shared/cpp/lore_core/include/config.hpp"
#include "../../../shared/cpp/lore_core/include/entity.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

class GenerationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Produces the natural-language description of one entity. Implementations
// throw GenerationError and never substitute text of their own.
class DescriptionGenerator {
public:
    virtual ~DescriptionGenerator() = default;
    virtual std::string provider() const = 0;
    virtual std::string generate(const ParsedEntity& e,
                                 const std::optional<std::string>& context = std::nullopt) = 0;
    virtual std::vector<std::string> generate_batch(const std::vector<ParsedEntity>& entities,
                                                    const std::optional<std::string>& context = std::nullopt);
};

std::string build_prompt(const ParsedEntity& e, const std::optional<std::string>& context);
std::string truncate_source(const std::string& source, std::size_t max_chars);
// Recorded by the pipeline when generation fails and placeholders are enabled.
std::string placeholder_description(const ParsedEntity& e);

// Description text in a provider's chat reply body. Anything else, including
// well-formed JSON of the wrong shape, throws GenerationError.
std::string ollama_reply_text(const std::string& body);
std::string openai_reply_text(const std::string& body);
std::string anthropic_reply_text(const std::string& body);

class MockGenerator : public DescriptionGenerator {
public:
    std::string provider() const override { return "mock"; }
    std::string generate(const ParsedEntity& e,
                         const std::optional<std::string>& context = std::nullopt) override;
};

// Shared prompt handling for the HTTP chat providers.
class ChatGenerator : public DescriptionGenerator {
public:
    std::string provider() const override { return provider_; }
    std::string generate(const ParsedEntity& e,
                         const std::optional<std::string>& context = std::nullopt) override;
    std::string model_for(Scope scope) const;

protected:
    ChatGenerator(const Config& cfg, std::string provider, std::string default_model);
    virtual std::string request(const std::string& model, const std::string& user_message) = 0;

    Config cfg_;
    std::string provider_;
    std::string default_model_;
};

class OllamaGenerator : public ChatGenerator {
public:
    explicit OllamaGenerator(const Config& cfg);

protected:
    std::string request(const std::string& model, const std::string& user_message) override;
};

class OpenAIGenerator : public ChatGenerator {
public:
    explicit OpenAIGenerator(const Config& cfg);

protected:
    std::string request(const std::string& model, const std::string& user_message) override;
};

class AnthropicGenerator : public ChatGenerator {
public:
    explicit AnthropicGenerator(const Config& cfg);

protected:
    std::string request(const std::string& model, const std::string& user_message) override;
};

using GeneratorFactory = std::function<std::unique_ptr<DescriptionGenerator>(const Config&)>;

void register_generator(const std::string& provider, GeneratorFactory factory);
std::vector<std::string> generator_names();
// Throws std::invalid_argument for an unregistered provider.
std::unique_ptr<DescriptionGenerator> make_generator(const Config& cfg, const std::string& provider);
