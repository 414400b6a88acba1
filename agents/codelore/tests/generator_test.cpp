#include "../include/generator.hpp"
#include <gtest/gtest.h>
#include <algorithm>

namespace {

ParsedEntity entity(Scope scope, const std::string& name, const std::string& source = "def f():\n    pass\n") {
    ParsedEntity e;
    e.scope = scope;
    e.name = name;
    e.location = CodeLocation{"src/app.py", 1, 2};
    e.source = source;
    e.language = "python";
    return e;
}

// Records what would go over the wire and answers with a canned reply.
class ScriptedChat : public ChatGenerator {
public:
    ScriptedChat(const Config& cfg, std::string reply)
        : ChatGenerator(cfg, "scripted", "base-model"), reply_(std::move(reply)) {}

    std::string last_model;
    std::string last_message;

protected:
    std::string request(const std::string& model, const std::string& user_message) override {
        last_model = model;
        last_message = user_message;
        return reply_;
    }

private:
    std::string reply_;
};

} // namespace

TEST(MockGeneratorTest, DescribesByScope) {
    MockGenerator g;
    EXPECT_EQ(g.provider(), "mock");
    EXPECT_EQ(g.generate(entity(Scope::Function, "add")), "Function add in python.");
    EXPECT_EQ(g.generate(entity(Scope::Class, "Greeter")), "Class Greeter in python.");
    EXPECT_EQ(g.generate(entity(Scope::Module, "app")), "Module app written in python.");

    auto batch = g.generate_batch({entity(Scope::Function, "a"), entity(Scope::Function, "b")});
    ASSERT_EQ(batch.size(), 2u);
    EXPECT_EQ(batch[1], "Function b in python.");
}

TEST(PromptTest, ScopeSpecificTemplates) {
    auto fn = build_prompt(entity(Scope::Function, "add"), std::nullopt);
    EXPECT_NE(fn.find("Function name: add"), std::string::npos);
    EXPECT_NE(fn.find("Language: python"), std::string::npos);

    auto cls = build_prompt(entity(Scope::Class, "Greeter"), std::string("Part of the greeting service."));
    EXPECT_NE(cls.find("Class name: Greeter"), std::string::npos);
    EXPECT_NE(cls.find("Context: Part of the greeting service."), std::string::npos);

    auto pkg = build_prompt(entity(Scope::Package, "src"), std::nullopt);
    EXPECT_NE(pkg.find("package named src"), std::string::npos);
}

TEST(PromptTest, TruncateAndPlaceholder) {
    EXPECT_EQ(truncate_source("short", 10), "short");
    EXPECT_EQ(truncate_source("abcdefghij", 4), "abcd\n... (truncated)");
    EXPECT_EQ(placeholder_description(entity(Scope::Function, "add")), "Description unavailable for function add.");
}

TEST(ChatGeneratorTest, PicksScopeModelAndTrimsReply) {
    Config cfg;
    cfg.model_settings["scripted"].by_scope["function"] = "fn-model";
    cfg.max_source_chars = 8;
    ScriptedChat g(cfg, "  Adds numbers.\n\n");

    EXPECT_EQ(g.generate(entity(Scope::Function, "add", "def add(a, b):\n    return a + b\n")), "Adds numbers.");
    EXPECT_EQ(g.last_model, "fn-model");
    EXPECT_NE(g.last_message.find("def add(\n... (truncated)"), std::string::npos);
    EXPECT_EQ(g.last_message.find("return a + b"), std::string::npos);

    g.generate(entity(Scope::Class, "C"));
    EXPECT_EQ(g.last_model, "base-model");
    EXPECT_EQ(g.provider(), "scripted");
}

TEST(ChatGeneratorTest, EmptyReplyIsAnError) {
    Config cfg;
    ScriptedChat g(cfg, " \n ");
    EXPECT_THROW(g.generate(entity(Scope::Function, "f")), GenerationError);
}

TEST(ChatGeneratorTest, UnreachableServerIsGenerationError) {
    Config cfg;
    cfg.ollama_url = "http://127.0.0.1:9";
    cfg.timeout_ms = 2000;
    OllamaGenerator g(cfg);
    EXPECT_EQ(g.model_for(Scope::Function), "llama3.2");
    EXPECT_THROW(g.generate(entity(Scope::Function, "f")), GenerationError);
}

TEST(ReplyParsingTest, ExtractsText) {
    EXPECT_EQ(ollama_reply_text(R"({"message": {"role": "assistant", "content": "Adds."}})"), "Adds.");
    EXPECT_EQ(openai_reply_text(R"({"choices": [{"message": {"content": "Adds."}}]})"), "Adds.");
    EXPECT_EQ(anthropic_reply_text(R"({"content": [{"type": "thinking"}, {"type": "text", "text": "Adds."}]})"),
              "Adds.");
}

TEST(ReplyParsingTest, WrongShapesAreGenerationErrors) {
    for (const char* body : {"[]", "\"text\"", "42", "null", "not json", "{}"}) {
        EXPECT_THROW(ollama_reply_text(body), GenerationError) << body;
        EXPECT_THROW(openai_reply_text(body), GenerationError) << body;
        EXPECT_THROW(anthropic_reply_text(body), GenerationError) << body;
    }
    EXPECT_THROW(ollama_reply_text(R"({"message": "Adds."})"), GenerationError);
    EXPECT_THROW(ollama_reply_text(R"({"message": {"content": 7}})"), GenerationError);
    EXPECT_THROW(openai_reply_text(R"({"choices": {"message": "x"}})"), GenerationError);
    EXPECT_THROW(openai_reply_text(R"({"choices": ["x"]})"), GenerationError);
    EXPECT_THROW(openai_reply_text(R"({"choices": [{"message": "x"}]})"), GenerationError);
    EXPECT_THROW(anthropic_reply_text(R"({"content": "Adds."})"), GenerationError);
    EXPECT_THROW(anthropic_reply_text(R"({"content": ["Adds.", {"type": "text", "text": 1}]})"), GenerationError);
}

TEST(GeneratorRegistryTest, BuiltinsAndCustom) {
    auto names = generator_names();
    for (const char* p : {"mock", "ollama", "openai", "anthropic"}) {
        EXPECT_NE(std::find(names.begin(), names.end(), p), names.end()) << p;
    }

    Config cfg;
    EXPECT_EQ(make_generator(cfg, "mock")->provider(), "mock");
    EXPECT_THROW(make_generator(cfg, "nope"), std::invalid_argument);

    cfg.openai_api_key.clear();
    EXPECT_THROW(make_generator(cfg, "openai"), std::invalid_argument);
    cfg.anthropic_api_key = "key";
    EXPECT_EQ(make_generator(cfg, "anthropic")->provider(), "anthropic");

    register_generator("scripted", [](const Config& c) {
        return std::unique_ptr<DescriptionGenerator>(new ScriptedChat(c, "ok"));
    });
    EXPECT_EQ(make_generator(cfg, "scripted")->generate(entity(Scope::Function, "f")), "ok");
}
