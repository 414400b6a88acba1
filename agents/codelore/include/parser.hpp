#pragma once
#include "../../../shared/cpp/lore_core/include/entity.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Turns one source file into describable entities: a module entity for the
// whole file followed by its classes and functions in source order.
class SourceParser {
public:
    virtual ~SourceParser() = default;
    virtual std::string language() const = 0;
    // path is the project-relative path recorded in each entity's location.
    virtual std::vector<ParsedEntity> parse(const std::string& source, const std::string& path) const = 0;
};

// Walks the tree-sitter syntax tree of one language, collecting the node
// types that language uses for classes and functions. Members are qualified
// by their enclosing entity ("Greeter.hello"), Go methods by their receiver
// type and C++ out-of-class definitions by their qualifier.
class TreeSitterParser : public SourceParser {
public:
    // Throws std::invalid_argument for a language without a linked grammar.
    explicit TreeSitterParser(std::string language);
    std::string language() const override { return language_; }
    std::vector<ParsedEntity> parse(const std::string& source, const std::string& path) const override;

private:
    std::string language_;
};

std::optional<std::string> detect_language(const std::filesystem::path& p);
std::vector<std::string> extensions_for(const std::string& language);
// Languages with a linked grammar, sorted.
std::vector<std::string> parser_languages();
// nullptr when no parser handles the language.
std::unique_ptr<SourceParser> make_parser(const std::string& language);

ParsedEntity make_entity(Scope scope, const std::string& name,
                         const std::optional<std::string>& parent,
                         const std::string& path, int start_line, int end_line,
                         const std::string& source, const std::string& language);

// Entities of one file that share scope and name (overloads, property
// getter/setter pairs, repeated impl blocks) get "#2", "#3"... in source
// order, so every entity keeps its own identity.
void disambiguate_names(std::vector<ParsedEntity>& entities);
