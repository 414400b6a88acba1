#pragma once
#include <string>
#include <optional>

// Ordered from widest to narrowest.
enum class Scope {
    Project,
    Package,
    Module,
    Class,
    Function
};

const char* scope_name(Scope s);
std::optional<Scope> parse_scope(const std::string& s);

struct CodeLocation {
    std::string path;   // project-relative, '/' separated
    int start_line{0};
    int end_line{0};
};

// One describable unit as handed over by a parser.
struct ParsedEntity {
    Scope scope{Scope::Function};
    std::string name;   // qualified: Parent.child for members
    std::optional<std::string> parent_name;
    CodeLocation location;
    std::string source;
    std::string fingerprint;
    std::string language;
};

// Stable across edits; the fingerprint is what changes.
struct EntityIdentity {
    Scope scope{Scope::Function};
    std::string name;
    std::string path;

    std::string key() const;
};

EntityIdentity identity_of(const ParsedEntity& e);
