#include "../include/entity.hpp"

const char* scope_name(Scope s) {
    switch (s) {
        case Scope::Project: return "project";
        case Scope::Package: return "package";
        case Scope::Module: return "module";
        case Scope::Class: return "class";
        case Scope::Function: return "function";
    }
    return "function";
}

std::optional<Scope> parse_scope(const std::string& s) {
    if (s == "project") return Scope::Project;
    if (s == "package") return Scope::Package;
    if (s == "module") return Scope::Module;
    if (s == "class") return Scope::Class;
    if (s == "function") return Scope::Function;
    return std::nullopt;
}

std::string EntityIdentity::key() const {
    return std::string(scope_name(scope)) + "|" + path + "|" + name;
}

EntityIdentity identity_of(const ParsedEntity& e) {
    return EntityIdentity{e.scope, e.name, e.location.path};
}
