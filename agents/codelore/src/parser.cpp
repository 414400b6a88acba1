#include "../include/parser.hpp"
#include "../../../shared/cpp/lore_core/include/normalize.hpp"
#include "../../../shared/cpp/lore_core/include/util.hpp"
#include <tree_sitter/api.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <map>
#include <set>
#include <stdexcept>

extern "C" {
const TSLanguage* tree_sitter_c(void);
const TSLanguage* tree_sitter_cpp(void);
const TSLanguage* tree_sitter_go(void);
const TSLanguage* tree_sitter_java(void);
const TSLanguage* tree_sitter_javascript(void);
const TSLanguage* tree_sitter_php(void);
const TSLanguage* tree_sitter_python(void);
const TSLanguage* tree_sitter_ruby(void);
const TSLanguage* tree_sitter_rust(void);
const TSLanguage* tree_sitter_tsx(void);
const TSLanguage* tree_sitter_typescript(void);
}

namespace {

const std::map<std::string, std::string>& language_map() {
    static const std::map<std::string, std::string> m = {
        {".py", "python"},     {".js", "javascript"}, {".jsx", "javascript"}, {".ts", "typescript"},
        {".tsx", "typescript"}, {".go", "go"},         {".rs", "rust"},         {".c", "c"},
        {".h", "c"},           {".cpp", "cpp"},       {".cc", "cpp"},          {".cxx", "cpp"},
        {".hpp", "cpp"},       {".java", "java"},     {".kt", "kotlin"},       {".swift", "swift"},
        {".rb", "ruby"},       {".php", "php"},       {".cs", "c_sharp"},      {".scala", "scala"},
        {".sh", "bash"},       {".yaml", "yaml"},     {".yml", "yaml"},        {".json", "json"},
        {".toml", "toml"},     {".md", "markdown"}
    };
    return m;
}

struct Grammar {
    const TSLanguage* (*language)();
    std::set<std::string> functions;
    std::set<std::string> classes;
};

const std::set<std::string> kJsFunctions = {
    "function_declaration", "generator_function_declaration", "function_expression", "function",
    "generator_function", "arrow_function", "method_definition"
};

const std::map<std::string, Grammar>& grammars() {
    static const std::map<std::string, Grammar> g = {
        {"python", {tree_sitter_python, {"function_definition"}, {"class_definition"}}},
        {"javascript", {tree_sitter_javascript, kJsFunctions, {"class_declaration", "class"}}},
        {"typescript", {tree_sitter_typescript, kJsFunctions,
                        {"class_declaration", "class", "abstract_class_declaration", "interface_declaration"}}},
        {"go", {tree_sitter_go, {"function_declaration", "method_declaration"}, {"type_spec"}}},
        {"rust", {tree_sitter_rust, {"function_item"}, {"struct_item", "enum_item", "trait_item", "impl_item"}}},
        {"java", {tree_sitter_java, {"method_declaration", "constructor_declaration"},
                  {"class_declaration", "interface_declaration", "enum_declaration", "record_declaration"}}},
        {"c", {tree_sitter_c, {"function_definition"}, {"struct_specifier"}}},
        {"cpp", {tree_sitter_cpp, {"function_definition"}, {"class_specifier", "struct_specifier"}}},
        {"ruby", {tree_sitter_ruby, {"method", "singleton_method"}, {"class", "module"}}},
        {"php", {tree_sitter_php, {"function_definition", "method_declaration"},
                 {"class_declaration", "interface_declaration", "trait_declaration"}}}
    };
    return g;
}

// Declarator wrappers between a C/C++ function_definition and its name.
const std::set<std::string> kDeclaratorWrappers = {
    "function_declarator", "pointer_declarator", "reference_declarator",
    "parenthesized_declarator", "attributed_declarator"
};

const std::set<std::string> kAnonymousFunctions = {
    "function_expression", "function", "generator_function", "arrow_function"
};

struct ParserHandle {
    TSParser* p;
    ParserHandle() : p(ts_parser_new()) {}
    ~ParserHandle() { ts_parser_delete(p); }
    ParserHandle(const ParserHandle&) = delete;
    ParserHandle& operator=(const ParserHandle&) = delete;
};

struct TreeHandle {
    TSTree* t;
    explicit TreeHandle(TSTree* tree) : t(tree) {}
    ~TreeHandle() { if (t) ts_tree_delete(t); }
    TreeHandle(const TreeHandle&) = delete;
    TreeHandle& operator=(const TreeHandle&) = delete;
};

std::string file_stem(const std::string& path) {
    return std::filesystem::path(path).stem().string();
}

TSNode field(TSNode n, const char* name) {
    return ts_node_child_by_field_name(n, name, (uint32_t)std::strlen(name));
}

// Whitespace dropped, template/generic arguments dropped, "::" -> ".".
std::string compact(const std::string& raw) {
    std::string s;
    for (char c : raw) {
        if (!std::isspace((unsigned char)c)) s += c;
    }
    if (!starts_with(s, "operator")) {
        std::string out;
        int depth = 0;
        for (char c : s) {
            if (c == '<' || c == '[') ++depth;
            else if ((c == '>' || c == ']') && depth > 0) --depth;
            else if (depth == 0) out += c;
        }
        s = out;
    }
    std::string out;
    for (size_t k = 0; k < s.size(); ++k) {
        if (s.compare(k, 2, "::") == 0) {
            if (!out.empty()) out += '.';
            ++k;
        } else {
            out += s[k];
        }
    }
    return out;
}

class Walker {
public:
    Walker(const std::string& src, const std::string& path, const std::string& language, const Grammar& grammar)
        : src_(src), path_(path), language_(language), grammar_(grammar) {}

    void walk(TSNode node, const std::optional<std::string>& parent) {
        const std::string type = ts_node_type(node);
        std::optional<std::string> inner = parent;
        const bool fn = grammar_.functions.count(type) > 0;
        const bool cls = !fn && grammar_.classes.count(type) > 0 && is_class(node, type);
        if (fn || cls) {
            auto local = name_of(node, type);
            if (local && !local->empty()) {
                std::string name = parent ? *parent + "." + *local : *local;
                std::optional<std::string> owner = parent;
                auto dot = local->rfind('.');
                if (!owner && dot != std::string::npos) owner = local->substr(0, dot);
                add(fn ? Scope::Function : Scope::Class, name, owner, span_of(node));
                inner = name;
            }
        }
        uint32_t n = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < n; ++i) walk(ts_node_named_child(node, i), inner);
    }

    std::vector<ParsedEntity> found;

private:
    std::string text(TSNode n) const {
        uint32_t b = ts_node_start_byte(n);
        uint32_t e = ts_node_end_byte(n);
        return src_.substr(b, e - b);
    }

    bool is_cpp_family() const { return language_ == "c" || language_ == "cpp"; }

    bool is_class(TSNode node, const std::string& type) const {
        if (type == "type_spec") {
            TSNode t = field(node, "type");
            if (ts_node_is_null(t)) return false;
            std::string tt = ts_node_type(t);
            return tt == "struct_type" || tt == "interface_type";
        }
        // forward declarations and elaborated type uses have no body
        if (is_cpp_family()) return !ts_node_is_null(field(node, "body"));
        return true;
    }

    // Decorators belong to what they decorate.
    TSNode span_of(TSNode node) const {
        TSNode p = ts_node_parent(node);
        if (!ts_node_is_null(p) && std::strcmp(ts_node_type(p), "decorated_definition") == 0) return p;
        return node;
    }

    std::optional<std::string> name_of(TSNode node, const std::string& type) const {
        if (is_cpp_family() && type == "function_definition") return declarator_name(node);
        if (type == "impl_item") {
            TSNode t = field(node, "type");
            if (ts_node_is_null(t)) return std::nullopt;
            return compact(text(t));
        }
        TSNode n = field(node, "name");
        if (!ts_node_is_null(n)) {
            std::string name = compact(text(n));
            if (type == "method_declaration" && language_ == "go") {
                std::string recv = receiver_type(node);
                if (!recv.empty()) name = recv + "." + name;
            }
            return name;
        }
        if (kAnonymousFunctions.count(type)) return binding_name(node);
        return std::nullopt;
    }

    std::optional<std::string> declarator_name(TSNode node) const {
        TSNode d = field(node, "declarator");
        while (!ts_node_is_null(d) && kDeclaratorWrappers.count(ts_node_type(d))) {
            TSNode next = field(d, "declarator");
            if (ts_node_is_null(next) && ts_node_named_child_count(d) > 0) next = ts_node_named_child(d, 0);
            d = next;
        }
        if (ts_node_is_null(d)) return std::nullopt;
        return compact(text(d));
    }

    std::string receiver_type(TSNode node) const {
        TSNode recv = field(node, "receiver");
        if (ts_node_is_null(recv)) return {};
        uint32_t n = ts_node_named_child_count(recv);
        for (uint32_t i = 0; i < n; ++i) {
            TSNode t = field(ts_node_named_child(recv, i), "type");
            if (ts_node_is_null(t)) continue;
            std::string s = compact(text(t));
            s.erase(std::remove(s.begin(), s.end(), '*'), s.end());
            return s;
        }
        return {};
    }

    // Name an anonymous function takes from where it is bound, if anywhere.
    std::optional<std::string> binding_name(TSNode node) const {
        TSNode p = ts_node_parent(node);
        if (ts_node_is_null(p)) return std::nullopt;
        const std::string pt = ts_node_type(p);
        TSNode n = {};
        if (pt == "variable_declarator") n = field(p, "name");
        else if (pt == "pair") n = field(p, "key");
        else if (pt == "public_field_definition") n = field(p, "name");
        else if (pt == "field_definition") n = field(p, "property");
        else if (pt == "assignment_expression") {
            n = field(p, "left");
            if (!ts_node_is_null(n) && std::strcmp(ts_node_type(n), "member_expression") == 0) {
                n = field(n, "property");
            }
        } else if (pt == "export_statement") {
            return std::string("default");
        }
        if (ts_node_is_null(n)) return std::nullopt;
        std::string name = compact(text(n));
        name.erase(std::remove_if(name.begin(), name.end(), [](char c) { return c == '"' || c == '\''; }),
                   name.end());
        if (name.find('.') != std::string::npos || name.find('{') != std::string::npos ||
            name.find('[') != std::string::npos) {
            return std::nullopt; // destructuring and computed targets
        }
        return name;
    }

    void add(Scope scope, const std::string& name, const std::optional<std::string>& parent, TSNode span) {
        TSPoint start = ts_node_start_point(span);
        TSPoint end = ts_node_end_point(span);
        uint32_t from = ts_node_start_byte(span) - start.column;
        uint32_t to = ts_node_end_byte(span);
        std::string body = src_.substr(from, to - from);
        while (!body.empty() && (body.back() == '\n' || body.back() == '\r')) body.pop_back();
        int last = (int)end.row + 1;
        if (end.column == 0 && end.row > start.row) --last;
        found.push_back(make_entity(scope, name, parent, path_, (int)start.row + 1, last, body, language_));
    }

    const std::string& src_;
    const std::string& path_;
    const std::string& language_;
    const Grammar& grammar_;
};

bool has_extension(const std::string& path, const char* ext) {
    std::string e = std::filesystem::path(path).extension().string();
    std::transform(e.begin(), e.end(), e.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return e == ext;
}

} // namespace

ParsedEntity make_entity(Scope scope, const std::string& name,
                         const std::optional<std::string>& parent,
                         const std::string& path, int start_line, int end_line,
                         const std::string& source, const std::string& language) {
    ParsedEntity e;
    e.scope = scope;
    e.name = name;
    e.parent_name = parent;
    e.location = CodeLocation{path, start_line, end_line};
    e.source = source;
    e.language = language;
    e.fingerprint = normalize_and_fingerprint(source, language);
    return e;
}

void disambiguate_names(std::vector<ParsedEntity>& entities) {
    std::map<std::pair<int, std::string>, int> seen;
    for (auto& e : entities) {
        int n = ++seen[std::make_pair((int)e.scope, e.name)];
        if (n > 1) e.name += "#" + std::to_string(n);
    }
}

TreeSitterParser::TreeSitterParser(std::string language) : language_(std::move(language)) {
    if (!grammars().count(language_)) throw std::invalid_argument("no tree-sitter grammar for " + language_);
}

std::vector<ParsedEntity> TreeSitterParser::parse(const std::string& source, const std::string& path) const {
    const Grammar& grammar = grammars().at(language_);
    const TSLanguage* lang = language_ == "typescript" && has_extension(path, ".tsx") ? tree_sitter_tsx()
                                                                                      : grammar.language();
    ParserHandle parser;
    if (!ts_parser_set_language(parser.p, lang)) {
        throw std::runtime_error("tree-sitter grammar for " + language_ + " does not match the runtime ABI");
    }
    TreeHandle tree(ts_parser_parse_string(parser.p, nullptr, source.c_str(), (uint32_t)source.size()));
    if (!tree.t) throw std::runtime_error("tree-sitter could not parse " + path);

    Walker walker(source, path, language_, grammar);
    walker.walk(ts_tree_root_node(tree.t), std::nullopt);
    disambiguate_names(walker.found);

    std::vector<ParsedEntity> out;
    out.push_back(make_entity(Scope::Module, file_stem(path), std::nullopt, path, 1,
                              std::max(1, (int)split_lines(source).size()), source, language_));
    out.insert(out.end(), walker.found.begin(), walker.found.end());
    return out;
}

std::optional<std::string> detect_language(const std::filesystem::path& p) {
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    auto it = language_map().find(ext);
    if (it == language_map().end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> extensions_for(const std::string& language) {
    std::vector<std::string> out;
    for (const auto& kv : language_map()) {
        if (kv.second == language) out.push_back(kv.first);
    }
    return out;
}

std::vector<std::string> parser_languages() {
    std::vector<std::string> out;
    for (const auto& kv : grammars()) out.push_back(kv.first);
    return out;
}

std::unique_ptr<SourceParser> make_parser(const std::string& language) {
    if (!grammars().count(language)) return nullptr;
    return std::unique_ptr<SourceParser>(new TreeSitterParser(language));
}
