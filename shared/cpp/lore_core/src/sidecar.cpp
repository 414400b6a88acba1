#include "../include/sidecar.hpp"
#include "../include/normalize.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <cstdio>
#include <iostream>
#include <sstream>

namespace {

const char* const kPrefixes[] = {"#", "//", "--"};
const std::string kProjectKey = "__project__";
const std::string kPackageSuffix = "/__package__";

// "<prefix> @lore <key>:<value>" -> value
std::optional<std::string> lore_value(const std::string& line, const std::string& prefix,
                                      const char* key) {
    std::string head = prefix + " @lore " + key + ":";
    if (!starts_with(line, head)) return std::nullopt;
    return line.substr(head.size());
}

std::vector<std::string> split_ws(const std::string& s) {
    std::istringstream in(s);
    std::vector<std::string> out;
    std::string tok;
    while (in >> tok) out.push_back(tok);
    return out;
}

// Splits on '\n' only, keeping empty pieces.
std::vector<std::string> split_exact(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == '\r') continue;
        if (c == '\n') {
            out.push_back(cur);
            cur.clear();
        } else {
            cur += c;
        }
    }
    out.push_back(cur);
    return out;
}

bool is_blank(const std::string& s) { return trim(s).empty(); }

void strip_trailing_blank(std::vector<std::string>& lines) {
    while (!lines.empty() && is_blank(lines.back())) lines.pop_back();
}

void strip_blank_edges(std::vector<std::string>& lines) {
    strip_trailing_blank(lines);
    auto first = std::find_if(lines.begin(), lines.end(),
                              [](const std::string& l) { return !is_blank(l); });
    lines.erase(lines.begin(), first);
}

struct Document {
    std::vector<std::string> preamble;
    std::vector<SidecarFragment> fragments;
    std::vector<std::vector<std::string>> attached; // lines after each signature
};

std::optional<SidecarFragment> read_fragment(const std::vector<std::string>& lines, size_t at,
                                             const std::string& prefix, const std::string& hash_value,
                                             std::string& reason, size_t& next) {
    SidecarFragment f;
    auto toks = split_ws(hash_value);
    if (toks.empty() || !is_fingerprint(toks[0])) {
        reason = "malformed fingerprint";
        return std::nullopt;
    }
    f.fingerprint = toks[0];
    for (size_t k = 1; k < toks.size(); ++k) {
        if (!starts_with(toks[k], "stale:")) continue;
        std::string v = toks[k].substr(6);
        if (v == "true") f.stale = true;
        else if (v == "false") f.stale = false;
        else {
            reason = "bad stale token '" + toks[k] + "'";
            return std::nullopt;
        }
    }

    size_t j = at + 1;
    const size_t n = lines.size();
    if (j < n) {
        if (auto ev = lore_value(lines[j], prefix, "entity")) {
            auto et = split_ws(*ev);
            auto scope = et.empty() ? std::nullopt : parse_scope(et[0]);
            if (!scope || et.size() < 2) {
                reason = "bad entity line";
                return std::nullopt;
            }
            f.scope = scope;
            f.name = et[1];
            for (size_t k = 2; k < et.size(); ++k) {
                int a = 0, b = 0;
                if (std::sscanf(et[k].c_str(), "lines:%d-%d", &a, &b) == 2) {
                    f.start_line = a;
                    f.end_line = b;
                }
            }
            ++j;
        }
    }

    std::optional<std::string> dv;
    if (j < n) dv = lore_value(lines[j], prefix, "description");
    if (!dv) {
        reason = "missing description";
        return std::nullopt;
    }
    f.description = *dv;
    ++j;
    const std::string cont = prefix + " ";
    while (j < n) {
        const std::string& l = lines[j];
        if (lore_value(l, prefix, "hash")) break;
        if (l == prefix) f.description += "\n";
        else if (starts_with(l, cont)) f.description += "\n" + l.substr(cont.size());
        else break;
        ++j;
    }

    if (j >= n || is_blank(lines[j])) {
        reason = "missing signature line";
        return std::nullopt;
    }
    f.signature = lines[j];
    f.sidecar_start = (int)at + 1;
    f.sidecar_end = (int)j + 1;
    next = j + 1;
    return f;
}

Document parse_document(const std::string& text, const std::string& origin) {
    Document doc;
    auto lines = split_lines(text);
    auto sink = [&doc]() -> std::vector<std::string>& {
        return doc.attached.empty() ? doc.preamble : doc.attached.back();
    };
    size_t i = 0;
    while (i < lines.size()) {
        std::string prefix;
        std::optional<std::string> hv;
        for (const char* p : kPrefixes) {
            hv = lore_value(lines[i], p, "hash");
            if (hv) {
                prefix = p;
                break;
            }
        }
        if (!hv) {
            sink().push_back(lines[i++]);
            continue;
        }
        std::string reason;
        size_t next = i + 1;
        auto frag = read_fragment(lines, i, prefix, *hv, reason, next);
        if (!frag) {
            std::cerr << "[sidecar] " << (origin.empty() ? "<text>" : origin) << ":" << (i + 1)
                      << ": skipping fragment: " << reason << std::endl;
            sink().push_back(lines[i++]);
            continue;
        }
        doc.fragments.push_back(std::move(*frag));
        doc.attached.emplace_back();
        i = next;
    }
    return doc;
}

bool same_entity(const SidecarFragment& old, const ParsedEntity& e, const std::string& sig) {
    if (old.scope) return *old.scope == e.scope && old.name == e.name;
    return old.signature == sig;
}

} // namespace

std::string comment_prefix_for(const std::string& language) {
    static const std::set<std::string> hash = {"python", "ruby", "bash", "shell", "yaml",
                                               "toml", "perl", "r"};
    static const std::set<std::string> dash = {"lua", "sql", "haskell"};
    if (language.empty() || hash.count(language)) return "#";
    if (dash.count(language)) return "--";
    return "//";
}

std::string signature_of(const ParsedEntity& e) {
    std::string fallback = std::string(scope_name(e.scope)) + " " + e.name;
    if (e.scope == Scope::Project || e.scope == Scope::Package || e.scope == Scope::Module) {
        return fallback;
    }
    const std::string prefix = comment_prefix_for(e.language);
    for (const auto& line : split_lines(e.source)) {
        std::string t = trim(line);
        if (t.empty() || t[0] == '@') continue;
        if (starts_with(t, prefix) || starts_with(t, "/*") || starts_with(t, "*")) continue;
        return t;
    }
    return fallback;
}

std::string project_fragment(const DescriptionRecord& rec, const ParsedEntity& e) {
    const std::string prefix = comment_prefix_for(e.language);
    std::ostringstream out;
    out << prefix << " @lore hash:" << rec.fingerprint << " stale:" << (rec.stale ? "true" : "false") << "\n";
    out << prefix << " @lore entity:" << scope_name(e.scope) << " " << e.name
        << " lines:" << e.location.start_line << "-" << e.location.end_line << "\n";
    auto desc = split_exact(rec.description);
    out << prefix << " @lore description:" << desc[0] << "\n";
    for (size_t k = 1; k < desc.size(); ++k) {
        std::string l = desc[k];
        // would otherwise open a new fragment on parse
        if (starts_with(l, "@lore hash:")) l.insert(5, " ");
        if (l.empty()) out << prefix << "\n";
        else out << prefix << " " << l << "\n";
    }
    out << signature_of(e);
    return out.str();
}

std::vector<SidecarFragment> parse_sidecar(const std::string& text, const std::string& origin) {
    return parse_document(text, origin).fragments;
}

std::string sidecar_key_for(const ParsedEntity& e) {
    if (e.scope == Scope::Project) return kProjectKey;
    if (e.scope == Scope::Package) return e.location.path + kPackageSuffix;
    return e.location.path;
}

std::string source_path_for_key(const std::string& key) {
    if (key == kProjectKey) return ".";
    if (key.size() > kPackageSuffix.size() &&
        key.compare(key.size() - kPackageSuffix.size(), kPackageSuffix.size(), kPackageSuffix) == 0) {
        return key.substr(0, key.size() - kPackageSuffix.size());
    }
    return key;
}

SidecarSynchronizer::SidecarSynchronizer(HashIndex& index, const Paths& paths)
    : index_(index), paths_(paths) {}

std::filesystem::path SidecarSynchronizer::sidecar_path_for(const std::string& key) const {
    return paths_.sidecar_dir / (key + ".lore");
}

std::string SidecarSynchronizer::render(const std::string& existing,
                                        const std::vector<ParsedEntity>& entities,
                                        ReconcileResult* stats) const {
    Document doc = parse_document(existing, "");
    std::vector<std::string> blocks;

    auto preamble = doc.preamble;
    strip_blank_edges(preamble);
    if (!preamble.empty()) blocks.push_back(join_lines(preamble));

    std::vector<const ParsedEntity*> ordered;
    for (const auto& e : entities) ordered.push_back(&e);
    std::stable_sort(ordered.begin(), ordered.end(), [](const ParsedEntity* a, const ParsedEntity* b) {
        if (a->location.start_line != b->location.start_line) {
            return a->location.start_line < b->location.start_line;
        }
        return (int)a->scope < (int)b->scope;
    });

    std::vector<bool> used(doc.fragments.size(), false);
    std::set<std::string> seen;
    std::size_t fragments = 0;
    for (const ParsedEntity* e : ordered) {
        // the same entity listed twice, not two entities sharing a name
        if (!seen.insert(identity_of(*e).key() + "@" + std::to_string(e->location.start_line)).second) continue;
        auto rec = index_.get(e->fingerprint);
        if (!rec) continue;
        std::string block = project_fragment(*rec, *e);
        const std::string sig = signature_of(*e);
        for (size_t k = 0; k < doc.fragments.size(); ++k) {
            if (used[k] || !same_entity(doc.fragments[k], *e, sig)) continue;
            used[k] = true;
            auto attached = doc.attached[k];
            strip_trailing_blank(attached);
            if (!attached.empty()) block += "\n" + join_lines(attached);
            break;
        }
        blocks.push_back(block);
        ++fragments;
    }

    // Notes whose fragment is gone go to the end rather than being dropped.
    std::vector<std::string> orphans;
    for (size_t k = 0; k < doc.fragments.size(); ++k) {
        if (used[k]) continue;
        auto attached = doc.attached[k];
        strip_blank_edges(attached);
        if (!attached.empty()) orphans.push_back(join_lines(attached));
    }
    if (!orphans.empty()) blocks.push_back(join_lines(orphans, "\n\n"));

    if (stats) {
        stats->fragments = fragments;
        stats->orphaned_blocks = orphans.size();
    }
    if (blocks.empty()) return {};
    return join_lines(blocks, "\n\n") + "\n";
}

ReconcileResult SidecarSynchronizer::reconcile(const std::string& key,
                                               const std::vector<ParsedEntity>& entities) {
    ReconcileResult res;
    res.sidecar = sidecar_path_for(key);
    const bool exists = std::filesystem::is_regular_file(res.sidecar);
    std::string existing = exists ? read_text_file(res.sidecar) : std::string();
    std::string text = render(existing, entities, &res);
    if (text.empty()) {
        if (exists) res.removed = std::filesystem::remove(res.sidecar);
        return res;
    }
    if (exists && text == existing) return res;
    write_text_file_atomic(res.sidecar, text);
    res.written = true;
    return res;
}

std::vector<SidecarFragment> SidecarSynchronizer::read(const std::string& key) const {
    auto path = sidecar_path_for(key);
    if (!std::filesystem::is_regular_file(path)) return {};
    return parse_sidecar(read_text_file(path), path.string());
}

std::vector<std::string> SidecarSynchronizer::list_sidecars() const {
    std::vector<std::string> keys;
    if (!std::filesystem::is_directory(paths_.sidecar_dir)) return keys;
    for (const auto& p : list_files(paths_.sidecar_dir, {".lore"}, {})) {
        std::string rel = std::filesystem::relative(p, paths_.sidecar_dir).generic_string();
        keys.push_back(rel.substr(0, rel.size() - 5));
    }
    return keys;
}

ReseedResult SidecarSynchronizer::reseed(const std::vector<ParsedEntity>& current, bool force) {
    ReseedResult r;
    std::size_t existing = index_.size();
    if (existing > 0 && !force) {
        std::cerr << "[sidecar] reseed refused: index already holds " << existing
                  << " records (use --force to merge)" << std::endl;
        r.refused = true;
        return r;
    }
    std::set<std::string> live;
    for (const auto& e : current) live.insert(e.fingerprint);

    for (const auto& key : list_sidecars()) {
        ++r.files;
        for (const auto& f : read(key)) {
            if (index_.get(f.fingerprint)) {
                ++r.already_present;
            } else {
                index_.set(f.fingerprint, f.description, f.stale);
                ++r.seeded;
                if (!live.count(f.fingerprint)) ++r.unverified;
            }
            if (f.scope) {
                EntityIdentity id{*f.scope, f.name, source_path_for_key(key)};
                if (!index_.current_fingerprint(id.key())) index_.bind(id.key(), f.fingerprint);
            }
        }
    }
    return r;
}

std::size_t SidecarSynchronizer::remove_orphans(const std::set<std::string>& live_keys) {
    std::size_t removed = 0;
    for (const auto& key : list_sidecars()) {
        if (live_keys.count(key)) continue;
        if (std::filesystem::remove(sidecar_path_for(key))) ++removed;
    }
    return removed;
}
