#pragma once
#include "config.hpp"
#include "entity.hpp"
#include "hash_index.hpp"
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

// One annotated block of a .lore file:
//
//   # @lore hash:sha256:<hex> stale:false
//   # @lore entity:function authenticate_user lines:12-20
//   # @lore description:First line
//   # further lines
//   def authenticate_user(username, password):
struct SidecarFragment {
    std::string fingerprint;
    bool stale{false};
    std::string description;
    std::string signature;
    std::optional<Scope> scope;
    std::string name;
    int start_line{0};      // entity lines in the source file, 0 when absent
    int end_line{0};
    int sidecar_start{0};   // 1-based, first annotation line
    int sidecar_end{0};     // 1-based, the signature line
};

std::string comment_prefix_for(const std::string& language);
std::string signature_of(const ParsedEntity& e);
std::string project_fragment(const DescriptionRecord& rec, const ParsedEntity& e);
// Malformed fragments are logged and skipped; origin only labels the log.
std::vector<SidecarFragment> parse_sidecar(const std::string& text, const std::string& origin = "");

// Sidecar key: the source path for file entities, "<dir>/__package__" for a
// package and "__project__" for the project.
std::string sidecar_key_for(const ParsedEntity& e);
std::string source_path_for_key(const std::string& key);

struct ReconcileResult {
    std::filesystem::path sidecar;
    std::size_t fragments{0};
    std::size_t orphaned_blocks{0};
    bool written{false};
    bool removed{false};
};

struct ReseedResult {
    std::size_t files{0};
    std::size_t seeded{0};
    std::size_t already_present{0};
    std::size_t unverified{0};   // seeded but matching no current entity
    bool refused{false};
};

// Keeps the .lore mirror under .codelore/lore in line with the HashIndex.
// The index is authoritative; sidecars only flow back through reseed().
class SidecarSynchronizer {
public:
    SidecarSynchronizer(HashIndex& index, const Paths& paths);

    std::filesystem::path sidecar_path_for(const std::string& key) const;
    // Full text reconcile() would write for these entities over existing.
    std::string render(const std::string& existing, const std::vector<ParsedEntity>& entities,
                       ReconcileResult* stats = nullptr) const;
    ReconcileResult reconcile(const std::string& key, const std::vector<ParsedEntity>& entities);
    std::vector<SidecarFragment> read(const std::string& key) const;
    std::vector<std::string> list_sidecars() const;
    ReseedResult reseed(const std::vector<ParsedEntity>& current, bool force = false);
    std::size_t remove_orphans(const std::set<std::string>& live_keys);

private:
    HashIndex& index_;
    Paths paths_;
};
