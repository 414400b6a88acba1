#pragma once
#include "config.hpp"
#include "entity.hpp"
#include "hash_index.hpp"
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

enum class Freshness {
    Fresh,
    Stale,
    Unknown
};

const char* freshness_name(Freshness f);

struct RevertMatch {
    std::string owner_fingerprint; // record whose history holds the current fingerprint
    std::string description;
};

struct CheckResult {
    Freshness freshness{Freshness::Unknown};
    std::optional<std::string> stored_fingerprint; // only for Stale
    std::optional<std::string> description;        // only for Fresh
    std::optional<RevertMatch> revert;
};

struct StaleEntry {
    Scope scope{Scope::Function};
    std::string name;
    std::string path;
    std::string current_fingerprint;
    std::optional<std::string> stored_fingerprint; // none means never described
};

struct FreshnessReport {
    std::size_t total{0};
    std::size_t fresh{0};
    std::size_t stale{0};
    std::size_t unknown{0};
    std::vector<StaleEntry> entries; // stale and unknown, input order
    bool interrupted{false};

    std::size_t needs_attention() const { return stale + unknown; }
};

// Decides whether the description stored for an entity still holds.
//
// record_generated() does not re-check freshness before it commits: if an
// invalidate() of the same fingerprint lands while a generation is in flight,
// the generation's write wins and the record comes back fresh.
class StalenessTracker {
public:
    StalenessTracker(HashIndex& index, const Config& cfg);

    CheckResult check(const EntityIdentity& id, const std::string& fingerprint) const;
    // Stops between entities once *cancel becomes true.
    FreshnessReport check_batch(const std::vector<ParsedEntity>& entities,
                                const std::atomic<bool>* cancel = nullptr) const;
    std::optional<RevertMatch> detect_revert(const EntityIdentity& id,
                                             const std::string& fingerprint) const;

    void record_generated(const EntityIdentity& id,
                          const std::string& fingerprint,
                          const std::string& description);
    // Stores a detected revert under its own fingerprint so later checks hit
    // the fast path. False when no revert applies.
    bool adopt_revert(const EntityIdentity& id, const std::string& fingerprint);

    bool invalidate(const std::string& fingerprint);
    bool mark_fresh(const std::string& fingerprint);
    std::size_t invalidate_entities(const std::vector<ParsedEntity>& entities);

    // History a new record for (id, fingerprint) would carry: the identity's
    // previous fingerprint followed by that record's history, newest first,
    // truncated to history_cap.
    std::vector<std::string> next_history(const EntityIdentity& id,
                                          const std::string& fingerprint) const;

private:
    HashIndex& index_;
    const Config& cfg_;
    std::mutex write_mtx_;
};
