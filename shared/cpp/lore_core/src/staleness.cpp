#include "../include/staleness.hpp"
#include <algorithm>
#include <unordered_set>

const char* freshness_name(Freshness f) {
    switch (f) {
        case Freshness::Fresh: return "fresh";
        case Freshness::Stale: return "stale";
        case Freshness::Unknown: return "unknown";
    }
    return "unknown";
}

StalenessTracker::StalenessTracker(HashIndex& index, const Config& cfg)
    : index_(index), cfg_(cfg) {}

CheckResult StalenessTracker::check(const EntityIdentity& id, const std::string& fingerprint) const {
    CheckResult r;
    if (auto rec = index_.get(fingerprint)) {
        if (rec->stale) {
            r.freshness = Freshness::Stale;
            r.stored_fingerprint = rec->fingerprint;
        } else {
            r.freshness = Freshness::Fresh;
            r.description = rec->description;
        }
        return r;
    }
    if (auto m = detect_revert(id, fingerprint)) {
        r.freshness = Freshness::Fresh;
        r.description = m->description;
        r.revert = std::move(*m);
        return r;
    }
    r.freshness = Freshness::Unknown;
    return r;
}

FreshnessReport StalenessTracker::check_batch(const std::vector<ParsedEntity>& entities,
                                              const std::atomic<bool>* cancel) const {
    FreshnessReport rep;
    for (const auto& e : entities) {
        if (cancel && cancel->load()) {
            rep.interrupted = true;
            break;
        }
        auto r = check(identity_of(e), e.fingerprint);
        ++rep.total;
        switch (r.freshness) {
            case Freshness::Fresh:
                ++rep.fresh;
                continue;
            case Freshness::Stale:
                ++rep.stale;
                break;
            case Freshness::Unknown:
                ++rep.unknown;
                break;
        }
        rep.entries.push_back(StaleEntry{e.scope, e.name, e.location.path, e.fingerprint,
                                         r.stored_fingerprint});
    }
    return rep;
}

std::optional<RevertMatch> StalenessTracker::detect_revert(const EntityIdentity& id,
                                                           const std::string& fingerprint) const {
    // Only fingerprints still inside the active record's capped history count.
    auto current = index_.current_fingerprint(id.key());
    if (!current || *current == fingerprint) return std::nullopt;
    auto active = index_.get(*current);
    if (!active) return std::nullopt;
    const auto& window = active->fingerprint_history;
    if (std::find(window.begin(), window.end(), fingerprint) == window.end()) return std::nullopt;

    // Newest binding first, so the most recently superseded match wins.
    for (const auto& owner : index_.fingerprints_for(id.key())) {
        if (owner == fingerprint) continue;
        auto rec = index_.get(owner);
        if (!rec || rec->stale) continue;
        const auto& h = rec->fingerprint_history;
        if (std::find(h.begin(), h.end(), fingerprint) != h.end()) {
            return RevertMatch{owner, rec->description};
        }
    }
    return std::nullopt;
}

std::vector<std::string> StalenessTracker::next_history(const EntityIdentity& id,
                                                        const std::string& fingerprint) const {
    std::vector<std::string> candidates;
    auto prev = index_.current_fingerprint(id.key());
    if (prev && *prev != fingerprint) {
        candidates.push_back(*prev);
        if (auto rec = index_.get(*prev)) {
            candidates.insert(candidates.end(), rec->fingerprint_history.begin(),
                              rec->fingerprint_history.end());
        }
    } else if (auto rec = index_.get(fingerprint)) {
        candidates = rec->fingerprint_history;
    }

    std::vector<std::string> out;
    std::unordered_set<std::string> seen{fingerprint};
    const std::size_t cap = (std::size_t)std::max(1, cfg_.history_cap);
    for (auto& fp : candidates) {
        if (out.size() >= cap) break; // oldest fall off the end
        if (seen.insert(fp).second) out.push_back(fp);
    }
    return out;
}

void StalenessTracker::record_generated(const EntityIdentity& id,
                                        const std::string& fingerprint,
                                        const std::string& description) {
    std::lock_guard<std::mutex> lock(write_mtx_);
    index_.commit_generation(id.key(), fingerprint, description, next_history(id, fingerprint));
}

bool StalenessTracker::adopt_revert(const EntityIdentity& id, const std::string& fingerprint) {
    std::lock_guard<std::mutex> lock(write_mtx_);
    if (index_.get(fingerprint)) return false;
    auto m = detect_revert(id, fingerprint);
    if (!m) return false;
    index_.commit_generation(id.key(), fingerprint, m->description, next_history(id, fingerprint));
    return true;
}

bool StalenessTracker::invalidate(const std::string& fingerprint) {
    return index_.mark_stale(fingerprint);
}

bool StalenessTracker::mark_fresh(const std::string& fingerprint) {
    return index_.mark_fresh(fingerprint);
}

std::size_t StalenessTracker::invalidate_entities(const std::vector<ParsedEntity>& entities) {
    std::size_t n = 0;
    for (const auto& e : entities) {
        if (invalidate(e.fingerprint)) ++n;
    }
    return n;
}
