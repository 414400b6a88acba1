#include "../include/pipeline.hpp"
#include "../include/generation_queue.hpp"
#include "../../../shared/cpp/lore_core/include/normalize.hpp"
#include "../../../shared/cpp/lore_core/include/util.hpp"
#include <algorithm>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

std::vector<ParsedEntity> aggregate_entities(const std::string& project_name,
                                             const std::vector<ParsedEntity>& modules) {
    std::map<std::string, std::vector<const ParsedEntity*>> by_dir;
    std::vector<const ParsedEntity*> all;
    for (const auto& e : modules) {
        if (e.scope != Scope::Module) continue;
        all.push_back(&e);
        std::string dir = std::filesystem::path(e.location.path).parent_path().generic_string();
        if (!dir.empty()) by_dir[dir].push_back(&e);
    }
    auto by_path = [](const ParsedEntity* a, const ParsedEntity* b) { return a->location.path < b->location.path; };
    auto listing = [&by_path](std::vector<const ParsedEntity*> members) {
        std::sort(members.begin(), members.end(), by_path);
        std::string s;
        for (const auto* m : members) s += m->location.path + " " + m->fingerprint + "\n";
        return s;
    };

    std::vector<ParsedEntity> out;
    for (const auto& kv : by_dir) {
        ParsedEntity p;
        p.scope = Scope::Package;
        p.name = kv.first;
        p.location = CodeLocation{kv.first, 0, 0};
        p.source = listing(kv.second);
        p.language = kv.second.front()->language;
        p.fingerprint = normalize_and_fingerprint(p.source, "text");
        out.push_back(std::move(p));
    }
    if (!all.empty()) {
        ParsedEntity p;
        p.scope = Scope::Project;
        p.name = project_name;
        p.location = CodeLocation{".", 0, 0};
        p.source = listing(all);
        p.language = all.front()->language;
        p.fingerprint = normalize_and_fingerprint(p.source, "text");
        out.push_back(std::move(p));
    }
    return out;
}

Pipeline::Pipeline(const Paths& paths, const Config& cfg, StalenessTracker& tracker,
                   SidecarSynchronizer& sidecars)
    : paths_(paths), cfg_(cfg), tracker_(tracker), sidecars_(sidecars) {}

ScanResult Pipeline::scan(const std::filesystem::path& target) const {
    ScanResult res;
    auto root = std::filesystem::weakly_canonical(paths_.root_dir);
    auto dir = std::filesystem::weakly_canonical(target);
    res.full = dir == root;

    std::vector<std::string> exts;
    for (const auto& lang : cfg_.languages) {
        auto e = extensions_for(lang);
        exts.insert(exts.end(), e.begin(), e.end());
    }
    if (exts.empty()) return res;

    std::map<std::string, std::unique_ptr<SourceParser>> parsers;
    std::set<std::string> unsupported;
    std::vector<ParsedEntity> modules;
    for (const auto& file : list_files(dir, exts, cfg_.ignore_dirs)) {
        auto lang = detect_language(file);
        if (!lang || std::find(cfg_.languages.begin(), cfg_.languages.end(), *lang) == cfg_.languages.end()) {
            continue;
        }
        auto& parser = parsers[*lang];
        if (!parser) parser = make_parser(*lang);
        if (!parser) {
            if (unsupported.insert(*lang).second) {
                std::cerr << "[pipeline] no parser for language " << *lang << ", skipping its files" << std::endl;
            }
            continue;
        }
        std::string rel = std::filesystem::relative(std::filesystem::weakly_canonical(file), root).generic_string();
        auto entities = parser->parse(read_text_file(file), rel);
        res.files.push_back(rel);
        for (const auto& e : entities) {
            if (e.scope == Scope::Module) modules.push_back(e);
        }
        res.by_sidecar[rel] = entities;
        res.entities.insert(res.entities.end(), entities.begin(), entities.end());
    }

    if (res.full) {
        for (auto& agg : aggregate_entities(root.filename().string(), modules)) {
            res.by_sidecar[sidecar_key_for(agg)].push_back(agg);
            res.entities.push_back(std::move(agg));
        }
    }
    return res;
}

PipelineStats Pipeline::run(const ScanResult& scan, DescriptionGenerator& gen, const PipelineOptions& opts,
                            const std::atomic<bool>* cancel) {
    PipelineStats st;
    st.files = scan.files.size();
    st.entities = scan.entities.size();
    auto cancelled = [cancel]() { return cancel && cancel->load(); };

    if (opts.force) tracker_.invalidate_entities(scan.entities);

    GenerationQueue queue;
    std::set<std::string> seen;
    for (const auto& e : scan.entities) {
        if (cancelled()) break;
        if (!seen.insert(e.fingerprint + "|" + identity_of(e).key()).second) continue;
        auto id = identity_of(e);
        auto r = tracker_.check(id, e.fingerprint);
        switch (r.freshness) {
            case Freshness::Fresh:
                if (r.revert && tracker_.adopt_revert(id, e.fingerprint)) ++st.reused;
                else ++st.fresh;
                break;
            case Freshness::Stale:
                queue.enqueue(GenerationJob{0, e, "high"});
                ++st.queued_high;
                break;
            case Freshness::Unknown:
                queue.enqueue(GenerationJob{0, e, "low"});
                ++st.queued_low;
                break;
        }
    }

    const std::size_t pending = queue.queued();
    int workers = opts.parallelism > 0 ? opts.parallelism : cfg_.max_parallelism;
    workers = (int)std::min<std::size_t>((std::size_t)std::max(1, workers), std::max<std::size_t>(1, pending));
    if (pending > 0) {
        std::cout << "[codelore] generating " << pending << " descriptions (" << st.queued_high
                  << " stale, " << st.queued_low << " new) with " << workers << " workers via "
                  << gen.provider() << std::endl;
    }

    std::mutex err_mtx;
    std::exception_ptr storage_failure;
    std::atomic<bool> abort{false};
    std::atomic<std::size_t> placeholders{0};

    auto worker = [&]() {
        while (!abort.load() && !cancelled()) {
            auto job = queue.dequeue();
            if (!job) break;
            const ParsedEntity& e = job->entity;
            auto id = identity_of(e);
            try {
                std::string desc;
                bool ok = true;
                try {
                    desc = gen.generate(e);
                } catch (const std::exception& ge) {
                    std::cerr << "[pipeline] generation failed for " << scope_name(e.scope) << " " << e.name
                              << " (" << e.location.path << "): " << ge.what() << std::endl;
                    ok = false;
                }
                if (ok) {
                    tracker_.record_generated(id, e.fingerprint, desc);
                } else if (cfg_.placeholder_on_failure) {
                    tracker_.record_generated(id, e.fingerprint, placeholder_description(e));
                    ++placeholders;
                }
                queue.complete(job->id, ok);
            } catch (const StorageError&) {
                // ends the run once the other workers stop
                queue.complete(job->id, false);
                std::lock_guard<std::mutex> lock(err_mtx);
                if (!storage_failure) storage_failure = std::current_exception();
                abort = true;
            } catch (const std::exception& ex) {
                std::cerr << "[pipeline] could not record " << e.name << ": " << ex.what() << std::endl;
                queue.complete(job->id, false);
            }
        }
    };

    std::vector<std::thread> threads;
    if (pending > 0) {
        for (int i = 0; i < workers; ++i) threads.emplace_back(worker);
        for (auto& t : threads) t.join();
    }

    auto snap = queue.snapshot();
    st.generated = snap.succeeded;
    st.failed = snap.failed;
    st.placeholders = placeholders.load();
    if (cancelled()) {
        std::size_t dropped = queue.cancel_queued();
        st.interrupted = true;
        if (dropped) std::cout << "[codelore] interrupted, " << dropped << " descriptions left for next run" << std::endl;
    }
    if (storage_failure) std::rethrow_exception(storage_failure);

    sync_sidecars(scan, st);
    return st;
}

void Pipeline::sync_sidecars(const ScanResult& scan, PipelineStats& stats) {
    std::set<std::string> live;
    for (const auto& kv : scan.by_sidecar) {
        live.insert(kv.first);
        auto r = sidecars_.reconcile(kv.first, kv.second);
        if (r.written) ++stats.sidecars_written;
        if (r.removed) ++stats.sidecars_removed;
    }
    if (scan.full) stats.sidecars_removed += sidecars_.remove_orphans(live);
}
