#pragma once
#include "generator.hpp"
#include "parser.hpp"
#include "../../../shared/cpp/lore_core/include/config.hpp"
#include "../../../shared/cpp/lore_core/include/hash_index.hpp"
#include "../../../shared/cpp/lore_core/include/sidecar.hpp"
#include "../../../shared/cpp/lore_core/include/staleness.hpp"
#include <atomic>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

struct ScanResult {
    bool full{false};                       // whole project scanned
    std::vector<std::string> files;         // project-relative, sorted
    std::vector<ParsedEntity> entities;     // file order, aggregates last
    std::map<std::string, std::vector<ParsedEntity>> by_sidecar;
};

struct PipelineOptions {
    bool force{false};         // regenerate fresh entities as well
    int parallelism{0};        // 0 means Config::max_parallelism
};

struct PipelineStats {
    std::size_t files{0};
    std::size_t entities{0};
    std::size_t fresh{0};
    std::size_t queued_high{0};
    std::size_t queued_low{0};
    std::size_t generated{0};
    std::size_t reused{0};
    std::size_t failed{0};
    std::size_t placeholders{0};
    std::size_t sidecars_written{0};
    std::size_t sidecars_removed{0};
    bool interrupted{false};
};

// Package and project entities summarizing the modules of a full scan.
std::vector<ParsedEntity> aggregate_entities(const std::string& project_name,
                                             const std::vector<ParsedEntity>& modules);

class Pipeline {
public:
    Pipeline(const Paths& paths, const Config& cfg, StalenessTracker& tracker, SidecarSynchronizer& sidecars);

    // target may be the project root, a subdirectory or a single file.
    ScanResult scan(const std::filesystem::path& target) const;
    // Generates what is stale or unknown, commits each success as it lands,
    // then reconciles the sidecars of every scanned file.
    PipelineStats run(const ScanResult& scan, DescriptionGenerator& gen, const PipelineOptions& opts,
                      const std::atomic<bool>* cancel = nullptr);
    void sync_sidecars(const ScanResult& scan, PipelineStats& stats);

private:
    Paths paths_;
    const Config& cfg_;
    StalenessTracker& tracker_;
    SidecarSynchronizer& sidecars_;
};
