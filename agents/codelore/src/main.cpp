#include "../include/generator.hpp"
#include "../include/parser.hpp"
#include "../include/pipeline.hpp"
#include "../../../shared/cpp/lore_core/include/config.hpp"
#include "../../../shared/cpp/lore_core/include/hash_index.hpp"
#include "../../../shared/cpp/lore_core/include/sidecar.hpp"
#include "../../../shared/cpp/lore_core/include/staleness.hpp"
#include "../../../shared/cpp/lore_core/include/util.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <set>

using json = nlohmann::json;
namespace fs = std::filesystem;

static std::atomic<bool> g_cancel{false};

static void on_sigint(int) {
    g_cancel = true;
    std::signal(SIGINT, SIG_DFL);
}

static void usage() {
    std::cerr << "codelore usage:\n"
              << "  init [--language L]... [--provider P] [--max-parallelism N] [--force]\n"
              << "  generate [path] [--force] [--provider P] [--model M] [-j N]\n"
              << "  update [path] [-y]\n"
              << "  status [path] [--stale-only]\n"
              << "  validate [path] [--fail-on-stale]\n"
              << "  invalidate <fingerprint>... | --path <file>\n"
              << "  read [path] [--scope S] [--format text|json|markdown]\n"
              << "  reseed [--force]\n"
              << "  clean [--force]\n"
              << "  config show | get <key> | set <key> <value>\n"
              << "  hooks install [--hook-type pre-commit|pre-push] [--force] | hooks uninstall\n";
}

namespace {

struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Everything a command needs once the project root is known.
struct Project {
    Paths paths;
    Config cfg;
    std::unique_ptr<HashIndex> index;
    std::unique_ptr<StalenessTracker> tracker;
    std::unique_ptr<SidecarSynchronizer> sidecars;
    std::unique_ptr<Pipeline> pipeline;

    fs::path resolve(const std::string& arg) const {
        if (arg.empty()) return paths.root_dir;
        fs::path p(arg);
        if (p.is_relative()) p = fs::current_path() / p;
        if (!fs::exists(p)) throw std::runtime_error("no such path: " + arg);
        return p;
    }
};

std::unique_ptr<Project> open_project() {
    auto p = std::unique_ptr<Project>(new Project());
    p->paths = make_paths(find_project_root(fs::current_path()));
    p->cfg = load_config(p->paths.config_file);
    apply_env_overrides(p->cfg);
    p->index.reset(new HashIndex(p->paths.hash_db.string()));
    p->tracker.reset(new StalenessTracker(*p->index, p->cfg));
    p->sidecars.reset(new SidecarSynchronizer(*p->index, p->paths));
    p->pipeline.reset(new Pipeline(p->paths, p->cfg, *p->tracker, *p->sidecars));
    return p;
}

bool confirm(const std::string& question) {
    std::cout << question << " [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) return false;
    answer = trim(answer);
    return answer == "y" || answer == "Y" || answer == "yes";
}

void require_provider(const std::string& provider) {
    auto names = generator_names();
    if (std::find(names.begin(), names.end(), provider) == names.end()) {
        throw UsageError("unknown provider '" + provider + "' (expected one of: " + join_lines(names, ", ") + ")");
    }
}

void print_stats(const PipelineStats& st) {
    std::cout << "[OK] files " << st.files << ", entities " << st.entities
              << ", fresh " << st.fresh << ", generated " << st.generated
              << ", reused " << st.reused << ", failed " << st.failed;
    if (st.placeholders) std::cout << " (" << st.placeholders << " placeholders)";
    std::cout << ", sidecars written " << st.sidecars_written << "\n";
}

void print_entries(const FreshnessReport& rep, bool stale_only) {
    for (const auto& e : rep.entries) {
        if (stale_only && !e.stored_fingerprint) continue;
        std::cout << "  " << (e.stored_fingerprint ? "stale  " : "missing") << " "
                  << scope_name(e.scope) << " " << e.name << " (" << e.path << ") "
                  << e.current_fingerprint << "\n";
    }
}

int worker_count(const std::string& cmd, const std::string& flag, const std::string& value) {
    try {
        return (int)parse_long(flag, value, 1);
    } catch (const std::invalid_argument& e) {
        throw UsageError(cmd + ": " + e.what());
    }
}

int cmd_init(int argc, char** argv) {
    std::vector<std::string> languages;
    std::string provider;
    int parallelism = 0;
    bool force = false;
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--language" && i + 1 < argc) languages.push_back(argv[++i]);
        else if (a == "--provider" && i + 1 < argc) provider = argv[++i];
        else if (a == "--max-parallelism" && i + 1 < argc) parallelism = worker_count("init", a, argv[++i]);
        else if (a == "--force") force = true;
        else throw UsageError("init: unexpected argument " + a);
    }
    Paths paths = make_paths(fs::current_path());
    if (fs::exists(paths.state_dir)) {
        if (!force) {
            std::cerr << "[ERROR] already initialized at " << paths.root_dir.string() << " (use --force)\n";
            return 1;
        }
        fs::remove_all(paths.state_dir);
    }
    Config cfg;
    if (!languages.empty()) cfg.languages = languages;
    if (!provider.empty()) {
        require_provider(provider);
        cfg.provider = provider;
    }
    if (parallelism > 0) cfg.max_parallelism = parallelism;
    fs::create_directories(paths.sidecar_dir);
    save_config(cfg, paths.config_file);
    HashIndex index(paths.hash_db.string());
    std::cout << "[OK] Initialized codelore in " << paths.root_dir.string()
              << " (languages: " << join_lines(cfg.languages, ", ") << ", provider: " << cfg.provider << ")\n";
    return 0;
}

int run_generation(Project& p, const std::string& path, const PipelineOptions& opts, bool ask) {
    auto scan = p.pipeline->scan(p.resolve(path));
    if (ask) {
        auto rep = p.tracker->check_batch(scan.entities, &g_cancel);
        if (rep.needs_attention() == 0) {
            std::cout << "[OK] all " << rep.total << " descriptions are fresh\n";
            return 0;
        }
        print_entries(rep, false);
        if (!confirm("Regenerate " + std::to_string(rep.needs_attention()) + " descriptions?")) {
            std::cout << "[codelore] aborted\n";
            return 1;
        }
    }
    auto gen = make_generator(p.cfg, p.cfg.provider);
    auto st = p.pipeline->run(scan, *gen, opts, &g_cancel);
    print_stats(st);
    if (st.interrupted) return 1;
    return st.failed > 0 ? 1 : 0;
}

int cmd_generate(int argc, char** argv) {
    std::string path, provider, model;
    PipelineOptions opts;
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--force") opts.force = true;
        else if (a == "--provider" && i + 1 < argc) provider = argv[++i];
        else if (a == "--model" && i + 1 < argc) model = argv[++i];
        else if ((a == "-j" || a == "--max-parallelism") && i + 1 < argc) opts.parallelism = worker_count("init", a, argv[++i]);
        else if (!a.empty() && a[0] != '-' && path.empty()) path = a;
        else throw UsageError("generate: unexpected argument " + a);
    }
    auto p = open_project();
    if (!provider.empty()) {
        require_provider(provider);
        p->cfg.provider = provider;
    }
    if (!model.empty()) {
        ModelConfig& m = p->cfg.model_settings[p->cfg.provider];
        m.default_model = model;
        m.by_scope.clear();
    }
    return run_generation(*p, path, opts, false);
}

int cmd_update(int argc, char** argv) {
    std::string path;
    bool yes = false;
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-y" || a == "--yes") yes = true;
        else if (!a.empty() && a[0] != '-' && path.empty()) path = a;
        else throw UsageError("update: unexpected argument " + a);
    }
    auto p = open_project();
    return run_generation(*p, path, PipelineOptions{}, !yes);
}

int cmd_status(int argc, char** argv, bool validate) {
    std::string path;
    bool stale_only = false;
    bool fail_on_stale = false;
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (!validate && a == "--stale-only") stale_only = true;
        else if (validate && a == "--fail-on-stale") fail_on_stale = true;
        else if (!a.empty() && a[0] != '-' && path.empty()) path = a;
        else throw UsageError(std::string(validate ? "validate" : "status") + ": unexpected argument " + a);
    }
    auto p = open_project();
    auto scan = p->pipeline->scan(p->resolve(path));
    auto rep = p->tracker->check_batch(scan.entities, &g_cancel);

    if (validate) {
        if (rep.needs_attention() == 0) {
            std::cout << "[OK] all " << rep.total << " descriptions are fresh\n";
            return rep.interrupted ? 1 : 0;
        }
        std::cout << "[WARN] " << rep.stale << " stale and " << rep.unknown << " missing of "
                  << rep.total << " descriptions\n";
        print_entries(rep, false);
        return (fail_on_stale || p->cfg.fail_on_stale) ? 1 : 0;
    }

    std::cout << "[codelore] total " << rep.total << ", fresh " << rep.fresh << ", stale " << rep.stale
              << ", missing " << rep.unknown << (rep.interrupted ? " (interrupted)" : "") << "\n";
    print_entries(rep, stale_only);
    if (rep.needs_attention() > 0 && p->cfg.auto_update) {
        std::cout << "[codelore] auto_update is on: run 'codelore update' to refresh\n";
    }
    return rep.needs_attention() > 0 || rep.interrupted ? 1 : 0;
}

int cmd_invalidate(int argc, char** argv) {
    std::vector<std::string> fingerprints;
    std::string path;
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--path" && i + 1 < argc) path = argv[++i];
        else if (!a.empty() && a[0] != '-') fingerprints.push_back(a);
        else throw UsageError("invalidate: unexpected argument " + a);
    }
    if (fingerprints.empty() && path.empty()) throw UsageError("invalidate: give fingerprints or --path");
    auto p = open_project();
    int rc = 0;
    std::size_t marked = 0;
    for (const auto& fp : fingerprints) {
        if (p->tracker->invalidate(fp)) {
            ++marked;
        } else {
            std::cerr << "[WARN] no record for " << fp << "\n";
            rc = 1;
        }
    }
    ScanResult scan;
    if (!path.empty()) {
        scan = p->pipeline->scan(p->resolve(path));
        marked += p->tracker->invalidate_entities(scan.entities);
    } else {
        scan = p->pipeline->scan(p->paths.root_dir);
    }
    PipelineStats st;
    p->pipeline->sync_sidecars(scan, st);
    std::cout << "[OK] marked " << marked << " descriptions stale\n";
    return rc;
}

int cmd_read(int argc, char** argv) {
    std::string path, format = "text";
    std::optional<Scope> scope;
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--scope" && i + 1 < argc) {
            scope = parse_scope(argv[++i]);
            if (!scope) throw UsageError(std::string("read: unknown scope ") + argv[i]);
        } else if (a == "--format" && i + 1 < argc) {
            format = argv[++i];
            if (format != "text" && format != "json" && format != "markdown") {
                throw UsageError("read: unknown format " + format);
            }
        } else if (!a.empty() && a[0] != '-' && path.empty()) {
            path = a;
        } else {
            throw UsageError("read: unexpected argument " + a);
        }
    }
    auto p = open_project();
    std::string filter;
    if (!path.empty()) {
        filter = fs::relative(fs::weakly_canonical(p->resolve(path)),
                              fs::weakly_canonical(p->paths.root_dir)).generic_string();
        if (filter == ".") filter.clear();
    }

    json out = json::array();
    for (const auto& key : p->sidecars->list_sidecars()) {
        std::string src = source_path_for_key(key);
        if (!filter.empty() && src != filter && !starts_with(src, filter + "/")) continue;
        auto fragments = p->sidecars->read(key);
        bool header = false;
        for (const auto& f : fragments) {
            if (scope && f.scope != scope) continue;
            std::string sname = f.scope ? scope_name(*f.scope) : "entity";
            std::string label = f.name.empty() ? f.signature : f.name;
            if (format == "json") {
                out.push_back({{"path", src}, {"scope", sname}, {"name", label},
                               {"start_line", f.start_line}, {"end_line", f.end_line},
                               {"fingerprint", f.fingerprint}, {"stale", f.stale},
                               {"description", f.description}, {"signature", f.signature}});
            } else if (format == "markdown") {
                if (!header) std::cout << "## " << src << "\n\n";
                header = true;
                std::cout << "### " << sname << " `" << label << "`" << (f.stale ? " (stale)" : "") << "\n\n"
                          << f.description << "\n\n";
            } else {
                std::cout << src << ":" << f.start_line << " " << sname << " " << label
                          << (f.stale ? " [stale]" : "") << "\n";
                for (const auto& l : split_lines(f.description)) std::cout << "    " << l << "\n";
            }
        }
    }
    if (format == "json") std::cout << out.dump(2) << "\n";
    return 0;
}

int cmd_reseed(int argc, char** argv) {
    bool force = false;
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--force") force = true;
        else throw UsageError("reseed: unexpected argument " + a);
    }
    auto p = open_project();
    auto scan = p->pipeline->scan(p->paths.root_dir);
    auto r = p->sidecars->reseed(scan.entities, force);
    if (r.refused) return 1;
    std::cout << "[OK] read " << r.files << " sidecars: seeded " << r.seeded << ", already present "
              << r.already_present << ", not matching current code " << r.unverified << "\n";
    return 0;
}

int cmd_clean(int argc, char** argv) {
    bool force = false;
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--force" || a == "-y") force = true;
        else throw UsageError("clean: unexpected argument " + a);
    }
    Paths paths = make_paths(find_project_root(fs::current_path()));
    if (!force && !confirm("Remove " + paths.state_dir.string() + " with all descriptions?")) {
        std::cout << "[codelore] aborted\n";
        return 1;
    }
    auto n = fs::remove_all(paths.state_dir);
    std::cout << "[OK] removed " << paths.state_dir.string() << " (" << n << " entries)\n";
    return 0;
}

int cmd_config(int argc, char** argv) {
    if (argc < 3) throw UsageError("config: expected show, get or set");
    std::string sub = argv[2];
    Paths paths = make_paths(find_project_root(fs::current_path()));
    Config cfg = load_config(paths.config_file);
    if (sub == "show" && argc == 3) {
        std::cout << config_to_json(cfg).dump(2) << "\n";
        return 0;
    }
    if (sub == "get" && argc == 4) {
        auto v = config_get(cfg, argv[3]);
        if (!v) {
            std::cerr << "[ERROR] " << argv[3] << " is not set\n";
            return 1;
        }
        std::cout << *v << "\n";
        return 0;
    }
    if (sub == "set" && argc == 5) {
        config_set(cfg, argv[3], argv[4]);
        if (std::string(argv[3]) == "provider") require_provider(cfg.provider);
        save_config(cfg, paths.config_file);
        std::cout << "[OK] " << argv[3] << " = " << *config_get(cfg, argv[3]) << "\n";
        return 0;
    }
    throw UsageError("config: expected show, get <key> or set <key> <value>");
}

const char* kHookMarker = "# installed by codelore";

int cmd_hooks(int argc, char** argv) {
    if (argc < 3) throw UsageError("hooks: expected install or uninstall");
    std::string sub = argv[2];
    std::string type = "pre-commit";
    bool force = false;
    for (int i = 3; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--hook-type" && i + 1 < argc) type = argv[++i];
        else if (a == "--force") force = true;
        else throw UsageError("hooks: unexpected argument " + a);
    }
    if (type != "pre-commit" && type != "pre-push") throw UsageError("hooks: unknown hook type " + type);

    Paths paths = make_paths(find_project_root(fs::current_path()));
    fs::path hooks_dir = paths.root_dir / ".git" / "hooks";
    if (!fs::is_directory(paths.root_dir / ".git")) {
        std::cerr << "[ERROR] " << paths.root_dir.string() << " is not a git work tree\n";
        return 1;
    }
    auto ours = [](const fs::path& hook) {
        return fs::exists(hook) && read_text_file(hook).find(kHookMarker) != std::string::npos;
    };

    if (sub == "install") {
        fs::path hook = hooks_dir / type;
        if (fs::exists(hook) && !ours(hook) && !force) {
            std::cerr << "[ERROR] " << hook.string() << " already exists (use --force to replace)\n";
            return 1;
        }
        write_text_file_atomic(hook, std::string("#!/bin/sh\n") + kHookMarker + "\n" +
                                         "exec codelore validate --fail-on-stale\n");
        fs::permissions(hook, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                                  fs::perms::others_read | fs::perms::others_exec);
        std::cout << "[OK] installed " << hook.string() << "\n";
        return 0;
    }
    if (sub == "uninstall") {
        int removed = 0;
        for (const char* t : {"pre-commit", "pre-push"}) {
            fs::path hook = hooks_dir / t;
            if (ours(hook) && fs::remove(hook)) ++removed;
        }
        std::cout << "[OK] removed " << removed << " hooks\n";
        return 0;
    }
    throw UsageError("hooks: expected install or uninstall");
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) { usage(); return 2; }
    std::string cmd = argv[1];
    std::signal(SIGINT, on_sigint);
    curl_global_init(CURL_GLOBAL_DEFAULT);
    int rc = 0;
    try {
        if (cmd == "init") rc = cmd_init(argc, argv);
        else if (cmd == "generate") rc = cmd_generate(argc, argv);
        else if (cmd == "update") rc = cmd_update(argc, argv);
        else if (cmd == "status") rc = cmd_status(argc, argv, false);
        else if (cmd == "validate") rc = cmd_status(argc, argv, true);
        else if (cmd == "invalidate") rc = cmd_invalidate(argc, argv);
        else if (cmd == "read") rc = cmd_read(argc, argv);
        else if (cmd == "reseed") rc = cmd_reseed(argc, argv);
        else if (cmd == "clean") rc = cmd_clean(argc, argv);
        else if (cmd == "config") rc = cmd_config(argc, argv);
        else if (cmd == "hooks") rc = cmd_hooks(argc, argv);
        else if (cmd == "help" || cmd == "--help" || cmd == "-h") usage();
        else { usage(); rc = 2; }
    } catch (const UsageError& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        usage();
        rc = 2;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        rc = 1;
    }
    curl_global_cleanup();
    return rc;
}
