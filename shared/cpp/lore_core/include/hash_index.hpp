#pragma once
#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include <shared_mutex>

// Raised for any failure of the underlying database. Writes never degrade a
// StorageError into "absent"; callers may retry when retryable() is true.
class StorageError : public std::runtime_error {
public:
    StorageError(const std::string& what, int code);
    int code() const { return code_; }
    bool retryable() const;

private:
    int code_;
};

struct DescriptionRecord {
    std::string fingerprint;
    std::string description;
    bool stale{false};
    std::string created_at;
    std::string updated_at;
    std::vector<std::string> fingerprint_history; // most recent first
};

// Durable fingerprint -> DescriptionRecord map backed by SQLite, plus the
// identity bindings that tell which fingerprints an entity has been recorded
// under. Every mutation is committed before it returns.
class HashIndex {
public:
    explicit HashIndex(const std::string& db_path);
    ~HashIndex();

    HashIndex(const HashIndex&) = delete;
    HashIndex& operator=(const HashIndex&) = delete;

    // A record whose stored history does not decode is reported as absent.
    std::optional<DescriptionRecord> get(const std::string& fingerprint) const;
    // Insert or fully replace; created_at survives a replace.
    void set(const std::string& fingerprint,
             const std::string& description,
             bool stale = false,
             const std::vector<std::string>& history = {});
    bool mark_stale(const std::string& fingerprint);
    bool mark_fresh(const std::string& fingerprint);
    std::vector<DescriptionRecord> list_stale() const;
    std::vector<DescriptionRecord> list_all() const;
    bool remove(const std::string& fingerprint);
    void reset();
    std::size_t size() const;

    std::optional<std::string> current_fingerprint(const std::string& identity) const;
    // Distinct fingerprints bound to identity, most recently bound first.
    std::vector<std::string> fingerprints_for(const std::string& identity) const;
    void bind(const std::string& identity, const std::string& fingerprint);

    // Record write and identity binding in one transaction. Bindings of the
    // identity to fingerprints outside {fingerprint} + history are dropped,
    // leaving one row per remaining fingerprint.
    void commit_generation(const std::string& identity,
                           const std::string& fingerprint,
                           const std::string& description,
                           const std::vector<std::string>& history);

    const std::string& path() const { return path_; }

private:
    void init();
    void exec(const std::string& sql);
    void begin();
    void commit();
    void rollback() noexcept;
    void write_record(const std::string& fingerprint,
                      const std::string& description,
                      bool stale,
                      const std::vector<std::string>& history,
                      const std::string& now);
    void write_binding(const std::string& identity,
                       const std::string& fingerprint,
                       const std::string& now);
    void prune_bindings(const std::string& identity, const std::vector<std::string>& keep);
    bool set_stale_flag(const std::string& fingerprint, bool stale);
    std::vector<DescriptionRecord> select_records(const char* sql) const;

    std::string path_;
    struct sqlite3* db_ {nullptr};
    mutable std::shared_mutex mtx_;
};
