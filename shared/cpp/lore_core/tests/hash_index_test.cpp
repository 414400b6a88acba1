#include "../include/hash_index.hpp"
#include <gtest/gtest.h>
#include <sqlite3.h>
#include <filesystem>
#include <string>

namespace {

std::string fp(char c) { return "sha256:" + std::string(64, c); }

class HashIndexTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("codelore-index-" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "-" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(dir_);
        db_path_ = (dir_ / "nested" / "hash-index.db").string();
    }
    void TearDown() override { std::filesystem::remove_all(dir_); }

    std::filesystem::path dir_;
    std::string db_path_;
};

} // namespace

TEST_F(HashIndexTest, CreatesDatabaseAndParentDirectories) {
    HashIndex idx(db_path_);
    EXPECT_TRUE(std::filesystem::exists(db_path_));
    EXPECT_EQ(idx.size(), 0u);
    EXPECT_FALSE(idx.get(fp('a')).has_value());
}

TEST_F(HashIndexTest, SetThenGet) {
    HashIndex idx(db_path_);
    idx.set(fp('a'), "Adds two numbers.", false, {fp('b'), fp('c')});
    auto rec = idx.get(fp('a'));
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->fingerprint, fp('a'));
    EXPECT_EQ(rec->description, "Adds two numbers.");
    EXPECT_FALSE(rec->stale);
    EXPECT_FALSE(rec->created_at.empty());
    EXPECT_FALSE(rec->updated_at.empty());
    ASSERT_EQ(rec->fingerprint_history.size(), 2u);
    EXPECT_EQ(rec->fingerprint_history[0], fp('b'));
    EXPECT_EQ(idx.size(), 1u);
}

TEST_F(HashIndexTest, ReplaceKeepsCreatedAt) {
    HashIndex idx(db_path_);
    idx.set(fp('a'), "first");
    auto before = idx.get(fp('a'));
    ASSERT_TRUE(before);
    idx.set(fp('a'), "second", true);
    auto after = idx.get(fp('a'));
    ASSERT_TRUE(after);
    EXPECT_EQ(after->description, "second");
    EXPECT_TRUE(after->stale);
    EXPECT_EQ(after->created_at, before->created_at);
    EXPECT_EQ(idx.size(), 1u);
}

TEST_F(HashIndexTest, MarkStaleAndFresh) {
    HashIndex idx(db_path_);
    idx.set(fp('a'), "a");
    idx.set(fp('b'), "b");
    EXPECT_TRUE(idx.mark_stale(fp('a')));
    EXPECT_FALSE(idx.mark_stale(fp('f')));
    auto stale = idx.list_stale();
    ASSERT_EQ(stale.size(), 1u);
    EXPECT_EQ(stale[0].fingerprint, fp('a'));
    EXPECT_EQ(stale[0].description, "a");

    EXPECT_TRUE(idx.mark_fresh(fp('a')));
    EXPECT_TRUE(idx.list_stale().empty());
    EXPECT_FALSE(idx.mark_fresh(fp('f')));
}

TEST_F(HashIndexTest, ListAllOrderedByFingerprint) {
    HashIndex idx(db_path_);
    idx.set(fp('c'), "c");
    idx.set(fp('a'), "a");
    idx.set(fp('b'), "b");
    auto all = idx.list_all();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].fingerprint, fp('a'));
    EXPECT_EQ(all[2].fingerprint, fp('c'));
}

TEST_F(HashIndexTest, RemoveAndReset) {
    HashIndex idx(db_path_);
    idx.set(fp('a'), "a");
    idx.set(fp('b'), "b");
    idx.bind("function|m.py|f", fp('a'));
    EXPECT_TRUE(idx.remove(fp('a')));
    EXPECT_FALSE(idx.remove(fp('a')));
    EXPECT_EQ(idx.size(), 1u);

    idx.reset();
    EXPECT_EQ(idx.size(), 0u);
    EXPECT_FALSE(idx.current_fingerprint("function|m.py|f").has_value());
}

TEST_F(HashIndexTest, SurvivesReopen) {
    {
        HashIndex idx(db_path_);
        idx.set(fp('a'), "kept", false, {fp('b')});
        idx.bind("class|m.py|C", fp('a'));
    }
    HashIndex idx(db_path_);
    auto rec = idx.get(fp('a'));
    ASSERT_TRUE(rec);
    EXPECT_EQ(rec->description, "kept");
    ASSERT_EQ(rec->fingerprint_history.size(), 1u);
    EXPECT_EQ(idx.current_fingerprint("class|m.py|C"), fp('a'));
}

TEST_F(HashIndexTest, BindingsNewestFirst) {
    HashIndex idx(db_path_);
    const std::string id = "function|src/a.py|f";
    EXPECT_FALSE(idx.current_fingerprint(id).has_value());
    EXPECT_TRUE(idx.fingerprints_for(id).empty());

    idx.bind(id, fp('a'));
    idx.bind(id, fp('b'));
    idx.bind(id, fp('b'));
    idx.bind(id, fp('a'));
    EXPECT_EQ(idx.current_fingerprint(id), fp('a'));
    auto all = idx.fingerprints_for(id);
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0], fp('a'));
    EXPECT_EQ(all[1], fp('b'));

    EXPECT_TRUE(idx.fingerprints_for("function|src/a.py|g").empty());
}

TEST_F(HashIndexTest, CommitGenerationWritesRecordAndBinding) {
    HashIndex idx(db_path_);
    idx.commit_generation("function|m.py|f", fp('b'), "desc", {fp('a')});
    auto rec = idx.get(fp('b'));
    ASSERT_TRUE(rec);
    EXPECT_EQ(rec->description, "desc");
    EXPECT_FALSE(rec->stale);
    EXPECT_EQ(rec->fingerprint_history, std::vector<std::string>{fp('a')});
    EXPECT_EQ(idx.current_fingerprint("function|m.py|f"), fp('b'));
}

TEST_F(HashIndexTest, CommitGenerationKeepsBindingsWithinHistory) {
    HashIndex idx(db_path_);
    const std::string id = "function|m.py|f";
    idx.commit_generation(id, fp('a'), "A", {});
    idx.commit_generation(id, fp('b'), "B", {fp('a')});
    idx.commit_generation(id, fp('a'), "A again", {fp('b')});
    idx.commit_generation(id, fp('c'), "C", {fp('a')});
    EXPECT_EQ(idx.fingerprints_for(id), (std::vector<std::string>{fp('c'), fp('a')}));

    sqlite3* raw = nullptr;
    ASSERT_EQ(sqlite3_open(db_path_.c_str(), &raw), SQLITE_OK);
    sqlite3_stmt* st = nullptr;
    ASSERT_EQ(sqlite3_prepare_v2(raw, "SELECT COUNT(*) FROM bindings;", -1, &st, nullptr), SQLITE_OK);
    ASSERT_EQ(sqlite3_step(st), SQLITE_ROW);
    EXPECT_EQ(sqlite3_column_int(st, 0), 2);
    sqlite3_finalize(st);
    sqlite3_close(raw);
}

TEST_F(HashIndexTest, CorruptHistoryReadsAsAbsent) {
    HashIndex idx(db_path_);
    idx.set(fp('a'), "good");
    idx.set(fp('b'), "bad");

    sqlite3* raw = nullptr;
    ASSERT_EQ(sqlite3_open(db_path_.c_str(), &raw), SQLITE_OK);
    std::string sql = "UPDATE descriptions SET fingerprint_history = 'not json' WHERE fingerprint = '" +
                      fp('b') + "';";
    ASSERT_EQ(sqlite3_exec(raw, sql.c_str(), nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(raw);

    EXPECT_FALSE(idx.get(fp('b')).has_value());
    EXPECT_TRUE(idx.get(fp('a')).has_value());
    auto all = idx.list_all();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].fingerprint, fp('a'));

    // A full replace repairs the row.
    idx.set(fp('b'), "repaired");
    ASSERT_TRUE(idx.get(fp('b')).has_value());
}

TEST(StorageErrorTest, RetryableCodes) {
    EXPECT_TRUE(StorageError("busy", SQLITE_BUSY).retryable());
    EXPECT_TRUE(StorageError("locked", SQLITE_LOCKED).retryable());
    EXPECT_TRUE(StorageError("io", SQLITE_IOERR_WRITE).retryable());
    EXPECT_FALSE(StorageError("constraint", SQLITE_CONSTRAINT).retryable());
    EXPECT_FALSE(StorageError("corrupt", SQLITE_CORRUPT).retryable());
    EXPECT_EQ(StorageError("busy", SQLITE_BUSY).code(), SQLITE_BUSY);
}

TEST(StorageErrorTest, UnopenablePathThrows) {
    auto dir = std::filesystem::temp_directory_path() / "codelore-index-unopenable";
    std::filesystem::create_directories(dir);
    // The path names an existing directory, which SQLite cannot open as a database.
    EXPECT_THROW(HashIndex idx(dir.string()), StorageError);
    std::filesystem::remove_all(dir);
}
