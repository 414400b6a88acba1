#include "../include/sidecar.hpp"
#include "../include/util.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <memory>

namespace {

std::string fp(char c) { return "sha256:" + std::string(64, c); }

ParsedEntity function_entity(const std::string& name, const std::string& fingerprint, int start, int end,
                             const std::string& source) {
    ParsedEntity e;
    e.scope = Scope::Function;
    e.name = name;
    e.location = CodeLocation{"src/app.py", start, end};
    e.source = source;
    e.fingerprint = fingerprint;
    e.language = "python";
    return e;
}

ParsedEntity module_entity(const std::string& fingerprint) {
    ParsedEntity e;
    e.scope = Scope::Module;
    e.name = "app";
    e.location = CodeLocation{"src/app.py", 1, 6};
    e.source = "def f():\n    return 1\n";
    e.fingerprint = fingerprint;
    e.language = "python";
    return e;
}

DescriptionRecord record(const std::string& fingerprint, const std::string& description, bool stale = false) {
    DescriptionRecord r;
    r.fingerprint = fingerprint;
    r.description = description;
    r.stale = stale;
    return r;
}

class SidecarTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               (std::string("codelore-sidecar-") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(dir_);
        paths_ = make_paths(dir_);
        index_.reset(new HashIndex(paths_.hash_db.string()));
        sync_.reset(new SidecarSynchronizer(*index_, paths_));
    }
    void TearDown() override {
        sync_.reset();
        index_.reset();
        std::filesystem::remove_all(dir_);
    }

    std::string sidecar_text(const std::string& key) { return read_text_file(sync_->sidecar_path_for(key)); }

    std::filesystem::path dir_;
    Paths paths_;
    std::unique_ptr<HashIndex> index_;
    std::unique_ptr<SidecarSynchronizer> sync_;
};

} // namespace

TEST(SidecarFormat, CommentPrefixPerLanguage) {
    EXPECT_EQ(comment_prefix_for("python"), "#");
    EXPECT_EQ(comment_prefix_for(""), "#");
    EXPECT_EQ(comment_prefix_for("ruby"), "#");
    EXPECT_EQ(comment_prefix_for("cpp"), "//");
    EXPECT_EQ(comment_prefix_for("typescript"), "//");
    EXPECT_EQ(comment_prefix_for("lua"), "--");
}

TEST(SidecarFormat, SignatureSkipsDecoratorsAndComments) {
    auto e = function_entity("f", fp('a'), 3, 5, "@cached\n# note\n\ndef f(x):\n    return x\n");
    EXPECT_EQ(signature_of(e), "def f(x):");
    EXPECT_EQ(signature_of(module_entity(fp('b'))), "module app");

    auto empty = function_entity("g", fp('c'), 1, 1, "\n# only comments\n");
    EXPECT_EQ(signature_of(empty), "function g");
}

TEST(SidecarFormat, ProjectFragmentLayout) {
    auto e = function_entity("f", fp('a'), 2, 3, "@dec\ndef f(x):\n    return x\n");
    std::string text = project_fragment(record(fp('a'), "First\n\nThird"), e);
    std::string expected = "# @lore hash:" + fp('a') + " stale:false\n"
                           "# @lore entity:function f lines:2-3\n"
                           "# @lore description:First\n"
                           "#\n"
                           "# Third\n"
                           "def f(x):";
    EXPECT_EQ(text, expected);
}

TEST(SidecarFormat, ParseReadsProjectedFragment) {
    auto e = function_entity("f", fp('a'), 2, 3, "def f(x):\n    return x\n");
    std::string text = "# header\n\n" + project_fragment(record(fp('a'), "First\n\nThird", true), e) + "\n";
    auto frags = parse_sidecar(text, "app.py.lore");
    ASSERT_EQ(frags.size(), 1u);
    const auto& f = frags[0];
    EXPECT_EQ(f.fingerprint, fp('a'));
    EXPECT_TRUE(f.stale);
    EXPECT_EQ(f.description, "First\n\nThird");
    EXPECT_EQ(f.signature, "def f(x):");
    ASSERT_TRUE(f.scope);
    EXPECT_EQ(*f.scope, Scope::Function);
    EXPECT_EQ(f.name, "f");
    EXPECT_EQ(f.start_line, 2);
    EXPECT_EQ(f.end_line, 3);
    EXPECT_EQ(f.sidecar_start, 3);
    EXPECT_EQ(f.sidecar_end, 8);
}

TEST(SidecarFormat, ParseAcceptsFragmentWithoutEntityLine) {
    std::string text = "// @lore hash:" + fp('b') + " stale:false\n"
                       "// @lore description:Adds numbers.\n"
                       "int add(int a, int b) {\n";
    auto frags = parse_sidecar(text);
    ASSERT_EQ(frags.size(), 1u);
    EXPECT_FALSE(frags[0].scope);
    EXPECT_EQ(frags[0].description, "Adds numbers.");
    EXPECT_EQ(frags[0].signature, "int add(int a, int b) {");
}

TEST(SidecarFormat, DescriptionLooksLikeAnnotation) {
    auto e = function_entity("f", fp('a'), 1, 2, "def f():\n    pass\n");
    std::string text = project_fragment(record(fp('a'), "intro\n@lore hash:" + fp('c') + " stale:false"), e);
    auto frags = parse_sidecar(text);
    ASSERT_EQ(frags.size(), 1u);
    EXPECT_EQ(frags[0].fingerprint, fp('a'));
    EXPECT_EQ(frags[0].signature, "def f():");
}

TEST(SidecarFormat, MalformedFragmentsAreSkipped) {
    std::string good = "# @lore hash:" + fp('d') + " stale:false\n"
                       "# @lore description:Good one.\n"
                       "def good():\n";
    std::string text =
        "# @lore hash:sha256:short stale:false\n"
        "# @lore description:bad fingerprint\n"
        "def a():\n"
        "# @lore hash:" + fp('a') + " stale:maybe\n"
        "# @lore description:bad stale\n"
        "def b():\n"
        "# @lore hash:" + fp('b') + " stale:false\n"
        "def no_description():\n"
        "# @lore hash:" + fp('c') + " stale:false\n"
        "# @lore entity:widget w lines:1-2\n"
        "# @lore description:bad scope\n"
        "def c():\n" +
        good +
        "# @lore hash:" + fp('e') + " stale:false\n"
        "# @lore description:no signature\n";
    auto frags = parse_sidecar(text, "broken.lore");
    ASSERT_EQ(frags.size(), 1u);
    EXPECT_EQ(frags[0].fingerprint, fp('d'));
    EXPECT_EQ(frags[0].description, "Good one.");
}

TEST(SidecarFormat, KeysForAggregates) {
    auto f = function_entity("f", fp('a'), 1, 2, "def f(): pass\n");
    EXPECT_EQ(sidecar_key_for(f), "src/app.py");

    ParsedEntity pkg;
    pkg.scope = Scope::Package;
    pkg.name = "src";
    pkg.location = CodeLocation{"src", 0, 0};
    EXPECT_EQ(sidecar_key_for(pkg), "src/__package__");
    EXPECT_EQ(source_path_for_key("src/__package__"), "src");

    ParsedEntity project;
    project.scope = Scope::Project;
    project.location = CodeLocation{".", 0, 0};
    EXPECT_EQ(sidecar_key_for(project), "__project__");
    EXPECT_EQ(source_path_for_key("__project__"), ".");
    EXPECT_EQ(source_path_for_key("src/app.py"), "src/app.py");
}

TEST_F(SidecarTest, ReconcileWritesOnceThenIsStable) {
    auto mod = module_entity(fp('m'));
    auto f = function_entity("f", fp('a'), 1, 2, "def f():\n    return 1\n");
    index_->set(fp('m'), "The app module.");
    index_->set(fp('a'), "Returns one.");

    auto r1 = sync_->reconcile("src/app.py", {f, mod});
    EXPECT_TRUE(r1.written);
    EXPECT_EQ(r1.fragments, 2u);
    EXPECT_TRUE(std::filesystem::exists(paths_.sidecar_dir / "src" / "app.py.lore"));

    std::string text = sidecar_text("src/app.py");
    auto frags = parse_sidecar(text);
    ASSERT_EQ(frags.size(), 2u);
    EXPECT_EQ(frags[0].scope, Scope::Module);
    EXPECT_EQ(frags[1].scope, Scope::Function);

    auto r2 = sync_->reconcile("src/app.py", {f, mod});
    EXPECT_FALSE(r2.written);
    EXPECT_EQ(sidecar_text("src/app.py"), text);
}

TEST_F(SidecarTest, GetterAndSetterEachGetAFragment) {
    auto getter = function_entity("C.x", fp('g'), 2, 4, "    @property\n    def x(self):\n        return self._x");
    auto setter = function_entity("C.x", fp('s'), 6, 8, "    @x.setter\n    def x(self, v):\n        self._x = v");
    index_->set(fp('g'), "Reads x.");
    index_->set(fp('s'), "Writes x.");

    auto r1 = sync_->reconcile("src/app.py", {getter, setter});
    EXPECT_EQ(r1.fragments, 2u);
    auto frags = sync_->read("src/app.py");
    ASSERT_EQ(frags.size(), 2u);
    EXPECT_EQ(frags[0].description, "Reads x.");
    EXPECT_EQ(frags[0].signature, "def x(self):");
    EXPECT_EQ(frags[1].description, "Writes x.");
    EXPECT_EQ(frags[1].signature, "def x(self, v):");

    EXPECT_FALSE(sync_->reconcile("src/app.py", {getter, setter}).written);
    // listing the same entity twice still yields one fragment
    EXPECT_EQ(sync_->reconcile("src/app.py", {getter, getter, setter}).fragments, 2u);
}

TEST_F(SidecarTest, NumberedOverloadsKeepTheirNames) {
    auto first = function_entity("area", fp('1'), 1, 1, "double area(double r) { return r; }");
    auto second = function_entity("area#2", fp('2'), 2, 2, "double area(double w, double h) { return w * h; }");
    first.language = second.language = "cpp";
    first.location.path = second.location.path = "geo.cpp";
    index_->set(fp('1'), "Area of a circle.");
    index_->set(fp('2'), "Area of a rectangle.");

    EXPECT_EQ(sync_->reconcile("geo.cpp", {first, second}).fragments, 2u);
    auto frags = sync_->read("geo.cpp");
    ASSERT_EQ(frags.size(), 2u);
    EXPECT_EQ(frags[0].name, "area");
    EXPECT_EQ(frags[1].name, "area#2");
    EXPECT_EQ(frags[1].start_line, 2);
}

TEST_F(SidecarTest, ReconcileSkipsEntitiesWithoutRecord) {
    auto f = function_entity("f", fp('a'), 1, 2, "def f():\n    return 1\n");
    auto g = function_entity("g", fp('b'), 4, 5, "def g():\n    return 2\n");
    index_->set(fp('a'), "Returns one.");
    auto r = sync_->reconcile("src/app.py", {f, g});
    EXPECT_EQ(r.fragments, 1u);
    auto frags = sync_->read("src/app.py");
    ASSERT_EQ(frags.size(), 1u);
    EXPECT_EQ(frags[0].name, "f");
}

TEST_F(SidecarTest, HandWrittenNotesSurvive) {
    std::string existing =
        "Notes for app\n"
        "\n"
        "# @lore hash:" + fp('a') + " stale:false\n"
        "# @lore entity:function f lines:1-2\n"
        "# @lore description:Old f\n"
        "def f():\n"
        "keep this note about f\n"
        "\n"
        "# @lore hash:" + fp('b') + " stale:false\n"
        "# @lore entity:function gone lines:4-5\n"
        "# @lore description:Old gone\n"
        "def gone():\n"
        "orphan note\n";
    write_text_file_atomic(sync_->sidecar_path_for("src/app.py"), existing);

    auto f = function_entity("f", fp('c'), 1, 2, "def f():\n    return 2\n");
    index_->set(fp('c'), "New f", true);
    auto r = sync_->reconcile("src/app.py", {f});
    EXPECT_TRUE(r.written);
    EXPECT_EQ(r.orphaned_blocks, 1u);

    std::string expected = "Notes for app\n\n" + project_fragment(*index_->get(fp('c')), f) +
                           "\nkeep this note about f\n\norphan note\n";
    EXPECT_EQ(sidecar_text("src/app.py"), expected);

    auto again = sync_->reconcile("src/app.py", {f});
    EXPECT_FALSE(again.written);
    EXPECT_EQ(sidecar_text("src/app.py"), expected);
}

TEST_F(SidecarTest, EmptyRenderRemovesSidecar) {
    auto f = function_entity("f", fp('a'), 1, 2, "def f():\n    return 1\n");
    index_->set(fp('a'), "Returns one.");
    sync_->reconcile("src/app.py", {f});
    ASSERT_TRUE(std::filesystem::exists(sync_->sidecar_path_for("src/app.py")));

    auto r = sync_->reconcile("src/app.py", {});
    EXPECT_TRUE(r.removed);
    EXPECT_FALSE(std::filesystem::exists(sync_->sidecar_path_for("src/app.py")));
}

TEST_F(SidecarTest, ListAndRemoveOrphans) {
    index_->set(fp('a'), "Returns one.");
    auto f = function_entity("f", fp('a'), 1, 2, "def f():\n    return 1\n");
    auto g = f;
    g.location.path = "lib/util.py";
    sync_->reconcile("src/app.py", {f});
    sync_->reconcile("lib/util.py", {g});

    auto keys = sync_->list_sidecars();
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys[0], "lib/util.py");
    EXPECT_EQ(keys[1], "src/app.py");

    EXPECT_EQ(sync_->remove_orphans({"src/app.py"}), 1u);
    keys = sync_->list_sidecars();
    ASSERT_EQ(keys.size(), 1u);
    EXPECT_EQ(keys[0], "src/app.py");
}

TEST_F(SidecarTest, ReseedRebuildsIndex) {
    auto f = function_entity("f", fp('a'), 1, 2, "def f():\n    return 1\n");
    index_->set(fp('a'), "Returns one.\nAlways.");
    sync_->reconcile("src/app.py", {f});
    index_->reset();

    auto r = sync_->reseed({f});
    EXPECT_FALSE(r.refused);
    EXPECT_EQ(r.files, 1u);
    EXPECT_EQ(r.seeded, 1u);
    EXPECT_EQ(r.unverified, 0u);
    auto rec = index_->get(fp('a'));
    ASSERT_TRUE(rec);
    EXPECT_EQ(rec->description, "Returns one.\nAlways.");
    EXPECT_EQ(index_->current_fingerprint(identity_of(f).key()), fp('a'));

    EXPECT_TRUE(sync_->reseed({f}).refused);

    auto forced = sync_->reseed({}, true);
    EXPECT_FALSE(forced.refused);
    EXPECT_EQ(forced.already_present, 1u);
    EXPECT_EQ(forced.seeded, 0u);
}

TEST_F(SidecarTest, ReseedCountsFragmentsWithoutCurrentCode) {
    auto f = function_entity("f", fp('a'), 1, 2, "def f():\n    return 1\n");
    index_->set(fp('a'), "Returns one.");
    sync_->reconcile("src/app.py", {f});
    index_->reset();

    auto r = sync_->reseed({});
    EXPECT_EQ(r.seeded, 1u);
    EXPECT_EQ(r.unverified, 1u);
}
