#include "test_helpers.hpp"

#include <codeatlas/error.hpp>
#include <codeatlas/indexer.hpp>

#include <algorithm>

using namespace codeatlas;
using namespace codeatlas::test;

TEST(MatchPatternTest, ComponentsWholePathsAndPrefixes) {
    EXPECT_TRUE(matches_pattern("__pycache__", "pkg/__pycache__/mod.pyc"));
    EXPECT_TRUE(matches_pattern("*.pyc", "pkg/mod.pyc"));
    EXPECT_TRUE(matches_pattern("*.egg-info", "dist/thing.egg-info"));
    EXPECT_TRUE(matches_pattern("data/test", "data/test/sample.py"));
    EXPECT_TRUE(matches_pattern("data/test", "data/test"));
    EXPECT_FALSE(matches_pattern("data/test", "data/testing/sample.py"));
    EXPECT_FALSE(matches_pattern("cache", "src/cached.py"));
    EXPECT_FALSE(matches_pattern("", "a.py"));
}

class IndexerTest : public TempDirTest {
protected:
    Config config;

    void SetUp() override {
        TempDirTest::SetUp();
        config.processing.num_threads = 2;
    }
};

TEST_F(IndexerTest, DiscoverFilesAppliesPatternsAndSorts) {
    write_file("b.py", "x = 1\n");
    write_file("a.py", "x = 1\n");
    write_file("pkg/mod.py", "x = 1\n");
    write_file("pkg/__pycache__/mod.cpython-311.pyc", "bin");
    write_file("node_modules/lib/index.js", "var x;\n");
    write_file("README.md", "# readme\n");
    write_file("notes.txt", "ignored\n");
    write_file("data/test/fixture.py", "x = 1\n");

    Indexer indexer(config);
    auto files = indexer.discover_files(root_);

    std::vector<std::string> rel;
    for (const auto &f : files) {
        rel.push_back(fs::relative(f, root_).generic_string());
    }
    std::vector<std::string> expected = {"README.md", "a.py", "b.py", "pkg/mod.py"};
    EXPECT_EQ(rel, expected);
}

TEST_F(IndexerTest, DiscoverMissingRootIsEmpty) {
    Indexer indexer(config);
    EXPECT_TRUE(indexer.discover_files(root_ / "missing").empty());
}

TEST_F(IndexerTest, RunRejectsMissingRootBeforeTouchingStore) {
    write_file("kept.py", "x = 1\n");
    Store store(":memory:");
    Indexer indexer(config);
    indexer.run(root_, store);

    EXPECT_THROW(indexer.run(root_ / "missing", store), SourceRootError);
    EXPECT_TRUE(store.get_file("kept.py").has_value());
}

TEST_F(IndexerTest, ExtractAllKeepsInputOrderAndReportsProgress) {
    for (int i = 0; i < 7; ++i) {
        write_file("m" + std::to_string(i) + ".py", "def f" + std::to_string(i) + "():\n    pass\n");
    }

    size_t calls = 0;
    size_t last_total = 0;
    Indexer indexer(config, [&](const std::string &, size_t, size_t total) {
        ++calls;
        last_total = total;
    });
    auto files = indexer.discover_files(root_);
    auto batch = indexer.extract_all(root_, files);

    ASSERT_EQ(batch.size(), 7u);
    for (size_t i = 0; i < batch.size(); ++i) {
        EXPECT_EQ(batch[i].file.path, "m" + std::to_string(i) + ".py");
        ASSERT_EQ(batch[i].callables.size(), 1u);
        EXPECT_EQ(batch[i].callables[0].unit.name, "f" + std::to_string(i));
    }
    EXPECT_EQ(calls, 7u);
    EXPECT_EQ(last_total, 7u);
}

TEST_F(IndexerTest, PartialFailureKeepsEveryFile) {
    write_file("a.py", "def a():\n    return 1\n");
    write_file("b.py", "def b(:\n    return\n");
    write_file("c.py", "class C:\n    pass\n");

    Store store(":memory:");
    Indexer indexer(config);
    RunSummary summary = indexer.run(root_, store);

    EXPECT_EQ(summary.files, 3u);
    ASSERT_EQ(summary.errors.size(), 1u);
    EXPECT_EQ(summary.errors[0].path, "b.py");

    auto broken = store.get_file("b.py");
    ASSERT_TRUE(broken.has_value());
    EXPECT_EQ(broken->lines_of_code, 0u);
    EXPECT_EQ(store.get_file("a.py")->lines_of_code, 2u);
    EXPECT_EQ(store.counts().files, 3u);
}

TEST_F(IndexerTest, PersistMapsBatchEntitiesToStoreIds) {
    write_file("x.py", "class Base:\n    def run(self):\n        pass\n");
    write_file("y.py", "from x import Base\n\nclass Child(Base):\n    def go(self):\n        self.run()\n");

    Store store(":memory:");
    Indexer indexer(config);
    RunSummary summary = indexer.run(root_, store);
    EXPECT_EQ(summary.types, 2u);
    EXPECT_EQ(summary.callables, 2u);
    EXPECT_TRUE(summary.errors.empty());

    TypeFilter by_name;
    by_name.name_contains = "Child";
    auto child_types = store.list_types(by_name);
    ASSERT_EQ(child_types.items.size(), 1u);
    const auto &child = child_types.items[0];

    RelationshipFilter filter;
    filter.kind = RelationshipKind::Inherits;
    auto inherits = store.list_relationships(filter);
    ASSERT_EQ(inherits.items.size(), 1u);
    EXPECT_EQ(inherits.items[0].source_id, child.id);

    auto base = store.get_type(inherits.items[0].target_id);
    ASSERT_TRUE(base.has_value());
    EXPECT_EQ(base->name, "Base");

    // Methods stay in their type's file
    for (const auto &callable : store.list_callables().items) {
        ASSERT_TRUE(callable.type_id.has_value());
        EXPECT_EQ(store.get_type(*callable.type_id)->file_id, callable.file_id);
    }
}

TEST_F(IndexerTest, IntegrityViolationRollsBackWholeRun) {
    Store store(":memory:");
    Indexer indexer(config);

    write_file("kept.py", "def kept():\n    pass\n");
    indexer.run(root_, store);
    ASSERT_TRUE(store.get_file("kept.py").has_value());

    // Two records for one path break the unique key mid-run
    AnalysisBatch batch = make_batch({{"dup.py", "def a():\n    pass\n"},
                                      {"dup.py", "def b():\n    pass\n"}});
    EXPECT_THROW(indexer.persist(store, batch), IntegrityViolation);

    EXPECT_TRUE(store.get_file("kept.py").has_value());
    EXPECT_FALSE(store.get_file("dup.py").has_value());
    EXPECT_EQ(store.counts().files, 1u);
    EXPECT_EQ(store.counts().callables, 1u);
}
