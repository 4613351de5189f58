#include "test_helpers.hpp"

#include <algorithm>

using namespace codeatlas;
using namespace codeatlas::test;

namespace {

const RelationshipStub *find_stub(const FileExtraction &fx, RelationshipKind kind,
                                  const std::string &target) {
    for (const auto &stub : fx.stubs) {
        if (stub.kind == kind && stub.target_name == target) {
            return &stub;
        }
    }
    return nullptr;
}

size_t count_stubs(const FileExtraction &fx, RelationshipKind kind) {
    return std::count_if(fx.stubs.begin(), fx.stubs.end(),
                         [&](const RelationshipStub &s) { return s.kind == kind; });
}

const char *SHAPES = "import os\n"
                     "from abc import ABC, abstractmethod\n"
                     "\n"
                     "class Shape(ABC):\n"
                     "    @abstractmethod\n"
                     "    def area(self):\n"
                     "        pass\n"
                     "\n"
                     "    @staticmethod\n"
                     "    def unit():\n"
                     "        return 1\n"
                     "\n"
                     "    @property\n"
                     "    def label(self) -> str:\n"
                     "        return \"shape\"\n"
                     "\n"
                     "async def fetch(url: str, retries=3, *args, **kwargs):\n"
                     "    result = helper(url)\n"
                     "    return result\n"
                     "\n"
                     "def numbers():\n"
                     "    yield 1\n";

} // namespace

class ExtractorTest : public TempDirTest {
protected:
    Config config;

    FileExtraction extract(const std::string &path, const std::string &content,
                           uint64_t max_bytes = 0) {
        EntityExtractor extractor(config.extraction, config.complexity, max_bytes);
        return extractor.extract(path, content);
    }
};

// ============================================================================
// Path helpers
// ============================================================================

TEST(PathHelpersTest, ClassifyDomainByPathTokens) {
    EXPECT_EQ(classify_domain("ui/dashboard.py"), DomainType::Presentation);
    EXPECT_EQ(classify_domain("src/models/user.py"), DomainType::Models);
    EXPECT_EQ(classify_domain("core/services/billing.py"), DomainType::Services);
    EXPECT_EQ(classify_domain("infra/db.py"), DomainType::Infrastructure);
    EXPECT_EQ(classify_domain("utils/strings.py"), DomainType::Utils);
    EXPECT_EQ(classify_domain("tests/test_api.py"), DomainType::Tests);
    EXPECT_EQ(classify_domain("settings.py"), DomainType::Config);
    EXPECT_EQ(classify_domain("README.md"), DomainType::Docs);
    EXPECT_EQ(classify_domain("lib/thing.py"), DomainType::Unknown);
}

TEST(PathHelpersTest, CountLines) {
    EXPECT_EQ(count_lines(""), 0u);
    EXPECT_EQ(count_lines("a"), 1u);
    EXPECT_EQ(count_lines("a\n"), 1u);
    EXPECT_EQ(count_lines("a\nb"), 2u);
    EXPECT_EQ(count_lines("a\n\nb\n"), 3u);
}

TEST(PathHelpersTest, ModuleNameForPath) {
    EXPECT_EQ(module_name_for_path("pkg/mod.py"), "pkg.mod");
    EXPECT_EQ(module_name_for_path("pkg/__init__.py"), "pkg");
    EXPECT_EQ(module_name_for_path("top.py"), "top");
    EXPECT_EQ(module_name_for_path("README.md"), "");
}

// ============================================================================
// Python extraction
// ============================================================================

TEST_F(ExtractorTest, ExtractsTypesAndMembers) {
    auto fx = extract("geometry/shapes.py", SHAPES);
    ASSERT_TRUE(fx.ok());

    ASSERT_EQ(fx.types.size(), 1u);
    const auto &shape = fx.types[0];
    EXPECT_EQ(shape.name, "Shape");
    EXPECT_EQ(shape.kind, TypeKind::Abstract);
    EXPECT_TRUE(shape.is_abstract);
    EXPECT_EQ(shape.base_names, std::vector<std::string>{"ABC"});
    EXPECT_EQ(shape.member_count, 3u);
    EXPECT_EQ(shape.start_line, 4u);
    EXPECT_EQ(shape.end_line, 15u);

    ASSERT_EQ(fx.callables.size(), 5u);
    EXPECT_EQ(fx.callables[0].unit.name, "area");
    EXPECT_EQ(fx.callables[0].unit.kind, CallableKind::Method);
    EXPECT_EQ(fx.callables[0].unit.decorators, std::vector<std::string>{"abstractmethod"});
    EXPECT_EQ(fx.callables[0].parent_type, std::optional<size_t>(0));
    EXPECT_EQ(fx.callables[1].unit.kind, CallableKind::Static);
    EXPECT_EQ(fx.callables[2].unit.kind, CallableKind::Property);
    EXPECT_EQ(fx.callables[2].unit.return_type, std::optional<std::string>("str"));
}

TEST_F(ExtractorTest, ExtractsFreeFunctions) {
    auto fx = extract("geometry/shapes.py", SHAPES);
    ASSERT_TRUE(fx.ok());
    ASSERT_EQ(fx.callables.size(), 5u);

    const auto &fetch = fx.callables[3];
    EXPECT_EQ(fetch.unit.name, "fetch");
    EXPECT_EQ(fetch.unit.kind, CallableKind::Function);
    EXPECT_FALSE(fetch.parent_type.has_value());
    EXPECT_TRUE(fetch.unit.is_async);
    EXPECT_FALSE(fetch.unit.is_generator);
    std::vector<std::string> params = {"url:str", "retries=3", "*args", "**kwargs"};
    EXPECT_EQ(fetch.unit.parameters, params);

    const auto &numbers = fx.callables[4];
    EXPECT_TRUE(numbers.unit.is_generator);
    EXPECT_FALSE(numbers.unit.is_async);
    EXPECT_TRUE(numbers.unit.parameters.empty());
}

TEST_F(ExtractorTest, FileRecordSummarizesContents) {
    auto fx = extract("geometry/shapes.py", SHAPES);
    ASSERT_TRUE(fx.ok());
    EXPECT_EQ(fx.file.path, "geometry/shapes.py");
    EXPECT_EQ(fx.file.name, "shapes.py");
    EXPECT_EQ(fx.file.kind, FileKind::Python);
    EXPECT_EQ(fx.file.lines_of_code, 22u);
    EXPECT_EQ(fx.file.types_count, 1u);
    EXPECT_EQ(fx.file.callables_count, 5u);
    EXPECT_EQ(fx.file.imports_count, 2u);
    // base + five definitions
    EXPECT_EQ(fx.file.complexity, 6);
    EXPECT_EQ(fx.file.complexity_level, ComplexityLevel::Low);
}

TEST_F(ExtractorTest, EmitsRelationshipStubs) {
    auto fx = extract("geometry/shapes.py", SHAPES);
    ASSERT_TRUE(fx.ok());

    const auto *inherits = find_stub(fx, RelationshipKind::Inherits, "ABC");
    ASSERT_NE(inherits, nullptr);
    EXPECT_EQ(inherits->source_kind, EntityKind::Type);
    EXPECT_EQ(inherits->source_name, "Shape");
    EXPECT_EQ(inherits->line, 4u);

    EXPECT_EQ(count_stubs(fx, RelationshipKind::Contains), 3u);
    const auto *contains = find_stub(fx, RelationshipKind::Contains, "label");
    ASSERT_NE(contains, nullptr);
    EXPECT_EQ(contains->local_target, std::optional<size_t>(2));

    const auto *call = find_stub(fx, RelationshipKind::Calls, "helper");
    ASSERT_NE(call, nullptr);
    EXPECT_EQ(call->source_name, "fetch");
    EXPECT_EQ(call->source_index, 3u);
    EXPECT_EQ(call->line, 18u);

    ASSERT_NE(find_stub(fx, RelationshipKind::Imports, "os"), nullptr);
    ASSERT_NE(find_stub(fx, RelationshipKind::Imports, "abc"), nullptr);
}

TEST_F(ExtractorTest, ClassifiesTypeKinds) {
    const char *source = "from dataclasses import dataclass\n"
                         "from enum import Enum\n"
                         "from pydantic import BaseModel\n"
                         "\n"
                         "@dataclass\n"
                         "class Point:\n"
                         "    x: int = 0\n"
                         "\n"
                         "class Color(Enum):\n"
                         "    RED = 1\n"
                         "\n"
                         "class User(BaseModel):\n"
                         "    name: str\n"
                         "\n"
                         "class NotFound(LookupError):\n"
                         "    pass\n"
                         "\n"
                         "class Plain(object):\n"
                         "    pass\n";
    auto fx = extract("models/records.py", source);
    ASSERT_TRUE(fx.ok());
    ASSERT_EQ(fx.types.size(), 5u);
    EXPECT_EQ(fx.types[0].kind, TypeKind::DataHolder);
    EXPECT_EQ(fx.types[0].decorators, std::vector<std::string>{"dataclass"});
    EXPECT_EQ(fx.types[1].kind, TypeKind::Enumeration);
    EXPECT_EQ(fx.types[2].kind, TypeKind::SchemaModel);
    EXPECT_EQ(fx.types[3].kind, TypeKind::Exception);
    EXPECT_EQ(fx.types[4].kind, TypeKind::Plain);
    EXPECT_EQ(fx.file.schema_models_count, 1u);

    // "object" is never an inheritance target
    EXPECT_EQ(find_stub(fx, RelationshipKind::Inherits, "object"), nullptr);
    EXPECT_EQ(count_stubs(fx, RelationshipKind::Inherits), 3u);
}

TEST_F(ExtractorTest, AbcMetaclassMarksAbstract) {
    auto fx = extract("base.py", "import abc\n\nclass Repo(metaclass=abc.ABCMeta):\n    pass\n");
    ASSERT_TRUE(fx.ok());
    ASSERT_EQ(fx.types.size(), 1u);
    EXPECT_TRUE(fx.types[0].is_abstract);
    EXPECT_TRUE(fx.types[0].base_names.empty());
}

TEST_F(ExtractorTest, NestedFunctionCallsAlsoBelongToEnclosingCallable) {
    const char *source = "def outer():\n"
                         "    def inner():\n"
                         "        work()\n"
                         "        yield 1\n"
                         "    inner()\n";
    auto fx = extract("jobs.py", source);
    ASSERT_TRUE(fx.ok());
    ASSERT_EQ(fx.callables.size(), 2u);
    EXPECT_EQ(fx.callables[0].unit.name, "outer");
    EXPECT_EQ(fx.callables[1].unit.name, "inner");
    EXPECT_FALSE(fx.callables[1].parent_type.has_value());

    // work() is recorded for both inner and outer
    std::vector<std::string> work_sources;
    for (const auto &stub : fx.stubs) {
        if (stub.kind == RelationshipKind::Calls && stub.target_name == "work") {
            work_sources.push_back(stub.source_name);
        }
    }
    std::sort(work_sources.begin(), work_sources.end());
    EXPECT_EQ(work_sources, (std::vector<std::string>{"inner", "outer"}));

    const auto *inner = find_stub(fx, RelationshipKind::Calls, "inner");
    ASSERT_NE(inner, nullptr);
    EXPECT_EQ(inner->source_name, "outer");
    EXPECT_EQ(count_stubs(fx, RelationshipKind::Calls), 3u);

    // A nested generator does not make the enclosing function one
    EXPECT_FALSE(fx.callables[0].unit.is_generator);
    EXPECT_TRUE(fx.callables[1].unit.is_generator);
}

TEST_F(ExtractorTest, AttributeCallsKeepDottedName) {
    const char *source = "class Repo:\n"
                         "    def save(self):\n"
                         "        self.flush()\n"
                         "        get_items()[0].run()\n";
    auto fx = extract("repo.py", source);
    ASSERT_TRUE(fx.ok());
    EXPECT_NE(find_stub(fx, RelationshipKind::Calls, "self.flush"), nullptr);
    EXPECT_NE(find_stub(fx, RelationshipKind::Calls, "get_items"), nullptr);
    // Subscript receivers are not dotted names
    EXPECT_EQ(count_stubs(fx, RelationshipKind::Calls), 2u);
}

TEST_F(ExtractorTest, RelativeAndAliasedImports) {
    const char *source = "import numpy as np\n"
                         "from . import sibling\n"
                         "from .pkg.mod import thing\n";
    auto fx = extract("app/main.py", source);
    ASSERT_TRUE(fx.ok());
    EXPECT_EQ(fx.file.imports_count, 3u);
    EXPECT_NE(find_stub(fx, RelationshipKind::Imports, "numpy"), nullptr);
    EXPECT_NE(find_stub(fx, RelationshipKind::Imports, "pkg.mod"), nullptr);
    EXPECT_EQ(count_stubs(fx, RelationshipKind::Imports), 2u);
}

TEST_F(ExtractorTest, ImportExtractionCanBeDisabled) {
    config.extraction.extract_imports = false;
    auto fx = extract("a.py", "import os\nimport sys\n");
    ASSERT_TRUE(fx.ok());
    EXPECT_EQ(fx.file.imports_count, 2u);
    EXPECT_EQ(count_stubs(fx, RelationshipKind::Imports), 0u);
}

// ============================================================================
// Failures and non-Python files
// ============================================================================

TEST_F(ExtractorTest, SyntaxErrorYieldsStubRecord) {
    auto fx = extract("broken.py", "def broken(:\n    pass\n");
    EXPECT_FALSE(fx.ok());
    EXPECT_EQ(fx.file.path, "broken.py");
    EXPECT_EQ(fx.file.lines_of_code, 0u);
    EXPECT_TRUE(fx.types.empty());
    EXPECT_TRUE(fx.callables.empty());
    EXPECT_TRUE(fx.stubs.empty());
}

TEST_F(ExtractorTest, OversizedContentIsRejected) {
    auto fx = extract("big.py", "x = 1\ny = 2\n", 4);
    EXPECT_FALSE(fx.ok());
    EXPECT_EQ(fx.file.lines_of_code, 0u);
}

TEST_F(ExtractorTest, NonPythonFileGetsBasicRecord) {
    auto fx = extract("docs/README.md", "# Title\n\nSome text\n");
    ASSERT_TRUE(fx.ok());
    EXPECT_EQ(fx.file.kind, FileKind::Markdown);
    EXPECT_EQ(fx.file.domain, DomainType::Docs);
    EXPECT_EQ(fx.file.lines_of_code, 3u);
    EXPECT_EQ(fx.file.complexity, 0);
    EXPECT_TRUE(fx.stubs.empty());
}

TEST_F(ExtractorTest, ExtractFileReadsFromDisk) {
    auto path = write_file("pkg/util.py", "def helper():\n    return 1\n");
    EntityExtractor extractor(config.extraction, config.complexity);
    auto fx = extractor.extract_file(path, "pkg/util.py");
    ASSERT_TRUE(fx.ok());
    ASSERT_EQ(fx.callables.size(), 1u);
    EXPECT_EQ(fx.callables[0].unit.name, "helper");
}

TEST_F(ExtractorTest, MissingFileIsReportedNotThrown) {
    EntityExtractor extractor(config.extraction, config.complexity);
    auto fx = extractor.extract_file(root_ / "nope.py", "nope.py");
    EXPECT_FALSE(fx.ok());
    EXPECT_EQ(fx.file.path, "nope.py");
}

TEST_F(ExtractorTest, ExtractorIsReusableAfterFailure) {
    EntityExtractor extractor(config.extraction, config.complexity);
    EXPECT_FALSE(extractor.extract("bad.py", "class (:\n").ok());
    auto fx = extractor.extract("good.py", "class Good:\n    pass\n");
    ASSERT_TRUE(fx.ok());
    EXPECT_EQ(fx.types.size(), 1u);
}

TEST_F(ExtractorTest, ParseTimeoutYieldsStubRecord) {
    config.extraction.parse_timeout_ms = 1;
    std::string big;
    for (int i = 0; i < 200000; ++i) {
        std::string n = std::to_string(i);
        big += "def f" + n + "(a, b=" + n + "):\n    if a and b:\n        return g(a) + " + n +
               "\n    return [x for x in range(b) if x % 2]\n";
    }

    EntityExtractor extractor(config.extraction, config.complexity);
    auto slow = extractor.extract("huge.py", big);
    EXPECT_FALSE(slow.ok());
    EXPECT_EQ(slow.file.path, "huge.py");
    EXPECT_EQ(slow.file.lines_of_code, 0u);
    EXPECT_TRUE(slow.callables.empty());

    // The same extractor still parses small files within the budget
    auto small = extractor.extract("small.py", "def ok():\n    return 1\n");
    ASSERT_TRUE(small.ok());
    ASSERT_EQ(small.callables.size(), 1u);
    EXPECT_EQ(small.callables[0].unit.name, "ok");
}

TEST(FailedExtractionTest, KeepsPathDomainAndKind) {
    auto fx = failed_extraction("services/billing.py", "Extractor unavailable");
    EXPECT_FALSE(fx.ok());
    EXPECT_EQ(*fx.error, "Extractor unavailable");
    EXPECT_EQ(fx.file.path, "services/billing.py");
    EXPECT_EQ(fx.file.name, "billing.py");
    EXPECT_EQ(fx.file.domain, DomainType::Services);
    EXPECT_EQ(fx.file.kind, FileKind::Python);
    EXPECT_EQ(fx.file.lines_of_code, 0u);
}
