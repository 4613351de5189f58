#include <codeatlas/complexity.hpp>
#include <codeatlas/parser.hpp>

#include <gtest/gtest.h>
#include <vector>

using namespace codeatlas;

class ComplexityTest : public ::testing::Test {
protected:
    PythonParser parser;
    ComplexityConfig config;

    // function_definition nodes in document order
    std::vector<TSNode> functions(const std::string &source) {
        std::vector<TSNode> result;
        EXPECT_TRUE(parser.parse(source));
        EXPECT_FALSE(parser.has_syntax_errors());
        visit_nodes(parser.root(), [&](TSNode node) {
            if (node_is(node, "function_definition")) {
                result.push_back(node);
            }
            return true;
        });
        return result;
    }

    int score_first(const std::string &source) {
        auto defs = functions(source);
        EXPECT_FALSE(defs.empty());
        return defs.empty() ? -1 : score_callable(defs.front(), config);
    }
};

TEST_F(ComplexityTest, StraightLineFunctionScoresBase) {
    EXPECT_EQ(score_first("def f(x):\n    return x + 1\n"), 1);
}

TEST_F(ComplexityTest, CountsBranchesLoopsAndHandlers) {
    const char *source = "def f(items):\n"
                         "    if not items:\n"
                         "        return 0\n"
                         "    elif len(items) == 1:\n"
                         "        return 1\n"
                         "    else:\n"
                         "        pass\n"
                         "    for item in items:\n"
                         "        print(item)\n"
                         "    while items:\n"
                         "        items.pop()\n"
                         "    try:\n"
                         "        risky()\n"
                         "    except ValueError:\n"
                         "        pass\n"
                         "    return 2\n";
    // if, elif, for, while, except
    EXPECT_EQ(score_first(source), 6);
}

TEST_F(ComplexityTest, BooleanOperatorsAddOneEach) {
    const char *source = "def f(a, b, c):\n"
                         "    if a and b or c:\n"
                         "        return True\n"
                         "    return False\n";
    EXPECT_EQ(score_first(source), 4);
}

TEST_F(ComplexityTest, NestedDefinitionsCountTowardEnclosingCallable) {
    const char *source = "def outer(x):\n"
                         "    def inner(y):\n"
                         "        if y:\n"
                         "            return 1\n"
                         "        return 0\n"
                         "    return inner(x)\n";
    auto defs = functions(source);
    ASSERT_EQ(defs.size(), 2u);
    // outer includes inner's branch, inner is still scored on its own
    EXPECT_EQ(score_callable(defs[0], config), 2);
    EXPECT_EQ(score_callable(defs[1], config), 2);
}

TEST_F(ComplexityTest, CallableScoreIsCapped) {
    config.max_callable = 3;
    const char *source = "def f(a):\n"
                         "    if a:\n        pass\n"
                         "    if a:\n        pass\n"
                         "    if a:\n        pass\n"
                         "    if a:\n        pass\n";
    EXPECT_EQ(score_first(source), 3);
}

TEST_F(ComplexityTest, FileScoreCountsDefinitionsAndBranches) {
    const char *source = "def f(x):\n"
                         "    if x and x > 1:\n"
                         "        return 1\n"
                         "    return 0\n"
                         "\n"
                         "class A:\n"
                         "    def m(self):\n"
                         "        for i in range(3):\n"
                         "            pass\n";
    ASSERT_TRUE(parser.parse(source));
    // base + two defs + if + for; boolean operators ignored
    EXPECT_EQ(score_file(parser.root(), config), 5);
}

TEST_F(ComplexityTest, FileScoreIsCapped) {
    config.max_file = 2;
    ASSERT_TRUE(parser.parse("def a():\n    pass\n\ndef b():\n    pass\n\ndef c():\n    pass\n"));
    EXPECT_EQ(score_file(parser.root(), config), 2);
}

TEST_F(ComplexityTest, LevelBoundaries) {
    EXPECT_EQ(complexity_level(1, config), ComplexityLevel::Low);
    EXPECT_EQ(complexity_level(9, config), ComplexityLevel::Low);
    EXPECT_EQ(complexity_level(10, config), ComplexityLevel::Medium);
    EXPECT_EQ(complexity_level(19, config), ComplexityLevel::Medium);
    EXPECT_EQ(complexity_level(20, config), ComplexityLevel::High);
    EXPECT_EQ(complexity_level(39, config), ComplexityLevel::High);
    EXPECT_EQ(complexity_level(40, config), ComplexityLevel::VeryHigh);
    EXPECT_EQ(complexity_level(100, config), ComplexityLevel::VeryHigh);
}
