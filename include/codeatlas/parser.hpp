#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <tree_sitter/api.h>

// Forward declaration for the tree-sitter Python grammar
extern "C" {
const TSLanguage *tree_sitter_python();
}

namespace codeatlas {

// Owns a tree-sitter parser configured for Python and the last tree it produced
class PythonParser {
public:

    PythonParser();
    ~PythonParser();

    // Non-copyable
    PythonParser(const PythonParser &) = delete;
    PythonParser &operator=(const PythonParser &) = delete;

    // Movable
    PythonParser(PythonParser &&other) noexcept;
    PythonParser &operator=(PythonParser &&other) noexcept;

    // Wall-clock budget for a single parse, 0 = unlimited
    void set_timeout_ms(uint32_t timeout_ms);

    // Parse source code. Returns false when no tree was produced
    // (timeout or cancellation).
    bool parse(const std::string &source);

    // True if the last tree contains ERROR or MISSING nodes
    bool has_syntax_errors() const;

    // Get root node (null node if nothing parsed)
    TSNode root() const;

    std::string node_text(TSNode node) const;

private:

    TSParser *parser_ = nullptr;
    TSTree *tree_ = nullptr;
    std::string source_;
};

// ============================================================================
// Node helpers
// ============================================================================

bool node_is(TSNode node, const char *type);

// Pre-order walk. The visitor returns false to skip a node's children.
void visit_nodes(TSNode node, const std::function<bool(TSNode)> &visitor);

TSNode child_by_field(TSNode node, const char *field);

// 1-based line numbers
inline uint32_t start_line(TSNode node) { return ts_node_start_point(node).row + 1; }
inline uint32_t end_line(TSNode node) { return ts_node_end_point(node).row + 1; }

} // namespace codeatlas
