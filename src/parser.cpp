#include "codeatlas/parser.hpp"
#include "codeatlas/error.hpp"
#include <cstring>
#include <vector>

namespace codeatlas {

PythonParser::PythonParser() {
    parser_ = ts_parser_new();
    if (!parser_) {
        throw Error("Failed to create tree-sitter parser");
    }

    if (!ts_parser_set_language(parser_, tree_sitter_python())) {
        ts_parser_delete(parser_);
        parser_ = nullptr;
        throw Error("Failed to set parser language");
    }
}

PythonParser::~PythonParser() {
    if (tree_) ts_tree_delete(tree_);
    if (parser_) ts_parser_delete(parser_);
}

PythonParser::PythonParser(PythonParser &&other) noexcept
    : parser_(other.parser_), tree_(other.tree_), source_(std::move(other.source_)) {
    other.parser_ = nullptr;
    other.tree_ = nullptr;
}

PythonParser &PythonParser::operator=(PythonParser &&other) noexcept {
    if (this != &other) {
        if (tree_) ts_tree_delete(tree_);
        if (parser_) ts_parser_delete(parser_);

        parser_ = other.parser_;
        tree_ = other.tree_;
        source_ = std::move(other.source_);

        other.parser_ = nullptr;
        other.tree_ = nullptr;
    }
    return *this;
}

void PythonParser::set_timeout_ms(uint32_t timeout_ms) {
    ts_parser_set_timeout_micros(parser_, static_cast<uint64_t>(timeout_ms) * 1000);
}

bool PythonParser::parse(const std::string &source) {
    source_ = source;

    if (tree_) {
        ts_tree_delete(tree_);
        tree_ = nullptr;
    }

    tree_ = ts_parser_parse_string(parser_, nullptr, source_.c_str(),
                                   static_cast<uint32_t>(source_.size()));
    if (!tree_) {
        // Timed out: discard the partial parse state
        ts_parser_reset(parser_);
        return false;
    }
    return true;
}

bool PythonParser::has_syntax_errors() const {
    if (!tree_) {
        return false;
    }
    return ts_node_has_error(ts_tree_root_node(tree_));
}

TSNode PythonParser::root() const {
    if (!tree_) {
        return TSNode{};
    }
    return ts_tree_root_node(tree_);
}

std::string PythonParser::node_text(TSNode node) const {
    if (ts_node_is_null(node)) {
        return "";
    }
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);
    if (start < source_.size() && end <= source_.size() && start <= end) {
        return source_.substr(start, end - start);
    }
    return "";
}

void visit_nodes(TSNode node, const std::function<bool(TSNode)> &visitor) {
    if (ts_node_is_null(node)) {
        return;
    }

    // Iterative with an explicit stack; deep expressions would overflow recursion
    std::vector<TSNode> stack;
    stack.push_back(node);

    while (!stack.empty()) {
        TSNode current = stack.back();
        stack.pop_back();

        if (!visitor(current)) {
            continue;
        }

        uint32_t child_count = ts_node_child_count(current);
        // Add children in reverse order so they're processed in order
        for (uint32_t i = child_count; i > 0; --i) {
            stack.push_back(ts_node_child(current, i - 1));
        }
    }
}

bool node_is(TSNode node, const char *type) {
    return !ts_node_is_null(node) && strcmp(ts_node_type(node), type) == 0;
}

TSNode child_by_field(TSNode node, const char *field) {
    return ts_node_child_by_field_name(node, field, static_cast<uint32_t>(strlen(field)));
}

} // namespace codeatlas
