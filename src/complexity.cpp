// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "codeatlas/complexity.hpp"
#include "codeatlas/parser.hpp"
#include <algorithm>

namespace codeatlas {

namespace {

bool is_branch(TSNode node) {
    // async for is a for_statement with an "async" token
    return node_is(node, "if_statement") || node_is(node, "elif_clause") ||
           node_is(node, "for_statement") || node_is(node, "while_statement");
}

bool is_handler(TSNode node) {
    return node_is(node, "except_clause") || node_is(node, "except_group_clause");
}

} // namespace

int score_callable(TSNode definition, const ComplexityConfig &config) {
    int decisions = 0;

    // Nested definitions count toward the enclosing callable too
    visit_nodes(definition, [&](TSNode node) {
        if (is_branch(node) || is_handler(node)) {
            ++decisions;
        } else if (node_is(node, "boolean_operator")) {
            // a and b and c nests as two operators: N-1 for N operands
            ++decisions;
        }
        return true;
    });

    return std::min(config.base + decisions * config.increment, config.max_callable);
}

int score_file(TSNode module, const ComplexityConfig &config) {
    int decisions = 0;

    visit_nodes(module, [&](TSNode node) {
        if (is_branch(node) || is_handler(node) || node_is(node, "function_definition")) {
            ++decisions;
        }
        return true;
    });

    return std::min(config.base + decisions * config.increment, config.max_file);
}

ComplexityLevel complexity_level(int score, const ComplexityConfig &config) {
    if (score < config.medium_at)
        return ComplexityLevel::Low;
    if (score < config.high_at)
        return ComplexityLevel::Medium;
    if (score < config.very_high_at)
        return ComplexityLevel::High;
    return ComplexityLevel::VeryHigh;
}

} // namespace codeatlas
