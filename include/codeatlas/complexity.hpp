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

#pragma once

#include "config.hpp"
#include "types.hpp"
#include <tree_sitter/api.h>

namespace codeatlas {

// Simplified cyclomatic complexity of one function_definition node.
// Counts if/elif/for/while, except clauses and boolean operators in the
// body. Nested function and class definitions are scored on their own.
int score_callable(TSNode definition, const ComplexityConfig &config);

// Whole-module score: every branch and handler anywhere, plus one per
// function definition (nested or not). Boolean operators are not counted.
int score_file(TSNode module, const ComplexityConfig &config);

ComplexityLevel complexity_level(int score, const ComplexityConfig &config);

} // namespace codeatlas
