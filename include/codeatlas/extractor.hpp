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
#include "parser.hpp"
#include "types.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace codeatlas {

// Relationship whose target is still a name. Source and local targets are
// indexes into the owning FileExtraction's types/callables.
struct RelationshipStub {
    RelationshipKind kind = RelationshipKind::Calls;
    EntityKind source_kind = EntityKind::Callable;
    size_t source_index = 0; // Ignored for file sources
    std::string source_name;
    EntityKind target_kind = EntityKind::Callable;
    std::string target_name;
    std::optional<size_t> local_target; // Same-file entity, bypasses name lookup
    uint32_t line = 0;
};

struct ExtractedCallable {
    CallableUnit unit;
    std::optional<size_t> parent_type; // Index into FileExtraction::types
};

// Everything one file contributes to an analysis run
struct FileExtraction {
    SourceFile file;
    std::vector<TypeDefinition> types;
    std::vector<ExtractedCallable> callables;
    std::vector<RelationshipStub> stubs;
    std::optional<std::string> error; // Parse failure, file kept as a stub record

    bool ok() const { return !error.has_value(); }
};

// Extracts the structural model of one file at a time.
// Not thread-safe: use one extractor per worker.
class EntityExtractor {
public:

    EntityExtractor(const ExtractionConfig &extraction, const ComplexityConfig &complexity,
                    uint64_t max_file_bytes = 0);

    // Read and extract a file. Never throws for per-file problems.
    FileExtraction extract_file(const std::filesystem::path &path, const std::string &rel_path);

    // Extract from in-memory content
    FileExtraction extract(const std::string &rel_path, const std::string &content);

private:

    ExtractionConfig extraction_;
    ComplexityConfig complexity_;
    uint64_t max_file_bytes_;
    PythonParser parser_;
};

// Minimal record (path, name, domain, kind) for a file that could not be
// extracted, carrying `message` as its error
FileExtraction failed_extraction(const std::string &rel_path, const std::string &message);

// ============================================================================
// Path helpers
// ============================================================================

// Architectural bucket from the tokens of a relative path
DomainType classify_domain(const std::string &rel_path);

// Number of lines, counting a final line without a trailing newline
uint32_t count_lines(const std::string &content);

// Dotted module name of a Python file: pkg/mod.py -> pkg.mod,
// pkg/__init__.py -> pkg. Empty for non-Python paths.
std::string module_name_for_path(const std::string &rel_path);

} // namespace codeatlas
