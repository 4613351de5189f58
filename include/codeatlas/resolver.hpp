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
#include "extractor.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace codeatlas {

// Per-file extraction results of one run, in sorted path order
using AnalysisBatch = std::vector<FileExtraction>;

// Batch-local address of an entity. local_index is unused for files.
struct EntityRef {
    size_t file_index = 0;
    size_t local_index = 0;

    bool operator==(const EntityRef &other) const {
        return file_index == other.file_index && local_index == other.local_index;
    }
};

// Stub with both endpoints bound to batch entities
struct ResolvedEdge {
    RelationshipKind kind = RelationshipKind::Calls;
    EntityKind source_kind = EntityKind::Callable;
    EntityRef source;
    std::string source_name;
    EntityKind target_kind = EntityKind::Callable;
    EntityRef target;
    std::string target_name;
    std::string file_path;
    uint32_t line = 0;
};

// (entity kind, name) -> candidates in file-processing order
class NameIndex {
public:

    // Index every type and callable by name, and every Python file by its
    // dotted module path
    static NameIndex build(const AnalysisBatch &batch);

    void add(EntityKind kind, const std::string &name, const EntityRef &ref);

    // Exact lookup, nullptr when absent
    const std::vector<EntityRef> *find(EntityKind kind, const std::string &name) const;

    // Modules whose dotted path ends with ".<name>"
    const std::vector<EntityRef> *find_module_suffix(const std::string &name) const;

    size_t size() const;

private:

    using Bucket = std::unordered_map<std::string, std::vector<EntityRef>>;

    Bucket files_;
    Bucket types_;
    Bucket callables_;
    Bucket module_suffixes_;

    Bucket &bucket(EntityKind kind);
    const Bucket &bucket(EntityKind kind) const;
};

struct ResolutionResult {
    std::vector<ResolvedEdge> edges;
    size_t unresolved = 0; // Dropped stubs
    size_t ambiguous = 0;  // Resolved to the first of several candidates
};

// Bind every stub in the batch. Pure: reads only its arguments.
ResolutionResult resolve_relationships(const AnalysisBatch &batch, const NameIndex &index,
                                       const ResolutionConfig &config);

} // namespace codeatlas
