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

#include "types.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <set>
#include <unordered_map>
#include <utility>
#include <vector>

namespace codeatlas {

using json = nlohmann::json;

// File-level node of the dependency graph
struct FileNode {
    EntityId id = INVALID_ID;
    std::string path;
    std::string name;
    DomainType domain = DomainType::Unknown;
    uint32_t type_count = 0;
    uint32_t abstract_type_count = 0;
};

// Simple directed graph over file ids: no self-loops, no parallel edges
class DependencyGraph {
public:

    void add_node(const FileNode &node);

    // Returns false for self-loops, unknown endpoints and duplicates
    bool add_edge(EntityId from, EntityId to);

    bool has_node(EntityId id) const;
    bool has_edge(EntityId from, EntityId to) const;

    // nullptr if absent
    const FileNode *node(EntityId id) const;

    // Ascending id order
    std::vector<EntityId> node_ids() const;

    // Edges sorted by (from, to)
    std::vector<std::pair<EntityId, EntityId>> edges() const;

    // Files this file depends on
    const std::set<EntityId> &successors(EntityId id) const;

    // Files depending on this file
    const std::set<EntityId> &predecessors(EntityId id) const;

    size_t node_count() const { return nodes_.size(); }
    size_t edge_count() const { return edge_count_; }

    // {"nodes": [...], "edges": [{"source", "target"}]}
    json to_json() const;

private:

    std::map<EntityId, FileNode> nodes_;
    std::unordered_map<EntityId, std::set<EntityId>> successors_;
    std::unordered_map<EntityId, std::set<EntityId>> predecessors_;
    size_t edge_count_ = 0;
};

// Project entity-level relationships onto files. Endpoints map to their
// owning file (a file endpoint owns itself); edges with an unknown owner or
// inside one file are dropped. Every file becomes a node.
DependencyGraph build_dependency_graph(
    const std::vector<SourceFile> &files, const std::vector<Relationship> &relationships,
    const OwnerMap &type_owners, const OwnerMap &callable_owners,
    const std::unordered_map<EntityId, uint32_t> &abstract_type_counts = {});

} // namespace codeatlas
