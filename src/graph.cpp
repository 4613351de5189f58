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

#include "codeatlas/graph.hpp"

namespace codeatlas {

void DependencyGraph::add_node(const FileNode &node) { nodes_[node.id] = node; }

bool DependencyGraph::add_edge(EntityId from, EntityId to) {
    if (from == to || !has_node(from) || !has_node(to)) {
        return false;
    }
    if (!successors_[from].insert(to).second) {
        return false;
    }
    predecessors_[to].insert(from);
    ++edge_count_;
    return true;
}

bool DependencyGraph::has_node(EntityId id) const { return nodes_.count(id) > 0; }

bool DependencyGraph::has_edge(EntityId from, EntityId to) const {
    auto it = successors_.find(from);
    return it != successors_.end() && it->second.count(to) > 0;
}

const FileNode *DependencyGraph::node(EntityId id) const {
    auto it = nodes_.find(id);
    return (it != nodes_.end()) ? &it->second : nullptr;
}

std::vector<EntityId> DependencyGraph::node_ids() const {
    std::vector<EntityId> ids;
    ids.reserve(nodes_.size());
    for (const auto &[id, node] : nodes_) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<std::pair<EntityId, EntityId>> DependencyGraph::edges() const {
    std::vector<std::pair<EntityId, EntityId>> result;
    result.reserve(edge_count_);
    for (const auto &[id, node] : nodes_) {
        for (EntityId to : successors(id)) {
            result.emplace_back(id, to);
        }
    }
    return result;
}

const std::set<EntityId> &DependencyGraph::successors(EntityId id) const {
    static const std::set<EntityId> empty;
    auto it = successors_.find(id);
    return (it != successors_.end()) ? it->second : empty;
}

const std::set<EntityId> &DependencyGraph::predecessors(EntityId id) const {
    static const std::set<EntityId> empty;
    auto it = predecessors_.find(id);
    return (it != predecessors_.end()) ? it->second : empty;
}

json DependencyGraph::to_json() const {
    json j;
    json nodes = json::array();
    for (const auto &[id, node] : nodes_) {
        nodes.push_back({{"id", node.id},
                         {"path", node.path},
                         {"name", node.name},
                         {"domain", domain_to_string(node.domain)},
                         {"type_count", node.type_count},
                         {"abstract_type_count", node.abstract_type_count}});
    }

    json edge_list = json::array();
    for (const auto &[from, to] : edges()) {
        edge_list.push_back({{"source", from}, {"target", to}});
    }

    j["nodes"] = nodes;
    j["edges"] = edge_list;
    return j;
}

// Owning file of a relationship endpoint, INVALID_ID if unknown
static EntityId owner_of(EntityKind kind, EntityId id, const DependencyGraph &graph,
                         const OwnerMap &type_owners, const OwnerMap &callable_owners) {
    switch (kind) {
    case EntityKind::File:
        return graph.has_node(id) ? id : INVALID_ID;
    case EntityKind::Type: {
        auto it = type_owners.find(id);
        return (it != type_owners.end()) ? it->second : INVALID_ID;
    }
    case EntityKind::Callable: {
        auto it = callable_owners.find(id);
        return (it != callable_owners.end()) ? it->second : INVALID_ID;
    }
    }
    return INVALID_ID;
}

DependencyGraph build_dependency_graph(
    const std::vector<SourceFile> &files, const std::vector<Relationship> &relationships,
    const OwnerMap &type_owners, const OwnerMap &callable_owners,
    const std::unordered_map<EntityId, uint32_t> &abstract_type_counts) {
    DependencyGraph graph;

    for (const auto &file : files) {
        FileNode node;
        node.id = file.id;
        node.path = file.path;
        node.name = file.name;
        node.domain = file.domain;
        node.type_count = file.types_count;
        auto it = abstract_type_counts.find(file.id);
        if (it != abstract_type_counts.end()) {
            node.abstract_type_count = it->second;
        }
        graph.add_node(node);
    }

    for (const auto &rel : relationships) {
        EntityId from =
            owner_of(rel.source_kind, rel.source_id, graph, type_owners, callable_owners);
        EntityId to = owner_of(rel.target_kind, rel.target_id, graph, type_owners, callable_owners);
        if (from == INVALID_ID || to == INVALID_ID) {
            continue;
        }
        graph.add_edge(from, to);
    }

    return graph;
}

} // namespace codeatlas
