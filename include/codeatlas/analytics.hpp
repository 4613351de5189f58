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
#include "graph.hpp"
#include <vector>

namespace codeatlas {

struct CouplingMetrics {
    EntityId file_id = INVALID_ID;
    std::string path;
    std::string name;
    DomainType domain = DomainType::Unknown;
    size_t afferent = 0; // Distinct files depending on this one
    size_t efferent = 0; // Distinct files this one depends on
    size_t total = 0;
    double instability = 0.0;  // efferent / (afferent + efferent), 0 when isolated
    double abstractness = 0.0;
    double distance = 0.0;     // |abstractness + instability - 1|
};

// Mutually reachable files plus one cycle through them
struct CircularDependencyGroup {
    std::vector<EntityId> members; // Ascending
    std::vector<std::string> member_paths;
    std::vector<std::string> member_names;
    std::vector<EntityId> cycle;   // Each node once; last node links back to the first
};

// Metrics for every node, in ascending file id order
std::vector<CouplingMetrics> coupling_metrics(const DependencyGraph &graph,
                                              const AnalyticsConfig &config = {});

// Tarjan's algorithm. Each component's ids are ascending; components are
// ordered by their smallest id.
std::vector<std::vector<EntityId>> strongly_connected_components(const DependencyGraph &graph);

// Shortest cycle through the smallest member, staying inside the component
std::vector<EntityId> find_cycle(const DependencyGraph &graph,
                                 const std::vector<EntityId> &component);

// Components of two or more files
std::vector<CircularDependencyGroup> circular_dependencies(const DependencyGraph &graph);

} // namespace codeatlas
