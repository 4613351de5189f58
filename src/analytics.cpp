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

#include "codeatlas/analytics.hpp"
#include <algorithm>
#include <cmath>
#include <deque>
#include <unordered_set>

namespace codeatlas {

// ============================================================================
// Coupling
// ============================================================================

std::vector<CouplingMetrics> coupling_metrics(const DependencyGraph &graph,
                                              const AnalyticsConfig &config) {
    std::vector<CouplingMetrics> result;
    result.reserve(graph.node_count());

    for (EntityId id : graph.node_ids()) {
        const FileNode *node = graph.node(id);

        CouplingMetrics m;
        m.file_id = id;
        m.path = node->path;
        m.name = node->name;
        m.domain = node->domain;
        m.afferent = graph.predecessors(id).size();
        m.efferent = graph.successors(id).size();
        m.total = m.afferent + m.efferent;
        m.instability = m.total == 0 ? 0.0 : static_cast<double>(m.efferent) / m.total;

        if (config.abstractness == AbstractnessMode::Ratio) {
            m.abstractness = node->type_count == 0
                                 ? 0.0
                                 : static_cast<double>(node->abstract_type_count) / node->type_count;
        } else {
            m.abstractness = config.placeholder_abstractness;
        }

        m.distance = std::fabs(m.abstractness + m.instability - 1.0);
        result.push_back(std::move(m));
    }

    return result;
}

// ============================================================================
// Strongly connected components
// ============================================================================

std::vector<std::vector<EntityId>> strongly_connected_components(const DependencyGraph &graph) {
    struct State {
        size_t index = 0;
        size_t lowlink = 0;
        bool on_stack = false;
        bool visited = false;
    };

    std::unordered_map<EntityId, State> state;
    std::vector<EntityId> stack;
    std::vector<std::vector<EntityId>> components;
    size_t next_index = 0;

    // Explicit call stack: node plus iterator over its successors
    struct Frame {
        EntityId node;
        std::set<EntityId>::const_iterator next;
        std::set<EntityId>::const_iterator end;
    };

    for (EntityId root : graph.node_ids()) {
        if (state[root].visited) {
            continue;
        }

        std::vector<Frame> frames;
        auto enter = [&](EntityId v) {
            State &s = state[v];
            s.visited = true;
            s.index = s.lowlink = next_index++;
            s.on_stack = true;
            stack.push_back(v);
            const auto &succ = graph.successors(v);
            frames.push_back(Frame{v, succ.begin(), succ.end()});
        };
        enter(root);

        while (!frames.empty()) {
            Frame &frame = frames.back();

            if (frame.next != frame.end) {
                EntityId w = *frame.next;
                ++frame.next;
                State &ws = state[w];
                if (!ws.visited) {
                    enter(w);
                } else if (ws.on_stack) {
                    State &vs = state[frame.node];
                    vs.lowlink = std::min(vs.lowlink, ws.index);
                }
                continue;
            }

            // All successors done
            EntityId v = frame.node;
            frames.pop_back();
            State &vs = state[v];

            if (!frames.empty()) {
                State &parent = state[frames.back().node];
                parent.lowlink = std::min(parent.lowlink, vs.lowlink);
            }

            if (vs.lowlink == vs.index) {
                std::vector<EntityId> component;
                EntityId w;
                do {
                    w = stack.back();
                    stack.pop_back();
                    state[w].on_stack = false;
                    component.push_back(w);
                } while (w != v);
                std::sort(component.begin(), component.end());
                components.push_back(std::move(component));
            }
        }
    }

    std::sort(components.begin(), components.end(),
              [](const std::vector<EntityId> &a, const std::vector<EntityId> &b) {
                  return a.front() < b.front();
              });
    return components;
}

std::vector<EntityId> find_cycle(const DependencyGraph &graph,
                                 const std::vector<EntityId> &component) {
    if (component.size() < 2) {
        return {};
    }

    std::unordered_set<EntityId> members(component.begin(), component.end());
    EntityId start = *std::min_element(component.begin(), component.end());

    // BFS from start; the first edge back to start closes the shortest cycle
    std::unordered_map<EntityId, EntityId> parent;
    std::deque<EntityId> queue;
    queue.push_back(start);
    parent[start] = INVALID_ID;

    while (!queue.empty()) {
        EntityId u = queue.front();
        queue.pop_front();

        for (EntityId w : graph.successors(u)) {
            if (!members.count(w)) {
                continue;
            }
            if (w == start) {
                std::vector<EntityId> cycle;
                for (EntityId at = u; at != INVALID_ID; at = parent[at]) {
                    cycle.push_back(at);
                }
                std::reverse(cycle.begin(), cycle.end());
                return cycle;
            }
            if (!parent.count(w)) {
                parent[w] = u;
                queue.push_back(w);
            }
        }
    }

    return {};
}

std::vector<CircularDependencyGroup> circular_dependencies(const DependencyGraph &graph) {
    std::vector<CircularDependencyGroup> groups;

    for (auto &component : strongly_connected_components(graph)) {
        if (component.size() < 2) {
            continue;
        }

        CircularDependencyGroup group;
        group.cycle = find_cycle(graph, component);
        for (EntityId id : component) {
            const FileNode *node = graph.node(id);
            group.member_paths.push_back(node ? node->path : "");
            group.member_names.push_back(node ? node->name : "");
        }
        group.members = std::move(component);
        groups.push_back(std::move(group));
    }

    return groups;
}

} // namespace codeatlas
