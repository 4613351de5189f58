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

#include "codeatlas/resolver.hpp"
#include <algorithm>

namespace codeatlas {

// ============================================================================
// NameIndex
// ============================================================================

NameIndex::Bucket &NameIndex::bucket(EntityKind kind) {
    switch (kind) {
    case EntityKind::File:
        return files_;
    case EntityKind::Type:
        return types_;
    default:
        return callables_;
    }
}

const NameIndex::Bucket &NameIndex::bucket(EntityKind kind) const {
    switch (kind) {
    case EntityKind::File:
        return files_;
    case EntityKind::Type:
        return types_;
    default:
        return callables_;
    }
}

void NameIndex::add(EntityKind kind, const std::string &name, const EntityRef &ref) {
    if (name.empty()) {
        return;
    }
    bucket(kind)[name].push_back(ref);

    if (kind == EntityKind::File) {
        // pkg.sub.mod is also reachable as sub.mod and mod
        size_t pos = name.find('.');
        while (pos != std::string::npos) {
            module_suffixes_[name.substr(pos + 1)].push_back(ref);
            pos = name.find('.', pos + 1);
        }
    }
}

NameIndex NameIndex::build(const AnalysisBatch &batch) {
    NameIndex index;
    for (size_t f = 0; f < batch.size(); ++f) {
        const auto &extraction = batch[f];

        index.add(EntityKind::File, module_name_for_path(extraction.file.path), EntityRef{f, 0});

        for (size_t t = 0; t < extraction.types.size(); ++t) {
            index.add(EntityKind::Type, extraction.types[t].name, EntityRef{f, t});
        }
        for (size_t c = 0; c < extraction.callables.size(); ++c) {
            index.add(EntityKind::Callable, extraction.callables[c].unit.name, EntityRef{f, c});
        }
    }
    return index;
}

const std::vector<EntityRef> *NameIndex::find(EntityKind kind, const std::string &name) const {
    const Bucket &b = bucket(kind);
    auto it = b.find(name);
    if (it == b.end() || it->second.empty()) {
        return nullptr;
    }
    return &it->second;
}

const std::vector<EntityRef> *NameIndex::find_module_suffix(const std::string &name) const {
    auto it = module_suffixes_.find(name);
    if (it == module_suffixes_.end() || it->second.empty()) {
        return nullptr;
    }
    return &it->second;
}

size_t NameIndex::size() const {
    size_t total = 0;
    for (const Bucket *b : {&files_, &types_, &callables_}) {
        for (const auto &[name, refs] : *b) {
            total += refs.size();
        }
    }
    return total;
}

// ============================================================================
// Resolution
// ============================================================================

static std::string last_segment(const std::string &name) {
    size_t pos = name.rfind('.');
    if (pos == std::string::npos) {
        return name;
    }
    return name.substr(pos + 1);
}

// Candidates for a stub, exact name first
static std::vector<EntityRef> lookup(const NameIndex &index, const RelationshipStub &stub,
                                     const ResolutionConfig &config) {
    if (const auto *exact = index.find(stub.target_kind, stub.target_name)) {
        return *exact;
    }
    if (!config.suffix_fallback) {
        return {};
    }

    if (stub.target_kind == EntityKind::File) {
        if (const auto *suffix = index.find_module_suffix(stub.target_name)) {
            return *suffix;
        }
        return {};
    }

    std::string tail = last_segment(stub.target_name);
    if (tail != stub.target_name) {
        if (const auto *fallback = index.find(stub.target_kind, tail)) {
            return *fallback;
        }
    }
    return {};
}

ResolutionResult resolve_relationships(const AnalysisBatch &batch, const NameIndex &index,
                                       const ResolutionConfig &config) {
    ResolutionResult result;

    for (size_t f = 0; f < batch.size(); ++f) {
        const auto &extraction = batch[f];

        for (const auto &stub : extraction.stubs) {
            ResolvedEdge edge;
            edge.kind = stub.kind;
            edge.source_kind = stub.source_kind;
            edge.source = EntityRef{f, stub.source_kind == EntityKind::File ? 0 : stub.source_index};
            edge.source_name = stub.source_name;
            edge.target_kind = stub.target_kind;
            edge.target_name = stub.target_name;
            edge.file_path = extraction.file.path;
            edge.line = stub.line;

            if (stub.local_target) {
                edge.target = EntityRef{f, *stub.local_target};
                result.edges.push_back(std::move(edge));
                continue;
            }

            if (!config.enabled) {
                ++result.unresolved;
                continue;
            }

            std::vector<EntityRef> candidates = lookup(index, stub, config);

            // A class never inherits from itself: class Base(lib.Base)
            if (stub.kind == RelationshipKind::Inherits) {
                candidates.erase(std::remove(candidates.begin(), candidates.end(), edge.source),
                                 candidates.end());
            }

            if (candidates.empty()) {
                ++result.unresolved;
                continue;
            }
            if (candidates.size() > 1) {
                ++result.ambiguous;
            }

            // Best effort: use first match
            edge.target = candidates.front();
            result.edges.push_back(std::move(edge));
        }
    }

    return result;
}

} // namespace codeatlas
