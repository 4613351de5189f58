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

#include "analytics.hpp"
#include "config.hpp"
#include "graph.hpp"
#include "indexer.hpp"
#include "store.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>

namespace codeatlas {

// Entry point for populate runs, queries and graph analytics.
// Populate commits are exclusive; queries and analytics share the lock.
// Derived analytics are cached until the next committed run.
class Engine {
public:

    // Opens config.store.db_path. Throws StoreUnavailable.
    explicit Engine(const Config &config, IndexProgressCallback progress_callback = nullptr);

    // Analyze `source_root` with the configured patterns
    RunSummary populate(const fs::path &source_root);

    RunSummary populate(const fs::path &source_root,
                        const std::vector<std::string> &include_patterns,
                        const std::vector<std::string> &exclude_patterns);

    // Incremented on every committed run
    uint64_t generation() const { return generation_.load(); }

    const Config &config() const { return config_; }

    // ========================================================================
    // Query surface
    // ========================================================================

    std::optional<SourceFile> get_file(EntityId id);
    std::optional<SourceFile> get_file(const std::string &path);
    std::optional<TypeDefinition> get_type(EntityId id);
    std::optional<CallableUnit> get_callable(EntityId id);

    QueryResult<SourceFile> list_files(const FileFilter &filter = {});
    QueryResult<TypeDefinition> list_types(const TypeFilter &filter = {});
    QueryResult<CallableUnit> list_callables(const CallableFilter &filter = {});
    QueryResult<Relationship> list_relationships(const RelationshipFilter &filter = {});

    EntityCounts counts();
    std::vector<DomainStats> domain_stats();
    std::vector<ComplexityBucket> complexity_distribution();

    // ========================================================================
    // Graph surface
    // ========================================================================

    std::shared_ptr<const DependencyGraph> dependency_graph();
    std::vector<CouplingMetrics> coupling_metrics();
    std::vector<CircularDependencyGroup> circular_dependencies();

private:

    Config config_;
    IndexProgressCallback progress_callback_;
    std::unique_ptr<Store> store_;

    mutable std::shared_mutex mutex_;
    std::atomic<uint64_t> generation_{0};

    // Analytics cache, valid for cache_generation_
    std::mutex cache_mutex_;
    uint64_t cache_generation_ = 0;
    std::shared_ptr<const DependencyGraph> graph_;
    std::optional<std::vector<CouplingMetrics>> metrics_;
    std::optional<std::vector<CircularDependencyGroup>> cycles_;

    RunSummary run(const fs::path &source_root, const Config &config);

    // Requires mutex_ held (shared or exclusive) and cache_mutex_ held
    std::shared_ptr<const DependencyGraph> graph_locked();
    void invalidate_cache();
};

} // namespace codeatlas
