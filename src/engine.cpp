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

#include "codeatlas/engine.hpp"
#include "codeatlas/error.hpp"
#include <iostream>

namespace codeatlas {

Engine::Engine(const Config &config, IndexProgressCallback progress_callback)
    : config_(config), progress_callback_(std::move(progress_callback)) {
    validate_config(config_);
    store_ = std::make_unique<Store>(config_.store.db_path);
}

RunSummary Engine::populate(const fs::path &source_root) { return run(source_root, config_); }

RunSummary Engine::populate(const fs::path &source_root,
                            const std::vector<std::string> &include_patterns,
                            const std::vector<std::string> &exclude_patterns) {
    Config config = config_;
    config.discovery.include_patterns = include_patterns;
    config.discovery.exclude_patterns = exclude_patterns;
    return run(source_root, config);
}

RunSummary Engine::run(const fs::path &source_root, const Config &config) {
    check_source_root(source_root);
    Indexer indexer(config, progress_callback_);

    // Extraction runs unlocked; only the commit is exclusive
    auto files = indexer.discover_files(source_root);
    if (config.verbose) {
        std::cout << "Found " << files.size() << " source files to index." << std::endl;
        std::cout << "Using " << indexer.num_threads() << " threads." << std::endl;
    }
    AnalysisBatch batch = indexer.extract_all(source_root, files);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    RunSummary summary;
    try {
        summary = indexer.persist(*store_, batch);
    } catch (const Error &e) {
        std::cerr << "Error: populate rolled back: " << e.what() << std::endl;
        throw;
    }

    summary.generation = ++generation_;
    invalidate_cache();

    if (config.verbose) {
        std::cout << "Run " << summary.generation << ": " << summary.files << " files, "
                  << summary.types << " types, " << summary.callables << " callables, "
                  << summary.relationships << " relationships (" << summary.unresolved
                  << " unresolved, " << summary.ambiguous << " ambiguous, "
                  << summary.errors.size() << " errors)" << std::endl;
    }
    return summary;
}

// ============================================================================
// Query surface
// ============================================================================

std::optional<SourceFile> Engine::get_file(EntityId id) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return store_->get_file(id);
}

std::optional<SourceFile> Engine::get_file(const std::string &path) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return store_->get_file(path);
}

std::optional<TypeDefinition> Engine::get_type(EntityId id) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return store_->get_type(id);
}

std::optional<CallableUnit> Engine::get_callable(EntityId id) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return store_->get_callable(id);
}

QueryResult<SourceFile> Engine::list_files(const FileFilter &filter) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return store_->list_files(filter);
}

QueryResult<TypeDefinition> Engine::list_types(const TypeFilter &filter) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return store_->list_types(filter);
}

QueryResult<CallableUnit> Engine::list_callables(const CallableFilter &filter) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return store_->list_callables(filter);
}

QueryResult<Relationship> Engine::list_relationships(const RelationshipFilter &filter) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return store_->list_relationships(filter);
}

EntityCounts Engine::counts() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return store_->counts();
}

std::vector<DomainStats> Engine::domain_stats() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return store_->domain_stats();
}

std::vector<ComplexityBucket> Engine::complexity_distribution() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return store_->complexity_distribution();
}

// ============================================================================
// Graph surface
// ============================================================================

void Engine::invalidate_cache() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    graph_.reset();
    metrics_.reset();
    cycles_.reset();
    cache_generation_ = generation_.load();
}

std::shared_ptr<const DependencyGraph> Engine::graph_locked() {
    if (graph_ && cache_generation_ == generation_.load()) {
        return graph_;
    }

    if (cache_generation_ != generation_.load()) {
        metrics_.reset();
        cycles_.reset();
    }

    std::vector<SourceFile> files = store_->list_files().items;
    std::vector<Relationship> relationships = store_->list_relationships().items;
    graph_ = std::make_shared<const DependencyGraph>(
        build_dependency_graph(files, relationships, store_->type_owners(),
                               store_->callable_owners(), store_->abstract_type_counts()));
    cache_generation_ = generation_.load();
    return graph_;
}

std::shared_ptr<const DependencyGraph> Engine::dependency_graph() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::lock_guard<std::mutex> cache_lock(cache_mutex_);
    return graph_locked();
}

std::vector<CouplingMetrics> Engine::coupling_metrics() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::lock_guard<std::mutex> cache_lock(cache_mutex_);
    auto graph = graph_locked();
    if (!metrics_) {
        metrics_ = codeatlas::coupling_metrics(*graph, config_.analytics);
    }
    return *metrics_;
}

std::vector<CircularDependencyGroup> Engine::circular_dependencies() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::lock_guard<std::mutex> cache_lock(cache_mutex_);
    auto graph = graph_locked();
    if (!cycles_) {
        cycles_ = codeatlas::circular_dependencies(*graph);
    }
    return *cycles_;
}

} // namespace codeatlas
