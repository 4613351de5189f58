#include "codeatlas/indexer.hpp"
#include "codeatlas/error.hpp"
#include <algorithm>
#include <fnmatch.h>
#include <iostream>
#include <memory>

namespace codeatlas {

bool matches_pattern(const std::string &pattern, const std::string &rel_path) {
    if (pattern.empty()) {
        return false;
    }

    for (const auto &component : fs::path(rel_path)) {
        if (fnmatch(pattern.c_str(), component.string().c_str(), 0) == 0) {
            return true;
        }
    }

    if (fnmatch(pattern.c_str(), rel_path.c_str(), FNM_PATHNAME) == 0) {
        return true;
    }

    // Directory prefix
    return rel_path.size() > pattern.size() && rel_path.compare(0, pattern.size(), pattern) == 0 &&
           rel_path[pattern.size()] == '/';
}

void check_source_root(const fs::path &root) {
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        throw SourceRootError("Source root does not exist: " + root.string());
    }
    if (!fs::is_directory(root, ec)) {
        throw SourceRootError("Source root is not a directory: " + root.string());
    }
}

Indexer::Indexer(const Config &config, IndexProgressCallback progress_callback)
    : config_(config), progress_callback_(std::move(progress_callback)) {
    // Auto-detect thread count if not specified
    num_threads_ = config_.processing.num_threads;
    if (num_threads_ == 0) {
        num_threads_ = std::thread::hardware_concurrency();
        if (num_threads_ == 0)
            num_threads_ = 4; // Fallback
    }
}

bool Indexer::should_include(const fs::path &path) const {
    std::string filename = path.filename().string();
    for (const auto &pattern : config_.discovery.include_patterns) {
        if (fnmatch(pattern.c_str(), filename.c_str(), 0) == 0) {
            return true;
        }
    }
    return false;
}

bool Indexer::should_exclude(const std::string &rel_path) const {
    for (const auto &pattern : config_.discovery.exclude_patterns) {
        if (matches_pattern(pattern, rel_path)) {
            return true;
        }
    }
    return false;
}

std::vector<fs::path> Indexer::discover_files(const fs::path &root) const {
    std::vector<fs::path> files;

    if (!fs::exists(root)) {
        std::cerr << "Error: Path does not exist: " << root.string() << std::endl;
        return files;
    }

    // Iterative directory traversal
    std::vector<fs::path> dirs_to_visit;
    dirs_to_visit.push_back(root);

    while (!dirs_to_visit.empty()) {
        fs::path current_dir = dirs_to_visit.back();
        dirs_to_visit.pop_back();

        std::error_code list_ec;
        fs::directory_iterator it(current_dir, list_ec);
        if (list_ec) {
            std::lock_guard<std::mutex> lock(output_mutex_);
            std::cerr << "Warning: cannot list " << current_dir.string() << ": "
                      << list_ec.message() << std::endl;
            continue;
        }

        for (const auto &entry : it) {
            std::error_code ec;
            const fs::path &path = entry.path();
            std::string rel = fs::relative(path, root, ec).generic_string();
            if (ec || should_exclude(rel))
                continue;

            if (entry.is_directory(ec)) {
                dirs_to_visit.push_back(path);
            } else if (entry.is_regular_file(ec) && should_include(path)) {
                files.push_back(path);
            }
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

void Indexer::worker_extract_files(const fs::path &root, const std::vector<fs::path> &files,
                                   size_t start_idx, size_t end_idx, AnalysisBatch &batch) {
    // One extractor per thread: the parser is not shareable
    std::unique_ptr<EntityExtractor> extractor;
    std::string setup_error;
    try {
        extractor = std::make_unique<EntityExtractor>(
            config_.extraction, config_.complexity,
            static_cast<uint64_t>(config_.discovery.max_file_size_mb) * 1024 * 1024);
    } catch (const std::exception &e) {
        setup_error = std::string("Extractor unavailable: ") + e.what();
    }

    for (size_t i = start_idx; i < end_idx; ++i) {
        const auto &filepath = files[i];
        std::error_code ec;
        std::string rel = fs::relative(filepath, root, ec).generic_string();
        if (ec) {
            rel = filepath.generic_string();
        }

        if (!extractor) {
            batch[i] = failed_extraction(rel, setup_error);
        } else {
            try {
                batch[i] = extractor->extract_file(filepath, rel);
            } catch (const std::exception &e) {
                batch[i] = failed_extraction(rel, e.what());
            }
        }
        size_t done = ++files_done_;

        // Print progress (with lock to avoid garbled output)
        std::lock_guard<std::mutex> lock(output_mutex_);
        if (!batch[i].ok()) {
            std::cerr << "Warning: " << rel << ": " << *batch[i].error << std::endl;
        } else if (config_.verbose) {
            std::cout << "Parsed: " << rel << std::endl;
        }
        if (progress_callback_) {
            progress_callback_(rel, done, files.size());
        }
    }
}

AnalysisBatch Indexer::extract_all(const fs::path &root, const std::vector<fs::path> &files) {
    AnalysisBatch batch(files.size());
    files_done_ = 0;

    if (files.empty()) {
        return batch;
    }

    // Create worker threads, each owning a contiguous slice of the batch
    std::vector<std::thread> threads;
    size_t files_per_thread = (files.size() + num_threads_ - 1) / num_threads_;

    for (unsigned int t = 0; t < num_threads_; ++t) {
        size_t start_idx = t * files_per_thread;
        size_t end_idx = std::min(start_idx + files_per_thread, files.size());

        if (start_idx >= files.size())
            break;

        threads.emplace_back(&Indexer::worker_extract_files, this, std::cref(root),
                             std::cref(files), start_idx, end_idx, std::ref(batch));
    }

    // Wait for all threads
    for (auto &t : threads) {
        t.join();
    }

    return batch;
}

RunSummary Indexer::persist(Store &store, const AnalysisBatch &batch) {
    RunSummary summary;

    NameIndex index = NameIndex::build(batch);
    ResolutionResult resolved = resolve_relationships(batch, index, config_.resolution);
    summary.unresolved = resolved.unresolved;
    summary.ambiguous = resolved.ambiguous;

    // Batch-local entity -> store id
    std::vector<EntityId> file_ids(batch.size(), INVALID_ID);
    std::vector<std::vector<EntityId>> type_ids(batch.size());
    std::vector<std::vector<EntityId>> callable_ids(batch.size());

    Transaction tx(store.database());
    store.clear_all();

    for (size_t f = 0; f < batch.size(); ++f) {
        const auto &extraction = batch[f];
        if (!extraction.ok()) {
            summary.errors.push_back(FileError{extraction.file.path, *extraction.error});
        }

        EntityId file_id = store.insert_file(extraction.file);
        file_ids[f] = file_id;
        ++summary.files;

        for (const auto &type : extraction.types) {
            TypeDefinition row = type;
            row.file_id = file_id;
            type_ids[f].push_back(store.insert_type_definition(row));
            ++summary.types;
        }

        for (const auto &callable : extraction.callables) {
            CallableUnit row = callable.unit;
            row.file_id = file_id;
            if (callable.parent_type) {
                row.type_id = type_ids[f].at(*callable.parent_type);
            }
            callable_ids[f].push_back(store.insert_callable(row));
            ++summary.callables;
        }
    }

    auto id_of = [&](EntityKind kind, const EntityRef &ref) -> EntityId {
        switch (kind) {
        case EntityKind::File:
            return file_ids.at(ref.file_index);
        case EntityKind::Type:
            return type_ids.at(ref.file_index).at(ref.local_index);
        default:
            return callable_ids.at(ref.file_index).at(ref.local_index);
        }
    };

    for (const auto &edge : resolved.edges) {
        Relationship rel;
        rel.kind = edge.kind;
        rel.source_kind = edge.source_kind;
        rel.source_id = id_of(edge.source_kind, edge.source);
        rel.source_name = edge.source_name;
        rel.target_kind = edge.target_kind;
        rel.target_id = id_of(edge.target_kind, edge.target);
        rel.target_name = edge.target_name;
        rel.file_path = edge.file_path;
        rel.line = edge.line;
        store.insert_relationship(rel);
        ++summary.relationships;
    }

    tx.commit();
    return summary;
}

RunSummary Indexer::run(const fs::path &root, Store &store) {
    check_source_root(root);

    // Phase 1: Discover files
    auto files = discover_files(root);

    if (config_.verbose) {
        std::cout << "Found " << files.size() << " source files to index." << std::endl;
        std::cout << "Using " << num_threads_ << " threads." << std::endl;
    }

    // Phase 2: Parallel extraction
    AnalysisBatch batch = extract_all(root, files);

    // Phase 3: Resolution and persistence
    if (config_.verbose) {
        std::cout << "Resolving relationships and writing store..." << std::endl;
    }
    RunSummary summary = persist(store, batch);

    if (config_.verbose) {
        std::cout << "\nIndexing complete." << std::endl;
        std::cout << "  Files indexed: " << summary.files << std::endl;
        std::cout << "  Types found: " << summary.types << std::endl;
        std::cout << "  Callables found: " << summary.callables << std::endl;
        std::cout << "  Relationships: " << summary.relationships << std::endl;
        std::cout << "  Unresolved: " << summary.unresolved << std::endl;
        std::cout << "  Ambiguous: " << summary.ambiguous << std::endl;
        std::cout << "  Errors: " << summary.errors.size() << std::endl;
    }

    return summary;
}

} // namespace codeatlas
