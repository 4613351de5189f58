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
#include "resolver.hpp"
#include "store.hpp"
#include <atomic>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace codeatlas {

namespace fs = std::filesystem;

// Callback for progress reporting
using IndexProgressCallback =
    std::function<void(const std::string &file, size_t current, size_t total)>;

struct FileError {
    std::string path;
    std::string message;
};

// Outcome of one populate run
struct RunSummary {
    size_t files = 0;
    size_t types = 0;
    size_t callables = 0;
    size_t relationships = 0;
    std::vector<FileError> errors;
    size_t unresolved = 0;
    size_t ambiguous = 0;
    uint64_t generation = 0;
};

// True if `pattern` matches any component of `rel_path`, the whole path,
// or a directory prefix of it ("data/test" matches "data/test/x.py")
bool matches_pattern(const std::string &pattern, const std::string &rel_path);

// Throws SourceRootError unless root is an existing directory
void check_source_root(const fs::path &root);

class Indexer {
public:

    explicit Indexer(const Config &config, IndexProgressCallback progress_callback = nullptr);

    // Sorted paths of every included, non-excluded regular file under root
    std::vector<fs::path> discover_files(const fs::path &root) const;

    // Phase 1: extract every file in parallel. Results keep the input order.
    AnalysisBatch extract_all(const fs::path &root, const std::vector<fs::path> &files);

    // Phase 2: resolve stubs and replace the store's contents in one
    // transaction. Throws on store failures after rolling back.
    RunSummary persist(Store &store, const AnalysisBatch &batch);

    // check root + discover + extract + persist
    RunSummary run(const fs::path &root, Store &store);

    unsigned int num_threads() const { return num_threads_; }

private:

    Config config_;
    IndexProgressCallback progress_callback_;
    unsigned int num_threads_;

    // Thread synchronization
    mutable std::mutex output_mutex_;
    std::atomic<size_t> files_done_{0};

    bool should_include(const fs::path &path) const;
    bool should_exclude(const std::string &rel_path) const;

    // Worker function for thread pool
    void worker_extract_files(const fs::path &root, const std::vector<fs::path> &files,
                              size_t start_idx, size_t end_idx, AnalysisBatch &batch);
};

} // namespace codeatlas
