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

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace codeatlas {

using json = nlohmann::json;

// How per-file abstractness is derived for the main-sequence distance
enum class AbstractnessMode {
    Placeholder, // Constant value for every file
    Ratio        // Abstract-kind types / all types in the file
};

struct DiscoveryConfig {
    std::vector<std::string> include_patterns = {"*.py",  "*.js",   "*.html", "*.css",
                                                 "*.md",  "*.json", "*.yml",  "*.yaml"};
    std::vector<std::string> exclude_patterns = {
        "__pycache__", "*.pyc", "node_modules", ".git",           ".vscode",
        "*.egg-info",  "logs",  "temp",         "cache",          "data/processed",
        "data/test"};
    uint32_t max_file_size_mb = 10;
};

struct ExtractionConfig {
    uint32_t parse_timeout_ms = 5000; // Per-file wall-clock budget, 0 = unlimited
    bool extract_imports = true;
};

struct ComplexityConfig {
    int base = 1;
    int increment = 1;
    int max_callable = 50;
    int max_file = 100;

    // Level boundaries: score < medium_at is low, < high_at medium,
    // < very_high_at high, everything else very high
    int medium_at = 10;
    int high_at = 20;
    int very_high_at = 40;
};

struct ProcessingConfig {
    unsigned int num_threads = 0; // 0 = auto-detect
};

struct ResolutionConfig {
    bool enabled = true;
    bool suffix_fallback = true; // "self.save" falls back to "save"
};

struct AnalyticsConfig {
    AbstractnessMode abstractness = AbstractnessMode::Placeholder;
    double placeholder_abstractness = 0.5;
};

struct StoreConfig {
    std::string db_path = "codeatlas.db";
};

struct Config {
    DiscoveryConfig discovery;
    ExtractionConfig extraction;
    ComplexityConfig complexity;
    ProcessingConfig processing;
    ResolutionConfig resolution;
    AnalyticsConfig analytics;
    StoreConfig store;
    bool verbose = false;
};

// Build a config from JSON. Missing keys keep their defaults.
// Throws ConfigError on wrong value types or inconsistent thresholds.
Config config_from_json(const json &j);

json config_to_json(const Config &config);

// Load settings from a JSON file. Throws ConfigError if the file is
// missing or malformed.
Config load_config(const std::string &path);

// Throws ConfigError when the config cannot be used
void validate_config(const Config &config);

const char *abstractness_mode_to_string(AbstractnessMode mode);

} // namespace codeatlas
