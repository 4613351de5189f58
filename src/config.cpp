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

#include "codeatlas/config.hpp"
#include "codeatlas/error.hpp"
#include <filesystem>
#include <fstream>

namespace codeatlas {

const char *abstractness_mode_to_string(AbstractnessMode mode) {
    return mode == AbstractnessMode::Ratio ? "ratio" : "placeholder";
}

static AbstractnessMode abstractness_mode_from_string(const std::string &s) {
    if (s == "ratio")
        return AbstractnessMode::Ratio;
    if (s == "placeholder")
        return AbstractnessMode::Placeholder;
    throw ConfigError("Unknown abstractness mode: " + s);
}

void validate_config(const Config &config) {
    const auto &c = config.complexity;
    if (c.base < 0 || c.increment < 0) {
        throw ConfigError("complexity base and increment must be non-negative");
    }
    if (c.max_callable < c.base || c.max_file < c.base) {
        throw ConfigError("complexity caps must not be below the base score");
    }
    if (!(c.medium_at <= c.high_at && c.high_at <= c.very_high_at)) {
        throw ConfigError("complexity level thresholds must be non-decreasing");
    }
    if (config.analytics.placeholder_abstractness < 0.0 ||
        config.analytics.placeholder_abstractness > 1.0) {
        throw ConfigError("placeholder abstractness must be within [0, 1]");
    }
    if (config.store.db_path.empty()) {
        throw ConfigError("store db_path must not be empty");
    }
}

Config config_from_json(const json &j) {
    Config config;
    if (!j.is_object()) {
        throw ConfigError("settings root must be a JSON object");
    }

    try {
        if (j.contains("discovery")) {
            const auto &d = j.at("discovery");
            auto &out = config.discovery;
            out.include_patterns = d.value("include_patterns", out.include_patterns);
            out.exclude_patterns = d.value("exclude_patterns", out.exclude_patterns);
            out.max_file_size_mb = d.value("max_file_size_mb", out.max_file_size_mb);
        }

        if (j.contains("extraction")) {
            const auto &e = j.at("extraction");
            auto &out = config.extraction;
            out.parse_timeout_ms = e.value("parse_timeout_ms", out.parse_timeout_ms);
            out.extract_imports = e.value("extract_imports", out.extract_imports);
        }

        if (j.contains("complexity")) {
            const auto &c = j.at("complexity");
            auto &out = config.complexity;
            out.base = c.value("base", out.base);
            out.increment = c.value("increment", out.increment);
            out.max_callable = c.value("max_callable", out.max_callable);
            out.max_file = c.value("max_file", out.max_file);
            out.medium_at = c.value("medium_at", out.medium_at);
            out.high_at = c.value("high_at", out.high_at);
            out.very_high_at = c.value("very_high_at", out.very_high_at);
        }

        if (j.contains("processing")) {
            const auto &p = j.at("processing");
            config.processing.num_threads =
                p.value("num_threads", config.processing.num_threads);
        }

        if (j.contains("resolution")) {
            const auto &r = j.at("resolution");
            auto &out = config.resolution;
            out.enabled = r.value("enabled", out.enabled);
            out.suffix_fallback = r.value("suffix_fallback", out.suffix_fallback);
        }

        if (j.contains("analytics")) {
            const auto &a = j.at("analytics");
            auto &out = config.analytics;
            if (a.contains("abstractness")) {
                out.abstractness =
                    abstractness_mode_from_string(a.at("abstractness").get<std::string>());
            }
            out.placeholder_abstractness =
                a.value("placeholder_abstractness", out.placeholder_abstractness);
        }

        if (j.contains("store")) {
            config.store.db_path = j.at("store").value("db_path", config.store.db_path);
        }

        config.verbose = j.value("verbose", config.verbose);
    } catch (const json::exception &e) {
        throw ConfigError(std::string("Invalid settings: ") + e.what());
    }

    validate_config(config);
    return config;
}

json config_to_json(const Config &config) {
    json j;
    j["discovery"] = {{"include_patterns", config.discovery.include_patterns},
                      {"exclude_patterns", config.discovery.exclude_patterns},
                      {"max_file_size_mb", config.discovery.max_file_size_mb}};
    j["extraction"] = {{"parse_timeout_ms", config.extraction.parse_timeout_ms},
                       {"extract_imports", config.extraction.extract_imports}};
    j["complexity"] = {{"base", config.complexity.base},
                       {"increment", config.complexity.increment},
                       {"max_callable", config.complexity.max_callable},
                       {"max_file", config.complexity.max_file},
                       {"medium_at", config.complexity.medium_at},
                       {"high_at", config.complexity.high_at},
                       {"very_high_at", config.complexity.very_high_at}};
    j["processing"] = {{"num_threads", config.processing.num_threads}};
    j["resolution"] = {{"enabled", config.resolution.enabled},
                       {"suffix_fallback", config.resolution.suffix_fallback}};
    j["analytics"] = {
        {"abstractness", abstractness_mode_to_string(config.analytics.abstractness)},
        {"placeholder_abstractness", config.analytics.placeholder_abstractness}};
    j["store"] = {{"db_path", config.store.db_path}};
    j["verbose"] = config.verbose;
    return j;
}

Config load_config(const std::string &path) {
    if (!std::filesystem::exists(path)) {
        throw ConfigError("Settings file not found: " + path);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Failed to open settings file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error &e) {
        throw ConfigError("Failed to parse " + path + ": " + e.what());
    }
    return config_from_json(j);
}

} // namespace codeatlas
