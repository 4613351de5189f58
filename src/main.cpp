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

#include <cxxopts.hpp>
#include <iostream>

#include "codeatlas/commands.hpp"
#include "codeatlas/error.hpp"
#include "codeatlas/version.hpp"

using namespace codeatlas;

void print_banner() {
    std::cout << "  codeatlas - Python codebase analyzer v" << VERSION_STRING << "\n" << std::endl;
}

int main(int argc, char *argv[]) {
    cxxopts::Options options(
        "codeatlas", "Python codebase analyzer - index entities, relationships and coupling");

    auto opts = options.add_options();
    opts("h,help", "Print help");
    opts("v,version", "Print version");
    opts("index", "Analyze the source tree and replace the stored index");
    opts("r,root", "Source tree to analyze", cxxopts::value<std::string>()->default_value("."));
    opts("d,db", "Database path (overrides config)", cxxopts::value<std::string>());
    opts("c,config", "JSON settings file", cxxopts::value<std::string>());
    opts("j,jobs", "Number of threads for indexing (0 = auto)", cxxopts::value<unsigned int>());
    opts("include", "Include patterns (comma-separated, no spaces)",
         cxxopts::value<std::vector<std::string>>());
    opts("exclude", "Exclude patterns (comma-separated, no spaces)",
         cxxopts::value<std::vector<std::string>>());
    opts("verbose", "Print per-file progress");

    opts("stats", "Show entity counts, domain statistics and complexity distribution");
    opts("files", "List indexed files");
    opts("types", "List type definitions");
    opts("callables", "List functions and methods");
    opts("relationships", "List resolved relationships");
    opts("search", "Filter listings by name substring", cxxopts::value<std::string>());
    opts("domain", "Filter --files by domain", cxxopts::value<std::string>());
    opts("level", "Filter --files by complexity level", cxxopts::value<std::string>());
    opts("kind", "Filter --relationships by kind", cxxopts::value<std::string>());
    opts("limit", "Maximum rows to list (0 = all)",
         cxxopts::value<size_t>()->default_value("0"));
    opts("offset", "Rows to skip", cxxopts::value<size_t>()->default_value("0"));

    opts("metrics", "Show per-file coupling metrics");
    opts("cycles", "Show circular dependency groups");
    opts("graph", "Export the file dependency graph as JSON ('-' = stdout)",
         cxxopts::value<std::string>()->implicit_value("-"));

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_banner();
            std::cout << options.help() << std::endl;
            std::cout << "Examples:" << std::endl;
            std::cout << "  codeatlas --index                      Index the current directory"
                      << std::endl;
            std::cout << "  codeatlas --index -r src -j 8          Index src using 8 threads"
                      << std::endl;
            std::cout << "  codeatlas --stats                      Summarize the index"
                      << std::endl;
            std::cout << "  codeatlas --files --level very_high    Most complex files"
                      << std::endl;
            std::cout << "  codeatlas --types --search Model       Types whose name has 'Model'"
                      << std::endl;
            std::cout << "  codeatlas --metrics                    Coupling per file" << std::endl;
            std::cout << "  codeatlas --cycles                     Circular dependencies"
                      << std::endl;
            std::cout << "  codeatlas --graph deps.json            Export the dependency graph"
                      << std::endl;
            return 0;
        }

        if (result.count("version")) {
            std::cout << "codeatlas v" << VERSION_STRING << std::endl;
            return 0;
        }

        Config config;
        if (result.count("config")) {
            config = load_config(result["config"].as<std::string>());
        }
        if (result.count("db"))
            config.store.db_path = result["db"].as<std::string>();
        if (result.count("jobs"))
            config.processing.num_threads = result["jobs"].as<unsigned int>();
        if (result.count("verbose"))
            config.verbose = true;

        Engine engine(config);

        Page page;
        page.limit = result["limit"].as<size_t>();
        page.offset = result["offset"].as<size_t>();
        std::optional<std::string> search;
        if (result.count("search"))
            search = result["search"].as<std::string>();

        if (result.count("index")) {
            auto include = config.discovery.include_patterns;
            auto exclude = config.discovery.exclude_patterns;
            if (result.count("include"))
                include = result["include"].as<std::vector<std::string>>();
            if (result.count("exclude"))
                exclude = result["exclude"].as<std::vector<std::string>>();
            return cmd_index(engine, result["root"].as<std::string>(), include, exclude);
        }

        if (result.count("stats")) {
            return cmd_stats(engine);
        }

        if (result.count("files")) {
            FileFilter filter;
            filter.search = search;
            filter.page = page;
            if (result.count("domain")) {
                std::string domain = result["domain"].as<std::string>();
                filter.domain = parse_domain(domain);
                if (!filter.domain) {
                    std::cerr << "Error: unknown domain: " << domain << std::endl;
                    return 1;
                }
            }
            if (result.count("level")) {
                std::string level = result["level"].as<std::string>();
                filter.complexity_level = parse_complexity_level(level);
                if (!filter.complexity_level) {
                    std::cerr << "Error: unknown complexity level: " << level << std::endl;
                    return 1;
                }
            }
            return cmd_files(engine, filter);
        }

        if (result.count("types")) {
            TypeFilter filter;
            filter.name_contains = search;
            filter.page = page;
            return cmd_types(engine, filter);
        }

        if (result.count("callables")) {
            CallableFilter filter;
            filter.name_contains = search;
            filter.page = page;
            return cmd_callables(engine, filter);
        }

        if (result.count("relationships")) {
            RelationshipFilter filter;
            filter.page = page;
            if (result.count("kind")) {
                std::string kind = result["kind"].as<std::string>();
                filter.kind = relationship_kind_from_string(kind);
                if (!filter.kind) {
                    std::cerr << "Error: unknown relationship kind: " << kind << std::endl;
                    return 1;
                }
            }
            return cmd_relationships(engine, filter);
        }

        if (result.count("metrics")) {
            return cmd_metrics(engine);
        }

        if (result.count("cycles")) {
            return cmd_cycles(engine);
        }

        if (result.count("graph")) {
            return cmd_graph(engine, result["graph"].as<std::string>());
        }

        print_banner();
        std::cout << options.help() << std::endl;
        return 0;

    } catch (const cxxopts::exceptions::exception &e) {
        std::cerr << "Error parsing options: " << e.what() << std::endl;
        return 1;
    } catch (const ConfigError &e) {
        std::cerr << "Error: invalid configuration: " << e.what() << std::endl;
        return 1;
    } catch (const StoreUnavailable &e) {
        std::cerr << "Error: store unavailable: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
