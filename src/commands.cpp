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

#include "codeatlas/commands.hpp"
#include "codeatlas/error.hpp"
#include <fstream>
#include <iomanip>
#include <iostream>

namespace codeatlas {

void print_page_footer(size_t shown, size_t total, const Page &page) {
    if (shown < total) {
        std::cout << "  ... showing " << shown << " of " << total << " (offset " << page.offset
                  << ")" << std::endl;
    }
}

int cmd_index(Engine &engine, const fs::path &root, const std::vector<std::string> &include,
              const std::vector<std::string> &exclude) {
    std::cout << "Indexing " << root.string() << "..." << std::endl;

    RunSummary summary;
    try {
        summary = engine.populate(root, include, exclude);
    } catch (const Error &e) {
        std::cerr << "Error: indexing failed: " << e.what() << std::endl;
        std::cerr << "The previous index was left unchanged." << std::endl;
        return 1;
    }

    std::cout << "\nIndex saved to: " << engine.config().store.db_path << std::endl;
    std::cout << "  Files: " << summary.files << std::endl;
    std::cout << "  Types: " << summary.types << std::endl;
    std::cout << "  Callables: " << summary.callables << std::endl;
    std::cout << "  Relationships: " << summary.relationships << std::endl;
    std::cout << "  Unresolved references: " << summary.unresolved << std::endl;
    std::cout << "  Ambiguous references: " << summary.ambiguous << std::endl;

    if (!summary.errors.empty()) {
        std::cout << "  Files with errors (" << summary.errors.size() << "):" << std::endl;
        for (const auto &err : summary.errors) {
            std::cout << "    " << err.path << ": " << err.message << std::endl;
        }
    }
    return 0;
}

int cmd_stats(Engine &engine) {
    EntityCounts counts = engine.counts();
    std::cout << "Files: " << counts.files << std::endl;
    std::cout << "Types: " << counts.types << std::endl;
    std::cout << "Callables: " << counts.callables << std::endl;
    std::cout << "Relationships: " << counts.relationships << std::endl;
    std::cout << "Lines of code: " << counts.total_lines << std::endl;
    std::cout << "Average file complexity: " << std::fixed << std::setprecision(1)
              << counts.average_complexity << std::endl;

    std::cout << "\nBy domain:" << std::endl;
    for (const auto &d : engine.domain_stats()) {
        std::cout << "  " << std::left << std::setw(16) << domain_to_string(d.domain)
                  << d.file_count << " files, " << d.type_count << " types, "
                  << d.callable_count << " callables, " << d.total_lines
                  << " lines, avg complexity " << std::fixed << std::setprecision(1)
                  << d.average_complexity << std::endl;
    }

    std::cout << "\nComplexity distribution:" << std::endl;
    for (const auto &bucket : engine.complexity_distribution()) {
        std::cout << "  " << std::left << std::setw(10) << complexity_level_to_string(bucket.level)
                  << bucket.count << " (" << std::fixed << std::setprecision(1)
                  << bucket.percentage << "%)" << std::endl;
    }
    return 0;
}

int cmd_files(Engine &engine, const FileFilter &filter) {
    auto result = engine.list_files(filter);
    std::cout << "Files (" << result.total << "):" << std::endl;
    for (const auto &f : result.items) {
        std::cout << "  " << f.path << "  [" << domain_to_string(f.domain) << ", "
                  << f.lines_of_code << " lines, complexity " << f.complexity << " "
                  << complexity_level_to_string(f.complexity_level) << "]" << std::endl;
    }
    print_page_footer(result.items.size(), result.total, filter.page);
    return 0;
}

int cmd_types(Engine &engine, const TypeFilter &filter) {
    auto result = engine.list_types(filter);
    std::cout << "Types (" << result.total << "):" << std::endl;
    for (const auto &t : result.items) {
        auto file = engine.get_file(t.file_id);
        std::cout << "  " << t.name << "  [" << type_kind_to_string(t.kind) << ", "
                  << t.member_count << " members]";
        if (file) {
            std::cout << "  " << file->path << ":" << t.start_line;
        }
        std::cout << std::endl;
    }
    print_page_footer(result.items.size(), result.total, filter.page);
    return 0;
}

int cmd_callables(Engine &engine, const CallableFilter &filter) {
    auto result = engine.list_callables(filter);
    std::cout << "Callables (" << result.total << "):" << std::endl;
    for (const auto &c : result.items) {
        std::string owner;
        if (c.type_id) {
            if (auto type = engine.get_type(*c.type_id)) {
                owner = type->name + ".";
            }
        }
        std::cout << "  " << owner << c.name << "(" << c.parameters.size() << ")  ["
                  << callable_kind_to_string(c.kind) << ", complexity " << c.complexity;
        if (c.is_async)
            std::cout << ", async";
        if (c.is_generator)
            std::cout << ", generator";
        std::cout << "]" << std::endl;
    }
    print_page_footer(result.items.size(), result.total, filter.page);
    return 0;
}

int cmd_relationships(Engine &engine, const RelationshipFilter &filter) {
    auto result = engine.list_relationships(filter);
    std::cout << "Relationships (" << result.total << "):" << std::endl;
    for (const auto &r : result.items) {
        std::cout << "  " << r.source_name << " -" << relationship_kind_to_string(r.kind) << "-> "
                  << r.target_name << "  " << r.file_path << ":" << r.line << std::endl;
    }
    print_page_footer(result.items.size(), result.total, filter.page);
    return 0;
}

int cmd_metrics(Engine &engine) {
    auto metrics = engine.coupling_metrics();
    std::cout << "Coupling metrics (" << metrics.size() << " files, abstractness "
              << abstractness_mode_to_string(engine.config().analytics.abstractness)
              << "):" << std::endl;
    std::cout << "  " << std::left << std::setw(40) << "file" << std::right << std::setw(4)
              << "Ca" << std::setw(4) << "Ce" << std::setw(8) << "I" << std::setw(8) << "A"
              << std::setw(8) << "D" << std::endl;

    for (const auto &m : metrics) {
        std::cout << "  " << std::left << std::setw(40) << m.path << std::right << std::setw(4)
                  << m.afferent << std::setw(4) << m.efferent << std::fixed
                  << std::setprecision(2) << std::setw(8) << m.instability << std::setw(8)
                  << m.abstractness << std::setw(8) << m.distance << std::endl;
    }
    return 0;
}

int cmd_cycles(Engine &engine) {
    auto groups = engine.circular_dependencies();
    std::cout << groups.size() << " circular dependency groups found" << std::endl;
    if (groups.empty()) {
        std::cout << "  (none found)" << std::endl;
        return 0;
    }

    auto graph = engine.dependency_graph();
    for (size_t i = 0; i < groups.size(); ++i) {
        const auto &group = groups[i];
        std::cout << "\nGroup " << (i + 1) << " (" << group.members.size()
                  << " files):" << std::endl;
        for (const auto &path : group.member_paths) {
            std::cout << "  " << path << std::endl;
        }

        if (!group.cycle.empty()) {
            std::cout << "  Cycle: ";
            for (EntityId id : group.cycle) {
                const FileNode *node = graph->node(id);
                std::cout << (node ? node->path : std::to_string(id)) << " -> ";
            }
            const FileNode *first = graph->node(group.cycle.front());
            std::cout << (first ? first->path : std::to_string(group.cycle.front()))
                      << std::endl;
        }
    }
    return 0;
}

int cmd_graph(Engine &engine, const std::string &output_path) {
    json doc = engine.dependency_graph()->to_json();

    if (output_path.empty() || output_path == "-") {
        std::cout << doc.dump(2) << std::endl;
        return 0;
    }

    std::ofstream out(output_path);
    if (!out) {
        std::cerr << "Error: cannot write " << output_path << std::endl;
        return 1;
    }
    out << doc.dump(2) << std::endl;
    std::cout << "Dependency graph written to: " << output_path << std::endl;
    return 0;
}

} // namespace codeatlas
