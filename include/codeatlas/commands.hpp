#pragma once

#include "engine.hpp"
#include <string>
#include <vector>

namespace codeatlas {

// Command handlers. Each returns the process exit code.
int cmd_index(Engine &engine, const fs::path &root, const std::vector<std::string> &include,
              const std::vector<std::string> &exclude);
int cmd_stats(Engine &engine);
int cmd_files(Engine &engine, const FileFilter &filter);
int cmd_types(Engine &engine, const TypeFilter &filter);
int cmd_callables(Engine &engine, const CallableFilter &filter);
int cmd_relationships(Engine &engine, const RelationshipFilter &filter);
int cmd_metrics(Engine &engine);
int cmd_cycles(Engine &engine);
int cmd_graph(Engine &engine, const std::string &output_path);

// Helper functions
void print_page_footer(size_t shown, size_t total, const Page &page);

} // namespace codeatlas
