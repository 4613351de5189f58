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

#include "codeatlas/extractor.hpp"
#include "codeatlas/complexity.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <sstream>

namespace codeatlas {

namespace fs = std::filesystem;

// ============================================================================
// Path helpers
// ============================================================================

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::vector<std::string> path_tokens(const std::string &rel_path) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : to_lower(rel_path)) {
        if (c == '/' || c == '\\' || c == '_' || c == '-' || c == '.') {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }
    return tokens;
}

DomainType classify_domain(const std::string &rel_path) {
    struct Rule {
        DomainType domain;
        std::vector<const char *> keywords;
    };
    static const std::vector<Rule> rules = {
        {DomainType::Presentation, {"presentation", "ui", "dashboard"}},
        {DomainType::Application, {"application", "app"}},
        {DomainType::Domain, {"domain", "business"}},
        {DomainType::Infrastructure, {"infrastructure", "infra"}},
        {DomainType::Services, {"service"}},
        {DomainType::Models, {"model", "entity", "entities", "dto"}},
        {DomainType::Utils, {"util", "helper", "tool"}},
        {DomainType::Tests, {"test"}},
        {DomainType::Config, {"config", "setting"}},
        {DomainType::Docs, {"doc", "readme"}},
    };

    std::vector<std::string> tokens = path_tokens(rel_path);
    for (const auto &rule : rules) {
        for (const char *keyword : rule.keywords) {
            for (const auto &token : tokens) {
                // Prefix match: "models" and "services" hit their singular keyword
                if (token.rfind(keyword, 0) == 0) {
                    return rule.domain;
                }
            }
        }
    }
    return DomainType::Unknown;
}

uint32_t count_lines(const std::string &content) {
    if (content.empty()) {
        return 0;
    }
    uint32_t lines = static_cast<uint32_t>(std::count(content.begin(), content.end(), '\n'));
    if (content.back() != '\n') {
        ++lines;
    }
    return lines;
}

std::string module_name_for_path(const std::string &rel_path) {
    fs::path p(rel_path);
    if (p.extension() != ".py") {
        return "";
    }

    std::string module;
    fs::path stem_path = p.parent_path();
    for (const auto &part : stem_path) {
        if (part.empty() || part == "." || part == "/") {
            continue;
        }
        if (!module.empty()) {
            module += '.';
        }
        module += part.string();
    }

    std::string stem = p.stem().string();
    if (stem != "__init__") {
        if (!module.empty()) {
            module += '.';
        }
        module += stem;
    }
    return module;
}

// ============================================================================
// Tree walking
// ============================================================================

namespace {

bool contains(const std::string &haystack, const char *needle) {
    return haystack.find(needle) != std::string::npos;
}

bool any_contains(const std::vector<std::string> &values, const char *needle) {
    return std::any_of(values.begin(), values.end(),
                       [&](const std::string &v) { return contains(v, needle); });
}

bool any_equals(const std::vector<std::string> &values, const char *needle) {
    return std::find(values.begin(), values.end(), needle) != values.end();
}

bool ends_with(const std::string &s, const std::string &suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// True for identifiers and attribute chains made only of identifiers
bool is_dotted_name(TSNode node) {
    while (node_is(node, "attribute")) {
        node = child_by_field(node, "object");
    }
    return node_is(node, "identifier");
}

class FileWalker {
public:

    FileWalker(const PythonParser &parser, const ExtractionConfig &extraction,
               const ComplexityConfig &complexity, FileExtraction &out)
        : parser_(parser), extraction_(extraction), complexity_(complexity), out_(out) {}

    void run() {
        TSNode root = parser_.root();
        walk_scope(root, std::nullopt);
        collect_imports(root);
    }

private:

    const PythonParser &parser_;
    const ExtractionConfig &extraction_;
    const ComplexityConfig &complexity_;
    FileExtraction &out_;

    // Visit definitions reachable from `scope` without crossing another
    // definition. Definitions found directly under a class are methods.
    void walk_scope(TSNode scope, std::optional<size_t> owner_type) {
        uint32_t count = ts_node_named_child_count(scope);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(scope, i);
            visit_nodes(child, [&](TSNode node) {
                if (node_is(node, "decorated_definition")) {
                    handle_definition(child_by_field(node, "definition"),
                                      decorator_names(node), owner_type);
                    return false;
                }
                if (node_is(node, "class_definition") || node_is(node, "function_definition")) {
                    handle_definition(node, {}, owner_type);
                    return false;
                }
                return true;
            });
        }
    }

    void handle_definition(TSNode node, std::vector<std::string> decorators,
                           std::optional<size_t> owner_type) {
        if (node_is(node, "class_definition")) {
            handle_class(node, std::move(decorators));
        } else if (node_is(node, "function_definition")) {
            handle_function(node, std::move(decorators), owner_type);
        }
    }

    std::string decorator_name(TSNode decorator) {
        // Skip the "@" token: the expression is the only named child
        TSNode expr = ts_node_named_child(decorator, 0);
        if (node_is(expr, "call")) {
            expr = child_by_field(expr, "function");
        }
        return parser_.node_text(expr);
    }

    std::vector<std::string> decorator_names(TSNode decorated) {
        std::vector<std::string> names;
        uint32_t count = ts_node_named_child_count(decorated);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(decorated, i);
            if (node_is(child, "decorator")) {
                names.push_back(decorator_name(child));
            }
        }
        return names;
    }

    // ========================================================================
    // Classes
    // ========================================================================

    void handle_class(TSNode node, std::vector<std::string> decorators) {
        TypeDefinition type;
        type.name = parser_.node_text(child_by_field(node, "name"));
        type.start_line = start_line(node);
        type.end_line = end_line(node);
        type.decorators = std::move(decorators);

        bool abc_metaclass = false;
        TSNode supers = child_by_field(node, "superclasses");
        if (!ts_node_is_null(supers)) {
            uint32_t count = ts_node_named_child_count(supers);
            for (uint32_t i = 0; i < count; ++i) {
                TSNode arg = ts_node_named_child(supers, i);
                if (node_is(arg, "keyword_argument")) {
                    std::string key = parser_.node_text(child_by_field(arg, "name"));
                    std::string value = parser_.node_text(child_by_field(arg, "value"));
                    if (key == "metaclass" && contains(value, "ABCMeta")) {
                        abc_metaclass = true;
                    }
                } else if (is_dotted_name(arg)) {
                    type.base_names.push_back(parser_.node_text(arg));
                }
            }
        }

        type.kind = classify_type(type, abc_metaclass);
        type.is_abstract = type.kind == TypeKind::Abstract;

        size_t index = out_.types.size();
        out_.types.push_back(type);

        for (const auto &base : type.base_names) {
            if (base == "object") {
                continue;
            }
            RelationshipStub stub;
            stub.kind = RelationshipKind::Inherits;
            stub.source_kind = EntityKind::Type;
            stub.source_index = index;
            stub.source_name = type.name;
            stub.target_kind = EntityKind::Type;
            stub.target_name = base;
            stub.line = type.start_line;
            out_.stubs.push_back(stub);
        }

        size_t first_callable = out_.callables.size();
        TSNode body = child_by_field(node, "body");
        if (!ts_node_is_null(body)) {
            walk_scope(body, index);
        }

        uint32_t members = 0;
        for (size_t i = first_callable; i < out_.callables.size(); ++i) {
            if (out_.callables[i].parent_type == index) {
                ++members;
            }
        }
        out_.types[index].member_count = members;
    }

    static TypeKind classify_type(const TypeDefinition &type, bool abc_metaclass) {
        const auto &bases = type.base_names;
        if (any_contains(type.decorators, "dataclass")) {
            return TypeKind::DataHolder;
        }
        if (any_contains(bases, "ABC") || any_contains(bases, "Abstract") || abc_metaclass) {
            return TypeKind::Abstract;
        }
        if (any_contains(bases, "BaseModel") || any_contains(type.decorators, "pydantic")) {
            return TypeKind::SchemaModel;
        }
        if (any_contains(bases, "Enum")) {
            return TypeKind::Enumeration;
        }
        if (any_contains(bases, "Exception") || any_contains(bases, "Error")) {
            return TypeKind::Exception;
        }
        return TypeKind::Plain;
    }

    // ========================================================================
    // Callables
    // ========================================================================

    void handle_function(TSNode node, std::vector<std::string> decorators,
                         std::optional<size_t> owner_type) {
        ExtractedCallable extracted;
        CallableUnit &unit = extracted.unit;
        unit.name = parser_.node_text(child_by_field(node, "name"));
        unit.start_line = start_line(node);
        unit.end_line = end_line(node);
        unit.decorators = std::move(decorators);
        unit.kind = classify_callable(unit.decorators, owner_type.has_value());
        unit.parameters = parameters(child_by_field(node, "parameters"));

        TSNode returns = child_by_field(node, "return_type");
        if (!ts_node_is_null(returns)) {
            unit.return_type = parser_.node_text(returns);
        }

        TSNode first = ts_node_child(node, 0);
        unit.is_async = !ts_node_is_null(first) && strcmp(ts_node_type(first), "async") == 0;
        unit.complexity = score_callable(node, complexity_);
        extracted.parent_type = owner_type;

        size_t index = out_.callables.size();
        out_.callables.push_back(extracted);

        if (owner_type) {
            RelationshipStub stub;
            stub.kind = RelationshipKind::Contains;
            stub.source_kind = EntityKind::Type;
            stub.source_index = *owner_type;
            stub.source_name = out_.types[*owner_type].name;
            stub.target_kind = EntityKind::Callable;
            stub.target_name = unit.name;
            stub.local_target = index;
            stub.line = unit.start_line;
            out_.stubs.push_back(stub);
        }

        TSNode body = child_by_field(node, "body");
        if (ts_node_is_null(body)) {
            return;
        }

        // Only the callable's own body makes it a generator
        bool generator = false;
        visit_nodes(body, [&](TSNode n) {
            if (node_is(n, "function_definition") || node_is(n, "class_definition")) {
                return false;
            }
            if (node_is(n, "yield")) {
                generator = true;
            }
            return true;
        });

        // Calls made anywhere inside, nested definitions included
        visit_nodes(body, [&](TSNode n) {
            if (node_is(n, "call")) {
                TSNode callee = child_by_field(n, "function");
                if (is_dotted_name(callee)) {
                    RelationshipStub stub;
                    stub.kind = RelationshipKind::Calls;
                    stub.source_kind = EntityKind::Callable;
                    stub.source_index = index;
                    stub.source_name = out_.callables[index].unit.name;
                    stub.target_kind = EntityKind::Callable;
                    stub.target_name = parser_.node_text(callee);
                    stub.line = start_line(n);
                    out_.stubs.push_back(stub);
                }
            }
            return true;
        });
        out_.callables[index].unit.is_generator = generator;

        // Nested definitions become callables of their own
        walk_scope(body, std::nullopt);
    }

    static CallableKind classify_callable(const std::vector<std::string> &decorators,
                                          bool is_member) {
        if (!is_member) {
            return CallableKind::Function;
        }
        if (any_equals(decorators, "staticmethod")) {
            return CallableKind::Static;
        }
        if (any_equals(decorators, "classmethod")) {
            return CallableKind::ClassBound;
        }
        for (const auto &d : decorators) {
            if (d == "property" || d == "cached_property" || ends_with(d, ".cached_property") ||
                ends_with(d, ".setter") || ends_with(d, ".getter") || ends_with(d, ".deleter")) {
                return CallableKind::Property;
            }
        }
        return CallableKind::Method;
    }

    std::vector<std::string> parameters(TSNode params) {
        std::vector<std::string> result;
        if (ts_node_is_null(params)) {
            return result;
        }

        uint32_t count = ts_node_named_child_count(params);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode param = ts_node_named_child(params, i);
            const char *type = ts_node_type(param);

            if (strcmp(type, "keyword_separator") == 0 ||
                strcmp(type, "positional_separator") == 0) {
                continue;
            }

            std::string entry;
            if (strcmp(type, "typed_parameter") == 0) {
                // Name is the first named child: identifier or a splat pattern
                entry = parser_.node_text(ts_node_named_child(param, 0));
                entry += ":" + parser_.node_text(child_by_field(param, "type"));
            } else if (strcmp(type, "default_parameter") == 0) {
                entry = parser_.node_text(child_by_field(param, "name"));
                entry += "=" + parser_.node_text(child_by_field(param, "value"));
            } else if (strcmp(type, "typed_default_parameter") == 0) {
                entry = parser_.node_text(child_by_field(param, "name"));
                entry += ":" + parser_.node_text(child_by_field(param, "type"));
                entry += "=" + parser_.node_text(child_by_field(param, "value"));
            } else {
                // identifier, list_splat_pattern, dictionary_splat_pattern
                entry = parser_.node_text(param);
            }

            if (!entry.empty()) {
                result.push_back(entry);
            }
        }
        return result;
    }

    // ========================================================================
    // Imports
    // ========================================================================

    void collect_imports(TSNode root) {
        visit_nodes(root, [&](TSNode node) {
            if (node_is(node, "import_statement")) {
                ++out_.file.imports_count;
                uint32_t count = ts_node_named_child_count(node);
                for (uint32_t i = 0; i < count; ++i) {
                    TSNode name = ts_node_named_child(node, i);
                    if (node_is(name, "aliased_import")) {
                        name = child_by_field(name, "name");
                    }
                    if (node_is(name, "dotted_name")) {
                        add_import(parser_.node_text(name), start_line(node));
                    }
                }
                return false;
            }
            if (node_is(node, "import_from_statement")) {
                ++out_.file.imports_count;
                TSNode module = child_by_field(node, "module_name");
                if (node_is(module, "relative_import")) {
                    // from . import x has no module name
                    TSNode dotted = TSNode{};
                    uint32_t count = ts_node_named_child_count(module);
                    for (uint32_t i = 0; i < count; ++i) {
                        TSNode c = ts_node_named_child(module, i);
                        if (node_is(c, "dotted_name")) {
                            dotted = c;
                        }
                    }
                    module = dotted;
                }
                if (node_is(module, "dotted_name")) {
                    add_import(parser_.node_text(module), start_line(node));
                }
                return false;
            }
            return true;
        });
    }

    void add_import(const std::string &module, uint32_t line) {
        if (!extraction_.extract_imports || module.empty()) {
            return;
        }
        RelationshipStub stub;
        stub.kind = RelationshipKind::Imports;
        stub.source_kind = EntityKind::File;
        stub.source_name = out_.file.path;
        stub.target_kind = EntityKind::File;
        stub.target_name = module;
        stub.line = line;
        out_.stubs.push_back(stub);
    }
};

} // namespace

// ============================================================================
// EntityExtractor
// ============================================================================

EntityExtractor::EntityExtractor(const ExtractionConfig &extraction,
                                 const ComplexityConfig &complexity, uint64_t max_file_bytes)
    : extraction_(extraction), complexity_(complexity), max_file_bytes_(max_file_bytes) {
    parser_.set_timeout_ms(extraction_.parse_timeout_ms);
}

static SourceFile base_record(const std::string &rel_path) {
    SourceFile file;
    file.path = rel_path;
    file.name = fs::path(rel_path).filename().string();
    file.domain = classify_domain(rel_path);
    file.kind = file_kind_from_extension(to_lower(fs::path(rel_path).extension().string()));
    return file;
}

static FileExtraction failed(SourceFile file, const std::string &message) {
    FileExtraction result;
    result.file = std::move(file);
    result.file.lines_of_code = 0;
    result.file.complexity = 0;
    result.file.complexity_level = ComplexityLevel::Low;
    result.error = message;
    return result;
}

FileExtraction failed_extraction(const std::string &rel_path, const std::string &message) {
    return failed(base_record(rel_path), message);
}

FileExtraction EntityExtractor::extract_file(const fs::path &path, const std::string &rel_path) {
    std::error_code ec;
    uint64_t size = fs::file_size(path, ec);
    if (ec) {
        return failed(base_record(rel_path), "Cannot stat file: " + ec.message());
    }
    if (max_file_bytes_ > 0 && size > max_file_bytes_) {
        return failed(base_record(rel_path),
                      "File exceeds size limit (" + std::to_string(size) + " bytes)");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return failed(base_record(rel_path), "Cannot read file");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return failed(base_record(rel_path), "Read error");
    }

    return extract(rel_path, buffer.str());
}

FileExtraction EntityExtractor::extract(const std::string &rel_path, const std::string &content) {
    SourceFile record = base_record(rel_path);

    if (max_file_bytes_ > 0 && content.size() > max_file_bytes_) {
        return failed(std::move(record), "File exceeds size limit (" +
                                             std::to_string(content.size()) + " bytes)");
    }

    if (record.kind != FileKind::Python) {
        // Basic record only: no structural model for non-Python files
        FileExtraction result;
        result.file = std::move(record);
        result.file.lines_of_code = count_lines(content);
        return result;
    }

    if (!parser_.parse(content)) {
        return failed(std::move(record), "Parse timed out or was cancelled");
    }
    if (parser_.has_syntax_errors()) {
        return failed(std::move(record), "Syntax error");
    }

    FileExtraction result;
    result.file = std::move(record);
    result.file.lines_of_code = count_lines(content);

    FileWalker walker(parser_, extraction_, complexity_, result);
    walker.run();

    result.file.complexity = score_file(parser_.root(), complexity_);
    result.file.complexity_level = complexity_level(result.file.complexity, complexity_);
    result.file.types_count = static_cast<uint32_t>(result.types.size());
    result.file.callables_count = static_cast<uint32_t>(result.callables.size());
    result.file.schema_models_count = static_cast<uint32_t>(
        std::count_if(result.types.begin(), result.types.end(), [](const TypeDefinition &t) {
            return t.kind == TypeKind::SchemaModel;
        }));
    return result;
}

} // namespace codeatlas
