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
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace codeatlas {

// Entity ID type - surrogate key assigned by the store
using EntityId = int64_t;

// Reserved IDs
constexpr EntityId INVALID_ID = 0;

// Maps a type or callable id to its owning file id
using OwnerMap = std::unordered_map<EntityId, EntityId>;

// ============================================================================
// Enumerations
// ============================================================================

// Kind of entity a relationship endpoint refers to
enum class EntityKind { File, Type, Callable };

inline const char *entity_kind_to_string(EntityKind kind) {
    switch (kind) {
    case EntityKind::File:
        return "file";
    case EntityKind::Type:
        return "type";
    case EntityKind::Callable:
        return "callable";
    }
    return "unknown";
}

inline std::optional<EntityKind> entity_kind_from_string(std::string_view s) {
    if (s == "file")
        return EntityKind::File;
    if (s == "type")
        return EntityKind::Type;
    if (s == "callable")
        return EntityKind::Callable;
    return std::nullopt;
}

// Coarse architectural bucket inferred from a file's path
enum class DomainType {
    Presentation,
    Application,
    Domain,
    Infrastructure,
    Services,
    Models,
    Utils,
    Tests,
    Config,
    Docs,
    Unknown
};

inline const char *domain_to_string(DomainType domain) {
    switch (domain) {
    case DomainType::Presentation:
        return "presentation";
    case DomainType::Application:
        return "application";
    case DomainType::Domain:
        return "domain";
    case DomainType::Infrastructure:
        return "infrastructure";
    case DomainType::Services:
        return "services";
    case DomainType::Models:
        return "models";
    case DomainType::Utils:
        return "utils";
    case DomainType::Tests:
        return "tests";
    case DomainType::Config:
        return "config";
    case DomainType::Docs:
        return "docs";
    default:
        return "unknown";
    }
}

inline DomainType domain_from_string(std::string_view s) {
    for (DomainType d : {DomainType::Presentation, DomainType::Application, DomainType::Domain,
                         DomainType::Infrastructure, DomainType::Services, DomainType::Models,
                         DomainType::Utils, DomainType::Tests, DomainType::Config,
                         DomainType::Docs}) {
        if (s == domain_to_string(d))
            return d;
    }
    return DomainType::Unknown;
}

// Strict variant for user input: nullopt for anything but a known name
inline std::optional<DomainType> parse_domain(std::string_view s) {
    if (s == domain_to_string(DomainType::Unknown))
        return DomainType::Unknown;
    DomainType d = domain_from_string(s);
    if (d == DomainType::Unknown)
        return std::nullopt;
    return d;
}

// File kind based on extension
enum class FileKind { Python, JavaScript, Html, Css, Markdown, Json, Yaml, Other };

inline const char *file_kind_to_string(FileKind kind) {
    switch (kind) {
    case FileKind::Python:
        return "python";
    case FileKind::JavaScript:
        return "javascript";
    case FileKind::Html:
        return "html";
    case FileKind::Css:
        return "css";
    case FileKind::Markdown:
        return "markdown";
    case FileKind::Json:
        return "json";
    case FileKind::Yaml:
        return "yaml";
    default:
        return "other";
    }
}

inline FileKind file_kind_from_string(std::string_view s) {
    for (FileKind k : {FileKind::Python, FileKind::JavaScript, FileKind::Html, FileKind::Css,
                       FileKind::Markdown, FileKind::Json, FileKind::Yaml}) {
        if (s == file_kind_to_string(k))
            return k;
    }
    return FileKind::Other;
}

// Get file kind from file extension (lowercased, with leading dot)
inline FileKind file_kind_from_extension(const std::string &ext) {
    if (ext == ".py")
        return FileKind::Python;
    if (ext == ".js")
        return FileKind::JavaScript;
    if (ext == ".html" || ext == ".htm")
        return FileKind::Html;
    if (ext == ".css")
        return FileKind::Css;
    if (ext == ".md" || ext == ".markdown")
        return FileKind::Markdown;
    if (ext == ".json")
        return FileKind::Json;
    if (ext == ".yml" || ext == ".yaml")
        return FileKind::Yaml;
    return FileKind::Other;
}

// Ordinal bucket of a file's complexity score
enum class ComplexityLevel { Low, Medium, High, VeryHigh };

inline const char *complexity_level_to_string(ComplexityLevel level) {
    switch (level) {
    case ComplexityLevel::Low:
        return "low";
    case ComplexityLevel::Medium:
        return "medium";
    case ComplexityLevel::High:
        return "high";
    case ComplexityLevel::VeryHigh:
        return "very_high";
    }
    return "low";
}

inline ComplexityLevel complexity_level_from_string(std::string_view s) {
    if (s == "medium")
        return ComplexityLevel::Medium;
    if (s == "high")
        return ComplexityLevel::High;
    if (s == "very_high")
        return ComplexityLevel::VeryHigh;
    return ComplexityLevel::Low;
}

inline std::optional<ComplexityLevel> parse_complexity_level(std::string_view s) {
    ComplexityLevel level = complexity_level_from_string(s);
    if (s != complexity_level_to_string(level))
        return std::nullopt;
    return level;
}

enum class TypeKind { Plain, Abstract, Exception, Enumeration, DataHolder, SchemaModel };

inline const char *type_kind_to_string(TypeKind kind) {
    switch (kind) {
    case TypeKind::Abstract:
        return "abstract";
    case TypeKind::Exception:
        return "exception";
    case TypeKind::Enumeration:
        return "enumeration";
    case TypeKind::DataHolder:
        return "data_holder";
    case TypeKind::SchemaModel:
        return "schema_model";
    default:
        return "plain";
    }
}

inline TypeKind type_kind_from_string(std::string_view s) {
    for (TypeKind k : {TypeKind::Abstract, TypeKind::Exception, TypeKind::Enumeration,
                       TypeKind::DataHolder, TypeKind::SchemaModel}) {
        if (s == type_kind_to_string(k))
            return k;
    }
    return TypeKind::Plain;
}

enum class CallableKind { Function, Method, Static, ClassBound, Property };

inline const char *callable_kind_to_string(CallableKind kind) {
    switch (kind) {
    case CallableKind::Method:
        return "method";
    case CallableKind::Static:
        return "static";
    case CallableKind::ClassBound:
        return "class_bound";
    case CallableKind::Property:
        return "property";
    default:
        return "function";
    }
}

inline CallableKind callable_kind_from_string(std::string_view s) {
    for (CallableKind k : {CallableKind::Method, CallableKind::Static, CallableKind::ClassBound,
                           CallableKind::Property}) {
        if (s == callable_kind_to_string(k))
            return k;
    }
    return CallableKind::Function;
}

enum class RelationshipKind { Inherits, Calls, Imports, Uses, Contains, DependsOn };

inline const char *relationship_kind_to_string(RelationshipKind kind) {
    switch (kind) {
    case RelationshipKind::Inherits:
        return "inherits";
    case RelationshipKind::Calls:
        return "calls";
    case RelationshipKind::Imports:
        return "imports";
    case RelationshipKind::Uses:
        return "uses";
    case RelationshipKind::Contains:
        return "contains";
    case RelationshipKind::DependsOn:
        return "depends_on";
    }
    return "uses";
}

inline std::optional<RelationshipKind> relationship_kind_from_string(std::string_view s) {
    for (RelationshipKind k : {RelationshipKind::Inherits, RelationshipKind::Calls,
                               RelationshipKind::Imports, RelationshipKind::Uses,
                               RelationshipKind::Contains, RelationshipKind::DependsOn}) {
        if (s == relationship_kind_to_string(k))
            return k;
    }
    return std::nullopt;
}

// ============================================================================
// Persisted entities
// ============================================================================

// File-level summary record
struct SourceFile {
    EntityId id = INVALID_ID;
    std::string path;  // Relative to the analysis root, forward slashes
    std::string name;  // Final path component
    DomainType domain = DomainType::Unknown;
    FileKind kind = FileKind::Other;
    uint32_t lines_of_code = 0;
    int complexity = 0;
    ComplexityLevel complexity_level = ComplexityLevel::Low;
    uint32_t types_count = 0;
    uint32_t callables_count = 0;
    uint32_t imports_count = 0;
    uint32_t schema_models_count = 0;
};

// Class-like type definition
struct TypeDefinition {
    EntityId id = INVALID_ID;
    EntityId file_id = INVALID_ID;
    std::string name;
    uint32_t start_line = 0;
    uint32_t end_line = 0;
    TypeKind kind = TypeKind::Plain;
    std::vector<std::string> base_names; // Raw, resolved lazily
    std::vector<std::string> decorators;
    uint32_t member_count = 0;
    bool is_abstract = false;
};

// Function, method, or property
struct CallableUnit {
    EntityId id = INVALID_ID;
    EntityId file_id = INVALID_ID;
    std::optional<EntityId> type_id; // Unset for free functions
    std::string name;
    uint32_t start_line = 0;
    uint32_t end_line = 0;
    CallableKind kind = CallableKind::Function;
    std::vector<std::string> parameters; // name[:annotation][=default]
    std::optional<std::string> return_type;
    std::vector<std::string> decorators;
    bool is_async = false;
    bool is_generator = false;
    int complexity = 1;
};

// Resolved edge between two entities
struct Relationship {
    EntityId id = INVALID_ID;
    EntityKind source_kind = EntityKind::Callable;
    EntityId source_id = INVALID_ID;
    std::string source_name;
    EntityKind target_kind = EntityKind::Callable;
    EntityId target_id = INVALID_ID;
    std::string target_name;
    RelationshipKind kind = RelationshipKind::Calls;
    std::string file_path; // File that declared the relationship
    uint32_t line = 0;
};

} // namespace codeatlas
