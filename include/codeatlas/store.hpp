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

#include "sqlite.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace codeatlas {

// ============================================================================
// Query parameters
// ============================================================================

// limit 0 = no limit
struct Page {
    size_t limit = 0;
    size_t offset = 0;
};

// One page of rows plus the number of rows matching the filter
template <typename T> struct QueryResult {
    std::vector<T> items;
    size_t total = 0;
};

struct FileFilter {
    std::optional<DomainType> domain;
    std::optional<FileKind> kind;
    std::optional<ComplexityLevel> complexity_level;
    std::optional<uint32_t> min_lines;
    std::optional<uint32_t> max_lines;
    std::optional<std::string> search; // Substring of name or path
    Page page;
};

struct TypeFilter {
    std::optional<EntityId> file_id;
    std::optional<TypeKind> kind;
    std::optional<std::string> name_contains;
    Page page;
};

struct CallableFilter {
    std::optional<EntityId> file_id;
    std::optional<EntityId> type_id;
    std::optional<CallableKind> kind;
    std::optional<std::string> name_contains;
    Page page;
};

struct RelationshipFilter {
    std::optional<RelationshipKind> kind;
    std::optional<EntityKind> source_kind;
    std::optional<EntityId> source_id;
    std::optional<EntityKind> target_kind;
    std::optional<EntityId> target_id;
    std::optional<std::string> file_path;
    Page page;
};

// ============================================================================
// Aggregates
// ============================================================================

struct EntityCounts {
    size_t files = 0;
    size_t types = 0;
    size_t callables = 0;
    size_t relationships = 0;
    uint64_t total_lines = 0;
    double average_complexity = 0.0; // Mean file complexity
};

struct DomainStats {
    DomainType domain = DomainType::Unknown;
    size_t file_count = 0;
    size_t type_count = 0;
    size_t callable_count = 0;
    uint64_t total_lines = 0;
    double average_complexity = 0.0;
};

struct ComplexityBucket {
    ComplexityLevel level = ComplexityLevel::Low;
    size_t count = 0;
    double percentage = 0.0;
};

// ============================================================================
// Store
// ============================================================================

// Relational persistence of the code model. Not internally synchronized;
// the engine serializes writers against readers.
class Store {
public:

    // Open or create the database. ":memory:" gives a private in-memory store.
    // Throws StoreUnavailable.
    explicit Store(const std::string &path);

    // Inserts return the new id. Referential violations throw IntegrityViolation.
    EntityId insert_file(const SourceFile &file);
    EntityId insert_type_definition(const TypeDefinition &type);
    EntityId insert_callable(const CallableUnit &callable);
    EntityId insert_relationship(const Relationship &relationship);

    // Delete everything and reset id sequences
    void clear_all();

    // Point lookups
    std::optional<SourceFile> get_file(EntityId id);
    std::optional<SourceFile> get_file(const std::string &path);
    std::optional<TypeDefinition> get_type(EntityId id);
    std::optional<CallableUnit> get_callable(EntityId id);

    // Filtered, paginated listings in their default order
    QueryResult<SourceFile> list_files(const FileFilter &filter = {});
    QueryResult<TypeDefinition> list_types(const TypeFilter &filter = {});
    QueryResult<CallableUnit> list_callables(const CallableFilter &filter = {});
    QueryResult<Relationship> list_relationships(const RelationshipFilter &filter = {});

    EntityCounts counts();
    std::vector<DomainStats> domain_stats();
    std::vector<ComplexityBucket> complexity_distribution();

    OwnerMap type_owners();
    OwnerMap callable_owners();

    // file id -> number of abstract types, files without any omitted
    std::unordered_map<EntityId, uint32_t> abstract_type_counts();

    // True if an entity of that kind exists
    bool exists(EntityKind kind, EntityId id);

    Database &database() { return db_; }

private:

    Database db_;

    void initialize_schema();
    void create_tables();
    void drop_tables();
};

} // namespace codeatlas
