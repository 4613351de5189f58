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

#include "codeatlas/store.hpp"
#include "codeatlas/error.hpp"
#include "codeatlas/version.hpp"
#include <iostream>
#include <nlohmann/json.hpp>

namespace codeatlas {

using json = nlohmann::json;

namespace {

const char *SCHEMA_SQL = R"SQL(
CREATE TABLE IF NOT EXISTS files (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    path TEXT NOT NULL UNIQUE,
    name TEXT NOT NULL,
    domain TEXT NOT NULL,
    kind TEXT NOT NULL,
    lines_of_code INTEGER NOT NULL DEFAULT 0,
    complexity INTEGER NOT NULL DEFAULT 0,
    complexity_level TEXT NOT NULL,
    types_count INTEGER NOT NULL DEFAULT 0,
    callables_count INTEGER NOT NULL DEFAULT 0,
    imports_count INTEGER NOT NULL DEFAULT 0,
    schema_models_count INTEGER NOT NULL DEFAULT 0
);

CREATE TABLE IF NOT EXISTS types (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    file_id INTEGER NOT NULL REFERENCES files(id),
    name TEXT NOT NULL,
    start_line INTEGER NOT NULL,
    end_line INTEGER NOT NULL,
    kind TEXT NOT NULL,
    base_names TEXT NOT NULL DEFAULT '[]',
    decorators TEXT NOT NULL DEFAULT '[]',
    member_count INTEGER NOT NULL DEFAULT 0,
    is_abstract INTEGER NOT NULL DEFAULT 0
);

CREATE TABLE IF NOT EXISTS callables (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    file_id INTEGER NOT NULL REFERENCES files(id),
    type_id INTEGER REFERENCES types(id),
    name TEXT NOT NULL,
    start_line INTEGER NOT NULL,
    end_line INTEGER NOT NULL,
    kind TEXT NOT NULL,
    parameters TEXT NOT NULL DEFAULT '[]',
    parameter_count INTEGER NOT NULL DEFAULT 0,
    return_type TEXT,
    decorators TEXT NOT NULL DEFAULT '[]',
    is_async INTEGER NOT NULL DEFAULT 0,
    is_generator INTEGER NOT NULL DEFAULT 0,
    complexity INTEGER NOT NULL DEFAULT 1
);

CREATE TABLE IF NOT EXISTS relationships (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    source_kind TEXT NOT NULL,
    source_id INTEGER NOT NULL,
    source_name TEXT NOT NULL,
    target_kind TEXT NOT NULL,
    target_id INTEGER NOT NULL,
    target_name TEXT NOT NULL,
    kind TEXT NOT NULL,
    file_path TEXT NOT NULL,
    line INTEGER NOT NULL DEFAULT 0
);

CREATE INDEX IF NOT EXISTS idx_files_name ON files(name);
CREATE INDEX IF NOT EXISTS idx_types_file ON types(file_id);
CREATE INDEX IF NOT EXISTS idx_types_name ON types(name);
CREATE INDEX IF NOT EXISTS idx_callables_file ON callables(file_id);
CREATE INDEX IF NOT EXISTS idx_callables_type ON callables(type_id);
CREATE INDEX IF NOT EXISTS idx_callables_name ON callables(name);
CREATE INDEX IF NOT EXISTS idx_relationships_source ON relationships(source_kind, source_id);
CREATE INDEX IF NOT EXISTS idx_relationships_target ON relationships(target_kind, target_id);
)SQL";

const char *FILE_COLUMNS = "id, path, name, domain, kind, lines_of_code, complexity, "
                           "complexity_level, types_count, callables_count, imports_count, "
                           "schema_models_count";

const char *TYPE_COLUMNS = "id, file_id, name, start_line, end_line, kind, base_names, "
                           "decorators, member_count, is_abstract";

const char *CALLABLE_COLUMNS = "id, file_id, type_id, name, start_line, end_line, kind, "
                               "parameters, return_type, decorators, is_async, is_generator, "
                               "complexity";

const char *RELATIONSHIP_COLUMNS = "id, source_kind, source_id, source_name, target_kind, "
                                   "target_id, target_name, kind, file_path, line";

SqlValue int_value(int64_t v) { return SqlValue(v); }

SqlValue text_value(const std::string &v) { return SqlValue(v); }

std::string to_json_array(const std::vector<std::string> &values) { return json(values).dump(); }

std::vector<std::string> from_json_array(const std::string &text) {
    if (text.empty()) {
        return {};
    }
    try {
        return json::parse(text).get<std::vector<std::string>>();
    } catch (const json::exception &e) {
        throw StoreError(std::string("Corrupt JSON column: ") + e.what());
    }
}

const char *table_for(EntityKind kind) {
    switch (kind) {
    case EntityKind::File:
        return "files";
    case EntityKind::Type:
        return "types";
    default:
        return "callables";
    }
}

EntityKind entity_kind_column(const std::string &text) {
    auto kind = entity_kind_from_string(text);
    if (!kind) {
        throw StoreError("Unknown entity kind in store: " + text);
    }
    return *kind;
}

SourceFile read_file(const Statement &stmt) {
    SourceFile f;
    f.id = stmt.get_int64(0);
    f.path = stmt.get_string(1);
    f.name = stmt.get_string(2);
    f.domain = domain_from_string(stmt.get_string(3));
    f.kind = file_kind_from_string(stmt.get_string(4));
    f.lines_of_code = static_cast<uint32_t>(stmt.get_int64(5));
    f.complexity = stmt.get_int(6);
    f.complexity_level = complexity_level_from_string(stmt.get_string(7));
    f.types_count = static_cast<uint32_t>(stmt.get_int64(8));
    f.callables_count = static_cast<uint32_t>(stmt.get_int64(9));
    f.imports_count = static_cast<uint32_t>(stmt.get_int64(10));
    f.schema_models_count = static_cast<uint32_t>(stmt.get_int64(11));
    return f;
}

TypeDefinition read_type(const Statement &stmt) {
    TypeDefinition t;
    t.id = stmt.get_int64(0);
    t.file_id = stmt.get_int64(1);
    t.name = stmt.get_string(2);
    t.start_line = static_cast<uint32_t>(stmt.get_int64(3));
    t.end_line = static_cast<uint32_t>(stmt.get_int64(4));
    t.kind = type_kind_from_string(stmt.get_string(5));
    t.base_names = from_json_array(stmt.get_string(6));
    t.decorators = from_json_array(stmt.get_string(7));
    t.member_count = static_cast<uint32_t>(stmt.get_int64(8));
    t.is_abstract = stmt.get_int(9) != 0;
    return t;
}

CallableUnit read_callable(const Statement &stmt) {
    CallableUnit c;
    c.id = stmt.get_int64(0);
    c.file_id = stmt.get_int64(1);
    if (!stmt.is_null(2)) {
        c.type_id = stmt.get_int64(2);
    }
    c.name = stmt.get_string(3);
    c.start_line = static_cast<uint32_t>(stmt.get_int64(4));
    c.end_line = static_cast<uint32_t>(stmt.get_int64(5));
    c.kind = callable_kind_from_string(stmt.get_string(6));
    c.parameters = from_json_array(stmt.get_string(7));
    if (!stmt.is_null(8)) {
        c.return_type = stmt.get_string(8);
    }
    c.decorators = from_json_array(stmt.get_string(9));
    c.is_async = stmt.get_int(10) != 0;
    c.is_generator = stmt.get_int(11) != 0;
    c.complexity = stmt.get_int(12);
    return c;
}

Relationship read_relationship(const Statement &stmt) {
    Relationship r;
    r.id = stmt.get_int64(0);
    r.source_kind = entity_kind_column(stmt.get_string(1));
    r.source_id = stmt.get_int64(2);
    r.source_name = stmt.get_string(3);
    r.target_kind = entity_kind_column(stmt.get_string(4));
    r.target_id = stmt.get_int64(5);
    r.target_name = stmt.get_string(6);
    auto kind = relationship_kind_from_string(stmt.get_string(7));
    if (!kind) {
        throw StoreError("Unknown relationship kind in store: " + stmt.get_string(7));
    }
    r.kind = *kind;
    r.file_path = stmt.get_string(8);
    r.line = static_cast<uint32_t>(stmt.get_int64(9));
    return r;
}

// WHERE clause assembled from optional filters
struct Conditions {
    std::vector<std::string> clauses;
    std::vector<SqlValue> params;

    void add(const std::string &clause, SqlValue value) {
        clauses.push_back(clause);
        params.push_back(std::move(value));
    }

    std::string sql() const {
        if (clauses.empty()) {
            return "";
        }
        std::string out = " WHERE ";
        for (size_t i = 0; i < clauses.size(); ++i) {
            if (i > 0) {
                out += " AND ";
            }
            out += clauses[i];
        }
        return out;
    }
};

// Count plus one ordered page, read with `reader`
template <typename T, typename Reader>
QueryResult<T> run_paged(Database &db, const std::string &table, const char *columns,
                         const Conditions &where, const std::string &order_by, const Page &page,
                         Reader reader) {
    QueryResult<T> result;

    Statement count = db.prepare("SELECT COUNT(*) FROM " + table + where.sql());
    count.bind_all(where.params);
    if (count.step()) {
        result.total = static_cast<size_t>(count.get_int64(0));
    }

    std::string sql = std::string("SELECT ") + columns + " FROM " + table + where.sql() +
                      " ORDER BY " + order_by + " LIMIT ? OFFSET ?";
    Statement stmt = db.prepare(sql);
    stmt.bind_all(where.params);
    int next = static_cast<int>(where.params.size()) + 1;
    stmt.bind(next, page.limit == 0 ? int64_t{-1} : static_cast<int64_t>(page.limit));
    stmt.bind(next + 1, static_cast<int64_t>(page.offset));

    while (stmt.step()) {
        result.items.push_back(reader(stmt));
    }
    return result;
}

// Substring pattern for LIKE with a backslash escape: % and _ in the needle match literally
std::string like_pattern(const std::string &needle) {
    std::string pattern = "%";
    for (char c : needle) {
        if (c == '\\' || c == '%' || c == '_') {
            pattern += '\\';
        }
        pattern += c;
    }
    pattern += '%';
    return pattern;
}

} // namespace

// ============================================================================
// Schema
// ============================================================================

Store::Store(const std::string &path) : db_(path) {
    try {
        initialize_schema();
    } catch (const StoreUnavailable &) {
        throw;
    } catch (const Error &e) {
        throw StoreUnavailable(std::string("Failed to initialize schema: ") + e.what());
    }
}

void Store::initialize_schema() {
    int version = db_.user_version();
    if (!is_schema_compatible(version)) {
        // Every run recomputes from scratch, so an old layout is just dropped
        std::cerr << "Warning: rebuilding store with schema version " << version
                  << " (expected " << STORE_SCHEMA_VERSION << ")" << std::endl;
        drop_tables();
    }
    create_tables();
    db_.set_user_version(STORE_SCHEMA_VERSION);
}

void Store::create_tables() { db_.execute(SCHEMA_SQL); }

void Store::drop_tables() {
    db_.execute("DROP TABLE IF EXISTS relationships;"
                "DROP TABLE IF EXISTS callables;"
                "DROP TABLE IF EXISTS types;"
                "DROP TABLE IF EXISTS files;");
}

void Store::clear_all() {
    db_.execute("DELETE FROM relationships;"
                "DELETE FROM callables;"
                "DELETE FROM types;"
                "DELETE FROM files;"
                "DELETE FROM sqlite_sequence WHERE name IN "
                "('relationships', 'callables', 'types', 'files');");
}

// ============================================================================
// Inserts
// ============================================================================

EntityId Store::insert_file(const SourceFile &file) {
    Statement stmt = db_.prepare(
        "INSERT INTO files (path, name, domain, kind, lines_of_code, complexity, "
        "complexity_level, types_count, callables_count, imports_count, schema_models_count) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    stmt.bind_all({text_value(file.path), text_value(file.name),
                   text_value(domain_to_string(file.domain)),
                   text_value(file_kind_to_string(file.kind)), int_value(file.lines_of_code),
                   int_value(file.complexity),
                   text_value(complexity_level_to_string(file.complexity_level)),
                   int_value(file.types_count), int_value(file.callables_count),
                   int_value(file.imports_count), int_value(file.schema_models_count)});
    stmt.execute();
    return db_.last_insert_rowid();
}

EntityId Store::insert_type_definition(const TypeDefinition &type) {
    if (!exists(EntityKind::File, type.file_id)) {
        throw IntegrityViolation("Type '" + type.name + "' references missing file " +
                                 std::to_string(type.file_id));
    }

    Statement stmt = db_.prepare(
        "INSERT INTO types (file_id, name, start_line, end_line, kind, base_names, decorators, "
        "member_count, is_abstract) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
    stmt.bind_all({int_value(type.file_id), text_value(type.name), int_value(type.start_line),
                   int_value(type.end_line), text_value(type_kind_to_string(type.kind)),
                   text_value(to_json_array(type.base_names)),
                   text_value(to_json_array(type.decorators)), int_value(type.member_count),
                   int_value(type.is_abstract ? 1 : 0)});
    stmt.execute();
    return db_.last_insert_rowid();
}

EntityId Store::insert_callable(const CallableUnit &callable) {
    if (!exists(EntityKind::File, callable.file_id)) {
        throw IntegrityViolation("Callable '" + callable.name + "' references missing file " +
                                 std::to_string(callable.file_id));
    }

    if (callable.type_id) {
        Statement owner = db_.prepare("SELECT file_id FROM types WHERE id = ?");
        owner.bind(1, *callable.type_id);
        if (!owner.step()) {
            throw IntegrityViolation("Callable '" + callable.name + "' references missing type " +
                                     std::to_string(*callable.type_id));
        }
        if (owner.get_int64(0) != callable.file_id) {
            throw IntegrityViolation("Callable '" + callable.name + "' in file " +
                                     std::to_string(callable.file_id) + " owned by type " +
                                     std::to_string(*callable.type_id) + " from file " +
                                     std::to_string(owner.get_int64(0)));
        }
    }

    Statement stmt = db_.prepare(
        "INSERT INTO callables (file_id, type_id, name, start_line, end_line, kind, parameters, "
        "parameter_count, return_type, decorators, is_async, is_generator, complexity) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    stmt.bind_all({int_value(callable.file_id),
                   callable.type_id ? int_value(*callable.type_id) : SqlValue(nullptr),
                   text_value(callable.name), int_value(callable.start_line),
                   int_value(callable.end_line), text_value(callable_kind_to_string(callable.kind)),
                   text_value(to_json_array(callable.parameters)),
                   int_value(static_cast<int64_t>(callable.parameters.size())),
                   callable.return_type ? text_value(*callable.return_type) : SqlValue(nullptr),
                   text_value(to_json_array(callable.decorators)),
                   int_value(callable.is_async ? 1 : 0), int_value(callable.is_generator ? 1 : 0),
                   int_value(callable.complexity)});
    stmt.execute();
    return db_.last_insert_rowid();
}

EntityId Store::insert_relationship(const Relationship &rel) {
    if (!exists(rel.source_kind, rel.source_id)) {
        throw IntegrityViolation(std::string("Relationship source ") +
                                 entity_kind_to_string(rel.source_kind) + " " +
                                 std::to_string(rel.source_id) + " does not exist");
    }
    if (!exists(rel.target_kind, rel.target_id)) {
        throw IntegrityViolation(std::string("Relationship target ") +
                                 entity_kind_to_string(rel.target_kind) + " " +
                                 std::to_string(rel.target_id) + " does not exist");
    }

    Statement stmt = db_.prepare(
        "INSERT INTO relationships (source_kind, source_id, source_name, target_kind, target_id, "
        "target_name, kind, file_path, line) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
    stmt.bind_all({text_value(entity_kind_to_string(rel.source_kind)), int_value(rel.source_id),
                   text_value(rel.source_name),
                   text_value(entity_kind_to_string(rel.target_kind)), int_value(rel.target_id),
                   text_value(rel.target_name), text_value(relationship_kind_to_string(rel.kind)),
                   text_value(rel.file_path), int_value(rel.line)});
    stmt.execute();
    return db_.last_insert_rowid();
}

bool Store::exists(EntityKind kind, EntityId id) {
    Statement stmt = db_.prepare(std::string("SELECT 1 FROM ") + table_for(kind) + " WHERE id = ?");
    stmt.bind(1, id);
    return stmt.step();
}

// ============================================================================
// Point lookups
// ============================================================================

std::optional<SourceFile> Store::get_file(EntityId id) {
    Statement stmt = db_.prepare(std::string("SELECT ") + FILE_COLUMNS + " FROM files WHERE id = ?");
    stmt.bind(1, id);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return read_file(stmt);
}

std::optional<SourceFile> Store::get_file(const std::string &path) {
    Statement stmt =
        db_.prepare(std::string("SELECT ") + FILE_COLUMNS + " FROM files WHERE path = ?");
    stmt.bind(1, path);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return read_file(stmt);
}

std::optional<TypeDefinition> Store::get_type(EntityId id) {
    Statement stmt = db_.prepare(std::string("SELECT ") + TYPE_COLUMNS + " FROM types WHERE id = ?");
    stmt.bind(1, id);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return read_type(stmt);
}

std::optional<CallableUnit> Store::get_callable(EntityId id) {
    Statement stmt =
        db_.prepare(std::string("SELECT ") + CALLABLE_COLUMNS + " FROM callables WHERE id = ?");
    stmt.bind(1, id);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return read_callable(stmt);
}

// ============================================================================
// Listings
// ============================================================================

QueryResult<SourceFile> Store::list_files(const FileFilter &filter) {
    Conditions where;
    if (filter.domain) {
        where.add("domain = ?", text_value(domain_to_string(*filter.domain)));
    }
    if (filter.kind) {
        where.add("kind = ?", text_value(file_kind_to_string(*filter.kind)));
    }
    if (filter.complexity_level) {
        where.add("complexity_level = ?",
                  text_value(complexity_level_to_string(*filter.complexity_level)));
    }
    if (filter.min_lines) {
        where.add("lines_of_code >= ?", int_value(*filter.min_lines));
    }
    if (filter.max_lines) {
        where.add("lines_of_code <= ?", int_value(*filter.max_lines));
    }
    if (filter.search) {
        // Same pattern bound twice
        where.clauses.push_back("(name LIKE ? ESCAPE '\\' OR path LIKE ? ESCAPE '\\')");
        where.params.push_back(text_value(like_pattern(*filter.search)));
        where.params.push_back(text_value(like_pattern(*filter.search)));
    }

    return run_paged<SourceFile>(db_, "files", FILE_COLUMNS, where,
                                 "complexity DESC, lines_of_code DESC, path", filter.page,
                                 read_file);
}

QueryResult<TypeDefinition> Store::list_types(const TypeFilter &filter) {
    Conditions where;
    if (filter.file_id) {
        where.add("file_id = ?", int_value(*filter.file_id));
    }
    if (filter.kind) {
        where.add("kind = ?", text_value(type_kind_to_string(*filter.kind)));
    }
    if (filter.name_contains) {
        where.add("name LIKE ? ESCAPE '\\'", text_value(like_pattern(*filter.name_contains)));
    }

    return run_paged<TypeDefinition>(db_, "types", TYPE_COLUMNS, where,
                                     "member_count DESC, name, id", filter.page, read_type);
}

QueryResult<CallableUnit> Store::list_callables(const CallableFilter &filter) {
    Conditions where;
    if (filter.file_id) {
        where.add("file_id = ?", int_value(*filter.file_id));
    }
    if (filter.type_id) {
        where.add("type_id = ?", int_value(*filter.type_id));
    }
    if (filter.kind) {
        where.add("kind = ?", text_value(callable_kind_to_string(*filter.kind)));
    }
    if (filter.name_contains) {
        where.add("name LIKE ? ESCAPE '\\'", text_value(like_pattern(*filter.name_contains)));
    }

    return run_paged<CallableUnit>(db_, "callables", CALLABLE_COLUMNS, where,
                                   "complexity DESC, parameter_count DESC, name, id", filter.page,
                                   read_callable);
}

QueryResult<Relationship> Store::list_relationships(const RelationshipFilter &filter) {
    Conditions where;
    if (filter.kind) {
        where.add("kind = ?", text_value(relationship_kind_to_string(*filter.kind)));
    }
    if (filter.source_kind) {
        where.add("source_kind = ?", text_value(entity_kind_to_string(*filter.source_kind)));
    }
    if (filter.source_id) {
        where.add("source_id = ?", int_value(*filter.source_id));
    }
    if (filter.target_kind) {
        where.add("target_kind = ?", text_value(entity_kind_to_string(*filter.target_kind)));
    }
    if (filter.target_id) {
        where.add("target_id = ?", int_value(*filter.target_id));
    }
    if (filter.file_path) {
        where.add("file_path = ?", text_value(*filter.file_path));
    }

    return run_paged<Relationship>(db_, "relationships", RELATIONSHIP_COLUMNS, where,
                                   "source_name, target_name, id", filter.page, read_relationship);
}

// ============================================================================
// Aggregates
// ============================================================================

EntityCounts Store::counts() {
    Statement stmt = db_.prepare("SELECT (SELECT COUNT(*) FROM files), "
                                 "(SELECT COUNT(*) FROM types), "
                                 "(SELECT COUNT(*) FROM callables), "
                                 "(SELECT COUNT(*) FROM relationships), "
                                 "(SELECT COALESCE(SUM(lines_of_code), 0) FROM files), "
                                 "(SELECT COALESCE(AVG(complexity), 0.0) FROM files)");
    EntityCounts counts;
    if (stmt.step()) {
        counts.files = static_cast<size_t>(stmt.get_int64(0));
        counts.types = static_cast<size_t>(stmt.get_int64(1));
        counts.callables = static_cast<size_t>(stmt.get_int64(2));
        counts.relationships = static_cast<size_t>(stmt.get_int64(3));
        counts.total_lines = static_cast<uint64_t>(stmt.get_int64(4));
        counts.average_complexity = stmt.get_double(5);
    }
    return counts;
}

std::vector<DomainStats> Store::domain_stats() {
    Statement stmt = db_.prepare("SELECT domain, COUNT(*), SUM(types_count), SUM(callables_count), "
                                 "SUM(lines_of_code), AVG(complexity) FROM files "
                                 "GROUP BY domain ORDER BY COUNT(*) DESC, domain");
    std::vector<DomainStats> stats;
    while (stmt.step()) {
        DomainStats s;
        s.domain = domain_from_string(stmt.get_string(0));
        s.file_count = static_cast<size_t>(stmt.get_int64(1));
        s.type_count = static_cast<size_t>(stmt.get_int64(2));
        s.callable_count = static_cast<size_t>(stmt.get_int64(3));
        s.total_lines = static_cast<uint64_t>(stmt.get_int64(4));
        s.average_complexity = stmt.get_double(5);
        stats.push_back(s);
    }
    return stats;
}

std::vector<ComplexityBucket> Store::complexity_distribution() {
    std::vector<ComplexityBucket> buckets;
    for (ComplexityLevel level : {ComplexityLevel::Low, ComplexityLevel::Medium,
                                  ComplexityLevel::High, ComplexityLevel::VeryHigh}) {
        ComplexityBucket b;
        b.level = level;
        buckets.push_back(b);
    }

    size_t total = 0;
    Statement stmt =
        db_.prepare("SELECT complexity_level, COUNT(*) FROM files GROUP BY complexity_level");
    while (stmt.step()) {
        ComplexityLevel level = complexity_level_from_string(stmt.get_string(0));
        size_t count = static_cast<size_t>(stmt.get_int64(1));
        buckets[static_cast<size_t>(level)].count += count;
        total += count;
    }

    for (auto &b : buckets) {
        b.percentage = total == 0 ? 0.0 : 100.0 * static_cast<double>(b.count) / total;
    }
    return buckets;
}

OwnerMap Store::type_owners() {
    OwnerMap owners;
    Statement stmt = db_.prepare("SELECT id, file_id FROM types");
    while (stmt.step()) {
        owners[stmt.get_int64(0)] = stmt.get_int64(1);
    }
    return owners;
}

OwnerMap Store::callable_owners() {
    OwnerMap owners;
    Statement stmt = db_.prepare("SELECT id, file_id FROM callables");
    while (stmt.step()) {
        owners[stmt.get_int64(0)] = stmt.get_int64(1);
    }
    return owners;
}

std::unordered_map<EntityId, uint32_t> Store::abstract_type_counts() {
    std::unordered_map<EntityId, uint32_t> counts;
    Statement stmt =
        db_.prepare("SELECT file_id, COUNT(*) FROM types WHERE is_abstract = 1 GROUP BY file_id");
    while (stmt.step()) {
        counts[stmt.get_int64(0)] = static_cast<uint32_t>(stmt.get_int64(1));
    }
    return counts;
}

} // namespace codeatlas
