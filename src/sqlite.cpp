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

#include "codeatlas/sqlite.hpp"
#include "codeatlas/error.hpp"
#include <iostream>
#include <type_traits>

namespace codeatlas {

// ============================================================================
// Statement
// ============================================================================

Statement::Statement(sqlite3 *db, const std::string &sql) : db_(db) {
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        throw StoreError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db));
    }
}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement &&other) noexcept : stmt_(other.stmt_), db_(other.db_) {
    other.stmt_ = nullptr;
}

Statement &Statement::operator=(Statement &&other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        stmt_ = other.stmt_;
        db_ = other.db_;
        other.stmt_ = nullptr;
    }
    return *this;
}

void Statement::bind(int index, int64_t value) {
    if (sqlite3_bind_int64(stmt_, index, value) != SQLITE_OK) {
        throw StoreError("Failed to bind int64 parameter");
    }
}

void Statement::bind(int index, double value) {
    if (sqlite3_bind_double(stmt_, index, value) != SQLITE_OK) {
        throw StoreError("Failed to bind double parameter");
    }
}

void Statement::bind(int index, const std::string &value) {
    if (sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                          SQLITE_TRANSIENT) != SQLITE_OK) {
        throw StoreError("Failed to bind text parameter");
    }
}

void Statement::bind_null(int index) {
    if (sqlite3_bind_null(stmt_, index) != SQLITE_OK) {
        throw StoreError("Failed to bind null parameter");
    }
}

void Statement::bind(int index, const SqlValue &value) {
    std::visit(
        [&](const auto &v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                bind_null(index);
            } else {
                bind(index, v);
            }
        },
        value);
}

void Statement::bind_all(const std::vector<SqlValue> &values) {
    for (size_t i = 0; i < values.size(); ++i) {
        bind(static_cast<int>(i + 1), values[i]);
    }
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        throw IntegrityViolation(std::string("Constraint failed: ") + sqlite3_errmsg(db_));
    }
    throw StoreError(std::string("Statement execution failed: ") + sqlite3_errmsg(db_));
}

void Statement::execute() {
    if (!step()) {
        return;
    }
    throw StoreError("Execute called on query that returns data");
}

int64_t Statement::get_int64(int col) const { return sqlite3_column_int64(stmt_, col); }

int Statement::get_int(int col) const { return sqlite3_column_int(stmt_, col); }

double Statement::get_double(int col) const { return sqlite3_column_double(stmt_, col); }

std::string Statement::get_string(int col) const {
    const char *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt_, col));
    return text ? std::string(text) : std::string();
}

bool Statement::is_null(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }

// ============================================================================
// Database
// ============================================================================

Database::Database(const std::string &path) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw StoreUnavailable("Failed to open database " + path + ": " + message);
    }

    try {
        execute("PRAGMA foreign_keys = ON");
    } catch (const Error &e) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreUnavailable(std::string("Failed to configure database: ") + e.what());
    }
    sqlite3_busy_timeout(db_, 5000);
}

Database::~Database() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void Database::execute(const std::string &sql) {
    char *err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string error = err_msg ? err_msg : "Unknown error";
        sqlite3_free(err_msg);
        if ((rc & 0xff) == SQLITE_CONSTRAINT) {
            throw IntegrityViolation("Constraint failed: " + error);
        }
        throw StoreError("SQL execution failed: " + error);
    }
}

Statement Database::prepare(const std::string &sql) { return Statement(db_, sql); }

int64_t Database::last_insert_rowid() const { return sqlite3_last_insert_rowid(db_); }

int Database::user_version() {
    Statement stmt = prepare("PRAGMA user_version");
    if (!stmt.step()) {
        return 0;
    }
    return stmt.get_int(0);
}

void Database::set_user_version(int version) {
    execute("PRAGMA user_version = " + std::to_string(version));
}

// ============================================================================
// Transaction
// ============================================================================

Transaction::Transaction(Database &db) : db_(db) { db_.execute("BEGIN IMMEDIATE TRANSACTION"); }

Transaction::~Transaction() {
    if (!active_) {
        return;
    }
    try {
        db_.execute("ROLLBACK");
    } catch (const Error &e) {
        std::cerr << "Error: rollback failed: " << e.what() << std::endl;
    }
}

void Transaction::commit() {
    db_.execute("COMMIT");
    active_ = false;
}

} // namespace codeatlas
