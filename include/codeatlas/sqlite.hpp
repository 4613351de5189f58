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
#include <sqlite3.h>
#include <string>
#include <variant>
#include <vector>

namespace codeatlas {

// Value bound to a statement placeholder
using SqlValue = std::variant<std::nullptr_t, int64_t, double, std::string>;

// Prepared statement. Step failures throw StoreError, or IntegrityViolation
// for constraint failures.
class Statement {
public:

    Statement(sqlite3 *db, const std::string &sql);
    ~Statement();

    // Non-copyable
    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    // Movable
    Statement(Statement &&other) noexcept;
    Statement &operator=(Statement &&other) noexcept;

    // Placeholders are 1-based
    void bind(int index, int64_t value);
    void bind(int index, double value);
    void bind(int index, const std::string &value);
    void bind_null(int index);
    void bind(int index, const SqlValue &value);

    // Bind values to placeholders 1..n
    void bind_all(const std::vector<SqlValue> &values);

    // True while rows are available
    bool step();

    // Run a statement that returns no rows
    void execute();

    int64_t get_int64(int col) const;
    int get_int(int col) const;
    double get_double(int col) const;
    std::string get_string(int col) const;
    bool is_null(int col) const;

private:

    sqlite3_stmt *stmt_ = nullptr;
    sqlite3 *db_ = nullptr;
};

// Owns one sqlite3 connection with foreign keys enabled.
// Throws StoreUnavailable when the file cannot be opened.
class Database {
public:

    explicit Database(const std::string &path);
    ~Database();

    // Non-copyable
    Database(const Database &) = delete;
    Database &operator=(const Database &) = delete;

    // Execute SQL without results
    void execute(const std::string &sql);

    Statement prepare(const std::string &sql);

    int64_t last_insert_rowid() const;

    int user_version();
    void set_user_version(int version);

private:

    sqlite3 *db_ = nullptr;
};

// Rolls back on destruction unless committed
class Transaction {
public:

    explicit Transaction(Database &db);
    ~Transaction();

    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

    void commit();

private:

    Database &db_;
    bool active_ = true;
};

} // namespace codeatlas
