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

#include <stdexcept>
#include <string>

namespace codeatlas {

// Base for every failure that aborts an operation.
// Per-file extraction problems are not errors; they are reported as values.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The database could not be opened or initialized
class StoreUnavailable : public Error {
public:
    using Error::Error;
};

// Any other SQLite failure (prepare, step, bind)
class StoreError : public Error {
public:
    using Error::Error;
};

// An insert would break a referential invariant (e.g. method owned by a type
// from another file). Aborts and rolls back the whole populate run.
class IntegrityViolation : public Error {
public:
    using Error::Error;
};

// Populate was pointed at a missing path or a non-directory.
// Raised before the store is touched.
class SourceRootError : public Error {
public:
    using Error::Error;
};

// Settings file unreadable or malformed
class ConfigError : public Error {
public:
    using Error::Error;
};

} // namespace codeatlas
