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

namespace codeatlas {

// ============================================================================
// codeatlas Version Information
// ============================================================================

// Application version (displayed to users)
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

// Version string for display
constexpr const char *VERSION_STRING = "1.0.0";

// Store schema version, kept in PRAGMA user_version.
// Increment when the table layout changes.
constexpr int STORE_SCHEMA_VERSION = 3;

// Oldest schema version whose tables can be reused as-is
constexpr int MIN_COMPAT_SCHEMA_VERSION = 3;

// Check if an on-disk schema can be reused.
// 0 means a fresh database with no tables yet.
inline bool is_schema_compatible(int version) {
    if (version == 0) {
        return true;
    }
    if (version > STORE_SCHEMA_VERSION) {
        return false; // Written by a newer build
    }
    return version >= MIN_COMPAT_SCHEMA_VERSION;
}

} // namespace codeatlas
