// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 Recede Authors
//
// Minimal JSON value, recursive descent parser and writer. Used for the
// gain and config files, artifact manifests and the solver wire protocol.

#pragma once

#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "recede/core/types.hpp"

namespace recede::io {

struct JsonValue;
using JsonObject = std::vector<std::pair<std::string, JsonValue>>;
using JsonArray  = std::vector<JsonValue>;

struct JsonValue {
    std::variant<double, std::string, bool, std::nullptr_t, JsonObject, JsonArray> data;

    [[nodiscard]] bool isNumber() const noexcept { return std::holds_alternative<double>(data); }
    [[nodiscard]] bool isString() const noexcept { return std::holds_alternative<std::string>(data); }
    [[nodiscard]] bool isBool() const noexcept { return std::holds_alternative<bool>(data); }
    [[nodiscard]] bool isNull() const noexcept { return std::holds_alternative<std::nullptr_t>(data); }
    [[nodiscard]] bool isObject() const noexcept { return std::holds_alternative<JsonObject>(data); }
    [[nodiscard]] bool isArray() const noexcept { return std::holds_alternative<JsonArray>(data); }

    // Typed accessors throw std::runtime_error on a type mismatch
    [[nodiscard]] double asNumber() const;
    [[nodiscard]] bool asBool() const;
    [[nodiscard]] const std::string& asString() const;
    [[nodiscard]] const JsonObject& asObject() const;
    [[nodiscard]] const JsonArray& asArray() const;

    /// Member lookup; throws std::runtime_error when absent.
    [[nodiscard]] const JsonValue& operator[](std::string_view key) const;

    /// Member lookup; nullptr when absent or not an object.
    [[nodiscard]] const JsonValue* find(std::string_view key) const;
};

/// Deepest object/array nesting parseJson accepts.
inline constexpr int kMaxJsonDepth = 64;

/// Parse a complete JSON document. Throws std::runtime_error on malformed
/// input, trailing content or nesting deeper than kMaxJsonDepth.
[[nodiscard]] JsonValue parseJson(std::string_view text);

/// Compact JSON text; numbers use the shortest round-trip form.
void writeJson(std::ostream& os, const JsonValue& value);
[[nodiscard]] std::string dumpJson(const JsonValue& value);

/// Shortest round-trip decimal rendering of a number.
[[nodiscard]] std::string formatNumber(double v);

/// Whole file as a string; throws std::runtime_error when unreadable.
[[nodiscard]] std::string readTextFile(const std::filesystem::path& path);

// ── Vector helpers ───────────────────────────────────────────────────────────

[[nodiscard]] JsonValue toJsonArray(const VecX& v);

/// Numeric array → VecX; throws std::runtime_error on a non-number entry.
[[nodiscard]] VecX toVecX(const JsonValue& v);

}  // namespace recede::io
