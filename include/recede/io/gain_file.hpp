// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 Recede Authors
//
// Gain file reader. The file is a JSON object holding exactly the eight
// Gain::kFieldNames keys, e.g.
//   {"theta": 10, "position": 10, "obstacle": 100, "u_accel": 10,
//    "u_yaw_rate": 4, "terminal": 4, "impatience": 1, "speed": 0}

#pragma once

#include <filesystem>
#include <optional>

#include "recede/core/gain.hpp"
#include "recede/io/json.hpp"

namespace recede::io {

/// Throws std::runtime_error when a key is missing, not a number or negative.
[[nodiscard]] Gain parseGain(const JsonValue& root);

/// Throws std::runtime_error when the file is unreadable or malformed.
[[nodiscard]] Gain loadGainJSON(const std::filesystem::path& path);

/// std::nullopt when `path` does not exist; otherwise as loadGainJSON.
[[nodiscard]] std::optional<Gain> loadGainIfPresent(const std::filesystem::path& path);

}  // namespace recede::io
