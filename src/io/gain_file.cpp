// SPDX-License-Identifier: BSD-3-Clause
#include "recede/io/gain_file.hpp"

#include <stdexcept>
#include <string>

namespace recede::io {

Gain parseGain(const JsonValue& root) {
    if (!root.isObject()) throw std::runtime_error("gain file must hold a JSON object");

    std::array<Scalar, Gain::kDof> values{};
    for (std::size_t i = 0; i < Gain::kDof; ++i) {
        const auto name = Gain::kFieldNames[i];
        const JsonValue* v = root.find(name);
        if (v == nullptr)
            throw std::runtime_error("gain file is missing key '" + std::string(name) + "'");
        if (!v->isNumber())
            throw std::runtime_error("gain '" + std::string(name) + "' is not a number");
        values[i] = static_cast<Scalar>(v->asNumber());
        if (values[i] < 0)
            throw std::runtime_error("gain '" + std::string(name) + "' is negative");
    }
    return Gain::fromArray(values);
}

Gain loadGainJSON(const std::filesystem::path& path) {
    try {
        return parseGain(parseJson(readTextFile(path)));
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(path.string() + ": " + e.what());
    }
}

std::optional<Gain> loadGainIfPresent(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return std::nullopt;
    return loadGainJSON(path);
}

}  // namespace recede::io
