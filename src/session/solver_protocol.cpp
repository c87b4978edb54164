// SPDX-License-Identifier: BSD-3-Clause
#include "recede/session/solver_protocol.hpp"

#include <cmath>
#include <stdexcept>

#include "recede/io/json.hpp"

namespace recede::session {

using io::JsonArray;
using io::JsonObject;
using io::JsonValue;

namespace {

JsonValue number(double v) { return JsonValue{v}; }

int integerField(const JsonValue& root, std::string_view key) {
    double v = root[key].asNumber();
    if (std::floor(v) != v) {
        throw std::runtime_error("field '" + std::string(key) + "' is not an integer");
    }
    return static_cast<int>(v);
}

}  // namespace

// ─── Requests ────────────────────────────────────────────────────────────────

std::string encodeRequest(const SolverRequest& request) {
    JsonObject root;
    if (const auto* run = std::get_if<RunRequest>(&request)) {
        JsonObject body;
        body.emplace_back("parameter", io::toJsonArray(run->parameters));
        if (run->initialGuess) {
            body.emplace_back("initial_guess", io::toJsonArray(*run->initialGuess));
        }
        root.emplace_back("Run", JsonValue{std::move(body)});
    } else if (std::holds_alternative<PingRequest>(request)) {
        root.emplace_back("Ping", number(1));
    } else {
        root.emplace_back("Kill", number(1));
    }
    return io::dumpJson(JsonValue{std::move(root)});
}

SolverRequest decodeRequest(std::string_view text) {
    JsonValue root = io::parseJson(text);
    if (!root.isObject() || root.asObject().size() != 1) {
        throw std::runtime_error("request must be an object with one member");
    }

    const auto& [kind, body] = root.asObject().front();
    if (kind == "Ping") return PingRequest{};
    if (kind == "Kill") return KillRequest{};
    if (kind != "Run") throw std::runtime_error("unknown request '" + kind + "'");

    RunRequest run;
    run.parameters = io::toVecX(body["parameter"]);
    if (const auto* guess = body.find("initial_guess"); guess && !guess->isNull()) {
        run.initialGuess = io::toVecX(*guess);
    }
    return run;
}

// ─── Responses ───────────────────────────────────────────────────────────────

std::string encodeResponse(const SolveResponse& response) {
    JsonObject root;
    if (response.isOk()) {
        const auto& s = response.solution();
        root.emplace_back("exit_status", JsonValue{std::string(toString(s.exitStatus))});
        root.emplace_back("num_outer_iterations", number(s.outerIterations));
        root.emplace_back("num_inner_iterations", number(s.innerIterations));
        root.emplace_back("cost", number(s.cost));
        root.emplace_back("solve_time_ms", number(s.solveTimeMs));
        root.emplace_back("solution", io::toJsonArray(s.controls));
    } else {
        const auto& e = response.error();
        root.emplace_back("type", JsonValue{std::string("Error")});
        root.emplace_back("code", number(static_cast<int>(e.code)));
        root.emplace_back("message", JsonValue{e.message});
    }
    return io::dumpJson(JsonValue{std::move(root)});
}

std::string encodePong() {
    return io::dumpJson(JsonValue{JsonObject{{"Pong", number(1)}}});
}

SolveResponse decodeResponse(std::string_view text) {
    JsonValue root = io::parseJson(text);
    if (!root.isObject()) throw std::runtime_error("response must be an object");

    if (const auto* type = root.find("type"); type && type->asString() == "Error") {
        const JsonValue* message = root.find("message");
        return SolveResponse::failure(
            static_cast<SolverErrorCode>(integerField(root, "code")),
            message ? message->asString() : std::string{});
    }

    auto status = exitStatusFromString(root["exit_status"].asString());
    if (!status) {
        throw std::runtime_error("unknown exit status '" + root["exit_status"].asString() + "'");
    }

    SolverSolution s;
    s.exitStatus = *status;
    s.controls = io::toVecX(root["solution"]);
    s.outerIterations = integerField(root, "num_outer_iterations");
    s.innerIterations = integerField(root, "num_inner_iterations");
    s.cost = static_cast<Scalar>(root["cost"].asNumber());
    if (const auto* t = root.find("solve_time_ms")) s.solveTimeMs = t->asNumber();
    return SolveResponse::ok(std::move(s));
}

bool isPong(std::string_view text) noexcept {
    try {
        JsonValue root = io::parseJson(text);
        return root.find("Pong") != nullptr;
    } catch (const std::runtime_error&) {
        return false;
    }
}

}  // namespace recede::session
