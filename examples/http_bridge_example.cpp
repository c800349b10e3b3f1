/**
 * @file http_bridge_example.cpp
 * @brief Exposes the interpreter over HTTP.
 *
 * Endpoints:
 *   POST /interpret   {"text": "...", "session_id": "...",
 *                      "context": {"current_file": "...",
 *                                  "current_directory": "...",
 *                                  "mode_flags": ["voice_active"]}}
 *   GET  /metrics
 *   GET  /suggest?q=partial&limit=5
 *
 * Usage: http_bridge_example [port] [config.json] [catalog.json]
 */

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>

#include "nl_command/catalog/catalog_loader.h"
#include "nl_command/catalog/default_catalog.h"
#include "nl_command/interpreter.h"
#include "nl_command/serialization/json_serialization.h"

using namespace nl_command;

namespace {

SessionContext ParseContext(const nlohmann::json& json) {
    SessionContext context;
    if (!json.is_object()) {
        return context;
    }
    context.current_file = json.value("current_file", "");
    context.current_directory = json.value("current_directory", "");
    if (json.contains("mode_flags")) {
        for (const auto& flag : json["mode_flags"]) {
            context.mode_flags.insert(flag.get<std::string>());
        }
    }
    return context;
}

void SendError(httplib::Response& res, int status, const std::string& message) {
    nlohmann::json body;
    body["error"] = message;
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

}  // namespace

int main(int argc, char** argv) {
    int port = argc > 1 ? std::atoi(argv[1]) : 8090;

    InterpreterConfig config;
    std::string error;
    if (argc > 2 && !LoadConfigFromFile(argv[2], config, error)) {
        fprintf(stderr, "Failed to load configuration: %s\n", error.c_str());
        return 1;
    }

    std::shared_ptr<PatternCatalog> catalog = BuildDefaultCatalog();
    if (argc > 3 && !LoadCatalogFromFile(argv[3], *catalog, error)) {
        fprintf(stderr, "Failed to load catalog: %s\n", error.c_str());
        return 1;
    }

    Interpreter interpreter;
    if (!interpreter.Init(config, catalog)) {
        fprintf(stderr, "Failed to initialize Interpreter\n");
        return 1;
    }

    httplib::Server server;

    server.Post("/interpret", [&interpreter](const httplib::Request& req,
                                             httplib::Response& res) {
        nlohmann::json request;
        try {
            request = nlohmann::json::parse(req.body);
        } catch (const nlohmann::json::exception& e) {
            SendError(res, 400, std::string("Invalid JSON: ") + e.what());
            return;
        }

        if (!request.is_object() || !request.contains("text") ||
            !request["text"].is_string()) {
            SendError(res, 400, "Missing string field 'text'");
            return;
        }

        SessionContext context;
        std::string session_id = kDefaultSessionId;
        try {
            if (request.contains("context")) {
                context = ParseContext(request["context"]);
            }
            session_id = request.value("session_id", std::string(kDefaultSessionId));
        } catch (const nlohmann::json::exception& e) {
            SendError(res, 400, std::string("Invalid context: ") + e.what());
            return;
        }

        auto result = interpreter.Interpret(request["text"].get<std::string>(),
                                            context, session_id);
        res.set_content(ToJson(result).dump(), "application/json");
    });

    server.Get("/metrics", [&interpreter](const httplib::Request& /*req*/,
                                          httplib::Response& res) {
        res.set_content(ToJson(interpreter.GetMetrics()).dump(), "application/json");
    });

    server.Get("/suggest", [&interpreter](const httplib::Request& req,
                                          httplib::Response& res) {
        std::string partial = req.has_param("q") ? req.get_param_value("q") : "";
        std::size_t limit = 5;
        if (req.has_param("limit")) {
            int requested = std::atoi(req.get_param_value("limit").c_str());
            if (requested > 0) limit = static_cast<std::size_t>(requested);
        }

        nlohmann::json body;
        body["suggestions"] = interpreter.SuggestPhrases(partial, limit);
        res.set_content(body.dump(), "application/json");
    });

    printf("Listening on http://0.0.0.0:%d\n", port);
    if (!server.listen("0.0.0.0", port)) {
        fprintf(stderr, "Failed to listen on port %d\n", port);
        return 1;
    }
    return 0;
}
