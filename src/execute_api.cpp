#include "execute_api.h"
#include "session_store.h"
#include <json/json.h>
#include <sstream>

namespace pyexec {

namespace {

std::string to_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

HttpResponse bad_request(const std::string& message) {
    Json::Value body;
    body["error"] = "bad_request";
    body["message"] = message;

    HttpResponse resp;
    resp.status_code = 400;
    resp.body = to_json(body);
    return resp;
}

} // namespace

ExecuteApi::ExecuteApi(Orchestrator& orchestrator, const ServiceConfig& config)
    : orchestrator_(orchestrator), config_(config) {}

void ExecuteApi::register_routes(HttpServer& server) {
    server.route("POST", "/execute", [this](const HttpRequest& req) {
        return execute(req);
    });
    server.route("GET", "/health", [this](const HttpRequest&) {
        return health();
    });
}

HttpResponse ExecuteApi::execute(const HttpRequest& req) {
    Json::Value json;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(req.body.empty() ? "{}" : req.body);

    if (!Json::parseFromStream(builder, stream, &json, &errors) || !json.isObject()) {
        return bad_request("Body must be a JSON object");
    }

    std::string code;
    if (json.isMember("code")) {
        if (!json["code"].isString()) {
            return bad_request("code must be a string");
        }
        code = json["code"].asString();
    }

    std::optional<std::string> session_id;
    if (json.isMember("session_id") && !json["session_id"].isNull()) {
        if (!json["session_id"].isString()) {
            return bad_request("session_id must be a string");
        }
        session_id = json["session_id"].asString();
        if (!SessionStore::is_valid_session_id(*session_id)) {
            return bad_request("session_id may only contain letters, digits, '.', '_' and '-'");
        }
    }

    std::string token = TokenValidator::extract_bearer(req.header("Authorization"));
    ExecutionOutcome outcome = orchestrator_.execute(
        token, config_.make_request(std::move(code), std::move(session_id)));

    HttpResponse resp;
    resp.status_code = status_for(outcome);
    resp.body = render(outcome);
    if (outcome.error == ErrorCategory::AUTH_ERROR) {
        resp.headers["WWW-Authenticate"] = "Bearer";
    }
    return resp;
}

HttpResponse ExecuteApi::health() const {
    Json::Value body;
    body["status"] = "ok";
    body["service"] = "pyexec";
    body["backend"] = to_string(config_.backend);
    body["auth"] = config_.dev_mode() ? "development" : "jwks";
    body["timeout_seconds"] = config_.timeout_seconds;
    body["memory_mb"] = static_cast<Json::UInt64>(config_.memory_mb);
    body["max_output_bytes"] = static_cast<Json::UInt64>(config_.max_output_bytes);

    HttpResponse resp;
    resp.body = to_json(body);
    return resp;
}

int ExecuteApi::status_for(const ExecutionOutcome& outcome) {
    if (outcome.completed()) {
        return 200;
    }
    switch (outcome.error) {
        case ErrorCategory::AUTH_ERROR:
            return outcome.deny_reason == DenyReason::MISSING_SCOPE ? 403 : 401;
        case ErrorCategory::PROVISION_ERROR:
            return 503;
        default:
            return 500;
    }
}

std::string ExecuteApi::render(const ExecutionOutcome& outcome) {
    Json::Value body;

    if (outcome.completed() && outcome.result) {
        const ExecutionResult& result = *outcome.result;
        body["status"] = to_string(result.status);
        body["truncated"] = result.truncated;

        Json::Value outputs(Json::arrayValue);
        for (const auto& record : result.records) {
            Json::Value item;
            item["type"] = to_string(record.kind);
            item["data"] = record.data;
            outputs.append(item);
        }
        body["outputs"] = outputs;

        if (outcome.error != ErrorCategory::NONE) {
            body["error"] = to_string(outcome.error);
            if (!outcome.message.empty()) {
                body["message"] = outcome.message;
            }
        }
    } else {
        body["error"] = to_string(outcome.error);
        body["message"] = outcome.message;
    }

    body["request_id"] = outcome.request_id;
    return to_json(body);
}

} // namespace pyexec
