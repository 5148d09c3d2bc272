#pragma once

#include "http_server.h"
#include "orchestrator.h"
#include "config.h"
#include <string>

namespace pyexec {

// HTTP surface of the execute operation:
//   POST /execute   {"code": "...", "session_id": "..."} with a bearer token
//   GET  /health
class ExecuteApi {
public:
    ExecuteApi(Orchestrator& orchestrator, const ServiceConfig& config);

    void register_routes(HttpServer& server);

    HttpResponse execute(const HttpRequest& req);
    HttpResponse health() const;

    // HTTP status for a terminal outcome
    static int status_for(const ExecutionOutcome& outcome);

    // JSON body for a terminal outcome
    static std::string render(const ExecutionOutcome& outcome);

private:
    Orchestrator& orchestrator_;
    const ServiceConfig& config_;
};

} // namespace pyexec
