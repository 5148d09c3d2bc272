#include <gtest/gtest.h>
#include "execute_api.h"
#include "fake_launcher.h"
#include "test_tokens.h"
#include <json/json.h>
#include <filesystem>
#include <sstream>
#include <unistd.h>

namespace pyexec {
namespace {

namespace fs = std::filesystem;
using namespace testing_support;

Json::Value parse_json(const std::string& text) {
    Json::Value value;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(text);
    EXPECT_TRUE(Json::parseFromStream(builder, stream, &value, &errors)) << errors;
    return value;
}

class ExecuteApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = fs::temp_directory_path() / ("pyexec_api_" + std::to_string(getpid()));
        fs::remove_all(root);
        config.timeout_seconds = 10;
        config.max_output_bytes = 64 * 1024;
        validator = make_validator();
        sessions = std::make_unique<SessionStore>(root.string());
        orchestrator = std::make_unique<Orchestrator>(*validator, *sessions, launcher);
        api = std::make_unique<ExecuteApi>(*orchestrator, config);
        token = mint(valid_claims());
    }

    void TearDown() override {
        api.reset();
        orchestrator.reset();
        sessions.reset();
        fs::remove_all(root);
    }

    HttpRequest post(const std::string& body, const std::string& bearer) {
        HttpRequest req;
        req.method = "POST";
        req.path = "/execute";
        req.body = body;
        if (!bearer.empty()) {
            req.headers["authorization"] = "Bearer " + bearer;
        }
        return req;
    }

    fs::path root;
    ServiceConfig config;
    FakeLauncher launcher;
    std::unique_ptr<TokenValidator> validator;
    std::unique_ptr<SessionStore> sessions;
    std::unique_ptr<Orchestrator> orchestrator;
    std::unique_ptr<ExecuteApi> api;
    std::string token;
};

// ============================================================================
// POST /execute
// ============================================================================

TEST_F(ExecuteApiTest, ReturnsOutputsForValidRequest) {
    // Given: An authorized request printing a line
    auto req = post(R"json({"code": "print(\"hi\")"})json", token);

    // When: It is handled
    HttpResponse resp = api->execute(req);

    // Then: 200 with one text output
    EXPECT_EQ(resp.status_code, 200);
    Json::Value body = parse_json(resp.body);
    EXPECT_EQ(body["status"].asString(), "completed");
    EXPECT_FALSE(body["truncated"].asBool());
    ASSERT_EQ(body["outputs"].size(), 1u);
    EXPECT_EQ(body["outputs"][0]["type"].asString(), "text");
    EXPECT_EQ(body["outputs"][0]["data"].asString(), "hi\n");
    EXPECT_FALSE(body.isMember("error"));
    EXPECT_EQ(body["request_id"].asString().rfind("req_", 0), 0u);
}

TEST_F(ExecuteApiTest, GuestExceptionIsStill200) {
    HttpResponse resp = api->execute(post(R"({"code": "1/0"})", token));

    EXPECT_EQ(resp.status_code, 200);
    Json::Value body = parse_json(resp.body);
    ASSERT_EQ(body["outputs"].size(), 1u);
    EXPECT_EQ(body["outputs"][0]["type"].asString(), "error");
    EXPECT_EQ(body["error"].asString(), "guest_execution_error");
}

TEST_F(ExecuteApiTest, MissingTokenIs401) {
    HttpResponse resp = api->execute(post(R"json({"code": "print(1)"})json", ""));

    EXPECT_EQ(resp.status_code, 401);
    EXPECT_EQ(resp.headers["WWW-Authenticate"], "Bearer");
    Json::Value body = parse_json(resp.body);
    EXPECT_EQ(body["error"].asString(), "auth_error");
    EXPECT_FALSE(body.isMember("outputs"));
    EXPECT_EQ(launcher.launches.load(), 0);
}

TEST_F(ExecuteApiTest, MissingScopeIs403) {
    HttpResponse resp = api->execute(post(R"json({"code": "print(1)"})json", mint(valid_claims("read"))));

    EXPECT_EQ(resp.status_code, 403);
    EXPECT_EQ(launcher.launches.load(), 0);
}

TEST_F(ExecuteApiTest, MalformedBodiesAre400) {
    EXPECT_EQ(api->execute(post("not json", token)).status_code, 400);
    EXPECT_EQ(api->execute(post("[1, 2]", token)).status_code, 400);
    EXPECT_EQ(api->execute(post(R"({"code": 5})", token)).status_code, 400);
    EXPECT_EQ(api->execute(post(R"({"code": "x", "session_id": 7})", token)).status_code, 400);
    EXPECT_EQ(api->execute(post(R"({"code": "x", "session_id": "../etc"})", token)).status_code,
              400);
    EXPECT_EQ(launcher.launches.load(), 0);
}

TEST_F(ExecuteApiTest, MissingCodeIsReportedAsError) {
    HttpResponse resp = api->execute(post("{}", token));

    EXPECT_EQ(resp.status_code, 200);
    Json::Value body = parse_json(resp.body);
    ASSERT_EQ(body["outputs"].size(), 1u);
    EXPECT_EQ(body["outputs"][0]["type"].asString(), "error");
    EXPECT_EQ(body["outputs"][0]["data"].asString(), "Error: No Python code provided");
}

TEST_F(ExecuteApiTest, SessionIdSelectsWorkspace) {
    api->execute(post(R"json({"code": "write(\"f.txt\", \"kept\")", "session_id": "s1"})json", token));
    HttpResponse resp = api->execute(post(R"json({"code": "read(\"f.txt\")", "session_id": "s1"})json", token));

    Json::Value body = parse_json(resp.body);
    ASSERT_EQ(body["outputs"].size(), 1u);
    EXPECT_EQ(body["outputs"][0]["data"].asString(), "kept");
}

TEST_F(ExecuteApiTest, ConfiguredLimitsAreApplied) {
    config.memory_mb = 128;
    config.cpus = 2.0;

    api->execute(post(R"json({"code": "print(1)"})json", token));

    EXPECT_EQ(launcher.last_limits.memory_mb, 128u);
    EXPECT_DOUBLE_EQ(launcher.last_limits.cpu_share, 2.0);
}

TEST_F(ExecuteApiTest, ProvisionFailureIs503) {
    launcher.fail_launch = true;

    HttpResponse resp = api->execute(post(R"json({"code": "print(1)"})json", token));

    EXPECT_EQ(resp.status_code, 503);
    EXPECT_EQ(parse_json(resp.body)["error"].asString(), "provision_error");
}

// ============================================================================
// Rendering
// ============================================================================

TEST(ExecuteApiRenderTest, StatusCodesByCategory) {
    ExecutionOutcome outcome;
    outcome.state = OrchestratorState::FAILED;

    outcome.error = ErrorCategory::AUTH_ERROR;
    outcome.deny_reason = DenyReason::EXPIRED;
    EXPECT_EQ(ExecuteApi::status_for(outcome), 401);
    outcome.deny_reason = DenyReason::MISSING_SCOPE;
    EXPECT_EQ(ExecuteApi::status_for(outcome), 403);

    outcome.error = ErrorCategory::PROVISION_ERROR;
    EXPECT_EQ(ExecuteApi::status_for(outcome), 503);
    outcome.error = ErrorCategory::INTERNAL_ERROR;
    EXPECT_EQ(ExecuteApi::status_for(outcome), 500);

    outcome.state = OrchestratorState::COMPLETED;
    outcome.error = ErrorCategory::TIMEOUT_ERROR;
    EXPECT_EQ(ExecuteApi::status_for(outcome), 200);
}

TEST(ExecuteApiRenderTest, TimedOutResultKeepsOutputs) {
    ExecutionResult result;
    result.status = ExecutionStatus::TIMED_OUT;
    result.records.push_back(OutputRecord::text("before\n"));

    ExecutionOutcome outcome;
    outcome.state = OrchestratorState::COMPLETED;
    outcome.result = result;
    outcome.error = ErrorCategory::TIMEOUT_ERROR;
    outcome.message = "Execution timed out after 1 seconds";
    outcome.request_id = "req_1_1";

    Json::Value body = parse_json(ExecuteApi::render(outcome));

    EXPECT_EQ(body["status"].asString(), "timed_out");
    EXPECT_EQ(body["outputs"][0]["data"].asString(), "before\n");
    EXPECT_EQ(body["error"].asString(), "timeout_error");
    EXPECT_EQ(body["message"].asString(), "Execution timed out after 1 seconds");
    EXPECT_EQ(body["request_id"].asString(), "req_1_1");
}

TEST(ExecuteApiRenderTest, ImageRecordsRenderAsImageType) {
    ExecutionResult result;
    result.records.push_back(OutputRecord::image("iVBORw0KGgo="));
    result.truncated = true;

    ExecutionOutcome outcome;
    outcome.state = OrchestratorState::COMPLETED;
    outcome.result = result;

    Json::Value body = parse_json(ExecuteApi::render(outcome));

    EXPECT_TRUE(body["truncated"].asBool());
    EXPECT_EQ(body["outputs"][0]["type"].asString(), "image");
    EXPECT_EQ(body["outputs"][0]["data"].asString(), "iVBORw0KGgo=");
}

// ============================================================================
// GET /health
// ============================================================================

TEST_F(ExecuteApiTest, HealthDescribesService) {
    HttpResponse resp = api->health();

    EXPECT_EQ(resp.status_code, 200);
    Json::Value body = parse_json(resp.body);
    EXPECT_EQ(body["status"].asString(), "ok");
    EXPECT_EQ(body["backend"].asString(), "docker");
    EXPECT_EQ(body["auth"].asString(), "development");
    EXPECT_EQ(body["timeout_seconds"].asInt(), 10);
}

TEST_F(ExecuteApiTest, RoutesAreRegistered) {
    HttpServer server(0);
    api->register_routes(server);

    HttpRequest health;
    health.method = "GET";
    health.path = "/health";
    EXPECT_EQ(server.dispatch(health).status_code, 200);

    HttpResponse resp = server.dispatch(post(R"json({"code": "print(1)"})json", token));
    EXPECT_EQ(resp.status_code, 200);
}

} // namespace
} // namespace pyexec
