#include <gtest/gtest.h>

#include "weathermcp/router/request_router.hpp"
#include "weathermcp/tools/weather_tool.hpp"
#include "weathermcp/utils/error.hpp"

#include <atomic>
#include <chrono>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace weathermcp;
using namespace weathermcp::router;
using json = nlohmann::json;

class RequestRouterTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto catalog = std::make_shared<tools::ToolRegistry>();
    catalog->add(tools::makeWeatherTool(
        std::make_shared<tools::StaticWeatherSource>()));

    tools::ToolDefinition failing;
    failing.name = "explode";
    failing.description = "Fails while running";
    failing.handler = [](const json &,
                         tools::ToolContext &) -> tools::ToolOutcome {
      throw std::runtime_error("secret connection string");
    };
    catalog->add(std::move(failing));

    tools::ToolDefinition misreporting;
    misreporting.name = "misreport";
    misreporting.description = "Returns a payload its schema forbids";
    misreporting.output_schema = tools::ObjectSchema(
        {{.name = "count", .type = tools::FieldType::Integer}});
    misreporting.handler = [](const json &,
                              tools::ToolContext &) -> tools::ToolOutcome {
      return tools::ToolSuccess{"ok", json{{"count", "secret value"}}};
    };
    catalog->add(std::move(misreporting));

    tools_ = catalog;

    router_ = std::make_unique<RequestRouter>(
        registry_,
        types::ServerInfo{.name = "MyWeatherMCPServer", .version = "1.0.0"},
        tools_, [this] { return "session-" + std::to_string(++counter_); });
  }

  void TearDown() override {
    for (const auto &session : registry_.snapshot()) {
      session->close();
    }
  }

  static json initializeBody(std::int64_t id = 1) {
    return {{"jsonrpc", "2.0"},
            {"id", id},
            {"method", "initialize"},
            {"params",
             {{"protocolVersion", "2025-06-18"},
              {"capabilities", json::object()},
              {"clientInfo", {{"name", "tester"}, {"version", "1.0"}}}}}};
  }

  static transport::RequestEnvelope
  post(json body, std::optional<std::string> session = {}) {
    transport::RequestEnvelope envelope;
    envelope.method = transport::HttpMethod::Post;
    envelope.body = std::move(body);
    envelope.session_id = std::move(session);
    return envelope;
  }

  std::string initialize() {
    transport::HttpReply reply = router_->handle(post(initializeBody()));
    EXPECT_EQ(reply.status, 200);
    return reply.headers[transport::kSessionIdHeader];
  }

  transport::HttpReply callTool(const std::string &session,
                                const std::string &name,
                                const json &arguments) {
    return router_->handle(post({{"jsonrpc", "2.0"},
                                 {"id", 5},
                                 {"method", "tools/call"},
                                 {"params",
                                  {{"name", name}, {"arguments", arguments}}}},
                                session));
  }

  transport::HttpReply callWeather(const std::string &session,
                                   const std::string &city) {
    return callTool(session, "get_city_weather", {{"city", city}});
  }

  session::SessionRegistry registry_;
  std::shared_ptr<const tools::ToolRegistry> tools_;
  std::unique_ptr<RequestRouter> router_;
  std::atomic<int> counter_{0};
};

TEST_F(RequestRouterTest, RejectsMissingCollaborators) {
  EXPECT_THROW(RequestRouter(registry_, types::ServerInfo{}, nullptr),
               std::invalid_argument);
  EXPECT_THROW(RequestRouter(registry_, types::ServerInfo{}, tools_, nullptr),
               std::invalid_argument);
}

TEST_F(RequestRouterTest, InitializeCreatesAndRegistersSession) {
  std::string id = initialize();

  EXPECT_EQ(id, "session-1");
  ASSERT_NE(registry_.get(id), nullptr);
  EXPECT_EQ(registry_.get(id)->state(), session::LifecycleState::Active);
}

TEST_F(RequestRouterTest, KnownSessionIsReused) {
  std::string id = initialize();

  transport::HttpReply reply = callWeather(id, "Paris");

  EXPECT_EQ(reply.status, 200);
  json body = json::parse(reply.body);
  EXPECT_EQ(body["id"], 5);
  EXPECT_EQ(body["result"]["structuredContent"]["temperature"], 15.0);
  EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(RequestRouterTest, UnknownSessionIsNotFound) {
  transport::HttpReply reply = callWeather("does-not-exist", "paris");

  EXPECT_EQ(reply.status, 404);
  json body = json::parse(reply.body);
  EXPECT_EQ(body["error"]["code"], -32001);
  EXPECT_EQ(body["error"]["message"],
            "Session not found. Please re-initialize.");
  EXPECT_EQ(body["id"], 5);
  EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(RequestRouterTest, InitializeWithUnknownSessionIsNotFound) {
  transport::HttpReply reply =
      router_->handle(post(initializeBody(), std::string("stale")));

  EXPECT_EQ(reply.status, 404);
  EXPECT_EQ(json::parse(reply.body)["error"]["code"], -32001);
  EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(RequestRouterTest, NonInitializeWithoutSessionIsMalformed) {
  transport::HttpReply reply = router_->handle(
      post({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}}));

  EXPECT_EQ(reply.status, 400);
  json body = json::parse(reply.body);
  EXPECT_EQ(body["error"]["code"], -32600);
  EXPECT_EQ(body["error"]["message"],
            "Bad Request: Session ID required or invalid initialization.");
  EXPECT_EQ(body["id"], 2);
  EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(RequestRouterTest, MalformedRequestsNeverCreateSessions) {
  std::vector<transport::RequestEnvelope> requests;

  transport::RequestEnvelope no_body;
  no_body.method = transport::HttpMethod::Post;
  requests.push_back(no_body);

  json missing_client = initializeBody();
  missing_client["params"].erase("clientInfo");
  requests.push_back(post(missing_client));

  requests.push_back(post(json::array({initializeBody()})));

  transport::RequestEnvelope get;
  get.method = transport::HttpMethod::Get;
  requests.push_back(get);

  transport::RequestEnvelope del;
  del.method = transport::HttpMethod::Delete;
  requests.push_back(del);

  for (const auto &request : requests) {
    transport::HttpReply reply = router_->handle(request);
    EXPECT_EQ(reply.status, 400);
    EXPECT_EQ(json::parse(reply.body)["error"]["code"], -32600);
  }
  EXPECT_EQ(registry_.size(), 0u);
  EXPECT_EQ(counter_.load(), 0);
}

TEST_F(RequestRouterTest, DeleteEndsSession) {
  std::string id = initialize();

  transport::RequestEnvelope del;
  del.method = transport::HttpMethod::Delete;
  del.session_id = id;
  EXPECT_EQ(router_->handle(del).status, 200);

  EXPECT_EQ(registry_.get(id), nullptr);
  EXPECT_EQ(callWeather(id, "paris").status, 404);
}

TEST_F(RequestRouterTest, RouteThrowsProtocolErrors) {
  EXPECT_THROW(router_->route(post(json::object())), ProtocolException);
  EXPECT_THROW(router_->route(post(initializeBody(), std::string("x"))),
               ProtocolException);
}

TEST_F(RequestRouterTest, SessionsDoNotShareState) {
  std::string first = initialize();
  std::string second = initialize();
  ASSERT_NE(first, second);

  json level = {{"jsonrpc", "2.0"},
                {"id", 3},
                {"method", "logging/setLevel"},
                {"params", {{"level", "error"}}}};
  EXPECT_EQ(router_->handle(post(level, first)).status, 200);

  EXPECT_EQ(registry_.get(first)->server().logLevel(),
            types::LoggingLevel::Error);
  EXPECT_EQ(registry_.get(second)->server().logLevel(),
            types::LoggingLevel::Debug);
}

TEST_F(RequestRouterTest, DomainMissStaysInBand) {
  std::string id = initialize();

  transport::HttpReply reply = callWeather(id, "atlantis");

  EXPECT_EQ(reply.status, 200);
  json body = json::parse(reply.body);
  EXPECT_EQ(body["result"]["isError"], true);
}

TEST_F(RequestRouterTest, ConcurrentInitializationsGetDistinctSessions) {
  constexpr int kClients = 8;
  std::vector<std::string> ids(kClients);
  std::vector<std::thread> threads;
  for (int i = 0; i < kClients; ++i) {
    threads.emplace_back([this, &ids, i] {
      transport::HttpReply reply = router_->handle(post(initializeBody()));
      ids[i] = reply.headers[transport::kSessionIdHeader];
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  std::set<std::string> unique(ids.begin(), ids.end());
  EXPECT_EQ(unique.size(), static_cast<std::size_t>(kClients));
  EXPECT_EQ(registry_.size(), static_cast<std::size_t>(kClients));
}

TEST_F(RequestRouterTest, UnknownSessionWithInvalidUtf8IsNotFound) {
  transport::HttpReply reply = callWeather("abc\xff", "paris");

  EXPECT_EQ(reply.status, 404);
  json body = json::parse(reply.body);
  EXPECT_EQ(body["error"]["code"], -32001);
  EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(RequestRouterTest, FailingHandlerIsGenericInternalError) {
  std::string id = initialize();

  transport::HttpReply reply = callTool(id, "explode", json::object());

  EXPECT_EQ(reply.status, 500);
  json body = json::parse(reply.body);
  EXPECT_EQ(body["id"], 5);
  EXPECT_EQ(body["error"]["code"], -32000);
  EXPECT_EQ(body["error"]["message"], "Internal Server Error");
  EXPECT_EQ(reply.body.find("secret"), std::string::npos);
}

TEST_F(RequestRouterTest, OutputSchemaViolationIsGenericInternalError) {
  std::string id = initialize();

  transport::HttpReply reply = callTool(id, "misreport", json::object());

  EXPECT_EQ(reply.status, 500);
  json body = json::parse(reply.body);
  EXPECT_EQ(body["error"]["code"], -32000);
  EXPECT_EQ(body["error"]["message"], "Internal Server Error");
  EXPECT_FALSE(body["error"].contains("data"));
  EXPECT_EQ(reply.body.find("secret"), std::string::npos);
  EXPECT_EQ(reply.body.find("count"), std::string::npos);
}

TEST_F(RequestRouterTest, DeleteRacingRequestsEndsInNotFound) {
  std::string id = initialize();

  constexpr int kWorkers = 4;
  constexpr int kCallsPerWorker = 50;
  std::atomic<bool> deleted{false};
  std::atomic<int> unexpected{0};
  std::atomic<int> found_after_delete{0};

  std::vector<std::thread> threads;
  for (int w = 0; w < kWorkers; ++w) {
    threads.emplace_back([&] {
      for (int i = 0; i < kCallsPerWorker; ++i) {
        const bool was_deleted = deleted.load();
        transport::HttpReply reply = callWeather(id, "paris");
        if (reply.status == 200) {
          if (was_deleted) {
            ++found_after_delete;
          }
        } else if (reply.status != 404 ||
                   json::parse(reply.body)["error"]["code"] != -32001) {
          ++unexpected;
        }
      }
    });
  }
  threads.emplace_back([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    transport::RequestEnvelope del;
    del.method = transport::HttpMethod::Delete;
    del.session_id = id;
    router_->handle(del);
    deleted = true;
  });
  for (auto &thread : threads) {
    thread.join();
  }

  EXPECT_EQ(unexpected.load(), 0);
  EXPECT_EQ(found_after_delete.load(), 0);
  EXPECT_EQ(registry_.get(id), nullptr);

  transport::HttpReply after = callWeather(id, "paris");
  EXPECT_EQ(after.status, 404);
  EXPECT_EQ(json::parse(after.body)["error"]["code"], -32001);
}

TEST_F(RequestRouterTest, CloseRacingRequestsEndsInNotFound) {
  std::string id = initialize();
  auto session = registry_.get(id);
  ASSERT_NE(session, nullptr);

  std::atomic<int> unexpected{0};
  std::vector<std::thread> threads;
  for (int w = 0; w < 4; ++w) {
    threads.emplace_back([&] {
      for (int i = 0; i < 50; ++i) {
        transport::HttpReply reply = callWeather(id, "tokyo");
        if (reply.status != 200 &&
            (reply.status != 404 ||
             json::parse(reply.body)["error"]["code"] != -32001)) {
          ++unexpected;
        }
      }
    });
  }
  threads.emplace_back([&session] { session->close(); });
  for (auto &thread : threads) {
    thread.join();
  }

  EXPECT_EQ(unexpected.load(), 0);
  EXPECT_EQ(session->state(), session::LifecycleState::Closed);
  EXPECT_EQ(callWeather(id, "tokyo").status, 404);
}

TEST_F(RequestRouterTest, IdleSessionsAreClosed) {
  std::string idle = initialize();
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  std::string busy = initialize();
  ASSERT_EQ(callWeather(busy, "london").status, 200);

  auto now = registry_.get(busy)->lastActivity();
  EXPECT_EQ(router_->closeIdleSessions(std::chrono::hours(1), now), 0u);
  EXPECT_EQ(registry_.size(), 2u);

  EXPECT_EQ(router_->closeIdleSessions(std::chrono::milliseconds(10), now),
            1u);
  EXPECT_EQ(registry_.get(idle), nullptr);
  ASSERT_NE(registry_.get(busy), nullptr);

  transport::HttpReply expired = callWeather(idle, "paris");
  EXPECT_EQ(expired.status, 404);
  EXPECT_EQ(json::parse(expired.body)["error"]["code"], -32001);
  EXPECT_EQ(callWeather(busy, "paris").status, 200);
}
