#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "weathermcp/protocol_server.hpp"
#include "weathermcp/tools/weather_tool.hpp"
#include "weathermcp/types.hpp"
#include "weathermcp/utils/error.hpp"
#include "weathermcp/utils/json_utils.hpp"

#include <vector>

using namespace weathermcp;
using json = nlohmann::json;

// Mock transport for testing
class MockTransport : public transport::Transport {
public:
  MOCK_METHOD(void, start, (), (override));
  MOCK_METHOD(std::error_code, send, (const types::JSONRPCMessage &),
              (override));
  MOCK_METHOD(void, close, (), (override));
  MOCK_METHOD(bool, isOpen, (), (const, override));
  MOCK_METHOD(void, setMessageCallback,
              (std::function<void(const types::JSONRPCMessage &)>),
              (override));
  MOCK_METHOD(void, setErrorCallback,
              (std::function<void(const std::error_code &)>), (override));
  MOCK_METHOD(void, setCloseCallback, (std::function<void()>), (override));
};

class ProtocolServerTest : public ::testing::Test {
protected:
  void SetUp() override {
    transport_ = std::make_shared<testing::NiceMock<MockTransport>>();

    ON_CALL(*transport_, isOpen()).WillByDefault(testing::Return(true));

    // Record everything the server sends
    ON_CALL(*transport_, send(testing::_))
        .WillByDefault([this](const types::JSONRPCMessage &message) {
          sent_.push_back(json_utils::toJson(message));
          return std::error_code();
        });

    ON_CALL(*transport_, setMessageCallback(testing::_))
        .WillByDefault(
            [this](std::function<void(const types::JSONRPCMessage &)> cb) {
              message_callback_ = std::move(cb);
            });

    auto tools = std::make_shared<tools::ToolRegistry>();
    tools->add(tools::makeWeatherTool(
        std::make_shared<tools::StaticWeatherSource>()));

    server_ = std::make_unique<ProtocolServer>(
        types::ServerInfo{.name = "TestWeather",
                          .version = "0.1.0",
                          .instructions = "Ask about the weather."},
        tools);
    server_->connect(transport_);
    server_->setSessionId("session-1");
  }

  void TearDown() override { server_.reset(); }

  // Deliver a request and return the last message sent back
  json request(std::int64_t id, const std::string &method,
               const json &params = nullptr) {
    types::JSONRPCRequest message{.id = id, .method = method};
    if (!params.is_null()) {
      message.params = params;
    }
    message_callback_(message);
    EXPECT_FALSE(sent_.empty());
    return sent_.empty() ? json() : sent_.back();
  }

  json initialize(const std::string &version = "2025-06-18") {
    return request(1, "initialize",
                   {{"protocolVersion", version},
                    {"capabilities", json::object()},
                    {"clientInfo", {{"name", "tester"}, {"version", "1.0"}}}});
  }

  std::shared_ptr<testing::NiceMock<MockTransport>> transport_;
  std::function<void(const types::JSONRPCMessage &)> message_callback_;
  std::unique_ptr<ProtocolServer> server_;
  std::vector<json> sent_;
};

TEST_F(ProtocolServerTest, ConnectStartsTransport) {
  auto transport = std::make_shared<testing::NiceMock<MockTransport>>();
  EXPECT_CALL(*transport, start()).Times(1);

  ProtocolServer server(types::ServerInfo{.name = "x", .version = "1"},
                        std::make_shared<tools::ToolRegistry>());
  server.connect(transport);
}

TEST_F(ProtocolServerTest, ConnectRejectsNullTransport) {
  ProtocolServer server(types::ServerInfo{.name = "x", .version = "1"},
                        std::make_shared<tools::ToolRegistry>());
  EXPECT_THROW(server.connect(nullptr), TransportException);
}

TEST_F(ProtocolServerTest, InitializeReportsIdentityAndCapabilities) {
  json response = initialize();

  EXPECT_EQ(response["id"], 1);
  json result = response["result"];
  EXPECT_EQ(result["protocolVersion"], "2025-06-18");
  EXPECT_EQ(result["serverInfo"]["name"], "TestWeather");
  EXPECT_EQ(result["serverInfo"]["version"], "0.1.0");
  EXPECT_EQ(result["instructions"], "Ask about the weather.");
  EXPECT_TRUE(result["capabilities"].contains("tools"));
  EXPECT_TRUE(result["capabilities"].contains("logging"));

  EXPECT_TRUE(server_->isInitialized());
  ASSERT_TRUE(server_->clientInfo().has_value());
  EXPECT_EQ(server_->clientInfo()->name, "tester");
}

TEST_F(ProtocolServerTest, InitializeNegotiatesVersion) {
  json response = initialize("2024-11-05");
  EXPECT_EQ(response["result"]["protocolVersion"], "2024-11-05");
  EXPECT_EQ(server_->protocolVersion(), "2024-11-05");
}

TEST_F(ProtocolServerTest, InitializeFallsBackToLatestVersion) {
  json response = initialize("1999-01-01");
  EXPECT_EQ(response["result"]["protocolVersion"],
            types::kLatestProtocolVersion);
}

TEST_F(ProtocolServerTest, InitializeRequiresParams) {
  json response = request(1, "initialize");

  EXPECT_EQ(response["error"]["code"],
            static_cast<int>(types::ErrorCode::InvalidParams));
  EXPECT_FALSE(server_->isInitialized());
}

TEST_F(ProtocolServerTest, PingWorksBeforeInitialize) {
  json response = request(7, "ping");
  EXPECT_EQ(response["id"], 7);
  EXPECT_EQ(response["result"], json::object());
}

TEST_F(ProtocolServerTest, ToolsRequireInitialization) {
  json response = request(2, "tools/list");

  EXPECT_EQ(response["id"], 2);
  EXPECT_EQ(response["error"]["code"],
            static_cast<int>(types::ErrorCode::InvalidRequest));
}

TEST_F(ProtocolServerTest, ListToolsReturnsCatalog) {
  initialize();
  json response = request(2, "tools/list");

  json tools = response["result"]["tools"];
  ASSERT_EQ(tools.size(), 1u);
  EXPECT_EQ(tools[0]["name"], "get_city_weather");
  EXPECT_TRUE(tools[0].contains("inputSchema"));
  EXPECT_TRUE(tools[0].contains("outputSchema"));
}

TEST_F(ProtocolServerTest, CallToolReturnsTextAndStructuredContent) {
  initialize();
  json response =
      request(3, "tools/call",
              {{"name", "get_city_weather"}, {"arguments", {{"city", "Paris"}}}});

  json result = response["result"];
  EXPECT_EQ(result["content"][0]["type"], "text");
  EXPECT_EQ(result["content"][0]["text"],
            "The weather in paris is 15°C, Cloudy with 70% humidity.");
  EXPECT_EQ(result["structuredContent"]["city"], "paris");
  EXPECT_FALSE(result.contains("isError"));
}

TEST_F(ProtocolServerTest, CallToolSendsLogNotificationFirst) {
  initialize();
  sent_.clear();

  request(3, "tools/call",
          {{"name", "get_city_weather"}, {"arguments", {{"city", "tokyo"}}}});

  ASSERT_EQ(sent_.size(), 2u);
  EXPECT_EQ(sent_[0]["method"], "notifications/message");
  EXPECT_EQ(sent_[0]["params"]["level"], "info");
  EXPECT_EQ(sent_[0]["params"]["logger"], "TestWeather");
  EXPECT_EQ(sent_[0]["params"]["data"],
            "Processing weather request for tokyo");
  EXPECT_EQ(sent_[1]["id"], 3);
}

TEST_F(ProtocolServerTest, SetLevelFiltersNotifications) {
  initialize();
  json response = request(4, "logging/setLevel", {{"level", "warning"}});
  EXPECT_EQ(response["result"], json::object());
  EXPECT_EQ(server_->logLevel(), types::LoggingLevel::Warning);

  sent_.clear();
  request(5, "tools/call",
          {{"name", "get_city_weather"}, {"arguments", {{"city", "tokyo"}}}});
  ASSERT_EQ(sent_.size(), 1u);
  EXPECT_EQ(sent_[0]["id"], 5);
}

TEST_F(ProtocolServerTest, SetLevelRejectsUnknownLevel) {
  initialize();
  json response = request(4, "logging/setLevel", {{"level", "chatty"}});

  EXPECT_EQ(response["error"]["code"],
            static_cast<int>(types::ErrorCode::InvalidParams));
  EXPECT_EQ(server_->logLevel(), types::LoggingLevel::Debug);
}

TEST_F(ProtocolServerTest, UnknownCityIsToolErrorNotProtocolError) {
  initialize();
  json response =
      request(3, "tools/call",
              {{"name", "get_city_weather"}, {"arguments", {{"city", "atlantis"}}}});

  ASSERT_TRUE(response.contains("result"));
  EXPECT_EQ(response["result"]["isError"], true);
  EXPECT_EQ(response["result"]["content"][0]["text"],
            "Sorry, I don't have weather data for atlantis.");
}

TEST_F(ProtocolServerTest, InvalidArgumentsAreToolErrors) {
  initialize();
  json response = request(
      3, "tools/call",
      {{"name", "get_city_weather"},
       {"arguments", {{"city", "paris"}, {"unit", "kelvin"}}}});

  ASSERT_TRUE(response.contains("result"));
  EXPECT_EQ(response["result"]["isError"], true);
}

TEST_F(ProtocolServerTest, CallToolWithoutNameIsInvalidParams) {
  initialize();
  json response = request(3, "tools/call", {{"arguments", json::object()}});

  EXPECT_EQ(response["error"]["code"],
            static_cast<int>(types::ErrorCode::InvalidParams));
}

TEST_F(ProtocolServerTest, UnknownMethod) {
  initialize();
  json response = request(9, "resources/list");

  EXPECT_EQ(response["id"], 9);
  EXPECT_EQ(response["error"]["code"],
            static_cast<int>(types::ErrorCode::MethodNotFound));
  EXPECT_EQ(response["error"]["message"], "Method not found: resources/list");
}

TEST_F(ProtocolServerTest, NotificationsGetNoReply) {
  initialize();
  sent_.clear();

  message_callback_(
      types::JSONRPCNotification{.method = "notifications/initialized"});
  message_callback_(
      types::JSONRPCNotification{.method = "notifications/cancelled"});

  EXPECT_TRUE(sent_.empty());
}

TEST_F(ProtocolServerTest, DisconnectDropsCallbacks) {
  EXPECT_CALL(*transport_, setMessageCallback(testing::IsNull())).Times(1);
  EXPECT_CALL(*transport_, close()).Times(0);

  server_->disconnect();
}
