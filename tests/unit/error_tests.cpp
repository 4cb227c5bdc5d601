#include "weathermcp/transport/http_message.hpp"
#include "weathermcp/utils/error.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace weathermcp;
using namespace weathermcp::types;
using json = nlohmann::json;

class ErrorTest : public ::testing::Test {};

TEST_F(ErrorTest, McpExceptionWithErrorData) {
  ErrorData error_data{.code = static_cast<int>(ErrorCode::InvalidParams),
                       .message = "Invalid parameters",
                       .data = json{{"param", "value"}}};

  McpException exception(error_data);

  EXPECT_EQ(exception.what(), std::string("Invalid parameters"));
  EXPECT_EQ(exception.code(), ErrorCode::InvalidParams);
  EXPECT_EQ(exception.error().message, "Invalid parameters");
  EXPECT_EQ(exception.error().data["param"], "value");
}

TEST_F(ErrorTest, McpExceptionWithErrorCode) {
  McpException exception(ErrorCode::InvalidRequest, "Invalid request");

  EXPECT_EQ(exception.what(), std::string("Invalid request"));
  EXPECT_EQ(exception.error().code,
            static_cast<int>(ErrorCode::InvalidRequest));
  EXPECT_TRUE(exception.error().data.is_null());
}

TEST_F(ErrorTest, MalformedRequestUsesInvalidRequestCode) {
  auto exception = ProtocolException::malformedRequest("Bad Request");

  EXPECT_EQ(exception.error().code, -32600);
  EXPECT_EQ(exception.error().message, "Bad Request");
}

TEST_F(ErrorTest, SessionNotFoundCarriesTheSessionId) {
  auto exception = ProtocolException::sessionNotFound("abc-123");

  EXPECT_EQ(exception.error().code, -32001);
  EXPECT_EQ(exception.error().message,
            "Session not found. Please re-initialize.");
  EXPECT_EQ(exception.error().data["sessionId"], "abc-123");
}

TEST_F(ErrorTest, DuplicateSessionRemembersTheId) {
  DuplicateSessionException exception("dup");

  EXPECT_EQ(exception.sessionId(), "dup");
  EXPECT_EQ(exception.code(), ErrorCode::ServerError);
}

TEST_F(ErrorTest, OutputSchemaExceptionListsViolations) {
  json violations = json::array({{{"path", "/unit"}, {"message", "bad"}}});
  OutputSchemaException exception("get_city_weather", violations);

  EXPECT_EQ(exception.code(), ErrorCode::InternalError);
  EXPECT_EQ(exception.error().data["tool"], "get_city_weather");
  EXPECT_EQ(exception.error().data["violations"], violations);
}

TEST_F(ErrorTest, CreateErrorResponseFromException) {
  auto exception = ProtocolException::sessionNotFound("s1");
  JSONRPCError error =
      createErrorResponse(RequestId{std::int64_t{7}}, exception);

  json j = error;
  EXPECT_EQ(j["jsonrpc"], "2.0");
  EXPECT_EQ(j["id"], 7);
  EXPECT_EQ(j["error"]["code"], -32001);
  EXPECT_EQ(j["error"]["data"]["sessionId"], "s1");
}

TEST_F(ErrorTest, UncorrelatedErrorSerializesNullId) {
  JSONRPCError error = createErrorResponse(
      std::nullopt, ErrorCode::ServerError, "Internal Server Error");

  json j = error;
  EXPECT_TRUE(j.contains("id"));
  EXPECT_TRUE(j["id"].is_null());
  EXPECT_EQ(j["error"]["code"], -32000);
  EXPECT_EQ(j["error"]["message"], "Internal Server Error");
  EXPECT_FALSE(j["error"].contains("data"));
}

TEST_F(ErrorTest, HttpStatusForErrorCodes) {
  EXPECT_EQ(transport::statusForError(ErrorCode::InvalidRequest), 400);
  EXPECT_EQ(transport::statusForError(ErrorCode::ParseError), 400);
  EXPECT_EQ(transport::statusForError(ErrorCode::SessionNotFound), 404);
  EXPECT_EQ(transport::statusForError(ErrorCode::ServerError), 500);
  EXPECT_EQ(transport::statusForError(ErrorCode::InternalError), 500);
}

TEST_F(ErrorTest, ErrorReplyUsesMappedStatus) {
  auto reply = transport::errorReply(createErrorResponse(
      RequestId{std::string("req-1")},
      ProtocolException::malformedRequest("nope")));

  EXPECT_EQ(reply.status, 400);
  EXPECT_EQ(reply.content_type, "application/json");
  json body = json::parse(reply.body);
  EXPECT_EQ(body["id"], "req-1");
  EXPECT_EQ(body["error"]["code"], -32600);
}

TEST_F(ErrorTest, ErrorReplyToleratesInvalidUtf8InSessionId) {
  transport::HttpReply reply;
  ASSERT_NO_THROW(reply = transport::errorReply(createErrorResponse(
                      std::nullopt, ProtocolException::sessionNotFound(
                                        "abc\xff"))));

  EXPECT_EQ(reply.status, 404);
  json body = json::parse(reply.body);
  EXPECT_EQ(body["error"]["code"], -32001);
  EXPECT_EQ(body["error"]["data"]["sessionId"], "abc\xEF\xBF\xBD");
}
