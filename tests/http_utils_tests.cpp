#include "chunkup/transport/http.hpp"
#include "mocks/mock_transport.h"
#include <gtest/gtest.h>

using namespace chunkup::http;
using ::testing::_;
using ::testing::Return;
using ::testing::SaveArg;

TEST(HttpUtils, MethodNames) {
  EXPECT_EQ(StringToHttpMethod("POST"), HttpMethod::POST);
  EXPECT_EQ(StringToHttpMethod("PATCH"), HttpMethod::INVALID);
  EXPECT_EQ(HttpMethodToString(HttpMethod::GET), "GET");
}

TEST(HttpUtils, StatusClassification) {
  EXPECT_TRUE(IsTransientStatus(500));
  EXPECT_TRUE(IsTransientStatus(503));
  EXPECT_TRUE(IsTransientStatus(429));
  EXPECT_TRUE(IsTransientStatus(408));
  EXPECT_FALSE(IsTransientStatus(400));
  EXPECT_FALSE(IsTransientStatus(301));
  EXPECT_TRUE(IsRedirectStatus(301));
  EXPECT_TRUE(IsRedirectStatus(302));
  EXPECT_FALSE(IsRedirectStatus(307));
  EXPECT_EQ(ReasonPhrase(404), "Not Found");
  EXPECT_EQ(ReasonPhrase(599), "Unknown");
}

TEST(HttpUtils, DescribeRequest) {
  Request req;
  req.method = HttpMethod::POST;
  req.path = "chunk-upload/";
  req.body = "abcd";
  EXPECT_EQ(DescribeRequest(req), "POST chunk-upload/ (4 bytes)");
}

TEST(HttpUtils, AuthenticatedTransportAddsBearerToken) {
  MockTransport inner;
  Request seen;
  EXPECT_CALL(inner, send(_))
      .WillOnce(::testing::DoAll(SaveArg<0>(&seen), Return(makeResponse(200))));
  AuthenticatedTransport auth(inner, "secret");
  Request req;
  req.path = "chunk-upload/";
  EXPECT_TRUE(auth.send(req).isSuccess());
  EXPECT_EQ(seen.headers.at("Authorization"), "Bearer secret");
}

TEST(HttpUtils, AuthenticatedTransportKeepsExplicitHeader) {
  MockTransport inner;
  Request seen;
  EXPECT_CALL(inner, send(_))
      .WillOnce(::testing::DoAll(SaveArg<0>(&seen), Return(makeResponse(200))));
  AuthenticatedTransport auth(inner, "secret");
  Request req;
  req.headers["Authorization"] = "DSN abc";
  auth.send(req);
  EXPECT_EQ(seen.headers.at("Authorization"), "DSN abc");
}
