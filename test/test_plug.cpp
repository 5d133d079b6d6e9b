#include <gtest/gtest.h>

#include <keycase/core.h>
#include <keycase/plug/SnakeCaseParams.h>

using namespace keycase;
using namespace keycase::plug;

namespace {

Request make_request(const Value& params) {
    Request request;
    request.method = "POST";
    request.path = "/users";
    request.params = params;
    return request;
}

} // namespace

TEST(SnakeCaseParams, NestedParams) {
  auto request = make_request(Map{{"userInfo", Map{{"firstName", "John"}, {"lastName", "Doe"}}}});
  auto result = SnakeCaseParams{}.call(request);
  EXPECT_EQ(result.params, (Value{Map{{"user_info", Map{{"first_name", "John"}, {"last_name", "Doe"}}}}}));
}

TEST(SnakeCaseParams, ListOfMaps) {
  auto request = make_request(Map{{"userPosts", List{Map{{"postTitle", "Hello"}}, Map{{"postTitle", "Bye"}}}}});
  auto result = SnakeCaseParams{}.call(request);
  Value expect = Map{{"user_posts", List{Map{{"post_title", "Hello"}}, Map{{"post_title", "Bye"}}}}};
  EXPECT_EQ(result.params, expect);
}

TEST(SnakeCaseParams, AcronymKeys) {
  auto result = SnakeCaseParams{}.call(make_request(Map{{"APIResponse", 1}, {"userID", 2}}));
  EXPECT_EQ(result.params, (Value{Map{{"api_response", 1}, {"user_id", 2}}}));
}

TEST(SnakeCaseParams, OtherFieldsUntouched) {
  Request request = make_request(Map{{"userId", 1}});
  request.query_params = Map{{"pageSize", 10}};
  request.body_params = Map{{"userId", 1}};

  auto result = SnakeCaseParams{}.call(request);
  EXPECT_EQ(result.method, "POST");
  EXPECT_EQ(result.path, "/users");
  EXPECT_EQ(result.query_params, (Value{Map{{"pageSize", 10}}}));
  EXPECT_EQ(result.body_params, (Value{Map{{"userId", 1}}}));
  EXPECT_EQ(result.params, (Value{Map{{"user_id", 1}}}));
}

TEST(SnakeCaseParams, UploadKept) {
  Value upload = make_record<Upload>("/tmp/plug-1", "image/png", "avatar.png");
  auto result = SnakeCaseParams{}.call(make_request(Map{{"profilePhoto", upload}}));
  EXPECT_TRUE(result.params.get("profile_photo").is(upload));
}

TEST(SnakeCaseParams, NonMapParams) {
  EXPECT_EQ(SnakeCaseParams{}.call(make_request(nil)).params, nil);
  EXPECT_EQ(SnakeCaseParams{}.call(make_request("rawBody")).params, "rawBody");
  EXPECT_EQ(SnakeCaseParams{}.call(make_request(List{Map{{"aB", 1}}})).params, (Value{List{Map{{"a_b", 1}}}}));
}

TEST(SnakeCaseParams, AlreadySnakeCase) {
  Value params = Map{{"user_id", 1}, {"tags", List{"a", "b"}}};
  EXPECT_EQ(SnakeCaseParams{}.call(make_request(params)).params, params);
}

TEST(SnakeCaseParams, CallOperator) {
  SnakeCaseParams plug;
  auto request = make_request(Map{{"userId"_sym, 1}});
  EXPECT_EQ(plug(request).params, plug.call(request).params);
  EXPECT_EQ(plug(request).params.get("user_id"_sym), 1);
}
