#include <gtest/gtest.h>

#include <keycase/core.h>
#include <keycase/json/encoder.h>

#include <cmath>
#include <limits>
#include <sstream>

using namespace keycase;
using namespace keycase::json;

TEST(Encode, SimpleMap) {
  EXPECT_EQ(encode(Map{{"user_name", "John"}, {"user_age", 30}}), R"({"userName":"John","userAge":30})");
}

TEST(Encode, SymbolAndTextKeysEncodeTheSame) {
  auto with_text = encode(Map{{"user_name", "John"}, {"user_age", 30}});
  auto with_symbols = encode(Map{{"user_name"_sym, "John"}, {"user_age"_sym, 30}});
  EXPECT_EQ(with_text, with_symbols);
}

TEST(Encode, NestedMaps) {
  Value input = Map{{"user_info", Map{{"first_name", "John"}, {"last_name", "Doe"}}}};
  EXPECT_EQ(encode(input), R"({"userInfo":{"firstName":"John","lastName":"Doe"}})");
}

TEST(Encode, ListOfMaps) {
  Value input = Map{{"users", List{Map{{"user_id", 1}, {"user_name", "John"}},
                                   Map{{"user_id", 2}, {"user_name", "Jane"}}}}};
  EXPECT_EQ(encode(input), R"({"users":[{"userId":1,"userName":"John"},{"userId":2,"userName":"Jane"}]})");
}

TEST(Encode, MixedKeyStyles) {
  Value input = Map{{"userName", "John"}, {"user_age", 30}, {"home_Address", "x"}};
  EXPECT_EQ(encode(input), R"({"userName":"John","userAge":30,"homeAddress":"x"})");
}

TEST(Encode, ValuesAreNotConverted) {
  EXPECT_EQ(encode(Map{{"status", "in_progress"}}), R"({"status":"in_progress"})");
  EXPECT_EQ(encode(Map{{"status", Value::symbol("in_progress")}}), R"({"status":"in_progress"})");
}

TEST(Encode, Dates) {
  Value input = Map{
      {"birth_date", make_record<Date>(2025, 3, 23)},
      {"start_time", make_record<Time>(10, 30, 0, 123)},
      {"created_at", make_record<NaiveDateTime>(Date{2025, 3, 23}, Time{10, 30, 0})},
      {"updated_at", make_record<DateTime>(Date{2025, 3, 23}, Time{10, 30, 0})},
      {"local_at", make_record<DateTime>(Date{2025, 3, 23}, Time{10, 30, 0}, "America/New_York", -5 * 3600)}
  };
  EXPECT_EQ(encode(input), R"({"birthDate":"2025-03-23",)"
                           R"("startTime":"10:30:00.000123",)"
                           R"("createdAt":"2025-03-23T10:30:00",)"
                           R"("updatedAt":"2025-03-23T10:30:00Z",)"
                           R"("localAt":"2025-03-23T10:30:00-05:00"})");
}

TEST(Encode, UploadHasNoJson) {
  Value input = Map{{"document", make_record<Upload>("/tmp/a", "text/plain", "a.txt")}};
  EXPECT_THROW(encode(input), EncodeError);
}

TEST(Encode, ConnectionHasNoJson) {
  EXPECT_THROW(encode(make_record<Connection>("test")), EncodeError);
}

TEST(Encode, NonFiniteFloat) {
  EXPECT_THROW(encode(Map{{"ratio", std::numeric_limits<Float>::quiet_NaN()}}), EncodeError);
  EXPECT_THROW(encode(List{std::numeric_limits<Float>::infinity()}), EncodeError);
}

TEST(Encode, EncodeErrorIsKeycaseException) {
  try {
    encode(make_record<Upload>("/tmp/a", "text/plain", "a.txt"));
    FAIL();
  } catch (const KeycaseException& e) {
    EXPECT_NE(std::string{e.what()}.find("Upload"), std::string::npos);
  }
}

TEST(Encode, EmptyContainers) {
  EXPECT_EQ(encode(Map{}), "{}");
  EXPECT_EQ(encode(List{}), "[]");
  EXPECT_EQ(encode(Map{{"empty_list", List{}}, {"empty_map", Map{}}}), R"({"emptyList":[],"emptyMap":{}})");
}

TEST(Encode, Stream) {
  std::ostringstream ss;
  encode(ss, Map{{"user_id", 1}});
  EXPECT_EQ(ss.str(), R"({"userId":1})");
}

TEST(Encode, Pretty) {
  Value input = Map{{"user_name", "John"}, {"tag_ids", List{1, 2}}, {"meta_data", Map{}}};
  auto expect = "{\n"
                "  \"userName\": \"John\",\n"
                "  \"tagIds\": [\n"
                "    1,\n"
                "    2\n"
                "  ],\n"
                "  \"metaData\": {}\n"
                "}";
  EXPECT_EQ(encode(input, EncodeOptions{.pretty = true}), expect);
}

TEST(Encode, PrettyIndent) {
  auto expect = "{\n"
                "    \"userId\": 1\n"
                "}";
  EXPECT_EQ(encode(Map{{"user_id", 1}}, EncodeOptions{.pretty = true, .indent = 4}), expect);
}

TEST(ToJson, KeysNotConverted) {
  EXPECT_EQ(to_json(Map{{"user_id", 1}, {"userName", 2}}), R"({"user_id":1,"userName":2})");
}

TEST(ToJson, Scalars) {
  EXPECT_EQ(to_json(nil), "null");
  EXPECT_EQ(to_json(true), "true");
  EXPECT_EQ(to_json(false), "false");
  EXPECT_EQ(to_json(-3), "-3");
  EXPECT_EQ(to_json(std::numeric_limits<UInt>::max()), "18446744073709551615");
  EXPECT_EQ(to_json(1.5), "1.5");
  EXPECT_EQ(to_json(2.0), "2.0");
  EXPECT_EQ(to_json(Value::symbol("ok")), R"("ok")");
  EXPECT_EQ(to_json(make_record<Date>(2024, 1, 5)), R"("2024-01-05")");
}

TEST(ToJson, NonStringKeys) {
  EXPECT_EQ(to_json(Map{{1, "a"}, {true, "b"}, {nil, "c"}}), R"({"1":"a","true":"b","nil":"c"})");
}

TEST(ToJson, Escape) {
  EXPECT_EQ(to_json("a\"b\\c\nd\te\x01"), R"("a\"b\\c\nd\te\u0001")");
  EXPECT_EQ(to_json(Map{{"quo\"te", 1}}), R"({"quo\"te":1})");
}

TEST(ToJson, Utf8PassesThrough) {
  EXPECT_EQ(to_json("caf\xc3\xa9"), "\"caf\xc3\xa9\"");
}

TEST(ToJson, ShortestRoundTripFloat) {
  EXPECT_EQ(to_json(0.1 + 0.2), "0.30000000000000004");
  EXPECT_EQ(to_json(0.1), "0.1");
  EXPECT_EQ(to_json(1e20), "1e+20");
  EXPECT_EQ(to_json(-0.5), "-0.5");
}

TEST(ToJson, InvalidUtf8) {
  EXPECT_THROW(to_json("\xff"), EncodeError);
  EXPECT_THROW(to_json("caf\xc3"), EncodeError);
  EXPECT_THROW(to_json("\xc0\xaf"), EncodeError);
  EXPECT_THROW(to_json("\xed\xa0\x80"), EncodeError);
  EXPECT_THROW(to_json(Map{{"bad\xfekey", 1}}), EncodeError);
  EXPECT_THROW(encode(Map{{"user_name", "\x80"}}), EncodeError);
}

TEST(ToJson, ValidUtf8) {
  EXPECT_EQ(to_json("\xe2\x82\xac"), "\"\xe2\x82\xac\"");
  EXPECT_EQ(to_json("\xf0\x9f\x98\x80"), "\"\xf0\x9f\x98\x80\"");
}
