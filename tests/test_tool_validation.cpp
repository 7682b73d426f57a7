#include <gtest/gtest.h>
#include "mcp_types.hpp"

using namespace orchestrator;

class ToolValidationTest : public ::testing::Test {
 protected:
  void SetUp() override {
    tool.id = "t1";
    tool.parameters = {
        {"x", "string", "", true, nullptr},
        {"n", "number", "", false, nullptr},
        {"flag", "boolean", "", false, nullptr},
        {"items", "array", "", false, nullptr},
        {"opts", "object", "", false, nullptr},
    };
  }

  Tool tool;
  Error err;
};

TEST_F(ToolValidationTest, AcceptsMatchingParameters) {
  nlohmann::json params = {{"x", "hi"}, {"n", 1.5}, {"flag", true}, {"items", {1, 2}}, {"opts", {{"a", 1}}}};
  EXPECT_TRUE(ValidateParameters(tool, params, &err));
}

TEST_F(ToolValidationTest, IntegerCountsAsNumber) {
  EXPECT_TRUE(ValidateParameters(tool, {{"x", "hi"}, {"n", 3}}, &err));
}

TEST_F(ToolValidationTest, MissingRequired) {
  EXPECT_FALSE(ValidateParameters(tool, nlohmann::json::object(), &err));
  EXPECT_EQ(err.code, ErrorCode::kValidationFailed);
  EXPECT_EQ(err.message, "missing required parameter: x");
}

TEST_F(ToolValidationTest, NullParamsStillChecksRequired) {
  EXPECT_FALSE(ValidateParameters(tool, nullptr, &err));
  EXPECT_EQ(err.message, "missing required parameter: x");
}

TEST_F(ToolValidationTest, UnknownParameter) {
  EXPECT_FALSE(ValidateParameters(tool, {{"x", "hi"}, {"zzz", 1}}, &err));
  EXPECT_EQ(err.message, "unknown parameter: zzz");
}

TEST_F(ToolValidationTest, WrongType) {
  EXPECT_FALSE(ValidateParameters(tool, {{"x", 5}}, &err));
  EXPECT_EQ(err.message, "invalid type for parameter x: expected string, got number");
}

TEST_F(ToolValidationTest, RequiredCheckedBeforeTypes) {
  EXPECT_FALSE(ValidateParameters(tool, {{"n", "not a number"}}, &err));
  EXPECT_EQ(err.message, "missing required parameter: x");
}

TEST_F(ToolValidationTest, UnsupportedTypeTag) {
  Tool t;
  t.parameters = {{"when", "date", "", false, nullptr}};
  EXPECT_FALSE(ValidateParameters(t, {{"when", "2024-01-01"}}, &err));
  EXPECT_EQ(err.message, "invalid type for parameter when: unsupported parameter type: date");
}

TEST_F(ToolValidationTest, NonObjectParamsRejected) {
  EXPECT_FALSE(ValidateParameters(tool, nlohmann::json::array(), &err));
  EXPECT_EQ(err.code, ErrorCode::kValidationFailed);
}

TEST(TimestampTest, FormatAndParse) {
  auto ts = ParseTimestamp("2024-03-05T10:20:30.123456789Z");
  ASSERT_TRUE(ts.has_value());
  EXPECT_EQ(FormatTimestamp(*ts), "2024-03-05T10:20:30.123456789Z");
  auto offset = ParseTimestamp("2024-03-05T12:20:30+02:00");
  ASSERT_TRUE(offset.has_value());
  EXPECT_EQ(FormatTimestamp(*offset), "2024-03-05T10:20:30.000000000Z");
  EXPECT_FALSE(ParseTimestamp("yesterday").has_value());
}

TEST(ServerJsonTest, UnknownTypeRejected) {
  Server s;
  std::string why;
  EXPECT_FALSE(FromJson(nlohmann::json{{"id", "s1"}, {"type", "cloud"}}, &s, &why));
  EXPECT_FALSE(why.empty());
}
