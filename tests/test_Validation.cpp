#include <gtest/gtest.h>
#include "protocol/Validation.h"

using Kind = LlmResponseClassification::Kind;

TEST(ValidationTest, WholeObjectIsValid) {
    auto c = classifyLlmResponse("  \n{\"jsonrpc\":\"2.0\",\"result\":\"hi\",\"id\":1}\n ");
    EXPECT_EQ(c.kind, Kind::Valid);
    ASSERT_TRUE(c.json.has_value());
    EXPECT_EQ((*c.json)["result"], "hi");
    EXPECT_EQ(createCorrectionPrompt(c), "");
}

TEST(ValidationTest, ProseWithObjectIsMixed) {
    auto c = classifyLlmResponse(
        "Sure, let me check.  {\"jsonrpc\":\"2.0\",\"method\":\"mcp.tool_call\","
        "\"params\":{\"name\":\"shell\",\"parameters\":{}},\"id\":\"1\"}");
    EXPECT_EQ(c.kind, Kind::Mixed);
    EXPECT_EQ(c.text, "Sure, let me check.");
    ASSERT_TRUE(c.json.has_value());
    EXPECT_EQ((*c.json)["method"], "mcp.tool_call");

    std::string prompt = createCorrectionPrompt(c);
    EXPECT_NE(prompt.find("mixed regular text"), std::string::npos);
    EXPECT_NE(prompt.find("Sure, let me check."), std::string::npos);
}

TEST(ValidationTest, ProseWithBrokenBracesIsMixed) {
    auto c = classifyLlmResponse("here is {something} odd");
    EXPECT_EQ(c.kind, Kind::Mixed);
    EXPECT_EQ(c.text, "here is {something} odd");
    EXPECT_FALSE(c.json.has_value());
}

TEST(ValidationTest, TwoObjectsAreMultiple) {
    auto c = classifyLlmResponse(
        "{\"jsonrpc\":\"2.0\",\"method\":\"a\",\"id\":1}{\"jsonrpc\":\"2.0\",\"method\":\"b\",\"id\":2}");
    EXPECT_EQ(c.kind, Kind::MultipleJsonRpc);
    ASSERT_EQ(c.objects.size(), 2u);
    EXPECT_NE(createCorrectionPrompt(c).find("multiple JSON-RPC objects (2)"), std::string::npos);
}

TEST(ValidationTest, PlainJsonIsNotJsonRpc) {
    auto c = classifyLlmResponse("{\"answer\": 42}");
    EXPECT_EQ(c.kind, Kind::NotJsonRpc);
    ASSERT_TRUE(c.json.has_value());
    EXPECT_EQ((*c.json)["answer"], 42);
    EXPECT_NE(createCorrectionPrompt(c).find("not a valid JSON-RPC 2.0 object"), std::string::npos);
}

TEST(ValidationTest, PlainTextIsInvalidFormat) {
    auto c = classifyLlmResponse("I think the answer is yes.");
    EXPECT_EQ(c.kind, Kind::InvalidFormat);
    EXPECT_EQ(c.text, "I think the answer is yes.");
}

TEST(ValidationTest, CorrectionPromptTruncatesLongContent) {
    std::string longText(500, 'x');
    auto c = classifyLlmResponse(longText);
    std::string prompt = createCorrectionPrompt(c);
    EXPECT_NE(prompt.find(std::string(200, 'x') + "...\" (truncated)"), std::string::npos);
    EXPECT_EQ(prompt.find(std::string(201, 'x')), std::string::npos);
}

TEST(ValidationTest, SchemaChecksTypeAndRequired) {
    nlohmann::json schema = {
        {"type", "object"},
        {"properties", {{"key", {{"type", "string"}}}}},
        {"required", nlohmann::json::array({"key"})}
    };

    EXPECT_FALSE(validateAgainstSchema({{"key", "a"}}, schema).has_value());

    auto missing = validateAgainstSchema(nlohmann::json::object(), schema);
    ASSERT_TRUE(missing.has_value());
    EXPECT_EQ(missing->code, -32602);

    auto wrongType = validateAgainstSchema(nlohmann::json::array(), schema);
    ASSERT_TRUE(wrongType.has_value());
    EXPECT_EQ(wrongType->code, -32602);

    EXPECT_TRUE(validateAgainstSchema(1.5, {{"type", "integer"}}).has_value());
    EXPECT_FALSE(validateAgainstSchema(3, {{"type", "number"}}).has_value());
    EXPECT_FALSE(validateAgainstSchema("anything", nlohmann::json::object()).has_value());
}
