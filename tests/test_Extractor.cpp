#include <gtest/gtest.h>
#include "jsonrpc/Extractor.h"

TEST(ExtractorTest, FindsSingleObjectWithOffsets) {
    std::string text = "The result is {\"jsonrpc\":\"2.0\",\"method\":\"ping\",\"id\":1} - done.";
    auto objects = extractJsonRpcObjects(text);

    ASSERT_EQ(objects.size(), 1u);
    EXPECT_EQ(objects[0].start, text.find('{'));
    EXPECT_EQ(objects[0].end, text.find('}') + 1);
    EXPECT_EQ(objects[0].value["method"], "ping");
    EXPECT_EQ(objects[0].value["id"], 1);
}

TEST(ExtractorTest, FindsObjectsWithoutIdsSeparatedByProse) {
    std::string text =
        "First {\"jsonrpc\":\"2.0\",\"method\":\"a\"} then some words "
        "and {\"jsonrpc\":\"2.0\",\"method\":\"b\"} at the end.";
    auto objects = extractJsonRpcObjects(text);

    ASSERT_EQ(objects.size(), 2u);
    EXPECT_EQ(objects[0].value["method"], "a");
    EXPECT_EQ(objects[1].value["method"], "b");
    EXPECT_LT(objects[0].end, objects[1].start);
}

TEST(ExtractorTest, ReturnsObjectsInOrderWithExactSpans) {
    std::string text;
    std::vector<std::pair<size_t, size_t>> expected;
    for (int i = 0; i < 5; ++i) {
        text += "step " + std::to_string(i) + ": ";
        std::string obj = "{\"jsonrpc\":\"2.0\",\"method\":\"m" + std::to_string(i) + "\",\"id\":" + std::to_string(i) + "}";
        expected.emplace_back(text.size(), text.size() + obj.size());
        text += obj + "\n";
    }

    auto objects = extractJsonRpcObjects(text);
    ASSERT_EQ(objects.size(), expected.size());
    for (size_t i = 0; i < objects.size(); ++i) {
        EXPECT_EQ(objects[i].start, expected[i].first);
        EXPECT_EQ(objects[i].end, expected[i].second);
        EXPECT_EQ(objects[i].value["id"], static_cast<int>(i));
        EXPECT_EQ(text[objects[i].start], '{');
        EXPECT_EQ(text[objects[i].end - 1], '}');
    }
}

TEST(ExtractorTest, KeepsNestedParamsInsideOneObject) {
    std::string text = "{\"jsonrpc\":\"2.0\",\"method\":\"a\",\"params\":{\"x\":{\"y\":[1,2]}}}";
    auto objects = extractJsonRpcObjects(text);

    ASSERT_EQ(objects.size(), 1u);
    EXPECT_EQ(objects[0].start, 0u);
    EXPECT_EQ(objects[0].end, text.size());
    EXPECT_EQ(objects[0].value["params"]["x"]["y"][1], 2);
}

TEST(ExtractorTest, SkipsMalformedAndNonJsonRpcCandidates) {
    std::string text =
        "{not json at all} {\"method\":\"no_version\"} "
        "{\"jsonrpc\":\"2.0\",\"method\":\"kept\"}";
    auto objects = extractJsonRpcObjects(text);

    ASSERT_EQ(objects.size(), 1u);
    EXPECT_EQ(objects[0].value["method"], "kept");
}

TEST(ExtractorTest, StopsAtUnclosedBrace) {
    std::string text = "{\"jsonrpc\":\"2.0\",\"method\":\"a\"} and then {\"jsonrpc\":\"2.0\",";
    auto objects = extractJsonRpcObjects(text);

    ASSERT_EQ(objects.size(), 1u);
    EXPECT_EQ(objects[0].value["method"], "a");
}

TEST(ExtractorTest, PlainTextYieldsNothing) {
    EXPECT_TRUE(extractJsonRpcObjects("").empty());
    EXPECT_TRUE(extractJsonRpcObjects("no braces here").empty());
    EXPECT_TRUE(extractJsonRpcObjects("} stray closing").empty());
}

TEST(ExtractorTest, BraceInsideStringBreaksBoundary) {
    // 深度计数不识别字符串, 这里的 "}" 提前结束了候选片段
    std::string text = "{\"jsonrpc\":\"2.0\",\"method\":\"say\",\"params\":{\"text\":\"}\"}}";
    EXPECT_TRUE(extractJsonRpcObjects(text).empty());
}

TEST(ExtractorTest, SplitSeparatesProseAndObjects) {
    std::string text =
        "  Hello  {\"jsonrpc\":\"2.0\",\"method\":\"a\"}\n   \n"
        "{\"jsonrpc\":\"2.0\",\"method\":\"b\"}  world  ";
    auto split = splitJsonRpcAndText(text);

    EXPECT_EQ(split.original, text);
    ASSERT_EQ(split.textSegments.size(), 2u);
    EXPECT_EQ(split.textSegments[0], "Hello");
    EXPECT_EQ(split.textSegments[1], "world");
    ASSERT_EQ(split.jsonObjects.size(), 2u);
    EXPECT_EQ(split.jsonObjects[1]["method"], "b");
}

TEST(ExtractorTest, SplitWithoutObjectsKeepsWholeText) {
    auto split = splitJsonRpcAndText("just prose");
    ASSERT_EQ(split.textSegments.size(), 1u);
    EXPECT_EQ(split.textSegments[0], "just prose");
    EXPECT_TRUE(split.jsonObjects.empty());
}

TEST(ExtractorTest, FilterReplacesOnlyToolCalls) {
    std::string toolCall =
        "{\"jsonrpc\":\"2.0\",\"method\":\"mcp.tool_call\",\"params\":{\"name\":\"shell\",\"parameters\":{}},\"id\":\"1\"}";
    std::string other = "{\"jsonrpc\":\"2.0\",\"result\":\"ok\",\"id\":2}";
    std::string text = "Run " + toolCall + " now, keep " + other;

    std::string filtered = filterToolCalls(text);
    EXPECT_EQ(filtered, "Run [Tool command detected and executed] now, keep " + other);
    EXPECT_EQ(filterToolCalls(text, "<call>"), "Run <call> now, keep " + other);
    EXPECT_EQ(filterToolCalls("nothing to filter"), "nothing to filter");
}
