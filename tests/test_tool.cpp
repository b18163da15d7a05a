#include <gtest/gtest.h>

#include <stdexcept>

#include "agentwire/tool/tool.hpp"

using namespace agentwire;

namespace {

std::shared_ptr<FunctionTool> make_read_tool() {
  return std::make_shared<FunctionTool>("read", "Read a file",
                                        std::vector<ParameterSchema>{{"path", "string", "File to read", true, std::nullopt, std::nullopt},
                                                                     {"limit", "integer", "Max lines", false, json(100), std::nullopt}},
                                        [](const json& args) { return ToolOutcome::success("contents of " + args["path"].get<std::string>()); });
}

}  // namespace

TEST(ToolTest, RegisterAndGet) {
  ToolRegistry registry;
  registry.register_tool(make_read_tool());

  auto read = registry.get("read");
  ASSERT_NE(read, nullptr);
  EXPECT_EQ(read->id(), "read");
  EXPECT_EQ(registry.get("write"), nullptr);

  registry.unregister_tool("read");
  EXPECT_EQ(registry.get("read"), nullptr);
}

TEST(ToolTest, JsonSchema) {
  auto schema = make_read_tool()->to_json_schema();
  EXPECT_EQ(schema["type"], "object");
  EXPECT_EQ(schema["properties"]["path"]["type"], "string");
  EXPECT_EQ(schema["properties"]["limit"]["default"], 100);
  ASSERT_EQ(schema["required"].size(), 1u);
  EXPECT_EQ(schema["required"][0], "path");
}

TEST(ToolTest, DeclarationsSortedByName) {
  ToolRegistry registry;
  registry.register_tool(make_read_tool());
  registry.register_tool(std::make_shared<FunctionTool>("grep", "Search", std::vector<ParameterSchema>{},
                                                        [](const json&) { return ToolOutcome::success(json::array()); }));

  auto decls = registry.declarations();
  ASSERT_EQ(decls.size(), 2u);
  EXPECT_EQ(decls[0].name, "grep");
  EXPECT_EQ(decls[1].name, "read");
  EXPECT_EQ(decls[1].description, "Read a file");
}

TEST(ToolTest, ExecuteSuccess) {
  ToolRegistry registry;
  registry.register_tool(make_read_tool());

  auto outcome = registry.execute("read", {{"path", "a.txt"}});
  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.output_text(), "contents of a.txt");
}

TEST(ToolTest, UnknownToolIsNonFatalFailure) {
  ToolRegistry registry;
  auto outcome = registry.execute("missing", json::object());
  ASSERT_FALSE(outcome.ok());
  EXPECT_FALSE(outcome.error->fatal);
  EXPECT_NE(outcome.output_text().find("missing"), std::string::npos);
}

TEST(ToolTest, MissingRequiredParameter) {
  ToolRegistry registry;
  registry.register_tool(make_read_tool());

  auto outcome = registry.execute("read", {{"limit", 3}});
  ASSERT_FALSE(outcome.ok());
  EXPECT_NE(outcome.error->message.find("path"), std::string::npos);
}

TEST(ToolTest, ExceptionBecomesErrorResult) {
  ToolRegistry registry;
  registry.register_tool(std::make_shared<FunctionTool>("explode", "Always throws", std::vector<ParameterSchema>{},
                                                        [](const json&) -> ToolOutcome { throw std::runtime_error("disk on fire"); }));

  auto outcome = registry.execute("explode", json::object());
  ASSERT_FALSE(outcome.ok());
  EXPECT_FALSE(outcome.error->fatal);
  EXPECT_NE(outcome.output_text().find("disk on fire"), std::string::npos);
}

TEST(ToolTest, StructuredOutputIsSerialized) {
  auto outcome = ToolOutcome::success({{"lines", 3}});
  EXPECT_EQ(outcome.output_text(), R"({"lines":3})");
  EXPECT_EQ(ToolOutcome::success(nullptr).output_text(), "");
}

// --- Utf8Test ---

TEST(Utf8Test, ValidTextUntouched) {
  std::string text = "plain ascii, caf\xC3\xA9, \xE2\x82\xAC, \xF0\x9F\x98\x80";
  EXPECT_EQ(sanitize_utf8(text), text);
}

TEST(Utf8Test, InvalidBytesReplaced) {
  EXPECT_EQ(sanitize_utf8("a\xFFz"), "a\xEF\xBF\xBDz");
  // Truncated two-byte sequence
  EXPECT_EQ(sanitize_utf8("x\xC3"), "x\xEF\xBF\xBD");
  // Overlong encoding of '/'
  EXPECT_EQ(sanitize_utf8("\xC0\xAF"), "\xEF\xBF\xBD\xEF\xBF\xBD");
}
