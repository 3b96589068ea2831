#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>

#include "mcp/dispatcher.hpp"

using namespace ctxmgr;
using namespace ctxmgr::mcp;
using namespace ctxmgr::skill;
using ctxmgr::tool::Schema;

namespace {

std::future<json> ready(json value) {
  std::promise<json> p;
  p.set_value(std::move(value));
  return p.get_future();
}

Skill make_chat() {
  Skill s;
  s.id = "chat";
  s.name = "Chat";
  s.description = "Chat test skill";
  s.version = "1.0.0";
  s.tools.push_back({{"echo", "Echo", Schema::object({{"message", Schema::string()}})}, [](const json& input) {
                       return ready(json("Echo: " + input["message"].get<std::string>()));
                     }});
  s.tools.push_back({{"explode", "Always fails"}, [](const json&) -> std::future<json> {
                       throw std::runtime_error("kaboom");
                     }});
  s.tools.push_back({{"throw_int", "Throws an int"}, [](const json&) -> std::future<json> {
                       throw 42;
                     }});
  s.tools.push_back({{"async_str", "Fails asynchronously with a string"}, [](const json&) {
                       return std::async(std::launch::async, []() -> json {
                         throw std::string("nope");
                       });
                     }});
  return s;
}

Skill make_slow() {
  Skill s;
  s.id = "slow";
  s.name = "Slow";
  s.description = "Slow test skill";
  s.version = "1.0.0";
  s.tools.push_back({{"wait", "Waits briefly"}, [](const json&) {
                       return std::async(std::launch::async, []() -> json {
                         std::this_thread::sleep_for(std::chrono::milliseconds(30));
                         return "waited";
                       });
                     }});
  return s;
}

}  // namespace

// ============================================================
// DispatcherTest
// ============================================================

class DispatcherTest : public ::testing::Test {
 protected:
  void SetUp() override {
    registry_.register_skill(make_chat());
  }

  json handle(const std::string& line) {
    return dispatcher_.handle_line(line).get().to_json();
  }

  json handle_json(const json& message) {
    return dispatcher_.handle_message(message).get().to_json();
  }

  SkillRegistry registry_;
  Dispatcher dispatcher_{registry_, ServerInfo{"test-server", "9.9.9", "2024-11-05"}};
};

TEST_F(DispatcherTest, Initialize) {
  EXPECT_EQ(dispatcher_.state(), DispatcherState::Uninitialized);

  auto resp = handle(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})");

  EXPECT_EQ(resp["jsonrpc"], "2.0");
  EXPECT_EQ(resp["id"], 1);
  EXPECT_FALSE(resp.contains("error"));
  EXPECT_EQ(resp["result"]["protocolVersion"], "2024-11-05");
  EXPECT_TRUE(resp["result"]["capabilities"]["tools"].is_object());
  EXPECT_EQ(resp["result"]["serverInfo"]["name"], "test-server");
  EXPECT_EQ(resp["result"]["serverInfo"]["version"], "9.9.9");
  EXPECT_EQ(dispatcher_.state(), DispatcherState::Ready);
}

TEST_F(DispatcherTest, RepeatedInitializeStaysReady) {
  handle(R"({"jsonrpc":"2.0","id":1,"method":"initialize"})");
  auto resp = handle(R"({"jsonrpc":"2.0","id":2,"method":"initialize"})");

  EXPECT_EQ(resp["id"], 2);
  EXPECT_TRUE(resp.contains("result"));
  EXPECT_EQ(dispatcher_.state(), DispatcherState::Ready);
}

TEST_F(DispatcherTest, RequestsServedBeforeInitialize) {
  auto resp = handle(R"({"jsonrpc":"2.0","id":3,"method":"tools/list"})");

  EXPECT_TRUE(resp.contains("result"));
  EXPECT_EQ(dispatcher_.state(), DispatcherState::Uninitialized);
}

TEST_F(DispatcherTest, ToolsList) {
  auto resp = handle(R"({"jsonrpc":"2.0","id":"list","method":"tools/list"})");

  EXPECT_EQ(resp["id"], "list");
  auto tools = resp["result"]["tools"];
  ASSERT_EQ(tools.size(), 4u);
  EXPECT_EQ(tools[0]["name"], "echo");
  EXPECT_EQ(tools[0]["description"], "Echo");
  EXPECT_EQ(tools[0]["inputSchema"]["type"], "object");
  EXPECT_EQ(tools[1]["name"], "explode");
}

TEST_F(DispatcherTest, ToolsCallEcho) {
  auto resp = handle(R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"echo","arguments":{"message":"hi"}}})");

  EXPECT_EQ(resp["id"], 2);
  ASSERT_TRUE(resp.contains("result"));
  EXPECT_EQ(resp["result"]["content"][0]["type"], "text");
  EXPECT_EQ(resp["result"]["content"][0]["text"], "Echo: hi");
  EXPECT_FALSE(resp["result"].contains("isError"));
}

TEST_F(DispatcherTest, ToolsCallHandlerThrowIsToolResult) {
  auto resp = handle(R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"explode"}})");

  // 处理器异常以 isError 结果返回，而非 JSON-RPC 错误
  ASSERT_TRUE(resp.contains("result"));
  EXPECT_FALSE(resp.contains("error"));
  EXPECT_EQ(resp["result"]["isError"], true);
  EXPECT_EQ(resp["result"]["content"][0]["text"], "Error: kaboom");
}

TEST_F(DispatcherTest, ToolsCallNonExceptionThrowIsToolResult) {
  auto sync = handle(R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"throw_int"}})");
  auto async = handle(R"({"jsonrpc":"2.0","id":8,"method":"tools/call","params":{"name":"async_str"}})");

  // 任何抛出值都不会变成 -32603
  for (const auto& resp : {sync, async}) {
    ASSERT_TRUE(resp.contains("result"));
    EXPECT_FALSE(resp.contains("error"));
    EXPECT_EQ(resp["result"]["isError"], true);
    EXPECT_EQ(resp["result"]["content"][0]["text"], "Error: unknown error");
  }
  EXPECT_EQ(sync["id"], 7);
  EXPECT_EQ(async["id"], 8);
}

TEST_F(DispatcherTest, ToolsCallSchemaViolationIsToolResult) {
  auto resp = handle(R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":{"name":"echo","arguments":{}}})");

  ASSERT_TRUE(resp.contains("result"));
  EXPECT_EQ(resp["result"]["isError"], true);
  EXPECT_EQ(resp["result"]["content"][0]["text"], "Error: Invalid input at 'message': Required");
}

TEST_F(DispatcherTest, ToolsCallNullArgumentsDefaultToEmpty) {
  auto resp = handle(R"({"jsonrpc":"2.0","id":6,"method":"tools/call","params":{"name":"explode","arguments":null}})");

  EXPECT_EQ(resp["result"]["content"][0]["text"], "Error: kaboom");
}

TEST_F(DispatcherTest, ToolsCallUnknownToolListsAvailable) {
  auto resp = handle(R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"nope"}})");

  EXPECT_EQ(resp["id"], 7);
  ASSERT_TRUE(resp.contains("error"));
  EXPECT_EQ(resp["error"]["code"], -32602);
  EXPECT_EQ(resp["error"]["message"], "Invalid params: unknown tool 'nope'. Available tools: echo, explode, throw_int, async_str");
  EXPECT_EQ(resp["error"]["data"]["availableTools"], json::array({"echo", "explode", "throw_int", "async_str"}));
}

TEST_F(DispatcherTest, ToolsCallMissingName) {
  auto resp = handle(R"({"jsonrpc":"2.0","id":8,"method":"tools/call","params":{}})");

  EXPECT_EQ(resp["error"]["code"], -32602);
  EXPECT_EQ(resp["error"]["message"], "Invalid params: tool name is required");
}

TEST_F(DispatcherTest, ToolsRegisteredLaterAreCallable) {
  registry_.register_skill(make_slow());

  auto resp = handle(R"({"jsonrpc":"2.0","id":9,"method":"tools/call","params":{"name":"wait"}})");

  EXPECT_EQ(resp["result"]["content"][0]["text"], "waited");
}

TEST_F(DispatcherTest, ToolsCallIsDeferredWhileOthersAreReady) {
  registry_.register_skill(make_slow());

  auto slow = dispatcher_.handle_line(R"({"jsonrpc":"2.0","id":10,"method":"tools/call","params":{"name":"wait"}})");
  auto fast = dispatcher_.handle_line(R"({"jsonrpc":"2.0","id":11,"method":"tools/list"})");

  EXPECT_EQ(fast.wait_for(std::chrono::seconds(0)), std::future_status::ready);
  EXPECT_NE(slow.wait_for(std::chrono::seconds(0)), std::future_status::ready);
  EXPECT_EQ(slow.get().id, 10);
}

// ============================================================
// Protocol errors
// ============================================================

TEST_F(DispatcherTest, ParseError) {
  auto resp = handle("{not json");

  EXPECT_TRUE(resp["id"].is_null());
  EXPECT_EQ(resp["error"]["code"], -32700);
  EXPECT_EQ(resp["error"]["message"], "Parse error");
  EXPECT_TRUE(resp["error"]["data"].is_string());
}

TEST_F(DispatcherTest, ParseErrorDoesNotAffectNextLine) {
  handle("garbage");
  auto resp = handle(R"({"jsonrpc":"2.0","id":12,"method":"initialize"})");

  EXPECT_EQ(resp["id"], 12);
  EXPECT_TRUE(resp.contains("result"));
}

TEST_F(DispatcherTest, WrongJsonRpcVersion) {
  auto resp = handle(R"({"jsonrpc":"1.0","id":1,"method":"initialize"})");

  EXPECT_EQ(resp["id"], 1);
  EXPECT_EQ(resp["error"]["code"], -32600);
  EXPECT_EQ(resp["error"]["message"], "Invalid Request: jsonrpc must be '2.0'");
}

TEST_F(DispatcherTest, MissingMethod) {
  auto resp = handle(R"({"jsonrpc":"2.0","id":13})");

  EXPECT_EQ(resp["id"], 13);
  EXPECT_EQ(resp["error"]["code"], -32600);
  EXPECT_EQ(resp["error"]["message"], "Invalid Request: method is required and must be a string");
}

TEST_F(DispatcherTest, NonObjectMessage) {
  auto resp = handle("[1,2,3]");

  EXPECT_TRUE(resp["id"].is_null());
  EXPECT_EQ(resp["error"]["code"], -32600);
}

TEST_F(DispatcherTest, InvalidIdType) {
  auto resp = handle(R"({"jsonrpc":"2.0","id":{"x":1},"method":"initialize"})");

  EXPECT_TRUE(resp["id"].is_null());
  EXPECT_EQ(resp["error"]["code"], -32600);
}

TEST_F(DispatcherTest, UnknownMethod) {
  auto resp = handle(R"({"jsonrpc":"2.0","id":14,"method":"resources/list"})");

  EXPECT_EQ(resp["id"], 14);
  EXPECT_EQ(resp["error"]["code"], -32601);
  EXPECT_EQ(resp["error"]["message"], "Method not found: resources/list. Supported methods: initialize, tools/list, tools/call");
}

// ============================================================
// Id echo
// ============================================================

TEST_F(DispatcherTest, EchoesZeroId) {
  auto resp = handle(R"({"jsonrpc":"2.0","id":0,"method":"tools/list"})");

  ASSERT_TRUE(resp["id"].is_number());
  EXPECT_EQ(resp["id"], 0);
}

TEST_F(DispatcherTest, EchoesStringId) {
  auto resp = handle(R"({"jsonrpc":"2.0","id":"string-id","method":"tools/list"})");

  EXPECT_EQ(resp["id"], "string-id");
}

TEST_F(DispatcherTest, EchoesNullId) {
  auto resp = handle(R"({"jsonrpc":"2.0","id":null,"method":"tools/list"})");

  EXPECT_TRUE(resp.contains("id"));
  EXPECT_TRUE(resp["id"].is_null());
  EXPECT_TRUE(resp.contains("result"));
}

TEST_F(DispatcherTest, NotificationStillAnswered) {
  auto resp = handle(R"({"jsonrpc":"2.0","method":"tools/list"})");

  EXPECT_TRUE(resp["id"].is_null());
  EXPECT_TRUE(resp.contains("result"));
}

TEST_F(DispatcherTest, HandleMessageDirect) {
  auto resp = handle_json(json{{"jsonrpc", "2.0"}, {"id", 15}, {"method", "initialize"}});

  EXPECT_EQ(resp["id"], 15);
  EXPECT_TRUE(resp.contains("result"));
}

TEST(DispatcherStateTest, Names) {
  EXPECT_EQ(to_string(DispatcherState::Uninitialized), "Uninitialized");
  EXPECT_EQ(to_string(DispatcherState::Ready), "Ready");
}

// ============================================================
// JsonRpcResponseTest
// ============================================================

TEST(JsonRpcResponseTest, SuccessSerialization) {
  auto resp = JsonRpcResponse::success(1, json{{"ok", true}});
  auto line = resp.serialize();

  EXPECT_EQ(line.find('\n'), std::string::npos);
  auto j = json::parse(line);
  EXPECT_EQ(j["jsonrpc"], "2.0");
  EXPECT_EQ(j["id"], 1);
  EXPECT_EQ(j["result"]["ok"], true);
  EXPECT_FALSE(j.contains("error"));
}

TEST(JsonRpcResponseTest, FailureSerialization) {
  auto resp = JsonRpcResponse::failure("abc", ErrorCode::MethodNotFound, "Method not found: x");
  auto j = resp.to_json();

  EXPECT_FALSE(resp.ok());
  EXPECT_EQ(j["id"], "abc");
  EXPECT_EQ(j["error"]["code"], -32601);
  EXPECT_FALSE(j["error"].contains("data"));
  EXPECT_FALSE(j.contains("result"));
}

TEST(JsonRpcResponseTest, InvalidUtf8Replaced) {
  auto resp = JsonRpcResponse::success(1, json("bad \xff byte"));

  EXPECT_NO_THROW(resp.serialize());
}

TEST(JsonRpcResponseTest, ErrorCodeNames) {
  EXPECT_EQ(to_string(ErrorCode::ParseError), "Parse error");
  EXPECT_EQ(to_string(ErrorCode::InvalidRequest), "Invalid Request");
  EXPECT_EQ(static_cast<int>(ErrorCode::ToolExecutionError), -32000);
}

TEST(JsonRpcIdTest, ValidIds) {
  EXPECT_TRUE(is_valid_id(nullptr));
  EXPECT_TRUE(is_valid_id(0));
  EXPECT_TRUE(is_valid_id("id"));
  EXPECT_FALSE(is_valid_id(json::array()));
  EXPECT_FALSE(is_valid_id(json::object()));
  EXPECT_FALSE(is_valid_id(true));
}
