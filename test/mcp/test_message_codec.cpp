#include <catch2/catch_test_macros.hpp>

#include <snap_mcp/mcp/message_codec.hpp>

#include <string>

using namespace snap_mcp;
using json = nlohmann::json;

// ===========================================================================
// DecodeRequest
// ===========================================================================

TEST_CASE("DecodeRequest: well-formed request", "[mcp][codec]") {
    auto result = DecodeRequest(
        R"({"jsonrpc":"2.0","id":"req-1","method":"tools/call","params":{"name":"get_friends"}})");
    REQUIRE(result.IsOk());
    const auto& req = result.Value();
    CHECK(req.id == "req-1");
    CHECK(req.method == "tools/call");
    REQUIRE(req.params.has_value());
    CHECK((*req.params)["name"] == "get_friends");
}

TEST_CASE("DecodeRequest: integer id and absent params", "[mcp][codec]") {
    auto result = DecodeRequest(R"({"jsonrpc":"2.0","id":7,"method":"tools/list"})");
    REQUIRE(result.IsOk());
    CHECK(result.Value().id == 7);
    CHECK_FALSE(result.Value().params.has_value());
}

TEST_CASE("DecodeRequest: missing id decodes with null id", "[mcp][codec]") {
    auto result = DecodeRequest(R"({"method":"initialize"})");
    REQUIRE(result.IsOk());
    CHECK(result.Value().id.is_null());
}

TEST_CASE("DecodeRequest: invalid JSON is ParseError with null id", "[mcp][codec]") {
    auto result = DecodeRequest("not valid json");
    REQUIRE(result.IsErr());
    CHECK(result.Error().error.code == rpc_code::kParseError);
    CHECK(result.Error().id.is_null());
}

TEST_CASE("DecodeRequest: non-object document is ParseError", "[mcp][codec]") {
    for (const char* line : {"[1,2,3]", "42", "\"initialize\"", "null"}) {
        auto result = DecodeRequest(line);
        REQUIRE(result.IsErr());
        CHECK(result.Error().error.code == rpc_code::kParseError);
    }
}

TEST_CASE("DecodeRequest: invalid UTF-8 is ParseError", "[mcp][codec]") {
    auto result = DecodeRequest("{\"id\":1,\"method\":\"\xff\xfe\"}");
    REQUIRE(result.IsErr());
    CHECK(result.Error().error.code == rpc_code::kParseError);
}

TEST_CASE("DecodeRequest: missing method keeps the id", "[mcp][codec]") {
    auto result = DecodeRequest(R"({"jsonrpc":"2.0","id":"abc"})");
    REQUIRE(result.IsErr());
    CHECK(result.Error().error.code == rpc_code::kParseError);
    CHECK(result.Error().id == "abc");

    auto numeric = DecodeRequest(R"({"id":3,"method":12})");
    REQUIRE(numeric.IsErr());
    CHECK(numeric.Error().id == 3);
}

TEST_CASE("DecodeRequest: wrong jsonrpc version is InvalidRequest", "[mcp][codec]") {
    auto result = DecodeRequest(R"({"jsonrpc":"1.0","id":1,"method":"initialize"})");
    REQUIRE(result.IsErr());
    CHECK(result.Error().error.code == rpc_code::kInvalidRequest);
    CHECK(result.Error().id == 1);
}

TEST_CASE("DecodeRequest: unusable id type is InvalidRequest", "[mcp][codec]") {
    auto result = DecodeRequest(R"({"id":{"nested":true},"method":"initialize"})");
    REQUIRE(result.IsErr());
    CHECK(result.Error().error.code == rpc_code::kInvalidRequest);
    CHECK(result.Error().id.is_null());
}

TEST_CASE("DecodeRequest: non-object params is InvalidRequest", "[mcp][codec]") {
    auto result = DecodeRequest(R"({"id":2,"method":"tools/call","params":[1]})");
    REQUIRE(result.IsErr());
    CHECK(result.Error().error.code == rpc_code::kInvalidRequest);
    CHECK(result.Error().id == 2);
}

TEST_CASE("DecodeRequest: inverts EncodeRequest", "[mcp][codec]") {
    Request original{json("req-9"), "resources/read",
                     json{{"uri", "snap://camera/status"}}};
    auto encoded = EncodeRequest(original);
    REQUIRE(encoded.back() == '\n');
    encoded.pop_back();

    auto decoded = DecodeRequest(encoded);
    REQUIRE(decoded.IsOk());
    CHECK(decoded.Value() == original);
}

// ===========================================================================
// EncodeResponse / DecodeResponse
// ===========================================================================

TEST_CASE("EncodeResponse: success frame is one sorted line", "[mcp][codec]") {
    auto line = EncodeResponse(Response::Success(json(1), json{{"tools", json::array()}}));
    CHECK(line == "{\"id\":1,\"jsonrpc\":\"2.0\",\"result\":{\"tools\":[]}}\n");
}

TEST_CASE("EncodeResponse: error frame carries data when present", "[mcp][codec]") {
    RpcError err{rpc_code::kInvalidParams, "Invalid params: missing URI",
                 json{{"field", "uri"}}};
    auto line = EncodeResponse(Response::Failure(json("r"), err));
    auto parsed = json::parse(line);
    CHECK(parsed["id"] == "r");
    CHECK(parsed["error"]["code"] == -32602);
    CHECK(parsed["error"]["data"]["field"] == "uri");
    CHECK_FALSE(parsed.contains("result"));
}

TEST_CASE("EncodeResponse: null id is written explicitly", "[mcp][codec]") {
    auto line = EncodeResponse(
        Response::Failure(nullptr, RpcError{rpc_code::kParseError, "Parse error", std::nullopt}));
    auto parsed = json::parse(line);
    REQUIRE(parsed.contains("id"));
    CHECK(parsed["id"].is_null());
    CHECK_FALSE(parsed["error"].contains("data"));
}

TEST_CASE("DecodeResponse: parses success and error frames", "[mcp][codec]") {
    auto ok = DecodeResponse(R"({"jsonrpc":"2.0","id":4,"result":{"x":1}})");
    REQUIRE(ok.IsOk());
    CHECK_FALSE(ok.Value().IsError());
    CHECK(ok.Value().ResultBody()["x"] == 1);

    auto err = DecodeResponse(
        R"({"jsonrpc":"2.0","id":null,"error":{"code":-32700,"message":"Parse error"}})");
    REQUIRE(err.IsOk());
    REQUIRE(err.Value().IsError());
    CHECK(err.Value().ErrorBody().code == -32700);
    CHECK(err.Value().id.is_null());
}

TEST_CASE("DecodeResponse: rejects malformed frames", "[mcp][codec]") {
    CHECK(DecodeResponse("garbage").IsErr());
    CHECK(DecodeResponse(R"({"id":1,"result":{}})").IsErr());
    CHECK(DecodeResponse(R"({"jsonrpc":"2.0","id":1})").IsErr());
    CHECK(DecodeResponse(R"({"jsonrpc":"2.0","id":1,"error":{"code":"x"}})").IsErr());
}

// ===========================================================================
// LineBuffer
// ===========================================================================

TEST_CASE("LineBuffer: yields complete lines in order", "[mcp][codec][framing]") {
    LineBuffer buffer;
    buffer.Append("first\nsecond\nthi");

    auto a = buffer.NextLine();
    auto b = buffer.NextLine();
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    CHECK(*a == "first");
    CHECK(*b == "second");
    CHECK_FALSE(buffer.NextLine().has_value());
    CHECK(buffer.PendingBytes() == 3);

    buffer.Append("rd\n");
    auto c = buffer.NextLine();
    REQUIRE(c.has_value());
    CHECK(*c == "third");
    CHECK(buffer.PendingBytes() == 0);
}

TEST_CASE("LineBuffer: strips CR and skips blank lines", "[mcp][codec][framing]") {
    LineBuffer buffer;
    buffer.Append("\n\r\none\r\n\n");

    auto line = buffer.NextLine();
    REQUIRE(line.has_value());
    CHECK(*line == "one");
    CHECK_FALSE(buffer.NextLine().has_value());
}

TEST_CASE("LineBuffer: message split across many appends", "[mcp][codec][framing]") {
    const std::string message = R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})";
    LineBuffer buffer;
    for (char c : message) {
        buffer.Append(std::string(1, c));
        CHECK_FALSE(buffer.NextLine().has_value());
    }
    buffer.Append("\n");
    auto line = buffer.NextLine();
    REQUIRE(line.has_value());
    CHECK(*line == message);
}
