#include <snap_mcp/mcp/message_codec.hpp>

#include <string>

namespace snap_mcp {

namespace {

using DecodeResult = Result<Request, DecodeFailure>;

DecodeResult Fail(nlohmann::json id, int code, std::string message) {
    return DecodeResult::Err(
        DecodeFailure{std::move(id), RpcError{code, std::move(message), std::nullopt}});
}

bool IsUsableId(const nlohmann::json& id) {
    return id.is_null() || id.is_string() || id.is_number_integer();
}

std::string Dump(const nlohmann::json& j) {
    // Tool output may carry bytes that are not valid UTF-8; never throw here.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// DecodeRequest
// ---------------------------------------------------------------------------
Result<Request, DecodeFailure> DecodeRequest(std::string_view line) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(line.begin(), line.end());
    } catch (const nlohmann::json::parse_error& e) {
        return Fail(nullptr, rpc_code::kParseError,
                    std::string("Parse error: ") + e.what());
    }

    if (!doc.is_object()) {
        return Fail(nullptr, rpc_code::kParseError,
                    "Parse error: message must be a JSON object");
    }

    nlohmann::json id = nullptr;
    if (auto it = doc.find("id"); it != doc.end()) {
        if (!IsUsableId(*it)) {
            return Fail(nullptr, rpc_code::kInvalidRequest,
                        "Invalid Request: id must be a string, integer or null");
        }
        id = *it;
    }

    auto method_it = doc.find("method");
    if (method_it == doc.end() || !method_it->is_string()) {
        return Fail(std::move(id), rpc_code::kParseError,
                    "Parse error: missing 'method'");
    }

    if (auto it = doc.find("jsonrpc"); it != doc.end()) {
        if (!it->is_string() || it->get<std::string>() != kJsonRpcVersion) {
            return Fail(std::move(id), rpc_code::kInvalidRequest,
                        "Invalid Request: unsupported JSON-RPC version");
        }
    }

    std::optional<nlohmann::json> params;
    if (auto it = doc.find("params"); it != doc.end() && !it->is_null()) {
        if (!it->is_object()) {
            return Fail(std::move(id), rpc_code::kInvalidRequest,
                        "Invalid Request: params must be an object");
        }
        params = *it;
    }

    return DecodeResult::Ok(
        Request{std::move(id), method_it->get<std::string>(), std::move(params)});
}

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------
nlohmann::json ResponseToJson(const Response& response) {
    nlohmann::json j = {
        {"jsonrpc", kJsonRpcVersion},
        {"id", response.id},
    };
    if (response.IsError()) {
        const auto& err = response.ErrorBody();
        nlohmann::json error = {
            {"code", err.code},
            {"message", err.message},
        };
        if (err.data.has_value()) {
            error["data"] = *err.data;
        }
        j["error"] = std::move(error);
    } else {
        j["result"] = response.ResultBody();
    }
    return j;
}

std::string EncodeResponse(const Response& response) {
    return Dump(ResponseToJson(response)) + "\n";
}

std::string EncodeRequest(const Request& request) {
    nlohmann::json j = {
        {"jsonrpc", kJsonRpcVersion},
        {"method", request.method},
    };
    if (!request.id.is_null()) {
        j["id"] = request.id;
    }
    if (request.params.has_value()) {
        j["params"] = *request.params;
    }
    return Dump(j) + "\n";
}

Result<Response, std::string> DecodeResponse(std::string_view line) {
    using R = Result<Response, std::string>;

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(line.begin(), line.end());
    } catch (const nlohmann::json::parse_error& e) {
        return R::Err(std::string("invalid JSON: ") + e.what());
    }
    if (!doc.is_object()) {
        return R::Err("response is not a JSON object");
    }
    auto version = doc.find("jsonrpc");
    if (version == doc.end() || !version->is_string() ||
        version->get<std::string>() != kJsonRpcVersion) {
        return R::Err("response lacks jsonrpc \"2.0\"");
    }

    auto id = doc.contains("id") ? doc["id"] : nlohmann::json(nullptr);

    if (auto it = doc.find("error"); it != doc.end()) {
        if (!it->is_object() || !it->contains("code") ||
            !(*it)["code"].is_number_integer()) {
            return R::Err("malformed error member");
        }
        RpcError err;
        err.code = (*it)["code"].get<int>();
        if (it->contains("message") && (*it)["message"].is_string()) {
            err.message = (*it)["message"].get<std::string>();
        }
        if (it->contains("data") && (*it)["data"].is_object()) {
            err.data = (*it)["data"];
        }
        return R::Ok(Response::Failure(std::move(id), std::move(err)));
    }

    if (auto it = doc.find("result"); it != doc.end()) {
        return R::Ok(Response::Success(std::move(id), *it));
    }
    return R::Err("response has neither result nor error");
}

// ---------------------------------------------------------------------------
// LineBuffer
// ---------------------------------------------------------------------------
void LineBuffer::Append(std::string_view bytes) {
    buffer_.append(bytes.data(), bytes.size());
}

std::optional<std::string> LineBuffer::NextLine() {
    while (true) {
        auto newline = buffer_.find('\n', consumed_);
        if (newline == std::string::npos) {
            Compact();
            return std::nullopt;
        }

        std::string line = buffer_.substr(consumed_, newline - consumed_);
        consumed_ = newline + 1;

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            return line;
        }
    }
}

void LineBuffer::Compact() {
    if (consumed_ > 0) {
        buffer_.erase(0, consumed_);
        consumed_ = 0;
    }
}

} // namespace snap_mcp
