#include <qng/common/jsonrpc.hpp>

char constexpr qng::JsonRpcRequest::VERSION[];

bool qng::StringToJson(const std::string& str, qng::Json& json)
{
    json = qng::Json::parse(str, nullptr, false);
    return json.is_discarded();
}

std::string qng::JsonToString(const qng::Json& json)
{
    return json.dump(-1, ' ', false, qng::Json::error_handler_t::replace);
}

boost::optional<std::string> qng::JsonGetString(const qng::Json& json,
                                                const std::string& key)
{
    if (!json.is_object())
    {
        return boost::none;
    }
    auto it = json.find(key);
    if (it == json.end() || !it->is_string())
    {
        return boost::none;
    }
    return it->get<std::string>();
}

qng::RpcParams::RpcParams() : items_(qng::Json::array())
{
}

qng::RpcParams& qng::RpcParams::AddString(const std::string& str)
{
    items_.push_back(str);
    return *this;
}

qng::RpcParams& qng::RpcParams::AddInt(int64_t value)
{
    items_.push_back(value);
    return *this;
}

qng::RpcParams& qng::RpcParams::AddUint(uint64_t value)
{
    items_.push_back(value);
    return *this;
}

qng::RpcParams& qng::RpcParams::AddBool(bool value)
{
    items_.push_back(value);
    return *this;
}

qng::RpcParams& qng::RpcParams::AddJson(const qng::Json& json)
{
    items_.push_back(json);
    return *this;
}

size_t qng::RpcParams::Size() const
{
    return items_.size();
}

const qng::Json& qng::RpcParams::Array() const
{
    return items_;
}

qng::JsonRpcRequest::JsonRpcRequest(const std::string& method,
                                    const qng::RpcParams& params, uint64_t id)
    : method_(method), params_(params), id_(id)
{
}

std::string qng::JsonRpcRequest::Serialize() const
{
    qng::Json json;
    json["method"] = method_;
    json["params"] = params_.Array();
    json["id"] = id_;
    json["jsonrpc"] = VERSION;
    return qng::JsonToString(json);
}

qng::JsonRpcResponse::JsonRpcResponse() : error_code_(0)
{
}

bool qng::JsonRpcResponse::Deserialize(const std::string& body)
{
    qng::Json json;
    bool error = qng::StringToJson(body, json);
    IF_ERROR_RETURN(error, true);
    if (!json.is_object())
    {
        return true;
    }

    auto id_it = json.find("id");
    if (id_it != json.end())
    {
        id_ = *id_it;
    }

    auto jsonrpc_it = json.find("jsonrpc");
    if (jsonrpc_it != json.end() && jsonrpc_it->is_string())
    {
        jsonrpc_ = jsonrpc_it->get<std::string>();
    }

    auto message_it = json.find("message");
    if (message_it != json.end() && message_it->is_string())
    {
        message_ = message_it->get<std::string>();
    }

    auto result_it = json.find("result");
    if (result_it != json.end() && !result_it->is_null())
    {
        result_ = *result_it;
    }

    auto error_it = json.find("error");
    if (error_it == json.end() || error_it->is_null())
    {
        return false;
    }
    if (!error_it->is_object())
    {
        return true;
    }

    auto code_it = error_it->find("code");
    if (code_it != error_it->end() && !code_it->is_null())
    {
        if (!code_it->is_number_integer())
        {
            return true;
        }
        error_code_ = code_it->get<int64_t>();
    }

    auto error_message_it = error_it->find("message");
    if (error_message_it != error_it->end() && !error_message_it->is_null())
    {
        if (!error_message_it->is_string())
        {
            return true;
        }
        error_message_ = error_message_it->get<std::string>();
    }

    return false;
}

bool qng::JsonRpcResponse::IsError() const
{
    return error_code_ != 0;
}

bool qng::JsonRpcResponse::HasResult() const
{
    return static_cast<bool>(result_);
}

std::string qng::JsonRpcResultJson(const qng::Json& id,
                                   const qng::Json& result)
{
    qng::Json json;
    json["id"] = id;
    json["jsonrpc"] = qng::JsonRpcRequest::VERSION;
    json["result"] = result;
    return qng::JsonToString(json);
}

std::string qng::JsonRpcErrorJson(const qng::Json& id, int64_t code,
                                  const std::string& message)
{
    qng::Json json;
    json["id"] = id;
    json["jsonrpc"] = qng::JsonRpcRequest::VERSION;
    json["error"]["code"] = code;
    json["error"]["message"] = message;
    return qng::JsonToString(json);
}
