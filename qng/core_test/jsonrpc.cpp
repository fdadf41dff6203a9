#include <gtest/gtest.h>
#include <qng/core_test/test_util.hpp>
#include <qng/common/jsonrpc.hpp>

TEST(JsonRpc, Request)
{
    qng::RpcParams params;
    params.AddString("0xABC").AddInt(1).AddBool(false);
    qng::JsonRpcRequest request("qng_getUTXOs", params, 1);
    ASSERT_EQ(
        "{\"method\":\"qng_getUTXOs\",\"params\":[\"0xABC\",1,false],\"id\":1,"
        "\"jsonrpc\":\"2.0\"}",
        request.Serialize());

    qng::JsonRpcRequest empty("eth_chainId", qng::RpcParams(), 1);
    ASSERT_EQ(
        "{\"method\":\"eth_chainId\",\"params\":[],\"id\":1,"
        "\"jsonrpc\":\"2.0\"}",
        empty.Serialize());
}

TEST(JsonRpc, RequestParams)
{
    qng::RpcParams params;
    params.AddString("a\"b\n").AddUint(18446744073709551615ULL).AddInt(-1);
    params.AddJson(TestJson("{\"z\":1,\"a\":[]}"));
    ASSERT_EQ(4, params.Size());
    ASSERT_EQ("[\"a\\\"b\\n\",18446744073709551615,-1,{\"z\":1,\"a\":[]}]",
              qng::JsonToString(params.Array()));
}

TEST(JsonRpc, ResponseResult)
{
    qng::JsonRpcResponse response;
    ASSERT_EQ(false, response.Deserialize(
                         "{\"id\":1,\"jsonrpc\":\"2.0\",\"result\":\"1000\"}"));
    ASSERT_FALSE(response.IsError());
    ASSERT_TRUE(response.HasResult());
    ASSERT_EQ("\"1000\"", qng::JsonToString(*response.result_));
    ASSERT_EQ("2.0", response.jsonrpc_);
    ASSERT_EQ(1, response.id_.get<int64_t>());

    qng::JsonRpcResponse object;
    ASSERT_EQ(false, object.Deserialize(
                         "{\"result\":{\"hash\":\"0x01\",\"amount\":5}}"));
    ASSERT_EQ("{\"hash\":\"0x01\",\"amount\":5}",
              qng::JsonToString(*object.result_));
}

TEST(JsonRpc, ResponseResultKeepsTypes)
{
    qng::JsonRpcResponse empty_array;
    ASSERT_EQ(false, empty_array.Deserialize("{\"result\":[]}"));
    ASSERT_TRUE(empty_array.result_->is_array());
    ASSERT_EQ("[]", qng::JsonToString(*empty_array.result_));

    qng::JsonRpcResponse number;
    ASSERT_EQ(false, number.Deserialize("{\"result\":1000}"));
    ASSERT_TRUE(number.result_->is_number());
    ASSERT_EQ("1000", qng::JsonToString(*number.result_));

    qng::JsonRpcResponse nested;
    ASSERT_EQ(false, nested.Deserialize("{\"result\":[{\"a\":1,\"b\":false}]}"));
    ASSERT_EQ("[{\"a\":1,\"b\":false}]", qng::JsonToString(*nested.result_));

    // a string that reads null is still a result
    qng::JsonRpcResponse null_string;
    ASSERT_EQ(false, null_string.Deserialize("{\"result\":\"null\"}"));
    ASSERT_TRUE(null_string.HasResult());
    ASSERT_EQ("null", null_string.result_->get<std::string>());

    qng::JsonRpcResponse empty_string;
    ASSERT_EQ(false, empty_string.Deserialize("{\"result\":\"\"}"));
    ASSERT_TRUE(empty_string.HasResult());
    ASSERT_TRUE(empty_string.result_->is_string());
}

TEST(JsonRpc, ResponseError)
{
    qng::JsonRpcResponse response;
    ASSERT_EQ(false,
              response.Deserialize(
                  "{\"error\":{\"code\":1,\"message\":\"bad address\"}}"));
    ASSERT_TRUE(response.IsError());
    ASSERT_EQ(1, response.error_code_);
    ASSERT_EQ("bad address", response.error_message_);
    ASSERT_FALSE(response.HasResult());

    qng::JsonRpcResponse negative;
    ASSERT_EQ(false,
              negative.Deserialize(
                  "{\"error\":{\"code\":-32601,\"message\":\"not found\"}}"));
    ASSERT_EQ(-32601, negative.error_code_);
}

TEST(JsonRpc, ResponseNoResult)
{
    qng::JsonRpcResponse absent;
    ASSERT_EQ(false, absent.Deserialize("{\"id\":1,\"jsonrpc\":\"2.0\"}"));
    ASSERT_FALSE(absent.IsError());
    ASSERT_FALSE(absent.HasResult());

    qng::JsonRpcResponse null;
    ASSERT_EQ(false, null.Deserialize("{\"result\":null,\"error\":null}"));
    ASSERT_FALSE(null.HasResult());
    ASSERT_FALSE(null.IsError());

    qng::JsonRpcResponse zero;
    ASSERT_EQ(false, zero.Deserialize(
                         "{\"error\":{\"code\":0,\"message\":\"\"},"
                         "\"message\":\"busy\"}"));
    ASSERT_FALSE(zero.IsError());
    ASSERT_FALSE(zero.HasResult());
    ASSERT_EQ("busy", *zero.message_);
}

TEST(JsonRpc, ResponseMalformed)
{
    qng::JsonRpcResponse response;
    ASSERT_EQ(true, response.Deserialize("not json"));
    ASSERT_EQ(true, response.Deserialize("[1,2]"));
    ASSERT_EQ(true, response.Deserialize(""));
    ASSERT_EQ(true, response.Deserialize("{\"error\":\"failed\"}"));
    ASSERT_EQ(true, response.Deserialize("{\"error\":{\"code\":\"1\"}}"));
    ASSERT_EQ(true, response.Deserialize("{\"error\":{\"code\":1.5}}"));
}

TEST(JsonRpc, ServerEnvelopes)
{
    ASSERT_EQ("{\"id\":7,\"jsonrpc\":\"2.0\",\"result\":\"0x1\"}",
              qng::JsonRpcResultJson(7, "0x1"));
    ASSERT_EQ("{\"id\":\"abc\",\"jsonrpc\":\"2.0\",\"result\":[]}",
              qng::JsonRpcResultJson("abc", qng::Json::array()));
    ASSERT_EQ("{\"id\":null,\"jsonrpc\":\"2.0\",\"result\":null}",
              qng::JsonRpcResultJson(nullptr, nullptr));
    ASSERT_EQ(
        "{\"id\":null,\"jsonrpc\":\"2.0\",\"error\":{\"code\":-32700,"
        "\"message\":\"parse error\"}}",
        qng::JsonRpcErrorJson(nullptr, -32700, "parse error"));
}

TEST(JsonRpc, StringToJson)
{
    qng::Json json;
    ASSERT_FALSE(qng::StringToJson("{\"a\":[1,2]}", json));
    ASSERT_EQ(2, json.at("a").size());
    ASSERT_TRUE(qng::StringToJson("{\"a\":", json));

    ASSERT_EQ("x", *qng::JsonGetString(TestJson("{\"k\":\"x\"}"), "k"));
    ASSERT_FALSE(qng::JsonGetString(TestJson("{\"k\":1}"), "k"));
    ASSERT_FALSE(qng::JsonGetString(TestJson("{}"), "k"));
    ASSERT_FALSE(qng::JsonGetString(TestJson("[\"k\"]"), "k"));
}
