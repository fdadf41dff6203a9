#include <gtest/gtest.h>
#include <qng/core_test/test_util.hpp>
#include <qng/bridge/adapter.hpp>
#include <qng/bridge/invoker.hpp>
#include <qng/common/stat.hpp>

TEST(JsonRpcInvoker, Result)
{
    StubNode node("{\"id\":1,\"jsonrpc\":\"2.0\",\"result\":\"1000\"}");
    qng::JsonRpcInvoker invoker(node.Url());

    qng::RpcParams params;
    params.AddString("0xABC").AddInt(1);
    qng::Json result;
    qng::Error error = invoker.Invoke("qng_getBalance", params, result);
    ASSERT_FALSE(static_cast<bool>(error));
    ASSERT_EQ("1000", result.get<std::string>());

    ASSERT_EQ(1, node.Requests());
    ASSERT_EQ(
        "{\"method\":\"qng_getBalance\",\"params\":[\"0xABC\",1],\"id\":1,"
        "\"jsonrpc\":\"2.0\"}",
        node.LastRequest());
}

TEST(JsonRpcInvoker, ObjectResult)
{
    StubNode node(
        "{\"id\":1,\"jsonrpc\":\"2.0\",\"result\":{\"txid\":\"0x01\","
        "\"amount\":25}}");
    qng::JsonRpcInvoker invoker(node.Url());

    qng::Json result;
    qng::Error error = invoker.Invoke("qng_addBalance",
                                      qng::RpcParams().AddString("0xABC"),
                                      result);
    ASSERT_FALSE(static_cast<bool>(error));
    ASSERT_EQ("0x01", result.at("txid").get<std::string>());
    ASSERT_TRUE(result.at("amount").is_number());
    ASSERT_EQ(25, result.at("amount").get<uint64_t>());
}

TEST(JsonRpcInvoker, RpcError)
{
    StubNode node("{\"error\":{\"code\":1,\"message\":\"bad address\"}}");
    qng::JsonRpcInvoker invoker(node.Url());

    uint64_t count = qng::Stats::Get(qng::ErrorCode::JSON_RPC_ERROR);
    qng::Json result;
    qng::Error error = invoker.Invoke("qng_getUTXOs", qng::RpcParams(), result);
    ASSERT_TRUE(static_cast<bool>(error));
    ASSERT_EQ(qng::ErrorKind::RPC, error.Kind());
    ASSERT_EQ("bad address", error.Message());
    ASSERT_TRUE(result.is_null());
    ASSERT_EQ(count + 1, qng::Stats::Get(qng::ErrorCode::JSON_RPC_ERROR));
}

TEST(JsonRpcInvoker, MissingResult)
{
    StubNode node("{\"id\":1,\"jsonrpc\":\"2.0\"}");
    qng::JsonRpcInvoker invoker(node.Url());

    qng::Json result;
    qng::Error error = invoker.Invoke("qng_getBalance", qng::RpcParams(), result);
    ASSERT_TRUE(static_cast<bool>(error));
    ASSERT_EQ(qng::ErrorKind::PROTOCOL, error.Kind());
    ASSERT_EQ("network request exception", error.Message());
}

TEST(JsonRpcInvoker, NullResult)
{
    StubNode node("{\"id\":1,\"jsonrpc\":\"2.0\",\"result\":null}");
    qng::JsonRpcInvoker invoker(node.Url());

    qng::Json result;
    qng::Error error = invoker.Invoke("qng_getBalance", qng::RpcParams(), result);
    ASSERT_EQ(qng::ErrorKind::PROTOCOL, error.Kind());
}

TEST(JsonRpcInvoker, EmptyArrayResult)
{
    StubNode node("{\"id\":1,\"jsonrpc\":\"2.0\",\"result\":[]}");
    qng::JsonRpcInvoker invoker(node.Url());

    qng::Json result;
    qng::Error error = invoker.Invoke("qng_getUTXOs", qng::RpcParams(), result);
    ASSERT_FALSE(static_cast<bool>(error));
    ASSERT_TRUE(result.is_array());
    ASSERT_TRUE(result.empty());
    ASSERT_EQ("[]", qng::JsonToString(result));
}

TEST(JsonRpcInvoker, NumberResult)
{
    StubNode node("{\"id\":1,\"jsonrpc\":\"2.0\",\"result\":1000}");
    qng::JsonRpcInvoker invoker(node.Url());

    qng::Json result;
    qng::Error error = invoker.Invoke("qng_getBalance", qng::RpcParams(), result);
    ASSERT_FALSE(static_cast<bool>(error));
    ASSERT_TRUE(result.is_number_unsigned());
    ASSERT_EQ(1000, result.get<uint64_t>());
}

TEST(JsonRpcInvoker, NullStringResult)
{
    StubNode node("{\"id\":1,\"jsonrpc\":\"2.0\",\"result\":\"null\"}");
    qng::JsonRpcInvoker invoker(node.Url());

    uint64_t count = qng::Stats::Get(qng::ErrorCode::JSON_RPC_EMPTY_RESPONSE);
    qng::Json result;
    qng::Error error = invoker.Invoke("qng_getBalance", qng::RpcParams(), result);
    ASSERT_FALSE(static_cast<bool>(error));
    ASSERT_TRUE(result.is_string());
    ASSERT_EQ("null", result.get<std::string>());
    ASSERT_EQ(count,
              qng::Stats::Get(qng::ErrorCode::JSON_RPC_EMPTY_RESPONSE));
}

TEST(JsonRpcInvoker, UndecodableBody)
{
    StubNode node("<html>gateway</html>");
    qng::JsonRpcInvoker invoker(node.Url());

    qng::Json result;
    qng::Error error = invoker.Invoke("qng_getBalance", qng::RpcParams(), result);
    ASSERT_EQ(qng::ErrorKind::TRANSPORT, error.Kind());
}

TEST(JsonRpcInvoker, ErrorStatusWithResult)
{
    StatusNode node(boost::beast::http::status::internal_server_error,
                    "{\"id\":1,\"jsonrpc\":\"2.0\",\"result\":\"0x2a\"}");
    qng::JsonRpcInvoker invoker(node.Url());

    qng::Json result;
    qng::Error error = invoker.Invoke("qng_getBalance", qng::RpcParams(), result);
    ASSERT_FALSE(static_cast<bool>(error));
    ASSERT_EQ("0x2a", result.get<std::string>());
}

TEST(JsonRpcInvoker, ErrorStatusWithRpcError)
{
    StatusNode node(boost::beast::http::status::bad_request,
                    "{\"error\":{\"code\":-32602,\"message\":\"bad params\"}}");
    qng::JsonRpcInvoker invoker(node.Url());

    qng::Json result;
    qng::Error error = invoker.Invoke("qng_getBalance", qng::RpcParams(), result);
    ASSERT_EQ(qng::ErrorKind::RPC, error.Kind());
    ASSERT_EQ("bad params", error.Message());
}

TEST(JsonRpcInvoker, ErrorStatusUndecodable)
{
    StatusNode node(boost::beast::http::status::bad_gateway,
                    "<html>gateway</html>");
    qng::JsonRpcInvoker invoker(node.Url());

    qng::Json result;
    qng::Error error = invoker.Invoke("qng_getBalance", qng::RpcParams(), result);
    ASSERT_EQ(qng::ErrorKind::TRANSPORT, error.Kind());
    ASSERT_EQ(qng::ErrorCode::HTTP_POST, error.code_);
    ASSERT_NE(std::string::npos, error.Message().find("502"));
}

TEST(JsonRpcInvoker, ConnectionRefused)
{
    qng::Url url;
    ASSERT_EQ(false, url.Parse("http://127.0.0.1:1"));
    qng::JsonRpcInvoker invoker(url);

    qng::Json result;
    qng::Error error = invoker.Invoke("qng_getBalance", qng::RpcParams(), result);
    ASSERT_TRUE(static_cast<bool>(error));
    ASSERT_EQ(qng::ErrorKind::TRANSPORT, error.Kind());
}

TEST(RpcAdapter, GetBalance)
{
    StubNode node("{\"id\":1,\"jsonrpc\":\"2.0\",\"result\":\"1000\"}");
    qng::RpcAdapter adapter(std::make_shared<qng::JsonRpcInvoker>(node.Url()),
                            nullptr);

    qng::Json result;
    qng::Error error = adapter.GetBalance("0xABC", 1, result);
    ASSERT_FALSE(static_cast<bool>(error));
    ASSERT_EQ("1000", result.get<std::string>());
}

TEST(RpcAdapter, GetUtxosError)
{
    StubNode node("{\"error\":{\"code\":1,\"message\":\"bad address\"}}");
    qng::RpcAdapter adapter(std::make_shared<qng::JsonRpcInvoker>(node.Url()),
                            nullptr);

    qng::Json result;
    qng::Error error = adapter.GetUtxos("0xABC", 10, false, result);
    ASSERT_TRUE(static_cast<bool>(error));
    ASSERT_EQ("bad address", error.Message());
    ASSERT_EQ(
        "{\"method\":\"qng_getUTXOs\",\"params\":[\"0xABC\",10,false],\"id\":1,"
        "\"jsonrpc\":\"2.0\"}",
        node.LastRequest());
}

TEST(RpcAdapter, AddBalanceAndSendRaw)
{
    StubNode node("{\"id\":1,\"jsonrpc\":\"2.0\",\"result\":\"ok\"}");
    qng::RpcAdapter adapter(std::make_shared<qng::JsonRpcInvoker>(node.Url()),
                            nullptr);

    qng::Json result;
    ASSERT_FALSE(static_cast<bool>(adapter.AddBalance("0xABC", result)));
    ASSERT_EQ(
        "{\"method\":\"qng_addBalance\",\"params\":[\"0xABC\"],\"id\":1,"
        "\"jsonrpc\":\"2.0\"}",
        node.LastRequest());

    ASSERT_FALSE(
        static_cast<bool>(adapter.SendRawTransaction("0x0102", true, result)));
    ASSERT_EQ(
        "{\"method\":\"qng_sendRawTransaction\",\"params\":[\"0x0102\",true],"
        "\"id\":1,\"jsonrpc\":\"2.0\"}",
        node.LastRequest());
    ASSERT_EQ(2, node.Requests());
}
