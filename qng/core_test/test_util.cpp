#include <qng/core_test/test_util.hpp>

#include <qng/evm/abi.hpp>
#include <qng/evm/crypto.hpp>

bool TestDecodeHex(const std::string& in, std::vector<uint8_t>& out)
{
    out.clear();
    return qng::EvmHexToBytes(in, out);
}

std::string TestEncodeHex(const std::vector<uint8_t>& in)
{
    return qng::StringToLower(qng::BytesToHex(in.data(), in.size()));
}

qng::Json TestJson(const std::string& str)
{
    qng::Json json;
    bool error = qng::StringToJson(str, json);
    if (error)
    {
        return qng::Json();
    }
    return json;
}

std::vector<uint8_t> TestEncodeHandleOps(
    const std::vector<qng::UserOperation>& ops,
    const qng::EvmAddress& beneficiary)
{
    std::vector<std::vector<uint8_t>> tuples;
    for (const auto& op : ops)
    {
        qng::AbiEncoder tuple;
        tuple.Address(op.sender_)
            .Uint(op.nonce_)
            .Bytes(op.init_code_)
            .Bytes(op.call_data_)
            .Uint(op.call_gas_limit_)
            .Uint(op.verification_gas_limit_)
            .Uint(op.pre_verification_gas_)
            .Uint(op.max_fee_per_gas_)
            .Uint(op.max_priority_fee_per_gas_)
            .Bytes(op.paymaster_and_data_)
            .Bytes(op.signature_);
        tuples.push_back(tuple.Encode());
    }

    auto append_word = [](std::vector<uint8_t>& out, const qng::uint256_t& n) {
        qng::uint256_union word(n);
        out.insert(out.end(), word.bytes.begin(), word.bytes.end());
    };

    std::vector<uint8_t> args;
    append_word(args, 0x40);
    qng::uint256_union beneficiary_word = beneficiary.ToWord();
    args.insert(args.end(), beneficiary_word.bytes.begin(),
                beneficiary_word.bytes.end());
    append_word(args, ops.size());
    size_t offset = 32 * tuples.size();
    for (const auto& i : tuples)
    {
        append_word(args, offset);
        offset += i.size();
    }
    for (const auto& i : tuples)
    {
        args.insert(args.end(), i.begin(), i.end());
    }

    std::vector<uint8_t> input =
        qng::FunctionSelector(qng::HandleOpsCall::SIGNATURE);
    input.insert(input.end(), args.begin(), args.end());
    return input;
}

MockEthClient::MockEthClient() : qng::EthClient(nullptr)
{
}

qng::Error MockEthClient::Call(const std::string& method,
                               const qng::RpcParams& params,
                               qng::Json& result) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    ++calls_[method];
    params_[method] = qng::JsonToString(params.Array());

    auto error_it = errors_.find(method);
    if (error_it != errors_.end())
    {
        return error_it->second;
    }

    auto it = results_.find(method);
    if (it == results_.end())
    {
        return qng::Error(qng::ErrorCode::JSON_RPC_ERROR,
                          "method not mocked: " + method);
    }
    if (it->second == "null")
    {
        return qng::Error(qng::ErrorCode::JSON_RPC_EMPTY_RESPONSE);
    }
    result = TestJson(it->second);
    return qng::Error();
}

void MockEthClient::SetResult(const std::string& method,
                              const std::string& json)
{
    std::lock_guard<std::mutex> lock(mutex_);
    results_[method] = json;
}

void MockEthClient::SetError(const std::string& method,
                             const qng::Error& error)
{
    std::lock_guard<std::mutex> lock(mutex_);
    errors_[method] = error;
}

size_t MockEthClient::Calls(const std::string& method) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = calls_.find(method);
    return it == calls_.end() ? 0 : it->second;
}

size_t MockEthClient::TotalCalls() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& i : calls_)
    {
        total += i.second;
    }
    return total;
}

std::string MockEthClient::LastParams(const std::string& method) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = params_.find(method);
    return it == params_.end() ? "" : it->second;
}

StubNode::StubNode(const std::string& response)
    : response_(response), requests_(0)
{
    qng::RpcConfig config;
    config.port_ = 0;
    rpc_ = qng::MakeRpc(
        service_, config,
        [this](qng::Rpc& rpc, const std::string& body,
               const boost::asio::ip::address_v4& ip,
               const std::function<void(const std::string&)>& send_response)
            -> std::unique_ptr<qng::RpcHandler> {
            return std::make_unique<StubRpcHandler>(*this, rpc, body, ip,
                                                    send_response);
        });
    if (rpc_ != nullptr && !rpc_->Start())
    {
        runner_ = std::make_unique<qng::ServiceRunner>(service_, 1);
    }
}

StubNode::~StubNode()
{
    service_.stop();
    if (runner_)
    {
        runner_->Join();
    }
}

qng::Url StubNode::Url() const
{
    qng::Url url;
    url.Parse(qng::ToString("http://127.0.0.1:", rpc_ ? rpc_->Port() : 0));
    return url;
}

std::string StubNode::LastRequest() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return last_request_;
}

size_t StubNode::Requests() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

void StubNode::Record(const std::string& body)
{
    std::lock_guard<std::mutex> lock(mutex_);
    last_request_ = body;
    ++requests_;
}

const std::string& StubNode::Response() const
{
    return response_;
}

StubRpcHandler::StubRpcHandler(
    StubNode& node, qng::Rpc& rpc, const std::string& body,
    const boost::asio::ip::address_v4& ip,
    const std::function<void(const std::string&)>& send_response)
    : qng::RpcHandler(rpc, body, ip, send_response), node_(node)
{
}

void StubRpcHandler::ProcessImpl()
{
}

void StubRpcHandler::Response()
{
    node_.Record(body_);
    send_response_(node_.Response());
}

StatusNode::StatusNode(boost::beast::http::status status,
                       const std::string& body)
    : acceptor_(service_), status_(status), body_(body)
{
    boost::asio::ip::tcp::endpoint endpoint(
        boost::asio::ip::address_v4::loopback(), 0);
    boost::system::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec)
    {
        acceptor_.bind(endpoint, ec);
    }
    if (!ec)
    {
        acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    }
    if (ec)
    {
        return;
    }

    Accept_();
    runner_ = std::make_unique<qng::ServiceRunner>(service_, 1);
}

StatusNode::~StatusNode()
{
    service_.stop();
    if (runner_)
    {
        runner_->Join();
    }
}

qng::Url StatusNode::Url() const
{
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    qng::Url url;
    url.Parse(qng::ToString("http://127.0.0.1:", ec ? 0 : endpoint.port()));
    return url;
}

void StatusNode::Accept_()
{
    namespace http = boost::beast::http;
    auto socket = std::make_shared<boost::asio::ip::tcp::socket>(service_);
    acceptor_.async_accept(*socket, [this, socket](
                                        const boost::system::error_code& ec) {
        if (ec)
        {
            return;
        }

        auto buffer = std::make_shared<boost::beast::flat_buffer>();
        auto request = std::make_shared<http::request<http::string_body>>();
        http::async_read(
            *socket, *buffer, *request,
            [this, socket, buffer, request](const boost::system::error_code& ec,
                                            size_t) {
                if (ec)
                {
                    return;
                }
                auto response =
                    std::make_shared<http::response<http::string_body>>(
                        status_, request->version());
                response->set(http::field::content_type, "application/json");
                response->keep_alive(false);
                response->body() = body_;
                response->prepare_payload();
                http::async_write(
                    *socket, *response,
                    [socket, response](const boost::system::error_code&,
                                       size_t) {
                        boost::system::error_code ignore;
                        socket->shutdown(
                            boost::asio::ip::tcp::socket::shutdown_both,
                            ignore);
                    });
            });

        Accept_();
    });
}
