#include <qng/secure/rpc.hpp>

#include <chrono>
#include <qng/common/jsonrpc.hpp>
#include <qng/common/log.hpp>
#include <qng/common/stat.hpp>

qng::RpcConfig::RpcConfig()
    : enable_(true),
      address_(boost::asio::ip::address_v4::loopback()),
      port_(7179),
      enable_control_(false),
      whitelist_({boost::asio::ip::address_v4::loopback()})
{
}

qng::Rpc::Rpc(boost::asio::io_service& service, const qng::RpcConfig& config,
              const qng::RpcHandlerMaker& maker)
    : service_(service),
      acceptor_(service),
      config_(config),
      stopped_{ATOMIC_FLAG_INIT},
      make_handler_(maker)
{
}

bool qng::Rpc::Start()
{
    boost::asio::ip::tcp::endpoint endpoint(config_.address_, config_.port_);
    boost::system::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec)
    {
        acceptor_.set_option(
            boost::asio::ip::tcp::acceptor::reuse_address(true), ec);
    }
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
        qng::Log::Error(qng::ToString("Error while binding for RPC on port ",
                                      endpoint.port(), ": ", ec.message()));
        return true;
    }

    Accept();
    return false;
}

void qng::Rpc::Stop()
{
    if (stopped_.test_and_set())
    {
        return;
    }
    boost::system::error_code ignore;
    acceptor_.close(ignore);
}

void qng::Rpc::Accept()
{
    auto connection = std::make_shared<qng::RpcConnection>(*this);
    acceptor_.async_accept(
        connection->socket_,
        [this, connection](const boost::system::error_code& ec) {
            if (boost::asio::error::operation_aborted != ec
                && acceptor_.is_open())
            {
                Accept();
            }

            if (!ec)
            {
                connection->Parse();
            }
            else if (boost::asio::error::operation_aborted != ec)
            {
                qng::Log::Rpc(qng::ToString(
                    "Error accepting RPC connections: ", ec.message()));
            }
        });
}

bool qng::Rpc::CheckWhitelist(const boost::asio::ip::address_v4& ip) const
{
    return !qng::Contain(config_.whitelist_, ip);
}

uint16_t qng::Rpc::Port() const
{
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    if (ec)
    {
        return 0;
    }
    return endpoint.port();
}

qng::RpcConnection::RpcConnection(qng::Rpc& rpc)
    : rpc_(rpc), socket_(rpc.service_)
{
    responded_.clear();
}

void qng::RpcConnection::Parse()
{
    boost::system::error_code ec;
    auto remote = socket_.remote_endpoint(ec);
    if (ec || !remote.address().is_v4())
    {
        return;
    }
    if (rpc_.CheckWhitelist(remote.address().to_v4()))
    {
        qng::Log::Rpc(qng::ToString("RPC request from ", remote, " denied"));
        return;
    }

    Read();
}

void qng::RpcConnection::Read()
{
    auto connection = shared_from_this();
    boost::beast::http::async_read(
        socket_, buffer_, request_,
        [connection](const boost::system::error_code& ec, size_t) {
            if (ec)
            {
                qng::Log::Rpc(qng::ToString("RPC read error:", ec.message()));
                return;
            }

            connection->rpc_.service_.post([connection]() {
                auto start = std::chrono::steady_clock::now();
                auto version = connection->request_.version();

                auto response_handler = [connection, version,
                                         start](const std::string& body) {
                    if (connection->Write(body, version))
                    {
                        return;
                    }
                    boost::beast::http::async_write(
                        connection->socket_, connection->response_,
                        [connection](const boost::system::error_code& ec,
                                     size_t) {
                            if (ec)
                            {
                                qng::Log::Rpc(qng::ToString(
                                    "RPC write error:", ec.message()));
                            }
                        });
                    qng::Log::Rpc(qng::ToString(
                        "RPC request completed in: ",
                        std::chrono::duration_cast<std::chrono::microseconds>(
                            std::chrono::steady_clock::now() - start)
                            .count(),
                        " microseconds"));
                };

                boost::system::error_code ec;
                auto remote = connection->socket_.remote_endpoint(ec);
                if (ec)
                {
                    return;
                }

                if (connection->request_.method()
                    == boost::beast::http::verb::post)
                {
                    auto handler = connection->rpc_.make_handler_(
                        connection->rpc_, connection->request_.body(),
                        remote.address().to_v4(), response_handler);
                    handler->Process();
                }
                else
                {
                    response_handler(qng::JsonRpcErrorJson(
                        nullptr,
                        static_cast<int64_t>(
                            qng::JsonRpcErrorCode::INVALID_REQUEST),
                        "Only POST requests are allowed"));
                }
            });
        });
}

bool qng::RpcConnection::Write(const std::string& body, unsigned version)
{
    if (responded_.test_and_set())
    {
        qng::Log::Error("RPC already responded");
        return true;
    }

    response_.set("Content-Type", "application/json");
    response_.set("Access-Control-Allow-Origin", "*");
    response_.set("Access-Control-Allow-Headers",
                  "Accept, Accept-Language, Content-Language, Content-Type");
    response_.set("Connection", "close");
    response_.result(boost::beast::http::status::ok);
    response_.body() = body;
    response_.version(version);
    response_.prepare_payload();
    return false;
}

qng::RpcHandler::RpcHandler(
    qng::Rpc& rpc, const std::string& body,
    const boost::asio::ip::address_v4& ip,
    const std::function<void(const std::string&)>& send_response)
    : rpc_(rpc),
      body_(body),
      ip_(ip),
      send_response_(send_response),
      error_code_(qng::ErrorCode::SUCCESS)
{
}

void qng::RpcHandler::Check()
{
    if (body_.size() > qng::RpcHandler::MAX_BODY_SIZE)
    {
        error_code_ = qng::ErrorCode::RPC_HTTP_BODY_SIZE;
        return;
    }

    int depth = 0;
    for (auto ch : body_)
    {
        if (ch == '[' || ch == '{')
        {
            ++depth;
        }
        else if (ch == ']' || ch == '}')
        {
            --depth;
        }
        else
        {
            continue;
        }

        if (depth < 0)
        {
            error_code_ = qng::ErrorCode::RPC_JSON;
            return;
        }

        if (depth > qng::RpcHandler::MAX_JSON_DEPTH)
        {
            error_code_ = qng::ErrorCode::RPC_JSON_DEPTH;
            return;
        }
    }
}

void qng::RpcHandler::Process()
{
    try
    {
        Check();
        if (error_code_ != qng::ErrorCode::SUCCESS)
        {
            Response();
            return;
        }

        bool error = qng::StringToJson(body_, request_);
        if (error || !request_.is_object())
        {
            error_code_ = qng::ErrorCode::RPC_JSON;
            Response();
            return;
        }

        auto id_it = request_.find("id");
        if (id_it != request_.end())
        {
            id_ = *id_it;
        }
        auto method_o = qng::JsonGetString(request_, "method");
        if (!method_o || method_o->empty())
        {
            error_code_ = qng::ErrorCode::RPC_UNKNOWN_METHOD;
            Response();
            return;
        }
        method_ = *method_o;

        ProcessImpl();
    }
    catch (const std::exception& e)
    {
        error_code_ = qng::ErrorCode::RPC_GENERIC;
        error_message_ = e.what();
    }

    Response();
}

void qng::RpcHandler::Response()
{
    if (error_code_ != qng::ErrorCode::SUCCESS)
    {
        std::string message = error_message_.empty()
                                  ? qng::ErrorString(error_code_)
                                  : error_message_;
        send_response_(qng::JsonRpcErrorJson(id_, JsonRpcCode_(), message));
        qng::Stats::Add(error_code_, method_, ": ", message);
        qng::Log::Rpc(qng::ToString("RPC ", method_, " failed: ", message));
    }
    else
    {
        send_response_(qng::JsonRpcResultJson(id_, result_));
    }
}

void qng::RpcHandler::Stop()
{
    rpc_.Stop();
}

bool qng::RpcHandler::CheckControl_()
{
    if (ip_ == boost::asio::ip::address_v4::loopback())
    {
        return false;
    }

    if (rpc_.config_.enable_control_)
    {
        return false;
    }

    error_code_ = qng::ErrorCode::RPC_ENABLE_CONTROL;
    return true;
}

bool qng::RpcHandler::CheckLocal_()
{
    if (ip_ == boost::asio::ip::address_v4::loopback())
    {
        return false;
    }

    error_code_ = qng::ErrorCode::RPC_NOT_LOCALHOST;
    return true;
}

size_t qng::RpcHandler::ParamsSize_() const
{
    auto params_it = request_.find("params");
    if (params_it == request_.end() || !params_it->is_array())
    {
        return 0;
    }
    return params_it->size();
}

bool qng::RpcHandler::GetParam_(size_t index, qng::Json& param)
{
    if (index >= ParamsSize_())
    {
        error_code_ = qng::ErrorCode::RPC_MISS_PARAMS;
        error_message_ = qng::ToString("missing param ", index);
        return true;
    }

    param = request_["params"][index];
    return false;
}

bool qng::RpcHandler::GetParamString_(size_t index, std::string& value)
{
    qng::Json param;
    bool error = GetParam_(index, param);
    IF_ERROR_RETURN(error, true);
    if (!param.is_string())
    {
        error_code_ = qng::ErrorCode::RPC_INVALID_PARAMS;
        error_message_ = qng::ToString("param ", index, " is not a string");
        return true;
    }
    value = param.get<std::string>();
    return false;
}

// An unsigned number, or a decimal or 0x hex string
bool qng::RpcHandler::GetParamUint_(size_t index, uint64_t& value)
{
    qng::Json param;
    bool error = GetParam_(index, param);
    IF_ERROR_RETURN(error, true);

    if (param.is_number_unsigned())
    {
        value = param.get<uint64_t>();
        return false;
    }

    if (!param.is_string()
        || (qng::StringToUint(param.get<std::string>(), value)
            && qng::EvmHexToUint64(param.get<std::string>(), value)))
    {
        error_code_ = qng::ErrorCode::RPC_INVALID_PARAMS;
        error_message_ = qng::ToString("param ", index, " is not an integer");
        return true;
    }
    return false;
}

bool qng::RpcHandler::GetParamBool_(size_t index, bool& value)
{
    qng::Json param;
    bool error = GetParam_(index, param);
    IF_ERROR_RETURN(error, true);

    if (!param.is_boolean())
    {
        error_code_ = qng::ErrorCode::RPC_INVALID_PARAMS;
        error_message_ = qng::ToString("param ", index, " is not a boolean");
        return true;
    }
    value = param.get<bool>();
    return false;
}

void qng::RpcHandler::SetResult_(const qng::Json& result)
{
    result_ = result;
}

void qng::RpcHandler::SetError_(const qng::Error& error)
{
    error_code_ = error.code_;
    error_message_ = error.Message();
}

int64_t qng::RpcHandler::JsonRpcCode_() const
{
    switch (error_code_)
    {
        case qng::ErrorCode::RPC_JSON:
        case qng::ErrorCode::RPC_JSON_DEPTH:
        case qng::ErrorCode::RPC_HTTP_BODY_SIZE:
        {
            return static_cast<int64_t>(qng::JsonRpcErrorCode::PARSE_ERROR);
        }
        case qng::ErrorCode::RPC_UNKNOWN_METHOD:
        {
            return static_cast<int64_t>(
                qng::JsonRpcErrorCode::METHOD_NOT_FOUND);
        }
        case qng::ErrorCode::RPC_MISS_PARAMS:
        case qng::ErrorCode::RPC_INVALID_PARAMS:
        case qng::ErrorCode::HEX_STRING:
        case qng::ErrorCode::HASH_LENGTH:
        case qng::ErrorCode::EVM_ADDRESS:
        case qng::ErrorCode::USER_OP_JSON:
        case qng::ErrorCode::STATE_OVERRIDE_JSON:
        {
            return static_cast<int64_t>(qng::JsonRpcErrorCode::INVALID_PARAMS);
        }
        default:
        {
            return static_cast<int64_t>(qng::JsonRpcErrorCode::SERVER_ERROR);
        }
    }
}

std::unique_ptr<qng::Rpc> qng::MakeRpc(boost::asio::io_service& service,
                                       const qng::RpcConfig& config,
                                       const qng::RpcHandlerMaker& maker)
{
    std::unique_ptr<qng::Rpc> impl;

    impl.reset(new qng::Rpc(service, config, maker));

    return impl;
}
