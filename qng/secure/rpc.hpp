#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <qng/common/errors.hpp>
#include <qng/common/util.hpp>

namespace qng
{
class RpcConfig
{
public:
    RpcConfig();

    bool enable_;
    boost::asio::ip::address_v4 address_;
    uint16_t port_;
    bool enable_control_;
    // only ips in the white list can access
    std::vector<boost::asio::ip::address_v4> whitelist_;
};

class Rpc;
class RpcHandler;
typedef std::function<std::unique_ptr<RpcHandler>(
    qng::Rpc&, const std::string&, const boost::asio::ip::address_v4&,
    const std::function<void(const std::string&)>&)>
    RpcHandlerMaker;

// JSON-RPC 2.0 over HTTP POST
class Rpc
{
public:
    Rpc(boost::asio::io_service&, const qng::RpcConfig&,
        const qng::RpcHandlerMaker&);
    bool Start();
    void Stop();
    void Accept();
    bool CheckWhitelist(const boost::asio::ip::address_v4&) const;
    uint16_t Port() const;

    boost::asio::io_service& service_;
    boost::asio::ip::tcp::acceptor acceptor_;
    qng::RpcConfig config_;
    std::atomic_flag stopped_;
    qng::RpcHandlerMaker make_handler_;
};

class RpcConnection : public std::enable_shared_from_this<qng::RpcConnection>
{
public:
    RpcConnection(qng::Rpc&);
    void Parse();
    void Read();
    bool Write(const std::string&, unsigned);

    qng::Rpc& rpc_;
    boost::asio::ip::tcp::socket socket_;
    boost::beast::flat_buffer buffer_;
    boost::beast::http::request<boost::beast::http::string_body> request_;
    boost::beast::http::response<boost::beast::http::string_body> response_;
    std::atomic_flag responded_;
};

class RpcHandler
{
public:
    RpcHandler(qng::Rpc&, const std::string&,
               const boost::asio::ip::address_v4&,
               const std::function<void(const std::string&)>&);
    virtual ~RpcHandler() = default;
    void Check();
    void Process();
    virtual void Response();
    void Stop();

    virtual void ProcessImpl() = 0;

    static int constexpr MAX_JSON_DEPTH = 20;
    static uint32_t constexpr MAX_BODY_SIZE = 64 * 1024;

    qng::Rpc& rpc_;
    std::string body_;
    boost::asio::ip::address_v4 ip_;
    std::function<void(const std::string&)> send_response_;
    qng::ErrorCode error_code_;
    std::string error_message_;
    qng::Json request_;
    std::string method_;
    qng::Json id_;
    // null unless a handler sets it
    qng::Json result_;

protected:
    bool CheckControl_();
    bool CheckLocal_();
    size_t ParamsSize_() const;
    bool GetParam_(size_t, qng::Json&);
    bool GetParamString_(size_t, std::string&);
    bool GetParamUint_(size_t, uint64_t&);
    bool GetParamBool_(size_t, bool&);
    void SetResult_(const qng::Json&);
    void SetError_(const qng::Error&);
    int64_t JsonRpcCode_() const;
};

std::unique_ptr<qng::Rpc> MakeRpc(boost::asio::io_service&,
                                  const qng::RpcConfig&,
                                  const qng::RpcHandlerMaker&);

}  // namespace qng
