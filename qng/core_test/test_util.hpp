#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <qng/common/runner.hpp>
#include <qng/common/util.hpp>
#include <qng/evm/client.hpp>
#include <qng/evm/userop.hpp>
#include <qng/secure/rpc.hpp>

bool TestDecodeHex(const std::string&, std::vector<uint8_t>&);
std::string TestEncodeHex(const std::vector<uint8_t>&);
qng::Json TestJson(const std::string&);

// calldata of handleOps(ops, beneficiary)
std::vector<uint8_t> TestEncodeHandleOps(const std::vector<qng::UserOperation>&,
                                         const qng::EvmAddress&);

// Answers eth client calls from canned JSON results, per method
class MockEthClient : public qng::EthClient
{
public:
    MockEthClient();
    qng::Error Call(const std::string&, const qng::RpcParams&,
                    qng::Json&) const override;

    void SetResult(const std::string&, const std::string&);
    void SetError(const std::string&, const qng::Error&);
    size_t Calls(const std::string&) const;
    size_t TotalCalls() const;
    std::string LastParams(const std::string&) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> results_;
    std::map<std::string, qng::Error> errors_;
    mutable std::map<std::string, size_t> calls_;
    mutable std::map<std::string, std::string> params_;
};

// JSON-RPC server on an ephemeral loopback port that answers every POST with
// the same body
class StubNode
{
public:
    StubNode(const std::string&);
    ~StubNode();
    qng::Url Url() const;
    std::string LastRequest() const;
    size_t Requests() const;
    void Record(const std::string&);
    const std::string& Response() const;

private:
    boost::asio::io_service service_;
    std::unique_ptr<qng::Rpc> rpc_;
    std::unique_ptr<qng::ServiceRunner> runner_;
    std::string response_;
    mutable std::mutex mutex_;
    std::string last_request_;
    size_t requests_;
};

class StubRpcHandler : public qng::RpcHandler
{
public:
    StubRpcHandler(StubNode&, qng::Rpc&, const std::string&,
                   const boost::asio::ip::address_v4&,
                   const std::function<void(const std::string&)>&);
    void ProcessImpl() override;
    void Response() override;

private:
    StubNode& node_;
};

// HTTP server on an ephemeral loopback port that answers every request with
// a fixed status and body
class StatusNode
{
public:
    StatusNode(boost::beast::http::status, const std::string&);
    ~StatusNode();
    qng::Url Url() const;

private:
    void Accept_();

    boost::asio::io_service service_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::unique_ptr<qng::ServiceRunner> runner_;
    boost::beast::http::status status_;
    std::string body_;
};
