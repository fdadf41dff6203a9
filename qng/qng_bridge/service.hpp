#pragma once

#include <memory>
#include <qng/bridge/adapter.hpp>
#include <qng/bridge/providers.hpp>
#include <qng/evm/gas.hpp>
#include <qng/qng_bridge/config.hpp>
#include <qng/secure/rpc.hpp>

namespace qng
{
// Components served by the bridge's JSON-RPC endpoint
class BridgeService
{
public:
    BridgeService(const qng::BridgeConfig&,
                  const std::shared_ptr<qng::RpcAdapter>&,
                  const qng::Providers&);
    qng::RpcHandlerMaker RpcHandlerMaker();

    std::shared_ptr<qng::RpcAdapter> adapter_;
    qng::Providers providers_;
    qng::GasOverhead overhead_;
    qng::EvmAddress entry_point_;
    uint64_t chain_id_;
    uint64_t block_range_;
};

class BridgeRpcHandler : public qng::RpcHandler
{
public:
    BridgeRpcHandler(qng::BridgeService&, qng::Rpc&, const std::string&,
                     const boost::asio::ip::address_v4&,
                     const std::function<void(const std::string&)>&);
    virtual ~BridgeRpcHandler() = default;

    void ProcessImpl() override;

    void BridgeStats();
    void BridgeStop();
    void BundlerGasPrices();
    void EstimateUserOperationGas();
    void GetUserOperationByHash();
    void GetUserOperationReceipt();
    void MaxPriorityFeePerGas();
    void QngAddBalance();
    void QngCrossSend();
    void QngGetBalance();
    void QngGetUtxos();
    void QngSendRawTransaction();

private:
    bool GetHash_(size_t, qng::uint256_union&);
    bool GetEntryPoint_(size_t, qng::EvmAddress&);

    qng::BridgeService& service_;
};
}  // namespace qng
