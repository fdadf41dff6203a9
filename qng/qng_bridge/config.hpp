#pragma once

#include <string>
#include <qng/bridge/providers.hpp>
#include <qng/common/errors.hpp>
#include <qng/common/log.hpp>
#include <qng/common/numbers.hpp>
#include <qng/common/util.hpp>
#include <qng/secure/rpc.hpp>

namespace qng
{
class BridgeConfig
{
public:
    BridgeConfig();
    qng::ErrorCode DeserializeJson(bool&, qng::Ptree&);
    // The private key is written as an empty string
    void SerializeJson(qng::Ptree&) const;
    qng::ErrorCode UpgradeJson(bool&, uint32_t, qng::Ptree&) const;
    bool BridgeEnabled() const;

    static uint32_t constexpr VERSION = 1;
    static uint16_t constexpr DEFAULT_RPC_PORT = 7179;
    static uint64_t constexpr DEFAULT_CHAIN_ID = 813;
    static uint64_t constexpr DEFAULT_BLOCK_RANGE = 2000;
    static uint64_t constexpr DEFAULT_MAX_GAS_LIMIT = 30000000;
    static uint32_t constexpr DEFAULT_IO_THREADS = 4;

    qng::Url qng_url_;
    qng::Url eth_url_;
    uint64_t chain_id_;
    // empty disables cross send
    std::string meerchange_;
    std::string private_key_;
    qng::EvmAddress entry_point_;
    uint64_t block_range_;
    qng::uint256_t max_gas_limit_;
    std::string tracer_;
    uint32_t io_threads_;
    qng::ProvidersConfig providers_;
    qng::RpcConfig rpc_;
    qng::LogConfig log_;
};
}  // namespace qng
