#pragma once

#include <memory>
#include <string>
#include <qng/common/errors.hpp>
#include <qng/evm/client.hpp>
#include <qng/evm/signer.hpp>

namespace qng
{
class QngUserOp
{
public:
    QngUserOp();

    // hex, at most 32 bytes, optional 0x prefix
    std::string txid_;
    uint32_t idx_;
    uint64_t fee_;
    std::string sig_;
};

// Submits qng operations to the MeerChange contract on the primary chain.
// Send returns once the transaction is accepted by the node, not mined.
class CrossChainBridge
{
public:
    CrossChainBridge(const std::shared_ptr<qng::Eoa>&,
                     const std::shared_ptr<qng::EthClient>&,
                     const std::string&, uint64_t);
    virtual ~CrossChainBridge() = default;

    virtual qng::Error Send(const qng::QngUserOp&, std::string&) const;

private:
    std::shared_ptr<qng::Eoa> eoa_;
    std::shared_ptr<qng::EthClient> client_;
    std::string meerchange_;
    uint64_t chain_id_;
};
}  // namespace qng
