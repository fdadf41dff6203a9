#pragma once

#include <memory>
#include <string>
#include <vector>
#include <qng/common/errors.hpp>
#include <qng/common/numbers.hpp>
#include <qng/evm/client.hpp>
#include <qng/evm/signer.hpp>

namespace qng
{
class TransactOpts
{
public:
    TransactOpts(const qng::Eoa&, uint64_t);

    const qng::Eoa& signer_;
    uint64_t chain_id_;
    qng::uint256_t value_;
};

// Contract at a fixed address, methods are sent as signed dynamic fee
// transactions through the eth client
class BoundContract
{
public:
    BoundContract(const qng::EvmAddress&,
                  const std::shared_ptr<qng::EthClient>&);
    virtual ~BoundContract() = default;

    // Returns the hash reported by eth_sendRawTransaction
    qng::Error Transact(const qng::TransactOpts&, const std::vector<uint8_t>&,
                        qng::uint256_union&) const;
    const qng::EvmAddress& Address() const;

protected:
    qng::EvmAddress address_;
    std::shared_ptr<qng::EthClient> client_;
};

class MeerChange : public qng::BoundContract
{
public:
    MeerChange(const qng::EvmAddress&, const std::shared_ptr<qng::EthClient>&);
    qng::Error Export4337(const qng::TransactOpts&, const qng::uint256_union&,
                          uint32_t, uint64_t, const std::string&,
                          qng::uint256_union&) const;

    static std::string const EXPORT_4337;
};
}  // namespace qng
