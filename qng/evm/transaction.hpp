#pragma once

#include <vector>
#include <qng/common/numbers.hpp>
#include <qng/evm/crypto.hpp>
#include <qng/evm/rlp.hpp>

namespace qng
{
// EIP-1559 transaction, type 0x02, with an empty access list
class DynamicFeeTx
{
public:
    DynamicFeeTx();
    std::vector<uint8_t> SigningPayload() const;
    qng::uint256_union SigningHash() const;
    bool Sign(const qng::RawKey&);
    // Signed envelope as sent with eth_sendRawTransaction
    std::vector<uint8_t> Serialize() const;
    qng::uint256_union Hash() const;

    uint64_t chain_id_;
    uint64_t nonce_;
    qng::uint256_t max_priority_fee_per_gas_;
    qng::uint256_t max_fee_per_gas_;
    uint64_t gas_;
    qng::EvmAddress to_;
    qng::uint256_t value_;
    std::vector<uint8_t> data_;
    qng::EcdsaSignature signature_;

    static uint8_t constexpr TYPE = 0x02;

private:
    qng::RlpStream Fields_() const;
};
}  // namespace qng
