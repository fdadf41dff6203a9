#pragma once

#include <string>
#include <qng/common/errors.hpp>
#include <qng/common/numbers.hpp>
#include <qng/evm/transaction.hpp>

namespace qng
{
// Externally owned account. The private key never leaves this object.
class Eoa
{
public:
    Eoa();
    Eoa(const qng::Eoa&) = delete;
    qng::ErrorCode Init(const std::string&);
    const qng::EvmAddress& Address() const;
    const qng::PublicKey& PublicKey() const;
    bool Sign(qng::DynamicFeeTx&) const;

private:
    qng::RawKey private_key_;
    qng::PublicKey public_key_;
    qng::EvmAddress address_;
};
}  // namespace qng
