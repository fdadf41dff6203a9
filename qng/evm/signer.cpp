#include <qng/evm/signer.hpp>

#include <qng/evm/crypto.hpp>
#include <qng/common/util.hpp>

qng::Eoa::Eoa()
{
}

qng::ErrorCode qng::Eoa::Init(const std::string& private_key)
{
    bool error = private_key_.DecodeHex(private_key);
    IF_ERROR_RETURN(error, qng::ErrorCode::PRIVATE_KEY);

    error = qng::GeneratePublicKey(private_key_, public_key_);
    if (error)
    {
        private_key_.data_.SecureClear();
        return qng::ErrorCode::PRIVATE_KEY;
    }
    address_ = qng::PublicKeyToAddress(public_key_);
    return qng::ErrorCode::SUCCESS;
}

const qng::EvmAddress& qng::Eoa::Address() const
{
    return address_;
}

const qng::PublicKey& qng::Eoa::PublicKey() const
{
    return public_key_;
}

bool qng::Eoa::Sign(qng::DynamicFeeTx& tx) const
{
    return tx.Sign(private_key_);
}
