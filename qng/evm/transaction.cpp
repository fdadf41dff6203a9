#include <qng/evm/transaction.hpp>

uint8_t constexpr qng::DynamicFeeTx::TYPE;

qng::DynamicFeeTx::DynamicFeeTx()
    : chain_id_(0),
      nonce_(0),
      max_priority_fee_per_gas_(0),
      max_fee_per_gas_(0),
      gas_(0),
      value_(0)
{
}

qng::RlpStream qng::DynamicFeeTx::Fields_() const
{
    qng::RlpStream stream;
    stream.AppendUint(chain_id_)
        .AppendUint(nonce_)
        .AppendUint(max_priority_fee_per_gas_)
        .AppendUint(max_fee_per_gas_)
        .AppendUint(gas_)
        .AppendAddress(to_)
        .AppendUint(value_)
        .AppendBytes(data_)
        .AppendList(qng::RlpStream());
    return stream;
}

std::vector<uint8_t> qng::DynamicFeeTx::SigningPayload() const
{
    std::vector<uint8_t> payload(1, TYPE);
    std::vector<uint8_t> rlp = Fields_().Encode();
    payload.insert(payload.end(), rlp.begin(), rlp.end());
    return payload;
}

qng::uint256_union qng::DynamicFeeTx::SigningHash() const
{
    return qng::Keccak256(SigningPayload());
}

bool qng::DynamicFeeTx::Sign(const qng::RawKey& key)
{
    return qng::SignHash(key, SigningHash(), signature_);
}

std::vector<uint8_t> qng::DynamicFeeTx::Serialize() const
{
    qng::RlpStream stream = Fields_();
    stream.AppendUint(signature_.recovery_id_)
        .AppendUint(signature_.r_.Number())
        .AppendUint(signature_.s_.Number());

    std::vector<uint8_t> envelope(1, TYPE);
    std::vector<uint8_t> rlp = stream.Encode();
    envelope.insert(envelope.end(), rlp.begin(), rlp.end());
    return envelope;
}

qng::uint256_union qng::DynamicFeeTx::Hash() const
{
    return qng::Keccak256(Serialize());
}
