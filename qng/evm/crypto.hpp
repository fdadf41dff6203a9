#pragma once

#include <string>
#include <vector>
#include <qng/common/numbers.hpp>

namespace qng
{
qng::uint256_union Keccak256(const uint8_t*, size_t);
qng::uint256_union Keccak256(const std::vector<uint8_t>&);
qng::uint256_union Keccak256(const std::string&);

// First four bytes of the keccak hash of a canonical signature,
// e.g. "transfer(address,uint256)"
std::vector<uint8_t> FunctionSelector(const std::string&);

class EcdsaSignature
{
public:
    EcdsaSignature();
    bool operator==(const qng::EcdsaSignature&) const;

    qng::uint256_union r_;
    qng::uint256_union s_;
    // y parity of the nonce point, 0 or 1
    uint8_t recovery_id_;
};

// secp256k1, the signature is normalized to low s
bool GeneratePublicKey(const qng::RawKey&, qng::PublicKey&);
bool SignHash(const qng::RawKey&, const qng::uint256_union&,
              qng::EcdsaSignature&);
bool VerifyHash(const qng::PublicKey&, const qng::uint256_union&,
                const qng::EcdsaSignature&);
bool RecoverPublicKey(const qng::uint256_union&, const qng::EcdsaSignature&,
                      qng::PublicKey&);
bool IsLowS(const qng::EcdsaSignature&);
qng::EvmAddress PublicKeyToAddress(const qng::PublicKey&);
}  // namespace qng
