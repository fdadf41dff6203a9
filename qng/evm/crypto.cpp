#include <qng/evm/crypto.hpp>

#include <memory>
#include <cryptopp/eccrypto.h>
#include <cryptopp/integer.h>
#include <cryptopp/keccak.h>
#include <cryptopp/nbtheory.h>
#include <cryptopp/oids.h>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>
#include <qng/common/util.hpp>

namespace
{
using Group = CryptoPP::DL_GroupParameters_EC<CryptoPP::ECP>;

class EcKeyDeleter
{
public:
    void operator()(EC_KEY* key) const
    {
        EC_KEY_free(key);
    }
};

class BignumDeleter
{
public:
    void operator()(BIGNUM* bn) const
    {
        BN_clear_free(bn);
    }
};

class EcPointDeleter
{
public:
    void operator()(EC_POINT* point) const
    {
        EC_POINT_free(point);
    }
};

class EcdsaSigDeleter
{
public:
    void operator()(ECDSA_SIG* sig) const
    {
        ECDSA_SIG_free(sig);
    }
};

class BnCtxDeleter
{
public:
    void operator()(BN_CTX* ctx) const
    {
        BN_CTX_free(ctx);
    }
};

// secp256k1 key holding both halves, ECDSA_do_sign wants the public one too
std::unique_ptr<EC_KEY, EcKeyDeleter> MakeEcKey(const qng::RawKey& private_key)
{
    std::unique_ptr<EC_KEY, EcKeyDeleter> key(
        EC_KEY_new_by_curve_name(NID_secp256k1));
    std::unique_ptr<BIGNUM, BignumDeleter> d(
        BN_bin2bn(private_key.data_.bytes.data(),
                  static_cast<int>(private_key.data_.bytes.size()), nullptr));
    std::unique_ptr<BN_CTX, BnCtxDeleter> ctx(BN_CTX_new());
    if (key == nullptr || d == nullptr || ctx == nullptr)
    {
        return nullptr;
    }
    if (EC_KEY_set_private_key(key.get(), d.get()) != 1)
    {
        return nullptr;
    }

    const EC_GROUP* group = EC_KEY_get0_group(key.get());
    std::unique_ptr<EC_POINT, EcPointDeleter> point(EC_POINT_new(group));
    if (point == nullptr
        || EC_POINT_mul(group, point.get(), d.get(), nullptr, nullptr,
                        ctx.get())
               != 1
        || EC_KEY_set_public_key(key.get(), point.get()) != 1)
    {
        return nullptr;
    }
    return key;
}

bool BignumToUint256(const BIGNUM* bn, qng::uint256_union& value)
{
    int size = static_cast<int>(value.bytes.size());
    return BN_bn2binpad(bn, value.bytes.data(), size) != size;
}

CryptoPP::Integer ToInteger(const qng::uint256_union& value)
{
    return CryptoPP::Integer(value.bytes.data(), value.bytes.size());
}

qng::uint256_union FromInteger(const CryptoPP::Integer& value)
{
    qng::uint256_union result;
    value.Encode(result.bytes.data(), result.bytes.size());
    return result;
}

qng::PublicKey FromPoint(const CryptoPP::ECP::Point& point)
{
    qng::PublicKey result;
    result.uint256s[0] = FromInteger(point.x);
    result.uint256s[1] = FromInteger(point.y);
    return result;
}

CryptoPP::ECP::Point ToPoint(const qng::PublicKey& key)
{
    return CryptoPP::ECP::Point(ToInteger(key.uint256s[0]),
                                ToInteger(key.uint256s[1]));
}
}  // namespace

qng::uint256_union qng::Keccak256(const uint8_t* data, size_t size)
{
    qng::uint256_union result;
    CryptoPP::Keccak_256 hash;
    hash.Update(data, size);
    hash.Final(result.bytes.data());
    return result;
}

qng::uint256_union qng::Keccak256(const std::vector<uint8_t>& data)
{
    return qng::Keccak256(data.data(), data.size());
}

qng::uint256_union qng::Keccak256(const std::string& data)
{
    return qng::Keccak256(reinterpret_cast<const uint8_t*>(data.data()),
                          data.size());
}

std::vector<uint8_t> qng::FunctionSelector(const std::string& signature)
{
    qng::uint256_union hash = qng::Keccak256(signature);
    return std::vector<uint8_t>(hash.bytes.begin(), hash.bytes.begin() + 4);
}

qng::EcdsaSignature::EcdsaSignature() : recovery_id_(0)
{
}

bool qng::EcdsaSignature::operator==(const qng::EcdsaSignature& other) const
{
    return r_ == other.r_ && s_ == other.s_
           && recovery_id_ == other.recovery_id_;
}

bool qng::GeneratePublicKey(const qng::RawKey& private_key,
                            qng::PublicKey& public_key)
{
    // curve arithmetic keeps scratch state, not shared between threads
    const Group group(CryptoPP::ASN1::secp256k1());
    CryptoPP::Integer d = ToInteger(private_key.data_);
    if (d.IsZero() || d >= group.GetSubgroupOrder())
    {
        return true;
    }

    public_key = FromPoint(group.ExponentiateBase(d));
    return false;
}

bool qng::SignHash(const qng::RawKey& private_key,
                   const qng::uint256_union& hash,
                   qng::EcdsaSignature& signature)
{
    const Group group(CryptoPP::ASN1::secp256k1());
    const CryptoPP::Integer& n = group.GetSubgroupOrder();
    CryptoPP::Integer d = ToInteger(private_key.data_);
    if (d.IsZero() || d >= n)
    {
        return true;
    }

    qng::PublicKey public_key;
    bool error = qng::GeneratePublicKey(private_key, public_key);
    IF_ERROR_RETURN(error, true);

    auto key = MakeEcKey(private_key);
    if (key == nullptr)
    {
        return true;
    }
    std::unique_ptr<ECDSA_SIG, EcdsaSigDeleter> sig(
        ECDSA_do_sign(hash.bytes.data(), static_cast<int>(hash.bytes.size()),
                      key.get()));
    if (sig == nullptr)
    {
        return true;
    }

    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig.get(), &r, &s);
    qng::EcdsaSignature result;
    error = BignumToUint256(r, result.r_) || BignumToUint256(s, result.s_);
    IF_ERROR_RETURN(error, true);

    CryptoPP::Integer s_value = ToInteger(result.s_);
    if (s_value > (n >> 1))
    {
        result.s_ = FromInteger(n - s_value);
    }

    // an r whose nonce point x is beyond the group order matches neither id
    for (uint8_t id = 0; id < 2; ++id)
    {
        result.recovery_id_ = id;
        qng::PublicKey recovered;
        error = qng::RecoverPublicKey(hash, result, recovered);
        if (!error && recovered == public_key)
        {
            signature = result;
            return false;
        }
    }
    return true;
}

bool qng::VerifyHash(const qng::PublicKey& public_key,
                     const qng::uint256_union& hash,
                     const qng::EcdsaSignature& signature)
{
    const Group group(CryptoPP::ASN1::secp256k1());
    const CryptoPP::Integer& n = group.GetSubgroupOrder();
    CryptoPP::Integer r = ToInteger(signature.r_);
    CryptoPP::Integer s = ToInteger(signature.s_);
    if (r.IsZero() || r >= n || s.IsZero() || s >= n)
    {
        return false;
    }

    CryptoPP::ECP::Point q = ToPoint(public_key);
    if (!group.GetCurve().VerifyPoint(q))
    {
        return false;
    }

    CryptoPP::Integer z = ToInteger(hash) % n;
    CryptoPP::Integer w = s.InverseMod(n);
    CryptoPP::Integer u1 = CryptoPP::a_times_b_mod_c(z, w, n);
    CryptoPP::Integer u2 = CryptoPP::a_times_b_mod_c(r, w, n);
    const CryptoPP::ECP& curve = group.GetCurve();
    CryptoPP::ECP::Point point =
        curve.Add(group.ExponentiateBase(u1), curve.ScalarMultiply(q, u2));
    if (point.identity)
    {
        return false;
    }
    return point.x % n == r;
}

bool qng::RecoverPublicKey(const qng::uint256_union& hash,
                           const qng::EcdsaSignature& signature,
                           qng::PublicKey& public_key)
{
    const Group group(CryptoPP::ASN1::secp256k1());
    const CryptoPP::ECP& curve = group.GetCurve();
    const CryptoPP::Integer& n = group.GetSubgroupOrder();
    const CryptoPP::Integer& p = curve.GetField().GetModulus();
    CryptoPP::Integer r = ToInteger(signature.r_);
    CryptoPP::Integer s = ToInteger(signature.s_);
    if (r.IsZero() || r >= n || s.IsZero() || s >= n
        || signature.recovery_id_ > 1)
    {
        return true;
    }

    // y^2 = x^3 + 7, p = 3 mod 4
    CryptoPP::Integer alpha =
        (CryptoPP::a_exp_b_mod_c(r, 3, p) + CryptoPP::Integer(7)) % p;
    CryptoPP::Integer y = CryptoPP::a_exp_b_mod_c(
        alpha, (p + CryptoPP::Integer::One()) >> 2, p);
    if (CryptoPP::a_times_b_mod_c(y, y, p) != alpha)
    {
        return true;
    }
    if (y.IsOdd() != (signature.recovery_id_ == 1))
    {
        y = p - y;
    }

    CryptoPP::ECP::Point point(r, y);
    CryptoPP::Integer z = ToInteger(hash) % n;
    CryptoPP::Integer r_inv = r.InverseMod(n);
    CryptoPP::Integer u1 = CryptoPP::a_times_b_mod_c((n - z) % n, r_inv, n);
    CryptoPP::Integer u2 = CryptoPP::a_times_b_mod_c(s, r_inv, n);
    CryptoPP::ECP::Point q =
        curve.Add(group.ExponentiateBase(u1), curve.ScalarMultiply(point, u2));
    if (q.identity)
    {
        return true;
    }

    public_key = FromPoint(q);
    return false;
}

bool qng::IsLowS(const qng::EcdsaSignature& signature)
{
    const Group group(CryptoPP::ASN1::secp256k1());
    const CryptoPP::Integer& n = group.GetSubgroupOrder();
    return ToInteger(signature.s_) <= (n >> 1);
}

qng::EvmAddress qng::PublicKeyToAddress(const qng::PublicKey& public_key)
{
    qng::uint256_union hash =
        qng::Keccak256(public_key.bytes.data(), public_key.bytes.size());
    qng::EvmAddress address;
    address.FromWord(hash);
    return address;
}
