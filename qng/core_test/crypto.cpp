#include <gtest/gtest.h>
#include <qng/core_test/test_util.hpp>
#include <qng/evm/crypto.hpp>
#include <qng/evm/signer.hpp>

namespace
{
std::string const TEST_KEY =
    "0x4646464646464646464646464646464646464646464646464646464646464646";
}

TEST(Crypto, Keccak256)
{
    ASSERT_EQ(
        "0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470",
        qng::Keccak256(std::string()).StringEvmHex());
    ASSERT_EQ(qng::Keccak256(std::string("abc")),
              qng::Keccak256(std::vector<uint8_t>{'a', 'b', 'c'}));
}

TEST(Crypto, FunctionSelector)
{
    ASSERT_EQ("a9059cbb",
              TestEncodeHex(qng::FunctionSelector("transfer(address,uint256)")));
    ASSERT_EQ("cdcd77c0",
              TestEncodeHex(qng::FunctionSelector("baz(uint32,bool)")));
}

TEST(Crypto, Address)
{
    qng::RawKey key;
    ASSERT_FALSE(key.DecodeHex(TEST_KEY));
    qng::PublicKey public_key;
    ASSERT_FALSE(qng::GeneratePublicKey(key, public_key));
    ASSERT_EQ("0x9d8a62f656a8d1615c1294fd71e9cfb3e4855a4f",
              qng::PublicKeyToAddress(public_key).StringHex());
}

TEST(Crypto, InvalidKey)
{
    qng::RawKey zero;
    qng::PublicKey public_key;
    ASSERT_TRUE(qng::GeneratePublicKey(zero, public_key));

    qng::Eoa eoa;
    ASSERT_EQ(qng::ErrorCode::PRIVATE_KEY, eoa.Init("0x1234"));
    ASSERT_EQ(qng::ErrorCode::PRIVATE_KEY, eoa.Init(std::string(64, '0')));
}

TEST(Crypto, SignRecover)
{
    qng::RawKey key;
    ASSERT_FALSE(key.DecodeHex(TEST_KEY));
    qng::PublicKey public_key;
    ASSERT_FALSE(qng::GeneratePublicKey(key, public_key));

    qng::uint256_union hash = qng::Keccak256(std::string("qng"));
    qng::EcdsaSignature signature;
    ASSERT_FALSE(qng::SignHash(key, hash, signature));
    ASSERT_TRUE(qng::IsLowS(signature));
    ASSERT_LE(signature.recovery_id_, 1);
    ASSERT_TRUE(qng::VerifyHash(public_key, hash, signature));

    qng::PublicKey recovered;
    ASSERT_FALSE(qng::RecoverPublicKey(hash, signature, recovered));
    ASSERT_EQ(public_key, recovered);

    qng::uint256_union other = qng::Keccak256(std::string("meer"));
    ASSERT_FALSE(qng::VerifyHash(public_key, other, signature));
}

TEST(Crypto, SignManyHashes)
{
    qng::RawKey key;
    ASSERT_FALSE(key.DecodeHex(TEST_KEY));
    qng::PublicKey public_key;
    ASSERT_FALSE(qng::GeneratePublicKey(key, public_key));

    bool recovery_ids[2] = {false, false};
    for (int i = 0; i < 32; ++i)
    {
        qng::uint256_union hash = qng::Keccak256(qng::ToString("op", i));
        qng::EcdsaSignature signature;
        ASSERT_FALSE(qng::SignHash(key, hash, signature));
        ASSERT_TRUE(qng::IsLowS(signature));
        ASSERT_TRUE(qng::VerifyHash(public_key, hash, signature));

        qng::PublicKey recovered;
        ASSERT_FALSE(qng::RecoverPublicKey(hash, signature, recovered));
        ASSERT_EQ(public_key, recovered);
        recovery_ids[signature.recovery_id_] = true;
    }
    ASSERT_TRUE(recovery_ids[0]);
    ASSERT_TRUE(recovery_ids[1]);
}

TEST(Crypto, SignInvalidKey)
{
    qng::uint256_union hash = qng::Keccak256(std::string("qng"));
    qng::EcdsaSignature signature;
    qng::RawKey zero;
    ASSERT_TRUE(qng::SignHash(zero, hash, signature));

    // the secp256k1 group order
    qng::RawKey order;
    ASSERT_FALSE(order.DecodeHex(
        "0xfffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141"));
    ASSERT_TRUE(qng::SignHash(order, hash, signature));
}

TEST(Crypto, Eoa)
{
    qng::Eoa eoa;
    ASSERT_EQ(qng::ErrorCode::SUCCESS, eoa.Init(TEST_KEY));
    ASSERT_EQ("0x9d8a62f656a8d1615c1294fd71e9cfb3e4855a4f",
              eoa.Address().StringHex());
}
