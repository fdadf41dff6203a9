#include <gtest/gtest.h>
#include <qng/core_test/test_util.hpp>
#include <qng/evm/signer.hpp>
#include <qng/evm/transaction.hpp>

namespace
{
qng::DynamicFeeTx TestTransaction()
{
    qng::DynamicFeeTx tx;
    tx.chain_id_ = 813;
    tx.nonce_ = 5;
    tx.max_priority_fee_per_gas_ = 10;
    tx.max_fee_per_gas_ = 100;
    tx.gas_ = 60000;
    tx.to_.DecodeHex("0x5FF137D4b0FDCD49DcA30c7CF57E578a026d2789");
    tx.value_ = 0;
    tx.data_ = {0xde, 0xad, 0xbe, 0xef};
    return tx;
}
}  // namespace

TEST(DynamicFeeTx, SigningPayload)
{
    qng::DynamicFeeTx tx = TestTransaction();
    std::vector<uint8_t> payload = tx.SigningPayload();
    ASSERT_FALSE(payload.empty());
    ASSERT_EQ(qng::DynamicFeeTx::TYPE, payload[0]);
    // list prefix follows the type byte
    ASSERT_GE(payload[1], 0xc0);
    ASSERT_EQ(qng::Keccak256(payload), tx.SigningHash());
}

TEST(DynamicFeeTx, SignAndRecover)
{
    qng::Eoa eoa;
    ASSERT_EQ(
        qng::ErrorCode::SUCCESS,
        eoa.Init("0x4646464646464646464646464646464646464646464646464646464646464646"));

    qng::DynamicFeeTx tx = TestTransaction();
    ASSERT_FALSE(eoa.Sign(tx));
    ASSERT_TRUE(qng::IsLowS(tx.signature_));

    std::vector<uint8_t> raw = tx.Serialize();
    ASSERT_EQ(0x02, raw[0]);
    ASSERT_EQ(qng::Keccak256(raw), tx.Hash());

    qng::PublicKey recovered;
    ASSERT_FALSE(
        qng::RecoverPublicKey(tx.SigningHash(), tx.signature_, recovered));
    ASSERT_EQ(eoa.PublicKey(), recovered);
    ASSERT_EQ(eoa.Address(), qng::PublicKeyToAddress(recovered));
}

TEST(DynamicFeeTx, HashChangesWithNonce)
{
    qng::DynamicFeeTx a = TestTransaction();
    qng::DynamicFeeTx b = TestTransaction();
    b.nonce_ = 6;
    ASSERT_NE(a.SigningHash(), b.SigningHash());
}
