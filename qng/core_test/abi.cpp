#include <gtest/gtest.h>
#include <qng/core_test/test_util.hpp>
#include <qng/evm/abi.hpp>
#include <qng/evm/crypto.hpp>

TEST(Abi, StaticCall)
{
    qng::AbiEncoder encoder;
    encoder.Uint(69).Bool(true);
    std::vector<uint8_t> call =
        encoder.EncodeCall(qng::FunctionSelector("baz(uint32,bool)"));
    ASSERT_EQ(
        "cdcd77c0"
        "0000000000000000000000000000000000000000000000000000000000000045"
        "0000000000000000000000000000000000000000000000000000000000000001",
        TestEncodeHex(call));
}

TEST(Abi, DynamicString)
{
    qng::AbiEncoder encoder;
    encoder.Uint(7).String("hello");
    std::vector<uint8_t> data = encoder.Encode();
    ASSERT_EQ(
        "0000000000000000000000000000000000000000000000000000000000000007"
        "0000000000000000000000000000000000000000000000000000000000000040"
        "0000000000000000000000000000000000000000000000000000000000000005"
        "68656c6c6f000000000000000000000000000000000000000000000000000000",
        TestEncodeHex(data));

    qng::AbiDecoder decoder(data);
    uint64_t number = 0;
    ASSERT_FALSE(decoder.Uint64(0, number));
    ASSERT_EQ(7, number);
    std::string text;
    ASSERT_FALSE(decoder.String(1, text));
    ASSERT_EQ("hello", text);
}

TEST(Abi, AddressAndBytes)
{
    qng::EvmAddress address;
    ASSERT_FALSE(address.DecodeHex("0x9d8a62f656a8d1615c1294fd71e9cfb3e4855a4f"));
    std::vector<uint8_t> payload = {1, 2, 3};

    qng::AbiEncoder encoder;
    encoder.Address(address).Bytes(payload);
    std::vector<uint8_t> data = encoder.Encode();

    qng::AbiDecoder decoder(data);
    qng::EvmAddress decoded;
    ASSERT_FALSE(decoder.Address(0, decoded));
    ASSERT_EQ(address, decoded);
    std::vector<uint8_t> bytes;
    ASSERT_FALSE(decoder.Bytes(1, bytes));
    ASSERT_EQ(payload, bytes);
}

TEST(Abi, Truncated)
{
    std::vector<uint8_t> data(31, 0);
    qng::AbiDecoder decoder(data);
    qng::uint256_t value;
    ASSERT_TRUE(decoder.Uint(0, value));

    std::vector<uint8_t> offset(32, 0);
    offset[31] = 0xff;
    qng::AbiDecoder bad(offset);
    std::vector<uint8_t> bytes;
    ASSERT_TRUE(bad.Bytes(0, bytes));
}

TEST(Abi, Uint64Overflow)
{
    qng::AbiEncoder encoder;
    encoder.Uint(qng::uint256_t(1) << 64);
    std::vector<uint8_t> data = encoder.Encode();
    qng::AbiDecoder decoder(data);
    uint64_t value = 0;
    ASSERT_TRUE(decoder.Uint64(0, value));
}
