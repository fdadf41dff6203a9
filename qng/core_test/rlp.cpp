#include <gtest/gtest.h>
#include <qng/core_test/test_util.hpp>
#include <qng/evm/rlp.hpp>

TEST(Rlp, Strings)
{
    qng::RlpStream stream;
    stream.AppendString("dog");
    ASSERT_EQ("83646f67", TestEncodeHex(stream.Bytes()));

    qng::RlpStream empty;
    empty.AppendString("");
    ASSERT_EQ("80", TestEncodeHex(empty.Bytes()));
}

TEST(Rlp, SingleByte)
{
    ASSERT_EQ("0f", TestEncodeHex(qng::RlpEncodeBytes({0x0f})));
    ASSERT_EQ("8180", TestEncodeHex(qng::RlpEncodeBytes({0x80})));
}

TEST(Rlp, Uints)
{
    ASSERT_EQ("80", TestEncodeHex(qng::RlpEncodeUint(0)));
    ASSERT_EQ("01", TestEncodeHex(qng::RlpEncodeUint(1)));
    ASSERT_EQ("820400", TestEncodeHex(qng::RlpEncodeUint(1024)));
}

TEST(Rlp, Lists)
{
    qng::RlpStream list;
    list.AppendString("cat").AppendString("dog");
    ASSERT_EQ("c88363617483646f67", TestEncodeHex(list.Encode()));

    qng::RlpStream empty;
    ASSERT_EQ("c0", TestEncodeHex(empty.Encode()));

    qng::RlpStream outer;
    outer.AppendList(empty).AppendUint(1);
    ASSERT_EQ("c2c001", TestEncodeHex(outer.Encode()));
}

TEST(Rlp, LongString)
{
    std::string text(56, 'a');
    qng::RlpStream stream;
    stream.AppendString(text);
    const std::vector<uint8_t>& bytes = stream.Bytes();
    ASSERT_EQ(58, bytes.size());
    ASSERT_EQ(0xb8, bytes[0]);
    ASSERT_EQ(56, bytes[1]);
}
