#include <gtest/gtest.h>
#include <qng/core_test/test_util.hpp>
#include <qng/common/errors.hpp>
#include <qng/common/numbers.hpp>
#include <qng/common/stat.hpp>
#include <qng/common/util.hpp>

TEST(CommonUtil, HexToBytes)
{
    std::vector<uint8_t> bytes;
    ASSERT_EQ(false, qng::HexToBytes("00ff7A", bytes));
    ASSERT_EQ(3, bytes.size());
    ASSERT_EQ(0x00, bytes[0]);
    ASSERT_EQ(0xff, bytes[1]);
    ASSERT_EQ(0x7a, bytes[2]);
    ASSERT_EQ("00FF7A", qng::BytesToHex(bytes.data(), bytes.size()));

    bytes.clear();
    ASSERT_EQ(true, qng::HexToBytes("abc", bytes));
    ASSERT_EQ(true, qng::HexToBytes("zz", bytes));
    ASSERT_EQ(false, qng::HexToBytes("", bytes));
    ASSERT_TRUE(bytes.empty());
}

TEST(CommonUtil, EvmHex)
{
    std::vector<uint8_t> bytes;
    ASSERT_EQ(false, qng::EvmHexToBytes("0xDEADbeef", bytes));
    ASSERT_EQ("0xdeadbeef", qng::BytesToEvmHex(bytes));
    bytes.clear();
    ASSERT_EQ(false, qng::EvmHexToBytes("deadbeef", bytes));
    ASSERT_EQ(4, bytes.size());
    ASSERT_EQ("0x", qng::BytesToEvmHex(std::vector<uint8_t>()));

    uint64_t value = 1;
    ASSERT_EQ("0x0", qng::Uint64ToEvmHex(0));
    ASSERT_EQ("0x400", qng::Uint64ToEvmHex(1024));
    ASSERT_EQ(false, qng::EvmHexToUint64("0x0", value));
    ASSERT_EQ(0, value);
    ASSERT_EQ(false, qng::EvmHexToUint64("0xffffffffffffffff", value));
    ASSERT_EQ(std::numeric_limits<uint64_t>::max(), value);
    ASSERT_EQ(true, qng::EvmHexToUint64("0x10000000000000000", value));
    ASSERT_EQ(true, qng::EvmHexToUint64("100", value));
    ASSERT_EQ(true, qng::EvmHexToUint64("0x", value));
    ASSERT_EQ(true, qng::EvmHexToUint64("0xg1", value));
}

TEST(CommonUtil, StringToUint)
{
    uint16_t u16 = 0;
    ASSERT_EQ(false, qng::StringToUint("65535", u16));
    ASSERT_EQ(65535, u16);
    ASSERT_EQ(true, qng::StringToUint("65536", u16));
    ASSERT_EQ(true, qng::StringToUint("012", u16));
    ASSERT_EQ(true, qng::StringToUint("-1", u16));
    ASSERT_EQ(true, qng::StringToUint("", u16));
}

TEST(CommonUtil, Url)
{
    qng::Url url;
    ASSERT_EQ(false, url.Parse("http://127.0.0.1:18131"));
    ASSERT_EQ("127.0.0.1", url.host_);
    ASSERT_EQ(18131, url.port_);
    ASSERT_EQ("/", url.path_);
    ASSERT_FALSE(url.Ssl());
    ASSERT_EQ("http://127.0.0.1:18131", url.String());

    ASSERT_EQ(false, url.Parse("https://rpc.example.org/v1/qng"));
    ASSERT_EQ("rpc.example.org", url.host_);
    ASSERT_EQ(443, url.port_);
    ASSERT_EQ("/v1/qng", url.path_);
    ASSERT_TRUE(url.Ssl());
    ASSERT_EQ("https://rpc.example.org/v1/qng", url.String());

    ASSERT_EQ(true, url.Parse("ws://127.0.0.1:1234"));
    ASSERT_EQ(true, url.Parse("http://127.0.0.1:"));
    ASSERT_EQ(true, url.Parse("http://:80"));
}

TEST(CommonUtil, Numbers)
{
    qng::uint256_union hash;
    ASSERT_EQ(false,
              hash.DecodeEvmHex("0x00000000000000000000000000000000000000000"
                                "00000000000000000000400"));
    ASSERT_EQ(qng::uint256_t(1024), hash.Number());
    ASSERT_EQ(true, hash.DecodeEvmHex("0x0400"));

    ASSERT_EQ(false, hash.DecodeEvmHexPadded("0x0400"));
    ASSERT_EQ(qng::uint256_t(1024), hash.Number());
    ASSERT_EQ(true, hash.DecodeEvmHexPadded("zz"));
    ASSERT_EQ(true, hash.DecodeEvmHexPadded(std::string(66, 'a')));

    qng::EvmAddress address;
    ASSERT_EQ(false,
              address.DecodeHex("0x9D8A62F656A8D1615C1294FD71E9CFB3E4855A4F"));
    ASSERT_EQ("0x9d8a62f656a8d1615c1294fd71e9cfb3e4855a4f",
              address.StringHex());
    ASSERT_EQ(true, address.DecodeHex("0x9d8a62f656a8d1615c1294fd71e9cfb3"));

    qng::EvmAddress from_word;
    from_word.FromWord(address.ToWord());
    ASSERT_EQ(address, from_word);

    qng::uint256_t value;
    ASSERT_EQ("0x0", qng::EncodeEvmQuantity(0));
    ASSERT_EQ("0x5208", qng::EncodeEvmQuantity(21000));
    ASSERT_EQ(false, qng::DecodeEvmQuantity("0x5208", value));
    ASSERT_EQ(qng::uint256_t(21000), value);
    ASSERT_EQ(true, qng::DecodeEvmQuantity("21000", value));
}

TEST(CommonUtil, ErrorKinds)
{
    ASSERT_EQ(qng::ErrorKind::NONE, qng::Error().Kind());
    ASSERT_FALSE(static_cast<bool>(qng::Error()));
    ASSERT_EQ(qng::ErrorKind::TRANSPORT,
              qng::Error(qng::ErrorCode::TCP_CONNECT).Kind());
    ASSERT_EQ(qng::ErrorKind::PROTOCOL,
              qng::Error(qng::ErrorCode::JSON_RPC_EMPTY_RESPONSE).Kind());
    ASSERT_EQ(qng::ErrorKind::RPC,
              qng::Error(qng::ErrorCode::JSON_RPC_ERROR).Kind());
    ASSERT_EQ(qng::ErrorKind::ENCODING,
              qng::Error(qng::ErrorCode::HEX_STRING).Kind());
    ASSERT_EQ(qng::ErrorKind::SUBMISSION,
              qng::Error(qng::ErrorCode::BRIDGE_SUBMIT).Kind());
    ASSERT_EQ(qng::ErrorKind::CONFIG,
              qng::Error(qng::ErrorCode::BRIDGE_NOT_CONFIGURED).Kind());

    qng::Error error(qng::ErrorCode::JSON_RPC_ERROR, "bad address");
    ASSERT_EQ("bad address", error.Message());
    ASSERT_TRUE(error == qng::ErrorCode::JSON_RPC_ERROR);
    ASSERT_EQ("network request exception",
              qng::Error(qng::ErrorCode::JSON_RPC_EMPTY_RESPONSE).Message());
}

TEST(CommonUtil, Stats)
{
    qng::Stats::Reset(qng::ErrorCode::WRITE_FILE);
    for (size_t i = 0; i < qng::StatEntry::MAX_DETAILS + 2; ++i)
    {
        qng::Stats::Add(qng::ErrorCode::WRITE_FILE, "detail ", i);
    }
    ASSERT_EQ(qng::StatEntry::MAX_DETAILS + 2,
              qng::Stats::Get(qng::ErrorCode::WRITE_FILE));

    bool found = false;
    for (const auto& i : qng::Stats::GetAll())
    {
        if (i.index_ != qng::ErrorCode::WRITE_FILE)
        {
            continue;
        }
        found = true;
        ASSERT_EQ(qng::StatEntry::MAX_DETAILS, i.details_.size());
    }
    ASSERT_TRUE(found);

    qng::Json json;
    qng::Stats::SerializeJson(json);
    ASSERT_TRUE(json["errors"].is_array());
    bool serialized = false;
    for (const auto& i : json["errors"])
    {
        if (i.at("code") == static_cast<int>(qng::ErrorCode::WRITE_FILE))
        {
            serialized = true;
            ASSERT_EQ(qng::StatEntry::MAX_DETAILS + 2,
                      i.at("count").get<uint64_t>());
            ASSERT_EQ(qng::StatEntry::MAX_DETAILS, i.at("details").size());
        }
    }
    ASSERT_TRUE(serialized);

    qng::Stats::Reset(qng::ErrorCode::WRITE_FILE);
    ASSERT_EQ(0, qng::Stats::Get(qng::ErrorCode::WRITE_FILE));
}
