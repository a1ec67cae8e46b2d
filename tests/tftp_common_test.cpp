#include <gtest/gtest.h>

#include "tftp_common.hpp"

#include <string>
#include <vector>

namespace {

std::vector<char> bytes(const std::string &s) {
    return std::vector<char>(s.begin(), s.end());
}

TEST(PacketCreationTest, DataPacketCarriesBigEndianBlockNumber) {
    const char payload[] = {'a', 'b', 'c'};
    std::vector<char> packet = create_data_packet(0x1234, payload, sizeof(payload));

    EXPECT_EQ(bytes(std::string("\x00\x03\x12\x34" "abc", 7)), packet);
}

TEST(PacketCreationTest, EmptyDataPacketIsHeaderOnly) {
    std::vector<char> packet = create_data_packet(7, nullptr, 0);

    EXPECT_EQ(bytes(std::string("\x00\x03\x00\x07", 4)), packet);
}

TEST(PacketCreationTest, DataPacketRejectsOversizedPayload) {
    std::vector<char> payload(MAX_BLOCK_SIZE + 1);

    EXPECT_THROW(create_data_packet(1, payload.data(), payload.size()), std::length_error);
}

TEST(PacketCreationTest, OackNamesBlockSizeInDecimal) {
    EXPECT_EQ(bytes(std::string("\x00\x06" "blksize\x00" "1428\x00", 15)), create_oack_packet(1428));
}

TEST(PacketParsingTest, AckIsParsedFromAtLeastFourBytes) {
    const std::string raw("\x00\x04\xff\xfe", 4);
    uint16_t block = 0;

    ASSERT_TRUE(parse_ack_packet(raw.data(), raw.size(), block));
    EXPECT_EQ(0xfffe, block);

    EXPECT_FALSE(parse_ack_packet(raw.data(), 3, block));
}

TEST(PacketParsingTest, OtherOpcodesAreNotAcks) {
    const std::string raw("\x00\x03\x00\x01", 4);
    uint16_t block = 0;

    EXPECT_FALSE(parse_ack_packet(raw.data(), raw.size(), block));
}

TEST(PacketParsingTest, ShortBufferHasNoOpcode) {
    EXPECT_EQ(0, get_opcode("\x00", 1));
    EXPECT_EQ(TFTP_OPCODE_RRQ, get_opcode("\x00\x01", 2));
}

TEST(PacketParsingTest, StartsWithNeedsTheWholePrefix) {
    std::vector<char> prefix = create_rrq_packet("digicap.dav");
    std::vector<char> full = prefix;
    full.push_back('x');

    EXPECT_TRUE(starts_with(full.data(), full.size(), prefix));
    EXPECT_TRUE(starts_with(prefix.data(), prefix.size(), prefix));
    EXPECT_FALSE(starts_with(prefix.data(), prefix.size() - 1, prefix));
}

TEST(RequestOptionsTest, ParsesKeyValuePairsAfterMode) {
    const std::string raw("\x00\x01" "digicap.dav\x00" "octet\x00" "blksize\x00" "1024\x00" "tsize\x00" "0\x00", 41);

    ClientOptions options = parse_request_options(raw.data(), raw.size());

    ASSERT_EQ(2u, options.size());
    EXPECT_EQ("1024", options["blksize"]);
    EXPECT_EQ("0", options["tsize"]);
}

TEST(RequestOptionsTest, KeysAreLowerCasedAndLastValueWins) {
    const std::string raw("\x00\x01" "f\x00" "octet\x00" "BLKSIZE\x00" "8\x00" "blksize\x00" "16\x00", 31);

    ClientOptions options = parse_request_options(raw.data(), raw.size());

    ASSERT_EQ(1u, options.size());
    EXPECT_EQ("16", options["blksize"]);
}

TEST(RequestOptionsTest, UnpairedTrailingKeyAndEmptyKeysAreDropped) {
    const std::string raw("\x00\x01" "f\x00" "octet\x00" "\x00" "x\x00" "tsize", 18);

    ClientOptions options = parse_request_options(raw.data(), raw.size());

    EXPECT_TRUE(options.empty());
}

TEST(RequestOptionsTest, MissingModeMarkerYieldsNoOptions) {
    const std::string raw("\x00\x01" "f\x00" "netascii\x00" "blksize\x00" "1024\x00", 26);

    EXPECT_TRUE(parse_request_options(raw.data(), raw.size()).empty());
}

TEST(RequestOptionsTest, UndecodableBytesAreDropped) {
    const std::string raw("\x00\x01" "f\x00" "octet\x00" "k\xff\x00" "v\x80\x00", 16);

    ClientOptions options = parse_request_options(raw.data(), raw.size());

    ASSERT_EQ(1u, options.size());
    EXPECT_EQ("v", options["k"]);
}

TEST(RequestOptionsTest, BlksizeWithTrailingInvalidByteStillParses) {
    const std::string raw("\x00\x01" "f\x00" "octet\x00" "blksize\x00" "1024\xff\x00", 24);

    ClientOptions options = parse_request_options(raw.data(), raw.size());

    EXPECT_EQ("1024", options["blksize"]);
    EXPECT_EQ(1024u, parse_block_size(options["blksize"]).value());
}

TEST(Utf8FilterTest, KeepsWellFormedSequences) {
    const std::string text("a\xc3\xa9\xe2\x82\xac\xf0\x9f\x98\x80z");

    EXPECT_EQ(text, drop_invalid_utf8(text));
}

TEST(Utf8FilterTest, DropsMalformedSequences) {
    // Overlong '/', a surrogate, a truncated euro sign and a stray continuation.
    const std::string text("1\xc0\xaf" "2\xed\xa0\x80" "3\xe2\x82" "4\x80");

    EXPECT_EQ("1234", drop_invalid_utf8(text));
}

TEST(BlockSizeTest, AcceptsValuesInRange) {
    EXPECT_EQ(8u, parse_block_size("8").value());
    EXPECT_EQ(512u, parse_block_size("512").value());
    EXPECT_EQ(65464u, parse_block_size("65464").value());
}

TEST(BlockSizeTest, ToleratesWhitespaceAndPlusSign) {
    EXPECT_EQ(1024u, parse_block_size(" 1024 ").value());
    EXPECT_EQ(1024u, parse_block_size("+1024").value());
}

TEST(BlockSizeTest, RejectsOutOfRangeAndGarbage) {
    EXPECT_FALSE(parse_block_size("7"));
    EXPECT_FALSE(parse_block_size("65465"));
    EXPECT_FALSE(parse_block_size("4"));
    EXPECT_FALSE(parse_block_size(""));
    EXPECT_FALSE(parse_block_size("+"));
    EXPECT_FALSE(parse_block_size("-512"));
    EXPECT_FALSE(parse_block_size("1e3"));
    EXPECT_FALSE(parse_block_size("99999999999999999999999"));
}

TEST(AddressTest, RoundTripsDottedQuad) {
    sockaddr_in addr = make_address("192.0.0.128", 69);

    EXPECT_EQ("192.0.0.128", address_ip(addr));
    EXPECT_EQ("192.0.0.128:69", address_to_string(addr));
    EXPECT_THROW(make_address("192.0.0.256", 69), std::invalid_argument);
}

TEST(HexDumpTest, RendersLowercasePairs) {
    EXPECT_EQ("00ff10ab", hex_dump("\x00\xff\x10\xab", 4));
    EXPECT_EQ("", hex_dump("", 0));
}

} // namespace
