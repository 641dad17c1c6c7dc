#include "byte_stream.hpp"

#include <gtest/gtest.h>
#include <string>

TEST(ByteStreamTest, ReadsBigEndianWidths)
{
    const uint8_t data[] = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08};

    EXPECT_EQ(read_2bytes(data), 0x0102);
    EXPECT_EQ(read_3bytes(data), 0x010203u);
    EXPECT_EQ(read_4bytes(data), 0x01020304u);
    EXPECT_EQ(read_8bytes(data), 0x0102030405060708ull);
}

TEST(ByteStreamTest, SignedReadsExtendTheSign)
{
    const uint8_t minus_ten[] = {0xff, 0xff, 0xf6};
    const uint8_t max_positive[] = {0x7f, 0xff, 0xff};
    const uint8_t minus_two[] = {0xff, 0xfe};

    EXPECT_EQ(read_3bytes_signed(minus_ten), -10);
    EXPECT_EQ(read_3bytes_signed(max_positive), 0x7fffff);
    EXPECT_EQ(read_2bytes_signed(minus_two), -2);
}

TEST(ByteStreamTest, WriteThenReadDouble)
{
    uint8_t data[8];

    write_double(data, 3.5);
    EXPECT_EQ(data[0], 0x40);
    EXPECT_EQ(data[1], 0x0c);
    EXPECT_DOUBLE_EQ(read_double(data), 3.5);
}

TEST(ByteReaderTest, AdvancesOnSuccess)
{
    const uint8_t data[] = {0x08, 0x00, 0x00, 0x0a, 0x00, 0x00, 0x00, 0x01, 'a', 'b'};
    byte_reader reader(data, sizeof(data));

    uint8_t u8 = 0;
    uint32_t u24 = 0;
    uint32_t u32 = 0;
    std::string str;

    ASSERT_EQ(reader.read_1byte(u8), BYTE_READER_OK);
    ASSERT_EQ(reader.read_3bytes(u24), BYTE_READER_OK);
    ASSERT_EQ(reader.read_4bytes(u32), BYTE_READER_OK);
    ASSERT_EQ(reader.read_string(2, str), BYTE_READER_OK);

    EXPECT_EQ(u8, 0x08);
    EXPECT_EQ(u24, 10u);
    EXPECT_EQ(u32, 1u);
    EXPECT_EQ(str, "ab");
    EXPECT_TRUE(reader.empty());
    EXPECT_EQ(reader.pos(), sizeof(data));
}

TEST(ByteReaderTest, ShortReadKeepsTheCursor)
{
    const uint8_t data[] = {0x00, 0x01, 0x02};
    byte_reader reader(data, sizeof(data));

    uint8_t u8 = 0;
    ASSERT_EQ(reader.read_1byte(u8), BYTE_READER_OK);

    uint32_t u32 = 0;
    uint64_t u64 = 0;
    double number = 0.0;
    std::string str;
    EXPECT_EQ(reader.read_4bytes(u32), BYTE_READER_NEED_MORE);
    EXPECT_EQ(reader.read_8bytes(u64), BYTE_READER_NEED_MORE);
    EXPECT_EQ(reader.read_double(number), BYTE_READER_NEED_MORE);
    EXPECT_EQ(reader.read_string(3, str), BYTE_READER_NEED_MORE);
    EXPECT_EQ(reader.skip(3), BYTE_READER_NEED_MORE);
    EXPECT_EQ(reader.pos(), 1u);
    EXPECT_EQ(reader.left(), 2u);

    uint16_t u16 = 0;
    EXPECT_EQ(reader.read_2bytes(u16), BYTE_READER_OK);
    EXPECT_EQ(u16, 0x0102);
    EXPECT_EQ(reader.peek_1byte(u8), BYTE_READER_NEED_MORE);
}
