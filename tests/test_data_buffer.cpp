#include "data_buffer.hpp"

#include <gtest/gtest.h>
#include <string>

TEST(DataBufferTest, AppendAndConsume)
{
    data_buffer buffer(16);

    EXPECT_EQ(buffer.buffer_size(), 16u);
    EXPECT_EQ(buffer.append_data("hello", 5), 5);
    EXPECT_EQ(buffer.append_data("world", 5), 10);
    EXPECT_TRUE(buffer.require(10));
    EXPECT_FALSE(buffer.require(11));

    char* p = buffer.consume_data(5);
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(std::string(p, buffer.data_len()), "world");
    EXPECT_EQ(buffer.consume_data(6), nullptr);
    EXPECT_EQ(buffer.data_len(), 5u);
}

TEST(DataBufferTest, ReusesConsumedSpaceBeforeGrowing)
{
    data_buffer buffer(16);

    buffer.append_data("0123456789", 10);
    buffer.consume_data(8);
    buffer.append_data("abcdefghij", 10);
    EXPECT_EQ(buffer.buffer_size(), 16u);
    EXPECT_EQ(std::string(buffer.data(), buffer.data_len()), "89abcdefghij");

    buffer.append_data("klmnopqrst", 10);
    EXPECT_GT(buffer.buffer_size(), 16u);
    EXPECT_EQ(std::string(buffer.data(), buffer.data_len()), "89abcdefghijklmnopqrst");
}

TEST(DataBufferTest, CopyKeepsOnlyUnconsumedBytes)
{
    data_buffer buffer(8);

    buffer.append_data("abcdef", 6);
    buffer.consume_data(2);

    data_buffer copy(buffer);
    EXPECT_EQ(std::string(copy.data(), copy.data_len()), "cdef");

    data_buffer assigned;
    assigned = buffer;
    EXPECT_EQ(std::string(assigned.data(), assigned.data_len()), "cdef");

    buffer.reset();
    EXPECT_EQ(buffer.data_len(), 0u);
    EXPECT_EQ(copy.data_len(), 4u);
}
