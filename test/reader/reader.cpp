#include "reader.h"
#include "gtest/gtest.h"

#include "errorha.h"

using namespace heapgraph;
using namespace heapgraph::internal::reader;

TEST(buffer_reader, read_and_skip_big_endian_u1) {
    const uint8_t buffer[] = {0x01, 0x02};
    Reader reader(buffer, sizeof(buffer));
    reader.SkipU1();
    EXPECT_EQ(2, reader.ReadU1());
}

TEST(buffer_reader, read_and_skip_big_endian_u2) {
    const uint8_t buffer[] = {0x00, 0x01, 0x00, 0x02};
    Reader reader(buffer, sizeof(buffer));
    reader.SkipU2();
    EXPECT_EQ(2, reader.ReadU2());
}

TEST(buffer_reader, read_and_skip_big_endian_u4) {
    const uint8_t buffer[] = {0x00, 0x00, 0x00, 0x01, 0x12, 0x34, 0x56, 0x78};
    Reader reader(buffer, sizeof(buffer));
    reader.SkipU4();
    EXPECT_EQ(0x12345678, reader.ReadU4());
}

TEST(buffer_reader, read_and_skip_big_endian_u8) {
    const uint8_t buffer[] = {0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01,
                              0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x02};
    Reader reader(buffer, sizeof(buffer));
    reader.SkipU8();
    EXPECT_EQ(2, reader.ReadU8());
}

TEST(buffer_reader, read_id) {
    const uint8_t buffer[] = {0x00, 0x00, 0x01, 0x01,
                              0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01, 0x02};
    {
        Reader reader(buffer, sizeof(buffer), sizeof(uint32_t));
        EXPECT_EQ(0x101, reader.ReadId());
        reader.SetIdSize(sizeof(uint64_t));
        EXPECT_EQ(0x102, reader.ReadId());
        EXPECT_TRUE(reader.IsEnd());
    }
    {
        Reader reader(buffer, sizeof(buffer));
        EXPECT_THROW(reader.ReadId(), std::logic_error);
    }
}

TEST(buffer_reader, read_strings) {
    const uint8_t buffer[] = {'J', 'A', 'V', 'A', 0x00, 'h', 'p', 'r', 'o', 'f'};
    Reader reader(buffer, sizeof(buffer));
    EXPECT_EQ("JAVA", reader.ReadNullTerminatedString());
    EXPECT_EQ("hprof", reader.ReadString(5));
    EXPECT_TRUE(reader.IsEnd());
}

TEST(buffer_reader, skip_dynamic) {
    const uint8_t buffer[] = {
            0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
            0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01
    };
    Reader reader(buffer, sizeof(buffer));
    reader.Skip(15);
    EXPECT_EQ(1, reader.ReadU1());
}

TEST(buffer_reader, buffer_overflow) {
    const uint8_t buffer[] = {0x00, 0x01, 0x02};
    Reader reader(buffer, sizeof(buffer));
    try {
        reader.ReadU4();
        FAIL() << "read past the end of buffer";
    } catch (const HprofError &error) {
        EXPECT_EQ(error_kind_t::kTruncatedInput, error.GetKind());
        EXPECT_TRUE(error.IsFatal());
    }
    // A failed read leaves the cursor where it was.
    EXPECT_EQ(0, reader.GetCursor());
    EXPECT_EQ(0x0001, reader.ReadU2());
    EXPECT_THROW(reader.Skip(2), HprofError);
    EXPECT_THROW(reader.Read(sizeof(uint64_t) + 1), std::logic_error);
}

TEST(buffer_reader, slice) {
    const uint8_t buffer[] = {0x01, 0x02, 0x03, 0x04, 0x05};
    Reader reader(buffer, sizeof(buffer), sizeof(uint32_t));
    reader.SkipU1();
    Reader slice = reader.Slice(2);
    EXPECT_EQ(3, reader.GetCursor());
    EXPECT_EQ(2, slice.GetSize());
    EXPECT_EQ(sizeof(uint32_t), slice.GetIdSize());
    EXPECT_EQ(0x0203, slice.ReadU2());
    EXPECT_THROW(slice.ReadU1(), HprofError);
    EXPECT_EQ(0x04, reader.ReadU1());
}

TEST(buffer_reader, expect_consumed) {
    const uint8_t buffer[] = {0x01, 0x02};
    Reader reader(buffer, sizeof(buffer));
    reader.SkipU1();
    try {
        reader.ExpectConsumed("test payload");
        FAIL() << "one byte left unread";
    } catch (const HprofError &error) {
        EXPECT_EQ(error_kind_t::kUnconsumedPayload, error.GetKind());
    }
    reader.SkipU1();
    EXPECT_NO_THROW(reader.ExpectConsumed("test payload"));
    reader.ResetCursor();
    EXPECT_EQ(2, reader.Remaining());
}
