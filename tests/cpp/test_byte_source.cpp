#include <gtest/gtest.h>
#include "binform/ByteSource.hpp"
#include "binform/Errors.hpp"
#include <limits>
#include <sstream>
#include <string>
#include <vector>

using namespace binform;

namespace
{
    struct Packet
    {
        std::string payload;
    };

    ByteString toBytes(const Packet& p)
    {
        return ByteString(p.payload.begin(), p.payload.end());
    }
}

TEST(BufferSource, ReadExactAdvances) {
    std::vector<uint8_t> data = {1, 2, 3, 4, 5};
    BufferSource source(data);

    EXPECT_EQ(source.readExact(2), (ByteString{1, 2}));
    EXPECT_EQ(source.position(), 2u);
    EXPECT_EQ(source.remaining().value(), 3u);
    EXPECT_FALSE(source.atEnd());

    EXPECT_EQ(source.readExact(3), (ByteString{3, 4, 5}));
    EXPECT_TRUE(source.atEnd());
    EXPECT_EQ(source.remaining().value(), 0u);
}

TEST(BufferSource, FailedReadLeavesPosition) {
    std::vector<uint8_t> data = {1, 2, 3};
    BufferSource source(data);
    source.skip(1);

    try {
        source.readExact(4);
        FAIL() << "expected InsufficientData";
    } catch (const InsufficientData& e) {
        EXPECT_EQ(e.requested(), 4u);
        EXPECT_EQ(e.available(), 2u);
        EXPECT_EQ(e.position(), 1u);
    }
    EXPECT_EQ(source.position(), 1u);

    EXPECT_THROW(source.skip(3), InsufficientData);
    EXPECT_EQ(source.position(), 1u);
    EXPECT_EQ(source.readExact(2), (ByteString{2, 3}));
}

TEST(BufferSource, ZeroLengthRead) {
    BufferSource source(ByteString{});
    EXPECT_TRUE(source.atEnd());
    EXPECT_TRUE(source.readExact(0).empty());
    EXPECT_THROW(source.readExact(1), InsufficientData);
}

TEST(BufferSource, OwningCopyIsIndependent) {
    BufferSource original(std::string_view("abcd"));
    original.skip(1);

    BufferSource copy = original;
    EXPECT_EQ(copy.position(), 1u);
    EXPECT_EQ(copy.readExact(1), (ByteString{'b'}));
    EXPECT_EQ(original.readExact(3), (ByteString{'b', 'c', 'd'}));
}

TEST(StreamSource, ReadsSequentially) {
    std::istringstream in(std::string("\x01\x02\x03\x04", 4));
    StreamSource source(in);

    EXPECT_FALSE(source.atEnd());
    EXPECT_EQ(source.readExact(3), (ByteString{1, 2, 3}));
    EXPECT_EQ(source.position(), 3u);
    EXPECT_FALSE(source.remaining().has_value());
    EXPECT_EQ(source.readExact(1), (ByteString{4}));
    EXPECT_TRUE(source.atEnd());
}

TEST(StreamSource, FailedReadLeavesBytesAvailable) {
    std::istringstream in(std::string("\xAA\xBB", 2));
    StreamSource source(in);

    EXPECT_THROW(source.readExact(4), InsufficientData);
    EXPECT_EQ(source.position(), 0u);
    EXPECT_FALSE(source.atEnd());

    // The two bytes fetched by the failed read are still there
    EXPECT_EQ(source.readExact(2), (ByteString{0xAA, 0xBB}));
    EXPECT_TRUE(source.atEnd());
}

TEST(StreamSource, LargeReadSpanningManyChunks) {
    std::string payload(200 * 1024, '\x5A');
    std::istringstream in(payload);
    StreamSource source(in);

    ByteString bytes = source.readExact(payload.size());
    EXPECT_EQ(bytes.size(), payload.size());
    EXPECT_EQ(bytes.back(), 0x5A);
    EXPECT_TRUE(source.atEnd());
}

TEST(ByteSource, OversizedReadDoesNotAllocate) {
    std::vector<uint8_t> data = {1, 2};
    BufferSource buffer(data);
    EXPECT_THROW(buffer.readExact(std::numeric_limits<std::size_t>::max()), InsufficientData);
    EXPECT_EQ(buffer.position(), 0u);

    std::istringstream in(std::string("\x01\x02", 2));
    StreamSource stream(in);
    EXPECT_THROW(stream.readExact(std::numeric_limits<std::size_t>::max()), InsufficientData);
    EXPECT_EQ(stream.readExact(2), (ByteString{1, 2}));
}

TEST(StreamSource, EmptyStream) {
    std::istringstream in;
    StreamSource source(in);
    EXPECT_TRUE(source.atEnd());
    EXPECT_THROW(source.skip(1), InsufficientData);
}

TEST(MakeSource, AcceptsByteConvertibleValues) {
    auto source = makeSource(Packet{"hi"});
    EXPECT_EQ(source.size(), 2u);
    EXPECT_EQ(source.readExact(2), (ByteString{'h', 'i'}));
}

TEST(MakeSource, AcceptsSpansAndStreams) {
    std::vector<uint8_t> data = {9, 8};
    auto buffer = makeSource(std::span<const uint8_t>(data));
    EXPECT_EQ(buffer.readExact(1), (ByteString{9}));

    std::istringstream in(std::string("\x07", 1));
    auto stream = makeSource(in);
    EXPECT_EQ(stream.readExact(1), (ByteString{7}));
}
