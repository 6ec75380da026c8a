#include <gtest/gtest.h>
#include "binform/binform.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

using namespace binform;

namespace
{
    struct Header
    {
        uint32_t magic = 0;
        std::string name;
        std::vector<uint16_t> samples;
        bool compressed = false;
    };

    struct Point
    {
        int16_t x = 0;
        int16_t y = 0;
    };

    struct Shape
    {
        std::array<uint8_t, 2> tag{};
        std::vector<Point> points;
    };
}

TEST(Record, FillsMembers) {
    auto layout = Record<Header>(ByteOrder::Big)
        .field("magic", &Header::magic, u32())
        .field("nameLength", u8())
        .field("name", &Header::name, string(Termination::byCount("nameLength"), "ascii"))
        .field("count", u8())
        .field("samples", &Header::samples, array(u16(), Termination::byCount("count")))
        .field("compressed", &Header::compressed, boolean());

    ByteString data = {
        0xCA, 0xFE, 0xBA, 0xBE,
        0x03, 'a', 'b', 'c',
        0x02, 0x00, 0x01, 0x01, 0x00,
        0x01,
    };

    Header h = layout.read(data);
    EXPECT_EQ(h.magic, 0xCAFEBABEu);
    EXPECT_EQ(h.name, "abc");
    EXPECT_EQ(h.samples, (std::vector<uint16_t>{1, 256}));
    EXPECT_TRUE(h.compressed);
}

TEST(Record, UnboundFieldsAreStillDecoded) {
    auto layout = Record<Point>(ByteOrder::Little)
        .field("x", &Point::x, i16())
        .field("padding", bytes(Termination::byCount(2)))
        .field("y", &Point::y, i16());

    ByteString data = {0xFF, 0xFF, 0x00, 0x00, 0x05, 0x00};
    Point p = layout.read(data);
    EXPECT_EQ(p.x, -1);
    EXPECT_EQ(p.y, 5);
    EXPECT_EQ(layout.format()->size(), 3u);
}

TEST(Record, NestedRecordArray) {
    auto point = Record<Point>()
        .field("x", &Point::x, i16())
        .field("y", &Point::y, i16());

    auto shape = Record<Shape>(ByteOrder::Little)
        .field("tag", &Shape::tag, bytes(Termination::byCount(2)))
        .field("n", u8())
        .field("points", &Shape::points, point, Termination::byCount("n"));

    ByteString data = {'S', 'H', 0x02, 0x01, 0x00, 0x02, 0x00, 0x03, 0x00, 0xFC, 0xFF};
    DecodeResult raw = shape.format()->parseCounted(data);
    EXPECT_EQ(raw.bytesConsumed, data.size());

    Shape s = shape.read(data);
    EXPECT_EQ(s.tag[0], 'S');
    EXPECT_EQ(s.tag[1], 'H');
    ASSERT_EQ(s.points.size(), 2u);
    EXPECT_EQ(s.points[0].x, 1);
    EXPECT_EQ(s.points[0].y, 2);
    EXPECT_EQ(s.points[1].x, 3);
    EXPECT_EQ(s.points[1].y, -4);
}

TEST(Record, NestedRecordMember) {
    struct Segment
    {
        Point from;
        Point to;
    };

    auto point = Record<Point>()
        .field("x", &Point::x, i16())
        .field("y", &Point::y, i16());

    auto segment = Record<Segment>(ByteOrder::Big)
        .field("from", &Segment::from, point)
        .field("to", &Segment::to, point);

    ByteString data = {0, 1, 0, 2, 0, 3, 0, 4};
    Segment seg = segment.read(data);
    EXPECT_EQ(seg.from.x, 1);
    EXPECT_EQ(seg.to.y, 4);

    EXPECT_THROW(point.fromValue(Value(1)), InvalidConfiguration);
}

TEST(Record, ValueDoesNotFitMember) {
    struct Small
    {
        uint8_t v = 0;
    };

    auto layout = Record<Small>(ByteOrder::Big).field("v", &Small::v, u16());
    ByteString data = {0x01, 0x00};
    try {
        layout.read(data);
        FAIL() << "expected InvalidConfiguration";
    } catch (const InvalidConfiguration& e) {
        EXPECT_EQ(e.fieldPath(), "v");
    }
}

TEST(Record, LeftoverOption) {
    auto layout = Record<Point>(ByteOrder::Big)
        .field("x", &Point::x, i16())
        .field("y", &Point::y, i16());

    ByteString data = {0, 1, 0, 2, 0xEE};
    EXPECT_THROW(layout.read(data), TrailingData);

    DecodeOptions lenient;
    lenient.allowLeftover = true;
    Point p = layout.read(data, lenient);
    EXPECT_EQ(p.x, 1);
    EXPECT_EQ(p.y, 2);
}

TEST(ValueAs, Conversions) {
    EXPECT_EQ(valueAs<int>(Value(-7)), -7);
    EXPECT_EQ(valueAs<uint8_t>(Value(255)), 255);
    EXPECT_THROW(valueAs<uint8_t>(Value(256)), InvalidConfiguration);
    EXPECT_THROW(valueAs<uint32_t>(Value(-1)), InvalidConfiguration);
    EXPECT_DOUBLE_EQ(valueAs<double>(Value(3)), 3.0);
    EXPECT_EQ(valueAs<std::string>(Value(ByteString{'h', 'i'})), "hi");
    EXPECT_THROW(valueAs<std::string>(Value(1)), InvalidConfiguration);

    Value list(Value::List{Value(1), Value(2)});
    EXPECT_EQ(valueAs<ByteString>(list), (ByteString{1, 2}));
    EXPECT_EQ((valueAs<std::array<int, 2>>(list)), (std::array<int, 2>{1, 2}));
    EXPECT_THROW((valueAs<std::array<int, 3>>(list)), InvalidConfiguration);
}

TEST(Record, RejectedFieldLeavesLayoutUnchanged) {
    auto layout = Record<Point>(ByteOrder::Big).field("x", &Point::x, i16());

    EXPECT_THROW(layout.field("x", &Point::y, i16()), InvalidConfiguration);
    EXPECT_THROW(layout.field("", u8()), InvalidConfiguration);
    EXPECT_EQ(layout.format()->size(), 1u);

    layout.field("y", &Point::y, i16());
    ByteString data = {0, 1, 0, 2};
    Point p = layout.read(data);
    EXPECT_EQ(p.x, 1);
    EXPECT_EQ(p.y, 2);
}
