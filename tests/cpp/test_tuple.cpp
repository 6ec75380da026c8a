#include <gtest/gtest.h>
#include "binform/Errors.hpp"
#include "binform/types/Bytes.hpp"
#include "binform/types/Float.hpp"
#include "binform/types/Integer.hpp"
#include "binform/types/Tuple.hpp"

using namespace binform;

TEST(Tuple, DecodesInOrder) {
    // u8, i16 big-endian, f32 little-endian 1.0
    ByteString data = {0x07, 0xFF, 0xFE, 0x00, 0x00, 0x80, 0x3F};
    auto t = tuple({u8(), i16(ByteOrder::Big), f32(ByteOrder::Little)});

    Decoded d = t->read(data);
    ASSERT_TRUE(d.value.isList());
    ASSERT_EQ(d.value.asList().size(), 3u);
    EXPECT_EQ(d.value[0], Value(7));
    EXPECT_EQ(d.value[1], Value(-2));
    EXPECT_DOUBLE_EQ(d.value[2].asDouble(), 1.0);
    EXPECT_EQ(d.bytesRead, 7u);
}

TEST(Tuple, SeesEnclosingContext) {
    Context ctx;
    ctx.insert("n", Value(2));

    ByteString data = {1, 'a', 'b'};
    auto t = tuple({u8(), bytes(Termination::byCount("n"))});
    Value v = t->read(data, ctx).value;
    EXPECT_EQ(v[1], Value(ByteString{'a', 'b'}));
}

TEST(Tuple, FailsPartwayThrough) {
    ByteString data = {1, 2};
    BufferSource source(data);
    EXPECT_THROW(tuple({u8(), u16()})->read(source), InsufficientData);

    // The first element is consumed, the failed one is not
    EXPECT_EQ(source.position(), 1u);
}

TEST(Tuple, NullElementRejected) {
    EXPECT_THROW(tuple({u8(), nullptr}), InvalidConfiguration);
}

TEST(Tuple, TypeName) {
    EXPECT_EQ(tuple({u8(), f64()})->typeName(), "tuple<u8, f64>");
}
