#include <gtest/gtest.h>
#include "binform/Errors.hpp"
#include "binform/Format.hpp"
#include "binform/Length.hpp"
#include "binform/Termination.hpp"
#include "binform/types/Bytes.hpp"
#include "binform/types/Integer.hpp"

using namespace binform;

TEST(Length, Literal) {
    Context ctx;
    EXPECT_EQ(Length(0).resolve(ctx), 0u);
    EXPECT_EQ(Length(12).resolve(ctx), 12u);
    EXPECT_EQ(Length(std::size_t{7}).resolve(ctx), 7u);
    EXPECT_TRUE(Length(1).isLiteral());
    EXPECT_THROW(Length(-1), InvalidConfiguration);
}

TEST(Length, Reference) {
    Context ctx;
    ctx.insert("size", Value(uint64_t{4}));
    ctx.insert("negative", Value(-2));
    ctx.insert("name", Value("abc"));

    EXPECT_EQ(Length("size").resolve(ctx), 4u);
    EXPECT_EQ(Length::field("size").describe(), "field 'size'");
    EXPECT_THROW(Length("missing").resolve(ctx), UnresolvedReference);
    EXPECT_THROW(Length("negative").resolve(ctx), InvalidConfiguration);
    EXPECT_THROW(Length("name").resolve(ctx), InvalidConfiguration);
    EXPECT_THROW(Length(""), InvalidConfiguration);
}

TEST(Length, BoolReferenceCountsAsZeroOrOne) {
    Context ctx;
    ctx.insert("present", Value(true));
    ctx.insert("absent", Value(false));

    EXPECT_EQ(Length("present").resolve(ctx), 1u);
    EXPECT_EQ(Length("absent").resolve(ctx), 0u);

    // An optional trailer gated by a flag byte
    auto f = format({
        {"hasTrailer", boolean()},
        {"trailer", bytes(Termination::byCount("hasTrailer"))},
    });
    ByteString with = {1, 0xEE};
    ByteString without = {0};
    EXPECT_EQ(f->parse(with).at("trailer"), Value(ByteString{0xEE}));
    EXPECT_EQ(f->parse(without).at("trailer"), Value(ByteString{}));
}

TEST(Length, Computed) {
    Context ctx;
    ctx.insert("rows", Value(3));
    ctx.insert("cols", Value(4));

    Length cells([](const Context& c) {
        return *c.at("rows").toInt64() * *c.at("cols").toInt64();
    });
    EXPECT_EQ(cells.resolve(ctx), 12u);
    EXPECT_EQ(cells.describe(), "computed");

    Length negative([](const Context&) { return -5; });
    EXPECT_THROW(negative.resolve(ctx), InvalidConfiguration);
}

TEST(Termination, ExactlyOneStrategy) {
    EXPECT_NO_THROW(Termination::byCount(3).validate("array"));
    EXPECT_NO_THROW(Termination::bySentinel(Value(0)).validate("array"));

    EXPECT_THROW(Termination{}.validate("array"), InvalidConfiguration);

    Termination both = Termination::byCount(3);
    both.byteBudget = Length(6);
    EXPECT_THROW(both.validate("array"), InvalidConfiguration);
}
