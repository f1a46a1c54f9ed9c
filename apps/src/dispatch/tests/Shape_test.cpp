#include "dispatch/ShapeOf.h"
#include "tests/TestMessages.h"
#include <cstdint>
#include <gtest/gtest.h>

using namespace Switchboard;
using namespace Switchboard::Tests;

namespace Switchboard::Tests {

enum class Mood { Happy, Sad };

struct MoodReport {
    Mood mood = Mood::Happy;
    std::vector<int> scores;
    std::optional<std::string> note;
    double weight = 0.0;
    bool urgent = false;
};

} // namespace Switchboard::Tests

namespace {

std::vector<ValidationIssue> validate(const Shape& shape, const nlohmann::json& value)
{
    std::vector<ValidationIssue> issues;
    shape.validate(value, nlohmann::json::array(), issues);
    return issues;
}

} // namespace

TEST(ShapeTest, AggregateBecomesObjectWithOneFieldPerMember)
{
    const Shape shape = shapeOf<MoodReport>();

    ASSERT_EQ(shape.kind(), ShapeKind::Object);
    ASSERT_EQ(shape.fields().size(), 5u);
    EXPECT_EQ(shape.fields()[0].name, "mood");
    EXPECT_EQ(shape.fields()[0].shape.kind(), ShapeKind::Enum);
    EXPECT_EQ(shape.fields()[1].shape.kind(), ShapeKind::Array);
    EXPECT_EQ(shape.fields()[1].shape.inner().kind(), ShapeKind::Integer);
    EXPECT_EQ(shape.fields()[2].shape.kind(), ShapeKind::Nullable);
    EXPECT_FALSE(shape.fields()[2].required);
    EXPECT_TRUE(shape.fields()[0].required);
    EXPECT_EQ(shape.fields()[3].shape.kind(), ShapeKind::Number);
    EXPECT_EQ(shape.fields()[4].shape.kind(), ShapeKind::Boolean);
}

TEST(ShapeTest, NestedPayloadIssuesCarryFullPath)
{
    const Shape shape = shapeOf<ChatMessage>();

    auto issues = validate(shape, { { "action", "chat" }, { "payload", nlohmann::json::object() } });
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].type, IssueType::Missing);
    EXPECT_EQ(issues[0].loc, nlohmann::json::array({ "payload", "text" }));

    issues = validate(shape, { { "action", "chat" }, { "payload", { { "text", 5 } } } });
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].type, IssueType::StringType);
    EXPECT_EQ(issues[0].loc, nlohmann::json::array({ "payload", "text" }));
}

TEST(ShapeTest, EveryMismatchIsReported)
{
    auto issues = validate(
        shapeOf<MoodReport>(),
        { { "mood", "Angry" }, { "scores", { 1, "two", 3 } }, { "weight", "heavy" } });

    ASSERT_EQ(issues.size(), 4u);
    EXPECT_EQ(issues[0].type, IssueType::Enum);
    EXPECT_EQ(issues[0].loc, nlohmann::json::array({ "mood" }));
    EXPECT_EQ(issues[1].type, IssueType::IntType);
    EXPECT_EQ(issues[1].loc, nlohmann::json::array({ "scores", 1 }));
    EXPECT_EQ(issues[2].type, IssueType::FloatType);
    EXPECT_EQ(issues[3].type, IssueType::Missing);
    EXPECT_EQ(issues[3].loc, nlohmann::json::array({ "urgent" }));
}

TEST(ShapeTest, OptionalMembersAcceptAbsenceAndNull)
{
    const Shape shape = shapeOf<PingMessage>();

    EXPECT_TRUE(validate(shape, { { "action", "ping" } }).empty());
    EXPECT_TRUE(validate(shape, { { "seq", nullptr } }).empty());
    EXPECT_TRUE(validate(shape, { { "seq", 7 } }).empty());

    auto issues = validate(shape, { { "seq", "seven" } });
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].type, IssueType::IntType);
    EXPECT_EQ(issues[0].loc, nlohmann::json::array({ "seq" }));
}

TEST(ShapeTest, IntegerAcceptsIntegralFloats)
{
    const Shape shape = Shape::integer();

    EXPECT_TRUE(validate(shape, 3).empty());
    EXPECT_TRUE(validate(shape, 3.0).empty());
    EXPECT_FALSE(validate(shape, 3.5).empty());
    EXPECT_FALSE(validate(shape, true).empty());
    EXPECT_FALSE(validate(shape, "3").empty());
}

TEST(ShapeTest, FractionalFloatIsIntFromFloat)
{
    auto issues = validate(shapeOf<int>(), 2.5);
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].type, IssueType::IntFromFloat);
}

TEST(ShapeTest, IntegerMustFitTheMemberType)
{
    const Shape intShape = shapeOf<int>();
    EXPECT_TRUE(validate(intShape, 2147483647).empty());
    EXPECT_TRUE(validate(intShape, -2147483648LL).empty());
    EXPECT_TRUE(validate(intShape, 2147483647.0).empty());

    auto issues = validate(intShape, 4294967297ULL);
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].type, IssueType::LessThanEqual);
    EXPECT_EQ(issues[0].msg, "Input should be less than or equal to 2147483647");

    issues = validate(intShape, 2147483648LL);
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].type, IssueType::LessThanEqual);

    issues = validate(intShape, 1e10);
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].type, IssueType::LessThanEqual);

    issues = validate(intShape, -2147483649.0);
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].type, IssueType::GreaterThanEqual);
}

TEST(ShapeTest, NegativeIntoUnsignedIsRejected)
{
    auto issues = validate(shapeOf<unsigned>(), -1);
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].type, IssueType::GreaterThanEqual);
    EXPECT_EQ(issues[0].msg, "Input should be greater than or equal to 0");

    EXPECT_TRUE(validate(shapeOf<unsigned>(), 4294967295ULL).empty());
    EXPECT_FALSE(validate(shapeOf<unsigned>(), 4294967296ULL).empty());
}

TEST(ShapeTest, SixtyFourBitLimitsAreExact)
{
    EXPECT_TRUE(validate(shapeOf<std::uint64_t>(), 18446744073709551615ULL).empty());
    EXPECT_FALSE(validate(shapeOf<std::uint64_t>(), 18446744073709551616.0).empty());
    EXPECT_TRUE(validate(shapeOf<std::int64_t>(), -9223372036854775807LL - 1).empty());
    EXPECT_FALSE(validate(shapeOf<std::int64_t>(), 9223372036854775807ULL + 1).empty());
    EXPECT_FALSE(validate(shapeOf<std::int64_t>(), 9223372036854775808.0).empty());
}

TEST(ShapeTest, UndeclaredKeysAreIgnored)
{
    EXPECT_TRUE(
        validate(shapeOf<JoinRoom>(), { { "room", "room_1" }, { "extra", { 1, 2 } } }).empty());
}

TEST(ShapeTest, NonObjectInputIsModelTypeAtRoot)
{
    auto issues = validate(shapeOf<JoinRoom>(), nlohmann::json::array());
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].type, IssueType::ModelType);
    EXPECT_TRUE(issues[0].loc.empty());
}

TEST(ShapeTest, NullableCollapses)
{
    const Shape shape = Shape::nullable(Shape::nullable(Shape::integer()));
    EXPECT_EQ(shape.kind(), ShapeKind::Nullable);
    EXPECT_EQ(shape.inner().kind(), ShapeKind::Integer);

    EXPECT_EQ(Shape::nullable(Shape::any()).kind(), ShapeKind::Any);
}

TEST(ShapeTest, StructuralEquality)
{
    EXPECT_EQ(shapeOf<PingMessage>(), shapeOf<PongMessage>());
    EXPECT_NE(shapeOf<PingMessage>(), shapeOf<ChatMessage>());
    EXPECT_NE(shapeOf<RoomNotice>(), shapeOf<JoinRoom>());
    EXPECT_NE(shapeOf<int>(), shapeOf<unsigned>());
    EXPECT_EQ(shapeOf<int>(), Shape::integer(-2147483648LL, 2147483647u));
    EXPECT_EQ(Shape::enumOf({ "a", "b" }), Shape::enumOf({ "a", "b" }));
    EXPECT_NE(Shape::enumOf({ "a", "b" }), Shape::enumOf({ "b", "a" }));
}

TEST(ShapeTest, JsonMembersAcceptAnything)
{
    const Shape shape = shapeOf<nlohmann::json>();
    EXPECT_EQ(shape.kind(), ShapeKind::Any);
    EXPECT_TRUE(validate(shape, nullptr).empty());
    EXPECT_TRUE(validate(shape, { 1, "two" }).empty());
}
