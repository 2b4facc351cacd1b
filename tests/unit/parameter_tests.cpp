/**
 * Unit tests for parameter.hpp
 */

#include <argroute/parameter.hpp>
#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace argroute;

namespace {

ParameterSignature greeting() {
    return {Parameter::required("name"), Parameter::optional("greeting", "Hello")};
}

} // namespace

TEST(ParameterSignatureTest, UsageListsSlotsInOrder) {
    const ParameterSignature sig{Parameter::required("src"), Parameter::optional("dst"), Parameter::variadic("rest")};
    EXPECT_EQ(sig.usage(), "<src> [<dst>] [<rest>] ...");
    EXPECT_EQ(sig.requiredCount(), 1u);
    EXPECT_EQ(sig.optionalCount(), 1u);
    EXPECT_TRUE(sig.hasVariadic());
}

TEST(ParameterSignatureTest, RequiredAfterOptionalIsRejected) {
    ParameterSignature sig;
    sig.add(Parameter::optional("a"));
    EXPECT_THROW(sig.add(Parameter::required("b")), ConfigurationError);
}

TEST(ParameterSignatureTest, NothingMayFollowVariadic) {
    ParameterSignature sig;
    sig.add(Parameter::variadic("files"));
    EXPECT_THROW(sig.add(Parameter::optional("x")), ConfigurationError);
    EXPECT_THROW(sig.add(Parameter::variadic("more")), ConfigurationError);
}

TEST(ParameterSignatureTest, DuplicateAndEmptyNamesAreRejected) {
    ParameterSignature sig;
    sig.add(Parameter::required("a"));
    EXPECT_THROW(sig.add(Parameter::optional("a")), ConfigurationError);
    EXPECT_THROW(Parameter::required(""), ConfigurationError);
}

TEST(ParameterFillerTest, OptionalKeepsDefaultWhenOmitted) {
    auto result = ParameterFiller().fill(greeting(), TokenStream(std::vector<std::string>{"alice"}));
    ASSERT_TRUE(result.ok());

    const auto& params = result.value();
    EXPECT_EQ(params.get("name"), "alice");
    EXPECT_EQ(params.get("greeting"), "Hello");
    EXPECT_TRUE(params.supplied("name"));
    EXPECT_FALSE(params.supplied("greeting"));
    EXPECT_TRUE(result.stream.exhausted());
}

TEST(ParameterFillerTest, GreedyAssignmentInOrder) {
    auto result = ParameterFiller().fill(greeting(), TokenStream(std::vector<std::string>{"alice", "Hi"}));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().get("name"), "alice");
    EXPECT_EQ(result.value().get("greeting"), "Hi");
}

TEST(ParameterFillerTest, NotEnoughArguments) {
    auto result = ParameterFiller().fill(greeting(), TokenStream(std::vector<std::string>{}));
    ASSERT_FALSE(result.ok());

    const auto& err = result.error();
    EXPECT_EQ(err.kind, ParameterError::Kind::NotEnoughArguments);
    EXPECT_EQ(err.minimum, 1u);
    ASSERT_TRUE(err.maximum.has_value());
    EXPECT_EQ(*err.maximum, 2u);
    EXPECT_EQ(err.given, 0u);
}

TEST(ParameterFillerTest, TooManyArguments) {
    auto result = ParameterFiller().fill(greeting(), TokenStream(std::vector<std::string>{"a", "b", "c"}));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ParameterError::Kind::TooManyArguments);
    EXPECT_EQ(result.error().given, 3u);
}

TEST(ParameterFillerTest, VariadicCollectsRemainder) {
    const ParameterSignature sig{Parameter::required("dest"), Parameter::variadic("files")};

    auto many = ParameterFiller().fill(sig, TokenStream(std::vector<std::string>{"out", "a", "b", "c"}));
    ASSERT_TRUE(many.ok());
    EXPECT_EQ(many.value().get("dest"), "out");
    EXPECT_EQ(many.value().collected("files"), (std::vector<std::string>{"a", "b", "c"}));

    auto none = ParameterFiller().fill(sig, TokenStream(std::vector<std::string>{"out"}));
    ASSERT_TRUE(none.ok());
    EXPECT_TRUE(none.value().collected("files").empty());
    EXPECT_FALSE(none.value().supplied("files"));

    auto missing = ParameterFiller().fill(sig, TokenStream(std::vector<std::string>{}));
    ASSERT_FALSE(missing.ok());
    EXPECT_FALSE(missing.error().maximum.has_value());
}

TEST(ParameterFillerTest, ConsumedTokensAreNotBound) {
    TokenStream stream(std::vector<std::string>{"--verbose", "alice"});
    stream.consume(0);

    auto result = ParameterFiller().fill(greeting(), std::move(stream));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().get("name"), "alice");
    EXPECT_FALSE(result.value().supplied("greeting"));
}

TEST(ParametersTest, AccessorsCheckSlotKind) {
    const ParameterSignature sig{Parameter::required("dest"), Parameter::variadic("files")};
    auto result = ParameterFiller().fill(sig, TokenStream(std::vector<std::string>{"out"}));
    ASSERT_TRUE(result.ok());

    const auto& params = result.value();
    EXPECT_THROW((void)params.get("files"), std::out_of_range);
    EXPECT_THROW((void)params.collected("dest"), std::out_of_range);
    EXPECT_THROW((void)params.get("nope"), std::out_of_range);
    EXPECT_TRUE(params.has("dest"));
    EXPECT_FALSE(params.has("nope"));
}
