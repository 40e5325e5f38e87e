// SPDX-License-Identifier: MIT

// tests/document_test.cpp
#include <gtest/gtest.h>

#include <cstdint>
#include <string>

#include "kvmigrate/document.hpp"

namespace kvmigrate {
namespace {

TEST(DocumentTest, KindFollowsConstructor) {
    EXPECT_TRUE(Value().IsNull());
    EXPECT_TRUE(Value(nullptr).IsNull());
    EXPECT_TRUE(Value(true).IsBool());
    EXPECT_EQ(Value(7).kind(), Value::Kind::Int);
    EXPECT_EQ(Value(uint64_t{7}).kind(), Value::Kind::Uint);
    EXPECT_EQ(Value(1.5).kind(), Value::Kind::Double);
    EXPECT_TRUE(Value("x").IsString());
    EXPECT_TRUE(Value(Array{}).IsArray());
    EXPECT_TRUE(Value(Object{}).IsObject());
}

TEST(DocumentTest, FindAndSet) {
    Value doc(Object{});
    doc.Set("id", Value(1));
    doc.Set("name", Value("alpha"));
    doc.Set("id", Value(2));  // Replaces, keeps position

    ASSERT_EQ(doc.AsObject().size(), 2u);
    EXPECT_EQ(doc.AsObject()[0].first, "id");
    ASSERT_NE(doc.Find("id"), nullptr);
    EXPECT_EQ(doc.Find("id")->AsInt(), 2);
    EXPECT_EQ(doc.Find("missing"), nullptr);
    EXPECT_EQ(Value(3).Find("id"), nullptr);
}

TEST(DocumentTest, ToDoubleWidensIntegers) {
    EXPECT_DOUBLE_EQ(Value(-3).ToDouble(), -3.0);
    EXPECT_DOUBLE_EQ(Value(uint64_t{10}).ToDouble(), 10.0);
    EXPECT_DOUBLE_EQ(Value(2.25).ToDouble(), 2.25);
}

TEST(DocumentTest, ToJsonIsCompact) {
    Value doc(Object{});
    doc.Set("a", Value(Array{Value(1), Value("two"), Value(nullptr)}));
    doc.Set("b", Value(true));
    EXPECT_EQ(ToJson(doc), R"({"a":[1,"two",null],"b":true})");
}

TEST(DocumentTest, ToJsonEscapesStrings) {
    EXPECT_EQ(ToJson(Value("say \"hi\"\n")), R"("say \"hi\"\n")");
}

TEST(DocumentTest, IdentifierOfStringsAndIntegers) {
    EXPECT_EQ(IdentifierOf(Value("abc-123")), "abc-123");
    EXPECT_EQ(IdentifierOf(Value(42)), "42");
    EXPECT_EQ(IdentifierOf(Value(uint64_t{18446744073709551615u})), "18446744073709551615");
    EXPECT_EQ(IdentifierOf(Value(7.0)), "7");
}

TEST(DocumentTest, IdentifierOfRejectsNonIdentifiers) {
    EXPECT_FALSE(IdentifierOf(Value()).has_value());
    EXPECT_FALSE(IdentifierOf(Value("")).has_value());
    EXPECT_FALSE(IdentifierOf(Value(true)).has_value());
    EXPECT_FALSE(IdentifierOf(Value(1.5)).has_value());
    EXPECT_FALSE(IdentifierOf(Value(Array{})).has_value());
    EXPECT_FALSE(IdentifierOf(Value(Object{})).has_value());
}

TEST(DocumentTest, StringAndNumberIdentifiersCoincide) {
    // "id": 3 and a reference "3" name the same record
    EXPECT_EQ(IdentifierOf(Value(3)), IdentifierOf(Value("3")));
}

}  // namespace
}  // namespace kvmigrate
