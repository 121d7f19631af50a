// tests/MappingLineTests.cpp
#include <Piston/Mappings/MappingLine.hpp>
#include <gtest/gtest.h>

using namespace Piston::Mappings;

TEST(MappingLineTest, CommentLines) {
    EXPECT_EQ(MappingLine::parse("# {\"id\":\"sourceFile\",\"fileName\":\"Foo.java\"}").kind, LineKind::COMMENT);
    EXPECT_EQ(MappingLine::parse("#com.example.Foo -> x:").kind, LineKind::COMMENT);
}

TEST(MappingLineTest, ClassHeader) {
    MappingLine line = MappingLine::parse("com.example.Foo -> x:");
    ASSERT_EQ(line.kind, LineKind::CLASS_HEADER);
    const auto& header = std::get<ClassHeader>(line.data);
    EXPECT_EQ(header.deobfuscatedName, "com.example.Foo");
    EXPECT_EQ(header.obfuscatedName, "x");
}

TEST(MappingLineTest, ClassHeaderWithCarriageReturn) {
    MappingLine line = MappingLine::parse("com.example.Foo -> x:\r");
    ASSERT_EQ(line.kind, LineKind::CLASS_HEADER);
    EXPECT_EQ(std::get<ClassHeader>(line.data).obfuscatedName, "x");
}

TEST(MappingLineTest, LinesWithoutSeparatorAreSkipped) {
    EXPECT_EQ(MappingLine::parse("").kind, LineKind::SKIPPED);
    EXPECT_EQ(MappingLine::parse("com.example.Foo x:").kind, LineKind::SKIPPED);
    EXPECT_EQ(MappingLine::parse("    int count a").kind, LineKind::SKIPPED);
    EXPECT_EQ(MappingLine::parse("com.example.Foo->x:").kind, LineKind::SKIPPED);
}

TEST(MappingLineTest, MemberWithSingleTokenIsSkipped) {
    EXPECT_EQ(MappingLine::parse("    count -> a").kind, LineKind::SKIPPED);
}

TEST(MappingLineTest, FieldMember) {
    MappingLine line = MappingLine::parse("    int count -> a");
    ASSERT_EQ(line.kind, LineKind::FIELD_MEMBER);
    const auto& field = std::get<FieldMember>(line.data);
    EXPECT_EQ(field.obfuscatedName, "a");
    EXPECT_EQ(field.fieldName, "count");
}

TEST(MappingLineTest, MethodWithoutParameters) {
    MappingLine line = MappingLine::parse("    void tick() -> b");
    ASSERT_EQ(line.kind, LineKind::METHOD_MEMBER);
    const auto& method = std::get<MethodMember>(line.data);
    EXPECT_EQ(method.obfuscatedName, "b");
    EXPECT_EQ(method.functionName, "tick");
    EXPECT_TRUE(method.parameterTypes.empty());
    EXPECT_EQ(method.returnType, "void");
}

TEST(MappingLineTest, MethodWithLineRangeAndParameters) {
    MappingLine line = MappingLine::parse("    12:14:com.example.Foo[] get(int,java.lang.String[][]) -> c");
    ASSERT_EQ(line.kind, LineKind::METHOD_MEMBER);
    const auto& method = std::get<MethodMember>(line.data);
    EXPECT_EQ(method.obfuscatedName, "c");
    EXPECT_EQ(method.functionName, "get");
    ASSERT_EQ(method.parameterTypes.size(), 2u);
    EXPECT_EQ(method.parameterTypes[0], "int");
    EXPECT_EQ(method.parameterTypes[1], "java.lang.String[][]");
    EXPECT_EQ(method.returnType, "com.example.Foo[]");
}

TEST(MappingLineTest, InlinedMethodRangeKeepsTypeAfterLastColon) {
    MappingLine line = MappingLine::parse("    1:1:void <init>():10:10 -> <init>");
    ASSERT_EQ(line.kind, LineKind::METHOD_MEMBER);
    const auto& method = std::get<MethodMember>(line.data);
    EXPECT_EQ(method.functionName, "<init>");
    EXPECT_EQ(method.returnType, "void");
    EXPECT_EQ(method.obfuscatedName, "<init>");
}

TEST(MappingLineTest, DeeperIndentationIsStillAMember) {
    EXPECT_EQ(MappingLine::parse("        int count -> a").kind, LineKind::FIELD_MEMBER);
}

TEST(MappingLineTest, KindNames) {
    EXPECT_EQ(line_kind_to_string(LineKind::METHOD_MEMBER), "method");
    EXPECT_EQ(line_kind_to_string(LineKind::SKIPPED), "skipped");
}
