// tests/MappingConverterTests.cpp
#include <Piston/Mappings/MappingConverter.hpp>
#include <gtest/gtest.h>

#include <string>

using namespace Piston::Mappings;

namespace {
// Shaped like the client_mappings.txt published for each version
constexpr const char* kSample =
    "# {\"fileName\":\"client.jar\",\"id\":\"sourceFile\"}\n"
    "# This is a comment\n"
    "com.example.Foo -> x:\n"
    "# {\"fileName\":\"Foo.java\",\"id\":\"sourceFile\"}\n"
    "    int count -> a\n"
    "    com.example.Bar partner -> b\n"
    "    1:3:void tick() -> b\n"
    "    4:9:com.example.Bar[] pair(com.example.Foo,int[][],java.lang.String) -> c\n"
    "com.example.Bar -> y:\n"
    "    10:12:boolean isLinked(com.example.Foo) -> a\n";
}

TEST(MappingConverterTest, FieldScenario) {
    EXPECT_EQ(convertMappings("com.example.Foo -> x:\n    int count -> a\n"),
              "x com/example/Foo\n\ta count\n");
}

TEST(MappingConverterTest, MethodWithoutParametersScenario) {
    EXPECT_EQ(convertMappings("com.example.Foo -> x:\n    void tick() -> b\n"),
              "x com/example/Foo\n\tb ()V tick\n");
}

TEST(MappingConverterTest, MethodReturningKnownClassScenario) {
    EXPECT_EQ(convertMappings("com.example.Foo -> x:\n    com.example.Foo get(int) -> c\n"),
              "x com/example/Foo\n\tc (I)Lx; get\n");
}

TEST(MappingConverterTest, ClassHeaderScenario) {
    EXPECT_EQ(convertMappings("com.example.Foo -> x:\n"), "x com/example/Foo\n");
}

TEST(MappingConverterTest, FullSampleKeepsLineOrder) {
    const std::string expected =
        "x com/example/Foo\n"
        "\ta count\n"
        "\tb partner\n"
        "\tb ()V tick\n"
        "\tc (Lx;[[ILjava/lang/String;)[Ly; pair\n"
        "y com/example/Bar\n"
        "\ta (Lx;)Z isLinked\n";
    EXPECT_EQ(convertMappings(kSample), expected);
}

TEST(MappingConverterTest, ForwardReferencesResolve) {
    const std::string input =
        "com.example.Foo -> x:\n"
        "    void attach(com.example.Later) -> a\n"
        "com.example.Later -> z:\n";
    EXPECT_EQ(convertMappings(input),
              "x com/example/Foo\n"
              "\ta (Lz;)V attach\n"
              "z com/example/Later\n");
}

TEST(MappingConverterTest, CommentsAndMalformedLinesProduceNothing) {
    const std::string input =
        "# header\n"
        "\n"
        "not a mapping line\n"
        "    lonely -> a\n"
        "    int missingSeparator\n";
    ConversionStats stats;
    EXPECT_EQ(convertMappings(input, stats), "");
    EXPECT_EQ(stats.comments, 1u);
    EXPECT_EQ(stats.skipped, 4u);
    EXPECT_EQ(stats.nameTableSize, 0u);
}

TEST(MappingConverterTest, CommentedHeaderDoesNotEnterNameTable) {
    NameTable table = buildNameTable("#com.example.Foo -> x:\n");
    EXPECT_TRUE(table.empty());
}

TEST(MappingConverterTest, DuplicateClassNamesLastOneWins) {
    const std::string input =
        "com.example.Foo -> x:\n"
        "com.example.Foo -> w:\n"
        "com.example.User -> u:\n"
        "    com.example.Foo get() -> a\n";
    ConversionStats stats;
    NameTable table = buildNameTable(input, &stats);
    EXPECT_EQ(table.at("Lcom/example/Foo;"), "w");
    EXPECT_EQ(stats.duplicateClasses, 1u);
    EXPECT_EQ(stats.nameTableSize, 2u);

    EXPECT_EQ(convertMappings(input),
              "x com/example/Foo\n"
              "w com/example/Foo\n"
              "u com/example/User\n"
              "\ta ()Lw; get\n");
}

TEST(MappingConverterTest, NameTableKeysAreReferenceDescriptors) {
    NameTable table = buildNameTable(kSample);
    ASSERT_EQ(table.size(), 2u);
    EXPECT_EQ(table.at("Lcom/example/Foo;"), "x");
    EXPECT_EQ(table.at("Lcom/example/Bar;"), "y");
}

TEST(MappingConverterTest, QualifiedObfuscatedNamesUseSlashes) {
    EXPECT_EQ(convertMappings("com.example.Foo -> net.minecraft.a:\n    com.example.Foo self() -> b\n"),
              "net/minecraft/a com/example/Foo\n\tb ()Lnet/minecraft/a; self\n");
}

TEST(MappingConverterTest, CrlfInputMatchesLfInput) {
    EXPECT_EQ(convertMappings("com.example.Foo -> x:\r\n    int count -> a\r\n"),
              convertMappings("com.example.Foo -> x:\n    int count -> a\n"));
}

TEST(MappingConverterTest, FinalLineWithoutNewlineIsConverted) {
    EXPECT_EQ(convertMappings("com.example.Foo -> x:"), "x com/example/Foo\n");
}

TEST(MappingConverterTest, StatsDoNotChangeOutput) {
    ConversionStats stats;
    std::string withStats = convertMappings(kSample, stats);
    EXPECT_EQ(withStats, convertMappings(kSample));
    EXPECT_EQ(stats.classes, 2u);
    EXPECT_EQ(stats.methods, 3u);
    EXPECT_EQ(stats.fields, 2u);
    EXPECT_EQ(stats.comments, 3u);
    EXPECT_EQ(stats.skipped, 0u);
}

TEST(MappingConverterTest, EmitLineIgnoresCommentsAndSkippedLines) {
    NameTable table;
    EXPECT_FALSE(emitLine(MappingLine::parse("# note"), table).has_value());
    EXPECT_FALSE(emitLine(MappingLine::parse("garbage"), table).has_value());
    EXPECT_EQ(emitLine(MappingLine::parse("    int count -> a"), table), std::optional<std::string>("\ta count"));
}

TEST(MappingConverterTest, MethodSignatureConcatenatesWithoutSeparators) {
    MethodMember method;
    method.parameterTypes = {"long", "double[]", "com.example.Foo"};
    method.returnType = "char";
    NameTable table{{"Lcom/example/Foo;", "x"}};
    EXPECT_EQ(encodeMethodSignature(method, table), "(J[DLx;)C");
}

TEST(MappingConverterTest, SplitLinesHandlesTrailingNewline) {
    EXPECT_EQ(splitLines("a\nb\n").size(), 2u);
    EXPECT_EQ(splitLines("a\nb").size(), 2u);
    EXPECT_EQ(splitLines("a\n\nb").size(), 3u);
    EXPECT_TRUE(splitLines("").empty());
}
