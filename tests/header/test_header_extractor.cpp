/**
 * @file test_header_extractor.cpp
 * @brief Pragma and import extraction tests
 */

#include "compactscan/header.hpp"
#include "compactscan/source.hpp"

#include <stdexcept>
#include <string_view>

#include <gtest/gtest.h>

namespace compactscan::header::test {

namespace {

Header header_of(std::string_view text)
{
    auto doc = source::scan(text);
    if (!doc) {
        throw std::runtime_error(doc.error().message);
    }
    return extract_header(*doc);
}

}  // namespace

TEST(LanguageVersion, ParsesMajorMinorOnly)
{
    auto v = LanguageVersion::parse("0.16");
    ASSERT_TRUE(v);
    EXPECT_EQ(v->major, 0);
    EXPECT_EQ(v->minor, 16);
    EXPECT_EQ(v->key(), 16);
    EXPECT_EQ(v->to_string(), "0.16");

    EXPECT_FALSE(LanguageVersion::parse("0.16.1"));
    EXPECT_FALSE(LanguageVersion::parse("1"));
    EXPECT_FALSE(LanguageVersion::parse("a.b"));
    EXPECT_FALSE(LanguageVersion::parse(""));
}

TEST(LanguageVersion, RejectsComponentsOutsideKeyRange)
{
    EXPECT_FALSE(LanguageVersion::parse("30000000.0"));
    EXPECT_FALSE(LanguageVersion::parse("1000000.0"));
    EXPECT_FALSE(LanguageVersion::parse("0.100"));
    EXPECT_FALSE(LanguageVersion::parse("99999999999.0"));

    auto widest = LanguageVersion::parse("999999.99");
    ASSERT_TRUE(widest);
    EXPECT_EQ(widest->key(), 99999999);
}

TEST(HeaderExtractor, OutOfRangeVersionMakesPragmaMalformed)
{
    auto header = header_of("pragma language_version >= 30000000.0 && <= 0.18;");
    ASSERT_TRUE(header.pragma);
    EXPECT_FALSE(header.pragma->well_formed);
    EXPECT_FALSE(header.pragma->declared_min);
    ASSERT_TRUE(header.pragma->declared_max);
    EXPECT_EQ(header.pragma->declared_max->to_string(), "0.18");
    ASSERT_TRUE(header.pragma->language_version);
    EXPECT_EQ(header.pragma->language_version->to_string(), "0.18");
}

TEST(LanguageVersion, RangeContainsIsInclusive)
{
    const VersionRange range{.min = {.major = 0, .minor = 16}, .max = {.major = 0, .minor = 18}};
    EXPECT_TRUE(range.contains({.major = 0, .minor = 16}));
    EXPECT_TRUE(range.contains({.major = 0, .minor = 18}));
    EXPECT_FALSE(range.contains({.major = 0, .minor = 15}));
    EXPECT_FALSE(range.contains({.major = 1, .minor = 0}));
}

TEST(HeaderExtractor, BoundedPragma)
{
    auto header = header_of("pragma language_version >= 0.16 && <= 0.18;\n");
    ASSERT_TRUE(header.pragma);
    const auto& pragma = *header.pragma;
    EXPECT_EQ(pragma.line, 1U);
    EXPECT_TRUE(pragma.well_formed);
    ASSERT_TRUE(pragma.language_version);
    EXPECT_EQ(pragma.language_version->to_string(), "0.16");
    ASSERT_TRUE(pragma.declared_min);
    ASSERT_TRUE(pragma.declared_max);
    EXPECT_EQ(pragma.declared_min->to_string(), "0.16");
    EXPECT_EQ(pragma.declared_max->to_string(), "0.18");
    EXPECT_EQ(pragma.raw_text, "pragma language_version >= 0.16 && <= 0.18;");
}

TEST(HeaderExtractor, PatchVersionIsNormalizedButNotWellFormed)
{
    auto header = header_of("pragma language_version >= 0.16.0;");
    ASSERT_TRUE(header.pragma);
    EXPECT_FALSE(header.pragma->well_formed);
    ASSERT_TRUE(header.pragma->language_version);
    EXPECT_EQ(header.pragma->language_version->to_string(), "0.16");
    ASSERT_TRUE(header.pragma->declared_min);
    EXPECT_FALSE(header.pragma->declared_max);
}

TEST(HeaderExtractor, MissingOperatorSetsBothBounds)
{
    auto header = header_of("pragma language_version 0.17;");
    ASSERT_TRUE(header.pragma);
    EXPECT_FALSE(header.pragma->well_formed);
    EXPECT_EQ(header.pragma->declared_min->to_string(), "0.17");
    EXPECT_EQ(header.pragma->declared_max->to_string(), "0.17");
}

TEST(HeaderExtractor, ExactAndTildeOperators)
{
    for (std::string_view text :
         {"pragma language_version == 0.17;", "pragma language_version ~ 0.17;"}) {
        auto header = header_of(text);
        ASSERT_TRUE(header.pragma) << text;
        EXPECT_TRUE(header.pragma->well_formed) << text;
        EXPECT_EQ(header.pragma->declared_min->to_string(), "0.17") << text;
        EXPECT_EQ(header.pragma->declared_max->to_string(), "0.17") << text;
    }
}

TEST(HeaderExtractor, StrictOperators)
{
    auto header = header_of("pragma language_version > 0.15 && < 0.19;");
    ASSERT_TRUE(header.pragma);
    EXPECT_TRUE(header.pragma->well_formed);
    EXPECT_EQ(header.pragma->declared_min->to_string(), "0.15");
    EXPECT_EQ(header.pragma->declared_max->to_string(), "0.19");
}

TEST(HeaderExtractor, PragmaWrappedOverLines)
{
    auto header = header_of("// header\npragma language_version >= 0.16\n    && <= 0.18;\n");
    ASSERT_TRUE(header.pragma);
    EXPECT_EQ(header.pragma->line, 2U);
    EXPECT_TRUE(header.pragma->well_formed);
    EXPECT_EQ(header.pragma->raw_text, "pragma language_version >= 0.16 && <= 0.18;");
}

TEST(HeaderExtractor, PragmaInCommentIsIgnored)
{
    auto header = header_of("// pragma language_version >= 0.16;\nexport ledger x: Field;");
    EXPECT_FALSE(header.pragma);
}

TEST(HeaderExtractor, ImportsInSourceOrder)
{
    auto header = header_of("import CompactStandardLibrary;\n"
                            "import \"./lib/token\" prefix Tok_;\n"
                            "import Foo prefix F$;\n"
                            "include \"util\";\n"
                            "import CompactStandardLibrary;\n");
    ASSERT_EQ(header.imports.size(), 5U);

    EXPECT_EQ(header.imports[0].name, "CompactStandardLibrary");
    EXPECT_FALSE(header.imports[0].prefix);
    EXPECT_EQ(header.imports[0].line, 1U);

    EXPECT_EQ(header.imports[1].name, "./lib/token");
    ASSERT_TRUE(header.imports[1].prefix);
    EXPECT_EQ(*header.imports[1].prefix, "Tok_");
    EXPECT_EQ(header.imports[1].line, 2U);

    EXPECT_EQ(header.imports[2].name, "Foo");
    EXPECT_EQ(*header.imports[2].prefix, "F$");

    EXPECT_EQ(header.imports[3].name, "util");
    EXPECT_EQ(header.imports[3].line, 4U);

    // Duplicates are kept.
    EXPECT_EQ(header.imports[4].name, "CompactStandardLibrary");
}

TEST(HeaderExtractor, ImportInsideStringOrCommentIsIgnored)
{
    auto header = header_of("const s = \"import Foo;\";\n/* import Bar; */\n");
    EXPECT_TRUE(header.imports.empty());
}

TEST(HeaderExtractor, NoPragmaIsNotAnError)
{
    auto header = header_of("export ledger counter: Counter;");
    EXPECT_FALSE(header.pragma);
    EXPECT_TRUE(header.imports.empty());
}

}  // namespace compactscan::header::test
