#include <catch2/catch_test_macros.hpp>
#include "charclass/CharacterClassifier.hpp"

using charclass::CharacterClassifier;
using charclass::CodepointRange;
using charclass::TargetSet;

TEST_CASE("CharacterClassifier - Default range", "[charclass]")
{
    CharacterClassifier classifier;
    const std::optional<TargetSet> none;

    SECTION("Bounds are inclusive")
    {
        REQUIRE(classifier.isProblematic(0x80, none));
        REQUIRE(classifier.isProblematic(0xFF, none));
    }

    SECTION("ASCII and codepoints above 0xFF are not problematic")
    {
        REQUIRE_FALSE(classifier.isProblematic(U'A', none));
        REQUIRE_FALSE(classifier.isProblematic(0x7F, none));
        REQUIRE_FALSE(classifier.isProblematic(0x100, none));
        REQUIRE_FALSE(classifier.isProblematic(0x2014, none));
    }

    SECTION("Configured range replaces the default")
    {
        CharacterClassifier wide(CodepointRange{ 0x80, 0x10FFFF });
        REQUIRE(wide.isProblematic(0x2014, none));
        REQUIRE_FALSE(wide.isProblematic(U'z', none));
    }
}

TEST_CASE("CharacterClassifier - Target set", "[charclass]")
{
    CharacterClassifier classifier;

    SECTION("Only members of the set are problematic")
    {
        const std::optional<TargetSet> targets = TargetSet{ 0x82 };
        REQUIRE(classifier.isProblematic(0x82, targets));
        REQUIRE_FALSE(classifier.isProblematic(0x81, targets));
    }

    SECTION("Set members outside the default range still count")
    {
        const std::optional<TargetSet> targets = TargetSet{ U'A', 0x2014 };
        REQUIRE(classifier.isProblematic(U'A', targets));
        REQUIRE(classifier.isProblematic(0x2014, targets));
    }

    SECTION("An empty set flags nothing")
    {
        const std::optional<TargetSet> targets = TargetSet{};
        REQUIRE_FALSE(classifier.isProblematic(0x81, targets));
    }
}

TEST_CASE("CharacterClassifier - Printability", "[charclass]")
{
    REQUIRE(CharacterClassifier::isPrintable(U'A'));
    REQUIRE(CharacterClassifier::isPrintable(0xE9));
    REQUIRE(CharacterClassifier::isPrintable(U' '));
    REQUIRE(CharacterClassifier::isPrintable(0xA0));

    REQUIRE_FALSE(CharacterClassifier::isPrintable(0x81));    // Cc
    REQUIRE_FALSE(CharacterClassifier::isPrintable(0x200B));  // Cf
    REQUIRE_FALSE(CharacterClassifier::isPrintable(0xE000));  // Co
    REQUIRE_FALSE(CharacterClassifier::isPrintable(0x2028));  // Zl
    REQUIRE_FALSE(CharacterClassifier::isPrintable(0x2029));  // Zp
    REQUIRE_FALSE(CharacterClassifier::isPrintable(0x0378));  // Cn
    REQUIRE_FALSE(CharacterClassifier::isPrintable(0x110000));
}

TEST_CASE("CharacterClassifier - Category strings", "[charclass]")
{
    SECTION("Printable characters")
    {
        REQUIRE(CharacterClassifier::describe(0xE9) == "Printable");
    }

    SECTION("Control character")
    {
        REQUIRE(CharacterClassifier::describe(0x81) == "Non-printable - Unicode category: Cc (Cc)");
    }

    SECTION("Unassigned codepoint has no database entry")
    {
        REQUIRE(CharacterClassifier::describe(0x0378) == "Non-printable - Unicode category: Cn (UNDEFINED)");
    }

    SECTION("Beyond the Unicode range")
    {
        REQUIRE(CharacterClassifier::categoryCode(0x110000) == CharacterClassifier::kUndefined);
        REQUIRE(CharacterClassifier::describe(0x110000) ==
                "Non-printable - Unicode category: UNDEFINED (UNDEFINED)");
    }
}

TEST_CASE("CharacterClassifier - classify combines membership and category", "[charclass]")
{
    CharacterClassifier classifier;

    auto c = classifier.classify(0x81, std::nullopt);
    REQUIRE(c.is_problematic);
    REQUIRE_FALSE(c.is_printable);
    REQUIRE(c.category.rfind("Non-printable", 0) == 0);

    c = classifier.classify(0xE9, TargetSet{ 0x82 });
    REQUIRE_FALSE(c.is_problematic);
    REQUIRE(c.is_printable);
    REQUIRE(c.category == "Printable");
}
