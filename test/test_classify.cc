#include "catch2/catch.hpp"

#include "classify.h"

#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>

using namespace floatview;

static uint64_t BitsFromFloat(double f)
{
    uint64_t u;
    std::memcpy(&u, &f, sizeof(uint64_t));
    return u;
}

static std::string ReasonOf(ParseOutcome const& outcome)
{
    if (auto const* incomplete = std::get_if<Incomplete>(&outcome))
        return incomplete->reason;
    if (auto const* invalid = std::get_if<Invalid>(&outcome))
        return invalid->reason;
    return "<valid>";
}

static std::string NormalizedOf(ParseOutcome const& outcome)
{
    return std::visit([](auto const& o) { return o.normalized_text; }, outcome);
}

static void CheckIncomplete(std::string const& text, char const* why, ParseOptions const& options = ParseOptions{})
{
    CAPTURE(text);
    auto const outcome = Classify(text, options);
    CHECK(IsIncomplete(outcome));
    CHECK(ReasonOf(outcome) == why);
}

static void CheckInvalid(std::string const& text, char const* why, ParseOptions const& options = ParseOptions{})
{
    CAPTURE(text);
    auto const outcome = Classify(text, options);
    CHECK(IsInvalid(outcome));
    CHECK(ReasonOf(outcome) == why);
}

static void CheckValid(std::string const& text, double value, std::string const& normalized, ParseOptions const& options = ParseOptions{})
{
    CAPTURE(text);
    auto const outcome = Classify(text, options);
    REQUIRE(IsValid(outcome));

    auto const& valid = std::get<Valid>(outcome);
    CHECK(valid.normalized_text == normalized);
    if (std::isnan(value))
    {
        CHECK(std::isnan(valid.value));
    }
    else
    {
        CHECK(BitsFromFloat(valid.value) == BitsFromFloat(value));
    }
}

TEST_CASE("Classify - incomplete")
{
    CheckIncomplete("", reason::kEmpty);
    CheckIncomplete("   \t ", reason::kEmpty);
    CheckIncomplete("-", reason::kSignOnly);
    CheckIncomplete("+", reason::kSignOnly);
    CheckIncomplete(".", reason::kDotOnly);
    CheckIncomplete("-.", reason::kDotOnly);
    CheckIncomplete("+.", reason::kDotOnly);
    CheckIncomplete("1e", reason::kExponentMarkerOnly);
    CheckIncomplete("1.E", reason::kExponentMarkerOnly);
    CheckIncomplete("-.5e", reason::kExponentMarkerOnly);
    CheckIncomplete("12.34e", reason::kExponentMarkerOnly);
    CheckIncomplete("1e-", reason::kExponentSignOnly);
    CheckIncomplete("1e+", reason::kExponentSignOnly);
    CheckIncomplete("+2.5E-", reason::kExponentSignOnly);

    CHECK(NormalizedOf(Classify("")) == "");
    CHECK(NormalizedOf(Classify("  1e- ")) == "1e-");
}

TEST_CASE("Classify - incomplete special tokens")
{
    CheckIncomplete("n", reason::kIncompleteNaN);
    CheckIncomplete("N", reason::kIncompleteNaN);
    CheckIncomplete("Na", reason::kIncompleteNaN);
    CheckIncomplete("-na", reason::kIncompleteNaN);

    CheckIncomplete("i", reason::kIncompleteInfinity);
    CheckIncomplete("In", reason::kIncompleteInfinity);
    CheckIncomplete("infi", reason::kIncompleteInfinity);
    CheckIncomplete("-INFINI", reason::kIncompleteInfinity);
    CheckIncomplete("+infinit", reason::kIncompleteInfinity);

    CHECK(NormalizedOf(Classify(" -Na ")) == "-Na");
}

TEST_CASE("Classify - invalid")
{
    CheckInvalid("1ee3", reason::kInvalidSyntax);
    CheckInvalid("--1", reason::kInvalidSyntax);
    CheckInvalid("e3", reason::kInvalidSyntax);
    CheckInvalid("1e1.2", reason::kInvalidSyntax);
    CheckInvalid("1e+-3", reason::kInvalidSyntax);
    CheckInvalid("1.2.3", reason::kInvalidSyntax);
    CheckInvalid("..5", reason::kInvalidSyntax);
    CheckInvalid(".e1", reason::kInvalidSyntax);
    CheckInvalid("0x10", reason::kInvalidSyntax);
    CheckInvalid("1 2", reason::kInvalidSyntax);
    CheckInvalid("1,5", reason::kInvalidSyntax);
    CheckInvalid("+-1", reason::kInvalidSyntax);
    CheckInvalid("nana", reason::kInvalidSyntax);
    CheckInvalid("nan1", reason::kInvalidSyntax);
    CheckInvalid("infinityy", reason::kInvalidSyntax);
    CheckInvalid("infx", reason::kInvalidSyntax);
    CheckInvalid("abc", reason::kInvalidSyntax);

    CHECK(NormalizedOf(Classify(" 1ee3 ")) == "1ee3");
}

TEST_CASE("Classify - valid decimals")
{
    CheckValid("0", 0.0, "0");
    CheckValid("-0", -0.0, "-0");
    CheckValid("1.0", 1.0, "1.0");
    CheckValid("-1.25", -1.25, "-1.25");
    CheckValid(".5", 0.5, ".5");
    CheckValid("1.", 1.0, "1.");
    CheckValid("1e-3", 1e-3, "1e-3");
    CheckValid("-1.2E+8", -1.2e8, "-1.2E+8");
    CheckValid("1.e2", 100.0, "1.e2");
    CheckValid("007", 7.0, "007");
    CheckValid("0.1", 0.1, "0.1");
    CheckValid("  3.5\t\n", 3.5, "3.5");
    CheckValid("9007199254740993", 9007199254740992.0, "9007199254740993");
    CheckValid("2.2250738585072014e-308", std::numeric_limits<double>::min(), "2.2250738585072014e-308");
    CheckValid("4.9406564584124654e-324", std::numeric_limits<double>::denorm_min(), "4.9406564584124654e-324");
    CheckValid("1.7976931348623157e308", std::numeric_limits<double>::max(), "1.7976931348623157e308");
}

TEST_CASE("Classify - leading plus is stripped")
{
    CheckValid("+1", 1.0, "1");
    CheckValid("+.5e1", 5.0, ".5e1");
    CheckValid(" +0 ", 0.0, "0");
}

TEST_CASE("Classify - out of range saturates")
{
    double const inf = std::numeric_limits<double>::infinity();

    CheckValid("1e400", inf, "1e400");
    CheckValid("-1e400", -inf, "-1e400");
    CheckValid("1e-400", 0.0, "1e-400");
    CheckValid("-1e-400", -0.0, "-1e-400");
    CheckValid("1e999999999999", inf, "1e999999999999");
}

TEST_CASE("Classify - special tokens")
{
    double const inf = std::numeric_limits<double>::infinity();
    double const nan = std::numeric_limits<double>::quiet_NaN();

    CheckValid("NaN", nan, "NaN");
    CheckValid("nan", nan, "NaN");
    CheckValid("NAN", nan, "NaN");
    CheckValid("-NaN", nan, "-NaN");
    CheckValid("+nan", nan, "+NaN");

    CheckValid("Inf", inf, "Infinity");
    CheckValid("inf", inf, "Infinity");
    CheckValid("INFINITY", inf, "Infinity");
    CheckValid("-inf", -inf, "-Infinity");
    CheckValid("+Infinity", inf, "+Infinity");
    CheckValid("  -Infinity ", -inf, "-Infinity");
}

TEST_CASE("Classify - NaN value carries no sign")
{
    auto const outcome = Classify("-NaN");
    REQUIRE(IsValid(outcome));
    CHECK(!std::signbit(std::get<Valid>(outcome).value));
}

TEST_CASE("Classify - options")
{
    SECTION("leading plus disallowed")
    {
        ParseOptions options;
        options.allow_leading_plus = false;

        CheckInvalid("+1", reason::kLeadingPlus, options);
        CheckInvalid("+", reason::kLeadingPlus, options);
        CheckInvalid("+.", reason::kLeadingPlus, options);
        CheckInvalid("+Inf", reason::kLeadingPlus, options);
        CheckIncomplete("-", reason::kSignOnly, options);
        CheckValid("-1", -1.0, "-1", options);
        CheckValid("1", 1.0, "1", options);
    }

    SECTION("infinity disallowed")
    {
        ParseOptions options;
        options.allow_infinity_synonyms = false;

        CheckInvalid("inf", reason::kInvalidSyntax, options);
        CheckInvalid("Infinity", reason::kInvalidSyntax, options);
        CheckInvalid("in", reason::kInvalidSyntax, options);
        CheckInvalid("1e400", reason::kInfinityNotAllowed, options);
        CheckInvalid("-1e400", reason::kInfinityNotAllowed, options);
        CheckValid("1e300", 1e300, "1e300", options);
        CheckValid("NaN", std::numeric_limits<double>::quiet_NaN(), "NaN", options);
    }

    SECTION("NaN disallowed")
    {
        ParseOptions options;
        options.allow_nan = false;

        CheckInvalid("NaN", reason::kInvalidSyntax, options);
        CheckInvalid("n", reason::kInvalidSyntax, options);
        CheckInvalid("na", reason::kInvalidSyntax, options);
        CheckIncomplete("i", reason::kIncompleteInfinity, options);
        CheckValid("inf", std::numeric_limits<double>::infinity(), "Infinity", options);
    }

    SECTION("case sensitive specials")
    {
        ParseOptions options;
        options.case_insensitive_specials = false;

        double const inf = std::numeric_limits<double>::infinity();

        CheckValid("NaN", std::numeric_limits<double>::quiet_NaN(), "NaN", options);
        CheckValid("-Inf", -inf, "-Infinity", options);
        CheckValid("Infinity", inf, "Infinity", options);

        CheckInvalid("nan", reason::kInvalidSyntax, options);
        CheckInvalid("INF", reason::kInvalidSyntax, options);
        CheckInvalid("infinity", reason::kInvalidSyntax, options);

        // Partially typed tokens are not recognized in this mode.
        CheckInvalid("Na", reason::kInvalidSyntax, options);
        CheckInvalid("In", reason::kInvalidSyntax, options);
        CheckInvalid("Infin", reason::kInvalidSyntax, options);
    }
}

TEST_CASE("Classify - deterministic")
{
    for (char const* text : {"", "-", "1e", "1ee3", "-1.25", "nan", "+Inf", " 7 "})
    {
        CAPTURE(text);

        auto const a = Classify(text);
        auto const b = Classify(text);
        CHECK(a.index() == b.index());
        CHECK(ReasonOf(a) == ReasonOf(b));
        CHECK(NormalizedOf(a) == NormalizedOf(b));
    }
}

TEST_CASE("Classify - normalized text is a fixed point")
{
    for (char const* text : {"1.0", "+1", "  -2.5e-3 ", ".5", "1.", "+.25E+2", "nan", "-NaN", "inf", "+INFINITY", "1e400"})
    {
        CAPTURE(text);

        auto const first = Classify(text);
        REQUIRE(IsValid(first));
        auto const& v1 = std::get<Valid>(first);

        auto const second = Classify(v1.normalized_text);
        REQUIRE(IsValid(second));
        auto const& v2 = std::get<Valid>(second);

        CHECK(v2.normalized_text == v1.normalized_text);
        if (std::isnan(v1.value))
        {
            CHECK(std::isnan(v2.value));
        }
        else
        {
            CHECK(BitsFromFloat(v2.value) == BitsFromFloat(v1.value));
        }
    }
}
