// tests/test_text_encoding.cpp
//
// Regression tests for ghostledger::util::NormalizeTextToUtf8() and IsValidUtf8()
// (src/util/TextEncoding.h).
//
// Run files and settings.json are hand-editable. A UTF-8 BOM is tolerated; a
// UTF-16 file is refused so the loader reports it instead of mis-parsing it.

#include <doctest/doctest.h>

#include "util/TextEncoding.h"

#include <string>

using ghostledger::util::IsValidUtf8;
using ghostledger::util::NormalizeTextToUtf8;

TEST_CASE("NormalizeTextToUtf8 strips UTF-8 BOM")
{
    std::string s;
    s.append("\xEF\xBB\xBF");
    s.append("{\"a\":1}\n");

    CHECK(NormalizeTextToUtf8(s));
    CHECK(s == "{\"a\":1}\n");
}

TEST_CASE("NormalizeTextToUtf8 leaves plain UTF-8 alone")
{
    std::string s = "{\"currency\":\"\xC2\xA3\"}";
    const std::string before = s;

    CHECK(NormalizeTextToUtf8(s));
    CHECK(s == before);
}

TEST_CASE("NormalizeTextToUtf8 rejects UTF-16 byte order marks")
{
    std::string le("\xFF\xFE{\0}\0", 6);
    std::string be("\xFE\xFF\0{\0}", 6);

    CHECK_FALSE(NormalizeTextToUtf8(le));
    CHECK_FALSE(NormalizeTextToUtf8(be));
}

TEST_CASE("NormalizeTextToUtf8 accepts empty and tiny inputs")
{
    std::string empty;
    std::string one = "x";
    CHECK(NormalizeTextToUtf8(empty));
    CHECK(NormalizeTextToUtf8(one));
    CHECK(one == "x");
}

TEST_CASE("IsValidUtf8 accepts well-formed text")
{
    CHECK(IsValidUtf8(""));
    CHECK(IsValidUtf8("Sage"));
    CHECK(IsValidUtf8("\xC2\xA3" "20"));            // U+00A3
    CHECK(IsValidUtf8("\xE2\x82\xAC"));             // U+20AC
    CHECK(IsValidUtf8("\xF0\x9F\x91\xBB"));         // U+1F47B
    CHECK(IsValidUtf8("\xF4\x8F\xBF\xBF"));         // U+10FFFF
}

TEST_CASE("IsValidUtf8 rejects malformed sequences")
{
    CHECK_FALSE(IsValidUtf8("Sage\xFF"));
    CHECK_FALSE(IsValidUtf8("\xC3"));               // truncated
    CHECK_FALSE(IsValidUtf8("\xC0\xAF"));           // overlong
    CHECK_FALSE(IsValidUtf8("\xE0\x80\xAF"));       // overlong
    CHECK_FALSE(IsValidUtf8("\xED\xA0\x80"));       // surrogate
    CHECK_FALSE(IsValidUtf8("\xF4\x90\x80\x80"));   // past U+10FFFF
    CHECK_FALSE(IsValidUtf8("\xE2\x28\xA1"));       // bad continuation
}
