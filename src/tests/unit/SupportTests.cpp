// File: tests/unit/SupportTests.cpp
// Purpose: Cover integer literal parsing, Expected results, diagnostic
//          printing and source path registration.
// Key invariants: Diagnostics print as "path:line:col: error: msg" when a
//                 file is known and "line N:col: error: msg" otherwise.
// Ownership/Lifetime: Standalone tests.
// Links: src/support/literal.hpp, src/support/diag_expected.hpp,
//        src/support/source_manager.hpp

#include <gtest/gtest.h>

#include "support/diag_expected.hpp"
#include "support/literal.hpp"
#include "support/source_manager.hpp"

#include <sstream>
#include <string>

using namespace rexta::support;

TEST(Literal, DecimalAndHex)
{
    int64_t v = -1;
    EXPECT_EQ(parseIntegerLiteral("0", v), LiteralStatus::Ok);
    EXPECT_EQ(v, 0);
    EXPECT_EQ(parseIntegerLiteral("255", v), LiteralStatus::Ok);
    EXPECT_EQ(v, 255);
    EXPECT_EQ(parseIntegerLiteral("0x2000", v), LiteralStatus::Ok);
    EXPECT_EQ(v, 0x2000);
    EXPECT_EQ(parseIntegerLiteral("0XfF", v), LiteralStatus::Ok);
    EXPECT_EQ(v, 255);
    EXPECT_EQ(parseIntegerLiteral("-12", v), LiteralStatus::Ok);
    EXPECT_EQ(v, -12);
}

TEST(Literal, MalformedAndOverflow)
{
    int64_t v = 77;
    EXPECT_EQ(parseIntegerLiteral("", v), LiteralStatus::Malformed);
    EXPECT_EQ(parseIntegerLiteral("0x", v), LiteralStatus::Malformed);
    EXPECT_EQ(parseIntegerLiteral("-", v), LiteralStatus::Malformed);
    EXPECT_EQ(parseIntegerLiteral("12a", v), LiteralStatus::Malformed);
    EXPECT_EQ(parseIntegerLiteral("0x1G", v), LiteralStatus::Malformed);
    EXPECT_EQ(parseIntegerLiteral("99999999999999999999", v), LiteralStatus::OutOfRange);
    EXPECT_EQ(v, 77);
    EXPECT_EQ(parseIntegerLiteral("9223372036854775807", v), LiteralStatus::Ok);
}

TEST(Literal, LooksNumeric)
{
    EXPECT_TRUE(looksNumeric("0x10"));
    EXPECT_TRUE(looksNumeric("-3"));
    EXPECT_TRUE(looksNumeric("7up"));
    EXPECT_FALSE(looksNumeric("loop"));
    EXPECT_FALSE(looksNumeric("-"));
    EXPECT_FALSE(looksNumeric(""));
}

TEST(Expected, ValueAndError)
{
    Expected<int> ok = 42;
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), 42);

    Expected<int> bad = makeError(makeLoc(0, 3, 7), "boom", 5);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().message, "boom");
    EXPECT_EQ(bad.error().code, 5u);
    EXPECT_EQ(bad.error().loc.line, 3u);
    EXPECT_EQ(bad.error().severity, Severity::Error);

    Expected<void> done;
    EXPECT_TRUE(done);
    Expected<void> failed = makeError({}, "nope");
    EXPECT_FALSE(failed);
    EXPECT_EQ(failed.error().code, 0u);
}

TEST(PrintDiag, WithoutSourceManager)
{
    std::ostringstream os;
    printDiag(makeError(makeLoc(0, 4, 2), "bad operand"), os);
    EXPECT_EQ(os.str(), "line 4:2: error: bad operand\n");

    os.str("");
    printDiag(makeError({}, "cannot open file"), os);
    EXPECT_EQ(os.str(), "error: cannot open file\n");
}

TEST(PrintDiag, WithSourceManager)
{
    SourceManager sm;
    const uint32_t id = sm.addFile("dir/../prog.s");
    std::ostringstream os;
    printDiag(makeError(makeLoc(id, 10, 1), "oops"), os, &sm);
    EXPECT_EQ(os.str(), "prog.s:10:1: error: oops\n");

    // Unknown file ids fall back to the line-only form.
    os.str("");
    printDiag(makeError(makeLoc(id + 1, 2, 0), "oops"), os, &sm);
    EXPECT_EQ(os.str(), "line 2: error: oops\n");
}

TEST(SourceManager, DeduplicatesNormalizedPaths)
{
    SourceManager sm;
    const uint32_t a = sm.addFile("src/a.s");
    const uint32_t b = sm.addFile("src/./a.s");
    const uint32_t c = sm.addFile("src/b.s");
    EXPECT_NE(a, 0u);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(sm.fileCount(), 2u);
    EXPECT_EQ(sm.getPath(c), "src/b.s");
    EXPECT_TRUE(sm.getPath(0).empty());
    EXPECT_TRUE(sm.getPath(99).empty());
}
