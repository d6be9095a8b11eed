// =============================================================================
// Fingerprint Tests
// =============================================================================

#include <gtest/gtest.h>
#include "capture/Fingerprint.hpp"

#include <string>
#include <vector>

using namespace capture;

TEST(RollingHashTest, KnownValues) {
    EXPECT_EQ(rolling_hash(""), "0");
    EXPECT_EQ(rolling_hash("a"), "61");
    EXPECT_EQ(rolling_hash("ab"), "c21");
    EXPECT_EQ(rolling_hash("hello world"), "6aefe2c4");
}

TEST(RollingHashTest, WrapsToSigned32Bit) {
    EXPECT_EQ(rolling_hash_value("hello world"), 1794106052);
    EXPECT_EQ(rolling_hash("Hello there"), "-31d41a8a");
    EXPECT_EQ(rolling_hash("The quick brown fox jumps over the lazy dog"), "-245322ad");
}

TEST(FingerprintTest, IgnoresCaseAndSurroundingWhitespace) {
    EXPECT_EQ(fingerprint("  Hello There \n"), fingerprint("hello there"));
    EXPECT_NE(fingerprint("hello there"), fingerprint("hello where"));
}

TEST(FingerprintTest, OnlyLeadingHundredCharactersCount) {
    const std::string head(100, 'x');
    EXPECT_EQ(fingerprint(head + " first ending"), fingerprint(head + " a different, longer ending"));
    EXPECT_EQ(fingerprint(head), fingerprint(head + "tail"));
    EXPECT_NE(fingerprint(head.substr(0, 99)), fingerprint(head));
}

TEST(FingerprintTest, CountsCodePointsNotBytes) {
    const std::string head(99, 'y');
    const std::string e_acute = "\xC3\xA9";
    // the 100th character is two bytes long and must be kept whole
    EXPECT_EQ(fingerprint(head + e_acute + "zzz"), fingerprint(head + e_acute));
    EXPECT_NE(fingerprint(head + e_acute), fingerprint(head));
}

TEST(SnapshotDigestTest, JoinsFragmentTexts) {
    std::vector<Fragment> frags = {
        {Role::User, "a", 0.0},
        {Role::Assistant, "b", 1.0},
    };
    EXPECT_EQ(snapshot_digest(frags), rolling_hash("a|||b"));
    EXPECT_EQ(snapshot_digest({}), "0");
}
