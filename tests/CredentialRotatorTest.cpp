#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <set>
#include "CredentialRotator.hpp"
#include "SessionErrors.hpp"

TEST(CredentialRotatorTest, EveryCycleIsAPermutation) {
    std::vector<Credential> keys = {"k1", "k2", "k3", "k4"};
    CredentialRotator rotator(keys, 42);

    for (int cycle = 0; cycle < 5; cycle++) {
        std::vector<Credential> seen;
        for (size_t i = 0; i < keys.size(); i++) {
            seen.push_back(rotator.next());
        }
        std::sort(seen.begin(), seen.end());
        EXPECT_EQ(keys, seen) << "cycle " << cycle;
    }
}

TEST(CredentialRotatorTest, SingleCredentialRepeats) {
    CredentialRotator rotator({"only"});
    for (int i = 0; i < 3; i++) {
        EXPECT_EQ("only", rotator.next());
    }
}

TEST(CredentialRotatorTest, ConsecutiveDrawsWithinCycleDiffer) {
    CredentialRotator rotator({"a", "b", "c"}, 7);
    std::set<Credential> drawn;
    for (int i = 0; i < 3; i++) {
        drawn.insert(rotator.next());
    }
    EXPECT_EQ(3u, drawn.size());
}

TEST(CredentialRotatorTest, RejectsEmptySets) {
    EXPECT_THROW(CredentialRotator(std::vector<Credential>()), ConfigurationError);
    EXPECT_THROW(CredentialRotator({"a", ""}), ConfigurationError);
}

TEST(CredentialRotatorTest, ParseSplitsAndTrims) {
    std::vector<Credential> expected = {"a", "b", "c"};
    EXPECT_EQ(expected, CredentialRotator::parse("a, b,,c "));
    EXPECT_THROW(CredentialRotator::parse(" , ,"), ConfigurationError);
    EXPECT_THROW(CredentialRotator::parse(""), ConfigurationError);
}

TEST(CredentialRotatorTest, LoadsFromEnvironment) {
    const char* name = "LIVEVOICE_TEST_KEYS";
    unsetenv(name);
    EXPECT_THROW(CredentialRotator::loadFromEnvironment(name), ConfigurationError);

    setenv(name, "x,y", 1);
    std::vector<Credential> expected = {"x", "y"};
    EXPECT_EQ(expected, CredentialRotator::loadFromEnvironment(name));
    unsetenv(name);
}
