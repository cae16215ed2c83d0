#include <gtest/gtest.h>
#include <localexec/version.hpp>

TEST(VersionTest, VersionString)
{
    std::string version = localexec::version_string();
    EXPECT_FALSE(version.empty());
    std::string expected = std::to_string(localexec::VERSION_MAJOR) + "." +
                           std::to_string(localexec::VERSION_MINOR) + "." +
                           std::to_string(localexec::VERSION_PATCH);
    EXPECT_EQ(version, expected);
}

TEST(VersionTest, VersionConstants)
{
    EXPECT_GE(localexec::VERSION_MAJOR, 0);
    EXPECT_GE(localexec::VERSION_MINOR, 0);
    EXPECT_GE(localexec::VERSION_PATCH, 0);
}

TEST(VersionTest, InitialRelease)
{
    EXPECT_EQ(localexec::version_string(), "0.1.0");
}
