// tests/digest_utility_test.cpp
#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "digest_utility.hpp"
#include "split_errors.hpp"
#include "test_support.hpp"

using namespace FileSplitter;
using Digest::DigestUtility;
using Digest::StreamingDigest;

namespace
{
    const std::string EMPTY_SHA256 = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
    const std::string ABC_SHA256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
}

TEST(DigestUtilityTest, KnownVectors)
{
    EXPECT_EQ(DigestUtility::sha256Hex(std::vector<char>{}), EMPTY_SHA256);
    EXPECT_EQ(DigestUtility::sha256Hex("abc", 3), ABC_SHA256);
}

TEST(DigestUtilityTest, StreamingMatchesOneShot)
{
    std::vector<char> data = Testing::patternBytes(100000);
    StreamingDigest digest;
    digest.update(data.data(), 1);
    digest.update(data.data() + 1, 49999);
    digest.update(data.data() + 50000, 0);
    digest.update(data.data() + 50000, 50000);
    EXPECT_EQ(digest.bytesProcessed(), 100000u);
    EXPECT_EQ(digest.finalizeHex(), DigestUtility::sha256Hex(data));
}

TEST(DigestUtilityTest, FinalizedDigestRejectsFurtherUse)
{
    StreamingDigest digest;
    digest.update("abc", 3);
    EXPECT_EQ(digest.finalizeHex(), ABC_SHA256);
    EXPECT_THROW(digest.update("x", 1), std::logic_error);
    EXPECT_THROW(digest.finalizeHex(), std::logic_error);
}

TEST(DigestUtilityTest, FileDigestMatchesBufferDigest)
{
    Testing::TempDir dir;
    std::vector<char> data = Testing::patternBytes(8192 * 3 + 17);
    Testing::writeFile(dir / "data.bin", data);
    EXPECT_EQ(DigestUtility::sha256File(dir / "data.bin"), DigestUtility::sha256Hex(data));
}

TEST(DigestUtilityTest, FileDigestOfMissingFileIsIoError)
{
    Testing::TempDir dir;
    try
    {
        DigestUtility::sha256File(dir / "absent.bin");
        FAIL() << "expected SplitError";
    }
    catch (const SplitError &e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::IoError);
        EXPECT_EQ(e.path(), dir / "absent.bin");
    }
}

TEST(DigestUtilityTest, HexDigestShape)
{
    EXPECT_TRUE(DigestUtility::isHexDigest(ABC_SHA256));
    EXPECT_TRUE(DigestUtility::isHexDigest("BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD"));
    EXPECT_FALSE(DigestUtility::isHexDigest(""));
    EXPECT_FALSE(DigestUtility::isHexDigest(ABC_SHA256.substr(1)));
    EXPECT_FALSE(DigestUtility::isHexDigest("g" + ABC_SHA256.substr(1)));
}
