#include <gtest/gtest.h>

#include "FileStream.hpp"
#include "TestUtils.hpp"

class FileStreamTest : public ::testing::Test {
   protected:
    TempDir dir_;
};

TEST_F(FileStreamTest, OpenMissingFileFails) {
    FileStream stream(dir_ / "missing.bin");
    const auto err = stream.Open(std::ios::binary | std::ios::in);
    ASSERT_TRUE(err.has_value());
    EXPECT_NE(err->message.find("open"), std::string::npos);
    EXPECT_FALSE(stream.IsOpen());
}

TEST_F(FileStreamTest, ReadBeforeOpenFails) {
    FileStream stream(dir_ / "missing.bin");
    std::string buffer(4, '\0');
    const auto [ok, n, err] = stream.Read(buffer);
    EXPECT_FALSE(ok);
    EXPECT_EQ(n, 0);
    EXPECT_EQ(err.code, -1);
}

TEST_F(FileStreamTest, SeekThenReadReturnsBytesAtOffset) {
    WriteFile(dir_ / "data.bin", "0123456789");

    FileStream stream(dir_ / "data.bin");
    ASSERT_FALSE(stream.Open(std::ios::binary | std::ios::in).has_value());
    ASSERT_FALSE(stream.Seek(4).has_value());

    std::string buffer(3, '\0');
    const auto [ok, n, err] = stream.Read(buffer);
    ASSERT_TRUE(ok) << err.message;
    EXPECT_EQ(n, 3);
    EXPECT_EQ(buffer, "456");
}

TEST_F(FileStreamTest, ShortReadAtEndOfFileKeepsStreamUsable) {
    WriteFile(dir_ / "data.bin", "abcdef");

    FileStream stream(dir_ / "data.bin");
    ASSERT_FALSE(stream.Open(std::ios::binary | std::ios::in).has_value());
    ASSERT_FALSE(stream.Seek(4).has_value());

    std::string buffer(10, '\0');
    {
        const auto [ok, n, err] = stream.Read(buffer);
        ASSERT_TRUE(ok) << err.message;
        EXPECT_EQ(n, 2);
        EXPECT_EQ(buffer.substr(0, 2), "ef");
    }

    // A seek after hitting end of file must work again.
    ASSERT_FALSE(stream.Seek(0).has_value());
    {
        const auto [ok, n, err] = stream.Read(buffer);
        ASSERT_TRUE(ok) << err.message;
        EXPECT_EQ(n, 6);
        EXPECT_EQ(buffer.substr(0, 6), "abcdef");
    }
}

TEST_F(FileStreamTest, WriteThenSize) {
    FileStream out(dir_ / "out.bin");
    ASSERT_FALSE(
        out.Open(std::ios::binary | std::ios::out | std::ios::trunc).has_value());
    ASSERT_FALSE(out.Write("hello world").has_value());
    ASSERT_FALSE(out.Close().has_value());

    const auto [ok, size, err] = out.Size();
    ASSERT_TRUE(ok) << err.message;
    EXPECT_EQ(size, 11u);
    EXPECT_EQ(ReadFile(dir_ / "out.bin"), "hello world");
}

TEST_F(FileStreamTest, SizeOfMissingFileFails) {
    FileStream stream(dir_ / "missing.bin");
    const auto [ok, size, err] = stream.Size();
    EXPECT_FALSE(ok);
    EXPECT_NE(err.code, 0);
}

TEST_F(FileStreamTest, ReadAtReturnsSliceAndStopsAtEndOfFile) {
    WriteFile(dir_ / "data.bin", "0123456789");

    FileStream stream(dir_ / "data.bin");
    ASSERT_FALSE(stream.Open(std::ios::binary | std::ios::in).has_value());

    {
        const auto [ok, data, err] = stream.ReadAt(2, 4);
        ASSERT_TRUE(ok) << err.message;
        EXPECT_EQ(data, "2345");
    }
    {
        const auto [ok, data, err] = stream.ReadAt(7, 10);
        ASSERT_TRUE(ok) << err.message;
        EXPECT_EQ(data, "789");
    }
    {
        const auto [ok, data, err] = stream.ReadAt(0, 3);
        ASSERT_TRUE(ok) << err.message;
        EXPECT_EQ(data, "012");
    }
}

TEST_F(FileStreamTest, ReadAtOnClosedStreamFails) {
    FileStream stream(dir_ / "missing.bin");
    const auto [ok, data, err] = stream.ReadAt(0, 4);
    EXPECT_FALSE(ok);
    EXPECT_TRUE(data.empty());
    EXPECT_EQ(err.code, -1);
}
