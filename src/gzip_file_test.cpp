#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include "gzip_file.hpp"

using namespace gcscache;
namespace fs = std::filesystem;

class GzipFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() / ("gzip_file_test_" + std::to_string(getpid()));
        fs::create_directories(dir);
        path = (dir / "data.gz").string();
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    std::string readRaw() const {
        std::ifstream in(path, std::ios::binary);
        return std::string{std::istreambuf_iterator<char>{in}, {}};
    }

    fs::path dir;
    std::string path;
};

TEST(AccessModeTest, ParsesReadModes) {
    EXPECT_EQ(parseAccessMode("r"), AccessMode::kRead);
    EXPECT_EQ(parseAccessMode("rb"), AccessMode::kRead);
    EXPECT_EQ(parseAccessMode("rt"), AccessMode::kRead);
}

TEST(AccessModeTest, ParsesWriteModes) {
    EXPECT_EQ(parseAccessMode("w"), AccessMode::kWrite);
    EXPECT_EQ(parseAccessMode("wb"), AccessMode::kWrite);
    EXPECT_EQ(parseAccessMode("a"), AccessMode::kAppend);
    EXPECT_EQ(parseAccessMode("ab"), AccessMode::kAppend);
    EXPECT_EQ(parseAccessMode("x"), AccessMode::kExclusive);
    EXPECT_EQ(parseAccessMode("xt"), AccessMode::kExclusive);
}

TEST(AccessModeTest, RejectsUnknownModes) {
    EXPECT_THROW(parseAccessMode(""), std::invalid_argument);
    EXPECT_THROW(parseAccessMode("q"), std::invalid_argument);
    EXPECT_THROW(parseAccessMode("rw"), std::invalid_argument);
    EXPECT_THROW(parseAccessMode("r+b"), std::invalid_argument);
}

TEST_F(GzipFileTest, WriteThenReadBack) {
    {
        GzipFile out(path, AccessMode::kWrite);
        out.write("hello ");
        out.write("world\n");
    }

    GzipFile in(path, AccessMode::kRead);
    EXPECT_EQ(in.readAll(), "hello world\n");
}

TEST_F(GzipFileTest, WrittenContentIsCompressed) {
    {
        GzipFile out(path, AccessMode::kWrite);
        out.write(std::string(4096, 'a'));
    }

    const auto raw = readRaw();
    ASSERT_GE(raw.size(), 2u);
    EXPECT_EQ(static_cast<unsigned char>(raw[0]), 0x1f);
    EXPECT_EQ(static_cast<unsigned char>(raw[1]), 0x8b);
    EXPECT_LT(raw.size(), 4096u);
}

TEST_F(GzipFileTest, PlainFilesPassThrough) {
    {
        std::ofstream out(path, std::ios::binary);
        out << "not compressed";
    }

    GzipFile in(path, AccessMode::kRead);
    EXPECT_EQ(in.readAll(), "not compressed");
}

TEST_F(GzipFileTest, EmptyFileReadsEmpty) {
    { std::ofstream out(path, std::ios::binary); }

    GzipFile in(path, AccessMode::kRead);
    EXPECT_EQ(in.readAll(), "");
}

TEST_F(GzipFileTest, AppendAddsMember) {
    {
        GzipFile out(path, AccessMode::kWrite);
        out.write("first\n");
    }
    {
        GzipFile out(path, AccessMode::kAppend);
        out.write("second\n");
    }

    GzipFile in(path, AccessMode::kRead);
    EXPECT_EQ(in.readAll(), "first\nsecond\n");
}

TEST_F(GzipFileTest, ReadLineSplitsOnNewlines) {
    {
        GzipFile out(path, AccessMode::kWrite);
        out.write("one\ntwo\nthree");
    }

    GzipFile in(path, AccessMode::kRead);
    std::string line;
    ASSERT_TRUE(in.readLine(line));
    EXPECT_EQ(line, "one");
    ASSERT_TRUE(in.readLine(line));
    EXPECT_EQ(line, "two");
    ASSERT_TRUE(in.readLine(line));
    EXPECT_EQ(line, "three");
    EXPECT_FALSE(in.readLine(line));
}

TEST_F(GzipFileTest, ExclusiveFailsOnExistingFile) {
    { std::ofstream out(path, std::ios::binary); }

    EXPECT_THROW({ GzipFile file(path, AccessMode::kExclusive); }, std::runtime_error);
}

TEST_F(GzipFileTest, MissingFileThrowsOnRead) {
    EXPECT_THROW({ GzipFile file((dir / "missing.gz").string(), AccessMode::kRead); }, std::runtime_error);
}

TEST_F(GzipFileTest, WrongDirectionThrows) {
    GzipFile out(path, AccessMode::kWrite);
    char buf[4];
    EXPECT_THROW(out.read(buf, sizeof(buf)), std::logic_error);
}

TEST_F(GzipFileTest, ReadLineOnWriteHandleThrows) {
    GzipFile out(path, AccessMode::kWrite);
    out.write("hello\n");
    std::string line;
    EXPECT_THROW(out.readLine(line), std::logic_error);
}

TEST_F(GzipFileTest, CloseIsIdempotentAndMoveTransfersOwnership) {
    GzipFile out(path, AccessMode::kWrite);
    out.write("data");

    GzipFile moved(std::move(out));
    EXPECT_FALSE(out.isOpen());
    EXPECT_TRUE(moved.isOpen());

    moved.close();
    moved.close();
    EXPECT_FALSE(moved.isOpen());
    EXPECT_THROW(moved.write("more"), std::logic_error);

    GzipFile in(path, AccessMode::kRead);
    EXPECT_EQ(in.readAll(), "data");
}
