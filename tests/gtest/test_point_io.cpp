// =============================================================================
// Coordinate File I/O Tests
// =============================================================================

#include <gtest/gtest.h>
#include "knowmap/io/point_io.hpp"
#include "knowmap/error.hpp"
#include <filesystem>
#include <fstream>
#include <string>

using namespace knowmap;
namespace fs = std::filesystem;

class PointIoTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("knowmap_io_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::string write_text(const std::string& name, const std::string& text) {
        const fs::path p = dir / name;
        std::ofstream out(p);
        out << text;
        return p.string();
    }

    fs::path dir;
};

TEST_F(PointIoTest, ReadsSpaceAndCommaSeparated) {
    const std::string path = write_text("pts.txt",
        "# articles\n"
        "0.1 0.2\n"
        "\n"
        "0.3,0.4\n"
        "  1 0  \r\n");

    PointSet pts = io::read_points(path);
    ASSERT_EQ(pts.size(), 3u);
    EXPECT_EQ(pts[0], Point2D(0.1, 0.2));
    EXPECT_EQ(pts[1], Point2D(0.3, 0.4));
    EXPECT_EQ(pts[2], Point2D(1.0, 0.0));
}

TEST_F(PointIoTest, MalformedLineReportsLocation) {
    const std::string path = write_text("bad.txt", "0.1 0.2\n0.5\n");
    try {
        io::read_points(path);
        FAIL() << "expected IOError";
    } catch (const IOError& e) {
        EXPECT_EQ(e.code(), ErrorCode::IO_ERROR);
        EXPECT_NE(e.context().find(":2"), std::string::npos);
    }

    const std::string extra = write_text("extra.txt", "0.1 0.2 0.3\n");
    EXPECT_THROW(io::read_points(extra), IOError);
}

TEST_F(PointIoTest, MissingFile) {
    EXPECT_THROW(io::read_points((dir / "nope.txt").string()), IOError);
}

TEST_F(PointIoTest, WriteThenReadKeepsFullPrecision) {
    PointSet pts = {{0.1, 1.0 / 3.0}, {0.0, 1.0}, {0.123456789012345678, 0.987654321}};
    const std::string path = (dir / "out.txt").string();

    io::write_points_atomic(path, pts);
    EXPECT_EQ(io::read_points(path), pts);
    EXPECT_FALSE(fs::exists(path + ".tmp"));
}

TEST_F(PointIoTest, AtomicWriteReplacesExistingFile) {
    const std::string path = write_text("active.txt", "0.5 0.5\n");
    io::write_points_atomic(path, {{0.1, 0.1}, {0.2, 0.2}});
    EXPECT_EQ(io::read_points(path).size(), 2u);
}

TEST_F(PointIoTest, FailedWriteLeavesOldFile) {
    const std::string path = write_text("active.txt", "0.5 0.5\n");
    // A directory squatting on the temp name makes the write fail
    fs::create_directories(path + ".tmp");

    EXPECT_THROW(io::write_points_atomic(path, {{0.1, 0.1}}), IOError);

    PointSet kept = io::read_points(path);
    ASSERT_EQ(kept.size(), 1u);
    EXPECT_EQ(kept[0], Point2D(0.5, 0.5));
}

TEST_F(PointIoTest, WriteIntoMissingDirectoryFails) {
    EXPECT_THROW(io::write_points_atomic((dir / "missing" / "x.txt").string(), {{0.1, 0.1}}), IOError);
}

TEST_F(PointIoTest, GroupWriteReplacesAllFiles) {
    const std::string a = write_text("a.txt", "0.5 0.5\n");
    const std::string b = write_text("b.txt", "0.5 0.5\n");
    const PointSet pa = {{0.1, 0.1}, {0.2, 0.2}};
    const PointSet pb = {{0.3, 0.3}, {0.4, 0.4}, {0.5, 0.6}};

    io::write_point_files_atomic({{a, &pa}, {b, &pb}});

    EXPECT_EQ(io::read_points(a), pa);
    EXPECT_EQ(io::read_points(b), pb);
    EXPECT_FALSE(fs::exists(a + ".tmp"));
    EXPECT_FALSE(fs::exists(b + ".tmp"));
}

TEST_F(PointIoTest, GroupWriteFailureLeavesEveryFile) {
    const std::string a = write_text("a.txt", "0.5 0.5\n");
    const std::string bad = (dir / "missing" / "b.txt").string();
    const PointSet pa = {{0.1, 0.1}, {0.2, 0.2}};
    const PointSet pb = {{0.3, 0.3}};

    EXPECT_THROW(io::write_point_files_atomic({{a, &pa}, {bad, &pb}}), IOError);

    PointSet kept = io::read_points(a);
    ASSERT_EQ(kept.size(), 1u);
    EXPECT_EQ(kept[0], Point2D(0.5, 0.5));
    EXPECT_FALSE(fs::exists(a + ".tmp"));
}
