/**
 * @file test_multipart_form.cpp
 * @brief Unit tests for multipart/form-data encoding
 */

#include <gtest/gtest.h>

#include <kcenon/media_uploader/request/multipart_form.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace kcenon::media_uploader::test {

class MultipartFormTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "media_uploader_multipart_test";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    static auto body_string(const multipart_form& form) -> std::string {
        auto body = form.body();
        return std::string(body.begin(), body.end());
    }

    std::filesystem::path test_dir_;
};

TEST_F(MultipartFormTest, EmptyForm_OnlyClosingBoundary) {
    multipart_form form("XYZ");

    EXPECT_EQ(form.part_count(), 0u);
    EXPECT_EQ(body_string(form), "--XYZ--\r\n");
    EXPECT_EQ(form.content_type(), "multipart/form-data; boundary=XYZ");
}

TEST_F(MultipartFormTest, Field_Encoding) {
    multipart_form form("XYZ");
    form.add_field("params", R"({"a":1})");

    EXPECT_EQ(body_string(form),
              "--XYZ\r\n"
              "Content-Disposition: form-data; name=\"params\"\r\n\r\n"
              "{\"a\":1}\r\n"
              "--XYZ--\r\n");
}

TEST_F(MultipartFormTest, GeneratedBoundariesDiffer) {
    multipart_form a;
    multipart_form b;

    EXPECT_FALSE(a.boundary().empty());
    EXPECT_NE(a.boundary(), b.boundary());
}

TEST_F(MultipartFormTest, AddFile_UsesFilenameAndContentType) {
    auto path = test_dir_ / "clip.mp4";
    {
        std::ofstream out(path, std::ios::binary);
        out << "video-bytes";
    }

    multipart_form form("B");
    auto added = form.add_file("file_1", path);

    ASSERT_TRUE(added);
    auto body = body_string(form);
    EXPECT_NE(body.find("name=\"file_1\"; filename=\"clip.mp4\""), std::string::npos);
    EXPECT_NE(body.find("Content-Type: video/mp4\r\n\r\nvideo-bytes\r\n"), std::string::npos);
}

TEST_F(MultipartFormTest, AddFile_Missing) {
    multipart_form form("B");

    auto added = form.add_file("file_1", test_dir_ / "missing.mp4");

    ASSERT_FALSE(added);
    EXPECT_EQ(added.error().code, error_code::file_not_found);
    EXPECT_EQ(form.part_count(), 0u);
}

TEST_F(MultipartFormTest, AddStream_ReadsFromCurrentPosition) {
    std::istringstream stream("skipme-payload");
    stream.seekg(7);

    multipart_form form("B");
    auto added = form.add_stream("upload", stream);

    ASSERT_TRUE(added);
    auto body = body_string(form);
    EXPECT_NE(body.find("application/octet-stream\r\n\r\npayload\r\n"), std::string::npos);
    EXPECT_EQ(body.find("skipme"), std::string::npos);
}

TEST_F(MultipartFormTest, QuotesAreEscaped) {
    multipart_form form("B");
    form.add_field("we\"ird\r\n", "v");

    EXPECT_NE(body_string(form).find("name=\"we\\\"ird\""), std::string::npos);
}

TEST_F(MultipartFormTest, BinaryDataPreserved) {
    multipart_form form("B");
    std::vector<uint8_t> data = {0x00, 0xff, 0x0d, 0x0a};
    form.add_data("bin", "raw.bin", "application/octet-stream", data);

    auto body = form.body();
    std::string marker = "application/octet-stream\r\n\r\n";
    auto text = std::string(body.begin(), body.end());
    auto pos = text.find(marker);
    ASSERT_NE(pos, std::string::npos);
    pos += marker.size();
    ASSERT_LE(pos + data.size(), body.size());
    EXPECT_TRUE(std::equal(data.begin(), data.end(), body.begin() + static_cast<long>(pos)));
    EXPECT_EQ(form.part_count(), 1u);
}

}  // namespace kcenon::media_uploader::test
