#include <string>

#include <gtest/gtest.h>

#include "chunkfs/client/http_upload_transport.h"
#include "chunkfs/http/multipart_form.h"

namespace {

std::string BinaryPayload() {
    std::string bytes;
    for (int i = 0; i < 512; ++i) {
        bytes.push_back(static_cast<char>(i % 256));
    }
    // Embedded CRLF and dashes must survive as file content.
    bytes += "\r\n--not-a-boundary\r\n";
    return bytes;
}

}  // namespace

TEST(MultipartForm, DecodesChunkFormBuiltByTheClient) {
    chunkfs::client::ChunkPayload chunk;
    chunk.session_id = "3f0c9a2e-session";
    chunk.index = 42;
    chunk.content_hash = "abcdef";
    chunk.bytes = BinaryPayload();

    std::string content_type;
    const auto body = chunkfs::client::BuildChunkForm(chunk, &content_type);
    EXPECT_EQ(content_type.rfind("multipart/form-data; boundary=chunkfs-", 0), 0u);

    auto form = chunkfs::http::ParseMultipartForm(content_type, body);
    ASSERT_TRUE(form.ok()) << form.error().message;
    EXPECT_EQ(form.value().Field("uploadId"), "3f0c9a2e-session");
    EXPECT_EQ(form.value().Field("chunkIndex"), "42");
    EXPECT_EQ(form.value().Field("fileHash"), "abcdef");
    ASSERT_TRUE(form.value().file.has_value());
    EXPECT_EQ(*form.value().file, chunk.bytes);
    EXPECT_EQ(form.value().file_name, "42.part");
    EXPECT_EQ(form.value().Field("missing"), "");
}

TEST(MultipartForm, FallsBackToFirstPartWithFilename) {
    const std::string body =
        "--b1\r\n"
        "Content-Disposition: form-data; name=\"uploadId\"\r\n\r\n"
        "abc\r\n"
        "--b1\r\n"
        "Content-Disposition: form-data; name=\"blob\"; filename=\"x.bin\"\r\n\r\n"
        "payload\r\n"
        "--b1--\r\n";
    auto form = chunkfs::http::ParseMultipartForm("multipart/form-data; boundary=b1", body);
    ASSERT_TRUE(form.ok()) << form.error().message;
    ASSERT_TRUE(form.value().file.has_value());
    EXPECT_EQ(*form.value().file, "payload");
    EXPECT_EQ(form.value().file_name, "x.bin");
    EXPECT_EQ(form.value().Field("uploadId"), "abc");
}

TEST(MultipartForm, BodyWithoutFilePartHasNoFile) {
    const std::string body =
        "--b2\r\n"
        "Content-Disposition: form-data; name=\"chunkIndex\"\r\n\r\n"
        "0\r\n"
        "--b2--\r\n";
    auto form = chunkfs::http::ParseMultipartForm("multipart/form-data; boundary=b2", body);
    ASSERT_TRUE(form.ok());
    EXPECT_FALSE(form.value().file.has_value());
    EXPECT_EQ(form.value().Field("chunkIndex"), "0");
}

TEST(MultipartForm, RejectsOtherContentTypes) {
    for (const std::string type : {"application/json", "multipart/form-data", ""}) {
        auto form = chunkfs::http::ParseMultipartForm(type, "{}");
        ASSERT_FALSE(form.ok()) << type;
        EXPECT_EQ(form.error().code, chunkfs::core::ErrorCode::kInvalidArgument);
    }
}
