#include "d2p/upload/multipart.hpp"

#include <gtest/gtest.h>

#include <cctype>
#include <string>
#include <vector>

using d2p::upload::MultipartFormBuilder;

namespace {

std::string as_string(const std::vector<std::uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} // namespace

TEST(MultipartFormBuilder, FileAndFieldLayout) {
    MultipartFormBuilder form("XYZ");
    const std::string content = "%PDF-1.4 binary\r\n\x01\x02";
    form.add_file("document", "scan.pdf", std::vector<std::uint8_t>(content.begin(), content.end()));
    form.add_field("title", "scan.pdf");

    const std::string expected =
        "--XYZ\r\n"
        "Content-Disposition: form-data; name=\"document\"; filename=\"scan.pdf\"\r\n"
        "Content-Type: application/octet-stream\r\n"
        "\r\n" + content + "\r\n"
        "--XYZ\r\n"
        "Content-Disposition: form-data; name=\"title\"\r\n"
        "\r\n"
        "scan.pdf\r\n"
        "--XYZ--\r\n";

    EXPECT_EQ(as_string(form.finish()), expected);
    EXPECT_EQ(form.content_type(), "multipart/form-data; boundary=XYZ");
}

TEST(MultipartFormBuilder, EmptyFileStillProducesPart) {
    MultipartFormBuilder form("b");
    form.add_file("document", "empty.pdf", {});

    const std::string body = as_string(form.finish());
    EXPECT_NE(body.find("filename=\"empty.pdf\"\r\nContent-Type: application/octet-stream\r\n\r\n\r\n--b--\r\n"),
              std::string::npos);
}

TEST(MultipartFormBuilder, QuotesInNamesAreEscaped) {
    MultipartFormBuilder form("b");
    form.add_field("title", "x");
    form.add_file("document", "my \"best\" scan.pdf", {});

    const std::string body = as_string(form.finish());
    EXPECT_NE(body.find("filename=\"my \\\"best\\\" scan.pdf\""), std::string::npos);
}

TEST(MultipartFormBuilder, RandomBoundaryIsHex) {
    MultipartFormBuilder first;
    MultipartFormBuilder second;

    EXPECT_EQ(first.boundary().size(), 60u);
    for (char c : first.boundary()) {
        EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(c)));
    }
    EXPECT_NE(first.boundary(), second.boundary());
}
