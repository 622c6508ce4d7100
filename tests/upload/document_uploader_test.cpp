#include "d2p/upload/document_uploader.hpp"

#include "support/fakes.hpp"

#include <gtest/gtest.h>

#include <string>

using d2p::test_support::FakeFileSystem;
using d2p::test_support::FakeHttpClient;
using d2p::upload::DocumentUploader;
using d2p::upload::UploadError;

class DocumentUploaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        fs_.add_file("/consume/invoice 42.pdf", "%PDF-1.7 invoice");
    }

    FakeFileSystem fs_;
    FakeHttpClient client_;
};

TEST_F(DocumentUploaderTest, ComposesPaperlessRequest) {
    client_.respond(200, "\"0f1e2d\"");
    DocumentUploader uploader(fs_, client_, "http://paperless:8000/", "abc123");

    auto result = uploader.upload("/consume/invoice 42.pdf");
    ASSERT_TRUE(result.is_ok());

    const auto requests = client_.requests();
    ASSERT_EQ(requests.size(), 1u);
    const auto& request = requests[0];

    EXPECT_EQ(request.method, d2p::network::HttpMethod::POST);
    EXPECT_EQ(request.url, "http://paperless:8000/api/documents/post_document/");
    EXPECT_EQ(request.get_header("Authorization"), "Token abc123");

    const std::string content_type = request.get_header("Content-Type");
    ASSERT_EQ(content_type.rfind("multipart/form-data; boundary=", 0), 0u);
    const std::string boundary = content_type.substr(content_type.find('=') + 1);

    const std::string body = request.body_as_string();
    EXPECT_EQ(body.rfind("--" + boundary + "\r\n", 0), 0u);
    EXPECT_NE(body.find("name=\"document\"; filename=\"invoice 42.pdf\""), std::string::npos);
    EXPECT_NE(body.find("%PDF-1.7 invoice"), std::string::npos);
    EXPECT_NE(body.find("name=\"title\"\r\n\r\ninvoice 42.pdf\r\n"), std::string::npos);
    EXPECT_NE(body.find("--" + boundary + "--\r\n"), std::string::npos);
}

TEST_F(DocumentUploaderTest, EndpointIgnoresTrailingSlashes) {
    DocumentUploader plain(fs_, client_, "http://host", "t");
    DocumentUploader slashed(fs_, client_, "http://host//", "t");

    EXPECT_EQ(plain.endpoint(), "http://host/api/documents/post_document/");
    EXPECT_EQ(slashed.endpoint(), plain.endpoint());
}

TEST_F(DocumentUploaderTest, UploadNeverDeletesTheFile) {
    client_.respond(200);
    DocumentUploader uploader(fs_, client_, "http://host", "t");

    ASSERT_TRUE(uploader.upload("/consume/invoice 42.pdf").is_ok());
    EXPECT_TRUE(fs_.exists("/consume/invoice 42.pdf"));
    EXPECT_EQ(fs_.remove_calls("/consume/invoice 42.pdf"), 0);
}

TEST_F(DocumentUploaderTest, OnlyStatus200IsSuccess) {
    client_.respond(201, "created");
    DocumentUploader uploader(fs_, client_, "http://host", "t");

    auto result = uploader.upload("/consume/invoice 42.pdf");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, UploadError::Kind::Rejected);
    EXPECT_EQ(result.error().status_code, 201);
    EXPECT_TRUE(result.error().is_remote());
}

TEST_F(DocumentUploaderTest, ServerErrorIsRejectedWithBody) {
    client_.respond(500, "{\"error\":\"db down\"}");
    DocumentUploader uploader(fs_, client_, "http://host", "t");

    auto result = uploader.upload("/consume/invoice 42.pdf");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, UploadError::Kind::Rejected);
    EXPECT_EQ(result.error().status_code, 500);
    EXPECT_EQ(result.error().body, "{\"error\":\"db down\"}");
}

TEST_F(DocumentUploaderTest, TransportFailure) {
    client_.fail("Failed to connect to host:80: Connection refused");
    DocumentUploader uploader(fs_, client_, "http://host", "t");

    auto result = uploader.upload("/consume/invoice 42.pdf");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, UploadError::Kind::Transport);
    EXPECT_NE(result.error().message.find("Connection refused"), std::string::npos);
    EXPECT_TRUE(result.error().is_remote());
}

TEST_F(DocumentUploaderTest, UnreadableFileIsLocalFailure) {
    client_.respond(200);
    DocumentUploader uploader(fs_, client_, "http://host", "t");

    auto result = uploader.upload("/consume/missing.pdf");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, UploadError::Kind::LocalIo);
    EXPECT_FALSE(result.error().is_remote());
    EXPECT_TRUE(client_.requests().empty());
}

TEST(UploadErrorKind, ToString) {
    EXPECT_STREQ(d2p::upload::to_string(UploadError::Kind::LocalIo), "local-io");
    EXPECT_STREQ(d2p::upload::to_string(UploadError::Kind::Transport), "transport");
    EXPECT_STREQ(d2p::upload::to_string(UploadError::Kind::Rejected), "rejected");
}
