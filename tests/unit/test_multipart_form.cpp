#include <string>

#include <gtest/gtest.h>

#include "flashdrop/http/multipart_form.h"
#include "flashdrop/http/preview_page.h"

namespace {

const std::string kBoundary = "----flashdropBoundary7MA4YWxk";

std::string Part(const std::string& name, const std::string& value,
                 const std::string& filename = "") {
    std::string part = "--" + kBoundary + "\r\n";
    part += "Content-Disposition: form-data; name=\"" + name + "\"";
    if (!filename.empty()) {
        part += "; filename=\"" + filename + "\"\r\nContent-Type: application/octet-stream";
    }
    part += "\r\n\r\n" + value + "\r\n";
    return part;
}

}  // namespace

TEST(MultipartForm, ParsesFieldsAndBinaryPart) {
    const std::string binary("\x89PNG\r\n\x1a\n\0\x01\x02", 11);
    const auto body = Part("chunk", binary, "blob") + Part("fileName", "cat.png") +
                      Part("chunkIndex", "2") + Part("totalChunks", "3") + "--" + kBoundary +
                      "--\r\n";

    auto form = flashdrop::http::MultipartForm::Parse(
        "multipart/form-data; boundary=" + kBoundary, body);
    ASSERT_TRUE(form.ok()) << form.error().message;
    ASSERT_TRUE(form.value().Has("chunk"));
    EXPECT_EQ(form.value().Find("chunk")->body, binary);
    EXPECT_EQ(form.value().Find("chunk")->filename, "blob");
    EXPECT_EQ(form.value().Field("fileName"), "cat.png");
    EXPECT_EQ(form.value().Field("chunkIndex"), "2");
    EXPECT_EQ(form.value().Field("sessionId", "none"), "none");
    EXPECT_EQ(form.value().Find("sessionId"), nullptr);
}

TEST(MultipartForm, RejectsWrongContentType) {
    auto json = flashdrop::http::MultipartForm::Parse("application/json", "{}");
    ASSERT_FALSE(json.ok());
    EXPECT_EQ(json.error().code, flashdrop::core::ErrorCode::kInvalidArgument);

    auto no_boundary = flashdrop::http::MultipartForm::Parse("multipart/form-data", "");
    ASSERT_FALSE(no_boundary.ok());
}

TEST(PreviewPage, EscapesNamesAndEmbedsMedia) {
    flashdrop::metadata::FileRecord record;
    record.id = "Ab12cd";
    record.original_name = "<script>alert(1)</script>.png";
    record.mime_type = "image/png";
    record.human_size = "3.6 kB";
    record.extension = ".png";
    flashdrop::core::SiteConfig site;
    site.public_url = "https://drop.example";

    const auto html = flashdrop::http::RenderPreviewPage(record, site);
    EXPECT_EQ(html.find("<script>"), std::string::npos);
    EXPECT_NE(html.find("&lt;script&gt;"), std::string::npos);
    EXPECT_NE(html.find("og:image\" content=\"https://drop.example/files/Ab12cd.png?raw=true\""),
              std::string::npos);
    EXPECT_NE(html.find("<img src=\"/files/Ab12cd.png?raw=true\""), std::string::npos);
    EXPECT_NE(html.find("3.6 kB"), std::string::npos);

    record.mime_type = "application/pdf";
    const auto pdf = flashdrop::http::RenderPreviewPage(record, site);
    EXPECT_EQ(pdf.find("og:image"), std::string::npos);
    EXPECT_NE(pdf.find("No preview available"), std::string::npos);
}
