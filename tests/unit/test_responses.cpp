#include <string>

#include <boost/system/error_code.hpp>
#include <gtest/gtest.h>

#include "flashdrop/http/responses.h"
#include "flashdrop/http/router.h"

TEST(Responses, ObjectUnlinkedAfterLookupIsNotFound) {
    const auto gone = flashdrop::http::OpenFileError(
        boost::system::errc::make_error_code(boost::system::errc::no_such_file_or_directory));
    EXPECT_EQ(gone.code, flashdrop::core::ErrorCode::kNotFound);
    EXPECT_EQ(flashdrop::http::StatusFor(gone.code), boost::beast::http::status::not_found);

    const auto denied = flashdrop::http::OpenFileError(
        boost::system::errc::make_error_code(boost::system::errc::permission_denied));
    EXPECT_EQ(denied.code, flashdrop::core::ErrorCode::kIoError);
    EXPECT_EQ(flashdrop::http::StatusFor(denied.code),
              boost::beast::http::status::internal_server_error);
}

TEST(Responses, ErrorEnvelopeCarriesCodeAndRequestId) {
    const auto response = flashdrop::http::JsonError(
        11, flashdrop::core::Error{flashdrop::core::ErrorCode::kExpired, "file has expired"},
        "req-42");
    EXPECT_EQ(response.result(), boost::beast::http::status::gone);
    const auto& body = response.body();
    EXPECT_NE(body.find("\"code\":\"EXPIRED\""), std::string::npos);
    EXPECT_NE(body.find("\"message\":\"file has expired\""), std::string::npos);
    EXPECT_NE(body.find("\"request_id\":\"req-42\""), std::string::npos);
}

TEST(Responses, QueryParameters) {
    EXPECT_EQ(flashdrop::http::GetQueryParam("/files/abc.png?raw=true&download=true", "download"),
              "true");
    EXPECT_EQ(flashdrop::http::GetQueryParam("/files/abc.png?raw=true", "download"), "");
    EXPECT_EQ(flashdrop::http::StripQuery("/files/abc.png?raw=true"), "/files/abc.png");
}

TEST(Router, DispatchesByMethodAndCapturesParams) {
    flashdrop::http::Router router;
    std::string captured;
    router.Add("GET", "/files/{file}",
               [&captured](const flashdrop::http::RequestContext&,
                           const flashdrop::http::HttpRequest& request,
                           const flashdrop::http::RouteParams& params)
                   -> flashdrop::core::Result<flashdrop::http::HttpResponse> {
                   captured = params.at("file");
                   return flashdrop::http::JsonOk(request.version(), "{}");
               });
    router.Add("DELETE", "/files/{file}",
               [](const flashdrop::http::RequestContext&,
                  const flashdrop::http::HttpRequest& request,
                  const flashdrop::http::RouteParams&)
                   -> flashdrop::core::Result<flashdrop::http::HttpResponse> {
                   return flashdrop::http::JsonOk(request.version(), "{}");
               });

    flashdrop::http::RequestContext ctx;
    ctx.request_id = "req-1";
    flashdrop::http::HttpRequest get{boost::beast::http::verb::get, "/files/aB3dE9.png?raw=true",
                                     11};
    auto ok = router.Route(ctx, get);
    ASSERT_TRUE(ok.ok());
    EXPECT_EQ(ok.value().result(), boost::beast::http::status::ok);
    EXPECT_EQ(captured, "aB3dE9.png");

    flashdrop::http::HttpRequest post{boost::beast::http::verb::post, "/files/aB3dE9.png", 11};
    auto not_allowed = router.Route(ctx, post);
    ASSERT_TRUE(not_allowed.ok());
    EXPECT_EQ(not_allowed.value().result(), boost::beast::http::status::method_not_allowed);
    EXPECT_EQ(std::string(not_allowed.value()[boost::beast::http::field::allow]),
              "GET, DELETE");

    flashdrop::http::HttpRequest unknown{boost::beast::http::verb::get, "/nowhere", 11};
    auto missing = router.Route(ctx, unknown);
    ASSERT_TRUE(missing.ok());
    EXPECT_EQ(missing.value().result(), boost::beast::http::status::not_found);
    EXPECT_NE(missing.value().body().find("req-1"), std::string::npos);
}
