#include "flashdrop/http/responses.h"

#include <sstream>

#include <Poco/JSON/Object.h>

namespace flashdrop::http {

HttpResponse JsonOk(int version, const std::string& body) {
    HttpResponse response{boost::beast::http::status::ok, version};
    response.set(boost::beast::http::field::content_type, "application/json");
    response.body() = body;
    response.prepare_payload();
    return response;
}

HttpResponse JsonError(int version, const std::string& code, const std::string& message,
                       const std::string& request_id, boost::beast::http::status status) {
    // Built with Poco::JSON because messages may carry client-supplied text.
    Poco::JSON::Object::Ptr error = new Poco::JSON::Object();
    error->set("code", code);
    error->set("message", message);
    error->set("request_id", request_id);
    Poco::JSON::Object root;
    root.set("error", error);
    std::stringstream ss;
    root.stringify(ss);

    HttpResponse response{status, version};
    response.set(boost::beast::http::field::content_type, "application/json");
    response.body() = ss.str();
    response.prepare_payload();
    return response;
}

HttpResponse JsonError(int version, const core::Error& error, const std::string& request_id) {
    return JsonError(version, core::ErrorCodeName(error.code), error.message, request_id,
                     StatusFor(error.code));
}

boost::beast::http::status StatusFor(core::ErrorCode code) {
    using boost::beast::http::status;
    switch (code) {
        case core::ErrorCode::kInvalidArgument:
        case core::ErrorCode::kInvalidFileType:
        case core::ErrorCode::kSessionNotFound:
        case core::ErrorCode::kMissingChunks:
            return status::bad_request;
        case core::ErrorCode::kFileTooLarge:
            return status::payload_too_large;
        case core::ErrorCode::kNotFound:
            return status::not_found;
        case core::ErrorCode::kExpired:
            return status::gone;
        default:
            return status::internal_server_error;
    }
}

core::Error OpenFileError(const boost::system::error_code& ec) {
    if (ec == boost::system::errc::no_such_file_or_directory) {
        return core::Error{core::ErrorCode::kNotFound, "file not found"};
    }
    return core::Error{core::ErrorCode::kIoError, "failed to open file: " + ec.message()};
}

std::string GetQueryParam(const std::string& target, const std::string& key) {
    auto pos = target.find('?');
    if (pos == std::string::npos) {
        return "";
    }
    auto query = target.substr(pos + 1);
    std::stringstream ss(query);
    std::string item;
    while (std::getline(ss, item, '&')) {
        auto eq = item.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        if (item.substr(0, eq) == key) {
            return item.substr(eq + 1);
        }
    }
    return "";
}

std::string StripQuery(const std::string& target) {
    auto pos = target.find('?');
    if (pos == std::string::npos) {
        return target;
    }
    return target.substr(0, pos);
}

}  // namespace flashdrop::http
