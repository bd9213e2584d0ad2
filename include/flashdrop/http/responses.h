#pragma once

#include <string>

#include <boost/beast/http/status.hpp>
#include <boost/system/error_code.hpp>

#include "flashdrop/core/error.h"
#include "flashdrop/http/router.h"

namespace flashdrop::http {

HttpResponse JsonOk(int version, const std::string& body);
/// @brief Error envelope: {"error":{"code","message","request_id"}}.
HttpResponse JsonError(int version, const std::string& code, const std::string& message,
                       const std::string& request_id, boost::beast::http::status status);
/// @brief Envelope for a module error, with the status chosen by StatusFor().
HttpResponse JsonError(int version, const core::Error& error, const std::string& request_id);

/// @brief HTTP status a module error surfaces as.
boost::beast::http::status StatusFor(core::ErrorCode code);

/// @brief Maps a failed open of a resolved object; a file unlinked since lookup is kNotFound.
core::Error OpenFileError(const boost::system::error_code& ec);

/// @brief Value of `key` in the query string of `target`, or empty.
std::string GetQueryParam(const std::string& target, const std::string& key);
std::string StripQuery(const std::string& target);

}  // namespace flashdrop::http
