#pragma once

#include <map>
#include <string>

#include "flashdrop/core/result.h"

namespace flashdrop::http {

/// @brief One part of a multipart/form-data body.
struct FormPart {
    std::string name;
    std::string filename;
    std::string content_type;
    std::string body;
};

/// @brief Parsed multipart/form-data body, keyed by part name (last one wins).
class MultipartForm {
public:
    /// @brief Parses `body` using the boundary from the request Content-Type header.
    static core::Result<MultipartForm> Parse(const std::string& content_type,
                                             const std::string& body);

    bool Has(const std::string& name) const;
    const FormPart* Find(const std::string& name) const;
    /// @brief Body of a plain field, or default_value when absent.
    std::string Field(const std::string& name, const std::string& default_value = "") const;

private:
    std::map<std::string, FormPart> parts_;
};

}  // namespace flashdrop::http
