#include "flashdrop/http/multipart_form.h"

#include <sstream>

#include <Poco/Exception.h>
#include <Poco/Net/MessageHeader.h>
#include <Poco/Net/MultipartReader.h>
#include <Poco/Net/NameValueCollection.h>
#include <Poco/StreamCopier.h>
#include <Poco/String.h>

namespace flashdrop::http {

core::Result<MultipartForm> MultipartForm::Parse(const std::string& content_type,
                                                 const std::string& body) {
    std::string media_type;
    Poco::Net::NameValueCollection params;
    Poco::Net::MessageHeader::splitParameters(content_type, media_type, params);
    if (Poco::icompare(media_type, "multipart/form-data") != 0) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "expected multipart/form-data body"};
    }
    const auto boundary = params.get("boundary", "");
    if (boundary.empty()) {
        return core::Error{core::ErrorCode::kInvalidArgument, "multipart boundary missing"};
    }

    MultipartForm form;
    try {
        std::istringstream in(body);
        Poco::Net::MultipartReader reader(in, boundary);
        while (reader.hasNextPart()) {
            Poco::Net::MessageHeader header;
            reader.nextPart(header);

            std::string disposition;
            Poco::Net::NameValueCollection disposition_params;
            Poco::Net::MessageHeader::splitParameters(header.get("Content-Disposition", ""),
                                                      disposition, disposition_params);
            FormPart part;
            part.name = disposition_params.get("name", "");
            part.filename = disposition_params.get("filename", "");
            part.content_type = header.get("Content-Type", "");
            Poco::StreamCopier::copyToString(reader.stream(), part.body);
            if (part.name.empty()) {
                continue;
            }
            form.parts_[part.name] = std::move(part);
        }
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "malformed multipart body: " + ex.displayText()};
    }
    return form;
}

bool MultipartForm::Has(const std::string& name) const { return parts_.count(name) > 0; }

const FormPart* MultipartForm::Find(const std::string& name) const {
    auto it = parts_.find(name);
    return it == parts_.end() ? nullptr : &it->second;
}

std::string MultipartForm::Field(const std::string& name, const std::string& default_value) const {
    const auto* part = Find(name);
    return part ? part->body : default_value;
}

}  // namespace flashdrop::http
