#include "chunkfs/http/multipart_form.h"

#include <sstream>

#include <Poco/Exception.h>
#include <Poco/Net/MediaType.h>
#include <Poco/Net/MessageHeader.h>
#include <Poco/Net/MultipartReader.h>
#include <Poco/Net/NameValueCollection.h>
#include <Poco/StreamCopier.h>

namespace chunkfs::http {

std::string MultipartForm::Field(const std::string& name) const {
    auto it = fields.find(name);
    return it == fields.end() ? std::string() : it->second;
}

core::Result<MultipartForm> ParseMultipartForm(const std::string& content_type,
                                               const std::string& body,
                                               const std::string& file_field) {
    try {
        Poco::Net::MediaType media_type(content_type);
        if (!media_type.matches("multipart", "form-data") ||
            !media_type.hasParameter("boundary")) {
            return core::Error{core::ErrorCode::kInvalidArgument,
                               "expected multipart/form-data with a boundary"};
        }

        std::istringstream in(body);
        Poco::Net::MultipartReader reader(in, media_type.getParameter("boundary"));
        MultipartForm form;
        while (reader.hasNextPart()) {
            Poco::Net::MessageHeader header;
            reader.nextPart(header);

            std::string disposition;
            Poco::Net::NameValueCollection params;
            Poco::Net::MessageHeader::splitParameters(header.get("Content-Disposition", ""),
                                                      disposition, params);
            const auto name = params.get("name", "");
            std::string content;
            Poco::StreamCopier::copyToString(reader.stream(), content);

            const bool is_file = name == file_field || params.has("filename");
            if (is_file && !form.file) {
                form.file = std::move(content);
                form.file_name = params.get("filename", "");
            } else if (!name.empty()) {
                form.fields[name] = std::move(content);
            }
        }
        return form;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "malformed multipart body: " + ex.displayText()};
    }
}

}  // namespace chunkfs::http
