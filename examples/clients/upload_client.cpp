/**
 * FlashDrop Upload Client Example
 *
 * Splits a local file into chunks, sends them to /upload/chunk, asks the
 * server to assemble them via /upload/complete and prints the share link.
 *
 * Usage: flashdrop_upload_client <file> [server-url]
 */

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include <Poco/Exception.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>
#include <Poco/Net/HTMLForm.h>
#include <Poco/Net/HTTPClientSession.h>
#include <Poco/Net/HTTPRequest.h>
#include <Poco/Net/HTTPResponse.h>
#include <Poco/Net/StringPartSource.h>
#include <Poco/Path.h>
#include <Poco/StreamCopier.h>
#include <Poco/URI.h>

using namespace Poco::Net;
using namespace Poco::JSON;
using namespace std;

namespace {

const size_t kChunkSize = 25 * 1024 * 1024;
const int kMaxRetries = 3;

struct Reply {
    HTTPResponse::HTTPStatus status;
    Object::Ptr body;
};

}  // namespace

class FlashDropClient {
private:
    Poco::URI base_uri;

    Reply send(HTTPRequest& request, const string& body, HTMLForm* form = nullptr) {
        HTTPClientSession session(base_uri.getHost(), base_uri.getPort());
        session.setTimeout(Poco::Timespan(120, 0));

        if (form) {
            form->prepareSubmit(request);
            form->write(session.sendRequest(request));
        } else {
            request.setContentLength(static_cast<streamsize>(body.size()));
            session.sendRequest(request) << body;
        }

        HTTPResponse response;
        istream& response_stream = session.receiveResponse(response);
        string text;
        Poco::StreamCopier::copyToString(response_stream, text);

        Reply reply{response.getStatus(), nullptr};
        if (!text.empty()) {
            Parser parser;
            reply.body = parser.parse(text).extract<Object::Ptr>();
        }
        return reply;
    }

    static string errorMessage(const Reply& reply) {
        if (reply.body && reply.body->has("error")) {
            return reply.body->getObject("error")->getValue<string>("message");
        }
        return HTTPResponse::getReasonForStatus(reply.status);
    }

public:
    explicit FlashDropClient(const string& url) : base_uri(url) {}

    /**
     * Send one chunk, retrying with exponential backoff on transport errors
     * and 5xx responses. Returns the session id issued (or echoed) by the server.
     */
    string uploadChunk(const string& data, const string& file_name, int index, int total,
                       const string& session_id) {
        for (int attempt = 0;; ++attempt) {
            try {
                HTMLForm form(HTMLForm::ENCODING_MULTIPART);
                form.set("fileName", file_name);
                form.set("chunkIndex", to_string(index));
                form.set("totalChunks", to_string(total));
                if (!session_id.empty()) {
                    form.set("sessionId", session_id);
                }
                form.addPart("chunk",
                             new StringPartSource(data, "application/octet-stream", "blob"));

                HTTPRequest request(HTTPRequest::HTTP_POST, "/upload/chunk",
                                    HTTPMessage::HTTP_1_1);
                auto reply = send(request, "", &form);
                if (reply.status == HTTPResponse::HTTP_OK) {
                    return reply.body->getValue<string>("sessionId");
                }
                if (reply.status < HTTPResponse::HTTP_INTERNAL_SERVER_ERROR) {
                    throw runtime_error("chunk " + to_string(index) + " rejected: " +
                                        errorMessage(reply));
                }
                if (attempt + 1 >= kMaxRetries) {
                    throw runtime_error("chunk " + to_string(index) + " failed: " +
                                        errorMessage(reply));
                }
            } catch (const Poco::Exception& e) {
                if (attempt + 1 >= kMaxRetries) {
                    throw runtime_error("chunk " + to_string(index) + " failed: " +
                                        e.displayText());
                }
            }
            const auto delay = chrono::seconds(1 << attempt);
            cout << "  retrying chunk " << index << " in " << delay.count() << "s" << endl;
            this_thread::sleep_for(delay);
        }
    }

    /**
     * Upload a whole file and return its share link.
     */
    string uploadFile(const string& local_path) {
        ifstream file(local_path, ios::binary);
        if (!file.is_open()) {
            throw runtime_error("cannot open file: " + local_path);
        }
        file.seekg(0, ios::end);
        const auto file_size = static_cast<size_t>(file.tellg());
        file.seekg(0, ios::beg);

        const string file_name = Poco::Path(local_path).getFileName();
        const int total = static_cast<int>(max<size_t>(1, (file_size + kChunkSize - 1) / kChunkSize));

        string session_id;
        string buffer;
        for (int index = 0; index < total; ++index) {
            const size_t length = min(kChunkSize, file_size - static_cast<size_t>(index) * kChunkSize);
            buffer.resize(length);
            file.read(&buffer[0], static_cast<streamsize>(length));
            session_id = uploadChunk(buffer, file_name, index, total, session_id);
            cout << "✓ Chunk " << (index + 1) << "/" << total << " sent" << endl;
        }

        Object payload;
        payload.set("sessionId", session_id);
        payload.set("fileName", file_name);
        payload.set("totalChunks", total);
        stringstream json;
        payload.stringify(json);

        HTTPRequest request(HTTPRequest::HTTP_POST, "/upload/complete", HTTPMessage::HTTP_1_1);
        request.setContentType("application/json");
        auto reply = send(request, json.str());
        if (reply.status != HTTPResponse::HTTP_OK) {
            throw runtime_error("complete failed: " + errorMessage(reply));
        }
        return reply.body->getValue<string>("shareLink");
    }
};

int main(int argc, char** argv) {
    if (argc < 2) {
        cerr << "usage: " << argv[0] << " <file> [server-url]" << endl;
        return 1;
    }
    const string server = argc > 2 ? argv[2] : "http://localhost:8000";

    try {
        FlashDropClient client(server);
        const auto link = client.uploadFile(argv[1]);
        cout << "✓ Uploaded: " << server << link << endl;
    } catch (const exception& e) {
        cout << "✗ Upload error: " << e.what() << endl;
        return 1;
    }
    return 0;
}
