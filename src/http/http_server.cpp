#include "flashdrop/http/http_server.h"

#include <array>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/system/system_error.hpp>

#include "flashdrop/core/ids.h"
#include "flashdrop/core/logger.h"
#include "flashdrop/http/preview_page.h"
#include "flashdrop/http/responses.h"
#include "flashdrop/observability/metrics.h"

namespace {
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

constexpr std::size_t kBufferSize = 8192;
constexpr const char* kFilesRoute = "/files/{file}";

struct RangeRequest {
    std::uint64_t start{0};
    std::uint64_t end{0};
};

std::optional<RangeRequest> ParseRange(const std::string& header, std::uint64_t size) {
    // Single byte ranges only: "bytes=start-end", "bytes=start-" or "bytes=-suffix".
    if (header.rfind("bytes=", 0) != 0 || size == 0) {
        return std::nullopt;
    }
    auto range = header.substr(6);
    auto dash = range.find('-');
    if (dash == std::string::npos || range.find(',') != std::string::npos) {
        return std::nullopt;
    }
    const std::string start_str = range.substr(0, dash);
    const std::string end_str = range.substr(dash + 1);

    RangeRequest req;
    try {
        if (start_str.empty()) {
            if (end_str.empty()) {
                return std::nullopt;
            }
            const auto suffix = static_cast<std::uint64_t>(std::stoull(end_str));
            if (suffix == 0) {
                return std::nullopt;
            }
            req.start = suffix >= size ? 0 : size - suffix;
            req.end = size - 1;
            return req;
        }
        req.start = static_cast<std::uint64_t>(std::stoull(start_str));
        req.end = end_str.empty() ? size - 1
                                  : static_cast<std::uint64_t>(std::stoull(end_str));
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (req.end >= size) {
        req.end = size - 1;
    }
    if (req.start > req.end || req.start >= size) {
        return std::nullopt;
    }
    return req;
}

/// Quotes a file name for Content-Disposition; quotes and control bytes become '_'.
std::string DispositionFileName(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (unsigned char ch : name) {
        out += (ch < 0x20 || ch == '"' || ch == '\\' || ch == 0x7f) ? '_' : static_cast<char>(ch);
    }
    return out;
}

struct ServerContext {
    flashdrop::core::Config config;
    flashdrop::http::Router router;
    std::shared_ptr<flashdrop::retrieval::RetrievalGateway> gateway;
    flashdrop::core::Clock clock;
};

template <typename Stream>
class Session : public std::enable_shared_from_this<Session<Stream>> {
public:
    Session(Stream&& stream, std::shared_ptr<const ServerContext> context)
        : stream_(std::move(stream)), context_(std::move(context)) {}

    void Start() {
        // TLS handshake happens once per connection when enabled.
        if constexpr (std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>) {
            stream_.async_handshake(net::ssl::stream_base::server,
                                    beast::bind_front_handler(&Session::OnHandshake,
                                                              this->shared_from_this()));
        } else {
            DoReadHeader();
        }
    }

private:
    void OnHandshake(beast::error_code ec) {
        if (ec) {
            flashdrop::core::LogError("TLS handshake failed: " + ec.message());
            return;
        }
        DoReadHeader();
    }

    void DoReadHeader() {
        parser_.emplace();
        parser_->body_limit(context_->config.server.limits.max_body_bytes);
        http::async_read_header(stream_, buffer_, *parser_,
                                beast::bind_front_handler(&Session::OnReadHeader,
                                                          this->shared_from_this()));
    }

    void OnReadHeader(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            return DoClose();
        }
        if (ec) {
            flashdrop::core::LogError("Read header failed: " + ec.message());
            return;
        }

        request_id_ = flashdrop::core::GenerateRequestId();
        request_start_ = std::chrono::steady_clock::now();
        request_method_ = std::string(parser_->get().method_string());
        request_target_ = std::string(parser_->get().target());
        request_remote_ = GetRemoteAddress();
        version_ = parser_->get().version();

        const auto declared = parser_->content_length();
        if (declared && *declared > context_->config.server.limits.max_body_bytes) {
            return RejectOversizedBody();
        }
        if (parser_->get().method() == http::verb::options) {
            return SendPreflight();
        }

        if (parser_->is_done()) {
            body_.clear();
            return HandleRequest();
        }
        ReadBodyToString();
    }

    void ReadBodyToString() {
        body_.clear();
        if (parser_->content_length() && parser_->content_length().value() == 0) {
            return HandleRequest();
        }
        DoReadBodyChunk();
    }

    void DoReadBodyChunk() {
        parser_->get().body().data = body_buffer_.data();
        parser_->get().body().size = body_buffer_.size();
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&Session::OnBodyChunk,
                                                   this->shared_from_this()));
    }

    void OnBodyChunk(beast::error_code ec, std::size_t) {
        if (ec == http::error::body_limit) {
            return RejectOversizedBody();
        }
        if (ec && ec != http::error::need_buffer) {
            flashdrop::core::LogError("Read body failed: " + ec.message());
            return;
        }
        const auto bytes = body_buffer_.size() - parser_->get().body().size;
        body_.append(body_buffer_.data(), bytes);
        if (parser_->is_done()) {
            return HandleRequest();
        }
        DoReadBodyChunk();
    }

    void RejectOversizedBody() {
        auto response = flashdrop::http::JsonError(
            version_, "FILE_TOO_LARGE", "request body exceeds the configured limit", request_id_,
            http::status::payload_too_large);
        // The rest of the body is never read, so the connection cannot be reused.
        response.keep_alive(false);
        Send(std::move(response));
    }

    void SendPreflight() {
        http::response<http::empty_body> response{http::status::no_content, version_};
        response.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
        response.set(http::field::access_control_allow_headers, "Content-Type, Range");
        response.set(http::field::access_control_max_age, "86400");
        response.keep_alive(parser_->get().keep_alive());
        if (!parser_->is_done()) {
            response.keep_alive(false);
        }
        Send(std::move(response));
    }

    void HandleRequest() {
        // Convert buffer_body parser into a string_body request for routing handlers.
        flashdrop::http::HttpRequest request;
        request.method(parser_->get().method());
        request.target(parser_->get().target());
        request.version(parser_->get().version());
        for (const auto& field : parser_->get()) {
            request.set(field.name(), field.value());
        }
        request.body() = std::move(body_);
        request.prepare_payload();
        request.keep_alive(parser_->get().keep_alive());

        const auto path = flashdrop::http::StripQuery(request_target_);
        flashdrop::http::RouteParams params;
        if ((request.method() == http::verb::get || request.method() == http::verb::head) &&
            flashdrop::http::Router::Match(kFilesRoute, path, &params)) {
            return HandleFile(request, params["file"]);
        }

        flashdrop::http::RequestContext ctx;
        ctx.request_id = request_id_;
        ctx.method = request_method_;
        ctx.target = request_target_;
        ctx.remote = request_remote_;

        auto result = context_->router.Route(ctx, request);
        if (!result.ok()) {
            auto response = flashdrop::http::JsonError(request.version(), result.error(),
                                                       request_id_);
            response.keep_alive(request.keep_alive());
            return Send(std::move(response));
        }
        result.value().keep_alive(request.keep_alive());
        Send(std::move(result.value()));
    }

    void HandleFile(const flashdrop::http::HttpRequest& request, const std::string& file) {
        auto resolved = context_->gateway->Resolve(file, context_->clock());
        if (!resolved.ok()) {
            auto response = flashdrop::http::JsonError(request.version(), resolved.error(),
                                                       request_id_);
            response.keep_alive(request.keep_alive());
            return Send(std::move(response));
        }
        const auto& record = resolved.value().record;

        const auto raw = flashdrop::retrieval::RetrievalGateway::PreferRawResponse(
            flashdrop::http::GetQueryParam(request_target_, "raw"),
            std::string(request[http::field::accept]));
        if (!raw) {
            auto page = flashdrop::http::RenderPreviewPage(record, context_->config.site);
            if (request.method() == http::verb::head) {
                http::response<http::empty_body> head{http::status::ok, request.version()};
                head.set(http::field::content_type, "text/html; charset=utf-8");
                head.content_length(page.size());
                head.keep_alive(request.keep_alive());
                return Send(std::move(head));
            }
            flashdrop::http::HttpResponse response{http::status::ok, request.version()};
            response.set(http::field::content_type, "text/html; charset=utf-8");
            response.body() = std::move(page);
            response.prepare_payload();
            response.keep_alive(request.keep_alive());
            return Send(std::move(response));
        }

        beast::error_code ec;
        http::response<http::file_body> response{http::status::ok, request.version()};
        response.body().open(resolved.value().path.string().c_str(), beast::file_mode::scan, ec);
        if (ec) {
            // The reaper may unlink the object between Resolve() and here.
            auto err = flashdrop::http::JsonError(
                request.version(), flashdrop::http::OpenFileError(ec), request_id_);
            err.keep_alive(request.keep_alive());
            return Send(std::move(err));
        }

        const auto size = response.body().size();
        const bool download = flashdrop::http::GetQueryParam(request_target_, "download") == "true";
        response.set(http::field::content_type, record.mime_type);
        response.set(http::field::accept_ranges, "bytes");
        response.set(http::field::content_disposition,
                     std::string(download ? "attachment" : "inline") + "; filename=\"" +
                         DispositionFileName(record.original_name) + "\"");
        response.keep_alive(request.keep_alive());

        auto range_header = request[http::field::range];
        if (!range_header.empty()) {
            auto range = ParseRange(std::string(range_header), size);
            if (!range) {
                auto err = flashdrop::http::JsonError(request.version(), "INVALID_RANGE",
                                                      "invalid range", request_id_,
                                                      http::status::range_not_satisfiable);
                err.set(http::field::content_range, "bytes */" + std::to_string(size));
                err.keep_alive(request.keep_alive());
                return Send(std::move(err));
            }
            response.result(http::status::partial_content);
            response.body().seek(range->start, ec);
            if (ec) {
                auto err = flashdrop::http::JsonError(request.version(), "IO_ERROR",
                                                      "failed to seek file", request_id_,
                                                      http::status::internal_server_error);
                return Send(std::move(err));
            }
            response.content_length(range->end - range->start + 1);
            response.set(http::field::content_range,
                         "bytes " + std::to_string(range->start) + "-" +
                             std::to_string(range->end) + "/" + std::to_string(size));
        } else {
            response.content_length(size);
        }

        if (request.method() == http::verb::head) {
            http::response<http::empty_body> head{response.result(), response.version()};
            for (const auto& field : response.base()) {
                head.set(field.name_string(), field.value());
            }
            head.keep_alive(request.keep_alive());
            return Send(std::move(head));
        }
        Send(std::move(response));
    }

    template <typename Body>
    void Send(http::response<Body>&& response) {
        response.set(http::field::server, "FlashDrop");
        response.set("X-Request-Id", request_id_);
        response.set(http::field::access_control_allow_origin,
                     context_->config.server.cors_allow_origin);
        const auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - request_start_)
                                 .count();
        flashdrop::core::LogRequest(request_id_, request_method_, request_target_,
                                    request_remote_, response.result_int(), latency);
        flashdrop::observability::RecordRequest(response.result_int(), latency);
        auto sp = std::make_shared<http::response<Body>>(std::move(response));
        http::async_write(stream_, *sp,
                          beast::bind_front_handler(&Session::OnWrite<Body>,
                                                    this->shared_from_this(), sp->need_eof(), sp));
    }

    template <typename Body>
    void OnWrite(bool close, std::shared_ptr<http::response<Body>>,
                 beast::error_code ec, std::size_t) {
        if (ec) {
            flashdrop::core::LogError("Write failed: " + ec.message());
            return;
        }
        if (close) {
            return DoClose();
        }
        DoReadHeader();
    }

    void DoClose() {
        beast::error_code ec;
        if constexpr (std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>) {
            stream_.shutdown(ec);
        } else {
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        }
    }

    std::string GetRemoteAddress() const {
        beast::error_code ec;
        auto endpoint = beast::get_lowest_layer(stream_).socket().remote_endpoint(ec);
        if (ec) {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    Stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::buffer_body>> parser_;
    std::array<char, kBufferSize> body_buffer_{};
    std::shared_ptr<const ServerContext> context_;

    std::string request_id_;
    std::string request_method_;
    std::string request_target_;
    std::string request_remote_;
    unsigned version_{11};
    std::chrono::steady_clock::time_point request_start_{};
    std::string body_;
};

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(net::io_context& ioc, tcp::endpoint endpoint,
             std::shared_ptr<const ServerContext> context, net::ssl::context* ssl_ctx)
        : acceptor_(ioc), context_(std::move(context)), ssl_ctx_(ssl_ctx) {
        beast::error_code ec;
        acceptor_.open(endpoint.protocol(), ec);
        if (!ec) {
            acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        }
        if (!ec) {
            acceptor_.bind(endpoint, ec);
        }
        if (!ec) {
            acceptor_.listen(net::socket_base::max_listen_connections, ec);
        }
        if (ec) {
            flashdrop::core::LogError("Failed to listen on " + endpoint.address().to_string() +
                                      ":" + std::to_string(endpoint.port()) + ": " +
                                      ec.message());
            throw boost::system::system_error(ec);
        }
    }

    void Run() { DoAccept(); }

private:
    void DoAccept() {
        acceptor_.async_accept(net::make_strand(acceptor_.get_executor()),
                               beast::bind_front_handler(&Listener::OnAccept,
                                                         shared_from_this()));
    }

    void OnAccept(beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        if (ec) {
            flashdrop::core::LogError("Accept failed: " + ec.message());
        } else if (ssl_ctx_) {
            auto stream = beast::ssl_stream<beast::tcp_stream>(std::move(socket), *ssl_ctx_);
            std::make_shared<Session<beast::ssl_stream<beast::tcp_stream>>>(std::move(stream),
                                                                           context_)
                ->Start();
        } else {
            auto stream = beast::tcp_stream(std::move(socket));
            std::make_shared<Session<beast::tcp_stream>>(std::move(stream), context_)->Start();
        }
        DoAccept();
    }

    tcp::acceptor acceptor_;
    std::shared_ptr<const ServerContext> context_;
    net::ssl::context* ssl_ctx_{nullptr};
};

}  // namespace

namespace flashdrop::http {

HttpServer::HttpServer(boost::asio::io_context& ioc, const core::Config& config, Router router,
                       std::shared_ptr<retrieval::RetrievalGateway> gateway, core::Clock clock)
    : ioc_(ioc),
      config_(config),
      router_(std::move(router)),
      gateway_(std::move(gateway)),
      clock_(std::move(clock)) {
    if (config_.server.tls.enabled) {
        ssl_context_ = std::make_unique<net::ssl::context>(net::ssl::context::tlsv12_server);
        ssl_context_->use_certificate_chain_file(config_.server.tls.certificate);
        ssl_context_->use_private_key_file(config_.server.tls.private_key, net::ssl::context::pem);
    }
}

void HttpServer::Run() {
    const auto address = net::ip::make_address(config_.server.host);
    const tcp::endpoint endpoint{address, static_cast<unsigned short>(config_.server.port)};

    auto context = std::make_shared<const ServerContext>(
        ServerContext{config_, router_, gateway_, clock_});
    std::make_shared<Listener>(ioc_, endpoint, std::move(context),
                               ssl_context_ ? ssl_context_.get() : nullptr)
        ->Run();
    core::LogInfo("Listening on " + config_.server.host + ":" +
                  std::to_string(config_.server.port) +
                  (ssl_context_ ? " (TLS)" : ""));
}

}  // namespace flashdrop::http
