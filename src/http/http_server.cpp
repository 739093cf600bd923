#include "stitchfs/http/http_server.h"

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include "stitchfs/core/ids.h"
#include "stitchfs/core/logger.h"
#include "stitchfs/http/download.h"
#include "stitchfs/observability/metrics.h"

namespace {
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using TlsStream = beast::ssl_stream<beast::tcp_stream>;

// Immutable state shared by the listener and every connection it accepts.
struct ServerContext {
    stitchfs::http::Router router;
    std::shared_ptr<stitchfs::storage::LocalDestinationStore> destination;
    std::string download_pattern;
    std::uint64_t max_body_bytes{0};
};

/// One client connection; requests are read whole (chunk payloads are bounded by
/// max_body_bytes) and answered in order.
template <typename Stream>
class Connection : public std::enable_shared_from_this<Connection<Stream>> {
public:
    Connection(Stream&& stream, std::shared_ptr<const ServerContext> context)
        : stream_(std::move(stream)), context_(std::move(context)) {}

    void Start() {
        if constexpr (std::is_same_v<Stream, TlsStream>) {
            stream_.async_handshake(net::ssl::stream_base::server,
                                    beast::bind_front_handler(&Connection::OnHandshake,
                                                              this->shared_from_this()));
        } else {
            ReadRequest();
        }
    }

private:
    void OnHandshake(beast::error_code ec) {
        if (ec) {
            stitchfs::core::LogWarning("TLS handshake failed: " + ec.message());
            return;
        }
        ReadRequest();
    }

    void ReadRequest() {
        parser_.emplace();
        parser_->body_limit(context_->max_body_bytes);
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&Connection::OnRead,
                                                   this->shared_from_this()));
    }

    void OnRead(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            return Close();
        }
        if (ec == http::error::body_limit) {
            BeginRequest();
            auto response = stitchfs::http::ErrorResponse(
                http::status::payload_too_large, parser_->get().version(), "PAYLOAD_TOO_LARGE",
                "request body exceeds " + std::to_string(context_->max_body_bytes) + " bytes",
                request_id_);
            response.keep_alive(false);
            return Send(std::move(response));
        }
        if (ec) {
            stitchfs::core::LogError("Read request failed: " + ec.message());
            return;
        }
        BeginRequest();
        Dispatch(parser_->release());
    }

    void BeginRequest() {
        const auto& header = parser_->get();
        request_id_ = stitchfs::core::GenerateRequestId();
        started_ = std::chrono::steady_clock::now();
        method_ = std::string(header.method_string());
        target_ = std::string(header.target());
        remote_ = RemoteAddress();
    }

    void Dispatch(stitchfs::http::HttpRequest request) {
        stitchfs::http::RouteParams params;
        if (request.method() == http::verb::get &&
            stitchfs::http::Router::Match(context_->download_pattern,
                                          stitchfs::http::Router::StripQuery(target_),
                                          &params)) {
            return ServeDownload(request, params["name"]);
        }

        stitchfs::http::RequestContext ctx;
        ctx.request_id = request_id_;
        ctx.method = method_;
        ctx.target = target_;
        ctx.remote = remote_;

        auto routed = context_->router.Route(ctx, request);
        if (!routed.ok()) {
            stitchfs::core::LogError("Handler failed for " + target_ + ": " +
                                     routed.error().message);
            return Send(stitchfs::http::ErrorResponse(http::status::internal_server_error,
                                                      request.version(), "INTERNAL",
                                                      "internal error", request_id_));
        }
        auto response = std::move(routed.value());
        response.keep_alive(request.keep_alive());
        Send(std::move(response));
    }

    void ServeDownload(const stitchfs::http::HttpRequest& request, const std::string& name) {
        if (!stitchfs::http::IsDownloadableName(name)) {
            return Send(stitchfs::http::ErrorResponse(http::status::not_found,
                                                      request.version(), "FILE_NOT_FOUND",
                                                      "file not found", request_id_));
        }
        auto resolved = context_->destination->ResolveForRead(name);
        if (!resolved.ok()) {
            return Send(stitchfs::http::ErrorResponse(http::status::not_found,
                                                      request.version(), "FILE_NOT_FOUND",
                                                      "file not found", request_id_));
        }

        beast::error_code ec;
        http::response<http::file_body> response{http::status::ok, request.version()};
        response.body().open(resolved.value().c_str(), beast::file_mode::scan, ec);
        if (ec) {
            stitchfs::core::LogError("Cannot open " + name + " for download: " + ec.message());
            return Send(stitchfs::http::ErrorResponse(http::status::internal_server_error,
                                                      request.version(), "IO_ERROR",
                                                      "failed to open file", request_id_));
        }
        const std::uint64_t size = response.body().size();
        response.set(http::field::content_type, "application/octet-stream");
        response.set(http::field::accept_ranges, "bytes");
        response.keep_alive(request.keep_alive());

        const auto range_header = request[http::field::range];
        if (range_header.empty()) {
            response.content_length(size);
            return Send(std::move(response));
        }

        const auto range = stitchfs::http::ParseByteRange(std::string(range_header), size);
        if (!range) {
            auto refused = stitchfs::http::ErrorResponse(http::status::range_not_satisfiable,
                                                         request.version(), "INVALID_RANGE",
                                                         "invalid range", request_id_);
            refused.set(http::field::content_range, "bytes */" + std::to_string(size));
            return Send(std::move(refused));
        }
        response.body().seek(range->first, ec);
        if (ec) {
            stitchfs::core::LogError("Cannot seek " + name + ": " + ec.message());
            return Send(stitchfs::http::ErrorResponse(http::status::internal_server_error,
                                                      request.version(), "IO_ERROR",
                                                      "failed to seek file", request_id_));
        }
        response.result(http::status::partial_content);
        response.content_length(range->length());
        response.set(http::field::content_range,
                     "bytes " + std::to_string(range->first) + "-" +
                         std::to_string(range->last) + "/" + std::to_string(size));
        Send(std::move(response));
    }

    template <typename Body>
    void Send(http::response<Body>&& response) {
        response.set(http::field::server, "StitchFS");
        response.set("X-Request-Id", request_id_);
        const auto latency_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                    std::chrono::steady_clock::now() - started_)
                                    .count();
        stitchfs::core::LogRequest(request_id_, method_, target_, remote_,
                                   response.result_int(), latency_ms);
        stitchfs::observability::RecordRequest(response.result_int(), latency_ms);

        auto owned = std::make_shared<http::response<Body>>(std::move(response));
        const bool close = owned->need_eof();
        http::async_write(stream_, *owned,
                          [self = this->shared_from_this(), owned, close](
                              beast::error_code ec, std::size_t) {
                              self->OnWrite(close, ec);
                          });
    }

    void OnWrite(bool close, beast::error_code ec) {
        if (ec) {
            stitchfs::core::LogError("Write failed: " + ec.message());
            return;
        }
        if (close) {
            return Close();
        }
        ReadRequest();
    }

    void Close() {
        beast::error_code ec;
        if constexpr (std::is_same_v<Stream, TlsStream>) {
            stream_.shutdown(ec);
        } else {
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        }
    }

    std::string RemoteAddress() const {
        beast::error_code ec;
        auto endpoint = beast::get_lowest_layer(stream_).socket().remote_endpoint(ec);
        if (ec) {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    Stream stream_;
    std::shared_ptr<const ServerContext> context_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;

    std::string request_id_;
    std::string method_;
    std::string target_;
    std::string remote_;
    std::chrono::steady_clock::time_point started_{};
};

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(net::io_context& ioc, const tcp::endpoint& endpoint,
             std::shared_ptr<const ServerContext> context, net::ssl::context* tls)
        : acceptor_(ioc), context_(std::move(context)), tls_(tls) {
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
            throw std::runtime_error("failed to listen on " + endpoint.address().to_string() +
                                     ":" + std::to_string(endpoint.port()) + ": " +
                                     ec.message());
        }
    }

    void Accept() {
        acceptor_.async_accept(
            beast::bind_front_handler(&Listener::OnAccept, shared_from_this()));
    }

private:
    void OnAccept(beast::error_code ec, tcp::socket socket) {
        if (ec) {
            stitchfs::core::LogError("Accept failed: " + ec.message());
        } else if (tls_) {
            std::make_shared<Connection<TlsStream>>(TlsStream(std::move(socket), *tls_), context_)
                ->Start();
        } else {
            std::make_shared<Connection<beast::tcp_stream>>(beast::tcp_stream(std::move(socket)),
                                                            context_)
                ->Start();
        }
        Accept();
    }

    tcp::acceptor acceptor_;
    std::shared_ptr<const ServerContext> context_;
    net::ssl::context* tls_{nullptr};
};

}  // namespace

namespace stitchfs::http {

HttpServer::HttpServer(boost::asio::io_context& ioc, const core::Config& config, Router router,
                       std::shared_ptr<storage::LocalDestinationStore> destination,
                       std::shared_ptr<upload::StagingJanitor> janitor)
    : ioc_(ioc),
      config_(config),
      router_(std::move(router)),
      destination_(std::move(destination)),
      janitor_(std::move(janitor)) {
    if (config_.server.tls.enabled) {
        ssl_context_ = std::make_unique<net::ssl::context>(net::ssl::context::tlsv12_server);
        ssl_context_->use_certificate_chain_file(config_.server.tls.certificate);
        ssl_context_->use_private_key_file(config_.server.tls.private_key, net::ssl::context::pem);
    }
}

void HttpServer::Run() {
    auto context = std::make_shared<ServerContext>();
    context->router = router_;
    context->destination = destination_;
    context->download_pattern = DownloadPattern(config_.storage.public_prefix);
    context->max_body_bytes = config_.server.limits.max_body_bytes;

    const tcp::endpoint endpoint{net::ip::make_address(config_.server.host),
                                 static_cast<unsigned short>(config_.server.port)};
    std::make_shared<Listener>(ioc_, endpoint, std::move(context), ssl_context_.get())->Accept();
    core::LogInfo("Listening on " + config_.server.host + ":" +
                  std::to_string(config_.server.port) + (ssl_context_ ? " (tls)" : "") +
                  ", serving files under " + config_.storage.public_prefix);

    StartJanitor();
}

void HttpServer::StartJanitor() {
    if (!config_.janitor.enabled || !janitor_) {
        return;
    }
    janitor_timer_ = std::make_unique<net::steady_timer>(ioc_);
    ScheduleJanitorSweep();
}

void HttpServer::ScheduleJanitorSweep() {
    janitor_timer_->expires_after(std::chrono::seconds(config_.janitor.sweep_interval_seconds));
    janitor_timer_->async_wait([this](const beast::error_code& ec) {
        if (ec) {
            return;
        }
        const int reaped = janitor_->Sweep();
        if (reaped > 0) {
            core::LogDebug("Janitor sweep removed " + std::to_string(reaped) + " sessions");
        }
        ScheduleJanitorSweep();
    });
}

}  // namespace stitchfs::http
