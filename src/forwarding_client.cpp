#include "hermes/forwarding_client.hpp"
#include "hermes/json_util.hpp"
#include "hermes/logging.hpp"
#include "hermes/url.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <algorithm>
#include <cctype>
#include <type_traits>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace hermes
{
    namespace
    {
        std::string send_failure(std::string_view stage, const beast::error_code &ec)
        {
            return "Failed to send request to target: " + std::string(stage) + ": " + ec.message();
        }

        /**
         * One outbound exchange. Stream is beast::tcp_stream for http targets
         * and beast::ssl_stream<beast::tcp_stream> for https.
         */
        template <class Stream>
        class ClientSession : public std::enable_shared_from_this<ClientSession<Stream>>
        {
            static constexpr bool kTls = !std::is_same_v<Stream, beast::tcp_stream>;

            std::shared_ptr<const void> owner_; // keeps the TLS context alive
            tcp::resolver resolver_;
            Stream stream_;
            net::steady_timer resolve_timer_;
            beast::flat_buffer buffer_;
            http::request<http::string_body> req_;
            http::response_parser<http::string_body> parser_;
            Url url_;
            std::string method_;
            std::chrono::milliseconds timeout_;
            bool verify_tls_;
            ForwardHandler handler_;
            std::shared_ptr<spdlog::logger> log_;
            bool done_{false};
            bool resolve_timed_out_{false};

        public:
            template <class... StreamArgs>
            ClientSession(std::shared_ptr<const void> owner, net::any_io_executor strand, Url url,
                          http::request<http::string_body> req, std::chrono::milliseconds timeout, bool verify_tls,
                          std::size_t body_limit, ForwardHandler handler, StreamArgs &&...stream_args)
                : owner_(std::move(owner)),
                  resolver_(strand),
                  stream_(strand, std::forward<StreamArgs>(stream_args)...),
                  resolve_timer_(strand),
                  req_(std::move(req)),
                  url_(std::move(url)),
                  method_(req_.method_string().data(), req_.method_string().size()),
                  timeout_(timeout),
                  verify_tls_(verify_tls),
                  handler_(std::move(handler)),
                  log_(logging::category("forward"))
            {
                parser_.body_limit(body_limit);
            }

            void run()
            {
                if constexpr (kTls)
                {
                    if (!SSL_set_tlsext_host_name(stream_.native_handle(), url_.host.c_str()))
                    {
                        beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
                        return fail("sni", ec);
                    }
                    if (verify_tls_)
                        stream_.set_verify_callback(ssl::host_name_verification(url_.host));
                }

                // The resolver has no stream timer of its own.
                resolve_timer_.expires_after(timeout_);
                resolve_timer_.async_wait(
                    [self = this->shared_from_this()](beast::error_code ec)
                    {
                        if (ec)
                            return;
                        self->resolve_timed_out_ = true;
                        self->resolver_.cancel();
                    });

                resolver_.async_resolve(
                    url_.host, url_.port,
                    beast::bind_front_handler(&ClientSession::on_resolve, this->shared_from_this()));
            }

        private:
            void on_resolve(beast::error_code ec, tcp::resolver::results_type results)
            {
                if (resolve_timed_out_)
                    return fail("resolve", beast::error::timeout);
                if (ec)
                    return fail("resolve", ec);

                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    resolve_timer_.expiry() - std::chrono::steady_clock::now());
                resolve_timer_.cancel();
                if (remaining.count() <= 0)
                    return fail("connect", beast::error::timeout);

                // One deadline over connect, handshake, write and read.
                beast::get_lowest_layer(stream_).expires_after(remaining);
                beast::get_lowest_layer(stream_).async_connect(
                    results, beast::bind_front_handler(&ClientSession::on_connect, this->shared_from_this()));
            }

            void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type)
            {
                if (ec)
                    return fail("connect", ec);

                if constexpr (kTls)
                {
                    stream_.async_handshake(
                        ssl::stream_base::client,
                        beast::bind_front_handler(&ClientSession::on_handshake, this->shared_from_this()));
                }
                else
                {
                    do_write();
                }
            }

            void on_handshake(beast::error_code ec)
            {
                if (ec)
                    return fail("tls handshake", ec);
                do_write();
            }

            void do_write()
            {
                http::async_write(stream_, req_,
                                  beast::bind_front_handler(&ClientSession::on_write, this->shared_from_this()));
            }

            void on_write(beast::error_code ec, std::size_t)
            {
                if (ec)
                    return fail("write", ec);

                http::async_read(stream_, buffer_, parser_,
                                 beast::bind_front_handler(&ClientSession::on_read, this->shared_from_this()));
            }

            void on_read(beast::error_code ec, std::size_t)
            {
                if (ec)
                    return fail("read", ec);

                auto res = parser_.release();
                UpstreamResponse out{};
                out.status = res.result_int();
                out.body = parse_response_body(res.body());
                log_->debug("{} {} -> {}", method_, url_.host_header() + url_.target,
                            out.status);
                finish(std::move(out));
                close();
            }

            void close()
            {
                if constexpr (kTls)
                {
                    beast::get_lowest_layer(stream_).expires_after(std::chrono::seconds(5));
                    // Peers commonly skip close_notify; nothing is left to report.
                    stream_.async_shutdown([self = this->shared_from_this()](beast::error_code) {});
                }
                else
                {
                    beast::error_code ec;
                    stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
                }
            }

            void fail(std::string_view stage, beast::error_code ec)
            {
                log_->debug("{} {}: {} failed: {}", method_, url_.host_header(), stage,
                            ec.message());
                finish(std::unexpected(HermesError::network(send_failure(stage, ec))));
            }

            void finish(Result<UpstreamResponse> result)
            {
                if (done_)
                    return;
                done_ = true;
                resolve_timer_.cancel();
                auto handler = std::move(handler_);
                handler(std::move(result));
            }
        };

        std::string upper(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::toupper(c)); });
            return s;
        }
    } // namespace

    Result<http::verb> map_method(const std::string &method)
    {
        const std::string m = upper(method);
        if (m == "GET")
            return http::verb::get;
        if (m == "POST")
            return http::verb::post;
        if (m == "PUT")
            return http::verb::put;
        if (m == "DELETE")
            return http::verb::delete_;
        if (m == "PATCH")
            return http::verb::patch;
        return std::unexpected(HermesError::unsupported_method("Unsupported HTTP method: " + method));
    }

    nlohmann::json parse_response_body(const std::string &text)
    {
        auto parsed = parse_json(text);
        if (!parsed)
            return nlohmann::json(text);
        return std::move(*parsed);
    }

    class HttpForwarder::Impl : public std::enable_shared_from_this<HttpForwarder::Impl>
    {
    public:
        Impl(net::any_io_executor executor, ForwarderConfig cfg)
            : executor_(std::move(executor)), cfg_(std::move(cfg)), tls_(ssl::context::tls_client)
        {
            auto log = logging::category("forward");
            tls_.set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3);

            beast::error_code ec;
            tls_.set_default_verify_paths(ec);
            if (ec)
                log->warn("Could not load system CA certificates: {}", ec.message());

            tls_.set_verify_mode(cfg_.verify_tls ? ssl::verify_peer : ssl::verify_none, ec);
            if (ec)
                log->warn("Could not set TLS verify mode: {}", ec.message());
            if (!cfg_.verify_tls)
                log->warn("TLS certificate verification is disabled for outbound requests");
        }

        void send(OutboundRequest request, ForwardHandler handler)
        {
            auto verb = map_method(request.method);
            if (!verb)
                return post_error(std::move(handler), std::move(verb.error()));

            auto url = Url::parse(request.url);
            if (!url)
            {
                return post_error(std::move(handler),
                                  HermesError::config("Failed to send request to target: " +
                                                      std::string(url.error().what())));
            }

            http::request<http::string_body> req{*verb, url->target, 11};
            for (const auto &[name, value] : request.headers)
                req.set(name, value);
            req.set(http::field::host, url->host_header());
            req.set(http::field::user_agent, cfg_.user_agent);
            req.set(http::field::content_type, "application/json");
            req.body() = request.body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
            req.prepare_payload();

            auto strand = net::make_strand(executor_);
            if (url->is_tls())
            {
                std::make_shared<ClientSession<beast::ssl_stream<beast::tcp_stream>>>(
                    shared_from_this(), strand, std::move(*url), std::move(req), request.timeout, cfg_.verify_tls,
                    cfg_.max_response_bytes, std::move(handler), tls_)
                    ->run();
            }
            else
            {
                std::make_shared<ClientSession<beast::tcp_stream>>(
                    shared_from_this(), strand, std::move(*url), std::move(req), request.timeout, cfg_.verify_tls,
                    cfg_.max_response_bytes, std::move(handler))
                    ->run();
            }
        }

    private:
        void post_error(ForwardHandler handler, HermesError error)
        {
            net::post(executor_, [handler = std::move(handler), error = std::move(error)]() mutable
                      { handler(std::unexpected(std::move(error))); });
        }

        net::any_io_executor executor_;
        ForwarderConfig cfg_;
        ssl::context tls_;
    };

    HttpForwarder::HttpForwarder(net::any_io_executor executor, ForwarderConfig cfg)
        : impl_(std::make_shared<Impl>(std::move(executor), std::move(cfg)))
    {
    }

    HttpForwarder::~HttpForwarder() = default;

    void HttpForwarder::send(OutboundRequest request, ForwardHandler handler)
    {
        impl_->send(std::move(request), std::move(handler));
    }

} // namespace hermes
