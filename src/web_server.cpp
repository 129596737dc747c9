#include "hermes/web_server.hpp"
#include "hermes/dispatcher.hpp"
#include "hermes/forwarding_client.hpp"
#include "hermes/health.hpp"
#include "hermes/logging.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace hermes
{
    namespace
    {
        std::string to_json_string(const nlohmann::json &j)
        {
            return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        }

        /** State shared by the acceptor and every session. */
        struct ServerState
        {
            WebServerConfig cfg;
            std::shared_ptr<const EndpointRegistry> registry;
            std::unique_ptr<Dispatcher> dispatcher;
            std::atomic<std::size_t> in_flight{0};
            std::atomic<bool> stopping{false};
            std::shared_ptr<spdlog::logger> log;
        };

        class Session : public std::enable_shared_from_this<Session>
        {
        public:
            Session(tcp::socket socket, ServerState &state)
                : stream_(std::move(socket)),
                  state_(state)
            {
            }

            ~Session()
            {
                release();
            }

            void run()
            {
                net::dispatch(stream_.get_executor(),
                              beast::bind_front_handler(&Session::do_read, shared_from_this()));
            }

        private:
            void do_read()
            {
                parser_.emplace();
                parser_->body_limit(state_.cfg.max_body_bytes);
                stream_.expires_after(state_.cfg.request_timeout);
                http::async_read(stream_, buffer_, *parser_,
                                 beast::bind_front_handler(&Session::on_read, shared_from_this()));
            }

            void on_read(beast::error_code ec, std::size_t)
            {
                if (ec == http::error::end_of_stream)
                    return do_close();
                if (ec == http::error::body_limit)
                {
                    req_ = parser_->release();
                    started_ = std::chrono::steady_clock::now();
                    close_after_ = true;
                    return respond({413, {{"error", "Payload too large"}}});
                }
                if (ec)
                {
                    if (ec != beast::error::timeout && ec != net::error::operation_aborted)
                        state_.log->debug("Read failed: {}", ec.message());
                    return;
                }

                req_ = parser_->release();
                started_ = std::chrono::steady_clock::now();
                stream_.expires_never();

                if (!acquire())
                    return respond({503, {{"error", "Too many concurrent requests"}}});

                handle_request();
            }

            void handle_request()
            {
                const auto target = std::string_view(req_.target().data(), req_.target().size());
                const auto path = target.substr(0, target.find('?'));
                const auto method = req_.method();

                if (state_.cfg.health_check_enabled && (path == "/health" || path == "/ready"))
                {
                    if (method != http::verb::get)
                        return respond({405, {{"error", "Method not allowed"}}});
                    return respond({200, path == "/health" ? health_status() : readiness_status()});
                }

                if (path == "/debug")
                {
                    if (method != http::verb::post)
                        return respond({405, {{"error", "Method not allowed"}}});
                    return respond(Dispatcher::debug(req_.body()));
                }

                state_.dispatcher->dispatch(
                    path, req_.body(),
                    [self = shared_from_this()](DispatchResponse response)
                    {
                        // Completion may arrive on the forwarder's strand.
                        net::post(self->stream_.get_executor(),
                                  [self, response = std::move(response)]() mutable
                                  { self->respond(std::move(response)); });
                    });
            }

            void respond(DispatchResponse response)
            {
                res_ = {};
                res_.result(response.status);
                res_.version(req_.version());
                res_.set(http::field::server, "hermes/" + version());
                res_.set(http::field::content_type, "application/json");
                res_.keep_alive(req_.keep_alive() && !close_after_ && !state_.stopping.load());
                res_.body() = to_json_string(response.body);
                res_.prepare_payload();

                const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - started_);
                const auto target = req_.target();
                state_.log->info("{} {} {} {}ms",
                                 std::string(req_.method_string().data(), req_.method_string().size()),
                                 std::string(target.data(), target.size()), response.status, elapsed.count());

                do_write();
            }

            void do_write()
            {
                stream_.expires_after(state_.cfg.request_timeout);
                auto self = shared_from_this();
                http::async_write(stream_, res_,
                                  [self](beast::error_code ec, std::size_t)
                                  {
                                      self->on_write(ec);
                                  });
            }

            void on_write(beast::error_code ec)
            {
                release();
                if (ec)
                    return;
                if (!res_.keep_alive())
                    return do_close();
                do_read();
            }

            void do_close()
            {
                beast::error_code ec;
                stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            }

            bool acquire()
            {
                const auto n = state_.in_flight.fetch_add(1) + 1;
                counted_ = true;
                const auto cap = state_.cfg.max_concurrent_requests;
                if (cap != 0 && n > cap)
                {
                    release();
                    return false;
                }
                return true;
            }

            void release()
            {
                if (counted_)
                {
                    state_.in_flight.fetch_sub(1);
                    counted_ = false;
                }
            }

            beast::tcp_stream stream_;
            beast::flat_buffer buffer_;
            std::optional<http::request_parser<http::string_body>> parser_;
            http::request<http::string_body> req_;
            http::response<http::string_body> res_;
            ServerState &state_;
            std::chrono::steady_clock::time_point started_{};
            bool counted_{false};
            bool close_after_{false};
        };
    } // namespace

    class WebServer::Impl
    {
    public:
        Impl(WebServerConfig cfg, std::shared_ptr<const EndpointRegistry> registry)
            : ioc_(static_cast<int>(cfg.threads ? cfg.threads : 1)),
              acceptor_(net::make_strand(ioc_)),
              drain_timer_(acceptor_.get_executor()),
              signals_(acceptor_.get_executor())
        {
            state_.cfg = std::move(cfg);
            state_.registry = std::move(registry);
            state_.log = logging::category("server");

            ForwarderConfig fwd{};
            fwd.verify_tls = state_.cfg.verify_tls;
            fwd.user_agent = "hermes/" + version();
            state_.dispatcher = std::make_unique<Dispatcher>(
                state_.registry, std::make_shared<HttpForwarder>(ioc_.get_executor(), fwd), ioc_.get_executor(),
                DispatcherConfig{state_.cfg.request_timeout});
        }

        ~Impl()
        {
            ioc_.stop();
        }

        std::uint16_t listen()
        {
            if (listening_)
                return local_port();

            beast::error_code ec;
            auto address = net::ip::make_address(state_.cfg.bind_address, ec);
            if (ec)
                throw beast::system_error{ec, "invalid bind address '" + state_.cfg.bind_address + "'"};
            tcp::endpoint endpoint{address, state_.cfg.port};

            acceptor_.open(endpoint.protocol(), ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.set_option(net::socket_base::reuse_address(true), ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.bind(endpoint, ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.listen(net::socket_base::max_listen_connections, ec);
            if (ec)
                throw beast::system_error{ec};

            listening_ = true;
            port_ = acceptor_.local_endpoint().port();
            state_.log->info("Webhook proxy server running on http://{}:{}", state_.cfg.bind_address, port_);
            return port_;
        }

        std::uint16_t local_port() const { return port_; }

        void run()
        {
            listen();
            do_accept();

            if (state_.cfg.handle_signals)
            {
                signals_.add(SIGINT);
                signals_.add(SIGTERM);
                signals_.async_wait(
                    [this](beast::error_code ec, int signo)
                    {
                        if (ec)
                            return;
                        state_.log->info("Received signal {}, shutting down", signo);
                        begin_shutdown();
                    });
            }

            std::vector<std::thread> threads;
            threads.reserve(state_.cfg.threads);
            for (std::size_t i = 0; i < state_.cfg.threads; ++i)
            {
                threads.emplace_back([this] { ioc_.run(); });
            }

            for (auto &t : threads)
                t.join();

            state_.log->info("Server stopped");
        }

        void stop()
        {
            net::post(acceptor_.get_executor(), [this] { begin_shutdown(); });
        }

    private:
        void do_accept()
        {
            acceptor_.async_accept(
                net::make_strand(ioc_),
                beast::bind_front_handler(&Impl::on_accept, this));
        }

        void on_accept(beast::error_code ec, tcp::socket socket)
        {
            if (state_.stopping.load())
                return;
            if (!ec)
            {
                std::make_shared<Session>(std::move(socket), state_)->run();
            }
            else if (ec != net::error::operation_aborted)
            {
                state_.log->warn("Accept failed: {}", ec.message());
            }
            do_accept();
        }

        // Runs on the acceptor strand.
        void begin_shutdown()
        {
            if (state_.stopping.exchange(true))
                return;

            beast::error_code ec;
            acceptor_.cancel(ec);
            acceptor_.close(ec);
            signals_.cancel(ec);

            deadline_ = std::chrono::steady_clock::now() + state_.cfg.shutdown_grace;
            state_.log->info("Draining {} in-flight request(s)", state_.in_flight.load());
            drain();
        }

        void drain()
        {
            const auto pending = state_.in_flight.load();
            if (pending == 0 || std::chrono::steady_clock::now() >= deadline_)
            {
                if (pending != 0)
                    state_.log->warn("Grace period elapsed with {} request(s) still in flight", pending);
                ioc_.stop();
                return;
            }

            drain_timer_.expires_after(std::chrono::milliseconds(50));
            drain_timer_.async_wait(
                [this](beast::error_code ec)
                {
                    if (!ec)
                        drain();
                });
        }

        // Declared before ioc_ so sessions destroyed with the io_context can
        // still release their in-flight slot.
        ServerState state_;
        net::io_context ioc_;
        tcp::acceptor acceptor_;
        net::steady_timer drain_timer_;
        net::signal_set signals_;
        std::chrono::steady_clock::time_point deadline_{};
        std::uint16_t port_{0};
        bool listening_{false};
    };

    WebServer::WebServer(const WebServerConfig &cfg, std::shared_ptr<const EndpointRegistry> registry)
        : impl_(std::make_unique<Impl>(cfg, std::move(registry)))
    {
    }

    WebServer::~WebServer() = default;

    std::uint16_t WebServer::listen() { return impl_->listen(); }
    std::uint16_t WebServer::local_port() const { return impl_->local_port(); }
    void WebServer::run() { impl_->run(); }
    void WebServer::stop() { impl_->stop(); }

} // namespace hermes
