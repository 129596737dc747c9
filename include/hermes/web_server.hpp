#pragma once

#include "endpoint_registry.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace hermes
{
    struct WebServerConfig
    {
        std::string bind_address{"0.0.0.0"};
        std::uint16_t port{3000}; // 0 picks an ephemeral port
        std::size_t threads{std::thread::hardware_concurrency() ? std::thread::hardware_concurrency() : 4};
        std::chrono::seconds request_timeout{30};
        std::size_t max_concurrent_requests{1000}; // 0 disables the cap
        std::size_t max_body_bytes{2 * 1024 * 1024};
        bool health_check_enabled{true};
        bool handle_signals{true}; // SIGINT/SIGTERM trigger graceful shutdown
        std::chrono::seconds shutdown_grace{30};
        bool verify_tls{true};
    };

    /**
     * Boost.Beast HTTP/1.1 front end. Serves /health, /ready and /debug
     * itself and hands every other path to the Dispatcher.
     */
    class WebServer
    {
    public:
        WebServer(const WebServerConfig &cfg, std::shared_ptr<const EndpointRegistry> registry);
        ~WebServer();

        WebServer(const WebServer &) = delete;
        WebServer &operator=(const WebServer &) = delete;

        /** Open, bind and listen. Throws boost::system::system_error. */
        std::uint16_t listen();

        /** Port actually bound; valid after listen(). */
        std::uint16_t local_port() const;

        /** Serve on cfg.threads threads until shut down. Listens first if needed. */
        void run();

        /** Stop accepting, drain in-flight requests, then return from run(). */
        void stop();

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };

} // namespace hermes
