#include "ward/revocation_server.hpp"
#include "ward/license_key.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <vector>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace ward
{
    namespace
    {
        http::response<http::string_body> json_response(http::status status, unsigned version, const nlohmann::json &j)
        {
            http::response<http::string_body> res{status, version};
            res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
            res.set(http::field::content_type, "application/json");
            res.body() = j.dump();
            res.prepare_payload();
            return res;
        }

        http::response<http::string_body> error_response(http::status status, unsigned version, const std::string &why)
        {
            return json_response(status, version, {{"error", why}});
        }
    } // namespace

    std::pair<unsigned, std::string> RevocationServer::handle_revocation(const std::string &body,
                                                                         const RevocationList &revocations)
    {
        std::string serial;
        try
        {
            auto j = nlohmann::json::parse(body);
            serial = j.at("serial").get<std::string>();
        }
        catch (const nlohmann::json::exception &e)
        {
            return {400, nlohmann::json{{"error", std::format("invalid request: {}", e.what())}}.dump()};
        }

        if (!LicenseKeyCodec::is_valid_serial(serial))
        {
            return {400, nlohmann::json{{"error", "invalid serial"}}.dump()};
        }

        nlohmann::json out{{"serial", serial},
                           {"revoked", revocations.is_revoked(serial)},
                           {"server_time", unix_now()}};
        return {200, out.dump()};
    }

    class RevocationServer::Impl
    {
    public:
        explicit Impl(RevocationServerConfig cfg)
            : cfg_(std::move(cfg)),
              ioc_(static_cast<int>(cfg_.threads)),
              acceptor_(ioc_),
              limiter_(cfg_.rate_limit)
        {
        }

        ~Impl()
        {
            stop();
        }

        std::uint16_t listen()
        {
            if (acceptor_.is_open())
                return acceptor_.local_endpoint().port();

            tcp::endpoint endpoint{net::ip::make_address(cfg_.address), cfg_.port};
            beast::error_code ec;

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

            auto port = acceptor_.local_endpoint().port();
            spdlog::info("Revocation server listening on {}:{}", cfg_.address, port);
            return port;
        }

        void run()
        {
            listen();
            do_accept();

            std::vector<std::thread> threads;
            threads.reserve(cfg_.threads);
            for (std::size_t i = 0; i < cfg_.threads; ++i)
            {
                threads.emplace_back([this] { ioc_.run(); });
            }

            for (auto &t : threads)
                t.join();
        }

        void stop()
        {
            beast::error_code ec;
            acceptor_.cancel(ec);
            acceptor_.close(ec);
            ioc_.stop();
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
            if (!ec)
            {
                std::make_shared<Session>(std::move(socket), limiter_, cfg_)->run();
            }
            if (acceptor_.is_open())
                do_accept();
        }

        class Session : public std::enable_shared_from_this<Session>
        {
        public:
            Session(tcp::socket socket, RateLimiter &limiter, const RevocationServerConfig &cfg)
                : stream_(std::move(socket)),
                  limiter_(limiter),
                  cfg_(cfg)
            {
            }

            void run()
            {
                net::dispatch(stream_.get_executor(),
                              beast::bind_front_handler(&Session::do_read, shared_from_this()));
            }

        private:
            void do_read()
            {
                req_ = {};
                stream_.expires_after(std::chrono::seconds(30));
                http::async_read(stream_, buffer_, req_,
                                 beast::bind_front_handler(&Session::on_read, shared_from_this()));
            }

            void on_read(beast::error_code ec, std::size_t)
            {
                if (ec == http::error::end_of_stream)
                {
                    return do_close();
                }
                if (ec)
                {
                    return;
                }

                beast::error_code rec;
                auto remote = stream_.socket().remote_endpoint(rec);
                if (rec)
                    return do_close();

                // Buckets are keyed by peer address only.
                const std::string client = remote.address().to_string();
                if (!limiter_.allow(client))
                {
                    spdlog::warn("Rate limit exceeded for {}", client);
                    res_ = error_response(http::status::too_many_requests, req_.version(), "rate limit exceeded");
                    return do_write();
                }

                res_ = handle_request(req_);
                do_write();
            }

            void do_write()
            {
                auto self = shared_from_this();
                http::async_write(stream_, res_,
                                  [self](beast::error_code ec, std::size_t) {
                                      self->on_write(ec);
                                  });
            }

            void on_write(beast::error_code ec)
            {
                if (ec)
                {
                    return;
                }
                stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            }

            void do_close()
            {
                beast::error_code ec;
                stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            }

            http::response<http::string_body> handle_request(const http::request<http::string_body> &req)
            {
                if (req.target() == "/health")
                {
                    if (req.method() != http::verb::get)
                        return error_response(http::status::method_not_allowed, req.version(), "method not allowed");
                    return json_response(http::status::ok, req.version(), {{"status", "ok"}});
                }

                if (req.target() == "/v1/revocation")
                {
                    if (req.method() != http::verb::post)
                        return error_response(http::status::method_not_allowed, req.version(), "method not allowed");

                    auto [status, body] = handle_revocation(req.body(), *cfg_.revocations);
                    http::response<http::string_body> res{static_cast<http::status>(status), req.version()};
                    res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
                    res.set(http::field::content_type, "application/json");
                    res.body() = std::move(body);
                    res.prepare_payload();
                    return res;
                }

                return error_response(http::status::not_found, req.version(), "not found");
            }

            beast::tcp_stream stream_;
            beast::flat_buffer buffer_;
            http::request<http::string_body> req_;
            http::response<http::string_body> res_;
            RateLimiter &limiter_;
            const RevocationServerConfig &cfg_;
        };

        RevocationServerConfig cfg_;
        net::io_context ioc_;
        tcp::acceptor acceptor_;
        RateLimiter limiter_;
    };

    RevocationServer::RevocationServer(const RevocationServerConfig &cfg)
    {
        if (!cfg.revocations)
            throw WardError::config("Revocation server needs a revocation list");
        impl_ = std::make_unique<Impl>(cfg);
    }

    RevocationServer::~RevocationServer() = default;

    std::uint16_t RevocationServer::listen() { return impl_->listen(); }
    void RevocationServer::run() { impl_->run(); }
    void RevocationServer::stop() { impl_->stop(); }

} // namespace ward
