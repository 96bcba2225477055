#include "ward/online_reconciler.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace ward
{
    // ============================================================================
    // Endpoint Implementation
    // ============================================================================

    Result<Endpoint> Endpoint::parse(const std::string &url)
    {
        const std::string scheme = "http://";
        if (!url.starts_with(scheme))
        {
            return std::unexpected(WardError::config(std::format(
                "Revocation endpoint must start with http:// (got '{}')", url)));
        }

        std::string rest = url.substr(scheme.size());
        Endpoint ep;

        auto slash = rest.find('/');
        std::string authority = slash == std::string::npos ? rest : rest.substr(0, slash);
        if (slash != std::string::npos)
            ep.target = rest.substr(slash);

        auto colon = authority.rfind(':');
        if (colon != std::string::npos)
        {
            ep.host = authority.substr(0, colon);
            ep.port = authority.substr(colon + 1);
            if (ep.port.empty() || ep.port.find_first_not_of("0123456789") != std::string::npos)
            {
                return std::unexpected(WardError::config(std::format("Invalid port in '{}'", url)));
            }
        }
        else
        {
            ep.host = authority;
        }

        if (ep.host.empty())
            return std::unexpected(WardError::config(std::format("Missing host in '{}'", url)));
        return ep;
    }

    // ============================================================================
    // HttpRevocationTransport Implementation
    // ============================================================================

    HttpRevocationTransport::HttpRevocationTransport(Endpoint endpoint, std::chrono::milliseconds timeout)
        : endpoint_(std::move(endpoint)), timeout_(timeout)
    {
    }

    Result<RevocationStatus> HttpRevocationTransport::check(const std::string &serial)
    {
        net::io_context ioc;
        tcp::resolver resolver(ioc);
        beast::tcp_stream stream(ioc);
        beast::flat_buffer buffer;

        http::request<http::string_body> req{http::verb::post, endpoint_.target, 11};
        req.set(http::field::host, endpoint_.host);
        req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
        req.set(http::field::content_type, "application/json");
        req.body() = nlohmann::json{{"serial", serial}}.dump();
        req.prepare_payload();

        http::response<http::string_body> res;
        beast::error_code failure;
        bool done = false;

        // One async chain on a private io_context; run_for bounds the whole exchange.
        resolver.async_resolve(
            endpoint_.host, endpoint_.port,
            [&](beast::error_code ec, tcp::resolver::results_type results) {
                if (ec)
                {
                    failure = ec;
                    return;
                }
                stream.expires_after(timeout_);
                stream.async_connect(results, [&](beast::error_code ec, const tcp::endpoint &) {
                    if (ec)
                    {
                        failure = ec;
                        return;
                    }
                    http::async_write(stream, req, [&](beast::error_code ec, std::size_t) {
                        if (ec)
                        {
                            failure = ec;
                            return;
                        }
                        http::async_read(stream, buffer, res, [&](beast::error_code ec, std::size_t) {
                            failure = ec;
                            done = !ec;
                        });
                    });
                });
            });

        ioc.run_for(timeout_);

        beast::error_code ignored;
        stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

        if (!done)
        {
            std::string why = failure ? failure.message() : std::string("timed out");
            return std::unexpected(WardError::network(std::format(
                "Revocation check against {}:{} failed: {}", endpoint_.host, endpoint_.port, why)));
        }

        if (res.result() != http::status::ok)
        {
            return std::unexpected(WardError::network(std::format(
                "Revocation endpoint answered HTTP {}", res.result_int())));
        }
        return parse_response(res.body(), serial);
    }

    Result<RevocationStatus> HttpRevocationTransport::parse_response(const std::string &body, const std::string &serial)
    {
        try
        {
            auto j = nlohmann::json::parse(body);
            if (j.at("serial").get<std::string>() != serial)
            {
                return std::unexpected(WardError::network("Revocation response is for a different serial"));
            }
            RevocationStatus status;
            status.revoked = j.at("revoked").get<bool>();
            status.server_time = j.at("server_time").get<UnixSeconds>();
            return status;
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(WardError::network(std::format("Malformed revocation response: {}", e.what())));
        }
    }

    // ============================================================================
    // OnlineReconciler Implementation
    // ============================================================================

    OnlineReconciler::OnlineReconciler(std::shared_ptr<RevocationTransport> transport,
                                       std::shared_ptr<ValidationCache> cache,
                                       int64_t clock_skew_seconds)
        : transport_(std::move(transport)), cache_(std::move(cache)), clock_skew_seconds_(clock_skew_seconds)
    {
    }

    ReconcileResult OnlineReconciler::reconcile(const LicenseRecord &record, UnixSeconds local_clock)
    {
        ReconcileResult result;

        auto status = transport_->check(record.serial);
        if (!status)
        {
            spdlog::warn("Revocation service unreachable for {}: {}", record.serial, status.error().what());
            result.error = status.error().what();
            return result;
        }

        result.reachable = true;
        result.revoked = status->revoked;
        result.server_time = status->server_time;

        if (std::llabs(status->server_time - local_clock) > clock_skew_seconds_)
        {
            // Neither clock can be trusted as a grace anchor.
            spdlog::warn("Server time {} disagrees with local clock {}; cache not refreshed", status->server_time,
                         local_clock);
            return result;
        }

        if (cache_)
        {
            auto updated = cache_->update([&](CacheState &state) {
                state.record = record;
                state.last_online = status->server_time;
                state.revoked = status->revoked;
            });
            if (!updated)
            {
                // The answer is still authoritative for this call.
                spdlog::error("Failed to refresh validation cache: {}", updated.error().what());
            }
        }

        spdlog::debug("Reconciled {}: revoked={} server_time={}", record.serial, status->revoked, status->server_time);
        return result;
    }

} // namespace ward
