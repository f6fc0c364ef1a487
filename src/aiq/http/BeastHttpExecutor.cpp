//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/aiq/http/BeastHttpExecutor.cpp
// Purpose: Single-shot HTTP/HTTPS request execution using Boost.Beast coroutines on a per-call io_context
//==========================================================================================================

#include <chrono>
#include <exception>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>
#include <openssl/ssl.h>

#include "aiq/errors/ErrorClassifier.hpp"
#include "aiq/http/HttpExecutor.hpp"
#include "aiq/uri/UriBuilder.hpp"
#include "aiq/version.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace aiq::http {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
using tcp = net::ip::tcp;

using errors::ErrorCategory;
using errors::Result;

const char* MethodName(Method method) {
    return method == Method::Post ? "POST" : "GET";
}

// Timeouts wider than unsigned int keep the default rather than wrapping.
static unsigned int timeoutFromEnv(const char* name, unsigned int defaultValue) {
    const unsigned long long v = GetEnvUnsignedOrDefault(name, defaultValue);
    if (v > std::numeric_limits<unsigned int>::max()) {
        LOG_DEBUG("{}={} is out of range, keeping {}", name, v, defaultValue);
        return defaultValue;
    }
    return static_cast<unsigned int>(v);
}

BeastHttpExecutor::Options BeastHttpExecutor::Options::FromEnvironment() {
    Options o;
    o.connectTimeoutMs = timeoutFromEnv("AIQ_HTTP_CONNECT_TIMEOUT_MS", o.connectTimeoutMs);
    o.readTimeoutMs = timeoutFromEnv("AIQ_HTTP_READ_TIMEOUT_MS", o.readTimeoutMs);
    o.maxBodyBytes = static_cast<std::uint64_t>(
        GetEnvUnsignedOrDefault("AIQ_HTTP_MAX_BODY_BYTES", o.maxBodyBytes));
    return o;
}

class BeastHttpExecutor::Impl {
public:
    BeastHttpExecutor::Options opts;

    explicit Impl(const BeastHttpExecutor::Options& o) : opts(o) {
        if (opts.userAgent.empty()) {
            opts.userAgent = getUserAgent();
        }
    }

    template <typename Stream>
    void arm(Stream& stream, unsigned int timeoutMs) const {
        if (timeoutMs == 0) {
            beast::get_lowest_layer(stream).expires_never();
        } else {
            beast::get_lowest_layer(stream).expires_after(std::chrono::milliseconds(timeoutMs));
        }
    }

    static std::string hostHeader(const uri::UrlParts& u) {
        std::string h = (u.host.find(':') != std::string::npos) ? std::string("[") + u.host + std::string("]") : u.host;
        const bool defaultPort = (u.scheme == std::string("https") && u.port == std::string("443")) ||
                                 (u.scheme == std::string("http") && u.port == std::string("80"));
        if (!defaultPort) {
            h += std::string(":") + u.port;
        }
        return h;
    }

    bhttp::request<bhttp::string_body> buildRequest(const uri::UrlParts& u, const HttpRequest& request) const {
        const bhttp::verb verb = (request.method == Method::Post) ? bhttp::verb::post : bhttp::verb::get;
        bhttp::request<bhttp::string_body> req{verb, u.target, 11};
        req.set(bhttp::field::host, hostHeader(u));
        req.set(bhttp::field::user_agent, opts.userAgent);
        req.set(bhttp::field::accept, "application/json");
        req.set(bhttp::field::connection, "close");
        for (const auto& h : request.headers) {
            req.set(h.name, h.value);
        }
        if (request.method == Method::Post) {
            req.body() = request.body;
        }
        req.prepare_payload();
        return req;
    }

    static HttpResponse toResponse(const bhttp::response<bhttp::string_body>& res) {
        HttpResponse out;
        out.status = static_cast<int>(res.result_int());
        out.reason = std::string(res.reason());
        if (out.reason.empty() && res.result() != bhttp::status::unknown) {
            out.reason = std::string(bhttp::obsolete_reason(res.result()));
        }
        if (out.reason.empty()) {
            out.reason = std::string("HTTP ") + std::to_string(out.status);
        }
        for (const auto& field : res) {
            out.headers.push_back(HeaderKV{std::string(field.name_string()), std::string(field.value())});
        }
        out.body = res.body();
        return out;
    }

    // Write the request, read the whole response under the body limit.
    template <typename Stream>
    net::awaitable<HttpResponse> coRoundTrip(Stream& stream, bhttp::request<bhttp::string_body> req) const {
        arm(stream, opts.readTimeoutMs);
        co_await bhttp::async_write(stream, req, net::use_awaitable);
        beast::flat_buffer buffer;
        bhttp::response_parser<bhttp::string_body> parser;
        parser.body_limit(opts.maxBodyBytes);
        co_await bhttp::async_read(stream, buffer, parser, net::use_awaitable);
        co_return toResponse(parser.get());
    }

    // Coroutine: perform one request against an already validated URL
    net::awaitable<HttpResponse> coExecute(uri::UrlParts u, HttpRequest request) const {
        tcp::resolver resolver(co_await net::this_coro::executor);
        auto results = co_await resolver.async_resolve(u.host, u.port, net::use_awaitable);
        LOG_DEBUG("HTTP {} resolved {}:{} target={}", MethodName(request.method), u.host, u.port, u.target);

        if (u.scheme == std::string("https")) {
            ssl::context ctx(ssl::context::tls_client);
            ::SSL_CTX_set_min_proto_version(ctx.native_handle(), TLS1_2_VERSION);
            try {
                ctx.set_default_verify_paths();
            } catch (const std::exception& e) {
                LOG_DEBUG("HTTPS: set_default_verify_paths failed: {}", e.what());
            }
            ctx.set_verify_mode(ssl::verify_peer);

            beast::ssl_stream<beast::tcp_stream> stream(co_await net::this_coro::executor, ctx);
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), u.serverName.c_str())) {
                LOG_WARN("HTTPS: failed to set SNI hostname {}", u.serverName);
            }
            (void)::SSL_set1_host(stream.native_handle(), u.serverName.c_str());

            arm(stream, opts.connectTimeoutMs);
            co_await beast::get_lowest_layer(stream).async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
            LOG_DEBUG("HTTPS: handshake complete with {}", u.serverName);

            HttpResponse res = co_await coRoundTrip(stream, buildRequest(u, request));
            // close_notify is best effort; the response is already complete
            arm(stream, opts.readTimeoutMs);
            try {
                co_await stream.async_shutdown(net::use_awaitable);
            } catch (const std::exception& e) {
                LOG_DEBUG("HTTPS: shutdown with {}: {}", u.serverName, e.what());
            }
            co_return res;
        }

        beast::tcp_stream stream(co_await net::this_coro::executor);
        arm(stream, opts.connectTimeoutMs);
        co_await stream.async_connect(results, net::use_awaitable);
        LOG_DEBUG("HTTP: connected to {}:{}", u.host, u.port);

        HttpResponse res = co_await coRoundTrip(stream, buildRequest(u, request));
        boost::system::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        co_return res;
    }
};

BeastHttpExecutor::BeastHttpExecutor()
    : pImpl(std::make_unique<Impl>(Options::FromEnvironment())) {}

BeastHttpExecutor::BeastHttpExecutor(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

BeastHttpExecutor::~BeastHttpExecutor() = default;

const BeastHttpExecutor::Options& BeastHttpExecutor::GetOptions() const {
    return pImpl->opts;
}

Result<HttpResponse> BeastHttpExecutor::Execute(const HttpRequest& request) const {
    FUNC_SCOPE();
    uri::UrlParts parts;
    std::string err;
    if (!uri::ParseAbsoluteUrl(request.url, parts, err)) {
        return Result<HttpResponse>::Fail(ErrorCategory::InvalidInput, std::string("Invalid URL: ") + err);
    }

    net::io_context ioc;
    std::optional<HttpResponse> response;
    std::string failure;
    net::co_spawn(ioc, pImpl->coExecute(parts, request),
        [&](std::exception_ptr eptr, HttpResponse res) {
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const std::exception& e) {
                    failure = e.what();
                }
                return;
            }
            response = std::move(res);
        });
    ioc.run();

    if (!response.has_value()) {
        if (failure.empty()) {
            failure = "request did not complete";
        }
        LOG_WARN("HTTP {} {}:{}{} failed: {}", MethodName(request.method), parts.host, parts.port, parts.path, failure);
        return Result<HttpResponse>::Fail(errors::ClassifyTransportFailure(failure));
    }
    LOG_DEBUG("HTTP {} {}:{}{} -> {} {} ({} bytes)", MethodName(request.method), parts.host, parts.port, parts.path,
              response->status, response->reason, response->body.size());
    return Result<HttpResponse>::Ok(std::move(*response));
}

//==========================================================================================================
// HttpExecutorFactory::ParseConfig
// Purpose: Parse semicolon-delimited key=value config into Options.
//==========================================================================================================
BeastHttpExecutor::Options HttpExecutorFactory::ParseConfig(const std::string& config) {
    BeastHttpExecutor::Options opts = BeastHttpExecutor::Options::FromEnvironment();
    auto trim = [](std::string s) -> std::string {
        std::size_t b = 0, e = s.size();
        while (b < e && (s[b] == ' ' || s[b] == '\t')) {
            ++b;
        }
        while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) {
            --e;
        }
        return s.substr(b, e - b);
    };
    auto parseUnsigned = [](const std::string& val, std::uint64_t& out) {
        if (val.empty() || val.find_first_not_of("0123456789") != std::string::npos) {
            return false;
        }
        try {
            out = static_cast<std::uint64_t>(std::stoull(val));
            return true;
        } catch (const std::exception&) {
            return false;
        }
    };

    std::size_t start = 0;
    while (start < config.size()) {
        std::size_t sep = config.find(';', start);
        if (sep == std::string::npos) { sep = config.size(); }
        std::string kv = trim(config.substr(start, sep - start));
        std::size_t eq = kv.find('=');
        if (!kv.empty() && eq != std::string::npos) {
            std::string key = trim(kv.substr(0, eq));
            std::string val = trim(kv.substr(eq + 1));
            std::uint64_t n = 0;
            if (key == "connectTimeoutMs") {
                if (parseUnsigned(val, n) && n <= std::numeric_limits<unsigned int>::max()) {
                    opts.connectTimeoutMs = static_cast<unsigned int>(n);
                }
            }
            else if (key == "readTimeoutMs") {
                if (parseUnsigned(val, n) && n <= std::numeric_limits<unsigned int>::max()) {
                    opts.readTimeoutMs = static_cast<unsigned int>(n);
                }
            }
            else if (key == "maxBodyBytes") {
                if (parseUnsigned(val, n)) {
                    opts.maxBodyBytes = n;
                }
            }
            else if (key == "userAgent") {
                opts.userAgent = val;
            }
            else {
                LOG_DEBUG("HttpExecutorFactory: ignoring unknown key '{}'", key);
            }
        }
        start = sep + 1;
    }
    return opts;
}

std::unique_ptr<IHttpExecutor> HttpExecutorFactory::CreateExecutor(const std::string& config) {
    return std::make_unique<BeastHttpExecutor>(ParseConfig(config));
}

} // namespace aiq::http
