//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/aiq/http/HttpExecutor.hpp
// Purpose: Single-shot HTTP/HTTPS request execution using Boost.Beast
//==========================================================================================================
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "aiq/errors/Errors.h"

namespace aiq::http {

struct HeaderKV {
    std::string name;
    std::string value;
};

enum class Method {
    Get,
    Post
};

//==========================================================================================================
// HttpRequest
// Purpose: One outbound request, built per call and not retained.
// Fields:
//   method: GET or POST
//   url: Absolute http(s) URL including any query
//   headers: Extra headers; a header named here replaces the executor default of the same name
//   body: Request body (POST only)
//==========================================================================================================
struct HttpRequest {
    Method method{Method::Get};
    std::string url;
    std::vector<HeaderKV> headers;
    std::string body;
};

//==========================================================================================================
// HttpResponse
// Purpose: Fully read response. reason is never empty: when the server omits it, the standard phrase for
//          the status (or "HTTP <status>") is substituted.
//==========================================================================================================
struct HttpResponse {
    int status{0};
    std::string reason;
    std::vector<HeaderKV> headers;
    std::string body;
};

//==========================================================================================================
// IHttpExecutor
// Purpose: Transport seam used by the authentication protocol.
// Notes:
//   - Execute blocks until the response is fully read or the request fails.
//   - Failures to complete the exchange are reported as TransportFailure; an unusable URL as InvalidInput.
//   - Any HTTP status (including 4xx/5xx) is a successful execution.
//   - Implementations must be safe to call concurrently.
//==========================================================================================================
class IHttpExecutor {
public:
    virtual ~IHttpExecutor() = default;

    virtual errors::Result<HttpResponse> Execute(const HttpRequest& request) const = 0;
};

//==========================================================================================================
// BeastHttpExecutor
// Purpose: IHttpExecutor over Boost.Beast. Every Execute call owns its io_context, resolver, socket and
//          (for https) TLS context, all released before it returns.
//==========================================================================================================
class BeastHttpExecutor final : public IHttpExecutor {
public:
    //======================================================================================================
    // Options
    // Fields:
    //   connectTimeoutMs: Connect (and TLS handshake) timeout, counted after name resolution; 0 disables it
    //   readTimeoutMs: Write-and-read timeout; 0 disables the timeout
    //   maxBodyBytes: Largest accepted response body; larger bodies are a TransportFailure
    //   userAgent: User-Agent header; defaults to "aiq-auth/<version>"
    //======================================================================================================
    struct Options {
        unsigned int connectTimeoutMs{10000};
        unsigned int readTimeoutMs{30000};
        std::uint64_t maxBodyBytes{8u * 1024u * 1024u};
        std::string userAgent;

        // Defaults overridden by AIQ_HTTP_CONNECT_TIMEOUT_MS, AIQ_HTTP_READ_TIMEOUT_MS, AIQ_HTTP_MAX_BODY_BYTES.
        static Options FromEnvironment();
    };

    BeastHttpExecutor();
    explicit BeastHttpExecutor(const Options& opts);
    ~BeastHttpExecutor() override;

    errors::Result<HttpResponse> Execute(const HttpRequest& request) const override;

    const Options& GetOptions() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// HttpExecutorFactory
// Purpose: Creates executors from a semicolon-delimited key=value config string, e.g.
//          "connectTimeoutMs=500; readTimeoutMs=1500; maxBodyBytes=65536; userAgent=build-task/1.0".
//          Unknown keys and unparsable numbers are ignored; unspecified keys keep the environment defaults.
//==========================================================================================================
class HttpExecutorFactory {
public:
    static BeastHttpExecutor::Options ParseConfig(const std::string& config);

    std::unique_ptr<IHttpExecutor> CreateExecutor(const std::string& config);
};

// Textual method name, "GET" or "POST".
const char* MethodName(Method method);

} // namespace aiq::http
