//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/MiniHttpServer.hpp
// Purpose: Single-threaded Boost.Beast HTTP server on 127.0.0.1 for executor and protocol tests
//==========================================================================================================
#pragma once

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace testsupport {

// What the server saw for one request.
struct SeenRequest {
    std::string method;
    std::string target;
    std::string host;
    std::string contentType;
    std::string userAgent;
    std::string authorization;
    std::string body;
};

// What the handler wants sent back.
struct Reply {
    int status{200};
    std::string reason;                 // empty: Beast default phrase
    std::string body;
    std::string contentType{"application/json"};
    std::optional<std::string> raw;     // sent verbatim instead of a formatted response
    unsigned int delayMs{0};            // sleep before replying
};

using Handler = std::function<Reply(const SeenRequest&)>;

struct MiniHttpServer {
    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor acceptor{io};
    std::thread thr;
    std::atomic<bool> running{false};
    std::atomic<int> requestCount{0};
    unsigned short port{0};
    Handler handler;

    std::mutex seenMutex;
    std::vector<SeenRequest> seen;

    explicit MiniHttpServer(Handler h) : handler(std::move(h)) {}
    ~MiniHttpServer() { stop(); }

    std::string baseUrl() const {
        return std::string("http://127.0.0.1:") + std::to_string(port);
    }

    std::vector<SeenRequest> requests() {
        std::lock_guard<std::mutex> lk(seenMutex);
        return seen;
    }

    void serveOne() {
        namespace http = boost::beast::http;
        using boost::asio::ip::tcp;
        try {
            tcp::socket socket{io};
            acceptor.accept(socket);
            if (!running.load()) {
                return;
            }
            boost::beast::tcp_stream stream{std::move(socket)};
            boost::beast::flat_buffer buffer;
            http::request<http::string_body> req;
            http::read(stream, buffer, req);

            SeenRequest s;
            s.method = std::string(req.method_string());
            s.target = std::string(req.target());
            s.host = std::string(req[http::field::host]);
            s.contentType = std::string(req[http::field::content_type]);
            s.userAgent = std::string(req[http::field::user_agent]);
            s.authorization = std::string(req[http::field::authorization]);
            s.body = req.body();
            {
                std::lock_guard<std::mutex> lk(seenMutex);
                seen.push_back(s);
            }
            requestCount.fetch_add(1);

            Reply r = handler ? handler(s) : Reply{};
            if (r.delayMs > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(r.delayMs));
            }
            if (r.raw.has_value()) {
                boost::asio::write(stream.socket(), boost::asio::buffer(*r.raw));
            } else {
                http::response<http::string_body> res{static_cast<http::status>(r.status), req.version()};
                if (!r.reason.empty()) {
                    res.reason(r.reason);
                }
                res.set(http::field::server, "mini-server");
                res.set(http::field::content_type, r.contentType);
                res.keep_alive(false);
                res.body() = r.body;
                res.prepare_payload();
                http::write(stream, res);
            }
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        } catch (const std::exception&) {
            // Client hang-ups and the stop() poke land here
        }
    }

    void start() {
        using boost::asio::ip::tcp;
        tcp::endpoint ep{boost::asio::ip::make_address("127.0.0.1"), 0};
        acceptor.open(ep.protocol());
        acceptor.set_option(tcp::acceptor::reuse_address(true));
        acceptor.bind(ep);
        acceptor.listen();
        port = acceptor.local_endpoint().port();
        running.store(true);
        thr = std::thread([this]() {
            while (running.load()) {
                serveOne();
            }
        });
    }

    void stop() {
        if (!thr.joinable()) {
            return;
        }
        running.store(false);
        boost::system::error_code ec;
        // Poke accept so the loop observes running == false
        boost::asio::ip::tcp::socket pokeSock{io};
        pokeSock.connect({boost::asio::ip::make_address("127.0.0.1"), port}, ec);
        pokeSock.close(ec);
        thr.join();
        acceptor.close(ec);
    }
};

// A loopback port with nothing listening on it.
inline unsigned short UnusedLoopbackPort() {
    using boost::asio::ip::tcp;
    boost::asio::io_context io;
    tcp::acceptor a{io, tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), 0}};
    unsigned short p = a.local_endpoint().port();
    a.close();
    return p;
}

} // namespace testsupport
