#include "TelemetryServer.hpp"
#include "core/CycleHistory.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/Serialization.hpp"

#include <chrono>
#include <functional>
#include <iostream>
#include <mutex>
#include <set>
// Boost.Beast / Asio for WebSocket
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using nlohmann::json;

namespace qecloop {

using WsStream = websocket::stream<tcp::socket>;

static json control_error(const std::string& detail) {
    return { {"type", "error"}, {"code", errors::E3500_CONTROL_REJECTED}, {"message", errors::format(errors::MSG_E3500_PREFIX, detail)} };
}

struct TelemetryServer::Impl {
    asio::io_context ioc;
    tcp::acceptor acceptor;
    mutable std::mutex sessions_m;
    std::set<std::shared_ptr<WsStream>> sessions;

    explicit Impl(int port) : ioc(), acceptor(ioc) {
        boost::system::error_code ec;
        acceptor.open(tcp::v4(), ec);
        if (ec) {
            std::cerr << "[telemetry] acceptor.open failed: " << ec.message() << std::endl;
            return;
        }
        acceptor.set_option(asio::socket_base::reuse_address(true), ec);
        if (ec) {
            std::cerr << "[telemetry] set_option failed: " << ec.message() << std::endl;
        }
        acceptor.bind(tcp::endpoint(tcp::v4(), (unsigned short)port), ec);
        if (ec) {
            std::cerr << "[telemetry] bind failed: " << ec.message() << std::endl;
            return;
        }
        acceptor.listen(asio::socket_base::max_listen_connections, ec);
        if (ec) {
            std::cerr << "[telemetry] listen failed: " << ec.message() << std::endl;
        }
    }

    void add_session(const std::shared_ptr<WsStream>& s) {
        std::lock_guard<std::mutex> lk(sessions_m);
        sessions.insert(s);
        std::cerr << "[telemetry] client connected (count=" << sessions.size() << ")" << std::endl;
    }
    void remove_session(const std::shared_ptr<WsStream>& s) {
        std::lock_guard<std::mutex> lk(sessions_m);
        sessions.erase(s);
        std::cerr << "[telemetry] client disconnected (count=" << sessions.size() << ")" << std::endl;
    }
    template <typename Fn>
    void for_each_session(Fn&& fn) {
        std::lock_guard<std::mutex> lk(sessions_m);
        for (auto& s : sessions) fn(s);
    }
};

TelemetryServer::TelemetryServer(int port, const CycleHistory& history)
: port_(port), history_(history) {}

TelemetryServer::~TelemetryServer() {
    stop();
}

void TelemetryServer::start() {
    if (running_) return;
    running_ = true;
    impl_ = std::make_shared<Impl>(port_);
    event_thread_ = std::thread([this]() { run_event_loop(); });
    std::cout << "[telemetry] listening on port " << port_ << std::endl;
}

void TelemetryServer::stop() {
    running_ = false;
    if (event_thread_.joinable()) event_thread_.join();
}

size_t TelemetryServer::client_count() const {
    if (!impl_) return 0;
    std::lock_guard<std::mutex> lk(impl_->sessions_m);
    return impl_->sessions.size();
}

void TelemetryServer::run_event_loop() {
    try {
        auto& ioc = impl_->ioc;
        auto& acceptor = impl_->acceptor;

        std::function<void()> do_accept;
        do_accept = [&]() {
            auto socket = std::make_shared<tcp::socket>(ioc);
            acceptor.async_accept(*socket, [this, socket, &do_accept](boost::system::error_code ec) {
                if (ec) {
                    if (running_) std::cerr << "[telemetry] accept error: " << ec.message() << std::endl;
                } else {
                    auto ws = std::make_shared<WsStream>(std::move(*socket));
                    ws->async_accept([this, ws](boost::system::error_code ec) {
                        if (ec) {
                            std::cerr << "[telemetry] websocket accept failed: " << ec.message() << std::endl;
                            return;
                        }
                        impl_->add_session(ws);
                        auto buffer = std::make_shared<beast::flat_buffer>();
                        auto do_read = std::make_shared<std::function<void()>>();
                        *do_read = [this, ws, buffer, do_read]() {
                            ws->async_read(*buffer, [this, ws, buffer, do_read](boost::system::error_code ec, std::size_t) {
                                if (ec) {
                                    impl_->remove_session(ws);
                                    // Break the self-reference so the session can be freed.
                                    *do_read = nullptr;
                                    return;
                                }
                                auto data = beast::buffers_to_string(buffer->data());
                                buffer->consume(buffer->size());
                                json reply;
                                try {
                                    reply = handle_control(json::parse(data));
                                } catch (const json::parse_error& e) {
                                    reply = control_error(std::string(errors::D3500_PARSE_FAILED) + ": " + e.what());
                                }
                                boost::system::error_code wec;
                                ws->text(true);
                                ws->write(asio::buffer(reply.dump()), wec);
                                if (wec) std::cerr << "[telemetry] reply failed: " << wec.message() << std::endl;
                                (*do_read)();
                            });
                        };
                        (*do_read)();
                    });
                }
                if (running_) do_accept();
            });
        };

        if (acceptor.is_open()) do_accept();

        while (running_) {
            try {
                ioc.poll();
            } catch (const std::exception& e) {
                std::cerr << "[telemetry] I/O context error: " << e.what() << std::endl;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }

        // Flush writes queued by the last publish before closing.
        ioc.poll();
        impl_->for_each_session([&](const std::shared_ptr<WsStream>& s) {
            boost::system::error_code ec;
            s->close(websocket::close_code::normal, ec);
        });
        boost::system::error_code ec;
        acceptor.close(ec);
        // Drain the cancelled handlers while do_accept is still alive.
        ioc.poll();
    } catch (const std::exception& e) {
        std::cerr << "[telemetry] run_event_loop exception: " << e.what() << std::endl;
    }
}

void TelemetryServer::broadcast(std::string payload) {
    if (!impl_ || !running_) return;
    auto shared = std::make_shared<std::string>(std::move(payload));
    impl_->for_each_session([&](const std::shared_ptr<WsStream>& s) {
        // Writes run on the event thread, the only thread touching the streams.
        asio::post(impl_->ioc, [s, shared]() {
            boost::system::error_code ec;
            s->text(true);
            s->write(asio::buffer(*shared), ec);
            if (ec) {
                // The session's read loop notices the broken connection and removes it.
            }
        });
    });
}

void TelemetryServer::publish_cycle(const CycleRecord& record) {
    json msg = record;
    msg["type"] = "cycle";
    broadcast(msg.dump());
}

void TelemetryServer::publish_summary(RunStatus status, const metrics::Summary& summary) {
    json msg = { {"type", "summary"}, {"status", to_string(status)}, {"summary", summary} };
    broadcast(msg.dump());
}

json TelemetryServer::handle_control(const json& msg) const {
    if (!msg.is_object() || !msg.contains("cmd") || !msg["cmd"].is_string()) {
        return control_error(errors::D3500_INVALID_REQUEST);
    }
    const std::string cmd = msg["cmd"].get<std::string>();
    if (cmd == "summary") {
        auto records = history_.snapshot();
        return { {"type", "summary"}, {"summary", metrics::summarize(records)} };
    }
    if (cmd == "history") {
        int64_t since = 0;
        if (msg.contains("since") && msg["since"].is_number_integer()) since = msg["since"].get<int64_t>();
        json cycles = history_.since(since);
        return { {"type", "history"}, {"cycles", cycles} };
    }
    return control_error(std::string(errors::D3500_UNKNOWN_CMD) + " '" + cmd + "'");
}

} // namespace qecloop
