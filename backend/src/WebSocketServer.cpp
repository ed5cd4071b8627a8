#include "WebSocketServer.hpp"
#include "ControlService.hpp"
#include <algorithm>
#include <iostream>
#include <chrono>
#include <functional>
#include <mutex>
#include <set>
#include <nlohmann/json.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace keylightd {

using WsStream = websocket::stream<tcp::socket>;

struct WebSocketServer::Impl {
    asio::io_context ioc;
    asio::executor_work_guard<asio::io_context::executor_type> work;
    tcp::acceptor acceptor;
    asio::thread_pool rpc_pool;
    std::mutex sessions_m;
    std::set<std::shared_ptr<WsStream>> sessions;
    bool listening = false;

    Impl(const ServerOptions& opts)
    : ioc(), work(asio::make_work_guard(ioc)), acceptor(ioc), rpc_pool(std::max(1, opts.rpc_threads)) {
        boost::system::error_code ec;
        auto address = asio::ip::make_address(opts.bind, ec);
        if (ec) {
            std::cerr << "WebSocketServer: bad bind address '" << opts.bind << "': " << ec.message() << std::endl;
            return;
        }
        tcp::endpoint endpoint(address, opts.port);
        acceptor.open(endpoint.protocol(), ec);
        if (ec) {
            std::cerr << "WebSocketServer: acceptor.open failed: " << ec.message() << std::endl;
            return;
        }
        acceptor.set_option(asio::socket_base::reuse_address(true), ec);
        if (ec) {
            std::cerr << "WebSocketServer: set_option failed: " << ec.message() << std::endl;
        }
        acceptor.bind(endpoint, ec);
        if (ec) {
            std::cerr << "WebSocketServer: bind " << opts.bind << ":" << opts.port << " failed: " << ec.message() << std::endl;
            return;
        }
        acceptor.listen(asio::socket_base::max_listen_connections, ec);
        if (ec) {
            std::cerr << "WebSocketServer: listen failed: " << ec.message() << std::endl;
            return;
        }
        listening = true;
    }

    void track(const std::shared_ptr<WsStream>& ws, bool open) {
        std::lock_guard<std::mutex> lk(sessions_m);
        if (open) {
            sessions.insert(ws);
        } else if (sessions.erase(ws) == 0) {
            return;
        }
        std::cerr << "WebSocketServer: " << (open ? "client connected" : "client disconnected")
                  << ", " << sessions.size() << " open" << std::endl;
    }
    template<typename Fn>
    void each_session(Fn&& fn) {
        std::lock_guard<std::mutex> lk(sessions_m);
        for (const auto& ws : sessions) fn(ws);
    }
};

WebSocketServer::WebSocketServer(ServerOptions opts, ControlService& svc)
: options(std::move(opts)), running(false), service(svc) {}

WebSocketServer::~WebSocketServer() {
    stop();
}

bool WebSocketServer::start() {
    if (running) return true;
    impl = std::make_shared<Impl>(options);
    if (!impl->listening) {
        impl.reset();
        return false;
    }
    boost::system::error_code ec;
    auto local = impl->acceptor.local_endpoint(ec);
    bound_port = ec ? options.port : local.port();

    running = true;
    do_accept();
    event_thread = std::thread([this](){ run_event_loop(); });
    return true;
}

void WebSocketServer::stop_accepting() {
    if (!running.exchange(false)) return;
    if (impl) {
        boost::system::error_code ec;
        impl->acceptor.close(ec);
        impl->work.reset();
        impl->ioc.stop();
    }
    if (event_thread.joinable()) event_thread.join();
    if (impl) {
        impl->each_session([&](const std::shared_ptr<WsStream>& s){
            boost::system::error_code ec;
            s->close(websocket::close_code::going_away, ec);
        });
    }
}

void WebSocketServer::stop() {
    stop_accepting();
    // Requests still running finish against whatever the service answers now.
    if (impl) impl->rpc_pool.join();
}

void WebSocketServer::do_accept() {
    auto socket = std::make_shared<tcp::socket>(impl->ioc);
    impl->acceptor.async_accept(*socket, [this, socket](boost::system::error_code ec) {
        if (ec) {
            if (running) std::cerr << "WebSocketServer: accept error: " << ec.message() << std::endl;
        } else {
            auto ws = std::make_shared<WsStream>(std::move(*socket));
            ws->set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
            ws->async_accept([this, ws](boost::system::error_code ec) {
                if (ec) {
                    std::cerr << "WebSocketServer: websocket accept failed: " << ec.message() << std::endl;
                    return;
                }
                impl->track(ws, true);
                // Read loop: every text frame is one rpc request.
                auto buffer = std::make_shared<beast::flat_buffer>();
                auto do_read = std::make_shared<std::function<void()>>();
                *do_read = [this, ws, buffer, do_read]() {
                    ws->async_read(*buffer, [this, ws, buffer, do_read](boost::system::error_code ec, std::size_t) {
                        if (ec) {
                            impl->track(ws, false);
                            // break the self-reference so the session can be freed
                            *do_read = nullptr;
                            return;
                        }
                        std::string data = beast::buffers_to_string(buffer->data());
                        buffer->consume(buffer->size());

                        Impl* self = impl.get();
                        asio::post(self->rpc_pool, [this, self, ws, data = std::move(data)]() {
                            std::string reply;
                            try {
                                reply = service.handle_text(data).dump();
                            } catch (const std::exception& e) {
                                std::cerr << "WebSocketServer: request failed: " << e.what() << std::endl;
                                return;
                            }
                            // writes happen on the single I/O thread, one at a time
                            asio::post(self->ioc, [self, ws, reply = std::move(reply)]() {
                                boost::system::error_code wec;
                                ws->text(true);
                                ws->write(asio::buffer(reply), wec);
                                if (wec) {
                                    std::cerr << "WebSocketServer: write failed: " << wec.message() << std::endl;
                                    self->track(ws, false);
                                }
                            });
                        });
                        (*do_read)();
                    });
                };
                (*do_read)();
            });
        }
        if (running) do_accept();
    });
}

void WebSocketServer::run_event_loop() {
    while (running) {
        try {
            impl->ioc.run();
            break;
        } catch (const std::exception& e) {
            std::cerr << "WebSocketServer: I/O context error: " << e.what() << std::endl;
        }
    }
}

} // namespace keylightd
