#pragma once
#include <thread>
#include <atomic>
#include <string>
#include <memory>
#include <cstdint>

namespace keylightd {

class ControlService;

struct ServerOptions {
    std::string bind = "127.0.0.1";
    uint16_t port = 9124;
    int rpc_threads = 2;
};

// WebSocket front for ControlService. One text frame in, one rpc_result
// frame out. Requests run on a small worker pool so a slow light never
// stalls the I/O thread.
class WebSocketServer {
public:
    WebSocketServer(ServerOptions options, ControlService& service);
    ~WebSocketServer();

    // Returns false if the listening socket could not be set up.
    bool start();
    // Closes the listener and every session. Requests already handed to the
    // worker pool keep running.
    void stop_accepting();
    // stop_accepting(), then waits for the worker pool.
    void stop();

    // Actual listening port (useful when configured with port 0).
    uint16_t port() const { return bound_port; }

private:
    struct Impl;

    void run_event_loop();
    void do_accept();

    ServerOptions options;
    std::atomic<bool> running;
    std::atomic<uint16_t> bound_port{0};
    std::thread event_thread;

    ControlService& service;
    std::shared_ptr<Impl> impl;
};

} // namespace keylightd
