#include "discovery/MdnsDiscovery.hpp"
#include "discovery/MdnsPacket.hpp"
#include <array>
#include <functional>
#include <memory>
#include <stdexcept>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>

namespace asio = boost::asio;
using udp = asio::ip::udp;

namespace keylightd {

MdnsDiscovery::MdnsDiscovery(std::string service, std::chrono::milliseconds listen_window)
: service_(std::move(service)), listen_window_(listen_window) {}

void MdnsDiscovery::scan(const ObservationHandler& emit, const std::atomic<bool>& running) {
    asio::io_context ioc;
    udp::socket socket(ioc);
    boost::system::error_code ec;

    socket.open(udp::v4(), ec);
    if (ec) throw std::runtime_error("mdns: socket open failed: " + ec.message());
    socket.set_option(asio::ip::multicast::hops(255), ec);
    socket.bind(udp::endpoint(udp::v4(), 0), ec);
    if (ec) throw std::runtime_error("mdns: bind failed: " + ec.message());

    const auto query = mdns::build_query(service_);
    const udp::endpoint group(asio::ip::make_address(mdns::MULTICAST_ADDRESS), mdns::MULTICAST_PORT);
    socket.send_to(asio::buffer(query), group, 0, ec);
    if (ec) throw std::runtime_error("mdns: send failed: " + ec.message());

    auto buffer = std::make_shared<std::array<uint8_t, 9000>>();
    auto sender = std::make_shared<udp::endpoint>();
    std::function<void()> do_receive;
    do_receive = [&]() {
        socket.async_receive_from(asio::buffer(*buffer), *sender,
            [&, buffer, sender](boost::system::error_code rec, std::size_t n) {
                if (rec) return; // cancelled at end of window
                if (auto msg = mdns::parse(buffer->data(), n)) {
                    if (msg->is_response) {
                        for (const auto& obs : mdns::to_observations(*msg, service_, sender->address().to_string())) {
                            emit(obs);
                        }
                    }
                }
                if (running) do_receive();
            });
    };
    do_receive();

    asio::steady_timer deadline(ioc, listen_window_);
    deadline.async_wait([&](boost::system::error_code) {
        boost::system::error_code ignored;
        socket.cancel(ignored);
    });

    // Run in short slices so a stop request is honoured mid-window.
    while (running && !ioc.stopped()) {
        ioc.run_for(std::chrono::milliseconds(100));
    }
    if (!ioc.stopped()) {
        boost::system::error_code ignored;
        deadline.cancel();
        socket.cancel(ignored);
        ioc.run_for(std::chrono::milliseconds(100));
    }
}

} // namespace keylightd
