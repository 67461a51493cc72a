/// @file src/events/udp_transport.cpp
/// @brief JSON-datagram event transport over Boost.Asio UDP.

#include "chit/events.hpp"

#include "chit/json_codec.hpp"
#include "chit/logging.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

#include <charconv>

namespace chit::events {

namespace asio = boost::asio;
using udp = asio::ip::udp;

// ─── parse_udp_endpoint ───────────────────────────────────────────────────────

std::optional<UdpEndpoint> parse_udp_endpoint(std::string_view text) {
    const auto colon = text.rfind(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 == text.size()) {
        return std::nullopt;
    }

    const std::string_view port_text = text.substr(colon + 1);
    unsigned int port = 0;
    const auto [end, ec] = std::from_chars(port_text.data(),
                                           port_text.data() + port_text.size(), port);
    if (ec != std::errc{} || end != port_text.data() + port_text.size() ||
        port == 0 || port > 65535) {
        return std::nullopt;
    }
    return UdpEndpoint{std::string(text.substr(0, colon)),
                       static_cast<unsigned short>(port)};
}

// ─── UdpTransport ─────────────────────────────────────────────────────────────

struct UdpTransport::Impl {
    asio::io_context             io;
    udp::socket                  socket{io};
    std::optional<udp::endpoint> target;
};

UdpTransport::UdpTransport(UdpEndpoint endpoint)
    : endpoint_(std::move(endpoint))
    , impl_(std::make_unique<Impl>()) {}

UdpTransport::~UdpTransport() = default;

bool UdpTransport::publish(std::string_view topic, const std::string& payload) {
    // Resolve on first use so a bus that is down at startup is retried.
    if (!impl_->target) {
        udp::resolver resolver(impl_->io);
        const auto results = resolver.resolve(udp::v4(), endpoint_.host,
                                              std::to_string(endpoint_.port));
        if (results.empty()) {
            log::logger()->warn("udp bus {}:{} did not resolve", endpoint_.host, endpoint_.port);
            return false;
        }
        impl_->target = *results.begin();
        impl_->socket.open(udp::v4());
    }

    // The payload is already JSON; embed it rather than re-encode it.
    std::string datagram;
    datagram.reserve(payload.size() + topic.size() + 24);
    datagram += R"({"topic":)";
    datagram += io::write_json(Json::Value(std::string(topic)));
    datagram += R"(,"event":)";
    datagram += payload;
    datagram += '}';

    const std::size_t sent = impl_->socket.send_to(asio::buffer(datagram), *impl_->target);
    return sent == datagram.size();
}

} // namespace chit::events
