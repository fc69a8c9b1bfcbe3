#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/system/system_error.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ts::protocols {

namespace asio  = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

[[noreturn]] inline void throw_with_context(std::string_view what, std::string_view detail) {
    throw std::runtime_error(std::string(what) + ": " + std::string(detail));
}

template <class Fn>
void wrap_sys(const std::string_view what, Fn&& fn) {
    try { std::forward<Fn>(fn)(); }
    catch (const boost::system::system_error& e) { throw_with_context(what, e.what()); }
}

inline std::string endpointToString(const tcp::endpoint& ep) {
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

// "host:port" or ":port" (all interfaces).
inline tcp::endpoint parseEndpoint(const std::string_view bind, const std::string_view defaultHost = "0.0.0.0") {
    const auto colon = bind.rfind(':');
    if (colon == std::string_view::npos) throw std::invalid_argument("bind address must be host:port, got " + std::string(bind));

    const auto host = colon == 0 ? std::string(defaultHost) : std::string(bind.substr(0, colon));
    const auto portStr = std::string(bind.substr(colon + 1));

    unsigned long port = 0;
    try {
        std::size_t used = 0;
        port = std::stoul(portStr, &used);
        if (used != portStr.size()) throw std::invalid_argument(portStr);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid port in bind address: " + std::string(bind));
    }
    if (port > UINT16_MAX) throw std::invalid_argument("port out of range: " + portStr);

    boost::system::error_code ec;
    const auto address = asio::ip::make_address(host, ec);
    if (ec) throw std::invalid_argument("invalid bind host " + host + ": " + ec.message());
    return {address, static_cast<uint16_t>(port)};
}

inline void init_acceptor(tcp::acceptor& acceptor, const tcp::endpoint& endpoint) {
    wrap_sys("Failed to open acceptor", [&] { acceptor.open(endpoint.protocol()); });
    wrap_sys("Failed to set reuse_address", [&] {
        acceptor.set_option(asio::socket_base::reuse_address(true));
    });
    wrap_sys("Failed to bind acceptor", [&] { acceptor.bind(endpoint); });
    wrap_sys("Failed to listen on acceptor", [&] {
        acceptor.listen(asio::socket_base::max_listen_connections);
    });
}

}
