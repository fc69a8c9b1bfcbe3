#pragma once

#include "protocols/TCPAcceptor.hpp"
#include "protocols/http/Session.hpp"

#include <memory>

namespace ts::concurrency { class ThreadPool; }

namespace ts::protocols::http {

class Router;

class Server : public std::enable_shared_from_this<Server> {
public:
    Server(net::io_context& ioc, const tcp::endpoint& endpoint,
           std::shared_ptr<Router> router,
           std::shared_ptr<concurrency::ThreadPool> pool,
           Session::Options sessionOpts);

    void run();

    // Closes the acceptor; sessions already handed to the pool run to completion.
    void stop();

    [[nodiscard]] tcp::endpoint localEndpoint() const { return acceptor_.local_endpoint(); }

private:
    void do_accept();

    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    std::shared_ptr<Router> router_;
    std::shared_ptr<concurrency::ThreadPool> pool_;
    Session::Options sessionOpts_;
};

}
