#include "protocols/http/Server.hpp"
#include "protocols/http/Router.hpp"
#include "protocols/http/SessionTask.hpp"
#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

using namespace ts::concurrency;
using namespace ts::log;

namespace ts::protocols::http {

Server::Server(net::io_context& ioc, const tcp::endpoint& endpoint,
               std::shared_ptr<Router> router,
               std::shared_ptr<ThreadPool> pool,
               Session::Options sessionOpts)
    : ioc_(ioc), acceptor_(ioc), router_(std::move(router)), pool_(std::move(pool)), sessionOpts_(sessionOpts) {
    if (!router_) throw std::invalid_argument("Router cannot be null");
    if (!pool_) throw std::invalid_argument("ThreadPool cannot be null");
    init_acceptor(acceptor_, endpoint);
}

void Server::run() {
    Registry::http()->info("[Server] Listening on {}", endpointToString(acceptor_.local_endpoint()));
    do_accept();
}

void Server::stop() {
    net::post(ioc_, [self = shared_from_this()] {
        beast::error_code ec;
        self->acceptor_.close(ec);
        if (ec) Registry::http()->warn("[Server] Failed to close acceptor: {}", ec.message());
    });
}

void Server::do_accept() {
    // each connection gets its own io_context, run by the worker that owns the session
    auto sessionIoc = std::make_shared<net::io_context>(1);

    acceptor_.async_accept(*sessionIoc, [self = shared_from_this(), sessionIoc](const beast::error_code& ec, tcp::socket socket) mutable {
        if (ec) {
            if (ec == net::error::operation_aborted) return; // shutting down
            Registry::http()->warn("[Server] accept error: {}", ec.message());
            self->do_accept();
            return;
        }

        self->do_accept();

        try {
            auto session = std::make_shared<Session>(std::move(sessionIoc), std::move(socket), self->router_, self->sessionOpts_);
            self->pool_->submit(std::make_shared<SessionTask>(std::move(session)));
        } catch (const std::exception& e) {
            Registry::http()->error("[Server] Failed to dispatch connection: {}", e.what());
        }
    });
}

}
