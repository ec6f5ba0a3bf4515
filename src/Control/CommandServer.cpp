#include "wakecap/CommandServer.hpp"
#include "wakecap/debug_log.hpp"

#include <stdexcept>

using websocketpp::lib::placeholders::_1;
using websocketpp::lib::bind;

namespace wakecap {

CommandServer::CommandServer(std::shared_ptr<CommandRouter> router, std::string address, uint16_t port)
    : _router(std::move(router))
    , _address(std::move(address))
    , _port(port) {

    _endpoint.clear_access_channels(websocketpp::log::alevel::all);
    _endpoint.clear_error_channels(websocketpp::log::elevel::all);

    _endpoint.init_asio();
    _endpoint.set_reuse_addr(true);
    _endpoint.set_http_handler(bind(&CommandServer::OnHttp, this, ::_1));
}

CommandServer::~CommandServer() {
    Stop();
}

void CommandServer::Start() {
    if (_thread) return;

    websocketpp::lib::error_code ec;
    _endpoint.listen(_address, std::to_string(_port), ec);
    if (ec) {
        throw std::runtime_error("Failed to bind HTTP server on " + _address + ":"
                                 + std::to_string(_port) + ": " + ec.message());
    }

    _endpoint.start_accept(ec);
    if (ec) {
        throw std::runtime_error("Failed to accept HTTP connections: " + ec.message());
    }

    _thread.reset(new std::thread([this]() {
        try {
            _endpoint.run();
        } catch (const std::exception& e) {
            WAKECAP_LOG_ERROR("HTTP server run error: " << e.what());
        }
    }));

    WAKECAP_LOG_INFO("Starting HTTP server on " << _address << ":" << _port);
}

void CommandServer::Stop() {
    if (!_thread) return;

    websocketpp::lib::error_code ec;
    if (_endpoint.is_listening()) {
        _endpoint.stop_listening(ec);
        if (ec) {
            WAKECAP_LOG_WARN("Error stopping HTTP listener: " << ec.message());
        }
    }
    _endpoint.stop();

    if (_thread->joinable()) {
        _thread->join();
    }
    _thread.reset();
}

void CommandServer::OnHttp(websocketpp::connection_hdl hdl) {
    server::connection_ptr con = _endpoint.get_con_from_hdl(hdl);

    HttpReply reply;
    try {
        reply = _router->Handle(con->get_request().get_method(), con->get_resource());
    } catch (const std::exception& e) {
        WAKECAP_LOG_ERROR("Failed to handle HTTP request " << con->get_resource() << ": " << e.what());
        reply.status = 500;
        reply.body = R"({"status":"error","error":"Internal server error"})";
    }

    con->set_status(static_cast<websocketpp::http::status_code::value>(reply.status));
    con->append_header("Content-Type", "application/json");
    con->set_body(reply.body);
}

} // namespace wakecap
