#pragma once

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include "CommandRouter.hpp"

namespace wakecap {

typedef websocketpp::server<websocketpp::config::asio> server;

// HTTP-транспорт для команд (websocketpp, только http handler), свой поток asio
class CommandServer {
public:
    CommandServer(std::shared_ptr<CommandRouter> router, std::string address, uint16_t port);
    ~CommandServer();

    // Бросает std::runtime_error, если не удалось занять адрес
    void Start();
    void Stop();

private:
    void OnHttp(websocketpp::connection_hdl hdl);

    server _endpoint;
    std::shared_ptr<CommandRouter> _router;
    std::string _address;
    uint16_t _port;
    std::unique_ptr<std::thread> _thread;
};

} // namespace wakecap
