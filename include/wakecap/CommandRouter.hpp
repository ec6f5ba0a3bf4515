#pragma once

#include <memory>
#include <string>

#include "CaptureController.hpp"

namespace wakecap {

struct HttpReply {
    int status = 200;
    std::string body; // JSON
};

// Отображение HTTP-запросов на команды контроллера, без привязки к транспорту.
//   POST /start, /stop, /save, /halt;  GET /status
class CommandRouter {
public:
    explicit CommandRouter(std::shared_ptr<CaptureController> controller);

    HttpReply Handle(const std::string& method, const std::string& resource);

private:
    std::shared_ptr<CaptureController> _controller;
};

} // namespace wakecap
