#include "wakecap/CommandRouter.hpp"
#include "wakecap/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace wakecap {

namespace {

HttpReply Reply(int status, const json& body) {
    // Путь запроса и каталог могут содержать не-UTF-8 байты
    return HttpReply{status, body.dump(-1, ' ', false, json::error_handler_t::replace)};
}

HttpReply FromCommand(const CommandResult& result) {
    if (!result.ok) {
        return Reply(500, {{"status", "error"}, {"error", result.message}});
    }
    return Reply(200, {{"status", "ok"}, {"message", result.message}});
}

std::string StripQuery(const std::string& resource) {
    std::string path = resource.substr(0, resource.find('?'));
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

} // namespace

CommandRouter::CommandRouter(std::shared_ptr<CaptureController> controller)
    : _controller(std::move(controller)) {
}

HttpReply CommandRouter::Handle(const std::string& method, const std::string& resource) {
    const std::string path = StripQuery(resource);
    WAKECAP_DEBUG_LOG("HTTP " << method << " " << path);

    if (path == "/status") {
        if (method != "GET") {
            return Reply(405, {{"status", "error"}, {"error", "Method not allowed"}});
        }
        CaptureStatus status = _controller->Status();
        return Reply(200, {
            {"status", "ok"},
            {"recording", status.recording},
            {"halting", status.halting},
            {"capturing", status.capturing},
            {"buffered_samples", status.bufferedSamples},
            {"capacity", status.capacity},
            {"output_dir", status.outputDirectory},
        });
    }

    if (path != "/start" && path != "/stop" && path != "/save" && path != "/halt") {
        return Reply(404, {{"status", "error"}, {"error", "Not found: " + path}});
    }
    if (method != "POST") {
        return Reply(405, {{"status", "error"}, {"error", "Method not allowed"}});
    }

    if (path == "/start") {
        return FromCommand(_controller->StartRecording());
    }
    if (path == "/stop") {
        return FromCommand(_controller->StopRecording());
    }
    if (path == "/halt") {
        return FromCommand(_controller->Halt());
    }

    SaveResult saved = _controller->SaveAudio();
    if (!saved.ok) {
        return Reply(500, {{"status", "error"}, {"path", saved.path}, {"error", saved.error}});
    }
    return Reply(200, {{"status", "ok"}, {"path", saved.path}, {"samples", saved.sampleCount}});
}

} // namespace wakecap
