#pragma once

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace wakecap {

class ConfigException : public std::runtime_error {
public:
    explicit ConfigException(const std::string& message)
        : std::runtime_error(message) {}
};

// Час истории при 48 кГц уже ~700 МБ
constexpr unsigned int kMaxBufferSeconds = 3600;

struct DaemonConfig {
    unsigned int bufferSeconds = 60;
    std::string outputDirectory = "captures";
    std::string httpAddress = "127.0.0.1";
    uint16_t httpPort = 8000;

    // Porcupine
    std::string accessKey;
    std::string modelPath;
    std::vector<std::string> keywordPaths;
    std::vector<float> sensitivities;

    unsigned int pollIntervalMs = 100;
    unsigned int haltGraceMs = 200;

    bool listDevices = false;
    bool showHelp = false;
};

using EnvLookup = std::function<const char*(const char*)>;

// Порядок: значения по умолчанию < JSON (--config) < окружение < аргументы.
// args без имени программы. Бросает ConfigException.
DaemonConfig ParseConfig(const std::vector<std::string>& args, const EnvLookup& env = nullptr);

void ValidateConfig(const DaemonConfig& config);

std::string Usage(const std::string& program);

} // namespace wakecap
