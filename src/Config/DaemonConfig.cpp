#include "wakecap/DaemonConfig.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace wakecap {

namespace {

unsigned long ParseUnsigned(const std::string& name, const std::string& value, unsigned long max) {
    std::size_t pos = 0;
    unsigned long parsed = 0;
    try {
        if (!value.empty() && value[0] == '-') {
            throw std::invalid_argument("negative");
        }
        parsed = std::stoul(value, &pos);
    } catch (const std::exception&) {
        throw ConfigException(name + " must be a positive integer, got '" + value + "'");
    }
    if (pos != value.size() || parsed == 0 || parsed > max) {
        throw ConfigException(name + " must be an integer in [1, " + std::to_string(max)
                              + "], got '" + value + "'");
    }
    return parsed;
}

float ParseSensitivity(const std::string& value) {
    std::size_t pos = 0;
    float parsed = 0.0f;
    try {
        parsed = std::stof(value, &pos);
    } catch (const std::exception&) {
        throw ConfigException("Sensitivity must be a number, got '" + value + "'");
    }
    if (pos != value.size()) {
        throw ConfigException("Sensitivity must be a number, got '" + value + "'");
    }
    return parsed;
}

std::vector<std::string> SplitList(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

void ApplyJson(DaemonConfig& config, const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigException("Cannot open config file " + path);
    }

    json root;
    try {
        root = json::parse(file);
    } catch (const json::exception& e) {
        throw ConfigException("Cannot parse config file " + path + ": " + e.what());
    }
    if (!root.is_object()) {
        throw ConfigException("Config file " + path + " must contain a JSON object");
    }

    try {
        if (root.contains("buffer_seconds")) {
            config.bufferSeconds = static_cast<unsigned int>(ParseUnsigned(
                "buffer_seconds", std::to_string(root.at("buffer_seconds").get<long long>()),
                std::numeric_limits<unsigned int>::max()));
        }
        if (root.contains("output_dir")) {
            config.outputDirectory = root.at("output_dir").get<std::string>();
        }
        if (root.contains("http_address")) {
            config.httpAddress = root.at("http_address").get<std::string>();
        }
        if (root.contains("http_port")) {
            config.httpPort = static_cast<uint16_t>(ParseUnsigned(
                "http_port", std::to_string(root.at("http_port").get<long long>()), 65535));
        }
        if (root.contains("access_key")) {
            config.accessKey = root.at("access_key").get<std::string>();
        }
        if (root.contains("model_path")) {
            config.modelPath = root.at("model_path").get<std::string>();
        }
        if (root.contains("keyword_paths")) {
            config.keywordPaths = root.at("keyword_paths").get<std::vector<std::string>>();
        }
        if (root.contains("sensitivities")) {
            config.sensitivities = root.at("sensitivities").get<std::vector<float>>();
        }
        if (root.contains("poll_interval_ms")) {
            config.pollIntervalMs = static_cast<unsigned int>(ParseUnsigned(
                "poll_interval_ms", std::to_string(root.at("poll_interval_ms").get<long long>()), 10000));
        }
        if (root.contains("halt_grace_ms")) {
            config.haltGraceMs = static_cast<unsigned int>(ParseUnsigned(
                "halt_grace_ms", std::to_string(root.at("halt_grace_ms").get<long long>()), 60000));
        }
    } catch (const json::exception& e) {
        throw ConfigException("Invalid value in config file " + path + ": " + e.what());
    }
}

void ApplyEnvironment(DaemonConfig& config, const EnvLookup& env) {
    if (const char* value = env("WAKECAP_BUFFER_SECONDS")) {
        config.bufferSeconds = static_cast<unsigned int>(
            ParseUnsigned("WAKECAP_BUFFER_SECONDS", value, std::numeric_limits<unsigned int>::max()));
    }
    if (const char* value = env("WAKECAP_OUTPUT_DIR")) {
        config.outputDirectory = value;
    }
    if (const char* value = env("WAKECAP_HTTP_ADDRESS")) {
        config.httpAddress = value;
    }
    if (const char* value = env("WAKECAP_HTTP_PORT")) {
        config.httpPort = static_cast<uint16_t>(ParseUnsigned("WAKECAP_HTTP_PORT", value, 65535));
    }
    if (const char* value = env("PICOVOICE_ACCESS_KEY")) {
        config.accessKey = value;
    }
    if (const char* value = env("PORCUPINE_MODEL_PATH")) {
        config.modelPath = value;
    }
    if (const char* value = env("PORCUPINE_KEYWORD_PATHS")) {
        config.keywordPaths = SplitList(value);
    }
    if (const char* value = env("PORCUPINE_SENSITIVITIES")) {
        config.sensitivities.clear();
        for (const auto& item : SplitList(value)) {
            config.sensitivities.push_back(ParseSensitivity(item));
        }
    }
}

} // namespace

DaemonConfig ParseConfig(const std::vector<std::string>& args, const EnvLookup& env) {
    EnvLookup lookup = env;
    if (!lookup) {
        lookup = [](const char* name) -> const char* { return std::getenv(name); };
    }

    DaemonConfig config;

    // --config читается первым, чтобы окружение и аргументы его перекрывали
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) {
                throw ConfigException("--config requires a value");
            }
            ApplyJson(config, args[i + 1]);
        }
    }

    ApplyEnvironment(config, lookup);

    // Повторяемые флаги заменяют значения из файла и окружения целиком
    std::vector<std::string> keywordPaths;
    std::vector<float> sensitivities;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
            continue;
        }
        if (arg == "--list-devices") {
            config.listDevices = true;
            continue;
        }

        if (i + 1 >= args.size()) {
            throw ConfigException("Unknown option or missing value: " + arg);
        }
        const std::string& value = args[++i];

        if (arg == "--config") {
            // уже применен
        } else if (arg == "--buffer-seconds") {
            config.bufferSeconds = static_cast<unsigned int>(
                ParseUnsigned("--buffer-seconds", value, std::numeric_limits<unsigned int>::max()));
        } else if (arg == "--output-dir") {
            config.outputDirectory = value;
        } else if (arg == "--address") {
            config.httpAddress = value;
        } else if (arg == "--port") {
            config.httpPort = static_cast<uint16_t>(ParseUnsigned("--port", value, 65535));
        } else if (arg == "--access-key") {
            config.accessKey = value;
        } else if (arg == "--model-path") {
            config.modelPath = value;
        } else if (arg == "--keyword-path") {
            keywordPaths.push_back(value);
        } else if (arg == "--sensitivity") {
            sensitivities.push_back(ParseSensitivity(value));
        } else {
            throw ConfigException("Unknown option: " + arg);
        }
    }

    if (!keywordPaths.empty()) {
        config.keywordPaths = keywordPaths;
    }
    if (!sensitivities.empty()) {
        config.sensitivities = sensitivities;
    }

    if (!config.showHelp && !config.listDevices) {
        ValidateConfig(config);
    }
    return config;
}

void ValidateConfig(const DaemonConfig& config) {
    if (config.bufferSeconds == 0 || config.bufferSeconds > kMaxBufferSeconds) {
        throw ConfigException("Buffer duration must be within [1, " + std::to_string(kMaxBufferSeconds)
                              + "] seconds, got " + std::to_string(config.bufferSeconds));
    }
    if (config.outputDirectory.empty()) {
        throw ConfigException("Output directory must not be empty");
    }
    if (config.accessKey.empty()) {
        throw ConfigException("PICOVOICE_ACCESS_KEY is not set");
    }
    if (config.modelPath.empty()) {
        throw ConfigException("PORCUPINE_MODEL_PATH is not set");
    }
    if (config.keywordPaths.empty()) {
        throw ConfigException("PORCUPINE_KEYWORD_PATHS is not set");
    }
    if (!config.sensitivities.empty() && config.sensitivities.size() != config.keywordPaths.size()) {
        throw ConfigException("Expected " + std::to_string(config.keywordPaths.size())
                              + " sensitivities, got " + std::to_string(config.sensitivities.size()));
    }
    for (float sensitivity : config.sensitivities) {
        if (sensitivity < 0.0f || sensitivity > 1.0f) {
            throw ConfigException("Sensitivity must be within [0, 1], got " + std::to_string(sensitivity));
        }
    }
}

std::string Usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "\n"
        << "Options:\n"
        << "  --config <file>         JSON config file\n"
        << "  --buffer-seconds <n>    Seconds of audio history to keep, 1..3600 (default 60)\n"
        << "  --output-dir <dir>      Directory for saved recordings (default captures)\n"
        << "  --address <host>        HTTP bind address (default 127.0.0.1)\n"
        << "  --port <n>              HTTP port (default 8000)\n"
        << "  --access-key <key>      Picovoice access key (PICOVOICE_ACCESS_KEY)\n"
        << "  --model-path <file>     Porcupine model parameters (PORCUPINE_MODEL_PATH)\n"
        << "  --keyword-path <file>   Porcupine keyword file, repeatable (PORCUPINE_KEYWORD_PATHS)\n"
        << "  --sensitivity <0..1>    Sensitivity per keyword, repeatable (PORCUPINE_SENSITIVITIES)\n"
        << "  --list-devices          Print audio input devices and exit\n"
        << "  -h, --help              Show this help\n"
        << "\n"
        << "Commands: POST /start, POST /stop, POST /save, POST /halt, GET /status\n";
    return oss.str();
}

} // namespace wakecap
