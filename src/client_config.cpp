/**
 * netsdr-client
 */

#include "client_config.hpp"

#include <fstream>

#include "nlohmann/json.hpp"

#include "log.hpp"

bool load_client_config(const std::string &path, ClientConfig *config) {
    if (config == nullptr) {
        LERROR(ClientConfig) << "Error nullptr";
        return false;
    }
    std::ifstream file(path);
    if (!file.is_open()) {
        LERROR(ClientConfig) << "Failed to open config file " << path;
        return false;
    }

    ClientConfig loaded = *config;
    try {
        nlohmann::json config_json = nlohmann::json::parse(file);
        if (!config_json.is_object()) {
            LERROR(ClientConfig) << "Config file " << path << " does not hold a JSON object";
            return false;
        }
        if (config_json.contains("host")) {
            loaded.host = config_json.at("host").get<std::string>();
        }
        if (config_json.contains("tcp_port")) {
            loaded.tcp_port = config_json.at("tcp_port").get<uint32_t>();
        }
        if (config_json.contains("udp_port")) {
            loaded.udp_port = config_json.at("udp_port").get<uint32_t>();
        }
        if (config_json.contains("request_timeout_ms")) {
            loaded.request_timeout_ms = config_json.at("request_timeout_ms").get<uint32_t>();
        }
        if (config_json.contains("sample_bits")) {
            loaded.sample_bits = config_json.at("sample_bits").get<uint16_t>();
        }
        if (config_json.contains("max_pending_datagrams")) {
            loaded.max_pending_datagrams = config_json.at("max_pending_datagrams").get<uint32_t>();
        }
        if (config_json.contains("log_level")) {
            loaded.log_level = config_json.at("log_level").get<uint8_t>();
        }
    } catch (nlohmann::json::exception &e) {
        LERROR(ClientConfig) << "Exception in json : " << e.what();
        return false;
    }

    if (loaded.tcp_port > 0xFFFF || loaded.udp_port > 0xFFFF) {
        LERROR(ClientConfig) << "Port out of range in " << path;
        return false;
    }
    if (loaded.sample_bits == 0 || loaded.sample_bits > 32) {
        LERROR(ClientConfig) << "sample_bits must be within 1..32, got " << loaded.sample_bits;
        return false;
    }
    if (loaded.log_level > LOG_ERROR) {
        LERROR(ClientConfig) << "log_level must be within 0..4, got " << static_cast<uint32_t>(loaded.log_level);
        return false;
    }

    *config = loaded;
    LDEBUG(ClientConfig) << "Loaded config from " << path;
    return true;
}
