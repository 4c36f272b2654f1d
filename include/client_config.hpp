/**
 * netsdr-client
 */

#pragma once

#include <stdint.h>

#include <string>

struct ClientConfig {
    std::string host = "127.0.0.1";
    uint32_t tcp_port = 50000;
    uint32_t udp_port = 60000;
    // 0 waits forever
    uint32_t request_timeout_ms = 2000;
    uint16_t sample_bits = 16;
    // 0 does not bound the data queue
    uint32_t max_pending_datagrams = 1024;
    uint8_t log_level = 2;
};

/**
 * Reads a JSON object holding any subset of the ClientConfig keys, e.g.
 * {"host": "192.168.1.20", "tcp_port": 50000, "request_timeout_ms": 500}
 * Keys that are absent keep their current value. Returns false on I/O, JSON or range errors.
 */
bool load_client_config(const std::string &path, ClientConfig *config);
