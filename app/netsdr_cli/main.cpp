/**
 * netsdr-client
 */

#include <unistd.h>

#include <iostream>
#include <memory>
#include <string>

#include "CLI/CLI.hpp"

#include "client_config.hpp"
#include "failure_handle.hpp"
#include "helpers.hpp"
#include "log.hpp"
#include "netsdr_client.hpp"
#include "tcp_client.hpp"
#include "udp_client.hpp"
#include "version.hpp"

namespace {

bool print_control_item(NetSdrClient *client, const std::string &item, uint8_t channel) {
    if (item == "target_name") {
        TargetNameItem current;
        if (!client->request_control_item(&current)) {
            return false;
        }
        std::cout << "target_name: " << current.name << std::endl;
    } else if (item == "frequency") {
        ReceiverFrequencyItem current;
        current.channel = channel;
        if (!client->request_control_item(&current)) {
            return false;
        }
        std::cout << "frequency: " << current.frequency_hz << " Hz, channel " << static_cast<uint32_t>(current.channel)
                  << std::endl;
    } else if (item == "sample_rate") {
        IqSampleRateItem current;
        current.channel = channel;
        if (!client->request_control_item(&current)) {
            return false;
        }
        std::cout << "sample_rate: " << current.sample_rate_hz << " Hz" << std::endl;
    } else if (item == "rf_filter") {
        RfFilterItem current;
        current.channel = channel;
        if (!client->request_control_item(&current)) {
            return false;
        }
        std::cout << "rf_filter: mode " << static_cast<uint32_t>(current.mode) << std::endl;
    } else if (item == "ad_modes") {
        AdModesItem current;
        current.channel = channel;
        if (!client->request_control_item(&current)) {
            return false;
        }
        std::cout << "ad_modes: " << static_cast<uint32_t>(current.mode) << std::endl;
    } else if (item == "receiver_state") {
        ReceiverStateItem current;
        if (!client->request_control_item(&current)) {
            return false;
        }
        std::cout << "receiver_state: " << (current.run_state == ReceiverStateItem::kRun ? "run" : "idle")
                  << std::endl;
    } else {
        LERROR(netsdr_cli) << "Unknown item " << item;
        return false;
    }
    return true;
}

}  // namespace

int main(int argc, char **argv) {
    InitFailureHandle();
    CLI::App app{"netsdr_cli: control and IQ streaming client for NetSDR receivers, version " NETSDR_CLIENT_VERSION};

    std::string config_path;
    app.add_option("--config", config_path, "json config file, flags below override its values");
    std::string host;
    app.add_option("--host", host, "address of the receiver, default: 127.0.0.1");
    uint32_t tcp_port = 0;
    app.add_option("--port", tcp_port, "tcp control port, default: 50000")->check(CLI::Range(1, 65535));
    uint32_t udp_port = 0;
    app.add_option("--udp_port", udp_port, "udp data port, default: 60000")->check(CLI::Range(0, 65535));
    int32_t log_level = -1;
    app.add_option("--log_level", log_level, "0 trace .. 4 error, default: 2")->check(CLI::Range(0, 4));
    app.require_subcommand(1);

    CLI::App *subcom_frequency = app.add_subcommand("frequency", "change receiver frequency");
    int64_t frequency_hz = 0;
    uint32_t frequency_channel = 0;
    subcom_frequency->add_option("--hz", frequency_hz, "frequency in Hz")->required();
    subcom_frequency->add_option("--channel", frequency_channel, "receiver channel, default: 0")
        ->check(CLI::Range(0, 255));

    CLI::App *subcom_stream = app.add_subcommand("stream", "stream IQ data and print statistics");
    uint32_t stream_seconds = 5;
    subcom_stream->add_option("--seconds", stream_seconds, "streaming duration, default: 5");

    CLI::App *subcom_get = app.add_subcommand("get", "request current value of a control item");
    std::string get_item;
    uint32_t get_channel = 0;
    subcom_get
        ->add_option("--item", get_item,
                     "one of target_name, frequency, sample_rate, rf_filter, ad_modes, receiver_state")
        ->required();
    subcom_get->add_option("--channel", get_channel, "receiver channel, default: 0")->check(CLI::Range(0, 255));

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    ClientConfig config;
    if (!config_path.empty() && !load_client_config(config_path, &config)) {
        return 1;
    }
    if (!host.empty()) {
        config.host = host;
    }
    if (tcp_port != 0) {
        config.tcp_port = tcp_port;
    }
    if (app.count("--udp_port") > 0) {
        config.udp_port = udp_port;
    }
    if (log_level >= 0) {
        config.log_level = static_cast<uint8_t>(log_level);
    }
    g_log_manager.SetLogLevel(config.log_level);

    std::shared_ptr<TcpClient> tcp_client = std::make_shared<TcpClient>(config.host, config.tcp_port);
    std::shared_ptr<UdpClient> udp_client = std::make_shared<UdpClient>(config.udp_port);
    NetSdrClient client(tcp_client, udp_client);
    client.set_request_timeout(config.request_timeout_ms);
    client.set_max_pending_datagrams(config.max_pending_datagrams);
    if (!client.set_sample_bits(config.sample_bits)) {
        return 1;
    }
    if (!client.connect()) {
        std::cerr << "Failed to connect to " << config.host << ":" << config.tcp_port << std::endl;
        return 1;
    }

    int ret = 0;
    if (subcom_frequency->parsed()) {
        std::vector<uint8_t> response;
        if (client.change_frequency(frequency_hz, static_cast<uint8_t>(frequency_channel), &response)) {
            std::cout << to_hex_string(response) << std::endl;
        } else {
            ret = 1;
        }
    }

    if (subcom_stream->parsed()) {
        client.subscribe_samples([](const IqPacket &packet) {
            LTRACE(netsdr_cli) << "Packet " << packet.sequence_number << " with " << packet.samples.size()
                               << " samples";
        });
        client.start_iq();
        for (uint32_t i = 0; i < stream_seconds && client.is_connected(); ++i) {
            sleep(1);
            IqStats stats = client.iq_stats();
            std::cout << "packets " << stats.packets << ", samples " << stats.samples << ", malformed "
                      << stats.malformed << ", sequence gaps " << stats.sequence_gaps << ", dropped " << stats.dropped
                      << std::endl;
        }
        client.stop_iq();
    }

    if (subcom_get->parsed()) {
        if (!print_control_item(&client, get_item, static_cast<uint8_t>(get_channel))) {
            ret = 1;
        }
    }

    client.disconnect();
    return ret;
}
