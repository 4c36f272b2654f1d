/**
 * netsdr-client
 */

#pragma once

#include <stdint.h>

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <vector>

#include "control_item.hpp"
#include "frame.hpp"
#include "helpers.hpp"
#include "log.hpp"
#include "message.hpp"
#include "message_queue.hpp"
#include "transport.hpp"

struct IqPacket {
    MessageType type = MSG_DATA_ITEM_0;
    uint16_t sequence_number = 0;
    std::vector<int32_t> samples;
};

struct IqStats {
    uint64_t packets = 0;
    uint64_t samples = 0;
    uint64_t malformed = 0;
    uint64_t sequence_gaps = 0;
    // datagrams dropped because the data queue was full
    uint64_t dropped = 0;
};

/**
 * Protocol client of a NetSDR receiver.
 *
 * Requests travel on the TCP command channel and are correlated with the next inbound frame, one request
 * at a time. IQ data arrives on the UDP channel while streaming is on and is handed to sample subscribers.
 * Inbound frames of both channels are queued by the transport threads and consumed by the client's own
 * workers.
 */
class NetSdrClient {
 public:
    static constexpr size_t kDefaultMaxPendingDatagrams = 1024;

    NetSdrClient(std::shared_ptr<ITcpClient> tcp_client, std::shared_ptr<IUdpClient> udp_client);
    ~NetSdrClient();

    NetSdrClient(const NetSdrClient &) = delete;
    NetSdrClient &operator=(const NetSdrClient &) = delete;

    // Connects when not connected yet and sends the receiver setup items. Returns whether the command
    // channel is connected.
    bool connect();
    void disconnect();

    void start_iq();
    void stop_iq();

    // response receives the body of the reply. Returns false when nothing was sent, the send timed out, the
    // reply names another control item, or the frequency does not fit in 40 bits.
    bool change_frequency(int64_t frequency_hz, uint8_t channel, std::vector<uint8_t> *response);

    // Sends a complete frame and waits for the next inbound control frame. Transport exceptions propagate.
    bool send_request(const std::vector<uint8_t> &frame, std::vector<uint8_t> *reply);

    template <typename ItemT>
    bool set_control_item(const ItemT &item, ItemT *current);

    template <typename ItemT>
    bool request_control_item(ItemT *current);

    void subscribe_samples(std::function<void(const IqPacket &)> callback);

    IqStats iq_stats() const;
    bool is_iq_started() const { return iq_started_.load(); }
    bool is_connected() const { return tcp_client_->connected(); }

    // false when bits is not within 1..32
    bool set_sample_bits(uint16_t bits);
    // 0 waits forever
    void set_request_timeout(uint32_t timeout_ms) { request_timeout_ms_.store(timeout_ms); }
    // Datagrams waiting for decoding beyond this count are dropped and counted. 0 does not bound them.
    void set_max_pending_datagrams(size_t max_datagrams) { data_queue_.set_capacity(max_datagrams); }

 private:
    template <typename ItemT>
    bool query_item(MessageType type, const std::vector<uint8_t> &parameters, ItemT *current);

    void control_worker();
    void data_worker();
    void handle_unsolicited(const std::vector<uint8_t> &frame);
    void handle_iq_datagram(const std::vector<uint8_t> &frame);
    void clear_pending();

    std::shared_ptr<ITcpClient> tcp_client_;
    std::shared_ptr<IUdpClient> udp_client_;

    std::atomic<bool> iq_started_{false};
    std::atomic<uint16_t> sample_bits_{16};
    std::atomic<uint32_t> request_timeout_ms_{2000};

    // serializes correlated requests
    std::mutex request_mtx_;
    std::unique_ptr<std::promise<std::vector<uint8_t> > > pending_;
    std::mutex pending_mtx_;

    MessageQueue<std::vector<uint8_t> > control_queue_;
    MessageQueue<std::vector<uint8_t> > data_queue_{kDefaultMaxPendingDatagrams};
    std::shared_ptr<std::thread> control_worker_;
    std::shared_ptr<std::thread> data_worker_;

    std::vector<std::function<void(const IqPacket &)> > sample_subscribers_;
    std::shared_mutex subscribers_mtx_;

    IqStats stats_;
    bool has_last_sequence_ = false;
    uint16_t last_sequence_ = 0;
    mutable std::mutex stats_mtx_;
};

template <typename ItemT>
bool NetSdrClient::set_control_item(const ItemT &item, ItemT *current) {
    std::vector<uint8_t> parameters;
    item.serialize(&parameters);
    return query_item(MSG_SET_CONTROL_ITEM, parameters, current);
}

template <typename ItemT>
bool NetSdrClient::request_control_item(ItemT *current) {
    if (current == nullptr) {
        LERROR(NetSdrClient) << "Error nullptr";
        return false;
    }
    std::vector<uint8_t> parameters;
    current->serialize_query(&parameters);
    return query_item(MSG_CURRENT_CONTROL_ITEM, parameters, current);
}

template <typename ItemT>
bool NetSdrClient::query_item(MessageType type, const std::vector<uint8_t> &parameters, ItemT *current) {
    std::vector<uint8_t> reply;
    if (!send_request(get_control_item_message(type, ItemT::code, parameters), &reply)) {
        return false;
    }
    if (current == nullptr) {
        return true;
    }
    NetSdrMessage msg;
    if (!translate_message(reply, &msg)) {
        LWARN(NetSdrClient) << "Undecodable reply to " << control_item_name(ItemT::code) << " : "
                            << to_hex_string(reply);
        return false;
    }
    if (msg.item_code != ItemT::code) {
        LWARN(NetSdrClient) << "Reply addresses " << control_item_name(msg.item_code) << " instead of "
                            << control_item_name(ItemT::code);
        return false;
    }
    if (!current->deserialize(msg.body)) {
        LWARN(NetSdrClient) << "Invalid " << control_item_name(ItemT::code) << " body : " << to_hex_string(msg.body);
        return false;
    }
    return true;
}
