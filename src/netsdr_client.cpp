/**
 * netsdr-client
 */

#include "netsdr_client.hpp"

#include <chrono>
#include <exception>
#include <shared_mutex>
#include <utility>

namespace {

const char *const kNoConnectionNotice = "No active connection.";

// the device counts 0 once after start, then 1..65535 and around again
uint16_t next_sequence_number(uint16_t sequence_number) {
    return sequence_number == 0xFFFF ? 1 : static_cast<uint16_t>(sequence_number + 1);
}

}  // namespace

NetSdrClient::NetSdrClient(std::shared_ptr<ITcpClient> tcp_client, std::shared_ptr<IUdpClient> udp_client)
    : tcp_client_(std::move(tcp_client)), udp_client_(std::move(udp_client)) {
    tcp_client_->set_message_handler([this](const std::vector<uint8_t> &frame) {
        if (control_queue_.push(frame) != QUEUE_PUSHED) {
            LDEBUG(NetSdrClient) << "Control queue closed, dropping frame";
        }
    });
    udp_client_->set_message_handler([this](const std::vector<uint8_t> &frame) {
        QueuePushResult ret = data_queue_.push(frame);
        if (ret == QUEUE_FULL) {
            std::lock_guard<std::mutex> lock(stats_mtx_);
            if (stats_.dropped++ == 0) {
                LWARN(NetSdrClient) << "Data queue full, dropping datagrams";
            }
        } else if (ret == QUEUE_CLOSED) {
            LDEBUG(NetSdrClient) << "Data queue closed, dropping datagram";
        }
    });
    control_worker_ = std::make_shared<std::thread>(&NetSdrClient::control_worker, this);
    data_worker_ = std::make_shared<std::thread>(&NetSdrClient::data_worker, this);
}

NetSdrClient::~NetSdrClient() {
    // both calls join the transport reader threads
    if (iq_started_.exchange(false)) {
        udp_client_->stop_listening();
    }
    tcp_client_->disconnect();
    tcp_client_->set_message_handler(nullptr);
    udp_client_->set_message_handler(nullptr);
    control_queue_.close();
    data_queue_.close();
    if (control_worker_ != nullptr && control_worker_->joinable()) {
        control_worker_->join();
    }
    if (data_worker_ != nullptr && data_worker_->joinable()) {
        data_worker_->join();
    }
}

bool NetSdrClient::connect() {
    if (tcp_client_->connected()) {
        LDEBUG(NetSdrClient) << "Already connected";
        return true;
    }
    tcp_client_->connect();
    if (!tcp_client_->connected()) {
        LERROR(NetSdrClient) << "Failed to connect to the receiver";
        return false;
    }

    IqSampleRateItem sample_rate;
    if (!set_control_item<IqSampleRateItem>(sample_rate, nullptr)) {
        LWARN(NetSdrClient) << "No reply to IQ output sample rate setup";
    }
    RfFilterItem rf_filter;
    if (!set_control_item<RfFilterItem>(rf_filter, nullptr)) {
        LWARN(NetSdrClient) << "No reply to RF filter setup";
    }
    AdModesItem ad_modes;
    if (!set_control_item<AdModesItem>(ad_modes, nullptr)) {
        LWARN(NetSdrClient) << "No reply to A/D modes setup";
    }
    return tcp_client_->connected();
}

void NetSdrClient::disconnect() {
    if (iq_started_.exchange(false)) {
        udp_client_->stop_listening();
    }
    tcp_client_->disconnect();
}

void NetSdrClient::start_iq() {
    if (!tcp_client_->connected()) {
        LINFO(NetSdrClient) << kNoConnectionNotice;
        return;
    }
    if (!set_control_item<ReceiverStateItem>(ReceiverStateItem::start_iq(), nullptr)) {
        LWARN(NetSdrClient) << "No reply to IQ start";
    }
    {
        std::lock_guard<std::mutex> lock(stats_mtx_);
        has_last_sequence_ = false;
    }
    if (!udp_client_->start_listening()) {
        LERROR(NetSdrClient) << "Failed to start listening for IQ data";
        if (!set_control_item<ReceiverStateItem>(ReceiverStateItem::stop_iq(), nullptr)) {
            LWARN(NetSdrClient) << "No reply to IQ stop";
        }
        return;
    }
    iq_started_.store(true);
    LINFO(NetSdrClient) << "IQ started";
}

void NetSdrClient::stop_iq() {
    if (!tcp_client_->connected()) {
        LINFO(NetSdrClient) << kNoConnectionNotice;
        return;
    }
    if (!set_control_item<ReceiverStateItem>(ReceiverStateItem::stop_iq(), nullptr)) {
        LWARN(NetSdrClient) << "No reply to IQ stop";
    }
    udp_client_->stop_listening();
    iq_started_.store(false);
    LINFO(NetSdrClient) << "IQ stopped";
}

bool NetSdrClient::change_frequency(int64_t frequency_hz, uint8_t channel, std::vector<uint8_t> *response) {
    if (response != nullptr) {
        response->clear();
    }
    ReceiverFrequencyItem item;
    item.channel = channel;
    item.frequency_hz = frequency_hz;
    if (!item.is_valid()) {
        LERROR(NetSdrClient) << "Frequency " << frequency_hz << " Hz is out of range";
        return false;
    }

    std::vector<uint8_t> parameters;
    item.serialize(&parameters);
    std::vector<uint8_t> reply;
    if (!send_request(get_control_item_message(MSG_SET_CONTROL_ITEM, ReceiverFrequencyItem::code, parameters),
                      &reply)) {
        return false;
    }
    NetSdrMessage msg;
    if (!translate_message(reply, &msg)) {
        LWARN(NetSdrClient) << "Undecodable reply to frequency change : " << to_hex_string(reply);
        return true;
    }
    if (msg.item_code != ReceiverFrequencyItem::code) {
        LWARN(NetSdrClient) << "Reply for " << control_item_name(msg.item_code) << " does not match frequency change";
        return false;
    }
    if (response != nullptr) {
        *response = std::move(msg.body);
    }
    return true;
}

bool NetSdrClient::send_request(const std::vector<uint8_t> &frame, std::vector<uint8_t> *reply) {
    if (reply != nullptr) {
        reply->clear();
    }
    if (!tcp_client_->connected()) {
        LINFO(NetSdrClient) << kNoConnectionNotice;
        return false;
    }

    std::lock_guard<std::mutex> request_lock(request_mtx_);
    std::future<std::vector<uint8_t> > reply_future;
    {
        std::lock_guard<std::mutex> lock(pending_mtx_);
        pending_.reset(new std::promise<std::vector<uint8_t> >());
        reply_future = pending_->get_future();
    }

    try {
        tcp_client_->send(frame);
    } catch (const std::exception &e) {
        LERROR(NetSdrClient) << "Failed to send request : " << e.what();
        clear_pending();
        throw;
    }
    LTRACE(NetSdrClient) << "Request sent : " << to_hex_string(frame);

    uint32_t timeout_ms = request_timeout_ms_.load();
    if (timeout_ms == 0) {
        reply_future.wait();
    } else if (reply_future.wait_for(std::chrono::milliseconds(timeout_ms)) != std::future_status::ready) {
        LWARN(NetSdrClient) << "No reply within " << timeout_ms << " ms";
        clear_pending();
        return false;
    }

    std::vector<uint8_t> data = reply_future.get();
    LTRACE(NetSdrClient) << "Reply received : " << to_hex_string(data);
    if (reply != nullptr) {
        *reply = std::move(data);
    }
    return true;
}

void NetSdrClient::subscribe_samples(std::function<void(const IqPacket &)> callback) {
    std::unique_lock<std::shared_mutex> lock(subscribers_mtx_);
    sample_subscribers_.push_back(std::move(callback));
}

IqStats NetSdrClient::iq_stats() const {
    std::lock_guard<std::mutex> lock(stats_mtx_);
    return stats_;
}

bool NetSdrClient::set_sample_bits(uint16_t bits) {
    if (bits == 0 || bits > 32) {
        LERROR(NetSdrClient) << "Invalid sample size " << bits << " bits";
        return false;
    }
    sample_bits_.store(bits);
    return true;
}

void NetSdrClient::clear_pending() {
    std::lock_guard<std::mutex> lock(pending_mtx_);
    pending_.reset();
}

void NetSdrClient::control_worker() {
    std::vector<uint8_t> frame;
    while (control_queue_.pop(&frame)) {
        bool correlated = false;
        {
            std::lock_guard<std::mutex> lock(pending_mtx_);
            if (pending_ != nullptr) {
                pending_->set_value(frame);
                pending_.reset();
                correlated = true;
            }
        }
        if (!correlated) {
            handle_unsolicited(frame);
        }
    }
    LDEBUG(NetSdrClient) << "Control worker exits";
}

void NetSdrClient::data_worker() {
    std::vector<uint8_t> frame;
    while (data_queue_.pop(&frame)) {
        handle_iq_datagram(frame);
    }
    LDEBUG(NetSdrClient) << "Data worker exits";
}

void NetSdrClient::handle_unsolicited(const std::vector<uint8_t> &frame) {
    NetSdrMessage msg;
    if (!translate_message(frame, &msg)) {
        LWARN(NetSdrClient) << "Undecodable unsolicited message : " << to_hex_string(frame);
        return;
    }
    LINFO(NetSdrClient) << "Unsolicited message - Type: " << message_type_name(msg.type)
                        << ", Code: " << control_item_name(msg.item_code) << ", Sequence: " << msg.sequence_number;
    switch (msg.type) {
        case MSG_ACK:
            LINFO(NetSdrClient) << "Acknowledgment received: " << to_hex_string(msg.body);
            break;
        case MSG_DATA_ITEM_0:
        case MSG_DATA_ITEM_1:
        case MSG_DATA_ITEM_2:
        case MSG_DATA_ITEM_3:
            LINFO(NetSdrClient) << "Data item update: " << to_hex_string(msg.body);
            break;
        case MSG_CURRENT_CONTROL_ITEM:
            LINFO(NetSdrClient) << "Current control item: " << control_item_name(msg.item_code) << " "
                                << to_hex_string(msg.body);
            break;
        default:
            LINFO(NetSdrClient) << "Other unsolicited message type: " << message_type_name(msg.type);
            break;
    }
}

void NetSdrClient::handle_iq_datagram(const std::vector<uint8_t> &frame) {
    NetSdrMessage msg;
    if (!translate_message(frame, &msg) || !is_data_item(msg.type)) {
        LWARN(NetSdrClient) << "Dropping malformed IQ datagram of " << frame.size() << " bytes";
        std::lock_guard<std::mutex> lock(stats_mtx_);
        ++stats_.malformed;
        return;
    }

    IqPacket packet;
    packet.type = msg.type;
    packet.sequence_number = msg.sequence_number;
    packet.samples = get_samples(sample_bits_.load(), std::move(msg.body)).to_vector();

    {
        std::lock_guard<std::mutex> lock(stats_mtx_);
        ++stats_.packets;
        stats_.samples += packet.samples.size();
        if (has_last_sequence_ && packet.sequence_number != 0 &&
            packet.sequence_number != next_sequence_number(last_sequence_)) {
            ++stats_.sequence_gaps;
            LDEBUG(NetSdrClient) << "Sequence gap, expected " << next_sequence_number(last_sequence_) << " got "
                                 << packet.sequence_number;
        }
        has_last_sequence_ = true;
        last_sequence_ = packet.sequence_number;
    }

    std::shared_lock<std::shared_mutex> lock(subscribers_mtx_);
    for (auto &callback : sample_subscribers_) {
        callback(packet);
    }
}
