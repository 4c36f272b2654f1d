/**
 * netsdr-client
 */

#include "message.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace {

uint16_t read_u16_le(const uint8_t *data) {
    return static_cast<uint16_t>(data[0]) | static_cast<uint16_t>(static_cast<uint16_t>(data[1]) << 8);
}

void append_u16_le(uint16_t value, std::vector<uint8_t> *out) {
    out->push_back(static_cast<uint8_t>(value & 0xFF));
    out->push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

}  // namespace

bool is_known_control_item(uint16_t code) {
    switch (static_cast<ControlItemCode>(code)) {
        case ITEM_NONE:
        case ITEM_TARGET_NAME:
        case ITEM_SERIAL_NUMBER:
        case ITEM_INTERFACE_VERSION:
        case ITEM_STATUS:
        case ITEM_RECEIVER_STATE:
        case ITEM_RECEIVER_FREQUENCY:
        case ITEM_RF_GAIN:
        case ITEM_RF_FILTER:
        case ITEM_AD_MODES:
        case ITEM_IQ_OUTPUT_SAMPLE_RATE:
        case ITEM_DATA_OUTPUT_PACKET_SIZE:
            return true;
    }
    return false;
}

const char *message_type_name(MessageType type) {
    switch (type) {
        case MSG_SET_CONTROL_ITEM:
            return "SetControlItem";
        case MSG_CURRENT_CONTROL_ITEM:
            return "CurrentControlItem";
        case MSG_CONTROL_ITEM_RANGE:
            return "ControlItemRange";
        case MSG_ACK:
            return "Ack";
        case MSG_DATA_ITEM_0:
            return "DataItem0";
        case MSG_DATA_ITEM_1:
            return "DataItem1";
        case MSG_DATA_ITEM_2:
            return "DataItem2";
        case MSG_DATA_ITEM_3:
            return "DataItem3";
    }
    return "Unknown";
}

const char *control_item_name(ControlItemCode code) {
    switch (code) {
        case ITEM_NONE:
            return "None";
        case ITEM_TARGET_NAME:
            return "TargetName";
        case ITEM_SERIAL_NUMBER:
            return "SerialNumber";
        case ITEM_INTERFACE_VERSION:
            return "InterfaceVersion";
        case ITEM_STATUS:
            return "Status";
        case ITEM_RECEIVER_STATE:
            return "ReceiverState";
        case ITEM_RECEIVER_FREQUENCY:
            return "ReceiverFrequency";
        case ITEM_RF_GAIN:
            return "RfGain";
        case ITEM_RF_FILTER:
            return "RfFilter";
        case ITEM_AD_MODES:
            return "AdModes";
        case ITEM_IQ_OUTPUT_SAMPLE_RATE:
            return "IqOutputSampleRate";
        case ITEM_DATA_OUTPUT_PACKET_SIZE:
            return "DataOutputPacketSize";
    }
    return "Unknown";
}

std::vector<uint8_t> get_header(MessageType type, size_t msg_length) {
    size_t length_with_header = msg_length + kHeaderLength;
    if (is_data_item(type) && length_with_header == kMaxDataItemMessageLength) {
        length_with_header = 0;
    }
    if (length_with_header > kMaxMessageLength) {
        throw std::invalid_argument("Message length " + std::to_string(msg_length + kHeaderLength) +
                                    " exceeds allowed value");
    }
    std::vector<uint8_t> header;
    header.reserve(kHeaderLength);
    append_u16_le(static_cast<uint16_t>(length_with_header | (static_cast<uint16_t>(type) << 13)), &header);
    return header;
}

bool translate_header(const uint8_t *data, size_t size, FrameHeader *header) {
    if (data == nullptr || header == nullptr || size < kHeaderLength) {
        return false;
    }
    uint16_t value = read_u16_le(data);
    header->message_type = static_cast<MessageType>(value >> 13);
    header->frame_length = static_cast<uint16_t>(value - (static_cast<uint16_t>(header->message_type) << 13));
    if (is_data_item(header->message_type) && header->frame_length == 0) {
        header->frame_length = kMaxDataItemMessageLength;
    }
    return true;
}

std::vector<uint8_t> get_control_item_message(MessageType type,
                                              ControlItemCode item_code,
                                              const std::vector<uint8_t> &parameters) {
    std::vector<uint8_t> frame = get_header(type, kControlItemLength + parameters.size());
    frame.reserve(kHeaderLength + kControlItemLength + parameters.size());
    append_u16_le(static_cast<uint16_t>(item_code), &frame);
    frame.insert(frame.end(), parameters.begin(), parameters.end());
    return frame;
}

std::vector<uint8_t> get_data_item_message(MessageType type, const std::vector<uint8_t> &parameters) {
    std::vector<uint8_t> frame = get_header(type, parameters.size());
    frame.reserve(kHeaderLength + parameters.size());
    frame.insert(frame.end(), parameters.begin(), parameters.end());
    return frame;
}

bool translate_message(const std::vector<uint8_t> &frame, NetSdrMessage *msg) {
    if (msg == nullptr) {
        return false;
    }
    *msg = NetSdrMessage();

    FrameHeader header;
    if (!translate_header(frame.data(), frame.size(), &header)) {
        return false;
    }
    msg->type = header.message_type;
    if (frame.size() != header.frame_length) {
        return false;
    }

    size_t offset = kHeaderLength;
    bool success = true;
    if (!is_data_item(header.message_type)) {
        if (frame.size() < offset + kControlItemLength) {
            return false;
        }
        uint16_t code = read_u16_le(frame.data() + offset);
        offset += kControlItemLength;
        if (is_known_control_item(code)) {
            msg->item_code = static_cast<ControlItemCode>(code);
        } else {
            success = false;
        }
    } else {
        if (frame.size() < offset + kSequenceNumberLength) {
            return false;
        }
        msg->sequence_number = read_u16_le(frame.data() + offset);
        offset += kSequenceNumberLength;
    }
    msg->body.assign(frame.begin() + offset, frame.end());
    return success;
}

SampleSequence::SampleSequence(uint16_t sample_bits, std::vector<uint8_t> body)
    : sample_bits_(sample_bits), body_(std::move(body)), count_(0) {
    if (sample_bits_ == 0 || sample_bits_ > 32) {
        throw std::out_of_range("Sample size of " + std::to_string(sample_bits_) +
                                " bits does not fit a 32-bit sample");
    }
    count_ = body_.size() * 8 / sample_bits_;
}

int32_t SampleSequence::at(size_t index) const {
    if (index >= count_) {
        throw std::out_of_range("Sample index out of range");
    }
    size_t bit_offset = index * sample_bits_;
    size_t byte_index = bit_offset / 8;
    size_t shift = bit_offset % 8;

    // at most 39 bits are spanned: up to 7 bits of skew plus a 32-bit sample
    uint64_t acc = 0;
    for (size_t k = 0; k * 8 < shift + sample_bits_ && byte_index + k < body_.size(); ++k) {
        acc |= static_cast<uint64_t>(body_[byte_index + k]) << (8 * k);
    }
    uint64_t mask = (sample_bits_ == 32) ? 0xFFFFFFFFull : ((1ull << sample_bits_) - 1);
    return static_cast<int32_t>(static_cast<uint32_t>((acc >> shift) & mask));
}

std::vector<int32_t> SampleSequence::to_vector() const {
    std::vector<int32_t> samples;
    samples.reserve(count_);
    for (int32_t sample : *this) {
        samples.push_back(sample);
    }
    return samples;
}

SampleSequence get_samples(uint16_t sample_bits, std::vector<uint8_t> body) {
    return SampleSequence(sample_bits, std::move(body));
}
