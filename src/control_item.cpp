/**
 * netsdr-client
 */

#include "control_item.hpp"

const ControlItemCode ReceiverStateItem::code = ITEM_RECEIVER_STATE;
const ControlItemCode ReceiverFrequencyItem::code = ITEM_RECEIVER_FREQUENCY;
const ControlItemCode IqSampleRateItem::code = ITEM_IQ_OUTPUT_SAMPLE_RATE;
const ControlItemCode RfFilterItem::code = ITEM_RF_FILTER;
const ControlItemCode AdModesItem::code = ITEM_AD_MODES;
const ControlItemCode TargetNameItem::code = ITEM_TARGET_NAME;

ReceiverStateItem ReceiverStateItem::start_iq() {
    ReceiverStateItem item;
    item.data_type = kComplexIqData;
    item.run_state = kRun;
    item.capture_mode = kFifo16Bit;
    item.fifo_count = 1;
    return item;
}

ReceiverStateItem ReceiverStateItem::stop_iq() {
    ReceiverStateItem item;
    item.data_type = kRealData;
    item.run_state = kIdle;
    item.capture_mode = kContiguous16Bit;
    item.fifo_count = 0;
    return item;
}

void ReceiverStateItem::serialize(std::vector<uint8_t> *data) const {
    *data = {data_type, run_state, capture_mode, fifo_count};
}

bool ReceiverStateItem::deserialize(const std::vector<uint8_t> &data) {
    if (data.size() < 4) {
        return false;
    }
    data_type = data[0];
    run_state = data[1];
    capture_mode = data[2];
    fifo_count = data[3];
    return true;
}

void ReceiverFrequencyItem::serialize(std::vector<uint8_t> *data) const {
    data->clear();
    data->push_back(channel);
    uint64_t value = static_cast<uint64_t>(frequency_hz);
    for (int i = 0; i < 5; ++i) {
        data->push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

bool ReceiverFrequencyItem::deserialize(const std::vector<uint8_t> &data) {
    if (data.size() < 6) {
        return false;
    }
    channel = data[0];
    uint64_t value = 0;
    for (int i = 0; i < 5; ++i) {
        value |= static_cast<uint64_t>(data[1 + i]) << (8 * i);
    }
    frequency_hz = static_cast<int64_t>(value);
    return true;
}

void ReceiverFrequencyItem::serialize_query(std::vector<uint8_t> *data) const { data->assign(1, channel); }

void IqSampleRateItem::serialize(std::vector<uint8_t> *data) const {
    data->clear();
    data->push_back(channel);
    for (int i = 0; i < 4; ++i) {
        data->push_back(static_cast<uint8_t>((sample_rate_hz >> (8 * i)) & 0xFF));
    }
}

bool IqSampleRateItem::deserialize(const std::vector<uint8_t> &data) {
    if (data.size() < 5) {
        return false;
    }
    channel = data[0];
    sample_rate_hz = 0;
    for (int i = 0; i < 4; ++i) {
        sample_rate_hz |= static_cast<uint32_t>(data[1 + i]) << (8 * i);
    }
    return true;
}

bool RfFilterItem::deserialize(const std::vector<uint8_t> &data) {
    if (data.size() < 2) {
        return false;
    }
    channel = data[0];
    mode = data[1];
    return true;
}

bool AdModesItem::deserialize(const std::vector<uint8_t> &data) {
    if (data.size() < 2) {
        return false;
    }
    channel = data[0];
    mode = data[1];
    return true;
}

void TargetNameItem::serialize(std::vector<uint8_t> *data) const {
    data->assign(name.begin(), name.end());
    data->push_back(0);
}

bool TargetNameItem::deserialize(const std::vector<uint8_t> &data) {
    name.clear();
    for (uint8_t c : data) {
        if (c == 0) {
            break;
        }
        name.push_back(static_cast<char>(c));
    }
    return true;
}
