/**
 * netsdr-client
 */

#pragma once

#include <stdint.h>

#include <string>
#include <vector>

#include "frame.hpp"

class ControlItemBase {
 public:
    virtual ~ControlItemBase() {}
    virtual void serialize(std::vector<uint8_t> *data) const = 0;
    virtual bool deserialize(const std::vector<uint8_t> &data) = 0;
    // parameters of a request for the current value, most items take none
    virtual void serialize_query(std::vector<uint8_t> *data) const { data->clear(); }
};

class ReceiverStateItem : public ControlItemBase {
 public:
    static const ControlItemCode code;

    static constexpr uint8_t kRealData = 0x00;
    static constexpr uint8_t kComplexIqData = 0x80;
    static constexpr uint8_t kIdle = 0x01;
    static constexpr uint8_t kRun = 0x02;
    static constexpr uint8_t kContiguous16Bit = 0x00;
    static constexpr uint8_t kFifo16Bit = 0x01;
    static constexpr uint8_t kContiguous24Bit = 0x80;

    static ReceiverStateItem start_iq();
    static ReceiverStateItem stop_iq();

 public:
    virtual void serialize(std::vector<uint8_t> *data) const override;
    virtual bool deserialize(const std::vector<uint8_t> &data) override;

 public:
    uint8_t data_type = kRealData;
    uint8_t run_state = kIdle;
    uint8_t capture_mode = kContiguous16Bit;
    uint8_t fifo_count = 0;
};

class ReceiverFrequencyItem : public ControlItemBase {
 public:
    static const ControlItemCode code;
    // frequency travels as a 40-bit unsigned value
    static constexpr int64_t kMaxFrequencyHz = 0xFFFFFFFFFFLL;

 public:
    virtual void serialize(std::vector<uint8_t> *data) const override;
    virtual bool deserialize(const std::vector<uint8_t> &data) override;
    virtual void serialize_query(std::vector<uint8_t> *data) const override;

    bool is_valid() const { return frequency_hz >= 0 && frequency_hz <= kMaxFrequencyHz; }

 public:
    uint8_t channel = 0;
    int64_t frequency_hz = 0;
};

class IqSampleRateItem : public ControlItemBase {
 public:
    static const ControlItemCode code;

 public:
    virtual void serialize(std::vector<uint8_t> *data) const override;
    virtual bool deserialize(const std::vector<uint8_t> &data) override;
    virtual void serialize_query(std::vector<uint8_t> *data) const override { data->assign(1, channel); }

 public:
    uint8_t channel = 0;
    uint32_t sample_rate_hz = 100000;
};

class RfFilterItem : public ControlItemBase {
 public:
    static const ControlItemCode code;

    static constexpr uint8_t kAutomatic = 0x00;

 public:
    virtual void serialize(std::vector<uint8_t> *data) const override { *data = {channel, mode}; }
    virtual bool deserialize(const std::vector<uint8_t> &data) override;
    virtual void serialize_query(std::vector<uint8_t> *data) const override { data->assign(1, channel); }

 public:
    uint8_t channel = 0;
    uint8_t mode = kAutomatic;
};

class AdModesItem : public ControlItemBase {
 public:
    static const ControlItemCode code;

    static constexpr uint8_t kDither = 0x01;
    static constexpr uint8_t kGain1_5 = 0x02;

 public:
    virtual void serialize(std::vector<uint8_t> *data) const override { *data = {channel, mode}; }
    virtual bool deserialize(const std::vector<uint8_t> &data) override;
    virtual void serialize_query(std::vector<uint8_t> *data) const override { data->assign(1, channel); }

 public:
    uint8_t channel = 0;
    uint8_t mode = kDither | kGain1_5;
};

class TargetNameItem : public ControlItemBase {
 public:
    static const ControlItemCode code;

 public:
    virtual void serialize(std::vector<uint8_t> *data) const override;
    virtual bool deserialize(const std::vector<uint8_t> &data) override;

 public:
    std::string name;
};
