/**
 * netsdr-client
 */

#include <doctest/doctest.h>

#include <stdexcept>
#include <vector>

#include "control_item.hpp"
#include "frame.hpp"
#include "message.hpp"

namespace {

uint16_t header_value(const std::vector<uint8_t> &frame) {
    return static_cast<uint16_t>(frame[0] | (frame[1] << 8));
}

std::vector<uint8_t> counting_bytes(size_t size) {
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>(i * 7 + 3);
    }
    return data;
}

}  // namespace

TEST_CASE("Control item message carries header, item code and parameters") {
    std::vector<uint8_t> parameters = counting_bytes(7500);
    std::vector<uint8_t> frame = get_control_item_message(MSG_SET_CONTROL_ITEM, ITEM_RECEIVER_FREQUENCY, parameters);

    REQUIRE(frame.size() == 7504);
    uint16_t header = header_value(frame);
    CHECK((header >> 13) == MSG_SET_CONTROL_ITEM);
    CHECK((header & 0x1FFF) == frame.size());
    CHECK(frame[2] == 0x20);
    CHECK(frame[3] == 0x00);
    CHECK(std::vector<uint8_t>(frame.begin() + 4, frame.end()) == parameters);

    NetSdrMessage msg;
    REQUIRE(translate_message(frame, &msg));
    CHECK(msg.type == MSG_SET_CONTROL_ITEM);
    CHECK(msg.item_code == ITEM_RECEIVER_FREQUENCY);
    CHECK(msg.sequence_number == 0);
    CHECK(msg.body == parameters);
}

TEST_CASE("Data item message has no item code and decodes a sequence number") {
    std::vector<uint8_t> parameters = counting_bytes(7500);
    std::vector<uint8_t> frame = get_data_item_message(MSG_DATA_ITEM_2, parameters);

    REQUIRE(frame.size() == 7502);
    CHECK(header_value(frame) == 56654);

    NetSdrMessage msg;
    REQUIRE(translate_message(frame, &msg));
    CHECK(msg.type == MSG_DATA_ITEM_2);
    CHECK(msg.item_code == ITEM_NONE);
    CHECK(msg.sequence_number == static_cast<uint16_t>(parameters[0] | (parameters[1] << 8)));
    CHECK(msg.body.size() == parameters.size() - 2);
    CHECK(msg.body == std::vector<uint8_t>(parameters.begin() + 2, parameters.end()));
}

TEST_CASE("Every message kind keeps its tag in the header") {
    for (int type = MSG_SET_CONTROL_ITEM; type <= MSG_DATA_ITEM_3; ++type) {
        MessageType message_type = static_cast<MessageType>(type);
        std::vector<uint8_t> frame = is_data_item(message_type)
                                         ? get_data_item_message(message_type, {0x01, 0x00, 0xAA})
                                         : get_control_item_message(message_type, ITEM_RECEIVER_STATE, {0xAA});
        CAPTURE(type);
        CHECK((header_value(frame) >> 13) == type);
        CHECK((header_value(frame) & 0x1FFF) == frame.size());

        NetSdrMessage msg;
        REQUIRE(translate_message(frame, &msg));
        CHECK(msg.type == message_type);
        CHECK(msg.body == std::vector<uint8_t>{0xAA});
    }
}

TEST_CASE("Largest data item is sent with a zero length field") {
    std::vector<uint8_t> parameters = counting_bytes(8192);
    std::vector<uint8_t> frame = get_data_item_message(MSG_DATA_ITEM_0, parameters);

    REQUIRE(frame.size() == 8194);
    CHECK(frame[0] == 0x00);
    CHECK(frame[1] == 0x80);

    FrameHeader header;
    REQUIRE(translate_header(frame.data(), frame.size(), &header));
    CHECK(header.message_type == MSG_DATA_ITEM_0);
    CHECK(header.frame_length == 8194);

    NetSdrMessage msg;
    REQUIRE(translate_message(frame, &msg));
    CHECK(msg.body.size() == 8190);
}

TEST_CASE("Frames beyond the 13-bit length field are rejected when built") {
    CHECK_NOTHROW(get_control_item_message(MSG_SET_CONTROL_ITEM, ITEM_TARGET_NAME, std::vector<uint8_t>(8187)));
    CHECK_THROWS_AS(get_control_item_message(MSG_SET_CONTROL_ITEM, ITEM_TARGET_NAME, std::vector<uint8_t>(8188)),
                    std::invalid_argument);
    CHECK_THROWS_AS(get_data_item_message(MSG_DATA_ITEM_1, std::vector<uint8_t>(8193)), std::invalid_argument);
    // the 8194 exception only holds for data items
    CHECK_THROWS_AS(get_header(MSG_ACK, 8192), std::invalid_argument);
}

TEST_CASE("Malformed frames fail to translate without throwing") {
    NetSdrMessage msg;

    SUBCASE("shorter than a header") {
        CHECK_FALSE(translate_message({0x05}, &msg));
        CHECK_FALSE(translate_message({}, &msg));
    }
    SUBCASE("shorter than the declared length") {
        std::vector<uint8_t> frame = get_control_item_message(MSG_SET_CONTROL_ITEM, ITEM_RF_FILTER, {0x00, 0x00});
        frame.pop_back();
        CHECK_FALSE(translate_message(frame, &msg));
    }
    SUBCASE("longer than the declared length") {
        std::vector<uint8_t> frame = get_control_item_message(MSG_SET_CONTROL_ITEM, ITEM_RF_FILTER, {0x00, 0x00});
        frame.push_back(0xFF);
        CHECK_FALSE(translate_message(frame, &msg));
    }
    SUBCASE("control frame without an item code") {
        CHECK_FALSE(translate_message({0x02, 0x00}, &msg));
    }
    SUBCASE("data frame without a sequence number") {
        CHECK_FALSE(translate_message({0x03, 0x80, 0x01}, &msg));
    }
    SUBCASE("unknown control item code") {
        CHECK_FALSE(translate_message({0x05, 0x00, 0x34, 0x12, 0x99}, &msg));
        CHECK(msg.item_code == ITEM_NONE);
    }
}

TEST_CASE("Sixteen bit samples are little endian and zero extended") {
    SampleSequence samples = get_samples(16, {0x01, 0x02, 0x03, 0x04});
    CHECK(samples.size() == 2);
    CHECK(samples.to_vector() == std::vector<int32_t>{0x0201, 0x0403});

    std::vector<int32_t> high = get_samples(16, {0xFF, 0xFF}).to_vector();
    REQUIRE(high.size() == 1);
    CHECK(high[0] == 0xFFFF);
}

TEST_CASE("Sample widths outside 1..32 are a range error") {
    CHECK_THROWS_AS(get_samples(40, {0x01, 0x02, 0x03, 0x04, 0x05}), std::out_of_range);
    CHECK_THROWS_AS(get_samples(33, {}), std::out_of_range);
    CHECK_THROWS_AS(get_samples(0, {0x01}), std::out_of_range);
}

TEST_CASE("Empty body yields an empty finite sequence") {
    SampleSequence samples = get_samples(8, {});
    CHECK(samples.empty());
    CHECK(samples.begin() == samples.end());
    size_t visited = 0;
    for (int32_t sample : samples) {
        (void)sample;
        ++visited;
    }
    CHECK(visited == 0);
}

TEST_CASE("Odd sample widths pack lowest bits first and drop trailing bits") {
    // 0xEFCDAB read as two 12-bit values
    CHECK(get_samples(12, {0xAB, 0xCD, 0xEF}).to_vector() == std::vector<int32_t>{0xDAB, 0xEFC});
    CHECK(get_samples(16, {0x01, 0x02, 0x03}).to_vector() == std::vector<int32_t>{0x0201});
    CHECK(get_samples(1, {0x05}).to_vector() == std::vector<int32_t>{1, 0, 1, 0, 0, 0, 0, 0});
    CHECK(get_samples(24, {0x01, 0x02, 0x03, 0x04, 0x05, 0x06}).to_vector() ==
          std::vector<int32_t>{0x030201, 0x060504});

    std::vector<int32_t> wide = get_samples(32, {0xFF, 0xFF, 0xFF, 0xFF}).to_vector();
    REQUIRE(wide.size() == 1);
    CHECK(static_cast<uint32_t>(wide[0]) == 0xFFFFFFFFu);
}

TEST_CASE("Control items serialize to their wire layouts") {
    std::vector<uint8_t> data;

    ReceiverStateItem::start_iq().serialize(&data);
    CHECK(data == std::vector<uint8_t>{0x80, 0x02, 0x01, 0x01});
    ReceiverStateItem::stop_iq().serialize(&data);
    CHECK(data == std::vector<uint8_t>{0x00, 0x01, 0x00, 0x00});

    ReceiverFrequencyItem frequency;
    frequency.frequency_hz = 14010000;
    frequency.serialize(&data);
    CHECK(data == std::vector<uint8_t>{0x00, 0x90, 0xC6, 0xD5, 0x00, 0x00});
    frequency.serialize_query(&data);
    CHECK(data == std::vector<uint8_t>{0x00});

    IqSampleRateItem sample_rate;
    sample_rate.serialize(&data);
    CHECK(data == std::vector<uint8_t>{0x00, 0xA0, 0x86, 0x01, 0x00});

    RfFilterItem rf_filter;
    rf_filter.serialize(&data);
    CHECK(data == std::vector<uint8_t>{0x00, 0x00});

    AdModesItem ad_modes;
    ad_modes.serialize(&data);
    CHECK(data == std::vector<uint8_t>{0x00, 0x03});

    TargetNameItem target_name;
    target_name.name = "NetSDR";
    target_name.serialize(&data);
    CHECK(data == std::vector<uint8_t>{'N', 'e', 't', 'S', 'D', 'R', 0x00});
    target_name.serialize_query(&data);
    CHECK(data.empty());
}

TEST_CASE("Control items decode device replies") {
    ReceiverFrequencyItem frequency;
    REQUIRE(frequency.deserialize({0x01, 0x00, 0x00, 0x00, 0x00, 0x01}));
    CHECK(frequency.channel == 1);
    CHECK(frequency.frequency_hz == 0x100000000LL);
    CHECK_FALSE(frequency.deserialize({0x00, 0x01}));

    ReceiverStateItem state;
    REQUIRE(state.deserialize({0x80, 0x02, 0x01, 0x01}));
    CHECK(state.data_type == ReceiverStateItem::kComplexIqData);
    CHECK(state.run_state == ReceiverStateItem::kRun);

    TargetNameItem target_name;
    REQUIRE(target_name.deserialize({'S', 'D', 'R', 0x00, 'x'}));
    CHECK(target_name.name == "SDR");
}

TEST_CASE("Frequency range is 40 bits") {
    ReceiverFrequencyItem frequency;
    frequency.frequency_hz = 0;
    CHECK(frequency.is_valid());
    frequency.frequency_hz = ReceiverFrequencyItem::kMaxFrequencyHz;
    CHECK(frequency.is_valid());
    frequency.frequency_hz = ReceiverFrequencyItem::kMaxFrequencyHz + 1;
    CHECK_FALSE(frequency.is_valid());
    frequency.frequency_hz = -1;
    CHECK_FALSE(frequency.is_valid());
}
