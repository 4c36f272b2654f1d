/**
 * netsdr-client
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

// 3-bit message kind carried in the top bits of the frame header.
// CURRENT_CONTROL_ITEM is "request current value" from the host and "current value" from the device.
enum MessageType : uint8_t {
    MSG_SET_CONTROL_ITEM = 0,
    MSG_CURRENT_CONTROL_ITEM,
    MSG_CONTROL_ITEM_RANGE,
    MSG_ACK,
    MSG_DATA_ITEM_0,
    MSG_DATA_ITEM_1,
    MSG_DATA_ITEM_2,
    MSG_DATA_ITEM_3
};

enum ControlItemCode : int16_t {
    ITEM_NONE = 0,
    ITEM_TARGET_NAME = 0x0001,
    ITEM_SERIAL_NUMBER = 0x0002,
    ITEM_INTERFACE_VERSION = 0x0003,
    ITEM_STATUS = 0x0005,
    ITEM_RECEIVER_STATE = 0x0018,
    ITEM_RECEIVER_FREQUENCY = 0x0020,
    ITEM_RF_GAIN = 0x0038,
    ITEM_RF_FILTER = 0x0044,
    ITEM_AD_MODES = 0x008A,
    ITEM_IQ_OUTPUT_SAMPLE_RATE = 0x00B8,
    ITEM_DATA_OUTPUT_PACKET_SIZE = 0x00C4
};

struct FrameHeader {
    MessageType message_type = MSG_SET_CONTROL_ITEM;
    // total frame size in bytes, header included
    uint16_t frame_length = 0;
};

const size_t kHeaderLength = 2;
const size_t kControlItemLength = 2;
const size_t kSequenceNumberLength = 2;
const size_t kMaxMessageLength = 8191;
// data items of this size are sent with a zero length field
const size_t kMaxDataItemMessageLength = 8194;

inline bool is_data_item(MessageType type) { return type >= MSG_DATA_ITEM_0; }

bool is_known_control_item(uint16_t code);

const char *message_type_name(MessageType type);

const char *control_item_name(ControlItemCode code);
