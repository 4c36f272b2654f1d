/**
 * netsdr-client
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#include <iterator>
#include <vector>

#include "frame.hpp"

/**
 * A decoded frame. item_code is ITEM_NONE for data items, sequence_number is only meaningful for them.
 */
struct NetSdrMessage {
    MessageType type = MSG_SET_CONTROL_ITEM;
    ControlItemCode item_code = ITEM_NONE;
    uint16_t sequence_number = 0;
    std::vector<uint8_t> body;
};

/**
 * Packs (type << 13) | (msg_length + header) as two little-endian bytes.
 * Throws std::invalid_argument when the frame would not fit in the 13-bit length field.
 */
std::vector<uint8_t> get_header(MessageType type, size_t msg_length);

// Needs at least kHeaderLength bytes.
bool translate_header(const uint8_t *data, size_t size, FrameHeader *header);

std::vector<uint8_t> get_control_item_message(MessageType type,
                                              ControlItemCode item_code,
                                              const std::vector<uint8_t> &parameters);

std::vector<uint8_t> get_data_item_message(MessageType type, const std::vector<uint8_t> &parameters);

/**
 * Never throws on malformed input. Returns false when the frame is truncated, its size differs from the
 * declared length, or it addresses an unknown control item. msg is filled as far as decoding got.
 */
bool translate_message(const std::vector<uint8_t> &frame, NetSdrMessage *msg);

/**
 * Samples packed back to back in a body, lowest bits first, each zero-extended to 32 bits.
 * Values are computed while iterating; the sequence keeps its own copy of the body.
 */
class SampleSequence {
 public:
    class iterator {
     public:
        using iterator_category = std::input_iterator_tag;
        using value_type = int32_t;
        using difference_type = std::ptrdiff_t;
        using pointer = const int32_t *;
        using reference = int32_t;

        iterator(const SampleSequence *sequence, size_t index) : sequence_(sequence), index_(index) {}

        int32_t operator*() const { return sequence_->at(index_); }
        iterator &operator++() {
            ++index_;
            return *this;
        }
        iterator operator++(int) {
            iterator prev = *this;
            ++index_;
            return prev;
        }
        bool operator==(const iterator &other) const {
            return sequence_ == other.sequence_ && index_ == other.index_;
        }
        bool operator!=(const iterator &other) const { return !(*this == other); }

     private:
        const SampleSequence *sequence_;
        size_t index_;
    };

    SampleSequence(uint16_t sample_bits, std::vector<uint8_t> body);

    iterator begin() const { return iterator(this, 0); }
    iterator end() const { return iterator(this, count_); }
    size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }

    int32_t at(size_t index) const;
    std::vector<int32_t> to_vector() const;

 private:
    uint16_t sample_bits_;
    std::vector<uint8_t> body_;
    size_t count_;
};

/**
 * Throws std::out_of_range when sample_bits is 0 or larger than 32.
 */
SampleSequence get_samples(uint16_t sample_bits, std::vector<uint8_t> body);
