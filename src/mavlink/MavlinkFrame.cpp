#include "skybridge/mavlink/MavlinkFrame.hpp"

namespace skybridge::mavlink {

FrameParser::FrameParser() {
    rx_status_.parse_state = MAVLINK_PARSE_STATE_IDLE;
}

void FrameParser::feed(const uint8_t* data, std::size_t len, std::vector<mavlink_message_t>& out) {
    mavlink_message_t msg;
    mavlink_status_t status;

    for (std::size_t i = 0; i < len; ++i) {
        const uint8_t r = mavlink_frame_char_buffer(&rx_msg_, &rx_status_, data[i], &msg, &status);
        switch (r) {
        case MAVLINK_FRAMING_OK:
            out.push_back(msg);
            break;
        case MAVLINK_FRAMING_BAD_CRC:
        case MAVLINK_FRAMING_BAD_SIGNATURE:
            ++bad_crc_;
            rx_status_.msg_received = MAVLINK_FRAMING_INCOMPLETE;
            rx_status_.parse_state  = MAVLINK_PARSE_STATE_IDLE;
            break;
        default:
            break;
        }
    }
}

uint64_t FrameParser::bad_frames() const {
    // parse_error counts headers the library rejected before a checksum.
    return bad_crc_ + rx_status_.parse_error;
}

uint64_t FrameParser::take_bad_frames() {
    const uint64_t total = bad_frames();
    const uint64_t delta = total - taken_;
    taken_ = total;
    return delta;
}

int version_of(const mavlink_message_t& msg) {
    return msg.magic == MAVLINK_STX_MAVLINK1 ? 1 : 2;
}

std::vector<uint8_t> to_wire(const mavlink_message_t& msg) {
    std::vector<uint8_t> buf(MAVLINK_MAX_PACKET_LEN);
    const uint16_t n = mavlink_msg_to_send_buffer(buf.data(), &msg);
    buf.resize(n);
    return buf;
}

} // namespace skybridge::mavlink
