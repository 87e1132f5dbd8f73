#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include <ardupilotmega/mavlink.h>

namespace skybridge::mavlink {

// ---------------------------------------------------------------------------
// Incremental parser over the MAVLink C library's framing state machine.
// Each parser owns its own rx buffer and status, so sessions never share the
// library's per-channel globals. Bytes may arrive in arbitrary chunks.
//
// Frames with a bad checksum (including ids outside the dialect, whose
// CRC_EXTRA is unknown) or a rejected header are counted and dropped.
// Signed frames are accepted; the signature is not verified.
// ---------------------------------------------------------------------------
class FrameParser {
public:
    FrameParser();

    // Appends every complete, checksum-valid message to out.
    void feed(const uint8_t* data, std::size_t len, std::vector<mavlink_message_t>& out);

    uint64_t bad_frames() const;

    // Bad frames since the last call.
    uint64_t take_bad_frames();

private:
    mavlink_message_t rx_msg_{};
    mavlink_status_t  rx_status_{};
    uint64_t bad_crc_{0};
    uint64_t taken_{0};
};

// 1 or 2, from the frame's start marker.
int version_of(const mavlink_message_t& msg);

// Serialised wire bytes of a packed/finalized message.
std::vector<uint8_t> to_wire(const mavlink_message_t& msg);

} // namespace skybridge::mavlink
