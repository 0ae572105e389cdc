#ifndef CHUNKRELAY_RELAY_PROTOCOL_H
#define CHUNKRELAY_RELAY_PROTOCOL_H

#include "chunkrelay/base/error_code.h"
#include "chunkrelay/session/protocol_engine.h"
#include <cstdint>
#include <string>
#include <vector>

namespace chunkrelay {

// Peer transport framing
constexpr uint32_t FRAME_MAGIC = 0x43524C59;  // "CRLY"
constexpr uint32_t FRAME_VERSION = 1;
constexpr uint32_t MAX_EVENT_NAME_LENGTH = 64;

// Bytes; keeps the escaped chunk file name under NAME_MAX
constexpr size_t MAX_TRANSFER_ID_LENGTH = 64;

// Fixed header preceding every frame. All fields are in network byte order
// on the wire. Body layout: event name | JSON object | binary payload.
struct FrameHeader {
    uint32_t magic;
    uint32_t version;
    uint32_t event_length;
    uint32_t json_length;
    uint32_t binary_length;
} __attribute__((packed));

constexpr size_t FRAME_HEADER_SIZE = sizeof(FrameHeader);

struct Frame {
    std::string event;
    std::string json;
    std::vector<uint8_t> binary;

    size_t body_size() const { return event.size() + json.size() + binary.size(); }
};

// Serialize header and body into one buffer
std::vector<uint8_t> encode_frame(const Frame& frame);

// Parse a raw header (host byte order after the call). Rejects bad magic or
// version with InvalidMessage, and sections above max_buffer_size (or an
// overlong event name) with FrameTooLarge.
ErrorCode decode_header(const uint8_t* data, size_t size, uint64_t max_buffer_size,
                        FrameHeader& header);

// Split a body of header.event_length + json_length + binary_length bytes
Frame split_body(const FrameHeader& header, std::vector<uint8_t> body);

// Decode one complete frame from a buffer holding exactly that frame
ErrorCode decode_frame(const std::vector<uint8_t>& bytes, uint64_t max_buffer_size, Frame& frame);

// Map a frame onto a typed peer message. Unknown events, unparsable JSON,
// a missing or overlong transferId or wrongly typed fields yield InvalidMessage.
struct ParsedMessage {
    ErrorCode code = ErrorCode::Success;
    PeerMessage message;
    std::string detail;

    bool ok() const { return code == ErrorCode::Success; }
};

ParsedMessage parse_peer_message(Frame frame);

// Frame for an inbound event, as a peer would send it
Frame make_peer_frame(const PeerMessage& message);

// Frame for an outbound engine event
Frame make_outbound_frame(OutboundEvent event);

Frame make_ping_frame();

} // namespace chunkrelay

#endif // CHUNKRELAY_RELAY_PROTOCOL_H
