#include "chunkrelay/relay/protocol.h"
#include <cstring>
#include <limits>
#include <arpa/inet.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace chunkrelay {

namespace {

bool read_u32(const json& obj, const char* key, uint32_t& out) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return false;
    }
    if (it->is_number_unsigned()) {
        auto value = it->get<uint64_t>();
        if (value > std::numeric_limits<uint32_t>::max()) {
            return false;
        }
        out = static_cast<uint32_t>(value);
        return true;
    }
    if (it->is_number_integer() && it->get<int64_t>() >= 0) {
        out = static_cast<uint32_t>(it->get<int64_t>());
        return true;
    }
    return false;
}

// Absent is fine; present with the wrong type is not
bool read_optional_u64(const json& obj, const char* key, uint64_t& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return true;
    }
    if (it->is_number_unsigned()) {
        out = it->get<uint64_t>();
        return true;
    }
    if (it->is_number_integer() && it->get<int64_t>() >= 0) {
        out = static_cast<uint64_t>(it->get<int64_t>());
        return true;
    }
    return false;
}

bool read_optional_string(const json& obj, const char* key, std::string& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return true;
    }
    if (!it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return true;
}

ParsedMessage invalid(std::string detail) {
    ParsedMessage parsed;
    parsed.code = ErrorCode::InvalidMessage;
    parsed.detail = std::move(detail);
    return parsed;
}

} // anonymous namespace

std::vector<uint8_t> encode_frame(const Frame& frame) {
    FrameHeader header{};
    header.magic = htonl(FRAME_MAGIC);
    header.version = htonl(FRAME_VERSION);
    header.event_length = htonl(static_cast<uint32_t>(frame.event.size()));
    header.json_length = htonl(static_cast<uint32_t>(frame.json.size()));
    header.binary_length = htonl(static_cast<uint32_t>(frame.binary.size()));

    std::vector<uint8_t> out(FRAME_HEADER_SIZE + frame.body_size());
    uint8_t* pos = out.data();
    std::memcpy(pos, &header, FRAME_HEADER_SIZE);
    pos += FRAME_HEADER_SIZE;
    std::memcpy(pos, frame.event.data(), frame.event.size());
    pos += frame.event.size();
    std::memcpy(pos, frame.json.data(), frame.json.size());
    pos += frame.json.size();
    if (!frame.binary.empty()) {
        std::memcpy(pos, frame.binary.data(), frame.binary.size());
    }
    return out;
}

ErrorCode decode_header(const uint8_t* data, size_t size, uint64_t max_buffer_size,
                        FrameHeader& header) {
    if (size < FRAME_HEADER_SIZE) {
        return ErrorCode::InvalidMessage;
    }

    FrameHeader raw;
    std::memcpy(&raw, data, FRAME_HEADER_SIZE);
    header.magic = ntohl(raw.magic);
    header.version = ntohl(raw.version);
    header.event_length = ntohl(raw.event_length);
    header.json_length = ntohl(raw.json_length);
    header.binary_length = ntohl(raw.binary_length);

    if (header.magic != FRAME_MAGIC || header.version != FRAME_VERSION) {
        return ErrorCode::InvalidMessage;
    }
    if (header.event_length == 0) {
        return ErrorCode::InvalidMessage;
    }
    if (header.event_length > MAX_EVENT_NAME_LENGTH ||
        header.json_length > max_buffer_size ||
        header.binary_length > max_buffer_size) {
        return ErrorCode::FrameTooLarge;
    }
    return ErrorCode::Success;
}

Frame split_body(const FrameHeader& header, std::vector<uint8_t> body) {
    Frame frame;
    const char* base = reinterpret_cast<const char*>(body.data());
    frame.event.assign(base, header.event_length);
    frame.json.assign(base + header.event_length, header.json_length);

    size_t binary_offset = static_cast<size_t>(header.event_length) + header.json_length;
    if (header.binary_length > 0) {
        frame.binary.assign(body.begin() + binary_offset,
                            body.begin() + binary_offset + header.binary_length);
    }
    return frame;
}

ErrorCode decode_frame(const std::vector<uint8_t>& bytes, uint64_t max_buffer_size, Frame& frame) {
    FrameHeader header{};
    auto code = decode_header(bytes.data(), bytes.size(), max_buffer_size, header);
    if (code != ErrorCode::Success) {
        return code;
    }

    size_t body_size = static_cast<size_t>(header.event_length) + header.json_length +
                       header.binary_length;
    if (bytes.size() != FRAME_HEADER_SIZE + body_size) {
        return ErrorCode::InvalidMessage;
    }

    std::vector<uint8_t> body(bytes.begin() + FRAME_HEADER_SIZE, bytes.end());
    frame = split_body(header, std::move(body));
    return ErrorCode::Success;
}

ParsedMessage parse_peer_message(Frame frame) {
    auto type = parse_peer_event_type(frame.event);
    if (!type) {
        return invalid("unknown event '" + frame.event + "'");
    }

    ParsedMessage parsed;
    parsed.message.type = *type;
    if (*type == PeerEventType::Pong) {
        return parsed;
    }

    json fields = frame.json.empty() ? json::object()
                                     : json::parse(frame.json, nullptr, false);
    if (fields.is_discarded() || !fields.is_object()) {
        return invalid("payload of " + frame.event + " is not a JSON object");
    }

    auto id = fields.find("transferId");
    if (id == fields.end() || !id->is_string() || id->get_ref<const std::string&>().empty()) {
        return invalid("missing transferId in " + frame.event);
    }
    if (id->get_ref<const std::string&>().size() > MAX_TRANSFER_ID_LENGTH) {
        return invalid("transferId longer than " + std::to_string(MAX_TRANSFER_ID_LENGTH) +
                       " bytes in " + frame.event);
    }
    parsed.message.transfer_id = id->get<std::string>();

    if (*type != PeerEventType::UploadChunk) {
        return parsed;
    }

    ChunkUpload& upload = parsed.message.upload;
    if (!read_u32(fields, "chunkIndex", upload.chunk_index)) {
        return invalid("invalid chunkIndex");
    }
    if (!read_u32(fields, "totalChunks", upload.total_chunks)) {
        return invalid("invalid totalChunks");
    }
    if (!read_optional_string(fields, "fileName", upload.file_name) ||
        !read_optional_string(fields, "fileType", upload.file_type) ||
        !read_optional_u64(fields, "fileSize", upload.file_size)) {
        return invalid("invalid file description");
    }
    upload.data = std::move(frame.binary);
    return parsed;
}

Frame make_peer_frame(const PeerMessage& message) {
    Frame frame;
    frame.event = to_string(message.type);
    if (message.type == PeerEventType::Pong) {
        return frame;
    }

    json fields = {{"transferId", message.transfer_id}};
    if (message.type == PeerEventType::UploadChunk) {
        fields["chunkIndex"] = message.upload.chunk_index;
        fields["totalChunks"] = message.upload.total_chunks;
        fields["fileName"] = message.upload.file_name;
        fields["fileSize"] = message.upload.file_size;
        fields["fileType"] = message.upload.file_type;
        frame.binary = message.upload.data;
    }
    frame.json = fields.dump(-1, ' ', false, json::error_handler_t::replace);
    return frame;
}

Frame make_outbound_frame(OutboundEvent event) {
    Frame frame;
    frame.event = to_string(event.type);
    frame.json = event.payload.dump(-1, ' ', false, json::error_handler_t::replace);
    frame.binary = std::move(event.binary);
    return frame;
}

Frame make_ping_frame() {
    Frame frame;
    frame.event = to_string(OutboundEventType::Ping);
    frame.json = json{{"timestamp", now_millis()}}.dump();
    return frame;
}

} // namespace chunkrelay
