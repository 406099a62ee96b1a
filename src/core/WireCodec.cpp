/**
 * @file WireCodec.cpp
 * @brief Message tags, envelope serialization and frame decoding
 */

#include "p2lan/WireCodec.h"
#include "p2lan/config.h"

#include <unordered_map>

namespace P2Lan {

//=============================================================================
// Message tags
//=============================================================================

namespace {

struct TagEntry {
    MessageType type;
    const char* tag;
};

constexpr TagEntry kTags[] = {
    {MessageType::Discovery,               "discovery"},
    {MessageType::DiscoveryResponse,       "discovery_response"},
    {MessageType::DiscoveryScanRequest,    "discovery_scan_request"},
    {MessageType::HandshakeConfirm,        "handshake_confirm"},
    {MessageType::PairingRequest,          "pairing_request"},
    {MessageType::PairingResponse,         "pairing_response"},
    {MessageType::TrustRequest,            "trust_request"},
    {MessageType::TrustResponse,           "trust_response"},
    {MessageType::Heartbeat,               "heartbeat"},
    {MessageType::Disconnect,              "disconnect"},
    {MessageType::FileTransferRequest,     "file_transfer_request"},
    {MessageType::FileTransferResponse,    "file_transfer_response"},
    {MessageType::DataChunk,               "data_chunk"},
    {MessageType::DataChunkAck,            "data_chunk_ack"},
    {MessageType::DataTransferComplete,    "data_transfer_complete"},
    {MessageType::DataTransferCompleteAck, "data_transfer_complete_ack"},
    {MessageType::DataTransferCancel,      "data_transfer_cancel"},
    {MessageType::KeyExchangeRequest,      "key_exchange_request"},
    {MessageType::KeyExchangeResponse,     "key_exchange_response"},
    {MessageType::EncryptedDataChunk,      "encrypted_data_chunk"},
    {MessageType::RemoteControlRequest,    "remote_control_request"},
    {MessageType::RemoteControlResponse,   "remote_control_response"},
    {MessageType::RemoteControlEvent,      "remote_control_event"},
    {MessageType::RemoteControlDisconnect, "remote_control_disconnect"},
    {MessageType::ScreenSharingRequest,    "screen_sharing_request"},
    {MessageType::ScreenSharingResponse,   "screen_sharing_response"},
    {MessageType::ScreenSharingData,       "screen_sharing_data"},
    {MessageType::ScreenSharingDisconnect, "screen_sharing_disconnect"},
};

const std::unordered_map<std::string, MessageType>& tagLookup() {
    static const std::unordered_map<std::string, MessageType> lookup = [] {
        std::unordered_map<std::string, MessageType> m;
        for (const auto& entry : kTags) {
            m.emplace(entry.tag, entry.type);
        }
        return m;
    }();
    return lookup;
}

uint32_t readBigEndian32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

}  // namespace

const char* messageTypeToString(MessageType type) {
    for (const auto& entry : kTags) {
        if (entry.type == type) {
            return entry.tag;
        }
    }
    return "unknown";
}

MessageType messageTypeFromString(const std::string& tag) {
    const auto& lookup = tagLookup();
    auto it = lookup.find(tag);
    return it == lookup.end() ? MessageType::Unknown : it->second;
}

//=============================================================================
// WireMessage
//=============================================================================

WireMessage WireMessage::make(MessageType type,
                              const std::string& fromUserId,
                              const std::string& toUserId,
                              nlohmann::json data)
{
    WireMessage msg;
    msg.type = type;
    msg.rawType = messageTypeToString(type);
    msg.fromUserId = fromUserId;
    msg.toUserId = toUserId;
    msg.data = data.is_null() ? nlohmann::json::object() : std::move(data);
    return msg;
}

nlohmann::json WireMessage::toJson() const {
    nlohmann::json j;
    j["type"] = (type == MessageType::Unknown) ? rawType : std::string(messageTypeToString(type));
    j["fromUserId"] = fromUserId;
    j["toUserId"] = toUserId;
    j["data"] = data;
    return j;
}

bool WireMessage::operator==(const WireMessage& other) const {
    return type == other.type &&
           rawType == other.rawType &&
           fromUserId == other.fromUserId &&
           toUserId == other.toUserId &&
           data == other.data;
}

//=============================================================================
// Framing
//=============================================================================

bool encodeFrame(const WireMessage& message, std::vector<uint8_t>& frame, std::string& errorMsg) {
    std::string payload;
    try {
        payload = message.toJson().dump();
    } catch (const nlohmann::json::type_error& e) {
        // Invalid UTF-8 in a string field
        errorMsg = std::string("Cannot serialize message: ") + e.what();
        return false;
    }

    if (payload.size() > MAX_FRAME_SIZE) {
        errorMsg = "Message payload of " + std::to_string(payload.size()) +
                   " bytes exceeds maximum frame size";
        return false;
    }

    const auto len = static_cast<uint32_t>(payload.size());
    frame.clear();
    frame.reserve(FRAME_HEADER_SIZE + payload.size());
    frame.push_back(static_cast<uint8_t>((len >> 24) & 0xFF));
    frame.push_back(static_cast<uint8_t>((len >> 16) & 0xFF));
    frame.push_back(static_cast<uint8_t>((len >> 8) & 0xFF));
    frame.push_back(static_cast<uint8_t>(len & 0xFF));
    frame.insert(frame.end(), payload.begin(), payload.end());
    return true;
}

DecodeResult decodePayload(const std::string& payload) {
    DecodeResult result;
    result.status = DecodeStatus::MalformedFrame;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("Invalid JSON: ") + e.what();
        return result;
    }

    if (!j.is_object()) {
        result.error = "Envelope is not an object";
        return result;
    }
    if (!j.contains("type") || !j["type"].is_string()) {
        result.error = "Envelope has no type";
        return result;
    }
    if (!j.contains("fromUserId") || !j["fromUserId"].is_string()) {
        result.error = "Envelope has no fromUserId";
        return result;
    }
    if (!j.contains("data") || !j["data"].is_object()) {
        result.error = "Envelope has no data object";
        return result;
    }

    WireMessage& msg = result.message;
    msg.rawType = j["type"].get<std::string>();
    msg.type = messageTypeFromString(msg.rawType);
    msg.fromUserId = j["fromUserId"].get<std::string>();
    if (j.contains("toUserId") && j["toUserId"].is_string()) {
        msg.toUserId = j["toUserId"].get<std::string>();
    }
    msg.data = std::move(j["data"]);

    result.status = DecodeStatus::Ok;
    return result;
}

void FrameDecoder::feed(const uint8_t* data, size_t size) {
    if (size == 0 || m_corrupt) {
        return;
    }
    m_buffer.insert(m_buffer.end(), data, data + size);
}

DecodeResult FrameDecoder::next() {
    DecodeResult result;

    if (m_corrupt) {
        result.status = DecodeStatus::CorruptStream;
        result.error = "Stream is corrupt";
        return result;
    }

    if (bufferedBytes() < FRAME_HEADER_SIZE) {
        result.status = DecodeStatus::IncompleteFrame;
        return result;
    }

    const uint32_t length = readBigEndian32(m_buffer.data() + m_readPos);
    if (length > MAX_FRAME_SIZE) {
        m_corrupt = true;
        result.status = DecodeStatus::CorruptStream;
        result.error = "Declared frame length " + std::to_string(length) + " exceeds maximum";
        return result;
    }

    if (bufferedBytes() < FRAME_HEADER_SIZE + length) {
        result.status = DecodeStatus::IncompleteFrame;
        return result;
    }

    const auto* begin = reinterpret_cast<const char*>(m_buffer.data() + m_readPos + FRAME_HEADER_SIZE);
    std::string payload(begin, length);
    m_readPos += FRAME_HEADER_SIZE + length;
    compact();

    return decodePayload(payload);
}

void FrameDecoder::reset() {
    m_buffer.clear();
    m_readPos = 0;
    m_corrupt = false;
}

void FrameDecoder::compact() {
    if (m_readPos == m_buffer.size()) {
        m_buffer.clear();
        m_readPos = 0;
    } else if (m_readPos > m_buffer.size() / 2) {
        m_buffer.erase(m_buffer.begin(), m_buffer.begin() + static_cast<std::ptrdiff_t>(m_readPos));
        m_readPos = 0;
    }
}

}  // namespace P2Lan
