/**
* @file
* @brief Big-endian encoders and the bounds-checked datagram decoder.
*/

#include "speedtest/wire.hpp"
#include <charconv>
#include <cstring>

namespace speedtest {

/// \cond INTERNAL
namespace {

void put_u16(uint8_t* p, uint16_t v) {
    p[0] = static_cast<uint8_t>(v >> 8);
    p[1] = static_cast<uint8_t>(v);
}

void put_u32(uint8_t* p, uint32_t v) {
    for (int i = 3; i >= 0; --i) { p[i] = static_cast<uint8_t>(v); v >>= 8; }
}

void put_u64(uint8_t* p, uint64_t v) {
    for (int i = 7; i >= 0; --i) { p[i] = static_cast<uint8_t>(v); v >>= 8; }
}

uint16_t get_u16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

uint32_t get_u32(const uint8_t* p) {
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i) v = (v << 8) | p[i];
    return v;
}

uint64_t get_u64(const uint8_t* p) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) v = (v << 8) | p[i];
    return v;
}

void put_header(uint8_t* p, MessageType type) {
    put_u32(p, kMagic);
    p[4] = static_cast<uint8_t>(type);
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

} // namespace
/// \endcond

std::vector<uint8_t> encode_offer(const OfferMessage& m) {
    std::vector<uint8_t> out(kOfferSize);
    put_header(out.data(), MessageType::Offer);
    put_u16(out.data() + 5, m.udp_port);
    put_u16(out.data() + 7, m.tcp_port);
    return out;
}

std::vector<uint8_t> encode_request(const RequestMessage& m) {
    std::vector<uint8_t> out(kRequestSize);
    put_header(out.data(), MessageType::Request);
    put_u64(out.data() + 5, m.file_size);
    return out;
}

void encode_payload(uint64_t total_segments, uint64_t segment_index,
                    const uint8_t* payload, size_t len, std::vector<uint8_t>& out) {
    out.resize(kPayloadHeaderSize + len);
    put_header(out.data(), MessageType::Payload);
    put_u64(out.data() + 5, total_segments);
    put_u64(out.data() + 13, segment_index);
    if (len) std::memcpy(out.data() + kPayloadHeaderSize, payload, len);
}

Message decode(const uint8_t* data, size_t len) {
    if (data == nullptr || len < kHeaderSize) return UnknownMessage{};
    if (get_u32(data) != kMagic) return UnknownMessage{};

    switch (static_cast<MessageType>(data[4])) {
        case MessageType::Offer:
            if (len < kOfferSize) break;
            return OfferMessage{get_u16(data + 5), get_u16(data + 7)};
        case MessageType::Request:
            if (len < kRequestSize) break;
            return RequestMessage{get_u64(data + 5)};
        case MessageType::Payload: {
            if (len < kPayloadHeaderSize) break;
            PayloadSegment seg;
            seg.total_segments = get_u64(data + 5);
            seg.segment_index  = get_u64(data + 13);
            seg.payload = std::string_view(reinterpret_cast<const char*>(data) + kPayloadHeaderSize,
                                           len - kPayloadHeaderSize);
            return seg;
        }
    }
    return UnknownMessage{};
}

std::string encode_size_line(uint64_t file_size) {
    return std::to_string(file_size) + "\n";
}

std::optional<uint64_t> parse_size_line(std::string_view line) {
    while (!line.empty() && is_space(line.front())) line.remove_prefix(1);
    while (!line.empty() && is_space(line.back()))  line.remove_suffix(1);
    if (line.empty()) return std::nullopt;

    uint64_t value = 0;
    const char* first = line.data();
    const char* last  = line.data() + line.size();
    // from_chars takes no sign, so "-1" and "+1" are both rejected.
    auto res = std::from_chars(first, last, value, 10);
    if (res.ec != std::errc() || res.ptr != last) return std::nullopt;
    return value;
}

} // namespace speedtest
