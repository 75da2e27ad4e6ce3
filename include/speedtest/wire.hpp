#pragma once
#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include "speedtest/common.hpp"

/**
* @file
* @brief Wire codec for the three datagram messages plus the TCP request line.
*
* All integers are big-endian. Layouts:
*
* | Message | Layout                                                                 |
* |---------|------------------------------------------------------------------------|
* | Offer   | magic(4) type=0x2(1) udp_port(2) tcp_port(2)                           |
* | Request | magic(4) type=0x3(1) file_size(8)                                      |
* | Payload | magic(4) type=0x4(1) total_segments(8) segment_index(8) payload(<=seg) |
*
* Decoding never throws and never reads past the buffer: anything short,
* with a foreign magic, or with an unknown tag decodes to @ref UnknownMessage.
*
* The TCP side is not binary: the client sends the decimal size followed by
* @c '\n' and the server streams raw bytes back.
*/

namespace speedtest {

static constexpr size_t kHeaderSize  = 5;                 ///< magic + type
static constexpr size_t kOfferSize   = kHeaderSize + 4;   ///< 9 bytes
static constexpr size_t kRequestSize = kHeaderSize + 8;   ///< 13 bytes
static constexpr size_t kPayloadHeaderSize = kHeaderSize + 16; ///< 21 bytes

struct OfferMessage {
    uint16_t udp_port = 0;
    uint16_t tcp_port = 0;
};

struct RequestMessage {
    uint64_t file_size = 0;
};

/**
* @brief One UDP datagram of a segmented transfer.
*
* @ref payload is a view into the buffer that was decoded; it is only valid
* while that buffer lives.
*/
struct PayloadSegment {
    uint64_t total_segments = 0;
    uint64_t segment_index  = 0;
    std::string_view payload;
};

/// @brief Anything that failed validation (short, bad magic, unknown tag).
struct UnknownMessage {};

using Message = std::variant<UnknownMessage, OfferMessage, RequestMessage, PayloadSegment>;

std::vector<uint8_t> encode_offer(const OfferMessage& m);
std::vector<uint8_t> encode_request(const RequestMessage& m);

/**
* @brief Encode a payload segment header followed by @p payload.
*
* @details Writes into @p out (resized to header + payload) so callers on the
*          send path can reuse a buffer across segments.
*/
void encode_payload(uint64_t total_segments, uint64_t segment_index,
                    const uint8_t* payload, size_t len, std::vector<uint8_t>& out);

/// @brief Decode a datagram. Never throws; invalid input yields @ref UnknownMessage.
Message decode(const uint8_t* data, size_t len);

inline Message decode(const std::vector<uint8_t>& buf) { return decode(buf.data(), buf.size()); }

/// @brief @c ceil(file_size / segment_size); 0 when @p segment_size is 0.
inline uint64_t segment_count(uint64_t file_size, size_t segment_size) {
    if (segment_size == 0) return 0;
    return file_size / segment_size + (file_size % segment_size ? 1 : 0);
}

/**
* @brief Payload length of segment @p index:
*        @c min(segment_size, file_size - index*segment_size), 0 if out of range.
*/
inline size_t segment_length(uint64_t file_size, size_t segment_size, uint64_t index) {
    if (index >= segment_count(file_size, segment_size)) return 0;
    uint64_t offset = index * segment_size;
    uint64_t rest = file_size - offset;
    return rest < segment_size ? static_cast<size_t>(rest) : segment_size;
}

/// @brief The TCP request line: decimal @p file_size followed by @c '\n'.
std::string encode_size_line(uint64_t file_size);

/**
* @brief Parse a TCP request line (without or with its trailing newline).
*
* Surrounding ASCII whitespace (including @c "\r") is ignored. The remainder
* must be a non-empty run of decimal digits that fits in 64 bits.
*
* @return The requested byte count, or an empty optional for a malformed line.
*/
std::optional<uint64_t> parse_size_line(std::string_view line);

} // namespace speedtest
