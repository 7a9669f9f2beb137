#pragma once
#include <cstdint>
#include <cstddef>
#include <optional>
#include <variant>
#include <vector>

namespace termlink {

constexpr uint8_t  kVersion = 0x01;

enum FrameType : uint16_t {
    HDR_TYPE_DATA   = 0x01,
    HDR_TYPE_PAD    = 0x02,
    HDR_TYPE_SM     = 0x03,
    HDR_TYPE_NAK    = 0x04,
    HDR_TYPE_SETUP  = 0x05
};

enum FrameFlags : uint8_t {
    FLAG_BEGIN       = 0x80,
    FLAG_END         = 0x40,
    FLAG_UNFRAGMENTED = FLAG_BEGIN | FLAG_END
};

constexpr size_t kDataHeaderLength   = 32;
constexpr size_t kSetupHeaderLength  = 40;
constexpr size_t kStatusHeaderLength = 28;
constexpr size_t kNakHeaderLength    = 28;
// frameLength(4) + version(1) + flags(1) + type(2)
constexpr size_t kFrameHeaderLength  = 8;

constexpr size_t   kFrameAlignment        = 32;
constexpr int32_t  kTermMinLength         = 64 * 1024;
constexpr int32_t  kTermMaxLength         = 1024 * 1024 * 1024;
constexpr int32_t  kTermDefaultLength     = 16 * 1024 * 1024;
constexpr int32_t  kPageMinSize           = 4 * 1024;
constexpr int32_t  kPageMaxSize           = 1024 * 1024 * 1024;
constexpr uint32_t kMtuDefaultLength      = 1408;
constexpr uint32_t kReceiverWindowDefault = 16 * 1024 * 1024;
constexpr size_t   kMaxUdpPayloadLength   = 65507;

struct DataHeader {
    uint32_t frame_length{0};
    uint8_t  version{kVersion};
    uint8_t  flags{FLAG_UNFRAGMENTED};
    uint16_t type{HDR_TYPE_DATA};
    uint32_t term_offset{0};
    uint32_t session_id{0};
    uint32_t stream_id{0};
    uint32_t term_id{0};
    uint64_t reserved_value{0};
};

struct SetupHeader {
    uint32_t frame_length{kSetupHeaderLength};
    uint8_t  version{kVersion};
    uint8_t  flags{0};
    uint16_t type{HDR_TYPE_SETUP};
    uint32_t term_offset{0};
    uint32_t session_id{0};
    uint32_t stream_id{0};
    uint32_t initial_term_id{0};
    uint32_t active_term_id{0};
    uint32_t term_length{0};
    uint32_t mtu_length{kMtuDefaultLength};
    uint32_t ttl{0};
};

struct StatusHeader {
    uint32_t frame_length{kStatusHeaderLength};
    uint8_t  version{kVersion};
    uint8_t  flags{0};
    uint16_t type{HDR_TYPE_SM};
    uint32_t session_id{0};
    uint32_t stream_id{0};
    uint32_t consumption_term_id{0};
    uint32_t consumption_term_offset{0};
    uint32_t receiver_window{0};
};

struct NakHeader {
    uint32_t frame_length{kNakHeaderLength};
    uint8_t  version{kVersion};
    uint8_t  flags{0};
    uint16_t type{HDR_TYPE_NAK};
    uint32_t session_id{0};
    uint32_t stream_id{0};
    uint32_t term_id{0};
    uint32_t term_offset{0};
    uint32_t length{0};
};

// DATA or PAD frame; payload excludes header and alignment padding.
struct DataFrame {
    DataHeader hdr{};
    std::vector<uint8_t> payload;
};

using Frame = std::variant<DataFrame, SetupHeader, StatusHeader, NakHeader>;

// Reliability layer: same 32-byte layout as DataHeader, the low 4 bytes of
// reserved_value (offset 24) carry the sequence number. Type codes live in
// their own space and are only meaningful on a reliability endpoint.
enum ReliableFrameType : uint16_t {
    REL_TYPE_DATA         = 0x01,
    REL_TYPE_ACK          = 0x02,
    REL_TYPE_NAK          = 0x03,
    REL_TYPE_HEARTBEAT    = 0x04,
    REL_TYPE_FLOW_CONTROL = 0x05
};

constexpr size_t kReliableHeaderLength  = kDataHeaderLength;
constexpr size_t kSequenceNumberOffset  = 24;

struct ReliableFrame {
    DataHeader hdr{};
    uint32_t sequence_number{0};
    std::vector<uint8_t> payload;
};

inline size_t align_frame_length(size_t length) {
    return (length + kFrameAlignment - 1) & ~(kFrameAlignment - 1);
}

// Little-endian field access. Callers guarantee offset + width <= buffer size.
void put_u16(uint8_t* dst, size_t offset, uint16_t v);
void put_u32(uint8_t* dst, size_t offset, uint32_t v);
void put_u64(uint8_t* dst, size_t offset, uint64_t v);
uint16_t get_u16(const uint8_t* src, size_t offset);
uint32_t get_u32(const uint8_t* src, size_t offset);
uint64_t get_u64(const uint8_t* src, size_t offset);

void write_data_header(uint8_t* dst, const DataHeader& h);
DataHeader read_data_header(const uint8_t* src);

// Encoders produce the frame exactly as it goes on the wire. Data frames are
// zero padded to the next 32-byte boundary.
std::vector<uint8_t> encode_data_frame(const DataHeader& h, const uint8_t* payload, size_t len);
std::vector<uint8_t> encode_setup(const SetupHeader& h);
std::vector<uint8_t> encode_status(const StatusHeader& h);
std::vector<uint8_t> encode_nak(const NakHeader& h);

std::optional<uint16_t> peek_frame_type(const uint8_t* data, size_t len);
std::optional<DataFrame> decode_data_frame(const uint8_t* data, size_t len);
std::optional<SetupHeader> decode_setup(const uint8_t* data, size_t len);
std::optional<StatusHeader> decode_status(const uint8_t* data, size_t len);
std::optional<NakHeader> decode_nak(const uint8_t* data, size_t len);

// Dispatches on the type field. nullopt: too short, bad length or unknown type.
std::optional<Frame> decode_frame(const uint8_t* data, size_t len);

std::vector<uint8_t> encode_reliable_frame(uint16_t type, uint32_t session_id, uint32_t stream_id,
                                           uint32_t sequence_number,
                                           const uint8_t* payload, size_t len);
std::optional<ReliableFrame> decode_reliable_frame(const uint8_t* data, size_t len);

const char* frame_type_name(uint16_t type);

} // namespace termlink
