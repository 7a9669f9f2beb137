#include "protocol.hpp"
#include <cstring>

namespace termlink {

void put_u16(uint8_t *dst, size_t offset, uint16_t v) {
  dst[offset] = (uint8_t)(v & 0xFF);
  dst[offset + 1] = (uint8_t)(v >> 8);
}

void put_u32(uint8_t *dst, size_t offset, uint32_t v) {
  for (int i = 0; i < 4; i++)
    dst[offset + i] = (uint8_t)(v >> (8 * i));
}

void put_u64(uint8_t *dst, size_t offset, uint64_t v) {
  for (int i = 0; i < 8; i++)
    dst[offset + i] = (uint8_t)(v >> (8 * i));
}

uint16_t get_u16(const uint8_t *src, size_t offset) {
  return (uint16_t)(src[offset] | (src[offset + 1] << 8));
}

uint32_t get_u32(const uint8_t *src, size_t offset) {
  uint32_t v = 0;
  for (int i = 3; i >= 0; i--)
    v = (v << 8) | src[offset + i];
  return v;
}

uint64_t get_u64(const uint8_t *src, size_t offset) {
  uint64_t v = 0;
  for (int i = 7; i >= 0; i--)
    v = (v << 8) | src[offset + i];
  return v;
}

static void write_frame_prefix(uint8_t *dst, uint32_t frame_length,
                               uint8_t version, uint8_t flags, uint16_t type) {
  put_u32(dst, 0, frame_length);
  dst[4] = version;
  dst[5] = flags;
  put_u16(dst, 6, type);
}

void write_data_header(uint8_t *dst, const DataHeader &h) {
  write_frame_prefix(dst, h.frame_length, h.version, h.flags, h.type);
  put_u32(dst, 8, h.term_offset);
  put_u32(dst, 12, h.session_id);
  put_u32(dst, 16, h.stream_id);
  put_u32(dst, 20, h.term_id);
  put_u64(dst, 24, h.reserved_value);
}

DataHeader read_data_header(const uint8_t *src) {
  DataHeader h;
  h.frame_length = get_u32(src, 0);
  h.version = src[4];
  h.flags = src[5];
  h.type = get_u16(src, 6);
  h.term_offset = get_u32(src, 8);
  h.session_id = get_u32(src, 12);
  h.stream_id = get_u32(src, 16);
  h.term_id = get_u32(src, 20);
  h.reserved_value = get_u64(src, 24);
  return h;
}

std::vector<uint8_t> encode_data_frame(const DataHeader &h,
                                       const uint8_t *payload, size_t len) {
  std::vector<uint8_t> out(align_frame_length(kDataHeaderLength + len), 0);
  DataHeader hd = h;
  hd.frame_length = (uint32_t)(kDataHeaderLength + len);
  write_data_header(out.data(), hd);
  if (len)
    std::memcpy(out.data() + kDataHeaderLength, payload, len);
  return out;
}

std::vector<uint8_t> encode_setup(const SetupHeader &h) {
  std::vector<uint8_t> out(kSetupHeaderLength, 0);
  uint8_t *p = out.data();
  write_frame_prefix(p, h.frame_length, h.version, h.flags, h.type);
  put_u32(p, 8, h.term_offset);
  put_u32(p, 12, h.session_id);
  put_u32(p, 16, h.stream_id);
  put_u32(p, 20, h.initial_term_id);
  put_u32(p, 24, h.active_term_id);
  put_u32(p, 28, h.term_length);
  put_u32(p, 32, h.mtu_length);
  put_u32(p, 36, h.ttl);
  return out;
}

std::vector<uint8_t> encode_status(const StatusHeader &h) {
  std::vector<uint8_t> out(kStatusHeaderLength, 0);
  uint8_t *p = out.data();
  write_frame_prefix(p, h.frame_length, h.version, h.flags, h.type);
  put_u32(p, 8, h.session_id);
  put_u32(p, 12, h.stream_id);
  put_u32(p, 16, h.consumption_term_id);
  put_u32(p, 20, h.consumption_term_offset);
  put_u32(p, 24, h.receiver_window);
  return out;
}

std::vector<uint8_t> encode_nak(const NakHeader &h) {
  std::vector<uint8_t> out(kNakHeaderLength, 0);
  uint8_t *p = out.data();
  write_frame_prefix(p, h.frame_length, h.version, h.flags, h.type);
  put_u32(p, 8, h.session_id);
  put_u32(p, 12, h.stream_id);
  put_u32(p, 16, h.term_id);
  put_u32(p, 20, h.term_offset);
  put_u32(p, 24, h.length);
  return out;
}

std::optional<uint16_t> peek_frame_type(const uint8_t *data, size_t len) {
  if (len < kFrameHeaderLength)
    return std::nullopt;
  return get_u16(data, 6);
}

std::optional<DataFrame> decode_data_frame(const uint8_t *data, size_t len) {
  if (len < kDataHeaderLength)
    return std::nullopt;
  DataFrame f;
  f.hdr = read_data_header(data);
  if (f.hdr.type != HDR_TYPE_DATA && f.hdr.type != HDR_TYPE_PAD)
    return std::nullopt;
  if (f.hdr.frame_length < kDataHeaderLength || f.hdr.frame_length > len)
    return std::nullopt;
  if (f.hdr.type == HDR_TYPE_DATA)
    f.payload.assign(data + kDataHeaderLength, data + f.hdr.frame_length);
  return f;
}

std::optional<SetupHeader> decode_setup(const uint8_t *data, size_t len) {
  if (len < kSetupHeaderLength || get_u16(data, 6) != HDR_TYPE_SETUP)
    return std::nullopt;
  SetupHeader h;
  h.frame_length = get_u32(data, 0);
  h.version = data[4];
  h.flags = data[5];
  h.type = get_u16(data, 6);
  h.term_offset = get_u32(data, 8);
  h.session_id = get_u32(data, 12);
  h.stream_id = get_u32(data, 16);
  h.initial_term_id = get_u32(data, 20);
  h.active_term_id = get_u32(data, 24);
  h.term_length = get_u32(data, 28);
  h.mtu_length = get_u32(data, 32);
  h.ttl = get_u32(data, 36);
  return h;
}

std::optional<StatusHeader> decode_status(const uint8_t *data, size_t len) {
  if (len < kStatusHeaderLength || get_u16(data, 6) != HDR_TYPE_SM)
    return std::nullopt;
  StatusHeader h;
  h.frame_length = get_u32(data, 0);
  h.version = data[4];
  h.flags = data[5];
  h.type = get_u16(data, 6);
  h.session_id = get_u32(data, 8);
  h.stream_id = get_u32(data, 12);
  h.consumption_term_id = get_u32(data, 16);
  h.consumption_term_offset = get_u32(data, 20);
  h.receiver_window = get_u32(data, 24);
  return h;
}

std::optional<NakHeader> decode_nak(const uint8_t *data, size_t len) {
  if (len < kNakHeaderLength || get_u16(data, 6) != HDR_TYPE_NAK)
    return std::nullopt;
  NakHeader h;
  h.frame_length = get_u32(data, 0);
  h.version = data[4];
  h.flags = data[5];
  h.type = get_u16(data, 6);
  h.session_id = get_u32(data, 8);
  h.stream_id = get_u32(data, 12);
  h.term_id = get_u32(data, 16);
  h.term_offset = get_u32(data, 20);
  h.length = get_u32(data, 24);
  return h;
}

std::optional<Frame> decode_frame(const uint8_t *data, size_t len) {
  auto type = peek_frame_type(data, len);
  if (!type)
    return std::nullopt;
  switch (*type) {
  case HDR_TYPE_DATA:
  case HDR_TYPE_PAD:
    if (auto f = decode_data_frame(data, len))
      return Frame{std::move(*f)};
    break;
  case HDR_TYPE_SETUP:
    if (auto h = decode_setup(data, len))
      return Frame{*h};
    break;
  case HDR_TYPE_SM:
    if (auto h = decode_status(data, len))
      return Frame{*h};
    break;
  case HDR_TYPE_NAK:
    if (auto h = decode_nak(data, len))
      return Frame{*h};
    break;
  default:
    break;
  }
  return std::nullopt;
}

std::vector<uint8_t> encode_reliable_frame(uint16_t type, uint32_t session_id,
                                           uint32_t stream_id,
                                           uint32_t sequence_number,
                                           const uint8_t *payload,
                                           size_t len) {
  DataHeader h;
  h.type = type;
  h.flags = (type == REL_TYPE_DATA) ? FLAG_UNFRAGMENTED : 0;
  h.session_id = session_id;
  h.stream_id = stream_id;
  h.reserved_value = sequence_number;
  return encode_data_frame(h, payload, len);
}

std::optional<ReliableFrame> decode_reliable_frame(const uint8_t *data,
                                                   size_t len) {
  if (len < kReliableHeaderLength)
    return std::nullopt;
  ReliableFrame f;
  f.hdr = read_data_header(data);
  if (f.hdr.type < REL_TYPE_DATA || f.hdr.type > REL_TYPE_FLOW_CONTROL)
    return std::nullopt;
  if (f.hdr.frame_length < kReliableHeaderLength || f.hdr.frame_length > len)
    return std::nullopt;
  f.sequence_number = get_u32(data, kSequenceNumberOffset);
  f.payload.assign(data + kReliableHeaderLength, data + f.hdr.frame_length);
  return f;
}

const char *frame_type_name(uint16_t type) {
  switch (type) {
  case HDR_TYPE_DATA:
    return "DATA";
  case HDR_TYPE_PAD:
    return "PAD";
  case HDR_TYPE_SM:
    return "STATUS";
  case HDR_TYPE_NAK:
    return "NAK";
  case HDR_TYPE_SETUP:
    return "SETUP";
  default:
    return "UNKNOWN";
  }
}

} // namespace termlink
