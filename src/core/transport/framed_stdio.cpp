#include "core/transport/framed_stdio.hpp"

#include <array>

namespace transport {

static uint32_t decode_u32_le(const std::array<uint8_t, 4> &b) {
  return static_cast<uint32_t>(b[0]) | (static_cast<uint32_t>(b[1]) << 8) |
         (static_cast<uint32_t>(b[2]) << 16) |
         (static_cast<uint32_t>(b[3]) << 24);
}

static std::array<uint8_t, 4> encode_u32_le(uint32_t v) {
  return {static_cast<uint8_t>(v & 0xFF), static_cast<uint8_t>((v >> 8) & 0xFF),
          static_cast<uint8_t>((v >> 16) & 0xFF),
          static_cast<uint8_t>((v >> 24) & 0xFF)};
}

bool read_exact(std::istream &in, uint8_t *buf, std::size_t n) {
  std::size_t got = 0;
  while (got < n) {
    in.read(reinterpret_cast<char *>(buf + got),
            static_cast<std::streamsize>(n - got));
    const std::streamsize r = in.gcount();
    if (r <= 0) {
      return false;
    }
    got += static_cast<std::size_t>(r);
  }
  return true;
}

bool read_frame(std::istream &in, std::vector<uint8_t> &out, std::string &err,
                uint32_t max_len) {
  err.clear();

  // EOF before the first header byte is a clean shutdown
  if (in.peek() == std::char_traits<char>::eof()) {
    return false;
  }

  std::array<uint8_t, 4> hdr{};
  if (!read_exact(in, hdr.data(), hdr.size())) {
    err = "unexpected EOF while reading frame header";
    return false;
  }

  const uint32_t len = decode_u32_le(hdr);
  if (len == 0) {
    err = "invalid frame length: 0";
    return false;
  }
  if (len > max_len) {
    err = "frame length " + std::to_string(len) + " exceeds max " +
          std::to_string(max_len);
    return false;
  }

  out.assign(len, 0);
  if (!read_exact(in, out.data(), len)) {
    err = "unexpected EOF while reading frame payload";
    return false;
  }
  return true;
}

bool write_frame(std::ostream &out, const uint8_t *data, std::size_t len,
                 std::string &err, uint32_t max_len) {
  err.clear();

  if (len == 0) {
    err = "invalid frame length: 0";
    return false;
  }
  if (len > max_len) {
    err = "frame length " + std::to_string(len) + " exceeds max " +
          std::to_string(max_len);
    return false;
  }

  const auto hdr = encode_u32_le(static_cast<uint32_t>(len));
  out.write(reinterpret_cast<const char *>(hdr.data()),
            static_cast<std::streamsize>(hdr.size()));
  out.write(reinterpret_cast<const char *>(data),
            static_cast<std::streamsize>(len));
  out.flush();

  if (!out.good()) {
    err = "failed writing frame";
    return false;
  }
  return true;
}

} // namespace transport
