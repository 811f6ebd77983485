#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace transport {

// Largest accepted frame payload: 1 MiB
constexpr uint32_t kMaxFrameBytes = 1024u * 1024u;

// Reads exactly n bytes into buf. Returns false on EOF or stream failure
// before n bytes arrive.
bool read_exact(std::istream &in, uint8_t *buf, std::size_t n);

// Reads one length-prefixed frame (uint32_le + payload bytes).
// Returns:
//  - true  => frame read successfully into out
//  - false => clean EOF before a header (err empty) or a protocol/IO error
//             (err non-empty)
bool read_frame(std::istream &in, std::vector<uint8_t> &out, std::string &err,
                uint32_t max_len = kMaxFrameBytes);

// Writes one length-prefixed frame and flushes. Returns false and sets err
// on failure.
bool write_frame(std::ostream &out, const uint8_t *data, std::size_t len,
                 std::string &err, uint32_t max_len = kMaxFrameBytes);

} // namespace transport
