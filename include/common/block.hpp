#pragma once
#include <cstdint>

/* All comments are in English.
 * Common Block struct shared by the dispatcher, lanes and reassembler.
 */

namespace rf {

// One unit of data in flight: payload + sequence id assigned at admission.
struct Block {
    std::uint64_t payload = 0;  // masked to payload_bits
    std::uint32_t seq     = 0;  // masked to seq_bits; never altered after admission
};

inline bool operator==(const Block& a, const Block& b) {
    return a.payload == b.payload && a.seq == b.seq;
}
inline bool operator!=(const Block& a, const Block& b) { return !(a == b); }

} // namespace rf
