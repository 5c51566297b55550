#ifndef BSPGRAPH_TYPES_VALUE_CODEC_H
#define BSPGRAPH_TYPES_VALUE_CODEC_H

#include <bspgraph/types/value.h>

#include <cstdint>
#include <span>
#include <vector>

namespace bspgraph {

    // =============================================================================
    // Binary format:
    // - Header: uint32 magic ("BSPG") + uint8 version
    // - Each value: type tag (1 byte) followed by the payload
    //   - none: nothing
    //   - bool: 1 byte
    //   - int: int64, little endian
    //   - double: IEEE-754 bits as uint64, little endian
    //   - string: uint64 length + UTF-8 bytes
    //   - list: uint64 count + values
    //   - map: uint64 count + (uint64 key length + key bytes + value) pairs, in key order
    // =============================================================================
    namespace value_format {
        constexpr uint32_t MAGIC = 0x42535047;  // "BSPG" in ASCII
        constexpr uint8_t VERSION = 1;

        constexpr uint8_t TYPE_NONE = 0x00;
        constexpr uint8_t TYPE_BOOL = 0x01;
        constexpr uint8_t TYPE_INT64 = 0x02;
        constexpr uint8_t TYPE_FLOAT64 = 0x03;
        constexpr uint8_t TYPE_STRING = 0x04;
        constexpr uint8_t TYPE_LIST = 0x05;
        constexpr uint8_t TYPE_MAP = 0x06;

        // Guards against runaway recursion on corrupt input.
        constexpr size_t MAX_DEPTH = 512;
    } // namespace value_format

    using bytes_t = std::vector<uint8_t>;

    [[nodiscard]] BSPGRAPH_EXPORT bytes_t encode_value(const Value &value);

    /**
     * Decodes bytes produced by encode_value. Truncated input, an unknown tag, a bad header or trailing bytes raise
     * ChannelError(SERIALIZATION_ERROR).
     */
    [[nodiscard]] BSPGRAPH_EXPORT Value decode_value(std::span<const uint8_t> bytes);

} // namespace bspgraph

#endif  // BSPGRAPH_TYPES_VALUE_CODEC_H
