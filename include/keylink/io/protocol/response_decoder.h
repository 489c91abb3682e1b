#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "keylink/io/protocol/byte_codec.h"
#include "keylink/io/protocol/wrapper_packet.h"

namespace keylink::io::protocol {

using bytecodec::Endian;

// ---------------------------------------------------------------------------
// Decode shapes. Each carries only what it needs; DecodeOptions validates
// them when built, so decode() only ever fails on the payload itself.
// ---------------------------------------------------------------------------

// Payload bytes, optionally without the first `skip` bytes.
struct RawBytes {
    std::size_t skip{0};
};

// Unsigned elements of 8/16/32 bits read back to back from `skip`.
// Element count = (size - skip) / width. `slice` drops leading elements.
struct FixedWidthArray {
    std::uint8_t widthBytes{1};
    Endian       endian{Endian::Little};
    std::size_t  skip{0};
    std::size_t  slice{0};
};

// One unsigned value at byte position skip + offset. The offset is a raw
// byte offset for every width, never an element index.
struct ScalarByOffset {
    std::uint8_t widthBytes{1};
    Endian       endian{Endian::Little};
    std::size_t  skip{0};
    std::size_t  offset{0};
};

// Mixed-width record described by a format string of B/H/I/Q codes and
// an endianness marker ('<' little, '>' big, default little).
struct PackedStruct {
    std::string                format;
    std::vector<std::uint8_t>  fieldWidths;
    Endian                     endian{Endian::Little};
    std::size_t                skip{0};
    std::optional<std::size_t> index;   // pick one field instead of all

    std::size_t totalSize() const noexcept;
};

class DecodeOptions {
public:
    using Shape = std::variant<RawBytes, FixedWidthArray, ScalarByOffset, PackedStruct>;

    // Raw payload (the default for commands whose reply is not inspected).
    DecodeOptions() : _shape(RawBytes{}) {}

    static DecodeOptions raw(std::size_t skip = 0);

    // widthBits must be 8, 16 or 32 and skip a multiple of the width;
    // misaligned layouts belong in packed().
    static DecodeOptions array(unsigned widthBits,
                               Endian endian = Endian::Little,
                               std::size_t skip = 0,
                               std::size_t slice = 0);

    static DecodeOptions scalar(unsigned widthBits,
                                std::size_t byteOffset,
                                Endian endian = Endian::Little,
                                std::size_t skip = 0);

    static DecodeOptions packed(std::string_view format,
                                std::size_t skip = 0,
                                std::optional<std::size_t> index = std::nullopt);

    const Shape& shape() const noexcept { return _shape; }

private:
    explicit DecodeOptions(Shape shape) : _shape(std::move(shape)) {}

    Shape _shape;
};

// Result alternatives, by shape:
//   RawBytes, 8-bit arrays      -> ByteBuffer
//   16-bit arrays               -> std::vector<std::uint16_t>
//   32-bit arrays               -> std::vector<std::uint32_t>
//   scalars, indexed structs    -> std::uint64_t
//   whole structs               -> std::vector<std::uint64_t>
using DecodedValue = std::variant<ByteBuffer,
                                  std::vector<std::uint16_t>,
                                  std::vector<std::uint32_t>,
                                  std::uint64_t,
                                  std::vector<std::uint64_t>>;

// Pure payload -> value conversion. Throws DecodeError when the payload is
// too short for the requested shape.
DecodedValue decode_payload(const ByteBuffer& payload, const DecodeOptions& options);

// Typed access; throws DecodeError when the value has another shape.
template <typename T>
const T& value_as(const DecodedValue& v);

extern template const ByteBuffer& value_as<ByteBuffer>(const DecodedValue&);
extern template const std::vector<std::uint16_t>& value_as<std::vector<std::uint16_t>>(const DecodedValue&);
extern template const std::vector<std::uint32_t>& value_as<std::vector<std::uint32_t>>(const DecodedValue&);
extern template const std::uint64_t& value_as<std::uint64_t>(const DecodedValue&);
extern template const std::vector<std::uint64_t>& value_as<std::vector<std::uint64_t>>(const DecodedValue&);

// ---------------------------------------------------------------------------
// Encoding in the same vocabulary (argument building).
// ---------------------------------------------------------------------------

// Serialise values according to a packed-struct format string.
// Throws std::invalid_argument on count mismatch or a value that overflows
// its field.
ByteBuffer pack(std::string_view format, const std::vector<std::uint64_t>& values);

// Serialise values as back-to-back 8/16/32-bit elements.
ByteBuffer encode_array(unsigned widthBits, Endian endian, const std::vector<std::uint64_t>& values);

} // namespace keylink::io::protocol
