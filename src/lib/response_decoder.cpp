#include "keylink/io/protocol/response_decoder.h"

#include "keylink/core/errors.h"

#include <limits>
#include <stdexcept>

namespace keylink::io::protocol {

using bytecodec::Reader;

namespace {

std::uint8_t width_bytes_for(unsigned widthBits)
{
    switch (widthBits) {
    case 8:  return 1;
    case 16: return 2;
    case 32: return 4;
    default:
        throw std::invalid_argument("element width must be 8, 16 or 32 bits, got " +
                                    std::to_string(widthBits));
    }
}

// Parse "B>H", "<IH", "BBHH" ... into field widths + endianness.
void parse_format(std::string_view format, std::vector<std::uint8_t>& widths, Endian& endian)
{
    bool little = false;
    bool big    = false;

    widths.clear();
    for (char c : format) {
        switch (c) {
        case '<': little = true; break;
        case '>': big = true; break;
        case 'B': widths.push_back(1); break;
        case 'H': widths.push_back(2); break;
        case 'I': widths.push_back(4); break;
        case 'Q': widths.push_back(8); break;
        default:
            throw std::invalid_argument(std::string("unknown field code '") + c +
                                        "' in format \"" + std::string(format) + "\"");
        }
    }

    if (little && big) {
        throw std::invalid_argument("format \"" + std::string(format) +
                                    "\" mixes '<' and '>'");
    }
    if (widths.empty()) {
        throw std::invalid_argument("format \"" + std::string(format) + "\" has no fields");
    }

    endian = big ? Endian::Big : Endian::Little;
}

void require(bool ok, const char* what, std::size_t need, std::size_t have)
{
    if (!ok) {
        throw DecodeError(std::string(what) + ": need " + std::to_string(need) +
                          " bytes, payload has " + std::to_string(have));
    }
}

template <typename T>
std::vector<T> read_elements(Reader& r, std::size_t width, Endian e, std::size_t count)
{
    std::vector<T> out;
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        std::uint64_t v = 0;
        r.read_uint(v, width, e);
        out.push_back(static_cast<T>(v));
    }
    return out;
}

DecodedValue decode_raw(const ByteBuffer& payload, const RawBytes& shape)
{
    require(shape.skip <= payload.size(), "raw bytes", shape.skip, payload.size());
    return ByteBuffer(payload.begin() + static_cast<std::ptrdiff_t>(shape.skip), payload.end());
}

DecodedValue decode_array(const ByteBuffer& payload, const FixedWidthArray& shape)
{
    require(shape.skip <= payload.size(), "array", shape.skip, payload.size());

    const std::size_t count = (payload.size() - shape.skip) / shape.widthBytes;
    if (shape.slice > count) {
        throw DecodeError("array slice " + std::to_string(shape.slice) +
                          " exceeds element count " + std::to_string(count));
    }

    Reader r(payload);
    r.skip(shape.skip + shape.slice * shape.widthBytes);
    const std::size_t n = count - shape.slice;

    switch (shape.widthBytes) {
    case 1:  return read_elements<std::uint8_t>(r, 1, shape.endian, n);
    case 2:  return read_elements<std::uint16_t>(r, 2, shape.endian, n);
    default: return read_elements<std::uint32_t>(r, 4, shape.endian, n);
    }
}

DecodedValue decode_scalar(const ByteBuffer& payload, const ScalarByOffset& shape)
{
    const std::size_t at = shape.skip + shape.offset;
    Reader r(payload);
    std::uint64_t v = 0;
    require(r.skip(at) && r.read_uint(v, shape.widthBytes, shape.endian),
            "scalar", at + shape.widthBytes, payload.size());
    return v;
}

DecodedValue decode_packed(const ByteBuffer& payload, const PackedStruct& shape)
{
    const std::size_t need = shape.skip + shape.totalSize();
    require(need <= payload.size(), "packed struct", need, payload.size());

    Reader r(payload);
    r.skip(shape.skip);

    std::vector<std::uint64_t> fields;
    fields.reserve(shape.fieldWidths.size());
    for (std::uint8_t w : shape.fieldWidths) {
        std::uint64_t v = 0;
        r.read_uint(v, w, shape.endian);
        fields.push_back(v);
    }

    if (shape.index) {
        return fields[*shape.index];
    }
    return fields;
}

} // namespace

std::size_t PackedStruct::totalSize() const noexcept
{
    std::size_t n = 0;
    for (std::uint8_t w : fieldWidths) {
        n += w;
    }
    return n;
}

// ---------------------------------------------------------------------------
// DecodeOptions factories
// ---------------------------------------------------------------------------

DecodeOptions DecodeOptions::raw(std::size_t skip)
{
    return DecodeOptions(RawBytes{skip});
}

DecodeOptions DecodeOptions::array(unsigned widthBits, Endian endian, std::size_t skip, std::size_t slice)
{
    FixedWidthArray a;
    a.widthBytes = width_bytes_for(widthBits);
    a.endian     = endian;
    a.skip       = skip;
    a.slice      = slice;

    if (skip % a.widthBytes != 0) {
        throw std::invalid_argument("array start " + std::to_string(skip) +
                                    " is not aligned to " + std::to_string(widthBits) +
                                    "-bit elements; use a packed struct");
    }
    return DecodeOptions(a);
}

DecodeOptions DecodeOptions::scalar(unsigned widthBits, std::size_t byteOffset, Endian endian, std::size_t skip)
{
    ScalarByOffset s;
    s.widthBytes = width_bytes_for(widthBits);
    s.endian     = endian;
    s.skip       = skip;
    s.offset     = byteOffset;
    return DecodeOptions(s);
}

DecodeOptions DecodeOptions::packed(std::string_view format, std::size_t skip, std::optional<std::size_t> index)
{
    PackedStruct p;
    p.format = std::string(format);
    parse_format(format, p.fieldWidths, p.endian);
    p.skip  = skip;
    p.index = index;

    if (index && *index >= p.fieldWidths.size()) {
        throw std::invalid_argument("field index " + std::to_string(*index) +
                                    " out of range for format \"" + p.format + "\"");
    }
    return DecodeOptions(std::move(p));
}

// ---------------------------------------------------------------------------
// decode
// ---------------------------------------------------------------------------

DecodedValue decode_payload(const ByteBuffer& payload, const DecodeOptions& options)
{
    const auto& shape = options.shape();

    if (const auto* raw = std::get_if<RawBytes>(&shape)) {
        return decode_raw(payload, *raw);
    }
    if (const auto* arr = std::get_if<FixedWidthArray>(&shape)) {
        return decode_array(payload, *arr);
    }
    if (const auto* sc = std::get_if<ScalarByOffset>(&shape)) {
        return decode_scalar(payload, *sc);
    }
    return decode_packed(payload, std::get<PackedStruct>(shape));
}

template <typename T>
const T& value_as(const DecodedValue& v)
{
    if (const auto* p = std::get_if<T>(&v)) {
        return *p;
    }
    throw DecodeError("decoded value has an unexpected shape");
}

template const ByteBuffer& value_as<ByteBuffer>(const DecodedValue&);
template const std::vector<std::uint16_t>& value_as<std::vector<std::uint16_t>>(const DecodedValue&);
template const std::vector<std::uint32_t>& value_as<std::vector<std::uint32_t>>(const DecodedValue&);
template const std::uint64_t& value_as<std::uint64_t>(const DecodedValue&);
template const std::vector<std::uint64_t>& value_as<std::vector<std::uint64_t>>(const DecodedValue&);

// ---------------------------------------------------------------------------
// encode
// ---------------------------------------------------------------------------

static void put_checked(ByteBuffer& out, std::uint64_t v, std::size_t width, Endian e)
{
    if (width < 8 && v > ((std::uint64_t{1} << (8U * width)) - 1U)) {
        throw std::invalid_argument("value " + std::to_string(v) + " does not fit in " +
                                    std::to_string(width * 8) + " bits");
    }
    bytecodec::write_uint(out, v, width, e);
}

ByteBuffer pack(std::string_view format, const std::vector<std::uint64_t>& values)
{
    std::vector<std::uint8_t> widths;
    Endian endian = Endian::Little;
    parse_format(format, widths, endian);

    if (widths.size() != values.size()) {
        throw std::invalid_argument("format \"" + std::string(format) + "\" expects " +
                                    std::to_string(widths.size()) + " values, got " +
                                    std::to_string(values.size()));
    }

    ByteBuffer out;
    for (std::size_t i = 0; i < widths.size(); ++i) {
        put_checked(out, values[i], widths[i], endian);
    }
    return out;
}

ByteBuffer encode_array(unsigned widthBits, Endian endian, const std::vector<std::uint64_t>& values)
{
    const std::uint8_t width = width_bytes_for(widthBits);

    ByteBuffer out;
    out.reserve(values.size() * width);
    for (std::uint64_t v : values) {
        put_checked(out, v, width, endian);
    }
    return out;
}

} // namespace keylink::io::protocol
