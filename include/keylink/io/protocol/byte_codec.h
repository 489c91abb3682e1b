#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace keylink::io::bytecodec {

enum class Endian : std::uint8_t {
    Little,
    Big,
};

// Bounds-checked reader over a byte span.
class Reader {
public:
    Reader(const std::uint8_t* data, std::size_t size)
        : _begin(data), _p(data), _end(data + size) {}

    explicit Reader(const std::vector<std::uint8_t>& buf)
        : Reader(buf.data(), buf.size()) {}

    bool read_u8(std::uint8_t& out) {
        if (remaining() < 1) return false;
        out = *_p++;
        return true;
    }

    bool read_u16(std::uint16_t& out, Endian e) {
        std::uint64_t v = 0;
        if (!read_uint(v, 2, e)) return false;
        out = static_cast<std::uint16_t>(v);
        return true;
    }

    bool read_u32(std::uint32_t& out, Endian e) {
        std::uint64_t v = 0;
        if (!read_uint(v, 4, e)) return false;
        out = static_cast<std::uint32_t>(v);
        return true;
    }

    bool read_u64(std::uint64_t& out, Endian e) {
        return read_uint(out, 8, e);
    }

    bool read_u16le(std::uint16_t& out) { return read_u16(out, Endian::Little); }
    bool read_u32le(std::uint32_t& out) { return read_u32(out, Endian::Little); }
    bool read_u16be(std::uint16_t& out) { return read_u16(out, Endian::Big); }

    // Unsigned integer of 1..8 bytes.
    bool read_uint(std::uint64_t& out, std::size_t width, Endian e) {
        if (width == 0 || width > 8 || remaining() < width) return false;
        out = 0;
        for (std::size_t i = 0; i < width; ++i) {
            const std::size_t shift = (e == Endian::Little) ? i : (width - 1 - i);
            out |= static_cast<std::uint64_t>(_p[i]) << (8U * shift);
        }
        _p += width;
        return true;
    }

    bool read_bytes(const std::uint8_t*& ptr, std::size_t n) {
        if (remaining() < n) return false;
        ptr = _p;
        _p += n;
        return true;
    }

    bool skip(std::size_t n) {
        if (remaining() < n) return false;
        _p += n;
        return true;
    }

    bool seek(std::size_t pos) {
        if (pos > static_cast<std::size_t>(_end - _begin)) return false;
        _p = _begin + pos;
        return true;
    }

    std::size_t remaining() const { return static_cast<std::size_t>(_end - _p); }
    std::size_t pos() const { return static_cast<std::size_t>(_p - _begin); }

private:
    const std::uint8_t* _begin{};
    const std::uint8_t* _p{};
    const std::uint8_t* _end{};
};

// -----------------------------
// Writer helpers
// -----------------------------

inline void write_u8(std::vector<std::uint8_t>& out, std::uint8_t v) {
    out.push_back(v);
}

inline void write_uint(std::vector<std::uint8_t>& out, std::uint64_t v, std::size_t width, Endian e) {
    for (std::size_t i = 0; i < width; ++i) {
        const std::size_t shift = (e == Endian::Little) ? i : (width - 1 - i);
        out.push_back(static_cast<std::uint8_t>((v >> (8U * shift)) & 0xFF));
    }
}

inline void write_u16le(std::vector<std::uint8_t>& out, std::uint16_t v) {
    write_uint(out, v, 2, Endian::Little);
}

inline void write_u16be(std::vector<std::uint8_t>& out, std::uint16_t v) {
    write_uint(out, v, 2, Endian::Big);
}

inline void write_u32le(std::vector<std::uint8_t>& out, std::uint32_t v) {
    write_uint(out, v, 4, Endian::Little);
}

inline void write_bytes(std::vector<std::uint8_t>& out, const std::uint8_t* data, std::size_t n) {
    out.insert(out.end(), data, data + n);
}

} // namespace keylink::io::bytecodec
