#include "keylink/session/chunked_transfer.h"

#include "keylink/core/errors.h"
#include "keylink/core/logging.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace keylink::session {

static constexpr const char* TAG = "chunk";

using io::protocol::PAYLOAD_SIZE;
using io::protocol::value_as;

namespace bc = io::bytecodec;

namespace {

// Chunk replies: [echo][offset:2][size][data...]
constexpr std::size_t CHUNK_SIZE_POS   = 3;
constexpr std::size_t CHUNK_DATA_POS   = 4;
constexpr std::size_t MAX_CHUNK_DATA   = PAYLOAD_SIZE - CHUNK_DATA_POS;   // 22

bool echoes_offset(const ByteBuffer& payload, std::uint16_t offset, Endian e)
{
    bc::Reader r(payload);
    std::uint16_t echoed = 0;
    return r.skip(1) && r.read_u16(echoed, e) && echoed == offset;
}

std::uint16_t wire_offset(std::size_t offset)
{
    if (offset > 0xFFFF) {
        throw std::invalid_argument("chunk offset " + std::to_string(offset) +
                                    " does not fit 16 bits");
    }
    return static_cast<std::uint16_t>(offset);
}

} // namespace

ChunkedTransfer::ChunkedTransfer(CommandDispatcher& dispatcher, const config::ProtocolConfig& cfg)
    : _dispatcher(dispatcher)
    , _cfg(cfg)
{
    if (_cfg.chunkSize == 0 || _cfg.chunkSize > MAX_CHUNK_DATA) {
        throw std::invalid_argument("chunk size must be 1.." + std::to_string(MAX_CHUNK_DATA) +
                                    ", got " + std::to_string(_cfg.chunkSize));
    }
}

std::future<ByteBuffer> ChunkedTransfer::fetchChunked(std::uint8_t sizeCmd,
                                                      std::uint8_t chunkCmd,
                                                      DecodeOptions sizeOptions)
{
    return std::async(std::launch::async, [this, sizeCmd, chunkCmd, sizeOptions]() {
        const DecodedValue sizeValue =
            _dispatcher.sendExtension(sizeCmd, {}, sizeOptions).get();
        const std::uint64_t total = value_as<std::uint64_t>(sizeValue);

        if (total > _cfg.maxDefinitionSize) {
            KL_LOGE(TAG, "reported size %llu exceeds limit %zu",
                    static_cast<unsigned long long>(total), _cfg.maxDefinitionSize);
            throw DecodeError("reported size " + std::to_string(total) + " exceeds limit " +
                              std::to_string(_cfg.maxDefinitionSize));
        }

        KL_LOGI(TAG, "pull of %llu bytes via cmd 0x%02x", static_cast<unsigned long long>(total),
                chunkCmd);
        return pullChunks(chunkCmd, static_cast<std::size_t>(total));
    });
}

std::future<ByteBuffer> ChunkedTransfer::fetchChunkedSized(std::uint8_t chunkCmd, std::size_t totalSize)
{
    return std::async(std::launch::async, [this, chunkCmd, totalSize]() {
        return pullChunks(chunkCmd, totalSize);
    });
}

ByteBuffer ChunkedTransfer::pullChunks(std::uint8_t chunkCmd, std::size_t totalSize)
{
    ByteBuffer accumulated;
    accumulated.reserve(totalSize);

    std::size_t offset = 0;
    while (offset < totalSize) {
        const std::size_t requested = std::min(_cfg.chunkSize, totalSize - offset);
        const std::uint16_t at = wire_offset(offset);

        ByteBuffer args;
        bc::write_u16le(args, at);
        bc::write_u8(args, static_cast<std::uint8_t>(requested));

        const ByteBuffer payload = value_as<ByteBuffer>(
            _dispatcher.sendExtension(chunkCmd, std::move(args), DecodeOptions::raw(),
                                      [at](const ByteBuffer& p) {
                                          return echoes_offset(p, at, Endian::Little);
                                      })
                .get());

        const std::size_t actual = payload[CHUNK_SIZE_POS];
        if (actual > payload.size() - CHUNK_DATA_POS) {
            throw DecodeError("chunk at offset " + std::to_string(offset) + " claims " +
                              std::to_string(actual) + " data bytes");
        }

        const std::size_t take = std::min(actual, totalSize - offset);
        accumulated.insert(accumulated.end(),
                           payload.begin() + CHUNK_DATA_POS,
                           payload.begin() + CHUNK_DATA_POS + take);
        offset += take;

        KL_LOGV(TAG, "chunk @%u requested %zu got %zu", at, requested, actual);

        if (actual < requested) {
            KL_LOGD(TAG, "short chunk, end of data at %zu/%zu", offset, totalSize);
            break;
        }
    }

    return accumulated;
}

std::future<ByteBuffer> ChunkedTransfer::fetchBuffer(std::uint8_t cmd, std::size_t size)
{
    return std::async(std::launch::async, [this, cmd, size]() {
        return pullBuffer(cmd, size);
    });
}

std::future<std::vector<std::uint16_t>> ChunkedTransfer::fetchBuffer16(std::uint8_t cmd, std::size_t elements)
{
    return std::async(std::launch::async, [this, cmd, elements]() {
        const ByteBuffer bytes = pullBuffer(cmd, elements * 2);
        return value_as<std::vector<std::uint16_t>>(
            io::protocol::decode_payload(bytes, DecodeOptions::array(16, Endian::Big)));
    });
}

ByteBuffer ChunkedTransfer::pullBuffer(std::uint8_t cmd, std::size_t size)
{
    ByteBuffer accumulated;
    accumulated.reserve(size);

    for (std::size_t offset = 0; offset < size; offset += _cfg.chunkSize) {
        const std::size_t sz = std::min(_cfg.chunkSize, size - offset);
        const std::uint16_t at = wire_offset(offset);

        ByteBuffer args;
        bc::write_u16be(args, at);
        bc::write_u8(args, static_cast<std::uint8_t>(sz));

        const ByteBuffer data = value_as<ByteBuffer>(
            _dispatcher.sendLegacy(cmd, std::move(args), DecodeOptions::raw(CHUNK_DATA_POS),
                                   [at](const ByteBuffer& p) {
                                       return echoes_offset(p, at, Endian::Big);
                                   })
                .get());

        accumulated.insert(accumulated.end(), data.begin(), data.begin() + sz);
    }

    KL_LOGD(TAG, "buffer cmd 0x%02x: %zu bytes", cmd, accumulated.size());
    return accumulated;
}

std::future<void> ChunkedTransfer::pushChunked(std::uint8_t cmd,
                                               ByteBuffer buffer,
                                               std::size_t totalSize,
                                               Endian offsetEndian)
{
    if (totalSize > buffer.size()) {
        throw std::invalid_argument("push of " + std::to_string(totalSize) +
                                    " bytes from a " + std::to_string(buffer.size()) +
                                    "-byte buffer");
    }

    return std::async(std::launch::async,
                      [this, cmd, buffer = std::move(buffer), totalSize, offsetEndian]() {
        for (std::size_t offset = 0; offset < totalSize; offset += _cfg.chunkSize) {
            const std::size_t n = std::min(_cfg.chunkSize, totalSize - offset);

            ByteBuffer args;
            bc::write_uint(args, wire_offset(offset), 2, offsetEndian);
            bc::write_bytes(args, buffer.data() + offset, n);
            args.resize(args.size() + (_cfg.chunkSize - n), 0);

            _dispatcher.sendLegacy(cmd, std::move(args)).get();
        }
        KL_LOGD(TAG, "pushed %zu bytes via cmd 0x%02x", totalSize, cmd);
    });
}

std::future<std::vector<DecodedValue>> ChunkedTransfer::fetchEntries(std::uint8_t getCmd,
                                                                     std::size_t count,
                                                                     DecodeOptions options)
{
    if (count > 0x100) {
        throw std::invalid_argument("entry index must fit one byte, count " + std::to_string(count));
    }

    return std::async(std::launch::async, [this, getCmd, count, options]() {
        std::vector<DecodedValue> entries;
        entries.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            entries.push_back(
                _dispatcher.sendExtension(getCmd, {static_cast<std::uint8_t>(i)}, options).get());
        }
        return entries;
    });
}

} // namespace keylink::session
