#pragma once

#include <cstddef>
#include <cstdint>
#include <future>
#include <vector>

#include "keylink/config/keylink_config.h"
#include "keylink/io/protocol/byte_codec.h"
#include "keylink/session/command_dispatcher.h"

namespace keylink::session {

using io::bytecodec::Endian;

// Buffers larger than one report, moved as a series of ordinary dispatcher
// calls. Each call owns its offset / accumulator and nothing else; the
// returned future completes on a helper thread once the last chunk is in.
//
// Never wait on these from the device FIFO worker.
class ChunkedTransfer {
public:
    ChunkedTransfer(CommandDispatcher& dispatcher, const config::ProtocolConfig& cfg);

    // Extension-set pull. The total size comes from `sizeCmd`, decoded with
    // `sizeOptions` (default: u32 after the command echo). Each `chunkCmd`
    // request is [offset:LE16][requested]; the reply is
    // [echo][offset:LE16][actual][data...]. A short chunk ends the transfer.
    // Fails with DecodeError when the size exceeds the configured limit.
    std::future<ByteBuffer> fetchChunked(std::uint8_t sizeCmd,
                                         std::uint8_t chunkCmd,
                                         DecodeOptions sizeOptions = DecodeOptions::scalar(32, 1));

    // Same chunk loop with a size already known.
    std::future<ByteBuffer> fetchChunkedSized(std::uint8_t chunkCmd, std::size_t totalSize);

    // Legacy-set pull of exactly `size` bytes: [offset:BE16][size] requests,
    // [echo][offset:BE16][size][data...] replies, the last chunk truncated.
    std::future<ByteBuffer> fetchBuffer(std::uint8_t cmd, std::size_t size);

    // fetchBuffer() viewed as big-endian 16-bit elements (keycodes).
    std::future<std::vector<std::uint16_t>> fetchBuffer16(std::uint8_t cmd, std::size_t elements);

    // Legacy-set push: one `cmd` per chunk, args [offset:2][data], the final
    // chunk zero padded to the chunk size.
    std::future<void> pushChunked(std::uint8_t cmd,
                                  ByteBuffer buffer,
                                  std::size_t totalSize,
                                  Endian offsetEndian = Endian::Little);

    // get(i) for i in [0, count), in order, on the extension set.
    std::future<std::vector<DecodedValue>> fetchEntries(std::uint8_t getCmd,
                                                        std::size_t count,
                                                        DecodeOptions options = {});

private:
    ByteBuffer pullChunks(std::uint8_t chunkCmd, std::size_t totalSize);
    ByteBuffer pullBuffer(std::uint8_t cmd, std::size_t size);

    CommandDispatcher&            _dispatcher;
    const config::ProtocolConfig& _cfg;
};

} // namespace keylink::session
