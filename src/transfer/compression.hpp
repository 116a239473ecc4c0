#pragma once

// DEFLATE compression/decompression for transfer chunks.
//
// Chunks are compressed independently with raw DEFLATE (no zlib/gzip
// header) so any chunk can be retried or resumed on its own.
//
// Internal header, not installed.

#include <algorithm>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include <zlib.h>

namespace peersync::transfer {

// Upper bound on one decompressed chunk, guards against inflate bombs.
inline constexpr std::size_t max_inflated_chunk = std::size_t{256} * 1024 * 1024;

// Compress data using raw DEFLATE at the given zlib level (0-9).
inline auto deflate_compress(std::span<const std::byte> input, int level = Z_DEFAULT_COMPRESSION)
    -> std::optional<std::vector<std::byte>> {

    if (input.empty()) return std::vector<std::byte>{};

    auto stream = z_stream{};
    // windowBits = -15 for raw deflate (negative = no header)
    auto ret = ::deflateInit2(&stream, level, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) return std::nullopt;

    auto bound = ::deflateBound(&stream, static_cast<uLong>(input.size()));
    auto output = std::vector<std::byte>(bound);

    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(bound);

    ret = ::deflate(&stream, Z_FINISH);
    ::deflateEnd(&stream);

    if (ret != Z_STREAM_END) return std::nullopt;

    output.resize(stream.total_out);
    return output;
}

// Decompress raw DEFLATE data (no zlib/gzip header).
// Returns nullopt on corrupt input or when the output would exceed max_output_size.
inline auto deflate_decompress(std::span<const std::byte> input,
                               std::size_t max_output_size = max_inflated_chunk)
    -> std::optional<std::vector<std::byte>> {

    if (input.empty()) return std::vector<std::byte>{};

    // Start with 4x the input size, grow if needed
    auto output_size = std::min(input.size() * 4, max_output_size);
    auto output = std::vector<std::byte>(output_size);

    auto stream = z_stream{};
    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(output_size);

    auto ret = ::inflateInit2(&stream, -15);
    if (ret != Z_OK) return std::nullopt;

    ret = ::inflate(&stream, Z_FINISH);

    // Grow only while inflate stopped because the output buffer is full.
    while ((ret == Z_BUF_ERROR || ret == Z_OK) && stream.avail_out == 0 &&
           output_size < max_output_size) {
        auto written = stream.total_out;
        output_size = std::min(output_size * 2, max_output_size);
        output.resize(output_size);
        stream.next_out = reinterpret_cast<Bytef*>(output.data() + written);
        stream.avail_out = static_cast<uInt>(output_size - written);
        ret = ::inflate(&stream, Z_FINISH);
    }

    ::inflateEnd(&stream);

    if (ret != Z_STREAM_END) return std::nullopt;

    output.resize(stream.total_out);
    return output;
}

}  // namespace peersync::transfer
