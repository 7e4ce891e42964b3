#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>
#include "byte_reader.hpp"
#include "byte_writer.hpp"

namespace mblink {

/**
 * @brief Incremental frame length rule: bytes still missing from a frame starting with the given prefix
 *
 * Returns 0 once the prefix is a complete frame. May throw InvalidResponseError when the
 * prefix can never become a valid frame.
 */
using BytesNeededFn = size_t (*)(std::span<uint8_t const>);

/**
 * @brief Write the whole buffer and flush, waiting for the stream to accept it until @p deadline
 * @throws TimeoutError if the stream still refuses bytes at @p deadline
 * @throws ConnectionError if the stream rejects the write
 */
void WriteAll(ByteWriter &writer, std::span<uint8_t const> data, std::chrono::steady_clock::time_point deadline);

/**
 * @brief Read exactly one frame, as delimited by @p bytes_needed
 *
 * The deadline bounds the whole frame, not each byte.
 * @throws TimeoutError if the frame is not complete by @p deadline
 * @throws ConnectionError if the stream reports an error or end of stream
 */
[[nodiscard]] std::vector<uint8_t> ReadFrame(ByteReader &reader, BytesNeededFn bytes_needed,
                                             std::chrono::steady_clock::time_point deadline);

/**
 * @brief Wait up to @p wait for the first byte of a frame
 * @return true if data (or end of stream) is ready
 */
[[nodiscard]] bool WaitForData(ByteReader const &reader, std::chrono::milliseconds wait);

/**
 * @brief Discard input until the line has been idle for @p idle_gap
 *
 * With a zero gap only what is already buffered is discarded.
 * @return Number of bytes discarded
 */
size_t DrainInput(ByteReader &reader, std::chrono::microseconds idle_gap);

}  // namespace mblink
