#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <thread>
#include <vector>
#include "common/errors.hpp"
#include "transport/byte_reader.hpp"
#include "transport/byte_writer.hpp"
#include "transport/stream_io.hpp"

namespace mblink {

namespace {

constexpr std::chrono::milliseconds kPollInterval{1};
constexpr size_t kDrainChunkSize = 64;

}  // namespace

void WriteAll(ByteWriter &writer, std::span<uint8_t const> data, std::chrono::steady_clock::time_point deadline) {
  size_t written = 0;
  while (written < data.size()) {
    int n = writer.Write(data.subspan(written));
    if (n < 0) {
      throw ConnectionError("write failed after " + std::to_string(written) + " of " + std::to_string(data.size()) +
                            " bytes");
    }
    if (n > 0) {
      written += static_cast<size_t>(n);
      continue;
    }

    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      throw TimeoutError("stream accepted " + std::to_string(written) + " of " + std::to_string(data.size()) +
                         " bytes before deadline");
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    static_cast<void>(writer.WaitWritable(std::max(remaining, kPollInterval)));
  }
  if (!writer.Flush()) {
    throw ConnectionError("flush failed");
  }
}

std::vector<uint8_t> ReadFrame(ByteReader &reader, BytesNeededFn bytes_needed,
                               std::chrono::steady_clock::time_point deadline) {
  std::vector<uint8_t> frame;
  frame.reserve(256);

  size_t needed = bytes_needed(frame);
  while (needed > 0) {
    if (std::chrono::steady_clock::now() >= deadline) {
      throw TimeoutError("no complete frame before deadline (" + std::to_string(frame.size()) + " bytes received)");
    }

    if (!reader.HasData()) {
      std::this_thread::sleep_for(kPollInterval);
      continue;
    }

    size_t current_size = frame.size();
    frame.resize(current_size + needed);
    int bytes_read = reader.Read(std::span<uint8_t>(frame.data() + current_size, needed));
    if (bytes_read < 0) {
      throw ConnectionError("read failed after " + std::to_string(current_size) + " bytes");
    }
    frame.resize(current_size + static_cast<size_t>(bytes_read));
    needed = bytes_needed(frame);
  }
  return frame;
}

bool WaitForData(ByteReader const &reader, std::chrono::milliseconds wait) {
  auto deadline = std::chrono::steady_clock::now() + wait;
  while (!reader.HasData()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(kPollInterval);
  }
  return true;
}

size_t DrainInput(ByteReader &reader, std::chrono::microseconds idle_gap) {
  std::array<uint8_t, kDrainChunkSize> scratch{};
  size_t discarded = 0;
  auto last_activity = std::chrono::steady_clock::now();

  while (true) {
    if (reader.HasData()) {
      int n = reader.Read(scratch);
      if (n <= 0) {
        return discarded;
      }
      discarded += static_cast<size_t>(n);
      last_activity = std::chrono::steady_clock::now();
      continue;
    }
    if (std::chrono::steady_clock::now() - last_activity >= idle_gap) {
      return discarded;
    }
    std::this_thread::sleep_for(std::min<std::chrono::microseconds>(idle_gap, kPollInterval));
  }
}

}  // namespace mblink
