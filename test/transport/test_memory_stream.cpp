#include <gtest/gtest.h>
#include <array>
#include <cstdint>
#include <span>
#include <vector>
#include "modbus_link/common/errors.hpp"
#include "modbus_link/transport/memory_stream.hpp"

using mblink::ConnectionError;
using mblink::MemoryStream;

TEST(MemoryStream, StartsClosedAndEmpty) {
  MemoryStream stream;
  EXPECT_FALSE(stream.IsOpen());
  EXPECT_FALSE(stream.HasData());
  EXPECT_EQ(stream.AvailableBytes(), 0U);
  EXPECT_TRUE(stream.GetWrittenData().empty());
}

TEST(MemoryStream, ClosedStreamRejectsIo) {
  MemoryStream stream;
  std::array<uint8_t, 4> buffer{};
  std::vector<uint8_t> data{0x01};
  EXPECT_EQ(stream.Read(buffer), -1);
  EXPECT_EQ(stream.Write(data), -1);
}

TEST(MemoryStream, ReadPartialData) {
  MemoryStream stream;
  stream.Open();
  stream.SetReadData(std::vector<uint8_t>{0x01, 0x02, 0x03, 0x04, 0x05});

  std::array<uint8_t, 3> buffer{};
  EXPECT_EQ(stream.Read(buffer), 3);
  EXPECT_EQ(buffer, (std::array<uint8_t, 3>{0x01, 0x02, 0x03}));
  EXPECT_TRUE(stream.HasData());
  EXPECT_EQ(stream.AvailableBytes(), 2U);
}

TEST(MemoryStream, ReadReturnsZeroWhenDrained) {
  MemoryStream stream;
  stream.Open();
  stream.SetReadData(std::vector<uint8_t>{0xAA});

  std::array<uint8_t, 4> buffer{};
  EXPECT_EQ(stream.Read(buffer), 1);
  EXPECT_EQ(stream.Read(buffer), 0);
}

TEST(MemoryStream, ChunkLimitCapsEachRead) {
  MemoryStream stream;
  stream.Open();
  stream.SetReadData(std::vector<uint8_t>{0x01, 0x02, 0x03, 0x04, 0x05});
  stream.SetReadChunkLimit(2);

  std::array<uint8_t, 8> buffer{};
  EXPECT_EQ(stream.Read(buffer), 2);
  EXPECT_EQ(stream.Read(buffer), 2);
  EXPECT_EQ(stream.Read(buffer), 1);

  stream.SetReadChunkLimit(0);
  stream.SetReadData(std::vector<uint8_t>{0x01, 0x02, 0x03});
  EXPECT_EQ(stream.Read(buffer), 3);
}

TEST(MemoryStream, AppendKeepsUnreadData) {
  MemoryStream stream;
  stream.Open();
  stream.SetReadData(std::vector<uint8_t>{0x01, 0x02});

  std::array<uint8_t, 1> one{};
  EXPECT_EQ(stream.Read(one), 1);
  stream.AppendReadData(std::vector<uint8_t>{0x03});

  std::array<uint8_t, 4> rest{};
  EXPECT_EQ(stream.Read(rest), 2);
  EXPECT_EQ(rest[0], 0x02);
  EXPECT_EQ(rest[1], 0x03);
}

TEST(MemoryStream, WritesAreRecorded) {
  MemoryStream stream;
  stream.Open();
  EXPECT_EQ(stream.Write(std::vector<uint8_t>{0x01, 0x02}), 2);
  EXPECT_EQ(stream.Write(std::vector<uint8_t>{0x03}), 1);
  EXPECT_EQ(stream.GetWrittenData(), (std::vector<uint8_t>{0x01, 0x02, 0x03}));

  stream.ClearWriteBuffer();
  EXPECT_TRUE(stream.GetWrittenData().empty());
}

TEST(MemoryStream, ResponderQueuesReply) {
  MemoryStream stream;
  stream.Open();
  stream.SetResponder([](std::span<uint8_t const> request) {
    return std::vector<uint8_t>{static_cast<uint8_t>(request[0] + 1)};
  });

  EXPECT_EQ(stream.Write(std::vector<uint8_t>{0x41}), 1);

  std::array<uint8_t, 2> buffer{};
  EXPECT_EQ(stream.Read(buffer), 1);
  EXPECT_EQ(buffer[0], 0x42);
}

TEST(MemoryStream, CountsWritesWithUnreadInput) {
  MemoryStream stream;
  stream.Open();
  EXPECT_EQ(stream.Write(std::vector<uint8_t>{0x01}), 1);
  EXPECT_EQ(stream.WritesWithPendingInput(), 0U);

  stream.SetReadData(std::vector<uint8_t>{0xFF});
  EXPECT_EQ(stream.Write(std::vector<uint8_t>{0x02}), 1);
  EXPECT_EQ(stream.WritesWithPendingInput(), 1U);
}

TEST(MemoryStream, FailOpen) {
  MemoryStream stream;
  stream.SetFailOpen(true);
  EXPECT_THROW(stream.Open(), ConnectionError);
  EXPECT_FALSE(stream.IsOpen());
}
