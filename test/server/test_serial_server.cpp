#include <gtest/gtest.h>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include "modbus_link/common/errors.hpp"
#include "modbus_link/server/data_store.hpp"
#include "modbus_link/server/serial_server.hpp"
#include "modbus_link/server/server_options.hpp"
#include "modbus_link/transport/memory_stream.hpp"
#include "modbus_link/transport/serial_framing.hpp"
#include "../support/recording_diagnostics.hpp"

using mblink::ConnectionError;
using mblink::DataStore;
using mblink::ErrorCode;
using mblink::MemoryStream;
using mblink::RegisterTable;
using mblink::SerialFraming;
using mblink::SerialServer;
using mblink::ServerOptions;
using mblink::testing::RecordingDiagnostics;

namespace {

constexpr std::chrono::milliseconds kWait{20};

std::vector<uint8_t> Bytes(std::string const &text) { return {text.begin(), text.end()}; }

class SerialServerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    std::vector<uint16_t> values{0x000A, 0x0102};
    ASSERT_TRUE(store_.WriteRegisters(RegisterTable::kHolding, 0, values));
  }

  std::unique_ptr<SerialServer> MakeServer(SerialFraming framing) {
    auto stream = std::make_unique<MemoryStream>();
    stream->Open();
    line_ = stream.get();
    ServerOptions options;
    options.unit_id = 1;
    options.frame_timeout = std::chrono::milliseconds(50);
    options.diagnostics = &diagnostics_;
    return std::make_unique<SerialServer>(std::move(stream), framing, store_, options, 115200);
  }

  DataStore store_;
  RecordingDiagnostics diagnostics_;
  MemoryStream *line_{nullptr};
};

}  // namespace

TEST_F(SerialServerTest, IdleLineReturnsFalse) {
  auto server = MakeServer(SerialFraming::kRtu);
  EXPECT_FALSE(server->ServeOnce(kWait));
  EXPECT_TRUE(line_->GetWrittenData().empty());
}

TEST_F(SerialServerTest, AnswersRtuReadHoldingRegisters) {
  auto server = MakeServer(SerialFraming::kRtu);
  line_->SetReadData(std::vector<uint8_t>{0x01, 0x03, 0x00, 0x00, 0x00, 0x02, 0xC4, 0x0B});

  EXPECT_TRUE(server->ServeOnce(kWait));

  EXPECT_EQ(line_->GetWrittenData(), (std::vector<uint8_t>{0x01, 0x03, 0x04, 0x00, 0x0A, 0x01, 0x02, 0x5A, 0x60}));
  EXPECT_EQ(diagnostics_.Received().size(), 1U);
  EXPECT_EQ(diagnostics_.Sent().size(), 1U);
}

TEST_F(SerialServerTest, AnswersAsciiReadHoldingRegisters) {
  auto server = MakeServer(SerialFraming::kAscii);
  line_->SetReadData(Bytes(":010300000002FA\r\n"));

  EXPECT_TRUE(server->ServeOnce(kWait));

  EXPECT_EQ(line_->GetWrittenData(), Bytes(":010304000A0102EB\r\n"));
}

TEST_F(SerialServerTest, IgnoresOtherUnits) {
  auto server = MakeServer(SerialFraming::kRtu);
  line_->SetReadData(std::vector<uint8_t>{0x11, 0x03, 0x00, 0x6B, 0x00, 0x03, 0x76, 0x87});

  EXPECT_TRUE(server->ServeOnce(kWait));

  EXPECT_TRUE(line_->GetWrittenData().empty());
  EXPECT_TRUE(diagnostics_.Errors().empty());
}

TEST_F(SerialServerTest, AppliesBroadcastWithoutReply) {
  auto server = MakeServer(SerialFraming::kRtu);
  line_->SetReadData(std::vector<uint8_t>{0x00, 0x06, 0x00, 0x01, 0x00, 0x03, 0x99, 0xDA});

  EXPECT_TRUE(server->ServeOnce(kWait));

  EXPECT_TRUE(line_->GetWrittenData().empty());
  EXPECT_EQ(store_.ReadRegisters(RegisterTable::kHolding, 1, 1), (std::vector<uint16_t>{3}));
}

TEST_F(SerialServerTest, DiscardsFrameWithBadCrc) {
  auto server = MakeServer(SerialFraming::kRtu);
  line_->SetReadData(std::vector<uint8_t>{0x01, 0x06, 0x00, 0x01, 0x00, 0x03, 0x00, 0x00});

  EXPECT_TRUE(server->ServeOnce(kWait));

  EXPECT_TRUE(line_->GetWrittenData().empty());
  EXPECT_EQ(store_.ReadRegisters(RegisterTable::kHolding, 1, 1), (std::vector<uint16_t>{0x0102}));
  EXPECT_EQ(diagnostics_.Errors(), (std::vector<ErrorCode>{ErrorCode::kChecksum}));
}

TEST_F(SerialServerTest, RecoversAfterIncompleteFrame) {
  auto server = MakeServer(SerialFraming::kRtu);
  line_->SetReadData(std::vector<uint8_t>{0x01, 0x03, 0x00});

  EXPECT_TRUE(server->ServeOnce(kWait));
  EXPECT_EQ(diagnostics_.Errors(), (std::vector<ErrorCode>{ErrorCode::kTimeout}));

  line_->SetReadData(std::vector<uint8_t>{0x01, 0x03, 0x00, 0x00, 0x00, 0x02, 0xC4, 0x0B});
  EXPECT_TRUE(server->ServeOnce(kWait));
  EXPECT_EQ(line_->GetWrittenData().size(), 9U);
}

TEST_F(SerialServerTest, RepliesWithExceptionForBadAddress) {
  auto server = MakeServer(SerialFraming::kAscii);
  // Read 1 register at 0x2710, beyond the default 1000-entry table
  std::vector<uint8_t> request = Bytes(":010327100001C4\r\n");
  line_->SetReadData(request);

  EXPECT_TRUE(server->ServeOnce(kWait));

  EXPECT_EQ(line_->GetWrittenData(), Bytes(":0183027A\r\n"));
}

TEST_F(SerialServerTest, StalledLineDropsReply) {
  auto server = MakeServer(SerialFraming::kRtu);
  line_->SetReadData(std::vector<uint8_t>{0x01, 0x03, 0x00, 0x00, 0x00, 0x02, 0xC4, 0x0B});
  line_->SetWriteStalled(true);

  EXPECT_TRUE(server->ServeOnce(kWait));

  EXPECT_TRUE(line_->GetWrittenData().empty());
  EXPECT_EQ(diagnostics_.Errors(), (std::vector<ErrorCode>{ErrorCode::kTimeout}));
  EXPECT_TRUE(line_->IsOpen());
}

TEST_F(SerialServerTest, ClosedStreamIsConnectionError) {
  auto server = MakeServer(SerialFraming::kRtu);
  line_->Close();
  EXPECT_THROW(static_cast<void>(server->ServeOnce(kWait)), ConnectionError);
}

TEST_F(SerialServerTest, BackgroundThreadServesUntilStopped) {
  auto server = MakeServer(SerialFraming::kRtu);
  server->Start();
  EXPECT_TRUE(server->IsRunning());

  line_->SetReadData(std::vector<uint8_t>{0x01, 0x03, 0x00, 0x00, 0x00, 0x02, 0xC4, 0x0B});
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (line_->GetWrittenData().empty() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  server->Stop();
  EXPECT_FALSE(server->IsRunning());
  EXPECT_EQ(line_->GetWrittenData().size(), 9U);
  EXPECT_EQ(diagnostics_.Messages(), (std::vector<std::string>{"server started", "server stopped"}));
}

TEST_F(SerialServerTest, RestartsAfterStreamFailure) {
  auto server = MakeServer(SerialFraming::kRtu);
  server->Start();
  line_->Close();

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (server->IsRunning() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  ASSERT_FALSE(server->IsRunning());
  EXPECT_EQ(diagnostics_.Errors(), (std::vector<ErrorCode>{ErrorCode::kConnection}));

  server->Start();
  EXPECT_TRUE(server->IsRunning());
  EXPECT_TRUE(line_->IsOpen());

  line_->SetReadData(std::vector<uint8_t>{0x01, 0x03, 0x00, 0x00, 0x00, 0x02, 0xC4, 0x0B});
  deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (line_->GetWrittenData().empty() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  server->Stop();
  EXPECT_EQ(line_->GetWrittenData().size(), 9U);
}
