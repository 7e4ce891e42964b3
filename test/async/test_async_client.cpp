#include <gtest/gtest.h>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "modbus_link/async/async_client.hpp"
#include "modbus_link/async/async_transport.hpp"
#include "modbus_link/common/errors.hpp"
#include "modbus_link/common/exception_code.hpp"
#include "modbus_link/common/wire_format_options.hpp"
#include "modbus_link/pdu/pdu.hpp"
#include "../support/run_awaitable.hpp"

namespace asio = boost::asio;

using mblink::AsyncClient;
using mblink::AsyncTransport;
using mblink::ByteOrder;
using mblink::ExceptionCode;
using mblink::InvalidArgumentError;
using mblink::InvalidResponseError;
using mblink::ModbusException;
using mblink::Pdu;
using mblink::WireFormatOptions;
using mblink::WordOrder;
using mblink::testing::RunAwaitable;

namespace {

/**
 * @brief AsyncTransport that records requests and answers from a queue
 */
class ScriptedAsyncTransport : public AsyncTransport {
 public:
  asio::awaitable<void> Open() override {
    open_ = true;
    co_return;
  }
  void Close() override { open_ = false; }
  [[nodiscard]] bool IsOpen() const override { return open_; }

  asio::awaitable<std::optional<Pdu>> Exchange(uint8_t unit_id, Pdu request) override {
    unit_ids_.push_back(unit_id);
    requests_.push_back(std::move(request));
    std::optional<Pdu> response;
    if (!responses_.empty()) {
      response = responses_.front();
      responses_.pop_front();
    }
    co_return response;
  }

  void Respond(std::optional<Pdu> response) { responses_.push_back(std::move(response)); }

  [[nodiscard]] std::vector<Pdu> const &Requests() const { return requests_; }
  [[nodiscard]] std::vector<uint8_t> const &UnitIds() const { return unit_ids_; }

 private:
  bool open_{true};
  std::deque<std::optional<Pdu>> responses_;
  std::vector<Pdu> requests_;
  std::vector<uint8_t> unit_ids_;
};

class AsyncClientTest : public ::testing::Test {
 protected:
  asio::io_context context_;
  ScriptedAsyncTransport transport_;
  AsyncClient client_{transport_};
};

}  // namespace

TEST_F(AsyncClientTest, ReadHoldingRegisters) {
  transport_.Respond(Pdu{0x03, {0x04, 0x00, 0x0A, 0x01, 0x02}});

  std::vector<uint16_t> registers = RunAwaitable(context_, client_.ReadHoldingRegisters(1, 0, 2));

  EXPECT_EQ(registers, (std::vector<uint16_t>{0x000A, 0x0102}));
  EXPECT_EQ(transport_.Requests()[0], (Pdu{0x03, {0x00, 0x00, 0x00, 0x02}}));
}

TEST_F(AsyncClientTest, ReadFloat32BigEndian) {
  transport_.Respond(Pdu{0x03, {0x04, 0x41, 0xCC, 0xCC, 0xCD}});
  EXPECT_FLOAT_EQ(RunAwaitable(context_, client_.ReadFloat32(1, 20)), 25.6F);
  EXPECT_EQ(transport_.Requests()[0], (Pdu{0x03, {0x00, 0x14, 0x00, 0x02}}));
}

TEST_F(AsyncClientTest, WriteFloat32LowWordFirst) {
  transport_.Respond(Pdu{0x10, {0x00, 0x14, 0x00, 0x02}});

  WireFormatOptions format{ByteOrder::BigEndian, WordOrder::LowWordFirst};
  RunAwaitable(context_, client_.WriteFloat32(1, 20, 25.6F, format));

  EXPECT_EQ(transport_.Requests()[0], (Pdu{0x10, {0x00, 0x14, 0x00, 0x02, 0x04, 0xCC, 0xCD, 0x41, 0xCC}}));
}

TEST_F(AsyncClientTest, Uint32RoundTripThroughRequests) {
  transport_.Respond(Pdu{0x10, {0x00, 0x00, 0x00, 0x02}});
  transport_.Respond(Pdu{0x03, {0x04, 0xDE, 0xAD, 0xBE, 0xEF}});

  RunAwaitable(context_, client_.WriteUint32(1, 0, 0xDEADBEEF));
  EXPECT_EQ(RunAwaitable(context_, client_.ReadUint32(1, 0)), 0xDEADBEEFU);
  EXPECT_EQ(transport_.Requests()[0].payload, (std::vector<uint8_t>{0x00, 0x00, 0x00, 0x02, 0x04, 0xDE, 0xAD, 0xBE,
                                                                    0xEF}));
}

TEST_F(AsyncClientTest, ExceptionResponseIsThrown) {
  transport_.Respond(Pdu{0x84, {0x02}});

  try {
    RunAwaitable(context_, client_.ReadInputRegisters(1, 0, 1));
    FAIL() << "expected ModbusException";
  } catch (ModbusException const &error) {
    EXPECT_EQ(error.GetFunctionCode(), 0x04);
    EXPECT_EQ(error.GetExceptionCode(), ExceptionCode::kIllegalDataAddress);
  }
}

TEST_F(AsyncClientTest, InvalidRequestsNeverReachTransport) {
  EXPECT_THROW(RunAwaitable(context_, client_.ReadCoils(1, 0, 0)), InvalidArgumentError);
  EXPECT_THROW(RunAwaitable(context_, client_.ReadDiscreteInputs(1, 0xFFFF, 2)), InvalidArgumentError);
  EXPECT_THROW(RunAwaitable(context_, client_.ReadHoldingRegisters(1, 0, 126)), InvalidArgumentError);
  EXPECT_THROW(RunAwaitable(context_, client_.WriteMultipleRegisters(1, 0, std::vector<uint16_t>(124, 1))),
               InvalidArgumentError);
  EXPECT_THROW(RunAwaitable(context_, client_.WriteMultipleCoils(1, 0, std::vector<bool>(1969))),
               InvalidArgumentError);
  EXPECT_THROW(RunAwaitable(context_, client_.ReadString(1, 0, 0)), InvalidArgumentError);

  EXPECT_TRUE(transport_.Requests().empty());
}

TEST_F(AsyncClientTest, MissingReadResponseIsInvalid) {
  transport_.Respond(std::nullopt);
  EXPECT_THROW(RunAwaitable(context_, client_.ReadCoils(1, 0, 1)), InvalidResponseError);
}

TEST_F(AsyncClientTest, BroadcastWriteCompletesWithoutResponse) {
  transport_.Respond(std::nullopt);
  int completions = 0;

  RunAwaitable(context_, client_.WriteMultipleCoils(0, 0, {true, true}, [&completions]() { ++completions; }));

  EXPECT_EQ(completions, 1);
  EXPECT_EQ(transport_.UnitIds()[0], 0);
}

TEST_F(AsyncClientTest, WriteCompletionSkippedOnBadEcho) {
  transport_.Respond(Pdu{0x05, {0x00, 0x01, 0x00, 0x00}});
  int completions = 0;

  EXPECT_THROW(RunAwaitable(context_, client_.WriteSingleCoil(1, 1, true, [&completions]() { ++completions; })),
               InvalidResponseError);
  EXPECT_EQ(completions, 0);
}

TEST_F(AsyncClientTest, StringLittleEndian) {
  transport_.Respond(Pdu{0x10, {0x00, 0x05, 0x00, 0x02}});
  transport_.Respond(Pdu{0x03, {0x04, 'b', 'a', 0x00, 'c'}});

  RunAwaitable(context_, client_.WriteString(1, 5, "abc", ByteOrder::LittleEndian));
  EXPECT_EQ(transport_.Requests()[0].payload,
            (std::vector<uint8_t>{0x00, 0x05, 0x00, 0x02, 0x04, 'b', 'a', 0x00, 'c'}));
  EXPECT_EQ(RunAwaitable(context_, client_.ReadString(1, 5, 3, ByteOrder::LittleEndian)), "abc");
}

TEST_F(AsyncClientTest, Float64Completion) {
  transport_.Respond(Pdu{0x03, {0x08, 0x3F, 0xF8, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}});
  double seen = 0.0;

  double value = RunAwaitable(context_, client_.ReadFloat64(1, 0, {}, [&seen](double const &v) { seen = v; }));

  EXPECT_DOUBLE_EQ(value, 1.5);
  EXPECT_DOUBLE_EQ(seen, 1.5);
}
