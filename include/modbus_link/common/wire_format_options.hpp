#pragma once

namespace mblink {

/**
 * @brief Byte order inside each 16-bit register of a multi-register value.
 */
enum class ByteOrder {
  /** High byte first (standard Modbus, big-endian) */
  BigEndian,
  /** Low byte first (little-endian) */
  LittleEndian
};

/**
 * @brief Order of the 16-bit registers that make up a 32/64-bit value.
 */
enum class WordOrder {
  /** Most significant word in the lowest register address */
  HighWordFirst,
  /** Least significant word in the lowest register address */
  LowWordFirst
};

/**
 * @brief Layout of extended data types (int32, uint32, float32, float64, strings) over registers.
 */
struct WireFormatOptions {
  ByteOrder byte_order{ByteOrder::BigEndian};
  WordOrder word_order{WordOrder::HighWordFirst};
};

}  // namespace mblink
