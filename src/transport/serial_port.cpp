#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <string>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>
#include "common/errors.hpp"
#include "transport/serial_port.hpp"

namespace mblink {

namespace {

speed_t GetBaudRate(int baud) {
  switch (baud) {
    case 1200:
      return B1200;
    case 2400:
      return B2400;
    case 4800:
      return B4800;
    case 9600:
      return B9600;
    case 19200:
      return B19200;
    case 38400:
      return B38400;
    case 57600:
      return B57600;
    case 115200:
      return B115200;
    case 230400:
      return B230400;
    default:
      throw InvalidArgumentError("unsupported baud rate " + std::to_string(baud));
  }
}

tcflag_t GetCharacterSize(int data_bits) {
  switch (data_bits) {
    case 5:
      return CS5;
    case 6:
      return CS6;
    case 7:
      return CS7;
    case 8:
      return CS8;
    default:
      throw InvalidArgumentError("unsupported data bits " + std::to_string(data_bits));
  }
}

std::string SystemError(std::string const &what, std::string const &port) {
  return what + " " + port + ": " + std::strerror(errno);
}

}  // namespace

void SerialPort::Open() {
  if (fd_ >= 0) {
    return;
  }

  // Validate before touching the device
  speed_t speed = GetBaudRate(config_.baud_rate);
  tcflag_t character_size = GetCharacterSize(config_.data_bits);

  fd_ = ::open(config_.port.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) {
    throw ConnectionError(SystemError("cannot open", config_.port));
  }

  struct termios tty {};
  if (::tcgetattr(fd_, &tty) != 0) {
    std::string message = SystemError("cannot read settings of", config_.port);
    Close();
    throw ConnectionError(message);
  }

  if (::cfsetispeed(&tty, speed) != 0 || ::cfsetospeed(&tty, speed) != 0) {
    std::string message = SystemError("cannot set baud rate of", config_.port);
    Close();
    throw ConnectionError(message);
  }

  // Raw mode: no line editing, no echo, no translation
  tty.c_iflag &= ~(IGNBRK | BRKINT | PARMRK | ISTRIP | INLCR | IGNCR | ICRNL | IXON);
  tty.c_oflag &= ~OPOST;
  tty.c_lflag &= ~(ECHO | ECHONL | ICANON | ISIG | IEXTEN);
  tty.c_cflag &= ~(CSIZE | PARENB | PARODD | CSTOPB | CRTSCTS);
  tty.c_cflag |= character_size | CLOCAL | CREAD;

  switch (config_.parity) {
    case 'E':
    case 'e':
      tty.c_cflag |= PARENB;
      break;
    case 'O':
    case 'o':
      tty.c_cflag |= PARENB | PARODD;
      break;
    default:
      break;
  }
  if (config_.stop_bits == 2) {
    tty.c_cflag |= CSTOPB;
  }

  // Reads return immediately with whatever is available
  tty.c_cc[VMIN] = 0;
  tty.c_cc[VTIME] = 0;

  if (::tcsetattr(fd_, TCSANOW, &tty) != 0) {
    std::string message = SystemError("cannot configure", config_.port);
    Close();
    throw ConnectionError(message);
  }
  if (::tcflush(fd_, TCIOFLUSH) != 0) {
    std::string message = SystemError("cannot flush", config_.port);
    Close();
    throw ConnectionError(message);
  }
}

void SerialPort::Close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

int SerialPort::Read(std::span<uint8_t> buffer) {
  if (fd_ < 0) {
    return -1;
  }
  ssize_t bytes_read = ::read(fd_, buffer.data(), buffer.size());
  if (bytes_read < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
      return 0;  // No data available, not an error
    }
    return -1;
  }
  return static_cast<int>(bytes_read);
}

bool SerialPort::HasData() const {
  return AvailableBytes() > 0;
}

size_t SerialPort::AvailableBytes() const {
  if (fd_ < 0) {
    return 0;
  }
  int bytes_available = 0;
  if (::ioctl(fd_, FIONREAD, &bytes_available) == 0 && bytes_available > 0) {
    return static_cast<size_t>(bytes_available);
  }
  return 0;
}

int SerialPort::Write(std::span<uint8_t const> data) {
  if (fd_ < 0) {
    return -1;
  }
  ssize_t bytes_written = ::write(fd_, data.data(), data.size());
  if (bytes_written < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
      return 0;
    }
    return -1;
  }
  return static_cast<int>(bytes_written);
}

bool SerialPort::WaitWritable(std::chrono::milliseconds wait) {
  if (fd_ < 0) {
    return true;
  }
  struct pollfd pfd {};
  pfd.fd = fd_;
  pfd.events = POLLOUT;
  return ::poll(&pfd, 1, static_cast<int>(wait.count())) != 0;
}

bool SerialPort::Flush() {
  if (fd_ < 0) {
    return false;
  }
  return ::tcdrain(fd_) == 0;
}

}  // namespace mblink
