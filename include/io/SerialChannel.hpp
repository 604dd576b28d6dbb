#pragma once
/** @file  SerialChannel.hpp
 *  @brief Non-blocking UART line I/O wrapper (termios + Asio stream_descriptor).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <array>
#include <functional>
#include <optional>
#include <string>

// Linux header
#include <termios.h> // for speed_t types e.g., B115200

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

namespace geoedge {
  namespace core {
    class Logger;
  }

  namespace io {

    /**
 * @class SerialChannel
 * @brief RAII wrapper around a single /dev/tty* file descriptor.
 *
 *  * Frames I/O as ASCII lines (`\r\n`).
 *  * Reads are asynchronous on the owning io_context; writes are a short
 *    blocking loop (lines are small).
 *  * Non-copyable, non-movable: the read loop captures `this`.
 */
    class SerialChannel {

    public:
      using LineHandler = std::function<void(const std::string&)>;

      //---ctr / dtr--------------------------------------------
      SerialChannel(boost::asio::io_context& io, core::Logger& log);
      virtual ~SerialChannel(); // close the /dev/tty fd at destruction

      //---public API-------------------------------------------
      virtual bool open(const std::string& dev, speed_t baud);
      virtual bool writeLine(const std::string& line); // returns false on EIO
      virtual void startReading(LineHandler onLine);   // one call per line, CRLF stripped
      void close();
      bool isOpen() const { return stream_.is_open(); }

      /// 9600, 19200, ... 921600 -> B*; std::nullopt for unsupported rates.
      static std::optional<speed_t> toSpeed(int baud);

      //---non-copyable / non-movable---------------------------
      SerialChannel(const SerialChannel&) = delete;
      SerialChannel& operator=(const SerialChannel&) = delete;
      SerialChannel(SerialChannel&&) = delete;
      SerialChannel& operator=(SerialChannel&&) = delete;

    protected:
      /// Splits complete lines off rx_buffer_ and hands them to the handler.
      void consume(const char* data, std::size_t n);

    private:
      void readSome();

      core::Logger& log_;
      boost::asio::posix::stream_descriptor stream_;
      std::array<char, 256> rx_chunk_{};
      std::string rx_buffer_{}; ///< bytes after the last CRLF
      LineHandler onLine_{};
    };
  } // namespace io
} // namespace geoedge
