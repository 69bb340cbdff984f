/* @file FrameCodec.cpp
 * @brief encode / validate / decode of TC4820 frames. No I/O.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cctype>
#include <cstdint>

// labcomm headers
#include "protocols/FrameCodec.hpp"

namespace labcomm {
  namespace protocols {

    namespace {
      constexpr char kHexDigits[] = "0123456789abcdef";

      int hexValue(char c) {
        if (c >= '0' && c <= '9')
          return c - '0';
        if (c >= 'a' && c <= 'f')
          return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
          return c - 'A' + 10;
        return -1;
      }

      std::string printable(std::string_view frame) {
        std::string out;
        for (char c : frame) {
          if (std::isprint(static_cast<unsigned char>(c)))
            out += c;
          else
            out += '.';
        }
        return out;
      }
    } // namespace

    std::string checksum(std::string_view bytes) {
      unsigned int sum = 0;
      for (char c : bytes)
        sum += static_cast<unsigned char>(c);
      sum &= 0xFF;

      return std::string{ kHexDigits[sum >> 4], kHexDigits[sum & 0x0F] };
    }

    std::string encodeFrame(std::string_view payload, char terminator) {
      std::string frame;
      frame.reserve(payload.size() + 4);
      frame += kFrameStart;
      frame.append(payload);
      frame += checksum(payload);
      frame += terminator;
      return frame;
    }

    std::int16_t decodeFrame(std::string_view frame) {
      if (frame.size() != kFrameSize)
        throw MalformedFrame("Malformed message received: bad length (" +
                             std::to_string(frame.size()) + "): " + printable(frame));

      if (frame.front() != kFrameStart || frame.back() != kReadTerminator)
        throw MalformedFrame("Malformed message received: bad start/end marker: " +
                             printable(frame));

      if (frame == kBadChecksumSentinel)
        throw MalformedFrame("Device reported bad checksum received");

      const auto payload = frame.substr(1, 4);
      std::uint16_t raw = 0;
      for (char c : payload) {
        const int digit = hexValue(c);
        if (digit < 0)
          throw MalformedFrame("Number was not provided as hex: " + printable(frame));
        raw = static_cast<std::uint16_t>((raw << 4) | digit);
      }

      if (frame.substr(5, 2) != checksum(payload))
        throw MalformedFrame("Checksum mismatch: " + printable(frame));

      // two's complement: 0xffff -> -1
      return static_cast<std::int16_t>(raw);
    }

  } // namespace protocols
} // namespace labcomm
