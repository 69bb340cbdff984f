#pragma once
/** @file  FrameCodec.hpp
 *  @brief Checksummed 8-byte ASCII framing used by the TC4820 controller.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace labcomm {
  namespace protocols {

    inline constexpr char kFrameStart = '*';
    inline constexpr char kReadTerminator = '^';
    inline constexpr char kWriteTerminator = '\r';
    inline constexpr std::size_t kFrameSize = 8;

    /// What the controller sends back when the checksum of *our* frame was wrong.
    inline constexpr std::string_view kBadChecksumSentinel = "*XXXX60^";

    /**
 * @class MalformedFrame
 * @brief A frame failed structural, hex or checksum validation.
 *
 *  Transient: the request that produced it may simply be sent again.
 */
    class MalformedFrame : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    /// Sum of the ASCII bytes mod 256 as two lowercase hex digits.
    std::string checksum(std::string_view bytes);

    /// `*` + payload + checksum(payload) + terminator.
    std::string encodeFrame(std::string_view payload, char terminator);

    /**
     * @brief Validate a received frame and return its signed 16-bit payload.
     *
     * Checks, in order: length, start/end markers, the bad-checksum sentinel,
     * hex digits in the payload, then the checksum field.
     *
     * @throws MalformedFrame naming the first violated rule.
     */
    std::int16_t decodeFrame(std::string_view frame);

    /// Controller decimals travel as ten times their value.
    inline double toDecimal(int value) { return static_cast<double>(value) / 10.0; }

  } // namespace protocols
} // namespace labcomm
