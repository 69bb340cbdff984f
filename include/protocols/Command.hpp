#pragma once
/** @file  Command.hpp
 *  @brief TC4820 command codes with toWire.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iomanip>
#include <sstream>
#include <string>

// labcomm headers
#include "protocols/FrameCodec.hpp"

namespace labcomm {
  namespace protocols {
    struct Command {
      std::string code; ///< hex command string, e.g. "010000"
      std::string toWire() const { return encodeFrame(code, kWriteTerminator); }
    };

    namespace commands {
      inline const Command Temperature{ "010000" }; ///< decimal
      inline const Command Power{ "020000" };       ///< int
      inline const Command AlarmStatus{ "030000" }; ///< int
      inline const Command SetPoint{ "500000" };    ///< decimal

      /// "1c" + value as four lowercase hex digits. Caller range-checks.
      inline Command setPoint(unsigned int value) {
        std::ostringstream os;
        os << "1c" << std::hex << std::nouppercase << std::setw(4) << std::setfill('0') << value;
        return Command{ os.str() };
      }
    } // namespace commands

  } // namespace protocols
} // namespace labcomm
