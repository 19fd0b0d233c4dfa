/**
 * @file LineTransport.hpp
 * @brief Newline-framed byte link used by the serial arm driver
 */

#pragma once

#include <optional>
#include <string>

namespace sorting_arm {
namespace arm {
namespace serial {

struct LinkConfig {
    std::string portName;
    int baudRate = 115200;
    int dataBits = 8;
    int stopBits = 1;
};

/**
 * Implementations must allow writeLine() from one thread while another
 * thread is blocked in readLine().
 */
class ILineTransport {
public:
    virtual ~ILineTransport() = default;

    virtual bool open(const LinkConfig& config) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    /// Append '\n' and send. false on I/O failure.
    virtual bool writeLine(const std::string& line) = 0;

    /// Next complete line without terminator, nullopt on timeout
    virtual std::optional<std::string> readLine(int timeoutMs) = 0;

    /// Drop any buffered unread lines
    virtual void clearInput() = 0;

    /// Last I/O error text, empty if none
    virtual std::string lastError() const = 0;
};

} // namespace serial
} // namespace arm
} // namespace sorting_arm
