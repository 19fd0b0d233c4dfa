/**
 * @file SerialLineTransport.hpp
 * @brief Serial port line transport using Boost.Asio
 */

#pragma once

#include "LineTransport.hpp"
#include <boost/asio.hpp>
#include <array>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace sorting_arm {
namespace arm {
namespace serial {

/**
 * Reads run on an io thread and are split into lines; writes are
 * synchronous so that a failed write is reported to the caller.
 */
class SerialLineTransport : public ILineTransport {
public:
    SerialLineTransport();
    ~SerialLineTransport() override;

    SerialLineTransport(const SerialLineTransport&) = delete;
    SerialLineTransport& operator=(const SerialLineTransport&) = delete;

    bool open(const LinkConfig& config) override;
    void close() override;
    bool isOpen() const override;
    bool writeLine(const std::string& line) override;
    std::optional<std::string> readLine(int timeoutMs) override;
    void clearInput() override;
    std::string lastError() const override;

    size_t getBytesReceived() const { return bytesReceived_; }
    size_t getBytesSent() const { return bytesSent_; }

private:
    void startAsyncRead();
    void handleRead(const boost::system::error_code& error, size_t bytesTransferred);
    void runIoContext();
    void setError(const std::string& message);

    boost::asio::io_context ioContext_;
    std::unique_ptr<boost::asio::serial_port> port_;
    std::thread ioThread_;
    std::atomic<bool> running_;

    std::array<uint8_t, 512> readBuffer_;
    std::string lineBuffer_;

    std::queue<std::string> receivedLines_;
    std::mutex receivedLinesMutex_;
    std::condition_variable receivedLinesCv_;

    std::mutex writeMutex_;

    mutable std::mutex errorMutex_;
    std::string lastError_;

    std::atomic<size_t> bytesReceived_;
    std::atomic<size_t> bytesSent_;
};

/**
 * Candidate device paths in discovery order.
 * Linux/macOS: /dev/serial/by-id entries, then existing ttyACM/ttyUSB nodes.
 * Windows: COM ports that can be opened.
 */
std::vector<std::string> discoverSerialPorts();

} // namespace serial
} // namespace arm
} // namespace sorting_arm
