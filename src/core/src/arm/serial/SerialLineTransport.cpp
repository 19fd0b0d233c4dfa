/**
 * @file SerialLineTransport.cpp
 * @brief Boost.Asio serial transport and port discovery
 */

#include "SerialLineTransport.hpp"
#include "../../logging/Logger.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>

#ifdef _WIN32
#include <windows.h>
#endif

namespace sorting_arm {
namespace arm {
namespace serial {

using boost::asio::serial_port;

SerialLineTransport::SerialLineTransport()
    : running_(false),
      bytesReceived_(0),
      bytesSent_(0) {
}

SerialLineTransport::~SerialLineTransport() {
    close();
}

bool SerialLineTransport::open(const LinkConfig& config) {
    close();

    try {
        port_ = std::make_unique<serial_port>(ioContext_, config.portName);

        port_->set_option(serial_port::baud_rate(config.baudRate));
        port_->set_option(serial_port::character_size(config.dataBits));
        port_->set_option(serial_port::stop_bits(
            config.stopBits == 2 ? serial_port::stop_bits::two : serial_port::stop_bits::one));
        port_->set_option(serial_port::parity(serial_port::parity::none));
        port_->set_option(serial_port::flow_control(serial_port::flow_control::none));
    } catch (const boost::system::system_error& e) {
        setError(std::string("Failed to open ") + config.portName + ": " + e.what());
        port_.reset();
        return false;
    }

    running_ = true;
    startAsyncRead();
    ioThread_ = std::thread(&SerialLineTransport::runIoContext, this);

    LOG_DEBUG("Serial port {} opened at {} baud", config.portName, config.baudRate);
    return true;
}

void SerialLineTransport::close() {
    running_ = false;

    {
        std::lock_guard<std::mutex> lock(writeMutex_);
        if (port_ && port_->is_open()) {
            boost::system::error_code ec;
            port_->cancel(ec);
            port_->close(ec);
        }
    }

    ioContext_.stop();

    if (ioThread_.joinable()) {
        ioThread_.join();
    }

    ioContext_.restart();
    {
        std::lock_guard<std::mutex> lock(writeMutex_);
        port_.reset();
    }
    clearInput();
}

bool SerialLineTransport::isOpen() const {
    return port_ && port_->is_open();
}

bool SerialLineTransport::writeLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(writeMutex_);
    if (!isOpen()) {
        setError("Write on closed port");
        return false;
    }

    std::string data = line + "\n";
    boost::system::error_code ec;
    size_t written = boost::asio::write(*port_, boost::asio::buffer(data), ec);
    if (ec) {
        setError("Write error: " + ec.message());
        return false;
    }
    bytesSent_ += written;
    return true;
}

std::optional<std::string> SerialLineTransport::readLine(int timeoutMs) {
    std::unique_lock<std::mutex> lock(receivedLinesMutex_);

    if (receivedLinesCv_.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                                  [this] { return !receivedLines_.empty(); })) {
        std::string line = std::move(receivedLines_.front());
        receivedLines_.pop();
        return line;
    }
    return std::nullopt;
}

void SerialLineTransport::clearInput() {
    std::lock_guard<std::mutex> lock(receivedLinesMutex_);
    std::queue<std::string>().swap(receivedLines_);
}

std::string SerialLineTransport::lastError() const {
    std::lock_guard<std::mutex> lock(errorMutex_);
    return lastError_;
}

void SerialLineTransport::setError(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(errorMutex_);
        lastError_ = message;
    }
    LOG_WARN("Serial: {}", message);
}

void SerialLineTransport::startAsyncRead() {
    if (!running_ || !port_ || !port_->is_open()) return;

    port_->async_read_some(
        boost::asio::buffer(readBuffer_),
        [this](const boost::system::error_code& error, size_t bytesTransferred) {
            handleRead(error, bytesTransferred);
        });
}

void SerialLineTransport::handleRead(const boost::system::error_code& error, size_t bytesTransferred) {
    if (error) {
        if (error != boost::asio::error::operation_aborted) {
            setError("Read error: " + error.message());
        }
        return;
    }

    bytesReceived_ += bytesTransferred;

    // Only touched from the io thread
    for (size_t i = 0; i < bytesTransferred; ++i) {
        char c = static_cast<char>(readBuffer_[i]);
        if (c == '\n' || c == '\r') {
            if (!lineBuffer_.empty()) {
                {
                    std::lock_guard<std::mutex> lock(receivedLinesMutex_);
                    receivedLines_.push(lineBuffer_);
                }
                receivedLinesCv_.notify_one();
                lineBuffer_.clear();
            }
        } else {
            lineBuffer_ += c;
        }
    }

    startAsyncRead();
}

void SerialLineTransport::runIoContext() {
    while (running_) {
        try {
            ioContext_.run();
            if (running_) {
                ioContext_.restart();
                // Nothing pending (read error); avoid spinning
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                startAsyncRead();
            }
        } catch (const std::exception& e) {
            setError(std::string("IO error: ") + e.what());
        }
    }
}

std::vector<std::string> discoverSerialPorts() {
    std::vector<std::string> ports;

#ifdef _WIN32
    for (int i = 1; i <= 256; ++i) {
        char portName[24];
        snprintf(portName, sizeof(portName), "\\\\.\\COM%d", i);

        HANDLE hPort = CreateFileA(
            portName, GENERIC_READ | GENERIC_WRITE, 0, nullptr,
            OPEN_EXISTING, 0, nullptr);

        if (hPort != INVALID_HANDLE_VALUE) {
            ports.push_back("COM" + std::to_string(i));
            CloseHandle(hPort);
        }
    }
#else
    namespace fs = std::filesystem;
    std::error_code ec;

    const fs::path byId("/dev/serial/by-id");
    if (fs::is_directory(byId, ec)) {
        std::vector<std::string> entries;
        for (const auto& entry : fs::directory_iterator(byId, ec)) {
            entries.push_back(entry.path().string());
        }
        std::sort(entries.begin(), entries.end());
        ports.insert(ports.end(), entries.begin(), entries.end());
    }

    const char* patterns[] = {"/dev/ttyACM", "/dev/ttyUSB", "/dev/tty.usbmodem"};
    for (int i = 0; i < 10; ++i) {
        for (const char* pattern : patterns) {
            std::string portName = std::string(pattern) + std::to_string(i);
            if (fs::exists(portName, ec)) {
                ports.push_back(portName);
            }
        }
    }
#endif

    return ports;
}

} // namespace serial
} // namespace arm
} // namespace sorting_arm
