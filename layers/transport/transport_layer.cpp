#include "transport_layer.h"

#include <utility>

namespace transport {

namespace {

template <typename Stream>
void closeStream(Stream& stream) {
    boost::system::error_code ec;
    stream.cancel(ec);
    stream.close(ec);
}

} // namespace

SerialTransport::SerialTransport(const SerialSettings& settings)
    : settings_(settings), port_(ioContext_) {}

SerialTransport::~SerialTransport() {
    close();
}

bool SerialTransport::open(std::string& error) {
    std::lock_guard<std::mutex> lock(portMutex_);
    try {
        port_.open(settings_.portName);
        port_.set_option(boost::asio::serial_port_base::baud_rate(settings_.baudRate));
        port_.set_option(boost::asio::serial_port_base::character_size(settings_.characterSize));
        port_.set_option(boost::asio::serial_port_base::parity(boost::asio::serial_port_base::parity::none));
        port_.set_option(boost::asio::serial_port_base::stop_bits(boost::asio::serial_port_base::stop_bits::one));
        port_.set_option(boost::asio::serial_port_base::flow_control(boost::asio::serial_port_base::flow_control::none));
    } catch (const std::exception& e) {
        closeStream(port_);
        error = "Failed to open port " + settings_.portName + ": " + e.what();
        return false;
    }

    closed_ = false;
    return true;
}

bool SerialTransport::send(const std::vector<uint8_t>& data, std::string& error) {
    std::lock_guard<std::mutex> lock(portMutex_);
    if (closed_) {
        error = "Cannot send: serial port is closed";
        return false;
    }

    boost::system::error_code ec;
    const auto written = boost::asio::write(port_, boost::asio::buffer(data), ec);
    if (ec) {
        error = "Write failed: " + ec.message();
        return false;
    }
    if (written != data.size()) {
        error = "Incomplete write, expected " + std::to_string(data.size()) + ", wrote " + std::to_string(written);
        return false;
    }
    return true;
}

ReceiveStatus SerialTransport::receive(std::vector<uint8_t>& out, std::chrono::milliseconds timeout, std::string& error) {
    std::lock_guard<std::mutex> lock(portMutex_);
    out.clear();
    if (closed_) {
        error = "Cannot receive: serial port is closed";
        return ReceiveStatus::Error;
    }

    boost::system::error_code readError = boost::asio::error::would_block;
    std::size_t bytesRead = 0;
    port_.async_read_some(
        boost::asio::buffer(readBuffer_),
        [&readError, &bytesRead](const boost::system::error_code& ec, std::size_t n) {
            readError = ec;
            bytesRead = n;
        });

    ioContext_.restart();
    ioContext_.run_for(timeout);

    if (readError == boost::asio::error::would_block) {
        // Deadline hit with the read still pending: cancel and let the handler drain.
        boost::system::error_code ignored;
        port_.cancel(ignored);
        ioContext_.restart();
        ioContext_.run();
    }

    if (bytesRead > 0) {
        out.assign(readBuffer_.begin(), readBuffer_.begin() + static_cast<std::ptrdiff_t>(bytesRead));
        return ReceiveStatus::Ok;
    }

    if (!readError || readError == boost::asio::error::operation_aborted ||
        readError == boost::asio::error::would_block) {
        error = "Read timeout after " + std::to_string(timeout.count()) + " ms";
        return ReceiveStatus::Timeout;
    }

    error = "Serial read error: " + readError.message();
    return ReceiveStatus::Error;
}

void SerialTransport::close() {
    std::lock_guard<std::mutex> lock(portMutex_);
    if (closed_) {
        return;
    }
    closed_ = true;
    closeStream(port_);
}

bool SerialTransport::isOpen() const {
    std::lock_guard<std::mutex> lock(portMutex_);
    return !closed_;
}

TransportPtr openSerialTransport(const SerialSettings& settings, std::string& error) {
    auto transport = std::make_shared<SerialTransport>(settings);
    if (!transport->open(error)) {
        return nullptr;
    }
    return transport;
}

TransportFactory makeSerialTransportFactory(const SerialSettings& settings) {
    return [settings](std::string& error) { return openSerialTransport(settings, error); };
}

} // namespace transport
