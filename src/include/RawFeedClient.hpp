#ifndef RAWFEEDCLIENT_HPP
#define RAWFEEDCLIENT_HPP

#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

using boost::asio::ip::tcp;

// Upstream connection the publisher releases on shutdown.
class MessageSource {
   public:
    virtual ~MessageSource() = default;
    virtual void close() = 0;
};

// Reads a dump1090 style raw feed ("*8D4840D6202CC371C32CE0576098;" per
// line) and hands every frame to the handler with its arrival time.
class RawFeedClient : public MessageSource {
   public:
    using FrameHandler =
        std::function<void(const std::string& frame, double timestamp)>;

    RawFeedClient(boost::asio::io_context& io_context, std::string host,
                  unsigned short port, FrameHandler handler,
                  std::chrono::steady_clock::duration reconnect_delay =
                      std::chrono::seconds(5));

    void start();
    void close() override;

    std::uint64_t frames_received() const { return frames; }

    static std::optional<std::string> parse_line(const std::string& line);

   private:
    void start_connect();
    void handle_connect(const boost::system::error_code& error);
    void start_receive();
    void handle_receive(const boost::system::error_code& error,
                        std::size_t bytes_received);
    void schedule_reconnect();

    std::string host;
    unsigned short port;
    FrameHandler handler;
    std::chrono::steady_clock::duration reconnect_delay;

    tcp::resolver resolver;
    tcp::socket socket;
    boost::asio::streambuf data;
    boost::asio::steady_timer reconnect_timer;
    std::uint64_t frames = 0;
    bool closed = false;
};

#endif  // RAWFEEDCLIENT_HPP
