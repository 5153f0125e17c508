#pragma once
#include <asio.hpp>

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "http.hpp"
#include "log.hpp"
#include "watch_channel.hpp"

// Source of server-sent event frames for a streaming response.
class EventSource {
public:
    virtual ~EventSource() = default;

    // Next frame to write, if one is ready. Sets `last` when the stream ends
    // after that frame.
    virtual std::optional<std::string> next(bool& last) = 0;

    // True once no further frames can arrive.
    virtual bool closed() const = 0;

    // `wake` may be called from any thread whenever a frame may be ready.
    virtual void set_wake(std::function<void()> wake) = 0;
};

// One HTTP/1.1 connection. Handlers run on the session's strand; the public
// response and streaming calls may be made from any thread.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    using RequestHandler = std::function<void(const std::shared_ptr<HttpSession>&, HttpRequest)>;
    // Return false to stop reading the body.
    using ChunkHandler = std::function<bool(const char* data, std::size_t size)>;
    using BodyHandler = std::function<void(bool complete)>;
    using SentHandler = std::function<void(bool delivered)>;

    static constexpr std::size_t kMaxHeadBytes = 64 * 1024;
    static constexpr std::size_t kReadChunk = 64 * 1024;

    static std::shared_ptr<HttpSession> create(asio::ip::tcp::socket sock,
                                               RequestHandler handler,
                                               std::shared_ptr<Logger> logger);
    ~HttpSession();

    void start();

    void send_text(int status, const std::string& body, bool close = false);
    void send_body(int status,
                   const std::string& content_type,
                   std::vector<char> body,
                   SentHandler on_sent = nullptr);

    // Delivers `length` body bytes of the current request to `on_chunk`, then
    // calls `on_done(true)`. A transport error calls `on_done(false)`.
    void read_body(std::uint64_t length, ChunkHandler on_chunk, BodyHandler on_done);

    // Replies with text/event-stream and writes frames until the source ends
    // or the client goes away; the connection closes afterwards.
    void stream(std::unique_ptr<EventSource> source);
    void stream_snapshots(WatchReceiver<std::string> receiver);
    void stream_progress(WatchReceiver<int> receiver);

    void post(std::function<void()> fn);
    void close();

    std::string remote_address() const { return remote_; }

private:
    HttpSession(asio::ip::tcp::socket sock, RequestHandler handler, std::shared_ptr<Logger> logger);

    struct Outgoing {
        std::string text;
        std::vector<char> bytes;
        SentHandler on_sent;
    };

    void do_read_head();
    void handle_head(std::size_t head_size);
    void do_read_body();
    void watch_disconnect();
    void pump_stream();
    void finish_response(bool close);
    void enqueue(Outgoing out);
    void do_write();
    void close_now();
    void fail_pending();

    asio::ip::tcp::socket socket_;
    RequestHandler handler_;
    std::shared_ptr<Logger> logger_;
    std::string remote_;

    asio::streambuf read_buf_;
    std::vector<char> body_buf_;
    std::uint64_t body_unread_ = 0;
    ChunkHandler on_chunk_;
    BodyHandler on_body_done_;
    bool request_keep_alive_ = true;

    std::deque<Outgoing> write_queue_;
    bool writing_ = false;
    bool close_after_write_ = false;
    bool read_next_after_write_ = false;
    bool closed_ = false;

    std::shared_ptr<EventSource> source_;
    char disconnect_byte_ = 0;
};
