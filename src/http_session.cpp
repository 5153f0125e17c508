#include "http_session.hpp"

#include <algorithm>

#include "protocol.hpp"

namespace {

class SnapshotEvents : public EventSource {
public:
    explicit SnapshotEvents(WatchReceiver<std::string> receiver) : receiver_(std::move(receiver)) {}

    std::optional<std::string> next(bool& last) override {
        auto value = receiver_.try_recv();
        if(!value) return std::nullopt;
        last = (*value == kConnectionReplaced);
        return make_sse_event(*value);
    }
    bool closed() const override { return receiver_.closed(); }
    void set_wake(std::function<void()> wake) override { receiver_.set_listener(std::move(wake)); }

private:
    WatchReceiver<std::string> receiver_;
};

class ProgressEvents : public EventSource {
public:
    explicit ProgressEvents(WatchReceiver<int> receiver) : receiver_(std::move(receiver)) {}

    std::optional<std::string> next(bool& last) override {
        auto value = receiver_.try_recv();
        if(!value) return std::nullopt;
        last = (*value >= 100);
        return make_sse_event(make_progress_payload(*value));
    }
    bool closed() const override { return receiver_.closed(); }
    void set_wake(std::function<void()> wake) override { receiver_.set_listener(std::move(wake)); }

private:
    WatchReceiver<int> receiver_;
};

} // namespace

std::shared_ptr<HttpSession> HttpSession::create(asio::ip::tcp::socket sock,
                                                 RequestHandler handler,
                                                 std::shared_ptr<Logger> logger)
{
    return std::shared_ptr<HttpSession>(new HttpSession(std::move(sock), std::move(handler), std::move(logger)));
}

HttpSession::HttpSession(asio::ip::tcp::socket sock, RequestHandler handler, std::shared_ptr<Logger> logger)
: socket_(std::move(sock)),
  handler_(std::move(handler)),
  logger_(logger ? std::move(logger) : std::make_shared<Logger>("http")),
  read_buf_(kMaxHeadBytes)
{
    std::error_code ec;
    auto ep = socket_.remote_endpoint(ec);
    remote_ = ec ? std::string("unknown") : ep.address().to_string() + ":" + std::to_string(ep.port());
}

HttpSession::~HttpSession(){
    std::error_code ec;
    socket_.close(ec);
}

void HttpSession::start(){
    auto self = shared_from_this();
    asio::dispatch(socket_.get_executor(), [this, self](){ do_read_head(); });
}

void HttpSession::post(std::function<void()> fn){
    asio::post(socket_.get_executor(), std::move(fn));
}

void HttpSession::do_read_head(){
    if(closed_) return;
    auto self = shared_from_this();
    asio::async_read_until(socket_, read_buf_, "\r\n\r\n",
        [this, self](std::error_code ec, std::size_t head_size){
            if(ec){
                if(ec == asio::error::not_found){
                    Outgoing out;
                    out.text = make_text_response(431, "request head too large", false);
                    enqueue(std::move(out));
                    finish_response(true);
                    return;
                }
                if(ec != asio::error::eof && ec != asio::error::operation_aborted){
                    logger_->debug("{} read error: {}", remote_, ec.message());
                }
                close_now();
                return;
            }
            handle_head(head_size);
        });
}

void HttpSession::handle_head(std::size_t head_size){
    auto begin = asio::buffers_begin(read_buf_.data());
    std::string head(begin, begin + head_size - 4);
    read_buf_.consume(head_size);

    HttpRequest req;
    std::string error;
    if(!parse_request_head(head, req, error)){
        logger_->debug("{} bad request: {}", remote_, error);
        request_keep_alive_ = false;
        send_text(400, error, true);
        return;
    }
    std::optional<std::uint64_t> length;
    if(!parse_content_length(req, length)){
        request_keep_alive_ = false;
        send_text(400, "invalid Content-Length", true);
        return;
    }
    body_unread_ = length.value_or(0);
    request_keep_alive_ = req.keep_alive() && !req.chunked();

    logger_->debug("{} {} {}", remote_, req.method, req.target);
    handler_(shared_from_this(), std::move(req));
}

void HttpSession::send_text(int status, const std::string& body, bool close){
    auto self = shared_from_this();
    post([this, self, status, body, close](){
        if(closed_) return;
        const bool keep = request_keep_alive_ && !close && body_unread_ == 0;
        Outgoing out;
        out.text = make_text_response(status, body, keep);
        enqueue(std::move(out));
        finish_response(!keep);
    });
}

void HttpSession::send_body(int status,
                            const std::string& content_type,
                            std::vector<char> body,
                            SentHandler on_sent)
{
    auto self = shared_from_this();
    auto payload = std::make_shared<std::vector<char>>(std::move(body));
    post([this, self, status, content_type, payload, on_sent](){
        if(closed_){
            if(on_sent) on_sent(false);
            return;
        }
        const bool keep = request_keep_alive_ && body_unread_ == 0;
        Outgoing head;
        head.text = make_response_head(status, {{"Content-Type", content_type}}, payload->size(), keep);
        enqueue(std::move(head));
        Outgoing content;
        content.bytes = std::move(*payload);
        content.on_sent = on_sent;
        enqueue(std::move(content));
        finish_response(!keep);
    });
}

void HttpSession::read_body(std::uint64_t length, ChunkHandler on_chunk, BodyHandler on_done){
    auto self = shared_from_this();
    post([this, self, length, on_chunk, on_done](){
        if(closed_) return;
        on_chunk_ = on_chunk;
        on_body_done_ = on_done;
        body_unread_ = length;

        // bytes that arrived together with the head
        if(read_buf_.size() > 0 && body_unread_ > 0){
            const std::size_t n = static_cast<std::size_t>(
                std::min<std::uint64_t>(read_buf_.size(), body_unread_));
            auto begin = asio::buffers_begin(read_buf_.data());
            std::vector<char> early(begin, begin + n);
            read_buf_.consume(n);
            body_unread_ -= n;
            if(!on_chunk_(early.data(), early.size())){
                on_chunk_ = nullptr;
                on_body_done_ = nullptr;
                return;
            }
        }
        do_read_body();
    });
}

void HttpSession::do_read_body(){
    if(closed_) return;
    if(body_unread_ == 0){
        auto done = std::move(on_body_done_);
        on_body_done_ = nullptr;
        on_chunk_ = nullptr;
        if(done) done(true);
        return;
    }
    body_buf_.resize(kReadChunk);
    const std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(body_unread_, kReadChunk));
    auto self = shared_from_this();
    socket_.async_read_some(asio::buffer(body_buf_.data(), want),
        [this, self](std::error_code ec, std::size_t n){
            if(ec){
                logger_->debug("{} body read error: {}", remote_, ec.message());
                auto done = std::move(on_body_done_);
                on_body_done_ = nullptr;
                on_chunk_ = nullptr;
                if(done) done(false);
                close_now();
                return;
            }
            body_unread_ -= n;
            if(!on_chunk_ || !on_chunk_(body_buf_.data(), n)){
                on_chunk_ = nullptr;
                on_body_done_ = nullptr;
                return;
            }
            do_read_body();
        });
}

void HttpSession::stream_snapshots(WatchReceiver<std::string> receiver){
    stream(std::make_unique<SnapshotEvents>(std::move(receiver)));
}

void HttpSession::stream_progress(WatchReceiver<int> receiver){
    stream(std::make_unique<ProgressEvents>(std::move(receiver)));
}

void HttpSession::stream(std::unique_ptr<EventSource> source){
    auto self = shared_from_this();
    std::shared_ptr<EventSource> shared(std::move(source));
    post([this, self, shared](){
        if(closed_) return;
        source_ = shared;
        request_keep_alive_ = false;

        Outgoing head;
        head.text = make_response_head(200,
            {{"Content-Type", "text/event-stream"}, {"Cache-Control", "no-cache"}},
            std::nullopt, false);
        enqueue(std::move(head));

        std::weak_ptr<HttpSession> weak = self;
        auto executor = socket_.get_executor();
        source_->set_wake([weak, executor](){
            asio::post(executor, [weak](){
                if(auto s = weak.lock()) s->pump_stream();
            });
        });
        watch_disconnect();
        pump_stream();
    });
}

void HttpSession::watch_disconnect(){
    auto self = shared_from_this();
    socket_.async_read_some(asio::buffer(&disconnect_byte_, 1),
        [this, self](std::error_code ec, std::size_t){
            if(ec){
                if(source_) logger_->debug("{} stream client left", remote_);
                close_now();
                return;
            }
            if(!closed_) watch_disconnect();
        });
}

void HttpSession::pump_stream(){
    if(closed_ || !source_) return;
    bool last = false;
    while(auto frame = source_->next(last)){
        Outgoing out;
        out.text = std::move(*frame);
        enqueue(std::move(out));
        if(last) break;
    }
    if(last || source_->closed()){
        source_.reset();
        close_after_write_ = true;
        if(!writing_ && write_queue_.empty()) close_now();
    }
}

void HttpSession::finish_response(bool close){
    if(close){
        close_after_write_ = true;
    } else {
        read_next_after_write_ = true;
    }
}

void HttpSession::enqueue(Outgoing out){
    if(closed_){
        if(out.on_sent) out.on_sent(false);
        return;
    }
    write_queue_.push_back(std::move(out));
    if(!writing_){
        do_write();
    }
}

void HttpSession::do_write(){
    if(write_queue_.empty()) return;
    writing_ = true;
    auto& front = write_queue_.front();
    auto buffer = front.text.empty() ? asio::buffer(front.bytes) : asio::buffer(front.text);
    auto self = shared_from_this();
    asio::async_write(socket_, buffer,
        [this, self](std::error_code ec, std::size_t){
            writing_ = false;
            Outgoing done = std::move(write_queue_.front());
            write_queue_.pop_front();
            if(done.on_sent) done.on_sent(!ec);
            if(ec || closed_){
                if(ec) logger_->debug("{} write error: {}", remote_, ec.message());
                close_now();
                fail_pending();
                return;
            }
            if(!write_queue_.empty()){
                do_write();
                return;
            }
            if(close_after_write_){
                close_now();
                return;
            }
            if(read_next_after_write_){
                read_next_after_write_ = false;
                do_read_head();
            }
        });
}

void HttpSession::close(){
    auto self = shared_from_this();
    post([this, self](){ close_now(); });
}

void HttpSession::close_now(){
    if(closed_) return;
    closed_ = true;
    std::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    source_.reset();
    if(!writing_) fail_pending();
}

void HttpSession::fail_pending(){
    auto pending = std::move(write_queue_);
    write_queue_.clear();
    for(auto& out : pending){
        if(out.on_sent) out.on_sent(false);
    }
}
