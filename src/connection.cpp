#include "connection.hpp"
#include "log.hpp"
#include <istream>

using json = nlohmann::json;

namespace {

std::atomic<uint64_t> next_connection_id{1};

} // namespace

std::shared_ptr<Connection> Connection::adopt(asio::io_context& io,
                                                        asio::ip::tcp::socket sock,
                                                        std::weak_ptr<ConnectionHandler> handler,
                                                        std::size_t max_message_bytes)
{
    auto c = std::shared_ptr<Connection>(new Connection(io, std::move(sock), std::move(handler), max_message_bytes));
    return c;
}

Connection::Connection(asio::io_context& io,
                       asio::ip::tcp::socket sock,
                       std::weak_ptr<ConnectionHandler> handler,
                       std::size_t max_message_bytes)
: io_(io),
  socket_(std::move(sock)),
  handler_(std::move(handler)),
  read_buf_(max_message_bytes),
  id_(next_connection_id.fetch_add(1))
{
    std::error_code ec;
    auto ep = socket_.remote_endpoint(ec);
    if(!ec){
        auto addr = ep.address();
        if(addr.is_v6() && addr.to_v6().is_v4_mapped()){
            addr = asio::ip::make_address_v4(asio::ip::v4_mapped, addr.to_v6());
        }
        remote_address_ = addr.to_string() + ":" + std::to_string(ep.port());
        loopback_ = addr.is_loopback();
    }
}

Connection::~Connection(){
    std::error_code ec;
    socket_.close(ec);
}

void Connection::start(){
    do_read();
}

void Connection::do_read(){
    auto self = shared_from_this();
    asio::async_read_until(socket_, read_buf_, "\n",
        [this, self](std::error_code ec, std::size_t){
            if(closing_ || closed_) return;
            if(ec == asio::error::not_found){
                log_to(nullptr, LogChannel::Warn, "Connection {} sent a message over {} bytes, closing",
                         remote_address_, read_buf_.max_size());
                shutdown();
                return;
            }
            if(ec){
                log_to(nullptr, LogChannel::Debug, "Connection {} read error: {}", remote_address_, ec.message());
                shutdown();
                return;
            }
            std::istream is(&read_buf_);
            std::string line;
            std::getline(is, line);
            if(!line.empty() && line.back() == '\r') line.pop_back();
            if(!line.empty()){
                handle_line(std::move(line));
            }
            if(!closing_ && !closed_) do_read();
        });
}

void Connection::handle_line(std::string line){
    auto handler = handler_.lock();
    if(!handler) return;
    auto j = json::parse(line, nullptr, false);
    if(j.is_discarded()){
        handler->on_invalid_message(shared_from_this(), "message is not valid JSON");
        return;
    }
    if(!j.is_object() || !j.contains("type") || !j["type"].is_string()){
        handler->on_invalid_message(shared_from_this(), "message has no type");
        return;
    }
    try{
        handler->on_message(shared_from_this(), j);
    } catch(const json::exception& ex){
        // a field had the wrong shape
        handler->on_invalid_message(shared_from_this(), ex.what());
    }
}

void Connection::async_send_json(const nlohmann::json& j){
    auto s = j.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
    auto self = shared_from_this();
    asio::post(io_, [this, self, s = std::move(s)]() mutable {
        if(closed_ || closing_) return;
        write_queue_.push_back(std::move(s));
        if(!writing_){
            do_write();
        }
    });
}

void Connection::do_write(){
    if(write_queue_.empty()){
        writing_ = false;
        if(closing_) shutdown();
        return;
    }
    writing_ = true;
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(write_queue_.front()),
        [this, self](std::error_code ec, std::size_t){
            if(ec){
                log_to(nullptr, LogChannel::Debug, "Connection {} write error: {}", remote_address_, ec.message());
                shutdown();
                return;
            }
            write_queue_.pop_front();
            do_write();
        });
}

void Connection::close_after_flush(){
    auto self = shared_from_this();
    asio::post(io_, [this, self]{
        if(closed_) return;
        closing_ = true;
        if(!writing_) shutdown();
    });
}

void Connection::close(){
    if(io_.get_executor().running_in_this_thread()){
        shutdown();
        return;
    }
    auto self = shared_from_this();
    asio::post(io_, [this, self]{ shutdown(); });
}

void Connection::shutdown(){
    if(closed_.exchange(true)) return;
    std::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    write_queue_.clear();
    writing_ = false;
    if(auto handler = handler_.lock()){
        handler->on_closed(shared_from_this());
    }
}

void Connection::connect_to(asio::io_context& io,
                                  const std::string& host,
                                  unsigned short port,
                                  std::weak_ptr<ConnectionHandler> handler,
                                  std::size_t max_message_bytes,
                                  ConnectHandler on_connect)
{
    auto resolver = std::make_shared<asio::ip::tcp::resolver>(io);
    resolver->async_resolve(host, std::to_string(port),
        [resolver, &io, handler, max_message_bytes, on_connect, host, port](std::error_code ec, asio::ip::tcp::resolver::results_type results){
            if(ec){
                log_to(nullptr, LogChannel::Info, "Resolve failed for {}:{}  {}", host, port, ec.message());
                on_connect(ec, nullptr);
                return;
            }
            auto sock = std::make_shared<asio::ip::tcp::socket>(io);
            asio::async_connect(*sock, results,
                [sock, &io, handler, max_message_bytes, on_connect](std::error_code ec, asio::ip::tcp::endpoint ep){
                    if(ec){
                        log_to(nullptr, LogChannel::Info, "Connect failed: {}", ec.message());
                        on_connect(ec, nullptr);
                        return;
                    }
                    log_to(nullptr, LogChannel::Debug, "Connected to {}:{}", ep.address().to_string(), ep.port());
                    auto conn = Connection::adopt(io, std::move(*sock), handler, max_message_bytes);
                    on_connect(std::error_code(), conn);
                    conn->start();
                });
        });
}
