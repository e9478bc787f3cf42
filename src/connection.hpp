#pragma once
#include <asio.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

class Connection;

// Receives the parsed lines of a Connection. Callbacks run on the io thread.
class ConnectionHandler {
public:
    virtual ~ConnectionHandler() = default;
    virtual void on_message(const std::shared_ptr<Connection>& conn, const nlohmann::json& message) = 0;
    // The line was not a JSON object with a string "type".
    virtual void on_invalid_message(const std::shared_ptr<Connection>& conn, const std::string& reason) = 0;
    virtual void on_closed(const std::shared_ptr<Connection>& conn) = 0;
};

// One newline-delimited JSON stream over TCP.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using ConnectHandler = std::function<void(std::error_code, std::shared_ptr<Connection>)>;

    // Wraps an accepted socket; call start() to begin reading.
    static std::shared_ptr<Connection> adopt(asio::io_context& io,
                                                       asio::ip::tcp::socket sock,
                                                       std::weak_ptr<ConnectionHandler> handler,
                                                       std::size_t max_message_bytes);

    // Resolves and connects. on_connect runs before the read loop starts.
    static void connect_to(asio::io_context& io,
                                 const std::string& host,
                                 unsigned short port,
                                 std::weak_ptr<ConnectionHandler> handler,
                                 std::size_t max_message_bytes,
                                 ConnectHandler on_connect);

    ~Connection();

    void start();
    // Safe from any thread; the write happens on the io thread.
    void async_send_json(const nlohmann::json& j);
    // Stops reading, flushes queued writes, then closes.
    void close_after_flush();
    void close();

    uint64_t id() const { return id_; }
    const std::string& remote_address() const { return remote_address_; }
    bool is_loopback() const { return loopback_; }
    bool is_open() const { return !closed_; }

private:
    Connection(asio::io_context& io,
               asio::ip::tcp::socket sock,
               std::weak_ptr<ConnectionHandler> handler,
               std::size_t max_message_bytes);
    void do_read();
    void handle_line(std::string line);
    void do_write();
    void shutdown();

    asio::io_context& io_;
    asio::ip::tcp::socket socket_;
    std::weak_ptr<ConnectionHandler> handler_;
    asio::streambuf read_buf_;
    std::deque<std::string> write_queue_;
    uint64_t id_;
    std::string remote_address_;
    bool loopback_ = false;
    bool writing_ = false;
    bool closing_ = false;
    std::atomic<bool> closed_{false};
};
