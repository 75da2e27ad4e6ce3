#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <sys/types.h>

/**
* @file
* @brief Byte-stream abstraction for the TCP transfer path plus a test double.
*
*  - @ref speedtest::IStream    : what the TCP responder and worker talk to,
*  - @ref speedtest::TcpStream  : a connected POSIX TCP socket,
*  - @ref speedtest::TcpListener: the server's listening socket,
*  - @ref speedtest::MockStream : scripted input, captured output.
*/

namespace speedtest {

/**
* @brief Abstract connected byte stream.
*
* @par Return conventions
* - @ref read_some : bytes read (>0), 0 when the peer closed, -1 on error
*   (@c errno is @c ETIMEDOUT when nothing arrived within the timeout).
* - @ref write_all : @p len once everything is written, -1 on error.
*/
class IStream {
public:
    virtual ~IStream() = default;

    virtual ssize_t read_some(uint8_t* buf, size_t len, int timeout_ms) = 0;
    virtual ssize_t write_all(const uint8_t* data, size_t len) = 0;

    /// @brief @c "ip:port" of the remote end, for logs.
    virtual std::string peer() const = 0;
};

/**
* @brief Connected TCP socket; owns and closes its descriptor.
*/
class TcpStream : public IStream {
public:
    /// @brief Adopt an already connected descriptor.
    TcpStream(int fd, std::string peer);
    ~TcpStream() override;

    TcpStream(const TcpStream&) = delete;
    TcpStream& operator=(const TcpStream&) = delete;

    /**
     * @brief Connect to @p ip:@p port, giving up after @p timeout_ms.
     * @throws TransportError on resolution, socket or connect failure.
     */
    static std::unique_ptr<TcpStream> connect(const std::string& ip, uint16_t port, int timeout_ms);

    ssize_t read_some(uint8_t* buf, size_t len, int timeout_ms) override;
    ssize_t write_all(const uint8_t* data, size_t len) override;
    std::string peer() const override { return peer_; }

    /// @brief Bound every blocking send (@c SO_SNDTIMEO).
    void set_send_timeout(int timeout_ms);

    int fd() const { return fd_; }

private:
    int fd_;
    std::string peer_;
};

/**
* @brief Listening TCP socket bound to @c INADDR_ANY.
*/
class TcpListener {
public:
    /// @throws TransportError if the socket cannot be bound or put in listen state.
    explicit TcpListener(uint16_t port, int backlog = 64);
    ~TcpListener();

    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;

    /**
     * @brief Wait up to @p timeout_ms for one connection.
     * @return The accepted stream, or nullptr on timeout or a failed accept
     *         (@c errno tells which; 0 on a plain timeout).
     */
    std::unique_ptr<TcpStream> poll_accept(int timeout_ms);

    uint16_t local_port() const;
    int fd() const { return fd_; }

private:
    int fd_;
};

/**
* @brief In-memory @ref IStream.
*
* Reads return the scripted input in pieces of at most @ref set_read_chunk
* bytes, then report end-of-stream (0), or a timeout (-1, @c ETIMEDOUT) when
* @ref hold_open was called. Writes are appended to @ref written until the
* configured budget is exhausted.
*/
class MockStream : public IStream {
public:
    explicit MockStream(std::string input = {}) : input_(std::move(input)) {}

    ssize_t read_some(uint8_t* buf, size_t len, int timeout_ms) override;
    ssize_t write_all(const uint8_t* data, size_t len) override;
    std::string peer() const override { return "mock:0"; }

    // ---------------------- Test hooks ----------------------

    void set_read_chunk(size_t n) { read_chunk_ = n ? n : 1; }
    /// @brief After the input is consumed, time out instead of reporting EOF.
    void hold_open() { hold_open_ = true; }
    /// @brief Accept @p n more bytes, then fail writes with -1 (@c EPIPE).
    void fail_writes_after(size_t n) { write_budget_ = static_cast<long long>(n); }

    const std::string& written() const { return output_; }
    size_t write_calls() const { return write_calls_; }

private:
    std::string input_;
    std::string output_;
    size_t    cursor_ = 0;
    size_t    read_chunk_ = 4096;
    size_t    write_calls_ = 0;
    long long write_budget_ = -1; ///< -1 = unlimited.
    bool      hold_open_ = false;
};

} // namespace speedtest
