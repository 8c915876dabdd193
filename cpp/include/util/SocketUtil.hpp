#pragma once

#include <boost/json.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace io {

using file_descriptor_t = int;
using port_t = int;

/*
 * Provides thread-safe access to a socket.
 *
 * The main methods are write() and read(). These methods are thread-safe and loop until all
 * requested bytes are written/read. Reads and writes are guarded by separate mutexes, so that one
 * thread can block in read() while another thread writes.
 *
 * For convenience, there are json_read() and json_write() methods specialized for json format
 * messages. These messages are prefixed with a 4-byte big-endian length header, followed by a
 * serialized json string of that length.
 *
 * Example usage:
 *
 * auto socket = io::Socket::create_client_socket(host, port);
 * socket->json_write(msg);
 *
 * boost::json::value reply;
 * if (!socket->json_read(&reply)) {
 *   // peer closed the connection
 * }
 *
 * The file descriptor is closed when the Socket is destroyed.
 */
class Socket {
 public:
  static constexpr uint32_t kMaxJsonMessageLength = 1 << 20;

  ~Socket();

  /*
   * Thread-safe write to socket. Loops until size bytes are written. Throws util::Exception if
   * the peer has gone away.
   */
  void write(const void* data, int size);

  /*
   * Thread-safe convenience method for writing json messages. Prepends a 4-byte length header to
   * a serialized json string, and writes both under a single lock.
   */
  void json_write(const boost::json::value& json);

  /*
   * Thread-safe read from socket.
   *
   * If the socket has been closed, then returns false.
   *
   * Otherwise, loops until size bytes have been read, and returns true.
   */
  bool read(void* data, int size);

  /*
   * Thread-safe convenience method for reading json messages.
   *
   * If the socket has been closed, then returns false.
   *
   * Otherwise, reads a 4-byte length, and then loops until that many more bytes have been read.
   * Deserializes those bytes into a json value, and returns true.
   *
   * A frame that does not parse as json raises util::CleanException; the stream remains usable. A
   * frame longer than kMaxJsonMessageLength raises util::Exception; the stream is unusable after
   * that.
   */
  bool json_read(boost::json::value* data);

  /*
   * Disallows further reads. A thread blocked in read() on this socket wakes up and sees a closed
   * connection. Writes remain possible.
   */
  void shutdown_read();

  /*
   * Disallows further reads and writes. On a listening socket, this wakes up a thread blocked in
   * accept().
   */
  void shutdown();

  /*
   * Returns the port the socket is bound to. Useful after binding a server socket to port 0.
   */
  port_t local_port() const;

  static std::unique_ptr<Socket> create_server_socket(port_t port, int max_connections);
  static std::unique_ptr<Socket> create_client_socket(std::string const& host, port_t port);

  /*
   * Blocks until a client connects. Returns nullptr if the socket was shut down while waiting.
   */
  std::unique_ptr<Socket> accept() const;

 private:
  explicit Socket(file_descriptor_t fd) : fd_(fd) {}
  Socket(const Socket&) = delete;
  Socket& operator=(const Socket&) = delete;

  void write_helper(const void* data, int size, const char* error_msg);
  bool read_helper(void* data, int size, const char* error_msg);

  mutable std::mutex write_mutex_;
  mutable std::mutex read_mutex_;
  const file_descriptor_t fd_;
  std::vector<char> json_buffer_;
  std::atomic<bool> active_ = true;
};

}  // namespace io

#include "inline/util/SocketUtil.inl"
