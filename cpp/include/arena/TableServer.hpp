#pragma once

#include "arena/Constants.hpp"
#include "arena/Events.hpp"
#include "arena/SessionCoordinator.hpp"
#include "util/SocketUtil.hpp"

#include <atomic>
#include <condition_variable>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace arena {

/*
 * TCP front end of a single table.
 *
 * Each accepted connection gets a pair of threads:
 *
 * - The reader decodes commands from the socket and calls into the SessionCoordinator. The first
 *   command must be a JoinRequest; if the table is full, a JoinRejected is sent and the connection
 *   is closed. A closed socket, or an explicit Disconnect, results in SessionCoordinator::leave().
 *
 * - The writer drains the connection's EventChannel onto the socket. It exits when the channel is
 *   closed and drained, or when a write fails. Either way it then wakes up the reader, so that a
 *   participant whose channel was closed by the coordinator (for falling behind) leaves the table.
 *
 * Malformed messages are answered with an Error event and otherwise ignored.
 *
 * Usage:
 *
 * TableServer server(params, coordinator);
 * server.start();  // binds the listening socket
 * server.run();    // blocks until shutdown() is called from another thread
 */
class TableServer {
 public:
  struct Params {
    auto make_options_description();

    io::port_t port = kDefaultPort;  // 0 means any free port
    int channel_capacity = kDefaultChannelCapacity;
  };

  TableServer(const Params& params, SessionCoordinator& coordinator);

  /*
   * Creates the listening socket. Throws util::CleanException if the port cannot be bound.
   */
  void start();

  // The port actually bound by start()
  io::port_t port() const;

  /*
   * Accepts connections until shutdown() is called, then waits for every connection to finish.
   * Connections still busy after kShutdownGracePeriod (typically a peer that stopped reading, with
   * the writer stuck in send()) have their sockets shut down in both directions.
   */
  void run();

  /*
   * Delivers ServerShutdown to all participants, lets pending events flush, and closes all
   * connections and the listening socket. Thread-safe and idempotent.
   */
  void shutdown();

 private:
  struct Connection {
    int id;
    std::unique_ptr<io::Socket> socket;
    channel_ptr_t channel;
    std::thread reader;
    std::thread writer;
    std::atomic<bool> done = false;
  };
  using connection_list_t = std::list<std::unique_ptr<Connection>>;

  void launch(std::unique_ptr<io::Socket> socket);
  void read_loop(Connection* conn);
  void write_loop(Connection* conn);
  std::optional<gomoku::role_t> handshake(Connection* conn);
  void serve(Connection* conn, gomoku::role_t role);
  Command receive(Connection* conn);
  void reap();  // assumes mutex_ is locked
  bool all_done() const;  // assumes mutex_ is locked

  const Params params_;
  SessionCoordinator& coordinator_;
  std::unique_ptr<io::Socket> listener_;

  std::mutex mutex_;
  std::condition_variable cv_done_;
  connection_list_t connections_;
  int next_connection_id_ = 0;
  std::atomic<bool> shutting_down_ = false;
};

}  // namespace arena

#include "inline/arena/TableServer.inl"
