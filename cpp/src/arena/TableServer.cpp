#include "arena/TableServer.hpp"

#include "arena/MessageCodec.hpp"
#include "util/Asserts.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

#include <fmt/format.h>

#include <boost/json.hpp>

#include <utility>

namespace arena {

TableServer::TableServer(const Params& params, SessionCoordinator& coordinator)
    : params_(params), coordinator_(coordinator) {
  CLEAN_ASSERT(params_.channel_capacity > 0, "channel capacity must be positive (got {})",
               params_.channel_capacity);
}

void TableServer::start() {
  RELEASE_ASSERT(!listener_, "TableServer::start() called twice");
  listener_ = io::Socket::create_server_socket(params_.port, kMaxConnections);
  LOG_INFO("TableServer listening on port {}", listener_->local_port());
}

io::port_t TableServer::port() const {
  RELEASE_ASSERT(listener_ != nullptr, "TableServer::start() has not been called");
  return listener_->local_port();
}

void TableServer::run() {
  RELEASE_ASSERT(listener_ != nullptr, "TableServer::start() has not been called");

  while (true) {
    std::unique_ptr<io::Socket> socket;
    try {
      socket = listener_->accept();
    } catch (const util::Exception& e) {
      LOG_ERROR("TableServer: {}", e.what());
      shutdown();
      break;
    }
    if (!socket) break;
    launch(std::move(socket));
  }

  connection_list_t remaining;
  std::unique_lock lock(mutex_);
  if (!cv_done_.wait_for(lock, kShutdownGracePeriod, [&] { return all_done(); })) {
    for (auto& conn : connections_) {
      if (conn->done) continue;
      LOG_WARN("Connection {} did not finish within {}ms, closing its socket", conn->id,
               kShutdownGracePeriod.count());
      conn->socket->shutdown();
    }
  }
  remaining.swap(connections_);
  lock.unlock();

  // Readers lock mutex_ on their way out, so they are joined without holding it
  for (auto& conn : remaining) {
    conn->reader.join();
  }
  LOG_INFO("TableServer stopped");
}

void TableServer::shutdown() {
  if (shutting_down_.exchange(true)) return;
  LOG_INFO("TableServer shutting down");

  coordinator_.shutdown();

  std::unique_lock lock(mutex_);
  for (auto& conn : connections_) {
    conn->channel->close();
    conn->socket->shutdown_read();
  }
  lock.unlock();

  if (listener_) {
    listener_->shutdown();
  }
}

void TableServer::launch(std::unique_ptr<io::Socket> socket) {
  std::unique_lock lock(mutex_);
  if (shutting_down_) return;
  reap();

  auto conn = std::make_unique<Connection>();
  conn->id = next_connection_id_++;
  conn->socket = std::move(socket);
  conn->channel = std::make_shared<EventChannel>(params_.channel_capacity);

  Connection* c = conn.get();
  LOG_INFO("Accepted connection {}", c->id);
  c->writer = std::thread([this, c] { write_loop(c); });
  c->reader = std::thread([this, c] { read_loop(c); });
  connections_.push_back(std::move(conn));
}

void TableServer::read_loop(Connection* conn) {
  std::optional<gomoku::role_t> role;
  try {
    role = handshake(conn);
    if (role) {
      serve(conn, *role);
    }
  } catch (const util::Exception& e) {
    LOG_ERROR("Connection {}: {}", conn->id, e.what());
  }

  if (role) {
    coordinator_.leave(*role);
  } else {
    conn->channel->close();
  }

  // Wait for queued events to be flushed before closing the socket
  conn->writer.join();
  conn->socket->shutdown();
  LOG_INFO("Closed connection {}", conn->id);

  std::unique_lock lock(mutex_);
  conn->done = true;
  cv_done_.notify_all();
}

void TableServer::write_loop(Connection* conn) {
  try {
    while (std::optional<Event> event = conn->channel->pop()) {
      conn->socket->json_write(MessageCodec::encode(*event));
    }
  } catch (const util::Exception& e) {
    LOG_ERROR("Connection {}: {}", conn->id, e.what());
    conn->channel->close();
  }
  conn->socket->shutdown_read();
}

std::optional<gomoku::role_t> TableServer::handshake(Connection* conn) {
  while (true) {
    Command command = receive(conn);
    if (std::holds_alternative<Disconnect>(command)) {
      return std::nullopt;
    }

    const JoinRequest* request = std::get_if<JoinRequest>(&command);
    if (!request) {
      conn->channel->push(Error{"Join the table before making a move"});
      continue;
    }

    try {
      return coordinator_.join(request->display_name, conn->channel, request->role);
    } catch (const gomoku::GameError& e) {
      LOG_INFO("Connection {}: join rejected: {}", conn->id, e.what());
      conn->channel->push(JoinRejected{e.what()});
      return std::nullopt;
    }
  }
}

void TableServer::serve(Connection* conn, gomoku::role_t role) {
  while (true) {
    Command command = receive(conn);
    if (std::holds_alternative<Disconnect>(command)) {
      return;
    }

    const MoveRequest* request = std::get_if<MoveRequest>(&command);
    if (!request) {
      conn->channel->push(Error{"Already joined the table"});
      continue;
    }

    try {
      coordinator_.submit_move(role, request->move());
    } catch (const gomoku::GameError&) {
      // already reported to the participant by the coordinator
    }
  }
}

// A closed connection is reported as Disconnect
Command TableServer::receive(Connection* conn) {
  while (true) {
    boost::json::value msg;
    try {
      if (!conn->socket->json_read(&msg)) {
        return Disconnect{};
      }
      return MessageCodec::decode_command(msg);
    } catch (const util::CleanException& e) {
      LOG_WARN("Connection {}: malformed message: {}", conn->id, e.what());
      conn->channel->push(Error{fmt::format("Malformed message: {}", e.what())});
    }
  }
}

void TableServer::reap() {
  for (auto it = connections_.begin(); it != connections_.end();) {
    Connection* conn = it->get();
    if (conn->done) {
      conn->reader.join();
      it = connections_.erase(it);
    } else {
      ++it;
    }
  }
}

bool TableServer::all_done() const {
  for (const auto& conn : connections_) {
    if (!conn->done) return false;
  }
  return true;
}

}  // namespace arena
