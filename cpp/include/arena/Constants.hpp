#pragma once

#include "util/SocketUtil.hpp"

#include <chrono>

namespace arena {

const io::port_t kDefaultPort = 8080;
const int kDefaultChannelCapacity = 32;
const int kMaxConnections = 16;  // listen() backlog
const int kMaxNameLength = 32;

// How long TableServer::run() waits for connections to flush after shutdown() before cutting them
constexpr std::chrono::milliseconds kShutdownGracePeriod(2000);

constexpr char kDefaultBotName[] = "AI001";
constexpr char kAiDisplayName[] = "AI";

}  // namespace arena
