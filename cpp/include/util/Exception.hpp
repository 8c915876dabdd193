#pragma once

#include <fmt/format.h>

#include <exception>
#include <string>
#include <utility>

namespace util {

/*
 * Base of every exception thrown by this project. The message is built with fmt::format():
 *
 * throw util::Exception("bad port {}", port);
 */
class Exception : public std::exception {
 public:
  Exception() = default;

  template <typename... Ts>
  Exception(fmt::format_string<Ts...> format_str, Ts&&... ts)
      : what_(fmt::format(format_str, std::forward<Ts>(ts)...)) {}

  char const* what() const noexcept override { return what_.c_str(); }

 private:
  std::string what_;
};

/*
 * An error that is somebody else's fault rather than a bug: bad cmdline args, an unreachable
 * server, a malformed message from a peer, an illegal move.
 *
 * A main() catches these and prints the message to stderr instead of letting the process die with
 * a core dump (core dumps being the "dirty" way to exit). The TableServer catches them per
 * connection and reports them back to the peer.
 */
class CleanException : public Exception {
 public:
  using Exception::Exception;
};

}  // namespace util
