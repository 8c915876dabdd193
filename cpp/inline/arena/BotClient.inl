#include "arena/BotClient.hpp"

#include <boost/program_options.hpp>

namespace arena {

inline auto BotClient::Params::make_options_description() {
  namespace po = boost::program_options;

  po::options_description desc("Remote table options");
  desc.add_options()("remote-server",
                     po::value<std::string>(&remote_server)->default_value(remote_server),
                     "table server to connect to")(
    "remote-port", po::value<io::port_t>(&remote_port)->default_value(remote_port),
    "table server port")("name", po::value<std::string>(&name)->default_value(name),
                         "display name to join with");
  return desc;
}

}  // namespace arena
