#include "arena/TableServer.hpp"

#include <boost/program_options.hpp>

namespace arena {

inline auto TableServer::Params::make_options_description() {
  namespace po = boost::program_options;

  po::options_description desc("TableServer options");
  desc.add_options()("port", po::value<io::port_t>(&port)->default_value(port),
                     "port to listen on")(
    "channel-capacity", po::value<int>(&channel_capacity)->default_value(channel_capacity),
    "max number of undelivered events queued per participant");
  return desc;
}

}  // namespace arena
