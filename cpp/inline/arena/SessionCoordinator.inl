#include "arena/SessionCoordinator.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace arena {

inline auto SessionCoordinator::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po::options_description desc("Table options");
  po2::add_flag(desc, "enable-ai", "disable-ai", &enable_ai,
                "let the AI take the vacant role when a single human is seated",
                "make a single human wait for a second human");
  desc.add(search_params.make_options_description());
  return desc;
}

}  // namespace arena
