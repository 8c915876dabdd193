#include "games/gomoku/SearchEngine.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace gomoku {

inline auto SearchEngine::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po::options_description desc("SearchEngine options");
  desc.add_options()("search-depth", po::value<int>(&depth)->default_value(depth),
                     "look-ahead depth of the heuristic search");
  po2::add_flag(desc, "random-ai", "heuristic-ai", &random_mode,
                "pick uniformly random legal moves", "pick moves with the heuristic search");
  return desc;
}

}  // namespace gomoku
