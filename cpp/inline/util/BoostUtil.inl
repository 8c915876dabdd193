#include "util/BoostUtil.hpp"

#include "util/Exception.hpp"

namespace boost_util {

namespace program_options {

template <typename... Ts>
boost::program_options::variables_map parse_args(
  const boost::program_options::options_description& desc, Ts&&... ts) {
  namespace po = boost::program_options;
  po::variables_map vm;
  try {
    po::store(po::command_line_parser(std::forward<Ts>(ts)...).options(desc).run(), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    throw util::CleanException("{}", e.what());
  }
  return vm;
}

}  // namespace program_options

}  // namespace boost_util
