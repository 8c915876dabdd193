#include "util/BoostUtil.hpp"

#include <string>

namespace boost_util {

namespace program_options {

void add_flag(boost::program_options::options_description& desc, const char* true_name,
              const char* false_name, bool* flag, const char* true_help, const char* false_help) {
  namespace po = boost::program_options;

  std::string full_true_help = true_help;
  std::string full_false_help = false_help;

  if (*flag) {
    full_true_help += " (no-op)";
  } else {
    full_false_help += " (no-op)";
  }

  desc.add_options()(true_name, po::value(flag)->implicit_value(true)->zero_tokens(),
                     full_true_help.c_str())(
    false_name, po::value(flag)->implicit_value(false)->zero_tokens(), full_false_help.c_str());
}

}  // namespace program_options

}  // namespace boost_util
