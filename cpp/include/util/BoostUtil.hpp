#pragma once

#include <boost/program_options.hpp>

namespace boost_util {

namespace program_options {

/*
 * Adds both --foo and --no-foo options, both writing into *flag. The one matching the current
 * value of *flag is annotated as a no-op in the --help output. This allows you to brainlessly add
 * both options without having to worry about what the default value is.
 *
 * See: https://stackoverflow.com/a/33172979/543913
 */
void add_flag(boost::program_options::options_description& desc, const char* true_name,
              const char* false_name, bool* flag, const char* true_help, const char* false_help);

/*
 * Constructs a boost::program_options::command_line_parser out of ts, which is expected to be
 * a collection of strings from the command line. Uses this to store to the passed-in desc.
 * Returns the parsed variables_map.
 *
 * Parsing errors are rethrown as util::CleanException, since they are the user's fault.
 */
template <typename... Ts>
boost::program_options::variables_map parse_args(
  const boost::program_options::options_description& desc, Ts&&... ts);

}  // namespace program_options

}  // namespace boost_util

#include "inline/util/BoostUtil.inl"
