#include "arena/BotClient.hpp"
#include "games/gomoku/SearchEngine.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <boost/program_options.hpp>

#include <unistd.h>

#include <iostream>

int main(int ac, char* av[]) {
  try {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    util::Logging::Params log_params;
    util::Random::Params random_params;
    arena::BotClient::Params bot_params;
    gomoku::SearchEngine::Params search_params;

    po::options_description desc("gomoku_bot options");
    desc.add_options()("help,h", "help");
    desc.add(bot_params.make_options_description())
      .add(search_params.make_options_description())
      .add(log_params.make_options_description())
      .add(random_params.make_options_description());

    po::variables_map vm = po2::parse_args(desc, ac, av);
    if (vm.count("help")) {
      std::cout << desc << std::endl;
      return 0;
    }

    util::Logging::init(log_params);
    util::Random::init(random_params);

    LOG_INFO("Starting process {}", getpid());

    arena::BotClient bot(bot_params, search_params);
    bot.run();
  } catch (const util::CleanException& e) {
    std::cerr << "Caught a CleanException: ";
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}
