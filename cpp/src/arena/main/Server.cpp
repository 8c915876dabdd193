#include "arena/SessionCoordinator.hpp"
#include "arena/TableServer.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <boost/program_options.hpp>

#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#include <iostream>
#include <thread>

namespace {

// Blocks SIGINT/SIGTERM in the calling thread, and in every thread it spawns afterwards, so that
// they can only be picked up by sigwait().
sigset_t block_shutdown_signals() {
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
    throw util::Exception("pthread_sigmask() failed");
  }
  return signals;
}

}  // namespace

int main(int ac, char* av[]) {
  try {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    util::Logging::Params log_params;
    util::Random::Params random_params;
    arena::SessionCoordinator::Params coordinator_params;
    arena::TableServer::Params server_params;

    po::options_description desc("gomoku_server options");
    desc.add_options()("help,h", "help");
    desc.add(server_params.make_options_description())
      .add(coordinator_params.make_options_description())
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

    sigset_t signals = block_shutdown_signals();

    arena::SessionCoordinator coordinator(coordinator_params);
    arena::TableServer server(server_params, coordinator);
    server.start();

    std::thread signal_thread([&] {
      int signum = 0;
      if (sigwait(&signals, &signum) == 0) {
        LOG_INFO("Received signal {}", signum);
      }
      server.shutdown();
    });

    server.run();

    // run() only returns after shutdown(), but the signal thread may still be waiting if the
    // shutdown was triggered by an accept() failure
    pthread_kill(signal_thread.native_handle(), SIGTERM);
    signal_thread.join();
  } catch (const util::CleanException& e) {
    std::cerr << "Caught a CleanException: ";
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}
