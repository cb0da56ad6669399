#include <chrono>
#include <iostream>

#include "sage_cli/cli_handler.hpp"
#include "sage_core/config.hpp"
#include "sage_core/db/database_manager.hpp"
#include "sage_core/services/query_orchestrator.hpp"
#include "sage_core/services/service_provider.hpp"

namespace
{
constexpr std::chrono::seconds kWorkerGracePeriod{2};
}

int main(int argc, char *argv[])
{
  try
  {
    const sage_core::Config config = sage_core::Config::load(sage_core::Config::resolve_path());

    sage_cli::CliOptions options =
        sage_cli::CliHandler::parse_arguments(argc, argv, config.default_collection);
    if (options.command == sage_cli::Command::Help)
    {
      sage_cli::CliHandler::print_help(std::cout);
      return 0;
    }

    auto &db_manager = sage_core::DatabaseManager::get_instance();
    db_manager.initialize(config.vector_db_path, config.db_pool_size);
    auto services = sage_core::ServiceProvider::create(config, db_manager);

    int exit_code = 0;
    try
    {
      sage_cli::CliHandler handler(services);
      handler.execute_command(options);
    }
    catch (const std::exception &e)
    {
      std::cerr << "Error: " << e.what() << std::endl;
      exit_code = 1;
    }

    // A timed-out query keeps its worker running; it must let go of its
    // pooled connections before the database goes away
    if (!services->get_query_orchestrator().wait_for_workers(kWorkerGracePeriod))
    {
      std::cerr << "Warning: a timed-out query was still running at exit" << std::endl;
    }
    db_manager.shutdown();
    return exit_code;
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
