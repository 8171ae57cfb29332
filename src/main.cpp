#include "flows/client/client_flow.h"
#include "flows/responder/responder_flow.h"
#include "utils/cli/args.h"

#include <iostream>

int main(int argc, char* argv[])
{
  using namespace beacon;

  const cli::Options opt = cli::parse(argc, argv);
  if (opt.help)
  {
    cli::print_usage(argv[0]);
    return 0;
  }
  if (!opt.valid)
  {
    std::cerr << opt.error << std::endl;
    cli::print_usage(argv[0]);
    return 2;
  }

  config::discovery_config config;
  try
  {
    config = cli::build_config(opt);
  }
  catch (const config::config_error& e)
  {
    std::cerr << "[beacon] configuration error: " << e.what() << std::endl;
    return 2;
  }

  try
  {
    if (opt.mode == "responder")
    {
      return flows::run_responder(config);
    }
    return flows::run_client(config);
  }
  catch (const config::config_error& e)
  {
    std::cerr << "[beacon] configuration error: " << e.what() << std::endl;
    return 2;
  }
}
