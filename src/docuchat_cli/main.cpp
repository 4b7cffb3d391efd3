#include "docuchat_cli/cli_handler.hpp"
#include <iostream>
#include <cstdlib>

int main(int argc, char *argv[])
{
  try
  {
    const char *api_base_url = std::getenv("API_BASE_URL");
    std::string base_url = api_base_url ? api_base_url : "http://127.0.0.1:3030";

    docuchat_cli::CliOptions options = docuchat_cli::CliHandler::parse_arguments(argc, argv);

    curl_global_init(CURL_GLOBAL_DEFAULT);
    bool ok = false;
    {
      docuchat_cli::CliHandler handler(base_url);
      ok = handler.execute_command(options);
    }
    curl_global_cleanup();
    return ok ? 0 : 1;
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
