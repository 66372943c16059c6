#include "docmind_cli/cli_handler.hpp"
#include <iostream>
#include <cstdlib>

int main(int argc, char *argv[])
{
  try
  {
    const char *api_base_url = std::getenv("DOCMIND_API_URL");
    std::string base_url = api_base_url ? api_base_url : "http://127.0.0.1:3030";

    const char *user = std::getenv("DOCMIND_USER");
    std::string user_id = user ? user : "";

    docmind_cli::CliOptions options = docmind_cli::CliHandler::parse_arguments(argc, argv);

    docmind_cli::CliHandler handler(base_url, user_id);
    handler.execute_command(options);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
