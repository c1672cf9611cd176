#include "doctext.h"
#include <iostream>

int main(int argc, char* argv[])
{
  using namespace doctext;

  try
  {
    shell_runner runner;

    // arguments reach the program as they are, nothing is expanded by a shell
    process_result result = runner.run(command{std::vector<std::string>{"printf", "%s|%s", "two words", "$HOME;*"}});
    ensure(result.std_out) == "two words|$HOME;*";

    bool missing_program_reported = false;
    try
    {
      runner.run(command{std::vector<std::string>{"doctext-no-such-program", "input.pdf"}});
    }
    catch (const std::exception& e)
    {
      ensure(errors::contains_type<errors::extraction_failed>(e)) == true;
      ensure(errors::contains_type<errors::shell_failure>(e)) == false;
      ensure(errors::diagnostic_message(e)).contains("doctext-no-such-program");
      missing_program_reported = true;
    }
    ensure(missing_program_reported) == true;

    bool empty_command_reported = false;
    try
    {
      runner.run(command{std::vector<std::string>{}});
    }
    catch (const errors::base& e)
    {
      ensure(std::string{e.what()}) == "Empty command";
      ensure(errors::contains_type<errors::extraction_failed>(e)) == true;
      empty_command_reported = true;
    }
    ensure(empty_command_reported) == true;

    bool failure_reported = false;
    try
    {
      runner.run(command{std::vector<std::string>{"sh", "-c", "exit 3"}});
    }
    catch (const std::exception& e)
    {
      ensure(errors::find_context<errors::shell_failure>(e)->exit_code) == 3;
      failure_reported = true;
    }
    ensure(failure_reported) == true;
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
