#include "doctext.h"
#include <iostream>

int main(int argc, char* argv[])
{
  using namespace doctext;

  try
  {
    shell_runner runner;

    process_result result = runner.run(command{"printf 'out'; printf 'err' >&2"});
    ensure(result.exit_code) == 0;
    ensure(result.std_out) == "out";
    ensure(result.std_err) == "err";

    const command failing{"printf 'partial'; printf 'no such file\\n' >&2; exit 1"};
    bool reported = false;
    try
    {
      runner.run(failing);
    }
    catch (const std::exception& e)
    {
      std::optional<errors::shell_failure> failure = errors::find_context<errors::shell_failure>(e);
      ensure(failure.has_value()) == true;
      ensure(failure->command) == failing;
      ensure(failure->exit_code) == 1;
      ensure(failure->std_out) == "partial";
      ensure(failure->std_err) == "no such file\n";
      ensure(errors::diagnostic_message(e)).contains("no such file");
      reported = true;
    }
    ensure(reported) == true;
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
