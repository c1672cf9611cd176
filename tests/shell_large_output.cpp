#include "doctext.h"
#include <iostream>

int main(int argc, char* argv[])
{
  using namespace doctext;

  try
  {
    // several times the pipe buffer on both streams at once
    const size_t out_size = 8 * 1024 * 1024;
    const size_t err_size = 4 * 1024 * 1024;
    process_result result = shell_runner{}.run(command{
      "head -c " + std::to_string(err_size) + " /dev/zero >&2; head -c " + std::to_string(out_size) + " /dev/zero"});
    ensure(result.exit_code) == 0;
    ensure(result.std_out.size()) == out_size;
    ensure(result.std_err.size()) == err_size;
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
