#include "doctext.h"
#include <fstream>
#include <iostream>
#include <sstream>

using namespace doctext;

namespace
{

int exit_code_of(const std::vector<std::string>& argv)
{
  try
  {
    shell_runner{}.run(command{argv});
    return 0;
  }
  catch (const std::exception& e)
  {
    std::optional<errors::shell_failure> failure = errors::find_context<errors::shell_failure>(e);
    if (!failure)
      throw;
    return failure->exit_code;
  }
}

std::string read_file(const std::filesystem::path& path)
{
  std::ifstream stream{path, std::ios::binary};
  std::ostringstream contents;
  contents << stream.rdbuf();
  return contents.str();
}

}

int main(int argc, char* argv[])
{
  try
  {
    throw_if(argc != 2, "usage: cli <path to doctext executable>");
    const std::string cli = std::filesystem::absolute(argv[1]).string();

    scoped_temp_file sample{".txt"};
    std::ofstream{sample.path(), std::ios::binary} << "Zażółć gęślą jaźń. Pchnąć w tę łódź jeża lub ośm skrzyń fig.";

    process_result result = shell_runner{}.run(command{std::vector<std::string>{cli, sample.path().string()}});
    ensure(result.std_out) == "Zażółć gęślą jaźń. Pchnąć w tę łódź jeża lub ośm skrzyń fig.";

    result = shell_runner{}.run(command{std::vector<std::string>{cli, "-e", "ascii", sample.path().string()}});
    ensure(result.std_out) == "Za gl ja. Pchn w t d jea lub om skrzy fig.";

    scoped_temp_file output{".out"};
    shell_runner{}.run(command{std::vector<std::string>{cli, "--encoding", "ISO-8859-2", "-o", output.path().string(), "-O", "layout=true", sample.path().string()}});
    ensure(read_file(output.path()).substr(0, 6)) == "Za\xBF\xF3\xB3\xE6";

    result = shell_runner{}.run(command{std::vector<std::string>{cli, "--version"}});
    ensure(result.std_out).contains("doctext");

    ensure(exit_code_of({cli, "-O", "key=1", "-O", "key=2", sample.path().string()})) == 2;
    ensure(exit_code_of({cli, "-O", "no-separator", sample.path().string()})) == 2;
    ensure(exit_code_of({cli, "-e", "klingon-8", sample.path().string()})) == 2;
    ensure(exit_code_of({cli, "--no-such-flag", sample.path().string()})) == 2;
    ensure(exit_code_of({cli})) == 2;
    ensure(exit_code_of({cli, "/nonexistent/report.txt"})) == 1;
    ensure(exit_code_of({cli, "-m", "magic", "/nonexistent/report.pdf"})) == 1;
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
