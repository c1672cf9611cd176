#include "doctext.h"
#include <fstream>
#include <iostream>

namespace
{

void write_file(const std::filesystem::path& path, const std::string& bytes)
{
  std::ofstream stream{path, std::ios::binary};
  stream.write(bytes.data(), bytes.size());
}

}

int main(int argc, char* argv[])
{
  using namespace doctext;

  try
  {
    scoped_temp_file sample{".txt"};
    write_file(sample.path(), "The quick brown fox jumps over the lazy dog.\n");
    ensure(process(sample.path(), "utf-8", {}).v) == "The quick brown fox jumps over the lazy dog.\n";
    ensure(process(sample.path()).v) == "The quick brown fox jumps over the lazy dog.\n";

    // upper-case extension, UTF-8 input re-encoded to a legacy encoding
    scoped_temp_file polish{".TXT"};
    write_file(polish.path(), "Zażółć gęślą jaźń. Pchnąć w tę łódź jeża lub ośm skrzyń fig.");
    ensure(pipeline{}.process(polish.path(), "ISO-8859-2").v) ==
      "Za\xBF\xF3\xB3\xE6 g\xEA\xB6l\xB1 ja\xBC\xF1. Pchn\xB1\xE6 w t\xEA \xB3\xF3\x64\xBC je\xBF\x61 lub o\xB6m skrzy\xF1 fig.";

    scoped_temp_file empty{".txt"};
    ensure(process(empty.path(), "UTF-16LE").v) == "";
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
