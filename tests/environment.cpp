#include "doctext.h"
#include <cstdlib>
#include <iostream>

int main(int argc, char* argv[])
{
  using namespace doctext;

  try
  {
    const std::string variable{environment::tesseract_language_variable};

    ::unsetenv(variable.c_str());
    ensure(environment::get(variable).has_value()) == false;
    ensure(environment::get_or(variable, "eng")) == "eng";

    ::setenv(variable.c_str(), "", 1);
    ensure(environment::get(variable).value()) == "";
    ensure(environment::get_or(variable, "eng")) == "eng";

    ::setenv(variable.c_str(), "pol+eng", 1);
    ensure(environment::get(variable).value()) == "pol+eng";
    ensure(environment::get_or(variable, "eng")) == "pol+eng";
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
