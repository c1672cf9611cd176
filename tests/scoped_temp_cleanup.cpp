#include "doctext.h"
#include <fstream>
#include <iostream>

int main(int argc, char* argv[])
{
  using namespace doctext;

  try
  {
    std::filesystem::path file_path;
    std::filesystem::path dir_path;
    try
    {
      scoped_temp_file file{".png"};
      scoped_temp_directory dir;
      file_path = file.path();
      dir_path = dir.path();
      ensure(std::filesystem::is_regular_file(file_path)) == true;
      ensure(std::filesystem::is_directory(dir_path)) == true;
      ensure(file_path.extension().string()) == ".png";
      std::ofstream{dir_path / "page-1.png"} << "not really an image";
      std::filesystem::create_directory(dir_path / "nested");
      std::ofstream{dir_path / "nested" / "page-2.png"} << "neither";
      throw make_error("Simulated failure of an external tool", errors::extraction_failed{});
    }
    catch (const errors::base& e)
    {
      ensure(std::string{e.what()}) == "Simulated failure of an external tool";
    }
    ensure(file_path.empty()) == false;
    ensure(std::filesystem::exists(file_path)) == false;
    ensure(std::filesystem::exists(dir_path)) == false;

    scoped_temp_file first;
    scoped_temp_file second;
    ensure(first.path()) != second.path();
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
