#include "nc-validator/NetCdfReader.hpp"
#include "nc-validator/SchemaYaml.hpp"
#include <fstream>
#include <iostream>
#include <string>

using namespace ncvalidator;

int main(int argc, char *argv[]) {
  if (argc != 2 && argc != 3) {
    std::cerr << "Usage: " << argv[0] << " <file.nc> [output.yaml]\n";
    return 1;
  }

  OpenResult opened = open_schema(argv[1]);
  if (!opened.ok()) {
    std::cerr << "Failed to open " << argv[1] << ": "
              << opened.error->message << "\n";
    return 1;
  }

  std::string yaml = SchemaYaml::dump(*opened.file);
  if (argc == 2) {
    std::cout << yaml;
    return 0;
  }

  std::ofstream fout(argv[2]);
  if (!fout) {
    std::cerr << "Failed to write " << argv[2] << "\n";
    return 1;
  }
  fout << yaml;
  std::cout << "Wrote schema of " << argv[1] << " to " << argv[2] << std::endl;
  return 0;
}
