// Copyright (c) 2021-2025 nikitapnn1@gmail.com
// This file is a part of npsystem (Distributed Control System) and covered by LICENSING file in the topmost directory

#include <iostream>
#include <filesystem>

#include <boost/program_options.hpp>

#include "compilation.hpp"

using namespace npbgen;

namespace clr {
constexpr const char* red = "\033[31m";
constexpr const char* cyan = "\033[36m";
constexpr const char* reset = "\033[0m";
}

int main(int argc, char* argv[]) {
  namespace po = boost::program_options;

  std::filesystem::path output_dir;
  std::vector<std::filesystem::path> input_files;
  bool generate_cpp;
  bool generate_c_header;
  bool generate_metadata;

  // Declare the supported options.
  po::options_description desc("Allowed options");
  desc.add_options()
    ("help", "produce help message")
    ("cpp", po::bool_switch(&generate_cpp)->default_value(false), "Generate C++ scaffolding")
    ("c-header", po::bool_switch(&generate_c_header)->default_value(false), "Generate C header")
    ("metadata", po::bool_switch(&generate_metadata)->default_value(false), "Generate JSON metadata")
    ("output-dir", po::value<std::filesystem::path>(&output_dir), "Output directory for all generated files")
    ("input-files", po::value<std::vector<std::filesystem::path>>(&input_files), "List of declaration files")
    ;

  po::positional_options_description p;
  p.add("input-files", -1);

  try {
    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv).options(desc).positional(p).run(), vm);
    po::notify(vm);

    if (vm.count("help")) {
      std::cout << desc << "\n";
      return 0;
    }

    if (!vm.count("input-files")) {
      std::cerr << "Input files not specified.\n";
      return -1;
    }
  } catch (po::error& e) {
    std::cerr << e.what() << '\n';
    return -1;
  }

  // Without an explicit selection everything is generated.
  if (!generate_cpp && !generate_c_header && !generate_metadata)
    generate_cpp = generate_c_header = generate_metadata = true;

  try {
    if (!output_dir.empty())
      std::filesystem::create_directories(output_dir);

    CompilationBuilder builder;
    builder
      .set_input_files(input_files)
      .set_output_dir(output_dir)
      ;
    if (generate_cpp)
      builder.with_cpp_scaffolding();
    if (generate_c_header)
      builder.with_c_header();
    if (generate_metadata)
      builder.with_metadata();

    builder.build()->compile();

    return 0;
  } catch (classification_error& e) {
    std::cerr << clr::red << "Classification error in:\n\t" << clr::cyan << e.file_path << ": " << e.declaration << ": " << clr::reset << e.what() << '\n';
  } catch (declaration_error& e) {
    std::cerr << clr::red << "Declaration error in:\n\t" << clr::cyan << e.file_path << ": " << e.declaration << ": " << clr::reset << e.what() << '\n';
  } catch (std::exception& ex) {
    std::cerr << ex.what() << '\n';
  }

  return -1;
}
