// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#include <lsysgen/runtime.hpp>
#include <lsysgen/tool.hpp>
#include <lsysgen/util/print.hpp>

#include <cxxopts.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <string>
#include <vector>

#include "lsysgen/config.hpp"

using namespace lsysgen::runtime;
using namespace lsysgen::tool;
using namespace lsysgen::util;
namespace fs = std::filesystem;

using SerializerFn = std::string (*)(const Generation&);

static const std::map<std::string, SerializerFn> output_formats = {
  {"text", NoSpaceSerializer},
  {"spaced", SimpleSpaceSerializer},
  {"repr", ReprSerializer},
};

int main(int argc, char **argv) {
  std::string output_format_choices;
  bool first_format = true;
  for (const auto& output_format : output_formats) {
    if (!first_format) {
      output_format_choices += ", ";
    }
    output_format_choices += output_format.first;
    first_format = false;
  }

  int failures = 0;
  try {
    cxxopts::Options options(argv[0], "lsysgen: render generations saved as JSON");
    options.add_options()
      ("input",
       "input files to process",
       cxxopts::value<std::vector<std::string>>(),
       "PATH")
      ("o,out",
       "directory to save the rendered generations",
       cxxopts::value<std::string>()->default_value((fs::current_path()).string()),
       "DIR")
      ("stdout",
       "print rendered generations to stdout (alias for --out='')",
       cxxopts::value<bool>())
      ("f,format",
       "output format (choices: " + output_format_choices + ")",
       cxxopts::value<std::string>()->default_value("text"),
       "NAME")
      ("version", "print version and exit")
      ("help", "print help and exit");

    options.parse_positional({"input"});
    auto args = options.parse(argc, argv);

    if (args.count("help")) {
      pout(options.help());
      exit(0);
    }

    if (args.count("version")) {
      poutf("{} {}", argv[0], LSYSGEN_VERSION);
      exit(0);
    }

    fs::path out_dir = args.count("stdout") ? "" : args["out"].as<std::string>();
    if (!out_dir.empty()) {
      fs::create_directories(out_dir);
    }

    auto of_it = output_formats.find(args["format"].as<std::string>());
    if (of_it == output_formats.end()) {
      throw cxxopts::exceptions::parsing("Invalid argument for option 'format'");
    }
    if (!args.count("input")) {
      throw cxxopts::exceptions::parsing("No input files given");
    }

    JsonGenerationCodec codec;
    for (const auto &path_str : args["input"].as<std::vector<std::string>>()) {
      // 1) read entire input file
      fs::path in_file{path_str};
      std::ifstream ifs(in_file, std::ios::binary);
      if (!ifs) {
        perrf("Failed to open input file {}.", in_file.string());
        failures++;
        continue;
      }
      std::string src((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());

      // 2) decode to generations, one per line when several were kept
      std::vector<Generation> generations;
      if (!codec.decode_lines(src, generations)) {
        perrf("File {} does not contain valid generations.", in_file.string());
        failures++;
        continue;
      }

      // 3) render them with the selected serializer
      std::string text;
      for (size_t i = 0; i < generations.size(); ++i) {
        if (i > 0) {
          text += "\n";
        }
        text += of_it->second(generations[i]);
      }
      if (!out_dir.empty()) {
        fs::path out_file = out_dir / in_file.stem();
        std::ofstream ofs(out_file);
        ofs << text;
        ofs.close();
      } else {
        pout(text);
      }
    }
  } catch (const cxxopts::exceptions::parsing &e) {
    perrf("error parsing options: {}", e.what());
    exit(1);
  }
  return failures > 0 ? 1 : 0;
}
