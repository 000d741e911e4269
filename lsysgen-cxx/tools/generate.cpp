// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#include <lsysgen/parser.hpp>
#include <lsysgen/runtime.hpp>
#include <lsysgen/tool.hpp>
#include <lsysgen/util/log.hpp>
#include <lsysgen/util/print.hpp>
#include <lsysgen/util/random.hpp>

#include <cxxopts.hpp>

#include <filesystem>
#include <iostream>
#include <map>
#include <random>
#include <string>
#include <vector>

#include "lsysgen/config.hpp"

using namespace lsysgen::runtime;
using namespace lsysgen::tool;
using namespace lsysgen::util;

static const std::map<std::string, Tool::SerializerFn> output_formats = {
  {"text", NoSpaceSerializer},
  {"spaced", SimpleSpaceSerializer},
  {"repr", ReprSerializer},
  {"json", JsonSerializer},
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

  try {
    cxxopts::Options options(argv[0], "lsysgen: expand a stochastic L-system");
    options.add_options()
      ("grammar",
       "LSYS grammar file",
       cxxopts::value<std::string>(),
       "FILE")
      ("g,generations",
       "number of expansion steps (default: expand until a fixed point is reached)",
       cxxopts::value<int>(),
       "NUM")
      ("max-generations",
       "maximum number of expansion steps when expanding to a fixed point",
       cxxopts::value<int>()->default_value(std::to_string(LSYSGEN_MAX_GENERATIONS)),
       "NUM")
      ("all",
       "output every generation on a line of its own, not just the last one",
       cxxopts::value<bool>()->default_value("false"))
      ("weights",
       "JSON file defining weight multipliers for rule cases",
       cxxopts::value<std::string>(),
       "FILE")
      ("f,format",
       "output format (choices: " + output_format_choices + ")",
       cxxopts::value<std::string>()->default_value("text"),
       "NAME")
      ("o,out",
       "output file name pattern",
       cxxopts::value<std::string>()->default_value((std::filesystem::current_path() / "outputs" / "output_%d").string()),
       "FILE")
      ("stdout",
       "print outputs to stdout (alias for --out='')",
       cxxopts::value<bool>())
      ("n",
       "number of outputs to generate",
       cxxopts::value<int>()->default_value("1"),
       "NUM")
      ("memo-size",
       "memoize the last NUM unique outputs; if a memoized output is generated again, it is discarded and derivation is retried",
       cxxopts::value<int>()->default_value("0"),
       "NUM")
      ("unique-attempts",
       "limit on how many times to try to derive a unique (i.e., non-memoized) output; no effect if --memo-size=0",
       cxxopts::value<int>()->default_value("2"),
       "NUM")
      ("random-seed",
       "initialize random number generator with fixed seed (not set by default)",
       cxxopts::value<unsigned int>(),
       "NUM")
      ("stats",
       "print how often each rule case was chosen",
       cxxopts::value<bool>()->default_value("false"))
      ("check",
       "only validate the grammar and print it in canonical form",
       cxxopts::value<bool>()->default_value("false"))
      ("dry-run",
       "derive outputs without writing them to file or printing to stdout",
       cxxopts::value<bool>()->default_value("false"))
      ("log-level",
       "logging verbosity (off, fatal, error, warn, info, debug, trace)",
       cxxopts::value<std::string>()->default_value("warn"),
       "LEVEL")
      ("version", "print version and exit")
      ("help", "print help and exit")
      ;
    options.parse_positional({"grammar"});
    options.positional_help("FILE");
    auto args = options.parse(argc, argv);

    if (args.count("help")) {
      pout(options.help());
      exit(0);
    }
    if (args.count("version")) {
      poutf("{} {}", argv[0], LSYSGEN_VERSION);
      poutf("model: {}", LSYSGEN_STRFY(LSYSGEN_MODEL));
      exit(0);
    }

    LogLevel level;
    if (!parse_log_level(args["log-level"].as<std::string>(), level)) {
      throw cxxopts::exceptions::parsing("Invalid argument for option 'log-level'");
    }
    set_log_level(level);

    auto output_format_it = output_formats.find(args["format"].as<std::string>());
    if (output_format_it == output_formats.end()) {
      throw cxxopts::exceptions::parsing("Invalid argument for option 'format'");
    }
    if (!args.count("grammar")) {
      throw cxxopts::exceptions::parsing("Missing grammar file");
    }

    Grammar* grammar = GrammarLoader().load(args["grammar"].as<std::string>());
    if (!grammar) {
      exit(1);
    }

    if (args["check"].as<bool>()) {
      std::cout << grammar->format();
      delete grammar;
      exit(0);
    }

    // Parse optional custom weights from JSON
    WeightedModel::WeightMap weights;
    if (args.count("weights") && !JsonWeightLoader().load(args["weights"].as<std::string>(), weights)) {
      delete grammar;
      exit(1);
    }

    Model* model = new LSYSGEN_MODEL();
    if (!weights.empty()) {
      model = new WeightedModel(model, weights);
    }
    StatisticsListener* stats = args["stats"].as<bool>() ? new StatisticsListener() : nullptr;
    std::vector<Listener*> listeners;
    if (stats) {
      listeners.push_back(stats);
    }
    Engine engine(model, listeners);

    GeneratorTool generator(*grammar,  // grammar
                            engine,  // engine
                            output_format_it->second,  // serializer
                            args.count("stdout") ? "" : args["out"].as<std::string>(),  // out_format
                            args.count("generations") ? args["generations"].as<int>() : -1,  // generations
                            args["max-generations"].as<int>(),  // max_generations
                            args["all"].as<bool>(),  // all_generations
                            args["memo-size"].as<int>(),  // memo_size
                            args["unique-attempts"].as<int>(),  // unique_attempts
                            args["dry-run"].as<bool>()  // dry_run
                            );

    unsigned int seed = args.count("random-seed") ? args["random-seed"].as<unsigned int>() : std::random_device()();
    DefaultRandomSource random;
    for (int i = 0, n = args["n"].as<int>(); i < n; ++i) {
      random.seed(seed + i);
      generator.create_test(i, random);
    }

    if (stats) {
      perr(stats->format());
    }
    delete grammar;
  } catch (const cxxopts::exceptions::parsing &e) {
    perrf("error parsing options: {}", e.what());
    exit(1);
  }
}
