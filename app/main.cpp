#include "DatasetWriter.hpp"
#include "Errors.hpp"
#include "PipelineConfig.hpp"
#include "SessionJoiner.hpp"

#include <boost/program_options.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace po = boost::program_options;

int main(int argc, char** argv) {
  po::options_description opts("Usage: strokelegs [options] INPUT...\nOptions");
  opts.add_options()
    ("help,h", "show this help")
    ("config,c", po::value<std::string>(), "JSON file with segmenter/sanitizer thresholds")
    ("output,o", po::value<std::string>(), "write the dataset here instead of stdout")
    ("verbose,v", "log per-step details");

  po::options_description hidden;
  hidden.add_options()
    ("input", po::value<std::vector<std::string>>(), "session CSV files");

  po::options_description all;
  all.add(opts).add(hidden);

  po::positional_options_description positional;
  positional.add("input", -1);

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << "Error: " << e.what() << "\n" << opts << "\n";
    return 2;
  }

  if (vm.count("help")) {
    std::cout << opts << "\n";
    return 0;
  }
  if (!vm.count("input")) {
    std::cerr << "Error: no input files\n" << opts << "\n";
    return 2;
  }

  // stdout may carry the dataset, keep the log on stderr
  spdlog::set_default_logger(spdlog::stderr_color_mt("strokelegs"));
  spdlog::set_level(vm.count("verbose") ? spdlog::level::debug : spdlog::level::info);

  try {
    PipelineConfig cfg;
    if (vm.count("config")) {
      cfg = PipelineConfig::fromFile(vm["config"].as<std::string>());
    }

    SessionJoiner joiner(cfg);
    Dataset dataset = joiner.join(vm["input"].as<std::vector<std::string>>());
    spdlog::info("{} rows from {} files, {} skipped", dataset.rows.size(),
                 vm["input"].as<std::vector<std::string>>().size() - dataset.failures.size(),
                 dataset.failures.size());

    if (vm.count("output")) {
      const std::string path = vm["output"].as<std::string>();
      std::ofstream out(path);
      if (!out.is_open()) {
        spdlog::error("Could not open output file: {}", path);
        return 1;
      }
      writeJson(dataset, out);
    } else {
      writeJson(dataset, std::cout);
    }
    return 0;
  } catch (const NoValidSessionsError& e) {
    spdlog::error("{}", e.what());
    return 1;
  } catch (const ConfigError& e) {
    spdlog::error("{}", e.what());
    return 1;
  } catch (const std::exception& e) {
    spdlog::error("Error: {}", e.what());
    return 1;
  }
}
