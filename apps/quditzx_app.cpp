//
// This file is part of the QuditZX library released under the MIT license.
// See README.md for more information.
//

#include "circuit/Circuit.hpp"
#include "clifford/CliffordSimplifier.hpp"
#include "clifford/Configuration.hpp"
#include "zx/Graph.hpp"
#include "zx/Simplify.hpp"

#include <boost/program_options.hpp>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>
#include <plog/Severity.h>
#include <stdexcept>
#include <string>

namespace {
nlohmann::json readInput(const std::string& filename) {
  if (filename == "-") {
    return nlohmann::json::parse(std::cin);
  }
  std::ifstream ifs(filename);
  if (!ifs.good()) {
    throw std::runtime_error("Could not open file " + filename);
  }
  return nlohmann::json::parse(ifs);
}

void writeOutput(const nlohmann::json& j, const std::string& filename) {
  if (filename.empty()) {
    std::cout << j.dump(2) << "\n";
    return;
  }
  std::ofstream ofs(filename);
  if (!ofs.good()) {
    throw std::runtime_error("Could not open file " + filename);
  }
  ofs << j.dump(2) << "\n";
}

int simplifyCircuit(const nlohmann::json& input, const std::string& mode,
                    const clifford::Configuration& config,
                    const std::string& out, const bool printStats) {
  const auto qc = circuit::Circuit::fromJson(input);
  clifford::CliffordSimplifier simplifier(qc, config);
  if (mode == "simple") {
    simplifier.simpleOptimize();
  } else if (mode == "single_qudit") {
    simplifier.singleQuditOptimize();
  } else {
    std::cerr << "[ERROR] Unknown circuit mode '" << mode << "'!\n";
    return 1;
  }
  writeOutput(simplifier.getCircuit().json(), out);
  if (printStats) {
    std::cout << simplifier.getResults() << "\n";
  }
  return 0;
}

int simplifyGraph(const nlohmann::json& input, const std::string& mode,
                  const std::string& out, const bool printStats) {
  auto g = zx::Graph::fromJson(input);
  const auto initialVertices = g.numVertices();
  const auto initialEdges = g.numEdges();

  const auto start = std::chrono::high_resolution_clock::now();
  if (mode == "graph_like") {
    zx::toGraphLike(g);
  } else if (mode == "ap_form") {
    zx::toGraphLike(g);
    zx::toApForm(g);
  } else if (mode == "clifford") {
    zx::cliffordSimp(g);
  } else {
    std::cerr << "[ERROR] Unknown graph mode '" << mode << "'!\n";
    return 1;
  }
  const auto end = std::chrono::high_resolution_clock::now();
  const std::chrono::duration<double> diff = end - start;

  writeOutput(g.json(), out);
  if (printStats) {
    nlohmann::json stats;
    stats["initial_vertices"] = initialVertices;
    stats["initial_edges"] = initialEdges;
    stats["vertices"] = g.numVertices();
    stats["edges"] = g.numEdges();
    stats["graph_like"] = zx::isGraphLike(g);
    stats["runtime"] = diff.count();
    std::cout << stats.dump(2) << "\n";
  }
  return 0;
}
} // namespace

int main(int argc, char** argv) {
  namespace po = boost::program_options;
  // clang-format off
  po::options_description description("QuditZX -- Options");
  description.add_options()
      ("help,h", "produce help message")
      ("in_circuit", po::value<std::string>(), R"(Clifford circuit to simplify (JSON file, "-" reads from stdin))")
      ("in_graph", po::value<std::string>(), R"(ZX-diagram to simplify (JSON file, "-" reads from stdin))")
      ("mode,m", po::value<std::string>(), R"(Circuits: "simple" | "single_qudit" (default: "simple"), graphs: "graph_like" | "ap_form" | "clifford" (default: "clifford"))")
      ("check_semantics", "Compare the symplectic matrices after every circuit rewrite")
      ("out,o", po::value<std::string>(), "File to write the result to (default: stdout)")
      ("ps", "Print statistics")
      ("verbosity,v", po::value<int>()->default_value(3), "Log level from 0 (none) to 6 (verbose)")
      ;
  // clang-format on
  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.count("help") > 0) {
      std::cout << description;
      return 0;
    }
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << "[ERROR] " << e.what()
              << "! Try option '--help' for available commandline options.\n";
    std::exit(1);
  }

  const auto isCircuit = vm.count("in_circuit") > 0;
  if (isCircuit == (vm.count("in_graph") > 0)) {
    std::cerr << "[ERROR] Specify exactly one of '--in_circuit' and "
                 "'--in_graph'!\n";
    std::exit(1);
  }

  const auto level = vm["verbosity"].as<int>();
  if (level < plog::none || level > plog::verbose) {
    std::cerr << "[ERROR] Verbosity has to be between 0 and 6!\n";
    std::exit(1);
  }
  const auto severity = static_cast<plog::Severity>(level);
  static plog::ConsoleAppender<plog::TxtFormatter> consoleAppender;
  plog::init(severity, &consoleAppender);

  const auto out = vm.count("out") > 0 ? vm["out"].as<std::string>() : "";
  const auto printStats = vm.count("ps") > 0;

  try {
    if (isCircuit) {
      const auto input = readInput(vm["in_circuit"].as<std::string>());
      clifford::Configuration config{};
      config.checkSemanticsEachStep = vm.count("check_semantics") > 0;
      config.verbosity = severity;
      const auto mode =
          vm.count("mode") > 0 ? vm["mode"].as<std::string>() : "simple";
      return simplifyCircuit(input, mode, config, out, printStats);
    }
    const auto input = readInput(vm["in_graph"].as<std::string>());
    const auto mode =
        vm.count("mode") > 0 ? vm["mode"].as<std::string>() : "clifford";
    return simplifyGraph(input, mode, out, printStats);
  } catch (const std::exception& e) {
    PLOG_FATAL << e.what();
    std::cerr << "[ERROR] " << e.what() << "\n";
    return 1;
  }
}
