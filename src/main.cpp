// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#include "app/scenario.hpp"
#include "observer/snapshot.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <string>
#include <vector>

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Scenario:\n"
      << "  --nodes=<n>          Number of simulated nodes (default: 16)\n"
      << "  --seed=<n>           RNG seed (default: 0)\n"
      << "  --topology=<kind>    delaunay, random or none (default: delaunay)\n"
      << "  --min-peers=<n>      Random topology: minimum peers per node (default: 2)\n"
      << "  --max-peers=<n>      Random topology: peer count upper bound, exclusive (default: 4)\n"
      << "  --rounds=<n>         Poke rounds (default: 20)\n"
      << "  --pokes=<n>          Nodes poked per round (default: 1)\n"
      << "  --interval=<secs>    Virtual seconds per round (default: 100)\n"
      << "  --messages=<n>       Random underlay messages per round (default: 0)\n"
      << "  --flight=<speed>     Underlay distance per virtual second (default: 200)\n"
      << "  --dump               Print a JSON snapshot of the final state\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical,off)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: sim, topology, protocol, consensus, app, all\n"
      << "                       Can be comma-separated: --debug=sim,consensus\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "  --logfile=<path>     Log to a rotating file instead of stdout\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

// Parses "--name=<count>" into target; prints an error and returns false on bad input
static bool parse_count(const std::string &arg, size_t prefix_len, int min, int max,
                        size_t &target) {
  auto value = isds::util::SafeParseInt(arg.substr(prefix_len), min, max);
  if (!value) {
    std::cerr << "Error: Invalid value in " << arg << std::endl;
    std::cerr << "Value must be a number between " << min << " and " << max << std::endl;
    return false;
  }
  target = static_cast<size_t>(*value);
  return true;
}

int main(int argc, char *argv[]) {
  try {
    // Parse command line arguments
    isds::app::ScenarioConfig config;
    std::string log_level = "info";
    std::string log_file;
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << isds::GetFullVersionString() << std::endl;
        std::cout << isds::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--nodes=") == 0) {
        if (!parse_count(arg, 8, 0, 100000, config.nodes)) {
          return 1;
        }
      } else if (arg.find("--seed=") == 0) {
        auto seed_opt = isds::util::SafeParseUint64(arg.substr(7));
        if (!seed_opt) {
          std::cerr << "Error: Invalid seed: " << arg.substr(7) << std::endl;
          return 1;
        }
        config.sim_config.seed = *seed_opt;
      } else if (arg.find("--topology=") == 0) {
        auto kind = isds::app::ParseTopology(arg.substr(11));
        if (!kind) {
          std::cerr << "Error: Unknown topology: " << arg.substr(11) << std::endl;
          std::cerr << "Topology must be one of: delaunay, random, none" << std::endl;
          return 1;
        }
        config.topology = *kind;
      } else if (arg.find("--min-peers=") == 0) {
        if (!parse_count(arg, 12, 0, 100000, config.min_peers)) {
          return 1;
        }
      } else if (arg.find("--max-peers=") == 0) {
        if (!parse_count(arg, 12, 0, 100000, config.max_peers)) {
          return 1;
        }
      } else if (arg.find("--rounds=") == 0) {
        if (!parse_count(arg, 9, 0, 1000000, config.rounds)) {
          return 1;
        }
      } else if (arg.find("--pokes=") == 0) {
        if (!parse_count(arg, 8, 0, 100000, config.pokes_per_round)) {
          return 1;
        }
      } else if (arg.find("--messages=") == 0) {
        if (!parse_count(arg, 11, 0, 1000000, config.random_messages)) {
          return 1;
        }
      } else if (arg.find("--interval=") == 0) {
        auto interval = isds::util::SafeParseDouble(arg.substr(11), 0.0, 1e9);
        if (!interval) {
          std::cerr << "Error: Invalid interval: " << arg.substr(11) << std::endl;
          return 1;
        }
        config.round_interval = *interval;
      } else if (arg.find("--flight=") == 0) {
        auto speed = isds::util::SafeParseDouble(arg.substr(9), 1e-6, 1e12);
        if (!speed) {
          std::cerr << "Error: Invalid flight speed: " << arg.substr(9) << std::endl;
          return 1;
        }
        config.sim_config.flight_per_second = *speed;
      } else if (arg == "--dump") {
        config.dump_snapshot = true;
      } else if (arg == "--verbose") {
        log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
        if (!isds::util::LogManager::IsValidLevel(log_level)) {
          std::cerr << "Error: Unknown log level: " << log_level << std::endl;
          return 1;
        }
      } else if (arg.find("--logfile=") == 0) {
        log_file = arg.substr(10);
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=sim,consensus
        for (const auto &component : isds::util::SplitList(arg.substr(8))) {
          if (component != "all" && !isds::util::LogManager::IsComponent(component)) {
            std::cerr << "Error: Unknown log component: " << component << std::endl;
            return 1;
          }
          debug_components.push_back(component);
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    isds::util::LogManager::Initialize(log_level, !log_file.empty(), log_file);

    // Apply component-specific debug levels
    for (const auto &component : debug_components) {
      if (component == "all") {
        isds::util::LogManager::SetLogLevel("trace");
      } else {
        if (!isds::util::LogManager::SetComponentLevel(component, "trace")) {
          LOG_WARN("Could not raise log level of component {}", component);
        }
      }
    }

    int exit_code = 0;
    {
      isds::app::Scenario scenario(config);

      if (!scenario.initialize()) {
        LOG_ERROR("Failed to initialize scenario");
        exit_code = 1;
      } else if (!scenario.run()) {
        LOG_ERROR("Scenario run failed");
        exit_code = 1;
      } else {
        const isds::app::ScenarioReport report = scenario.report();
        std::cout << "nodes:        " << report.nodes << "\n"
                  << "links:        " << report.links << "\n"
                  << "virtual time: " << report.end_time << "s\n"
                  << "tip heights:  " << report.min_tip_height << ".."
                  << report.max_tip_height << "\n"
                  << "fork tips:    " << report.total_fork_tips << "\n"
                  << "converged:    " << (report.converged ? "yes" : "no") << " ("
                  << report.distinct_tips << " distinct tips)" << std::endl;

        if (config.dump_snapshot) {
          std::cout << isds::observer::Snapshot(scenario.simulation()).dump(2)
                    << std::endl;
        }
      }
    }

    isds::util::LogManager::Shutdown();
    return exit_code;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    isds::util::LogManager::Shutdown();
    return 1;
  }
}
