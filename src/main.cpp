#include "cli/cli.hpp"
#include "config/config.hpp"
#include "crypto/checksum.hpp"
#include "crypto/cipher.hpp"
#include "logger/logger.hpp"
#include "pipeline/packaging_pipeline.hpp"
#include "store/store.hpp"
#include <iostream>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  std::string store_dir;
  std::string config_path;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -s <store-dir> [-c <config.json>]\n"
        << "Required arguments:\n"
        << "  -s, --store   Directory of the local content store\n"
        << "Optional arguments:\n"
        << "  -c, --config  JSON configuration file\n"
        << "Example: " << program_name << " -s ./objects -c shardpack.json\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> flags = {"-s", "--store", "-c", "--config"};

  ProgramOptions options;
  if (argc % 2 == 0) {
    std::cerr << "Error: Every flag needs a value\n";
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    if (flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    if (flag == "-s" || flag == "--store") {
      options.store_dir = value;
    } else {
      options.config_path = value;
    }
  }

  if (options.store_dir.empty()) {
    std::cerr << "Error: Store directory is required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_shell(const ProgramOptions& options) {
  try {
    shardpack::config::PipelineConfig config;
    if (!options.config_path.empty()) {
      config = shardpack::config::load_config(options.config_path);
    }

    shardpack::logging::init_logging(config.logging.file,
                                     shardpack::logging::parse_severity(config.logging.level));

    shardpack::store::FileStore store(options.store_dir);
    shardpack::crypto::Checksum checksum;
    shardpack::crypto::Cipher cipher;
    shardpack::pipeline::PackagingPipeline pipeline(store, checksum, cipher, config);

    shardpack::cli::CLI cli(pipeline);
    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start shardpack: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_shell(options)) {
    return 1;
  }
  return 0;
}
