#include "cli/cli.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace shardpack {
namespace cli {

namespace {

Bytes read_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Cannot open " + path);
  }
  return Bytes(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

void write_file(const std::string& path, const Bytes& data) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file || !file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()))) {
    throw std::runtime_error("Cannot write " + path);
  }
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(pipeline::PackagingPipeline& pipeline, std::istream& input, std::ostream& output)
  : running_(false)
  , pipeline_(pipeline)
  , input_(input)
  , output_(output) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  output_ << "shardpack> " << std::flush;

  while (running_ && std::getline(input_, line)) {
    std::istringstream iss(line);
    std::string command;
    std::vector<std::string> args;

    iss >> command;
    for (std::string arg; iss >> arg;) {
      args.push_back(arg);
    }

    if (command == "quit") {
      running_ = false;
      continue;
    }
    if (!command.empty()) {
      process_command(command, args);
    }

    if (running_) {
      output_ << "shardpack> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.size() << " arguments";

  if (command == "put" && args.size() == 1) {
    handle_put_command(args[0]);
  }
  else if (command == "get" && (args.size() == 2 || args.size() == 3)) {
    handle_get_command(args);
  }
  else if (command == "verify" && args.size() == 1) {
    handle_verify_command(args[0]);
  }
  else if (command == "export" && args.size() >= 2) {
    handle_export_command(args);
  }
  else if (command == "import" && args.size() == 1) {
    handle_import_command(args[0]);
  }
  else if (command == "ls" && args.empty()) {
    handle_list_command();
  }
  else if (command == "keygen" && args.empty()) {
    handle_keygen_command();
  }
  else if (command == "help" && args.empty()) {
    handle_help_command();
  }
  else {
    output_ << "Unknown command or invalid arguments. Type 'help' for usage." << std::endl;
  }
}

void CLI::handle_put_command(const std::string& filename) {
  try {
    Bytes data = read_file(filename);
    auto name = std::filesystem::path(filename).filename().string();
    auto result = pipeline_.upload(data, name);

    output_ << "Stored " << name << " (" << data.size() << " bytes, " << result.manifest.piece_count
            << " pieces) as " << result.manifest_id << std::endl;
    if (result.key_material) {
      output_ << "Generated key: " << *result.key_material << std::endl;
      output_ << "Keep this key, it is required to read the object back." << std::endl;
    }
    records_.push_back(result.record);
  } catch (const std::exception& e) {
    log_and_display_error("Error storing file", e.what());
  }
}

void CLI::handle_get_command(const std::vector<std::string>& args) {
  try {
    std::optional<std::string> key;
    if (args.size() == 3) {
      key = args[2];
    }
    Bytes data = pipeline_.download(args[0], key);
    write_file(args[1], data);
    output_ << "Wrote " << data.size() << " bytes to " << args[1] << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error reading object", e.what());
  }
}

void CLI::handle_verify_command(const std::string& manifest_id) {
  try {
    auto report = pipeline_.verify(manifest_id);
    output_ << (report.valid ? "Valid" : "Damaged") << ", "
            << (report.recoverable ? "recoverable" : "not recoverable") << std::endl;
    for (auto position : report.corrupted) {
      output_ << "  corrupted piece " << position << std::endl;
    }
    for (auto position : report.missing) {
      output_ << "  missing piece " << position << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error verifying object", e.what());
  }
}

void CLI::handle_export_command(const std::vector<std::string>& args) {
  try {
    std::vector<ContentId> ids(args.begin() + 1, args.end());
    Bytes archive = pipeline_.export_archive(ids);
    write_file(args[0], archive);
    output_ << "Exported " << ids.size() << " objects to " << args[0] << " (" << archive.size() << " bytes)" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error exporting archive", e.what());
  }
}

void CLI::handle_import_command(const std::string& filename) {
  try {
    auto result = pipeline_.import_archive(read_file(filename), records_);
    for (const auto& item : result.items) {
      if (!item.duplicate) {
        records_.push_back(item.record);
      }
      output_ << (item.duplicate ? "  duplicate " : "  imported  ") << item.record.id << " " << item.record.name << std::endl;
    }
    for (const auto& warning : result.warnings) {
      output_ << "Warning: " << warning << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error importing archive", e.what());
  }
}

void CLI::handle_list_command() {
  if (records_.empty()) {
    output_ << "No objects in this session" << std::endl;
    return;
  }
  for (const auto& record : records_) {
    output_ << record.id << "  " << record.name << "  " << record.size << " bytes"
            << (record.encrypted ? "  encrypted" : "")
            << (record.sharded ? "  " + std::to_string(record.piece_count) + " pieces" : "")
            << (record.imported ? "  imported" : "") << std::endl;
  }
}

void CLI::handle_keygen_command() {
  const auto& encryption = pipeline_.config().encryption;
  output_ << crypto::Cipher::generate_key(encryption.algorithm, encryption.key_bits) << std::endl;
}

void CLI::handle_help_command() {
  output_ << "Available commands:" << std::endl;
  output_ << "  help                           Display this help message" << std::endl;
  output_ << "  put <file>                     Store local <file>, print its manifest id" << std::endl;
  output_ << "  get <id> <out-file> [key-hex]  Reassemble object <id> into <out-file>" << std::endl;
  output_ << "  verify <id>                    Check every stored piece of object <id>" << std::endl;
  output_ << "  export <out-file> <id>...      Bundle objects into an archive" << std::endl;
  output_ << "  import <archive-file>          Store every object of an archive" << std::endl;
  output_ << "  ls                             List objects of this session" << std::endl;
  output_ << "  keygen                         Print a new random key" << std::endl;
  output_ << "  quit                           Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  output_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace shardpack
