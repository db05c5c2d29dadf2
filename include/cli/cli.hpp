#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "pipeline/packaging_pipeline.hpp"

namespace shardpack {
namespace cli {

class CLI {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit CLI(pipeline::PackagingPipeline& pipeline,
               std::istream& input = std::cin,
               std::ostream& output = std::cout);


  // ---- STARTUP ----
  void run();


  // ---- GETTERS ----
  const std::vector<pipeline::ObjectRecord>& records() const { return records_; }

private:
  // ---- PARAMETERS ----
  bool running_;
  pipeline::PackagingPipeline& pipeline_;
  std::istream& input_;
  std::ostream& output_;
  // Objects uploaded or imported during this session
  std::vector<pipeline::ObjectRecord> records_;


  // ---- COMMAND PROCESSING ----
  void process_command(const std::string& command, const std::vector<std::string>& args);
  void handle_put_command(const std::string& filename);
  void handle_get_command(const std::vector<std::string>& args);
  void handle_verify_command(const std::string& manifest_id);
  void handle_export_command(const std::vector<std::string>& args);
  void handle_import_command(const std::string& filename);
  void handle_list_command();
  void handle_keygen_command();
  void handle_help_command();
  void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace shardpack
