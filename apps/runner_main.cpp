#include "particle_sizer/config/configuration.hpp"
#include "particle_sizer/core/errors.hpp"

#include "runner_pipeline.hpp"

#include <iostream>
#include <string>

#include <CLI/CLI.hpp>

namespace {

namespace config = particle_sizer::config;

int validate_command(const std::string &config_path) {
  try {
    auto cfg = config::Config::load(config_path);
    cfg.validate();
  } catch (const particle_sizer::ParticleSizerError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  std::cout << "Config OK: " << config_path << std::endl;
  return 0;
}

int schema_command() {
  std::cout << config::get_schema_json() << std::endl;
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"Particle Sizer Runner"};
  app.require_subcommand(1);

  std::string config_path, image_path, out_dir, run_id;

  auto run_cmd = app.add_subcommand("run", "Run the pipeline on one image");
  run_cmd->add_option("--config", config_path, "Path to config.yaml")
      ->required();
  run_cmd->add_option("--image", image_path, "Micrograph (PNG, TIFF, JPEG or FITS)")
      ->required();
  run_cmd->add_option("--out-dir", out_dir, "Directory receiving the run folder")
      ->required();
  run_cmd->add_option("--run-id", run_id, "Run folder name (default: timestamp)");

  auto validate_cmd = app.add_subcommand("validate", "Load and validate a config");
  validate_cmd->add_option("--config", config_path, "Path to config.yaml")
      ->required();

  auto schema_cmd = app.add_subcommand("schema", "Print the config JSON schema");

  CLI11_PARSE(app, argc, argv);

  if (run_cmd->parsed()) {
    return run_pipeline_command(config_path, image_path, out_dir, run_id);
  }
  if (validate_cmd->parsed()) {
    return validate_command(config_path);
  }
  if (schema_cmd->parsed()) {
    return schema_command();
  }

  std::cerr << app.help() << std::endl;
  return 1;
}
