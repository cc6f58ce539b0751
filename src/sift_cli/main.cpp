#include <curl/curl.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>

#include "sift_cli/cli_handler.hpp"
#include "sift_cli/config.hpp"
#include "sift_core/db/database_manager.hpp"
#include "sift_core/embedding/embedding_provider_factory.hpp"
#include "sift_core/errors.hpp"
#include "sift_core/task_store.hpp"
#include "sift_services/deduplication_service.hpp"

namespace {

constexpr const char *kDefaultConfigFile = "siftrc.json";

sift_cli::Config load_config(const std::string &explicit_path) {
  sift_cli::Config config;
  if (!explicit_path.empty()) {
    config = sift_cli::Config::from_file(explicit_path);
  } else if (std::filesystem::exists(kDefaultConfigFile)) {
    config = sift_cli::Config::from_file(kDefaultConfigFile);
  } else {
    config = sift_cli::Config::from_json(nlohmann::json::object());
  }
  config.apply_environment();
  return config;
}

}  // namespace

int main(int argc, char *argv[]) {
  curl_global_init(CURL_GLOBAL_DEFAULT);
  int exit_code = 0;
  auto &db_manager = sift_core::DatabaseManager::get_instance();

  try {
    sift_cli::CliOptions options = sift_cli::CliHandler::parse_arguments(argc, argv);
    if (options.command == sift_cli::Command::Help) {
      sift_cli::CliHandler::print_help(std::cout);
      curl_global_cleanup();
      return 0;
    }

    sift_cli::Config config = load_config(options.config_path);

    db_manager.initialize(config.database_path, config.database_key, config.pool_size);
    auto embedding_provider = sift_core::make_embedding_provider(config.embedding_settings());
    auto task_store = std::make_shared<sift_core::TaskStore>(db_manager, embedding_provider);
    auto dedup_service = std::make_shared<sift_services::DeduplicationService>(
        task_store, config.duplicate_threshold);

    sift_cli::CliHandler handler(task_store, dedup_service);
    handler.execute_command(options);
  } catch (const sift_core::TaskStoreError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    if (e.is_transient()) {
      std::cerr << "The database is in use by another process; try again." << std::endl;
    }
    exit_code = 1;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    exit_code = 1;
  }

  db_manager.shutdown();
  curl_global_cleanup();
  return exit_code;
}
