#pragma once

#include <iostream>
#include <memory>
#include <string>

#include "sift_core/task_store.hpp"
#include "sift_services/deduplication_service.hpp"

namespace sift_cli
{

  enum class Command
  {
    Add,
    Ingest,
    Similar,
    Recent,
    Show,
    Delete,
    Complete,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string config_path;
    std::string name;
    int priority = 2;
    std::string due_date;
    std::string context;
    std::string file_path;
    std::string query;
    int top_k = sift_core::TaskStore::DEFAULT_SIMILAR_LIMIT;
    int limit = sift_core::TaskStore::DEFAULT_RECENT_LIMIT;
    long long task_id = 0;
    bool force = false;  // add without the duplicate check
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    CliHandler(std::shared_ptr<sift_core::TaskStore> task_store,
               std::shared_ptr<sift_services::DeduplicationService> dedup_service,
               std::ostream &out = std::cout);

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Parse command line arguments. Throws CliError on bad usage.
    static CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command
    void execute_command(const CliOptions &options);

    static void print_help(std::ostream &out);

  private:
    std::shared_ptr<sift_core::TaskStore> task_store_;
    std::shared_ptr<sift_services::DeduplicationService> dedup_service_;
    std::ostream &out_;

    // Command handlers
    void handle_add_command(const CliOptions &options);
    void handle_ingest_command(const CliOptions &options);
    void handle_similar_command(const CliOptions &options);
    void handle_recent_command(const CliOptions &options);
    void handle_show_command(const CliOptions &options);
    void handle_delete_command(const CliOptions &options, bool complete);

    // Helper methods
    void print_task(const sift_core::TaskRecord &task, size_t position);
    void print_tasks(const std::vector<sift_core::TaskRecord> &tasks);
  };

}  // namespace sift_cli
