#include "sift_cli/cli_handler.hpp"

#include <iomanip>  // Required for std::fixed and std::setprecision
#include <map>
#include <sstream>

namespace sift_cli {

namespace {

int parse_int(const std::string &flag, const std::string &value) {
  try {
    size_t consumed = 0;
    int parsed = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      throw CliError("Invalid number for " + flag + ": " + value);
    }
    return parsed;
  } catch (const std::logic_error &) {
    throw CliError("Invalid number for " + flag + ": " + value);
  }
}

long long parse_id(const std::string &value) {
  try {
    size_t consumed = 0;
    long long parsed = std::stoll(value, &consumed);
    if (consumed != value.size()) {
      throw CliError("Invalid task id: " + value);
    }
    return parsed;
  } catch (const std::logic_error &) {
    throw CliError("Invalid task id: " + value);
  }
}

}  // namespace

CliHandler::CliHandler(std::shared_ptr<sift_core::TaskStore> task_store,
                       std::shared_ptr<sift_services::DeduplicationService> dedup_service,
                       std::ostream &out)
    : task_store_(std::move(task_store)), dedup_service_(std::move(dedup_service)), out_(out) {}

CliOptions CliHandler::parse_arguments(int argc, char *argv[]) {
  CliOptions options;

  // Global --config may precede the command
  int index = 1;
  if (argc > 2 && std::string(argv[1]) == "--config") {
    options.config_path = argv[2];
    index = 3;
  }

  if (argc <= index) {
    options.command = Command::Help;
    return options;
  }

  std::string command = argv[index];
  std::map<std::string, std::string> flags;
  for (int i = index + 1; i < argc; ++i) {
    std::string flag = argv[i];
    if (flag == "--force") {
      options.force = true;
      continue;
    }
    if (i + 1 >= argc) {
      throw CliError("Missing value for " + flag);
    }
    flags[flag] = argv[++i];
  }
  auto flag_value = [&flags](const std::string &long_flag, const std::string &short_flag,
                             std::string *out) {
    auto it = flags.find(long_flag);
    if (it == flags.end()) {
      it = flags.find(short_flag);
    }
    if (it == flags.end()) {
      return false;
    }
    *out = it->second;
    return true;
  };

  std::string value;
  if (command == "add" || command == "a") {
    options.command = Command::Add;
    flag_value("--name", "-n", &options.name);
    if (options.name.empty()) {
      throw CliError("Add command requires a task name. Usage: add --name <name>");
    }
    if (flag_value("--priority", "-p", &value)) {
      options.priority = parse_int("--priority", value);
    }
    flag_value("--due", "-d", &options.due_date);
    flag_value("--context", "-c", &options.context);
  } else if (command == "ingest" || command == "i") {
    options.command = Command::Ingest;
    flag_value("--file", "-f", &options.file_path);
    if (options.file_path.empty()) {
      throw CliError("Ingest command requires a file. Usage: ingest --file <tasks.json>");
    }
  } else if (command == "similar" || command == "s") {
    options.command = Command::Similar;
    flag_value("--query", "-q", &options.query);
    if (options.query.empty()) {
      throw CliError("Similar command requires a query. Usage: similar --query <query>");
    }
    if (flag_value("--top-k", "-k", &value)) {
      options.top_k = parse_int("--top-k", value);
    }
  } else if (command == "recent" || command == "r") {
    options.command = Command::Recent;
    if (flag_value("--limit", "-l", &value)) {
      options.limit = parse_int("--limit", value);
    }
  } else if (command == "show" || command == "delete" || command == "complete") {
    options.command = command == "show"     ? Command::Show
                      : command == "delete" ? Command::Delete
                                            : Command::Complete;
    if (!flag_value("--id", "-i", &value)) {
      throw CliError("The " + command + " command requires a task id. Usage: " + command +
                     " --id <task_id>");
    }
    options.task_id = parse_id(value);
  } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
    options.command = Command::Help;
  } else {
    throw CliError("Unknown command: " + command);
  }

  return options;
}

void CliHandler::execute_command(const CliOptions &options) {
  switch (options.command) {
    case Command::Add:
      handle_add_command(options);
      break;
    case Command::Ingest:
      handle_ingest_command(options);
      break;
    case Command::Similar:
      handle_similar_command(options);
      break;
    case Command::Recent:
      handle_recent_command(options);
      break;
    case Command::Show:
      handle_show_command(options);
      break;
    case Command::Delete:
      handle_delete_command(options, /*complete*/ false);
      break;
    case Command::Complete:
      handle_delete_command(options, /*complete*/ true);
      break;
    case Command::Help:
      print_help(out_);
      break;
  }
}

void CliHandler::handle_add_command(const CliOptions &options) {
  sift_core::TaskCandidate candidate;
  candidate.name = options.name;
  candidate.priority = options.priority;
  candidate.due_date =
      options.due_date.empty() ? sift_services::today_iso_date() : options.due_date;
  std::optional<std::string> context;
  if (!options.context.empty()) {
    context = options.context;
  }

  if (options.force) {
    auto record = task_store_->add_task(candidate, context);
    out_ << "Added task " << *record.id << ": " << record.name << std::endl;
    return;
  }

  auto outcome = dedup_service_->ingest(candidate, context);
  if (outcome.added) {
    out_ << "Added task " << *outcome.record->id << ": " << outcome.record->name << std::endl;
  } else {
    const auto &existing = outcome.skipped->duplicate_of;
    out_ << "Skipped duplicate of task " << *existing.id << ": " << existing.name
         << " (distance " << std::fixed << std::setprecision(4)
         << *existing.similarity_distance << ")" << std::endl;
  }
}

void CliHandler::handle_ingest_command(const CliOptions &options) {
  auto batch = sift_services::TaskBatch::from_file(options.file_path,
                                                   sift_services::today_iso_date());
  out_ << "Summary: " << batch.summary << std::endl;
  if (batch.tasks.empty()) {
    out_ << "No tasks to ingest" << std::endl;
    return;
  }

  auto report = dedup_service_->ingest_batch(batch.tasks);
  out_ << "Added " << report.added.size() << " new task(s), skipped " << report.skipped.size()
       << " duplicate(s)" << std::endl;
  for (const auto &skipped : report.skipped) {
    out_ << "  - " << skipped.candidate.name << " (similar to: " << skipped.duplicate_of.name
         << ")" << std::endl;
  }
}

void CliHandler::handle_similar_command(const CliOptions &options) {
  out_ << "Similar tasks for: " << options.query << " (top_k: " << options.top_k
       << ", search: " << task_store_->strategy_name() << ")" << std::endl;
  print_tasks(task_store_->find_similar_tasks(options.query, options.top_k));
}

void CliHandler::handle_recent_command(const CliOptions &options) {
  print_tasks(task_store_->get_recent_tasks(options.limit));
}

void CliHandler::handle_show_command(const CliOptions &options) {
  auto task = task_store_->get_task(options.task_id);
  if (!task) {
    throw CliError("Task " + std::to_string(options.task_id) + " not found");
  }
  print_task(*task, 1);
  if (task->email_context) {
    out_ << "   Context: " << *task->email_context << std::endl;
  }
  out_ << "   Embedded: " << (task->has_embedding() ? "yes" : "no") << std::endl;
}

void CliHandler::handle_delete_command(const CliOptions &options, bool complete) {
  bool removed = complete ? task_store_->complete_task(options.task_id)
                          : task_store_->delete_task(options.task_id);
  if (!removed) {
    throw CliError("Task " + std::to_string(options.task_id) + " not found");
  }
  out_ << (complete ? "Completed" : "Deleted") << " task " << options.task_id << std::endl;
}

void CliHandler::print_task(const sift_core::TaskRecord &task, size_t position) {
  out_ << position << ". [" << (task.id ? std::to_string(*task.id) : "-") << "] " << task.name
       << std::endl;
  out_ << "   Priority: " << sift_core::priority_to_string(task.priority)
       << "  Due: " << task.due_date << "  Created: " << task.created_at << std::endl;
  if (task.similarity_distance) {
    std::ostringstream distance;
    distance << std::fixed << std::setprecision(4) << *task.similarity_distance;
    out_ << "   Distance: " << distance.str() << std::endl;
  }
}

void CliHandler::print_tasks(const std::vector<sift_core::TaskRecord> &tasks) {
  if (tasks.empty()) {
    out_ << "No tasks found" << std::endl;
    return;
  }
  for (size_t i = 0; i < tasks.size(); ++i) {
    print_task(tasks[i], i + 1);
  }
}

void CliHandler::print_help(std::ostream &out) {
  out << "Usage: sift [--config <siftrc.json>] <command> [options]\n"
      << "\n"
      << "Commands:\n"
      << "  add, a        --name <name> [--priority 1|2|3] [--due YYYY-MM-DD]\n"
      << "                [--context <text>] [--force]\n"
      << "  ingest, i     --file <tasks.json>\n"
      << "  similar, s    --query <text> [--top-k <n>]\n"
      << "  recent, r     [--limit <n>]\n"
      << "  show          --id <task_id>\n"
      << "  delete        --id <task_id>\n"
      << "  complete      --id <task_id>\n"
      << "  help, h\n"
      << "\n"
      << "Environment: DATABASE_PATH, SIFT_DB_KEY, EMBEDDING_PROVIDER, OPENAI_API_KEY,\n"
      << "             OPENAI_BASE_URL, EMBEDDING_MODEL, OLLAMA_URL" << std::endl;
}

}  // namespace sift_cli
