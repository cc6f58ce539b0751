#include "sift_services/task_batch.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace sift_services {

std::string today_iso_date() {
  auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm_struct = {};
  gmtime_r(&now, &tm_struct);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%d");
  return ss.str();
}

TaskBatch TaskBatch::from_json(const nlohmann::json &json, const std::string &default_due_date) {
  if (!json.is_object()) {
    throw TaskBatchError("Task batch must be a JSON object");
  }

  TaskBatch batch;
  batch.summary = json.value("summary", std::string("Analysis complete"));

  if (!json.contains("tasks")) {
    return batch;
  }
  const auto &tasks = json.at("tasks");
  if (!tasks.is_array()) {
    throw TaskBatchError("\"tasks\" must be an array");
  }

  for (size_t i = 0; i < tasks.size(); ++i) {
    const auto &entry = tasks[i];
    if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string() ||
        entry["name"].get<std::string>().empty()) {
      throw TaskBatchError("Task " + std::to_string(i) + " has no name");
    }
    PendingTask pending;
    pending.candidate.name = entry["name"].get<std::string>();
    try {
      pending.candidate.priority = entry.value("priority", 2);
      pending.candidate.due_date = entry.value("due_date", default_due_date);
      if (entry.contains("email_context") && entry["email_context"].is_string()) {
        pending.email_context = entry["email_context"].get<std::string>();
      }
    } catch (const nlohmann::json::exception &e) {
      throw TaskBatchError("Task " + std::to_string(i) + " is malformed: " + e.what());
    }
    batch.tasks.push_back(std::move(pending));
  }
  return batch;
}

TaskBatch TaskBatch::from_file(const std::string &filename, const std::string &default_due_date) {
  std::ifstream file_stream(filename);
  if (!file_stream.is_open()) {
    throw TaskBatchError("Failed to open task file: " + filename);
  }

  nlohmann::json json;
  try {
    file_stream >> json;
  } catch (const nlohmann::json::exception &e) {
    throw TaskBatchError("Failed to parse JSON in task file '" + filename + "': " + e.what());
  }
  return from_json(json, default_due_date);
}

}  // namespace sift_services
