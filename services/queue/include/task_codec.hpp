#pragma once
#include <nlohmann/json.hpp>
#include "task.hpp"

// Wire form of a Task: enum names as lowercase strings, timestamps as ISO-8601 UTC.
nlohmann::json task_to_json(const Task& task);
Task task_from_json(const nlohmann::json& j);
