#pragma once
#include <string>
#include "timestamp.hpp"

std::string getenv_or(const char* key, const std::string& def);
std::string gen_uuid();
std::string current_worker_id();
long current_process_id();
bool process_alive(long pid);
