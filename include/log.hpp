#pragma once

#include <string>

enum class LogLevel { DEBUG, INFO, WARN, ERROR, OFF };

void set_log_level(LogLevel level);
LogLevel log_level();

void log_debug(const std::string &message);
void log_info(const std::string &message);
void log_warn(const std::string &message);
void log_error(const std::string &message);
