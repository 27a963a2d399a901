#include "common/logging.h"
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace vaultsim {
namespace common {

namespace {

void append_json_string(std::ostream &out, const std::string &text) {
  out << '"';
  for (char c : text) {
    switch (c) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\t':
      out << "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        char escaped[8];
        std::snprintf(escaped, sizeof(escaped), "\\u%04x",
                      static_cast<unsigned>(c));
        out << escaped;
      } else {
        out << c;
      }
    }
  }
  out << '"';
}

} // namespace

const char *level_name(LogLevel level) {
  switch (level) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::CRITICAL:
    return "CRITICAL";
  }
  return "UNKNOWN";
}

Result<LogLevel> parse_log_level(const std::string &name) {
  std::string lowered = name;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lowered == "warning") {
    lowered = "warn";
  }

  for (LogLevel level : {LogLevel::TRACE, LogLevel::DEBUG, LogLevel::INFO,
                         LogLevel::WARN, LogLevel::ERROR, LogLevel::CRITICAL}) {
    std::string candidate = level_name(level);
    std::transform(candidate.begin(), candidate.end(), candidate.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (candidate == lowered) {
      return Result<LogLevel>(level);
    }
  }
  return Result<LogLevel>("Unknown log level: " + name);
}

std::string Logger::format_json(const LogEntry &entry) const {
  std::ostringstream json;
  json << "{\"sim_time_ms\":" << entry.sim_time_ms << ",\"level\":\""
       << level_name(entry.level) << "\",\"module\":";
  append_json_string(json, entry.module);
  json << ",\"message\":";
  append_json_string(json, entry.message);

  if (!entry.error_code.empty()) {
    json << ",\"error_code\":";
    append_json_string(json, entry.error_code);
  }

  if (!entry.context.empty()) {
    json << ",\"context\":{";
    const char *separator = "";
    for (const auto &[key, value] : entry.context) {
      json << separator;
      append_json_string(json, key);
      json << ':';
      append_json_string(json, value);
      separator = ",";
    }
    json << '}';
  }

  json << '}';
  return json.str();
}

std::string Logger::format_text(const LogEntry &entry) const {
  std::ostringstream text;
  text << "[t=" << entry.sim_time_ms << "ms] [" << level_name(entry.level)
       << "] [" << entry.module << "] " << entry.message;

  if (!entry.error_code.empty()) {
    text << " (error: " << entry.error_code << ")";
  }

  if (!entry.context.empty()) {
    text << " {";
    const char *separator = "";
    for (const auto &[key, value] : entry.context) {
      text << separator << key << '=' << value;
      separator = ", ";
    }
    text << '}';
  }

  return text.str();
}

void Logger::emit(const LogEntry &entry) {
  std::string line = json_format_.load(std::memory_order_relaxed)
                         ? format_json(entry)
                         : format_text(entry);
  std::lock_guard<std::mutex> lock(output_mutex_);
  *output_ << line << '\n';
  output_->flush();
}

} // namespace common
} // namespace vaultsim
