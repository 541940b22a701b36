#include "resilix/core/logger.h"

#include "resilix/core/time.h"

#include <cstdio>
#include <ctime>
#include <iostream>
#include <kj/common.h>
#include <kj/debug.h>
#include <kj/filesystem.h>
#include <kj/memory.h>
#include <kj/string-tree.h>

namespace resilix::core {

// ============================================================================
// LogLevel
// ============================================================================

kj::StringPtr to_string(LogLevel level) {
  switch (level) {
  case LogLevel::Trace:
    return "TRACE"_kj;
  case LogLevel::Debug:
    return "DEBUG"_kj;
  case LogLevel::Info:
    return "INFO"_kj;
  case LogLevel::Warn:
    return "WARN"_kj;
  case LogLevel::Error:
    return "ERROR"_kj;
  case LogLevel::Critical:
    return "CRITICAL"_kj;
  case LogLevel::Off:
    return "OFF"_kj;
  }
  return "UNKNOWN"_kj;
}

kj::Maybe<LogLevel> to_log_level(kj::StringPtr name) {
  static constexpr LogLevel levels[] = {LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
                                        LogLevel::Warn,  LogLevel::Error, LogLevel::Critical,
                                        LogLevel::Off};
  for (auto level : levels) {
    auto label = to_string(level);
    if (label.size() != name.size()) {
      continue;
    }
    bool match = true;
    for (size_t i = 0; i < name.size(); ++i) {
      char c = name[i];
      if (c >= 'a' && c <= 'z') {
        c = static_cast<char>(c - 'a' + 'A');
      }
      if (c != label[i]) {
        match = false;
        break;
      }
    }
    if (match) {
      return level;
    }
  }
  return kj::none;
}

// ============================================================================
// TextFormatter
// ============================================================================

kj::String TextFormatter::colorize(LogLevel level, kj::StringPtr text) const {
  kj::StringPtr color_code;
  switch (level) {
  case LogLevel::Trace:
    color_code = "\033[90m"_kj; // Gray
    break;
  case LogLevel::Debug:
    color_code = "\033[36m"_kj; // Cyan
    break;
  case LogLevel::Info:
    color_code = "\033[32m"_kj; // Green
    break;
  case LogLevel::Warn:
    color_code = "\033[33m"_kj; // Yellow
    break;
  case LogLevel::Error:
    color_code = "\033[31m"_kj; // Red
    break;
  case LogLevel::Critical:
    color_code = "\033[35m"_kj; // Magenta
    break;
  default:
    color_code = "\033[0m"_kj;
  }
  return kj::str(color_code, text, "\033[0m"_kj);
}

kj::String TextFormatter::format(const LogEntry& entry) const {
  auto time_t_sec = std::chrono::system_clock::to_time_t(entry.time_point);
  auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(entry.time_point.time_since_epoch()) %
      1000;
  std::tm tm{};
#ifdef _WIN32
  localtime_s(&tm, &time_t_sec);
#else
  localtime_r(&time_t_sec, &tm);
#endif

  char timestamp[64];
  std::snprintf(timestamp, sizeof(timestamp), "[%04d-%02d-%02d %02d:%02d:%02d.%03d]",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                static_cast<int>(ms.count()));

  auto label = kj::str("["_kj, to_string(entry.level), "]"_kj);
  auto level_part = use_color_ ? colorize(entry.level, label) : kj::mv(label);

  auto location = include_function_
                      ? kj::str(entry.file, ":"_kj, entry.line, " "_kj, entry.function)
                      : kj::str(entry.file, ":"_kj, entry.line);

  return kj::str(timestamp, " "_kj, level_part, " "_kj, location, " - "_kj, entry.message);
}

// ============================================================================
// JsonFormatter
// ============================================================================

kj::String escape_json(kj::StringPtr s) {
  kj::Vector<char> result(s.size() + 8);

  auto append = [&result](kj::StringPtr lit) { result.addAll(lit); };

  for (char c : s) {
    switch (c) {
    case '"':
      append("\\\""_kj);
      break;
    case '\\':
      append("\\\\"_kj);
      break;
    case '\b':
      append("\\b"_kj);
      break;
    case '\f':
      append("\\f"_kj);
      break;
    case '\n':
      append("\\n"_kj);
      break;
    case '\r':
      append("\\r"_kj);
      break;
    case '\t':
      append("\\t"_kj);
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
        append(kj::StringPtr(buf));
      } else {
        result.add(c);
      }
    }
  }

  result.add('\0');
  return kj::String(result.releaseAsArray());
}

kj::String JsonFormatter::format(const LogEntry& entry) const {
  kj::StringPtr indent = pretty_ ? "  "_kj : ""_kj;
  kj::StringPtr sep = pretty_ ? ",\n"_kj : ","_kj;
  kj::StringPtr newline = pretty_ ? "\n"_kj : ""_kj;

  return kj::strTree("{"_kj, newline,
                     indent, "\"timestamp\":\""_kj, escape_json(entry.timestamp), "\""_kj, sep,
                     indent, "\"level\":\""_kj, to_string(entry.level), "\""_kj, sep,
                     indent, "\"file\":\""_kj, escape_json(entry.file), "\""_kj, sep,
                     indent, "\"line\":"_kj, static_cast<int>(entry.line), sep,
                     indent, "\"function\":\""_kj, escape_json(entry.function), "\""_kj, sep,
                     indent, "\"message\":\""_kj, escape_json(entry.message), "\""_kj, newline,
                     "}"_kj)
      .flatten();
}

// ============================================================================
// ConsoleOutput
// ============================================================================

void ConsoleOutput::write(kj::StringPtr formatted, const LogEntry& entry) {
  std::ostream* out = &std::cout;
  if (use_stderr_ || entry.level == LogLevel::Error || entry.level == LogLevel::Critical) {
    out = &std::cerr;
  }
  out->write(formatted.begin(), static_cast<std::streamsize>(formatted.size()));
  *out << '\n';
}

void ConsoleOutput::flush() {
  std::cout.flush();
  std::cerr.flush();
}

// ============================================================================
// FileOutput
// ============================================================================

namespace {

kj::Path backup_path(const kj::Path& base, size_t index) {
  return base.parent().append(kj::str(base.basename()[0], "."_kj, index));
}

} // namespace

FileOutput::FileOutput(kj::StringPtr file_path, size_t max_size, size_t max_files)
    : filesystem_(kj::newDiskFilesystem()),
      guarded_(filesystem_->getCurrentPath().evalNative(file_path)), max_size_(max_size),
      max_files_(max_files) {
  auto lock = guarded_.lockExclusive();
  auto native = lock->file_path.toNativeString(true);
  lock->file_stream.open(native.cStr(), std::ios::out | std::ios::app);
  KJ_REQUIRE(lock->file_stream.is_open(), "failed to open log file", native);

  lock->file_stream.seekp(0, std::ios::end);
  lock->current_size = static_cast<size_t>(lock->file_stream.tellp());
}

FileOutput::~FileOutput() noexcept {
  auto lock = guarded_.lockExclusive();
  if (lock->file_stream.is_open()) {
    lock->file_stream.close();
  }
}

void FileOutput::write(kj::StringPtr formatted, const LogEntry& /* entry */) {
  auto lock = guarded_.lockExclusive();
  if (!lock->file_stream.is_open()) {
    return;
  }

  lock->file_stream.write(formatted.begin(), static_cast<std::streamsize>(formatted.size()));
  lock->file_stream << '\n';
  lock->current_size += formatted.size() + 1;

  if (max_size_ > 0 && lock->current_size >= max_size_) {
    perform_rotation(*lock);
  }
}

void FileOutput::flush() {
  auto lock = guarded_.lockExclusive();
  if (lock->file_stream.is_open()) {
    lock->file_stream.flush();
  }
}

bool FileOutput::is_open() const {
  return guarded_.lockShared()->file_stream.is_open();
}

void FileOutput::rotate() {
  auto lock = guarded_.lockExclusive();
  perform_rotation(*lock);
}

kj::String FileOutput::current_path() const {
  return guarded_.lockShared()->file_path.toNativeString(true);
}

void FileOutput::perform_rotation(FileOutputState& state) {
  state.file_stream.close();

  auto& root = filesystem_->getRoot();

  if (max_files_ == 0) {
    root.remove(state.file_path);
  } else {
    auto oldest = backup_path(state.file_path, max_files_);
    if (root.exists(oldest)) {
      root.remove(oldest);
    }
    for (size_t i = max_files_; i > 1; --i) {
      auto from = backup_path(state.file_path, i - 1);
      if (root.exists(from)) {
        root.transfer(backup_path(state.file_path, i), kj::WriteMode::CREATE | kj::WriteMode::MODIFY, root, from,
                      kj::TransferMode::MOVE);
      }
    }
    root.transfer(backup_path(state.file_path, 1), kj::WriteMode::CREATE | kj::WriteMode::MODIFY, root,
                  state.file_path, kj::TransferMode::MOVE);
  }

  auto native = state.file_path.toNativeString(true);
  state.file_stream.open(native.cStr(), std::ios::out | std::ios::trunc);
  KJ_REQUIRE(state.file_stream.is_open(), "failed to reopen log file after rotation", native);
  state.current_size = 0;
}

// ============================================================================
// MultiOutput
// ============================================================================

void MultiOutput::add_output(kj::Own<LogOutput> output) {
  guarded_.lockExclusive()->add(kj::mv(output));
}

void MultiOutput::clear_outputs() {
  guarded_.lockExclusive()->clear();
}

void MultiOutput::write(kj::StringPtr formatted, const LogEntry& entry) {
  auto lock = guarded_.lockExclusive();
  for (auto& output : *lock) {
    output->write(formatted, entry);
  }
}

void MultiOutput::flush() {
  auto lock = guarded_.lockExclusive();
  for (auto& output : *lock) {
    output->flush();
  }
}

bool MultiOutput::is_open() const {
  return !guarded_.lockShared()->empty();
}

size_t MultiOutput::output_count() const {
  return guarded_.lockShared()->size();
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger(kj::Own<LogFormatter> formatter, kj::Own<LogOutput> output)
    : guarded_(kj::mv(formatter), kj::mv(output)) {}

Logger::~Logger() = default;

void Logger::set_level(LogLevel level) {
  guarded_.lockExclusive()->level = level;
}

LogLevel Logger::level() const {
  return guarded_.lockShared()->level;
}

bool Logger::enabled(LogLevel level) const {
  auto current = guarded_.lockShared()->level;
  return current != LogLevel::Off && level != LogLevel::Off &&
         static_cast<int>(level) >= static_cast<int>(current);
}

void Logger::set_formatter(kj::Own<LogFormatter> formatter) {
  guarded_.lockExclusive()->formatter = kj::mv(formatter);
}

void Logger::set_output(kj::Own<LogOutput> output) {
  auto lock = guarded_.lockExclusive();
  lock->multi_output = kj::heap<MultiOutput>();
  lock->multi_output->add_output(kj::mv(output));
}

void Logger::add_output(kj::Own<LogOutput> output) {
  guarded_.lockExclusive()->multi_output->add_output(kj::mv(output));
}

void Logger::log(LogLevel level, kj::StringPtr message, const std::source_location& location) {
  auto lock = guarded_.lockExclusive();
  if (lock->level == LogLevel::Off || level == LogLevel::Off ||
      static_cast<int>(level) < static_cast<int>(lock->level)) {
    return;
  }

  // Strip directories from the file name
  kj::StringPtr file_path(location.file_name());
  const char* begin = file_path.begin();
  const char* base = file_path.end();
  while (base > begin && base[-1] != '/' && base[-1] != '\\') {
    --base;
  }

  auto now = std::chrono::system_clock::now();
  LogEntry entry{.level = level,
                 .timestamp = to_utc_iso8601(now),
                 .file = kj::heapString(base, static_cast<size_t>(file_path.end() - base)),
                 .line = static_cast<int_least32_t>(location.line()),
                 .function = kj::heapString(location.function_name()),
                 .message = kj::heapString(message),
                 .time_point = now};

  auto formatted = lock->formatter->format(entry);
  lock->multi_output->write(formatted, entry);
}

void Logger::trace(kj::StringPtr message, const std::source_location& location) {
  log(LogLevel::Trace, message, location);
}

void Logger::debug(kj::StringPtr message, const std::source_location& location) {
  log(LogLevel::Debug, message, location);
}

void Logger::info(kj::StringPtr message, const std::source_location& location) {
  log(LogLevel::Info, message, location);
}

void Logger::warn(kj::StringPtr message, const std::source_location& location) {
  log(LogLevel::Warn, message, location);
}

void Logger::error(kj::StringPtr message, const std::source_location& location) {
  log(LogLevel::Error, message, location);
}

void Logger::critical(kj::StringPtr message, const std::source_location& location) {
  log(LogLevel::Critical, message, location);
}

void Logger::flush() {
  guarded_.lockExclusive()->multi_output->flush();
}

// ============================================================================
// Global Logger
// ============================================================================

Logger& global_logger() {
  // Function-local static: constructed once, thread-safe since C++11
  static Logger logger(kj::heap<TextFormatter>(false, false), kj::heap<ConsoleOutput>());
  return logger;
}

} // namespace resilix::core
