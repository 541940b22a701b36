/**
 * @file logger.h
 * @brief Leveled, thread-safe logging
 *
 * A Logger formats LogEntry records with a pluggable LogFormatter and writes
 * them to one or more LogOutput destinations. The resilience registry logs
 * circuit transitions, rejections, timeouts and configuration changes here.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <fstream>
#include <kj/common.h>
#include <kj/filesystem.h>
#include <kj/memory.h>
#include <kj/mutex.h>
#include <kj/string.h>
#include <kj/vector.h>
#include <source_location>

namespace resilix::core {

/**
 * @brief Log level enumeration
 *
 * Ordered from Trace (most detailed) to Critical (most severe). Off disables
 * all output.
 */
enum class LogLevel : std::uint8_t {
  Trace = 0,    ///< Most detailed debug information
  Debug = 1,    ///< Development diagnostics
  Info = 2,     ///< Normal runtime information
  Warn = 3,     ///< Potential issues
  Error = 4,    ///< Errors
  Critical = 5, ///< Errors that prevent the system from continuing
  Off = 6,      ///< Turn off all log output
};

[[nodiscard]] kj::StringPtr to_string(LogLevel level);

/**
 * @brief Parse a level name ("trace", "INFO", ...)
 * @return kj::none when the name is not a level
 */
[[nodiscard]] kj::Maybe<LogLevel> to_log_level(kj::StringPtr name);

struct LogEntry {
  LogLevel level;
  kj::String timestamp;
  kj::String file;
  int_least32_t line;
  kj::String function;
  kj::String message;
  std::chrono::system_clock::time_point time_point;
};

/**
 * @brief Base class for log formatters
 */
class LogFormatter {
public:
  virtual ~LogFormatter() = default;

  [[nodiscard]] virtual kj::String format(const LogEntry& entry) const = 0;
  [[nodiscard]] virtual kj::StringPtr name() const = 0;
};

/**
 * @brief Human-readable formatter
 *
 * Format: [YYYY-MM-DD HH:MM:SS.mmm] [LEVEL] file:line - message
 */
class TextFormatter final : public LogFormatter {
public:
  explicit TextFormatter(bool include_function = false, bool use_color = false)
      : include_function_(include_function), use_color_(use_color) {}

  [[nodiscard]] kj::String format(const LogEntry& entry) const override;
  [[nodiscard]] kj::StringPtr name() const override {
    return "TextFormatter"_kj;
  }

private:
  bool include_function_;
  bool use_color_;

  [[nodiscard]] kj::String colorize(LogLevel level, kj::StringPtr text) const;
};

/**
 * @brief Structured formatter
 *
 * One JSON object per entry with fields timestamp, level, file, line,
 * function and message.
 */
class JsonFormatter final : public LogFormatter {
public:
  explicit JsonFormatter(bool pretty = false) : pretty_(pretty) {}

  [[nodiscard]] kj::String format(const LogEntry& entry) const override;
  [[nodiscard]] kj::StringPtr name() const override {
    return "JsonFormatter"_kj;
  }

private:
  bool pretty_;
};

/**
 * @brief Escape a string for inclusion in a JSON string literal
 */
[[nodiscard]] kj::String escape_json(kj::StringPtr s);

/**
 * @brief Base class for log output destinations
 */
class LogOutput {
public:
  virtual ~LogOutput() = default;

  virtual void write(kj::StringPtr formatted, const LogEntry& entry) = 0;
  virtual void flush() = 0;
  [[nodiscard]] virtual bool is_open() const = 0;
};

/**
 * @brief Console destination
 *
 * Error and Critical entries go to stderr, the rest to stdout, unless
 * use_stderr routes everything to stderr.
 */
class ConsoleOutput final : public LogOutput {
public:
  explicit ConsoleOutput(bool use_stderr = false) : use_stderr_(use_stderr) {}

  void write(kj::StringPtr formatted, const LogEntry& entry) override;
  void flush() override;
  [[nodiscard]] bool is_open() const override {
    return true;
  }

private:
  bool use_stderr_;
};

/**
 * @brief File destination with size-based rotation
 *
 * When the file reaches max_size bytes it is renamed to `<path>.1`, older
 * backups shift up by one and at most max_files backups are kept.
 * A max_size of 0 disables rotation.
 */
class FileOutput final : public LogOutput {
public:
  explicit FileOutput(kj::StringPtr file_path, size_t max_size = 10 * 1024 * 1024,
                      size_t max_files = 5);
  ~FileOutput() noexcept override;

  void write(kj::StringPtr formatted, const LogEntry& entry) override;
  void flush() override;
  [[nodiscard]] bool is_open() const override;

  void rotate();

  [[nodiscard]] kj::String current_path() const;
  [[nodiscard]] size_t max_size() const {
    return max_size_;
  }
  [[nodiscard]] size_t max_files() const {
    return max_files_;
  }

private:
  struct FileOutputState {
    kj::Path file_path;
    std::ofstream file_stream;
    size_t current_size = 0;

    explicit FileOutputState(kj::Path path) : file_path(kj::mv(path)) {}
  };

  void perform_rotation(FileOutputState& state);

  kj::Own<kj::Filesystem> filesystem_;
  kj::MutexGuarded<FileOutputState> guarded_;
  const size_t max_size_;
  const size_t max_files_;
};

/**
 * @brief Fan-out destination writing to every registered output
 */
class MultiOutput final : public LogOutput {
public:
  MultiOutput() = default;

  void add_output(kj::Own<LogOutput> output);
  void clear_outputs();

  void write(kj::StringPtr formatted, const LogEntry& entry) override;
  void flush() override;
  [[nodiscard]] bool is_open() const override;

  [[nodiscard]] size_t output_count() const;

private:
  kj::MutexGuarded<kj::Vector<kj::Own<LogOutput>>> guarded_;
};

/**
 * @brief Thread-safe leveled logger
 */
class Logger final {
public:
  explicit Logger(kj::Own<LogFormatter> formatter = kj::heap<TextFormatter>(),
                  kj::Own<LogOutput> output = kj::heap<ConsoleOutput>());
  ~Logger();

  KJ_DISALLOW_COPY_AND_MOVE(Logger);

  void set_level(LogLevel level);
  [[nodiscard]] LogLevel level() const;
  [[nodiscard]] bool enabled(LogLevel level) const;

  void set_formatter(kj::Own<LogFormatter> formatter);
  void set_output(kj::Own<LogOutput> output);
  void add_output(kj::Own<LogOutput> output);

  void log(LogLevel level, kj::StringPtr message,
           const std::source_location& location = std::source_location::current());

  void trace(kj::StringPtr message,
             const std::source_location& location = std::source_location::current());
  void debug(kj::StringPtr message,
             const std::source_location& location = std::source_location::current());
  void info(kj::StringPtr message,
            const std::source_location& location = std::source_location::current());
  void warn(kj::StringPtr message,
            const std::source_location& location = std::source_location::current());
  void error(kj::StringPtr message,
             const std::source_location& location = std::source_location::current());
  void critical(kj::StringPtr message,
                const std::source_location& location = std::source_location::current());

  void flush();

private:
  struct LoggerState {
    kj::Own<LogFormatter> formatter;
    kj::Own<MultiOutput> multi_output;
    LogLevel level;

    LoggerState(kj::Own<LogFormatter> fmt, kj::Own<LogOutput> out)
        : formatter(kj::mv(fmt)), multi_output(kj::heap<MultiOutput>()), level(LogLevel::Info) {
      multi_output->add_output(kj::mv(out));
    }
  };

  kj::MutexGuarded<LoggerState> guarded_;
};

/**
 * @brief Process-wide logger, created on first use
 */
[[nodiscard]] Logger& global_logger();

} // namespace resilix::core
