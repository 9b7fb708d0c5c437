/*
 *
 * Copyright 2026 Veritas authors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 */

#ifndef VERITAS_UTIL_LOGGING_H_
#define VERITAS_UTIL_LOGGING_H_

#include <cstdint>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>

#include "absl/base/attributes.h"
#include "absl/base/optimization.h"

/// \cond Internal
#define COMPACT_VERITAS_LOG_INFO ::veritas::LogMessage(__FILE__, __LINE__)
#define COMPACT_VERITAS_LOG_WARNING \
  ::veritas::LogMessage(__FILE__, __LINE__, WARNING)
#define COMPACT_VERITAS_LOG_ERROR \
  ::veritas::LogMessage(__FILE__, __LINE__, ERROR)
#define COMPACT_VERITAS_LOG_FATAL \
  ::veritas::LogMessageFatal(__FILE__, __LINE__, FATAL)
#define COMPACT_VERITAS_LOG_QFATAL \
  ::veritas::LogMessageFatal(__FILE__, __LINE__, QFATAL)

#ifdef NDEBUG
#define COMPACT_VERITAS_LOG_DFATAL COMPACT_VERITAS_LOG_ERROR
#else
#define COMPACT_VERITAS_LOG_DFATAL COMPACT_VERITAS_LOG_FATAL
#endif
/// \endcond

/// Creates a message and logs it.
///
/// `LOG(severity)` returns a stream object that can be written to with the `<<`
/// operator. Log messages are emitted with terminating newlines.
/// Example:
///
/// ```
/// LOG(INFO) << "Mounted " << target;
/// ```
///
/// \param severity The severity of the log message, one of `LogSeverity`. The
///        FATAL severity will end the program after the log is emitted.
#define LOG(severity) COMPACT_VERITAS_LOG_##severity.stream()

/// A command to LOG only if a condition is true. If the condition is false,
/// nothing is logged.
#define LOG_IF(severity, condition) \
  !(condition) ? (void)0 : ::veritas::LogMessageVoidify() & LOG(severity)

/// A `LOG` command with an associated verbosity level. The verbosity threshold
/// may be configured at runtime with `set_vlog_level` and `InitLogging`.
///
/// `VLOG` statements are logged at `INFO` severity if they are logged at all.
#define VLOG(level) LOG_IF(INFO, (level) <= ::veritas::get_vlog_level())

/// Ends the program with a fatal error if the specified condition is
/// false.
#define CHECK(condition) \
  LOG_IF(FATAL, !(condition)) << "Check failed: " #condition " "

/// Severity level definitions.
enum LogSeverity { INFO, WARNING, ERROR, FATAL, QFATAL };

namespace veritas {

/// \cond Internal
template <typename T>
inline void MakeCheckOpValueString(std::ostream *os, const T &v) {
  (*os) << v;
}

// Overrides for char types provide readable values for unprintable
// characters.
template <>
void MakeCheckOpValueString(std::ostream *os, const char &v);
template <>
void MakeCheckOpValueString(std::ostream *os, const signed char &v);
template <>
void MakeCheckOpValueString(std::ostream *os, const unsigned char &v);
template <>
void MakeCheckOpValueString(std::ostream *os, const std::nullptr_t &p);

/// A helper class for formatting "expr (V1 vs. V2)" in a CHECK_XX
/// statement.
class CheckOpMessageBuilder {
 public:
  explicit CheckOpMessageBuilder(const char *exprtext);
  ~CheckOpMessageBuilder();

  std::ostream *ForVar1() { return stream_; }
  std::ostream *ForVar2();
  std::string *NewString();

 private:
  std::ostringstream *stream_;
};

template <typename T1, typename T2>
std::string *MakeCheckOpString(const T1 &v1, const T2 &v2,
                               const char *exprtext) {
  CheckOpMessageBuilder comb(exprtext);
  MakeCheckOpValueString(comb.ForVar1(), v1);
  MakeCheckOpValueString(comb.ForVar2(), v2);
  return comb.NewString();
}

#define DEFINE_CHECK_OP_IMPL(name, op)                                   \
  template <typename T1, typename T2>                                    \
  inline std::string *name##Impl(const T1 &v1, const T2 &v2,             \
                                 const char *exprtext) {                 \
    if (ABSL_PREDICT_TRUE(v1 op v2)) return nullptr;                     \
    return MakeCheckOpString(v1, v2, exprtext);                          \
  }                                                                      \
  inline std::string *name##Impl(int v1, int v2, const char *exprtext) { \
    return name##Impl<int, int>(v1, v2, exprtext);                       \
  }

DEFINE_CHECK_OP_IMPL(Check_EQ, ==)
DEFINE_CHECK_OP_IMPL(Check_NE, !=)
DEFINE_CHECK_OP_IMPL(Check_LE, <=)
DEFINE_CHECK_OP_IMPL(Check_LT, <)
DEFINE_CHECK_OP_IMPL(Check_GE, >=)
DEFINE_CHECK_OP_IMPL(Check_GT, >)
#undef DEFINE_CHECK_OP_IMPL

template <typename T>
inline const T &GetReferenceableValue(const T &t) {
  return t;
}
inline char GetReferenceableValue(char t) { return t; }
inline uint8_t GetReferenceableValue(uint8_t t) { return t; }
inline int8_t GetReferenceableValue(int8_t t) { return t; }
inline int16_t GetReferenceableValue(int16_t t) { return t; }
inline uint16_t GetReferenceableValue(uint16_t t) { return t; }
inline int32_t GetReferenceableValue(int32_t t) { return t; }
inline uint32_t GetReferenceableValue(uint32_t t) { return t; }
inline int64_t GetReferenceableValue(int64_t t) { return t; }
inline uint64_t GetReferenceableValue(uint64_t t) { return t; }
/// \endcond

/// Compares `val1` and `val2` with `op`, and does `log` if false.
#define CHECK_OP_LOG(name, op, val1, val2, log)                               \
  while (std::unique_ptr<std::string> _result = std::unique_ptr<std::string>( \
             ::veritas::name##Impl(::veritas::GetReferenceableValue(val1),    \
                                   ::veritas::GetReferenceableValue(val2),    \
                                   #val1 " " #op " " #val2)))                 \
  log(__FILE__, __LINE__, *_result).stream()

#define CHECK_OP(name, op, val1, val2) \
  CHECK_OP_LOG(name, op, val1, val2, ::veritas::LogMessageFatal)

#define CHECK_EQ(val1, val2) CHECK_OP(Check_EQ, ==, val1, val2)
#define CHECK_NE(val1, val2) CHECK_OP(Check_NE, !=, val1, val2)
#define CHECK_LE(val1, val2) CHECK_OP(Check_LE, <=, val1, val2)
#define CHECK_LT(val1, val2) CHECK_OP(Check_LT, <, val1, val2)
#define CHECK_GE(val1, val2) CHECK_OP(Check_GE, >=, val1, val2)
#define CHECK_GT(val1, val2) CHECK_OP(Check_GT, >, val1, val2)

/// Sets the verbosity threshold for VLOG. A VLOG command with a level greater
/// than this will be ignored.
void set_vlog_level(int level);

/// Gets the verbosity threshold for VLOG.
int get_vlog_level();

/// Sets the log directory. This is only set once. Any request to reset it will
/// return false. An empty `log_directory` selects console-only logging.
bool set_log_directory(const std::string &log_directory);

/// Gets the log directory, or an empty string if logging is console-only.
const std::string get_log_directory();

/// Checks the log directory to make sure it's accessible, and creates it if it
/// does not exist.
bool EnsureDirectory(const char *path);

/// Initializes the logging library.
///
/// The init process runs before any writable filesystem is mounted, so it
/// passes an empty `directory` and every message goes to the console streams
/// only. Other programs may pass a directory, in which case messages are also
/// appended to a file named after the basename of `file_name`.
///
/// \param directory The log file directory, or empty for console-only logging.
/// \param file_name The program name used for the log file.
/// \param level The verbosity threshold for VLOG commands.
bool InitLogging(const char *directory, const char *file_name, int level);

/// Class representing a log message created by a log macro.
class LogMessage {
 public:
  /// Constructs a new message with `INFO` severity.
  LogMessage(const char *file, int line);

  /// Constructs a new message with the specified severity.
  LogMessage(const char *file, int line, LogSeverity severity);

  /// Constructs a log message with additional text that is provided by CHECK
  /// macros.
  LogMessage(const char *file, int line, const std::string &result);

  /// The destructor flushes the message.
  ~LogMessage();

  std::ostringstream &stream() { return stream_; }

 protected:
  void SendToLog(const std::string &message_text);

  LogSeverity severity_;
  std::ostringstream stream_;

 private:
  void Init(const char *file, int line, LogSeverity severity);

  LogMessage(const LogMessage &) = delete;
  void operator=(const LogMessage &) = delete;
};

/// Turns an `ostream` into `void` to satisfy the ternary operator in `LOG_IF`.
class LogMessageVoidify {
 public:
  void operator&(const std::ostream &) {}
};

/// A LogSeverity FATAL (or QFATAL) version of LogMessage that the compiler can
/// interpret as noreturn.
class LogMessageFatal : public LogMessage {
 public:
  ABSL_ATTRIBUTE_NORETURN ~LogMessageFatal();

  LogMessageFatal(const char *file, int line, LogSeverity severity)
      : LogMessage(file, line, severity) {}

  LogMessageFatal(const char *file, int line, const std::string &result)
      : LogMessage(file, line, result) {}
};

}  // namespace veritas

#endif  // VERITAS_UTIL_LOGGING_H_
