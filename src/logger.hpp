#ifndef LOGGING_H
#define LOGGING_H

// Standard Includes
#include <chrono>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

// Local includes
#include "errors.hpp"

// Log levels
enum LogLevel { ERROR, LOG, VERBOSE };

/**
 * @brief The Logging class provides a simple mechanism for logging messages
 * to the standard output.
 *
 * Messages are prefixed with the rank of the process and the file and
 * function they were issued from. Output is filtered on the verbosity held
 * by the Metadata singleton.
 *
 * Errors are handled by throwing exceptions and storing information about
 * the error location. This information is then used to report the error
 * at the top of the call stack.
 *
 * At the bottom of this file, we define friendly macros for logging. These
 * macros are used throughout the codebase to log messages to the standard
 * output, rather than using the Logging class directly.
 *
 * Log levels:
 * - ERROR (0): Log only error messages. (Minimal output)
 * - LOG (1): Log regular messages. (Default)
 * - VERBOSE (2): Log verbose messages. (Maximum output)
 *
 */
class Logging {
private:
  // The rank of the process
  std::string _rank;

  // Time variables for measuring duration
  std::chrono::high_resolution_clock::time_point _tic;
  std::chrono::high_resolution_clock::time_point _toc;
  std::chrono::high_resolution_clock::time_point _start;

  // Error variables (used for throwing exceptions and reporting their location
  // at the top of the call stack)
  std::string error_message_;
  const char *error_file_ = "";
  const char *error_func_ = "";
  int error_line_ = 0;

  // The current sample being processed
  std::string _sample;

  // Private constructor to prevent direct instantiation
  Logging() : _rank("[...]") {}
  ~Logging() {}

  // Deleted move constructor and move assignment to ensure singleton
  Logging(Logging &&) = delete;            // Move constructor
  Logging &operator=(Logging &&) = delete; // Move assignment operator

public:
  /**
   * @brief Get the singleton instance of the Logging class.
   *
   * @return The singleton instance of the Logging class.
   */
  static Logging *getInstance() {
    static Logging instance;
    return &instance;
  }

  // Deleted copy constructor and copy assignment to prevent duplication
  Logging(const Logging &) = delete;            // Copy constructor
  Logging &operator=(const Logging &) = delete; // Copy assignment operator

  /**
   * @brief Set the rank of the process with 0-padding.
   *
   * @param rank The rank of the process.
   */
  void setRank(const int rank) {
    std::ostringstream oss;
    oss << std::setw(4) << std::setfill('0') << rank;
    _rank = oss.str();
  }

  /**
   * @brief Set the sample currently being generated.
   *
   * @param sample The index of the sample.
   * @param length The width to zero-pad the index to.
   */
  void setSample(const int sample, const int length = 4) {
    std::ostringstream oss;
    oss << "[" << std::setw(length) << std::setfill('0') << sample << "]";
    _sample = oss.str();
  }

  /**
   * @brief Forget the current sample (messages lose the sample tag).
   */
  void clearSample() { _sample.clear(); }

  /**
   * @brief Log a verbose message.
   *
   * @tparam Args Variadic template for message formatting.
   *
   * @param format The format string for the log message.
   * @param args The arguments for message formatting.
   */
  template <typename... Args>
  void v_message(const char *file, const char *func, const char *format,
                 Args... args) {
    if (verbosity() >= VERBOSE && shouldPrint()) {
      log(file, func, format, args...);
    }
  }

  /**
   * @brief Log a regular log message.
   *
   * @tparam Args Variadic template for message formatting.
   *
   * @param format The format string for the log message.
   * @param args The arguments for message formatting.
   */
  template <typename... Args>
  void message(const char *file, const char *func, const char *format,
               Args... args) {
    if (verbosity() >= LOG && shouldPrint()) {
      log(file, func, format, args...);
    }
  }

  /**
   * @brief Record the location of an error and throw it.
   *
   * @tparam ErrorType The exception type to throw. It must be constructible
   * from a std::string.
   *
   * @param format The error message format string.
   * @param args The arguments for message formatting.
   *
   * @throw ErrorType Thrown with the formatted error message.
   */
  template <typename ErrorType = std::runtime_error, typename... Args>
  void throw_error(const char *file, const char *func, int line,
                   const char *format, Args &&...args) {
    recordError(file, func, line, format, std::forward<Args>(args)...);
    throw ErrorType(this->error_message_);
  }

  /**
   * @brief Record the location of a numerical instability and throw it.
   *
   * @param step The integration step the instability was detected at.
   * @param format The error message format string.
   * @param args The arguments for message formatting.
   *
   * @throw NumericalInstabilityError Carrying the step index.
   */
  template <typename... Args>
  void throw_instability(const char *file, const char *func, int line,
                         int step, const char *format, Args &&...args) {
    recordError(file, func, line, format, std::forward<Args>(args)...);
    throw NumericalInstabilityError(this->error_message_, step);
  }

  /**
   * @brief Report the last recorded error and its location to stderr.
   */
  void report_error() {
    std::ostringstream oss;
    oss << "[ERROR][" << getBaseFilename(this->error_file_) << "."
        << this->error_func_ << "." << this->error_line_
        << "]: " << this->error_message_;
    std::cerr << oss.str() << std::endl;
  }

  /**
   * @brief Report an exception that never went through the error macros.
   *
   * @param what The exception message.
   */
  void report_error(const char *what) {
    if (this->error_message_ != what) {
      this->error_message_ = what;
      this->error_file_ = "unknown";
      this->error_func_ = "unknown";
      this->error_line_ = 0;
    }
    report_error();
  }

  /**
   * @brief Start measuring time.
   */
  void tic() { _tic = std::chrono::high_resolution_clock::now(); }

  /**
   * @brief Stop measuring time, log the duration, and print the log message.
   *
   * @param message The message indicating the operation being measured.
   */
  void toc(const char *file, const char *func, const char *message) {
    _toc = std::chrono::high_resolution_clock::now();

    if (verbosity() < LOG || !shouldPrint()) {
      return;
    }

    auto duration =
        std::chrono::duration_cast<std::chrono::milliseconds>(_toc - _tic);

    log(file, func, "%s took %lld ms", message,
        static_cast<long long>(duration.count()));
  }

  /**
   * @brief Start measuring time.
   */
  void start() { _start = std::chrono::high_resolution_clock::now(); }

  /**
   * @brief Report the full runtime of the program.
   */
  void finish(const char *file, const char *func) {

    if (!shouldPrint()) {
      return;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::high_resolution_clock::now() - _start);

    log(file, func, "Total runtime: %lld ms",
        static_cast<long long>(duration.count()));
  }

private:
  // Defined in logger.cpp (they need the Metadata singleton)
  bool shouldPrint() const;
  int verbosity() const;

  /**
   * @brief Format the error message and store where it was raised.
   */
  template <typename... Args>
  void recordError(const char *file, const char *func, int line,
                   const char *format, Args &&...args) {
    if constexpr (sizeof...(args) > 0) {
      char buffer[512];
      std::snprintf(buffer, sizeof(buffer), format,
                    std::forward<Args>(args)...);
      this->error_message_ = buffer;
    } else {
      this->error_message_ = format;
    }
    this->error_file_ = file;
    this->error_func_ = func;
    this->error_line_ = line;
  }

  /**
   * @brief Get the base filename from a given file path.
   *
   * @param filePath The full path to the file.
   * @return The base filename without the path and extension.
   */
  static std::string getBaseFilename(const std::string &filePath) {
    size_t lastSlash = filePath.find_last_of("/");
    size_t lastDot = filePath.find_last_of(".");

    // Extract the filename between the last slash and the last dot
    if (lastSlash != std::string::npos && lastDot != std::string::npos &&
        lastDot > lastSlash) {
      return filePath.substr(lastSlash + 1, lastDot - lastSlash - 1);
    }

    return filePath;
  }

  /**
   * @brief Log a formatted message.
   *
   * @tparam Args Variadic template for message formatting.
   *
   * @param format The format string for the log message.
   * @param args The arguments for message formatting.
   */
  template <typename... Args>
  void log(const char *file, const char *func, const char *format,
           Args... args) {

    std::ostringstream oss;
    oss << " [" << _rank << "]" << _sample << "[" << getBaseFilename(file)
        << "." << func << "] ";

    if constexpr (sizeof...(args) > 0) {
      char buffer[512];
      std::snprintf(buffer, sizeof(buffer), format, args...);
      oss << buffer << std::endl;
    } else {
      oss << format << std::endl;
    }

    std::cout << oss.str();
  }
};

// Define friendly macros for logging
#define message(...)                                                           \
  Logging::getInstance()->message(__FILE__, __func__, __VA_ARGS__)
#define v_message(...)                                                         \
  Logging::getInstance()->v_message(__FILE__, __func__, __VA_ARGS__)
#define start() Logging::getInstance()->start()
#define tic() Logging::getInstance()->tic()
#define toc(message) Logging::getInstance()->toc(__FILE__, __func__, message)
#define finish() Logging::getInstance()->finish(__FILE__, __func__)
#define error(...)                                                             \
  Logging::getInstance()->throw_error(__FILE__, __func__, __LINE__, __VA_ARGS__)
#define config_error(...)                                                      \
  Logging::getInstance()->throw_error<ConfigurationError>(                     \
      __FILE__, __func__, __LINE__, __VA_ARGS__)
#define reproducibility_error(...)                                             \
  Logging::getInstance()->throw_error<ReproducibilityViolation>(               \
      __FILE__, __func__, __LINE__, __VA_ARGS__)
#define instability_error(step, ...)                                           \
  Logging::getInstance()->throw_instability(__FILE__, __func__, __LINE__,      \
                                            step, __VA_ARGS__)
#define report_error(...) Logging::getInstance()->report_error(__VA_ARGS__)

#endif // LOGGING_H
