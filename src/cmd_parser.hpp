/**
 * @file cmd_parser.hpp
 * @brief Command line argument parser for bayronik
 */
#ifndef CMD_PARSER_HPP
#define CMD_PARSER_HPP

#include <cstring>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

/**
 * @brief Structure to hold parsed command line arguments
 */
struct CommandLineArgs {
  std::string parameter_file;
  int nthreads;
  int nsamples; // 0 means "take it from the parameter file"
  int verbosity;
  bool help_requested;

  // Constructor with defaults
  CommandLineArgs()
      : nthreads(1), nsamples(0), verbosity(1), help_requested(false) {}
};

/**
 * @brief Command line parser with validation
 *
 * Usage: bayronik <parameter_file> <nthreads> [nsamples] [verbosity]
 */
class CommandLineParser {
public:
  /**
   * @brief Parse command line arguments
   *
   * @param argc Number of command line arguments
   * @param argv Array of command line argument strings
   * @return CommandLineArgs structure with parsed values
   * @throws std::runtime_error if parsing fails or validation errors occur
   */
  static CommandLineArgs parse(int argc, char *argv[]) {
    CommandLineArgs args;

    // Handle help request early
    if (argc == 2 &&
        (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h")) {
      args.help_requested = true;
      return args;
    }

    if (argc < 3 || argc > 5) {
      std::ostringstream oss;
      oss << "Invalid number of arguments (" << (argc - 1)
          << "). Expected 2-4 arguments.";
      throw std::runtime_error(oss.str());
    }

    args.parameter_file = parseParameterFile(argv[1]);

    args.nthreads = parseInteger(argv[2], "Thread count");
    if (args.nthreads <= 0) {
      throw std::runtime_error("Thread count must be positive (got " +
                               std::to_string(args.nthreads) + ")");
    }
    if (args.nthreads > getMaxThreads()) {
      std::cerr << "Warning: Thread count " << args.nthreads
                << " exceeds hardware concurrency\n";
    }

    if (argc >= 4) {
      args.nsamples = parseInteger(argv[3], "Sample count");
      if (args.nsamples <= 0) {
        throw std::runtime_error("Sample count must be positive (got " +
                                 std::to_string(args.nsamples) + ")");
      }
    }

    if (argc >= 5) {
      args.verbosity = parseInteger(argv[4], "Verbosity");
      if (args.verbosity < 0 || args.verbosity > 2) {
        throw std::runtime_error("Verbosity must be 0, 1, or 2 (got " +
                                 std::to_string(args.verbosity) + ")");
      }
    }

    return args;
  }

  /**
   * @brief Print usage information
   *
   * @param program_name Name of the program executable
   */
  static void printUsage(const char *program_name) {
    std::cerr << "\nUsage: " << program_name
              << " <parameter_file> <nthreads> [nsamples] [verbosity]\n\n";
    std::cerr << "Arguments:\n";
    std::cerr << "  parameter_file   Path to YAML parameter file\n";
    std::cerr << "  nthreads         Number of OpenMP threads\n";
    std::cerr << "  nsamples         Optional number of maps to generate "
                 "(overrides Run/nsamples)\n";
    std::cerr << "  verbosity        Optional verbosity level: 0=minimal, "
                 "1=rank 0 only (default), 2=all ranks\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -h, --help       Show this help message\n\n";
    std::cerr << "Examples:\n";
    std::cerr << "  " << program_name << " params.yml 8\n";
    std::cerr << "  " << program_name << " params.yml 8 100\n";
    std::cerr << "  mpirun -n 4 " << program_name << " params.yml 8 1000\n\n";
  }

  /**
   * @brief Print detailed error with context
   */
  static void printError(const std::string &error_msg,
                         const char *program_name) {
    std::cerr << "\nError: " << error_msg << "\n";
    printUsage(program_name);
  }

private:
  /**
   * @brief Parse and validate parameter file argument
   */
  static std::string parseParameterFile(const char *arg) {
    std::string param_file(arg);

    if (!std::filesystem::exists(param_file)) {
      throw std::runtime_error("Parameter file '" + param_file +
                               "' does not exist");
    }

    if (!std::filesystem::is_regular_file(param_file)) {
      throw std::runtime_error("Parameter file '" + param_file +
                               "' is not a regular file");
    }

    std::string ext = std::filesystem::path(param_file).extension().string();
    if (ext != ".yml" && ext != ".yaml") {
      std::cerr << "Warning: Parameter file '" << param_file
                << "' does not have .yml/.yaml extension\n";
    }

    return param_file;
  }

  /**
   * @brief Parse a whole argument as an integer
   *
   * @param arg The argument
   * @param what The name of the argument for error messages
   */
  static int parseInteger(const char *arg, const std::string &what) {
    int value;
    try {
      size_t pos;
      value = std::stoi(arg, &pos);
      if (pos != std::strlen(arg)) {
        throw std::runtime_error(what + " contains non-numeric characters");
      }
    } catch (const std::invalid_argument &) {
      throw std::runtime_error(what + " is not a valid integer");
    } catch (const std::out_of_range &) {
      throw std::runtime_error(what + " is out of range");
    }
    return value;
  }

  /**
   * @brief Get reasonable maximum thread count
   */
  static int getMaxThreads() {
    const int hardware_threads = std::thread::hardware_concurrency();
    return hardware_threads > 0 ? hardware_threads * 2 : 64;
  }
};

#endif // CMD_PARSER_HPP
