// Standard includes
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <variant>

#ifdef WITH_MPI
#include <mpi.h>
#endif

// Local includes
#include "logger.hpp"
#include "metadata.hpp"
#include "params.hpp"

/** @brief Helper function to convert a string to a Param
 *
 * Integers and doubles may carry a leading sign and doubles may use an
 * exponent (1e10, 2.5E-3). Anything else is a string.
 *
 * @param str The string to convert
 *
 * @return The converted Param
 */
Param stringToVariant(const std::string &str) {

  /* Strip any quotes, quoted values are always strings. */
  if (str.size() >= 2 && str.front() == '"' && str.back() == '"') {
    return str.substr(1, str.length() - 2);
  }

  /* Empty values are strings too. */
  if (str.empty()) {
    return str;
  }

  /* Walk the characters to classify the value. */
  int decimalCount = 0;
  int exponentCount = 0;
  int digitCount = 0;
  for (size_t i = 0; i < str.size(); i++) {
    const char c = str[i];
    if (std::isdigit(static_cast<unsigned char>(c))) {
      digitCount++;
    } else if (c == '.') {
      decimalCount++;
    } else if ((c == 'e' || c == 'E') && digitCount > 0) {
      exponentCount++;
    } else if ((c == '-' || c == '+') &&
               (i == 0 || str[i - 1] == 'e' || str[i - 1] == 'E')) {
      continue;
    } else {
      return str;
    }
  }

  /* Too many decimal points, exponents or no digits at all. */
  if (digitCount == 0 || decimalCount > 1 || exponentCount > 1) {
    return str;
  }

  /* Parse the number and make sure all of it was consumed. */
  try {
    size_t pos = 0;
    if (decimalCount == 0 && exponentCount == 0) {
      int intValue = std::stoi(str, &pos);
      if (pos == str.size()) {
        return intValue;
      }
    } else {
      double doubleValue = std::stod(str, &pos);
      if (pos == str.size()) {
        return doubleValue;
      }
    }
  } catch (const std::logic_error &) {
    /* Out of range or malformed, fall through to a string. */
  }

  return str;
}

/**
 * @brief Get a parameter from the map as a string, or return the default value.
 *
 * @param key The key for the parameter.
 * @param defaultValue The default value for the parameter.
 */
std::string Parameters::getParameterString(const std::string &key,
                                           std::string defaultValue) {
  return getParameter<std::string>(key, defaultValue);
}

/**
 * @brief Get a non-negative integer parameter that may exceed the int range.
 *
 * Values too large for an int are stored as strings, so those are parsed as
 * unsigned 64 bit integers here.
 *
 * @param key The key for the parameter.
 * @param defaultValue The default value for the parameter.
 */
uint64_t Parameters::getParameterUnsigned(const std::string &key,
                                          uint64_t defaultValue) {

  if (parameters.count(key) == 0) {
    setParameter(key, std::to_string(defaultValue));
    return defaultValue;
  }

  const Param &value = parameters.at(key);
  if (std::holds_alternative<int>(value)) {
    const int intValue = std::get<int>(value);
    if (intValue < 0) {
      throw std::runtime_error("Parameter " + key + " must not be negative");
    }
    return static_cast<uint64_t>(intValue);
  }

  if (std::holds_alternative<std::string>(value)) {
    const std::string &str = std::get<std::string>(value);
    const bool digits =
        !str.empty() && std::all_of(str.begin(), str.end(), [](char c) {
          return std::isdigit(static_cast<unsigned char>(c)) != 0;
        });
    if (digits) {
      try {
        return std::stoull(str);
      } catch (const std::out_of_range &) {
        throw std::runtime_error("Parameter " + key +
                                 " does not fit in 64 bits");
      }
    }
  }

  throw std::runtime_error("Parameter " + key +
                           " is not a non-negative integer");
}

/**
 * @brief Fucntion to check if a parameter exists.
 *
 * @param key The key for the parameter.
 * @return true if the parameter exists, false otherwise.
 */
bool Parameters::exists(const std::string &key) {
  return parameters.count(key) > 0;
}

/**
 * @brief Function to print all key-value pairs stored in the map.
 */
void Parameters::printAllParameters() {

  message("Key-Value Pairs:");
  for (const auto &pair : parameters) {
    const Param &value = pair.second;

    // Print the value based on its type
    if (std::holds_alternative<int>(value)) {
      message("Key: %s - Value: %d", pair.first.c_str(),
              std::get<int>(value));
    } else if (std::holds_alternative<double>(value)) {
      message("Key: %s - Value: %g", pair.first.c_str(),
              std::get<double>(value));
    } else if (std::holds_alternative<std::string>(value)) {
      message("Key: %s - Value: %s", pair.first.c_str(),
              std::get<std::string>(value).c_str());
    }
  }

#ifdef WITH_MPI
  MPI_Barrier(MPI_COMM_WORLD);
#endif
}

/**
 * @brief Get the output path for this rank's map file.
 *
 * The directory is created if it doesn't exist. In MPI builds every rank
 * writes its own file so the rank is appended to the basename.
 *
 * @param params The parameters object.
 * @param rank The rank writing the file.
 *
 * @return The output file path.
 */
std::string getOutputFilePath(Parameters *params, const int rank) {

  // Get the output directory
  std::string output_file =
      params->getParameterNoDefault<std::string>("Output/filepath");

  // Ensure the output file path exists, if not create it
  if (!std::filesystem::exists(output_file)) {
    std::filesystem::create_directories(output_file);
  }

  // Ensure the output file path ends with a forward slash
  if (output_file.back() != '/') {
    output_file += "/";
  }

  // Combine the file path and the basename for the output file
  output_file += params->getParameterNoDefault<std::string>("Output/basename");

#ifdef WITH_MPI
  std::ostringstream ss;
  ss << "_" << std::setw(4) << std::setfill('0') << rank;
  output_file += ss.str();
#else
  (void)rank;
#endif

  return output_file + ".hdf5";
}

/**
 * @brief Parse a YAML stream and populate a Parameters object.
 *
 * Only the two level "Section:" / "  key: value" subset is supported.
 *
 * @param stream The stream to read.
 * @return The parameters object (owned by the caller).
 */
Parameters *parseParamsStream(std::istream &stream) {

  // Create the parameters object
  Parameters *params = new Parameters();

  /* Set up some variables we'll need in the loop. */
  std::string line;
  std::string parentKey;

  /* Loop until we find the end of the stream. */
  while (std::getline(stream, line)) {

    /* Remove comments (any text starting with #) */
    size_t commentPos = line.find('#');
    if (commentPos != std::string::npos) {
      line.erase(commentPos);
    }

    /* Check if the line contains a key-value pair, ignore it if not */
    size_t colonPos = line.find(':');
    if (colonPos == std::string::npos) {
      continue;
    }

    /* Extract the key and trim leading and trailing whitespace */
    std::string key = line.substr(0, colonPos);
    key.erase(0, key.find_first_not_of(" \t"));
    key.erase(key.find_last_not_of(" \t") + 1);

    /* Get the value and trim leading and trailing whitespace */
    std::string valueStr = line.substr(colonPos + 1);
    valueStr.erase(0, valueStr.find_first_not_of(" \t\r"));
    valueStr.erase(valueStr.find_last_not_of(" \t\r") + 1);

    /* Nothing after the colon means we have a new parent key. */
    if (valueStr.empty()) {
      parentKey = key;
      continue;
    }

    /* Convert the value string to a variant containing the correct
     * data type and store it. */
    Param value = stringToVariant(valueStr);
    const std::string fullKey = parentKey.empty() ? key : parentKey + "/" + key;
    if (std::holds_alternative<int>(value)) {
      params->setParameter(fullKey, std::get<int>(value));
    } else if (std::holds_alternative<double>(value)) {
      params->setParameter(fullKey, std::get<double>(value));
    } else {
      params->setParameter(fullKey, std::get<std::string>(value));
    }
  }

  return params;
}

/**
 * @brief Parse a YAML file and populate the Parameters object.
 *
 * @param filename The name of the YAML file.
 * @return The parameters object (owned by the caller).
 */
Parameters *parseParams(const std::string &filename) {

  /* Open the YAML file */
  std::ifstream file(filename);
  if (!file.is_open()) {
    error("Failed to open YAML file (%s).", filename.c_str());
  }

  return parseParamsStream(file);
}
