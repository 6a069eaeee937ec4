#ifndef PARAMS_H_
#define PARAMS_H_

// Standard includes
#include <cctype>
#include <cstdint>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

/* Define a variant type to hold different data types */
using Param = std::variant<int, double, std::string>;

class Parameters {
public:
  Parameters() = default;

  // Prototypes for member functions (defined in params.cpp)
  template <typename T>
  void setParameter(const std::string &key, const T &value);
  template <typename T> T getParameter(const std::string &key, T defaultValue);
  template <typename T> T getParameterNoDefault(const std::string &key);
  std::string getParameterString(const std::string &key,
                                 std::string defaultValue);
  uint64_t getParameterUnsigned(const std::string &key,
                                uint64_t defaultValue);
  bool exists(const std::string &key);
  void printAllParameters();

private:
  /** @brief Map to store key-value pairs
   *
   * Keys are "Section/key" strings.
   */
  std::map<std::string, Param> parameters;

  template <typename T> T convert(const std::string &key, const Param &value);
};

// Prototypes for helper functions (defined in params.cpp)
std::string getOutputFilePath(Parameters *params, const int rank);
Parameters *parseParams(const std::string &filename);
Parameters *parseParamsStream(std::istream &stream);
Param stringToVariant(const std::string &str);

/**
 * @brief Set a key-value pair for a parameter.
 *
 * @param key The key for the parameter.
 * @param value The value for the parameter.
 */
template <typename T>
void Parameters::setParameter(const std::string &key, const T &value) {
  parameters[key] = value;
}

/**
 * @brief Convert a stored parameter to the requested type.
 *
 * Integers are promoted to doubles (so "box_length: 25" is a valid double)
 * but no other conversion is allowed.
 *
 * @param key The key for the parameter (for the error message).
 * @param value The stored value.
 */
template <typename T>
T Parameters::convert(const std::string &key, const Param &value) {
  if constexpr (std::is_same_v<T, double>) {
    if (std::holds_alternative<int>(value)) {
      return static_cast<double>(std::get<int>(value));
    }
  }
  if (!std::holds_alternative<T>(value)) {
    throw std::runtime_error("Parameter " + key +
                             " does not have the expected type");
  }
  return std::get<T>(value);
}

/**
 * @brief Get a parameter from the map, or return the default value.
 *
 * @param key The key for the parameter.
 * @param defaultValue The default value for the parameter.
 */
template <typename T>
T Parameters::getParameter(const std::string &key, T defaultValue) {

  /* Get the parameter if exists, or store and return the default. */
  if (parameters.count(key) > 0) {
    return convert<T>(key, parameters.at(key));
  } else {
    setParameter(key, defaultValue);
    return defaultValue;
  }
}

/**
 * @brief Get a parameter from the map, or error if it does not exist.
 *
 * @param key The key for the parameter.
 */
template <typename T>
T Parameters::getParameterNoDefault(const std::string &key) {

  /* Get the parameter if exists, or error. */
  if (parameters.count(key) > 0) {
    return convert<T>(key, parameters.at(key));
  } else {
    throw std::runtime_error("Required parameter not found: " + key);
  }
}

#endif // PARAMS_H_
