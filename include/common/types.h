#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace vaultsim {
namespace common {

/**
 * @file types.h
 * @brief Fundamental types and utilities used throughout vaultsim
 *
 * Byte and address aliases shared by the crypto, routing, vault and harness
 * layers, plus the Result<T, E> wrapper used for every fallible call that is
 * not a harness contract violation.
 */

/// @brief Raw byte sequence (keys, contents, serialized payloads)
using Bytes = std::vector<uint8_t>;

/// @brief Length in bytes of a network address
constexpr size_t XOR_NAME_LEN = 32;

/// @brief Network address in the XOR metric space
using XorName = std::array<uint8_t, XOR_NAME_LEN>;

/// @brief Lower-case hex rendering of a byte range
std::string to_hex(const uint8_t *data, size_t len);

inline std::string to_hex(const Bytes &bytes) {
  return to_hex(bytes.data(), bytes.size());
}

inline std::string to_hex(const XorName &name) {
  return to_hex(name.data(), name.size());
}

/// @brief First three bytes of a name as hex, for log lines
std::string short_name(const XorName &name);

/**
 * @brief Returns true if `lhs` is strictly closer to `target` than `rhs`
 * in the XOR metric.
 */
bool closer_to(const XorName &target, const XorName &lhs, const XorName &rhs);

/**
 * @brief Type-safe result wrapper for operations that can fail
 *
 * Holds either a success value of type T or an error of type E. The default
 * error type is a human readable string; protocol-level failures use a typed
 * error instead (see routing::ClientError).
 *
 * @tparam T The type of the success value
 * @tparam E The type of the error
 *
 * @note Both T and E must be default constructible.
 *
 * Example usage:
 * @code
 * auto result = parse_harness_args(argc, argv);
 * if (result.is_ok()) {
 *     run(result.value());
 * } else {
 *     std::cerr << "Invalid arguments: " << result.error() << std::endl;
 * }
 * @endcode
 */
template <typename T, typename E = std::string>
class Result {
private:
  bool success_;
  T value_;
  E error_;

  struct ErrorTag {};
  Result(ErrorTag, E error)
      : success_(false), value_(), error_(std::move(error)) {}

public:
  /**
   * @brief Construct a successful result with a value
   * @param value The success value to store
   */
  explicit Result(T value)
      : success_(true), value_(std::move(value)), error_() {}

  /**
   * @brief Construct a failed result from an error message
   * @param error C-string describing the error
   */
  explicit Result(const char *error)
      : success_(false), value_(), error_(error) {}

  /**
   * @brief Construct a failed result from an error message
   * @param error String describing the error
   */
  explicit Result(const std::string &error)
      : success_(false), value_(), error_(error) {}

  /**
   * @brief Construct a failed result carrying a typed error
   * @param error The error value
   */
  static Result failure(E error) { return Result(ErrorTag{}, std::move(error)); }

  /// @brief true if the operation succeeded
  bool is_ok() const noexcept { return success_; }

  /// @brief true if the operation failed
  bool is_err() const noexcept { return !success_; }

  /**
   * @brief Get the success value
   * @warning Only call this if is_ok() returns true
   */
  const T &value() const & { return value_; }

  /// Rvalue overload for moving the value out
  T &&value() && { return std::move(value_); }

  /**
   * @brief Get the error
   * @warning Only call this if is_err() returns true
   */
  const E &error() const noexcept { return error_; }

  explicit operator bool() const noexcept { return success_; }

  /// @brief Value on success, `default_value` otherwise
  T value_or(const T &default_value) const {
    return success_ ? value_ : default_value;
  }
};

} // namespace common
} // namespace vaultsim
