#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace numerals {

/**
 * @brief Base class for every error raised by the numeral converters.
 */
class NumeralError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Raised by a parser when a character has no numeral mapping.
 *
 * Text is read byte by byte: the position is a byte offset and a multi-byte
 * UTF-8 character is reported through its first byte. The message escapes
 * bytes that are not printable ASCII. No partial sequence is produced when
 * this error is thrown.
 */
class InvalidNumeralText : public NumeralError {
public:
  /**
   * @brief Constructs the error for the offending character.
   * @param position Zero-based index of the character in the input text.
   * @param character The character that could not be mapped.
   */
  InvalidNumeralText(std::size_t position, char character);

  /**
   * @brief Returns the zero-based position of the offending character.
   */
  std::size_t Position() const;

  /**
   * @brief Returns the offending character.
   */
  char Character() const;

private:
  std::size_t position_; /**< Index of the rejected character. */
  char character_;       /**< The rejected character. */
};

/**
 * @brief Raised when a value with no Roman representation is encoded.
 */
class NonPositiveInput : public NumeralError {
public:
  /**
   * @brief Constructs the error for the rejected value.
   * @param input The value passed to the encoder.
   */
  explicit NonPositiveInput(std::int64_t input);

  /**
   * @brief Returns the rejected value.
   */
  std::int64_t Input() const;

private:
  std::int64_t input_;
};

/**
 * @brief Raised when a decoded value leaves the integer domain.
 */
class OverflowError : public NumeralError {
public:
  using NumeralError::NumeralError;
};

} // namespace numerals
