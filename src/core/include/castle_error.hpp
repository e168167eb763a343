#ifndef CASTLE_ERROR_HPP
#define CASTLE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace castle {

/**
 * @brief Contract violation inside the field encoder
 *
 * Raised only when an encrypted field is requested without the init
 * time its per-field key depends on. Not recoverable by retrying.
 */
class EncodingError : public std::runtime_error {
public:
    explicit EncodingError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief Malformed token handed to the inspector
 */
class TokenFormatError : public std::runtime_error {
public:
    explicit TokenFormatError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace castle

#endif // CASTLE_ERROR_HPP
