/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the pngme library
 * @author Igor
 * @date 14/08/2025
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the pngme library.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>

namespace pngme {

    /**
     * @enum error_kind
     * @brief Closed set of failure kinds reported by the library
     */
    enum class error_kind {
        invalid_chunk_type, ///< Type code is not four ASCII letters
        truncated,          ///< Buffer ends before a field is complete
        bad_signature,      ///< Leading eight bytes are not the PNG signature
        checksum_mismatch,  ///< Stored CRC differs from the computed one
        encoding,           ///< Payload requested as text is not UTF-8
        not_found,          ///< No chunk of the requested type
        chunk_too_large     ///< Chunk length exceeds the configured limit
    };

    /**
     * @class pngme_error
     * @brief Base exception class for all pngme errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch all pngme-specific errors with a single catch block.
     * The concrete failure is available through kind().
     */
    class pngme_error : public std::runtime_error {
    public:
        pngme_error(error_kind kind, const std::string& msg)
            : std::runtime_error(msg), m_kind(kind) {}

        [[nodiscard]] error_kind kind() const noexcept { return m_kind; }

    private:
        error_kind m_kind;
    };

    /**
     * @class parse_error
     * @brief Base class for failures while decoding a byte buffer
     */
    class parse_error : public pngme_error {
    public:
        parse_error(error_kind kind, const std::string& msg)
            : pngme_error(kind, msg) {}
    };

    /**
     * @class invalid_chunk_type
     * @brief Thrown when a chunk type code is not exactly four ASCII letters
     */
    class invalid_chunk_type : public pngme_error {
    public:
        explicit invalid_chunk_type(const std::string& msg)
            : pngme_error(error_kind::invalid_chunk_type, msg) {}
    };

    /**
     * @class truncated_error
     * @brief Thrown when the buffer ends in the middle of a field
     */
    class truncated_error : public parse_error {
    public:
        explicit truncated_error(const std::string& msg)
            : parse_error(error_kind::truncated, msg) {}
    };

    /**
     * @class bad_signature
     * @brief Thrown when a buffer does not start with the PNG signature
     */
    class bad_signature : public parse_error {
    public:
        explicit bad_signature(const std::string& msg)
            : parse_error(error_kind::bad_signature, msg) {}
    };

    /**
     * @class checksum_mismatch
     * @brief Thrown when a chunk's stored CRC does not match its contents
     */
    class checksum_mismatch : public parse_error {
    public:
        explicit checksum_mismatch(const std::string& msg)
            : parse_error(error_kind::checksum_mismatch, msg) {}
    };

    /**
     * @class chunk_too_large
     * @brief Thrown when a chunk length exceeds the allowed maximum
     */
    class chunk_too_large : public parse_error {
    public:
        explicit chunk_too_large(const std::string& msg)
            : parse_error(error_kind::chunk_too_large, msg) {}
    };

    /**
     * @class encoding_error
     * @brief Thrown when chunk data is requested as text but is not UTF-8
     */
    class encoding_error : public pngme_error {
    public:
        explicit encoding_error(const std::string& msg)
            : pngme_error(error_kind::encoding, msg) {}
    };

    /**
     * @class chunk_not_found
     * @brief Thrown when a removal matches no chunk
     */
    class chunk_not_found : public pngme_error {
    public:
        explicit chunk_not_found(const std::string& msg)
            : pngme_error(error_kind::not_found, msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_ERROR
     * @brief Throw an exception of the given type with formatted message
     * @param exc Exception class (one of the classes above)
     * @param ... Variable arguments to format into error message
     */
    #define THROW_ERROR(exc, ...) \
        throw ::pngme::exc(::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_ERROR_IF
     * @brief Conditionally throw an exception of the given type
     * @param condition Condition to check
     * @param exc Exception class
     * @param ... Variable arguments for error message if condition is true
     */
    #define THROW_ERROR_IF(condition, exc, ...) \
        do { if (condition) THROW_ERROR(exc, __VA_ARGS__); } while(0)

    /**
     * @def THROW_ERROR_UNLESS
     * @brief Throw an exception of the given type unless condition is true
     * @param condition Condition that must be true to avoid throwing
     * @param exc Exception class
     * @param ... Variable arguments for error message if condition is false
     */
    #define THROW_ERROR_UNLESS(condition, exc, ...) \
        do { if (!(condition)) THROW_ERROR(exc, __VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngme
