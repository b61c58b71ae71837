#pragma once

#include <QiTraffic/Core/Export.h>

/**
 * @file Exception.h
 * @brief Exception classes for QiTraffic
 *
 * All errors raised by the library are local and synchronous. Nothing is
 * logged-and-ignored inside the core; callers receive one of these types.
 */

#include <stdexcept>
#include <string>

namespace Qi::Traffic {

/**
 * @brief Base exception class for QiTraffic
 */
class QITRAFFIC_API Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}

    explicit Exception(const char* message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid argument exception (construction of an invalid value object)
 */
class QITRAFFIC_API InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message) {}
};

/**
 * @brief Insufficient data for an object (e.g., track with fewer than two detections)
 */
class QITRAFFIC_API InsufficientDataException : public Exception {
public:
    explicit InsufficientDataException(const std::string& message)
        : Exception("Insufficient data: " + message) {}
};

/**
 * @brief Builder used before all required fields were supplied
 */
class QITRAFFIC_API BuilderSetupException : public Exception {
public:
    explicit BuilderSetupException(const std::string& message)
        : Exception("Builder setup error: " + message) {}
};

/**
 * @brief Section or engine configuration is incomplete
 */
class QITRAFFIC_API ConfigurationException : public Exception {
public:
    explicit ConfigurationException(const std::string& message)
        : Exception("Configuration error: " + message) {}
};

/**
 * @brief Video file name does not follow the `<hostname>_<rest>` pattern
 */
class QITRAFFIC_API ImproperFormattedFilenameException : public Exception {
public:
    explicit ImproperFormattedFilenameException(const std::string& message)
        : Exception("Improperly formatted filename: " + message) {}
};

/**
 * @brief Requested id is not present in a repository
 */
class QITRAFFIC_API NotFoundException : public Exception {
public:
    explicit NotFoundException(const std::string& message)
        : Exception("Not found: " + message) {}
};

} // namespace Qi::Traffic
