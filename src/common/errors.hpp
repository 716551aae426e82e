#ifndef KINDLE_COMMON_ERRORS_HPP
#define KINDLE_COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace Kindle {
    // Invalid settings, vocabulary descriptors, or settings files.
    class ConfigurationError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    // A vocabulary file, checkpoint archive, or checkpoint tensor is absent.
    class NotFoundError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Slices handed over together do not form one logical parameter.
    class InconsistentSliceError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    class UnsupportedParameterTypeError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    class ShapeMismatchError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };
}

#endif // KINDLE_COMMON_ERRORS_HPP
