#pragma once

#include "io/fmt.h"
#include <stdexcept>

namespace except {
    class runtime_error : public std::runtime_error {
        public:
        using std::runtime_error::runtime_error;
        template<typename... Args>
        runtime_error(fmt::format_string<Args...> fs, Args &&...args) : std::runtime_error(fmt::format(fs, std::forward<Args>(args)...)) {}
    };

    class logic_error : public std::logic_error {
        public:
        using std::logic_error::logic_error;
        template<typename... Args>
        logic_error(fmt::format_string<Args...> fs, Args &&...args) : std::logic_error(fmt::format(fs, std::forward<Args>(args)...)) {}
    };

    class range_error : public std::range_error {
        public:
        using std::range_error::range_error;
        template<typename... Args>
        range_error(fmt::format_string<Args...> fs, Args &&...args) : std::range_error(fmt::format(fs, std::forward<Args>(args)...)) {}
    };

    class invalid_argument : public std::invalid_argument {
        public:
        using std::invalid_argument::invalid_argument;
        template<typename... Args>
        invalid_argument(fmt::format_string<Args...> fs, Args &&...args) : std::invalid_argument(fmt::format(fs, std::forward<Args>(args)...)) {}
    };

    class convergence_error : public except::runtime_error {
        // Used for signaling that a dense decomposition did not converge or returned non-finite values
        using except::runtime_error::runtime_error;
    };

    class file_error : public except::runtime_error {
        // Used for signaling that a config file could not be read
        using except::runtime_error::runtime_error;
    };

}
