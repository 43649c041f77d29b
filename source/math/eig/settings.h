#pragma once
#include "enums.h"
#include <optional>
#include <string>

namespace eig {

    class settings {
        public:
        // Solver library
        std::optional<Lib> lib = std::nullopt;

        // Solver properties
        std::optional<Form> form            = std::nullopt;
        std::optional<Type> type            = std::nullopt;
        std::optional<Vecs> compute_eigvecs = std::nullopt;

        std::string           tag; // Handy when you are using many instances
        std::optional<size_t> loglevel = std::nullopt;
        [[nodiscard]] std::string to_string() const;
    };
}
