#pragma once

#include <stdexcept>
#include <string>
#include <cstdint>

namespace natlib::core {

    /**
     * Method: ConfigurationError
     * Description: Invalid bounds, dimension mismatch, population below the
     * algorithm minimum or a bad configuration file. Raised before any
     * objective evaluation takes place.
     */
    class ConfigurationError : public std::invalid_argument {
    public:
        explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
    };

    /**
     * Method: RunExhausted
     * Description: Every candidate evaluated in one generation produced an
     * invalid fitness.
     */
    class RunExhausted : public std::runtime_error {
    public:
        RunExhausted(const std::string& what, std::uint64_t gen)
            : std::runtime_error(what), gen_(gen) {}

        std::uint64_t gen() const { return gen_; }

    private:
        std::uint64_t gen_;
    };

} // namespace natlib::core
