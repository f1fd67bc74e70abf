#pragma once

#include "config.hpp"

#include <ostream>
#include <string_view>

namespace tempo {

    /*
     * Host-side log sink. Every component that reports progress takes a host_logger&
     * instead of writing to std::cout directly, so tests can capture output in a
     * std::ostringstream. debug/info go to `out`, warn/error to `err`.
     *
     * Not synchronized: only the coordinating thread logs.
     */
    class host_logger {
      public:
        host_logger(std::ostream& out, std::ostream& err, log_level level = log_level::debug)
                : out_{out}, err_{err}, level_{level} {}

        explicit host_logger(std::ostream& out, log_level level = log_level::debug) : host_logger{out, out, level} {}

        log_level level() const { return level_; }
        void set_level(log_level level) { level_ = level; }

        bool enabled(log_level level) const { return level != log_level::off && level >= level_; }

        void log(log_level level, std::string_view message) {
            if (!enabled(level)) {
                return;
            }
            auto& os = level >= log_level::warn ? err_ : out_;
            os << message << '\n';
        }

        void debug(std::string_view message) { log(log_level::debug, message); }
        void info(std::string_view message) { log(log_level::info, message); }
        void warn(std::string_view message) { log(log_level::warn, message); }
        void error(std::string_view message) { log(log_level::error, message); }

      private:
        std::ostream& out_;
        std::ostream& err_;
        log_level level_;
    };

}  // namespace tempo
