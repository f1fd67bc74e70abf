#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace tempo {

    // No toolchains/builders/executors/includes, or one tool registered under two names.
    class configuration_error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    class build_error : public std::runtime_error {
      public:
        build_error(std::string builder, const std::string& message)
                : std::runtime_error{"builder \"" + builder + "\" failed: " + message}, builder_{std::move(builder)} {}

        const std::string& builder() const noexcept { return builder_; }

      private:
        std::string builder_;
    };

    // A benchmark case failed under a specific parameter combination. The coordinator
    // reports the parameters and rethrows cause().
    class suite_case_error : public std::runtime_error {
      public:
        suite_case_error(std::string params, std::exception_ptr cause)
                : std::runtime_error{"suite case failed at " + params}, params_{std::move(params)}, cause_{cause} {}

        const std::string& params() const noexcept { return params_; }
        std::exception_ptr cause() const noexcept { return cause_; }

      private:
        std::string params_;
        std::exception_ptr cause_;
    };

    class executor_transport_error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    class baseline_not_found_error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    class metric_shape_error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    // Scene count does not match the number of parameter combinations.
    class result_shape_error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

}  // namespace tempo
