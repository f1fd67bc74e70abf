#pragma once

#include "tempo.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

#include "../src/internal/types.hpp"

extern "C" {
#include <unistd.h>
}

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace tempo::test {

    namespace fs = std::filesystem;
    using namespace std::string_view_literals;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            static std::atomic<unsigned> counter{0U};
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now << "_" << counter++;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        temp_dir(const temp_dir&) = delete;
        temp_dir& operator=(const temp_dir&) = delete;

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    // Runs the enclosing scope with `dir` as the working directory.
    struct scoped_cwd {
        fs::path previous{fs::current_path()};

        explicit scoped_cwd(const fs::path& dir) { fs::current_path(dir); }

        scoped_cwd(const scoped_cwd&) = delete;
        scoped_cwd& operator=(const scoped_cwd&) = delete;

        ~scoped_cwd() {
            std::error_code ec{};
            fs::current_path(previous, ec);
        }
    };

    inline void write_text_file(const fs::path& path, std::string_view text) {
        auto parent = path.parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }
        std::ofstream out{path};
        REQUIRE(out.good());
        out << text;
        REQUIRE(out.good());
    }

    inline std::string read_text_file(const fs::path& path) {
        std::ifstream in{path};
        REQUIRE(in.good());
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    inline void make_executable_file(const fs::path& path, std::string_view content) {
        write_text_file(path, content);
        fs::permissions(
                path,
                fs::perms::owner_read | fs::perms::owner_write | fs::perms::owner_exec | fs::perms::group_read |
                        fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec,
                fs::perm_options::replace);
    }

    // A time metric the way a duration-measuring suite reports it.
    inline metric_meta time_meta() {
        return metric_meta{
                .key = "time",
                .format = "{duration.ms}",
                .analysis = metric_analysis::statistics,
                .lower_is_better = true};
    }

    inline case_result make_case(std::string name, metric_map metrics = {}) {
        return case_result{.name = std::move(name), .metrics = std::move(metrics)};
    }

    // One suite result without parameters: a single scene holding `cases`.
    inline toolchain_result result_stub(std::vector<case_result> cases = {make_case("foo")}) {
        toolchain_result result{};
        result.name = "suite";
        result.meta = {time_meta()};
        result.scenes = {std::move(cases)};
        return result;
    }

    inline std::string cell_string(const table_cell& cell) {
        if (const auto* text = std::get_if<std::string>(&cell.value)) {
            return *text;
        }
        return {};
    }

    inline double cell_number(const table_cell& cell) {
        const auto* number = std::get_if<double>(&cell.value);
        REQUIRE(number != nullptr);
        return *number;
    }

    inline bool cell_empty(const table_cell& cell) {
        return std::holds_alternative<std::monostate>(cell.value);
    }

    inline std::vector<std::string> header_names(const summary_table& table) {
        std::vector<std::string> names{};
        for (const auto& cell : table.header()) {
            names.push_back(cell_string(cell));
        }
        return names;
    }

    // Records build calls; optionally fails.
    class fake_builder final : public builder {
      public:
        explicit fake_builder(std::string error = {}) : error_{std::move(error)} {}

        std::string name() const override { return "fake"; }

        void build(const fs::path& output_dir, const std::vector<std::string>& files) override {
            std::lock_guard lock{mutex_};
            calls_.push_back({output_dir, files});
            if (!error_.empty()) {
                throw std::runtime_error(error_);
            }
        }

        size_t calls() const {
            std::lock_guard lock{mutex_};
            return calls_.size();
        }

        std::vector<std::string> files_of(size_t call) const {
            std::lock_guard lock{mutex_};
            return calls_.at(call).second;
        }

      private:
        std::string error_;
        mutable std::mutex mutex_;
        std::vector<std::pair<fs::path, std::vector<std::string>>> calls_{};
    };

    // Runs a scripted body per run(); counts start/close.
    class fake_executor final : public executor {
      public:
        using body_fn = std::function<void(execution_context&)>;

        explicit fake_executor(body_fn body = {}) : body_{std::move(body)} {}

        std::string name() const override { return "fake"; }

        void start() override {
            ++starts;
            if (fail_start) {
                throw std::runtime_error("start failed");
            }
        }

        void close() override { ++closes; }

        void run(execution_context& ctx) override {
            contexts.push_back(ctx);
            if (body_) {
                body_(ctx);
                return;
            }
            record_list records{};
            for (const auto& file : ctx.files) {
                auto r = result_stub({make_case("case", {{"time", metric_series{1.0, 2.0}}})});
                r.name = file;
                records.push_back(std::move(r));
            }
            ctx.dispatch(std::move(records));
        }

        int starts{0};
        int closes{0};
        bool fail_start{false};
        std::vector<execution_context> contexts{};

      private:
        body_fn body_;
    };

}  // namespace tempo::test
