#include "tempo/toolchain.hpp"

#include "tempo/errors.hpp"
#include "tempo/glob.hpp"
#include "tempo/units.hpp"

extern "C" {
#include <stdlib.h>
}

#include <algorithm>
#include <chrono>
#include <future>
#include <iterator>
#include <regex>
#include <system_error>

namespace fs = std::filesystem;
using namespace tempo::literals;

namespace tempo {

    namespace detail {

        static const void* identity_of(const tool_handle& tool) {
            return std::visit([](const auto& ptr) -> const void* { return ptr.get(); }, tool);
        }

        static std::optional<std::regex> compile_filter(const std::optional<std::string>& source) {
            if (!source) {
                return std::nullopt;
            }
            try {
                return std::regex{*source};
            } catch (const std::regex_error& e) {
                throw configuration_error{"Invalid filter pattern \"{}\": {}"_format(*source, e.what())};
            }
        }

        static bool accepts(const std::optional<std::regex>& re, const std::string& name) {
            return !re || std::regex_search(name, *re);
        }

        template <typename T, typename U>
        static void append_unique(std::vector<T>& out, const U& value) {
            if (std::ranges::find(out, value) == out.end()) {
                out.push_back(value);
            }
        }

        static fs::path make_build_dir(const fs::path& parent) {
            auto pattern = (parent / "build-XXXXXX").string();
            std::vector<char> buffer(pattern.begin(), pattern.end());
            buffer.push_back('\0');
            if (::mkdtemp(buffer.data()) == nullptr) {
                throw std::runtime_error("failed to create build directory under {}"_format(parent.string()));
            }
            return fs::path{buffer.data()};
        }

        struct pending_build {
            tool_id id;
            std::string name{};
            build_artifact artifact{};
            std::future<double> elapsed_ms{};
        };

    }  // namespace detail

    tool_id tool_registry::register_tool(const tool_handle& tool, std::string_view name) {
        if (utils::is_blank(name)) {
            throw configuration_error{"Tool name must be a non-empty string"};
        }
        if (auto existing = find(tool)) {
            if (entries_[existing->value].name == name) {
                return *existing;
            }
            throw configuration_error{"A tool can only have one name: {}"_format(name)};
        }
        entries_.push_back(entry{.tool = tool, .name = std::string{name}});
        return tool_id{entries_.size() - 1U};
    }

    std::optional<tool_id> tool_registry::find(const tool_handle& tool) const {
        auto identity = detail::identity_of(tool);
        for (size_t i = 0U; i < entries_.size(); ++i) {
            if (detail::identity_of(entries_[i].tool) == identity) {
                return tool_id{i};
            }
        }
        return std::nullopt;
    }

    const std::string& tool_registry::name_of(tool_id id) const {
        return entries_.at(id.value).name;
    }

    const tool_handle& tool_registry::tool(tool_id id) const {
        return entries_.at(id.value).tool;
    }

    job_generator::job_generator(fs::path temp_dir, job_filter filter, host_logger& logger, glob_fn glob)
            : temp_dir_{std::move(temp_dir)}, filter_{std::move(filter)}, logger_{logger}, glob_{std::move(glob)} {
        if (!glob_) {
            glob_ = [](const std::vector<std::string>& patterns) { return resolve_globs(patterns); };
        }
    }

    void job_generator::add(const toolchain_spec& toolchain) {
        auto builder_re = detail::compile_filter(filter_.builder);
        auto executor_re = detail::compile_filter(filter_.executor);

        std::vector<tool_id> executors{};
        for (const auto& [name, tool] : toolchain.executors) {
            if (detail::accepts(executor_re, name)) {
                executors.push_back(registry_.register_tool(tool, name));
            }
        }

        std::vector<std::string> includes{};
        for (const auto& pattern : toolchain.include) {
            includes.push_back(normalize_include(pattern));
        }

        for (const auto& [name, tool] : toolchain.builders) {
            if (!detail::accepts(builder_re, name)) {
                continue;
            }
            auto id = registry_.register_tool(tool, name);

            auto it = std::ranges::find(builders_, id, &builder_entry::id);
            if (it == builders_.end()) {
                builders_.push_back(builder_entry{.id = id});
                it = std::prev(builders_.end());
            }
            for (const auto& pattern : includes) {
                detail::append_unique(it->includes, pattern);
            }

            for (auto executor_id : executors) {
                auto e = std::ranges::find(executors_, executor_id, &executor_entry::id);
                if (e == executors_.end()) {
                    executors_.push_back(executor_entry{.id = executor_id});
                    e = std::prev(executors_.end());
                }
                detail::append_unique(e->builders, id);
            }
        }
    }

    void job_generator::build(std::optional<std::string_view> shared) {
        auto sharding = shared_filter::parse(shared);

        std::optional<std::string> file{};
        if (filter_.file) {
            file = utils::strip_dot_slash(normalize_include(*filter_.file));
        }

        std::error_code ec{};
        fs::create_directories(temp_dir_, ec);
        if (ec) {
            throw std::runtime_error("failed to create directory: {}"_format(temp_dir_.string()));
        }

        std::vector<detail::pending_build> pending{};
        for (const auto& entry : builders_) {
            auto files = sharding.select(glob_(entry.includes));
            if (file) {
                std::erase_if(files, [&](const std::string& path) { return path.find(*file) == std::string::npos; });
            }
            if (files.empty()) {
                continue;
            }

            const auto& name = registry_.name_of(entry.id);
            auto root = detail::make_build_dir(temp_dir_);
            auto tool = std::get<std::shared_ptr<builder>>(registry_.tool(entry.id));

            logger_.debug("Building {} suites with \"{}\"..."_format(files.size(), name));
            auto elapsed = std::async(std::launch::async, [tool, root, files] {
                auto start = std::chrono::steady_clock::now();
                tool->build(root, files);
                return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
            });

            pending.push_back(detail::pending_build{
                    .id = entry.id,
                    .name = name,
                    .artifact = build_artifact{.builder_name = name, .root = root, .files = std::move(files)},
                    .elapsed_ms = std::move(elapsed)});
        }

        for (auto& p : pending) {
            double ms = 0.0;
            try {
                ms = p.elapsed_ms.get();
            } catch (const std::exception& e) {
                throw build_error{p.name, e.what()};
            }
            logger_.info("Built suites with \"{}\" in {}"_format(p.name, units::duration().format_div(ms, "ms")));
            artifacts_.emplace_back(p.id, std::move(p.artifact));
        }
    }

    std::vector<job> job_generator::get_jobs() const {
        std::vector<job> jobs{};
        for (const auto& entry : executors_) {
            job j{
                    .executor_name = registry_.name_of(entry.id),
                    .executor = std::get<std::shared_ptr<executor>>(registry_.tool(entry.id))};

            for (auto builder_id : entry.builders) {
                auto it = std::ranges::find(artifacts_, builder_id, &std::pair<tool_id, build_artifact>::first);
                if (it != artifacts_.end()) {
                    j.builds.push_back(it->second);
                }
            }
            if (!j.builds.empty()) {
                jobs.push_back(std::move(j));
            }
        }
        return jobs;
    }

}  // namespace tempo
