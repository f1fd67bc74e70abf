#include "tempo/glob.hpp"

#include "tempo/errors.hpp"
#include "tempo/format.hpp"

extern "C" {
#include <fnmatch.h>
}

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;
using namespace tempo::literals;

namespace tempo {

    namespace detail {

        static bool has_glob_chars(std::string_view segment) {
            return segment.find_first_of("*?[") != std::string_view::npos;
        }

        static std::vector<std::string> split_segments(std::string_view pattern) {
            std::vector<std::string> segments{};
            size_t begin = 0U;
            while (begin <= pattern.size()) {
                auto end = pattern.find('/', begin);
                if (end == std::string_view::npos) {
                    end = pattern.size();
                }
                if (end != begin) {
                    segments.emplace_back(pattern.substr(begin, end - begin));
                }
                begin = end + 1U;
            }
            return segments;
        }

        static std::string join_display(const std::string& parent, std::string_view name) {
            if (parent.empty()) {
                return std::string{name};
            }
            return "{}/{}"_format(parent, name);
        }

        class glob_walker {
          public:
            glob_walker(const std::vector<std::string>& segments, std::vector<std::string>& out)
                    : segments_{segments}, out_{out} {}

            void walk(const fs::path& dir, const std::string& display, size_t i) {
                std::error_code ec{};
                if (i == segments_.size()) {
                    if (fs::is_regular_file(dir, ec)) {
                        out_.push_back(display);
                    }
                    return;
                }

                const auto& segment = segments_[i];
                if (segment == "**") {
                    walk_globstar(dir, display, i);
                    return;
                }
                if (!has_glob_chars(segment)) {
                    auto child = dir / segment;
                    if (fs::exists(child, ec)) {
                        walk(child, join_display(display, segment), i + 1U);
                    }
                    return;
                }

                for (const auto& entry : fs::directory_iterator{dir, ec}) {
                    auto name = entry.path().filename().string();
                    if (::fnmatch(segment.c_str(), name.c_str(), FNM_PERIOD) == 0) {
                        walk(entry.path(), join_display(display, name), i + 1U);
                    }
                }
            }

          private:
            void walk_globstar(const fs::path& dir, const std::string& display, size_t i) {
                // zero directories
                walk(dir, display, i + 1U);

                std::error_code ec{};
                auto last = i + 1U == segments_.size();
                for (const auto& entry : fs::directory_iterator{dir, ec}) {
                    auto name = entry.path().filename().string();
                    if (name.starts_with('.')) {
                        continue;
                    }
                    std::error_code entry_ec{};
                    if (entry.is_directory(entry_ec) && !entry.is_symlink(entry_ec)) {
                        walk_globstar(entry.path(), join_display(display, name), i);
                    }
                    else if (last && entry.is_regular_file(entry_ec)) {
                        out_.push_back(join_display(display, name));
                    }
                }
            }

            const std::vector<std::string>& segments_;
            std::vector<std::string>& out_;
        };

    }  // namespace detail

    std::string normalize_include(std::string_view pattern, const fs::path& base) {
        fs::path path{pattern};
        auto relative = path.is_absolute() ? path.lexically_relative(base) : path.lexically_normal();
        auto text = relative.generic_string();

        if (text.empty() || text == ".") {
            return "./";
        }
        if (text.starts_with("./") || text.starts_with("../") || text == "..") {
            return text;
        }
        return "./" + text;
    }

    std::vector<std::string> resolve_globs(const std::vector<std::string>& patterns, const fs::path& base) {
        std::vector<std::string> files{};

        for (const auto& pattern : patterns) {
            auto segments = detail::split_segments(pattern);

            // leading "." and ".." segments locate the search root
            fs::path root = base;
            std::string display{};
            size_t i = 0U;
            while (i < segments.size() && (segments[i] == "." || segments[i] == "..")) {
                root /= segments[i];
                display = detail::join_display(display, segments[i]);
                ++i;
            }
            if (pattern.starts_with('/')) {
                root = "/";
                display = "";
            }

            std::vector<std::string> rest(segments.begin() + static_cast<std::ptrdiff_t>(i), segments.end());
            std::vector<std::string> matched{};
            detail::glob_walker{rest, matched}.walk(root, display, 0U);

            if (pattern.starts_with('/')) {
                for (auto& m : matched) {
                    m.insert(m.begin(), '/');
                }
            }
            files.insert(files.end(), matched.begin(), matched.end());
        }

        std::ranges::sort(files);
        auto [first, last] = std::ranges::unique(files);
        files.erase(first, last);
        return files;
    }

    shared_filter shared_filter::parse(std::optional<std::string_view> option) {
        if (!option || option->empty()) {
            return {};
        }

        auto slash = option->find('/');
        if (slash != std::string_view::npos) {
            auto index = utils::parse_arithmetic<size_t>(option->substr(0U, slash));
            auto total = utils::parse_arithmetic<size_t>(option->substr(slash + 1U));
            if (index && total && *total > 0U && *index > 0U && *index <= *total) {
                return shared_filter{*index - 1U, *total};
            }
        }
        throw configuration_error{"Invalid --shared parameter: {}"_format(*option)};
    }

    std::vector<std::string> shared_filter::select(const std::vector<std::string>& files) const {
        std::vector<std::string> selected{};
        for (size_t i = 0U; i < files.size(); ++i) {
            if (i % total_ == index_) {
                selected.push_back(files[i]);
            }
        }
        return selected;
    }

}  // namespace tempo
