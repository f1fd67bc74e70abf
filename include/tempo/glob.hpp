#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tempo {

    /*
     * Expands include patterns into regular files, relative to `base`.
     *
     * Segments support `*`, `?` and `[...]`; a `**` segment matches any number of
     * directories. Hidden entries are only matched by a segment that names them
     * explicitly. Results keep the pattern's leading `./` or `../` form and are sorted
     * and deduplicated.
     */
    std::vector<std::string> resolve_globs(
            const std::vector<std::string>& patterns, const std::filesystem::path& base = std::filesystem::current_path());

    // "./" unless the path already starts with "./" or "../"; relative to `base`, forward slashes.
    std::string normalize_include(std::string_view pattern, const std::filesystem::path& base = std::filesystem::current_path());

    /*
     * Partitions suite files for sharded runs. "index/total" with a 1-based index keeps
     * the files at positions i where i % total == index - 1.
     */
    class shared_filter {
      public:
        shared_filter() = default;

        // Empty or nullopt selects everything; throws configuration_error on a malformed option.
        static shared_filter parse(std::optional<std::string_view> option);

        size_t index() const { return index_; }
        size_t total() const { return total_; }

        std::vector<std::string> select(const std::vector<std::string>& files) const;

      private:
        shared_filter(size_t index, size_t total) : index_{index}, total_{total} {}

        size_t index_{0U};
        size_t total_{1U};
    };

}  // namespace tempo
