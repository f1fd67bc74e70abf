#include "tempo/result.hpp"

#include "internal/types.hpp"

#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;
using namespace tempo::literals;

namespace tempo {

    void merge(result_set& raw, const result_set& more) {
        for (const auto& [file, records] : more) {
            auto& target = raw[file];
            target.insert(target.end(), records.begin(), records.end());
        }
    }

    void merge(result_set& raw, result_set&& more) {
        for (auto& [file, records] : more) {
            auto& target = raw[file];
            target.insert(target.end(), std::make_move_iterator(records.begin()), std::make_move_iterator(records.end()));
        }
        more.clear();
    }

    std::string serialize_result_set(const result_set& result) {
        std::string json{};
        auto ec = glz::write_json(result, json);
        if (ec) {
            throw std::runtime_error("failed to serialize result set");
        }
        return json;
    }

    result_set parse_result_set(std::string_view text) {
        std::string json{text};
        result_set result{};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(result, json);
        if (ec) {
            throw std::runtime_error("failed to parse result set: {}"_format(glz::format_error(ec, json)));
        }
        return result;
    }

    std::optional<result_set> load_result_set(const fs::path& path, bool optional) {
        std::error_code ec{};
        if (!fs::exists(path, ec)) {
            if (optional) {
                return std::nullopt;
            }
            throw std::runtime_error("result file does not exist: {}"_format(path.string()));
        }

        std::ifstream in{path};
        if (!in) {
            throw std::runtime_error("failed to open {}"_format(path.string()));
        }
        std::ostringstream ss{};
        ss << in.rdbuf();

        try {
            return parse_result_set(ss.str());
        } catch (const std::runtime_error& e) {
            throw std::runtime_error("{}: {}"_format(path.string(), e.what()));
        }
    }

    void save_result_set(const result_set& result, const fs::path& path) {
        auto json = serialize_result_set(result);

        auto parent = path.parent_path();
        if (!parent.empty()) {
            std::error_code ec{};
            fs::create_directories(parent, ec);
            if (ec) {
                throw std::runtime_error("failed to create directory: {}"_format(parent.string()));
            }
        }

        std::ofstream out{path};
        if (!out) {
            throw std::runtime_error("failed to open {}"_format(path.string()));
        }
        out << json << '\n';
        if (!out) {
            throw std::runtime_error("failed to write {}"_format(path.string()));
        }
    }

}  // namespace tempo
