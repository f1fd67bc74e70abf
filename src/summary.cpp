#include "tempo/summary.hpp"

#include "tempo/errors.hpp"

#include <algorithm>
#include <iterator>

using namespace tempo::literals;

namespace tempo {

    namespace detail {

        inline constexpr char identity_separator = '\x1f';

        /*
         * Walks the Cartesian product of a result's parameter definitions together with its
         * scenes. Combination i pairs with scenes[i]; the last parameter varies fastest.
         */
        class scene_combinations {
          public:
            scene_combinations(const toolchain_result& result) : params_{result.params}, scenes_{result.scenes} {
                for (const auto& param : params_) {
                    count_ *= param.values.size();
                }
                if (count_ != scenes_.size()) {
                    throw result_shape_error{"{}: {} scenes for {} parameter combinations"_format(
                            result.name, scenes_.size(), count_)};
                }
            }

            size_t size() const { return count_; }

            const scene_result& scene(size_t index) const { return scenes_[index]; }

            std::vector<std::pair<std::string, std::string>> combination(size_t index) const {
                std::vector<std::pair<std::string, std::string>> values(params_.size());
                for (size_t i = params_.size(); i-- > 0U;) {
                    const auto& param = params_[i];
                    auto n = param.values.size();
                    values[i] = {param.name, param.values[index % n]};
                    index /= n;
                }
                return values;
            }

          private:
            const std::vector<param_definition>& params_;
            const std::vector<scene_result>& scenes_;
            size_t count_{1U};
        };

        static void append_identity_part(std::string& out, std::string_view key, std::string_view value) {
            out.append(key);
            out.push_back('=');
            out.append(value);
            out.push_back(identity_separator);
        }

    }  // namespace detail

    std::optional<std::string_view> flattened_row::variable(std::string_view key) const {
        if (key == "Name"sv) {
            return name;
        }
        if (key == "Builder"sv) {
            return builder ? std::optional<std::string_view>{*builder} : std::nullopt;
        }
        if (key == "Executor"sv) {
            return executor ? std::optional<std::string_view>{*executor} : std::nullopt;
        }
        for (const auto& [param, value] : params) {
            if (param == key) {
                return value;
            }
        }
        return std::nullopt;
    }

    summary::summary(std::span<const toolchain_result> results) {
        for (auto builtin : builtin_variables) {
            vars_.push_back(variable_domain{.name = std::string{builtin}});
        }
        for (const auto& result : results) {
            add_result(result);
        }
    }

    const variable_domain* summary::find_variable(std::string_view name) const {
        auto it = std::ranges::find(vars_, name, &variable_domain::name);
        return it == vars_.end() ? nullptr : &*it;
    }

    const metric_meta* summary::find_meta(std::string_view key) const {
        auto it = std::ranges::find(meta_, key, &metric_meta::key);
        return it == meta_.end() ? nullptr : &*it;
    }

    const flattened_row* summary::find(const flattened_row& row) const {
        if (auto it = index_.find(identity_of(row)); it != index_.end()) {
            return &rows_[it->second];
        }
        return nullptr;
    }

    std::vector<std::vector<flattened_row*>> summary::split(std::string_view variable) {
        std::vector<std::vector<flattened_row*>> groups{};
        std::unordered_map<std::string, size_t> positions{};

        for (auto& row : rows_) {
            auto key = identity_of(row, variable);
            auto [it, inserted] = positions.try_emplace(std::move(key), groups.size());
            if (inserted) {
                groups.emplace_back();
            }
            groups[it->second].push_back(&row);
        }
        return groups;
    }

    std::string summary::identity_of(const flattened_row& row, std::string_view excluded) {
        std::string key{};
        for (auto builtin : builtin_variables) {
            if (builtin != excluded) {
                detail::append_identity_part(key, builtin, row.variable(builtin).value_or(""sv));
            }
        }

        // parameter order may differ between result sets
        std::vector<const std::pair<std::string, std::string>*> params{};
        params.reserve(row.params.size());
        for (const auto& p : row.params) {
            if (p.first != excluded) {
                params.push_back(&p);
            }
        }
        std::ranges::sort(params, {}, [](const auto* p) -> const std::string& { return p->first; });
        for (const auto* p : params) {
            detail::append_identity_part(key, p->first, p->second);
        }
        return key;
    }

    void summary::add_meta(const metric_meta& meta) {
        const auto* existing = find_meta(meta.key);
        if (existing == nullptr) {
            meta_.push_back(meta);
        }
        else if (*existing != meta) {
            notes_.push_back(summary_note{
                    .type = note_type::warn,
                    .text = "Metric \"{}\" has conflicting definitions, the first one is used."_format(meta.key)});
        }
    }

    void summary::add_variable_value(std::string_view name, std::optional<std::string_view> value) {
        auto it = std::ranges::find(vars_, name, &variable_domain::name);
        if (it == vars_.end()) {
            vars_.push_back(variable_domain{.name = std::string{name}});
            it = std::prev(vars_.end());
        }
        if (value) {
            it->values.emplace(*value);
        }
    }

    void summary::add_result(const toolchain_result& result) {
        for (const auto& meta : result.meta) {
            add_meta(meta);
        }
        if (!baseline_ && result.baseline) {
            baseline_ = result.baseline;
        }

        detail::scene_combinations combinations{result};
        auto first_row = rows_.size();

        for (size_t i = 0U; i < combinations.size(); ++i) {
            auto params = combinations.combination(i);
            for (const auto& [key, value] : params) {
                add_variable_value(key, value);
            }

            for (const auto& c : combinations.scene(i)) {
                flattened_row row{
                        .name = c.name,
                        .builder = result.builder,
                        .executor = result.executor,
                        .params = params,
                        .metrics = c.metrics,
                        .processed = c.metrics};

                add_variable_value("Name"sv, row.name);
                add_variable_value("Builder"sv, row.builder);
                add_variable_value("Executor"sv, row.executor);

                // later duplicates shadow earlier ones in find()
                index_.insert_or_assign(identity_of(row), rows_.size());
                rows_.push_back(std::move(row));
            }
        }

        auto row_count = rows_.size() - first_row;
        for (const auto& note : result.notes) {
            summary_note converted{.type = note.type, .text = note.text};
            if (note.case_id) {
                if (*note.case_id >= row_count) {
                    throw result_shape_error{
                            "{}: note refers to case {} of {}"_format(result.name, *note.case_id, row_count)};
                }
                converted.row = first_row + *note.case_id;
            }
            notes_.push_back(std::move(converted));
        }
    }

}  // namespace tempo
