#include "utils.hpp"

namespace tempo::test {

    namespace {
        toolchain_result tagged(std::string builder, std::string executor) {
            auto r = result_stub({make_case("push", {{"time", metric_series{1.0, 2.0}}})});
            r.builder = std::move(builder);
            r.executor = std::move(executor);
            return r;
        }
    }  // namespace

    TEST_CASE("005: merge appends toolchains per file in order", "[005][result]") {
        result_set raw{{"a.js", {tagged("noop", "node")}}};
        result_set more{{"a.js", {tagged("noop", "bun")}}, {"b.js", {tagged("rollup", "node")}}};

        merge(raw, more);

        REQUIRE(raw.size() == 2U);
        REQUIRE(raw["a.js"].size() == 2U);
        CHECK(raw["a.js"][0].executor == "node");
        CHECK(raw["a.js"][1].executor == "bun");
        REQUIRE(raw["b.js"].size() == 1U);
        CHECK(raw["b.js"][0].builder == "rollup");

        // merging the same data again duplicates it
        merge(raw, more);
        CHECK(raw["a.js"].size() == 3U);
        CHECK(raw["b.js"].size() == 2U);
    }

    TEST_CASE("005: moving merge leaves the source empty", "[005][result]") {
        result_set raw{};
        result_set more{{"a.js", {tagged("noop", "node")}}};

        merge(raw, std::move(more));

        CHECK(raw.size() == 1U);
        CHECK(more.empty());
    }

    TEST_CASE("005: result sets survive a json round trip", "[005][result]") {
        auto r = tagged("noop", "node");
        r.params = {param_definition{.name = "size", .values = {"10", "100"}}};
        r.scenes = {
                {make_case("push", {{"time", metric_series{1.0, 2.0}}, {"memory", 2048.0}})},
                {make_case("push", {{"time", metric_series{3.0}}, {"label", std::string{"big"}}})}};
        r.notes = {result_note{.type = note_type::warn, .case_id = 1U, .text = "slow"}};
        r.baseline = result_baseline{.type = "size", .value = "10"};

        result_set original{{"bench/a.js", {r}}};
        auto parsed = parse_result_set(serialize_result_set(original));

        REQUIRE(parsed.contains("bench/a.js"));
        const auto& back = parsed["bench/a.js"].at(0);
        CHECK(back.name == r.name);
        CHECK(back.builder == "noop");
        CHECK(back.executor == "node");
        REQUIRE(back.meta.size() == 1U);
        CHECK(back.meta[0] == time_meta());
        REQUIRE(back.params.size() == 1U);
        CHECK(back.params[0].values == std::vector<std::string>{"10", "100"});
        REQUIRE(back.scenes.size() == 2U);

        const auto& first = back.scenes[0].at(0).metrics;
        REQUIRE(std::holds_alternative<metric_series>(first.at("time")));
        CHECK(std::get<metric_series>(first.at("time")) == metric_series{1.0, 2.0});
        REQUIRE(std::holds_alternative<double>(first.at("memory")));
        CHECK(std::get<double>(first.at("memory")) == 2048.0);

        const auto& second = back.scenes[1].at(0).metrics;
        REQUIRE(std::holds_alternative<std::string>(second.at("label")));
        CHECK(std::get<std::string>(second.at("label")) == "big");

        REQUIRE(back.notes.size() == 1U);
        CHECK(back.notes[0].type == note_type::warn);
        CHECK(back.notes[0].case_id == 1U);
        REQUIRE(back.baseline);
        CHECK(back.baseline->type == "size");
    }

    TEST_CASE("005: result files are saved and loaded", "[005][result]") {
        temp_dir dir{"tempo_result"};
        auto path = dir.path / "nested" / "result.json";

        result_set original{{"a.js", {tagged("noop", "node")}}};
        save_result_set(original, path);
        REQUIRE(fs::exists(path));

        auto loaded = load_result_set(path);
        REQUIRE(loaded);
        CHECK(loaded->at("a.js").size() == 1U);

        CHECK_FALSE(load_result_set(dir.path / "missing.json", true));
        CHECK_THROWS_AS(load_result_set(dir.path / "missing.json"), std::runtime_error);

        write_text_file(dir.path / "broken.json", "{\"a.js\": [");
        CHECK_THROWS_AS(load_result_set(dir.path / "broken.json"), std::runtime_error);
    }

}  // namespace tempo::test
