#include "utils.hpp"

namespace tempo::test {

    namespace {
        // Answers every suite file with one "push" case.
        constexpr auto runner_script = R"(#!/bin/sh
printf '{"level":"info","log":"running in %s"}\n' "$1"
printf '{"records":['
sep=''
for f in $TEMPO_FILES; do
    printf '%s{"name":"%s","meta":[{"key":"time","format":"{duration.ms}","analysis":2,"lower_is_better":true}],"scenes":[[{"name":"push","metrics":{"time":[1,2,2,2]}}]]}' "$sep" "$f"
    sep=','
done
printf ']}\n'
)";

        std::string host_json(std::string_view extra = {}) {
            std::string json = R"({
                "temp_dir": ".tmp",
                "toolchains": [{
                    "include": ["./benchmark/*.js"],
                    "executors": [{"kind": "process", "name": "sh", "command": "sh runner.sh"}]
                }],
                "reporters": [
                    {"kind": "raw", "file": "out/result.json"},
                    {"kind": "text", "console": false, "file": "out/report.txt", "std_dev": false}
                ])";
            json += extra;
            json += "}";
            return json;
        }

        struct project {
            temp_dir dir{"tempo_host"};
            scoped_cwd cwd{dir.path};

            project() {
                make_executable_file(dir.path / "runner.sh", runner_script);
                write_text_file(dir.path / "benchmark" / "array.js", "");
                write_text_file(dir.path / "benchmark" / "map.js", "");
            }
        };
    }  // namespace

    TEST_CASE("012: text reporter renders one table per suite", "[012][reporter]") {
        result_set result{{"a.js", {result_stub({
                                           make_case("foo", {{"time", metric_series{0.0, 1.0, 1.0, 1.0}}}),
                                           make_case("bar", {{"time", metric_series{1.0, 2.0, 2.0, 2.0}}}),
                                   })}}};

        text_reporter_options options{};
        options.table.std_dev = false;
        text_reporter reporter{options};

        std::ostringstream out{};
        reporter.print(result, std::nullopt, out, false);

        CHECK(out.str() ==
              "Text reporter: Format benchmark results of 1 suites:"
              "\n\nSuite: a.js\n"
              "| No. | Name |     time |\n"
              "| --: | ---: | -------: |\n"
              "|   0 |  foo |   750 us |\n"
              "|   1 |  bar | 1,750 us |\n"
              "\n");
    }

    TEST_CASE("012: text reporter lists hints and warnings", "[012][reporter]") {
        auto r = result_stub({make_case("foo", {{"time", metric_series{1.0, 1.0, 1.0, 1.0, 2.0, 2.0, 2.0, 2.0, 50.0}}})});
        r.notes = {result_note{.type = note_type::warn, .text = "Timer resolution is low"}};
        result_set result{{"a.js", {r}}};

        std::ostringstream console{};
        text_reporter reporter{text_reporter_options{.color = color_mode::never}, console};

        std::ostringstream log{};
        host_logger logger{log};
        reporter.report(result, std::nullopt, logger);

        auto text = console.str();
        CHECK(text.find("\nHints:\n[No.0] foo: 1 outliers were removed.\n") != std::string::npos);
        CHECK(text.find("\nWarnings:\nTimer resolution is low\n") != std::string::npos);
        CHECK(text.find('\x1b') == std::string::npos);

        std::ostringstream colored{};
        reporter.print(result, std::nullopt, colored, true);
        CHECK(colored.str().find("\x1b[36m[No.0] foo: 1 outliers were removed.\x1b[39m") != std::string::npos);
    }

    TEST_CASE("012: host builds, runs and reports suites", "[012][host]") {
        project p{};
        std::ostringstream out{};
        std::ostringstream err{};
        host_logger logger{out, err};

        host h{parse_host_config(host_json()), logger};
        const auto& result = h.run();

        REQUIRE(result.size() == 2U);
        REQUIRE(result.contains("benchmark/array.js"));
        const auto& array = result.at("benchmark/array.js");
        REQUIRE(array.size() == 1U);
        CHECK(array[0].name == "./benchmark/array.js");
        CHECK(array[0].builder == "noop");
        CHECK(array[0].executor == "sh");

        // temp_dir is removed once reporters ran
        CHECK_FALSE(fs::exists(p.dir.path / ".tmp"));

        auto saved = load_result_set(p.dir.path / "out" / "result.json");
        REQUIRE(saved);
        CHECK(saved->size() == 2U);

        auto report = read_text_file(p.dir.path / "out" / "report.txt");
        CHECK(report.find("Suite: benchmark/array.js") != std::string::npos);
        CHECK(report.find("Suite: benchmark/map.js") != std::string::npos);
        CHECK(report.find("| push | 1.75 ms |") != std::string::npos);

        auto log = out.str();
        CHECK(log.find("Built suites with \"noop\" in") != std::string::npos);
        CHECK(log.find("1 jobs for 1 executors.") != std::string::npos);
        CHECK(log.find("running in .tmp/build-") != std::string::npos);
        CHECK(log.find("Raw result saved to out/result.json") != std::string::npos);
        CHECK(log.find("Global total time: ") != std::string::npos);
        CHECK(err.str().empty());
    }

    TEST_CASE("012: run filters and shards reach the executor", "[012][host]") {
        project p{};
        std::ostringstream out{};
        host_logger logger{out};

        host h{parse_host_config(host_json(R"(, "clean_temp_dir": false)")), logger};

        SECTION("file filter") {
            const auto& result = h.run(job_filter{.file = "map"});
            REQUIRE(result.size() == 1U);
            CHECK(result.contains("benchmark/map.js"));
            CHECK(fs::exists(p.dir.path / ".tmp"));
        }

        SECTION("second shard") {
            const auto& result = h.run({}, "2/2"sv);
            REQUIRE(result.size() == 1U);
            CHECK(result.contains("benchmark/map.js"));
        }

        SECTION("executor filter excludes everything") {
            const auto& result = h.run(job_filter{.executor = "^node$"});
            CHECK(result.empty());
            CHECK(out.str().find("No files match the includes, please check your config.") != std::string::npos);
            CHECK_FALSE(fs::exists(p.dir.path / "out" / "result.json"));
        }
    }

    TEST_CASE("012: diff compares against a previous result file", "[012][host][diff]") {
        project p{};
        std::ostringstream out{};
        host_logger logger{out};

        auto previous = result_stub({make_case("push", {{"time", metric_series{3.5}}})});
        previous.builder = "noop";
        previous.executor = "sh";
        save_result_set(result_set{{"benchmark/array.js", {previous}}}, p.dir.path / "previous.json");

        host h{parse_host_config(host_json(R"(, "diff": "previous.json")")), logger};
        h.run();

        auto report = read_text_file(p.dir.path / "out" / "report.txt");
        CHECK(report.find("time.diff") != std::string::npos);
        CHECK(report.find("-50.00%") != std::string::npos);
    }

    TEST_CASE("012: report merges saved result files", "[012][host][report]") {
        project p{};
        std::ostringstream out{};
        host_logger logger{out};

        auto node = result_stub({make_case("push", {{"time", metric_series{1.0}}})});
        node.executor = "node";
        auto bun = node;
        bun.executor = "bun";
        save_result_set(result_set{{"a.js", {node}}}, p.dir.path / "node.json");
        save_result_set(result_set{{"a.js", {bun}}, {"b.js", {bun}}}, p.dir.path / "bun.json");

        host h{parse_host_config(host_json()), logger};
        h.report({p.dir.path / "node.json", p.dir.path / "bun.json"});

        auto merged = load_result_set(p.dir.path / "out" / "result.json");
        REQUIRE(merged);
        REQUIRE(merged->at("a.js").size() == 2U);
        CHECK(merged->at("a.js")[0].executor == "node");
        CHECK(merged->at("a.js")[1].executor == "bun");
        CHECK(merged->at("b.js").size() == 1U);

        auto report = read_text_file(p.dir.path / "out" / "report.txt");
        CHECK(report.find("Executor") != std::string::npos);

        CHECK_THROWS_AS(h.report({}), configuration_error);
        CHECK_THROWS(h.report({p.dir.path / "missing.json"}));
    }

    TEST_CASE("012: report works with the default toolchains", "[012][host][report]") {
        temp_dir dir{"tempo_host"};
        scoped_cwd cwd{dir.path};
        std::ostringstream out{};
        host_logger logger{out};

        auto r = result_stub({make_case("push", {{"time", metric_series{1.0}}})});
        save_result_set(result_set{{"a.js", {r}}}, dir.path / "a.json");

        // no executors configured: running fails, reporting does not need them
        host h{parse_host_config(R"({"reporters": [{"kind": "raw", "file": "merged.json"}]})"), logger};
        h.report({dir.path / "a.json"});

        auto merged = load_result_set(dir.path / "merged.json");
        REQUIRE(merged);
        CHECK(merged->at("a.js").size() == 1U);
        CHECK_THROWS_WITH(h.run(), "No executors.");
    }

}  // namespace tempo::test
