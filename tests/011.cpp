#include "utils.hpp"

namespace tempo::test {

    namespace {
        constexpr auto records_line =
                R"({"records":[{"name":"suite","meta":[{"key":"time","format":"{duration.ms}","analysis":2}],)"
                R"("scenes":[[{"name":"foo","metrics":{"time":[1,2,3]}}]]}]})";

        // Collects everything an executor dispatches.
        struct dispatch_sink {
            std::vector<client_message> messages{};

            execution_context context(const fs::path& root, std::vector<std::string> files) {
                return execution_context{
                        .temp_dir = root / "tmp",
                        .pattern = "fo+",
                        .files = std::move(files),
                        .root = root,
                        .dispatch = [this](client_message m) { messages.push_back(std::move(m)); }};
            }

            std::vector<log_message> logs() const {
                std::vector<log_message> out{};
                for (const auto& m : messages) {
                    if (const auto* log = std::get_if<log_message>(&m)) {
                        out.push_back(*log);
                    }
                }
                return out;
            }
        };
    }  // namespace

    TEST_CASE("011: client message lines", "[011][tools][wire]") {
        auto log = parse_client_message(R"({"level":"warn","log":"slow machine"})");
        REQUIRE(log);
        REQUIRE(std::holds_alternative<log_message>(*log));
        CHECK(std::get<log_message>(*log).level == log_level::warn);
        CHECK(std::get<log_message>(*log).log == "slow machine");

        auto unknown_level = parse_client_message(R"({"level":"verbose","log":"x"})");
        REQUIRE(unknown_level);
        CHECK(std::get<log_message>(*unknown_level).level == log_level::info);

        auto error = parse_client_message(R"(  {"error":{"message":"boom","params":"n=1"}})");
        REQUIRE(error);
        REQUIRE(std::holds_alternative<error_message>(*error));
        CHECK(std::get<error_message>(*error).message == "boom");
        CHECK(std::get<error_message>(*error).params == "n=1");

        auto records = parse_client_message(records_line);
        REQUIRE(records);
        REQUIRE(std::holds_alternative<record_list>(*records));
        const auto& list = std::get<record_list>(*records);
        REQUIRE(list.size() == 1U);
        CHECK(list[0].meta.at(0).analysis == metric_analysis::statistics);
        CHECK(std::get<metric_series>(list[0].scenes.at(0).at(0).metrics.at("time")) == metric_series{1.0, 2.0, 3.0});

        CHECK_FALSE(parse_client_message("plain output"));
        CHECK_FALSE(parse_client_message("{not json"));
        CHECK_FALSE(parse_client_message(R"({"other":1})"));
    }

    TEST_CASE("011: noop builder writes an index of the suite files", "[011][tools][builder]") {
        temp_dir dir{"tempo_tools"};
        noop_builder builder{};
        CHECK(builder.name() == "noop");

        builder.build(dir.path, {"./bench/a.js", "./bench/b.js"});

        internal::build_manifest manifest{};
        auto json = read_text_file(dir.path / "index.json");
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(manifest, json);
        REQUIRE_FALSE(bool(ec));
        CHECK(manifest.files == std::vector<std::string>{"./bench/a.js", "./bench/b.js"});
    }

    TEST_CASE("011: command builder substitutes output and files", "[011][tools][builder]") {
        temp_dir dir{"tempo_tools"};
        auto script = dir.path / "build.sh";
        make_executable_file(script, "#!/bin/sh\nout=\"$1\"\nshift\nprintf '%s\\n' \"$@\" > \"$out/args.txt\"\necho built\n");

        command_builder builder{"sh " + script.string() + " {out} --"};
        CHECK(builder.name() == "sh");

        auto out = dir.path / "out";
        fs::create_directories(out);
        builder.build(out, {"./a.js", "./b.js"});

        CHECK(read_text_file(out / "args.txt") == "--\n./a.js\n./b.js\n");
        CHECK(read_text_file(out / "build.stdout") == "built\n");
    }

    TEST_CASE("011: command builder reports failures", "[011][tools][builder]") {
        temp_dir dir{"tempo_tools"};
        auto script = dir.path / "fail.sh";
        make_executable_file(script, "#!/bin/sh\necho nope >&2\nexit 3\n");

        command_builder builder{"sh " + script.string() + " {files}"};
        try {
            builder.build(dir.path, {"./a.js"});
            FAIL("expected a failure");
        } catch (const std::runtime_error& e) {
            CHECK(std::string_view{e.what()}.starts_with("Execute Failed (3), Command: sh "));
        }
        CHECK(read_text_file(dir.path / "build.stderr") == "nope\n");

        CHECK_THROWS_AS(command_builder{"   "}, configuration_error);
    }

    TEST_CASE("011: process executor streams messages from the suite process", "[011][tools][executor]") {
        temp_dir dir{"tempo_tools"};
        auto script = dir.path / "run.sh";
        std::string body = "#!/bin/sh\n";
        body += "echo 'starting'\n";
        body += "printf '{\"level\":\"info\",\"log\":\"root=%s files=%s pattern=%s\"}\\n' "
                "\"$1\" \"$TEMPO_FILES\" \"$TEMPO_PATTERN\"\n";
        body += "echo '" + std::string{records_line} + "'\n";
        make_executable_file(script, body);

        process_executor executor{"sh " + script.string()};
        CHECK(executor.name() == "sh");

        dispatch_sink sink{};
        auto ctx = sink.context(dir.path, {"./a.js"});
        executor.run(ctx);

        auto logs = sink.logs();
        REQUIRE(logs.size() == 2U);
        CHECK(logs[0].level == log_level::debug);
        CHECK(logs[0].log == "starting");
        CHECK(logs[1].level == log_level::info);
        CHECK(logs[1].log == "root=" + dir.path.string() + " files=./a.js pattern=fo+");

        REQUIRE(sink.messages.size() == 3U);
        REQUIRE(std::holds_alternative<record_list>(sink.messages[2]));
        CHECK(std::get<record_list>(sink.messages[2]).size() == 1U);
    }

    TEST_CASE("011: process executor fails on a non-zero exit", "[011][tools][executor]") {
        temp_dir dir{"tempo_tools"};
        auto script = dir.path / "crash.sh";
        make_executable_file(script, "#!/bin/sh\necho '{\"log\":\"about to fail\"}'\nexit 7\n");

        process_executor executor{"sh " + script.string()};
        dispatch_sink sink{};
        auto ctx = sink.context(dir.path, {"./a.js"});

        CHECK_THROWS_AS(executor.run(ctx), executor_transport_error);
        REQUIRE(sink.logs().size() == 1U);
        CHECK(sink.logs()[0].log == "about to fail");
    }

    TEST_CASE("011: process executor runs end to end through the coordinator", "[011][tools][executor]") {
        temp_dir dir{"tempo_tools"};
        auto script = dir.path / "run.sh";
        make_executable_file(script, "#!/bin/sh\necho '" + std::string{records_line} + "'\n");

        std::ostringstream out{};
        host_logger logger{out};
        std::vector<job> jobs{job{
                .executor_name = "sh",
                .executor = std::make_shared<process_executor>("sh " + script.string()),
                .builds = {build_artifact{.builder_name = "noop", .root = dir.path, .files = {"./bench/a.js"}}}}};

        auto result = run_jobs(jobs, {}, logger);
        REQUIRE(result.contains("bench/a.js"));
        const auto& r = result.at("bench/a.js").at(0);
        CHECK(r.builder == "noop");
        CHECK(r.executor == "sh");
    }

}  // namespace tempo::test
