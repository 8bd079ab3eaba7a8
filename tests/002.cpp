#include "utils.hpp"

namespace annomics::test {
    using namespace std::string_view_literals;
    using Catch::Matchers::ContainsSubstring;

    TEST_CASE("002: job spec defaults", "[002][job]") {
        auto spec = build_job_spec(R"({"input_files":"a.bed","genome_build":"hg38","output_directory":"out"})"sv);

        CHECK(spec.input_files == std::vector<std::string>{"a.bed"});
        CHECK(spec.genome == "hg38");
        CHECK(spec.output_directory == std::filesystem::path{"out"});
        CHECK_FALSE(spec.sample_name);
        CHECK(spec.include_cpg);
        CHECK(spec.include_genic);
        CHECK(spec.plot_formats == std::vector<plot_format>{plot_format::png, plot_format::pdf});
        CHECK_FALSE(spec.combine);
        CHECK(spec.pattern == "*.bed");
        CHECK(spec.timeout == std::chrono::seconds{300});
    }

    TEST_CASE("002: input file normalization", "[002][job]") {
        SECTION("comma-joined string") {
            auto spec = build_job_spec(
                    R"({"input_files":" a.bed, b.bed ,,c.bed ","genome_build":"mm10","output_directory":"o"})"sv);
            CHECK(spec.input_files == std::vector<std::string>{"a.bed", "b.bed", "c.bed"});
        }

        SECTION("array elements are split and trimmed the same way") {
            auto spec = build_job_spec(
                    R"({"input_files":["x.bed"," y.bed,z.bed",""],"genome_build":"mm10","output_directory":"o"})"sv);
            CHECK(spec.input_files == std::vector<std::string>{"x.bed", "y.bed", "z.bed"});
        }

        SECTION("nothing left after normalization") {
            CHECK_THROWS_AS(
                    build_job_spec(R"({"input_files":" , ","genome_build":"mm10","output_directory":"o"})"sv),
                    validation_error);
            CHECK_THROWS_AS(
                    build_job_spec(R"({"input_files":[],"genome_build":"mm10","output_directory":"o"})"sv),
                    validation_error);
        }
    }

    TEST_CASE("002: explicit options are carried through", "[002][job]") {
        auto spec = build_job_spec(R"({
            "input_files": ["s1.bed", "s2.bed"],
            "genome_build": "dm6",
            "output_directory": "/tmp/results",
            "sample_name": "  fly  ",
            "include_cpg": false,
            "plot_formats": ["SVG", "png", "svg"],
            "combine_analysis": true,
            "pattern": "*.narrowPeak",
            "timeout": 42,
            "unrelated_key": 1
        })"sv);

        CHECK(spec.sample_name == "fly");
        CHECK_FALSE(spec.include_cpg);
        CHECK(spec.include_genic);
        CHECK(spec.plot_formats == std::vector<plot_format>{plot_format::svg, plot_format::png});
        CHECK(spec.combine);
        CHECK(spec.pattern == "*.narrowPeak");
        CHECK(spec.timeout == std::chrono::seconds{42});
    }

    TEST_CASE("002: validation failures", "[002][job]") {
        SECTION("required fields") {
            CHECK_THROWS_WITH(
                    build_job_spec(R"({"genome_build":"hg38","output_directory":"o"})"sv),
                    ContainsSubstring("input_files"));
            CHECK_THROWS_WITH(
                    build_job_spec(R"({"input_files":"a.bed","output_directory":"o"})"sv),
                    ContainsSubstring("genome_build"));
            CHECK_THROWS_WITH(
                    build_job_spec(R"({"input_files":"a.bed","genome_build":"hg38"})"sv),
                    ContainsSubstring("output_directory"));
            CHECK_THROWS_AS(build_job_spec(""sv), validation_error);
        }

        SECTION("unsupported genome lists the alternatives") {
            CHECK_THROWS_WITH(
                    build_job_spec(R"({"input_files":"a.bed","genome_build":"hg37","output_directory":"o"})"sv),
                    ContainsSubstring("Unsupported genome build 'hg37'") && ContainsSubstring("hg38"));
        }

        SECTION("bad plot formats") {
            CHECK_THROWS_WITH(
                    build_job_spec(
                            R"({"input_files":"a.bed","genome_build":"hg38","output_directory":"o","plot_formats":["tiff"]})"sv),
                    ContainsSubstring("tiff"));
            CHECK_THROWS_AS(
                    build_job_spec(
                            R"({"input_files":"a.bed","genome_build":"hg38","output_directory":"o","plot_formats":[]})"sv),
                    validation_error);
        }

        SECTION("non-positive timeout") {
            CHECK_THROWS_AS(
                    build_job_spec(
                            R"({"input_files":"a.bed","genome_build":"hg38","output_directory":"o","timeout":0})"sv),
                    validation_error);
            CHECK_THROWS_AS(
                    build_job_spec(
                            R"({"input_files":"a.bed","genome_build":"hg38","output_directory":"o","timeout":-5})"sv),
                    validation_error);
        }

        SECTION("timeout above the upper bound") {
            CHECK_THROWS_AS(
                    build_job_spec(
                            R"({"input_files":"a.bed","genome_build":"hg38","output_directory":"o","timeout":4294968})"sv),
                    validation_error);
            CHECK_THROWS_AS(
                    build_job_spec(
                            R"({"input_files":"a.bed","genome_build":"hg38","output_directory":"o","timeout":9223372036854775807})"sv),
                    validation_error);

            auto longest = build_job_spec(
                    R"({"input_files":"a.bed","genome_build":"hg38","output_directory":"o","timeout":604800})"sv);
            CHECK(longest.timeout == max_job_timeout);
        }

        SECTION("wrong JSON types") {
            CHECK_THROWS_AS(
                    build_job_spec(R"({"input_files":7,"genome_build":"hg38","output_directory":"o"})"sv),
                    validation_error);
            CHECK_THROWS_AS(
                    build_job_spec(
                            R"({"input_files":"a.bed","genome_build":"hg38","output_directory":"o","timeout":"soon"})"sv),
                    validation_error);
            CHECK_THROWS_AS(build_job_spec("[1,2]"sv), validation_error);
            CHECK_THROWS_AS(build_job_spec("{not json"sv), validation_error);
        }
    }

    TEST_CASE("002: command line follows the annotation script contract", "[002][job][supervisor]") {
        runtime_config runtime{.rscript = "Rscript", .script = "/app/scripts/annotate_genomic_segments.R"};

        SECTION("defaults omit optional flags") {
            auto spec = build_job_spec(
                    R"({"input_files":["a.bed","b.bed"],"genome_build":"hg19","output_directory":"out"})"sv);
            CHECK(build_command_line(runtime, spec) ==
                  std::vector<std::string>{
                          "Rscript",
                          "/app/scripts/annotate_genomic_segments.R",
                          "-i",
                          "a.bed,b.bed",
                          "-g",
                          "hg19",
                          "-o",
                          "out",
                          "--formats",
                          "png,pdf"});
        }

        SECTION("every optional flag") {
            auto spec = build_job_spec(R"({
                "input_files": "a.bed",
                "genome_build": "rn6",
                "output_directory": "out",
                "sample_name": "rat",
                "plot_formats": ["svg"],
                "combine_analysis": true,
                "pattern": "*.bed.gz"
            })"sv);
            CHECK(build_command_line(runtime, spec) ==
                  std::vector<std::string>{
                          "Rscript",
                          "/app/scripts/annotate_genomic_segments.R",
                          "-i",
                          "a.bed",
                          "-g",
                          "rn6",
                          "-o",
                          "out",
                          "--formats",
                          "svg",
                          "-n",
                          "rat",
                          "--pattern",
                          "*.bed.gz",
                          "--combine"});
        }

        SECTION("input order is preserved") {
            auto spec = build_job_spec(
                    R"({"input_files":"z.bed,a.bed,m.bed","genome_build":"hg38","output_directory":"out"})"sv);
            auto cmd = build_command_line(runtime, spec);
            REQUIRE(cmd.size() > 3U);
            CHECK(cmd[3] == "z.bed,a.bed,m.bed");
            CHECK(utils::split_trimmed(cmd[3], ',') == spec.input_files);
        }
    }

}  // namespace annomics::test
