#include "utils.hpp"

namespace annomics::test {
    using namespace std::string_view_literals;

    TEST_CASE("004: output file classification", "[004][manifest]") {
        CHECK(classify_output_file("sample_annotated.tsv") == file_category::annotation);
        CHECK(classify_output_file("sample_summary.tsv") == file_category::summary);
        CHECK(classify_output_file("combined_annotations.tsv") == file_category::combined);
        // "summary" is checked before "combined"
        CHECK(classify_output_file("combined_summary.tsv") == file_category::summary);
        CHECK(classify_output_file("nested/dir/plot.png") == file_category::plot);
        CHECK(classify_output_file("plot.pdf") == file_category::plot);
        CHECK(classify_output_file("plot.svg") == file_category::plot);
        CHECK(classify_output_file("readme.txt") == file_category::ignored);
        CHECK(classify_output_file("table.TSV") == file_category::ignored);
        CHECK(classify_output_file("summary") == file_category::ignored);
    }

    TEST_CASE("004: scanning a populated output directory", "[004][manifest]") {
        detail::temp_dir temp{"annomics_manifest"};
        for (auto name : {"x.tsv"sv, "x_summary.tsv"sv, "combined_x.tsv"sv, "p.png"sv, "notes.txt"sv}) {
            detail::write_file(temp.path / name, "");
        }

        auto manifest = scan_output_directory(temp.path);
        CHECK(manifest.annotation_files == std::vector<std::string>{"x.tsv"});
        CHECK(manifest.summary_files == std::vector<std::string>{"x_summary.tsv"});
        CHECK(manifest.combined_files == std::vector<std::string>{"combined_x.tsv"});
        CHECK(manifest.plot_files == std::vector<std::string>{"p.png"});
        CHECK(manifest.total() == 4U);
        CHECK_FALSE(manifest.empty());
    }

    TEST_CASE("004: scanning recurses in lexicographic order", "[004][manifest]") {
        detail::temp_dir temp{"annomics_manifest_nested"};
        detail::write_file(temp.path / "b_annotated.tsv", "");
        detail::write_file(temp.path / "a_annotated.tsv", "");
        detail::write_file(temp.path / "plots" / "z.pdf", "");
        detail::write_file(temp.path / "plots" / "deep" / "a.svg", "");
        detail::write_file(temp.path / "c.png", "");

        auto manifest = scan_output_directory(temp.path);
        CHECK(manifest.annotation_files == std::vector<std::string>{"a_annotated.tsv", "b_annotated.tsv"});
        CHECK(manifest.plot_files == std::vector<std::string>{"c.png", "plots/deep/a.svg", "plots/z.pdf"});

        // identical on a second pass
        CHECK(scan_output_directory(temp.path).plot_files == manifest.plot_files);
    }

    TEST_CASE("004: missing or empty directories give an empty manifest", "[004][manifest]") {
        detail::temp_dir temp{"annomics_manifest_empty"};

        auto empty = scan_output_directory(temp.path);
        CHECK(empty.empty());
        CHECK(empty.total() == 0U);

        auto missing = scan_output_directory(temp.path / "never-created");
        CHECK(missing.empty());

        detail::write_file(temp.path / "file.tsv", "");
        CHECK(scan_output_directory(temp.path / "file.tsv").empty());
    }

    TEST_CASE("004: dangling links are skipped", "[004][manifest]") {
        detail::temp_dir temp{"annomics_manifest_dangling"};
        detail::write_file(temp.path / "kept_annotated.tsv", "");
        std::filesystem::create_symlink(temp.path / "gone_annotated.tsv", temp.path / "dangling_annotated.tsv");
        std::filesystem::create_directory_symlink(temp.path / "gone", temp.path / "gone_plots");

        file_manifest manifest{};
        REQUIRE_NOTHROW(manifest = scan_output_directory(temp.path));
        CHECK(manifest.annotation_files == std::vector<std::string>{"kept_annotated.tsv"});
        CHECK(manifest.total() == 1U);
    }

    TEST_CASE("004: unreadable subdirectories are skipped", "[004][manifest]") {
        if (::geteuid() == 0) {
            SKIP("permission bits are not enforced for root");
        }

        detail::temp_dir temp{"annomics_manifest_unreadable"};
        detail::write_file(temp.path / "a_annotated.tsv", "");
        detail::write_file(temp.path / "locked" / "hidden_annotated.tsv", "");
        detail::write_file(temp.path / "plots" / "p.png", "");

        namespace fs = std::filesystem;
        fs::permissions(temp.path / "locked", fs::perms::none);

        file_manifest manifest{};
        CHECK_NOTHROW(manifest = scan_output_directory(temp.path));

        fs::permissions(temp.path / "locked", fs::perms::owner_all);

        CHECK(manifest.annotation_files == std::vector<std::string>{"a_annotated.tsv"});
        CHECK(manifest.plot_files == std::vector<std::string>{"plots/p.png"});
    }

}  // namespace annomics::test
