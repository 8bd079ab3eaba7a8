#include "utils.hpp"

namespace annomics::test {
    using namespace std::string_view_literals;

    TEST_CASE("005: bed line classification by column count", "[005][bed]") {
        CHECK(classify_bed_line("chr1\t100\t200"sv) == bed_format::bed3);
        CHECK(classify_bed_line("chr1\t100\t200\tpeak\t0"sv) == bed_format::bed3);
        CHECK(classify_bed_line("chr1\t100\t200\tpeak\t0\t+"sv) == bed_format::bed6);
        CHECK(classify_bed_line("chr1\t100\t200\tn\t0\t+\t100\t200\t0\t2\t10,20\t0,80"sv) == bed_format::bed12);
        CHECK(classify_bed_line("chr1\t100"sv) == bed_format::unknown);
        CHECK(classify_bed_line(""sv) == bed_format::unknown);
        CHECK(to_string(bed_format::bed12) == "bed12"sv);
    }

    TEST_CASE("005: bed format detection skips comments and blank lines", "[005][bed]") {
        detail::temp_dir temp{"annomics_bed"};

        auto bed6 = temp.path / "peaks.bed";
        detail::write_file(bed6, "# track name=peaks\n\nchr1\t10\t20\tp1\t5\t+\nchr2\t30\t40\n");
        CHECK(detect_bed_format(bed6) == bed_format::bed6);

        auto bed3 = temp.path / "regions.bed";
        detail::write_file(bed3, "chr1\t10\t20\r\n");
        CHECK(detect_bed_format(bed3) == bed_format::bed3);

        auto comments_only = temp.path / "empty.bed";
        detail::write_file(comments_only, "# nothing here\n");
        CHECK(detect_bed_format(comments_only) == bed_format::unknown);

        CHECK(detect_bed_format(temp.path / "missing.bed") == bed_format::unknown);
    }

    TEST_CASE("005: bed preview returns the first data lines", "[005][bed]") {
        detail::temp_dir temp{"annomics_bed_preview"};

        auto file = temp.path / "many.bed";
        std::string content{"# header\n"};
        for (int i = 0; i < 8; ++i) {
            content += "chr1\t" + std::to_string(i * 100) + "\t" + std::to_string(i * 100 + 50) + "\r\n";
        }
        detail::write_file(file, content);

        auto preview = read_bed_preview(file);
        REQUIRE(preview.size() == 5U);
        CHECK(preview.front() == "chr1\t0\t50");
        CHECK(preview.back() == "chr1\t400\t450");

        CHECK(read_bed_preview(file, 2U).size() == 2U);
        CHECK(read_bed_preview(temp.path / "missing.bed").empty());
    }

}  // namespace annomics::test
