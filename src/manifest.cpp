#include "annomics/manifest.hpp"

#include "annomics/log.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace annomics {

    namespace detail {

        static void walk(const fs::path& root, const fs::path& dir, file_manifest& manifest) {
            std::error_code ec{};
            fs::directory_iterator it{dir, fs::directory_options::skip_permission_denied, ec};
            if (ec) {
                log::debug("skipping unreadable directory {}: {}", dir.string(), ec.message());
                return;
            }

            std::vector<fs::directory_entry> entries{};
            for (; it != fs::directory_iterator{}; it.increment(ec)) {
                if (ec) {
                    log::debug("stopped listing {}: {}", dir.string(), ec.message());
                    break;
                }
                entries.push_back(*it);
            }
            std::ranges::sort(entries, {}, [](const fs::directory_entry& e) { return e.path().filename(); });

            for (const auto& entry : entries) {
                if (entry.is_directory(ec) && !ec) {
                    // symlinked directories are not followed
                    if (!entry.is_symlink(ec)) {
                        walk(root, entry.path(), manifest);
                    }
                    continue;
                }
                if (!entry.is_regular_file(ec) || ec) {
                    continue;
                }

                auto rel = entry.path().lexically_relative(root).generic_string();
                switch (classify_output_file(entry.path())) {
                    case file_category::annotation:
                        manifest.annotation_files.push_back(std::move(rel));
                        break;
                    case file_category::summary:
                        manifest.summary_files.push_back(std::move(rel));
                        break;
                    case file_category::combined:
                        manifest.combined_files.push_back(std::move(rel));
                        break;
                    case file_category::plot:
                        manifest.plot_files.push_back(std::move(rel));
                        break;
                    case file_category::ignored:
                        break;
                }
            }
        }

    }  // namespace detail

    file_category classify_output_file(const fs::path& file) {
        auto name = file.filename().string();
        auto ext = file.extension().string();

        if (ext == ".tsv"sv) {
            if (name.find("summary"sv) != std::string::npos) {
                return file_category::summary;
            }
            if (name.find("combined"sv) != std::string::npos) {
                return file_category::combined;
            }
            return file_category::annotation;
        }
        if (ext == ".png"sv || ext == ".pdf"sv || ext == ".svg"sv) {
            return file_category::plot;
        }
        return file_category::ignored;
    }

    file_manifest scan_output_directory(const fs::path& directory) {
        file_manifest manifest{};
        std::error_code ec{};
        if (!fs::is_directory(directory, ec)) {
            return manifest;
        }
        detail::walk(directory, directory, manifest);
        return manifest;
    }

}  // namespace annomics
