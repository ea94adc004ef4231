#include "file_matcher.hpp"
#include <filesystem>
#include <algorithm>
#include <spdlog/spdlog.h>
#include "time_resolver.hpp"
#include "src/util/parallel.hpp"
#include "src/util/util.hpp"

namespace seiscat {
    namespace fs = std::filesystem;

    FileMatcher::FileMatcher(std::string directory, std::shared_ptr<const CompiledPattern> pattern, bool derive_time)
        : directory_(std::move(directory)), pattern_(std::move(pattern)), derive_time_(derive_time) {}

    std::vector<std::string> FileMatcher::get_files() const {
        std::vector<std::string> file_list;
        spdlog::info("Searching for files in {}", directory_);

        std::error_code ec;
        if (!fs::is_directory(directory_, ec)) {
            spdlog::warn("{} is not a directory, no files collected", directory_);
            return file_list;
        }

        auto it = fs::recursive_directory_iterator(directory_, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            spdlog::error("Failed to open directory {}: {}", directory_, ec.message());
            return file_list;
        }
        for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) {
                spdlog::error("Directory walk error under {}: {}", directory_, ec.message());
                break;
            }
            std::error_code entry_ec;
            // skip symbolic links, a linked directory is never descended
            if (it->is_symlink(entry_ec)) {
                if (it->is_directory(entry_ec)) it.disable_recursion_pending();
                continue;
            }
            if (!it->is_regular_file(entry_ec)) continue;
            file_list.push_back(it->path().string());
        }
        if (ec) {
            spdlog::error("Directory walk stopped early under {}: {}", directory_, ec.message());
        }

        std::sort(file_list.begin(), file_list.end());
        spdlog::info("Finish. {} files found in {}", file_list.size(), directory_);
        return file_list;
    }

    std::vector<Record> FileMatcher::match_files(unsigned threads) {
        return match_files(get_files(), threads);
    }

    std::vector<Record> FileMatcher::match_files(const std::vector<std::string>& file_paths, unsigned threads) {
        spdlog::info("Start file pattern matching...");
        double d1 = util::get_micro_timestamp();

        auto results = parallel_map(file_paths, threads, [this](const std::string& p) { return match_file(p); });

        std::vector<Record> all_results;
        all_results.reserve(results.size());
        for (auto& r : results) {
            if (r) all_results.push_back(std::move(*r));
        }
        double d2 = util::get_micro_timestamp();
        spdlog::info("{} files matched. time_cost={}", all_results.size(), (d2 - d1) / 1000.0);
        matched_files_ = all_results;
        return all_results;
    }

    std::optional<Record> FileMatcher::match_file(const std::string& file_path) const {
        if (!pattern_) return std::nullopt;
        boost::smatch m;
        try {
            if (!boost::regex_match(file_path, m, pattern_->regex)) return std::nullopt;
        } catch (const std::runtime_error& e) {
            // boost throws on pathological backtracking
            spdlog::error("An error occurred while processing the file {}: {}", file_path, e.what());
            return std::nullopt;
        }

        Record record;
        record.path = file_path;
        for (const auto& group : pattern_->groups) {
            const auto& sub = m[group];
            if (sub.matched) record.fields[group] = sub.str();
        }
        if (derive_time_) record.time = gen_time_from_fields(record.fields);
        return record;
    }
} // namespace seiscat
