#pragma once
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include "field_registry.hpp"
#include "record.hpp"

namespace seiscat {

    // Walks a directory tree and turns every path the compiled pattern
    // accepts into a Record.
    class FileMatcher {
    public:
        FileMatcher(std::string directory, std::shared_ptr<const CompiledPattern> pattern, bool derive_time = true);
        ~FileMatcher() {};

        // regular files below the directory, symlinks skipped, sorted
        std::vector<std::string> get_files() const;
        // walks the directory first
        std::vector<Record> match_files(unsigned threads = 1);
        std::vector<Record> match_files(const std::vector<std::string>& file_paths, unsigned threads = 1);
        // nullopt when the path does not match
        std::optional<Record> match_file(const std::string& file_path) const;

        const std::vector<Record>& matched_files() const { return matched_files_; }
        void set_derive_time(bool derive) { derive_time_ = derive; }
        bool derive_time() const { return derive_time_; }

    private:
        std::string directory_;
        std::shared_ptr<const CompiledPattern> pattern_;
        bool derive_time_;
        std::vector<Record> matched_files_;
    };
} // namespace seiscat
