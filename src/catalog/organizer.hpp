#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "record.hpp"

namespace seiscat {

    struct FileGroup {
        std::vector<std::string> key;   // one rendered value per label
        std::vector<Record> files;

        // bare value for a single label, values joined by '|' otherwise
        std::string label() const;
    };

    using FileGroups = std::vector<FileGroup>;

    enum class OutputType {
        DICT,   // leaves hold full records
        PATH    // leaves hold paths only
    };

    struct VirtualArrayNode {
        std::string key;
        std::vector<VirtualArrayNode> children;     // first-seen order
        std::vector<Record> records;                // leaf level, DICT output
        std::vector<std::string> paths;             // leaf level, PATH output

        const VirtualArrayNode* child(const std::string& child_key) const;
        VirtualArrayNode& child_or_insert(const std::string& child_key);
    };

    struct VirtualArray {
        OutputType output{OutputType::DICT};
        std::vector<std::string> label_order;
        VirtualArrayNode root;

        // walk down one key per level, nullptr if any level is missing
        const VirtualArrayNode* find(const std::vector<std::string>& keys) const;
        std::vector<std::string> keys() const;
        nlohmann::json to_json() const;
    };

    // Partition by the values at labels. Groups come out in first-seen order
    // after a stable sort of the input by sort_labels. Records missing a label
    // are left out.
    FileGroups group_by_labels(const std::vector<Record>& files, const std::vector<std::string>& labels,
                               const std::vector<std::string>& sort_labels = {});
    const FileGroup* find_group(const FileGroups& groups, const std::vector<std::string>& key);
    // [{"key": [...], "files": [...]}, ...] in group order
    nlohmann::json groups_to_json(const FileGroups& groups);

    // "dict" or "path"; anything else falls back to dict with a diagnostic
    OutputType parse_output_type(const std::string& output_type);
    VirtualArray organize_by_labels(const std::vector<Record>& files, const std::vector<std::string>& label_order,
                                    OutputType output = OutputType::DICT);
} // namespace seiscat
