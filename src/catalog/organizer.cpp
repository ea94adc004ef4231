#include "organizer.hpp"
#include <map>
#include <optional>
#include <algorithm>
#include <spdlog/spdlog.h>

namespace seiscat {

    std::string FileGroup::label() const {
        std::string out;
        for (std::size_t i = 0; i < key.size(); ++i) {
            if (i) out += "|";
            out += key[i];
        }
        return out;
    }

    // nullopt if the record lacks any of the labels
    static std::optional<std::vector<std::string>> key_of(const Record& r, const std::vector<std::string>& labels) {
        std::vector<std::string> key;
        key.reserve(labels.size());
        for (const auto& label : labels) {
            auto v = r.get(label);
            if (!v) return std::nullopt;
            key.push_back(format_value(*v));
        }
        return key;
    }

    FileGroups group_by_labels(const std::vector<Record>& files, const std::vector<std::string>& labels,
                               const std::vector<std::string>& sort_labels) {
        FileGroups groups;
        if (labels.empty()) {
            spdlog::error("Grouping needs at least one label");
            return groups;
        }

        // stable sort by sort_labels, missing values first
        std::vector<const Record*> ordered;
        ordered.reserve(files.size());
        for (const auto& r : files) ordered.push_back(&r);
        if (!sort_labels.empty()) {
            std::stable_sort(ordered.begin(), ordered.end(), [&](const Record* a, const Record* b) {
                for (const auto& label : sort_labels) {
                    auto va = a->get(label);
                    auto vb = b->get(label);
                    if (!va && !vb) continue;
                    if (!va) return true;
                    if (!vb) return false;
                    if (value_less(*va, *vb)) return true;
                    if (value_less(*vb, *va)) return false;
                }
                return false;
            });
        }

        std::map<std::vector<std::string>, std::size_t> index;
        std::size_t skipped = 0;
        for (const Record* r : ordered) {
            auto key = key_of(*r, labels);
            if (!key) {
                ++skipped;
                continue;
            }
            auto it = index.find(*key);
            if (it == index.end()) {
                index.emplace(*key, groups.size());
                groups.push_back(FileGroup{*key, {*r}});
            } else {
                groups[it->second].files.push_back(*r);
            }
        }
        if (skipped) spdlog::warn("{} files skipped while grouping, missing one of the labels", skipped);
        for (const auto& g : groups) spdlog::debug("group {}: {} files", g.label(), g.files.size());
        spdlog::info("Grouped {} files into {} groups", files.size() - skipped, groups.size());
        return groups;
    }

    const FileGroup* find_group(const FileGroups& groups, const std::vector<std::string>& key) {
        for (const auto& g : groups) {
            if (g.key == key) return &g;
        }
        return nullptr;
    }

    nlohmann::json groups_to_json(const FileGroups& groups) {
        // values may contain the label separator, so keys stay arrays
        nlohmann::json j = nlohmann::json::array();
        for (const auto& g : groups) {
            j.push_back({{"key", g.key}, {"files", records_to_json(g.files)}});
        }
        return j;
    }

    const VirtualArrayNode* VirtualArrayNode::child(const std::string& child_key) const {
        for (const auto& c : children) {
            if (c.key == child_key) return &c;
        }
        return nullptr;
    }

    VirtualArrayNode& VirtualArrayNode::child_or_insert(const std::string& child_key) {
        for (auto& c : children) {
            if (c.key == child_key) return c;
        }
        children.push_back(VirtualArrayNode{child_key, {}, {}, {}});
        return children.back();
    }

    const VirtualArrayNode* VirtualArray::find(const std::vector<std::string>& keys) const {
        const VirtualArrayNode* node = &root;
        for (const auto& k : keys) {
            node = node->child(k);
            if (!node) return nullptr;
        }
        return node;
    }

    std::vector<std::string> VirtualArray::keys() const {
        std::vector<std::string> out;
        for (const auto& c : root.children) out.push_back(c.key);
        return out;
    }

    static nlohmann::json node_to_json(const VirtualArrayNode& node, std::size_t depth, std::size_t max_depth,
                                       OutputType output) {
        if (depth == max_depth) {
            if (output == OutputType::PATH) return node.paths;
            return records_to_json(node.records);
        }
        nlohmann::json j = nlohmann::json::object();
        for (const auto& c : node.children) j[c.key] = node_to_json(c, depth + 1, max_depth, output);
        return j;
    }

    nlohmann::json VirtualArray::to_json() const {
        return node_to_json(root, 0, label_order.size(), output);
    }

    OutputType parse_output_type(const std::string& output_type) {
        if (output_type == "path") return OutputType::PATH;
        if (output_type != "dict") {
            spdlog::error("Output type '{}' should be 'path' or 'dict', using 'dict'.", output_type);
        }
        return OutputType::DICT;
    }

    VirtualArray organize_by_labels(const std::vector<Record>& files, const std::vector<std::string>& label_order,
                                    OutputType output) {
        VirtualArray va;
        va.output = output;
        va.label_order = label_order;

        std::size_t skipped = 0;
        for (const auto& r : files) {
            auto key = key_of(r, label_order);
            if (!key) {
                ++skipped;
                continue;
            }
            VirtualArrayNode* node = &va.root;
            for (const auto& k : *key) node = &node->child_or_insert(k);
            if (output == OutputType::PATH) node->paths.push_back(r.path);
            else node->records.push_back(r);
        }
        if (skipped) spdlog::warn("{} files skipped while organizing, missing one of the labels", skipped);
        return va;
    }
} // namespace seiscat
