#pragma once

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace TEB {

enum class TreeNodeKind { Root, Workspace, Folder, File, Suite, Test };

const char *toString(TreeNodeKind kind);

/**
 * @brief 0-based line/column range, end exclusive
 */
struct SourceRange {
    int startLine = 0;
    int startColumn = 0;
    int endLine = 0;
    int endColumn = 0;

    bool operator==(const SourceRange &other) const = default;

    /**
     * @brief Whole-line range for a 1-based runner line
     */
    static SourceRange forLine(int line) {
        return SourceRange{line - 1, 0, line, 0};
    }
};

/**
 * @brief Externally visible test tree node
 *
 * Only TestTree and TreeReconciler mutate nodes. Do not keep pointers to a
 * node across a reconciliation pass; look it up again by id.
 */
class TreeNode {
public:
    TreeNode(std::string id, TreeNodeKind kind, std::string label, std::string path)
        : id_(std::move(id)), kind_(kind), label_(std::move(label)), path_(std::move(path)) {}

    const std::string &id() const {
        return id_;
    }

    TreeNodeKind kind() const {
        return kind_;
    }

    const std::string &label() const {
        return label_;
    }

    /**
     * @brief File system path of the folder, file or file containing the entry
     */
    const std::string &path() const {
        return path_;
    }

    const std::optional<SourceRange> &range() const {
        return range_;
    }

    const std::set<std::string> &tags() const {
        return tags_;
    }

    bool canResolveChildren() const {
        return canResolveChildren_;
    }

    const TreeNode *parent() const {
        return parent_;
    }

    const std::vector<std::unique_ptr<TreeNode>> &children() const {
        return children_;
    }

    const TreeNode *findChild(const std::string &id) const;

private:
    friend class TestTree;
    friend class TreeReconciler;

    std::string id_;
    TreeNodeKind kind_;
    std::string label_;
    std::string path_;
    std::optional<SourceRange> range_;
    std::set<std::string> tags_;
    bool canResolveChildren_ = false;
    TreeNode *parent_ = nullptr;
    std::vector<std::unique_ptr<TreeNode>> children_;
};

}  // namespace TEB
