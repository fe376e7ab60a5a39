#pragma once

#include "model/TestModel.h"
#include "tree/TestTree.h"
#include <set>
#include <string>
#include <vector>

namespace TEB {

/**
 * @brief Wanted shape of one tree node, computed from the models
 */
struct DesiredNode {
    TreeNodeKind kind = TreeNodeKind::Folder;
    std::string location;
    std::string label;
    std::string path;
    std::optional<SourceRange> range;
    std::set<std::string> tags;
    std::vector<std::string> titlePath;
    std::set<std::string> configFiles;
    std::vector<DesiredNode> children;
};

struct TreeDelta {
    enum class Kind {
        Add,           // nodeId is the parent; node holds the whole subtree to create
        Remove,        // nodeId and its subtree go away
        Relocate,      // entry moved: new location key, identity kept
        UpdateRange,
        UpdateTags,
        UpdateDetails  // label, title path, contributing configs
    };

    Kind kind = Kind::Add;
    std::string nodeId;
    DesiredNode node;

    bool isStructural() const {
        return kind == Kind::Add || kind == Kind::Remove;
    }
};

const char *toString(TreeDelta::Kind kind);

struct ReconcileResult {
    std::vector<TreeDelta> deltas;
    size_t added = 0;
    size_t removed = 0;
    size_t updated = 0;

    size_t structuralChanges() const {
        return added + removed;
    }
};

/**
 * @brief Projects the models onto the persistent TestTree with minimal mutation
 *
 * A pass is computed completely by diff() before apply() touches the tree, so
 * it never applies partially. Per level, existing children are matched to
 * wanted ones by location key (path, or "<file>:<line>[#n]" for entries);
 * entries left over on both sides are then matched by file, kind and title
 * path so a test whose line moved keeps its node. Unmatched and stale
 * generation nodes are removed, unmatched wanted nodes are added, and matched
 * nodes only get their changed attributes updated.
 *
 * Only files below a workspace root are shown; entries of disabled projects
 * are not.
 */
class TreeReconciler {
public:
    explicit TreeReconciler(TestTree &tree) : tree_(tree) {}

    ReconcileResult reconcile(const std::vector<const TestModel *> &models);

    static std::vector<DesiredNode> buildDesiredTree(const std::vector<std::string> &workspaceRoots,
                                                     const std::vector<const TestModel *> &models);

    static std::vector<TreeDelta> diff(const TestTree &tree, const std::vector<DesiredNode> &desiredRoots);

    void apply(const std::vector<TreeDelta> &deltas);

private:
    TreeNode &createSubtree(TreeNode &parent, const DesiredNode &desired);

    TestTree &tree_;
};

}  // namespace TEB
