#pragma once

#include "reporter/ReporterEvents.h"
#include "tree/TreeNode.h"
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace TEB {

/**
 * @brief Reconciliation data kept beside a node, keyed by node id
 */
struct NodeMetadata {
    // Generation-free identity key: a path for folders and files, an entry id for suites and tests
    std::string location;
    std::string generation;
    std::vector<std::string> titlePath;
    // Config files contributing this file or entry
    std::set<std::string> configFiles;
};

/**
 * @brief Persistent test tree shown to the user
 *
 * Node ids are "<generation>:<location>". Starting a new generation turns all
 * existing nodes stale; the next reconciliation pass prunes them. The tree is
 * read by everyone and mutated only by TreeReconciler.
 */
class TestTree {
public:
    TestTree();

    /**
     * @brief Begin a full rebuild over @p workspaceRoots
     */
    void startNewGeneration(std::vector<std::string> workspaceRoots);

    const std::string &generation() const {
        return generation_;
    }

    const std::vector<std::string> &workspaceRoots() const {
        return workspaceRoots_;
    }

    /**
     * @brief Invisible root; its children are the workspace nodes
     */
    const TreeNode &root() const {
        return *root_;
    }

    std::string idForLocation(const std::string &location) const {
        return generation_ + ":" + location;
    }

    static std::string stripGeneration(const std::string &id);

    const TreeNode *findById(const std::string &id) const;

    /**
     * @brief Current-generation node for a folder/file path or an entry id
     */
    const TreeNode *getForLocation(const std::string &location) const;

    /**
     * @brief Test node at a runner location, disambiguated by title among same-line entries
     */
    const TreeNode *testItemForLocation(const Location &location, const std::string &title) const;

    const NodeMetadata *metadata(const std::string &id) const;

    /**
     * @brief Workspace root containing @p path, if any
     */
    std::optional<std::string> workspaceRootFor(const std::string &path) const;

    std::vector<const TreeNode *> collectTestsInside(const TreeNode &node) const;

    static bool isAncestorOf(const TreeNode &ancestor, const TreeNode &node);

    size_t size() const {
        return nodesById_.size();
    }

private:
    friend class TreeReconciler;

    TreeNode &addNode(TreeNode &parent, TreeNodeKind kind, const std::string &location, const std::string &label,
                      const std::string &path);
    void removeNode(const std::string &id);
    void relocateNode(const std::string &id, const std::string &location);
    TreeNode *mutableNode(const std::string &id);
    NodeMetadata &mutableMetadata(const std::string &id);
    void unindex(TreeNode &node);

    std::string generation_;
    std::vector<std::string> workspaceRoots_;
    std::unique_ptr<TreeNode> root_;
    std::unordered_map<std::string, TreeNode *> nodesById_;
    std::unordered_map<std::string, NodeMetadata> metadata_;
    // Current generation only
    std::unordered_map<std::string, std::string> locationIndex_;
};

}  // namespace TEB
