#include "tree/TestTree.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "common/UniqueIdGenerator.h"

#include <algorithm>
#include <functional>
#include <stdexcept>

namespace TEB {

TestTree::TestTree() : root_(std::make_unique<TreeNode>("", TreeNodeKind::Root, "", "")) {}

void TestTree::startNewGeneration(std::vector<std::string> workspaceRoots) {
    generation_ = UniqueIdGenerator::generateGeneration();
    workspaceRoots_.clear();
    for (const auto &root : workspaceRoots) {
        workspaceRoots_.push_back(PathUtils::normalizeFsPath(root));
    }
    locationIndex_.clear();
    LOG_DEBUG("TestTree: Generation {} over {} workspace root(s)", generation_, workspaceRoots_.size());
}

std::string TestTree::stripGeneration(const std::string &id) {
    const auto separator = id.find(':');
    return separator == std::string::npos ? id : id.substr(separator + 1);
}

const TreeNode *TestTree::findById(const std::string &id) const {
    auto it = nodesById_.find(id);
    return it == nodesById_.end() ? nullptr : it->second;
}

const TreeNode *TestTree::getForLocation(const std::string &location) const {
    auto it = locationIndex_.find(location);
    if (it == locationIndex_.end()) {
        return nullptr;
    }
    return findById(it->second);
}

const TreeNode *TestTree::testItemForLocation(const Location &location, const std::string &title) const {
    const std::string key = location.file + ":" + std::to_string(location.line);
    const TreeNode *first = getForLocation(key);
    if (!first || first->label() == title) {
        return first;
    }
    for (int ordinal = 1;; ++ordinal) {
        const TreeNode *candidate = getForLocation(key + "#" + std::to_string(ordinal));
        if (!candidate) {
            break;
        }
        if (candidate->label() == title) {
            return candidate;
        }
    }
    return first;
}

const NodeMetadata *TestTree::metadata(const std::string &id) const {
    auto it = metadata_.find(id);
    return it == metadata_.end() ? nullptr : &it->second;
}

std::optional<std::string> TestTree::workspaceRootFor(const std::string &path) const {
    for (const auto &root : workspaceRoots_) {
        if (PathUtils::isSameOrDescendant(root, path)) {
            return root;
        }
    }
    return std::nullopt;
}

std::vector<const TreeNode *> TestTree::collectTestsInside(const TreeNode &node) const {
    std::vector<const TreeNode *> tests;
    std::function<void(const TreeNode &)> visit = [&](const TreeNode &current) {
        if (current.kind() == TreeNodeKind::Test) {
            tests.push_back(&current);
        }
        for (const auto &child : current.children()) {
            visit(*child);
        }
    };
    visit(node);
    return tests;
}

bool TestTree::isAncestorOf(const TreeNode &ancestor, const TreeNode &node) {
    for (const TreeNode *current = node.parent(); current; current = current->parent()) {
        if (current == &ancestor) {
            return true;
        }
    }
    return false;
}

TreeNode &TestTree::addNode(TreeNode &parent, TreeNodeKind kind, const std::string &location, const std::string &label,
                            const std::string &path) {
    std::string id = idForLocation(location);
    // A relocated node keeps the id it was created with, which may equal this one
    for (int suffix = 1; nodesById_.count(id); ++suffix) {
        id = idForLocation(location) + "~" + std::to_string(suffix);
    }
    auto node = std::make_unique<TreeNode>(id, kind, label, path);
    node->parent_ = &parent;
    TreeNode &added = *node;
    parent.children_.push_back(std::move(node));

    nodesById_[id] = &added;
    metadata_[id] = NodeMetadata{location, generation_, {}, {}};
    locationIndex_[location] = id;
    return added;
}

void TestTree::removeNode(const std::string &id) {
    TreeNode *node = mutableNode(id);
    if (!node || !node->parent_) {
        return;
    }
    unindex(*node);
    auto &siblings = node->parent_->children_;
    siblings.erase(std::remove_if(siblings.begin(), siblings.end(),
                                  [node](const std::unique_ptr<TreeNode> &child) { return child.get() == node; }),
                   siblings.end());
}

void TestTree::unindex(TreeNode &node) {
    for (auto &child : node.children_) {
        unindex(*child);
    }
    auto meta = metadata_.find(node.id());
    if (meta != metadata_.end()) {
        auto indexed = locationIndex_.find(meta->second.location);
        if (indexed != locationIndex_.end() && indexed->second == node.id()) {
            locationIndex_.erase(indexed);
        }
        metadata_.erase(meta);
    }
    nodesById_.erase(node.id());
}

void TestTree::relocateNode(const std::string &id, const std::string &location) {
    NodeMetadata &meta = mutableMetadata(id);
    auto indexed = locationIndex_.find(meta.location);
    if (indexed != locationIndex_.end() && indexed->second == id) {
        locationIndex_.erase(indexed);
    }
    meta.location = location;
    locationIndex_[location] = id;
}

TreeNode *TestTree::mutableNode(const std::string &id) {
    auto it = nodesById_.find(id);
    return it == nodesById_.end() ? nullptr : it->second;
}

NodeMetadata &TestTree::mutableMetadata(const std::string &id) {
    auto it = metadata_.find(id);
    if (it == metadata_.end()) {
        throw std::logic_error("No metadata for tree node " + id);
    }
    return it->second;
}

}  // namespace TEB
