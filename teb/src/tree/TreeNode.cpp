#include "tree/TreeNode.h"

namespace TEB {

const char *toString(TreeNodeKind kind) {
    switch (kind) {
    case TreeNodeKind::Root:
        return "root";
    case TreeNodeKind::Workspace:
        return "workspace";
    case TreeNodeKind::Folder:
        return "folder";
    case TreeNodeKind::File:
        return "file";
    case TreeNodeKind::Suite:
        return "suite";
    case TreeNodeKind::Test:
        return "test";
    }
    return "unknown";
}

const TreeNode *TreeNode::findChild(const std::string &id) const {
    for (const auto &child : children_) {
        if (child->id() == id) {
            return child.get();
        }
    }
    return nullptr;
}

}  // namespace TEB
