#include "tree/TreeReconciler.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <map>
#include <set>
#include <sstream>

namespace TEB {

const char *toString(TreeDelta::Kind kind) {
    switch (kind) {
    case TreeDelta::Kind::Add:
        return "add";
    case TreeDelta::Kind::Remove:
        return "remove";
    case TreeDelta::Kind::Relocate:
        return "relocate";
    case TreeDelta::Kind::UpdateRange:
        return "update-range";
    case TreeDelta::Kind::UpdateTags:
        return "update-tags";
    case TreeDelta::Kind::UpdateDetails:
        return "update-details";
    }
    return "unknown";
}

namespace {

bool isEntryKind(TreeNodeKind kind) {
    return kind == TreeNodeKind::Suite || kind == TreeNodeKind::Test;
}

std::string titleKey(TreeNodeKind kind, const std::string &path, const std::vector<std::string> &titlePath,
                     const std::string &title) {
    std::string key = std::string(toString(kind)) + '\n' + path;
    for (const auto &segment : titlePath) {
        key += '\n' + segment;
    }
    key += '\n' + title;
    return key;
}

DesiredNode &findOrAdd(std::vector<DesiredNode> &nodes, TreeNodeKind kind, const std::string &location,
                       const std::string &label, const std::string &path) {
    for (auto &node : nodes) {
        if (node.location == location) {
            return node;
        }
    }
    DesiredNode node;
    node.kind = kind;
    node.location = location;
    node.label = label;
    node.path = path;
    nodes.push_back(std::move(node));
    return nodes.back();
}

void mergeEntries(std::vector<DesiredNode> &target, const std::vector<Entry> &entries, const std::string &projectName,
                  const std::string &configFile) {
    for (const auto &entry : entries) {
        const TreeNodeKind kind = entry.kind == EntryKind::Test ? TreeNodeKind::Test : TreeNodeKind::Suite;
        DesiredNode &node = findOrAdd(target, kind, entry.id, entry.title, entry.file);
        node.range = SourceRange::forLine(entry.line);
        node.titlePath = entry.titlePath;
        if (!projectName.empty()) {
            node.tags.insert(projectName);
        }
        node.configFiles.insert(configFile);
        mergeEntries(node.children, entry.children, projectName, configFile);
    }
}

DesiredNode withoutChildren(const DesiredNode &node) {
    DesiredNode copy;
    copy.kind = node.kind;
    copy.location = node.location;
    copy.label = node.label;
    copy.path = node.path;
    copy.range = node.range;
    copy.tags = node.tags;
    copy.titlePath = node.titlePath;
    copy.configFiles = node.configFiles;
    return copy;
}

std::vector<std::string> splitPath(const std::string &relative) {
    std::vector<std::string> segments;
    std::stringstream stream(relative);
    std::string segment;
    while (std::getline(stream, segment, '/')) {
        if (!segment.empty() && segment != ".") {
            segments.push_back(segment);
        }
    }
    return segments;
}

void diffLevel(const TestTree &tree, const TreeNode &parent, const std::vector<DesiredNode> &desired,
               std::vector<TreeDelta> &deltas) {
    std::map<std::string, const TreeNode *> existingByLocation;
    std::multimap<std::string, const TreeNode *> existingByTitle;
    for (const auto &child : parent.children()) {
        const NodeMetadata *meta = tree.metadata(child->id());
        if (!meta || meta->generation != tree.generation()) {
            deltas.push_back(TreeDelta{TreeDelta::Kind::Remove, child->id(), {}});
            continue;
        }
        existingByLocation[meta->location] = child.get();
        if (isEntryKind(child->kind())) {
            existingByTitle.emplace(titleKey(child->kind(), child->path(), meta->titlePath, child->label()),
                                    child.get());
        }
    }

    std::vector<std::pair<const TreeNode *, const DesiredNode *>> matched;
    std::set<const TreeNode *> claimed;

    // Entries keep their node while file, kind and title path stay; lines may move
    std::vector<const DesiredNode *> unmatched;
    for (const auto &wanted : desired) {
        const TreeNode *pick = nullptr;
        if (isEntryKind(wanted.kind)) {
            auto range = existingByTitle.equal_range(titleKey(wanted.kind, wanted.path, wanted.titlePath, wanted.label));
            for (auto it = range.first; it != range.second; ++it) {
                if (claimed.count(it->second)) {
                    continue;
                }
                if (!pick || tree.metadata(it->second->id())->location == wanted.location) {
                    pick = it->second;
                }
            }
        }
        if (pick) {
            matched.emplace_back(pick, &wanted);
            claimed.insert(pick);
        } else {
            unmatched.push_back(&wanted);
        }
    }

    // Same location: containers, and entries whose title changed
    for (const DesiredNode *wanted : unmatched) {
        auto it = existingByLocation.find(wanted->location);
        if (it != existingByLocation.end() && !claimed.count(it->second) && it->second->kind() == wanted->kind) {
            matched.emplace_back(it->second, wanted);
            claimed.insert(it->second);
            continue;
        }
        deltas.push_back(TreeDelta{TreeDelta::Kind::Add, parent.id(), *wanted});
    }

    for (const auto &[location, node] : existingByLocation) {
        if (!claimed.count(node)) {
            deltas.push_back(TreeDelta{TreeDelta::Kind::Remove, node->id(), {}});
        }
    }

    for (const auto &[node, wanted] : matched) {
        const NodeMetadata *meta = tree.metadata(node->id());
        if (meta->location != wanted->location) {
            deltas.push_back(TreeDelta{TreeDelta::Kind::Relocate, node->id(), withoutChildren(*wanted)});
        }
        if (node->range() != wanted->range) {
            deltas.push_back(TreeDelta{TreeDelta::Kind::UpdateRange, node->id(), withoutChildren(*wanted)});
        }
        // std::set compares as an unordered collection of names
        if (node->tags() != wanted->tags) {
            deltas.push_back(TreeDelta{TreeDelta::Kind::UpdateTags, node->id(), withoutChildren(*wanted)});
        }
        if (node->label() != wanted->label || meta->titlePath != wanted->titlePath ||
            meta->configFiles != wanted->configFiles) {
            deltas.push_back(TreeDelta{TreeDelta::Kind::UpdateDetails, node->id(), withoutChildren(*wanted)});
        }
        diffLevel(tree, *node, wanted->children, deltas);
    }
}

int applyPhase(TreeDelta::Kind kind) {
    switch (kind) {
    case TreeDelta::Kind::Remove:
        return 0;
    case TreeDelta::Kind::Relocate:
        return 1;
    case TreeDelta::Kind::Add:
        return 3;
    default:
        return 2;
    }
}

}  // namespace

std::vector<DesiredNode> TreeReconciler::buildDesiredTree(const std::vector<std::string> &workspaceRoots,
                                                          const std::vector<const TestModel *> &models) {
    std::vector<DesiredNode> roots;
    for (const auto &root : workspaceRoots) {
        findOrAdd(roots, TreeNodeKind::Workspace, root, PathUtils::basename(root), root);
    }

    for (const TestModel *model : models) {
        const std::string &configFile = model->config().configFile;
        for (const TestProject *project : model->enabledProjects()) {
            for (const auto &fileEntry : project->files) {
                const std::string &file = fileEntry.first;
                const TestFile &testFile = fileEntry.second;
                auto rootIt = std::find_if(roots.begin(), roots.end(), [&](const DesiredNode &root) {
                    return PathUtils::isDescendant(root.location, file);
                });
                if (rootIt == roots.end()) {
                    LOG_TRACE("TreeReconciler: {} is outside the workspace, not shown", file);
                    continue;
                }

                DesiredNode *current = &*rootIt;
                std::string folder = rootIt->location;
                for (const auto &segment : splitPath(PathUtils::relative(rootIt->location, PathUtils::dirname(file)))) {
                    folder += "/" + segment;
                    current = &findOrAdd(current->children, TreeNodeKind::Folder, folder, segment, folder);
                }

                DesiredNode &fileNode =
                    findOrAdd(current->children, TreeNodeKind::File, file, PathUtils::basename(file), file);
                if (!project->name.empty()) {
                    fileNode.tags.insert(project->name);
                }
                fileNode.configFiles.insert(configFile);
                mergeEntries(fileNode.children, testFile.entries, project->name, configFile);
            }
        }
    }
    return roots;
}

std::vector<TreeDelta> TreeReconciler::diff(const TestTree &tree, const std::vector<DesiredNode> &desiredRoots) {
    std::vector<TreeDelta> deltas;
    diffLevel(tree, tree.root(), desiredRoots, deltas);
    return deltas;
}

void TreeReconciler::apply(const std::vector<TreeDelta> &deltas) {
    std::vector<const TreeDelta *> ordered;
    ordered.reserve(deltas.size());
    for (const auto &delta : deltas) {
        ordered.push_back(&delta);
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const TreeDelta *a, const TreeDelta *b) {
        return applyPhase(a->kind) < applyPhase(b->kind);
    });

    for (const TreeDelta *delta : ordered) {
        if (delta->kind == TreeDelta::Kind::Remove) {
            tree_.removeNode(delta->nodeId);
            continue;
        }

        if (delta->kind == TreeDelta::Kind::Add) {
            TreeNode *parent = delta->nodeId.empty() ? tree_.root_.get() : tree_.mutableNode(delta->nodeId);
            if (!parent) {
                LOG_WARN("TreeReconciler: Parent {} vanished, skipping {}", delta->nodeId, delta->node.location);
                continue;
            }
            createSubtree(*parent, delta->node);
            continue;
        }

        TreeNode *node = tree_.mutableNode(delta->nodeId);
        if (!node) {
            continue;
        }
        switch (delta->kind) {
        case TreeDelta::Kind::Relocate:
            tree_.relocateNode(node->id(), delta->node.location);
            break;
        case TreeDelta::Kind::UpdateRange:
            node->range_ = delta->node.range;
            break;
        case TreeDelta::Kind::UpdateTags:
            node->tags_ = delta->node.tags;
            break;
        case TreeDelta::Kind::UpdateDetails: {
            node->label_ = delta->node.label;
            NodeMetadata &meta = tree_.mutableMetadata(node->id());
            meta.titlePath = delta->node.titlePath;
            meta.configFiles = delta->node.configFiles;
            break;
        }
        default:
            break;
        }
    }
}

TreeNode &TreeReconciler::createSubtree(TreeNode &parent, const DesiredNode &desired) {
    TreeNode &node = tree_.addNode(parent, desired.kind, desired.location, desired.label, desired.path);
    node.range_ = desired.range;
    node.tags_ = desired.tags;
    node.canResolveChildren_ = desired.kind == TreeNodeKind::Folder || desired.kind == TreeNodeKind::File;

    NodeMetadata &meta = tree_.mutableMetadata(node.id());
    meta.titlePath = desired.titlePath;
    meta.configFiles = desired.configFiles;

    for (const auto &child : desired.children) {
        createSubtree(node, child);
    }
    return node;
}

ReconcileResult TreeReconciler::reconcile(const std::vector<const TestModel *> &models) {
    ReconcileResult result;
    result.deltas = diff(tree_, buildDesiredTree(tree_.workspaceRoots(), models));
    for (const auto &delta : result.deltas) {
        if (delta.kind == TreeDelta::Kind::Add) {
            ++result.added;
        } else if (delta.kind == TreeDelta::Kind::Remove) {
            ++result.removed;
        } else {
            ++result.updated;
        }
    }
    apply(result.deltas);
    LOG_DEBUG("TreeReconciler: {} added, {} removed, {} updated", result.added, result.removed, result.updated);
    return result;
}

}  // namespace TEB
