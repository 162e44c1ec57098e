#include "ui/SpatialIndex.h"
#include <algorithm>

namespace TerminalMouse::UI {

// ============================================================================
// QuadTreeNode
// ============================================================================

QuadTreeNode::QuadTreeNode(const RegionBounds& bounds)
    : m_bounds(bounds)
{
}

std::array<RegionBounds, 4> QuadTreeNode::Quadrants() const {
    const int halfWidth = m_bounds.width / 2;
    const int halfHeight = m_bounds.height / 2;
    const int midX = m_bounds.x + halfWidth;
    const int midY = m_bounds.y + halfHeight;
    const int restWidth = m_bounds.width - halfWidth;
    const int restHeight = m_bounds.height - halfHeight;

    return {{
        {m_bounds.x, m_bounds.y, halfWidth, halfHeight},
        {midX, m_bounds.y, restWidth, halfHeight},
        {m_bounds.x, midY, halfWidth, restHeight},
        {midX, midY, restWidth, restHeight}
    }};
}

void QuadTreeNode::Build(const std::vector<const IndexEntry*>& entries, int depth, int maxDepth,
                         int minRegionsPerNode) {
    m_ids.clear();
    m_ids.reserve(entries.size());
    for (const IndexEntry* entry : entries) {
        m_ids.push_back(entry->id);
    }

    const bool canSplit = m_bounds.width >= 2 && m_bounds.height >= 2;
    if (!canSplit || depth >= maxDepth || static_cast<int>(entries.size()) <= minRegionsPerNode) {
        return;
    }

    const auto quadrants = Quadrants();
    for (std::size_t i = 0; i < quadrants.size(); ++i) {
        std::vector<const IndexEntry*> overlapping;
        for (const IndexEntry* entry : entries) {
            if (entry->bounds.Intersects(quadrants[i])) {
                overlapping.push_back(entry);
            }
        }
        m_children[i] = std::make_unique<QuadTreeNode>(quadrants[i]);
        m_children[i]->Build(overlapping, depth + 1, maxDepth, minRegionsPerNode);
    }
}

const QuadTreeNode* QuadTreeNode::FindLeafAt(int x, int y) const {
    const QuadTreeNode* node = this;
    while (!node->IsLeaf()) {
        const QuadTreeNode* next = nullptr;
        for (const auto& child : node->m_children) {
            if (child->m_bounds.Contains(x, y)) {
                next = child.get();
                break;
            }
        }
        if (!next) {
            // Quadrants tile the parent, so this only happens for a point outside it
            return node;
        }
        node = next;
    }
    return node;
}

int QuadTreeNode::Depth() const {
    if (IsLeaf()) {
        return 0;
    }
    int deepest = 0;
    for (const auto& child : m_children) {
        deepest = std::max(deepest, child->Depth());
    }
    return deepest + 1;
}

std::size_t QuadTreeNode::NodeCount() const {
    std::size_t count = 1;
    if (!IsLeaf()) {
        for (const auto& child : m_children) {
            count += child->NodeCount();
        }
    }
    return count;
}

// ============================================================================
// QuadTreeIndex
// ============================================================================

QuadTreeIndex::QuadTreeIndex(int maxDepth, int minRegionsPerNode)
    : m_maxDepth(maxDepth)
    , m_minRegionsPerNode(minRegionsPerNode)
{
}

void QuadTreeIndex::Rebuild(const RegionBounds& root, const std::vector<IndexEntry>& entries) {
    std::vector<const IndexEntry*> all;
    all.reserve(entries.size());
    for (const IndexEntry& entry : entries) {
        all.push_back(&entry);
    }

    m_root = std::make_unique<QuadTreeNode>(root);
    m_root->Build(all, 0, m_maxDepth, m_minRegionsPerNode);
}

const std::vector<std::string>& QuadTreeIndex::Candidates(int x, int y) const {
    static const std::vector<std::string> kEmpty;
    if (!m_root) {
        return kEmpty;
    }
    if (!m_root->GetBounds().Contains(x, y)) {
        return m_root->GetIds();
    }
    return m_root->FindLeafAt(x, y)->GetIds();
}

void QuadTreeIndex::Clear() {
    m_root.reset();
}

int QuadTreeIndex::Depth() const {
    return m_root ? m_root->Depth() : 0;
}

std::size_t QuadTreeIndex::NodeCount() const {
    return m_root ? m_root->NodeCount() : 0;
}

} // namespace TerminalMouse::UI
