#pragma once

#include "ui/RegionTypes.h"
#include <array>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace TerminalMouse::UI {

struct IndexEntry {
    std::string id;
    RegionBounds bounds;
};

/**
 * @brief Abstract spatial index over region rectangles
 *
 * Candidates() must return every region whose bounds contain the point
 * (it may return more); the registry filters and ranks them. Implementations
 * are rebuilt from scratch on every structural change.
 */
class ISpatialIndex {
public:
    virtual ~ISpatialIndex() = default;

    virtual void Rebuild(const RegionBounds& root, const std::vector<IndexEntry>& entries) = 0;
    virtual const std::vector<std::string>& Candidates(int x, int y) const = 0;
    virtual void Clear() = 0;

    virtual int Depth() const = 0;
    virtual std::size_t NodeCount() const = 0;
};

// Quadtree node: a leaf or exactly four quadrant children
class QuadTreeNode {
public:
    explicit QuadTreeNode(const RegionBounds& bounds);

    bool IsLeaf() const { return !m_children[0]; }
    const RegionBounds& GetBounds() const { return m_bounds; }
    const std::vector<std::string>& GetIds() const { return m_ids; }

    // Build this node from the entries overlapping it, subdividing as allowed
    void Build(const std::vector<const IndexEntry*>& entries, int depth, int maxDepth, int minRegionsPerNode);

    // Leaf whose bounds contain the point; the point must be inside this node
    const QuadTreeNode* FindLeafAt(int x, int y) const;

    int Depth() const;
    std::size_t NodeCount() const;

private:
    // Top-left, top-right, bottom-left, bottom-right
    std::array<RegionBounds, 4> Quadrants() const;

    RegionBounds m_bounds;
    std::vector<std::string> m_ids;
    std::array<std::unique_ptr<QuadTreeNode>, 4> m_children;
};

/**
 * @brief Quadtree ISpatialIndex
 *
 * The root covers the terminal and holds every region, including regions
 * lying partly or wholly outside it. A node splits into quadrants while it
 * holds more than minRegionsPerNode regions and maxDepth is not reached; a
 * region is stored in every node it overlaps. Points outside the root yield
 * every region.
 */
class QuadTreeIndex : public ISpatialIndex {
public:
    QuadTreeIndex(int maxDepth, int minRegionsPerNode);

    void Rebuild(const RegionBounds& root, const std::vector<IndexEntry>& entries) override;
    const std::vector<std::string>& Candidates(int x, int y) const override;
    void Clear() override;

    int Depth() const override;
    std::size_t NodeCount() const override;

private:
    int m_maxDepth;
    int m_minRegionsPerNode;
    std::unique_ptr<QuadTreeNode> m_root;
};

} // namespace TerminalMouse::UI
