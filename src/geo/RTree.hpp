#pragma once

#include "geo/GeoBBox.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>
#include <vector>

namespace efb::geo {

// 只读 R 树，STR (Sort-Tile-Recursive) 批量构建
//
// 条目在构建后不可增删，数据变化时整体重建。
template<typename T>
class RTree {
public:
    struct Entry {
        GeoBBox envelope;
        T value;
    };

    static constexpr std::size_t DEFAULT_NODE_CAPACITY = 16;

    RTree() = default;

    explicit RTree(std::vector<Entry> entries, std::size_t nodeCapacity = DEFAULT_NODE_CAPACITY)
        : entries_(std::move(entries)), capacity_(std::max<std::size_t>(nodeCapacity, 2)) {
        bulkLoad();
    }

    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    // 访问所有与 box 相交的条目
    template<typename Visitor>
    void query(const GeoBBox& box, Visitor&& visit) const {
        if (levels_.empty()) {
            return;
        }
        visitNode(levels_.size() - 1, 0, box, visit);
    }

    [[nodiscard]] std::vector<T> locateIntersecting(const GeoBBox& box) const {
        std::vector<T> result;
        query(box, [&result](const T& value) { result.push_back(value); });
        return result;
    }

    // 包围盒包含该点的条目
    [[nodiscard]] std::vector<T> locateAt(double lon, double lat) const {
        return locateIntersecting(GeoBBox::fromPoint(lon, lat));
    }

private:
    struct Node {
        GeoBBox envelope;
        std::size_t first{0};   // 下层（或条目）起始下标
        std::size_t count{0};
    };

    std::vector<Entry> entries_;
    std::vector<std::vector<Node>> levels_;  // levels_[0] 为叶子层
    std::size_t capacity_{DEFAULT_NODE_CAPACITY};

    // 按 STR 排序 items 并返回分组 [first, count)
    template<typename Item, typename EnvelopeOf>
    std::vector<std::pair<std::size_t, std::size_t>> pack(std::vector<Item>& items, EnvelopeOf envelopeOf) const {
        const std::size_t n = items.size();
        const auto leafCount = (n + capacity_ - 1) / capacity_;
        const auto sliceCount = static_cast<std::size_t>(std::ceil(std::sqrt(static_cast<double>(leafCount))));
        const auto sliceSize = sliceCount * capacity_;

        std::sort(items.begin(), items.end(), [&](const Item& a, const Item& b) {
            return envelopeOf(a).centerLon() < envelopeOf(b).centerLon();
        });

        std::vector<std::pair<std::size_t, std::size_t>> groups;
        for (std::size_t sliceStart = 0; sliceStart < n; sliceStart += sliceSize) {
            const auto sliceEnd = std::min(n, sliceStart + sliceSize);
            std::sort(items.begin() + sliceStart, items.begin() + sliceEnd, [&](const Item& a, const Item& b) {
                return envelopeOf(a).centerLat() < envelopeOf(b).centerLat();
            });
            for (std::size_t start = sliceStart; start < sliceEnd; start += capacity_) {
                groups.emplace_back(start, std::min(capacity_, sliceEnd - start));
            }
        }
        return groups;
    }

    template<typename Item, typename EnvelopeOf>
    static std::vector<Node> makeNodes(const std::vector<Item>& items,
                                       const std::vector<std::pair<std::size_t, std::size_t>>& groups,
                                       EnvelopeOf envelopeOf) {
        std::vector<Node> nodes;
        nodes.reserve(groups.size());
        for (const auto& [first, count] : groups) {
            GeoBBox envelope = envelopeOf(items[first]);
            for (std::size_t i = first + 1; i < first + count; ++i) {
                envelope = envelope.unite(envelopeOf(items[i]));
            }
            nodes.push_back(Node{envelope, first, count});
        }
        return nodes;
    }

    void bulkLoad() {
        levels_.clear();
        if (entries_.empty()) {
            return;
        }

        const auto entryEnvelope = [](const Entry& e) -> const GeoBBox& { return e.envelope; };
        const auto nodeEnvelope = [](const Node& n) -> const GeoBBox& { return n.envelope; };

        levels_.push_back(makeNodes(entries_, pack(entries_, entryEnvelope), entryEnvelope));

        while (levels_.back().size() > 1) {
            auto& below = levels_.back();
            auto groups = pack(below, nodeEnvelope);
            auto parents = makeNodes(below, groups, nodeEnvelope);
            levels_.push_back(std::move(parents));
        }
    }

    template<typename Visitor>
    void visitNode(std::size_t level, std::size_t index, const GeoBBox& box, Visitor& visit) const {
        const Node& node = levels_[level][index];
        if (!node.envelope.intersects(box)) {
            return;
        }

        if (level == 0) {
            for (std::size_t i = node.first; i < node.first + node.count; ++i) {
                if (entries_[i].envelope.intersects(box)) {
                    visit(entries_[i].value);
                }
            }
            return;
        }

        for (std::size_t i = node.first; i < node.first + node.count; ++i) {
            visitNode(level - 1, i, box, visit);
        }
    }
};

} // namespace efb::geo
