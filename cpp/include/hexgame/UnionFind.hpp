#pragma once

#include <concepts>
#include <optional>

namespace hexgame {

/*
 * Disjoint-set forest with path compression.
 *
 * Instead of union-by-rank or union-by-size, merge() always makes the larger of the two roots the
 * parent of the smaller one. Edges are laid out at the high end of the index space, so they tend to
 * stay roots, and no rank/size bookkeeping needs to be stored.
 *
 * UnionFind makes no assumption on how parents are stored. Derived must provide:
 *
 *   std::optional<Index> get_parent(Index) const;  // std::nullopt for a root
 *   void set_parent(Index item, Index parent) const;
 *
 * set_parent() is const because find_root() compresses paths: connectivity queries rewrite parent
 * links without changing set membership, so Derived is expected to keep its parents in mutable
 * storage.
 */
template <typename Derived, std::totally_ordered Index>
class UnionFind {
 public:
  Index find_root(Index item) const;
  void merge(Index item1, Index item2);
  bool is_in_same_set(Index item1, Index item2) const;

 private:
  const Derived& derived() const { return static_cast<const Derived&>(*this); }
};

}  // namespace hexgame

#include "inline/hexgame/UnionFind.inl"
