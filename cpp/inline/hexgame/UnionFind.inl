#include "hexgame/UnionFind.hpp"

namespace hexgame {

template <typename Derived, std::totally_ordered Index>
Index UnionFind<Derived, Index>::find_root(Index item) const {
  Index root = item;
  for (std::optional<Index> next = derived().get_parent(root); next;
       next = derived().get_parent(root)) {
    root = *next;
  }

  // path compression
  while (item != root) {
    Index next = *derived().get_parent(item);
    derived().set_parent(item, root);
    item = next;
  }
  return root;
}

template <typename Derived, std::totally_ordered Index>
void UnionFind<Derived, Index>::merge(Index item1, Index item2) {
  Index root1 = find_root(item1);
  Index root2 = find_root(item2);
  if (root1 == root2) return;

  if (root1 > root2) {
    derived().set_parent(root2, root1);
  } else {
    derived().set_parent(root1, root2);
  }
}

template <typename Derived, std::totally_ordered Index>
bool UnionFind<Derived, Index>::is_in_same_set(Index item1, Index item2) const {
  return find_root(item1) == find_root(item2);
}

}  // namespace hexgame
