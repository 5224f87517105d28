#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <limits>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include <fixtree/core/errors.hpp>

namespace fixtree::core {

  struct TreeConfig {
    size_t levels = 20;
    // Reject initial elements beyond capacity instead of building an oversized leaf layer.
    bool enforce_capacity = true;
  };

  template <class T>
  struct MerkleProof {
    // Sibling of the path node at each level, leaf level first.
    std::vector<T> path_elements;
    // 0 when the path node is the left child at that level, 1 when it is the right child.
    std::vector<uint8_t> path_index;
  };

  /**
   * Fixed-depth binary Merkle tree over elements of type T.
   *
   * Layer 0 holds the leaves in index order, layer levels() holds the root.
   * Missing right children are padded with the empty-subtree value of their
   * level. Combine must be a pure callable T(const T&, const T&); arguments are
   * always passed in (left, right) order.
   *
   * Not thread-safe: callers serialise access.
   */
  template <class T, class Combine = std::function<T(const T&, const T&)>>
  class MerkleTree {
    public:
      using value_type = T;
      using combine_type = Combine;
      using proof_type = MerkleProof<T>;

      /**
       * Build a tree from initial leaves. The leaves are taken by value, so the
       * caller's container is never aliased.
       * Throws TreeConfigError if config.levels is too large for size_t and
       * TreeFullError if elements exceed capacity while config.enforce_capacity is set.
       */
      MerkleTree(TreeConfig config, std::vector<T> elements, Combine combine, T zero_element)
        : config_(config), combine_(std::move(combine)) {
        check_levels(config_.levels);
        capacity_ = size_t{2} << config_.levels;
        if (config_.enforce_capacity && elements.size() > capacity_) throw TreeFullError();

        zeros_.reserve(levels() + 1);
        zeros_.push_back(std::move(zero_element));
        for (size_t level = 1; level <= levels(); ++level) {
          zeros_.push_back(combine_(zeros_[level - 1], zeros_[level - 1]));
        }

        layers_.resize(levels() + 1);
        layers_[0] = std::move(elements);
        rebuild();
      }

      MerkleTree(size_t levels, std::vector<T> elements, Combine combine, T zero_element)
        : MerkleTree(TreeConfig{levels}, std::move(elements), std::move(combine), std::move(zero_element)) {}

      // Numeric trees default to addition with a zero leaf of T{}.
      template <class U = T,
                class = std::enable_if_t<std::is_arithmetic_v<U> && std::is_constructible_v<Combine, std::plus<U>>>>
      explicit MerkleTree(size_t levels, std::vector<T> elements = {})
        : MerkleTree(TreeConfig{levels}, std::move(elements), Combine(std::plus<U>{}), T{}) {}

      size_t levels() const { return config_.levels; }
      size_t capacity() const { return capacity_; }
      size_t size() const { return layers_[0].size(); }
      bool empty() const { return layers_[0].empty(); }

      const std::vector<T>& elements() const { return layers_[0]; }
      const std::vector<T>& zeros() const { return zeros_; }
      const T& zero_element() const { return zeros_[0]; }

      const std::vector<T>& layer(size_t level) const {
        if (level > levels()) throw IndexOutOfBoundsError("Layer index out of bounds", level);
        return layers_[level];
      }

      T root() const {
        const auto& top = layers_[levels()];
        return top.empty() ? zeros_[levels()] : top.front();
      }

      /**
       * Append one leaf and recompute its path to the root.
       * Returns the index the leaf was stored at. Throws TreeFullError when full.
       */
      size_t insert(T element) {
        if (size() >= capacity_) throw TreeFullError();
        const size_t index = size();
        update(index, std::move(element));
        return index;
      }

      /**
       * Append a batch of leaves and rebuild every internal layer.
       * Capacity is checked before anything is appended. Taken by value, so
       * passing elements() is safe.
       */
      void bulk_insert(std::vector<T> elements) {
        if (size() > capacity_ || elements.size() > capacity_ - size()) throw TreeFullError();
        layers_[0].insert(layers_[0].end(), std::make_move_iterator(elements.begin()),
                          std::make_move_iterator(elements.end()));
        rebuild();
      }

      /**
       * Overwrite the leaf at index, or append when index == size().
       * Only the path from that leaf to the root is recomputed.
       */
      void update(size_t index, T element) {
        if (index > size() || index >= capacity_) {
          throw IndexOutOfBoundsError("Insert index out of bounds", index);
        }
        store(layers_[0], index, std::move(element));
        for (size_t level = 1; level <= levels(); ++level) {
          index >>= 1;
          store(layers_[level], index, combine_children(level - 1, index));
        }
      }

      /**
       * Sibling path for the leaf at index. Only leaves below 1 << levels() are
       * covered by root(); the path of a leaf past that span recombines to the
       * second node of the top layer instead.
       */
      proof_type proof(size_t index) const {
        if (index >= size()) throw IndexOutOfBoundsError("Index out of bounds", index);
        proof_type path;
        path.path_elements.reserve(levels());
        path.path_index.reserve(levels());
        for (size_t level = 0; level < levels(); ++level) {
          const auto& nodes = layers_[level];
          const size_t sibling = index ^ 1;
          path.path_index.push_back(static_cast<uint8_t>(index % 2));
          path.path_elements.push_back(sibling < nodes.size() ? nodes[sibling] : zeros_[level]);
          index >>= 1;
        }
        return path;
      }

      std::optional<size_t> index_of(const T& element) const {
        const auto& leaves = layers_[0];
        auto it = std::find(leaves.begin(), leaves.end(), element);
        if (it == leaves.end()) return std::nullopt;
        return static_cast<size_t>(it - leaves.begin());
      }

    private:
      static void check_levels(size_t levels) {
        if (levels >= static_cast<size_t>(std::numeric_limits<size_t>::digits - 1)) {
          throw TreeConfigError("levels is too large for size_t capacity");
        }
      }

      static void store(std::vector<T>& nodes, size_t index, T value) {
        if (index == nodes.size()) {
          nodes.push_back(std::move(value));
        } else {
          nodes[index] = std::move(value);
        }
      }

      T combine_children(size_t child_level, size_t index) const {
        const auto& children = layers_[child_level];
        const size_t right = index * 2 + 1;
        return combine_(children[index * 2], right < children.size() ? children[right] : zeros_[child_level]);
      }

      void rebuild() {
        for (size_t level = 1; level <= levels(); ++level) {
          auto& nodes = layers_[level];
          const size_t count = (layers_[level - 1].size() + 1) / 2;
          nodes.clear();
          nodes.reserve(count);
          for (size_t i = 0; i < count; ++i) nodes.push_back(combine_children(level - 1, i));
        }
      }

      TreeConfig config_{};
      size_t capacity_ = 0;
      Combine combine_;
      std::vector<T> zeros_;
      std::vector<std::vector<T>> layers_;
  };
}
