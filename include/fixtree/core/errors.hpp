#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace fixtree::core {

  // Appending would take the leaf layer past capacity.
  struct TreeFullError : std::runtime_error {
    TreeFullError() : std::runtime_error("Tree is full") {}
    using std::runtime_error::runtime_error;
  };

  struct TreeConfigError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
  };

  struct HashError : std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  class IndexOutOfBoundsError : public std::out_of_range {
    public:
      IndexOutOfBoundsError(const std::string& context, size_t index)
        : std::out_of_range(context + ": " + std::to_string(index)), index_(index) {}

      size_t index() const { return index_; }

    private:
      size_t index_;
  };
}
