//===----------------------------------------------------------------------===//
///
/// @file
/// Location primitives for nodes of serialized declaration trees.
///
//===----------------------------------------------------------------------===//
#ifndef TSBIND_FRONTEND_TREE_LOCATION_H
#define TSBIND_FRONTEND_TREE_LOCATION_H

#include <cstddef>
#include <string>

namespace tsbind
{

/// @brief Identifies one node inside a serialized declaration tree.
struct TreeLocation
{
    /// @brief Path to the input file.
    std::string file;

    /// @brief Node path from the document root, e.g. `$.statements[2].type`.
    std::string path{"$"};

    /// @brief Returns the location of a named member of this node.
    /// @param[in] key Member key.
    /// @return Child location.
    [[nodiscard]] TreeLocation member(const std::string& key) const;

    /// @brief Returns the location of an array element of this node.
    /// @param[in] index Element index.
    /// @return Child location.
    [[nodiscard]] TreeLocation element(std::size_t index) const;

    /// @brief Formats this location as a human-readable string.
    /// @return Formatted location text.
    [[nodiscard]] std::string str() const;
};

}  // namespace tsbind

#endif  // TSBIND_FRONTEND_TREE_LOCATION_H
