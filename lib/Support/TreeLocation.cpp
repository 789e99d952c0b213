//===----------------------------------------------------------------------===//
///
/// @file
/// Implements tree-location rendering helpers.
///
//===----------------------------------------------------------------------===//

#include "tsbind/Frontend/TreeLocation.h"

namespace tsbind
{

TreeLocation TreeLocation::member(const std::string& key) const
{
    return TreeLocation{file, path + "." + key};
}

TreeLocation TreeLocation::element(const std::size_t index) const
{
    return TreeLocation{file, path + "[" + std::to_string(index) + "]"};
}

std::string TreeLocation::str() const
{
    return file + ":" + path;
}

}  // namespace tsbind
