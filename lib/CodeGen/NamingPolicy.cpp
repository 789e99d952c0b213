//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements shared naming-policy helpers for binding generation.
///
//===----------------------------------------------------------------------===//

#include "tsbind/CodeGen/NamingPolicy.h"

#include <cctype>
#include <string>
#include <unordered_set>

#include "llvm/ADT/SetVector.h"

namespace tsbind
{
namespace
{

bool isQuote(const char c)
{
    return c == '"' || c == '\'';
}

}  // namespace

llvm::StringRef stripIdentifierQuotes(llvm::StringRef name)
{
    if (name.size() >= 2 && isQuote(name.front()) && name.back() == name.front())
    {
        return name.drop_front().drop_back();
    }
    return name;
}

std::string normalizeIdentifier(llvm::StringRef name)
{
    std::string out = stripIdentifierQuotes(name).str();
    for (char& c : out)
    {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_'))
        {
            c = '_';
        }
    }
    return out;
}

std::string lowercaseFirst(llvm::StringRef name)
{
    std::string out = name.str();
    if (!out.empty())
    {
        out.front() = static_cast<char>(std::tolower(static_cast<unsigned char>(out.front())));
    }
    return out;
}

std::string capitalizeFirst(llvm::StringRef name)
{
    std::string out = name.str();
    if (!out.empty())
    {
        out.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(out.front())));
    }
    return out;
}

std::vector<std::string> dedupePreservingOrder(const std::vector<std::string>& items)
{
    llvm::SetVector<std::string, std::vector<std::string>, std::unordered_set<std::string>> seen;
    for (const std::string& item : items)
    {
        seen.insert(item);
    }
    return seen.takeVector();
}

}  // namespace tsbind
