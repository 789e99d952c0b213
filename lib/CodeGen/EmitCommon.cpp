//===----------------------------------------------------------------------===//
//
// Part of the tsbind project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Shared emission helpers for the generated-file write policy.
///
//===----------------------------------------------------------------------===//

#include "tsbind/CodeGen/EmitCommon.h"

#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include <system_error>

namespace tsbind
{

namespace
{

std::filesystem::perms permsFromMode(const std::uint32_t mode)
{
    using Perm = std::filesystem::perms;
    Perm out   = Perm::none;

    if ((mode & 0400U) != 0U)
    {
        out |= Perm::owner_read;
    }
    if ((mode & 0200U) != 0U)
    {
        out |= Perm::owner_write;
    }
    if ((mode & 0040U) != 0U)
    {
        out |= Perm::group_read;
    }
    if ((mode & 0020U) != 0U)
    {
        out |= Perm::group_write;
    }
    if ((mode & 0004U) != 0U)
    {
        out |= Perm::others_read;
    }
    if ((mode & 0002U) != 0U)
    {
        out |= Perm::others_write;
    }

    return out;
}

std::string absoluteNormalizedPath(const std::filesystem::path& path)
{
    std::error_code ec;
    const auto      absolute = std::filesystem::absolute(path, ec);
    if (ec)
    {
        return path.lexically_normal().string();
    }
    return absolute.lexically_normal().string();
}

}  // namespace

llvm::Error writeGeneratedFile(const std::filesystem::path& path, llvm::StringRef content, const EmitWritePolicy& policy)
{
    if (policy.recordedOutputs != nullptr)
    {
        policy.recordedOutputs->push_back(absoluteNormalizedPath(path));
    }

    if (policy.dryRun)
    {
        return llvm::Error::success();
    }

    std::error_code ec;

    const auto parent = path.parent_path();
    if (!parent.empty())
    {
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            return llvm::createStringError(ec, "failed to create output directory %s", parent.string().c_str());
        }
    }

    const bool exists = std::filesystem::exists(path, ec);
    if (ec)
    {
        return llvm::createStringError(ec, "failed to stat output path %s", path.string().c_str());
    }
    if (exists)
    {
        if (policy.noOverwrite)
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "refusing to overwrite existing output file: %s",
                                           path.string().c_str());
        }
        const bool removed = std::filesystem::remove(path, ec);
        if (ec || !removed)
        {
            return llvm::createStringError(ec ? ec : llvm::inconvertibleErrorCode(),
                                           "failed to remove existing output file %s",
                                           path.string().c_str());
        }
    }

    llvm::raw_fd_ostream os(path.string(), ec, llvm::sys::fs::OF_Text);
    if (ec)
    {
        return llvm::createStringError(ec, "failed to open %s", path.string().c_str());
    }
    os << content;
    os.close();
    if (os.has_error())
    {
        const std::error_code writeError = os.error();
        os.clear_error();
        return llvm::createStringError(writeError, "failed to write %s", path.string().c_str());
    }

    std::filesystem::permissions(path, permsFromMode(policy.fileMode), std::filesystem::perm_options::replace, ec);
    if (ec)
    {
        return llvm::createStringError(ec, "failed to set mode on %s", path.string().c_str());
    }

    return llvm::Error::success();
}

}  // namespace tsbind
