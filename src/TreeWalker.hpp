#pragma once
#include <string>
#include "FileCopier.hpp"
#include "ProgressCounter.hpp"
#include "Util.hpp"

// Mirrors the directory from into dest, creating dest and any missing parents. Regular files go
// through copier; symlinks, fifos, sockets and device nodes are skipped with a warning. Fails with
// Error::Kind::DestinationInsideSource if any directory would be copied into its own subtree. The
// first failure aborts the rest of the walk, and whatever was already copied stays on disk.
[[nodiscard]] Result copyDirectoryTree(FileCopier& copier,
                                       const std::string& from,
                                       const std::string& dest,
                                       ProgressCounter* taskProgress = nullptr,
                                       ProgressCounter* runProgress = nullptr);

[[nodiscard]] Result copyDirectoryTree(const std::string& from, const std::string& dest, ProgressCounter* progress = nullptr);
