/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "Common.hpp"
#include "DiffEngine.hpp"
#include "JsonCommon.hpp"
#include "Modules.hpp"
#include "TextRenderer.hpp"

#include "Lib/ModuleRegistry.hpp"

#include <algorithm>
#include <filesystem>
#include <ostream>

namespace Cli {
using namespace StdLib;

struct CompareConfig {
    bool Color = false;
    bool RawJson = false;
    bool KeysOnly = false;
    Optional<String> OutputDir;
    size_t MaxDepth = Json::DEFAULT_MAX_DEPTH;
    size_t ParallelThreshold = Diff::DiffOptions().ParallelThreshold;
};

/** Compares two JSON files, or two directory trees of JSON files, and writes the reports
 *  either to the given stream or into the output directory.
 */
class CompareJob {
public:
    CompareJob(CompareConfig config, const SharedPtr<ModuleRegistry>& moduleRegistry);

    /** Run - Compares the two paths
     * @return IDENTICAL, DIFFERENT, or FAILURE on usage, I/O or parse errors
     */
    Exit::Code Run(const String& firstPath, const String& secondPath, std::ostream& out);

private:
    struct PairOutcome {
        Exit::Code Code = Exit::FAILURE;
        String Report;
    };

    PairOutcome ComparePair(const std::filesystem::path& firstFile, const std::filesystem::path& secondFile) const;
    Exit::Code Emit(const PairOutcome& outcome, const std::filesystem::path& relativeName, std::ostream& out) const;
    Exit::Code CompareFiles(const std::filesystem::path& firstFile, const std::filesystem::path& secondFile, std::ostream& out) const;
    Exit::Code CompareDirectories(const std::filesystem::path& firstDir, const std::filesystem::path& secondDir, std::ostream& out) const;

    CompareConfig mConfig;
    Diff::DiffEngine mEngine;
    Render::TextRenderer mRenderer;
    SharedPtr<ModuleRegistry> mModuleRegistry;
    SharedPtr<Log::SpdLogger> mLog;
}; // class CompareJob

/** fListJsonFiles - Relative paths of the *.json files under dir, sorted. Hidden entries are
 *  skipped, so are dangling links.
 * @return Empty if the directory cannot be fully listed
 */
Optional<Vector<std::filesystem::path>> fListJsonFiles(const std::filesystem::path& dir, Log::SpdLogger& log);

/** fMergeExitCodes - FAILURE wins over DIFFERENT, which wins over IDENTICAL */
inline Exit::Code fMergeExitCodes(Exit::Code lhs, Exit::Code rhs) {
    return static_cast<Exit::Code>(std::max(static_cast<int>(lhs), static_cast<int>(rhs)));
}
} // namespace Cli
