/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#include "CompareJob.hpp"

#include "DiffScore.hpp"
#include "DiffStats.hpp"
#include "FileStorage.hpp"
#include "JsonEncoder.hpp"
#include "JsonFileStorage.hpp"
#include "Lib/Utils.hpp"

#include <fmt/core.h>

#include <set>

namespace Cli {
namespace fs = std::filesystem;

namespace {
const String JSON_EXTENSION = ".json";
} // namespace

CompareJob::CompareJob(CompareConfig config, const SharedPtr<ModuleRegistry>& moduleRegistry)
  : mConfig(std::move(config)),
    mEngine(Diff::DiffOptions{mConfig.KeysOnly, mConfig.ParallelThreshold}, moduleRegistry),
    // Escape sequences are never written into report files
    mRenderer(Render::RenderOptions{mConfig.Color && !mConfig.OutputDir.has_value()}, moduleRegistry),
    mModuleRegistry(moduleRegistry),
    mLog(moduleRegistry->LoggerRegistry()->Logger(Module::Name::COMPARE_JOB)) {
}

Exit::Code CompareJob::Run(const String& firstPath, const String& secondPath, std::ostream& out) {
    std::error_code errCode = {};
    if (mConfig.OutputDir && !fs::is_directory(mConfig.OutputDir.value(), errCode)) {
        mLog->error("The output path `{}` is not correct", mConfig.OutputDir.value());
        return Exit::FAILURE;
    }

    const fs::path first(firstPath);
    const fs::path second(secondPath);
    if (!fs::exists(first, errCode)) {
        mLog->error("The first path `{}` is not correct", firstPath);
        return Exit::FAILURE;
    }

    if (!fs::exists(second, errCode)) {
        mLog->error("The second path `{}` is not correct", secondPath);
        return Exit::FAILURE;
    }

    const bool firstIsDir = fs::is_directory(first, errCode);
    const bool secondIsDir = fs::is_directory(second, errCode);
    if (firstIsDir && secondIsDir) {
        return CompareDirectories(first, second, out);
    }

    if (firstIsDir || secondIsDir) {
        mLog->error("Both paths should be a directory or a file");
        return Exit::FAILURE;
    }

    return CompareFiles(first, second, out);
}

CompareJob::PairOutcome CompareJob::ComparePair(const fs::path& firstFile, const fs::path& secondFile) const {
    PairOutcome outcome;
    Storage::JsonFileStorage firstStorage(firstFile.string(), mModuleRegistry, mConfig.MaxDepth);
    auto left = firstStorage.LoadValue();
    if (!left.has_value()) {
        mLog->error("Failed to load JSON document from file '{}'", firstStorage.URI());
        return outcome;
    }

    Storage::JsonFileStorage secondStorage(secondFile.string(), mModuleRegistry, mConfig.MaxDepth);
    auto right = secondStorage.LoadValue();
    if (!right.has_value()) {
        mLog->error("Failed to load JSON document from file '{}'", secondStorage.URI());
        return outcome;
    }

    auto diff = mEngine.Compare(left.value(), right.value());
    if (diff.IsUnchanged()) {
        mLog->info("Files '{}' and '{}' are identical", firstStorage.URI(), secondStorage.URI());
        outcome.Code = Exit::IDENTICAL;
        return outcome;
    }

    const auto stats = Diff::DiffStats::Collect(diff);
    mLog->info("Files '{}' and '{}' differ: {} added, {} removed, {} changed, similarity score {:.1f}", firstStorage.URI(), secondStorage.URI(),
        stats.Added(), stats.Removed(), stats.Changed(), Diff::fSimilarityScore(diff));

    outcome.Code = Exit::DIFFERENT;
    if (mConfig.RawJson) {
        outcome.Report = Render::fEncodeJson(diff).dump(Json::DEFAULT_OUTPUT_INDENT) + "\n";
    }
    else {
        outcome.Report = mRenderer.Render(diff);
    }

    return outcome;
}

Exit::Code CompareJob::Emit(const PairOutcome& outcome, const fs::path& relativeName, std::ostream& out) const {
    if (outcome.Code != Exit::DIFFERENT) {
        return outcome.Code;
    }

    if (!mConfig.OutputDir) {
        out << outcome.Report;
        out.flush();
        return out ? Exit::DIFFERENT : Exit::FAILURE;
    }

    const fs::path target = fs::path(mConfig.OutputDir.value()) / relativeName;
    std::error_code errCode = {};
    fs::create_directories(target.parent_path(), errCode);
    if (errCode) {
        mLog->error("Failed to create directory '{}'. Error: {}", target.parent_path().string(), errCode.message());
        return Exit::FAILURE;
    }

    Storage::FileStorage reportStorage(target.string(), mModuleRegistry);
    if (!reportStorage.SaveData(Utils::fToByteStream(outcome.Report))) {
        mLog->error("Failed to save report into file '{}'", reportStorage.URI());
        return Exit::FAILURE;
    }

    return Exit::DIFFERENT;
}

Exit::Code CompareJob::CompareFiles(const fs::path& firstFile, const fs::path& secondFile, std::ostream& out) const {
    return Emit(ComparePair(firstFile, secondFile), firstFile.filename(), out);
}

Optional<Vector<fs::path>> fListJsonFiles(const fs::path& dir, Log::SpdLogger& log) {
    Vector<fs::path> files;
    std::error_code errCode = {};
    for (auto entryIt = fs::recursive_directory_iterator(dir, errCode); !errCode && (entryIt != fs::recursive_directory_iterator()); entryIt.increment(errCode)) {
        const auto relative = entryIt->path().lexically_relative(dir);
        if (Utils::fIsHidden(relative)) {
            entryIt.disable_recursion_pending();
            continue;
        }

        std::error_code statusErrCode = {};
        const auto status = entryIt->status(statusErrCode);
        if (statusErrCode) {
            if (status.type() == fs::file_type::not_found) {
                log.warn("Skipping dangling link '{}'", entryIt->path().string());
                continue;
            }

            log.error("Failed to read status of '{}'. Error: {}", entryIt->path().string(), statusErrCode.message());
            return {};
        }

        if (fs::is_regular_file(status) && Utils::fHasExtension(relative, JSON_EXTENSION)) {
            files.push_back(relative);
        }
    }

    if (errCode) {
        log.error("Failed to list directory '{}'. Error: {}", dir.string(), errCode.message());
        return {};
    }

    std::sort(files.begin(), files.end());
    return files;
}

Exit::Code CompareJob::CompareDirectories(const fs::path& firstDir, const fs::path& secondDir, std::ostream& out) const {
    const auto firstListing = fListJsonFiles(firstDir, *mLog);
    const auto secondListing = fListJsonFiles(secondDir, *mLog);
    if (!firstListing || !secondListing) {
        return Exit::FAILURE;
    }

    const auto& firstFiles = firstListing.value();
    const auto& secondFiles = secondListing.value();
    const std::set<fs::path> firstSet(firstFiles.begin(), firstFiles.end());
    const std::set<fs::path> secondSet(secondFiles.begin(), secondFiles.end());

    auto exitCode = Exit::IDENTICAL;
    Vector<fs::path> common;
    for (const auto& file : firstFiles) {
        if (secondSet.count(file) == 0) {
            mLog->warn("Only in '{}': {}", firstDir.string(), file.string());
            exitCode = fMergeExitCodes(exitCode, Exit::DIFFERENT);
            continue;
        }

        common.push_back(file);
    }

    for (const auto& file : secondFiles) {
        if (firstSet.count(file) == 0) {
            mLog->warn("Only in '{}': {}", secondDir.string(), file.string());
            exitCode = fMergeExitCodes(exitCode, Exit::DIFFERENT);
        }
    }

    mLog->debug("Comparing {} file pairs between '{}' and '{}'", common.size(), firstDir.string(), secondDir.string());
    Vector<PairOutcome> outcomes(common.size());
    auto pool = mModuleRegistry->WorkerPool();
    Concurrency::fParallelFor(pool.get(), common.size(), pool ? pool->Size() : 1, [&](size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) {
            outcomes[i] = ComparePair(firstDir / common[i], secondDir / common[i]);
        }
    });

    for (size_t i = 0; i < common.size(); ++i) {
        if (!mConfig.OutputDir && (outcomes[i].Code == Exit::DIFFERENT)) {
            out << fmt::format("diff {} {}\n", (firstDir / common[i]).string(), (secondDir / common[i]).string());
        }

        exitCode = fMergeExitCodes(exitCode, Emit(outcomes[i], common[i], out));
    }

    return exitCode;
}
} // namespace Cli
