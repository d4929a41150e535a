#include "archname/batch/RenamePlanner.h"
#include "archname/batch/TitleGroupAnalyzer.h"
#include "archname/batch/TitleSources.h"
#include "archname/Exceptions.h"
#include "archname/utils/FileUtils.h"
#include <algorithm>
#include <set>
#include <utility>

namespace arn {

namespace fs = std::filesystem;

RenamePlanner::RenamePlanner(const FilenameEngine& engine)
    : m_engine(engine) {
}

std::vector<fs::path> RenamePlanner::scan(const fs::path& directory,
                                          const std::vector<std::string>& extensions) {
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        throw FileNotFoundException(directory.string());
    }

    std::vector<fs::path> files;
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code statusEc;
        if (!it->is_regular_file(statusEc)) {
            continue;
        }
        const fs::path& path = it->path();
        for (const auto& ext : extensions) {
            if (FileUtils::hasExtension(path, ext)) {
                files.push_back(path);
                break;
            }
        }
    }
    if (ec) {
        throw ReadException("Cannot list directory " + directory.string() + ": " + ec.message());
    }

    std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });
    return files;
}

std::vector<RenameOperation> RenamePlanner::plan(const std::vector<fs::path>& files) const {
    std::vector<RenameOperation> operations;
    if (files.empty()) {
        return operations;
    }

    const NamingConfig& config = m_engine.config();
    const fs::path directory = files.front().parent_path();

    // Files outside the plan keep their names and must not be collided with
    std::set<std::string> plannedStems;
    for (const auto& file : files) {
        plannedStems.insert(file.stem().string());
    }
    NameRegistry registry;
    for (const auto& stem : FileUtils::listStems(directory.empty() ? fs::path(".") : directory)) {
        if (plannedStems.find(stem) == plannedStems.end()) {
            registry.insert(stem);
        }
    }

    std::vector<std::string> titles;
    titles.reserve(files.size());
    for (const auto& file : files) {
        titles.push_back(TitleSources::fromArchivedFilename(file.filename().string()));
    }

    TitleGroupAnalyzer analyzer(config);
    analyzer.analyze(titles);

    for (size_t i = 0; i < files.size(); ++i) {
        const fs::path& file = files[i];
        const std::string ext = file.extension().string();

        size_t budget = analyzer.budgetFor(titles[i], config.targetBudget);
        if (ext.size() > config.extension.size()) {
            budget -= std::min(budget, ext.size() - config.extension.size());
            budget = std::max(budget, config.minimumTotalBudget());
        }

        const std::string stem = m_engine.assign(titles[i], "", registry, budget);

        RenameOperation op;
        op.oldPath = file;
        op.oldName = file.filename().string();
        op.newName = stem + ext;
        op.newPath = file.parent_path() / op.newName;

        if (!op.unchanged()) {
            std::error_code ec;
            if (fs::exists(op.newPath, ec) && !fs::equivalent(op.newPath, op.oldPath, ec)) {
                op.conflict = true;
                op.reason = "Target file already exists";
            }
        }
        operations.push_back(std::move(op));
    }

    return operations;
}

ApplySummary RenamePlanner::apply(const std::vector<RenameOperation>& operations, bool force) {
    ApplySummary summary;

    for (const auto& op : operations) {
        if (op.unchanged()) {
            ++summary.skipped;
            continue;
        }

        if (op.conflict && !force) {
            ++summary.skipped;
            summary.messages.push_back("Skipping " + op.oldName + ": " + op.reason);
            continue;
        }

        std::error_code ec;
        fs::rename(op.oldPath, op.newPath, ec);
        if (ec) {
            ++summary.failed;
            summary.messages.push_back("Failed to rename " + op.oldName + ": " + ec.message());
        } else {
            ++summary.renamed;
            summary.messages.push_back("Renamed: " + op.oldName + " -> " + op.newName);
        }
    }

    return summary;
}

size_t RenamePlanner::countPending(const std::vector<RenameOperation>& operations) {
    return static_cast<size_t>(std::count_if(operations.begin(), operations.end(),
        [](const RenameOperation& op) { return !op.unchanged() && !op.conflict; }));
}

size_t RenamePlanner::countConflicts(const std::vector<RenameOperation>& operations) {
    return static_cast<size_t>(std::count_if(operations.begin(), operations.end(),
        [](const RenameOperation& op) { return !op.unchanged() && op.conflict; }));
}

} // namespace arn
