/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "DiffNode.hpp"
#include "Modules.hpp"

#include "Lib/ModuleRegistry.hpp"

namespace Render {
using namespace StdLib;

struct RenderOptions {
    bool Color = false;
};

namespace Marker {
    constexpr char CONTEXT = ' ';
    constexpr char ADDED = '+';
    constexpr char REMOVED = '-';
} // namespace Marker

/** One report row: marker column and indented text */
struct ReportLine {
    char Marker;
    String Text;

    String ToString() const { return Marker + Text; }
};

/** Renders a diff tree as a line report.
 *  Rows start with a marker (' ' context, '-' removed or old, '+' added or new) and nest by two
 *  spaces. Unchanged object members are left out, unchanged array elements stay as context and
 *  containers among them are shown as "...". A fully unchanged tree renders to nothing.
 */
class TextRenderer {
public:
    explicit TextRenderer(RenderOptions options = {}, const SharedPtr<ModuleRegistry>& moduleRegistry = std::make_shared<ModuleRegistry>())
      : mOptions(options), mModuleRegistry(moduleRegistry), mLog(moduleRegistry->LoggerRegistry()->Logger(Module::Name::RENDERER)) {}

    Vector<ReportLine> RenderLines(const Diff::DiffNode& node) const;

    /** Render - Report text, one row per line, each row terminated by a new line.
     *  With color enabled added rows are green and removed rows red (ANSI escapes).
     */
    String Render(const Diff::DiffNode& node) const;

    const RenderOptions& Options() const { return mOptions; }

private:
    RenderOptions mOptions;
    SharedPtr<ModuleRegistry> mModuleRegistry;
    SharedPtr<Log::SpdLogger> mLog;
}; // class TextRenderer
} // namespace Render
