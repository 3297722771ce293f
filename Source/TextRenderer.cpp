/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#include "TextRenderer.hpp"

#include "DiffVisitor.hpp"
#include "ValueConverter.hpp"

#include <fmt/color.h>
#include <fmt/core.h>

namespace Render {
namespace {
constexpr size_t INDENT_WIDTH = 2;

/** Collects report rows while walking the diff tree */
class ReportWriter final : public Diff::IVisitor {
public:
    void Visit(const Optional<Diff::DiffKey>& key, const Diff::DiffNode& node) override {
        const String indent = Indent();
        const bool isElement = key && key->IsIndex();
        const Optional<String> label = (key && !isElement) ? Optional<String>(key->Name()) : std::nullopt;

        switch (node.GetStatus()) {
        case Diff::Status::Unchanged:
            // Only array elements are kept as context, the root and object members are left out
            if (!isElement) {
                break;
            }

            if (node.GetValue().IsContainer()) {
                mLines.push_back(ReportLine{Marker::CONTEXT, indent + "..."});
            }
            else {
                WriteValue(std::nullopt, node.GetValue(), Marker::CONTEXT, indent);
            }
            break;
        case Diff::Status::Added:
            WriteValue(label, node.GetValue(), Marker::ADDED, indent);
            break;
        case Diff::Status::Removed:
            WriteValue(label, node.GetValue(), Marker::REMOVED, indent);
            break;
        case Diff::Status::Changed:
            WriteValue(label, node.OldValue(), Marker::REMOVED, indent);
            WriteValue(label, node.NewValue(), Marker::ADDED, indent);
            break;
        case Diff::Status::Nested:
            break;
        }
    }

    bool Enter(const Optional<Diff::DiffKey>& key, const Diff::DiffNode& node) override {
        const bool isObject = node.GetContainerKind() == Diff::ContainerKind::Object;
        mLines.push_back(ReportLine{Marker::CONTEXT, Indent() + Prefix(key) + (isObject ? "{" : "[")});
        ++mDepth;
        return true;
    }

    void Leave([[maybe_unused]] const Optional<Diff::DiffKey>& key, const Diff::DiffNode& node) override {
        --mDepth;
        const bool isObject = node.GetContainerKind() == Diff::ContainerKind::Object;
        mLines.push_back(ReportLine{Marker::CONTEXT, Indent() + (isObject ? "}" : "]")});
    }

    Vector<ReportLine> TakeLines() { return std::move(mLines); }

private:
    String Indent() const { return String(mDepth * INDENT_WIDTH, ' '); }

    static String Prefix(const Optional<Diff::DiffKey>& key) {
        if (!key || key->IsIndex()) {
            return "";
        }

        return key->Name() + ": ";
    }

    /** Expands a plain value with one marker for all of its rows */
    void WriteValue(const Optional<String>& label, const Json::Value& value, char marker, const String& indent) {
        const String prefix = label ? (*label + ": ") : String();
        const String subIndent = indent + String(INDENT_WIDTH, ' ');
        switch (value.GetKind()) {
        case Json::Kind::Object: {
            mLines.push_back(ReportLine{marker, indent + prefix + "{"});
            const auto& object = value.AsObject();
            for (size_t i = 0; i < object.Size(); ++i) {
                WriteValue(object.KeyAt(i), object.ValueAt(i), marker, subIndent);
            }

            mLines.push_back(ReportLine{marker, indent + "}"});
            break;
        }
        case Json::Kind::Array:
            mLines.push_back(ReportLine{marker, indent + prefix + "["});
            for (const auto& item : value.AsArray()) {
                WriteValue(std::nullopt, item, marker, subIndent);
            }

            mLines.push_back(ReportLine{marker, indent + "]"});
            break;
        default:
            mLines.push_back(ReportLine{marker, indent + prefix + Json::fDump(value)});
            break;
        }
    }

    Vector<ReportLine> mLines;
    size_t mDepth = 0;
};
} // namespace

Vector<ReportLine> TextRenderer::RenderLines(const Diff::DiffNode& node) const {
    ReportWriter writer;
    node.Accept(writer);
    auto lines = writer.TakeLines();
    mLog->debug("Rendered {} report lines", lines.size());
    return lines;
}

String TextRenderer::Render(const Diff::DiffNode& node) const {
    String report;
    for (const auto& line : RenderLines(node)) {
        if (mOptions.Color && (line.Marker == Marker::ADDED)) {
            report += fmt::format(fmt::fg(fmt::terminal_color::green), "{}", line.ToString());
        }
        else if (mOptions.Color && (line.Marker == Marker::REMOVED)) {
            report += fmt::format(fmt::fg(fmt::terminal_color::red), "{}", line.ToString());
        }
        else {
            report += line.ToString();
        }

        report += '\n';
    }

    return report;
}
} // namespace Render
