#pragma once
#include <string>
#include <string_view>
#include <vector>

#include "Dockfix/Resolver.hpp"

namespace Dockfix
{

constexpr const char* kNewlineResolverId = "newline-between-instructions";

// One instruction as seen by the line scanner
struct InstructionSpan
{
    /// Lowercased instruction keyword
    std::string keyword;
    /// First line, including the comments directly above the instruction (1-based)
    int startLine = 0;
    /// Line holding the keyword (1-based)
    int instructionLine = 0;
    /// Last line, including continuations and heredoc bodies (1-based, inclusive)
    int endLine = 0;
};

/// Splits Dockerfile content into instructions without interpreting their arguments
std::vector<InstructionSpan> scanInstructions(std::string_view content);

// Normalizes the blank lines between instructions according to NewlineResolveData::mode.
// Always returns the complete set of edits for the file.
class NewlineResolver : public FixResolver
{
public:
    std::string id() const override
    {
        return kNewlineResolverId;
    }

    ResolveResult resolve(const CancellationTokenPtr& cancellationToken, const ResolveContext& context, const SuggestedFix& fix) const override;
};

} // namespace Dockfix
