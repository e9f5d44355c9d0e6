#include "argsem/semantics/semantics_kind.hpp"
#include "argsem/common/errors.hpp"

#include <cctype>

namespace argsem
{

namespace
{

std::string lowercase(const std::string& s)
{
    std::string out = s;
    for (char& c : out)
    {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

} // namespace

const std::vector<SemanticsKind>& all_semantics_kinds()
{
    static const std::vector<SemanticsKind> kinds = {
        SemanticsKind::ConflictFree,
        SemanticsKind::Admissible,
        SemanticsKind::Complete,
        SemanticsKind::Grounded,
        SemanticsKind::Preferred,
        SemanticsKind::Stable,
        SemanticsKind::Stage,
        SemanticsKind::SemiStable,
    };
    return kinds;
}

const char* to_string(SemanticsKind kind) noexcept
{
    switch (kind)
    {
        case SemanticsKind::ConflictFree: return "conflict-free";
        case SemanticsKind::Admissible: return "admissible";
        case SemanticsKind::Complete: return "complete";
        case SemanticsKind::Grounded: return "grounded";
        case SemanticsKind::Preferred: return "preferred";
        case SemanticsKind::Stable: return "stable";
        case SemanticsKind::Stage: return "stage";
        case SemanticsKind::SemiStable: return "semi-stable";
    }
    return "unknown";
}

SemanticsKind parse_semantics_kind(const std::string& name)
{
    std::string key = lowercase(name);
    for (SemanticsKind kind : all_semantics_kinds())
    {
        if (key == to_string(kind))
        {
            return kind;
        }
    }
    if (key == "semistable")
    {
        return SemanticsKind::SemiStable;
    }
    throw AfError(AfErrorCode::InvalidSemanticsKind, "Unknown semantics kind '" + name + "'");
}

std::vector<SemanticsKind> parse_semantics_selection(const std::string& name)
{
    if (lowercase(name) == "all")
    {
        return all_semantics_kinds();
    }
    return {parse_semantics_kind(name)};
}

const char* to_string(AcceptanceMode mode) noexcept
{
    switch (mode)
    {
        case AcceptanceMode::Credulous: return "credulous";
        case AcceptanceMode::Skeptical: return "skeptical";
    }
    return "unknown";
}

AcceptanceMode parse_acceptance_mode(const std::string& name)
{
    std::string key = lowercase(name);
    if (key == "credulous")
    {
        return AcceptanceMode::Credulous;
    }
    if (key == "skeptical")
    {
        return AcceptanceMode::Skeptical;
    }
    throw AfError(AfErrorCode::InvalidRequest, "Unknown acceptance mode '" + name + "'");
}

} // namespace argsem
