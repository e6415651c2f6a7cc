#pragma once

#include "page.hpp"

#include <string>

namespace page_pilot {

// Stored in place of a value the engine could not resolve.
extern const char* const kExtractionFailed;
// Substituted for a composite source that could not be resolved.
extern const char* const kSourceNotFound;

enum class AddressingMode {
    Direct,             // plain selector
    AnchorNextSibling,  // text=<T> >> next >> <child>
    AnchorAncestor      // text=<T> >> <child>
};

struct SelectorExpression {
    AddressingMode mode = AddressingMode::Direct;
    std::string selector;        // Direct only
    std::string anchor_text;     // anchor modes
    std::string child_selector;  // anchor modes
};

// Never throws; anything that does not look like an anchor form is Direct.
SelectorExpression parse_selector_expression(const std::string& expression);

struct ExtractionOutcome {
    bool ok = false;
    std::string value;   // trimmed text when ok
    std::string reason;  // why not, otherwise

    static ExtractionOutcome success(std::string value) { return {true, std::move(value), {}}; }
    static ExtractionOutcome failure(std::string reason) { return {false, {}, std::move(reason)}; }
};

// Page-side scripts for the anchor modes. Both evaluate to
// {ok: true, value} or {ok: false, reason}.
std::string anchor_next_sibling_script(const std::string& anchor_text, const std::string& child_selector);
std::string anchor_ancestor_script(const std::string& anchor_text, const std::string& child_selector);

// Resolves selector expressions to text.
//
// A miss (timeout, absent anchor, unmatched child, script failure) comes back
// as a failed outcome. Losing the page is not a miss and propagates as
// SessionClosedError.
class ExtractionEngine {
public:
    explicit ExtractionEngine(Millis selector_timeout = Millis(15000))
        : selector_timeout_(selector_timeout) {}

    ExtractionOutcome extract(Page& page, const std::string& expression) const;

private:
    ExtractionOutcome extractDirect(Page& page, const std::string& selector) const;
    ExtractionOutcome runAnchorScript(Page& page, const std::string& script) const;

    Millis selector_timeout_;
};

std::string trim(const std::string& s);

} // namespace page_pilot
