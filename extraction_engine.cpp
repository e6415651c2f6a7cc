#include "extraction_engine.hpp"
#include "errors.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

namespace page_pilot {

using json = nlohmann::json;

const char* const kExtractionFailed = "extraction failed";
const char* const kSourceNotFound = "not found";

namespace {

const std::string kTextPrefix = "text=";
const std::string kNextSeparator = ">> next >>";
const std::string kChildSeparator = ">>";

// Every element whose normalized text contains the anchor, in document order.
std::string anchor_candidates(const std::string& anchor_text) {
    return "const needle = " + json(anchor_text).dump() + ";"
           " const nodes = Array.from(document.querySelectorAll('*')).filter(el =>"
           " (el.textContent || '').replace(/\\s+/g, ' ').trim().includes(needle));";
}

} // namespace

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    const auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    const auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

SelectorExpression parse_selector_expression(const std::string& expression) {
    SelectorExpression out;
    const std::string expr = trim(expression);

    if (expr.compare(0, kTextPrefix.size(), kTextPrefix) != 0) {
        out.selector = expr;
        return out;
    }

    std::string::size_type sep = expr.find(kNextSeparator);
    std::string::size_type sep_len = kNextSeparator.size();
    out.mode = AddressingMode::AnchorNextSibling;
    if (sep == std::string::npos) {
        sep = expr.find(kChildSeparator);
        sep_len = kChildSeparator.size();
        out.mode = AddressingMode::AnchorAncestor;
    }
    if (sep == std::string::npos) {
        // "text=" with no child part is just a selector string.
        out.mode = AddressingMode::Direct;
        out.selector = expr;
        return out;
    }

    out.anchor_text = trim(expr.substr(kTextPrefix.size(), sep - kTextPrefix.size()));
    std::string rest = expr.substr(sep + sep_len);
    // Only the first segment after the separator is the child selector.
    const auto extra = rest.find(kChildSeparator);
    if (extra != std::string::npos) rest = rest.substr(0, extra);
    out.child_selector = trim(rest);
    return out;
}

std::string anchor_next_sibling_script(const std::string& anchor_text, const std::string& child_selector) {
    return "(() => { " + anchor_candidates(anchor_text) +
           " if (nodes.length === 0) return {ok: false, reason: 'anchor text \"' + needle + '\" not found'};"
           " const anchor = nodes[nodes.length - 1];"
           " let sibling = anchor.nextElementSibling;"
           " if (!sibling && anchor.parentElement) sibling = anchor.parentElement.nextElementSibling;"
           " if (!sibling) return {ok: false, reason: 'anchor \"' + needle + '\" has no next sibling'};"
           " const target = sibling.querySelector(" + json(child_selector).dump() + ") || sibling;"
           " return {ok: true, value: (target.textContent || '').trim()}; })()";
}

std::string anchor_ancestor_script(const std::string& anchor_text, const std::string& child_selector) {
    return "(() => { " + anchor_candidates(anchor_text) +
           " const childSel = " + json(child_selector).dump() + ";"
           " if (nodes.length === 0) return {ok: false, reason: 'no element contains text \"' + needle + '\"'};"
           " for (let i = nodes.length - 1; i >= 0; i--) {"
           "   let parent = nodes[i].parentElement;"
           "   while (parent && parent !== document.body) {"
           "     const child = parent.querySelector(childSel);"
           "     if (child) return {ok: true, value: (child.textContent || '').trim()};"
           "     parent = parent.parentElement;"
           "   }"
           " }"
           " return {ok: false, reason: 'found text \"' + needle + '\" but no ancestor contains ' + childSel}; })()";
}

ExtractionOutcome ExtractionEngine::extract(Page& page, const std::string& expression) const {
    const SelectorExpression parsed = parse_selector_expression(expression);
    switch (parsed.mode) {
        case AddressingMode::AnchorNextSibling:
            return runAnchorScript(page, anchor_next_sibling_script(parsed.anchor_text, parsed.child_selector));
        case AddressingMode::AnchorAncestor:
            return runAnchorScript(page, anchor_ancestor_script(parsed.anchor_text, parsed.child_selector));
        case AddressingMode::Direct:
            break;
    }
    return extractDirect(page, parsed.selector);
}

ExtractionOutcome ExtractionEngine::extractDirect(Page& page, const std::string& selector) const {
    try {
        page.waitForVisible(selector, selector_timeout_);
        return ExtractionOutcome::success(trim(page.textContent(selector)));
    } catch (const TimeoutError& e) {
        return ExtractionOutcome::failure(e.what());
    } catch (const ScriptError& e) {
        return ExtractionOutcome::failure(e.what());
    }
}

ExtractionOutcome ExtractionEngine::runAnchorScript(Page& page, const std::string& script) const {
    json result;
    try {
        result = page.evaluate(script);
    } catch (const ScriptError& e) {
        return ExtractionOutcome::failure(e.what());
    }
    if (!result.is_object()) {
        return ExtractionOutcome::failure("anchor script returned " + result.dump());
    }
    if (result.value("ok", false)) {
        return ExtractionOutcome::success(trim(result.value("value", "")));
    }
    return ExtractionOutcome::failure(result.value("reason", "anchor lookup failed"));
}

} // namespace page_pilot
