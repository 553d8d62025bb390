#pragma once
#include <string>

namespace mcptool::util::html
{

/// True when the body starts with an <html> tag or the content type says HTML.
bool looks_like_html(const std::string& body, const std::string& content_type);

/// Inner HTML of the first <article>, else <main>, else <body>; the whole
/// document when none is present.
std::string extract_main_content(const std::string& html);

/// Replace the common named entities and numeric (&#NN; / &#xHH;) references.
std::string decode_entities(const std::string& text);

/// Markdown-flavoured plain text:
///   h1-h6 -> "#".."######", p/div/tr -> paragraph breaks, br -> newline,
///   li -> "* ", a[href] -> [text](href), b/strong -> **, i/em -> _,
///   code -> `, pre -> fenced block. script, style, head, noscript and
///   template content is dropped. Runs of blank lines collapse to one.
std::string to_markdown(const std::string& html);

} // namespace mcptool::util::html
