#pragma once

#include <QString>

namespace lc {

// HtmlCleaner: turns a paragraph's HTML content into plain index text.
//
// Operations performed:
// 1. Drop <script>/<style> elements with their content
// 2. Replace every remaining tag with a space
// 3. Decode character references (&amp; &lt; &gt; &quot; &apos; &#39; &nbsp;,
//    decimal &#NNN; and hex &#xHH;)
// 4. Strip control characters
// 5. Collapse all whitespace runs (including newlines) to a single space and trim
class HtmlCleaner {
public:
    static QString clean(const QString& html);

    static QString decodeEntities(const QString& text);
};

} // namespace lc
