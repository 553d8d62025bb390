#include "mcptool/util/html.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <utility>

namespace mcptool::util::html
{

namespace
{
std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_space(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

// Tag name of the text between '<' and '>', lowercased, without a leading '/'.
std::string tag_name(const std::string& tag)
{
    std::size_t start = (!tag.empty() && tag[0] == '/') ? 1 : 0;
    std::size_t end = start;
    while (end < tag.size() && !is_space(tag[end]) && tag[end] != '/')
        ++end;
    return lower(tag.substr(start, end - start));
}

std::string attribute(const std::string& tag, const std::string& name)
{
    const std::string lowered = lower(tag);
    std::size_t pos = 0;
    while ((pos = lowered.find(name, pos)) != std::string::npos)
    {
        const bool boundary = pos > 0 && is_space(lowered[pos - 1]);
        std::size_t i = pos + name.size();
        pos = i;
        if (!boundary)
            continue;
        while (i < tag.size() && is_space(tag[i]))
            ++i;
        if (i >= tag.size() || tag[i] != '=')
            continue;
        ++i;
        while (i < tag.size() && is_space(tag[i]))
            ++i;
        if (i >= tag.size())
            return {};
        if (tag[i] == '"' || tag[i] == '\'')
        {
            const char quote = tag[i];
            auto close = tag.find(quote, i + 1);
            if (close == std::string::npos)
                return tag.substr(i + 1);
            return tag.substr(i + 1, close - i - 1);
        }
        std::size_t end = i;
        while (end < tag.size() && !is_space(tag[end]))
            ++end;
        return tag.substr(i, end - i);
    }
    return {};
}

void append_utf8(std::string& out, std::uint32_t cp)
{
    if (cp == 0 || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        cp = 0xFFFD;
    if (cp < 0x80)
    {
        out += static_cast<char>(cp);
    }
    else if (cp < 0x800)
    {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else if (cp < 0x10000)
    {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else
    {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

bool skipped_element(const std::string& name)
{
    return name == "script" || name == "style" || name == "head" || name == "noscript" ||
           name == "template";
}

// Collapse whitespace runs outside <pre>, squeeze blank lines and trim.
std::string tidy(const std::string& text)
{
    std::string out;
    out.reserve(text.size());
    int newlines = 0;
    for (char c : text)
    {
        if (c == '\n')
        {
            while (!out.empty() && out.back() == ' ')
                out.pop_back();
            if (++newlines <= 2 && !out.empty())
                out += '\n';
            continue;
        }
        newlines = 0;
        out += c;
    }
    auto first = out.find_first_not_of(" \n");
    if (first == std::string::npos)
        return {};
    auto last = out.find_last_not_of(" \n");
    return out.substr(first, last - first + 1);
}
} // namespace

bool looks_like_html(const std::string& body, const std::string& content_type)
{
    if (lower(content_type).find("text/html") != std::string::npos)
        return true;
    auto first = std::find_if_not(body.begin(), body.end(), is_space);
    std::string head(first, first + std::min<std::ptrdiff_t>(5, body.end() - first));
    return lower(head) == "<html";
}

std::string extract_main_content(const std::string& html)
{
    const std::string lowered = lower(html);
    for (const char* name : {"article", "main", "body"})
    {
        const std::string open = std::string("<") + name;
        std::size_t pos = 0;
        while ((pos = lowered.find(open, pos)) != std::string::npos)
        {
            const std::size_t after = pos + open.size();
            if (after < lowered.size() && (lowered[after] == '>' || is_space(lowered[after])))
                break;
            pos = after;
        }
        if (pos == std::string::npos)
            continue;
        auto start = html.find('>', pos);
        if (start == std::string::npos)
            continue;
        ++start;
        auto end = lowered.find(std::string("</") + name, start);
        return html.substr(start, end == std::string::npos ? std::string::npos : end - start);
    }
    return html;
}

std::string decode_entities(const std::string& text)
{
    static const std::pair<const char*, const char*> kNamed[] = {
        {"amp", "&"},         {"lt", "<"},           {"gt", ">"},
        {"quot", "\""},       {"apos", "'"},         {"nbsp", " "},
        {"copy", "\xC2\xA9"}, {"reg", "\xC2\xAE"},   {"hellip", "\xE2\x80\xA6"},
        {"mdash", "\xE2\x80\x94"}, {"ndash", "\xE2\x80\x93"},
    };

    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] != '&')
        {
            out += text[i];
            continue;
        }
        auto semi = text.find(';', i + 1);
        if (semi == std::string::npos || semi - i > 10)
        {
            out += '&';
            continue;
        }
        const std::string name = text.substr(i + 1, semi - i - 1);
        bool replaced = false;
        if (name.size() > 1 && name[0] == '#')
        {
            const bool hex = name[1] == 'x' || name[1] == 'X';
            const std::string digits = name.substr(hex ? 2 : 1);
            char* end = nullptr;
            unsigned long cp = std::strtoul(digits.c_str(), &end, hex ? 16 : 10);
            if (!digits.empty() && end && *end == '\0')
            {
                append_utf8(out, static_cast<std::uint32_t>(std::min(cp, 0x110000UL)));
                replaced = true;
            }
        }
        else
        {
            for (const auto& entity : kNamed)
            {
                if (name == entity.first)
                {
                    out += entity.second;
                    replaced = true;
                    break;
                }
            }
        }
        if (replaced)
            i = semi;
        else
            out += '&';
    }
    return out;
}

std::string to_markdown(const std::string& html)
{
    std::string out;
    out.reserve(html.size());
    std::string link;
    bool in_link = false;
    int pre_depth = 0;
    std::string skipping; // element whose content is being dropped

    auto paragraph = [&]
    {
        if (!out.empty() && out.back() != '\n')
            out += '\n';
        out += '\n';
    };

    std::size_t i = 0;
    while (i < html.size())
    {
        const char c = html[i];
        if (c == '<')
        {
            if (html.compare(i, 4, "<!--") == 0)
            {
                auto end = html.find("-->", i + 4);
                i = end == std::string::npos ? html.size() : end + 3;
                continue;
            }
            auto close = html.find('>', i + 1);
            if (close == std::string::npos)
                break;
            const std::string tag = html.substr(i + 1, close - i - 1);
            i = close + 1;

            const bool closing = !tag.empty() && tag[0] == '/';
            const std::string name = tag_name(tag);

            if (!skipping.empty())
            {
                if (closing && name == skipping)
                    skipping.clear();
                continue;
            }
            if (!closing && skipped_element(name) && (tag.empty() || tag.back() != '/'))
            {
                skipping = name;
                continue;
            }

            if (name.size() == 2 && name[0] == 'h' && name[1] >= '1' && name[1] <= '6')
            {
                paragraph();
                if (!closing)
                    out += std::string(static_cast<std::size_t>(name[1] - '0'), '#') + " ";
            }
            else if (name == "p" || name == "div" || name == "tr" || name == "section" ||
                     name == "ul" || name == "ol" || name == "table" || name == "blockquote")
            {
                paragraph();
            }
            else if (name == "br")
            {
                out += '\n';
            }
            else if (name == "li" && !closing)
            {
                if (!out.empty() && out.back() != '\n')
                    out += '\n';
                out += "* ";
            }
            else if (name == "a")
            {
                if (!closing)
                {
                    link = attribute(tag, "href");
                    in_link = !link.empty();
                    if (in_link)
                        out += '[';
                }
                else if (in_link)
                {
                    out += "](" + decode_entities(link) + ")";
                    in_link = false;
                }
            }
            else if (name == "b" || name == "strong")
            {
                out += "**";
            }
            else if (name == "i" || name == "em")
            {
                out += '_';
            }
            else if (name == "code" && pre_depth == 0)
            {
                out += '`';
            }
            else if (name == "pre")
            {
                if (!closing)
                {
                    paragraph();
                    out += "```\n";
                    ++pre_depth;
                }
                else
                {
                    if (!out.empty() && out.back() != '\n')
                        out += '\n';
                    out += "```";
                    pre_depth = std::max(0, pre_depth - 1);
                    paragraph();
                }
            }
            continue;
        }

        if (!skipping.empty())
        {
            ++i;
            continue;
        }

        // Text run up to the next tag.
        auto next = html.find('<', i);
        std::string run = html.substr(i, next == std::string::npos ? std::string::npos : next - i);
        i = next == std::string::npos ? html.size() : next;

        if (pre_depth > 0)
        {
            out += decode_entities(run);
            continue;
        }
        std::string collapsed;
        collapsed.reserve(run.size());
        for (char ch : run)
        {
            if (is_space(ch))
            {
                if (collapsed.empty() || collapsed.back() != ' ')
                    collapsed += ' ';
            }
            else
            {
                collapsed += ch;
            }
        }
        if (!collapsed.empty() && collapsed.front() == ' ' &&
            (out.empty() || out.back() == '\n' || out.back() == ' '))
            collapsed.erase(0, 1);
        out += decode_entities(collapsed);
    }

    return tidy(out);
}

} // namespace mcptool::util::html
