#include "mcptool/util/robots.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace mcptool::util
{

namespace
{
struct Rule
{
    bool allow;
    std::string pattern;
};

struct Group
{
    std::vector<std::string> agents;
    std::vector<Rule> rules;
};

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s)
{
    auto first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos)
        return {};
    auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

std::vector<Group> parse(const std::string& text)
{
    std::vector<Group> groups;
    bool last_was_agent = false;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line))
    {
        auto hash = line.find('#');
        if (hash != std::string::npos)
            line.erase(hash);
        auto colon = line.find(':');
        if (colon == std::string::npos)
            continue;
        const std::string key = lower(trim(line.substr(0, colon)));
        const std::string value = trim(line.substr(colon + 1));

        if (key == "user-agent")
        {
            if (!last_was_agent)
                groups.emplace_back();
            groups.back().agents.push_back(lower(value));
            last_was_agent = true;
            continue;
        }
        last_was_agent = false;
        if (groups.empty())
            continue;
        if (key == "allow" || key == "disallow")
        {
            // An empty Disallow allows everything; it adds no rule.
            if (value.empty())
                continue;
            groups.back().rules.push_back(Rule{key == "allow", value});
        }
    }
    return groups;
}

// Matches pattern against the start of path; '*' is any run, '$' anchors the end.
bool matches(const std::string& pattern, const std::string& path)
{
    std::size_t p = 0;
    std::size_t s = 0;
    std::size_t star = std::string::npos;
    std::size_t star_s = 0;
    while (true)
    {
        if (p < pattern.size() && pattern[p] == '$' && p + 1 == pattern.size())
        {
            if (s == path.size())
                return true;
        }
        else if (p == pattern.size())
        {
            return true;
        }
        else if (pattern[p] == '*')
        {
            star = p++;
            star_s = s;
            continue;
        }
        else if (s < path.size() && pattern[p] == path[s])
        {
            ++p;
            ++s;
            continue;
        }

        if (star == std::string::npos || star_s >= path.size())
            return false;
        p = star + 1;
        s = ++star_s;
    }
}

std::string product_token(const std::string& user_agent)
{
    auto end = user_agent.find_first_of("/ ");
    return lower(user_agent.substr(0, end));
}
} // namespace

bool robots_allows(const std::string& robots_txt, const std::string& user_agent,
                   const std::string& path)
{
    const auto groups = parse(robots_txt);
    const std::string token = product_token(user_agent);
    const std::string target = path.empty() ? "/" : path;

    std::vector<const Group*> selected;
    for (const auto& group : groups)
        for (const auto& agent : group.agents)
            if (!token.empty() && agent == token)
                selected.push_back(&group);
    if (selected.empty())
        for (const auto& group : groups)
            for (const auto& agent : group.agents)
                if (agent == "*")
                    selected.push_back(&group);

    bool allowed = true;
    std::size_t best = 0;
    bool matched = false;
    for (const Group* group : selected)
    {
        for (const auto& rule : group->rules)
        {
            if (!matches(rule.pattern, target))
                continue;
            const std::size_t length = rule.pattern.size();
            if (!matched || length > best || (length == best && rule.allow))
            {
                allowed = rule.allow;
                best = length;
                matched = true;
            }
        }
    }
    return allowed;
}

} // namespace mcptool::util
