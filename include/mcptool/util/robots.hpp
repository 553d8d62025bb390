#pragma once
#include <string>

namespace mcptool::util
{

/// Evaluate a robots.txt body for one user agent and one URL path.
///
/// The group whose User-agent token matches the product token of user_agent
/// (case-insensitive, "mcptool" for "mcptool/1.0 (...)") applies; otherwise
/// the "*" group; with neither, everything is allowed. Within the group the
/// longest matching Allow/Disallow pattern wins and Allow wins ties.
/// Patterns support '*' wildcards and a trailing '$' anchor.
bool robots_allows(const std::string& robots_txt, const std::string& user_agent,
                   const std::string& path);

} // namespace mcptool::util
