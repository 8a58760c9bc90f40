#pragma once

#include <optional>
#include <regex>
#include <string>
#include <vector>

// Rewrites app_id/title of a window heartbeat before it leaves the process.
struct WindowFilter {
    std::optional<std::regex> match_app_id;
    std::optional<std::regex> match_title;
    std::optional<std::string> replace_app_id;
    std::optional<std::string> replace_title;

    // Every present matcher must match the whole field. No matchers, no match.
    bool matches(const std::string& app_id, const std::string& title) const;

    // Returns false (and leaves the fields alone) if the filter does not match.
    bool apply(std::string& app_id, std::string& title) const;
};

// First matching filter wins.
void apply_filters(const std::vector<WindowFilter>& filters, std::string& app_id,
                   std::string& title);
