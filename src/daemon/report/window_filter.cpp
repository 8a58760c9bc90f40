#include "window_filter.hpp"

namespace {

std::string replace_field(const std::string& value, const std::optional<std::regex>& matcher,
                          const std::string& replacement) {
    // One whole-field match, formatted once.
    std::smatch m;
    if (matcher && std::regex_match(value, m, *matcher)) {
        return m.format(replacement);
    }
    return replacement;
}

} // namespace

bool WindowFilter::matches(const std::string& app_id, const std::string& title) const {
    if (!match_app_id && !match_title) return false;
    if (match_app_id && !std::regex_match(app_id, *match_app_id)) return false;
    if (match_title && !std::regex_match(title, *match_title)) return false;
    return true;
}

bool WindowFilter::apply(std::string& app_id, std::string& title) const {
    if (!matches(app_id, title)) return false;

    if (replace_app_id) app_id = replace_field(app_id, match_app_id, *replace_app_id);
    if (replace_title) title = replace_field(title, match_title, *replace_title);
    return true;
}

void apply_filters(const std::vector<WindowFilter>& filters, std::string& app_id,
                   std::string& title) {
    for (const auto& filter : filters) {
        if (filter.apply(app_id, title)) return;
    }
}
