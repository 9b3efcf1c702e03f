//! # Cross-Page Links
//!
//! Resolves component references written as `[[component]]` or
//! `[[text|component]]` in documentation markdown to the page and anchor
//! that document the component.

#ifndef STYLEBOOK_MARKDOWN_LINK_RESOLVER_HPP
#define STYLEBOOK_MARKDOWN_LINK_RESOLVER_HPP

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stylebook::markdown {

/// Maps a component reference to a URL.
class LinkResolver {
public:
    virtual ~LinkResolver() = default;

    /// Returns `page.html#component`, or nullopt for unknown components.
    [[nodiscard]] virtual auto resolve(std::string_view component) const
        -> std::optional<std::string> = 0;
};

/// One output page and the components it documents.
struct PageComponents {
    std::string name; ///< Output file name
    std::vector<std::string> component_names;
};

/// Link index built once from every page of a build.
///
/// When several pages declare the same component the first page wins.
class LinkHelper : public LinkResolver {
public:
    LinkHelper() = default;

    explicit LinkHelper(const std::vector<PageComponents>& pages);

    [[nodiscard]] auto resolve(std::string_view component) const
        -> std::optional<std::string> override;

    /// Component name to URL for every known component.
    [[nodiscard]] auto all_links() const -> const std::map<std::string, std::string, std::less<>>& {
        return links_;
    }

private:
    std::map<std::string, std::string, std::less<>> links_;
};

} // namespace stylebook::markdown

#endif // STYLEBOOK_MARKDOWN_LINK_RESOLVER_HPP
