//! # Parser Plugins
//!
//! Compiled-in hooks that observe every parsed block and may adjust the
//! final page map.
//!
//! ## Activation
//!
//! A registered plugin is active when its name is listed in the `plugins`
//! configuration array or `--<name>` is passed on the command line.
//!
//! ```cpp
//! auto registry = PluginRegistry::with_builtins();
//! Plugins plugins(registry, config.plugins, extra_args, diagnostics);
//! ```

#ifndef STYLEBOOK_DOC_PLUGIN_HPP
#define STYLEBOOK_DOC_PLUGIN_HPP

#include "build/diagnostics.hpp"
#include "build/errors.hpp"
#include "build/page.hpp"
#include "common.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace stylebook::doc {

/// A parser hook. Returning an error aborts the build.
class Plugin {
public:
    virtual ~Plugin() = default;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    /// Called for every documentation block, in parse order.
    virtual auto on_block(const build::ContentBlock& block, const std::filesystem::path& file)
        -> Result<Unit, std::string> {
        (void)block;
        (void)file;
        return Unit{};
    }

    /// Called once with the finished page map.
    virtual auto finalize(build::PageMap& pages) -> Result<Unit, std::string> {
        (void)pages;
        return Unit{};
    }
};

using PluginFactory = std::function<Box<Plugin>()>;

/// Named plugin factories.
class PluginRegistry {
public:
    /// Registry with every plugin shipped in the binary.
    [[nodiscard]] static auto with_builtins() -> PluginRegistry;

    void register_plugin(std::string name, PluginFactory factory);

    [[nodiscard]] auto contains(const std::string& name) const -> bool {
        return factories_.count(name) > 0;
    }

    [[nodiscard]] auto create(const std::string& name) const -> Box<Plugin>;

    [[nodiscard]] auto names() const -> std::vector<std::string>;

private:
    std::map<std::string, PluginFactory> factories_;
};

/// The plugins active for one build.
class Plugins {
public:
    Plugins() = default;

    /// Activates plugins named in `configured` or as `--<name>` in `args`.
    /// Unknown configured names are reported as warnings.
    Plugins(const PluginRegistry& registry, const std::vector<std::string>& configured,
            const std::vector<std::string>& args, build::DiagnosticSink& diagnostics);

    [[nodiscard]] auto active_names() const -> std::vector<std::string>;

    [[nodiscard]] auto empty() const -> bool {
        return active_.empty();
    }

    auto on_block(const build::ContentBlock& block, const std::filesystem::path& file)
        -> Result<Unit, build::BuildError>;

    auto finalize(build::PageMap& pages) -> Result<Unit, build::BuildError>;

private:
    std::vector<Box<Plugin>> active_;
};

} // namespace stylebook::doc

#endif // STYLEBOOK_DOC_PLUGIN_HPP
