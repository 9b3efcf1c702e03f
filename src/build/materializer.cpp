#include "build/materializer.hpp"

#include "build/file_io.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <vector>

namespace stylebook::build {

namespace fs = std::filesystem;

auto write_page(const fs::path& output_dir, const std::string& file_name, std::string_view content)
    -> Result<Unit, BuildError> {
    fs::path target = output_dir / file_name;

    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return BuildError{BuildErrorKind::Io, "Could not create directory " +
                                                  target.parent_path().string() + ": " +
                                                  ec.message()};
    }

    auto written = write_file(target, content);
    if (is_err(written)) {
        return BuildError{BuildErrorKind::Io, unwrap_err(written).message};
    }
    STYLEBOOK_LOG_DEBUG("build", "Wrote " << target.string() << " (" << content.size()
                                          << " bytes)");
    return Unit{};
}

auto replace_with_copy(const fs::path& src, const fs::path& dst) -> Result<Unit, std::error_code> {
    std::error_code ec;
    if (fs::exists(fs::symlink_status(dst, ec))) {
        fs::remove_all(dst, ec);
        if (ec) {
            return ec;
        }
    }
    fs::copy(src, dst, fs::copy_options::recursive, ec);
    if (ec) {
        return ec;
    }
    return Unit{};
}

auto copy_assets(const std::optional<fs::path>& assets_dir, const fs::path& output_dir)
    -> Result<size_t, BuildError> {
    if (!assets_dir) {
        return size_t{0};
    }

    std::error_code ec;
    std::vector<fs::path> entries;
    for (fs::directory_iterator it(*assets_dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (name == "." || name == ".." || name.starts_with("_")) {
            continue;
        }
        entries.push_back(it->path());
    }
    if (ec) {
        return BuildError{BuildErrorKind::Io, "Could not read documentation assets at " +
                                                  assets_dir->string() + ": " + ec.message()};
    }
    std::sort(entries.begin(), entries.end());

    for (const auto& entry : entries) {
        fs::path dst = output_dir / entry.filename();
        auto copied = replace_with_copy(entry, dst);
        if (is_err(copied)) {
            return BuildError{BuildErrorKind::Io, "Could not copy asset " + entry.string() +
                                                      " to " + dst.string() + ": " +
                                                      unwrap_err(copied).message()};
        }
        STYLEBOOK_LOG_DEBUG("copy", "Copied asset " << entry.filename().string());
    }
    return entries.size();
}

auto copy_dependencies(const BuildConfig& config, const fs::path& output_dir,
                       DiagnosticSink& diagnostics) -> size_t {
    size_t copied = 0;
    for (const auto& dir : config.dependencies) {
        auto resolved = config.resolve(dir);
        if (!resolved) {
            diagnostics.warning("copy", "Could not copy dependency: " + dir);
            continue;
        }

        fs::path dst = output_dir / resolved->filename();
        auto result = replace_with_copy(*resolved, dst);
        if (is_err(result)) {
            STYLEBOOK_LOG_DEBUG("copy", dir << ": " << unwrap_err(result).message());
            diagnostics.warning("copy", "Could not copy dependency: " + dir);
            continue;
        }
        STYLEBOOK_LOG_INFO("copy", "Copied dependency " << resolved->string() << " to "
                                                        << dst.string());
        ++copied;
    }
    return copied;
}

} // namespace stylebook::build
