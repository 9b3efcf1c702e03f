#include "build/scaffold.hpp"

#include "build/config.hpp"
#include "build/file_io.hpp"
#include "markdown/example_templates.hpp"

#include <utility>

namespace stylebook::build {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view CONFIG_DOCUMENT = R"({
  "source": "./sass",
  "destination": "./docs",
  "documentation_assets": "./doc_assets",
  "code_example_templates": "./code_example_templates",
  "dependencies": ["./build"],
  "index": "basics",
  "nav_level": "page",
  "exit_on_warnings": false
}
)";

constexpr std::string_view HEADER_TEMPLATE = R"(<!doctype html>
<html>
  <head>
    <meta charset="utf-8">
    <title>{% if title %}{{ escape(title) }} | {% endif %}Style Guide</title>
    <link rel="stylesheet" href="./your_stylesheet_here.css">
  </head>
  <body>
    <nav>
      <ul>
{% for category in categories %}
        <li><a href="{{ category.file }}">{{ escape(category.name) }}</a></li>
{% endfor %}
      </ul>
    </nav>
{% if blocks %}
    <nav class="sections">
      <ul>
{% for block in blocks %}
        <li><a href="#{{ block.name }}">{{ escape(block.title) }}</a></li>
{% endfor %}
      </ul>
    </nav>
{% endif %}
    <main>
)";

constexpr std::string_view FOOTER_TEMPLATE = R"(    </main>
  </body>
</html>
)";

} // namespace

auto default_config_document() -> std::string_view {
    return CONFIG_DOCUMENT;
}

auto setup_dir(const fs::path& target_dir, DiagnosticSink& diagnostics)
    -> Result<std::vector<std::string>, BuildError> {
    std::error_code ec;
    if (fs::exists(target_dir / CONFIG_FILE_NAME, ec)) {
        diagnostics.warning("build", std::string("Cowardly refusing to overwrite existing ") +
                                         CONFIG_FILE_NAME);
        return std::vector<std::string>{};
    }

    std::vector<std::pair<std::string, std::string_view>> files = {
        {CONFIG_FILE_NAME, CONFIG_DOCUMENT},
        {"doc_assets/_header.html", HEADER_TEMPLATE},
        {"doc_assets/_footer.html", FOOTER_TEMPLATE},
    };
    for (auto name : markdown::scaffold_example_templates()) {
        auto content = markdown::builtin_example_template(name);
        if (!content) {
            return BuildError{BuildErrorKind::Template,
                              "No built-in example template named " + std::string(name)};
        }
        files.emplace_back("code_example_templates/" + std::string(name) + ".html", *content);
    }

    std::vector<std::string> created;
    for (const auto& [relative, content] : files) {
        fs::path path = target_dir / relative;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return BuildError{BuildErrorKind::Io, "Could not create directory " +
                                                      path.parent_path().string() + ": " +
                                                      ec.message()};
        }
        auto written = write_file(path, content);
        if (is_err(written)) {
            return BuildError{BuildErrorKind::Io, unwrap_err(written).message};
        }
        diagnostics.info("build", "Created: " + relative);
        created.push_back(relative);
    }
    return created;
}

} // namespace stylebook::build
