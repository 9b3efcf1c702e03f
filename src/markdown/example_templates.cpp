#include "markdown/example_templates.hpp"

namespace stylebook::markdown {

namespace {

constexpr std::string_view EXAMPLE_TEMPLATE = R"(<div class="codeExample">
  <div class="exampleOutput">
    {{ rendered_example }}
  </div>
  <div class="codeBlock">
    <div class="highlight">
      <pre><code class="language-{{ language }}">{{ code_example }}</code></pre>
    </div>
  </div>
</div>
)";

constexpr std::string_view TABLE_TEMPLATE = R"(<div class="codeTable">
  <table>
    <tbody>
{% for example in examples %}
      <tr>
        <th>
          <div class="exampleOutput">
            {{ example.rendered_example }}
          </div>
        </th>
        <td>
          <div class="codeBlock">
            <div class="highlight">
              <pre><code class="language-{{ language }}">{{ example.code_example }}</code></pre>
            </div>
          </div>
        </td>
      </tr>
{% endfor %}
    </tbody>
  </table>
</div>
)";

constexpr std::string_view JS_TEMPLATE = R"(<div class="codeBlock jsExample">
  <div class="highlight">
    <pre><code class="language-{{ language }}">{{ code_example }}</code></pre>
  </div>
</div>
{{ rendered_example }}
)";

} // namespace

auto builtin_example_template(std::string_view name) -> std::optional<std::string_view> {
    if (name == "html_example_template" || name == "markdown_example_template") {
        return EXAMPLE_TEMPLATE;
    }
    if (name == "markdown_table_template") {
        return TABLE_TEMPLATE;
    }
    if (name == "js_example_template" || name == "jsx_example_template") {
        return JS_TEMPLATE;
    }
    return std::nullopt;
}

auto generic_example_template() -> std::string_view {
    return EXAMPLE_TEMPLATE;
}

auto scaffold_example_templates() -> std::vector<std::string_view> {
    return {"markdown_example_template", "markdown_table_template", "js_example_template",
            "jsx_example_template"};
}

} // namespace stylebook::markdown
