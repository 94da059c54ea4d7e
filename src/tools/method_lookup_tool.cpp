#include "irmcp/tools/method_lookup_tool.h"

#include "irmcp/core/normalization.h"
#include "irmcp/tools/tool_arguments.h"

namespace irmcp::tools {

using json = nlohmann::json;

namespace {

constexpr const char* kControllerModule = "InertiaRails::Controller";
constexpr const char* kPropsModule = "InertiaRails";
constexpr const char* kControllerSource = "lib/inertia_rails/controller.rb";

std::vector<MethodInfo> build_catalog() {
  return {
      {"render", "render inertia: component_name, props: {}, view_data: {}",
       "Render an Inertia response with the specified component and props", kControllerModule,
       R"RUBY(def index
  render inertia: 'Users/Index', props: {
    users: User.all.map { |user|
      { id: user.id, name: user.name, email: user.email }
    }
  }
end)RUBY"},
      {"inertia_share", "inertia_share(key => value) or inertia_share { hash }",
       "Share data globally across all Inertia responses", kControllerModule,
       R"RUBY(class ApplicationController < ActionController::Base
  inertia_share do
    {
      current_user: current_user&.slice(:id, :name, :email),
      flash: flash.to_hash
    }
  end
end)RUBY"},
      {"use_inertia_instance_props", "use_inertia_instance_props(only: [], except: [])",
       "Automatically use controller instance variables as Inertia props", kControllerModule,
       R"RUBY(class UsersController < ApplicationController
  use_inertia_instance_props only: [:user, :users]

  def show
    @user = User.find(params[:id])
    render inertia: 'Users/Show'
    # @user is passed as a prop
  end
end)RUBY"},
      {"inertia_config", "inertia_config(option => value)",
       "Configure Inertia settings for the controller", kControllerModule,
       R"RUBY(class AdminController < ApplicationController
  inertia_config(
    component_path_resolver: ->(path:, action:) { "Admin/#{path}/#{action}" },
    ssr_enabled: false
  )
end)RUBY"},
      {"inertia_location", "inertia_location(url)", "Perform a client-side redirect in Inertia",
       kControllerModule,
       R"RUBY(def create
  @user = User.create(user_params)
  if @user.save
    inertia_location user_path(@user)
  else
    render inertia: 'Users/New', props: { errors: @user.errors }
  end
end)RUBY"},
      {"lazy", "lazy { value }",
       "Create a lazy-loaded prop that only evaluates when explicitly requested", kPropsModule,
       R"RUBY(render inertia: 'Dashboard', props: {
  user: current_user,
  stats: lazy { expensive_calculation }
})RUBY"},
      {"optional", "optional { value }",
       "Create an optional prop that is only included during partial reloads", kPropsModule,
       R"RUBY(render inertia: 'Users/Index', props: {
  users: User.all,
  filters: optional { available_filters }
})RUBY"},
      {"defer", "defer(group: nil) { value }",
       "Create a deferred prop that loads after the initial page render", kPropsModule,
       R"RUBY(render inertia: 'Dashboard', props: {
  user: current_user,
  notifications: defer(group: :secondary) {
    current_user.notifications.unread
  }
})RUBY"},
      {"merge", "merge { value }", "Create a mergeable prop for handling paginated data",
       kPropsModule,
       R"RUBY(render inertia: 'Posts/Index', props: {
  posts: merge {
    Post.page(params[:page]).map { |post|
      { id: post.id, title: post.title }
    }
  }
})RUBY"},
  };
}

std::string format_method_info(const std::vector<MethodInfo>& infos, const bool include_source) {
  std::vector<std::string> output;

  for (const auto& info : infos) {
    output.push_back("\xF0\x9F\x93\x9A " + info.name);  // U+1F4DA books
    output.push_back("\nSignature: " + info.signature);
    if (!info.module.empty()) {
      output.push_back("Module: " + info.module);
    }
    output.push_back("\n" + info.description);

    if (!info.example.empty()) {
      output.push_back("\nExample:");
      output.push_back("```ruby");
      output.push_back(core::trim(info.example));
      output.push_back("```");
    }

    if (include_source && !info.module.empty()) {
      output.push_back(std::string("\nSource: ") + kControllerSource);
    }

    if (infos.size() > 1) {
      output.push_back("\n---");
    }
  }

  return core::trim(core::join(output, "\n"));
}

}  // namespace

const std::vector<MethodInfo>& method_catalog() {
  static const std::vector<MethodInfo> catalog = build_catalog();
  return catalog;
}

std::vector<MethodInfo> find_methods(const std::string& method_name) {
  const auto& catalog = method_catalog();

  for (const auto& info : catalog) {
    if (info.name == method_name) {
      return {info};
    }
  }

  const std::string needle = core::normalize_ascii_lower(method_name);
  std::vector<MethodInfo> matches;
  for (const auto& info : catalog) {
    if (info.name.find(needle) != std::string::npos) {
      matches.push_back(info);
    }
  }
  return matches;
}

std::string MethodLookupTool::description() const {
  return "Look up Inertia-rails methods, their signatures, and usage examples";
}

json MethodLookupTool::input_schema() const {
  return json{
      {"type", "object"},
      {"properties",
       {
           {"method_name",
            {{"type", "string"},
             {"description",
              "Name of the method to look up (e.g., \"render\", \"inertia_share\")"}}},
           {"include_source",
            {{"type", "boolean"},
             {"description", "Include source code location"},
             {"default", false}}},
       }},
      {"required", json::array({"method_name"})},
  };
}

std::string MethodLookupTool::call(const json& arguments) const {
  const std::string method_name = require_string(arguments, "method_name");
  const bool include_source = optional_bool(arguments, "include_source", false);

  auto matches = find_methods(method_name);
  if (matches.empty()) {
    return "Method '" + method_name + "' not found in Inertia-rails";
  }
  return format_method_info(matches, include_source);
}

}  // namespace irmcp::tools
