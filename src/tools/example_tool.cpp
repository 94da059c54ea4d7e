#include "irmcp/tools/example_tool.h"

#include "irmcp/core/normalization.h"
#include "irmcp/tools/tool_arguments.h"

namespace irmcp::tools {

using json = nlohmann::json;

namespace {

std::vector<CodeExample> build_catalog() {
  return {
      {"basic_setup", "Basic Inertia-rails controller setup",
       R"RUBY(class UsersController < ApplicationController
  def index
    users = User.all.map do |user|
      {
        id: user.id,
        name: user.name,
        email: user.email,
        created_at: user.created_at.to_s
      }
    end

    render inertia: 'Users/Index', props: { users: users }
  end

  def show
    user = User.find(params[:id])

    render inertia: 'Users/Show', props: {
      user: {
        id: user.id,
        name: user.name,
        email: user.email,
        posts_count: user.posts.count
      }
    }
  end
end)RUBY"},
      {"shared_data", "Sharing data across all Inertia responses",
       R"RUBY(class ApplicationController < ActionController::Base
  # Block form: evaluated per request
  inertia_share do
    {
      auth: { user: current_user&.slice(:id, :name, :email, :avatar_url) },
      flash: flash.to_hash,
      errors: session.delete(:errors) || {}
    }
  end

  # Hash form: static values
  inertia_share app_name: 'My Awesome App'

  # Conditional sharing
  before_action :share_notifications

  private

  def share_notifications
    return unless current_user

    inertia_share do
      { notifications_count: current_user.notifications.unread.count }
    end
  end
end)RUBY"},
      {"authentication", "Authentication flow with Inertia",
       R"RUBY(class SessionsController < ApplicationController
  def new
    render inertia: 'Auth/Login'
  end

  def create
    user = User.find_by(email: params[:email])

    if user&.authenticate(params[:password])
      session[:user_id] = user.id
      redirect_to root_path
    else
      render inertia: 'Auth/Login', props: {
        errors: { email: ['Invalid credentials'] }
      }
    end
  end

  def destroy
    session.delete(:user_id)
    redirect_to login_path
  end
end

class ApplicationController < ActionController::Base
  inertia_share do
    { auth: { user: current_user&.slice(:id, :name, :email) } }
  end

  private

  def current_user
    @current_user ||= User.find(session[:user_id]) if session[:user_id]
  end
end)RUBY"},
      {"file_upload", "Handling file uploads with Inertia",
       R"RUBY(class ProfilesController < ApplicationController
  def edit
    render inertia: 'Profile/Edit', props: {
      user: current_user.slice(:id, :name, :email, :avatar_url)
    }
  end

  def update
    if current_user.update(profile_params)
      current_user.avatar.attach(params[:avatar]) if params[:avatar]
      redirect_to profile_path, notice: 'Profile updated successfully'
    else
      render inertia: 'Profile/Edit', props: {
        user: current_user.slice(:id, :name, :email, :avatar_url),
        errors: current_user.errors
      }
    end
  end

  private

  def profile_params
    params.require(:user).permit(:name, :email, :bio)
  end
end

# Frontend: send multipart data
# const formData = new FormData()
# formData.append('user[name]', data.name)
# formData.append('avatar', avatarFile)
# router.post('/profile', formData))RUBY"},
      {"pagination", "Implementing pagination with Inertia",
       R"RUBY(class PostsController < ApplicationController
  def index
    posts = Post.page(params[:page]).per(10)

    render inertia: 'Posts/Index', props: {
      posts: {
        data: posts.map { |post| { id: post.id, title: post.title, excerpt: post.excerpt } },
        meta: {
          current_page: posts.current_page,
          total_pages: posts.total_pages,
          total_count: posts.total_count,
          per_page: posts.limit_value
        }
      },
      filters: { search: params[:search], category: params[:category] }
    }
  end
end

# Infinite scroll: merge each page into the existing list
class FeedController < ApplicationController
  def index
    posts = Post.page(params[:page]).per(10)

    render inertia: 'Feed/Index', props: {
      posts: merge { posts.map { |post| serialize_post(post) } }
    }
  end
end)RUBY"},
      {"validation", "Form validation with Inertia",
       R"RUBY(class UsersController < ApplicationController
  def create
    @user = User.new(user_params)

    if @user.save
      redirect_to user_path(@user), notice: 'User created successfully'
    else
      render inertia: 'Users/New', props: {
        user: @user.attributes.except('password_digest'),
        errors: form_errors(@user)
      }
    end
  end

  private

  def user_params
    params.require(:user).permit(:name, :email, :password)
  end

  # One message per field, as most form components expect
  def form_errors(model)
    model.errors.to_hash.transform_values(&:first)
  end
end)RUBY"},
      {"ssr", "Server-side rendering setup",
       R"RUBY(# config/initializers/inertia.rb
InertiaRails.configure do |config|
  config.ssr_enabled = Rails.env.production?
  config.ssr_url = ENV.fetch('INERTIA_SSR_URL', 'http://localhost:13714')

  # Skip SSR for specific requests
  config.skip_ssr = ->(request) {
    request.bot? || request.path.start_with?('/admin')
  }
end

# Disable SSR for a single controller
class ReportsController < ApplicationController
  inertia_config(ssr_enabled: false)
end

# package.json
# "scripts": { "ssr": "node ssr.js" })RUBY"},
      {"lazy_loading", "Lazy loading expensive data",
       R"RUBY(class DashboardController < ApplicationController
  def index
    render inertia: 'Dashboard/Index', props: {
      # Always loaded
      user: current_user.slice(:id, :name),

      # Only when explicitly requested
      stats: lazy {
        { total_revenue: calculate_revenue, active_users: User.active.count }
      },

      # Only on partial reloads
      notifications: optional {
        current_user.notifications.unread.limit(5).map { |n| { id: n.id, message: n.message } }
      },

      # After the initial render
      activity_feed: defer(group: :secondary) {
        ActivityFeed.recent.limit(20).map { |activity| serialize_activity(activity) }
      }
    }
  end
end

# Frontend:
# router.reload({ only: ['stats'] }))RUBY"},
      {"typescript", "TypeScript integration example",
       R"RUBY(class ProductsController < ApplicationController
  def show
    product = Product.find(params[:id])

    render inertia: 'Products/Show', props: {
      product: {
        id: product.id,
        name: product.name,
        price: product.price,
        inStock: product.in_stock?
      }
    }
  end
end

# types/index.d.ts
# export interface Product {
#   id: number
#   name: string
#   price: number
#   inStock: boolean
# }
#
# Pages/Products/Show.tsx
# export default function Show({ product }: { product: Product }) {
#   return <h1>{product.name}</h1>
# })RUBY"},
      {"testing", "Testing Inertia responses",
       R"RUBY(# spec/rails_helper.rb
require 'inertia_rails/rspec'

# spec/requests/users_spec.rb
RSpec.describe 'Users', type: :request do
  describe 'GET /users' do
    it 'renders the users list' do
      users = create_list(:user, 3)

      get users_path

      expect_inertia.to render_component('Users/Index')
      expect_inertia.to have_props(
        users: array_including(hash_including(id: users.first.id))
      )
    end
  end

  describe 'POST /users' do
    it 'renders the form with errors for invalid params' do
      post users_path, params: { user: { name: '', email: 'invalid' } }

      expect_inertia.to render_component('Users/New')
      expect_inertia.to have_props(errors: hash_including(:name, :email))
    end
  end
end)RUBY"},
  };
}

}  // namespace

const std::vector<CodeExample>& example_catalog() {
  static const std::vector<CodeExample> catalog = build_catalog();
  return catalog;
}

std::optional<CodeExample> find_example(const std::string& topic) {
  for (const auto& example : example_catalog()) {
    if (example.topic == topic) {
      return example;
    }
  }
  return std::nullopt;
}

std::string humanize_topic(const std::string& topic) {
  std::string text = core::normalize_ascii_lower(topic);
  for (char& ch : text) {
    if (ch == '_') {
      ch = ' ';
    }
  }
  if (!text.empty() && text[0] >= 'a' && text[0] <= 'z') {
    text[0] = static_cast<char>(text[0] - ('a' - 'A'));
  }
  return text;
}

std::string ExampleTool::description() const {
  return "Get code examples for common Inertia-rails use cases";
}

json ExampleTool::input_schema() const {
  json topics = json::array();
  for (const auto& example : example_catalog()) {
    topics.push_back(example.topic);
  }

  return json{
      {"type", "object"},
      {"properties",
       {
           {"topic",
            {{"type", "string"},
             {"enum", topics},
             {"description", "Topic for which to show examples"}}},
       }},
      {"required", json::array({"topic"})},
  };
}

std::string ExampleTool::call(const json& arguments) const {
  const std::string topic = require_string(arguments, "topic");

  auto example = find_example(topic);
  if (!example.has_value()) {
    return "No example found for topic '" + topic + "'";
  }

  std::vector<std::string> output;
  output.push_back("\xF0\x9F\x93\x9D Example: " + humanize_topic(topic));  // U+1F4DD memo
  output.push_back("\n" + example->description);
  output.push_back("\n```ruby");
  output.push_back(core::trim(example->code));
  output.push_back("```");
  return core::join(output, "\n");
}

}  // namespace irmcp::tools
