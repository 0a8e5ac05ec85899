#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

#include "core/address/address_parser.hpp"
#include "core/api/browser_api.hpp"
#include "core/config/launch_options.hpp"
#include "core/model/app_meta.hpp"
#include "core/util/log.hpp"

namespace {

// Resource path inside the snapshot named by the canonical address.
std::string resource_path_of(std::string_view canonical_address) {
  const permaweb::AddressParseResult parsed = permaweb::parse_address(canonical_address);
  return parsed.ok ? parsed.address.resource_path : std::string{"/"};
}

}  // namespace

#ifdef PERMAWEB_USE_GTK4
#include <gtk/gtk.h>

namespace {

struct AppContext;

class GtkViewer final : public permaweb::IContentViewer {
public:
  explicit GtkViewer(AppContext* ctx) : ctx_(ctx) {}
  void display(std::string_view content_root, std::string_view canonical_address) override;

private:
  AppContext* ctx_;
};

struct AppContext {
  permaweb::BrowserApi api;
  permaweb::LaunchOptions options;
  GtkViewer viewer{this};
  bool load_reported = true;
  bool syncing_controls = false;

  GtkWidget* address_entry = nullptr;
  GtkWidget* version_spin = nullptr;
  GtkWidget* version_button = nullptr;
  GtkWidget* status_label = nullptr;
  GtkTextBuffer* content_buffer = nullptr;
};

void GtkViewer::display(std::string_view content_root, std::string_view canonical_address) {
  const permaweb::Result content = ctx_->api.load_resource(content_root, resource_path_of(canonical_address));
  const std::string text = content.ok ? content.data : "Unable to open page: " + content.message;
  gtk_text_buffer_set_text(ctx_->content_buffer, text.c_str(), -1);
  ctx_->load_reported = false;
}

void refresh_controls(AppContext* ctx) {
  const permaweb::ViewState view = ctx->api.view_state();
  ctx->syncing_controls = true;

  GtkEntryBuffer* buffer = gtk_entry_get_buffer(GTK_ENTRY(ctx->address_entry));
  if (view.state != permaweb::NavigationState::Idle && view.address_text != gtk_entry_buffer_get_text(buffer)) {
    gtk_entry_buffer_set_text(buffer, view.address_text.c_str(), -1);
  }

  const double upper = view.version_max > 0 ? static_cast<double>(view.version_max) : 1000000.0;
  gtk_spin_button_set_range(GTK_SPIN_BUTTON(ctx->version_spin), 0.0, upper);
  if (view.version_enabled) {
    gtk_spin_button_set_value(GTK_SPIN_BUTTON(ctx->version_spin), static_cast<double>(view.version_value));
  }
  gtk_widget_set_sensitive(ctx->version_spin, view.version_enabled);
  gtk_widget_set_sensitive(ctx->version_button, view.version_enabled);
  gtk_label_set_text(GTK_LABEL(ctx->status_label), view.status_text.c_str());

  ctx->syncing_controls = false;
}

gboolean on_tick(gpointer user_data) {
  auto* ctx = static_cast<AppContext*>(user_data);
  const std::size_t applied = ctx->api.tick();
  if (!ctx->load_reported) {
    ctx->load_reported = true;
    ctx->api.viewer_loaded();
  }
  if (applied > 0) {
    refresh_controls(ctx);
  }
  return G_SOURCE_CONTINUE;
}

void report(AppContext* ctx, const permaweb::Result& result) {
  if (!result.ok) {
    spdlog::info("{}", result.message);
  }
  refresh_controls(ctx);
}

void on_address_activate(GtkEntry* entry, gpointer user_data) {
  auto* ctx = static_cast<AppContext*>(user_data);
  const char* text = gtk_entry_buffer_get_text(gtk_entry_get_buffer(entry));
  report(ctx, ctx->api.navigate(text, 0));
}

void on_version_submit(GtkWidget*, gpointer user_data) {
  auto* ctx = static_cast<AppContext*>(user_data);
  const auto value = static_cast<std::uint32_t>(gtk_spin_button_get_value_as_int(GTK_SPIN_BUTTON(ctx->version_spin)));
  report(ctx, ctx->api.submit_version(ctx->api.clamp_version_input(value)));
}

void on_version_changed(GtkSpinButton* spin, gpointer user_data) {
  auto* ctx = static_cast<AppContext*>(user_data);
  if (ctx->syncing_controls) {
    return;
  }
  const auto value = static_cast<std::uint32_t>(gtk_spin_button_get_value_as_int(spin));
  const std::uint32_t clamped = ctx->api.clamp_version_input(value);
  if (clamped != value) {
    gtk_spin_button_set_value(spin, static_cast<double>(clamped));
  }
}

void on_example_selected(GtkDropDown* dropdown, GParamSpec*, gpointer user_data) {
  auto* ctx = static_cast<AppContext*>(user_data);
  const guint index = gtk_drop_down_get_selected(dropdown);
  const auto examples = ctx->api.examples();
  if (index == GTK_INVALID_LIST_POSITION || index >= examples.size()) {
    return;
  }
  report(ctx, ctx->api.navigate(examples[index].address, 0));
}

void activate(GtkApplication* app, gpointer user_data) {
  auto* ctx = static_cast<AppContext*>(user_data);

  GtkWidget* window = gtk_application_window_new(app);
  gtk_window_set_title(GTK_WINDOW(window), std::string{permaweb::kAppDisplayName}.c_str());
  gtk_window_set_default_size(GTK_WINDOW(window), 1100, 720);

  GtkWidget* root = gtk_box_new(GTK_ORIENTATION_VERTICAL, 8);
  gtk_widget_set_margin_top(root, 10);
  gtk_widget_set_margin_bottom(root, 10);
  gtk_widget_set_margin_start(root, 10);
  gtk_widget_set_margin_end(root, 10);
  gtk_window_set_child(GTK_WINDOW(window), root);

  GtkWidget* top = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 8);
  gtk_box_append(GTK_BOX(root), top);

  ctx->address_entry = gtk_entry_new();
  gtk_entry_set_placeholder_text(GTK_ENTRY(ctx->address_entry), "awx://<identifier>[/path][?v=<n>]");
  gtk_widget_set_hexpand(ctx->address_entry, TRUE);
  g_signal_connect(ctx->address_entry, "activate", G_CALLBACK(on_address_activate), ctx);
  gtk_box_append(GTK_BOX(top), ctx->address_entry);

  gtk_box_append(GTK_BOX(top), gtk_label_new("Version"));
  ctx->version_spin = gtk_spin_button_new_with_range(0.0, 1000000.0, 1.0);
  g_signal_connect(ctx->version_spin, "value-changed", G_CALLBACK(on_version_changed), ctx);
  g_signal_connect(ctx->version_spin, "activate", G_CALLBACK(on_version_submit), ctx);
  gtk_box_append(GTK_BOX(top), ctx->version_spin);

  ctx->version_button = gtk_button_new_with_label("Load version");
  g_signal_connect(ctx->version_button, "clicked", G_CALLBACK(on_version_submit), ctx);
  gtk_box_append(GTK_BOX(top), ctx->version_button);

  const auto examples = ctx->api.examples();
  std::vector<const char*> titles;
  for (const auto& example : examples) {
    titles.push_back(example.title.c_str());
  }
  titles.push_back(nullptr);
  GtkWidget* dropdown = gtk_drop_down_new_from_strings(titles.data());
  gtk_drop_down_set_selected(GTK_DROP_DOWN(dropdown), GTK_INVALID_LIST_POSITION);
  g_signal_connect(dropdown, "notify::selected", G_CALLBACK(on_example_selected), ctx);
  gtk_box_append(GTK_BOX(top), dropdown);

  GtkWidget* close = gtk_button_new_with_label("Close");
  g_signal_connect_swapped(close, "clicked", G_CALLBACK(gtk_window_destroy), window);
  gtk_box_append(GTK_BOX(top), close);

  GtkWidget* scroller = gtk_scrolled_window_new();
  gtk_widget_set_vexpand(scroller, TRUE);
  gtk_box_append(GTK_BOX(root), scroller);

  GtkWidget* content_view = gtk_text_view_new();
  gtk_text_view_set_editable(GTK_TEXT_VIEW(content_view), FALSE);
  gtk_text_view_set_monospace(GTK_TEXT_VIEW(content_view), TRUE);
  ctx->content_buffer = gtk_text_view_get_buffer(GTK_TEXT_VIEW(content_view));
  gtk_scrolled_window_set_child(GTK_SCROLLED_WINDOW(scroller), content_view);

  ctx->status_label = gtk_label_new("");
  gtk_label_set_xalign(GTK_LABEL(ctx->status_label), 0.0F);
  gtk_box_append(GTK_BOX(root), ctx->status_label);

  if (!ctx->api.network_compatible()) {
    gtk_text_buffer_set_text(ctx->content_buffer,
                             "This network does not publish the expected history type.\n"
                             "Addresses may fail to resolve.",
                             -1);
  }

  report(ctx, ctx->api.take_initial(ctx->options.url, ctx->options.website_version));
  g_timeout_add(50, on_tick, ctx);
  gtk_window_present(GTK_WINDOW(window));
}

}  // namespace

int main(int argc, char** argv) {
  const permaweb::LaunchParseResult parsed = permaweb::parse_launch_options(argc, argv);
  if (!parsed.ok) {
    std::cerr << parsed.message << "\n\n" << permaweb::launch_usage();
    return 2;
  }
  if (parsed.options.show_help) {
    std::cout << permaweb::launch_usage();
    return 0;
  }
  permaweb::util::init_logging(parsed.options.log_level);

  AppContext context;
  context.options = parsed.options;
  const permaweb::Result init = context.api.init(permaweb::to_init_config(context.options), context.viewer);
  if (!init.ok) {
    std::cerr << "Init failed: " << init.message << '\n';
    return 1;
  }

  // Launch arguments are ours; GTK only sees the program name.
  GtkApplication* app = gtk_application_new(std::string{permaweb::kAppId}.c_str(), G_APPLICATION_DEFAULT_FLAGS);
  g_signal_connect(app, "activate", G_CALLBACK(activate), &context);
  const int status = g_application_run(G_APPLICATION(app), 1, argv);
  g_object_unref(app);
  return status;
}

#else

namespace {

class ConsoleViewer final : public permaweb::IContentViewer {
public:
  explicit ConsoleViewer(permaweb::BrowserApi& api) : api_(api) {}

  void display(std::string_view content_root, std::string_view canonical_address) override {
    const permaweb::Result content = api_.load_resource(content_root, resource_path_of(canonical_address));
    std::cout << "== " << canonical_address << " ==\n";
    if (content.ok) {
      std::cout << content.data << '\n';
    } else {
      std::cout << "Unable to open page: " << content.message << '\n';
    }
    displayed_ = true;
  }

  [[nodiscard]] bool displayed() const { return displayed_; }

private:
  permaweb::BrowserApi& api_;
  bool displayed_ = false;
};

}  // namespace

int main(int argc, char** argv) {
  const permaweb::LaunchParseResult parsed = permaweb::parse_launch_options(argc, argv);
  if (!parsed.ok) {
    std::cerr << parsed.message << "\n\n" << permaweb::launch_usage();
    return 2;
  }
  if (parsed.options.show_help) {
    std::cout << permaweb::launch_usage();
    return 0;
  }
  permaweb::util::init_logging(parsed.options.log_level);

  permaweb::BrowserApi api;
  ConsoleViewer viewer{api};
  const permaweb::Result init = api.init(permaweb::to_init_config(parsed.options), viewer);
  if (!init.ok) {
    std::cerr << "permaweb init failed: " << init.message << '\n';
    return 1;
  }

  if (!parsed.options.url.has_value()) {
    std::cout << permaweb::kAppDisplayName << ' ' << permaweb::kAppVersion << " (console shell)\n";
    std::cout << "Examples:\n";
    for (const auto& example : api.examples()) {
      std::cout << "  " << example.title << ": " << example.address << '\n';
    }
    std::cout << "\nBuild with gtk4 development packages installed for the windowed browser.\n";
    return 0;
  }

  const permaweb::Result started = api.take_initial(parsed.options.url, parsed.options.website_version);
  if (!started.ok) {
    std::cerr << started.message << '\n';
    return 1;
  }

  while (api.navigation_status().state == permaweb::NavigationState::Resolving) {
    api.wait_and_tick(100);
  }
  if (viewer.displayed()) {
    api.viewer_loaded();
  }

  const permaweb::ViewState view = api.view_state();
  std::cout << view.status_text << '\n';
  return view.state == permaweb::NavigationState::Loaded ? 0 : 1;
}

#endif
