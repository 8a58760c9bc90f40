#pragma once

#include "platform/handle_ids.hpp"
#include "platform/toplevel_source.hpp"

#include <cstdint>
#include <memory>
#include <string>

struct wl_array;
struct wl_display;
struct wl_output;
struct wl_registry;
struct wl_registry_listener;
struct zwlr_foreign_toplevel_handle_v1;
struct zwlr_foreign_toplevel_handle_v1_listener;
struct zwlr_foreign_toplevel_manager_v1;
struct zwlr_foreign_toplevel_manager_v1_listener;

// wlr-foreign-toplevel-management client. libwayland callbacks only queue
// ToplevelEvents; they are handed out by roundtrip().
class WlrToplevelSource : public ToplevelSource {
public:
    // Connects to $WAYLAND_DISPLAY and binds the toplevel manager.
    static std::expected<std::unique_ptr<WlrToplevelSource>, WatchError> connect();

    ~WlrToplevelSource() override;

    WlrToplevelSource(const WlrToplevelSource&) = delete;
    WlrToplevelSource& operator=(const WlrToplevelSource&) = delete;

    std::expected<std::vector<ToplevelEvent>, WatchError> roundtrip() override;

private:
    static constexpr uint32_t MANAGER_VERSION = 3;

    WlrToplevelSource();

    static const wl_registry_listener REGISTRY_LISTENER;
    static const zwlr_foreign_toplevel_manager_v1_listener MANAGER_LISTENER;
    static const zwlr_foreign_toplevel_handle_v1_listener HANDLE_LISTENER;

    // wl_registry
    static void handle_global(void* data, wl_registry* registry, uint32_t name,
                              const char* interface, uint32_t version);
    static void handle_global_remove(void* data, wl_registry* registry, uint32_t name);

    // zwlr_foreign_toplevel_manager_v1
    static void handle_toplevel(void* data, zwlr_foreign_toplevel_manager_v1* manager,
                                zwlr_foreign_toplevel_handle_v1* handle);
    static void handle_finished(void* data, zwlr_foreign_toplevel_manager_v1* manager);

    // zwlr_foreign_toplevel_handle_v1
    static void handle_title(void* data, zwlr_foreign_toplevel_handle_v1* handle,
                             const char* title);
    static void handle_app_id(void* data, zwlr_foreign_toplevel_handle_v1* handle,
                              const char* app_id);
    static void handle_output_enter(void* data, zwlr_foreign_toplevel_handle_v1* handle,
                                    wl_output* output);
    static void handle_output_leave(void* data, zwlr_foreign_toplevel_handle_v1* handle,
                                    wl_output* output);
    static void handle_state(void* data, zwlr_foreign_toplevel_handle_v1* handle,
                             wl_array* state);
    static void handle_done(void* data, zwlr_foreign_toplevel_handle_v1* handle);
    static void handle_closed(void* data, zwlr_foreign_toplevel_handle_v1* handle);
    static void handle_parent(void* data, zwlr_foreign_toplevel_handle_v1* handle,
                              zwlr_foreign_toplevel_handle_v1* parent);

    void push(ToplevelEvent::Kind kind, zwlr_foreign_toplevel_handle_v1* handle,
              std::string value = {});

    wl_display* display_ = nullptr;
    wl_registry* registry_ = nullptr;
    zwlr_foreign_toplevel_manager_v1* manager_ = nullptr;
    HandleIds<zwlr_foreign_toplevel_handle_v1> handles_;
    std::vector<ToplevelEvent> pending_;
};
