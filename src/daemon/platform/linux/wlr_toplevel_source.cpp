#include "platform/linux/wlr_toplevel_source.hpp"

#include "logging.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>
#include <wayland-client.h>
#include <wlr-foreign-toplevel-management-unstable-v1-client-protocol.h>

const wl_registry_listener WlrToplevelSource::REGISTRY_LISTENER = {
    .global = handle_global,
    .global_remove = handle_global_remove,
};

const zwlr_foreign_toplevel_manager_v1_listener WlrToplevelSource::MANAGER_LISTENER = {
    .toplevel = handle_toplevel,
    .finished = handle_finished,
};

const zwlr_foreign_toplevel_handle_v1_listener WlrToplevelSource::HANDLE_LISTENER = {
    .title = handle_title,
    .app_id = handle_app_id,
    .output_enter = handle_output_enter,
    .output_leave = handle_output_leave,
    .state = handle_state,
    .done = handle_done,
    .closed = handle_closed,
    .parent = handle_parent,
};

WlrToplevelSource::WlrToplevelSource()
    : handles_(zwlr_foreign_toplevel_handle_v1_interface.name) {}

std::expected<std::unique_ptr<WlrToplevelSource>, WatchError> WlrToplevelSource::connect() {
    std::unique_ptr<WlrToplevelSource> source(new WlrToplevelSource());

    source->display_ = wl_display_connect(nullptr);
    if (!source->display_) {
        return std::unexpected(WatchError{WatchError::Kind::SessionUnavailable,
                                          std::string("cannot connect to Wayland display: ") +
                                              std::strerror(errno)});
    }

    source->registry_ = wl_display_get_registry(source->display_);
    wl_registry_add_listener(source->registry_, &REGISTRY_LISTENER, source.get());

    if (wl_display_roundtrip(source->display_) < 0) {
        return std::unexpected(WatchError{WatchError::Kind::SessionUnavailable,
                                          "Wayland registry roundtrip failed"});
    }

    if (!source->manager_) {
        return std::unexpected(
            WatchError{WatchError::Kind::SessionUnavailable,
                       std::format("compositor does not advertise {}",
                                   zwlr_foreign_toplevel_manager_v1_interface.name)});
    }

    return source;
}

WlrToplevelSource::~WlrToplevelSource() {
    for (auto* handle : handles_.handles()) {
        zwlr_foreign_toplevel_handle_v1_destroy(handle);
    }
    if (manager_) zwlr_foreign_toplevel_manager_v1_destroy(manager_);
    if (registry_) wl_registry_destroy(registry_);
    if (display_) wl_display_disconnect(display_);
}

std::expected<std::vector<ToplevelEvent>, WatchError> WlrToplevelSource::roundtrip() {
    if (wl_display_roundtrip(display_) < 0) {
        int err = wl_display_get_error(display_);
        return std::unexpected(WatchError{WatchError::Kind::ConnectionLost,
                                          std::string("Wayland roundtrip failed: ") +
                                              std::strerror(err)});
    }

    std::vector<ToplevelEvent> events;
    events.swap(pending_);
    return events;
}

void WlrToplevelSource::handle_global(void* data, wl_registry* registry, uint32_t name,
                                      const char* interface, uint32_t version) {
    auto* self = static_cast<WlrToplevelSource*>(data);
    if (std::strcmp(interface, zwlr_foreign_toplevel_manager_v1_interface.name) != 0) return;
    if (self->manager_) return;

    uint32_t bind_version = std::min(version, MANAGER_VERSION);
    self->manager_ = static_cast<zwlr_foreign_toplevel_manager_v1*>(wl_registry_bind(
        registry, name, &zwlr_foreign_toplevel_manager_v1_interface, bind_version));
    zwlr_foreign_toplevel_manager_v1_add_listener(self->manager_, &MANAGER_LISTENER, self);
    logging::debug("Bound {} version {}", interface, bind_version);
}

void WlrToplevelSource::handle_global_remove(void*, wl_registry*, uint32_t) {}

void WlrToplevelSource::handle_toplevel(void* data, zwlr_foreign_toplevel_manager_v1*,
                                        zwlr_foreign_toplevel_handle_v1* handle) {
    auto* self = static_cast<WlrToplevelSource*>(data);
    self->handles_.assign(handle);
    zwlr_foreign_toplevel_handle_v1_add_listener(handle, &HANDLE_LISTENER, self);
    self->push(ToplevelEvent::Kind::Created, handle);
}

void WlrToplevelSource::handle_finished(void* data, zwlr_foreign_toplevel_manager_v1* manager) {
    auto* self = static_cast<WlrToplevelSource*>(data);
    logging::error("Toplevel manager is finished");
    self->pending_.push_back({.kind = ToplevelEvent::Kind::ManagerFinished});
    zwlr_foreign_toplevel_manager_v1_destroy(manager);
    self->manager_ = nullptr;
}

void WlrToplevelSource::handle_title(void* data, zwlr_foreign_toplevel_handle_v1* handle,
                                     const char* title) {
    static_cast<WlrToplevelSource*>(data)->push(ToplevelEvent::Kind::Title, handle, title);
}

void WlrToplevelSource::handle_app_id(void* data, zwlr_foreign_toplevel_handle_v1* handle,
                                      const char* app_id) {
    static_cast<WlrToplevelSource*>(data)->push(ToplevelEvent::Kind::AppId, handle, app_id);
}

void WlrToplevelSource::handle_output_enter(void*, zwlr_foreign_toplevel_handle_v1*, wl_output*) {}

void WlrToplevelSource::handle_output_leave(void*, zwlr_foreign_toplevel_handle_v1*, wl_output*) {}

void WlrToplevelSource::handle_state(void* data, zwlr_foreign_toplevel_handle_v1* handle,
                                     wl_array* state) {
    auto* self = static_cast<WlrToplevelSource*>(data);
    ToplevelEvent event{.kind = ToplevelEvent::Kind::State, .id = self->handles_.find(handle)};

    // wl_array_for_each relies on an implicit void* conversion, not valid C++.
    const auto* begin = static_cast<const uint32_t*>(state->data);
    event.states.assign(begin, begin + state->size / sizeof(uint32_t));

    self->pending_.push_back(std::move(event));
}

void WlrToplevelSource::handle_done(void* data, zwlr_foreign_toplevel_handle_v1* handle) {
    static_cast<WlrToplevelSource*>(data)->push(ToplevelEvent::Kind::Done, handle);
}

void WlrToplevelSource::handle_closed(void* data, zwlr_foreign_toplevel_handle_v1* handle) {
    auto* self = static_cast<WlrToplevelSource*>(data);
    self->push(ToplevelEvent::Kind::Closed, handle);
    self->handles_.release(handle);
    zwlr_foreign_toplevel_handle_v1_destroy(handle);
}

void WlrToplevelSource::handle_parent(void*, zwlr_foreign_toplevel_handle_v1*,
                                      zwlr_foreign_toplevel_handle_v1*) {}

void WlrToplevelSource::push(ToplevelEvent::Kind kind, zwlr_foreign_toplevel_handle_v1* handle,
                             std::string value) {
    pending_.push_back({.kind = kind, .id = handles_.find(handle), .value = std::move(value)});
}
