/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <desktop_probe.h>

#include <chrono>
#include <thread>

#include <X11/Xlib.h>
#include <X11/Xatom.h>

#include <util.h>

namespace WallpaperRotate {

namespace {

const int MAX_X_CONNECT_RETRIES = 6;  // e.g., 6 attempts
const int X_RETRY_DELAY_MS = 500;     // e.g., 500ms between attempts (~3 sec total)

//!
//! \brief Replaces the default Xlib error handler, which terminates the process, for the protocol errors a property
//! read can raise when the window manager restarts.
//!
int QuietXErrorHandler(Display* display, XErrorEvent* error_event)
{
    char error_text[256] = {};
    XGetErrorText(display, error_event->error_code, error_text, sizeof(error_text));

    debug_log("WARNING: %s: X error %i (%s), request %i",
              __func__,
              static_cast<int>(error_event->error_code),
              error_text,
              static_cast<int>(error_event->request_code));

    return 0;
}

int QuietXIOErrorHandler(Display* display)
{
    error_log("%s: lost connection to X display %s",
              __func__,
              DisplayString(display));

    return 0;
}

} // anonymous namespace

X11DesktopProbe::X11DesktopProbe()
    : m_display(nullptr)
    , m_current_desktop_atom(None)
    , m_connection_lost(false)
{}

X11DesktopProbe::~X11DesktopProbe()
{
    Disconnect();
}

bool X11DesktopProbe::Connect()
{
    if (m_display) {
        return true;
    }

    for (int attempt = 1; attempt <= MAX_X_CONNECT_RETRIES; ++attempt) {
        m_display = XOpenDisplay(nullptr);
        if (m_display) break;
        if (attempt < MAX_X_CONNECT_RETRIES) {
            error_log("WARNING: %s: Could not open X display (attempt %d/%d). Retrying...", __func__, attempt, MAX_X_CONNECT_RETRIES);
            std::this_thread::sleep_for(std::chrono::milliseconds(X_RETRY_DELAY_MS));
        } else {
            error_log("%s: Could not open X display after %d attempts.", __func__, MAX_X_CONNECT_RETRIES);
            return false;
        }
    }

    XSetErrorHandler(QuietXErrorHandler);
    XSetIOErrorHandler(QuietXIOErrorHandler);
    XSetIOErrorExitHandler(m_display, HandleIOErrorExit, this);

    m_connection_lost = false;

    m_current_desktop_atom = XInternAtom(m_display, "_NET_CURRENT_DESKTOP", False);

    debug_log("INFO: %s: connected to X display %s",
              __func__,
              DisplayString(m_display));

    return true;
}

void X11DesktopProbe::Disconnect()
{
    if (m_display) {
        XCloseDisplay(m_display);
        m_display = nullptr;
    }

    m_current_desktop_atom = None;
    m_connection_lost = false;
}

void X11DesktopProbe::HandleIOErrorExit(Display*, void* user_data)
{
    X11DesktopProbe* probe = static_cast<X11DesktopProbe*>(user_data);

    if (probe) {
        probe->m_connection_lost = true;
    }
}

bool X11DesktopProbe::IsConnectionLost() const
{
    return m_connection_lost;
}

std::optional<int> X11DesktopProbe::CurrentWorkspaceNumber()
{
    if (!Connect()) {
        return std::nullopt;
    }

    Atom actual_type = None;
    int actual_format = 0;
    unsigned long item_count = 0;
    unsigned long bytes_after = 0;
    unsigned char* data = nullptr;

    int status = XGetWindowProperty(m_display,
                                    DefaultRootWindow(m_display),
                                    m_current_desktop_atom,
                                    0,
                                    1,
                                    False,
                                    XA_CARDINAL,
                                    &actual_type,
                                    &actual_format,
                                    &item_count,
                                    &bytes_after,
                                    &data);

    if (m_connection_lost) {
        error_log("%s: X connection lost, reconnecting on the next query.",
                  __func__);

        if (data) XFree(data);
        Disconnect();
        return std::nullopt;
    }

    if (status != Success) {
        error_log("%s: XGetWindowProperty(_NET_CURRENT_DESKTOP) failed, reconnecting on the next query.",
                  __func__);

        if (data) XFree(data);
        Disconnect();
        return std::nullopt;
    }

    if (actual_type != XA_CARDINAL || actual_format != 32 || item_count == 0 || !data) {
        debug_log("WARNING: %s: _NET_CURRENT_DESKTOP is not set on the root window.",
                  __func__);

        if (data) XFree(data);
        return std::nullopt;
    }

    // Format 32 properties are returned as an array of long regardless of the platform's long size.
    unsigned long desktop = reinterpret_cast<unsigned long*>(data)[0];
    XFree(data);

    return static_cast<int>(desktop) + 1;
}

} // namespace WallpaperRotate
